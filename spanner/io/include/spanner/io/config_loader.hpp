#pragma once

/// @file config_loader.hpp
/// @brief Runtime configuration for the capture pipeline, loaded from JSON.
/// @ingroup io_config

#include <spanner/core/registry.hpp>

#include <spdlog/common.h>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace spanner::io {

/// @brief Settings read from a JSON configuration document.
///
/// Example:
/// @code{.json}
/// {
///   "max_events": 5000,
///   "log_level": "debug",
///   "log_file": "spanner.log",
///   "export_description": "nightly"
/// }
/// @endcode
///
/// Every key is optional. Unknown keys are ignored.
struct SpannerConfig {
    std::optional<std::size_t> max_events;            ///< Store capacity; default used when absent.
    std::string log_level{"info"};                    ///< spdlog level name.
    std::optional<std::filesystem::path> log_file;    ///< Extra file sink for the library logger.
    std::optional<std::string> export_description;    ///< Default description for snapshots.
};

/// @brief Load a configuration from a JSON file.
///
/// @param path  Filesystem path to the JSON document.
/// @return The parsed configuration.
///
/// @throws FileError    If the file cannot be read.
/// @throws LoaderError  If the JSON is malformed or a value has the wrong type.
///
/// @see load_config_from_string
[[nodiscard]] SpannerConfig load_config(const std::filesystem::path& path);

/// @brief Load a configuration from a JSON string.
///
/// @throws LoaderError  If the JSON is malformed or a value has the wrong type.
[[nodiscard]] SpannerConfig load_config_from_string(std::string_view json);

/// @brief Convert a level name ("trace" .. "critical", "off") to spdlog.
///
/// @throws LoaderError  If @p name is not a known level.
[[nodiscard]] spdlog::level::level_enum parse_log_level(std::string_view name);

/// @brief Configure the library logger and install the event manager.
///
/// The manager is only installed when @p registry has none yet.
///
/// @return true if this call installed the manager.
bool apply_config(const SpannerConfig& config, core::Registry& registry);

} // namespace spanner::io
