#pragma once

/// @file log.hpp
/// @brief Library-wide spdlog logger.
/// @ingroup core

#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>
#include <optional>

namespace spanner::core {

/// @brief The shared "spanner" logger.
///
/// Created on first use with a coloured stderr sink at `info` level.
/// Thread-safe.
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

/// @brief Set the logger level and optionally add a file sink.
///
/// Safe to call while other threads are logging. Adding the same file
/// twice appends a second sink; callers configure logging once at startup.
///
/// @param level Minimum level that is emitted.
/// @param file Optional path of a log file to append to.
void configure_logging(spdlog::level::level_enum level,
                       const std::optional<std::filesystem::path>& file = std::nullopt);

} // namespace spanner::core
