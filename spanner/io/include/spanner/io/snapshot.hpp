#pragma once

/// @file snapshot.hpp
/// @brief Export and import of event history as a self-describing JSON document.
///
/// Document layout:
/// @code
/// {
///   "metadata": {
///     "format_version": "1.0",
///     "export_timestamp": <ns since epoch>,
///     "total_events": <count>,
///     "level_counts": {"ERROR": 1, "INFO": 2},
///     "description": "nightly" | null
///   },
///   "events": [ <event>, ... ]
/// }
/// @endcode
///
/// The "bin" in the function names is a label only: the encoding is JSON.
///
/// @ingroup io_snapshot

#include <spanner/core/event.hpp>
#include <spanner/core/event_manager.hpp>
#include <spanner/core/types.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace spanner::io {

/// @brief Format version written by this library.
inline constexpr std::string_view FORMAT_VERSION = "1.0";

/// @brief Summary written ahead of the events in a snapshot.
///
/// @ingroup io_snapshot
/// @see ExportData, create_export_data
struct ExportMetadata {
    std::string format_version{FORMAT_VERSION};     ///< "major.minor"; major must match on import.
    core::Timestamp export_timestamp{};            ///< When the snapshot was created.
    uint64_t total_events{0};                      ///< Number of events in the snapshot.
    /// @brief Level label to count, for every level with at least one event.
    std::map<std::string, uint64_t> level_counts;
    std::optional<std::string> description;        ///< Free-form label supplied by the exporter.

    bool operator==(const ExportMetadata&) const = default;
};

/// @brief Metadata plus the exported events in capture order.
///
/// @ingroup io_snapshot
struct ExportData {
    ExportMetadata metadata;
    std::vector<core::Event> events;

    bool operator==(const ExportData&) const = default;
};

/// @brief Compute metadata for @p events and pair them with it.
/// @param events Events in the order they should be stored.
/// @param description Optional free-form label.
/// @return Snapshot ready for encoding, timestamped now.
[[nodiscard]] ExportData create_export_data(std::vector<core::Event> events,
                                            std::optional<std::string> description = std::nullopt);

/// @brief Convenience overload copying events out of a store listing.
[[nodiscard]] ExportData create_export_data(const core::EventManager::EventList& events,
                                            std::optional<std::string> description = std::nullopt);

/// @brief Serialise a snapshot to its JSON text.
[[nodiscard]] std::string encode_snapshot(const ExportData& data);

/// @brief Parse a snapshot from JSON text.
/// @throws DecodeError If the document is malformed, incomplete or of an
///         incompatible version.
[[nodiscard]] ExportData decode_snapshot(std::string_view json);

/// @brief Read and decode a snapshot file.
/// @throws FileError If the file cannot be read.
/// @throws DecodeError If the content is not a valid snapshot.
[[nodiscard]] ExportData read_snapshot(const std::filesystem::path& path);

/// @brief Encode and write a snapshot file.
///
/// The document is written to a sibling temporary file which is then
/// renamed over @p path.
///
/// @throws FileError If the file cannot be written or renamed.
void write_snapshot(const ExportData& data, const std::filesystem::path& path);

/// @brief Encode every retained event of @p manager (newest first).
[[nodiscard]] std::vector<uint8_t> export_to_bin_data(const core::EventManager& manager,
                                                      std::optional<std::string> description = std::nullopt);

/// @brief Write every retained event of @p manager to @p path.
/// @return Number of exported events.
std::size_t export_to_bin_file(const core::EventManager& manager, const std::filesystem::path& path,
                               std::optional<std::string> description = std::nullopt);

/// @brief Write the events of @p manager matching @p criteria to @p path.
/// @return Number of exported events.
std::size_t export_filtered_to_bin_file(const core::EventManager& manager,
                                        const std::filesystem::path& path,
                                        const core::SearchCriteria& criteria,
                                        std::optional<std::string> description = std::nullopt);

/// @brief Build a fresh store (default capacity) from snapshot bytes.
///
/// Events are replayed through push() in stored order, so eviction applies
/// again if the snapshot holds more than the capacity.
[[nodiscard]] std::unique_ptr<core::EventManager> import_from_bin_data(std::span<const uint8_t> bytes);

/// @brief Build a fresh store (default capacity) from a snapshot file.
[[nodiscard]] std::unique_ptr<core::EventManager> import_from_bin_file(const std::filesystem::path& path);

/// @brief Replay a snapshot file into @p target via push().
///
/// Imported events are historical data and are not published on the bus.
///
/// @return The decoded snapshot and the number of events pushed.
std::pair<ExportData, std::size_t> import_and_merge_from_bin_file(core::EventManager& target,
                                                                  const std::filesystem::path& path);

/// @name Global-scope equivalents operating on core::global_registry()
/// @throws core::NotInitializedError If no manager is installed.
/// @{
[[nodiscard]] std::vector<uint8_t> export_to_bin_data();
std::size_t export_to_bin_file(const std::filesystem::path& path);
std::size_t export_filtered_to_bin_file(const std::filesystem::path& path,
                                        const core::SearchCriteria& criteria,
                                        std::optional<std::string> description = std::nullopt);
std::pair<ExportData, std::size_t> import_and_merge_from_bin_file(const std::filesystem::path& path);
/// @}

} // namespace spanner::io
