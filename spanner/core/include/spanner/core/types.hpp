#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <source_location>
#include <string>

namespace spanner::core {

/// @brief Wall clock used for every capture timestamp.
/// @ingroup core_types
using Clock = std::chrono::system_clock;

/// @brief Absolute capture time.
/// @ingroup core_types
using Timestamp = Clock::time_point;

/// @brief Elapsed time with nanosecond resolution.
/// @ingroup core_types
using Duration = std::chrono::nanoseconds;

/// @brief Field name to stringified value.
///
/// Insertion order carries no meaning; an ordered map keeps rendering and
/// serialisation deterministic.
///
/// @ingroup core_types
using FieldMap = std::map<std::string, std::string>;

/// @brief Source position of a span or event call site.
///
/// Every part is independently optional, as instrumentation frameworks do
/// not always report all three.
///
/// @ingroup core_types
struct SourceLocation {
    std::optional<std::string> file;         ///< Source file path.
    std::optional<uint32_t> line;            ///< 1-based line number.
    std::optional<std::string> module_path;  ///< Logical module (e.g. namespace or component).

    /// @brief Location of the caller: file, line and enclosing function.
    [[nodiscard]] static SourceLocation current(std::source_location where = std::source_location::current());

    bool operator==(const SourceLocation&) const = default;
};

/// @brief Convert a timestamp to integer nanoseconds since the Unix epoch.
/// @param ts Timestamp to convert.
/// @return Signed nanosecond count.
/// @ingroup core_types
[[nodiscard]] int64_t timestamp_to_nanoseconds(Timestamp ts) noexcept;

/// @brief Build a timestamp from integer nanoseconds since the Unix epoch.
/// @param ns Signed nanosecond count.
/// @return Equivalent timestamp (lossless inverse of timestamp_to_nanoseconds).
/// @ingroup core_types
[[nodiscard]] Timestamp timestamp_from_nanoseconds(int64_t ns) noexcept;

/// @brief Render a timestamp as ISO-8601 UTC with nanoseconds.
///
/// Example: `2026-10-19T08:15:02.123456789Z`.
///
/// @ingroup core_types
[[nodiscard]] std::string format_timestamp(Timestamp ts);

/// @brief Render a duration with an adaptive unit and two decimals.
///
/// Example: `512.00ns`, `3.27µs`, `12.50ms`, `1.02s`.
///
/// @ingroup core_types
[[nodiscard]] std::string format_duration(Duration d);

} // namespace spanner::core
