#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace spanner::core {

/// @brief Severity of an event or span.
///
/// Ordered by increasing severity so that `Level::Error > Level::Warn`
/// compares as expected.
///
/// @see to_string, level_from_string
/// @ingroup core_model
enum class Level : uint8_t {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
};

/// @brief Upper-case label of a level ("ERROR", "WARN", ...).
/// @param level Level to convert.
/// @return Static label, never empty.
[[nodiscard]] std::string_view to_string(Level level) noexcept;

/// @brief Parse a level label, ignoring case.
/// @param text Label such as "info" or "ERROR".
/// @return The level, or std::nullopt if @p text names no level.
[[nodiscard]] std::optional<Level> level_from_string(std::string_view text) noexcept;

/// @brief All levels from most to least severe (ERROR first).
[[nodiscard]] constexpr std::array<Level, 5> all_levels() noexcept {
    return {Level::Error, Level::Warn, Level::Info, Level::Debug, Level::Trace};
}

} // namespace spanner::core
