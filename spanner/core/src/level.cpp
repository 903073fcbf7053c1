#include <spanner/core/level.hpp>

#include <cctype>

namespace spanner::core {

std::string_view to_string(Level level) noexcept {
    switch (level) {
        case Level::Trace: return "TRACE";
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO";
        case Level::Warn:  return "WARN";
        case Level::Error: return "ERROR";
    }
    return "INFO";
}

std::optional<Level> level_from_string(std::string_view text) noexcept {
    for (Level level : all_levels()) {
        std::string_view label = to_string(level);
        if (label.size() != text.size()) {
            continue;
        }
        bool same = true;
        for (std::size_t i = 0; i < label.size(); ++i) {
            if (std::toupper(static_cast<unsigned char>(text[i])) != label[i]) {
                same = false;
                break;
            }
        }
        if (same) {
            return level;
        }
    }
    // "WARNING" is accepted as an alias
    if (text.size() == 7) {
        std::string_view alias = "WARNING";
        for (std::size_t i = 0; i < alias.size(); ++i) {
            if (std::toupper(static_cast<unsigned char>(text[i])) != alias[i]) {
                return std::nullopt;
            }
        }
        return Level::Warn;
    }
    return std::nullopt;
}

} // namespace spanner::core
