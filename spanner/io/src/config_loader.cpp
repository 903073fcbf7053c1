#include <spanner/io/config_loader.hpp>
#include <spanner/io/error.hpp>

#include <spanner/core/log.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <array>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>

namespace spanner::io {

namespace {

// Optional getters: absent or null keys leave the default untouched
const rapidjson::Value* find_value(const rapidjson::Value& obj, const char* name) {
    auto it = obj.FindMember(name);
    if (it == obj.MemberEnd() || it->value.IsNull()) {
        return nullptr;
    }
    return &it->value;
}

std::optional<std::string> get_string_opt(const rapidjson::Value& obj, const char* name) {
    const auto* member = find_value(obj, name);
    if (member == nullptr) {
        return std::nullopt;
    }
    if (!member->IsString()) {
        throw LoaderError(std::string("field '") + name + "' must be a string", "config");
    }
    return std::string(member->GetString(), member->GetStringLength());
}

SpannerConfig parse_config(const rapidjson::Document& doc) {
    if (!doc.IsObject()) {
        throw LoaderError("root must be an object", "config");
    }

    SpannerConfig config;

    if (const auto* max_events = find_value(doc, "max_events")) {
        if (!max_events->IsUint64() || max_events->GetUint64() == 0) {
            throw LoaderError("field 'max_events' must be a positive integer", "config");
        }
        config.max_events = static_cast<std::size_t>(max_events->GetUint64());
    }

    if (auto level = get_string_opt(doc, "log_level")) {
        // Validate eagerly so a typo fails at load time
        static_cast<void>(parse_log_level(*level));
        config.log_level = std::move(*level);
    }

    if (auto file = get_string_opt(doc, "log_file")) {
        config.log_file = std::filesystem::path(*file);
    }

    config.export_description = get_string_opt(doc, "export_description");
    return config;
}

} // anonymous namespace

SpannerConfig load_config(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw FileError("cannot open file", path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return load_config_from_string(oss.str());
}

SpannerConfig load_config_from_string(std::string_view json) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());

    if (doc.HasParseError()) {
        throw LoaderError(
            std::string("JSON parse error: ") + rapidjson::GetParseError_En(doc.GetParseError()),
            "at offset " + std::to_string(doc.GetErrorOffset()));
    }

    return parse_config(doc);
}

spdlog::level::level_enum parse_log_level(std::string_view name) {
    static constexpr std::array<std::pair<std::string_view, spdlog::level::level_enum>, 8> levels{{
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"warning", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"critical", spdlog::level::critical},
        {"off", spdlog::level::off},
    }};
    for (const auto& [label, level] : levels) {
        if (label == name) {
            return level;
        }
    }
    throw LoaderError("unknown log level '" + std::string(name) + "'", "config");
}

bool apply_config(const SpannerConfig& config, core::Registry& registry) {
    core::configure_logging(parse_log_level(config.log_level), config.log_file);
    return registry.init_event_manager(config.max_events);
}

} // namespace spanner::io
