#include <spanner/io/snapshot.hpp>
#include <spanner/io/error.hpp>

#include <spanner/core/error.hpp>
#include <spanner/core/level.hpp>
#include <spanner/core/log.hpp>
#include <spanner/core/registry.hpp>
#include <spanner/core/span_info.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

namespace spanner::io {

namespace {

using namespace spanner::core;

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

// Span trees come from nested guards, so real documents stay far below this
constexpr size_t kMaxSpanDepth = 256;

// =============================================================================
// Encoding
// =============================================================================

void write_string(JsonWriter& writer, const std::string& value) {
    writer.String(value.c_str(), static_cast<rapidjson::SizeType>(value.size()));
}

void write_optional_string(JsonWriter& writer, const char* key, const std::optional<std::string>& value) {
    writer.Key(key);
    if (value) {
        write_string(writer, *value);
    } else {
        writer.Null();
    }
}

void write_field_map(JsonWriter& writer, const char* key, const FieldMap& fields) {
    writer.Key(key);
    writer.StartObject();
    for (const auto& [name, value] : fields) {
        writer.Key(name.c_str(), static_cast<rapidjson::SizeType>(name.size()));
        write_string(writer, value);
    }
    writer.EndObject();
}

void write_location(JsonWriter& writer, const SourceLocation& location) {
    write_optional_string(writer, "file", location.file);
    writer.Key("line");
    if (location.line) {
        writer.Uint(*location.line);
    } else {
        writer.Null();
    }
    write_optional_string(writer, "module_path", location.module_path);
}

void write_level(JsonWriter& writer, Level level) {
    auto label = to_string(level);
    writer.Key("level");
    writer.String(label.data(), static_cast<rapidjson::SizeType>(label.size()));
}

void write_span(JsonWriter& writer, const SpanInfo& span) {
    writer.StartObject();

    writer.Key("id");
    writer.Uint64(span.id());
    writer.Key("name");
    write_string(writer, span.name());
    writer.Key("target");
    write_string(writer, span.target());
    write_level(writer, span.level());
    write_location(writer, span.location());
    write_field_map(writer, "fields", span.fields());

    writer.Key("entered_at");
    writer.Int64(timestamp_to_nanoseconds(span.entered_at()));
    writer.Key("exited_at");
    if (span.exited_at()) {
        writer.Int64(timestamp_to_nanoseconds(*span.exited_at()));
    } else {
        writer.Null();
    }
    writer.Key("duration");
    if (span.duration()) {
        writer.Int64(span.duration()->count());
    } else {
        writer.Null();
    }

    writer.Key("children");
    writer.StartArray();
    for (const auto& child : span.children()) {
        write_span(writer, child);
    }
    writer.EndArray();

    writer.EndObject();
}

// Writes every key of an event object except "parent"; the object is left open
void write_event_body(JsonWriter& writer, const Event& event) {
    writer.StartObject();

    const auto& data = event.data();
    writer.Key("event_data");
    writer.StartObject();
    writer.Key("message");
    write_string(writer, data.message());
    write_level(writer, data.level());
    writer.Key("target");
    write_string(writer, data.target());
    write_location(writer, data.location());
    write_field_map(writer, "fields", data.fields());
    writer.Key("timestamp");
    writer.Int64(timestamp_to_nanoseconds(data.timestamp()));
    writer.EndObject();

    writer.Key("span_stack");
    writer.StartArray();
    for (const auto& span : event.span_stack()) {
        write_span(writer, span);
    }
    writer.EndArray();

    writer.Key("current_span");
    if (event.current_span()) {
        write_span(writer, *event.current_span());
    } else {
        writer.Null();
    }

    write_optional_string(writer, "thread_id", event.thread_id());
    write_optional_string(writer, "thread_name", event.thread_name());
    writer.Key("process_id");
    if (event.process_id()) {
        writer.Uint(*event.process_id());
    } else {
        writer.Null();
    }
    write_optional_string(writer, "correlation_id", event.correlation_id());
    write_field_map(writer, "custom_metadata", event.custom_metadata());
}

// "parent" is the last key of every event object, so the chain is written
// by opening one body per link and closing them all at the end.
void write_event(JsonWriter& writer, const Event& event) {
    size_t open = 0;
    for (const Event* link = &event; link != nullptr; link = link->parent().get()) {
        write_event_body(writer, *link);
        ++open;
        writer.Key("parent");
    }
    writer.Null();
    for (; open > 0; --open) {
        writer.EndObject();
    }
}

// =============================================================================
// Decoding
// =============================================================================

// Helper to get required member with error context
const rapidjson::Value& get_member(const rapidjson::Value& obj, const char* name, const std::string& context) {
    auto it = obj.FindMember(name);
    if (it == obj.MemberEnd()) {
        throw DecodeError(std::string("missing required field '") + name + "'", context);
    }
    return it->value;
}

// nullptr when the member is absent or null
const rapidjson::Value* find_optional(const rapidjson::Value& obj, const char* name) {
    auto it = obj.FindMember(name);
    if (it == obj.MemberEnd() || it->value.IsNull()) {
        return nullptr;
    }
    return &it->value;
}

void require_object(const rapidjson::Value& val, const std::string& context) {
    if (!val.IsObject()) {
        throw DecodeError("must be an object", context);
    }
}

std::string get_string(const rapidjson::Value& val, const char* name, const std::string& context) {
    const auto& member = get_member(val, name, context);
    if (!member.IsString()) {
        throw DecodeError(std::string("field '") + name + "' must be a string", context);
    }
    return std::string(member.GetString(), member.GetStringLength());
}

uint64_t get_uint64(const rapidjson::Value& val, const char* name, const std::string& context) {
    const auto& member = get_member(val, name, context);
    if (!member.IsUint64()) {
        throw DecodeError(std::string("field '") + name + "' must be a non-negative integer", context);
    }
    return member.GetUint64();
}

int64_t get_int64(const rapidjson::Value& val, const char* name, const std::string& context) {
    const auto& member = get_member(val, name, context);
    if (!member.IsInt64()) {
        throw DecodeError(std::string("field '") + name + "' must be an integer", context);
    }
    return member.GetInt64();
}

std::optional<std::string> get_optional_string(const rapidjson::Value& val, const char* name,
                                               const std::string& context) {
    const auto* member = find_optional(val, name);
    if (member == nullptr) {
        return std::nullopt;
    }
    if (!member->IsString()) {
        throw DecodeError(std::string("field '") + name + "' must be a string or null", context);
    }
    return std::string(member->GetString(), member->GetStringLength());
}

std::optional<uint32_t> get_optional_uint32(const rapidjson::Value& val, const char* name,
                                            const std::string& context) {
    const auto* member = find_optional(val, name);
    if (member == nullptr) {
        return std::nullopt;
    }
    if (!member->IsUint()) {
        throw DecodeError(std::string("field '") + name + "' must be a 32-bit unsigned integer or null", context);
    }
    return member->GetUint();
}

std::optional<int64_t> get_optional_int64(const rapidjson::Value& val, const char* name,
                                          const std::string& context) {
    const auto* member = find_optional(val, name);
    if (member == nullptr) {
        return std::nullopt;
    }
    if (!member->IsInt64()) {
        throw DecodeError(std::string("field '") + name + "' must be an integer or null", context);
    }
    return member->GetInt64();
}

Level get_level(const rapidjson::Value& val, const std::string& context) {
    std::string label = get_string(val, "level", context);
    auto level = level_from_string(label);
    if (!level) {
        throw DecodeError("unknown level '" + label + "'", context);
    }
    return *level;
}

FieldMap get_field_map(const rapidjson::Value& val, const char* name, const std::string& context) {
    const auto& member = get_member(val, name, context);
    if (!member.IsObject()) {
        throw DecodeError(std::string("field '") + name + "' must be an object", context);
    }
    FieldMap fields;
    for (auto it = member.MemberBegin(); it != member.MemberEnd(); ++it) {
        if (!it->value.IsString()) {
            throw DecodeError(std::string("values of '") + name + "' must be strings",
                              context + "." + name + "." + it->name.GetString());
        }
        fields.emplace(std::string(it->name.GetString(), it->name.GetStringLength()),
                       std::string(it->value.GetString(), it->value.GetStringLength()));
    }
    return fields;
}

const rapidjson::Value& get_array(const rapidjson::Value& val, const char* name, const std::string& context) {
    const auto& member = get_member(val, name, context);
    if (!member.IsArray()) {
        throw DecodeError(std::string("field '") + name + "' must be an array", context);
    }
    return member;
}

SourceLocation get_location(const rapidjson::Value& val, const std::string& context) {
    SourceLocation location;
    location.file = get_optional_string(val, "file", context);
    location.line = get_optional_uint32(val, "line", context);
    location.module_path = get_optional_string(val, "module_path", context);
    return location;
}

SpanInfo parse_span(const rapidjson::Value& obj, const std::string& context, size_t depth = 0) {
    require_object(obj, context);
    if (depth > kMaxSpanDepth) {
        throw DecodeError("span nesting exceeds " + std::to_string(kMaxSpanDepth) + " levels", context);
    }

    SpanInfo span(get_uint64(obj, "id", context),
                  get_string(obj, "name", context),
                  get_string(obj, "target", context),
                  get_level(obj, context),
                  timestamp_from_nanoseconds(get_int64(obj, "entered_at", context)));

    span.set_location(get_location(obj, context));
    for (auto& [key, value] : get_field_map(obj, "fields", context)) {
        span.add_field(key, value);
    }

    const auto& children = get_array(obj, "children", context);
    for (rapidjson::SizeType i = 0; i < children.Size(); ++i) {
        span.add_child(parse_span(children[i], context + ".children[" + std::to_string(i) + "]", depth + 1));
    }

    auto exited_at = get_optional_int64(obj, "exited_at", context);
    auto duration = get_optional_int64(obj, "duration", context);
    if (duration && !exited_at) {
        throw DecodeError("'duration' present without 'exited_at'", context);
    }
    if (exited_at) {
        span.exit(timestamp_from_nanoseconds(*exited_at));
        if (duration && *duration != span.duration()->count()) {
            throw DecodeError("'duration' does not match 'exited_at' - 'entered_at'", context);
        }
    }
    return span;
}

// Everything but "parent"
Event parse_event_body(const rapidjson::Value& obj, const std::string& context) {
    require_object(obj, context);

    std::string data_ctx = context + ".event_data";
    const auto& data_obj = get_member(obj, "event_data", context);
    require_object(data_obj, data_ctx);

    EventData data(get_string(data_obj, "message", data_ctx),
                   get_level(data_obj, data_ctx),
                   get_string(data_obj, "target", data_ctx),
                   timestamp_from_nanoseconds(get_int64(data_obj, "timestamp", data_ctx)));
    data.set_location(get_location(data_obj, data_ctx));
    data.set_fields(get_field_map(data_obj, "fields", data_ctx));

    Event event(std::move(data));

    const auto& stack = get_array(obj, "span_stack", context);
    std::vector<SpanInfo> spans;
    spans.reserve(stack.Size());
    for (rapidjson::SizeType i = 0; i < stack.Size(); ++i) {
        spans.push_back(parse_span(stack[i], context + ".span_stack[" + std::to_string(i) + "]"));
    }
    event.with_span_stack(std::move(spans));

    if (const auto* current = find_optional(obj, "current_span")) {
        event.with_current_span(parse_span(*current, context + ".current_span"));
    }

    auto thread_id = get_optional_string(obj, "thread_id", context);
    auto thread_name = get_optional_string(obj, "thread_name", context);
    if (thread_id) {
        event.with_thread_info(std::move(*thread_id), std::move(thread_name));
    } else if (thread_name) {
        throw DecodeError("'thread_name' present without 'thread_id'", context);
    }

    if (auto pid = get_optional_uint32(obj, "process_id", context)) {
        event.with_process_id(*pid);
    }
    if (auto correlation = get_optional_string(obj, "correlation_id", context)) {
        event.with_correlation_id(std::move(*correlation));
    }

    for (auto& [key, value] : get_field_map(obj, "custom_metadata", context)) {
        event.add_metadata(key, value);
    }

    return event;
}

// Parent chains can be arbitrarily long, so the links are collected first and
// built from the root ancestor down.
Event parse_event(const rapidjson::Value& obj, const std::string& context) {
    std::vector<const rapidjson::Value*> chain{&obj};
    for (const auto* link = &obj; link->IsObject();) {
        link = find_optional(*link, "parent");
        if (link == nullptr) {
            break;
        }
        chain.push_back(link);
    }

    auto link_context = [&](size_t i) {
        return i == 0 ? context : context + ".parent[" + std::to_string(i) + "]";
    };

    std::shared_ptr<const Event> parent;
    for (size_t i = chain.size() - 1; i > 0; --i) {
        Event ancestor = parse_event_body(*chain[i], link_context(i));
        ancestor.with_parent(std::move(parent));
        parent = std::make_shared<const Event>(std::move(ancestor));
    }

    Event event = parse_event_body(obj, context);
    event.with_parent(std::move(parent));
    return event;
}

ExportMetadata parse_metadata(const rapidjson::Value& obj) {
    const std::string context = "metadata";
    require_object(obj, context);

    ExportMetadata metadata;
    metadata.format_version = get_string(obj, "format_version", context);

    auto major_version = [](std::string_view version) { return version.substr(0, version.find('.')); };
    if (major_version(metadata.format_version) != major_version(FORMAT_VERSION)) {
        throw DecodeError("unsupported format version '" + metadata.format_version + "' (expected "
                              + std::string(FORMAT_VERSION) + ")",
                          context);
    }

    metadata.export_timestamp = timestamp_from_nanoseconds(get_int64(obj, "export_timestamp", context));
    metadata.total_events = get_uint64(obj, "total_events", context);

    const auto& counts = get_member(obj, "level_counts", context);
    if (!counts.IsObject()) {
        throw DecodeError("field 'level_counts' must be an object", context);
    }
    for (auto it = counts.MemberBegin(); it != counts.MemberEnd(); ++it) {
        if (!it->value.IsUint64()) {
            throw DecodeError("level counts must be non-negative integers",
                              context + ".level_counts." + it->name.GetString());
        }
        metadata.level_counts.emplace(it->name.GetString(), it->value.GetUint64());
    }

    metadata.description = get_optional_string(obj, "description", context);
    return metadata;
}

std::vector<uint8_t> to_bytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

// Replays in document order; each push prepends, so the last document entry ends up newest
std::size_t replay(const ExportData& data, EventManager& target) {
    for (const auto& event : data.events) {
        target.push(event);
    }
    return data.events.size();
}

std::shared_ptr<EventManager> require_global_manager() {
    auto manager = global_registry().manager();
    if (!manager) {
        throw NotInitializedError();
    }
    return manager;
}

} // anonymous namespace

ExportData create_export_data(std::vector<core::Event> events, std::optional<std::string> description) {
    ExportData data;
    data.metadata.export_timestamp = Clock::now();
    data.metadata.total_events = events.size();
    data.metadata.description = std::move(description);
    for (const auto& event : events) {
        ++data.metadata.level_counts[std::string(to_string(event.level()))];
    }
    data.events = std::move(events);
    return data;
}

ExportData create_export_data(const core::EventManager::EventList& events,
                              std::optional<std::string> description) {
    std::vector<Event> copies;
    copies.reserve(events.size());
    for (const auto& event : events) {
        copies.push_back(*event);
    }
    return create_export_data(std::move(copies), std::move(description));
}

std::string encode_snapshot(const ExportData& data) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);

    writer.StartObject();

    const auto& meta = data.metadata;
    writer.Key("metadata");
    writer.StartObject();
    writer.Key("format_version");
    write_string(writer, meta.format_version);
    writer.Key("export_timestamp");
    writer.Int64(timestamp_to_nanoseconds(meta.export_timestamp));
    writer.Key("total_events");
    writer.Uint64(meta.total_events);
    writer.Key("level_counts");
    writer.StartObject();
    for (const auto& [label, count] : meta.level_counts) {
        writer.Key(label.c_str(), static_cast<rapidjson::SizeType>(label.size()));
        writer.Uint64(count);
    }
    writer.EndObject();
    write_optional_string(writer, "description", meta.description);
    writer.EndObject();

    writer.Key("events");
    writer.StartArray();
    for (const auto& event : data.events) {
        write_event(writer, event);
    }
    writer.EndArray();

    writer.EndObject();

    return std::string(buffer.GetString(), buffer.GetSize());
}

ExportData decode_snapshot(std::string_view json) {
    rapidjson::Document doc;
    doc.Parse<rapidjson::kParseIterativeFlag>(json.data(), json.size());

    if (doc.HasParseError()) {
        throw DecodeError(
            std::string("JSON parse error: ") + rapidjson::GetParseError_En(doc.GetParseError()),
            "at offset " + std::to_string(doc.GetErrorOffset()));
    }

    if (!doc.IsObject()) {
        throw DecodeError("root must be an object", "snapshot");
    }

    ExportData data;
    data.metadata = parse_metadata(get_member(doc, "metadata", "snapshot"));

    const auto& events = get_array(doc, "events", "snapshot");
    data.events.reserve(events.Size());
    for (rapidjson::SizeType i = 0; i < events.Size(); ++i) {
        data.events.push_back(parse_event(events[i], "events[" + std::to_string(i) + "]"));
    }

    if (data.metadata.total_events != data.events.size()) {
        throw DecodeError("total_events is " + std::to_string(data.metadata.total_events) + " but "
                              + std::to_string(data.events.size()) + " events are present",
                          "metadata");
    }

    return data;
}

ExportData read_snapshot(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileError("cannot open file", path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    if (file.bad()) {
        throw FileError("read failed", path.string());
    }

    try {
        return decode_snapshot(oss.str());
    } catch (const DecodeError& e) {
        logger()->debug("rejecting snapshot {}: {}", path.string(), e.what());
        throw;
    }
}

void write_snapshot(const ExportData& data, const std::filesystem::path& path) {
    std::string json = encode_snapshot(data);

    std::filesystem::path temp = path;
    temp += ".tmp";
    {
        std::ofstream file(temp, std::ios::binary | std::ios::trunc);
        if (!file) {
            throw FileError("cannot open file for writing", temp.string());
        }
        file.write(json.data(), static_cast<std::streamsize>(json.size()));
        file.flush();
        if (!file) {
            throw FileError("write failed", temp.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp, ignored);
        throw FileError("cannot replace file: " + ec.message(), path.string());
    }
}

std::vector<uint8_t> export_to_bin_data(const core::EventManager& manager,
                                        std::optional<std::string> description) {
    auto data = create_export_data(manager.snapshot(), std::move(description));
    return to_bytes(encode_snapshot(data));
}

std::size_t export_to_bin_file(const core::EventManager& manager, const std::filesystem::path& path,
                               std::optional<std::string> description) {
    return export_filtered_to_bin_file(manager, path, SearchCriteria{}, std::move(description));
}

std::size_t export_filtered_to_bin_file(const core::EventManager& manager,
                                        const std::filesystem::path& path,
                                        const core::SearchCriteria& criteria,
                                        std::optional<std::string> description) {
    auto data = create_export_data(manager.search(criteria), std::move(description));
    write_snapshot(data, path);
    logger()->info("exported {} events to {}", data.events.size(), path.string());
    return data.events.size();
}

std::unique_ptr<core::EventManager> import_from_bin_data(std::span<const uint8_t> bytes) {
    auto data = decode_snapshot(std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size()));
    auto manager = std::make_unique<EventManager>();
    replay(data, *manager);
    return manager;
}

std::unique_ptr<core::EventManager> import_from_bin_file(const std::filesystem::path& path) {
    auto data = read_snapshot(path);
    auto manager = std::make_unique<EventManager>();
    std::size_t count = replay(data, *manager);
    logger()->info("imported {} events from {} ({} retained)", count, path.string(), manager->size());
    return manager;
}

std::pair<ExportData, std::size_t> import_and_merge_from_bin_file(core::EventManager& target,
                                                                  const std::filesystem::path& path) {
    auto data = read_snapshot(path);
    std::size_t count = replay(data, target);
    logger()->info("merged {} events from {}", count, path.string());
    return {std::move(data), count};
}

std::vector<uint8_t> export_to_bin_data() {
    return export_to_bin_data(*require_global_manager());
}

std::size_t export_to_bin_file(const std::filesystem::path& path) {
    return export_to_bin_file(*require_global_manager(), path);
}

std::size_t export_filtered_to_bin_file(const std::filesystem::path& path,
                                        const core::SearchCriteria& criteria,
                                        std::optional<std::string> description) {
    return export_filtered_to_bin_file(*require_global_manager(), path, criteria, std::move(description));
}

std::pair<ExportData, std::size_t> import_and_merge_from_bin_file(const std::filesystem::path& path) {
    return import_and_merge_from_bin_file(*require_global_manager(), path);
}

} // namespace spanner::io
