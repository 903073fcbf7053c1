#include <spanner/core/capture.hpp>

#include <utility>

namespace spanner::core {

namespace {

thread_local std::vector<SpanInfo> t_span_stack;

// Exit the innermost span and hand it to its enclosing span, if any
void close_innermost() {
    SpanInfo span = std::move(t_span_stack.back());
    t_span_stack.pop_back();
    span.exit();
    if (!t_span_stack.empty()) {
        t_span_stack.back().add_child(std::move(span));
    }
}

} // anonymous namespace

SpanGuard::SpanGuard(std::string name, Level level, std::string target, std::source_location where)
    : SpanGuard(std::move(name), level, std::move(target), SourceLocation::current(where)) {}

SpanGuard::SpanGuard(std::string name, Level level, std::string target,
                     std::optional<SourceLocation> location)
    : depth_(t_span_stack.size())
    , id_(SpanInfo::next_id()) {
    SpanInfo span(id_, std::move(name), std::move(target), level);
    if (location) {
        span.set_location(std::move(*location));
    }
    t_span_stack.push_back(std::move(span));
}

SpanGuard::~SpanGuard() {
    while (t_span_stack.size() > depth_) {
        close_innermost();
    }
}

void SpanGuard::record(std::string key, std::string value) {
    if (depth_ < t_span_stack.size()) {
        t_span_stack[depth_].add_field(std::move(key), std::move(value));
    }
}

std::vector<SpanInfo> current_span_stack() {
    return t_span_stack;
}

std::shared_ptr<const Event> capture_event(Registry& registry, std::string message, Level level,
                                           std::string target, FieldMap fields,
                                           std::optional<SourceLocation> location,
                                           std::shared_ptr<const Event> parent) {
    Event event = Event::from_record(std::move(message), level, std::move(target),
                                     std::move(location), std::move(fields));
    if (!t_span_stack.empty()) {
        event.with_current_span(t_span_stack.back());
        event.with_span_stack(t_span_stack);
    }
    event.with_thread_info(current_thread_id(), current_thread_name())
        .with_process_id(current_process_id())
        .with_correlation_id(generate_correlation_id());
    if (parent) {
        event.with_parent(std::move(parent));
    }

    auto shared = std::make_shared<const Event>(std::move(event));
    if (!registry.emit(shared)) {
        return nullptr;
    }
    return shared;
}

} // namespace spanner::core
