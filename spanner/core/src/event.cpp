#include <spanner/core/event.hpp>

#include <unistd.h>

#include <atomic>
#include <sstream>
#include <thread>
#include <utility>

namespace spanner::core {

namespace {

thread_local std::optional<std::string> t_thread_name;

std::atomic<uint64_t> g_correlation_sequence{0};

// "├─ name (LEVEL) [1.20ms] { key=value }" at the given depth, then children
void format_span(const SpanInfo& span, std::size_t depth, std::ostringstream& out) {
    out << std::string(depth * 2, ' ') << "├─ " << span.name() << " (" << to_string(span.level()) << ")";
    if (span.duration()) {
        out << " [" << format_duration(*span.duration()) << "]";
    } else {
        out << " [active]";
    }

    if (!span.fields().empty()) {
        out << " {";
        for (const auto& [key, value] : span.fields()) {
            out << " " << key << "=" << value;
        }
        out << " }";
    }
    out << "\n";

    for (const auto& child : span.children()) {
        format_span(child, depth + 1, out);
    }
}

} // anonymous namespace

Event::Event(EventData data)
    : data_(std::move(data)) {}

Event::~Event() {
    std::shared_ptr<const Event> link = std::move(parent_);
    while (link && link.use_count() == 1) {
        // Sole owner: take the next link before this one is destroyed
        std::shared_ptr<const Event> next = std::move(link->parent_);
        link = std::move(next);
    }
}

Event Event::from_record(std::string message, Level level, std::string target,
                         std::optional<SourceLocation> location, FieldMap fields) {
    EventData data(std::move(message), level, std::move(target));
    data.set_fields(std::move(fields));
    if (location) {
        data.set_location(std::move(*location));
    }
    return Event(std::move(data));
}

Event Event::capture_current_context(std::string message, Level level, std::string target) {
    Event event = from_record(std::move(message), level, std::move(target), std::nullopt, {});
    event.with_thread_info(current_thread_id(), current_thread_name())
        .with_process_id(current_process_id())
        .with_correlation_id(generate_correlation_id());
    return event;
}

Event& Event::with_parent(std::shared_ptr<const Event> parent) {
    parent_ = std::move(parent);
    return *this;
}

Event& Event::with_span_stack(std::vector<SpanInfo> spans) {
    span_stack_ = std::move(spans);
    return *this;
}

Event& Event::with_current_span(SpanInfo span) {
    current_span_ = std::move(span);
    return *this;
}

Event& Event::with_thread_info(std::string thread_id, std::optional<std::string> thread_name) {
    thread_id_ = std::move(thread_id);
    thread_name_ = std::move(thread_name);
    return *this;
}

Event& Event::with_process_id(uint32_t pid) {
    process_id_ = pid;
    return *this;
}

Event& Event::with_correlation_id(std::string correlation_id) {
    correlation_id_ = std::move(correlation_id);
    return *this;
}

void Event::add_metadata(std::string key, std::string value) {
    custom_metadata_.insert_or_assign(std::move(key), std::move(value));
}

bool Event::has_span_named(std::string_view name) const {
    for (const auto& span : span_stack_) {
        if (span.name().find(name) != std::string::npos) {
            return true;
        }
    }
    return current_span_ && current_span_->name().find(name) != std::string::npos;
}

bool Event::matches(const SearchCriteria& criteria) const {
    if (criteria.level && data_.level() != *criteria.level) {
        return false;
    }
    if (criteria.target && data_.target().find(*criteria.target) == std::string::npos) {
        return false;
    }
    if (criteria.message && data_.message().find(*criteria.message) == std::string::npos) {
        return false;
    }
    if (criteria.span_name && !has_span_named(*criteria.span_name)) {
        return false;
    }
    return true;
}

std::string Event::span_tree() const {
    std::ostringstream out;

    if (current_span_) {
        out << "Current Span: " << current_span_->name() << " ("
            << to_string(current_span_->level()) << ")\n";
    }

    if (!span_stack_.empty()) {
        out << "Span Stack:\n";
        for (std::size_t depth = 0; depth < span_stack_.size(); ++depth) {
            format_span(span_stack_[depth], depth, out);
        }
    }

    return out.str();
}

void Event::append_context(std::string& out) const {
    std::ostringstream oss;

    oss << "Event: " << data_.message() << " (" << to_string(data_.level()) << ")\n";
    oss << "Target: " << data_.target() << "\n";
    oss << "Timestamp: " << format_timestamp(data_.timestamp()) << "\n";

    const auto& loc = data_.location();
    if (loc.file) {
        oss << "Location: " << *loc.file << ":" << loc.line.value_or(0) << "\n";
    }
    if (loc.module_path) {
        oss << "Module: " << *loc.module_path << "\n";
    }

    if (thread_id_) {
        oss << "Thread: " << *thread_id_;
        if (thread_name_) {
            oss << " (" << *thread_name_ << ")";
        }
        oss << "\n";
    }
    if (process_id_) {
        oss << "Process ID: " << *process_id_ << "\n";
    }
    if (correlation_id_) {
        oss << "Correlation ID: " << *correlation_id_ << "\n";
    }

    if (!data_.fields().empty()) {
        oss << "Event Fields:\n";
        for (const auto& [key, value] : data_.fields()) {
            oss << "  " << key << ": " << value << "\n";
        }
    }
    if (!custom_metadata_.empty()) {
        oss << "Metadata:\n";
        for (const auto& [key, value] : custom_metadata_) {
            oss << "  " << key << ": " << value << "\n";
        }
    }

    oss << "\n" << span_tree();
    out += oss.str();
}

std::string Event::full_context() const {
    std::string out;
    append_context(out);

    // Walk the chain iteratively; it ends at the first event without a parent
    for (const Event* link = parent_.get(); link != nullptr; link = link->parent_.get()) {
        out += "\n--- Parent Event ---\n";
        link->append_context(out);
    }
    return out;
}

bool operator==(const Event& lhs, const Event& rhs) {
    const Event* a = &lhs;
    const Event* b = &rhs;
    while (a != nullptr && b != nullptr) {
        if (a == b) {
            return true;
        }
        if (!(a->data_ == b->data_
              && a->span_stack_ == b->span_stack_
              && a->current_span_ == b->current_span_
              && a->thread_id_ == b->thread_id_
              && a->thread_name_ == b->thread_name_
              && a->process_id_ == b->process_id_
              && a->correlation_id_ == b->correlation_id_
              && a->custom_metadata_ == b->custom_metadata_)) {
            return false;
        }
        a = a->parent_.get();
        b = b->parent_.get();
    }
    return a == b;
}

std::string generate_correlation_id() {
    auto since_epoch = Clock::now().time_since_epoch();
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch - secs);
    uint64_t seq = g_correlation_sequence.fetch_add(1, std::memory_order_relaxed);

    std::ostringstream oss;
    oss << "corr-" << std::hex << secs.count() << "-" << nanos.count() << "-" << seq;
    return oss.str();
}

std::string current_thread_id() {
    std::ostringstream oss;
    oss << std::this_thread::get_id();
    return oss.str();
}

void set_current_thread_name(std::string name) {
    t_thread_name = std::move(name);
}

std::optional<std::string> current_thread_name() {
    return t_thread_name;
}

uint32_t current_process_id() noexcept {
    return static_cast<uint32_t>(::getpid());
}

} // namespace spanner::core
