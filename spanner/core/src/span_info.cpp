#include <spanner/core/span_info.hpp>
#include <spanner/core/error.hpp>

#include <atomic>
#include <utility>

namespace spanner::core {

namespace {

std::atomic<uint64_t> g_next_span_id{1};

} // anonymous namespace

SpanInfo::SpanInfo(uint64_t id, std::string name, std::string target, Level level)
    : SpanInfo(id, std::move(name), std::move(target), level, Clock::now()) {}

SpanInfo::SpanInfo(uint64_t id, std::string name, std::string target, Level level,
                   Timestamp entered_at)
    : id_(id)
    , name_(std::move(name))
    , target_(std::move(target))
    , level_(level)
    , entered_at_(entered_at) {}

uint64_t SpanInfo::next_id() noexcept {
    return g_next_span_id.fetch_add(1, std::memory_order_relaxed);
}

void SpanInfo::require_active(const char* operation) const {
    if (!is_active()) {
        throw InvalidStateError(std::string("Cannot ") + operation + " on exited span '" + name_ + "'");
    }
}

void SpanInfo::add_field(std::string key, std::string value) {
    require_active("add field");
    fields_.insert_or_assign(std::move(key), std::move(value));
}

void SpanInfo::add_child(SpanInfo child) {
    require_active("add child");
    children_.push_back(std::move(child));
}

void SpanInfo::set_location(SourceLocation location) {
    require_active("set location");
    location_ = std::move(location);
}

void SpanInfo::exit() {
    exit(Clock::now());
}

void SpanInfo::exit(Timestamp at) {
    require_active("exit");
    exited_at_ = at;
    duration_ = std::chrono::duration_cast<Duration>(at - entered_at_);
}

Duration SpanInfo::elapsed() const {
    if (duration_) {
        return *duration_;
    }
    auto elapsed = std::chrono::duration_cast<Duration>(Clock::now() - entered_at_);
    return elapsed < Duration::zero() ? Duration::zero() : elapsed;
}

} // namespace spanner::core
