#include <spanner/core/event_manager.hpp>

#ifdef TRACY_ENABLE
#include <tracy/Tracy.hpp>
#endif

#include <algorithm>
#include <sstream>
#include <utility>

namespace spanner::core {

EventManager::EventManager(std::optional<std::size_t> max_events)
    : max_events_(max_events.value_or(DEFAULT_MAX_EVENTS)) {
    // Registered first, so the event is retained before any other listener sees it
    store_subscription_ = target_.subscribe([this](const EventPtr& event) { push(event); });
}

EventManager::~EventManager() {
    target_.unsubscribe(store_subscription_);
}

void EventManager::emit(Event event) {
    target_.emit(std::move(event));
}

void EventManager::emit(EventPtr event) {
    target_.emit(std::move(event));
}

void EventManager::push(Event event) {
    push(std::make_shared<const Event>(std::move(event)));
}

void EventManager::push(EventPtr event) {
#ifdef TRACY_ENABLE
    ZoneScoped;
#endif
    if (!event) {
        return;
    }

    EventPtr evicted;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_front(std::move(event));
        if (events_.size() > max_events_) {
            evicted = std::move(events_.back());
            events_.pop_back();
        }
    }
    // The evicted event (and possibly its parent chain) is released outside the lock
}

std::size_t EventManager::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

bool EventManager::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.empty();
}

void EventManager::clear() {
    std::deque<EventPtr> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dropped.swap(events_);
    }
}

template<typename Pred>
EventManager::EventList EventManager::filter(Pred&& pred) const {
    EventList result;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& event : events_) {
        if (pred(*event)) {
            result.push_back(event);
        }
    }
    return result;
}

EventManager::EventList EventManager::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return EventList(events_.begin(), events_.end());
}

EventManager::EventList EventManager::get_by_level(Level level) const {
    return filter([level](const Event& event) { return event.level() == level; });
}

EventManager::EventList EventManager::get_by_target(std::string_view target) const {
    return filter([target](const Event& event) {
        return event.data().target().find(target) != std::string::npos;
    });
}

EventManager::EventList EventManager::get_by_span(std::string_view span_name) const {
    return filter([span_name](const Event& event) { return event.has_span_named(span_name); });
}

EventManager::EventList EventManager::get_by_thread(std::string_view thread_id) const {
    return filter([thread_id](const Event& event) {
        return event.thread_id() && *event.thread_id() == thread_id;
    });
}

EventManager::EventList EventManager::get_by_correlation_id(std::string_view correlation_id) const {
    return filter([correlation_id](const Event& event) {
        return event.correlation_id() && *event.correlation_id() == correlation_id;
    });
}

EventManager::EventList EventManager::get_recent(std::size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto n = std::min(count, events_.size());
    return EventList(events_.begin(), events_.begin() + static_cast<std::ptrdiff_t>(n));
}

EventManager::EventList EventManager::search(const SearchCriteria& criteria) const {
    return filter([&criteria](const Event& event) { return event.matches(criteria); });
}

std::map<Level, std::size_t> EventManager::level_counts() const {
    std::map<Level, std::size_t> counts;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& event : events_) {
        ++counts[event->level()];
    }
    return counts;
}

std::string EventManager::summary() const {
    auto counts = level_counts();
    std::size_t total = 0;
    for (const auto& [level, count] : counts) {
        total += count;
    }

    std::ostringstream oss;
    oss << "Event Summary: " << total << " total events\n";
    for (Level level : all_levels()) {
        auto it = counts.find(level);
        if (it != counts.end() && it->second > 0) {
            oss << "  " << to_string(level) << ": " << it->second << "\n";
        }
    }
    return oss.str();
}

} // namespace spanner::core
