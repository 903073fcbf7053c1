#pragma once

#include <spanner/core/event.hpp>
#include <spanner/core/event_target.hpp>
#include <spanner/core/level.hpp>

#include <cstddef>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace spanner::core {

/// @brief Bounded, newest-first history of events plus the bus that feeds it.
///
/// The manager owns one EventTarget<Event> and subscribes itself to it, so
/// every event published through emit() or through `events().emit()` is
/// retained as well as fanned out. push() stores without publishing.
///
/// Storage is a fixed-capacity FIFO-eviction buffer keyed by arrival
/// order: each push prepends, and when the length exceeds max_events()
/// exactly one element is dropped from the back.
///
/// All queries copy out shared references under the buffer lock and never
/// mutate; results preserve newest-first order.
///
/// Non-copyable and non-movable: the bus handler refers to this instance.
///
/// @see EventTarget, Registry
/// @ingroup core_store
class EventManager {
public:
    /// @brief Capacity used when none is given.
    static constexpr std::size_t DEFAULT_MAX_EVENTS = 12'000;

    using EventPtr = std::shared_ptr<const Event>;
    using EventList = std::vector<EventPtr>;

    /// @brief Create an empty store.
    /// @param max_events Capacity; DEFAULT_MAX_EVENTS when absent.
    explicit EventManager(std::optional<std::size_t> max_events = std::nullopt);

    ~EventManager();

    EventManager(const EventManager&) = delete;
    EventManager& operator=(const EventManager&) = delete;
    EventManager(EventManager&&) = delete;
    EventManager& operator=(EventManager&&) = delete;

    /// @brief Store and publish an event.
    void emit(Event event);

    /// @brief Store and publish an already shared event.
    void emit(EventPtr event);

    /// @brief Store an event without publishing it.
    void push(Event event);

    /// @brief Store an already shared event without publishing it.
    void push(EventPtr event);

    /// @brief The bus this store is subscribed to.
    [[nodiscard]] EventTarget<Event>& events() noexcept { return target_; }

    /// @brief Number of retained events.
    [[nodiscard]] std::size_t size() const;

    /// @brief Returns true if no event is retained.
    [[nodiscard]] bool empty() const;

    /// @brief Capacity of the store.
    [[nodiscard]] std::size_t max_events() const noexcept { return max_events_; }

    /// @brief Drop every retained event.
    ///
    /// Subscriptions and previously returned lists are unaffected.
    void clear();

    /// @brief All retained events, newest first.
    [[nodiscard]] EventList snapshot() const;

    [[nodiscard]] EventList get_by_level(Level level) const;
    [[nodiscard]] EventList get_by_target(std::string_view target) const;
    [[nodiscard]] EventList get_by_span(std::string_view span_name) const;
    [[nodiscard]] EventList get_by_thread(std::string_view thread_id) const;
    [[nodiscard]] EventList get_by_correlation_id(std::string_view correlation_id) const;

    /// @brief The @p count most recent events.
    [[nodiscard]] EventList get_recent(std::size_t count) const;

    /// @brief Events satisfying every supplied filter.
    [[nodiscard]] EventList search(const SearchCriteria& criteria) const;

    /// @brief Retained event count per level; levels with no event are omitted.
    [[nodiscard]] std::map<Level, std::size_t> level_counts() const;

    /// @brief Human-readable count summary.
    ///
    /// First line `Event Summary: N total events`, then one indented
    /// `LEVEL: count` line per non-zero level from ERROR to TRACE.
    [[nodiscard]] std::string summary() const;

private:
    template<typename Pred>
    EventList filter(Pred&& pred) const;

    std::size_t max_events_;
    mutable std::mutex mutex_;
    std::deque<EventPtr> events_;
    EventTarget<Event> target_;
    SubscriptionId store_subscription_;
};

} // namespace spanner::core
