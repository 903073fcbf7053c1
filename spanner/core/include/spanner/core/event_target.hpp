#pragma once

/// @file event_target.hpp
/// @brief Generic thread-safe publish/subscribe bus with stream views.
/// @ingroup core_bus

#include <spanner/core/log.hpp>

#ifdef TRACY_ENABLE
#include <tracy/Tracy.hpp>
#endif

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <utility>
#include <vector>

namespace spanner::core {

template<typename T>
class EventTarget;

template<typename T>
class ScopedSubscription;

template<typename T>
class EventStream;

/// @brief Identifies one handler registration on an EventTarget.
///
/// Returned by EventTarget::subscribe(). Default-constructed instances are
/// invalid; only an EventTarget may create valid identifiers, and an
/// identifier is only honoured by the target that issued it.
///
/// @see EventTarget::unsubscribe, ScopedSubscription
/// @ingroup core_bus
class SubscriptionId {
    template<typename T>
    friend class EventTarget;
    template<typename T>
    friend class ScopedSubscription;

public:
    /// @brief Default-construct an invalid identifier.
    SubscriptionId() = default;

    /// @brief Returns true until the registration has been removed through this id.
    [[nodiscard]] bool valid() const noexcept { return value_ != 0; }

    /// @brief Allow contextual conversion to `bool`.
    explicit operator bool() const noexcept { return valid(); }

    /// @brief Raw registration number (0 when invalid).
    [[nodiscard]] uint64_t value() const noexcept { return value_; }

private:
    SubscriptionId(uint64_t value, const void* owner) noexcept
        : value_(value)
        , owner_(owner) {}

    void invalidate() noexcept {
        value_ = 0;
        owner_ = nullptr;
    }

    uint64_t value_{0};
    const void* owner_{nullptr};
};

namespace detail {

/// @brief Unbounded multi-producer queue of shared values with close semantics.
///
/// Consumers block in next() until a value arrives or the channel is
/// closed. No backpressure: a stalled consumer grows its queue without
/// limit.
template<typename T>
class Channel {
public:
    using Value = std::shared_ptr<const T>;

    void push(Value value) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return;
            }
            queue_.push_back(std::move(value));
        }
        cv_.notify_one();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    // nullptr once closed and drained
    Value next() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !queue_.empty() || closed_; });
        return pop_locked();
    }

    Value try_next() {
        std::lock_guard<std::mutex> lock(mutex_);
        return pop_locked();
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    [[nodiscard]] bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

private:
    Value pop_locked() {
        if (queue_.empty()) {
            return nullptr;
        }
        Value value = std::move(queue_.front());
        queue_.pop_front();
        return value;
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Value> queue_;
    bool closed_{false};
};

/// @brief Listener set shared between a target and its outstanding handles.
///
/// Handles keep only a weak reference, so they never extend the lifetime
/// of a disposed target and never dangle.
template<typename T>
class ListenerRegistry {
public:
    using Value = std::shared_ptr<const T>;
    using Handler = std::function<void(const Value&)>;

    struct Snapshot {
        std::vector<std::shared_ptr<const Handler>> handlers;
        std::shared_ptr<Channel<T>> default_channel;
    };

    // 0 when the registry has been closed
    uint64_t add(Handler handler) {
        auto shared = std::make_shared<const Handler>(std::move(handler));
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (closed_) {
            return 0;
        }
        uint64_t id = next_id_++;
        handlers_.emplace(id, std::move(shared));
        return id;
    }

    bool remove(uint64_t id) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return handlers_.erase(id) > 0;
    }

    // Returns false if the registry is already closed; the caller closes the channel.
    bool track(const std::shared_ptr<Channel<T>>& channel) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        std::erase_if(channels_, [](const auto& weak) { return weak.expired(); });
        channels_.push_back(channel);
        return true;
    }

    std::shared_ptr<Channel<T>> default_channel() {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (!default_channel_) {
            default_channel_ = std::make_shared<Channel<T>>();
            if (closed_) {
                default_channel_->close();
            }
        }
        return default_channel_;
    }

    Snapshot snapshot() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        Snapshot snap;
        snap.handlers.reserve(handlers_.size());
        for (const auto& [id, handler] : handlers_) {
            snap.handlers.push_back(handler);
        }
        snap.default_channel = default_channel_;
        return snap;
    }

    void close() {
        std::vector<std::weak_ptr<Channel<T>>> channels;
        std::shared_ptr<Channel<T>> default_channel;
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            closed_ = true;
            handlers_.clear();
            channels.swap(channels_);
            default_channel = default_channel_;
        }
        for (const auto& weak : channels) {
            if (auto channel = weak.lock()) {
                channel->close();
            }
        }
        if (default_channel) {
            default_channel->close();
        }
    }

    [[nodiscard]] std::size_t size() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return handlers_.size();
    }

private:
    mutable std::shared_mutex mutex_;
    std::map<uint64_t, std::shared_ptr<const Handler>> handlers_;
    std::vector<std::weak_ptr<Channel<T>>> channels_;
    std::shared_ptr<Channel<T>> default_channel_;
    uint64_t next_id_{1};
    bool closed_{false};
};

} // namespace detail

/// @brief Registration guard that unsubscribes when it goes out of scope.
///
/// Move-only. A moved-from or released guard does nothing on destruction.
/// Outliving the target is safe: the guard then has nothing to remove.
///
/// @see EventTarget::subscribe_scoped
/// @ingroup core_bus
template<typename T>
class ScopedSubscription {
    friend class EventTarget<T>;

public:
    ScopedSubscription() = default;

    ~ScopedSubscription() { reset(); }

    ScopedSubscription(const ScopedSubscription&) = delete;
    ScopedSubscription& operator=(const ScopedSubscription&) = delete;

    ScopedSubscription(ScopedSubscription&& other) noexcept
        : registry_(std::move(other.registry_))
        , id_(other.id_) {
        other.id_.invalidate();
    }

    ScopedSubscription& operator=(ScopedSubscription&& other) noexcept {
        if (this != &other) {
            reset();
            registry_ = std::move(other.registry_);
            id_ = other.id_;
            other.id_.invalidate();
        }
        return *this;
    }

    /// @brief Unsubscribe now. Idempotent.
    void reset() {
        if (id_) {
            if (auto registry = registry_.lock()) {
                registry->remove(id_.value());
            }
            id_.invalidate();
        }
        registry_.reset();
    }

    /// @brief Give up scoped ownership and return the plain identifier.
    [[nodiscard]] SubscriptionId release() noexcept {
        SubscriptionId id = id_;
        id_.invalidate();
        registry_.reset();
        return id;
    }

    [[nodiscard]] const SubscriptionId& id() const noexcept { return id_; }

    [[nodiscard]] bool active() const noexcept { return id_.valid(); }

private:
    ScopedSubscription(std::weak_ptr<detail::ListenerRegistry<T>> registry, SubscriptionId id)
        : registry_(std::move(registry))
        , id_(id) {}

    std::weak_ptr<detail::ListenerRegistry<T>> registry_;
    SubscriptionId id_;
};

/// @brief Pull-style view of an EventTarget.
///
/// Each stream obtained from EventTarget::as_stream() owns a private
/// unbounded queue fed by its own subscription, so a slow consumer never
/// blocks the publisher or other subscribers. The sequence is infinite
/// while the target lives and terminates (next() returns nullptr) once the
/// target is destroyed and the queue is drained.
///
/// Destroying the stream removes its subscription.
///
/// @see EventTarget::as_stream, EventTarget::default_stream
/// @ingroup core_bus
template<typename T>
class EventStream {
    friend class EventTarget<T>;

public:
    using Value = std::shared_ptr<const T>;

    ~EventStream() {
        if (subscription_ != 0) {
            if (auto registry = registry_.lock()) {
                registry->remove(subscription_);
            }
        }
    }

    EventStream(const EventStream&) = delete;
    EventStream& operator=(const EventStream&) = delete;

    EventStream(EventStream&& other) noexcept
        : channel_(std::move(other.channel_))
        , registry_(std::move(other.registry_))
        , subscription_(std::exchange(other.subscription_, 0)) {}

    EventStream& operator=(EventStream&&) = delete;

    /// @brief Block until the next value; nullptr once the stream has terminated.
    [[nodiscard]] Value next() { return channel_ ? channel_->next() : nullptr; }

    /// @brief Next value if one is queued, nullptr otherwise. Never blocks.
    [[nodiscard]] Value try_next() { return channel_ ? channel_->try_next() : nullptr; }

    /// @brief Number of values waiting in this stream's queue.
    [[nodiscard]] std::size_t pending() const { return channel_ ? channel_->size() : 0; }

    /// @brief Returns true once the target has been disposed.
    [[nodiscard]] bool closed() const { return !channel_ || channel_->closed(); }

private:
    EventStream(std::shared_ptr<detail::Channel<T>> channel,
                std::weak_ptr<detail::ListenerRegistry<T>> registry,
                uint64_t subscription)
        : channel_(std::move(channel))
        , registry_(std::move(registry))
        , subscription_(subscription) {}

    std::shared_ptr<detail::Channel<T>> channel_;
    std::weak_ptr<detail::ListenerRegistry<T>> registry_;
    uint64_t subscription_{0};
};

/// @brief Thread-safe publish/subscribe bus for values of type T.
///
/// emit() wraps the value in a `std::shared_ptr<const T>` and invokes
/// every registered handler synchronously on the caller's thread. The
/// listener set is guarded by a reader/writer lock that is held only while
/// the handler list is copied, never across handler invocation, so handlers
/// may themselves emit, subscribe or unsubscribe.
///
/// Unsubscribing affects only future emissions: an emit() that already
/// copied the listener list delivers to the removed handler once more.
///
/// A handler that throws a `std::exception` is logged and the remaining
/// handlers still run.
///
/// @code
/// core::EventTarget<Event> bus;
/// auto id = bus.subscribe([](const auto& event) { ... });
/// bus.emit(Event{...});
/// bus.unsubscribe(id);
/// @endcode
///
/// @see SubscriptionId, ScopedSubscription, EventStream
/// @ingroup core_bus
template<typename T>
class EventTarget {
public:
    using Value = std::shared_ptr<const T>;
    using Handler = typename detail::ListenerRegistry<T>::Handler;

    EventTarget()
        : registry_(std::make_shared<detail::ListenerRegistry<T>>()) {}

    /// @brief Dispose the bus: drops all handlers and terminates every stream.
    ~EventTarget() { registry_->close(); }

    EventTarget(const EventTarget&) = delete;
    EventTarget& operator=(const EventTarget&) = delete;
    EventTarget(EventTarget&&) = delete;
    EventTarget& operator=(EventTarget&&) = delete;

    /// @brief Publish a value to every current listener.
    void emit(T value) { emit(std::make_shared<const T>(std::move(value))); }

    /// @brief Publish an already shared value to every current listener.
    void emit(Value value) {
#ifdef TRACY_ENABLE
        ZoneScoped;
#endif
        if (!value) {
            return;
        }

        auto snapshot = registry_->snapshot();
        for (const auto& handler : snapshot.handlers) {
            try {
                (*handler)(value);
            } catch (const std::exception& e) {
                logger()->warn("event handler threw: {}", e.what());
            }
        }

        if (snapshot.default_channel) {
            snapshot.default_channel->push(std::move(value));
        }
    }

    /// @brief Register a handler for every subsequent emit().
    /// @return Identifier for unsubscribe(); invalid only if the target is being destroyed.
    [[nodiscard]] SubscriptionId subscribe(Handler handler) {
        uint64_t id = registry_->add(std::move(handler));
        if (id == 0) {
            return SubscriptionId{};
        }
        return SubscriptionId{id, registry_.get()};
    }

    /// @brief Register a handler that is removed when the returned guard is destroyed.
    [[nodiscard]] ScopedSubscription<T> subscribe_scoped(Handler handler) {
        return ScopedSubscription<T>(registry_, subscribe(std::move(handler)));
    }

    /// @brief Remove a registration. No-op if already removed or foreign.
    /// @param id Identifier from subscribe(); invalidated on return.
    void unsubscribe(SubscriptionId& id) {
        if (id && id.owner_ == registry_.get()) {
            registry_->remove(id.value());
        }
        id.invalidate();
    }

    /// @brief Create an independent stream with its own subscription and queue.
    [[nodiscard]] EventStream<T> as_stream() {
        auto channel = std::make_shared<detail::Channel<T>>();
        uint64_t id = registry_->add([channel](const Value& value) { channel->push(value); });
        if (id == 0 || !registry_->track(channel)) {
            channel->close();
        }
        return EventStream<T>(channel, registry_, id);
    }

    /// @brief Stream over the bus-owned delivery channel.
    ///
    /// The channel is created on the first call and receives every value
    /// emitted afterwards. All default streams share it, so each value is
    /// consumed by exactly one of them.
    [[nodiscard]] EventStream<T> default_stream() {
        return EventStream<T>(registry_->default_channel(), registry_, 0);
    }

    /// @brief Number of registered handlers, streams included.
    [[nodiscard]] std::size_t listener_count() const { return registry_->size(); }

private:
    std::shared_ptr<detail::ListenerRegistry<T>> registry_;
};

} // namespace spanner::core
