#include <spanner/core/registry.hpp>
#include <spanner/core/log.hpp>

#include <mutex>
#include <utility>

namespace spanner::core {

bool Registry::init_event_manager(std::optional<std::size_t> max_events) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (manager_) {
        logger()->debug("event manager already initialized (capacity {}), ignoring re-initialization",
                        manager_->max_events());
        return false;
    }
    manager_ = std::make_shared<EventManager>(max_events);
    logger()->info("event manager initialized (capacity {})", manager_->max_events());
    return true;
}

bool Registry::is_initialized() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return manager_ != nullptr;
}

std::shared_ptr<EventManager> Registry::manager() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return manager_;
}

std::shared_ptr<EventTarget<Event>> Registry::events() const {
    auto mgr = manager();
    if (!mgr) {
        return nullptr;
    }
    return std::shared_ptr<EventTarget<Event>>(mgr, &mgr->events());
}

bool Registry::emit(Event event) {
    auto mgr = manager();
    if (!mgr) {
        return false;
    }
    mgr->emit(std::move(event));
    return true;
}

bool Registry::emit(EventManager::EventPtr event) {
    auto mgr = manager();
    if (!mgr) {
        return false;
    }
    mgr->emit(std::move(event));
    return true;
}

std::optional<EventManager::EventList> Registry::get_events() const {
    auto mgr = manager();
    if (!mgr) {
        return std::nullopt;
    }
    return mgr->snapshot();
}

std::optional<std::size_t> Registry::get_event_count() const {
    auto mgr = manager();
    if (!mgr) {
        return std::nullopt;
    }
    return mgr->size();
}

bool Registry::clear_events() {
    auto mgr = manager();
    if (!mgr) {
        return false;
    }
    mgr->clear();
    return true;
}

std::string Registry::get_event_summary() const {
    auto mgr = manager();
    if (!mgr) {
        return "No events captured";
    }
    return mgr->summary();
}

Registry& global_registry() {
    static Registry instance;
    return instance;
}

bool init_global_event_manager(std::optional<std::size_t> max_events) {
    return global_registry().init_event_manager(max_events);
}

std::shared_ptr<EventTarget<Event>> events() {
    return global_registry().events();
}

bool emit(Event event) {
    return global_registry().emit(std::move(event));
}

std::optional<EventManager::EventList> get_global_events() {
    return global_registry().get_events();
}

std::optional<std::size_t> get_global_event_count() {
    return global_registry().get_event_count();
}

bool clear_global_events() {
    return global_registry().clear_events();
}

std::string get_event_summary() {
    return global_registry().get_event_summary();
}

} // namespace spanner::core
