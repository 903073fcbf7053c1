#pragma once

#include <spanner/core/event.hpp>
#include <spanner/core/event_manager.hpp>
#include <spanner/core/event_target.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>

namespace spanner::core {

/// @brief Context object holding zero or one active EventManager.
///
/// Created once at process start and passed by reference to the ingestion
/// adapter and to client code. Initialization is first-writer-wins: the
/// first successful init_event_manager() installs the manager and later
/// calls are ignored, so subscriptions taken on the installed manager are
/// never orphaned.
///
/// Every operation reports "not initialized" through its return value
/// (false, std::nullopt or a null handle) and never throws for it.
///
/// Tests construct their own Registry; global_registry() serves code that
/// has no context to pass around.
///
/// @see EventManager, global_registry
/// @ingroup core_registry
class Registry {
public:
    Registry() = default;

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;
    Registry(Registry&&) = delete;
    Registry& operator=(Registry&&) = delete;

    /// @brief Install a new EventManager unless one is already active.
    /// @param max_events Capacity of the new store.
    /// @return true if this call installed the manager.
    bool init_event_manager(std::optional<std::size_t> max_events = std::nullopt);

    /// @brief Returns true once a manager is installed.
    [[nodiscard]] bool is_initialized() const;

    /// @brief The active manager, or nullptr.
    [[nodiscard]] std::shared_ptr<EventManager> manager() const;

    /// @brief The active manager's bus, or nullptr.
    ///
    /// The handle keeps the whole manager alive.
    [[nodiscard]] std::shared_ptr<EventTarget<Event>> events() const;

    /// @brief Store and publish through the active manager.
    /// @return false if not initialized.
    bool emit(Event event);

    /// @brief Store and publish an already shared event.
    /// @return false if not initialized.
    bool emit(EventManager::EventPtr event);

    /// @brief All retained events, newest first; std::nullopt if not initialized.
    [[nodiscard]] std::optional<EventManager::EventList> get_events() const;

    /// @brief Retained event count; std::nullopt if not initialized.
    [[nodiscard]] std::optional<std::size_t> get_event_count() const;

    /// @brief Empty the active store.
    /// @return false if not initialized.
    bool clear_events();

    /// @brief EventManager::summary() of the active store, or "No events captured".
    [[nodiscard]] std::string get_event_summary() const;

private:
    mutable std::shared_mutex mutex_;
    std::shared_ptr<EventManager> manager_;
};

/// @brief Process-wide default registry.
/// @ingroup core_registry
[[nodiscard]] Registry& global_registry();

/// @name Global-scope equivalents operating on global_registry()
/// @{
bool init_global_event_manager(std::optional<std::size_t> max_events = std::nullopt);
[[nodiscard]] std::shared_ptr<EventTarget<Event>> events();
bool emit(Event event);
[[nodiscard]] std::optional<EventManager::EventList> get_global_events();
[[nodiscard]] std::optional<std::size_t> get_global_event_count();
bool clear_global_events();
[[nodiscard]] std::string get_event_summary();
/// @}

} // namespace spanner::core
