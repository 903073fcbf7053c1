#pragma once

#include <spanner/core/event_data.hpp>
#include <spanner/core/level.hpp>
#include <spanner/core/span_info.hpp>
#include <spanner/core/types.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace spanner::core {

/// @brief Conjunction of optional filters over events.
///
/// An absent filter is vacuously true, so a default-constructed criteria
/// matches every event. Text filters are substring matches; the level
/// filter is an exact match.
///
/// @see Event::matches, EventManager::search
/// @ingroup core_model
struct SearchCriteria {
    std::optional<Level> level;              ///< Exact level.
    std::optional<std::string> target;      ///< Substring of the event target.
    std::optional<std::string> message;      ///< Substring of the event message.
    std::optional<std::string> span_name;    ///< Substring of any stacked or current span name.
};

/// @brief One captured record plus the execution context it fired in.
///
/// An Event is assembled once by the ingestion adapter (through the
/// `with_*` builders) and then published as `std::shared_ptr<const Event>`.
/// From that point the bounded store, every subscriber and any snapshot
/// co-own the same immutable instance.
///
/// The optional parent forms a causal chain. Because a parent can only be
/// supplied as `std::shared_ptr<const Event>`, it is always an event that
/// was fully constructed before this one; the chain cannot form a cycle.
///
/// @see EventData, SpanInfo, EventManager
/// @ingroup core_model
class Event {
public:
    /// @brief Wrap a record with an empty context.
    explicit Event(EventData data);

    /// @brief Release the parent chain iteratively.
    ///
    /// Every link this event solely owns is unlinked in a loop, so dropping
    /// the last reference to an arbitrarily long chain uses constant stack.
    ~Event();

    Event(const Event&) = default;
    Event& operator=(const Event&) = default;
    Event(Event&&) = default;
    Event& operator=(Event&&) = default;

    /// @brief Ingestion constructor used by instrumentation adapters.
    /// @param message Rendered event message.
    /// @param level Event level.
    /// @param target Logical source or module name.
    /// @param location Call site, if known.
    /// @param fields Structured fields other than the message.
    /// @return Event with no span, thread or process context yet.
    [[nodiscard]] static Event from_record(std::string message, Level level, std::string target,
                                           std::optional<SourceLocation> location, FieldMap fields);

    /// @brief Capture an event with the calling thread's context.
    ///
    /// Fills thread id and name, process id and a freshly generated
    /// correlation id.
    [[nodiscard]] static Event capture_current_context(std::string message, Level level,
                                                       std::string target);

    Event& with_parent(std::shared_ptr<const Event> parent);
    Event& with_span_stack(std::vector<SpanInfo> spans);
    Event& with_current_span(SpanInfo span);
    Event& with_thread_info(std::string thread_id, std::optional<std::string> thread_name);
    Event& with_process_id(uint32_t pid);
    Event& with_correlation_id(std::string correlation_id);

    /// @brief Insert or overwrite a custom metadata entry.
    void add_metadata(std::string key, std::string value);

    [[nodiscard]] const EventData& data() const noexcept { return data_; }
    [[nodiscard]] EventData& data() noexcept { return data_; }
    [[nodiscard]] Level level() const noexcept { return data_.level(); }
    [[nodiscard]] const std::vector<SpanInfo>& span_stack() const noexcept { return span_stack_; }
    [[nodiscard]] const std::optional<SpanInfo>& current_span() const noexcept { return current_span_; }
    [[nodiscard]] const std::optional<std::string>& thread_id() const noexcept { return thread_id_; }
    [[nodiscard]] const std::optional<std::string>& thread_name() const noexcept { return thread_name_; }
    [[nodiscard]] std::optional<uint32_t> process_id() const noexcept { return process_id_; }
    [[nodiscard]] const std::optional<std::string>& correlation_id() const noexcept { return correlation_id_; }
    [[nodiscard]] const FieldMap& custom_metadata() const noexcept { return custom_metadata_; }
    [[nodiscard]] const std::shared_ptr<const Event>& parent() const noexcept { return parent_; }

    /// @brief Returns true if any span in the stack, or the current span,
    ///        has a name containing @p name.
    [[nodiscard]] bool has_span_named(std::string_view name) const;

    /// @brief Evaluate the conjunction of all supplied filters.
    [[nodiscard]] bool matches(const SearchCriteria& criteria) const;

    /// @brief Render the current span and the span stack as an indented tree.
    ///
    /// Pre-order, depth-first: stack entries in outer-to-inner order, each
    /// followed by its own children. Each node shows name, level,
    /// duration (or "active") and its fields.
    [[nodiscard]] std::string span_tree() const;

    /// @brief Render everything known about the event, then each parent in turn.
    [[nodiscard]] std::string full_context() const;

    /// @brief Value equality over every field, comparing parents deeply.
    friend bool operator==(const Event& lhs, const Event& rhs);

private:
    void append_context(std::string& out) const;

    EventData data_;
    std::vector<SpanInfo> span_stack_;
    std::optional<SpanInfo> current_span_;
    std::optional<std::string> thread_id_;
    std::optional<std::string> thread_name_;
    std::optional<uint32_t> process_id_;
    std::optional<std::string> correlation_id_;
    FieldMap custom_metadata_;
    // Mutable so the destructor can detach links owned through a const parent
    mutable std::shared_ptr<const Event> parent_;
};

/// @brief Generate a correlation id of the form `corr-<secs hex>-<nanos hex>-<seq hex>`.
///
/// The trailing per-process sequence keeps ids distinct when two events are
/// captured within the same clock tick.
/// @ingroup core_model
[[nodiscard]] std::string generate_correlation_id();

/// @brief Stable textual id of the calling thread.
/// @ingroup core_model
[[nodiscard]] std::string current_thread_id();

/// @brief Label the calling thread; picked up by capture_current_context().
/// @ingroup core_model
void set_current_thread_name(std::string name);

/// @brief Label previously set for the calling thread, if any.
/// @ingroup core_model
[[nodiscard]] std::optional<std::string> current_thread_name();

/// @brief Id of the current process.
/// @ingroup core_model
[[nodiscard]] uint32_t current_process_id() noexcept;

} // namespace spanner::core
