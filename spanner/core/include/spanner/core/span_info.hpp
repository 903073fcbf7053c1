#pragma once

#include <spanner/core/level.hpp>
#include <spanner/core/types.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace spanner::core {

/// @brief One named interval of execution and the span tree below it.
///
/// A SpanInfo is created on entry, mutated through add_field(),
/// add_child() and set_location() while active, and finalized exactly once
/// by exit(). Once exited, `duration()` is present and equals
/// `exited_at() - entered_at()`; while active, elapsed() is computed on
/// demand.
///
/// Copies are deep: children are held by value, so a captured span stack
/// never shares mutable state with the live span it was copied from.
///
/// @see Event, SpanGuard
/// @ingroup core_model
class SpanInfo {
public:
    /// @brief Enter a span now.
    /// @param id Process-unique identifier (see next_id()).
    /// @param name Span name.
    /// @param target Logical source or module name.
    /// @param level Span level.
    SpanInfo(uint64_t id, std::string name, std::string target, Level level);

    /// @brief Enter a span at an explicit time (used when restoring snapshots).
    SpanInfo(uint64_t id, std::string name, std::string target, Level level, Timestamp entered_at);

    /// @brief Allocate a fresh process-unique span id.
    [[nodiscard]] static uint64_t next_id() noexcept;

    /// @brief Insert or overwrite a field.
    /// @throws InvalidStateError if the span has exited.
    void add_field(std::string key, std::string value);

    /// @brief Append a child span.
    /// @throws InvalidStateError if the span has exited.
    void add_child(SpanInfo child);

    /// @brief Record where the span was declared.
    /// @throws InvalidStateError if the span has exited.
    void set_location(SourceLocation location);

    /// @brief Finalize the span now.
    /// @throws InvalidStateError if the span has already exited.
    void exit();

    /// @brief Finalize the span at an explicit time.
    ///
    /// A time earlier than entered_at() (a clock step backwards) is kept
    /// as is and yields a negative duration.
    ///
    /// @throws InvalidStateError if the span has already exited.
    void exit(Timestamp at);

    [[nodiscard]] uint64_t id() const noexcept { return id_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const std::string& target() const noexcept { return target_; }
    [[nodiscard]] Level level() const noexcept { return level_; }
    [[nodiscard]] const SourceLocation& location() const noexcept { return location_; }
    [[nodiscard]] const FieldMap& fields() const noexcept { return fields_; }
    [[nodiscard]] Timestamp entered_at() const noexcept { return entered_at_; }
    [[nodiscard]] std::optional<Timestamp> exited_at() const noexcept { return exited_at_; }
    [[nodiscard]] const std::vector<SpanInfo>& children() const noexcept { return children_; }

    /// @brief Stored duration; present iff the span has exited.
    [[nodiscard]] std::optional<Duration> duration() const noexcept { return duration_; }

    /// @brief Returns true until exit() has been called.
    [[nodiscard]] bool is_active() const noexcept { return !exited_at_.has_value(); }

    /// @brief Stored duration if exited, otherwise time since entry.
    [[nodiscard]] Duration elapsed() const;

    bool operator==(const SpanInfo&) const = default;

private:
    void require_active(const char* operation) const;

    uint64_t id_;
    std::string name_;
    std::string target_;
    Level level_;
    SourceLocation location_;
    FieldMap fields_;
    Timestamp entered_at_;
    std::optional<Timestamp> exited_at_;
    std::optional<Duration> duration_;
    std::vector<SpanInfo> children_;
};

} // namespace spanner::core
