#pragma once

#include <spanner/core/level.hpp>
#include <spanner/core/types.hpp>

#include <string>
#include <utility>

namespace spanner::core {

/// @brief The record part of an event: message, level, target, fields.
///
/// Fields may be added while the adapter assembles the enclosing Event;
/// once the Event is published it is only reachable through
/// `std::shared_ptr<const Event>` and therefore immutable.
///
/// @see Event
/// @ingroup core_model
class EventData {
public:
    /// @brief Capture a record now.
    EventData(std::string message, Level level, std::string target);

    /// @brief Capture a record at an explicit time (used when restoring snapshots).
    EventData(std::string message, Level level, std::string target, Timestamp timestamp);

    /// @brief Insert or overwrite a field.
    void add_field(std::string key, std::string value);

    /// @brief Replace all fields.
    void set_fields(FieldMap fields) { fields_ = std::move(fields); }

    /// @brief Record the emitting call site.
    void set_location(SourceLocation location) { location_ = std::move(location); }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] Level level() const noexcept { return level_; }
    [[nodiscard]] const std::string& target() const noexcept { return target_; }
    [[nodiscard]] const SourceLocation& location() const noexcept { return location_; }
    [[nodiscard]] const FieldMap& fields() const noexcept { return fields_; }
    [[nodiscard]] Timestamp timestamp() const noexcept { return timestamp_; }

    bool operator==(const EventData&) const = default;

private:
    std::string message_;
    Level level_;
    std::string target_;
    SourceLocation location_;
    FieldMap fields_;
    Timestamp timestamp_;
};

} // namespace spanner::core
