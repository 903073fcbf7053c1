#pragma once

/// @file capture.hpp
/// @brief Thread-local span tracking and event capture for instrumentation adapters.
/// @ingroup core_capture

#include <spanner/core/event.hpp>
#include <spanner/core/level.hpp>
#include <spanner/core/registry.hpp>
#include <spanner/core/span_info.hpp>
#include <spanner/core/types.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <vector>

namespace spanner::core {

/// @brief RAII guard that keeps a span active on the calling thread.
///
/// Construction enters a new SpanInfo on the thread-local stack;
/// destruction exits it and, when an enclosing span is still active,
/// attaches the finished span as that span's child. Events captured while
/// the guard lives carry a copy of the stack.
///
/// Guards must be destroyed on the thread that created them, in reverse
/// order of creation (which scoping guarantees).
///
/// @see capture_event
class SpanGuard {
public:
    /// @brief Enter a span located at the guard's declaration.
    SpanGuard(std::string name, Level level, std::string target,
              std::source_location where = std::source_location::current());

    /// @brief Enter a span with an explicit location, or none.
    SpanGuard(std::string name, Level level, std::string target, std::optional<SourceLocation> location);
    ~SpanGuard();

    SpanGuard(const SpanGuard&) = delete;
    SpanGuard& operator=(const SpanGuard&) = delete;
    SpanGuard(SpanGuard&&) = delete;
    SpanGuard& operator=(SpanGuard&&) = delete;

    /// @brief Add a field to the guarded span.
    void record(std::string key, std::string value);

    /// @brief Id of the guarded span.
    [[nodiscard]] uint64_t id() const noexcept { return id_; }

private:
    std::size_t depth_;
    uint64_t id_;
};

/// @brief Copy of the calling thread's active spans, outer to inner.
[[nodiscard]] std::vector<SpanInfo> current_span_stack();

/// @brief Build an event with the calling thread's context and emit it.
///
/// The event carries the span stack, the innermost span as current span,
/// thread id and name, process id and a fresh correlation id. Pass
/// `SourceLocation::current()` as @p location to record the call site.
///
/// @return The published event (usable as a parent for later events), or
///         nullptr if @p registry has no manager.
std::shared_ptr<const Event> capture_event(Registry& registry, std::string message, Level level,
                                           std::string target, FieldMap fields = {},
                                           std::optional<SourceLocation> location = std::nullopt,
                                           std::shared_ptr<const Event> parent = nullptr);

} // namespace spanner::core
