#pragma once

#include <stdexcept>
#include <string>

namespace spanner::core {

/// @brief Base exception for all errors raised by the core library.
///
/// Callers can catch spanner-specific errors separately from other
/// `std::runtime_error` exceptions.
///
/// @see InvalidStateError, NotInitializedError
/// @ingroup core
class SpannerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// @brief Thrown when an operation is invalid for the current object state.
///
/// For example, exiting a span twice or adding a field to a span that has
/// already exited.
///
/// @see SpanInfo::exit
/// @ingroup core
class InvalidStateError : public SpannerError {
public:
    using SpannerError::SpannerError;
};

/// @brief Thrown by global snapshot operations when no EventManager is installed.
///
/// Registry queries report this condition through empty results instead;
/// only operations that must produce a value (export, merge) raise it.
///
/// @see Registry::init_event_manager, init_global_event_manager
/// @ingroup core
class NotInitializedError : public SpannerError {
public:
    NotInitializedError()
        : SpannerError("event manager not initialized") {}

    using SpannerError::SpannerError;
};

} // namespace spanner::core
