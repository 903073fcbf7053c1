#pragma once

/// @defgroup core Core Library
/// @brief Event model, publish/subscribe bus, bounded store and registry.
///
/// The core library captures structured events and execution spans,
/// fans them out to live subscribers and retains a bounded, newest-first
/// history that can be queried. It has no dependency on any file format.

/// @defgroup core_types Types
/// @ingroup core
/// @brief Timestamps, durations, field maps and source locations.

/// @defgroup core_model Data Model
/// @ingroup core
/// @brief SpanInfo, EventData, Event and search criteria.

/// @defgroup core_bus Event Bus
/// @ingroup core
/// @brief EventTarget, subscriptions and streams.

/// @defgroup core_store Event Store
/// @ingroup core
/// @brief Bounded event history with queries.

/// @defgroup core_registry Registry
/// @ingroup core
/// @brief Single-active-store context object and global equivalents.

/// @defgroup core_capture Capture
/// @ingroup core
/// @brief Thread-local span stack and event capture for adapters.

// Convenience header for the core library
#include <spanner/core/types.hpp>
#include <spanner/core/level.hpp>
#include <spanner/core/error.hpp>
#include <spanner/core/log.hpp>

#include <spanner/core/span_info.hpp>
#include <spanner/core/event_data.hpp>
#include <spanner/core/event.hpp>

#include <spanner/core/event_target.hpp>
#include <spanner/core/event_manager.hpp>
#include <spanner/core/registry.hpp>
#include <spanner/core/capture.hpp>
