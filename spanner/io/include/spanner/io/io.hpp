#pragma once

/// @file io.hpp
/// @brief Convenience header that includes all public headers of the I/O library.
/// @ingroup io

/// @defgroup io I/O Library
/// @brief Snapshot persistence and runtime configuration.
///
/// Snapshots are self-describing JSON documents holding export metadata and
/// the full event model (span stacks, correlation ids, parent chains).

/// @defgroup io_snapshot Snapshots
/// @ingroup io
/// @brief Export, import and merge of captured events.

/// @defgroup io_config Configuration
/// @ingroup io
/// @brief JSON configuration of logging and store capacity.

#include <spanner/io/config_loader.hpp>
#include <spanner/io/error.hpp>
#include <spanner/io/snapshot.hpp>
