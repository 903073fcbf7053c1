#pragma once

/// @file error.hpp
/// @brief IO-specific exception types for the spanner I/O library.
/// @ingroup io

#include <stdexcept>
#include <string>

namespace spanner::io {

/// @brief Base exception for snapshot and configuration loading/writing.
///
/// @ingroup io
/// @see FileError, DecodeError
class LoaderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

    /// @brief Construct a LoaderError with a contextual prefix.
    ///
    /// The resulting message is formatted as `"context: message"`.
    ///
    /// @param message  Human-readable description of the error.
    /// @param context  Additional context such as the file path or field name.
    LoaderError(const std::string& message, const std::string& context)
        : std::runtime_error(context + ": " + message) {}
};

/// @brief The file could not be opened, read, written or renamed.
///
/// The destination is left in whatever state the failed operation left it.
///
/// @ingroup io
class FileError : public LoaderError {
public:
    using LoaderError::LoaderError;
};

/// @brief The content was readable but is not a valid document.
///
/// Raised for malformed JSON, missing or mistyped required fields,
/// incompatible format versions and inconsistent counts.
///
/// @ingroup io
class DecodeError : public LoaderError {
public:
    using LoaderError::LoaderError;
};

} // namespace spanner::io
