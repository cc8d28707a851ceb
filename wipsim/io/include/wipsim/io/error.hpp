#pragma once

/// @file error.hpp
/// @brief IO-specific exception types for the wipsim I/O library.
/// @ingroup io

#include <stdexcept>
#include <string>

namespace wipsim::io {

/// @brief Exception for I/O errors (loading, parsing, validation).
///
/// Thrown by loader functions when JSON input is malformed, required fields
/// are missing or have the wrong type, or values fail semantic validation
/// (e.g. an arrival day outside the recorded horizon).
///
/// @ingroup io
/// @see load_run_config, load_arrivals
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

} // namespace wipsim::io
