#pragma once

#include <stdexcept>
#include <string>

namespace wipsim::core {

/// @brief Base exception for all simulation errors.
///
/// All exceptions thrown by the core and algo libraries derive from this
/// class, allowing callers to catch simulation-specific errors separately
/// from other `std::runtime_error` exceptions.
///
/// @see InvalidConfigError, OutOfRangeError, InvalidStateError
/// @ingroup core
class SimulationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// @brief Thrown when a run configuration fails validation.
///
/// Raised before any simulated day is executed, e.g. for a negative number
/// of days or a negative daily capacity. The message names the offending
/// field.
///
/// @see validate, SimulationError
/// @ingroup core
class InvalidConfigError : public SimulationError {
public:
    /// @brief Construct an error for a named configuration field.
    /// @param field   Name of the offending RunConfig field.
    /// @param message Human-readable description of the constraint.
    InvalidConfigError(const std::string& field, const std::string& message)
        : SimulationError("invalid " + field + ": " + message)
        , field_(field) {}

    /// @brief Get the name of the field that failed validation.
    /// @return RunConfig field name.
    [[nodiscard]] const std::string& field() const noexcept { return field_; }

private:
    std::string field_;
};

/// @brief Thrown when a value is outside its valid range.
///
/// For example, burning a ticket on a day that has no following day slot
/// inside the simulated horizon, or looking up a policy that is not part of
/// a simulation set.
///
/// @see SimulationError
/// @ingroup core
class OutOfRangeError : public SimulationError {
public:
    using SimulationError::SimulationError;
};

/// @brief Thrown when an operation is invalid for the current object state.
///
/// For example, stepping a simulation set that already ran its last day.
///
/// @see SimulationError
/// @ingroup core
class InvalidStateError : public SimulationError {
public:
    using SimulationError::SimulationError;
};

} // namespace wipsim::core
