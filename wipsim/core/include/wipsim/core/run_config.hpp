#pragma once

/// @file run_config.hpp
/// @brief Parameters of one simulation run and their validation.
/// @ingroup core

#include <wipsim/core/types.hpp>

namespace wipsim::core {

/// @brief Run parameters shared by the arrival generator and all policies.
///
/// Defaults reproduce the detailed trace mode: twenty days, about one ticket
/// per day of about six hours, eight hours of capacity per day and a WIP cap
/// of two hours per ticket for the equal-working policy.
///
/// @ingroup core
/// @see validate, SimulationSet
struct RunConfig {
    Day days{20};                           ///< Simulation horizon in days.
    double mean_arrivals_per_day{1.0};      ///< Mean of the daily ticket count.
    double stddev_arrivals_per_day{1.0};    ///< Standard deviation of the daily ticket count.
    double mean_effort{6.0};                ///< Mean ticket effort in hours.
    double stddev_effort{4.0};              ///< Standard deviation of ticket effort.
    Hours min_effort{1};                    ///< Lower bound for generated effort.
    Hours daily_capacity_hours{8};          ///< Hours burned per day by every policy.
    Hours wip_cap_hours_per_ticket{2};      ///< First-pass cap of the equal-working policy.
};

/// @brief Check a run configuration before running it.
///
/// @param config Configuration to check.
/// @throws InvalidConfigError naming the first field that violates its
///         constraint (negative days or capacity, non-finite or negative
///         distribution parameters, minimum effort or WIP cap below one).
void validate(const RunConfig& config);

} // namespace wipsim::core
