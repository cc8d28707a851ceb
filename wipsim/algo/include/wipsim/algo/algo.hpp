#pragma once

/// @defgroup algo Algo Library
/// @brief Scheduling policies and the day-by-day simulation driver.
///
/// The algo library implements the five capacity-allocation policies on top
/// of the core ticket model, the per-policy Simulation that owns a ticket
/// population, and the SimulationSet that replays one arrival sequence
/// against every policy. Depends on core only.

/// @defgroup algo_policies Policies
/// @ingroup algo
/// @brief Equal-working, FIFO, SJF, OSJF and AWSJF capacity allocation.

/// @defgroup algo_simulation Simulation
/// @ingroup algo
/// @brief Per-policy populations and the shared day loop.

// Convenience header for the algo library
#include <wipsim/algo/policy.hpp>
#include <wipsim/algo/simulation.hpp>
#include <wipsim/algo/simulation_set.hpp>
