#pragma once

#include <wipsim/algo/policy.hpp>
#include <wipsim/core/ticket.hpp>
#include <wipsim/core/types.hpp>

#include <string_view>
#include <vector>

namespace wipsim::algo {

/// @brief One policy and the ticket population it schedules.
/// @ingroup algo_simulation
///
/// The simulation owns its tickets outright: arrivals are copied in, so the
/// trajectories mutated here are never visible to another policy. Tickets are
/// stored in arrival order and are never removed, which makes the arena index
/// equal to the ticket id when the simulation is driven by a SimulationSet.
///
/// @see SimulationSet, Policy
class Simulation {
public:
    /// @brief Construct an empty simulation.
    /// @param policy  Policy applied on every burned day.
    /// @param horizon Number of simulated days.
    Simulation(Policy policy, core::Day horizon);

    /// @brief Get the policy.
    /// @return Policy selected at construction.
    [[nodiscard]] const Policy& policy() const noexcept { return policy_; }

    /// @brief Get the policy display name.
    /// @return Same as policy().name().
    [[nodiscard]] std::string_view name() const noexcept { return policy_.name(); }

    /// @brief Get the simulated horizon.
    /// @return Number of days.
    [[nodiscard]] core::Day horizon() const noexcept { return horizon_; }

    /// @brief Append copies of newly arrived tickets.
    /// @param arrivals Tickets created for the current day.
    void add_tickets(const std::vector<core::Ticket>& arrivals);

    /// @brief Run the policy for one day.
    /// @param day Day to burn; a day + 1 slot must exist.
    /// @return Hours spent per ticket, indexed like tickets().
    /// @throws core::OutOfRangeError if @p day is the last day of the horizon
    ///         or outside it.
    std::vector<core::Hours> burn_down(core::Day day);

    /// @brief Access the ticket population.
    /// @return Tickets in arrival order.
    [[nodiscard]] const std::vector<core::Ticket>& tickets() const noexcept { return tickets_; }

private:
    Policy policy_;
    core::Day horizon_;
    std::vector<core::Ticket> tickets_;
};

} // namespace wipsim::algo
