#pragma once

#include <wipsim/algo/policy.hpp>
#include <wipsim/algo/simulation.hpp>
#include <wipsim/core/arrival_source.hpp>
#include <wipsim/core/run_config.hpp>
#include <wipsim/core/trace_writer.hpp>
#include <wipsim/core/types.hpp>

#include <cstddef>
#include <span>
#include <vector>

namespace wipsim::algo {

/// @brief Runs several policies over one shared arrival sequence.
/// @ingroup algo_simulation
///
/// The set owns the day loop. Each step draws the day's arrivals from the
/// ArrivalSource exactly once, creates the tickets, and hands every
/// Simulation its own copy before burning down that day. Burn-down is
/// skipped on the final day because no following day slot exists.
///
/// An optional TraceWriter receives `ticket_arrival`, `burn`,
/// `ticket_completed` and `day_end` records.
///
/// @see Simulation, core::ArrivalSource, core::TraceWriter
class SimulationSet {
public:
    /// @brief Build one simulation per requested policy.
    /// @param config Run configuration (validated here).
    /// @param kinds  Policies to run, in reporting order.
    /// @throws core::InvalidConfigError if @p config is invalid or @p kinds
    ///         is empty or repeats a policy.
    explicit SimulationSet(const core::RunConfig& config,
                           std::span<const PolicyKind> kinds = ALL_POLICIES);

    /// @brief Install a trace writer (nullptr disables tracing).
    /// @param writer Writer that outlives the set, or nullptr.
    void set_trace_writer(core::TraceWriter* writer) noexcept { writer_ = writer; }

    /// @brief Simulate the next day.
    /// @param source Supplier of the day's ticket efforts.
    /// @throws core::InvalidStateError if every day has already run.
    /// @throws core::OutOfRangeError if the source returns a negative effort.
    void step(core::ArrivalSource& source);

    /// @brief Simulate all remaining days.
    /// @param source Supplier of the ticket efforts.
    void run(core::ArrivalSource& source);

    /// @brief Check whether the whole horizon has been simulated.
    /// @return True once current_day() reached the configured days.
    [[nodiscard]] bool finished() const noexcept { return day_ >= config_.days; }

    /// @brief Get the next day to simulate.
    /// @return Number of days simulated so far.
    [[nodiscard]] core::Day current_day() const noexcept { return day_; }

    /// @brief Get the validated run configuration.
    /// @return Configuration given at construction.
    [[nodiscard]] const core::RunConfig& config() const noexcept { return config_; }

    /// @brief Access all simulations.
    /// @return Simulations in the order the policies were requested.
    [[nodiscard]] const std::vector<Simulation>& simulations() const noexcept { return simulations_; }

    /// @brief Access the simulation of one policy.
    /// @param kind Policy to look up.
    /// @return The simulation running @p kind.
    /// @throws core::OutOfRangeError if @p kind is not part of this set.
    [[nodiscard]] const Simulation& simulation(PolicyKind kind) const;

    /// @brief Access the arrival history.
    /// @return One entry per simulated day, including days without arrivals.
    [[nodiscard]] const std::vector<core::DayArrivals>& arrivals() const noexcept { return arrivals_; }

    /// @brief Get the number of tickets created so far.
    /// @return Size of every simulation's population.
    [[nodiscard]] std::size_t ticket_count() const noexcept { return next_id_; }

private:
    void trace_arrivals(const std::vector<core::Ticket>& tickets);
    void trace_burn(const Simulation& sim, const std::vector<core::Hours>& spent);

    core::RunConfig config_;
    std::vector<Simulation> simulations_;
    std::vector<core::DayArrivals> arrivals_;
    core::TraceWriter* writer_{nullptr};
    core::Day day_{0};
    core::TicketId next_id_{0};
};

} // namespace wipsim::algo
