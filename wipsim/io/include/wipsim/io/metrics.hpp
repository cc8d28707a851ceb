#pragma once

/// @file metrics.hpp
/// @brief Post-simulation lead-time statistics and arrival summaries.
///
/// Reduces a completed ticket population to mean and standard deviation of
/// lead time, summarises the arrival sequence, and extracts the number of
/// open tickets per day.
///
/// @ingroup io_metrics

#include <wipsim/algo/simulation.hpp>
#include <wipsim/core/arrival_source.hpp>
#include <wipsim/core/ticket.hpp>
#include <wipsim/core/types.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace wipsim::io {

/// @brief Lead-time summary of one ticket population.
///
/// @ingroup io_metrics
/// @see compute_lead_time_stats
struct LeadTimeStats {
    double mean{0.0};              ///< Arithmetic mean lead time (days).
    double stddev{0.0};            ///< Population standard deviation (days).
    double mean_plus_stddev{0.0};  ///< mean + stddev, a rough upper bound.

    bool operator==(const LeadTimeStats&) const = default;
};

/// @brief Compute lead-time statistics over a ticket population.
///
/// Uses the population standard deviation
/// `sqrt(sum(l^2) / n - mean^2)`; a tiny negative variance caused by
/// floating-point cancellation is clamped to zero.
///
/// @param tickets  Completed (or partially completed) population.
/// @return Statistics, or std::nullopt when @p tickets is empty.
std::optional<LeadTimeStats> compute_lead_time_stats(const std::vector<core::Ticket>& tickets);

/// @brief Totals of an arrival sequence.
///
/// @ingroup io_metrics
/// @see compute_arrival_stats
struct ArrivalStats {
    std::size_t total_tickets{0};      ///< Number of tickets created.
    long long total_effort{0};         ///< Sum of all efforts (hours).
    double mean_count_per_day{0.0};    ///< total_tickets / days.
    double mean_effort_per_day{0.0};   ///< total_effort / days.
};

/// @brief Summarise an arrival sequence over a horizon.
/// @param arrivals  One entry per day (days without entries count as empty).
/// @param days      Horizon used as the divisor; zero yields zero means.
/// @return Totals and per-day means.
ArrivalStats compute_arrival_stats(const std::vector<core::DayArrivals>& arrivals, core::Day days);

/// @brief Count open tickets per day.
///
/// A ticket is open on day @c d when it has arrived and its recorded
/// remaining effort for @c d is nonzero.
///
/// @param tickets  Ticket population.
/// @param horizon  Number of days to report.
/// @return One count per day in [0, horizon).
std::vector<std::size_t> wip_by_day(const std::vector<core::Ticket>& tickets, core::Day horizon);

/// @brief Per-policy summary consumed by the report writers.
///
/// @ingroup io_metrics
/// @see summarize
struct PolicySummary {
    std::string name;                      ///< Policy display name.
    std::string key;                       ///< Policy CLI key.
    std::size_t ticket_count{0};           ///< Population size.
    std::size_t open_tickets{0};           ///< Tickets with effort left at the end.
    std::optional<LeadTimeStats> lead_time;  ///< Empty when there are no tickets.
};

/// @brief Summarise one policy's simulation.
/// @param sim  Simulation to summarise.
/// @return Name, counts and lead-time statistics.
PolicySummary summarize(const algo::Simulation& sim);

} // namespace wipsim::io
