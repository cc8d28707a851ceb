#include <wipsim/io/metrics.hpp>

#include <algorithm>
#include <cmath>

namespace wipsim::io {

std::optional<LeadTimeStats> compute_lead_time_stats(const std::vector<core::Ticket>& tickets) {
    if (tickets.empty()) {
        return std::nullopt;
    }

    double sum = 0.0;
    double sum_sq = 0.0;
    for (const auto& ticket : tickets) {
        auto lead = static_cast<double>(ticket.lead_time());
        sum += lead;
        sum_sq += lead * lead;
    }

    auto count = static_cast<double>(tickets.size());
    LeadTimeStats stats;
    stats.mean = sum / count;
    double variance = sum_sq / count - stats.mean * stats.mean;
    stats.stddev = std::sqrt(std::max(variance, 0.0));
    stats.mean_plus_stddev = stats.mean + stats.stddev;
    return stats;
}

ArrivalStats compute_arrival_stats(const std::vector<core::DayArrivals>& arrivals, core::Day days) {
    ArrivalStats stats;
    for (const auto& day : arrivals) {
        stats.total_tickets += day.efforts.size();
        for (core::Hours effort : day.efforts) {
            stats.total_effort += effort;
        }
    }
    if (days > 0) {
        stats.mean_count_per_day = static_cast<double>(stats.total_tickets) / days;
        stats.mean_effort_per_day = static_cast<double>(stats.total_effort) / days;
    }
    return stats;
}

std::vector<std::size_t> wip_by_day(const std::vector<core::Ticket>& tickets, core::Day horizon) {
    std::vector<std::size_t> wip(static_cast<std::size_t>(std::max(horizon, 0)), 0);
    for (const auto& ticket : tickets) {
        const auto& remaining = ticket.remaining_by_day();
        auto last = std::min(static_cast<std::size_t>(std::max(horizon, 0)), remaining.size());
        for (auto day = static_cast<std::size_t>(ticket.start_day()); day < last; ++day) {
            if (remaining[day] > 0) {
                ++wip[day];
            }
        }
    }
    return wip;
}

PolicySummary summarize(const algo::Simulation& sim) {
    PolicySummary summary;
    summary.name = std::string(sim.name());
    summary.key = std::string(algo::policy_key(sim.policy().kind()));
    summary.ticket_count = sim.tickets().size();
    summary.open_tickets = static_cast<std::size_t>(
        std::count_if(sim.tickets().begin(), sim.tickets().end(),
                      [](const core::Ticket& ticket) { return !ticket.is_complete(); }));
    summary.lead_time = compute_lead_time_stats(sim.tickets());
    return summary;
}

} // namespace wipsim::io
