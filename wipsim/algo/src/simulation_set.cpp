#include <wipsim/algo/simulation_set.hpp>
#include <wipsim/core/error.hpp>

#include <algorithm>
#include <string>

namespace wipsim::algo {

SimulationSet::SimulationSet(const core::RunConfig& config, std::span<const PolicyKind> kinds)
    : config_(config) {
    core::validate(config_);
    if (kinds.empty()) {
        throw core::InvalidConfigError("policies", "at least one policy is required");
    }

    simulations_.reserve(kinds.size());
    for (std::size_t idx = 0; idx < kinds.size(); ++idx) {
        if (std::find(kinds.begin(), kinds.begin() + static_cast<std::ptrdiff_t>(idx), kinds[idx]) !=
            kinds.begin() + static_cast<std::ptrdiff_t>(idx)) {
            throw core::InvalidConfigError("policies",
                                           "duplicate policy '" +
                                               std::string(policy_key(kinds[idx])) + "'");
        }
        simulations_.emplace_back(
            Policy(kinds[idx], config_.daily_capacity_hours, config_.wip_cap_hours_per_ticket),
            config_.days);
    }
    arrivals_.reserve(static_cast<std::size_t>(config_.days));
}

const Simulation& SimulationSet::simulation(PolicyKind kind) const {
    auto iter = std::find_if(simulations_.begin(), simulations_.end(),
                             [kind](const Simulation& sim) { return sim.policy().kind() == kind; });
    if (iter == simulations_.end()) {
        throw core::OutOfRangeError("policy '" + std::string(policy_key(kind)) +
                                    "' is not part of this simulation set");
    }
    return *iter;
}

void SimulationSet::step(core::ArrivalSource& source) {
    if (finished()) {
        throw core::InvalidStateError("simulation set already ran all " +
                                      std::to_string(config_.days) + " days");
    }

    // 1. Draw the day's arrivals once for all policies
    core::DayArrivals today{day_, source.arrivals(day_)};

    // 2. Create the tickets; each simulation copies them
    std::vector<core::Ticket> tickets;
    tickets.reserve(today.efforts.size());
    for (core::Hours effort : today.efforts) {
        tickets.emplace_back(next_id_++, day_, effort, config_.days);
    }
    arrivals_.push_back(std::move(today));
    trace_arrivals(tickets);

    for (auto& sim : simulations_) {
        sim.add_tickets(tickets);
    }

    // 3. Burn down on every day that has a following slot
    if (day_ < config_.days - 1) {
        for (auto& sim : simulations_) {
            auto spent = sim.burn_down(day_);
            trace_burn(sim, spent);
        }
    }

    ++day_;
}

void SimulationSet::run(core::ArrivalSource& source) {
    while (!finished()) {
        step(source);
    }
}

void SimulationSet::trace_arrivals(const std::vector<core::Ticket>& tickets) {
    if (writer_ == nullptr) {
        return;
    }
    for (const auto& ticket : tickets) {
        writer_->begin(day_);
        writer_->type("ticket_arrival");
        writer_->field("ticket", static_cast<uint64_t>(ticket.id()));
        writer_->field("effort", static_cast<uint64_t>(ticket.effort()));
        writer_->end();
    }
}

void SimulationSet::trace_burn(const Simulation& sim, const std::vector<core::Hours>& spent) {
    if (writer_ == nullptr) {
        return;
    }

    const auto& tickets = sim.tickets();
    const auto key = policy_key(sim.policy().kind());
    core::Hours total = 0;
    uint64_t wip = 0;

    for (std::size_t idx = 0; idx < tickets.size(); ++idx) {
        const auto& ticket = tickets[idx];
        if (!ticket.is_complete()) {
            ++wip;
        }
        if (spent[idx] == 0) {
            continue;
        }
        total += spent[idx];

        writer_->begin(day_);
        writer_->type("burn");
        writer_->field("policy", key);
        writer_->field("ticket", static_cast<uint64_t>(ticket.id()));
        writer_->field("hours", static_cast<uint64_t>(spent[idx]));
        writer_->field("remaining", static_cast<uint64_t>(ticket.outstanding()));
        writer_->end();

        if (ticket.is_complete()) {
            writer_->begin(day_);
            writer_->type("ticket_completed");
            writer_->field("policy", key);
            writer_->field("ticket", static_cast<uint64_t>(ticket.id()));
            writer_->field("lead_time", static_cast<uint64_t>(ticket.lead_time()));
            writer_->end();
        }
    }

    writer_->begin(day_);
    writer_->type("day_end");
    writer_->field("policy", key);
    writer_->field("hours_spent", static_cast<uint64_t>(total));
    writer_->field("wip", wip);
    writer_->end();
}

} // namespace wipsim::algo
