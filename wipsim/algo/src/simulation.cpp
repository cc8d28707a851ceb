#include <wipsim/algo/simulation.hpp>
#include <wipsim/core/error.hpp>

#include <string>
#include <utility>

namespace wipsim::algo {

Simulation::Simulation(Policy policy, core::Day horizon)
    : policy_(std::move(policy))
    , horizon_(horizon) {}

void Simulation::add_tickets(const std::vector<core::Ticket>& arrivals) {
    tickets_.insert(tickets_.end(), arrivals.begin(), arrivals.end());
}

std::vector<core::Hours> Simulation::burn_down(core::Day day) {
    if (day < 0 || day + 1 >= horizon_) {
        throw core::OutOfRangeError(std::string(name()) + ": no slot after day " +
                                    std::to_string(day) + " in a horizon of " +
                                    std::to_string(horizon_) + " days");
    }
    return policy_.allocate(day, tickets_);
}

} // namespace wipsim::algo
