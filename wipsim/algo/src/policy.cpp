#include <wipsim/algo/policy.hpp>
#include <wipsim/core/error.hpp>

#include <algorithm>
#include <numeric>
#include <string>

namespace wipsim::algo {

namespace {

// Spend up to `offer` hours on one ticket and record what it actually took.
core::Hours serve(core::Ticket& ticket, core::Day day, core::Hours available,
                  core::Hours offer, core::Hours& spent) {
    core::Hours left = ticket.burn(day, available, offer);
    spent += available - left;
    return left;
}

} // anonymous namespace

std::string_view policy_name(PolicyKind kind) noexcept {
    switch (kind) {
        case PolicyKind::EqualWorking: return "Equal working";
        case PolicyKind::OldestFirst: return "Oldest first";
        case PolicyKind::ShortestFirst: return "Shortest first";
        case PolicyKind::OldestShortestFirst: return "Oldest, shortest first";
        case PolicyKind::AgeWeightedShortestFirst: return "Age weighted, shortest first";
    }
    return "unknown";
}

std::string_view policy_key(PolicyKind kind) noexcept {
    switch (kind) {
        case PolicyKind::EqualWorking: return "equal";
        case PolicyKind::OldestFirst: return "fifo";
        case PolicyKind::ShortestFirst: return "sjf";
        case PolicyKind::OldestShortestFirst: return "osjf";
        case PolicyKind::AgeWeightedShortestFirst: return "awsjf";
    }
    return "unknown";
}

std::optional<PolicyKind> parse_policy(std::string_view key) noexcept {
    for (PolicyKind kind : ALL_POLICIES) {
        if (policy_key(kind) == key) {
            return kind;
        }
    }
    return std::nullopt;
}

Policy::Policy(PolicyKind kind, core::Hours daily_capacity, core::Hours wip_cap)
    : kind_(kind)
    , daily_capacity_(daily_capacity)
    , wip_cap_(wip_cap) {}

std::vector<std::size_t> Policy::service_order(
    core::Day day, const std::vector<core::Ticket>& tickets) const {
    std::vector<std::size_t> order(tickets.size());
    std::iota(order.begin(), order.end(), std::size_t{0});

    auto remaining = [&tickets, day](std::size_t idx) {
        return tickets[idx].remaining(day);
    };

    switch (kind_) {
        case PolicyKind::EqualWorking:
        case PolicyKind::OldestFirst:
            // Population order is arrival order
            break;
        case PolicyKind::ShortestFirst:
            std::stable_sort(order.begin(), order.end(),
                             [&](std::size_t a, std::size_t b) {
                                 return remaining(a) < remaining(b);
                             });
            break;
        case PolicyKind::OldestShortestFirst:
            std::stable_sort(order.begin(), order.end(),
                             [&](std::size_t a, std::size_t b) {
                                 if (tickets[a].start_day() != tickets[b].start_day()) {
                                     return tickets[a].start_day() < tickets[b].start_day();
                                 }
                                 return remaining(a) < remaining(b);
                             });
            break;
        case PolicyKind::AgeWeightedShortestFirst: {
            // Age is at least one day because a ticket is only present from its start day
            auto weight = [&](std::size_t idx) {
                core::Day age = day + 1 - tickets[idx].start_day();
                return remaining(idx) / age;
            };
            std::stable_sort(order.begin(), order.end(),
                             [&](std::size_t a, std::size_t b) {
                                 return weight(a) < weight(b);
                             });
            break;
        }
    }
    return order;
}

std::vector<core::Hours> Policy::allocate(core::Day day,
                                          std::vector<core::Ticket>& tickets) const {
    // Ordering keys read remaining(day) and the ticket age, both need start_day <= day
    for (const auto& ticket : tickets) {
        if (ticket.start_day() > day) {
            throw core::OutOfRangeError("ticket " + std::to_string(ticket.id()) +
                                        " starts on day " + std::to_string(ticket.start_day()) +
                                        ", cannot burn day " + std::to_string(day));
        }
    }

    std::vector<core::Hours> spent(tickets.size(), 0);
    const auto order = service_order(day, tickets);
    core::Hours left = daily_capacity_;

    if (kind_ == PolicyKind::EqualWorking) {
        for (std::size_t idx : order) {
            left = serve(tickets[idx], day, left, wip_cap_, spent[idx]);
        }
        if (left > 0) {
            for (std::size_t idx : order) {
                left = serve(tickets[idx], day, left, left, spent[idx]);
            }
        }
        return spent;
    }

    // Greedy policies: a single pass offering everything that is left
    for (std::size_t idx : order) {
        left = serve(tickets[idx], day, left, left, spent[idx]);
    }
    return spent;
}

} // namespace wipsim::algo
