#include <wipsim/core/ticket.hpp>
#include <wipsim/core/error.hpp>

#include <algorithm>
#include <string>

namespace wipsim::core {

Ticket::Ticket(TicketId id, Day start_day, Hours effort, Day horizon)
    : id_(id)
    , start_day_(start_day)
    , effort_(effort)
    , outstanding_(effort) {
    if (start_day < 0 || start_day >= horizon) {
        throw OutOfRangeError("ticket " + std::to_string(id) + ": start day " +
                              std::to_string(start_day) + " outside horizon of " +
                              std::to_string(horizon) + " days");
    }
    if (effort < 0) {
        throw OutOfRangeError("ticket " + std::to_string(id) + ": negative effort");
    }
    remaining_.assign(static_cast<std::size_t>(horizon), 0);
    remaining_[static_cast<std::size_t>(start_day)] = effort;
}

Hours Ticket::remaining(Day day) const {
    if (day < 0 || day >= horizon()) {
        throw OutOfRangeError("day " + std::to_string(day) + " outside horizon of " +
                              std::to_string(horizon()) + " days");
    }
    return remaining_[static_cast<std::size_t>(day)];
}

Hours Ticket::burn(Day day, Hours hours_available, Hours hours_offered) {
    if (day < start_day_ || day + 1 >= horizon()) {
        throw OutOfRangeError("ticket " + std::to_string(id_) + ": cannot burn day " +
                              std::to_string(day));
    }

    const auto next = static_cast<std::size_t>(day) + 1;
    // A second pass on the same day starts from what the first pass left.
    Hours remain = last_burn_day_ == day ? remaining_[next]
                                         : remaining_[static_cast<std::size_t>(day)];

    if (remain > 0 && hours_available > 0 && hours_offered > 0) {
        Hours hours = std::min({remain, hours_offered, hours_available});
        remain -= hours;
        hours_available -= hours;
        end_day_ = day;
        lead_time_ = day + 1 - start_day_;
    }

    remaining_[next] = remain;
    outstanding_ = remain;
    last_burn_day_ = day;
    return hours_available;
}

} // namespace wipsim::core
