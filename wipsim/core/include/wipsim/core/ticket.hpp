#pragma once

#include <wipsim/core/types.hpp>

#include <vector>

namespace wipsim::core {

/// @brief One unit of work and its per-day remaining-effort trajectory.
/// @ingroup core
///
/// A ticket arrives on @c start_day with a fixed @c effort in hours. For every
/// simulated day the ticket is present, a scheduling policy burns some of the
/// remaining effort down and the result is carried into the next day's slot.
/// Slots before the start day are unused and hold zero.
///
/// Tickets are plain values: each Simulation owns its own copies so that two
/// policies never mutate the same trajectory.
///
/// @see Simulation, Policy
class Ticket {
public:
    /// @brief Construct a new Ticket.
    /// @param id        Position of the ticket in global arrival order.
    /// @param start_day Day of arrival, in [0, horizon).
    /// @param effort    Total work in hours (non-negative).
    /// @param horizon   Number of simulated days (size of the trajectory).
    /// @throws OutOfRangeError if @p start_day is outside the horizon or
    ///         @p effort is negative.
    Ticket(TicketId id, Day start_day, Hours effort, Day horizon);

    /// @brief Get the ticket identifier.
    /// @return Arrival-order index, identical across policies.
    [[nodiscard]] TicketId id() const noexcept { return id_; }

    /// @brief Get the arrival day.
    /// @return Day on which the ticket was created.
    [[nodiscard]] Day start_day() const noexcept { return start_day_; }

    /// @brief Get the total effort.
    /// @return Effort in hours assigned at creation.
    [[nodiscard]] Hours effort() const noexcept { return effort_; }

    /// @brief Get the last day on which the ticket received work.
    /// @return Day of the last nonzero burn, or 0 if never worked.
    [[nodiscard]] Day end_day() const noexcept { return end_day_; }

    /// @brief Get the lead time.
    ///
    /// Computed as `end_day + 1 - start_day` at the moment of the last burn.
    /// It stops changing once the remaining effort reaches zero.
    ///
    /// @return Lead time in days, or 0 if never worked.
    [[nodiscard]] Day lead_time() const noexcept { return lead_time_; }

    /// @brief Get the simulated horizon this ticket was created for.
    /// @return Number of day slots in the trajectory.
    [[nodiscard]] Day horizon() const noexcept { return static_cast<Day>(remaining_.size()); }

    /// @brief Get the remaining effort recorded for a day.
    /// @param day Day index in [0, horizon).
    /// @return Remaining hours at the start of @p day.
    /// @throws OutOfRangeError if @p day is outside the horizon.
    [[nodiscard]] Hours remaining(Day day) const;

    /// @brief Get the full remaining-effort trajectory.
    /// @return One entry per simulated day.
    [[nodiscard]] const std::vector<Hours>& remaining_by_day() const noexcept { return remaining_; }

    /// @brief Get the most recently recorded remaining effort.
    /// @return Remaining hours after the latest burn, or the effort if the
    ///         ticket was never burned.
    [[nodiscard]] Hours outstanding() const noexcept { return outstanding_; }

    /// @brief Check whether all effort has been burned down.
    /// @return True once the remaining effort reached zero.
    [[nodiscard]] bool is_complete() const noexcept { return outstanding_ == 0; }

    /// @brief Burn remaining effort for a day and carry the result forward.
    ///
    /// Spends `min(remaining, hours_offered, hours_available)` hours when the
    /// ticket still has work and both budgets are positive, updating end_day
    /// and lead_time. In every case the remaining effort is written to the
    /// slot of `day + 1`. Several calls on the same day continue from the
    /// value left by the previous call.
    ///
    /// @param day             Current day, in [start_day, horizon - 1).
    /// @param hours_available Capacity still unspent today.
    /// @param hours_offered   Maximum hours this call may spend on the ticket.
    /// @return Capacity left after this ticket's share.
    /// @throws OutOfRangeError if @p day is before start_day or has no
    ///         following slot.
    Hours burn(Day day, Hours hours_available, Hours hours_offered);

private:
    TicketId id_;
    Day start_day_;
    Hours effort_;
    Day end_day_{0};
    Day lead_time_{0};
    Day last_burn_day_{-1};
    Hours outstanding_;
    std::vector<Hours> remaining_;
};

} // namespace wipsim::core
