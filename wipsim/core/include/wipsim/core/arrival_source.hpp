#pragma once

#include <wipsim/core/types.hpp>

#include <vector>

namespace wipsim::core {

/// @brief Tickets that arrived on one day, as their efforts in hours.
/// @ingroup core
struct DayArrivals {
    Day day{0};                  ///< Arrival day.
    std::vector<Hours> efforts;  ///< One entry per new ticket, in arrival order.
};

/// @brief Abstract supplier of the daily arrival sequence.
/// @ingroup core
///
/// A SimulationSet asks its source exactly once per simulated day, in
/// increasing day order, and fans the answer out to every policy. Sources
/// may be random (io::RandomArrivalGenerator) or replay a recorded plan
/// (io::RecordedArrivals).
///
/// @see SimulationSet::step
class ArrivalSource {
public:
    /// @brief Virtual destructor for safe polymorphic deletion.
    virtual ~ArrivalSource() = default;

    /// @brief Produce the efforts of the tickets arriving on @p day.
    /// @param day The day being simulated.
    /// @return Efforts in hours, possibly empty.
    virtual std::vector<Hours> arrivals(Day day) = 0;

protected:
    ArrivalSource() = default;
    ArrivalSource(const ArrivalSource&) = default;
    ArrivalSource& operator=(const ArrivalSource&) = default;
    ArrivalSource(ArrivalSource&&) = default;
    ArrivalSource& operator=(ArrivalSource&&) = default;
};

} // namespace wipsim::core
