#pragma once

/// @file types.hpp
/// @brief Scalar units shared by every wipsim library.
/// @ingroup core_types

#include <cstddef>

namespace wipsim::core {

/// @brief Zero-based index of a simulated day.
///
/// Day 0 is the first simulated day; the last valid day of a run with a
/// horizon of @c N days is @c N-1.
///
/// @ingroup core_types
using Day = int;

/// @brief Whole working hours (effort, remaining effort, capacity).
/// @ingroup core_types
using Hours = int;

/// @brief Identifier of a ticket: its position in global arrival order.
///
/// The same ticket carries the same id in every policy's population, which
/// makes per-ticket results directly comparable across policies.
///
/// @ingroup core_types
using TicketId = std::size_t;

} // namespace wipsim::core
