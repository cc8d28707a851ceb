#pragma once

/// @defgroup core Core Library
/// @brief Tickets, run configuration, errors, and the collaborator interfaces.
///
/// The core library provides the ticket lifecycle model with its burn-down
/// primitive, the run configuration and its validation, and the abstract
/// ArrivalSource and TraceWriter seams used by the other libraries. It has
/// no dependencies on scheduling policies or I/O.

/// @defgroup core_types Types
/// @ingroup core
/// @brief Scalar units for days, hours, and ticket identifiers.

// Convenience header for the core library
#include <wipsim/core/types.hpp>
#include <wipsim/core/error.hpp>
#include <wipsim/core/ticket.hpp>
#include <wipsim/core/run_config.hpp>
#include <wipsim/core/arrival_source.hpp>
#include <wipsim/core/trace_writer.hpp>
