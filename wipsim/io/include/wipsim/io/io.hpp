#pragma once

/// @defgroup io I/O Library
/// @brief Arrival generation, JSON loading, traces, metrics, and reports.
///
/// The I/O library handles everything around the simulation core: random
/// and recorded arrival sources, JSON run configurations, trace writers
/// (JSON, textual, in-memory), lead-time statistics, and the final text and
/// JSON reports. Depends on core and algo.

/// @defgroup io_loaders Loaders
/// @ingroup io
/// @brief Run configuration and arrival plan loaders.

/// @defgroup io_writers Writers
/// @ingroup io
/// @brief Trace writers and report writers.

/// @defgroup io_metrics Metrics
/// @ingroup io
/// @brief Lead-time statistics and arrival summaries.

/// @defgroup io_generation Generation
/// @ingroup io
/// @brief Random arrival generation.

// Convenience header for the I/O library

#include <wipsim/io/error.hpp>
#include <wipsim/io/arrival_generation.hpp>
#include <wipsim/io/arrival_loader.hpp>
#include <wipsim/io/config_loader.hpp>
#include <wipsim/io/metrics.hpp>
#include <wipsim/io/trace_writers.hpp>
#include <wipsim/io/report_writers.hpp>
