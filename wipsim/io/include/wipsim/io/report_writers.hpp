#pragma once

/// @file report_writers.hpp
/// @brief Final reports of a simulation set, as text or JSON.
/// @ingroup io_writers

#include <wipsim/algo/simulation_set.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>

namespace wipsim::io {

/// @brief Options controlling report detail.
///
/// @ingroup io_writers
/// @see write_text_report, write_json_report
struct ReportOptions {
    /// @brief Largest day count / population for which per-day arrivals and
    ///        per-ticket tables are printed in the text report.
    std::size_t detail_limit{20};
    /// @brief Seed of the random generator, echoed so the run can be repeated.
    ///        Empty when arrivals were replayed from a file.
    std::optional<uint64_t> seed;
};

/// @brief Write the human-readable report.
///
/// Prints the horizon, the per-day arrivals (short runs only), the arrival
/// means, then one block per policy: its name, the lead-time line
/// `Leadtime of tickets mean: M stdev: S mean+stdev: B` (or `no tickets`),
/// the open-ticket count, `WIP per day: [...]` for short runs and, for small
/// populations, one line per ticket:
/// `# start leadtime end effort [remaining per day]`.
///
/// @param set      Finished (or partially run) simulation set.
/// @param out      Destination stream.
/// @param options  Detail limit and seed.
void write_text_report(const algo::SimulationSet& set, std::ostream& out,
                       const ReportOptions& options = {});

/// @brief Write the machine-readable report as one JSON object.
///
/// Keys: `days`, `seed` (when known), `arrivals` (`[{"day", "efforts"}]`),
/// `arrival_stats`, and `policies`, each with `name`, `key`, `open_tickets`,
/// `summary` (`null` without tickets), `wip_by_day` and `tickets`
/// (`[{"id", "start_day", "lead_time", "end_day", "effort", "remaining"}]`).
///
/// @param set      Simulation set to report.
/// @param out      Destination stream.
/// @param options  Seed to echo; the detail limit is ignored.
void write_json_report(const algo::SimulationSet& set, std::ostream& out,
                       const ReportOptions& options = {});

} // namespace wipsim::io
