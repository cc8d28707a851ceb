#include <wipsim/io/report_writers.hpp>
#include <wipsim/io/metrics.hpp>

#include <rapidjson/ostreamwrapper.h>
#include <rapidjson/prettywriter.h>

#include <iomanip>

namespace wipsim::io {

namespace {

template <typename T>
void write_list(std::ostream& out, const std::vector<T>& values) {
    out << "[";
    for (std::size_t idx = 0; idx < values.size(); ++idx) {
        if (idx > 0) {
            out << " ";
        }
        out << values[idx];
    }
    out << "]";
}

void write_policy_block(const algo::Simulation& sim, std::ostream& out,
                        const ReportOptions& options) {
    auto summary = summarize(sim);
    out << summary.name << "\n";

    if (!summary.lead_time) {
        out << "Leadtime of tickets: no tickets\n";
        return;
    }

    const auto& stats = *summary.lead_time;
    const auto flags = out.flags();
    const auto precision = out.precision();
    out << std::fixed << std::setprecision(2)
        << "Leadtime of tickets mean: " << stats.mean
        << " stdev: " << stats.stddev
        << " mean+stdev: " << stats.mean_plus_stddev << "\n";
    out.flags(flags);
    out.precision(precision);
    if (summary.open_tickets > 0) {
        out << "Open tickets at end: " << summary.open_tickets << "\n";
    }
    if (static_cast<std::size_t>(sim.horizon()) <= options.detail_limit) {
        out << "WIP per day: ";
        write_list(out, wip_by_day(sim.tickets(), sim.horizon()));
        out << "\n";
    }

    if (summary.ticket_count > options.detail_limit) {
        return;
    }
    out << "# start leadtime end effort [remaining per day]\n";
    for (const auto& ticket : sim.tickets()) {
        out << ticket.id() << " " << ticket.start_day() << " " << ticket.lead_time()
            << " " << ticket.end_day() << " " << ticket.effort() << " ";
        write_list(out, ticket.remaining_by_day());
        out << "\n";
    }
}

} // anonymous namespace

void write_text_report(const algo::SimulationSet& set, std::ostream& out,
                       const ReportOptions& options) {
    const auto days = set.config().days;
    out << "Simulating " << days << " days\n";
    if (options.seed) {
        out << "Seed: " << *options.seed << "\n";
    }

    if (static_cast<std::size_t>(days) <= options.detail_limit) {
        out << "day, count, efforts\n";
        for (const auto& day : set.arrivals()) {
            out << day.day << " " << day.efforts.size() << " ";
            write_list(out, day.efforts);
            out << "\n";
        }
    }

    auto arrival_stats = compute_arrival_stats(set.arrivals(), days);
    out << "\n"
        << "mean ticket count per day: " << arrival_stats.mean_count_per_day << "\n"
        << "mean ticket effort per day: " << arrival_stats.mean_effort_per_day << "\n"
        << "\n";

    for (const auto& sim : set.simulations()) {
        write_policy_block(sim, out, options);
        out << "\n";
    }
}

void write_json_report(const algo::SimulationSet& set, std::ostream& out,
                       const ReportOptions& options) {
    rapidjson::OStreamWrapper stream(out);
    rapidjson::PrettyWriter<rapidjson::OStreamWrapper> writer(stream);

    writer.StartObject();
    writer.Key("days");
    writer.Int(set.config().days);
    if (options.seed) {
        writer.Key("seed");
        writer.Uint64(*options.seed);
    }

    writer.Key("arrivals");
    writer.StartArray();
    for (const auto& day : set.arrivals()) {
        writer.StartObject();
        writer.Key("day");
        writer.Int(day.day);
        writer.Key("efforts");
        writer.StartArray();
        for (core::Hours effort : day.efforts) {
            writer.Int(effort);
        }
        writer.EndArray();
        writer.EndObject();
    }
    writer.EndArray();

    auto arrival_stats = compute_arrival_stats(set.arrivals(), set.config().days);
    writer.Key("arrival_stats");
    writer.StartObject();
    writer.Key("total_tickets");
    writer.Uint64(arrival_stats.total_tickets);
    writer.Key("total_effort");
    writer.Int64(arrival_stats.total_effort);
    writer.Key("mean_count_per_day");
    writer.Double(arrival_stats.mean_count_per_day);
    writer.Key("mean_effort_per_day");
    writer.Double(arrival_stats.mean_effort_per_day);
    writer.EndObject();

    writer.Key("policies");
    writer.StartArray();
    for (const auto& sim : set.simulations()) {
        auto summary = summarize(sim);
        writer.StartObject();
        writer.Key("name");
        writer.String(summary.name.c_str());
        writer.Key("key");
        writer.String(summary.key.c_str());
        writer.Key("open_tickets");
        writer.Uint64(summary.open_tickets);

        writer.Key("summary");
        if (summary.lead_time) {
            writer.StartObject();
            writer.Key("mean");
            writer.Double(summary.lead_time->mean);
            writer.Key("stddev");
            writer.Double(summary.lead_time->stddev);
            writer.Key("mean_plus_stddev");
            writer.Double(summary.lead_time->mean_plus_stddev);
            writer.EndObject();
        } else {
            writer.Null();
        }

        writer.Key("wip_by_day");
        writer.StartArray();
        for (std::size_t count : wip_by_day(sim.tickets(), sim.horizon())) {
            writer.Uint64(count);
        }
        writer.EndArray();

        writer.Key("tickets");
        writer.StartArray();
        for (const auto& ticket : sim.tickets()) {
            writer.StartObject();
            writer.Key("id");
            writer.Uint64(ticket.id());
            writer.Key("start_day");
            writer.Int(ticket.start_day());
            writer.Key("lead_time");
            writer.Int(ticket.lead_time());
            writer.Key("end_day");
            writer.Int(ticket.end_day());
            writer.Key("effort");
            writer.Int(ticket.effort());
            writer.Key("remaining");
            writer.StartArray();
            for (core::Hours hours : ticket.remaining_by_day()) {
                writer.Int(hours);
            }
            writer.EndArray();
            writer.EndObject();
        }
        writer.EndArray();

        writer.EndObject();
    }
    writer.EndArray();

    writer.EndObject();
    out << "\n";
}

} // namespace wipsim::io
