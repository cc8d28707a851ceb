#include <wipsim/core/core.hpp>
#include <wipsim/algo/algo.hpp>
#include <wipsim/io/io.hpp>

#include <cxxopts.hpp>

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace {

namespace core = wipsim::core;
namespace algo = wipsim::algo;
namespace io = wipsim::io;

struct Config {
    core::RunConfig run;
    std::string config_file;
    std::string arrivals_file;
    std::string record_file;
    std::optional<uint64_t> seed;
    std::vector<algo::PolicyKind> policies;
    std::string format{"text"};
    std::string output_file{"-"};
    std::string trace_file;
    std::string trace_format{"json"};
    bool verbose{false};
};

std::vector<algo::PolicyKind> parse_policies(const std::vector<std::string>& keys) {
    std::vector<algo::PolicyKind> kinds;
    for (const auto& key : keys) {
        auto kind = algo::parse_policy(key);
        if (!kind) {
            std::cerr << "Error: unknown policy '" << key
                      << "' (expected equal, fifo, sjf, osjf or awsjf)" << std::endl;
            std::exit(64);
        }
        kinds.push_back(*kind);
    }
    return kinds;
}

Config parse_args(int argc, char** argv) {
    cxxopts::Options options("wipsim", "Ticket lead-time simulator for WIP and prioritisation policies");

    options.add_options()
        ("d,days", "Days to simulate (default: 20)", cxxopts::value<int>())
        ("c,config", "Run configuration (JSON)", cxxopts::value<std::string>())
        ("a,arrivals", "Replay recorded arrivals (JSON); sets the number of days", cxxopts::value<std::string>())
        ("record", "Write the arrivals used to a JSON file", cxxopts::value<std::string>())
        ("s,seed", "Random seed (default: random)", cxxopts::value<uint64_t>())
        ("mean-arrivals", "Mean tickets per day", cxxopts::value<double>())
        ("stddev-arrivals", "Standard deviation of tickets per day", cxxopts::value<double>())
        ("mean-effort", "Mean ticket effort in hours", cxxopts::value<double>())
        ("stddev-effort", "Standard deviation of ticket effort", cxxopts::value<double>())
        ("min-effort", "Minimum ticket effort in hours", cxxopts::value<int>())
        ("capacity", "Hours of work per day", cxxopts::value<int>())
        ("wip-cap", "Hours per ticket in the first pass of equal working", cxxopts::value<int>())
        ("p,policies", "Policies: equal,fifo,sjf,osjf,awsjf (default: all)",
         cxxopts::value<std::vector<std::string>>())
        ("f,format", "Report format: text|json (default: text)", cxxopts::value<std::string>()->default_value("text"))
        ("o,output", "Report output (default: stdout)", cxxopts::value<std::string>()->default_value("-"))
        ("trace", "Write a per-day event trace to a file", cxxopts::value<std::string>())
        ("trace-format", "Trace format: json|text (default: json)", cxxopts::value<std::string>()->default_value("json"))
        ("v,verbose", "Verbose output")
        ("h,help", "Show help");

    options.parse_positional({"days"});
    options.positional_help("[days]");

    auto result = options.parse(argc, argv);

    if (result.count("help") != 0U) {
        std::cout << options.help() << std::endl;
        std::exit(0);
    }

    Config config;
    if (result.count("config") != 0U) {
        config.config_file = result["config"].as<std::string>();
        config.run = io::load_run_config(config.config_file);
    }

    // Command-line values override the configuration file
    if (result.count("days") != 0U) {
        config.run.days = result["days"].as<int>();
    }
    if (result.count("mean-arrivals") != 0U) {
        config.run.mean_arrivals_per_day = result["mean-arrivals"].as<double>();
    }
    if (result.count("stddev-arrivals") != 0U) {
        config.run.stddev_arrivals_per_day = result["stddev-arrivals"].as<double>();
    }
    if (result.count("mean-effort") != 0U) {
        config.run.mean_effort = result["mean-effort"].as<double>();
    }
    if (result.count("stddev-effort") != 0U) {
        config.run.stddev_effort = result["stddev-effort"].as<double>();
    }
    if (result.count("min-effort") != 0U) {
        config.run.min_effort = result["min-effort"].as<int>();
    }
    if (result.count("capacity") != 0U) {
        config.run.daily_capacity_hours = result["capacity"].as<int>();
    }
    if (result.count("wip-cap") != 0U) {
        config.run.wip_cap_hours_per_ticket = result["wip-cap"].as<int>();
    }

    if (result.count("arrivals") != 0U) {
        config.arrivals_file = result["arrivals"].as<std::string>();
    }
    if (result.count("record") != 0U) {
        config.record_file = result["record"].as<std::string>();
    }
    if (result.count("seed") != 0U) {
        config.seed = result["seed"].as<uint64_t>();
    }
    if (result.count("policies") != 0U) {
        config.policies = parse_policies(result["policies"].as<std::vector<std::string>>());
    } else {
        config.policies.assign(algo::ALL_POLICIES.begin(), algo::ALL_POLICIES.end());
    }
    if (result.count("trace") != 0U) {
        config.trace_file = result["trace"].as<std::string>();
    }

    config.format = result["format"].as<std::string>();
    config.output_file = result["output"].as<std::string>();
    config.trace_format = result["trace-format"].as<std::string>();
    config.verbose = result.count("verbose") != 0U;

    if (config.format != "text" && config.format != "json") {
        std::cerr << "Error: --format must be text or json" << std::endl;
        std::exit(64);
    }
    if (config.trace_format != "text" && config.trace_format != "json") {
        std::cerr << "Error: --trace-format must be text or json" << std::endl;
        std::exit(64);
    }

    return config;
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        auto config = parse_args(argc, argv);

        // 1. Choose the arrival source
        std::mt19937 rng;
        std::unique_ptr<core::ArrivalSource> source;
        io::ReportOptions report_options;

        if (!config.arrivals_file.empty()) {
            if (config.verbose) {
                std::cerr << "Replaying arrivals from: " << config.arrivals_file << std::endl;
            }
            auto plan = io::load_arrivals(config.arrivals_file);
            config.run.days = plan.days;
            source = std::make_unique<io::RecordedArrivals>(std::move(plan));
        } else {
            uint64_t seed = config.seed ? *config.seed : std::random_device{}();
            rng = io::make_engine(seed);
            report_options.seed = seed;
            if (config.verbose) {
                std::cerr << "Random arrivals, seed: " << seed << std::endl;
            }
            source = std::make_unique<io::RandomArrivalGenerator>(config.run, rng);
        }

        // 2. Build the simulation set (validates the configuration)
        algo::SimulationSet set(config.run, config.policies);

        if (config.verbose) {
            std::cerr << "Days: " << config.run.days
                      << ", capacity: " << config.run.daily_capacity_hours << "h/day"
                      << ", WIP cap: " << config.run.wip_cap_hours_per_ticket << "h"
                      << ", policies: " << config.policies.size() << std::endl;
        }

        // 3. Setup trace writer
        std::unique_ptr<core::TraceWriter> writer;
        std::ofstream tracefile;
        if (!config.trace_file.empty()) {
            tracefile.open(config.trace_file);
            if (!tracefile) {
                std::cerr << "Error: cannot open trace file: " << config.trace_file << std::endl;
                return 1;
            }
            if (config.trace_format == "text") {
                writer = std::make_unique<io::TextualTraceWriter>(tracefile);
            } else {
                writer = std::make_unique<io::JsonTraceWriter>(tracefile);
            }
            set.set_trace_writer(writer.get());
        }

        // 4. Run every day
        set.run(*source);

        if (auto* json = dynamic_cast<io::JsonTraceWriter*>(writer.get())) {
            json->finalize();
        }

        if (config.verbose) {
            std::cerr << "Simulation complete: " << set.ticket_count() << " tickets" << std::endl;
        }

        // 5. Record the arrivals used
        if (!config.record_file.empty()) {
            io::write_arrivals(io::ArrivalPlan{config.run.days, set.arrivals()}, config.record_file);
            if (config.verbose) {
                std::cerr << "Arrivals recorded to: " << config.record_file << std::endl;
            }
        }

        // 6. Report
        std::ofstream outfile;
        std::ostream* out = &std::cout;
        if (config.output_file != "-") {
            outfile.open(config.output_file);
            if (!outfile) {
                std::cerr << "Error: cannot open output file: " << config.output_file << std::endl;
                return 1;
            }
            out = &outfile;
        }

        if (config.format == "json") {
            io::write_json_report(set, *out, report_options);
        } else {
            io::write_text_report(set, *out, report_options);
        }

        return 0;
    }
    catch (const io::LoaderError& e) {
        std::cerr << "Config error: " << e.what() << std::endl;
        return 1;
    }
    catch (const core::InvalidConfigError& e) {
        std::cerr << "Config error: " << e.what() << std::endl;
        return 1;
    }
    catch (const cxxopts::exceptions::exception& e) {
        std::cerr << "Invalid args: " << e.what() << std::endl;
        return 64;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
