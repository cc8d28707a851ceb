#include <wipsim/io/arrival_generation.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

namespace wipsim::io {

int random_value_int(double mean, double stddev, int lowest, std::mt19937& rng) {
    double sample = mean;
    if (stddev > 0.0) {
        std::normal_distribution<double> dist(mean, stddev);
        sample = dist(rng);
    }
    // Clamp in floating point so the cast below cannot overflow
    sample = std::clamp(sample, static_cast<double>(lowest),
                        static_cast<double>(std::numeric_limits<int>::max()));
    return static_cast<int>(std::lround(sample));
}

std::mt19937 make_engine(uint64_t seed) {
    std::seed_seq seq{static_cast<uint32_t>(seed & 0xFFFFFFFFU),
                      static_cast<uint32_t>(seed >> 32U)};
    return std::mt19937(seq);
}

std::vector<core::Hours> generate_day(double mean_count, double stddev_count,
                                      double mean_effort, double stddev_effort,
                                      core::Hours min_effort, std::mt19937& rng) {
    int count = random_value_int(mean_count, stddev_count, 0, rng);

    std::vector<core::Hours> efforts;
    efforts.reserve(static_cast<std::size_t>(count));
    for (int idx = 0; idx < count; ++idx) {
        efforts.push_back(random_value_int(mean_effort, stddev_effort, min_effort, rng));
    }
    return efforts;
}

RandomArrivalGenerator::RandomArrivalGenerator(const core::RunConfig& config, std::mt19937& rng)
    : config_(config)
    , rng_(rng) {}

std::vector<core::Hours> RandomArrivalGenerator::arrivals(core::Day /*day*/) {
    return generate_day(config_.mean_arrivals_per_day, config_.stddev_arrivals_per_day,
                        config_.mean_effort, config_.stddev_effort,
                        config_.min_effort, rng_);
}

} // namespace wipsim::io
