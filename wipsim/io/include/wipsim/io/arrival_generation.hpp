#pragma once

/// @file arrival_generation.hpp
/// @brief Random daily ticket arrivals drawn from normal distributions.
///
/// Daily ticket counts and per-ticket efforts are sampled from Gaussian
/// distributions, rounded to the nearest integer and floored at a lower
/// bound. The generator state is always passed in explicitly so that runs
/// are reproducible from a seed.
///
/// @ingroup io_generation

#include <wipsim/core/arrival_source.hpp>
#include <wipsim/core/run_config.hpp>
#include <wipsim/core/types.hpp>

#include <cstdint>
#include <random>
#include <vector>

namespace wipsim::io {

/// @brief Draw a rounded, floored integer from a normal distribution.
///
/// Rounds half away from zero. A zero @p stddev returns the rounded mean
/// without consuming random numbers.
///
/// @param mean    Mean of the distribution.
/// @param stddev  Standard deviation (non-negative).
/// @param lowest  Smallest value returned.
/// @param rng     Mersenne Twister PRNG instance.
/// @return `max(lowest, round(sample))`, saturated at the largest `int`.
int random_value_int(double mean, double stddev, int lowest, std::mt19937& rng);

/// @brief Create a generator from a 64-bit seed.
///
/// Both halves of @p seed feed a std::seed_seq, so seeds that differ only in
/// the upper 32 bits give different sequences.
///
/// @param seed Seed as given on the command line or drawn at startup.
/// @return A seeded Mersenne Twister.
std::mt19937 make_engine(uint64_t seed);

/// @brief Generate the efforts of the tickets arriving on one day.
///
/// The ticket count is drawn first (floored at zero), then one effort per
/// ticket (floored at @p min_effort).
///
/// @param mean_count     Mean number of tickets per day.
/// @param stddev_count   Standard deviation of the ticket count.
/// @param mean_effort    Mean effort in hours.
/// @param stddev_effort  Standard deviation of the effort.
/// @param min_effort     Lower bound for each effort.
/// @param rng            Mersenne Twister PRNG instance.
/// @return Efforts of the new tickets, in arrival order.
///
/// @see RandomArrivalGenerator
std::vector<core::Hours> generate_day(double mean_count, double stddev_count,
                                      double mean_effort, double stddev_effort,
                                      core::Hours min_effort, std::mt19937& rng);

/// @brief ArrivalSource drawing each day's tickets with generate_day().
///
/// Holds a reference to the caller's generator; the generator must outlive
/// this object. Non-copyable because two copies would silently share it.
///
/// @ingroup io_generation
/// @see generate_day, core::ArrivalSource
class RandomArrivalGenerator : public core::ArrivalSource {
public:
    /// @brief Construct a generator for a run configuration.
    /// @param config Distribution parameters (only the arrival fields are used).
    /// @param rng    Generator shared with the caller.
    RandomArrivalGenerator(const core::RunConfig& config, std::mt19937& rng);

    RandomArrivalGenerator(const RandomArrivalGenerator&) = delete;
    RandomArrivalGenerator& operator=(const RandomArrivalGenerator&) = delete;
    RandomArrivalGenerator(RandomArrivalGenerator&&) = delete;
    RandomArrivalGenerator& operator=(RandomArrivalGenerator&&) = delete;
    ~RandomArrivalGenerator() override = default;

    /// @brief Draw the tickets arriving on @p day.
    /// @param day Day being simulated (not used by the distribution).
    /// @return Efforts of the new tickets.
    std::vector<core::Hours> arrivals(core::Day day) override;

private:
    core::RunConfig config_;
    std::mt19937& rng_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
};

} // namespace wipsim::io
