#include <wipsim/io/arrival_generation.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

#include <random>
#include <vector>

using namespace wipsim::io;
using namespace wipsim::core;

class ArrivalGenerationTest : public ::testing::Test {
protected:
    std::mt19937 rng_{42};
};

TEST_F(ArrivalGenerationTest, ZeroStddevRoundsTheMean) {
    EXPECT_EQ(random_value_int(6.0, 0.0, 0, rng_), 6);
    EXPECT_EQ(random_value_int(6.4, 0.0, 0, rng_), 6);
    EXPECT_EQ(random_value_int(6.5, 0.0, 0, rng_), 7);
    EXPECT_EQ(random_value_int(-2.0, 0.0, -5, rng_), -2);
}

TEST_F(ArrivalGenerationTest, ClampsToLowest) {
    EXPECT_EQ(random_value_int(-3.0, 0.0, 0, rng_), 0);
    EXPECT_EQ(random_value_int(0.2, 0.0, 1, rng_), 1);

    for (int idx = 0; idx < 1000; ++idx) {
        EXPECT_GE(random_value_int(1.0, 5.0, 1, rng_), 1);
    }
}

TEST_F(ArrivalGenerationTest, HugeMeansSaturateInsteadOfWrapping) {
    constexpr int MAX = std::numeric_limits<int>::max();
    EXPECT_EQ(random_value_int(3e9, 0.0, 0, rng_), MAX);
    EXPECT_EQ(random_value_int(1e12, 0.0, 0, rng_), MAX);
    EXPECT_EQ(random_value_int(-1e12, 0.0, 0, rng_), 0);
    EXPECT_EQ(random_value_int(1e12, 1.0, 1, rng_), MAX);
}

TEST_F(ArrivalGenerationTest, SampleMeanFollowsDistribution) {
    constexpr int SAMPLES = 20000;
    double sum = 0.0;
    for (int idx = 0; idx < SAMPLES; ++idx) {
        sum += random_value_int(6.0, 4.0, -1000, rng_);
    }
    EXPECT_NEAR(sum / SAMPLES, 6.0, 0.2);
}

TEST_F(ArrivalGenerationTest, SameSeedSameSequence) {
    std::mt19937 first(7);
    std::mt19937 second(7);
    for (int idx = 0; idx < 100; ++idx) {
        EXPECT_EQ(generate_day(1.0, 1.0, 6.0, 4.0, 1, first),
                  generate_day(1.0, 1.0, 6.0, 4.0, 1, second));
    }
}

TEST_F(ArrivalGenerationTest, GenerateDayWithoutSpread) {
    auto efforts = generate_day(3.0, 0.0, 5.0, 0.0, 1, rng_);
    EXPECT_EQ(efforts, (std::vector<Hours>{5, 5, 5}));
}

TEST_F(ArrivalGenerationTest, GenerateDayRespectsMinEffort) {
    for (int idx = 0; idx < 200; ++idx) {
        for (Hours effort : generate_day(2.0, 1.0, 1.0, 4.0, 2, rng_)) {
            EXPECT_GE(effort, 2);
        }
    }
}

TEST_F(ArrivalGenerationTest, NegativeCountMeansNoTickets) {
    EXPECT_TRUE(generate_day(-4.0, 0.0, 6.0, 4.0, 1, rng_).empty());
}

TEST_F(ArrivalGenerationTest, GeneratorDrawsFromConfig) {
    RunConfig config;
    config.mean_arrivals_per_day = 2.0;
    config.stddev_arrivals_per_day = 0.0;
    config.mean_effort = 4.0;
    config.stddev_effort = 0.0;

    RandomArrivalGenerator generator(config, rng_);

    EXPECT_EQ(generator.arrivals(0), (std::vector<Hours>{4, 4}));
    EXPECT_EQ(generator.arrivals(1), (std::vector<Hours>{4, 4}));
}

TEST_F(ArrivalGenerationTest, GeneratorIsReproducible) {
    RunConfig config;
    std::mt19937 first_rng(123);
    std::mt19937 second_rng(123);
    RandomArrivalGenerator first(config, first_rng);
    RandomArrivalGenerator second(config, second_rng);

    for (Day day = 0; day < 50; ++day) {
        EXPECT_EQ(first.arrivals(day), second.arrivals(day));
    }
}

// =============================================================================
// Seeding
// =============================================================================

TEST_F(ArrivalGenerationTest, EngineIsReproducible) {
    auto first = make_engine(2024);
    auto second = make_engine(2024);
    for (int idx = 0; idx < 100; ++idx) {
        EXPECT_EQ(first(), second());
    }
}

TEST_F(ArrivalGenerationTest, EngineUsesUpperSeedBits) {
    auto low = make_engine(1);
    auto high = make_engine(uint64_t{1} + (uint64_t{1} << 32U));

    std::vector<std::mt19937::result_type> low_draws;
    std::vector<std::mt19937::result_type> high_draws;
    for (int idx = 0; idx < 8; ++idx) {
        low_draws.push_back(low());
        high_draws.push_back(high());
    }
    EXPECT_NE(low_draws, high_draws);
}
