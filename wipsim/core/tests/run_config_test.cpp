#include <wipsim/core/error.hpp>
#include <wipsim/core/run_config.hpp>

#include <gtest/gtest.h>

#include <limits>

using namespace wipsim::core;

TEST(RunConfigTest, DefaultsAreValid) {
    RunConfig config;

    EXPECT_EQ(config.days, 20);
    EXPECT_DOUBLE_EQ(config.mean_arrivals_per_day, 1.0);
    EXPECT_DOUBLE_EQ(config.stddev_arrivals_per_day, 1.0);
    EXPECT_DOUBLE_EQ(config.mean_effort, 6.0);
    EXPECT_DOUBLE_EQ(config.stddev_effort, 4.0);
    EXPECT_EQ(config.min_effort, 1);
    EXPECT_EQ(config.daily_capacity_hours, 8);
    EXPECT_EQ(config.wip_cap_hours_per_ticket, 2);
    EXPECT_NO_THROW(validate(config));
}

TEST(RunConfigTest, ZeroDaysAndCapacityAreValid) {
    RunConfig config;
    config.days = 0;
    config.daily_capacity_hours = 0;
    EXPECT_NO_THROW(validate(config));
}

TEST(RunConfigTest, NegativeDaysRejected) {
    RunConfig config;
    config.days = -1;
    try {
        validate(config);
        FAIL() << "expected InvalidConfigError";
    } catch (const InvalidConfigError& e) {
        EXPECT_EQ(e.field(), "days");
    }
}

TEST(RunConfigTest, NegativeCapacityRejected) {
    RunConfig config;
    config.daily_capacity_hours = -8;
    EXPECT_THROW(validate(config), InvalidConfigError);
}

TEST(RunConfigTest, NegativeSpreadRejected) {
    RunConfig config;
    config.stddev_effort = -1.0;
    EXPECT_THROW(validate(config), InvalidConfigError);
}

TEST(RunConfigTest, NonFiniteMeanRejected) {
    RunConfig config;
    config.mean_effort = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(validate(config), InvalidConfigError);
}

TEST(RunConfigTest, MinEffortAndWipCapMustBePositive) {
    RunConfig config;
    config.min_effort = 0;
    EXPECT_THROW(validate(config), InvalidConfigError);

    config = RunConfig{};
    config.wip_cap_hours_per_ticket = 0;
    EXPECT_THROW(validate(config), InvalidConfigError);
}

TEST(RunConfigTest, ErrorIsSimulationError) {
    RunConfig config;
    config.days = -3;
    EXPECT_THROW(validate(config), SimulationError);
}
