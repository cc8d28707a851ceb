#include <wipsim/algo/simulation.hpp>
#include <wipsim/core/error.hpp>

#include <gtest/gtest.h>

#include <vector>

using namespace wipsim::algo;
using namespace wipsim::core;

class SimulationTest : public ::testing::Test {
protected:
    static constexpr Day HORIZON = 4;

    Simulation sim_{Policy(PolicyKind::OldestFirst, 8, 2), HORIZON};
};

TEST_F(SimulationTest, StartsEmpty) {
    EXPECT_TRUE(sim_.tickets().empty());
    EXPECT_EQ(sim_.horizon(), HORIZON);
    EXPECT_EQ(sim_.name(), "Oldest first");
    EXPECT_EQ(sim_.policy().kind(), PolicyKind::OldestFirst);
}

TEST_F(SimulationTest, AddTicketsCopiesArrivals) {
    std::vector<Ticket> arrivals;
    arrivals.emplace_back(0, 0, 5, HORIZON);
    sim_.add_tickets(arrivals);

    sim_.burn_down(0);

    ASSERT_EQ(sim_.tickets().size(), 1U);
    EXPECT_TRUE(sim_.tickets()[0].is_complete());
    EXPECT_FALSE(arrivals[0].is_complete());
    EXPECT_EQ(arrivals[0].outstanding(), 5);
}

TEST_F(SimulationTest, PopulationKeepsArrivalOrder) {
    sim_.add_tickets({Ticket(0, 0, 3, HORIZON)});
    sim_.add_tickets({Ticket(1, 1, 1, HORIZON), Ticket(2, 1, 2, HORIZON)});

    ASSERT_EQ(sim_.tickets().size(), 3U);
    for (std::size_t idx = 0; idx < sim_.tickets().size(); ++idx) {
        EXPECT_EQ(sim_.tickets()[idx].id(), idx);
    }
}

TEST_F(SimulationTest, BurnDownReportsSpentHours) {
    sim_.add_tickets({Ticket(0, 0, 10, HORIZON), Ticket(1, 0, 4, HORIZON)});

    auto spent = sim_.burn_down(0);

    EXPECT_EQ(spent, (std::vector<Hours>{8, 0}));
    EXPECT_EQ(sim_.tickets()[0].remaining(1), 2);
    EXPECT_EQ(sim_.tickets()[1].remaining(1), 4);
}

TEST_F(SimulationTest, BurnDownOnLastDayThrows) {
    sim_.add_tickets({Ticket(0, 0, 10, HORIZON)});
    EXPECT_THROW(sim_.burn_down(HORIZON - 1), OutOfRangeError);
    EXPECT_THROW(sim_.burn_down(-1), OutOfRangeError);
}

TEST_F(SimulationTest, BurnDownBeforeTicketStartThrowsForEveryPolicy) {
    for (PolicyKind kind : ALL_POLICIES) {
        Simulation sim(Policy(kind, 8, 2), HORIZON);
        sim.add_tickets({Ticket(0, 0, 4, HORIZON), Ticket(1, 2, 4, HORIZON)});
        EXPECT_THROW(sim.burn_down(1), OutOfRangeError) << policy_name(kind);
    }
}
