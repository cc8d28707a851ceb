#include <wipsim/algo/simulation_set.hpp>
#include <wipsim/core/error.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <map>
#include <random>
#include <string>
#include <utility>
#include <vector>

using namespace wipsim::algo;
using namespace wipsim::core;

namespace {

// Arrival source with fixed efforts per day
class ScriptedArrivals : public ArrivalSource {
public:
    ScriptedArrivals() = default;
    explicit ScriptedArrivals(std::map<Day, std::vector<Hours>> script)
        : script_(std::move(script)) {}

    std::vector<Hours> arrivals(Day day) override {
        ++calls;
        auto iter = script_.find(day);
        if (iter == script_.end()) {
            return {};
        }
        return iter->second;
    }

    int calls{0};

private:
    std::map<Day, std::vector<Hours>> script_;
};

// Deterministic random script for property checks
std::map<Day, std::vector<Hours>> random_script(Day days, unsigned seed) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> count(0, 3);
    std::uniform_int_distribution<int> effort(0, 15);
    std::map<Day, std::vector<Hours>> script;
    for (Day day = 0; day < days; ++day) {
        int n = count(rng);
        for (int idx = 0; idx < n; ++idx) {
            script[day].push_back(effort(rng));
        }
    }
    return script;
}

// Captures records in order with their integer fields
class RecordingWriter : public TraceWriter {
public:
    struct Record {
        Day day{0};
        std::string type;
        std::map<std::string, uint64_t> ints;
        std::map<std::string, std::string> strings;
    };

    void begin(Day day) override {
        current_ = Record{};
        current_.day = day;
    }
    void type(std::string_view name) override { current_.type = std::string(name); }
    void field(std::string_view /*key*/, double /*value*/) override {}
    void field(std::string_view key, uint64_t value) override {
        current_.ints[std::string(key)] = value;
    }
    void field(std::string_view key, std::string_view value) override {
        current_.strings[std::string(key)] = std::string(value);
    }
    void end() override { records.push_back(std::move(current_)); }

    std::vector<Record> records;

private:
    Record current_;
};

} // anonymous namespace

class SimulationSetTest : public ::testing::Test {
protected:
    RunConfig config_;

    void SetUp() override {
        config_.days = 10;
        config_.daily_capacity_hours = 8;
        config_.wip_cap_hours_per_ticket = 2;
    }
};

// =============================================================================
// Construction
// =============================================================================

TEST_F(SimulationSetTest, RunsAllPoliciesByDefault) {
    SimulationSet set(config_);

    ASSERT_EQ(set.simulations().size(), ALL_POLICIES.size());
    for (std::size_t idx = 0; idx < ALL_POLICIES.size(); ++idx) {
        EXPECT_EQ(set.simulations()[idx].policy().kind(), ALL_POLICIES[idx]);
    }
    EXPECT_EQ(set.current_day(), 0);
    EXPECT_FALSE(set.finished());
}

TEST_F(SimulationSetTest, SubsetKeepsRequestedOrder) {
    std::vector<PolicyKind> kinds{PolicyKind::ShortestFirst, PolicyKind::EqualWorking};
    SimulationSet set(config_, kinds);

    ASSERT_EQ(set.simulations().size(), 2U);
    EXPECT_EQ(set.simulations()[0].policy().kind(), PolicyKind::ShortestFirst);
    EXPECT_EQ(set.simulations()[1].policy().kind(), PolicyKind::EqualWorking);
    EXPECT_THROW((void)set.simulation(PolicyKind::OldestFirst), OutOfRangeError);
}

TEST_F(SimulationSetTest, RejectsEmptyPolicyList) {
    std::vector<PolicyKind> kinds;
    EXPECT_THROW((SimulationSet{config_, kinds}), InvalidConfigError);
}

TEST_F(SimulationSetTest, RejectsDuplicatePolicies) {
    std::vector<PolicyKind> kinds{PolicyKind::OldestFirst, PolicyKind::OldestFirst};
    try {
        SimulationSet set(config_, kinds);
        FAIL() << "Expected InvalidConfigError";
    } catch (const InvalidConfigError& e) {
        EXPECT_EQ(e.field(), "policies");
    }
}

TEST_F(SimulationSetTest, RejectsInvalidConfig) {
    config_.days = -3;
    EXPECT_THROW(SimulationSet{config_}, InvalidConfigError);
}

// =============================================================================
// Day loop
// =============================================================================

TEST_F(SimulationSetTest, DrawsArrivalsOncePerDay) {
    ScriptedArrivals source({{0, {5, 10}}, {4, {3}}});
    SimulationSet set(config_);

    set.run(source);

    EXPECT_EQ(source.calls, config_.days);
    EXPECT_TRUE(set.finished());
    EXPECT_EQ(set.ticket_count(), 3U);
    ASSERT_EQ(set.arrivals().size(), static_cast<std::size_t>(config_.days));
    EXPECT_EQ(set.arrivals()[0].efforts, (std::vector<Hours>{5, 10}));
    EXPECT_TRUE(set.arrivals()[1].efforts.empty());
    EXPECT_EQ(set.arrivals()[4].day, 4);
}

TEST_F(SimulationSetTest, StepAfterFinishedThrows) {
    ScriptedArrivals source;
    SimulationSet set(config_);
    set.run(source);

    EXPECT_THROW(set.step(source), InvalidStateError);
}

TEST_F(SimulationSetTest, ZeroArrivalsLeavesPopulationsEmpty) {
    ScriptedArrivals source;
    SimulationSet set(config_);
    set.run(source);

    for (const auto& sim : set.simulations()) {
        EXPECT_TRUE(sim.tickets().empty());
    }
}

TEST_F(SimulationSetTest, ZeroDaysFinishesImmediately) {
    config_.days = 0;
    ScriptedArrivals source;
    SimulationSet set(config_);
    set.run(source);

    EXPECT_TRUE(set.finished());
    EXPECT_EQ(source.calls, 0);
    EXPECT_TRUE(set.arrivals().empty());
}

TEST_F(SimulationSetTest, ShortestFirstExample) {
    config_.days = 3;
    ScriptedArrivals source({{0, {5, 10}}});
    SimulationSet set(config_);
    set.run(source);

    const auto& tickets = set.simulation(PolicyKind::ShortestFirst).tickets();
    ASSERT_EQ(tickets.size(), 2U);
    EXPECT_EQ(tickets[0].lead_time(), 1);
    EXPECT_EQ(tickets[1].lead_time(), 2);
    EXPECT_EQ(tickets[0].remaining_by_day(), (std::vector<Hours>{5, 0, 0}));
    EXPECT_EQ(tickets[1].remaining_by_day(), (std::vector<Hours>{10, 7, 0}));
}

TEST_F(SimulationSetTest, FinalDayIsNotBurned) {
    config_.days = 2;
    ScriptedArrivals source(std::map<Day, std::vector<Hours>>{{1, {4}}});
    SimulationSet set(config_);
    set.run(source);

    for (const auto& sim : set.simulations()) {
        ASSERT_EQ(sim.tickets().size(), 1U);
        EXPECT_EQ(sim.tickets()[0].start_day(), 1);
        EXPECT_EQ(sim.tickets()[0].outstanding(), 4);
        EXPECT_EQ(sim.tickets()[0].lead_time(), 0);
    }
}

TEST_F(SimulationSetTest, PoliciesReceiveIdenticalArrivals) {
    ScriptedArrivals source(random_script(config_.days, 7));
    SimulationSet set(config_);
    set.run(source);

    const auto& reference = set.simulations().front().tickets();
    for (const auto& sim : set.simulations()) {
        ASSERT_EQ(sim.tickets().size(), reference.size());
        for (std::size_t idx = 0; idx < reference.size(); ++idx) {
            EXPECT_EQ(sim.tickets()[idx].id(), idx);
            EXPECT_EQ(sim.tickets()[idx].start_day(), reference[idx].start_day());
            EXPECT_EQ(sim.tickets()[idx].effort(), reference[idx].effort());
        }
    }
}

TEST_F(SimulationSetTest, PoliciesMutateOwnCopies) {
    config_.days = 3;
    ScriptedArrivals source({{0, {10, 4}}});
    SimulationSet set(config_);
    set.run(source);

    // FIFO spends the whole day on the first ticket, SJF on the short one first
    EXPECT_EQ(set.simulation(PolicyKind::OldestFirst).tickets()[1].remaining(1), 4);
    EXPECT_EQ(set.simulation(PolicyKind::ShortestFirst).tickets()[1].remaining(1), 0);
}

TEST_F(SimulationSetTest, RunIsDeterministic) {
    auto script = random_script(config_.days, 11);
    ScriptedArrivals first_source(script);
    ScriptedArrivals second_source(script);
    SimulationSet first(config_);
    SimulationSet second(config_);

    first.run(first_source);
    second.run(second_source);

    for (std::size_t sim = 0; sim < first.simulations().size(); ++sim) {
        const auto& lhs = first.simulations()[sim].tickets();
        const auto& rhs = second.simulations()[sim].tickets();
        ASSERT_EQ(lhs.size(), rhs.size());
        for (std::size_t idx = 0; idx < lhs.size(); ++idx) {
            EXPECT_EQ(lhs[idx].remaining_by_day(), rhs[idx].remaining_by_day());
            EXPECT_EQ(lhs[idx].lead_time(), rhs[idx].lead_time());
            EXPECT_EQ(lhs[idx].end_day(), rhs[idx].end_day());
        }
    }
}

// =============================================================================
// Properties over a longer random run
// =============================================================================

class SimulationSetPropertyTest : public SimulationSetTest,
                                  public ::testing::WithParamInterface<unsigned> {};

TEST_P(SimulationSetPropertyTest, CapacityAndTrajectoryInvariants) {
    config_.days = 60;
    ScriptedArrivals source(random_script(config_.days, GetParam()));
    SimulationSet set(config_);
    set.run(source);

    const Hours capacity = config_.daily_capacity_hours;
    const Hours cap = config_.wip_cap_hours_per_ticket;

    for (const auto& sim : set.simulations()) {
        const auto& tickets = sim.tickets();
        SCOPED_TRACE(std::string(sim.name()));

        for (Day day = 0; day + 1 < config_.days; ++day) {
            Hours open = 0;
            Hours capped_open = 0;
            Hours spent = 0;
            Hours largest = 0;
            for (const auto& ticket : tickets) {
                if (ticket.start_day() > day) {
                    continue;
                }
                Hours today = ticket.remaining(day);
                Hours burned = today - ticket.remaining(day + 1);
                EXPECT_GE(burned, 0);
                open += today;
                capped_open += std::min(today, cap);
                spent += burned;
                largest = std::max(largest, burned);
            }

            EXPECT_LE(spent, capacity);
            // Work-conserving: idle hours only when nothing is left
            EXPECT_EQ(spent, std::min(open, capacity));
            if (sim.policy().kind() == PolicyKind::EqualWorking && capped_open >= capacity) {
                EXPECT_LE(largest, cap);
            }
        }

        for (const auto& ticket : tickets) {
            if (ticket.is_complete() && ticket.effort() > 0) {
                EXPECT_EQ(ticket.lead_time(), ticket.end_day() + 1 - ticket.start_day());
                EXPECT_EQ(ticket.remaining(ticket.end_day() + 1), 0);
                EXPECT_GT(ticket.remaining(ticket.end_day()), 0);
            }
        }
    }
}

INSTANTIATE_TEST_SUITE_P(Seeds, SimulationSetPropertyTest, ::testing::Values(1U, 2U, 3U, 42U));

// =============================================================================
// Tracing
// =============================================================================

TEST_F(SimulationSetTest, TracesArrivalsBurnsAndCompletions) {
    config_.days = 3;
    ScriptedArrivals source({{0, {5, 10}}});
    std::vector<PolicyKind> kinds{PolicyKind::ShortestFirst};
    SimulationSet set(config_, kinds);
    RecordingWriter writer;
    set.set_trace_writer(&writer);

    set.run(source);

    std::vector<std::string> types;
    for (const auto& rec : writer.records) {
        types.push_back(rec.type);
    }
    EXPECT_EQ(types, (std::vector<std::string>{
                         "ticket_arrival", "ticket_arrival",
                         "burn", "ticket_completed", "burn", "day_end",
                         "burn", "ticket_completed", "day_end"}));

    const auto& completed = writer.records[3];
    EXPECT_EQ(completed.day, 0);
    EXPECT_EQ(completed.strings.at("policy"), "sjf");
    EXPECT_EQ(completed.ints.at("ticket"), 0U);
    EXPECT_EQ(completed.ints.at("lead_time"), 1U);

    const auto& first_end = writer.records[5];
    EXPECT_EQ(first_end.ints.at("hours_spent"), 8U);
    EXPECT_EQ(first_end.ints.at("wip"), 1U);

    const auto& last_burn = writer.records[6];
    EXPECT_EQ(last_burn.day, 1);
    EXPECT_EQ(last_burn.ints.at("ticket"), 1U);
    EXPECT_EQ(last_burn.ints.at("hours"), 7U);
    EXPECT_EQ(last_burn.ints.at("remaining"), 0U);
}

TEST_F(SimulationSetTest, NoTraceWriterIsAllowed) {
    ScriptedArrivals source(std::map<Day, std::vector<Hours>>{{0, {5}}});
    SimulationSet set(config_);
    set.set_trace_writer(nullptr);
    EXPECT_NO_THROW(set.run(source));
}
