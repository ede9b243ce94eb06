/*
===============================================================================
TEST SESSION — Tests for session.h
===============================================================================

OVERVIEW
--------
Validates SchedulerSession: how Gurobi statuses map to outcomes, the
session state machine, the size of every variable and constraint family on
a hand-counted instance, and cancellation before the search.

TEST ORGANIZATION
-----------------
• Section A: Status classification and names
• Section B: State machine
• Section C: Model families on a small instance
• Section D: Running, cancellation and logging

TEST STRATEGY
-------------
The small instance is one producing cook (10 items/h, min_present 1) and one
employee available Monday 09:00-13:00, over a one-day horizon with three
items forecast at 10:00. Every family size below is counted by hand from
that instance.

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• Gurobi - solver backend
• session.h - System under test

===============================================================================
*/

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <shiftopt/session.h>

#include <set>
#include <string>
#include <vector>

using namespace shiftopt;

// ============================================================================
// TEST UTILITIES
// ============================================================================

namespace {

    SchedulerInput morningCook() {
        Role cook{ .id = "cook", .producing = true, .itemsPerEmployeePerHour = 10.0, .minPresent = 1 };
        Employee ana;
        ana.id = "ana";
        ana.roles = { "cook" };
        ana.availableHours[enum_index(Weekday::Monday)] = HourInterval{ 9.0, 13.0 };
        return SchedulerInput({ cook }, { ana }, {}, {});
    }

    DemandForecast tenOClockRush() {
        auto demand = DemandForecast::zero(1);
        demand.at(0, 10).itemCount = 3;
        return demand;
    }

    std::size_t familySize(const SchedulerSession& s, SchedCons c) {
        return s.constraints()(c).size();
    }

} // namespace

// ============================================================================
// SECTION A: STATUS CLASSIFICATION
// ============================================================================

/**
 * @test Classify::StatusTable
 * @brief Limits yield Feasible only when a solution exists
 */
TEST_CASE("A1: Classify::StatusTable", "[session][status]")
{
    REQUIRE(classifyStatus(GRB_OPTIMAL, 1) == SolveStatus::Optimal);
    REQUIRE(classifyStatus(GRB_INFEASIBLE, 0) == SolveStatus::Infeasible);
    REQUIRE(classifyStatus(GRB_INF_OR_UNBD, 0) == SolveStatus::Infeasible);

    for (int limit : { GRB_TIME_LIMIT, GRB_NODE_LIMIT, GRB_ITERATION_LIMIT,
                       GRB_SOLUTION_LIMIT, GRB_SUBOPTIMAL, GRB_INTERRUPTED }) {
        REQUIRE(classifyStatus(limit, 2) == SolveStatus::Feasible);
        REQUIRE(classifyStatus(limit, 0) == SolveStatus::Unknown);
    }

    REQUIRE(classifyStatus(GRB_NUMERIC, 0) == SolveStatus::Unknown);
    REQUIRE(classifyStatus(GRB_UNBOUNDED, 0) == SolveStatus::Unknown);
}

TEST_CASE("A2: Names::ConstraintClassesAreDistinct", "[session][names]")
{
    std::set<std::string> names;
    for_each_enum<SchedCons>([&](SchedCons c) {
        names.insert(std::string(constraintClassName(c)));
    });

    REQUIRE(names.size() == enum_size<SchedCons>::value);
    REQUIRE_FALSE(names.contains("unknown"));
    REQUIRE(constraintClassName(SchedCons::MinShiftLength) == "min_shift_length");
    REQUIRE(constraintClassName(SchedCons::CoPresence) == "co_presence");
    REQUIRE(stateName(SessionState::Built) == "built");
    REQUIRE(statusName(SolveStatus::Infeasible) == "infeasible");
}

// ============================================================================
// SECTION B: STATE MACHINE
// ============================================================================

/**
 * @test State::CreatedBuiltOptimal
 */
TEST_CASE("B1: State::CreatedBuiltOptimal", "[session][state]")
{
    SchedulerInput input = morningCook();
    DemandForecast demand = tenOClockRush();
    SchedulerSession session(input, demand);

    REQUIRE(session.state() == SessionState::Created);
    REQUIRE_FALSE(session.isBuilt());

    session.build();
    REQUIRE(session.state() == SessionState::Built);
    REQUIRE(session.store().at("stats:windows").get<int>() == 24);

    SolveResult r = session.run();
    REQUIRE(session.state() == SessionState::Optimal);
    REQUIRE(r.status == SolveStatus::Optimal);
}

TEST_CASE("B2: State::ConfigErrorBeforeAnySolverObject", "[session][state][exception]")
{
    SchedulerInput input = morningCook();
    auto demand = DemandForecast::zero(1);
    demand.at(0, 4).itemCount = -1;

    REQUIRE_THROWS_AS(SchedulerSession(input, demand), ConfigError);
}

// ============================================================================
// SECTION C: MODEL FAMILIES
// ============================================================================

/**
 * @test Families::PrecomputedLookups
 */
TEST_CASE("C1: Families::PrecomputedLookups", "[session][model]")
{
    SchedulerInput input = morningCook();
    DemandForecast demand = tenOClockRush();
    SchedulerSession session(input, demand);

    REQUIRE(session.grid().size() == 24);
    REQUIRE(session.assignable(0, 9));
    REQUIRE(session.assignable(0, 12));
    REQUIRE_FALSE(session.assignable(0, 8));
    REQUIRE_FALSE(session.assignable(0, 13));
    REQUIRE(session.eligibleAvailable(0, 10) == 1);
    REQUIRE(session.eligibleAvailable(0, 20) == 0);
    REQUIRE(session.demandCenti(10) == 300);
    REQUIRE(session.demandCenti(11) == 0);
}

/**
 * @test Families::VariableCounts
 * @then 4 assignable windows, 24 role windows, one soft demand window
 */
TEST_CASE("C2: Families::VariableCounts", "[session][model][variables]")
{
    SchedulerInput input = morningCook();
    DemandForecast demand = tenOClockRush();
    SchedulerSession session(input, demand);
    session.build();

    const auto& v = session.variables();
    REQUIRE(v(SchedVar::Assign).size() == 4);
    REQUIRE(v(SchedVar::RoleAssign).size() == 4);
    REQUIRE(v(SchedVar::Headcount).size() == 24);
    REQUIRE(v(SchedVar::RoleActive).size() == 24);
    REQUIRE(v(SchedVar::RoleOutput).size() == 24);
    REQUIRE(v(SchedVar::ChainRaw).empty());
    REQUIRE(v(SchedVar::Unmet).size() == 1);
    REQUIRE(v(SchedVar::HoursDeviation).size() == 1);
    REQUIRE(v.isEmpty(SchedVar::MaxHours));

    // headcount is bounded by the eligible available staff
    REQUIRE(v.var(SchedVar::Headcount, 0, 10).get(GRB_DoubleAttr_UB) == Catch::Approx(1.0));
    REQUIRE(v.var(SchedVar::Headcount, 0, 20).get(GRB_DoubleAttr_UB) == Catch::Approx(0.0));
}

/**
 * @test Families::ConstraintCounts
 * @details rest: (9,11) and (10,12) are one idle slot apart;
 *          min_shift_length: one per run position, the last forbids a start
 */
TEST_CASE("C3: Families::ConstraintCounts", "[session][model][constraints]")
{
    SchedulerInput input = morningCook();
    DemandForecast demand = tenOClockRush();
    SchedulerSession session(input, demand);
    session.build();

    REQUIRE(familySize(session, SchedCons::RoleSplit) == 4);
    REQUIRE(familySize(session, SchedCons::Headcount) == 24);
    REQUIRE(familySize(session, SchedCons::RoleActivity) == 48);
    REQUIRE(familySize(session, SchedCons::Coverage) == 25);
    REQUIRE(familySize(session, SchedCons::CoPresence) == 0);
    REQUIRE(familySize(session, SchedCons::Rest) == 2);
    REQUIRE(familySize(session, SchedCons::MaxConsecutive) == 0);
    REQUIRE(familySize(session, SchedCons::MinShiftLength) == 4);
    REQUIRE(familySize(session, SchedCons::WeeklyHours) == 1);
    REQUIRE(familySize(session, SchedCons::RoleOutput) == 24);
    REQUIRE(familySize(session, SchedCons::Demand) == 1);
    REQUIRE(familySize(session, SchedCons::HoursBalance) == 2);
    REQUIRE(familySize(session, SchedCons::Fairness) == 0);

    REQUIRE(constrName(session.constraints().constr(SchedCons::Rest, 0, 9, 11)) == "rest[0,9,11]");
}

/**
 * @test Families::HardDemandDropsTheSlack
 */
TEST_CASE("C4: Families::HardDemandDropsTheSlack", "[session][model]")
{
    Role cook{ .id = "cook", .producing = true, .itemsPerEmployeePerHour = 10.0, .minPresent = 1 };
    Employee ana;
    ana.id = "ana";
    ana.roles = { "cook" };
    ana.availableHours[enum_index(Weekday::Monday)] = HourInterval{ 9.0, 13.0 };
    SchedulerConfig cfg;
    cfg.meetAllDemand = true;
    SchedulerInput input({ cook }, { ana }, {}, cfg);
    DemandForecast demand = tenOClockRush();

    SchedulerSession session(input, demand);
    session.build();

    REQUIRE(session.variables()(SchedVar::Unmet).empty());
    REQUIRE(familySize(session, SchedCons::Demand) == 1);
}

// ============================================================================
// SECTION D: RUNNING
// ============================================================================

/**
 * @test Run::MinimumShiftAroundTheRush
 * @then The cook works exactly two hours including 10:00 and serves the rush
 */
TEST_CASE("D1: Run::MinimumShiftAroundTheRush", "[session][run]")
{
    SchedulerInput input = morningCook();
    DemandForecast demand = tenOClockRush();
    SchedulerSession session(input, demand);

    SolveResult r = session.run();

    REQUIRE(r.hasSchedule());
    REQUIRE(r.employees.size() == 1);
    REQUIRE(r.employees[0].assignedHours == Catch::Approx(2.0));
    REQUIRE(r.stats.solverStatus == "OPTIMAL");
    REQUIRE(r.stats.numWindows == 24);
    REQUIRE(r.stats.model.numVars > 0);

    const auto& day = r.schedule->at(0);
    bool rushServed = false;
    for (const auto& sw : day) {
        if (sw.window.start == Catch::Approx(10.0)) {
            rushServed = sw.works("ana") && sw.unmetItems == Catch::Approx(0.0);
        }
    }
    REQUIRE(rushServed);
}

/**
 * @test Run::CancelledBeforeSearch
 * @then Unknown with solver status NOT_RUN, and no schedule
 */
TEST_CASE("D2: Run::CancelledBeforeSearch", "[session][run][cancel]")
{
    SchedulerInput input = morningCook();
    DemandForecast demand = tenOClockRush();
    SchedulerSession session(input, demand);

    CancellationToken token;
    token.cancel();
    SolveResult r = session.run(token);

    REQUIRE(r.status == SolveStatus::Unknown);
    REQUIRE(r.stats.solverStatus == "NOT_RUN");
    REQUIRE_FALSE(r.hasSchedule());
    REQUIRE_FALSE(r.objectiveValue.has_value());
    REQUIRE(session.state() == SessionState::Unknown);
    REQUIRE(r.stats.parameters.at("stats:status").get<std::string>() == "NOT_RUN");
}

TEST_CASE("D3: Run::LogSinkReceivesSolverLines", "[session][run][logging]")
{
    SchedulerInput input = morningCook();
    DemandForecast demand = tenOClockRush();

    std::vector<std::string> lines;
    LogOptions log;
    log.sink = [&](const std::string& line) { lines.push_back(line); };
    SchedulerSession session(input, demand, log);

    SolveResult r = session.run();

    REQUIRE(r.status == SolveStatus::Optimal);
    REQUIRE_FALSE(lines.empty());
}
