/*
===============================================================================
TEST DIAGNOSTICS — Tests for diagnostics.h
===============================================================================

OVERVIEW
--------
Validates the diagnostic utilities the scheduler relies on when a model has
no solution:
- Status string conversion
- Model statistics and the one-line summary
- IIS extraction and grouping of its members by family

TEST ORGANIZATION
-----------------
• Section A: Status string conversion
• Section B: Model statistics
• Section C: IIS computation
• Section D: Grouping by family

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• Gurobi C++ API - Solver backend
• diagnostics.h - System under test

===============================================================================
*/

#include <catch2/catch_test_macros.hpp>
#include <shiftopt/diagnostics.h>
#include <shiftopt/constraints.h>
#include <shiftopt/variables.h>

#include <algorithm>
#include <string>
#include <vector>

using namespace shiftopt;

// ============================================================================
// TEST UTILITIES
// ============================================================================

struct QuietEnv {
    GRBEnv env{ true };
    QuietEnv() {
        env.set(GRB_IntParam_OutputFlag, 0);
        env.start();
    }
};

static GRBModel makeModel() {
    static QuietEnv quiet;
    return GRBModel(quiet.env);
}

/**
 * @brief A worker capped at 3 hours asked to cover 5
 *
 * @details hours[0] has UB 3; coverage[0] demands hours >= 5; rest[0] is an
 *          unrelated constraint that must stay out of the IIS.
 */
static void addOverbookedWorker(GRBModel& model) {
    IndexedVariableSet hours;
    IndexedVariableSet assign;
    IndexedConstraintSet cons;

    GRBVar h = VariableFactory::addNamedTo(hours, model, GRB_INTEGER, 0, 3, "hours", { 0 });
    GRBVar a = VariableFactory::addNamedTo(assign, model, GRB_BINARY, 0, 1, "assign", { 0 });

    ConstraintFactory::addTo(cons, model, h >= 5.0, "coverage", { 0 });
    ConstraintFactory::addTo(cons, model, a <= 1.0, "rest", { 0 });
}

// ============================================================================
// SECTION A: STATUS STRINGS
// ============================================================================

TEST_CASE("A1: StatusString::KnownStatuses", "[diagnostics][status]")
{
    REQUIRE(statusString(GRB_OPTIMAL) == "OPTIMAL");
    REQUIRE(statusString(GRB_INFEASIBLE) == "INFEASIBLE");
    REQUIRE(statusString(GRB_INF_OR_UNBD) == "INF_OR_UNBD");
    REQUIRE(statusString(GRB_TIME_LIMIT) == "TIME_LIMIT");
    REQUIRE(statusString(GRB_SOLUTION_LIMIT) == "SOLUTION_LIMIT");
    REQUIRE(statusString(GRB_INTERRUPTED) == "INTERRUPTED");
}

/**
 * @test StatusString::UnknownStatus
 * @then Codes Gurobi does not define render with their number
 */
TEST_CASE("A2: StatusString::UnknownStatus", "[diagnostics][status]")
{
    REQUIRE(statusString(999) == "UNKNOWN(999)");
    REQUIRE(statusString(-1) == "UNKNOWN(-1)");
}

// ============================================================================
// SECTION B: MODEL STATISTICS
// ============================================================================

/**
 * @test ModelStatistics::CountsByType
 * @given 2 binary, 1 general integer and 3 continuous variables, 2 constraints
 */
TEST_CASE("B1: ModelStatistics::CountsByType", "[diagnostics][statistics]")
{
    GRBModel model = makeModel();
    GRBVar b1 = model.addVar(0, 1, 0, GRB_BINARY);
    GRBVar b2 = model.addVar(0, 1, 0, GRB_BINARY);
    GRBVar n = model.addVar(0, 5, 0, GRB_INTEGER);
    GRBVar c1 = model.addVar(0, 10, 0, GRB_CONTINUOUS);
    GRBVar c2 = model.addVar(0, 10, 0, GRB_CONTINUOUS);
    model.addVar(0, 10, 0, GRB_CONTINUOUS);
    model.addConstr(b1 + b2 + n <= 4.0, "c0");
    model.addConstr(c1 - c2 >= 0.0, "c1");
    model.update();

    ModelStatistics stats = computeStatistics(model);
    REQUIRE(stats.numVars == 6);
    REQUIRE(stats.numBinary == 2);
    REQUIRE(stats.numInteger == 1);
    REQUIRE(stats.numContinuous == 3);
    REQUIRE(stats.numConstrs == 2);
    REQUIRE(stats.numNonZeros == 5);
    REQUIRE(isMIP(model));

    REQUIRE(modelSummary(model) == "6 vars (2 bin, 1 int), 2 constrs");
}

TEST_CASE("B2: ModelStatistics::PureLinearProgram", "[diagnostics][statistics]")
{
    GRBModel model = makeModel();
    GRBVar x = model.addVar(0, 10, 0, GRB_CONTINUOUS);
    model.addConstr(x <= 4.0, "cap");
    model.update();

    REQUIRE_FALSE(isMIP(model));
    REQUIRE(modelSummary(model) == "1 vars, 1 constrs");
}

TEST_CASE("B3: ModelStatistics::EmptyModel", "[diagnostics][statistics]")
{
    GRBModel model = makeModel();
    model.update();

    ModelStatistics stats = computeStatistics(model);
    REQUIRE(stats.numVars == 0);
    REQUIRE(stats.numConstrs == 0);
    REQUIRE(modelSummary(stats) == "0 vars, 0 constrs");
}

// ============================================================================
// SECTION C: IIS COMPUTATION
// ============================================================================

/**
 * @test IIS::ConflictingCoverageAndBound
 * @given hours <= 3 (bound) and hours >= 5 (coverage)
 * @then  The IIS holds coverage[0] and the upper bound of hours[0], not rest[0]
 */
TEST_CASE("C1: IIS::ConflictingCoverageAndBound", "[diagnostics][iis]")
{
    GRBModel model = makeModel();
    addOverbookedWorker(model);
    model.optimize();
    const int status = model.get(GRB_IntAttr_Status);
    REQUIRE((status == GRB_INFEASIBLE || status == GRB_INF_OR_UNBD));

    IISResult iis = computeIIS(model);

    REQUIRE_FALSE(iis.empty());
    REQUIRE(iis.constraints == std::vector<std::string>{ "coverage[0]" });
    REQUIRE(iis.upperBounds == std::vector<std::string>{ "hours[0]" });
    REQUIRE(iis.lowerBounds.empty());
    REQUIRE(iis.size() == 2);
}

TEST_CASE("C2: IISResult::EmptyAndSize", "[diagnostics][iis]")
{
    IISResult iis;
    REQUIRE(iis.empty());
    REQUIRE(iis.size() == 0);

    iis.lowerBounds.push_back("assign[0]");
    REQUIRE_FALSE(iis.empty());
    REQUIRE(iis.size() == 1);
}

// ============================================================================
// SECTION D: GROUPING
// ============================================================================

/**
 * @test Grouping::FamiliesAndBounds
 */
TEST_CASE("D1: Grouping::FamiliesAndBounds", "[diagnostics][iis][grouping]")
{
    IISResult iis;
    iis.constraints = { "coverage[0,3,1]", "coverage[0,4,1]", "weekly_hours[2,0]", "fairness" };
    iis.upperBounds = { "hours[0]" };
    iis.lowerBounds = { "C17" };

    auto groups = groupByFamily(iis);

    REQUIRE(groups.size() == 5);
    REQUIRE(groups.at("coverage").size() == 2);
    REQUIRE(groups.at("weekly_hours") == std::vector<std::string>{ "weekly_hours[2,0]" });
    REQUIRE(groups.at("fairness").size() == 1);
    REQUIRE(groups.at("bound:hours") == std::vector<std::string>{ "hours[0]" });
    REQUIRE(groups.at("bound:unnamed") == std::vector<std::string>{ "C17" });
}

TEST_CASE("D2: Grouping::SolvedIIS", "[diagnostics][iis][grouping]")
{
    GRBModel model = makeModel();
    addOverbookedWorker(model);
    model.optimize();

    auto groups = groupByFamily(computeIIS(model));

    REQUIRE(groups.count("coverage") == 1);
    REQUIRE(groups.count("bound:hours") == 1);
    REQUIRE(groups.count("rest") == 0);
}
