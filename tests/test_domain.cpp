/*
===============================================================================
TEST DOMAIN — Validation of SchedulerInput and DemandForecast
===============================================================================

OVERVIEW
--------
Every structural mistake in an input must surface as a ConfigError from the
SchedulerInput constructor (or from DemandForecast::validate), before any
solver object is created. These tests need no Gurobi licence.

TEST ORGANIZATION
-----------------
• Section A: HourInterval and Employee helpers
• Section B: Role validation
• Section C: Employee validation
• Section D: Chain validation
• Section E: Config validation
• Section F: Lookups on a valid input
• Section G: DemandForecast

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• domain.h, forecast.h - System under test

===============================================================================
*/

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <shiftopt/domain.h>
#include <shiftopt/forecast.h>

#include <stdexcept>
#include <string>
#include <vector>

using namespace shiftopt;

namespace {

    Role cook() {
        return Role{ .id = "cook", .producing = true, .itemsPerEmployeePerHour = 10.0, .minPresent = 1 };
    }

    Role cashier() {
        return Role{ .id = "cashier", .minPresent = 1, .isIndependent = false };
    }

    Employee worker(std::string id, std::set<std::string> roles) {
        Employee e;
        e.id = std::move(id);
        e.roles = std::move(roles);
        e.availableHours = everyDay({ 8.0, 20.0 });
        return e;
    }

    SchedulerInput make(std::vector<Role> roles, std::vector<Employee> emps,
                        std::vector<ProductionChain> chains = {},
                        SchedulerConfig cfg = {}) {
        return SchedulerInput(std::move(roles), std::move(emps), std::move(chains), std::move(cfg));
    }

} // namespace

// ============================================================================
// SECTION A: HELPERS
// ============================================================================

TEST_CASE("A1: HourInterval::CoversAndOverlap", "[domain][interval]")
{
    HourInterval day{ 8.0, 20.0 };

    REQUIRE(day.valid());
    REQUIRE(day.hours() == Catch::Approx(12.0));
    REQUIRE(day.covers(8.0, 9.0));
    REQUIRE(day.covers(19.0, 20.0));
    REQUIRE_FALSE(day.covers(7.5, 9.0));
    REQUIRE(day.overlap(6.0, 9.0) == Catch::Approx(1.0));
    REQUIRE(day.overlap(20.0, 22.0) == Catch::Approx(0.0));

    REQUIRE_FALSE(HourInterval{ 10.0, 10.0 }.valid());
    REQUIRE_FALSE(HourInterval{ -1.0, 4.0 }.valid());
    REQUIRE_FALSE(HourInterval{ 20.0, 25.0 }.valid());
}

/**
 * @test Employee::OffPreferenceHours
 * @brief Employees without preferences never pay the preference penalty
 */
TEST_CASE("A2: Employee::OffPreferenceHours", "[domain][employee]")
{
    Employee e = worker("ana", { "cook" });
    REQUIRE(e.offPreferenceHours(Weekday::Monday, 6.0, 10.0) == 0.0);

    e.preferredHours[enum_index(Weekday::Monday)] = HourInterval{ 9.0, 17.0 };
    REQUIRE(e.offPreferenceHours(Weekday::Monday, 8.0, 10.0) == Catch::Approx(1.0));
    REQUIRE(e.offPreferenceHours(Weekday::Monday, 10.0, 12.0) == Catch::Approx(0.0));
    // No preferred interval that day: every hour counts
    REQUIRE(e.offPreferenceHours(Weekday::Tuesday, 10.0, 12.0) == Catch::Approx(2.0));
}

// ============================================================================
// SECTION B: ROLES
// ============================================================================

TEST_CASE("B1: RoleValidation::Rejections", "[domain][role][exception]")
{
    SECTION("Duplicate id")
    {
        REQUIRE_THROWS_AS(make({ cook(), cook() }, {}), ConfigError);
    }

    SECTION("Empty id")
    {
        REQUIRE_THROWS_AS(make({ Role{} }, {}), ConfigError);
    }

    SECTION("Producing role without throughput")
    {
        Role r = cook();
        r.itemsPerEmployeePerHour.reset();
        REQUIRE_THROWS_AS(make({ r }, {}), ConfigError);
    }

    SECTION("Producing role with zero throughput")
    {
        Role r = cook();
        r.itemsPerEmployeePerHour = 0.0;
        REQUIRE_THROWS_AS(make({ r }, {}), ConfigError);
    }

    SECTION("Non-producing role with throughput")
    {
        Role r = cashier();
        r.itemsPerEmployeePerHour = 3.0;
        REQUIRE_THROWS_AS(make({ r }, {}), ConfigError);
    }

    SECTION("Negative min_present")
    {
        Role r = cook();
        r.minPresent = -1;
        REQUIRE_THROWS_AS(make({ r }, {}), ConfigError);
    }
}

/**
 * @test ConfigError::IsInvalidArgument
 * @brief Callers that only know std::invalid_argument still catch it
 */
TEST_CASE("B2: ConfigError::IsInvalidArgument", "[domain][exception]")
{
    REQUIRE_THROWS_AS(make({ cook(), cook() }, {}), std::invalid_argument);

    try {
        make({ cook(), cook() }, {});
        FAIL("expected ConfigError");
    }
    catch (const ConfigError& e) {
        REQUIRE(std::string(e.what()).find("cook") != std::string::npos);
    }
}

// ============================================================================
// SECTION C: EMPLOYEES
// ============================================================================

TEST_CASE("C1: EmployeeValidation::Rejections", "[domain][employee][exception]")
{
    SECTION("Unknown role")
    {
        REQUIRE_THROWS_AS(make({ cook() }, { worker("ana", { "baker" }) }), ConfigError);
    }

    SECTION("No role at all")
    {
        REQUIRE_THROWS_AS(make({ cook() }, { worker("ana", {}) }), ConfigError);
    }

    SECTION("Duplicate id")
    {
        REQUIRE_THROWS_AS(make({ cook() }, { worker("ana", { "cook" }), worker("ana", { "cook" }) }),
                          ConfigError);
    }

    SECTION("Non-positive wage")
    {
        Employee e = worker("ana", { "cook" });
        e.hourlyWage = 0.0;
        REQUIRE_THROWS_AS(make({ cook() }, { e }), ConfigError);
    }

    SECTION("max_consec_slots below one")
    {
        Employee e = worker("ana", { "cook" });
        e.maxConsecSlots = 0;
        REQUIRE_THROWS_AS(make({ cook() }, { e }), ConfigError);
    }

    SECTION("Negative weekly limits")
    {
        Employee e = worker("ana", { "cook" });
        e.maxHoursPerWeek = -1.0;
        REQUIRE_THROWS_AS(make({ cook() }, { e }), ConfigError);
        e.maxHoursPerWeek = 40.0;
        e.prefHours = -2.0;
        REQUIRE_THROWS_AS(make({ cook() }, { e }), ConfigError);
    }

    SECTION("Invalid availability interval")
    {
        Employee e = worker("ana", { "cook" });
        e.availableHours[enum_index(Weekday::Friday)] = HourInterval{ 18.0, 9.0 };
        REQUIRE_THROWS_AS(make({ cook() }, { e }), ConfigError);
    }

    SECTION("Preference outside availability")
    {
        Employee e = worker("ana", { "cook" });
        e.preferredHours[enum_index(Weekday::Monday)] = HourInterval{ 6.0, 12.0 };
        REQUIRE_THROWS_AS(make({ cook() }, { e }), ConfigError);
    }

    SECTION("Preference on an unavailable day")
    {
        Employee e = worker("ana", { "cook" });
        e.availableHours[enum_index(Weekday::Sunday)].reset();
        e.preferredHours[enum_index(Weekday::Sunday)] = HourInterval{ 10.0, 12.0 };
        REQUIRE_THROWS_AS(make({ cook() }, { e }), ConfigError);
    }
}

// ============================================================================
// SECTION D: CHAINS
// ============================================================================

TEST_CASE("D1: ChainValidation::Rejections", "[domain][chain][exception]")
{
    Role prep{ .id = "prep", .producing = true, .itemsPerEmployeePerHour = 20.0 };

    SECTION("Factor above one")
    {
        REQUIRE_THROWS_AS(make({ cook(), prep }, {}, { { "line", { "prep", "cook" }, 1.2 } }),
                          ConfigError);
    }

    SECTION("Factor of zero")
    {
        REQUIRE_THROWS_AS(make({ cook(), prep }, {}, { { "line", { "prep" }, 0.0 } }), ConfigError);
    }

    SECTION("Factor below one hundredth")
    {
        REQUIRE_THROWS_AS(make({ cook(), prep }, {}, { { "line", { "prep" }, 0.004 } }), ConfigError);
    }

    SECTION("Unknown role")
    {
        REQUIRE_THROWS_AS(make({ cook() }, {}, { { "line", { "prep" }, 0.9 } }), ConfigError);
    }

    SECTION("Empty chain")
    {
        REQUIRE_THROWS_AS(make({ cook() }, {}, { { "line", {}, 0.9 } }), ConfigError);
    }

    SECTION("Duplicate chain id")
    {
        REQUIRE_THROWS_AS(make({ cook(), prep }, {},
                               { { "line", { "prep" }, 0.9 }, { "line", { "cook" }, 0.9 } }),
                          ConfigError);
    }
}

// ============================================================================
// SECTION E: CONFIG
// ============================================================================

TEST_CASE("E1: ConfigValidation::Rejections", "[domain][config][exception]")
{
    SchedulerConfig cfg;

    SECTION("Non-positive slot length")
    {
        cfg.slotLenHour = 0.0;
        REQUIRE_THROWS_AS(make({ cook() }, {}, {}, cfg), ConfigError);
    }

    SECTION("Negative rest")
    {
        cfg.minRestSlots = -1;
        REQUIRE_THROWS_AS(make({ cook() }, {}, {}, cfg), ConfigError);
    }

    SECTION("Zero minimum shift length")
    {
        cfg.minShiftLengthSlots = 0;
        REQUIRE_THROWS_AS(make({ cook() }, {}, {}, cfg), ConfigError);
    }

    SECTION("Overlapping shifts")
    {
        cfg.fixedShifts = true;
        cfg.shifts = { { "morning", { 6.0, 14.0 } }, { "late", { 13.0, 22.0 } } };
        REQUIRE_THROWS_AS(make({ cook() }, {}, {}, cfg), ConfigError);
    }

    SECTION("Negative objective weight")
    {
        cfg.weights.fairness = -0.1;
        REQUIRE_THROWS_AS(make({ cook() }, {}, {}, cfg), ConfigError);
    }

    SECTION("Unordered insight thresholds")
    {
        cfg.insights.underutilized = 0.95;
        cfg.insights.overutilized = 0.9;
        REQUIRE_THROWS_AS(make({ cook() }, {}, {}, cfg), ConfigError);
    }

    SECTION("Invalid operating hours")
    {
        cfg.operatingHours[enum_index(Weekday::Monday)] = HourInterval{ 22.0, 6.0 };
        REQUIRE_THROWS_AS(make({ cook() }, {}, {}, cfg), ConfigError);
    }
}

// ============================================================================
// SECTION F: LOOKUPS
// ============================================================================

TEST_CASE("F1: SchedulerInput::IndicesAndEligibility", "[domain][lookup]")
{
    Role prep{ .id = "prep", .producing = true, .itemsPerEmployeePerHour = 20.0 };
    auto input = make({ cook(), cashier(), prep },
                      { worker("ana", { "prep", "cook" }), worker("ben", { "cashier" }) },
                      { { "line", { "prep", "cook" }, 0.85 } });

    REQUIRE(input.roleIndex("cashier") == 1u);
    REQUIRE_FALSE(input.roleIndex("baker").has_value());
    REQUIRE(input.employeeIndex("ben") == 1u);

    // eligible roles follow role order, not the employee's set order
    REQUIRE(input.eligibleRoles(0) == std::vector<int>{ 0, 2 });
    REQUIRE(input.eligibleRoles(1) == std::vector<int>{ 1 });

    REQUIRE(input.inAnyChain(0));
    REQUIRE_FALSE(input.inAnyChain(1));
    REQUIRE(input.inAnyChain(2));
    REQUIRE(input.chainRoles(0) == std::vector<int>{ 2, 0 });
}

TEST_CASE("F2: SchedulerInput::EmptyRosterIsValid", "[domain][lookup]")
{
    auto input = make({}, {});
    REQUIRE(input.roles().empty());
    REQUIRE(input.employees().empty());
    REQUIRE_FALSE(input.config().hasOperatingHours());
}

// ============================================================================
// SECTION G: DEMAND FORECAST
// ============================================================================

TEST_CASE("G1: DemandForecast::ProRataItems", "[forecast]")
{
    auto f = DemandForecast::zero(2, Weekday::Saturday);
    f.at(0, 12).itemCount = 40;
    f.at(0, 13).itemCount = 20;
    f.at(1, 9).orderCount = 5;

    REQUIRE(f.numDays() == 2);
    REQUIRE(f.weekdayOf(1) == Weekday::Sunday);
    REQUIRE(f.itemsBetween(0, 12.0, 14.0) == Catch::Approx(60.0));
    REQUIRE(f.itemsBetween(0, 12.5, 13.5) == Catch::Approx(30.0));
    REQUIRE(f.ordersBetween(1, 9.0, 10.0) == Catch::Approx(5.0));
    REQUIRE(f.totalItems(0) == 60);
    REQUIRE(f.totalItems() == 60);
}

TEST_CASE("G2: DemandForecast::Errors", "[forecast][exception]")
{
    auto f = DemandForecast::zero(1);

    REQUIRE_THROWS_AS(f.at(1, 0), std::out_of_range);
    REQUIRE_THROWS_AS(f.at(0, 24), std::out_of_range);

    f.at(0, 3).itemCount = -1;
    REQUIRE_THROWS_AS(f.validate(), ConfigError);
}
