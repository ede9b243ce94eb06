/*
===============================================================================
TEST GRID — Tests for grid.h
===============================================================================

OVERVIEW
--------
Validates the discretisation of the horizon: uniform and fixed-shift
patterns, active days, staffed windows, window demand and the gap
arithmetic the rest and run constraints are built from.

TEST ORGANIZATION
-----------------
• Section A: Uniform grid
• Section B: Fixed shifts
• Section C: Active days and staffed windows
• Section D: Adjacency, continuity and idle gaps
• Section E: Errors

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• grid.h - System under test

===============================================================================
*/

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <shiftopt/grid.h>

#include <string>
#include <vector>

using namespace shiftopt;

namespace {

    Role cook() {
        return Role{ .id = "cook", .producing = true, .itemsPerEmployeePerHour = 10.0, .minPresent = 1 };
    }

    Employee weekdayWorker() {
        Employee e;
        e.id = "ana";
        e.roles = { "cook" };
        for (Weekday d : { Weekday::Monday, Weekday::Tuesday, Weekday::Wednesday,
                           Weekday::Thursday, Weekday::Friday }) {
            e.availableHours[enum_index(d)] = HourInterval{ 8.0, 16.0 };
        }
        return e;
    }

} // namespace

// ============================================================================
// SECTION A: UNIFORM GRID
// ============================================================================

/**
 * @test UniformGrid::HourlySlots
 * @given One active day and a one-hour slot
 * @then  24 windows labelled "HH:MM-HH:MM", each one slot long
 */
TEST_CASE("A1: UniformGrid::HourlySlots", "[grid][uniform]")
{
    SchedulerInput input({ cook() }, { weekdayWorker() }, {}, {});
    auto demand = DemandForecast::zero(1);

    TimeGrid grid = buildGrid(input, demand);

    REQUIRE(grid.size() == 24);
    REQUIRE(grid.slotsPerDay() == 24);
    REQUIRE(grid.window(0).label == "00:00-01:00");
    REQUIRE(grid.window(23).label == "23:00-24:00");
    REQUIRE(grid.window(9).start == Catch::Approx(9.0));
    REQUIRE(grid.window(9).slots == 1);
    REQUIRE(grid.window(9).position == 9);
    REQUIRE(grid.windowsOfDay(0).size() == 24);
}

/**
 * @test UniformGrid::LastSlotClippedAtMidnight
 * @given A 5 hour slot
 * @then  ceil(24 / 5) = 5 windows, the last covering 20:00-24:00
 */
TEST_CASE("A2: UniformGrid::LastSlotClippedAtMidnight", "[grid][uniform]")
{
    SchedulerConfig cfg;
    cfg.slotLenHour = 5.0;
    cfg.minShiftLengthSlots = 1;
    SchedulerInput input({ cook() }, { weekdayWorker() }, {}, cfg);

    TimeGrid grid = buildGrid(input, DemandForecast::zero(1));

    REQUIRE(grid.size() == 5);
    REQUIRE(grid.window(4).start == Catch::Approx(20.0));
    REQUIRE(grid.window(4).end == Catch::Approx(24.0));
    REQUIRE(grid.window(4).hours() == Catch::Approx(4.0));
}

/**
 * @test UniformGrid::HalfHourLabels
 */
TEST_CASE("A3: UniformGrid::HalfHourLabels", "[grid][uniform]")
{
    SchedulerConfig cfg;
    cfg.slotLenHour = 0.5;
    SchedulerInput input({ cook() }, { weekdayWorker() }, {}, cfg);

    TimeGrid grid = buildGrid(input, DemandForecast::zero(1));

    REQUIRE(grid.size() == 48);
    REQUIRE(grid.window(17).label == "08:30-09:00");
    REQUIRE(clockLabel(13.75) == "13:45");
}

// ============================================================================
// SECTION B: FIXED SHIFTS
// ============================================================================

/**
 * @test FixedShifts::SortedByStartWithSlotLengths
 */
TEST_CASE("B1: FixedShifts::SortedByStartWithSlotLengths", "[grid][fixed]")
{
    SchedulerConfig cfg;
    cfg.fixedShifts = true;
    cfg.minShiftLengthSlots = 1;
    cfg.slotLenHour = 4.0;
    cfg.shifts = { { "late", { 14.0, 22.0 } }, { "early", { 6.0, 14.0 } }, { "night", { 22.0, 24.0 } } };
    SchedulerInput input({ cook() }, { weekdayWorker() }, {}, cfg);

    TimeGrid grid = buildGrid(input, DemandForecast::zero(2));

    REQUIRE(grid.size() == 6);
    REQUIRE(grid.window(0).label == "early");
    REQUIRE(grid.window(1).label == "late");
    REQUIRE(grid.window(2).label == "night");
    REQUIRE(grid.window(0).slots == 2);
    REQUIRE(grid.window(2).slots == 1);
    REQUIRE(grid.slotsPerDay() == 5);
    REQUIRE(grid.window(3).day == 1);
    REQUIRE(grid.window(3).weekday == Weekday::Tuesday);
}

// ============================================================================
// SECTION C: ACTIVE DAYS AND STAFFED WINDOWS
// ============================================================================

/**
 * @test ActiveDays::WeekendWithoutAvailabilityIsSkipped
 * @given Staff available Monday to Friday, no demand, no opening hours
 * @then  Saturday and Sunday contribute no windows
 */
TEST_CASE("C1: ActiveDays::WeekendWithoutAvailabilityIsSkipped", "[grid][active]")
{
    SchedulerInput input({ cook() }, { weekdayWorker() }, {}, {});
    TimeGrid grid = buildGrid(input, DemandForecast::zero(7));

    REQUIRE(grid.activeDays() == std::vector<std::size_t>{ 0, 1, 2, 3, 4 });
    REQUIRE(grid.windowsOfDay(5).empty());
    REQUIRE(grid.size() == 5 * 24);
    REQUIRE(grid.horizonDays() == 7);
}

/**
 * @test ActiveDays::DemandOrOpeningHoursActivateADay
 */
TEST_CASE("C2: ActiveDays::DemandOrOpeningHoursActivateADay", "[grid][active]")
{
    SchedulerConfig cfg;
    cfg.operatingHours[enum_index(Weekday::Sunday)] = HourInterval{ 10.0, 14.0 };
    SchedulerInput input({ cook() }, { weekdayWorker() }, {}, cfg);

    auto demand = DemandForecast::zero(7);
    demand.at(5, 12).itemCount = 3;   // Saturday

    TimeGrid grid = buildGrid(input, demand);
    REQUIRE(grid.activeDays().size() == 7);
}

/**
 * @test Staffed::OpeningHoursDriven
 * @brief Windows overlapping the opening hours are staffed; others are not
 */
TEST_CASE("C3: Staffed::OpeningHoursDriven", "[grid][staffed]")
{
    SchedulerConfig cfg;
    cfg.operatingHours[enum_index(Weekday::Monday)] = HourInterval{ 9.5, 12.0 };
    SchedulerInput input({ cook() }, { weekdayWorker() }, {}, cfg);

    auto demand = DemandForecast::zero(1);
    demand.at(0, 15).itemCount = 10;   // outside opening hours

    TimeGrid grid = buildGrid(input, demand);
    REQUIRE_FALSE(grid.window(8).staffed);
    REQUIRE(grid.window(9).staffed);
    REQUIRE(grid.window(11).staffed);
    REQUIRE_FALSE(grid.window(12).staffed);
    REQUIRE_FALSE(grid.window(15).staffed);
}

/**
 * @test Staffed::DemandDrivenWithoutOpeningHours
 */
TEST_CASE("C4: Staffed::DemandDrivenWithoutOpeningHours", "[grid][staffed]")
{
    SchedulerInput input({ cook() }, { weekdayWorker() }, {}, {});
    auto demand = DemandForecast::zero(1);
    demand.at(0, 12).itemCount = 10;

    TimeGrid grid = buildGrid(input, demand);
    int staffed = 0;
    for (const Window& w : grid.windows()) {
        if (w.staffed) ++staffed;
    }
    REQUIRE(staffed == 1);
    REQUIRE(grid.window(12).staffed);
}

/**
 * @test WindowDemand::ItemsAndOrders
 */
TEST_CASE("C5: WindowDemand::ItemsAndOrders", "[grid][demand]")
{
    SchedulerConfig cfg;
    cfg.slotLenHour = 2.0;
    cfg.minShiftLengthSlots = 1;
    SchedulerInput input({ cook() }, { weekdayWorker() }, {}, cfg);

    auto demand = DemandForecast::zero(1);
    demand.at(0, 12).itemCount = 10;
    demand.at(0, 13).itemCount = 6;
    demand.at(0, 13).orderCount = 2;

    TimeGrid grid = buildGrid(input, demand);
    WindowDemand wd = windowDemand(demand, grid.window(6));
    REQUIRE(wd.items == Catch::Approx(16.0));
    REQUIRE(wd.orders == Catch::Approx(2.0));
}

// ============================================================================
// SECTION D: ADJACENCY, CONTINUITY, IDLE GAPS
// ============================================================================

TEST_CASE("D1: Gaps::SameDayAndAcrossMidnight", "[grid][gaps]")
{
    SchedulerInput input({ cook() }, { weekdayWorker() }, {}, {});
    TimeGrid grid = buildGrid(input, DemandForecast::zero(2));

    REQUIRE(grid.adjacent(3, 4));
    REQUIRE_FALSE(grid.adjacent(3, 5));
    REQUIRE(grid.idleSlotsBetween(3, 6) == Catch::Approx(2.0));

    SECTION("Midnight: continuous but not adjacent")
    {
        REQUIRE_FALSE(grid.adjacent(23, 24));
        REQUIRE(grid.continues(23, 24));
        REQUIRE(grid.idleSlotsBetween(22, 25) == Catch::Approx(2.0));
    }
}

TEST_CASE("D2: Weeks::DaysPerWeek", "[grid][weeks]")
{
    SchedulerInput input({ cook() }, { weekdayWorker() }, {}, {});
    TimeGrid grid = buildGrid(input, DemandForecast::zero(10));

    REQUIRE(grid.numWeeks() == 2);
    REQUIRE(grid.daysInWeek(0) == 7);
    REQUIRE(grid.daysInWeek(1) == 3);
    REQUIRE(grid.daysInWeek(2) == 0);
    REQUIRE(TimeGrid::weekOf(9) == 1);
}

// ============================================================================
// SECTION E: ERRORS
// ============================================================================

TEST_CASE("E1: Errors::ConfigurationRejectedByGrid", "[grid][exception]")
{
    SECTION("Minimum shift longer than a day")
    {
        SchedulerConfig cfg;
        cfg.slotLenHour = 6.0;
        cfg.minShiftLengthSlots = 5;
        SchedulerInput input({ cook() }, { weekdayWorker() }, {}, cfg);
        REQUIRE_THROWS_AS(buildGrid(input, DemandForecast::zero(1)), ConfigError);
    }

    SECTION("Fixed shifts without definitions")
    {
        SchedulerConfig cfg;
        cfg.fixedShifts = true;
        SchedulerInput input({ cook() }, { weekdayWorker() }, {}, cfg);
        REQUIRE_THROWS_AS(buildGrid(input, DemandForecast::zero(1)), ConfigError);
    }

    SECTION("Negative demand")
    {
        SchedulerInput input({ cook() }, { weekdayWorker() }, {}, {});
        auto demand = DemandForecast::zero(1);
        demand.at(0, 0).orderCount = -3;
        REQUIRE_THROWS_AS(buildGrid(input, demand), ConfigError);
    }
}

/**
 * @test EmptyHorizon::NoWindows
 */
TEST_CASE("E2: EmptyHorizon::NoWindows", "[grid][edge]")
{
    SchedulerInput input({ cook() }, {}, {}, {});
    TimeGrid grid = buildGrid(input, DemandForecast::zero(3));
    REQUIRE(grid.empty());
    REQUIRE(grid.activeDays().empty());
}
