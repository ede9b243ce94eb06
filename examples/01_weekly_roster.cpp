/*
================================================================================
EXAMPLE 01: WEEKLY ROSTER - A Café Open Seven Days
================================================================================
DIFFICULTY: Beginner
PROBLEM TYPE: Mixed Integer Programming (MIP)

PROBLEM DESCRIPTION
-------------------
A café is open 07:00-19:00 from Monday to Saturday and 08:00-14:00 on
Sunday. Baristas make drinks, bakers make pastries, and cashiers take
orders but may never be alone in the shop. The forecast has a breakfast
rush at 08:00 and a lunch rush at 12:00. Find the cheapest weekly roster
that keeps every role staffed during opening hours and serves as much of
the forecast as is worth serving.

MODEL (see session.h for the full formulation)
-----------------------------------------------
    assign[e,w]        employee e works hour w
    headcount[r,w]     people working role r in hour w
    role_output[r,w]   drinks or pastries made, in centi-items
    unmet[w]           forecast items not served (soft demand)

    min  wages + preference + hours deviation + unmet + fairness

SHIFTOPT FEATURES DEMONSTRATED
------------------------------
- SchedulerInput               Roles, employees and config validated up front
- DemandForecast               Hourly item counts
- solve() with a preset        Interactive: 10s, 1% gap, budget overrides
- describe()                   Plain-text schedule and insights
- generateInsights()           Utilisation, cost, workload, hiring

================================================================================
*/

#include <chrono>
#include <iostream>
#include <string>
#include <vector>

#include <shiftopt/shiftopt.h>

using namespace shiftopt;

// ============================================================================
// INPUT
// ============================================================================
static SchedulerInput cafe()
{
    std::vector<Role> roles = {
        Role{ .id = "barista", .producing = true, .itemsPerEmployeePerHour = 15.0, .minPresent = 1 },
        Role{ .id = "baker",   .producing = true, .itemsPerEmployeePerHour = 6.0 },
        Role{ .id = "cashier", .minPresent = 1, .isIndependent = false },
    };

    auto weekdays = [](HourInterval h) {
        WeeklyIntervals w{};
        for (Weekday d : { Weekday::Monday, Weekday::Tuesday, Weekday::Wednesday,
                           Weekday::Thursday, Weekday::Friday }) {
            w[enum_index(d)] = h;
        }
        return w;
    };

    Employee ana{ .id = "ana", .roles = { "barista", "cashier" },
                  .availableHours = everyDay({ 6.0, 20.0 }), .hourlyWage = 14.0, .prefHours = 36.0 };
    Employee ben{ .id = "ben", .roles = { "barista" },
                  .availableHours = everyDay({ 6.0, 20.0 }), .hourlyWage = 13.0 };
    Employee cho{ .id = "cho", .roles = { "baker", "barista" },
                  .availableHours = weekdays({ 6.0, 15.0 }),
                  .preferredHours = weekdays({ 6.0, 12.0 }), .hourlyWage = 15.0, .prefHours = 25.0 };
    Employee dee{ .id = "dee", .roles = { "cashier" },
                  .availableHours = everyDay({ 7.0, 19.0 }), .hourlyWage = 11.0 };
    Employee eli{ .id = "eli", .roles = { "cashier", "baker" },
                  .availableHours = everyDay({ 10.0, 20.0 }), .hourlyWage = 12.0, .prefHours = 20.0 };
    Employee fay{ .id = "fay", .roles = { "barista", "cashier" },
                  .availableHours = everyDay({ 6.0, 20.0 }), .hourlyWage = 12.5, .maxHoursPerWeek = 24.0,
                  .prefHours = 20.0 };

    SchedulerConfig cfg;
    cfg.minShiftLengthSlots = 3;
    for (Weekday d : { Weekday::Monday, Weekday::Tuesday, Weekday::Wednesday,
                       Weekday::Thursday, Weekday::Friday, Weekday::Saturday }) {
        cfg.operatingHours[enum_index(d)] = HourInterval{ 7.0, 19.0 };
    }
    cfg.operatingHours[enum_index(Weekday::Sunday)] = HourInterval{ 8.0, 14.0 };

    return SchedulerInput(roles, { ana, ben, cho, dee, eli, fay }, {}, cfg);
}

static DemandForecast cafeForecast()
{
    auto demand = DemandForecast::zero(7, Weekday::Monday);
    for (std::size_t d = 0; d < 7; ++d) {
        const bool sunday = demand.weekdayOf(d) == Weekday::Sunday;
        for (int h = sunday ? 8 : 7; h < (sunday ? 14 : 19); ++h) {
            long long items = 6;
            if (h == 8) items = 28;
            if (h == 12) items = 24;
            if (h == 13) items = 14;
            demand.at(d, h) = { items / 2, items };
        }
    }
    return demand;
}

// ============================================================================
// MAIN
// ============================================================================
int main()
{
    std::cout << "================================================================\n";
    std::cout << "EXAMPLE 01: WEEKLY ROSTER\n";
    std::cout << "================================================================\n\n";

    try {
        const SchedulerInput input = cafe();
        const DemandForecast demand = cafeForecast();

        std::cout << "Forecast: " << demand.totalItems() << " items over "
                  << demand.numDays() << " days\n\n";

        SolveOptions opts;
        opts.preset = SolvePreset::Interactive;
        opts.log.console = true;

        SolveResult result = solve(input, demand, std::chrono::seconds(60), opts);

        std::cout << "\n" << describe(result, input, 7) << "\n";

        ManagementInsights insights = generateInsights(input, demand, &result);
        std::cout << describe(insights) << "\n";

    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    } catch (GRBException& e) {
        std::cerr << "Gurobi Error " << e.getErrorCode() << ": " << e.getMessage() << "\n";
        return 1;
    } catch (std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "================================================================\n";
    return 0;
}
