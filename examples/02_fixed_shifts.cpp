/*
================================================================================
EXAMPLE 02: FIXED SHIFTS - A Two-Week Warehouse Rota
================================================================================
DIFFICULTY: Intermediate
PROBLEM TYPE: Mixed Integer Programming (MIP)

PROBLEM DESCRIPTION
-------------------
A warehouse runs two fixed shifts every day, early (06:00-14:00) and late
(14:00-22:00). Each shift needs two pickers and one shift lead; leads can
also pick, but a lead never works without pickers on the floor. Nobody
works a double shift. Plan a fourteen-day rota that respects the 40 hour
weekly cap and spreads the shifts fairly.

In fixed-shift mode every window of the grid is one named shift, so the
variables below are whole shifts rather than hours.

MODEL
-----
    assign[e,s]        employee e works shift s
    headcount[r,s]     people working role r in shift s
    max_hours/min_hours  spread of assigned hours (fairness term)

    s.t.  headcount[picker,s] >= 2,  headcount[lead,s] >= 1
          assign[e,s] + assign[e,s+1] <= 1         (max 1 consecutive shift)
          sum_s 8 * assign[e,s] <= 40 per week

SHIFTOPT FEATURES DEMONSTRATED
------------------------------
- SchedulerConfig::fixedShifts    Named shifts instead of hourly slots
- ObjectiveWeights::fairness      Narrow the spread of hours
- SolvePreset::Thorough           Prove optimality, budget still wins
- Schedule / EmployeeSummary      Walk the result directly

================================================================================
*/

#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include <shiftopt/shiftopt.h>

using namespace shiftopt;

// ============================================================================
// INPUT
// ============================================================================
static SchedulerInput warehouse()
{
    std::vector<Role> roles = {
        Role{ .id = "picker", .producing = true, .itemsPerEmployeePerHour = 40.0, .minPresent = 2 },
        Role{ .id = "lead", .minPresent = 1, .isIndependent = false },
    };

    std::vector<Employee> staff;
    const std::vector<std::string> leads = { "lena", "luis", "lior", "lupe" };
    const std::vector<std::string> pickers = { "pam", "pia", "piet", "priya", "paco", "pola" };

    for (std::size_t i = 0; i < leads.size(); ++i) {
        Employee e;
        e.id = leads[i];
        e.roles = { "lead", "picker" };
        e.availableHours = everyDay({ 0.0, 24.0 });
        e.hourlyWage = 21.0 + static_cast<double>(i);
        e.maxConsecSlots = 1;
        e.prefHours = 40.0;
        staff.push_back(e);
    }
    for (std::size_t i = 0; i < pickers.size(); ++i) {
        Employee e;
        e.id = pickers[i];
        e.roles = { "picker" };
        e.availableHours = everyDay({ 0.0, 24.0 });
        e.hourlyWage = 16.0;
        e.maxConsecSlots = 1;
        e.prefHours = 32.0;
        staff.push_back(e);
    }
    // pia only does mornings
    staff[5].availableHours = everyDay({ 6.0, 14.0 });

    SchedulerConfig cfg;
    cfg.fixedShifts = true;
    cfg.slotLenHour = 8.0;
    cfg.minShiftLengthSlots = 1;
    cfg.minRestSlots = 0;
    cfg.shifts = { { "early", { 6.0, 14.0 } }, { "late", { 14.0, 22.0 } } };
    cfg.operatingHours = everyDay({ 6.0, 22.0 });
    cfg.weights.fairness = 0.5;

    return SchedulerInput(roles, staff, {}, cfg);
}

static DemandForecast orders(std::size_t days)
{
    auto demand = DemandForecast::zero(days, Weekday::Monday);
    for (std::size_t d = 0; d < days; ++d) {
        const Weekday wd = demand.weekdayOf(d);
        const bool weekend = wd == Weekday::Saturday || wd == Weekday::Sunday;
        for (int h = 6; h < 22; ++h) {
            const long long items = weekend ? 30 : 60;
            demand.at(d, h) = { items / 3, items };
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
    std::cout << "EXAMPLE 02: FIXED SHIFTS\n";
    std::cout << "================================================================\n\n";

    try {
        const SchedulerInput input = warehouse();
        const DemandForecast demand = orders(14);

        SolveOptions opts;
        opts.preset = SolvePreset::Thorough;

        std::cout << "SOLVING...\n";
        std::cout << "----------\n";
        SolveResult result = solve(input, demand, std::chrono::seconds(120), opts);

        std::cout << "Status:    " << statusName(result.status)
                  << " (" << result.stats.solverStatus << ")\n";
        std::cout << "Model:     " << modelSummary(result.stats.model) << "\n";
        std::cout << "Shifts:    " << result.stats.numWindows << "\n";
        if (result.objectiveValue) {
            std::cout << "Objective: " << std::fixed << std::setprecision(2)
                      << *result.objectiveValue << "\n";
        }
        std::cout << "\n";

        if (!result.hasSchedule()) {
            for (const auto& c : result.conflicts) {
                std::cout << "  conflict: " << c.constraintClass
                          << " (" << c.members.size() << " member(s))\n";
            }
            return 1;
        }

        // ====================================================================
        // ROTA
        // ====================================================================
        std::cout << "ROTA\n";
        std::cout << "----\n";
        for (const auto& [day, windows] : *result.schedule) {
            std::cout << "Day " << std::setw(2) << day << " "
                      << std::left << std::setw(10) << weekdayName(demand.weekdayOf(day))
                      << std::right << "\n";
            for (const auto& sw : windows) {
                std::cout << "    " << std::left << std::setw(6) << sw.window.label << std::right;
                for (const auto& a : sw.assignments) {
                    std::cout << " " << a.employeeId << (a.roleId == "lead" ? "*" : "");
                }
                std::cout << "\n";
            }
        }
        std::cout << "    (* = shift lead)\n\n";

        // ====================================================================
        // HOURS
        // ====================================================================
        std::cout << "HOURS\n";
        std::cout << "-----\n";
        std::cout << std::left << std::setw(8) << "Name" << std::right
                  << std::setw(8) << "Hours" << std::setw(8) << "Target"
                  << std::setw(10) << "Wages" << "\n";
        double wages = 0.0;
        for (const auto& s : result.employees) {
            std::cout << std::left << std::setw(8) << s.employeeId << std::right
                      << std::fixed << std::setprecision(1)
                      << std::setw(8) << s.assignedHours
                      << std::setw(8) << s.targetHours
                      << std::setprecision(2) << std::setw(10) << s.wageCost << "\n";
            wages += s.wageCost;
        }
        std::cout << "Total wages: " << std::fixed << std::setprecision(2) << wages << "\n\n";

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
