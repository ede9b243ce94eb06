/*
================================================================================
EXAMPLE 03: INFEASIBILITY DIAGNOSIS - When the Lunch Rush Cannot Be Met
================================================================================
DIFFICULTY: Intermediate
PROBLEM TYPE: Mixed Integer Programming (MIP) + Irreducible Infeasible Subsystem

PROBLEM DESCRIPTION
-------------------
A small restaurant insists on serving every forecast item (hard demand).
Its line is a prep cook feeding a grill cook, and the two together turn
out fewer plates than the lunch forecast asks for. The model is therefore
infeasible. This example shows how to find out why:

  1. generateInsights() without a result flags the shortfall up front
  2. solve() computes an IIS and groups its members by constraint family
  3. insights built from the failed result add hiring recommendations
  4. Relaxing to soft demand yields a schedule and the unmet items

MODEL (fragment that becomes infeasible)
----------------------------------------
    chain_raw[c,w]  = sum_r role_output[r,w]                (line chain)
    sum_c 0.85 * chain_raw[c,w] + independent output >= demand[w]
    headcount[r,w] <= eligible available staff

SHIFTOPT FEATURES DEMONSTRATED
------------------------------
- ProductionChain              Roles feeding each other at a loss
- SchedulerConfig::meetAllDemand  Hard versus penalised demand
- SolveResult::conflicts       IIS grouped by constraint family
- FeasibilityAnalysis          Likely cause of a missing schedule
- HiringRecommendation         How many people to add, per role

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
static SchedulerInput restaurant(bool meetAllDemand)
{
    std::vector<Role> roles = {
        Role{ .id = "prep", .producing = true, .itemsPerEmployeePerHour = 10.0 },
        Role{ .id = "grill", .producing = true, .itemsPerEmployeePerHour = 14.0, .minPresent = 1 },
        Role{ .id = "host", .minPresent = 1, .isIndependent = false },
    };
    std::vector<ProductionChain> chains = {
        ProductionChain{ .id = "line", .roleIds = { "prep", "grill" }, .contribFactor = 0.85 },
    };

    WeeklyIntervals lunchAndDinner{};
    for (Weekday d : { Weekday::Monday, Weekday::Tuesday, Weekday::Wednesday }) {
        lunchAndDinner[enum_index(d)] = HourInterval{ 10.0, 22.0 };
    }

    std::vector<Employee> staff = {
        Employee{ .id = "ana", .roles = { "grill", "prep" }, .availableHours = lunchAndDinner,
                  .hourlyWage = 17.0, .maxConsecSlots = 10 },
        Employee{ .id = "ben", .roles = { "grill" }, .availableHours = lunchAndDinner,
                  .hourlyWage = 16.0, .maxConsecSlots = 10 },
        Employee{ .id = "cai", .roles = { "prep" }, .availableHours = lunchAndDinner,
                  .hourlyWage = 13.0, .maxConsecSlots = 10 },
        Employee{ .id = "dot", .roles = { "host" }, .availableHours = lunchAndDinner,
                  .hourlyWage = 12.0, .maxConsecSlots = 10 },
        Employee{ .id = "eve", .roles = { "host", "prep" }, .availableHours = lunchAndDinner,
                  .hourlyWage = 12.0, .maxConsecSlots = 10 },
    };

    SchedulerConfig cfg;
    cfg.meetAllDemand = meetAllDemand;
    for (Weekday d : { Weekday::Monday, Weekday::Tuesday, Weekday::Wednesday }) {
        cfg.operatingHours[enum_index(d)] = HourInterval{ 11.0, 21.0 };
    }
    return SchedulerInput(roles, staff, chains, cfg);
}

static DemandForecast rushes()
{
    auto demand = DemandForecast::zero(3, Weekday::Monday);
    for (std::size_t d = 0; d < 3; ++d) {
        for (int h = 11; h < 21; ++h) demand.at(d, h) = { 4, 10 };
        demand.at(d, 12) = { 20, 70 };
        demand.at(d, 13) = { 15, 50 };
        demand.at(d, 19) = { 12, 36 };
    }
    return demand;
}

static void printInsights(const ManagementInsights& mi)
{
    if (mi.feasibility) {
        std::cout << "Likely cause: "
                  << (mi.feasibility->likelyCause.empty() ? "none" : mi.feasibility->likelyCause)
                  << "\n";
        for (const auto& issue : mi.feasibility->issues) {
            std::cout << "  [" << severityName(issue.severity) << "] "
                      << issue.constraintClass << ": " << issue.detail << "\n";
        }
    }
    for (const auto& h : mi.hiring) {
        std::cout << "  hire +" << h.additionalEmployees << " " << h.roleId
                  << " (" << severityName(h.priority) << "): " << h.reason << "\n";
    }
}

// ============================================================================
// MAIN
// ============================================================================
int main()
{
    std::cout << "================================================================\n";
    std::cout << "EXAMPLE 03: INFEASIBILITY DIAGNOSIS\n";
    std::cout << "================================================================\n\n";

    try {
        const DemandForecast demand = rushes();
        const SchedulerInput strict = restaurant(true);

        // ====================================================================
        // STEP 1: CHECK BEFORE SOLVING
        // ====================================================================
        std::cout << "STEP 1: PRE-SOLVE CHECK\n";
        std::cout << "-----------------------\n";
        printInsights(generateInsights(strict, demand, nullptr));
        std::cout << "\n";

        // ====================================================================
        // STEP 2: SOLVE WITH HARD DEMAND
        // ====================================================================
        std::cout << "STEP 2: SOLVE WITH HARD DEMAND\n";
        std::cout << "------------------------------\n";
        SolveResult strictResult = solve(strict, demand, std::chrono::seconds(30));
        std::cout << "Status: " << statusName(strictResult.status)
                  << " (" << strictResult.stats.solverStatus << ")\n";
        for (const auto& c : strictResult.conflicts) {
            std::cout << "  " << std::left << std::setw(24) << c.constraintClass << std::right
                      << c.members.size() << " member(s)";
            if (!c.members.empty()) std::cout << ", e.g. " << c.members.front();
            std::cout << "\n";
        }
        std::cout << "\n";

        // ====================================================================
        // STEP 3: DIAGNOSE THE FAILED RUN
        // ====================================================================
        std::cout << "STEP 3: DIAGNOSIS\n";
        std::cout << "-----------------\n";
        printInsights(generateInsights(strict, demand, &strictResult));
        std::cout << "\n";

        // ====================================================================
        // STEP 4: RELAX TO SOFT DEMAND
        // ====================================================================
        std::cout << "STEP 4: SOLVE WITH SOFT DEMAND\n";
        std::cout << "------------------------------\n";
        const SchedulerInput relaxed = restaurant(false);
        SolveResult relaxedResult = solve(relaxed, demand, std::chrono::seconds(30));
        std::cout << describe(relaxedResult, relaxed) << "\n";

        if (relaxedResult.hasSchedule()) {
            double unmet = 0.0;
            for (const auto& [day, windows] : *relaxedResult.schedule) {
                for (const auto& sw : windows) unmet += sw.unmetItems;
            }
            std::cout << "Items left unserved: " << std::fixed << std::setprecision(1)
                      << unmet << " of " << demand.totalItems() << "\n\n";
        }

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
