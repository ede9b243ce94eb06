/*
================================================================================
EXAMPLE 04: PARALLEL SESSIONS - Three Branches, One Deadline
================================================================================
DIFFICULTY: Advanced
PROBLEM TYPE: Mixed Integer Programming (MIP), concurrent solves

PROBLEM DESCRIPTION
-------------------
A bakery chain plans next week for three branches at once. Each branch is
an independent scheduling problem, so each runs in its own thread with
its own Gurobi environment. A head-office deadline stops every search
still running: the shared CancellationToken is raised and each session
returns the best roster found so far (Feasible) or none (Unknown).

Every session forwards its solver log to its own sink, so the output of
the three searches does not interleave.

SHIFTOPT FEATURES DEMONSTRATED
------------------------------
- solve() from several threads    Sessions share no solver state
- CancellationToken               One flag observed by every callback
- LogOptions::sink                Per-session capture of the Gurobi log
- SolveOptions::threads           Split the cores between sessions
- SolvePreset::FirstFeasible      Fast roster for the smallest branch

================================================================================
*/

#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <shiftopt/shiftopt.h>

using namespace shiftopt;

// ============================================================================
// INPUT
// ============================================================================
struct Branch {
    std::string name;
    int bakers;
    int sellers;
    long long dailyItems;
    std::optional<SolvePreset> preset;
};

static SchedulerInput branchInput(const Branch& b)
{
    std::vector<Role> roles = {
        Role{ .id = "baker", .producing = true, .itemsPerEmployeePerHour = 30.0, .minPresent = 1 },
        Role{ .id = "seller", .minPresent = 1, .isIndependent = false },
    };

    std::vector<Employee> staff;
    for (int i = 0; i < b.bakers; ++i) {
        Employee e;
        e.id = b.name + "-baker" + std::to_string(i + 1);
        e.roles = { "baker" };
        e.availableHours = everyDay({ 4.0, 16.0 });
        e.hourlyWage = 18.0;
        staff.push_back(e);
    }
    for (int i = 0; i < b.sellers; ++i) {
        Employee e;
        e.id = b.name + "-seller" + std::to_string(i + 1);
        e.roles = { "seller", "baker" };
        e.availableHours = everyDay({ 6.0, 20.0 });
        e.hourlyWage = 13.0;
        e.prefHours = 24.0;
        staff.push_back(e);
    }

    SchedulerConfig cfg;
    cfg.minShiftLengthSlots = 4;
    cfg.operatingHours = everyDay({ 7.0, 15.0 });
    return SchedulerInput(roles, staff, {}, cfg);
}

static DemandForecast branchDemand(const Branch& b)
{
    auto demand = DemandForecast::zero(7, Weekday::Monday);
    for (std::size_t d = 0; d < 7; ++d) {
        for (int h = 7; h < 15; ++h) {
            // morning bread run, then a flat afternoon
            const long long items = h < 10 ? b.dailyItems / 5 : b.dailyItems / 25;
            demand.at(d, h) = { items / 4, items };
        }
    }
    return demand;
}

struct BranchOutcome {
    SolveResult result;
    std::size_t logLines = 0;
    std::string error;
};

// ============================================================================
// MAIN
// ============================================================================
int main()
{
    std::cout << "================================================================\n";
    std::cout << "EXAMPLE 04: PARALLEL SESSIONS\n";
    std::cout << "================================================================\n\n";

    try {
        const std::vector<Branch> branches = {
            { "north", 3, 4, 300, SolvePreset::Interactive },
            { "south", 4, 5, 450, std::nullopt },
            { "kiosk", 2, 2, 120, SolvePreset::FirstFeasible },
        };

        CancellationToken deadline;
        std::vector<BranchOutcome> outcomes(branches.size());
        std::mutex consoleMutex;

        // ====================================================================
        // LAUNCH
        // ====================================================================
        std::vector<std::thread> workers;
        for (std::size_t i = 0; i < branches.size(); ++i) {
            workers.emplace_back([&, i] {
                const Branch& b = branches[i];
                BranchOutcome& out = outcomes[i];
                try {
                    const SchedulerInput input = branchInput(b);
                    const DemandForecast demand = branchDemand(b);

                    SolveOptions opts;
                    opts.preset = b.preset;
                    opts.threads = 2;
                    opts.cancel = deadline;
                    opts.log.sink = [&out](const std::string&) { ++out.logLines; };

                    out.result = solve(input, demand, std::chrono::seconds(60), opts);
                } catch (GRBException& e) {
                    out.error = "Gurobi Error " + std::to_string(e.getErrorCode()) + ": " + e.getMessage();
                } catch (std::exception& e) {
                    out.error = e.what();
                }

                std::lock_guard<std::mutex> lock(consoleMutex);
                std::cout << "  " << b.name << " finished\n";
            });
        }

        // head office deadline
        std::this_thread::sleep_for(std::chrono::seconds(5));
        {
            std::lock_guard<std::mutex> lock(consoleMutex);
            std::cout << "  deadline reached, cancelling remaining searches\n";
        }
        deadline.cancel();

        for (auto& t : workers) t.join();
        std::cout << "\n";

        // ====================================================================
        // RESULTS
        // ====================================================================
        std::cout << std::left << std::setw(8) << "Branch" << std::setw(12) << "Status"
                  << std::setw(14) << "Solver" << std::right << std::setw(12) << "Objective"
                  << std::setw(10) << "Runtime" << std::setw(8) << "Log" << "\n";
        std::cout << std::string(64, '-') << "\n";

        for (std::size_t i = 0; i < branches.size(); ++i) {
            const BranchOutcome& out = outcomes[i];
            std::cout << std::left << std::setw(8) << branches[i].name;
            if (!out.error.empty()) {
                std::cout << "error: " << out.error << "\n";
                continue;
            }
            const SolveResult& r = out.result;
            std::cout << std::setw(12) << statusName(r.status)
                      << std::setw(14) << r.stats.solverStatus << std::right
                      << std::fixed << std::setprecision(2) << std::setw(12)
                      << (r.objectiveValue ? *r.objectiveValue : 0.0)
                      << std::setprecision(1) << std::setw(9) << r.stats.runtimeSeconds << "s"
                      << std::setw(8) << out.logLines << "\n";
        }
        std::cout << "\n";

        for (std::size_t i = 0; i < branches.size(); ++i) {
            const SolveResult& r = outcomes[i].result;
            if (!r.hasSchedule()) continue;
            double hours = 0.0;
            for (const auto& s : r.employees) hours += s.assignedHours;
            std::cout << branches[i].name << ": " << r.employees.size() << " employee(s), "
                      << std::fixed << std::setprecision(1) << hours << " hours rostered\n";
        }
        std::cout << "\n";

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
