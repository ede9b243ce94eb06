#pragma once
/*
===============================================================================
SCHEDULE — Result types returned by a solve
===============================================================================

OVERVIEW
--------
A SolveResult carries the outcome status, the schedule when one exists,
per-employee summaries, solve statistics and, for infeasible models, the
constraint families of the irreducible conflict.

The Schedule maps a horizon day to its windows in time order. A window is
listed when someone works in it or when it has forecast demand, so a
degenerate input (no employees, no demand) yields an empty map.

===============================================================================
*/

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "data_store.h"
#include "diagnostics.h"
#include "grid.h"

namespace shiftopt {

enum class SolveStatus {
    Optimal,      ///< Proven optimal
    Feasible,     ///< A solution exists, optimality not proven
    Infeasible,   ///< Proven that no schedule satisfies the hard constraints
    Unknown       ///< No solution and no proof (budget, cancellation)
};

inline std::string_view statusName(SolveStatus s) noexcept {
    switch (s) {
        case SolveStatus::Optimal:    return "optimal";
        case SolveStatus::Feasible:   return "feasible";
        case SolveStatus::Infeasible: return "infeasible";
        case SolveStatus::Unknown:    return "unknown";
    }
    return "unknown";
}

struct ShiftAssignment {
    std::string employeeId;
    std::string roleId;
};

struct ScheduledWindow {
    Window window;
    std::vector<ShiftAssignment> assignments;
    double demandItems = 0.0;
    double supplyItems = 0.0;    ///< Realised output of the assigned staff
    double unmetItems = 0.0;     ///< Shortfall absorbed by the demand slack

    /// @brief Number of people working the given role in this window
    int headcount(std::string_view roleId) const {
        int n = 0;
        for (const auto& a : assignments) {
            if (a.roleId == roleId) ++n;
        }
        return n;
    }

    bool works(std::string_view employeeId) const {
        for (const auto& a : assignments) {
            if (a.employeeId == employeeId) return true;
        }
        return false;
    }
};

/// @brief Horizon day -> windows of that day in time order
using Schedule = std::map<std::size_t, std::vector<ScheduledWindow>>;

/// @brief Per-employee figures of a solved schedule
struct EmployeeSummary {
    std::string employeeId;
    double assignedHours = 0.0;
    double targetHours = 0.0;           ///< pref_hours pro-rated to the horizon
    double hoursDeviation = 0.0;        ///< assigned - target
    double offPreferenceHours = 0.0;
    double wageCost = 0.0;
};

/// @brief Constraints of one family that take part in the IIS
struct ConflictEntry {
    std::string constraintClass;
    std::vector<std::string> members;
};

struct SolveStats {
    std::string solverStatus;        ///< Gurobi status name, "NOT_RUN" if skipped
    double runtimeSeconds = 0.0;
    double mipGap = 0.0;
    double nodeCount = 0.0;
    int solutionCount = 0;
    std::size_t numWindows = 0;
    ModelStatistics model;
    DataStore parameters;            ///< "param:*" and "stats:*" entries
};

struct SolveResult {
    SolveStatus status = SolveStatus::Unknown;
    std::optional<Schedule> schedule;
    std::optional<double> objectiveValue;
    std::vector<EmployeeSummary> employees;
    SolveStats stats;
    std::vector<ConflictEntry> conflicts;   ///< Filled for Infeasible when requested

    bool hasSchedule() const noexcept { return schedule.has_value(); }
};

/// @brief Hours an employee works over the whole schedule
inline double assignedHours(const Schedule& schedule, std::string_view employeeId) {
    double h = 0.0;
    for (const auto& [day, windows] : schedule) {
        for (const auto& sw : windows) {
            if (sw.works(employeeId)) h += sw.window.hours();
        }
    }
    return h;
}

} // namespace shiftopt
