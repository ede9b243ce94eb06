#pragma once
/*
===============================================================================
REPORT — Plain-text rendering of results and insights
===============================================================================

    std::cout << describe(result, input) << "\n";
    std::cout << describe(insights) << "\n";

describe(result, input) lists the status and objective, per-employee hours,
the first days of the schedule and the unserved demand. describe(insights)
summarises every populated section of a ManagementInsights.

===============================================================================
*/

#include <cstddef>
#include <format>
#include <string>

#include "domain.h"
#include "enum_utils.h"
#include "insights.h"
#include "schedule.h"

namespace shiftopt {

inline constexpr std::size_t kReportDays = 3;

namespace report_detail {

    inline void rule(std::string& out) {
        out += std::string(60, '=') + "\n";
    }

    inline void line(std::string& out, const std::string& text) {
        out += text;
        out += "\n";
    }

} // namespace report_detail

/**
 * @brief Human-readable description of a solve result
 * @param days Number of horizon days whose windows are listed
 */
inline std::string describe(const SolveResult& result, const SchedulerInput& input,
                            std::size_t days = kReportDays)
{
    using report_detail::line;
    std::string out;

    report_detail::rule(out);
    if (!result.hasSchedule()) {
        line(out, std::format("NO SCHEDULE ({})", statusName(result.status)));
        report_detail::rule(out);
        line(out, std::format("Solver status: {}, {:.2f}s", result.stats.solverStatus,
                              result.stats.runtimeSeconds));
        for (const auto& c : result.conflicts) {
            line(out, std::format("  conflict: {} ({} member(s))", c.constraintClass, c.members.size()));
        }
        return out;
    }

    line(out, "SCHEDULE FOUND");
    report_detail::rule(out);
    line(out, std::format("Status: {} ({})", statusName(result.status), result.stats.solverStatus));
    if (result.objectiveValue) {
        line(out, std::format("Objective: {:.2f}", *result.objectiveValue));
    }
    line(out, std::format("Model: {}, {:.2f}s, gap {:.2f}%",
                          modelSummary(result.stats.model), result.stats.runtimeSeconds,
                          result.stats.mipGap * 100.0));
    line(out, std::format("Input: {} role(s), {} employee(s), {} chain(s), {} window(s)",
                          input.roles().size(), input.employees().size(),
                          input.chains().size(), result.stats.numWindows));

    line(out, "\n--- Employees ---");
    for (const auto& s : result.employees) {
        line(out, std::format("{}: {:.1f}h worked (target {:.1f}h, dev {:+.1f}h, "
                              "off-preference {:.1f}h, cost {:.2f})",
                              s.employeeId, s.assignedHours, s.targetHours, s.hoursDeviation,
                              s.offPreferenceHours, s.wageCost));
    }

    line(out, std::format("\n--- Schedule (first {} day(s)) ---", days));
    for (const auto& [day, windows] : *result.schedule) {
        if (day >= days) break;
        for (const auto& sw : windows) {
            std::string staff;
            for (const auto& a : sw.assignments) {
                if (!staff.empty()) staff += ", ";
                staff += a.employeeId + " -> " + a.roleId;
            }
            line(out, std::format("  Day {} {} {}: {}", day, weekdayName(sw.window.weekday),
                                  sw.window.label, staff.empty() ? "(nobody)" : staff));
        }
    }

    bool anyUnmet = false;
    for (const auto& [day, windows] : *result.schedule) {
        for (const auto& sw : windows) {
            if (sw.unmetItems <= 0.0) continue;
            if (!anyUnmet) line(out, "\n--- Unmet Demand ---");
            anyUnmet = true;
            line(out, std::format("  Day {} {}: {:.1f} of {:.1f} items",
                                  day, sw.window.label, sw.unmetItems, sw.demandItems));
        }
    }
    if (!anyUnmet) {
        line(out, "\n--- All demand satisfied ---");
    }
    return out;
}

/// @brief Human-readable summary of a management report
inline std::string describe(const ManagementInsights& mi)
{
    using report_detail::line;
    std::string out;

    report_detail::rule(out);
    line(out, mi.hasSolution ? "MANAGEMENT INSIGHTS" : "MANAGEMENT INSIGHTS (no schedule)");
    report_detail::rule(out);

    if (!mi.peakPeriods.empty()) {
        line(out, "--- Peak periods ---");
        for (const auto& p : mi.peakPeriods) {
            line(out, std::format("  {}: avg {:.1f}, max {:.1f} items over {} day(s), staff {}",
                                  p.label, p.averageDemand, p.maxDemand, p.occurrences,
                                  p.recommendedStaff));
        }
    }

    line(out, "--- Capacity ---");
    for (const auto& c : mi.capacity) {
        std::string ratio = c.capacityRatio ? std::format("{:.2f}", *c.capacityRatio) : "n/a";
        line(out, std::format("  {}: {} eligible, {:.1f}h available, {:.1f}h required, "
                              "ratio {} {}", c.roleId, c.eligibleEmployees, c.availableHours,
                              c.requiredHours, ratio, c.sufficient ? "ok" : "INSUFFICIENT"));
    }

    if (!mi.employeeUtilization.empty()) {
        line(out, "--- Utilisation ---");
        for (const auto& u : mi.employeeUtilization) {
            line(out, std::format("  {}: {:.1f}h of {:.1f}h ({:.0f}%) {}", u.employeeId,
                                  u.hoursWorked, u.capacityHours, u.utilizationRate * 100.0,
                                  utilizationName(u.status)));
        }
    }

    for (const auto& d : mi.roleDemand) {
        if (d.bottleneck) {
            line(out, std::format("  bottleneck: {} at {:.0f}% of available hours",
                                  d.roleId, d.utilization * 100.0));
        }
    }

    if (!mi.coverageGaps.empty()) {
        line(out, std::format("--- Coverage gaps ({}) ---", mi.coverageGaps.size()));
        for (const auto& g : mi.coverageGaps) {
            line(out, std::format("  day {} {}: {:.0f}% of {:.1f} items [{}]", g.day, g.label,
                                  g.coverageRate * 100.0, g.demand, severityName(g.severity)));
        }
    }

    if (mi.cost) {
        line(out, std::format("--- Cost --- wages {:.2f}, unmet {:.1f} items ({:.2f}), "
                              "total {:.2f}, per item {:.2f}",
                              mi.cost->totalWageCost, mi.cost->unmetItems, mi.cost->opportunityCost,
                              mi.cost->totalCost, mi.cost->costPerItemServed));
    }

    if (mi.workload) {
        line(out, std::format("--- Workload --- avg {:.1f}h, range {:.1f}h, balance {:.2f}",
                              mi.workload->averageHours, mi.workload->range,
                              mi.workload->balanceScore));
    }

    if (mi.feasibility) {
        line(out, "--- Feasibility ---");
        line(out, "  " + mi.feasibility->summary);
        for (const auto& i : mi.feasibility->issues) {
            line(out, std::format("  [{}] {}: {}", severityName(i.severity), i.constraintClass,
                                  i.detail));
        }
    }

    if (!mi.hiring.empty()) {
        line(out, "--- Hiring ---");
        for (const auto& h : mi.hiring) {
            line(out, std::format("  +{} {} [{}]: {}", h.additionalEmployees, h.roleId,
                                  severityName(h.priority), h.reason));
        }
    }
    return out;
}

} // namespace shiftopt
