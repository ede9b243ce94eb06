#pragma once
/*
===============================================================================
INSIGHTS — Management report derived from an input and a solve result
===============================================================================

OVERVIEW
--------
generateInsights() explains a schedule (or the absence of one) to the people
who staff the organisation: where demand peaks, which roles lack capacity,
who is over- or underused, what the schedule costs and whom to hire.

Always populated
    peak periods, capacity analysis, hiring recommendations

With a schedule
    employee utilisation, role demand and bottlenecks, coverage gaps,
    cost analysis, workload distribution

Without a schedule (infeasible, unknown, or no result given)
    feasibility analysis: structural shortages found by counting, plus the
    constraint classes of the solver's conflict when the result carries them

Supply is recomputed from the schedule with the integer arithmetic of
throughput.h, so the report does not depend on solver internals. All
thresholds come from InsightPolicy.

USAGE EXAMPLES
--------------
    SolveResult r = solve(input, demand, 30s);
    ManagementInsights mi = generateInsights(input, demand, &r);
    for (const auto& h : mi.hiring)
        std::cout << h.roleId << ": +" << h.additionalEmployees << "\n";

===============================================================================
*/

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <format>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "domain.h"
#include "forecast.h"
#include "grid.h"
#include "schedule.h"
#include "throughput.h"

namespace shiftopt {

enum class Severity { Info, Warning, High, Critical };

inline std::string_view severityName(Severity s) noexcept {
    switch (s) {
        case Severity::Info:     return "info";
        case Severity::Warning:  return "warning";
        case Severity::High:     return "high";
        case Severity::Critical: return "critical";
    }
    return "info";
}

enum class UtilizationStatus { Unused, Underutilized, WellUtilized, Overutilized };

inline std::string_view utilizationName(UtilizationStatus s) noexcept {
    switch (s) {
        case UtilizationStatus::Unused:        return "unused";
        case UtilizationStatus::Underutilized: return "underutilized";
        case UtilizationStatus::WellUtilized:  return "well_utilized";
        case UtilizationStatus::Overutilized:  return "overutilized";
    }
    return "unused";
}

/// @brief Time of day whose window demand reaches the peak percentile
struct PeakPeriod {
    std::string label;            ///< Window label, e.g. "12:00-13:00"
    double start = 0.0;
    double end = 0.0;
    int occurrences = 0;          ///< Peak windows with this label
    double averageDemand = 0.0;   ///< Items, over the peak windows
    double maxDemand = 0.0;
    int recommendedStaff = 0;     ///< Producers needed for maxDemand
};

struct RoleCapacity {
    std::string roleId;
    int eligibleEmployees = 0;
    double availableHours = 0.0;          ///< Horizon, capped by weekly limits
    double requiredHours = 0.0;           ///< min_present over staffed windows
    double potentialOutput = 0.0;         ///< Items, contrib factors applied
    double servableOutput = 0.0;          ///< Output inside windows with demand, capped by it
    std::optional<double> capacityRatio;  ///< Servable output / demand (producing, demand > 0)
    bool sufficient = true;
};

struct EmployeeUtilization {
    std::string employeeId;
    double hoursWorked = 0.0;
    double capacityHours = 0.0;           ///< max_hours_per_week over the horizon
    double utilizationRate = 0.0;
    double hoursDeviation = 0.0;          ///< Worked - pro-rated pref_hours
    UtilizationStatus status = UtilizationStatus::Unused;
};

struct RoleDemand {
    std::string roleId;
    int eligibleEmployees = 0;
    int workingEmployees = 0;
    double hoursWorked = 0.0;
    double itemsProduced = 0.0;           ///< Contrib factors applied
    double utilization = 0.0;             ///< Worked / available hours
    bool bottleneck = false;
};

struct HiringRecommendation {
    std::string roleId;
    int additionalEmployees = 0;
    std::string reason;
    double expectedImpactItems = 0.0;     ///< Output the hires would add
    Severity priority = Severity::High;
};

struct CoverageGap {
    std::size_t day = 0;
    std::string label;
    int employeesWorking = 0;
    double demand = 0.0;
    double supply = 0.0;
    double coverageRate = 0.0;
    Severity severity = Severity::Warning;
};

struct CostAnalysis {
    double totalWageCost = 0.0;
    std::map<std::string, double> costByRole;
    double unmetItems = 0.0;
    double opportunityCost = 0.0;         ///< unmet items * item margin
    double totalCost = 0.0;
    double costPerItemServed = 0.0;
};

struct WorkloadDistribution {
    double averageHours = 0.0;
    double maxHours = 0.0;
    double minHours = 0.0;
    double range = 0.0;
    int unused = 0;
    int underutilized = 0;
    int wellUtilized = 0;
    int overutilized = 0;
    double balanceScore = 1.0;            ///< 1 - range / max, 1 when nobody works
};

struct FeasibilityIssue {
    std::string constraintClass;          ///< Constraint family the issue maps to
    std::string detail;
    Severity severity = Severity::High;
};

struct FeasibilityAnalysis {
    std::vector<FeasibilityIssue> issues;
    std::string likelyCause;              ///< Constraint class, empty if none found
    std::string summary;
};

struct ManagementInsights {
    bool hasSolution = false;

    std::vector<PeakPeriod> peakPeriods;
    std::vector<RoleCapacity> capacity;
    std::vector<HiringRecommendation> hiring;

    std::vector<EmployeeUtilization> employeeUtilization;
    std::vector<RoleDemand> roleDemand;
    std::vector<CoverageGap> coverageGaps;
    std::optional<CostAnalysis> cost;
    std::optional<WorkloadDistribution> workload;

    std::optional<FeasibilityAnalysis> feasibility;

    const RoleCapacity* capacityOf(std::string_view roleId) const {
        for (const auto& c : capacity) {
            if (c.roleId == roleId) return &c;
        }
        return nullptr;
    }

    const HiringRecommendation* hiringFor(std::string_view roleId) const {
        for (const auto& h : hiring) {
            if (h.roleId == roleId) return &h;
        }
        return nullptr;
    }
};

namespace insights_detail {

    /// @brief Share of a role's output that reaches demand
    inline double outputFactor(const SchedulerInput& input, std::size_t role) {
        if (!input.inAnyChain(role)) return 1.0;
        double factor = 0.0;
        for (std::size_t c = 0; c < input.chains().size(); ++c) {
            for (int member : input.chainRoles(c)) {
                if (static_cast<std::size_t>(member) == role) {
                    factor += input.chains()[c].contribFactor;
                }
            }
        }
        return factor;
    }

    /// @brief Items per hour one employee in the role adds to supply
    inline double effectiveRate(const SchedulerInput& input, std::size_t role) {
        const Role& r = input.roles()[role];
        if (!r.producing) return 0.0;
        return *r.itemsPerEmployeePerHour * outputFactor(input, role);
    }

    /// @brief Counting view of the grid shared by all sections
    struct Context {
        const SchedulerInput& input;
        const DemandForecast& demand;
        TimeGrid grid;
        std::vector<std::vector<bool>> available;   // [e][w]
        std::vector<double> windowItems;            // [w]
        double totalDemand = 0.0;
        double horizonWeeks = 0.0;                  // horizon days / 7

        Context(const SchedulerInput& in, const DemandForecast& dem)
            : input(in), demand(dem), grid(buildGrid(in, dem))
        {
            const auto& emps = input.employees();
            available.assign(emps.size(), std::vector<bool>(grid.size(), false));
            for (const Window& w : grid.windows()) {
                windowItems.push_back(windowDemand(demand, w).items);
                for (std::size_t e = 0; e < emps.size(); ++e) {
                    available[e][static_cast<std::size_t>(w.index)] =
                        emps[e].availableFor(w.weekday, w.start, w.end);
                }
            }
            totalDemand = static_cast<double>(demand.totalItems());
            horizonWeeks = static_cast<double>(grid.horizonDays()) / 7.0;
        }

        bool eligible(std::size_t e, std::size_t r) const {
            return input.employees()[e].eligibleFor(input.roles()[r].id);
        }

        int eligibleAvailable(std::size_t r, int w) const {
            int n = 0;
            for (std::size_t e = 0; e < input.employees().size(); ++e) {
                if (eligible(e, r) && available[e][static_cast<std::size_t>(w)]) ++n;
            }
            return n;
        }

        int availableCount(int w) const {
            int n = 0;
            for (const auto& row : available) {
                if (row[static_cast<std::size_t>(w)]) ++n;
            }
            return n;
        }

        /// @brief Hours e can work in week k, capped by max_hours_per_week
        double weekHours(std::size_t e, std::size_t k) const {
            double h = 0.0;
            for (const Window& w : grid.windows()) {
                if (TimeGrid::weekOf(w.day) == k && available[e][static_cast<std::size_t>(w.index)]) {
                    h += w.hours();
                }
            }
            return std::min(h, input.employees()[e].maxHoursPerWeek);
        }

        double horizonHours(std::size_t e) const {
            double h = 0.0;
            for (std::size_t k = 0; k < grid.numWeeks(); ++k) h += weekHours(e, k);
            return h;
        }

        double staffedHours(std::optional<std::size_t> week = std::nullopt) const {
            double h = 0.0;
            for (const Window& w : grid.windows()) {
                if (!w.staffed) continue;
                if (week && TimeGrid::weekOf(w.day) != *week) continue;
                h += w.hours();
            }
            return h;
        }

        std::string windowName(const Window& w) const {
            return std::format("day {} ({}) {}", w.day, weekdayName(w.weekday), w.label);
        }
    };

    inline std::vector<PeakPeriod> peakPeriods(const Context& ctx) {
        std::vector<double> nonzero;
        for (double d : ctx.windowItems) {
            if (d > 0.0) nonzero.push_back(d);
        }
        if (nonzero.empty()) return {};

        std::sort(nonzero.begin(), nonzero.end());
        const double p = ctx.input.config().insights.peakPercentile;
        auto rank = static_cast<std::size_t>(std::ceil(p * static_cast<double>(nonzero.size())));
        rank = std::clamp<std::size_t>(rank, 1, nonzero.size());
        const double threshold = nonzero[rank - 1];

        double bestRate = 0.0;
        for (std::size_t r = 0; r < ctx.input.roles().size(); ++r) {
            bestRate = std::max(bestRate, effectiveRate(ctx.input, r));
        }

        std::map<std::string, PeakPeriod> byLabel;
        for (const Window& w : ctx.grid.windows()) {
            const double d = ctx.windowItems[static_cast<std::size_t>(w.index)];
            if (d <= 0.0 || d < threshold) continue;
            PeakPeriod& pp = byLabel[w.label];
            pp.label = w.label;
            pp.start = w.start;
            pp.end = w.end;
            pp.averageDemand += d;
            pp.maxDemand = std::max(pp.maxDemand, d);
            ++pp.occurrences;
            if (bestRate > 0.0) {
                pp.recommendedStaff = std::max(pp.recommendedStaff,
                    static_cast<int>(std::ceil(d / (bestRate * w.hours()) - 1e-9)));
            }
        }

        std::vector<PeakPeriod> out;
        for (auto& [label, pp] : byLabel) {
            pp.averageDemand /= pp.occurrences;
            out.push_back(std::move(pp));
        }
        std::sort(out.begin(), out.end(), [](const PeakPeriod& a, const PeakPeriod& b) {
            return a.averageDemand > b.averageDemand;
        });
        return out;
    }

    inline std::vector<RoleCapacity> capacity(const Context& ctx) {
        std::vector<RoleCapacity> out;
        const double staffed = ctx.staffedHours();
        for (std::size_t r = 0; r < ctx.input.roles().size(); ++r) {
            const Role& role = ctx.input.roles()[r];
            RoleCapacity c;
            c.roleId = role.id;
            for (std::size_t e = 0; e < ctx.input.employees().size(); ++e) {
                if (!ctx.eligible(e, r)) continue;
                ++c.eligibleEmployees;
                c.availableHours += ctx.horizonHours(e);
            }
            c.requiredHours = role.minPresent * staffed;
            const double rate = effectiveRate(ctx.input, r);
            c.potentialOutput = c.availableHours * rate;

            // Output only counts where the role's staff can meet the demand
            for (const Window& w : ctx.grid.windows()) {
                const double wanted = ctx.windowItems[static_cast<std::size_t>(w.index)];
                if (wanted <= 0.0) continue;
                const double reach = ctx.eligibleAvailable(r, w.index) * rate * w.hours();
                c.servableOutput += std::min(wanted, reach);
            }
            c.servableOutput = std::min(c.servableOutput, c.potentialOutput);
            if (role.producing && ctx.totalDemand > 0.0) {
                c.capacityRatio = c.servableOutput / ctx.totalDemand;
            }

            const bool needsStaff = role.minPresent > 0 && staffed > 0.0;
            c.sufficient = !(needsStaff && c.eligibleEmployees < role.minPresent)
                        && c.availableHours + kHourEps >= c.requiredHours
                        && (!c.capacityRatio || *c.capacityRatio >= 1.0);
            out.push_back(std::move(c));
        }
        return out;
    }

    inline std::vector<HiringRecommendation> hiring(const Context& ctx,
                                                    const std::vector<RoleCapacity>& capacity,
                                                    const std::optional<CostAnalysis>& cost)
    {
        const InsightPolicy& policy = ctx.input.config().insights;
        const double hireHours = policy.hiringReferenceHours * ctx.horizonWeeks;

        std::vector<HiringRecommendation> out;
        for (std::size_t r = 0; r < capacity.size(); ++r) {
            const RoleCapacity& c = capacity[r];
            if (c.sufficient) continue;
            const Role& role = ctx.input.roles()[r];
            const double rate = effectiveRate(ctx.input, r);

            int headGap = std::max(0, role.minPresent - c.eligibleEmployees);
            int outputGap = 0;
            if (c.capacityRatio && *c.capacityRatio < 1.0 && rate > 0.0 && hireHours > 0.0) {
                outputGap = static_cast<int>(std::ceil(
                    (ctx.totalDemand - c.servableOutput) / (rate * hireHours) - 1e-9));
            }
            int hoursGap = 0;
            if (c.requiredHours > c.availableHours && hireHours > 0.0) {
                hoursGap = static_cast<int>(std::ceil((c.requiredHours - c.availableHours) / hireHours - 1e-9));
            }

            HiringRecommendation h;
            h.roleId = role.id;
            h.additionalEmployees = std::max({ 1, headGap, outputGap, hoursGap });
            h.expectedImpactItems = h.additionalEmployees * hireHours * rate;
            if (headGap > 0) {
                h.reason = std::format("{} needs {} present but only {} employee(s) are eligible",
                                       role.id, role.minPresent, c.eligibleEmployees);
                h.priority = Severity::Critical;
            }
            else if (hoursGap >= outputGap) {
                h.reason = std::format("{} requires {:.1f}h of presence, {:.1f}h available",
                                       role.id, c.requiredHours, c.availableHours);
            }
            else {
                h.reason = std::format("{} can serve {:.1f} of {:.1f} demanded items",
                                       role.id, c.servableOutput, ctx.totalDemand);
            }
            out.push_back(std::move(h));
        }

        // Unserved demand in a schedule: hire for the most productive role
        if (cost && cost->unmetItems > 0.0 && hireHours > 0.0) {
            std::optional<std::size_t> best;
            for (std::size_t r = 0; r < ctx.input.roles().size(); ++r) {
                const double rate = effectiveRate(ctx.input, r);
                if (rate > 0.0 && (!best || rate > effectiveRate(ctx.input, *best))) best = r;
            }
            if (best) {
                const Role& role = ctx.input.roles()[*best];
                const bool listed = std::any_of(out.begin(), out.end(),
                    [&](const HiringRecommendation& h) { return h.roleId == role.id; });
                if (!listed) {
                    const double rate = effectiveRate(ctx.input, *best);
                    HiringRecommendation h;
                    h.roleId = role.id;
                    h.additionalEmployees = std::max(1, static_cast<int>(
                        std::ceil(cost->unmetItems / (rate * hireHours) - 1e-9)));
                    h.expectedImpactItems = h.additionalEmployees * hireHours * rate;
                    h.reason = std::format("{:.1f} items of demand left unserved", cost->unmetItems);
                    h.priority = Severity::Warning;
                    out.push_back(std::move(h));
                }
            }
        }

        std::sort(out.begin(), out.end(), [](const HiringRecommendation& a,
                                              const HiringRecommendation& b) {
            if (a.priority != b.priority) return a.priority > b.priority;
            return a.additionalEmployees > b.additionalEmployees;
        });
        return out;
    }

    inline UtilizationStatus classify(double rate, const InsightPolicy& policy) {
        if (rate <= 0.0) return UtilizationStatus::Unused;
        if (rate < policy.underutilized) return UtilizationStatus::Underutilized;
        if (rate > policy.overutilized) return UtilizationStatus::Overutilized;
        return UtilizationStatus::WellUtilized;
    }

    inline void scheduleSections(const Context& ctx, const SolveResult& result,
                                 const std::vector<RoleCapacity>& capacity,
                                 ManagementInsights& out)
    {
        const InsightPolicy& policy = ctx.input.config().insights;
        const auto& emps = ctx.input.employees();
        const auto& roles = ctx.input.roles();
        const Schedule& schedule = *result.schedule;

        // Employee utilisation
        std::map<std::string, double> hoursOf;
        for (const auto& s : result.employees) hoursOf[s.employeeId] = s.assignedHours;
        for (const auto& emp : emps) {
            EmployeeUtilization u;
            u.employeeId = emp.id;
            u.hoursWorked = hoursOf.contains(emp.id) ? hoursOf[emp.id] : assignedHours(schedule, emp.id);
            u.capacityHours = emp.maxHoursPerWeek * ctx.horizonWeeks;
            u.utilizationRate = u.capacityHours > 0.0 ? u.hoursWorked / u.capacityHours : 0.0;
            u.hoursDeviation = u.hoursWorked - emp.prefHours * ctx.horizonWeeks;
            u.status = classify(u.utilizationRate, policy);
            out.employeeUtilization.push_back(std::move(u));
        }
        std::sort(out.employeeUtilization.begin(), out.employeeUtilization.end(),
                  [](const EmployeeUtilization& a, const EmployeeUtilization& b) {
                      return a.utilizationRate > b.utilizationRate;
                  });

        // Coverage gaps
        for (const auto& [day, windows] : schedule) {
            for (const auto& sw : windows) {
                if (sw.demandItems <= 0.0) continue;
                const double rate = std::min(sw.supplyItems, sw.demandItems) / sw.demandItems;
                if (rate >= policy.coverageGap) continue;
                CoverageGap g;
                g.day = day;
                g.label = sw.window.label;
                g.employeesWorking = static_cast<int>(sw.assignments.size());
                g.demand = sw.demandItems;
                g.supply = sw.supplyItems;
                g.coverageRate = rate;
                g.severity = rate < policy.criticalGap ? Severity::Critical : Severity::Warning;
                out.coverageGaps.push_back(std::move(g));
            }
        }
        std::sort(out.coverageGaps.begin(), out.coverageGaps.end(),
                  [](const CoverageGap& a, const CoverageGap& b) {
                      return a.coverageRate < b.coverageRate;
                  });

        // Role demand and bottlenecks
        for (std::size_t r = 0; r < roles.size(); ++r) {
            RoleDemand d;
            d.roleId = roles[r].id;
            d.eligibleEmployees = capacity[r].eligibleEmployees;
            std::set<std::string> working;
            for (const auto& [day, windows] : schedule) {
                for (const auto& sw : windows) {
                    for (const auto& a : sw.assignments) {
                        if (a.roleId != roles[r].id) continue;
                        working.insert(a.employeeId);
                        d.hoursWorked += sw.window.hours();
                        d.itemsProduced += static_cast<double>(centiRate(roles[r], sw.window.hours()))
                                         / 100.0 * outputFactor(ctx.input, r);
                    }
                }
            }
            d.workingEmployees = static_cast<int>(working.size());
            d.utilization = capacity[r].availableHours > 0.0
                          ? d.hoursWorked / capacity[r].availableHours : 0.0;
            // a gap belongs to the role when its staff could have worked that window
            bool roleHasGap = false;
            for (const auto& [day, windows] : schedule) {
                for (const auto& sw : windows) {
                    if (sw.demandItems <= 0.0) continue;
                    if (std::min(sw.supplyItems, sw.demandItems) / sw.demandItems >= policy.coverageGap) continue;
                    const int w = sw.window.index;
                    if (w >= 0 && static_cast<std::size_t>(w) < ctx.grid.size()
                        && ctx.eligibleAvailable(r, w) > 0) {
                        roleHasGap = true;
                    }
                }
            }
            d.bottleneck = roles[r].producing
                        && d.utilization >= policy.bottleneckUtilization
                        && roleHasGap;
            out.roleDemand.push_back(std::move(d));
        }

        // Cost
        CostAnalysis cost;
        double served = 0.0;
        for (const auto& [day, windows] : schedule) {
            for (const auto& sw : windows) {
                cost.unmetItems += sw.unmetItems;
                served += sw.demandItems - sw.unmetItems;
                for (const auto& a : sw.assignments) {
                    auto e = ctx.input.employeeIndex(a.employeeId);
                    if (!e) continue;
                    const double c = emps[*e].hourlyWage * sw.window.hours();
                    cost.costByRole[a.roleId] += c;
                    cost.totalWageCost += c;
                }
            }
        }
        cost.opportunityCost = cost.unmetItems * policy.itemMargin;
        cost.totalCost = cost.totalWageCost + cost.opportunityCost;
        cost.costPerItemServed = served > 0.0 ? cost.totalWageCost / served : 0.0;
        out.cost = cost;

        // Workload
        WorkloadDistribution wl;
        if (!out.employeeUtilization.empty()) {
            wl.maxHours = out.employeeUtilization.front().hoursWorked;
            wl.minHours = wl.maxHours;
            double total = 0.0;
            for (const auto& u : out.employeeUtilization) {
                total += u.hoursWorked;
                wl.maxHours = std::max(wl.maxHours, u.hoursWorked);
                wl.minHours = std::min(wl.minHours, u.hoursWorked);
                switch (u.status) {
                    case UtilizationStatus::Unused:        ++wl.unused; break;
                    case UtilizationStatus::Underutilized: ++wl.underutilized; break;
                    case UtilizationStatus::WellUtilized:  ++wl.wellUtilized; break;
                    case UtilizationStatus::Overutilized:  ++wl.overutilized; break;
                }
            }
            wl.averageHours = total / static_cast<double>(out.employeeUtilization.size());
            wl.range = wl.maxHours - wl.minHours;
            wl.balanceScore = wl.maxHours > 0.0 ? 1.0 - wl.range / wl.maxHours : 1.0;
        }
        out.workload = wl;
    }

    inline FeasibilityAnalysis feasibility(const Context& ctx, const SolveResult* result) {
        FeasibilityAnalysis fa;
        const auto& roles = ctx.input.roles();
        const auto& emps = ctx.input.employees();
        const SchedulerConfig& cfg = ctx.input.config();

        // Staffed windows without enough eligible, available people
        for (std::size_t r = 0; r < roles.size(); ++r) {
            const Role& role = roles[r];
            if (role.minPresent <= 0) continue;
            int shortWindows = 0;
            const Window* first = nullptr;
            int firstAvail = 0;
            for (const Window& w : ctx.grid.windows()) {
                if (!w.staffed) continue;
                const int avail = ctx.eligibleAvailable(r, w.index);
                if (avail >= role.minPresent) continue;
                if (!first) {
                    first = &w;
                    firstAvail = avail;
                }
                ++shortWindows;
            }
            if (first) {
                fa.issues.push_back({ "coverage",
                    std::format("{} needs {} present in {} staffed window(s); {} has {} available",
                                role.id, role.minPresent, shortWindows,
                                ctx.windowName(*first), firstAvail),
                    Severity::Critical });
            }
        }

        // Dependent roles that would be alone
        for (std::size_t r = 0; r < roles.size(); ++r) {
            const Role& role = roles[r];
            if (role.isIndependent || role.minPresent <= 0) continue;
            int lonely = 0;
            for (const Window& w : ctx.grid.windows()) {
                if (!w.staffed) continue;
                if (ctx.availableCount(w.index) <= role.minPresent) ++lonely;
            }
            if (lonely > 0) {
                fa.issues.push_back({ "co_presence",
                    std::format("{} cannot work alone but {} staffed window(s) lack a second role",
                                role.id, lonely),
                    Severity::High });
            }
        }

        // Hard demand beyond what everyone available could produce
        if (cfg.meetAllDemand) {
            int impossible = 0;
            double worstShort = 0.0;
            for (const Window& w : ctx.grid.windows()) {
                const double wanted = ctx.windowItems[static_cast<std::size_t>(w.index)];
                if (wanted <= 0.0) continue;
                double best = 0.0;
                for (std::size_t e = 0; e < emps.size(); ++e) {
                    if (ctx.available[e][static_cast<std::size_t>(w.index)]) {
                        best += employeeItemCapacity(ctx.input, e, w.hours());
                    }
                }
                if (best + 1e-9 < wanted) {
                    ++impossible;
                    worstShort = std::max(worstShort, wanted - best);
                }
            }
            if (impossible > 0) {
                fa.issues.push_back({ "demand",
                    std::format("demand exceeds the output of all available staff in {} window(s), "
                                "worst shortfall {:.1f} items", impossible, worstShort),
                    Severity::Critical });
            }
        }

        // Presence hours beyond the weekly limits of eligible staff
        for (std::size_t r = 0; r < roles.size(); ++r) {
            const Role& role = roles[r];
            if (role.minPresent <= 0) continue;
            for (std::size_t k = 0; k < ctx.grid.numWeeks(); ++k) {
                const double required = role.minPresent * ctx.staffedHours(k);
                double offered = 0.0;
                for (std::size_t e = 0; e < emps.size(); ++e) {
                    if (ctx.eligible(e, r)) offered += ctx.weekHours(e, k);
                }
                if (offered + kHourEps < required) {
                    fa.issues.push_back({ "weekly_hours",
                        std::format("{} needs {:.1f}h in week {} but eligible staff offer {:.1f}h",
                                    role.id, required, k, offered),
                        Severity::High });
                }
            }
        }

        // The solver's own conflict
        std::string largestConflict;
        std::size_t largestSize = 0;
        if (result) {
            for (const auto& c : result->conflicts) {
                fa.issues.push_back({ c.constraintClass,
                    std::format("{} member(s) in the solver's conflict", c.members.size()),
                    Severity::High });
                if (c.constraintClass.starts_with("bound:")) continue;
                if (c.members.size() > largestSize) {
                    largestSize = c.members.size();
                    largestConflict = c.constraintClass;
                }
            }
        }

        auto critical = std::find_if(fa.issues.begin(), fa.issues.end(),
                                     [](const FeasibilityIssue& i) { return i.severity == Severity::Critical; });
        if (critical != fa.issues.end()) {
            fa.likelyCause = critical->constraintClass;
        }
        else if (!largestConflict.empty()) {
            fa.likelyCause = largestConflict;
        }
        else if (!fa.issues.empty()) {
            fa.likelyCause = fa.issues.front().constraintClass;
        }

        if (fa.likelyCause.empty()) {
            const bool unknown = result && result->status == SolveStatus::Unknown;
            fa.summary = unknown
                ? "no schedule within the budget; no structural shortage detected"
                : "no schedule; no structural shortage detected";
        }
        else {
            fa.summary = std::format("no schedule: likely cause is {} ({} issue(s) found)",
                                     fa.likelyCause, fa.issues.size());
        }
        return fa;
    }

} // namespace insights_detail

/**
 * @brief Build the management report
 * @param result Solve result, or nullptr when no solve was run
 * @throws ConfigError for an invalid forecast or grid
 */
inline ManagementInsights generateInsights(const SchedulerInput& input, const DemandForecast& demand,
                                           const SolveResult* result = nullptr)
{
    insights_detail::Context ctx(input, demand);

    ManagementInsights out;
    out.hasSolution = result && result->hasSchedule();
    out.peakPeriods = insights_detail::peakPeriods(ctx);
    out.capacity = insights_detail::capacity(ctx);

    if (out.hasSolution) {
        insights_detail::scheduleSections(ctx, *result, out.capacity, out);
    }
    else {
        out.feasibility = insights_detail::feasibility(ctx, result);
    }

    out.hiring = insights_detail::hiring(ctx, out.capacity, out.cost);
    return out;
}

} // namespace shiftopt
