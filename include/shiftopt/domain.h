#pragma once
/*
===============================================================================
DOMAIN — Roles, employees, production chains and scheduler configuration
===============================================================================

OVERVIEW
--------
Plain value types describing one organisation's scheduling problem, and
SchedulerInput, the validated aggregate handed to the solver. Validation
happens once, in the SchedulerInput constructor; afterwards the input is
immutable and can be shared by any number of sessions.

Per-weekday data (availability, preferences, opening hours) is kept in
std::array<std::optional<HourInterval>, Weekday_COUNT>: a weekday is an
available (preferred, open) day exactly when its interval is present.

KEY COMPONENTS
--------------
• HourInterval      — [start, end) in hours of the day
• Role              — staffing requirement and throughput of one role
• Employee          — eligibility, availability, wage and work limits
• ProductionChain   — roles jointly producing output, with a contrib factor
• ShiftDefinition   — named window used in fixed-shift mode
• ObjectiveWeights  — weights of the soft objective terms
• InsightPolicy     — thresholds used by the insights generator
• SchedulerConfig   — grid, rest and demand rules
• SchedulerInput    — validated, immutable aggregate

USAGE EXAMPLES
--------------
    Role chef{ .id = "chef", .producing = true,
               .itemsPerEmployeePerHour = 12.0, .minPresent = 1 };

    Employee ana{ .id = "ana", .roles = {"chef"}, .hourlyWage = 18.0 };
    ana.availableHours[enum_index(Weekday::Monday)] = HourInterval{8, 20};

    SchedulerInput input({chef}, {ana}, {}, SchedulerConfig{});

EXCEPTION SAFETY
----------------
• SchedulerInput's constructor throws ConfigError naming the first offence

===============================================================================
*/

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "enum_utils.h"
#include "error.h"

namespace shiftopt {

/// @brief Tolerance used for all hour comparisons
inline constexpr double kHourEps = 1e-9;

// ============================================================================
// HOUR INTERVAL
// ============================================================================
struct HourInterval {
    double start = 0.0;   ///< Inclusive, hours since midnight
    double end = 24.0;    ///< Exclusive, at most 24

    double hours() const noexcept { return end - start; }

    bool valid() const noexcept {
        return start >= 0.0 && end <= 24.0 + kHourEps && start < end;
    }

    /// @brief True if [s, e) lies inside this interval
    bool covers(double s, double e) const noexcept {
        return start <= s + kHourEps && e <= end + kHourEps;
    }

    bool covers(const HourInterval& other) const noexcept {
        return covers(other.start, other.end);
    }

    /// @brief Length of the intersection with [s, e)
    double overlap(double s, double e) const noexcept {
        double lo = std::max(start, s);
        double hi = std::min(end, e);
        return hi > lo ? hi - lo : 0.0;
    }
};

using WeeklyIntervals = std::array<std::optional<HourInterval>, Weekday_COUNT>;

/// @brief Same interval on every weekday
inline WeeklyIntervals everyDay(HourInterval interval) {
    WeeklyIntervals out;
    out.fill(interval);
    return out;
}

// ============================================================================
// ROLE / EMPLOYEE / CHAIN
// ============================================================================

/**
 * @brief A staffable role
 *
 * @details minPresent is the headcount required whenever the role is staffed
 *          at all; in staffed windows (see SchedulerConfig::operatingHours)
 *          every role with minPresent > 0 must be present.
 */
struct Role {
    std::string id;
    bool producing = false;                          ///< Contributes item throughput
    std::optional<double> itemsPerEmployeePerHour;   ///< Required iff producing
    int minPresent = 0;
    bool isIndependent = true;                       ///< May work without another role present
};

struct Employee {
    std::string id;
    std::set<std::string> roles;        ///< Eligible role ids, non-empty
    WeeklyIntervals availableHours{};   ///< Present interval == available weekday
    WeeklyIntervals preferredHours{};   ///< Present interval == preferred weekday
    double hourlyWage = 1.0;
    double maxHoursPerWeek = 40.0;
    int maxConsecSlots = 8;
    double prefHours = 32.0;            ///< Weekly target, objective only

    bool availableOn(Weekday d) const noexcept {
        return availableHours[enum_index(d)].has_value();
    }

    /// @brief True if the employee is available for the whole of [s, e) on d
    bool availableFor(Weekday d, double s, double e) const noexcept {
        const auto& a = availableHours[enum_index(d)];
        return a && a->covers(s, e);
    }

    bool hasPreferences() const noexcept {
        for (const auto& p : preferredHours) {
            if (p) return true;
        }
        return false;
    }

    /**
     * @brief Hours of [s, e) on d that fall outside the preferred hours
     * @return 0 for employees without any preference
     */
    double offPreferenceHours(Weekday d, double s, double e) const noexcept {
        if (!hasPreferences()) {
            return 0.0;
        }
        const auto& p = preferredHours[enum_index(d)];
        if (!p) {
            return e - s;
        }
        return (e - s) - p->overlap(s, e);
    }

    bool eligibleFor(const std::string& roleId) const {
        return roles.contains(roleId);
    }
};

struct ProductionChain {
    std::string id;
    std::vector<std::string> roleIds;   ///< Ordered, non-empty
    double contribFactor = 1.0;         ///< In (0, 1]
};

/// @brief Named shift window for fixed-shift mode
struct ShiftDefinition {
    std::string name;
    HourInterval hours;
};

// ============================================================================
// POLICIES
// ============================================================================

/**
 * @brief Weights of the objective terms
 *
 * @details All terms are in currency-like units. Wage cost is
 *          hourlyWage * hours * wage. Defaults keep wage cost dominant while
 *          letting preferences break ties.
 */
struct ObjectiveWeights {
    double wage = 1.0;             ///< Multiplier on wage cost
    double preference = 0.5;       ///< Per assigned hour outside preferred hours
    double hoursDeviation = 0.25;  ///< Per hour of |assigned - pref_hours| per week
    double unmetDemand = 50.0;     ///< Per unserved item (soft demand only)
    double fairness = 0.05;        ///< Per hour of (max - min) assigned hours
};

/// @brief Thresholds of the insights report
struct InsightPolicy {
    double peakPercentile = 0.9;         ///< Window demand quantile marking a peak
    double underutilized = 0.5;          ///< Utilisation below this is under
    double overutilized = 0.9;           ///< Utilisation above this is over
    double bottleneckUtilization = 0.85; ///< Role utilisation counted as saturated
    double coverageGap = 0.8;            ///< Served / demand below this is a gap
    double criticalGap = 0.5;            ///< Served / demand below this is critical
    double itemMargin = 10.0;            ///< Margin lost per unserved item
    double hiringReferenceHours = 40.0;  ///< Weekly hours of one new hire
};

// ============================================================================
// CONFIG
// ============================================================================
struct SchedulerConfig {
    double slotLenHour = 1.0;
    int minRestSlots = 2;            ///< Idle slots required between two shifts
    int minShiftLengthSlots = 2;
    bool meetAllDemand = false;      ///< Hard demand instead of penalised slack
    bool fixedShifts = false;
    std::vector<ShiftDefinition> shifts;   ///< Used when fixedShifts
    WeeklyIntervals operatingHours{};      ///< Staffed windows; empty = demand-driven
    ObjectiveWeights weights{};
    InsightPolicy insights{};

    bool hasOperatingHours() const noexcept {
        for (const auto& o : operatingHours) {
            if (o) return true;
        }
        return false;
    }
};

// ============================================================================
// SCHEDULER INPUT
// ============================================================================

/**
 * @class SchedulerInput
 * @brief Validated aggregate of roles, employees, chains and config
 *
 * @throws ConfigError from the constructor on any structural violation
 */
class SchedulerInput {
public:
    SchedulerInput(std::vector<Role> roles,
                   std::vector<Employee> employees,
                   std::vector<ProductionChain> chains,
                   SchedulerConfig config)
        : roles_(std::move(roles)),
          employees_(std::move(employees)),
          chains_(std::move(chains)),
          config_(std::move(config))
    {
        validateConfig();
        validateRoles();
        validateEmployees();
        validateChains();
    }

    const std::vector<Role>& roles() const noexcept { return roles_; }
    const std::vector<Employee>& employees() const noexcept { return employees_; }
    const std::vector<ProductionChain>& chains() const noexcept { return chains_; }
    const SchedulerConfig& config() const noexcept { return config_; }

    std::optional<std::size_t> roleIndex(const std::string& id) const {
        auto it = roleIndex_.find(id);
        if (it == roleIndex_.end()) return std::nullopt;
        return it->second;
    }

    std::optional<std::size_t> employeeIndex(const std::string& id) const {
        auto it = employeeIndex_.find(id);
        if (it == employeeIndex_.end()) return std::nullopt;
        return it->second;
    }

    /// @brief Indices of the roles an employee may perform, in role order
    const std::vector<int>& eligibleRoles(std::size_t employee) const {
        return eligible_.at(employee);
    }

    /// @brief True if the role belongs to at least one production chain
    bool inAnyChain(std::size_t role) const {
        return inChain_.at(role);
    }

    /// @brief Role indices of a chain, in chain order
    const std::vector<int>& chainRoles(std::size_t chain) const {
        return chainRoles_.at(chain);
    }

private:
    std::vector<Role> roles_;
    std::vector<Employee> employees_;
    std::vector<ProductionChain> chains_;
    SchedulerConfig config_;

    std::unordered_map<std::string, std::size_t> roleIndex_;
    std::unordered_map<std::string, std::size_t> employeeIndex_;
    std::vector<std::vector<int>> eligible_;
    std::vector<std::vector<int>> chainRoles_;
    std::vector<bool> inChain_;

    void validateConfig() const {
        const auto& c = config_;
        if (!(c.slotLenHour > 0.0) || c.slotLenHour > 24.0) {
            throw ConfigError::make("slot_len_hour must be in (0, 24], got {}", c.slotLenHour);
        }
        if (c.minRestSlots < 0) {
            throw ConfigError::make("min_rest_slots must be >= 0, got {}", c.minRestSlots);
        }
        if (c.minShiftLengthSlots < 1) {
            throw ConfigError::make("min_shift_length_slots must be >= 1, got {}",
                                    c.minShiftLengthSlots);
        }
        for (std::size_t i = 0; i < c.shifts.size(); ++i) {
            const auto& s = c.shifts[i];
            if (!s.hours.valid()) {
                throw ConfigError::make("shift '{}' has invalid hours [{}, {})",
                                        s.name, s.hours.start, s.hours.end);
            }
            for (std::size_t j = 0; j < i; ++j) {
                const auto& o = c.shifts[j];
                if (s.hours.overlap(o.hours.start, o.hours.end) > kHourEps) {
                    throw ConfigError::make("shifts '{}' and '{}' overlap", o.name, s.name);
                }
            }
        }
        for_each_enum<Weekday>([&](Weekday d) {
            const auto& o = c.operatingHours[enum_index(d)];
            if (o && !o->valid()) {
                throw ConfigError::make("operating hours of {} are invalid", weekdayName(d));
            }
        });

        const auto& w = c.weights;
        if (w.wage < 0 || w.preference < 0 || w.hoursDeviation < 0 ||
            w.unmetDemand < 0 || w.fairness < 0) {
            throw ConfigError("objective weights must be non-negative");
        }

        const auto& p = c.insights;
        auto unit = [](double v) { return v >= 0.0 && v <= 1.0; };
        if (!unit(p.peakPercentile) || !unit(p.underutilized) || !unit(p.criticalGap) ||
            !unit(p.coverageGap) || !unit(p.bottleneckUtilization) ||
            p.underutilized > p.overutilized || p.criticalGap > p.coverageGap) {
            throw ConfigError("insight thresholds must be ordered fractions in [0, 1]");
        }
        if (!(p.hiringReferenceHours > 0.0) || p.itemMargin < 0.0) {
            throw ConfigError("hiring reference hours must be > 0 and item margin >= 0");
        }
    }

    void validateRoles() {
        for (std::size_t r = 0; r < roles_.size(); ++r) {
            const Role& role = roles_[r];
            if (role.id.empty()) {
                throw ConfigError::make("role #{} has an empty id", r);
            }
            if (!roleIndex_.emplace(role.id, r).second) {
                throw ConfigError::make("duplicate role id '{}'", role.id);
            }
            if (role.minPresent < 0) {
                throw ConfigError::make("role '{}' has negative min_present", role.id);
            }
            if (role.producing) {
                if (!role.itemsPerEmployeePerHour || !(*role.itemsPerEmployeePerHour > 0.0)) {
                    throw ConfigError::make(
                        "producing role '{}' needs a positive items_per_employee_per_hour",
                        role.id);
                }
            }
            else if (role.itemsPerEmployeePerHour) {
                throw ConfigError::make(
                    "role '{}' is not producing but declares a throughput", role.id);
            }
        }
    }

    void validateEmployees() {
        eligible_.resize(employees_.size());
        for (std::size_t e = 0; e < employees_.size(); ++e) {
            const Employee& emp = employees_[e];
            if (emp.id.empty()) {
                throw ConfigError::make("employee #{} has an empty id", e);
            }
            if (!employeeIndex_.emplace(emp.id, e).second) {
                throw ConfigError::make("duplicate employee id '{}'", emp.id);
            }
            if (emp.roles.empty()) {
                throw ConfigError::make("employee '{}' has no eligible role", emp.id);
            }
            for (const auto& rid : emp.roles) {
                if (!roleIndex_.contains(rid)) {
                    throw ConfigError::make("employee '{}' references unknown role '{}'",
                                            emp.id, rid);
                }
            }
            for (std::size_t r = 0; r < roles_.size(); ++r) {
                if (emp.roles.contains(roles_[r].id)) {
                    eligible_[e].push_back(static_cast<int>(r));
                }
            }
            if (!(emp.hourlyWage > 0.0)) {
                throw ConfigError::make("employee '{}' must have a positive hourly wage", emp.id);
            }
            if (emp.maxHoursPerWeek < 0.0) {
                throw ConfigError::make("employee '{}' has negative max_hours_per_week", emp.id);
            }
            if (emp.maxConsecSlots < 1) {
                throw ConfigError::make("employee '{}' needs max_consec_slots >= 1", emp.id);
            }
            if (emp.prefHours < 0.0) {
                throw ConfigError::make("employee '{}' has negative pref_hours", emp.id);
            }
            for_each_enum<Weekday>([&](Weekday d) {
                const auto& avail = emp.availableHours[enum_index(d)];
                const auto& pref = emp.preferredHours[enum_index(d)];
                if (avail && !avail->valid()) {
                    throw ConfigError::make("employee '{}' has invalid hours on {}",
                                            emp.id, weekdayName(d));
                }
                if (pref) {
                    if (!pref->valid()) {
                        throw ConfigError::make("employee '{}' has invalid preferred hours on {}",
                                                emp.id, weekdayName(d));
                    }
                    if (!avail || !avail->covers(*pref)) {
                        throw ConfigError::make(
                            "employee '{}' prefers hours outside availability on {}",
                            emp.id, weekdayName(d));
                    }
                }
            });
        }
    }

    void validateChains() {
        inChain_.assign(roles_.size(), false);
        std::set<std::string> seen;
        for (const auto& chain : chains_) {
            if (chain.id.empty() || !seen.insert(chain.id).second) {
                throw ConfigError::make("production chain id '{}' is empty or duplicated",
                                        chain.id);
            }
            if (chain.roleIds.empty()) {
                throw ConfigError::make("production chain '{}' has no roles", chain.id);
            }
            if (!(chain.contribFactor > 0.0) || chain.contribFactor > 1.0) {
                throw ConfigError::make("production chain '{}' needs contrib_factor in (0, 1]",
                                        chain.id);
            }
            if (std::llround(chain.contribFactor * 100.0) < 1) {
                throw ConfigError::make(
                    "production chain '{}' contrib_factor {} is below 0.01",
                    chain.id, chain.contribFactor);
            }
            std::vector<int> members;
            for (const auto& rid : chain.roleIds) {
                auto r = roleIndex(rid);
                if (!r) {
                    throw ConfigError::make("production chain '{}' references unknown role '{}'",
                                            chain.id, rid);
                }
                members.push_back(static_cast<int>(*r));
                inChain_[*r] = true;
            }
            chainRoles_.push_back(std::move(members));
        }
    }
};

} // namespace shiftopt
