#pragma once
/*
===============================================================================
SESSION — The scheduling MIP of one input and one forecast horizon
===============================================================================

OVERVIEW
--------
SchedulerSession is a ModelBuilder that turns a SchedulerInput and a
DemandForecast into a Gurobi model, solves it and extracts a SolveResult.
A session owns its GRBEnv and GRBModel; nothing is shared between sessions,
so independent sessions can run on separate threads.

    Created --build()--> Built --run()--> Solving --> Optimal
                                                  \-> Feasible
                                                  \-> Infeasible
                                                  \-> Unknown

The grid is built in the constructor, so configuration errors surface
before any solver object exists.

MODEL
-----
Output quantities are integers in centi-items (see throughput.h).

Variables
    assign[e,w]          binary, employee e works window w (only where e is
                         available for the whole window)
    role_assign[e,r,w]   binary, e works w as role r (eligible roles only)
    headcount[r,w]       integer in [0, eligible available employees]
    role_active[r,w]     binary, role r is staffed in w
    role_output[r,w]     integer, producing roles
    chain_raw[c,w]       integer, sum of the chain's role outputs
    chain_scaled[c,w]    integer, realised chain output
    chain_rem[c,w]       integer in [0, den-1], remainder of the scaling
    unmet[w]             continuous, soft demand only
    hours_dev[e,k]       continuous, |hours in week k - weekly target|
    max_hours, min_hours continuous, fairness range

Constraint families
    role_split        assign = sum of role_assign
    headcount         headcount = sum of role_assign
    role_activity     headcount <= ub * role_active, headcount >= role_active
    coverage          headcount >= min_present * role_active; role_active = 1
                      in staffed windows for roles with min_present > 0
    co_presence       dependent role active only with another active role
    rest              idle gap shorter than min_rest only inside one shift
    max_consecutive   no run longer than max_consec_slots
    weekly_hours      hours per horizon week <= max_hours_per_week
    min_shift_length  every run at least min_shift_length_slots
    role_output       role_output = rate * headcount
    chain_raw         chain_raw = sum of member role outputs
    chain_scaling     den * chain_scaled + chain_rem = num * chain_raw
    demand            supply (+ unmet) >= forecast items
    hours_balance     hours_dev >= +-(hours - target)
    fairness          max_hours >= hours >= min_hours

Objective (minimised, weights from ObjectiveWeights)
    wage * sum(hourly_wage * hours * assign)
  + preference * sum(off-preference hours * assign)
  + hoursDeviation * sum(hours_dev)
  + unmetDemand * sum(unmet) / 100
  + fairness * (max_hours - min_hours)

USAGE EXAMPLES
--------------
    SchedulerSession session(input, demand, { .console = true });
    session.timeLimit(30.0);
    session.build();
    std::cout << modelSummary(session.model()) << "\n";

    SolveResult result = session.run();

LIFETIME
--------
The session keeps references to the input and the forecast; both must
outlive it.

===============================================================================
*/

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <format>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "gurobi_c++.h"

#include "constraints.h"
#include "diagnostics.h"
#include "domain.h"
#include "enum_utils.h"
#include "expressions.h"
#include "forecast.h"
#include "grid.h"
#include "model_builder.h"
#include "monitor.h"
#include "schedule.h"
#include "throughput.h"
#include "variables.h"

namespace shiftopt {

SHIFTOPT_ENUM_WITH_COUNT(SchedVar,
    Assign, RoleAssign, Headcount, RoleActive, RoleOutput,
    ChainRaw, ChainScaled, ChainRemainder, Unmet,
    HoursDeviation, MaxHours, MinHours);

SHIFTOPT_ENUM_WITH_COUNT(SchedCons,
    RoleSplit, Headcount, RoleActivity, Coverage, CoPresence,
    Rest, MaxConsecutive, WeeklyHours, MinShiftLength,
    RoleOutput, ChainRaw, ChainScaling, Demand,
    HoursBalance, Fairness);

/// @brief Family name used in constraint names and IIS reports
inline std::string_view constraintClassName(SchedCons c) {
    switch (c) {
        case SchedCons::RoleSplit:      return "role_split";
        case SchedCons::Headcount:      return "headcount";
        case SchedCons::RoleActivity:   return "role_activity";
        case SchedCons::Coverage:       return "coverage";
        case SchedCons::CoPresence:     return "co_presence";
        case SchedCons::Rest:           return "rest";
        case SchedCons::MaxConsecutive: return "max_consecutive";
        case SchedCons::WeeklyHours:    return "weekly_hours";
        case SchedCons::MinShiftLength: return "min_shift_length";
        case SchedCons::RoleOutput:     return "role_output";
        case SchedCons::ChainRaw:       return "chain_raw";
        case SchedCons::ChainScaling:   return "chain_scaling";
        case SchedCons::Demand:         return "demand";
        case SchedCons::HoursBalance:   return "hours_balance";
        case SchedCons::Fairness:       return "fairness";
        case SchedCons::COUNT:          break;
    }
    return "unknown";
}

enum class SessionState {
    Created, Built, Solving, Optimal, Feasible, Infeasible, Unknown
};

inline std::string_view stateName(SessionState s) noexcept {
    switch (s) {
        case SessionState::Created:    return "created";
        case SessionState::Built:      return "built";
        case SessionState::Solving:    return "solving";
        case SessionState::Optimal:    return "optimal";
        case SessionState::Feasible:   return "feasible";
        case SessionState::Infeasible: return "infeasible";
        case SessionState::Unknown:    return "unknown";
    }
    return "unknown";
}

/**
 * @brief Map a Gurobi status to a SolveStatus
 * @param solCount Solutions available after the search
 */
inline SolveStatus classifyStatus(int gurobiStatus, int solCount) noexcept {
    switch (gurobiStatus) {
        case GRB_OPTIMAL:
            return SolveStatus::Optimal;
        case GRB_INFEASIBLE:
        case GRB_INF_OR_UNBD:
            return SolveStatus::Infeasible;
        case GRB_TIME_LIMIT:
        case GRB_NODE_LIMIT:
        case GRB_ITERATION_LIMIT:
        case GRB_SOLUTION_LIMIT:
        case GRB_SUBOPTIMAL:
        case GRB_INTERRUPTED:
            return solCount > 0 ? SolveStatus::Feasible : SolveStatus::Unknown;
        default:
            return SolveStatus::Unknown;
    }
}

/// @brief Where the solver log goes
struct LogOptions {
    bool console = false;     ///< Gurobi log on stdout
    std::string file;         ///< Gurobi LogFile, empty = none
    LogSink sink;             ///< Receives every log line
};

class SchedulerSession : public ModelBuilder<SchedVar, SchedCons> {
public:
    SchedulerSession(const SchedulerInput& input, const DemandForecast& demand,
                     LogOptions log = {})
        : input_(input),
          demand_(demand),
          log_(std::move(log)),
          grid_(buildGrid(input, demand))
    {
        precompute();
    }

    const SchedulerInput& input() const noexcept { return input_; }
    const DemandForecast& demand() const noexcept { return demand_; }
    const TimeGrid& grid() const noexcept { return grid_; }
    SessionState state() const noexcept { return state_; }

    /// @brief True if employee e can be assigned to window w
    bool assignable(std::size_t e, int w) const {
        return assignable_.at(e).at(static_cast<std::size_t>(w));
    }

    /// @brief Eligible employees available for the whole of window w
    int eligibleAvailable(std::size_t r, int w) const {
        return eligibleCount_.at(r).at(static_cast<std::size_t>(w));
    }

    /// @brief Forecast items of a window in centi-items
    long long demandCenti(int w) const {
        return demandCenti_.at(static_cast<std::size_t>(w));
    }

    /**
     * @brief Build if needed, search and extract the result
     *
     * @param token   Polled during the search; when already cancelled the
     *                search is skipped and the result is Unknown
     * @param computeConflicts Compute an IIS when the model is infeasible
     *
     * @throws GRBException on solver failure (licence, memory)
     */
    SolveResult run(CancellationToken token = {}, bool computeConflicts = true)
    {
        build();

        SolveResult result;
        result.stats.numWindows = grid_.size();
        result.stats.model = computeStatistics(model());

        if (token.cancelled()) {
            logMessage("shiftopt: cancelled before search");
            state_ = SessionState::Unknown;
            result.status = SolveStatus::Unknown;
            result.stats.solverStatus = "NOT_RUN";
            store_["stats:status"] = std::string("NOT_RUN");
            result.stats.parameters = store_;
            return result;
        }

        monitor_ = std::make_unique<SolveMonitor>(std::move(token), log_.sink);
        state_ = SessionState::Solving;
        optimize();

        const int grb = status();
        const int solCount = solutionCount();
        result.status = classifyStatus(grb, solCount);
        state_ = toState(result.status);

        result.stats.solverStatus = statusString(grb);
        result.stats.runtimeSeconds = runtime();
        result.stats.solutionCount = solCount;
        if (isMIP(model())) {
            result.stats.nodeCount = nodeCount();
            if (solCount > 0) result.stats.mipGap = mipGap();
        }

        if (solCount > 0) {
            result.objectiveValue = objVal();
            result.schedule = extractSchedule();
            result.employees = extractEmployees();
        }
        else if (result.status == SolveStatus::Infeasible && computeConflicts) {
            result.conflicts = conflicts();
        }

        store_["stats:status"] = result.stats.solverStatus;
        store_["stats:runtime"] = result.stats.runtimeSeconds;
        store_["stats:solutions"] = solCount;
        result.stats.parameters = store_;

        logMessage(std::format("shiftopt: {} ({}), {} solution(s) in {:.2f}s",
                               statusName(result.status), result.stats.solverStatus,
                               solCount, result.stats.runtimeSeconds));
        return result;
    }

    /**
     * @brief IIS of the last search grouped into constraint classes
     * @note Only valid after an infeasible run()
     */
    std::vector<ConflictEntry> conflicts()
    {
        std::vector<ConflictEntry> out;
        for (auto& [family, names] : groupByFamily(computeIIS(model()))) {
            out.push_back({ family, std::move(names) });
        }
        logMessage(std::format("shiftopt: conflict spans {} constraint class(es)", out.size()));
        return out;
    }

protected:
    void configureEnvironment(GRBEnv& env) override
    {
        const bool output = log_.console || !log_.file.empty() || static_cast<bool>(log_.sink);
        env.set(GRB_IntParam_OutputFlag, output ? 1 : 0);
        env.set(GRB_IntParam_LogToConsole, log_.console ? 1 : 0);
        if (!log_.file.empty()) {
            env.set(GRB_StringParam_LogFile, log_.file);
        }
    }

    void addVariables() override
    {
        GRBModel& m = model();
        const auto& roles = input_.roles();
        const auto& emps = input_.employees();
        const int W = static_cast<int>(grid_.size());

        IndexedVariableSet assign, roleAssign;
        for (std::size_t e = 0; e < emps.size(); ++e) {
            for (int w : empWindows_[e]) {
                VariableFactory::addTo(assign, m, GRB_BINARY, 0, 1, "assign",
                                       { static_cast<int>(e), w });
                for (int r : input_.eligibleRoles(e)) {
                    VariableFactory::addTo(roleAssign, m, GRB_BINARY, 0, 1, "role_assign",
                                           { static_cast<int>(e), r, w });
                }
            }
        }

        IndexedVariableSet headcount, active, output;
        for (std::size_t r = 0; r < roles.size(); ++r) {
            const int ri = static_cast<int>(r);
            for (int w = 0; w < W; ++w) {
                const int ub = eligibleAvailable(r, w);
                VariableFactory::addNamedTo(headcount, m, GRB_INTEGER, 0, ub, "headcount", { ri, w });
                VariableFactory::addTo(active, m, GRB_BINARY, 0, 1, "role_active", { ri, w });
                if (roles[r].producing) {
                    const long long rate = centiRate(roles[r], grid_.window(w).hours());
                    VariableFactory::addTo(output, m, GRB_INTEGER, 0,
                                           static_cast<double>(rate * ub), "role_output", { ri, w });
                }
            }
        }

        IndexedVariableSet raw, scaled, rem;
        for (std::size_t c = 0; c < input_.chains().size(); ++c) {
            const ContribRatio ratio = contribRatio(input_.chains()[c].contribFactor);
            const int ci = static_cast<int>(c);
            for (int w = 0; w < W; ++w) {
                long long rawUb = 0;
                for (int r : input_.chainRoles(c)) {
                    rawUb += centiRate(roles[static_cast<std::size_t>(r)], grid_.window(w).hours())
                           * eligibleAvailable(static_cast<std::size_t>(r), w);
                }
                VariableFactory::addTo(raw, m, GRB_INTEGER, 0,
                                       static_cast<double>(rawUb), "chain_raw", { ci, w });
                VariableFactory::addTo(scaled, m, GRB_INTEGER, 0,
                                       static_cast<double>(scaledOutput(rawUb, ratio)),
                                       "chain_scaled", { ci, w });
                VariableFactory::addTo(rem, m, GRB_INTEGER, 0,
                                       static_cast<double>(ratio.den - 1), "chain_rem", { ci, w });
            }
        }

        IndexedVariableSet unmet;
        if (!input_.config().meetAllDemand) {
            for (int w = 0; w < W; ++w) {
                if (demandCenti(w) > 0) {
                    VariableFactory::addTo(unmet, m, GRB_CONTINUOUS, 0,
                                           static_cast<double>(demandCenti(w)), "unmet", { w });
                }
            }
        }

        IndexedVariableSet dev;
        for (std::size_t e = 0; e < emps.size(); ++e) {
            for (std::size_t k = 0; k < grid_.numWeeks(); ++k) {
                VariableFactory::addTo(dev, m, GRB_CONTINUOUS, 0, GRB_INFINITY, "hours_dev",
                                       { static_cast<int>(e), static_cast<int>(k) });
            }
        }

        IndexedVariableSet maxHours, minHours;
        if (fairnessApplies()) {
            VariableFactory::addTo(maxHours, m, GRB_CONTINUOUS, 0, GRB_INFINITY, "max_hours",
                                   std::vector<int>{});
            VariableFactory::addTo(minHours, m, GRB_CONTINUOUS, 0, GRB_INFINITY, "min_hours",
                                   std::vector<int>{});
        }

        vars_.set(SchedVar::Assign, std::move(assign));
        vars_.set(SchedVar::RoleAssign, std::move(roleAssign));
        vars_.set(SchedVar::Headcount, std::move(headcount));
        vars_.set(SchedVar::RoleActive, std::move(active));
        vars_.set(SchedVar::RoleOutput, std::move(output));
        vars_.set(SchedVar::ChainRaw, std::move(raw));
        vars_.set(SchedVar::ChainScaled, std::move(scaled));
        vars_.set(SchedVar::ChainRemainder, std::move(rem));
        vars_.set(SchedVar::Unmet, std::move(unmet));
        vars_.set(SchedVar::HoursDeviation, std::move(dev));
        vars_.set(SchedVar::MaxHours, std::move(maxHours));
        vars_.set(SchedVar::MinHours, std::move(minHours));

        logMessage(std::format("shiftopt: {} windows over {} day(s), {} assignable pairs",
                               grid_.size(), grid_.horizonDays(), vars_(SchedVar::Assign).size()));
    }

    void addConstraints() override
    {
        addStaffingConstraints();
        addWorkRuleConstraints();
        addThroughputConstraints();
        addBalanceConstraints();
    }

    void addObjective() override
    {
        const auto& emps = input_.employees();
        const ObjectiveWeights& wt = input_.config().weights;

        GRBLinExpr wage = 0.0;
        GRBLinExpr offPref = 0.0;
        for (const auto& entry : vars_(SchedVar::Assign)) {
            const Employee& emp = emps[static_cast<std::size_t>(entry.index[0])];
            const Window& win = grid_.window(entry.index[1]);
            wage += emp.hourlyWage * win.hours() * entry.var;
            offPref += emp.offPreferenceHours(win.weekday, win.start, win.end) * entry.var;
        }

        GRBLinExpr objective = wt.wage * wage
                             + wt.preference * offPref
                             + wt.hoursDeviation * sum(vars_(SchedVar::HoursDeviation))
                             + (wt.unmetDemand / 100.0) * sum(vars_(SchedVar::Unmet));

        if (fairnessApplies()) {
            objective += wt.fairness * (vars_.var(SchedVar::MaxHours) - vars_.var(SchedVar::MinHours));
        }

        minimize(objective);
    }

    void afterBuild() override
    {
        state_ = SessionState::Built;
        store_["stats:windows"] = static_cast<int>(grid_.size());
        logMessage("shiftopt: model " + modelSummary(model()));
    }

    void beforeOptimize() override
    {
        if (monitor_) {
            model().setCallback(monitor_.get());
        }
    }

private:
    const SchedulerInput& input_;
    const DemandForecast& demand_;
    LogOptions log_;
    TimeGrid grid_;

    SessionState state_ = SessionState::Created;
    std::unique_ptr<SolveMonitor> monitor_;

    std::vector<std::vector<bool>> assignable_;     // [e][w]
    std::vector<std::vector<int>> empWindows_;      // [e] -> assignable windows in time order
    std::vector<std::vector<int>> eligibleCount_;   // [r][w]
    std::vector<long long> demandCenti_;            // [w]

    void precompute()
    {
        const auto& emps = input_.employees();
        const std::size_t W = grid_.size();

        assignable_.assign(emps.size(), std::vector<bool>(W, false));
        empWindows_.assign(emps.size(), {});
        eligibleCount_.assign(input_.roles().size(), std::vector<int>(W, 0));
        demandCenti_.assign(W, 0);

        for (const Window& win : grid_.windows()) {
            const auto w = static_cast<std::size_t>(win.index);
            demandCenti_[w] = toCenti(windowDemand(demand_, win).items);
            for (std::size_t e = 0; e < emps.size(); ++e) {
                if (!emps[e].availableFor(win.weekday, win.start, win.end)) continue;
                assignable_[e][w] = true;
                empWindows_[e].push_back(win.index);
                for (int r : input_.eligibleRoles(e)) {
                    ++eligibleCount_[static_cast<std::size_t>(r)][w];
                }
            }
        }
    }

    static SessionState toState(SolveStatus s) noexcept {
        switch (s) {
            case SolveStatus::Optimal:    return SessionState::Optimal;
            case SolveStatus::Feasible:   return SessionState::Feasible;
            case SolveStatus::Infeasible: return SessionState::Infeasible;
            case SolveStatus::Unknown:    return SessionState::Unknown;
        }
        return SessionState::Unknown;
    }

    bool fairnessApplies() const {
        int withWindows = 0;
        for (const auto& ws : empWindows_) {
            if (!ws.empty()) ++withWindows;
        }
        return withWindows >= 2;
    }

    /// @brief Assigned hours of employee e in horizon week k (all weeks if k < 0)
    GRBLinExpr hoursExpr(std::size_t e, int k) const {
        GRBLinExpr h = 0.0;
        const auto& assign = vars_(SchedVar::Assign);
        for (int w : empWindows_[e]) {
            const Window& win = grid_.window(w);
            if (k >= 0 && TimeGrid::weekOf(win.day) != static_cast<std::size_t>(k)) continue;
            h += win.hours() * assign.at(static_cast<int>(e), w);
        }
        return h;
    }

    /// @brief Maximal sequences of contiguous assignable windows of e
    std::vector<std::vector<int>> runsOf(std::size_t e) const {
        std::vector<std::vector<int>> runs;
        for (int w : empWindows_[e]) {
            if (runs.empty() || !grid_.continues(runs.back().back(), w)) {
                runs.emplace_back();
            }
            runs.back().push_back(w);
        }
        return runs;
    }

    // -------------------------------------------------------------------------
    // role_split, headcount, role_activity, coverage, co_presence
    // -------------------------------------------------------------------------
    void addStaffingConstraints()
    {
        GRBModel& m = model();
        const auto& roles = input_.roles();
        const auto& emps = input_.employees();
        const auto& assign = vars_(SchedVar::Assign);
        const auto& roleAssign = vars_(SchedVar::RoleAssign);
        const auto& headcount = vars_(SchedVar::Headcount);
        const auto& active = vars_(SchedVar::RoleActive);
        const int W = static_cast<int>(grid_.size());

        IndexedConstraintSet split;
        for (std::size_t e = 0; e < emps.size(); ++e) {
            const int ei = static_cast<int>(e);
            for (int w : empWindows_[e]) {
                GRBLinExpr roles_of = sum(input_.eligibleRoles(e), [&](int r) {
                    return roleAssign.at(ei, r, w);
                });
                ConstraintFactory::addTo(split, m, assign.at(ei, w) == roles_of,
                                         "role_split", { ei, w });
            }
        }

        IndexedConstraintSet head, activity, coverage, coPresence;
        for (std::size_t r = 0; r < roles.size(); ++r) {
            const int ri = static_cast<int>(r);
            const Role& role = roles[r];
            for (int w = 0; w < W; ++w) {
                const GRBVar& h = headcount.at(ri, w);
                const GRBVar& a = active.at(ri, w);

                GRBLinExpr staff = sumExisting(roleAssign, [&](auto add) {
                    for (std::size_t e = 0; e < emps.size(); ++e) add(static_cast<int>(e), ri, w);
                });
                ConstraintFactory::addTo(head, m, h == staff, "headcount", { ri, w });

                const int ub = eligibleAvailable(r, w);
                ConstraintFactory::addTo(activity, m, h <= static_cast<double>(ub) * a, "role_activity", { ri, w, 0 });
                ConstraintFactory::addTo(activity, m, h >= a, "role_activity", { ri, w, 1 });

                if (role.minPresent > 0) {
                    ConstraintFactory::addTo(coverage, m, h >= static_cast<double>(role.minPresent) * a,
                                             "coverage", { ri, w, 0 });
                    if (grid_.window(w).staffed) {
                        ConstraintFactory::addTo(coverage, m, a == 1.0, "coverage", { ri, w, 1 });
                    }
                }

                if (!role.isIndependent) {
                    GRBLinExpr others = 0.0;
                    for (std::size_t o = 0; o < roles.size(); ++o) {
                        if (o != r) others += active.at(static_cast<int>(o), w);
                    }
                    ConstraintFactory::addTo(coPresence, m, a <= others, "co_presence", { ri, w });
                }
            }
        }

        cons_.set(SchedCons::RoleSplit, std::move(split));
        cons_.set(SchedCons::Headcount, std::move(head));
        cons_.set(SchedCons::RoleActivity, std::move(activity));
        cons_.set(SchedCons::Coverage, std::move(coverage));
        cons_.set(SchedCons::CoPresence, std::move(coPresence));
    }

    // -------------------------------------------------------------------------
    // rest, max_consecutive, min_shift_length, weekly_hours
    // -------------------------------------------------------------------------
    void addWorkRuleConstraints()
    {
        GRBModel& m = model();
        const auto& emps = input_.employees();
        const auto& assign = vars_(SchedVar::Assign);
        const SchedulerConfig& cfg = input_.config();

        IndexedConstraintSet rest, maxConsec, minLength, weekly;
        for (std::size_t e = 0; e < emps.size(); ++e) {
            const int ei = static_cast<int>(e);
            const auto& ws = empWindows_[e];
            auto x = [&](int w) -> const GRBVar& { return assign.at(ei, w); };

            // Pairs closer than min_rest are allowed only when bridged by work
            for (std::size_t i = 0; i < ws.size(); ++i) {
                for (std::size_t j = i + 1; j < ws.size(); ++j) {
                    const double idle = grid_.idleSlotsBetween(ws[i], ws[j]);
                    if (idle >= cfg.minRestSlots - kHourEps) break;
                    if (idle <= kHourEps) continue;
                    GRBLinExpr bridge = 0.0;
                    for (std::size_t k = i + 1; k < j; ++k) bridge += x(ws[k]);
                    ConstraintFactory::addTo(rest, m, x(ws[i]) + x(ws[j]) <= 1.0 + bridge,
                                             "rest", { ei, ws[i], ws[j] });
                }
            }

            for (const auto& run : runsOf(e)) {
                std::vector<int> slots;
                for (int w : run) slots.push_back(grid_.window(w).slots);

                for (std::size_t i = 0; i < run.size(); ++i) {
                    // shortest stretch from i exceeding the limit
                    int total = 0;
                    std::size_t j = i;
                    for (; j < run.size(); ++j) {
                        total += slots[j];
                        if (total > emps[e].maxConsecSlots) break;
                    }
                    if (j < run.size()) {
                        GRBLinExpr stretch = 0.0;
                        for (std::size_t k = i; k <= j; ++k) stretch += x(run[k]);
                        ConstraintFactory::addTo(maxConsec, m,
                                                 stretch <= static_cast<double>(j - i),
                                                 "max_consecutive", { ei, run[i] });
                    }

                    // a run starting at i must reach min_shift_length_slots
                    GRBLinExpr starts = x(run[i]);
                    if (i > 0) starts -= x(run[i - 1]);
                    total = 0;
                    j = i;
                    for (; j < run.size(); ++j) {
                        total += slots[j];
                        if (total >= cfg.minShiftLengthSlots) break;
                    }
                    if (j < run.size()) {
                        if (j == i) continue;
                        GRBLinExpr stretch = 0.0;
                        for (std::size_t k = i; k <= j; ++k) stretch += x(run[k]);
                        ConstraintFactory::addTo(minLength, m,
                                                 stretch >= static_cast<double>(j - i + 1) * starts,
                                                 "min_shift_length", { ei, run[i] });
                    }
                    else {
                        ConstraintFactory::addTo(minLength, m, starts <= 0.0,
                                                 "min_shift_length", { ei, run[i] });
                    }
                }
            }

            for (std::size_t k = 0; k < grid_.numWeeks(); ++k) {
                const bool any = std::any_of(ws.begin(), ws.end(), [&](int w) {
                    return TimeGrid::weekOf(grid_.window(w).day) == k;
                });
                if (!any) continue;
                ConstraintFactory::addTo(weekly, m,
                                         hoursExpr(e, static_cast<int>(k)) <= emps[e].maxHoursPerWeek,
                                         "weekly_hours", { ei, static_cast<int>(k) });
            }
        }

        cons_.set(SchedCons::Rest, std::move(rest));
        cons_.set(SchedCons::MaxConsecutive, std::move(maxConsec));
        cons_.set(SchedCons::MinShiftLength, std::move(minLength));
        cons_.set(SchedCons::WeeklyHours, std::move(weekly));
    }

    // -------------------------------------------------------------------------
    // role_output, chain_raw, chain_scaling, demand
    // -------------------------------------------------------------------------
    void addThroughputConstraints()
    {
        GRBModel& m = model();
        const auto& roles = input_.roles();
        const auto& headcount = vars_(SchedVar::Headcount);
        const auto& output = vars_(SchedVar::RoleOutput);
        const auto& raw = vars_(SchedVar::ChainRaw);
        const auto& scaled = vars_(SchedVar::ChainScaled);
        const auto& rem = vars_(SchedVar::ChainRemainder);
        const auto& unmet = vars_(SchedVar::Unmet);
        const int W = static_cast<int>(grid_.size());

        IndexedConstraintSet out, chainRaw, scaling, demand;
        for (std::size_t r = 0; r < roles.size(); ++r) {
            if (!roles[r].producing) continue;
            const int ri = static_cast<int>(r);
            for (int w = 0; w < W; ++w) {
                const double rate = static_cast<double>(centiRate(roles[r], grid_.window(w).hours()));
                ConstraintFactory::addTo(out, m, output.at(ri, w) == rate * headcount.at(ri, w),
                                         "role_output", { ri, w });
            }
        }

        for (std::size_t c = 0; c < input_.chains().size(); ++c) {
            const int ci = static_cast<int>(c);
            const ContribRatio ratio = contribRatio(input_.chains()[c].contribFactor);
            for (int w = 0; w < W; ++w) {
                // non-producing members have no role_output and add nothing
                GRBLinExpr members = sumExisting(output, [&](auto add) {
                    for (int r : input_.chainRoles(c)) add(r, w);
                });
                ConstraintFactory::addTo(chainRaw, m, raw.at(ci, w) == members,
                                         "chain_raw", { ci, w });
                ConstraintFactory::addTo(scaling, m,
                    static_cast<double>(ratio.den) * scaled.at(ci, w) + rem.at(ci, w)
                        == static_cast<double>(ratio.num) * raw.at(ci, w),
                    "chain_scaling", { ci, w });
            }
        }

        for (int w = 0; w < W; ++w) {
            if (demandCenti(w) <= 0) continue;
            GRBLinExpr supply = 0.0;
            for (std::size_t r = 0; r < roles.size(); ++r) {
                if (roles[r].producing && !input_.inAnyChain(r)) {
                    supply += output.at(static_cast<int>(r), w);
                }
            }
            for (std::size_t c = 0; c < input_.chains().size(); ++c) {
                supply += scaled.at(static_cast<int>(c), w);
            }
            supply += termOrZero(unmet.try_get(w));
            ConstraintFactory::addTo(demand, m, supply >= static_cast<double>(demandCenti(w)),
                                     "demand", { w });
        }

        cons_.set(SchedCons::RoleOutput, std::move(out));
        cons_.set(SchedCons::ChainRaw, std::move(chainRaw));
        cons_.set(SchedCons::ChainScaling, std::move(scaling));
        cons_.set(SchedCons::Demand, std::move(demand));
    }

    // -------------------------------------------------------------------------
    // hours_balance, fairness
    // -------------------------------------------------------------------------
    void addBalanceConstraints()
    {
        GRBModel& m = model();
        const auto& emps = input_.employees();
        const auto& dev = vars_(SchedVar::HoursDeviation);

        IndexedConstraintSet balance, fairness;
        for (std::size_t e = 0; e < emps.size(); ++e) {
            const int ei = static_cast<int>(e);
            for (std::size_t k = 0; k < grid_.numWeeks(); ++k) {
                const int ki = static_cast<int>(k);
                const double target = emps[e].prefHours * static_cast<double>(grid_.daysInWeek(k)) / 7.0;
                GRBLinExpr hours = hoursExpr(e, ki);
                ConstraintFactory::addTo(balance, m, dev.at(ei, ki) >= hours - target,
                                         "hours_balance", { ei, ki, 0 });
                ConstraintFactory::addTo(balance, m, dev.at(ei, ki) >= target - hours,
                                         "hours_balance", { ei, ki, 1 });
            }
        }

        if (fairnessApplies()) {
            const GRBVar& hi = vars_.var(SchedVar::MaxHours);
            const GRBVar& lo = vars_.var(SchedVar::MinHours);
            for (std::size_t e = 0; e < emps.size(); ++e) {
                if (empWindows_[e].empty()) continue;
                const int ei = static_cast<int>(e);
                GRBLinExpr hours = hoursExpr(e, -1);
                ConstraintFactory::addTo(fairness, m, hi >= hours, "fairness", { ei, 0 });
                ConstraintFactory::addTo(fairness, m, lo <= hours, "fairness", { ei, 1 });
            }
        }

        cons_.set(SchedCons::HoursBalance, std::move(balance));
        cons_.set(SchedCons::Fairness, std::move(fairness));
    }

    // -------------------------------------------------------------------------
    // Result extraction
    // -------------------------------------------------------------------------
    Schedule extractSchedule() const
    {
        const auto& roles = input_.roles();
        const auto& emps = input_.employees();
        const auto& roleAssign = vars_(SchedVar::RoleAssign);

        Schedule schedule;
        for (const Window& win : grid_.windows()) {
            ScheduledWindow sw;
            sw.window = win;
            std::vector<int> heads(roles.size(), 0);

            for (std::size_t e = 0; e < emps.size(); ++e) {
                if (!assignable(e, win.index)) continue;
                for (int r : input_.eligibleRoles(e)) {
                    if (isSet(roleAssign.try_get(static_cast<int>(e), r, win.index))) {
                        sw.assignments.push_back({ emps[e].id, roles[static_cast<std::size_t>(r)].id });
                        ++heads[static_cast<std::size_t>(r)];
                    }
                }
            }

            const long long wanted = demandCenti(win.index);
            const WindowSupply supply = windowSupply(input_, win, heads);
            sw.demandItems = static_cast<double>(wanted) / 100.0;
            sw.supplyItems = supply.items();
            sw.unmetItems = static_cast<double>(std::max(0LL, wanted - supply.totalCenti)) / 100.0;

            if (!sw.assignments.empty() || wanted > 0) {
                schedule[win.day].push_back(std::move(sw));
            }
        }
        return schedule;
    }

    std::vector<EmployeeSummary> extractEmployees() const
    {
        const auto& emps = input_.employees();
        const auto& assign = vars_(SchedVar::Assign);

        std::vector<EmployeeSummary> out;
        for (std::size_t e = 0; e < emps.size(); ++e) {
            EmployeeSummary s;
            s.employeeId = emps[e].id;
            s.targetHours = emps[e].prefHours * static_cast<double>(grid_.horizonDays()) / 7.0;
            for (int w : empWindows_[e]) {
                if (!isSet(assign.try_get(static_cast<int>(e), w))) continue;
                const Window& win = grid_.window(w);
                s.assignedHours += win.hours();
                s.offPreferenceHours += emps[e].offPreferenceHours(win.weekday, win.start, win.end);
                s.wageCost += emps[e].hourlyWage * win.hours();
            }
            s.hoursDeviation = s.assignedHours - s.targetHours;
            out.push_back(std::move(s));
        }
        return out;
    }
};

} // namespace shiftopt
