#pragma once
/*
===============================================================================
SOLVE — One-call entry point of the scheduler
===============================================================================

OVERVIEW
--------
solve() creates a SchedulerSession, applies the budget and limits, runs it
once and returns the SolveResult. It never retries: a budget that runs out
yields Feasible (with the best schedule found) or Unknown.

    SolveOptions opts;
    opts.preset = SolvePreset::Interactive;
    opts.log.console = true;

    SolveResult r = solve(input, demand, std::chrono::seconds(30), opts);
    if (r.status == SolveStatus::Infeasible)
        for (const auto& c : r.conflicts) std::cout << c.constraintClass << "\n";

The budget is applied after the preset, so it always wins over the preset's
time limit. A non-positive budget leaves the time unlimited.

EXCEPTION SAFETY
----------------
• ConfigError for an invalid forecast or grid (before any solver call)
• GRBException from Gurobi (licence, memory) is propagated unchanged

===============================================================================
*/

#include <chrono>
#include <optional>

#include "domain.h"
#include "forecast.h"
#include "monitor.h"
#include "schedule.h"
#include "session.h"

namespace shiftopt {

using SolvePreset = SchedulerSession::Preset;

struct SolveOptions {
    std::optional<SolvePreset> preset;
    std::optional<double> mipGap;
    std::optional<double> nodeLimit;
    std::optional<double> iterationLimit;
    std::optional<int> threads;

    LogOptions log;
    CancellationToken cancel;
    bool computeConflicts = true;     ///< IIS on infeasible models
};

/// @brief Apply options and budget to a session before it runs
inline void configure(SchedulerSession& session, std::chrono::duration<double> budget,
                      const SolveOptions& options)
{
    if (options.preset) session.applyPreset(*options.preset);
    if (budget.count() > 0.0) session.timeLimit(budget.count());
    if (options.mipGap) session.mipGapLimit(*options.mipGap);
    if (options.nodeLimit) session.nodeLimit(*options.nodeLimit);
    if (options.iterationLimit) session.iterationLimit(*options.iterationLimit);
    if (options.threads) session.threads(*options.threads);
}

/**
 * @brief Build and solve the schedule of one forecast horizon
 * @param budget Wall-clock limit of the search
 */
inline SolveResult solve(const SchedulerInput& input, const DemandForecast& demand,
                         std::chrono::duration<double> budget,
                         const SolveOptions& options = {})
{
    SchedulerSession session(input, demand, options.log);
    configure(session, budget, options);
    return session.run(options.cancel, options.computeConflicts);
}

} // namespace shiftopt
