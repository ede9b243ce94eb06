#pragma once
/*
===============================================================================
SHIFTOPT — Unified Include Header
===============================================================================

OVERVIEW
--------
Single include for the staff-scheduling engine: from a roster, shift rules
and an hourly demand forecast to a cost- and preference-optimal schedule
and a management insights report.

WHAT'S INCLUDED
---------------
• error.h        — ConfigError
• enum_utils.h   — SHIFTOPT_ENUM_WITH_COUNT, Weekday
• naming.h       — Debug/forced names of variables and constraints
• data_store.h   — Type-erased key-value storage (parameters, statistics)
• domain.h       — Roles, employees, chains, config, SchedulerInput
• forecast.h     — DemandForecast
• grid.h         — Window grid of the horizon
• throughput.h   — Integer output arithmetic, production chains
• variables.h    — Indexed variable families, VariableTable
• constraints.h  — Indexed constraint families, ConstraintTable
• expressions.h  — sum() helpers
• model_builder.h— Template-method model lifecycle, parameters, presets
• callbacks.h    — Named Gurobi callback hooks
• monitor.h      — CancellationToken, SolveMonitor
• diagnostics.h  — Status names, statistics, IIS
• schedule.h     — SolveResult, Schedule
• session.h      — SchedulerSession, the scheduling model
• solve.h        — solve()
• insights.h     — generateInsights()
• report.h       — describe()

QUICK START
-----------
    #include <shiftopt/shiftopt.h>
    using namespace shiftopt;

    Role chef{ .id = "chef", .producing = true,
               .itemsPerEmployeePerHour = 12.0, .minPresent = 1 };
    Employee ana{ .id = "ana", .roles = {"chef"},
                  .availableHours = everyDay({ 8.0, 20.0 }) };

    SchedulerConfig cfg;
    cfg.operatingHours = everyDay({ 10.0, 18.0 });
    SchedulerInput input({ chef }, { ana }, {}, cfg);

    auto demand = DemandForecast::zero(7);
    demand.at(0, 12).itemCount = 30;

    SolveResult result = solve(input, demand, std::chrono::seconds(30));
    std::cout << describe(result, input)
              << describe(generateInsights(input, demand, &result));

REQUIREMENTS
------------
• C++20 compiler (GCC 13+, Clang 17+, MSVC 19.29+) for <format>
• Gurobi Optimizer 10.0+ with the C++ API

CONFIGURATION
-------------
• SHIFTOPT_DEBUG or _DEBUG: readable names on every variable
  (constraints and headcount bounds are always named)

===============================================================================
*/

#include "error.h"
#include "enum_utils.h"
#include "naming.h"
#include "data_store.h"
#include "domain.h"
#include "forecast.h"
#include "grid.h"
#include "throughput.h"
#include "variables.h"
#include "constraints.h"
#include "expressions.h"
#include "model_builder.h"
#include "callbacks.h"
#include "monitor.h"
#include "diagnostics.h"
#include "schedule.h"
#include "session.h"
#include "solve.h"
#include "insights.h"
#include "report.h"
