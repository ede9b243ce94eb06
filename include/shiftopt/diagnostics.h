#pragma once
/*
===============================================================================
DIAGNOSTICS — Model statistics, status names and infeasibility analysis
===============================================================================

Overview
--------
Free functions over GRBModel used by the solver driver:

    * Human-readable Gurobi status names
    * Model size by variable type (logged after building, kept in SolveStats)
    * IIS computation for infeasible models, grouped by constraint family

Constraint families come from the forced "<family>[i,j]" names given by
ConstraintFactory, so an IIS reads as "2 x coverage, 1 x role_activity".
Variable bounds in an IIS are reported under "bound:<family>".

Typical Usage
-------------
    auto stats = shiftopt::computeStatistics(model);
    std::cout << shiftopt::modelSummary(model) << "\n";

    if (model.get(GRB_IntAttr_Status) == GRB_INFEASIBLE) {
        auto iis = shiftopt::computeIIS(model);
        for (const auto& [family, names] : shiftopt::groupByFamily(iis))
            std::cout << family << ": " << names.size() << "\n";
    }

===============================================================================
*/

#include <initializer_list>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "gurobi_c++.h"
#include "naming.h"

namespace shiftopt {

// =============================================================================
// STATUS STRING CONVERSION
// =============================================================================

/**
 * @brief Convert Gurobi status code to its name
 * @example statusString(GRB_TIME_LIMIT) == "TIME_LIMIT"
 */
inline std::string statusString(int status) {
    switch (status) {
        case GRB_LOADED:          return "LOADED";
        case GRB_OPTIMAL:         return "OPTIMAL";
        case GRB_INFEASIBLE:      return "INFEASIBLE";
        case GRB_INF_OR_UNBD:     return "INF_OR_UNBD";
        case GRB_UNBOUNDED:       return "UNBOUNDED";
        case GRB_CUTOFF:          return "CUTOFF";
        case GRB_ITERATION_LIMIT: return "ITERATION_LIMIT";
        case GRB_NODE_LIMIT:      return "NODE_LIMIT";
        case GRB_TIME_LIMIT:      return "TIME_LIMIT";
        case GRB_SOLUTION_LIMIT:  return "SOLUTION_LIMIT";
        case GRB_INTERRUPTED:     return "INTERRUPTED";
        case GRB_NUMERIC:         return "NUMERIC";
        case GRB_SUBOPTIMAL:      return "SUBOPTIMAL";
        case GRB_INPROGRESS:      return "INPROGRESS";
        case GRB_USER_OBJ_LIMIT:  return "USER_OBJ_LIMIT";
        default:                  return "UNKNOWN(" + std::to_string(status) + ")";
    }
}

// =============================================================================
// MODEL STATISTICS
// =============================================================================

struct ModelStatistics {
    int numVars = 0;
    int numConstrs = 0;
    int numBinary = 0;
    int numInteger = 0;     ///< General integers, binaries excluded
    int numContinuous = 0;
    int numNonZeros = 0;
};

/**
 * @brief Size and composition of a model
 * @note Call after GRBModel::update() so pending additions are counted
 */
inline ModelStatistics computeStatistics(const GRBModel& model) {
    ModelStatistics stats;

    stats.numVars = model.get(GRB_IntAttr_NumVars);
    stats.numConstrs = model.get(GRB_IntAttr_NumConstrs);
    stats.numBinary = model.get(GRB_IntAttr_NumBinVars);
    // NumIntVars counts binaries too
    stats.numInteger = model.get(GRB_IntAttr_NumIntVars) - stats.numBinary;
    stats.numNonZeros = model.get(GRB_IntAttr_NumNZs);
    stats.numContinuous = stats.numVars - stats.numBinary - stats.numInteger;

    return stats;
}

inline bool isMIP(const GRBModel& model) {
    return model.get(GRB_IntAttr_NumIntVars) > 0;
}

/**
 * @brief One-line summary like "120 vars (80 bin, 20 int), 310 constrs"
 */
inline std::string modelSummary(const ModelStatistics& stats) {
    std::string result = std::to_string(stats.numVars) + " vars";

    if (stats.numBinary > 0 || stats.numInteger > 0) {
        result += " (";
        if (stats.numBinary > 0) {
            result += std::to_string(stats.numBinary) + " bin";
            if (stats.numInteger > 0) result += ", ";
        }
        if (stats.numInteger > 0) {
            result += std::to_string(stats.numInteger) + " int";
        }
        result += ")";
    }

    result += ", " + std::to_string(stats.numConstrs) + " constrs";
    return result;
}

inline std::string modelSummary(const GRBModel& model) {
    return modelSummary(computeStatistics(model));
}

// =============================================================================
// IIS (IRREDUCIBLE INCONSISTENT SUBSYSTEM)
// =============================================================================

/**
 * @brief Names of the constraints and bounds forming an IIS
 *
 * @details Removing any single member makes the remaining system feasible.
 */
struct IISResult {
    std::vector<std::string> constraints;
    std::vector<std::string> lowerBounds;   ///< Variable names
    std::vector<std::string> upperBounds;   ///< Variable names

    bool empty() const {
        return constraints.empty() && lowerBounds.empty() && upperBounds.empty();
    }

    std::size_t size() const {
        return constraints.size() + lowerBounds.size() + upperBounds.size();
    }
};

/**
 * @brief Compute an IIS of an infeasible model
 * @note Only meaningful for status INFEASIBLE or INF_OR_UNBD; may be slow
 * @throws GRBException when Gurobi cannot compute the IIS
 */
inline IISResult computeIIS(GRBModel& model) {
    IISResult result;

    model.computeIIS();

    // getConstrs()/getVars() hand back new[] arrays owned by the caller
    std::unique_ptr<GRBConstr[]> constrs(model.getConstrs());
    int numConstrs = model.get(GRB_IntAttr_NumConstrs);
    for (int i = 0; i < numConstrs; ++i) {
        if (constrs[i].get(GRB_IntAttr_IISConstr) > 0) {
            result.constraints.push_back(constrs[i].get(GRB_StringAttr_ConstrName));
        }
    }

    std::unique_ptr<GRBVar[]> vars(model.getVars());
    int numVars = model.get(GRB_IntAttr_NumVars);
    for (int i = 0; i < numVars; ++i) {
        if (vars[i].get(GRB_IntAttr_IISLB) > 0) {
            result.lowerBounds.push_back(vars[i].get(GRB_StringAttr_VarName));
        }
        if (vars[i].get(GRB_IntAttr_IISUB) > 0) {
            result.upperBounds.push_back(vars[i].get(GRB_StringAttr_VarName));
        }
    }

    return result;
}

/**
 * @brief IIS members grouped by family name
 *
 * @details Constraint members are keyed by family_of(name). Bounds are keyed
 *          "bound:<family>"; variables without a generated name (Gurobi's
 *          default "C<n>") fall under "bound:unnamed".
 */
inline std::map<std::string, std::vector<std::string>> groupByFamily(const IISResult& iis) {
    std::map<std::string, std::vector<std::string>> out;
    for (const auto& name : iis.constraints) {
        out[family_of(name)].push_back(name);
    }
    for (const auto* bounds : { &iis.lowerBounds, &iis.upperBounds }) {
        for (const auto& name : *bounds) {
            bool generated = name.find('[') != std::string::npos;
            out["bound:" + (generated ? family_of(name) : std::string("unnamed"))].push_back(name);
        }
    }
    return out;
}

} // namespace shiftopt
