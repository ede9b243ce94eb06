#pragma once
/*
===============================================================================
CALLBACKS — Named hooks over Gurobi's where-based callback
===============================================================================

Overview
--------
MIPCallback turns GRBCallback::callback() into named virtual methods so a
derived class overrides only the events it cares about:

| Method          | Gurobi where           | Typical use                    |
|-----------------|------------------------|--------------------------------|
| onPolling()     | every callback point   | cooperative cancellation       |
| onProgress()    | GRB_CB_MIP             | progress reporting             |
| onIncumbent()   | GRB_CB_MIPSOL          | logging new schedules          |
| onMessage()     | GRB_CB_MESSAGE         | forwarding the solver log      |

Progress values are only read at the points where Gurobi provides them, so
no info query can fail with "data not available".

Typical Usage
-------------
    class Logger : public shiftopt::MIPCallback {
    protected:
        void onIncumbent(const Progress& p) override {
            std::cout << "new schedule, cost " << p.bestObj << "\n";
        }
    };

    Logger cb;
    model.setCallback(&cb);
    model.optimize();

Thread Safety
-------------
Gurobi invokes the callback from its own threads, one call at a time.

Exception Safety
----------------
Standard exceptions escaping a hook are rethrown as GRBException with
GRB_ERROR_CALLBACK, which ends the optimization and reaches the caller of
GRBModel::optimize().

===============================================================================
*/

#include <cmath>
#include <exception>
#include <string>

#include "gurobi_c++.h"

namespace shiftopt {

/**
 * @brief Search progress as reported by the solver
 * @note Fields not available at the current callback point keep defaults
 */
struct Progress {
    double runtime = 0.0;
    double bestObj = GRB_INFINITY;
    double bestBound = -GRB_INFINITY;
    double gap = GRB_INFINITY;
    double nodeCount = 0.0;
    int solutionCount = 0;

    bool hasSolution() const noexcept {
        return solutionCount > 0;
    }

    bool gapWithin(double tolerance = 0.01) const noexcept {
        return gap <= tolerance;
    }
};

/**
 * @brief GRBCallback with one virtual method per event of interest
 */
class MIPCallback : public GRBCallback {
public:
    virtual ~MIPCallback() = default;

protected:
    /// @brief Called at every callback point before the specific hook
    virtual void onPolling() {}

    virtual void onProgress(const Progress& p) {
        (void)p;
    }

    /// @brief A new incumbent was found; p.bestObj is its objective
    virtual void onIncumbent(const Progress& p) {
        (void)p;
    }

    virtual void onMessage(const std::string& msg) {
        (void)msg;
    }

    /// @brief Ask Gurobi to stop at the next opportunity
    void abort() {
        GRBCallback::abort();
    }

private:
    Progress mipProgress() {
        Progress p;
        p.runtime = getDoubleInfo(GRB_CB_RUNTIME);
        p.bestObj = getDoubleInfo(GRB_CB_MIP_OBJBST);
        p.bestBound = getDoubleInfo(GRB_CB_MIP_OBJBND);
        p.nodeCount = getDoubleInfo(GRB_CB_MIP_NODCNT);
        p.solutionCount = getIntInfo(GRB_CB_MIP_SOLCNT);
        p.gap = relativeGap(p);
        return p;
    }

    Progress incumbentProgress() {
        Progress p;
        p.runtime = getDoubleInfo(GRB_CB_RUNTIME);
        p.bestObj = getDoubleInfo(GRB_CB_MIPSOL_OBJ);
        p.bestBound = getDoubleInfo(GRB_CB_MIPSOL_OBJBND);
        p.nodeCount = getDoubleInfo(GRB_CB_MIPSOL_NODCNT);
        // SOLCNT counts the solutions found before this one
        p.solutionCount = getIntInfo(GRB_CB_MIPSOL_SOLCNT) + 1;
        p.gap = relativeGap(p);
        return p;
    }

    static double relativeGap(const Progress& p) {
        if (p.solutionCount == 0 || std::abs(p.bestObj) >= GRB_INFINITY) {
            return GRB_INFINITY;
        }
        if (std::abs(p.bestObj) < 1e-10) {
            return std::abs(p.bestObj - p.bestBound) < 1e-10 ? 0.0 : GRB_INFINITY;
        }
        return std::abs(p.bestObj - p.bestBound) / std::abs(p.bestObj);
    }

    void callback() override {
        try {
            onPolling();

            switch (where) {
                case GRB_CB_MIP:
                    onProgress(mipProgress());
                    break;

                case GRB_CB_MIPSOL:
                    onIncumbent(incumbentProgress());
                    break;

                case GRB_CB_MESSAGE:
                    onMessage(getStringInfo(GRB_CB_MSG_STRING));
                    break;

                default:
                    break;
            }
        } catch (GRBException&) {
            throw;
        } catch (std::exception& e) {
            throw GRBException(e.what(), GRB_ERROR_CALLBACK);
        }
    }
};

} // namespace shiftopt
