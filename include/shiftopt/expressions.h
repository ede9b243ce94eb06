#pragma once
/*
===============================================================================
EXPRESSIONS — Summation helpers for building GRBLinExpr
===============================================================================

OVERVIEW
--------
Thin helpers that read like the model they build:

    sum_{w in W} hours(w) * x[e,w]       -> sum(W, [&](int w) { ... })
    sum over a whole variable family      -> sum(family)
    sum over the members that exist       -> sumExisting(family, tuples)

Terms returned by the lambda may be a GRBVar, a GRBLinExpr or a number.
Absent members of a sparse family count as zero (termOrZero, sumExisting).

USAGE EXAMPLES
--------------
    GRBLinExpr wage = sum(windows, [&](int w) {
        return rate[w] * X(e, w);
    });

    GRBLinExpr staffed = sumExisting(Y, [&](auto add) {
        for (int r : roles) add(e, r, w);
    });

===============================================================================
*/

#include <type_traits>
#include <utility>

#include "gurobi_c++.h"
#include "variables.h"

namespace shiftopt {

    namespace expr_detail {

        template<typename Term>
        void add_term(GRBLinExpr& expr, Term&& term) {
            using T = std::decay_t<Term>;
            if constexpr (std::is_arithmetic_v<T>) {
                expr += static_cast<double>(term);
            }
            else {
                expr += std::forward<Term>(term);
            }
        }

    } // namespace expr_detail

    /**
     * @brief sum_{i in rng} func(i)
     * @param rng  Any iterable of indices
     * @param func Callable returning GRBVar, GRBLinExpr or a number
     */
    template<typename Range, typename Func>
    GRBLinExpr sum(const Range& rng, Func&& func) {
        GRBLinExpr expr = 0.0;
        for (const auto& idx : rng) {
            expr_detail::add_term(expr, func(idx));
        }
        return expr;
    }

    /// @brief Sum of every variable in the family
    inline GRBLinExpr sum(const IndexedVariableSet& vSet) {
        GRBLinExpr expr = 0.0;
        for (const auto& entry : vSet.all()) {
            expr += entry.var;
        }
        return expr;
    }

    /**
     * @brief Sum of the family members whose tuples the visitor names
     *
     * @details visit receives an `add(i, j, ...)` callable. Tuples that are not
     *          present in the family contribute nothing, which matches the
     *          convention that an absent variable is fixed at zero.
     */
    template<typename Visit>
    GRBLinExpr sumExisting(const IndexedVariableSet& vSet, Visit&& visit) {
        GRBLinExpr expr = 0.0;
        auto add = [&](auto... idx) {
            if (const GRBVar* v = vSet.try_get(idx...)) {
                expr += *v;
            }
        };
        visit(add);
        return expr;
    }

    /// @brief coef * var when the variable exists, 0 otherwise
    inline GRBLinExpr termOrZero(const GRBVar* v, double coef = 1.0) {
        GRBLinExpr expr = 0.0;
        if (v) {
            expr += coef * (*v);
        }
        return expr;
    }

} // namespace shiftopt
