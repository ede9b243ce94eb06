#pragma once
/*
===============================================================================
THROUGHPUT — Integer output arithmetic shared by the model and the insights
===============================================================================

OVERVIEW
--------
All output quantities are integers in centi-items (1/100 item). A producing
role with headcount h in a window of L hours yields
    round(items_per_employee_per_hour * L * 100) * h
centi-items. Production chains sum the output of their roles and realise a
fraction contrib_factor of it. The factor is rescaled to num/100 and reduced
by the gcd, and the realised output is the exact integer quotient

    scaled = floor(num * raw / den)      i.e.   den * scaled + rem = num * raw,
                                                 0 <= rem < den

which is also how the solver model ties the two variables together.

Producing roles outside every chain contribute their output directly.

USAGE EXAMPLES
--------------
    ContribRatio r = contribRatio(0.85);        // 17 / 20
    long long s = scaledOutput(1000, r);         // 850

    std::vector<int> heads(input.roles().size(), 0);
    heads[cook] = 2;
    WindowSupply sup = windowSupply(input, grid.window(w), heads);
    double served = sup.items();

===============================================================================
*/

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <numeric>
#include <vector>

#include "domain.h"
#include "grid.h"

namespace shiftopt {

/// @brief contrib_factor as a reduced fraction num / den
struct ContribRatio {
    long long num = 1;
    long long den = 1;
};

inline ContribRatio contribRatio(double factor) {
    long long num = std::llround(factor * 100.0);
    long long den = 100;
    long long g = std::gcd(num, den);
    if (g > 1) {
        num /= g;
        den /= g;
    }
    return { num, den };
}

/// @brief Realised part of a chain's raw output (floor division, raw >= 0)
inline long long scaledOutput(long long raw, ContribRatio r) {
    return (r.num * raw) / r.den;
}

/// @brief Centi-items one employee in `role` produces over `hours`
inline long long centiRate(const Role& role, double hours) {
    if (!role.producing || !role.itemsPerEmployeePerHour) {
        return 0;
    }
    return std::llround(*role.itemsPerEmployeePerHour * hours * 100.0);
}

/// @brief Item count converted to centi-items, rounded to nearest
inline long long toCenti(double items) {
    return std::llround(items * 100.0);
}

/// @brief Supply of one window for given per-role headcounts
struct WindowSupply {
    long long directCenti = 0;               ///< Producing roles outside chains
    std::vector<long long> chainRawCenti;    ///< Per chain, before contrib factor
    std::vector<long long> chainScaledCenti; ///< Per chain, realised
    long long totalCenti = 0;

    double items() const noexcept { return static_cast<double>(totalCenti) / 100.0; }
};

/**
 * @brief Compute the supply of a window
 * @param headcount Staff per role, indexed like input.roles()
 */
inline WindowSupply windowSupply(const SchedulerInput& input, const Window& window,
                                 const std::vector<int>& headcount)
{
    WindowSupply out;
    const auto& roles = input.roles();
    const double hours = window.hours();

    for (std::size_t r = 0; r < roles.size(); ++r) {
        if (!input.inAnyChain(r)) {
            out.directCenti += centiRate(roles[r], hours) * headcount.at(r);
        }
    }
    out.totalCenti = out.directCenti;

    for (std::size_t c = 0; c < input.chains().size(); ++c) {
        long long raw = 0;
        for (int r : input.chainRoles(c)) {
            raw += centiRate(roles[static_cast<std::size_t>(r)], hours)
                 * headcount.at(static_cast<std::size_t>(r));
        }
        long long scaled = scaledOutput(raw, contribRatio(input.chains()[c].contribFactor));
        out.chainRawCenti.push_back(raw);
        out.chainScaledCenti.push_back(scaled);
        out.totalCenti += scaled;
    }
    return out;
}

/**
 * @brief Upper bound on the items one employee can add to a window
 * @details Maximum over the employee's producing roles of the role's output
 *          times the total contrib factor of the chains it belongs to (1 for
 *          roles outside chains). No rounding is applied.
 */
inline double employeeItemCapacity(const SchedulerInput& input, std::size_t employee,
                                   double hours)
{
    double best = 0.0;
    for (int r : input.eligibleRoles(employee)) {
        const Role& role = input.roles()[static_cast<std::size_t>(r)];
        if (!role.producing) continue;
        double factor = input.inAnyChain(static_cast<std::size_t>(r)) ? 0.0 : 1.0;
        for (std::size_t c = 0; c < input.chains().size(); ++c) {
            for (int member : input.chainRoles(c)) {
                if (member == r) factor += input.chains()[c].contribFactor;
            }
        }
        best = std::max(best, *role.itemsPerEmployeePerHour * hours * factor);
    }
    return best;
}

} // namespace shiftopt
