#pragma once
/*
===============================================================================
FORECAST — Hourly demand consumed by the scheduler
===============================================================================

OVERVIEW
--------
DemandForecast is plain data produced elsewhere (a forecasting service);
the scheduler only reads it. The horizon is the list of forecast days:
day d falls on weekday (firstWeekday + d) mod 7 and in week d / 7.

Each day holds 24 hourly (order_count, item_count) pairs. Items drive the
supply constraints, orders are carried through for reporting.

USAGE EXAMPLES
--------------
    auto demand = DemandForecast::zero(7, Weekday::Monday);
    demand.at(0, 12).itemCount = 40;
    double lunch = demand.itemsBetween(0, 11.5, 13.0);   // pro-rated

===============================================================================
*/

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <format>
#include <stdexcept>
#include <vector>

#include "domain.h"
#include "enum_utils.h"
#include "error.h"

namespace shiftopt {

struct HourlyDemand {
    long long orderCount = 0;
    long long itemCount = 0;
};

using DayDemand = std::array<HourlyDemand, 24>;

class DemandForecast {
public:
    Weekday firstWeekday = Weekday::Monday;
    std::vector<DayDemand> days;

    /// @brief Forecast of `numDays` days with no demand at all
    static DemandForecast zero(std::size_t numDays, Weekday first = Weekday::Monday) {
        DemandForecast f;
        f.firstWeekday = first;
        f.days.assign(numDays, DayDemand{});
        return f;
    }

    std::size_t numDays() const noexcept { return days.size(); }

    Weekday weekdayOf(std::size_t day) const noexcept {
        return weekdayAfter(firstWeekday, day);
    }

    HourlyDemand& at(std::size_t day, int hour) {
        if (day >= days.size() || hour < 0 || hour >= 24) {
            throw std::out_of_range(
                std::format("DemandForecast::at: day {} hour {} outside horizon", day, hour));
        }
        return days[day][static_cast<std::size_t>(hour)];
    }

    const HourlyDemand& at(std::size_t day, int hour) const {
        return const_cast<DemandForecast*>(this)->at(day, hour);
    }

    /**
     * @brief Items demanded in [start, end) of a day
     * @details Hours partially covered contribute pro rata, so a 30 minute
     *          window over an hour of 40 items demands 20 items.
     */
    double itemsBetween(std::size_t day, double start, double end) const {
        return between(day, start, end, [](const HourlyDemand& h) { return h.itemCount; });
    }

    double ordersBetween(std::size_t day, double start, double end) const {
        return between(day, start, end, [](const HourlyDemand& h) { return h.orderCount; });
    }

    long long totalItems(std::size_t day) const {
        long long n = 0;
        for (const auto& h : days.at(day)) n += h.itemCount;
        return n;
    }

    long long totalItems() const {
        long long n = 0;
        for (std::size_t d = 0; d < days.size(); ++d) n += totalItems(d);
        return n;
    }

    /// @throws ConfigError on negative counts
    void validate() const {
        for (std::size_t d = 0; d < days.size(); ++d) {
            for (int h = 0; h < 24; ++h) {
                const auto& v = days[d][static_cast<std::size_t>(h)];
                if (v.orderCount < 0 || v.itemCount < 0) {
                    throw ConfigError::make(
                        "demand on day {} hour {} is negative", d, h);
                }
            }
        }
    }

private:
    template <typename Pick>
    double between(std::size_t day, double start, double end, Pick pick) const {
        const DayDemand& dd = days.at(day);
        double total = 0.0;
        int first = static_cast<int>(std::floor(start));
        int last = static_cast<int>(std::ceil(end));
        for (int h = std::max(first, 0); h < std::min(last, 24); ++h) {
            double lo = std::max(start, static_cast<double>(h));
            double hi = std::min(end, static_cast<double>(h + 1));
            if (hi > lo) {
                total += static_cast<double>(pick(dd[static_cast<std::size_t>(h)])) * (hi - lo);
            }
        }
        return total;
    }
};

} // namespace shiftopt
