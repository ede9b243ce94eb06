#pragma once
/*
===============================================================================
GRID — Discretisation of the horizon into scheduling windows
===============================================================================

OVERVIEW
--------
Turns the configuration and the forecast horizon into the ordered list of
windows every variable and constraint is indexed by.

    uniform mode:  ceil(24 / slot_len) windows per active day, the last one
                   clipped at midnight; every window is one slot
    fixed mode:    the configured shifts of each active day, sorted by start;
                   a shift spans ceil(hours / slot_len) slots

A horizon day is active when some employee is available on its weekday, the
forecast has demand on it, or opening hours are configured for it.

A window is *staffed* when it overlaps the opening hours of its weekday. When
no opening hours are configured at all, windows with forecast demand are the
staffed ones. Roles with min_present > 0 are mandatory in staffed windows.

USAGE EXAMPLES
--------------
    TimeGrid grid = buildGrid(input, demand);
    for (int w : grid.windowsOfDay(0))
        std::cout << grid.window(w).label << "\n";

EXCEPTION SAFETY
----------------
• ConfigError when min_shift_length_slots exceeds the slots of a day
• ConfigError for fixed_shifts without shift definitions
• ConfigError for negative forecast counts

===============================================================================
*/

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <format>
#include <map>
#include <string>
#include <vector>

#include "domain.h"
#include "enum_utils.h"
#include "error.h"
#include "forecast.h"

namespace shiftopt {

/// @brief One scheduling window of one horizon day
struct Window {
    int index = 0;             ///< Position in TimeGrid::windows()
    std::size_t day = 0;       ///< Horizon day
    Weekday weekday = Weekday::Monday;
    int position = 0;          ///< Order within its day
    double start = 0.0;
    double end = 0.0;
    int slots = 1;             ///< Length in slots
    std::string label;         ///< "HH:MM-HH:MM" or the shift name
    bool staffed = false;

    double hours() const noexcept { return end - start; }
};

/// @brief "08:30" style rendering of an hour value
inline std::string clockLabel(double hour) {
    long long minutes = std::llround(hour * 60.0);
    return std::format("{:02}:{:02}", minutes / 60, minutes % 60);
}

class TimeGrid {
public:
    TimeGrid() = default;

    TimeGrid(std::vector<Window> windows, std::size_t horizonDays,
             double slotLen, int slotsPerDay)
        : windows_(std::move(windows)),
          horizonDays_(horizonDays),
          slotLen_(slotLen),
          slotsPerDay_(slotsPerDay)
    {
        for (const auto& w : windows_) {
            byDay_[w.day].push_back(w.index);
        }
    }

    const std::vector<Window>& windows() const noexcept { return windows_; }
    const Window& window(int w) const { return windows_.at(static_cast<std::size_t>(w)); }
    std::size_t size() const noexcept { return windows_.size(); }
    bool empty() const noexcept { return windows_.empty(); }

    /// @brief Window indices of a day in time order (empty for inactive days)
    const std::vector<int>& windowsOfDay(std::size_t day) const {
        static const std::vector<int> none;
        auto it = byDay_.find(day);
        return it == byDay_.end() ? none : it->second;
    }

    /// @brief Active days in increasing order
    std::vector<std::size_t> activeDays() const {
        std::vector<std::size_t> out;
        for (const auto& [d, ws] : byDay_) out.push_back(d);
        return out;
    }

    std::size_t horizonDays() const noexcept { return horizonDays_; }
    std::size_t numWeeks() const noexcept { return (horizonDays_ + 6) / 7; }
    static std::size_t weekOf(std::size_t day) noexcept { return day / 7; }

    /// @brief Number of horizon days falling in week k
    std::size_t daysInWeek(std::size_t k) const noexcept {
        std::size_t first = k * 7;
        if (first >= horizonDays_) return 0;
        return std::min<std::size_t>(7, horizonDays_ - first);
    }

    double slotLen() const noexcept { return slotLen_; }
    int slotsPerDay() const noexcept { return slotsPerDay_; }

    /// @brief True when b starts exactly where a ends on the same day
    bool adjacent(int a, int b) const {
        const Window& wa = window(a);
        const Window& wb = window(b);
        return wa.day == wb.day && std::abs(wb.start - wa.end) < kHourEps;
    }

    /// @brief True when b starts exactly where a ends, midnight included
    bool continues(int a, int b) const {
        return std::abs(idleSlotsBetween(a, b)) < kHourEps;
    }

    /// @brief Idle time between the end of a and the start of b, in slots
    double idleSlotsBetween(int a, int b) const {
        const Window& wa = window(a);
        const Window& wb = window(b);
        double gap = (wb.start + 24.0 * static_cast<double>(wb.day))
                   - (wa.end + 24.0 * static_cast<double>(wa.day));
        return gap / slotLen_;
    }

private:
    std::vector<Window> windows_;
    std::map<std::size_t, std::vector<int>> byDay_;
    std::size_t horizonDays_ = 0;
    double slotLen_ = 1.0;
    int slotsPerDay_ = 0;
};

namespace grid_detail {

    inline int slotsFor(double hours, double slotLen) {
        return std::max(1, static_cast<int>(std::ceil(hours / slotLen - 1e-9)));
    }

    inline bool dayIsActive(const SchedulerInput& input, const DemandForecast& demand,
                            std::size_t day) {
        Weekday wd = demand.weekdayOf(day);
        if (input.config().operatingHours[enum_index(wd)]) return true;
        if (demand.totalItems(day) > 0) return true;
        for (const auto& e : input.employees()) {
            if (e.availableOn(wd)) return true;
        }
        return false;
    }

} // namespace grid_detail

/// @brief Forecast demand falling inside one window
struct WindowDemand {
    double items = 0.0;
    double orders = 0.0;
};

inline WindowDemand windowDemand(const DemandForecast& demand, const Window& w) {
    return { demand.itemsBetween(w.day, w.start, w.end),
             demand.ordersBetween(w.day, w.start, w.end) };
}

/**
 * @brief Build the window grid for an input and a forecast horizon
 * @throws ConfigError (see file header)
 */
inline TimeGrid buildGrid(const SchedulerInput& input, const DemandForecast& demand)
{
    demand.validate();
    const SchedulerConfig& cfg = input.config();

    struct Span { double start, end; int slots; std::string label; };
    std::vector<Span> pattern;

    if (cfg.fixedShifts) {
        if (cfg.shifts.empty()) {
            throw ConfigError("fixed_shifts requires at least one shift definition");
        }
        for (const auto& s : cfg.shifts) {
            pattern.push_back({ s.hours.start, s.hours.end,
                                grid_detail::slotsFor(s.hours.hours(), cfg.slotLenHour), s.name });
        }
        std::sort(pattern.begin(), pattern.end(),
                  [](const Span& a, const Span& b) { return a.start < b.start; });
    }
    else {
        int n = grid_detail::slotsFor(24.0, cfg.slotLenHour);
        for (int i = 0; i < n; ++i) {
            double s = i * cfg.slotLenHour;
            double e = std::min(24.0, (i + 1) * cfg.slotLenHour);
            pattern.push_back({ s, e, 1, clockLabel(s) + "-" + clockLabel(e) });
        }
    }

    int slotsPerDay = 0;
    for (const auto& p : pattern) slotsPerDay += p.slots;
    if (cfg.minShiftLengthSlots > slotsPerDay) {
        throw ConfigError::make(
            "min_shift_length_slots ({}) exceeds the {} slots of a day",
            cfg.minShiftLengthSlots, slotsPerDay);
    }

    const bool openingDriven = cfg.hasOperatingHours();
    std::vector<Window> windows;
    for (std::size_t d = 0; d < demand.numDays(); ++d) {
        if (!grid_detail::dayIsActive(input, demand, d)) continue;

        Weekday wd = demand.weekdayOf(d);
        const auto& open = cfg.operatingHours[enum_index(wd)];
        int position = 0;
        for (const auto& p : pattern) {
            Window w;
            w.index = static_cast<int>(windows.size());
            w.day = d;
            w.weekday = wd;
            w.position = position++;
            w.start = p.start;
            w.end = p.end;
            w.slots = p.slots;
            w.label = p.label;
            if (openingDriven) {
                w.staffed = open && open->overlap(p.start, p.end) > kHourEps;
            }
            else {
                w.staffed = windowDemand(demand, w).items > 0.0;
            }
            windows.push_back(std::move(w));
        }
    }

    return TimeGrid(std::move(windows), demand.numDays(), cfg.slotLenHour, slotsPerDay);
}

} // namespace shiftopt
