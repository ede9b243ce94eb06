#pragma once
/*
===============================================================================
ERROR — Exception types raised by the scheduling engine
===============================================================================

OVERVIEW
--------
Structurally invalid input is reported by throwing ConfigError at the moment
it is detected (construction of SchedulerInput, DemandForecast validation,
grid building). Infeasibility and budget exhaustion are NOT errors: they are
reported through SolveResult::status.

Solver failures (missing licence, out of memory) surface as GRBException
unchanged. Table lookups with unknown keys throw std::out_of_range.

USAGE EXAMPLES
--------------
    try {
        shiftopt::SchedulerInput input(roles, employees, chains, config);
    } catch (const shiftopt::ConfigError& e) {
        std::cerr << e.what() << "\n";
    }

===============================================================================
*/

#include <format>
#include <stdexcept>
#include <string>
#include <utility>

namespace shiftopt {

/**
 * @brief Raised for structurally invalid scheduling input
 *
 * @details Derives from std::invalid_argument so generic handlers that
 *          already catch invalid_argument keep working.
 */
class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& what)
        : std::invalid_argument(what) {}

    /// @brief Build the message with std::format
    template <typename... Args>
    static ConfigError make(std::format_string<Args...> fmt, Args&&... args) {
        return ConfigError(std::format(fmt, std::forward<Args>(args)...));
    }
};

} // namespace shiftopt
