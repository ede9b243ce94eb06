#pragma once
/*
===============================================================================
ENUM UTILS — Enumerations with a compile-time count for shiftopt
===============================================================================

OVERVIEW
--------
SHIFTOPT_ENUM_WITH_COUNT declares an enum class with a trailing COUNT
sentinel and a matching <Name>_COUNT constant. The variable and constraint
registries of the scheduler (SchedVar, SchedCons) and the Weekday type are
declared with it, which lets VariableTable / ConstraintTable size their
storage at compile time and lets per-weekday data live in std::array.

KEY COMPONENTS
--------------
• SHIFTOPT_ENUM_WITH_COUNT: enum class + COUNT + <Name>_COUNT
• enum_size<E>: uniform size trait
• enum_index(), is_valid_enum_value(), enum_from_value()
• for_each_enum(): visit every enumerator in declaration order
• Weekday plus weekdayName()

USAGE EXAMPLES
--------------
    SHIFTOPT_ENUM_WITH_COUNT(Shade, Light, Dark);
    std::array<int, Shade_COUNT> counts{};
    counts[enum_index(Shade::Dark)] += 1;

    for_each_enum<Weekday>([](Weekday d) { std::cout << weekdayName(d); });

THREAD SAFETY
-------------
• Everything here is constexpr or stateless

===============================================================================
*/

#include <cstddef>
#include <string_view>

/**
 * @macro SHIFTOPT_ENUM_WITH_COUNT
 * @brief Declares an enum class with automatic COUNT sentinel
 *
 * @details Expands to
 *     enum class Name { ..., COUNT };
 *     static constexpr std::size_t Name_COUNT = <number of enumerators>;
 *
 * @warning Do not list COUNT yourself. Values are sequential from 0.
 */
#define SHIFTOPT_ENUM_WITH_COUNT(Name, ...)                               \
    enum class Name { __VA_ARGS__, COUNT };                               \
    static constexpr std::size_t Name##_COUNT =                           \
        static_cast<std::size_t>(Name::COUNT)

namespace shiftopt {

/// @brief Number of enumerators (COUNT sentinel excluded)
template<typename Enum>
struct enum_size {
    static constexpr std::size_t value = static_cast<std::size_t>(Enum::COUNT);
};

/// @brief Position of an enumerator, usable as an array index
template<typename Enum>
constexpr std::size_t enum_index(Enum value) noexcept {
    return static_cast<std::size_t>(value);
}

/**
 * @brief True if value names a real enumerator (not COUNT, not out of range)
 *
 * @example
 *     is_valid_enum_value(static_cast<Weekday>(9));  // false
 */
template<typename Enum>
constexpr bool is_valid_enum_value(Enum value) noexcept {
    return static_cast<std::size_t>(value) < enum_size<Enum>::value;
}

/**
 * @brief Convert an integral position back to the enumeration
 * @pre value < enum_size<Enum>::value
 */
template<typename Enum>
constexpr Enum enum_from_value(std::size_t value) noexcept {
    return static_cast<Enum>(value);
}

/// @brief Call fn(e) for every enumerator in declaration order
template<typename Enum, typename Fn>
constexpr void for_each_enum(Fn&& fn) {
    for (std::size_t i = 0; i < enum_size<Enum>::value; ++i) {
        fn(enum_from_value<Enum>(i));
    }
}

// ============================================================================
// WEEKDAY
// ============================================================================

SHIFTOPT_ENUM_WITH_COUNT(Weekday,
    Monday, Tuesday, Wednesday, Thursday, Friday, Saturday, Sunday);

static_assert(Weekday_COUNT == 7, "a week has seven days");

/// @brief Weekday reached after `offset` days from `start`
constexpr Weekday weekdayAfter(Weekday start, std::size_t offset) noexcept {
    return enum_from_value<Weekday>((enum_index(start) + offset) % Weekday_COUNT);
}

/// @brief English name of a weekday ("Monday" ... "Sunday")
constexpr std::string_view weekdayName(Weekday d) noexcept {
    switch (d) {
        case Weekday::Monday:    return "Monday";
        case Weekday::Tuesday:   return "Tuesday";
        case Weekday::Wednesday: return "Wednesday";
        case Weekday::Thursday:  return "Thursday";
        case Weekday::Friday:    return "Friday";
        case Weekday::Saturday:  return "Saturday";
        case Weekday::Sunday:    return "Sunday";
        default:                 return "?";
    }
}

} // namespace shiftopt
