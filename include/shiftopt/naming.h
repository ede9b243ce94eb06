#pragma once
/*
===============================================================================
NAMING — Symbolic names for scheduler variables and constraints
===============================================================================

OVERVIEW
--------
Two flavours of name generation, sharing one implementation:

    make_name::   Debug-aware. Returns "" unless SHIFTOPT_DEBUG (or _DEBUG)
                  is defined, so release models carry no variable names.
    force_name::  Always produces the name.

Constraint names are always forced: the infeasibility diagnosis maps each
constraint of an IIS back to its family through the prefix before '['
("coverage[2,17]" belongs to the family "coverage"). Variable names are
only needed when a model is written out for inspection.

CONVENTIONS
-----------
    index style:  assign_3_17
    math style:   assign[3,17]

USAGE EXAMPLES
--------------
    make_name::math("assign", 3, 17);          // "" in release builds
    force_name::math("rest", std::vector{1, 4, 6});   // "rest[1,4,6]"
    family_of("coverage[2,17]");               // "coverage"

EXCEPTION SAFETY
----------------
• Empty base with indices throws std::invalid_argument
• std::format errors propagate

===============================================================================
*/

#include <concepts>
#include <format>
#include <ranges>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#if defined(SHIFTOPT_DEBUG) || defined(_DEBUG)
inline constexpr bool SHIFTOPT_DEBUG_NAMES = true;
#else
inline constexpr bool SHIFTOPT_DEBUG_NAMES = false;
#endif

namespace shiftopt {

/// @brief True when debug naming is compiled in
[[nodiscard]] constexpr bool naming_enabled() noexcept {
    return SHIFTOPT_DEBUG_NAMES;
}

namespace naming_detail {

    template<typename T>
    concept Integral = std::is_integral_v<std::remove_cvref_t<T>>;

    template<typename R>
    concept IndexRange =
        std::ranges::input_range<R> &&
        Integral<std::ranges::range_value_t<R>>;

    inline void check_base_name(std::string_view base, bool has_indices) {
        if (has_indices && base.empty()) {
            throw std::invalid_argument(
                "naming: base name cannot be empty when indices are present");
        }
    }

    template<IndexRange R>
    std::string join(std::string_view base, const R& idx,
                     std::string_view open, char sep, std::string_view close) {
        bool has_indices = std::ranges::begin(idx) != std::ranges::end(idx);
        check_base_name(base, has_indices);
        if (!has_indices) {
            return std::string(base);
        }

        std::string result(base);
        result.append(open);
        bool first = true;
        for (auto i : idx) {
            if (!first) {
                result.push_back(sep);
            }
            first = false;
            result.append(std::to_string(static_cast<long long>(i)));
        }
        result.append(close);
        return result;
    }

    template<Integral... I>
    std::string math_impl(std::string_view base, I... idx) {
        const long long values[] = { static_cast<long long>(idx)..., 0 };
        return join(base, std::views::counted(values, sizeof...(idx)), "[", ',', "]");
    }

    template<Integral... I>
    std::string index_impl(std::string_view base, I... idx) {
        const long long values[] = { static_cast<long long>(idx)..., 0 };
        return join(base, std::views::counted(values, sizeof...(idx)), "_", '_', "");
    }

} // namespace naming_detail

// ============================================================================
// make_name (debug only)
// ============================================================================
namespace make_name {

    template<naming_detail::Integral... I>
    std::string math(std::string_view base, I... idx) {
        if constexpr (!SHIFTOPT_DEBUG_NAMES) {
            return {};
        } else {
            return naming_detail::math_impl(base, idx...);
        }
    }

    template<naming_detail::IndexRange R>
    std::string math(std::string_view base, const R& idx) {
        if constexpr (!SHIFTOPT_DEBUG_NAMES) {
            return {};
        } else {
            return naming_detail::join(base, idx, "[", ',', "]");
        }
    }

    template<naming_detail::Integral... I>
    std::string index(std::string_view base, I... idx) {
        if constexpr (!SHIFTOPT_DEBUG_NAMES) {
            return {};
        } else {
            return naming_detail::index_impl(base, idx...);
        }
    }

} // namespace make_name

// ============================================================================
// force_name (always on)
// ============================================================================
namespace force_name {

    template<naming_detail::Integral... I>
    std::string math(std::string_view base, I... idx) {
        return naming_detail::math_impl(base, idx...);
    }

    template<naming_detail::IndexRange R>
    std::string math(std::string_view base, const R& idx) {
        return naming_detail::join(base, idx, "[", ',', "]");
    }

    template<naming_detail::Integral... I>
    std::string index(std::string_view base, I... idx) {
        return naming_detail::index_impl(base, idx...);
    }

    template<typename... Args>
    std::string format(std::format_string<Args...> fmt, Args&&... args) {
        return std::format(fmt, std::forward<Args>(args)...);
    }

} // namespace force_name

/**
 * @brief Family part of a generated name
 * @return Text before the first '[' (or '_' followed by a digit); whole name
 *         when neither is present
 *
 * @example
 *     family_of("min_shift_length[0,4]");   // "min_shift_length"
 *     family_of("hours_dev_2_0");            // "hours_dev"
 */
inline std::string family_of(std::string_view name) {
    auto bracket = name.find('[');
    if (bracket != std::string_view::npos) {
        return std::string(name.substr(0, bracket));
    }
    for (std::size_t i = 0; i + 1 < name.size(); ++i) {
        if (name[i] == '_' && name[i + 1] >= '0' && name[i + 1] <= '9') {
            return std::string(name.substr(0, i));
        }
    }
    return std::string(name);
}

} // namespace shiftopt
