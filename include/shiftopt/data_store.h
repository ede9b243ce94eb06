#pragma once
/*
===============================================================================
DATA STORE — Typed key/value record of session parameters and statistics
===============================================================================

OVERVIEW
--------
Every solver parameter a SchedulerSession applies is recorded under
"param:<GurobiName>", and the figures gathered after a solve under
"stats:<name>". The store travels into SolveStats so callers can see
exactly which limits were in force for a given result.

KEY COMPONENTS
--------------
• Value      — std::any wrapper with checked and defaulted access
• DataStore  — ordered map std::string -> Value (sorted for stable reports)
• describeValue() — text rendering for int/double/bool/string values

USAGE EXAMPLES
--------------
    DataStore store;
    store["param:TimeLimit"] = 30.0;
    double limit = store["param:TimeLimit"].get_or(0.0);

    for (const auto& [key, value] : store)
        std::cout << key << " = " << describeValue(value) << "\n";

THREAD SAFETY
-------------
• Not synchronized. Each session owns its own store.

EXCEPTION SAFETY
----------------
• get<T>() throws std::bad_any_cast on type mismatch
• get_or<T>() never throws on mismatch

===============================================================================
*/

#include <any>
#include <format>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <utility>

namespace shiftopt {

/**
 * @class Value
 * @brief Type-erased value with safe access helpers
 *
 * @note Character arrays are stored as const char*; store std::string
 *       explicitly when the text must be read back as a string.
 */
class Value
{
    std::any storage;

public:
    Value() = default;

    template <typename T>
        requires (!std::is_same_v<std::decay_t<T>, Value>)
    Value(T&& v)
        : storage(std::forward<T>(v))
    {
    }

    template <typename T>
        requires (!std::is_same_v<std::decay_t<T>, Value>)
    Value& operator=(T&& v)
    {
        storage = std::forward<T>(v);
        return *this;
    }

    bool has_value() const noexcept { return storage.has_value(); }

    const std::type_info& type() const noexcept { return storage.type(); }

    /// @brief Exact type match (no conversions)
    template <typename T>
    bool is() const noexcept
    {
        return storage.type() == typeid(T);
    }

    /// @brief Reference to the value when it holds a T, nullopt otherwise
    template <typename T>
    std::optional<std::reference_wrapper<const T>> try_get() const noexcept
    {
        if (!is<T>())
            return std::nullopt;
        return std::cref(*std::any_cast<T>(&storage));
    }

    /// @throws std::bad_any_cast if the stored type is not T
    template <typename T>
    T& get()
    {
        return std::any_cast<T&>(storage);
    }

    /// @throws std::bad_any_cast if the stored type is not T
    template <typename T>
    const T& get() const
    {
        return std::any_cast<const T&>(storage);
    }

    /**
     * @brief Stored value, or default_value when empty or of another type
     *
     * @example
     *     Value v = 3;
     *     v.get_or(0.0);   // 0.0, an int is not a double
     */
    template <typename T>
    T get_or(const T& default_value) const
    {
        if (is<T>())
            return get<T>();
        return default_value;
    }

    void reset() noexcept { storage.reset(); }
};

/// @brief Sorted string-keyed map of Values
using DataStore = std::map<std::string, Value>;

/**
 * @brief Human-readable rendering of a stored value
 * @return The value for int, long long, double, bool and string payloads;
 *         "<type>" placeholder otherwise, "" when empty
 */
inline std::string describeValue(const Value& v)
{
    if (!v.has_value())
        return {};
    if (auto i = v.try_get<int>())
        return std::to_string(i->get());
    if (auto l = v.try_get<long long>())
        return std::to_string(l->get());
    if (auto d = v.try_get<double>())
        return std::format("{}", d->get());
    if (auto b = v.try_get<bool>())
        return b->get() ? "true" : "false";
    if (auto s = v.try_get<std::string>())
        return s->get();
    return std::format("<{}>", v.type().name());
}

} // namespace shiftopt
