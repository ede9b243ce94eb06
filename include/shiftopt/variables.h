#pragma once
/*
===============================================================================
VARIABLES — Sparse decision-variable sets and the enum-keyed registry
===============================================================================

OVERVIEW
--------
The scheduling model is sparse by nature: an assignment variable exists only
for (employee, window) pairs where the employee is available, a role variable
only for the roles the employee holds, and so on. Every variable family is
therefore stored as an IndexedVariableSet: a flat list of (GRBVar, index)
entries plus a hash map for O(1) lookup by index tuple.

KEY COMPONENTS
--------------
• IndexedVariableSet  — variables keyed by arbitrary integer tuples
• VariableFactory     — creates a variable in the model and records it in a set
• VariableTable<E>    — one IndexedVariableSet per enumerator of E
• value(), values(), valueOr() — solution extraction

USAGE EXAMPLES
--------------
    IndexedVariableSet assign;
    VariableFactory::addTo(assign, model, GRB_BINARY, 0, 1, "assign", {e, w});

    VariableTable<SchedVar> vars;
    vars.set(SchedVar::Assign, std::move(assign));

    GRBVar& x = vars.var(SchedVar::Assign, e, w);     // throws if absent
    GRBVar* y = vars.get(SchedVar::Assign).try_get(e, w + 1);   // nullptr if absent

    double hours = valueOr(y, 0.0);

DEPENDENCIES
------------
• "gurobi_c++.h" — Gurobi C++ API
• "naming.h"     — debug-aware variable names
• "enum_utils.h" — COUNT-sentinel enums

EXCEPTION SAFETY
----------------
• Missing indices throw std::out_of_range from at(); try_get() returns nullptr
• Duplicate indices throw std::invalid_argument from VariableFactory::addTo()
• Solution queries propagate GRBException when no solution is loaded

===============================================================================
*/

#include <array>
#include <cmath>
#include <cstddef>
#include <format>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "gurobi_c++.h"
#include "naming.h"
#include "enum_utils.h"

namespace shiftopt {

    class VariableFactory; // forward declaration

    namespace index_key {

        /// @brief Lookup key "i_j_k" for an index tuple
        inline std::string fromVector(const std::vector<int>& idx) {
            std::string key;
            for (std::size_t k = 0; k < idx.size(); ++k) {
                if (k > 0) {
                    key.push_back('_');
                }
                key.append(std::to_string(idx[k]));
            }
            return key;
        }

        template<typename... I>
        std::string fromPack(I... idx) {
            static_assert((std::is_integral_v<I> && ...),
                "index_key::fromPack: indices must be integral");
            return fromVector(std::vector<int>{ static_cast<int>(idx)... });
        }

    } // namespace index_key

    // ============================================================================
    // INDEXED VARIABLE SET
    // ============================================================================
    /**
     * @class IndexedVariableSet
     * @brief Variables keyed by integer tuples of any arity
     *
     * @details The tuple arity is decided by the caller. A family with a single
     *          scalar member uses the empty tuple.
     */
    class IndexedVariableSet {
    public:
        struct Entry {
            GRBVar var;
            std::vector<int> index;
        };

    private:
        std::vector<Entry> entries;
        std::unordered_map<std::string, std::size_t> indexMap;

        void addEntry(GRBVar v, std::vector<int> idx) {
            std::string key = index_key::fromVector(idx);
            if (indexMap.contains(key)) {
                throw std::invalid_argument(
                    std::format("IndexedVariableSet: index [{}] added twice", key));
            }
            indexMap.emplace(std::move(key), entries.size());
            entries.push_back(Entry{ std::move(v), std::move(idx) });
        }

    public:
        IndexedVariableSet() = default;

        [[nodiscard]] std::size_t size() const noexcept { return entries.size(); }
        [[nodiscard]] bool empty() const noexcept { return entries.empty(); }

        using iterator = std::vector<Entry>::iterator;
        using const_iterator = std::vector<Entry>::const_iterator;

        iterator begin() noexcept { return entries.begin(); }
        iterator end() noexcept { return entries.end(); }
        const_iterator begin() const noexcept { return entries.begin(); }
        const_iterator end() const noexcept { return entries.end(); }

        const std::vector<Entry>& all() const noexcept { return entries; }

        /**
         * @brief Access a variable by its indices
         * @throws std::out_of_range if the tuple is not in the set
         */
        template<typename... I>
        GRBVar& at(I... idx) {
            std::string key = index_key::fromPack(idx...);
            auto it = indexMap.find(key);
            if (it == indexMap.end()) {
                throw std::out_of_range(
                    std::format("IndexedVariableSet::at: index [{}] not found", key));
            }
            return entries[it->second].var;
        }

        template<typename... I>
        const GRBVar& at(I... idx) const {
            return const_cast<IndexedVariableSet*>(this)->at(idx...);
        }

        template<typename... I>
        GRBVar& operator()(I... idx) { return at(idx...); }

        template<typename... I>
        const GRBVar& operator()(I... idx) const { return at(idx...); }

        /// @brief Pointer to the variable, nullptr if the tuple is absent
        template<typename... I>
        GRBVar* try_get(I... idx) {
            auto it = indexMap.find(index_key::fromPack(idx...));
            if (it == indexMap.end()) {
                return nullptr;
            }
            return &entries[it->second].var;
        }

        template<typename... I>
        const GRBVar* try_get(I... idx) const {
            return const_cast<IndexedVariableSet*>(this)->try_get(idx...);
        }

        template<typename... I>
        bool contains(I... idx) const {
            return indexMap.contains(index_key::fromPack(idx...));
        }

        /// @brief fn(GRBVar&, const std::vector<int>&) for every entry
        template<typename Fn>
        void forEach(Fn&& fn) {
            for (auto& e : entries) {
                fn(e.var, e.index);
            }
        }

        template<typename Fn>
        void forEach(Fn&& fn) const {
            for (const auto& e : entries) {
                fn(e.var, e.index);
            }
        }

    private:
        friend class VariableFactory;
    };

    // ============================================================================
    // VARIABLE FACTORY
    // ============================================================================
    /**
     * @class VariableFactory
     * @brief Adds variables to a GRBModel and records them in a set
     *
     * @details Names follow make_name::math, so they are empty unless debug
     *          naming is compiled in.
     */
    class VariableFactory {
    public:
        /**
         * @brief Create one variable and store it under idx
         * @param set   Destination set
         * @param model Model receiving the variable
         * @param type  GRB_BINARY, GRB_INTEGER or GRB_CONTINUOUS
         * @param lb    Lower bound
         * @param ub    Upper bound
         * @param base  Family name used for debug naming
         * @param idx   Index tuple
         * @return Copy of the created handle
         * @throws std::invalid_argument if idx is already present or lb > ub
         */
        static GRBVar addTo(IndexedVariableSet& set, GRBModel& model,
                            char type, double lb, double ub,
                            std::string_view base, std::vector<int> idx) {
            if (lb > ub) {
                throw std::invalid_argument(std::format(
                    "VariableFactory::addTo: {} has lb {} > ub {}", base, lb, ub));
            }
            GRBVar v = model.addVar(lb, ub, 0.0, type, make_name::math(base, idx));
            set.addEntry(v, std::move(idx));
            return v;
        }

        /**
         * @brief Same as addTo() but the name is always generated
         * @details For families whose bounds must stay identifiable in an IIS.
         */
        static GRBVar addNamedTo(IndexedVariableSet& set, GRBModel& model,
                                 char type, double lb, double ub,
                                 std::string_view base, std::vector<int> idx) {
            GRBVar v = addTo(set, model, type, lb, ub, base, idx);
            v.set(GRB_StringAttr_VarName, force_name::math(base, idx));
            return v;
        }

        /// @brief Convenience overload taking a braced index list
        static GRBVar addTo(IndexedVariableSet& set, GRBModel& model,
                            char type, double lb, double ub,
                            std::string_view base, std::initializer_list<int> idx) {
            return addTo(set, model, type, lb, ub, base, std::vector<int>(idx));
        }
    };

    // ============================================================================
    // VARIABLE TABLE
    // ============================================================================
    /**
     * @class VariableTable
     * @brief Enum-keyed registry of variable families
     *
     * @tparam EnumT Enum declared with SHIFTOPT_ENUM_WITH_COUNT
     */
    template<
        typename EnumT,
        std::size_t MAX = static_cast<std::size_t>(EnumT::COUNT)>
    class VariableTable {
    private:
        std::array<IndexedVariableSet, MAX> table_;

        static std::size_t slot(EnumT key, const char* where) {
            std::size_t idx = static_cast<std::size_t>(key);
            if (idx >= MAX) {
                throw std::out_of_range(
                    std::format("VariableTable::{}: key {} >= {}", where, idx, MAX));
            }
            return idx;
        }

    public:
        void set(EnumT key, IndexedVariableSet&& family) {
            table_[slot(key, "set")] = std::move(family);
        }

        IndexedVariableSet& get(EnumT key) { return table_[slot(key, "get")]; }
        const IndexedVariableSet& get(EnumT key) const { return table_[slot(key, "get")]; }

        IndexedVariableSet& operator()(EnumT key) { return get(key); }
        const IndexedVariableSet& operator()(EnumT key) const { return get(key); }

        /**
         * @brief Direct access to one variable of a family
         * @throws std::out_of_range for an unknown key or absent tuple
         *
         * @example
         *     GRBVar& h = vars.var(SchedVar::Headcount, r, w);
         *     GRBVar& m = vars.var(SchedVar::MaxHours);        // scalar family
         */
        template<typename... I>
        GRBVar& var(EnumT key, I... idx) {
            return table_[slot(key, "var")].at(idx...);
        }

        template<typename... I>
        const GRBVar& var(EnumT key, I... idx) const {
            return table_[slot(key, "var")].at(idx...);
        }

        bool isEmpty(EnumT key) const { return get(key).empty(); }

        /// @brief Total number of variables over all families
        std::size_t totalSize() const noexcept {
            std::size_t n = 0;
            for (const auto& s : table_) {
                n += s.size();
            }
            return n;
        }
    };

    // ============================================================================
    // SOLUTION EXTRACTION
    // ============================================================================

    /// @brief Solution value of a variable (GRB_DoubleAttr_X)
    inline double value(const GRBVar& v) {
        return v.get(GRB_DoubleAttr_X);
    }

    /// @brief Solution value, or fallback when the variable does not exist
    inline double valueOr(const GRBVar* v, double fallback) {
        return v ? value(*v) : fallback;
    }

    /// @brief Solution value rounded to the nearest integer
    inline long long roundedValue(const GRBVar& v) {
        return std::llround(v.get(GRB_DoubleAttr_X));
    }

    /// @brief True when a binary variable is set in the loaded solution
    inline bool isSet(const GRBVar* v) {
        return v && value(*v) > 0.5;
    }

    /// @brief Solution values of a whole family in storage order
    inline std::vector<double> values(const IndexedVariableSet& vs) {
        std::vector<double> result;
        result.reserve(vs.size());
        for (const auto& entry : vs.all()) {
            result.push_back(value(entry.var));
        }
        return result;
    }

} // namespace shiftopt
