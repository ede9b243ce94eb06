#pragma once
/*
===============================================================================
CONSTRAINTS — Named constraint families and the enum-keyed registry
===============================================================================

OVERVIEW
--------
Mirrors variables.h for constraints. Each hard-constraint class of the
scheduling model (coverage, rest, weekly hours, ...) is one
IndexedConstraintSet, and every member is named "<family>[i,j,...]"
regardless of build type. The names are what lets an IIS be traced back to
the constraint class that caused infeasibility.

KEY COMPONENTS
--------------
• IndexedConstraintSet  — constraints keyed by integer tuples
• ConstraintFactory     — adds a GRBTempConstr under a forced name
• ConstraintTable<E>    — one IndexedConstraintSet per enumerator of E
• slack(), constrName() — attribute helpers

USAGE EXAMPLES
--------------
    IndexedConstraintSet rest;
    ConstraintFactory::addTo(rest, model, x1 + x2 <= 1, "rest", {e, w1, w2});

    ConstraintTable<SchedCons> cons;
    cons.set(SchedCons::Rest, std::move(rest));
    GRBConstr& c = cons.constr(SchedCons::Rest, e, w1, w2);

EXCEPTION SAFETY
----------------
• Missing tuples throw std::out_of_range from at()
• Duplicate tuples throw std::invalid_argument from addTo()

===============================================================================
*/

#include <array>
#include <cstddef>
#include <format>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "gurobi_c++.h"
#include "naming.h"
#include "enum_utils.h"
#include "variables.h"

namespace shiftopt {

    class ConstraintFactory; // forward declaration

    // ============================================================================
    // INDEXED CONSTRAINT SET
    // ============================================================================
    class IndexedConstraintSet {
    public:
        struct Entry {
            GRBConstr constr;
            std::vector<int> index;
        };

    private:
        std::vector<Entry> entries;
        std::unordered_map<std::string, std::size_t> indexMap;

        void addEntry(GRBConstr c, std::vector<int> idx) {
            std::string key = index_key::fromVector(idx);
            if (indexMap.contains(key)) {
                throw std::invalid_argument(
                    std::format("IndexedConstraintSet: index [{}] added twice", key));
            }
            indexMap.emplace(std::move(key), entries.size());
            entries.push_back(Entry{ std::move(c), std::move(idx) });
        }

    public:
        IndexedConstraintSet() = default;

        [[nodiscard]] std::size_t size() const noexcept { return entries.size(); }
        [[nodiscard]] bool empty() const noexcept { return entries.empty(); }

        using iterator = std::vector<Entry>::iterator;
        using const_iterator = std::vector<Entry>::const_iterator;

        iterator begin() noexcept { return entries.begin(); }
        iterator end() noexcept { return entries.end(); }
        const_iterator begin() const noexcept { return entries.begin(); }
        const_iterator end() const noexcept { return entries.end(); }

        [[nodiscard]] const std::vector<Entry>& all() const noexcept { return entries; }

        template<typename... I>
        GRBConstr& at(I... idx) {
            std::string key = index_key::fromPack(idx...);
            auto it = indexMap.find(key);
            if (it == indexMap.end()) {
                throw std::out_of_range(
                    std::format("IndexedConstraintSet::at: index [{}] not found", key));
            }
            return entries[it->second].constr;
        }

        template<typename... I>
        const GRBConstr& at(I... idx) const {
            return const_cast<IndexedConstraintSet*>(this)->at(idx...);
        }

        template<typename... I>
        GRBConstr& operator()(I... idx) { return at(idx...); }

        template<typename... I>
        GRBConstr* try_get(I... idx) {
            auto it = indexMap.find(index_key::fromPack(idx...));
            if (it == indexMap.end()) {
                return nullptr;
            }
            return &entries[it->second].constr;
        }

        template<typename... I>
        bool contains(I... idx) const {
            return indexMap.contains(index_key::fromPack(idx...));
        }

        template<typename Fn>
        void forEach(Fn&& fn) {
            for (auto& e : entries) {
                fn(e.constr, e.index);
            }
        }

        template<typename Fn>
        void forEach(Fn&& fn) const {
            for (const auto& e : entries) {
                fn(e.constr, e.index);
            }
        }

    private:
        friend class ConstraintFactory;
    };

    // ============================================================================
    // CONSTRAINT FACTORY
    // ============================================================================
    class ConstraintFactory {
    public:
        /**
         * @brief Add a constraint named "<base>[idx...]" and record it
         * @param set   Destination set
         * @param model Model receiving the constraint
         * @param expr  Constraint built with <=, >= or == on GRB expressions
         * @param base  Family name (also the IIS classification key)
         * @param idx   Index tuple
         * @return Copy of the created handle
         */
        static GRBConstr addTo(IndexedConstraintSet& set, GRBModel& model,
                               const GRBTempConstr& expr,
                               std::string_view base, std::vector<int> idx) {
            GRBConstr c = model.addConstr(expr, force_name::math(base, idx));
            set.addEntry(c, std::move(idx));
            return c;
        }

        static GRBConstr addTo(IndexedConstraintSet& set, GRBModel& model,
                               const GRBTempConstr& expr,
                               std::string_view base, std::initializer_list<int> idx) {
            return addTo(set, model, expr, base, std::vector<int>(idx));
        }
    };

    // ============================================================================
    // CONSTRAINT TABLE
    // ============================================================================
    /**
     * @class ConstraintTable
     * @brief Enum-keyed registry of constraint families
     *
     * @note Mirrors VariableTable.
     */
    template<
        typename EnumT,
        std::size_t MAX = static_cast<std::size_t>(EnumT::COUNT)>
    class ConstraintTable {
    private:
        std::array<IndexedConstraintSet, MAX> table_;

        static std::size_t slot(EnumT key, const char* where) {
            std::size_t idx = static_cast<std::size_t>(key);
            if (idx >= MAX) {
                throw std::out_of_range(
                    std::format("ConstraintTable::{}: key {} >= {}", where, idx, MAX));
            }
            return idx;
        }

    public:
        void set(EnumT key, IndexedConstraintSet&& family) {
            table_[slot(key, "set")] = std::move(family);
        }

        IndexedConstraintSet& get(EnumT key) { return table_[slot(key, "get")]; }
        const IndexedConstraintSet& get(EnumT key) const { return table_[slot(key, "get")]; }

        IndexedConstraintSet& operator()(EnumT key) { return get(key); }
        const IndexedConstraintSet& operator()(EnumT key) const { return get(key); }

        template<typename... I>
        GRBConstr& constr(EnumT key, I... idx) {
            return table_[slot(key, "constr")].at(idx...);
        }

        /// @brief Number of constraints recorded per family, in enum order
        std::array<std::size_t, MAX> sizes() const {
            std::array<std::size_t, MAX> out{};
            for (std::size_t i = 0; i < MAX; ++i) {
                out[i] = table_[i].size();
            }
            return out;
        }
    };

    // ============================================================================
    // ATTRIBUTE HELPERS
    // ============================================================================

    /// @brief Slack of a constraint in the loaded solution
    inline double slack(const GRBConstr& c) {
        return c.get(GRB_DoubleAttr_Slack);
    }

    inline std::string constrName(const GRBConstr& c) {
        return c.get(GRB_StringAttr_ConstrName);
    }

} // namespace shiftopt
