#pragma once
/*
===============================================================================
MODEL BUILDER — Lifecycle of one Gurobi model
===============================================================================

Overview
--------
ModelBuilder owns a GRBEnv and a GRBModel and runs the model construction as
a template method:

    build() {
        initialize();          // env (deferred start) + model
        addVariables();
        addConstraints();
        addParameters();
        addObjective();
        model.update();
        afterBuild();
    }

    optimize() {
        build();               // no-op when already built
        beforeOptimize();
        model.optimize();
        afterOptimize();
    }

Building and optimizing are separate steps so callers can inspect a model
(statistics, variables, constraints) before searching, and so a session can
decide not to search at all.

Key Features
------------
1. Lazy initialization: the constructor touches no solver state.
2. Typed registries: variables and constraints live in VariableTable and
   ConstraintTable keyed by the builder's enums.
3. Parameter setters and presets, each tracked in store() as "param:<Name>".
4. Post-optimization accessors: status(), objVal(), mipGap(), runtime() ...
5. logMessage() writes to the Gurobi log (console and/or LogFile).

Typical Usage
-------------
    SHIFTOPT_ENUM_WITH_COUNT(Vars, X);
    SHIFTOPT_ENUM_WITH_COUNT(Cons, Cap);

    class Knapsack : public shiftopt::ModelBuilder<Vars, Cons> {
        void addVariables() override { ... }
        void addConstraints() override { ... }
        void addObjective() override { minimize(...); }
    };

    Knapsack k;
    k.applyPreset(Knapsack::Preset::Interactive);
    k.optimize();

===============================================================================
*/

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "gurobi_c++.h"

#include "constraints.h"
#include "data_store.h"
#include "variables.h"

namespace shiftopt {

template <typename VarEnum, typename ConEnum>
class ModelBuilder {
public:
    using VarTable = VariableTable<VarEnum>;
    using ConTable = ConstraintTable<ConEnum>;

private:
    std::unique_ptr<GRBEnv>   env_;
    std::unique_ptr<GRBModel> model_;

    bool initialized_ = false;
    bool built_ = false;

protected:
    VarTable vars_;
    ConTable cons_;

    // Parameters, statistics and other metadata
    DataStore store_;

public:
    ModelBuilder() = default;
    virtual ~ModelBuilder() = default;

    ModelBuilder(const ModelBuilder&) = delete;
    ModelBuilder& operator=(const ModelBuilder&) = delete;

    // -------------------------------------------------------------------------
    // Initialization
    // -------------------------------------------------------------------------

    /**
     * @brief Create the environment and the model if not done yet
     *
     * The environment is created with a deferred start so configureEnvironment()
     * can set logging parameters before Gurobi prints its banner.
     *
     * @throws GRBException when the environment cannot start (e.g. no licence)
     */
    void initialize()
    {
        if (initialized_)
            return;

        env_ = std::make_unique<GRBEnv>(true);
        configureEnvironment(*env_);
        env_->start();
        model_ = std::make_unique<GRBModel>(*env_);

        initialized_ = true;
    }

    bool isBuilt() const noexcept { return built_; }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    GRBModel& model()
    {
        if (!initialized_)
            initialize();
        return *model_;
    }

    const GRBModel& model() const
    {
        if (!model_)
            throw std::logic_error("ModelBuilder::model: model not initialized");
        return *model_;
    }

    GRBEnv& env()
    {
        if (!initialized_)
            initialize();
        return *env_;
    }

    VarTable& variables() noexcept { return vars_; }
    const VarTable& variables() const noexcept { return vars_; }

    ConTable& constraints() noexcept { return cons_; }
    const ConTable& constraints() const noexcept { return cons_; }

    DataStore& store() noexcept { return store_; }
    const DataStore& store() const noexcept { return store_; }

    /// @brief Write a line to the Gurobi log (honours OutputFlag / LogFile)
    void logMessage(const std::string& line)
    {
        env().message(line + "\n");
    }

    // -------------------------------------------------------------------------
    // Parameter Configuration
    // -------------------------------------------------------------------------

    /**
     * @brief Set a Gurobi model parameter
     * @note Prefer the named setters, which also record the value in store()
     */
    template <typename Param, typename Val>
    void setParam(Param p, Val&& value)
    {
        model().set(p, std::forward<Val>(value));
    }

    /**
     * @brief Set a Gurobi parameter and record it as store()["param:<name>"]
     */
    template <typename Param, typename Val>
    void setParam(Param p, Val&& value, const std::string& name)
    {
        model().set(p, value);
        store_[std::string("param:") + name] = value;
    }

    /// @brief Wall-clock limit in seconds
    void timeLimit(double seconds) {
        setParam(GRB_DoubleParam_TimeLimit, seconds, "TimeLimit");
    }

    /// @brief Relative MIP gap at which the search stops (0.01 = 1%)
    void mipGapLimit(double gap) {
        setParam(GRB_DoubleParam_MIPGap, gap, "MIPGap");
    }

    /// @brief Thread count, 0 = automatic
    void threads(int n) {
        setParam(GRB_IntParam_Threads, n, "Threads");
    }

    void nodeLimit(double nodes) {
        setParam(GRB_DoubleParam_NodeLimit, nodes, "NodeLimit");
    }

    /// @brief Simplex iteration limit
    void iterationLimit(double iterations) {
        setParam(GRB_DoubleParam_IterationLimit, iterations, "IterationLimit");
    }

    void solutionLimit(int n) {
        setParam(GRB_IntParam_SolutionLimit, n, "SolutionLimit");
    }

    /// @brief 0=balanced, 1=feasibility, 2=optimality, 3=bound
    void mipFocus(int focus) {
        setParam(GRB_IntParam_MIPFocus, focus, "MIPFocus");
    }

    void quiet() {
        setParam(GRB_IntParam_OutputFlag, 0, "OutputFlag");
    }

    void verbose() {
        setParam(GRB_IntParam_OutputFlag, 1, "OutputFlag");
    }

    // -------------------------------------------------------------------------
    // Parameter Presets
    // -------------------------------------------------------------------------

    enum class Preset {
        Interactive,    ///< 10 s, 1% gap: answers while a manager waits
        Thorough,       ///< 10 min, proven optimal
        FirstFeasible   ///< Stop at the first schedule found
    };

    /**
     * @brief Apply a predefined parameter set
     *
     * @details
     *   - Interactive: TimeLimit=10, MIPGap=1%
     *   - Thorough: TimeLimit=600, MIPGap=0
     *   - FirstFeasible: SolutionLimit=1, MIPFocus=1
     *
     * Named setters called afterwards override individual values.
     * The preset name is recorded in store()["param:Preset"].
     */
    void applyPreset(Preset p) {
        switch (p) {
            case Preset::Interactive:
                timeLimit(10.0);
                mipGapLimit(0.01);
                store_["param:Preset"] = std::string("Interactive");
                break;

            case Preset::Thorough:
                timeLimit(600.0);
                mipGapLimit(0.0);
                store_["param:Preset"] = std::string("Thorough");
                break;

            case Preset::FirstFeasible:
                solutionLimit(1);
                mipFocus(1);
                store_["param:Preset"] = std::string("FirstFeasible");
                break;
        }
    }

    // -------------------------------------------------------------------------
    // Objective Helpers
    // -------------------------------------------------------------------------

    void minimize(const GRBLinExpr& expr) {
        model().setObjective(expr, GRB_MINIMIZE);
    }

    void maximize(const GRBLinExpr& expr) {
        model().setObjective(expr, GRB_MAXIMIZE);
    }

    // -------------------------------------------------------------------------
    // Solution Diagnostics
    // -------------------------------------------------------------------------
    // All of these require optimize() to have run.

    int status() const {
        return model().get(GRB_IntAttr_Status);
    }

    bool isOptimal() const {
        return status() == GRB_OPTIMAL;
    }

    bool isInfeasible() const {
        int s = status();
        return s == GRB_INFEASIBLE || s == GRB_INF_OR_UNBD;
    }

    bool hasSolution() const {
        return solutionCount() > 0;
    }

    /// @throws GRBException if no solution is available
    double objVal() const {
        return model().get(GRB_DoubleAttr_ObjVal);
    }

    double objBound() const {
        return model().get(GRB_DoubleAttr_ObjBound);
    }

    /// @note Only meaningful for a MIP with a solution
    double mipGap() const {
        return model().get(GRB_DoubleAttr_MIPGap);
    }

    double runtime() const {
        return model().get(GRB_DoubleAttr_Runtime);
    }

    int solutionCount() const {
        return model().get(GRB_IntAttr_SolCount);
    }

    double nodeCount() const {
        return model().get(GRB_DoubleAttr_NodeCount);
    }

    // -------------------------------------------------------------------------
    // Template-method hooks
    // -------------------------------------------------------------------------

    /// @brief Set environment parameters (logging, licence) before start
    virtual void configureEnvironment(GRBEnv& env) {}

    virtual void addVariables() {}
    virtual void addConstraints() {}

    /// @brief Model-level parameters (TimeLimit, MIPGap, Threads ...)
    virtual void addParameters() {}

    virtual void addObjective() {}

    /// @brief Runs once after the model is complete and updated
    virtual void afterBuild() {}

    /// @brief Runs right before every model.optimize()
    virtual void beforeOptimize() {}

    /// @brief Runs right after every model.optimize()
    virtual void afterOptimize() {}

    // -------------------------------------------------------------------------
    // Main orchestration
    // -------------------------------------------------------------------------

    /**
     * @brief Create variables, constraints, parameters and objective once
     * @return The updated model, ready to optimize
     */
    GRBModel& build()
    {
        if (built_)
            return model();

        initialize();

        addVariables();
        addConstraints();
        addParameters();
        addObjective();

        model().update();
        built_ = true;
        afterBuild();

        return model();
    }

    /**
     * @brief Build if needed, then run the search
     *
     * Calling optimize() again resumes from the current state; Gurobi keeps
     * the incumbent, so the best objective never gets worse.
     */
    GRBModel& optimize()
    {
        build();

        beforeOptimize();
        model().optimize();
        afterOptimize();

        return model();
    }
};

} // namespace shiftopt
