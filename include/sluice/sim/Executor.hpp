#pragma once

/**
 * @file Executor.hpp
 * @brief Runs an ExecutionPlan once per simulation step
 *
 * Linear stages evaluate their node once. Loop stages iterate in their fixed
 * internal order, reading tear edges from the previous iteration, until the
 * tear residual drops below tolerance or the iteration cap is reached.
 *
 * A step is atomic: on any failure the edge values, retained node outputs
 * and component commit state are exactly as they were before the step.
 */

#include <sluice/core/Component.hpp>
#include <sluice/core/CoreTypes.hpp>
#include <sluice/core/Error.hpp>
#include <sluice/graph/Flowsheet.hpp>
#include <sluice/sched/StagePlanner.hpp>
#include <sluice/sim/SolverConfig.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sluice {

/**
 * @brief Per-step state machine
 *
 * Idle -> RunningStage -> (Converged | IterationCapReached | Failed) -> Idle
 */
enum class ExecutorState { Idle, RunningStage, Converged, IterationCapReached, Failed };

inline const char *ExecutorStateName(ExecutorState state) {
    switch (state) {
    case ExecutorState::Idle:
        return "Idle";
    case ExecutorState::RunningStage:
        return "RunningStage";
    case ExecutorState::Converged:
        return "Converged";
    case ExecutorState::IterationCapReached:
        return "IterationCapReached";
    case ExecutorState::Failed:
        return "Failed";
    }
    return "Unknown";
}

/**
 * @brief Outcome of one stage within a step
 */
struct StageReport {
    std::size_t stage = 0;
    StageKind kind = StageKind::Linear;
    bool converged = true;
    std::size_t iterations = 1;
    double residual = 0.0;                ///< Final tear residual (loop stages)
    std::vector<double> residual_history; ///< One entry per iteration (loop stages)
};

/**
 * @brief Outcome of one full step
 */
struct StepReport {
    double time = 0.0;
    std::vector<StageReport> stages;
    bool converged = true; ///< False if any loop was kept unconverged under the warn policy

    [[nodiscard]] std::size_t TotalIterations() const {
        std::size_t total = 0;
        for (const auto &s : stages) {
            total += s.iterations;
        }
        return total;
    }
};

class Executor {
  public:
    /// Called on every state transition with the stage index involved
    using StateObserver = std::function<void(ExecutorState, std::size_t stage)>;

    /**
     * @brief Construct an executor
     *
     * @param flowsheet Graph the plan was built from (must outlive the executor)
     * @param plan Execution plan
     * @param components One component per node, indexed by NodeIndex
     * @param solver Convergence settings
     * @param name Flowsheet name used as log context
     * @throws ConfigError if the component list does not match the graph
     */
    Executor(const Flowsheet &flowsheet, ExecutionPlan plan,
             std::vector<std::unique_ptr<Component>> components, SolverConfig solver = {},
             std::string name = "");

    /**
     * @brief Run every stage once, in plan order
     *
     * @param dt Time step size passed to components
     * @param time Simulation time used in reports and errors
     * @return Report for this step
     * @throws ComputationError if a node fails (step rolled back)
     * @throws NonConvergenceError if a loop does not converge under the error
     *         policy (step rolled back)
     */
    const StepReport &Step(double dt, double time = 0.0);

    /**
     * @brief Restore initial guesses and reset every component
     */
    void Reset();

    // =========================================================================
    // Edge Values
    // =========================================================================

    /// Current value on an edge (empty before its producer first ran)
    [[nodiscard]] const std::optional<PortValue> &EdgeValue(EdgeIndex edge) const {
        return values_.at(edge);
    }

    /// Override an edge value, e.g. to seed a tear edge
    void SetEdgeValue(EdgeIndex edge, PortValue value) { values_.at(edge) = std::move(value); }

    /// Last outputs of a node, including ports with no outgoing edge
    [[nodiscard]] const PortMap &NodeOutputs(NodeIndex node) const {
        return node_outputs_.at(node);
    }

    // =========================================================================
    // Accessors
    // =========================================================================

    [[nodiscard]] ExecutorState State() const { return state_; }
    [[nodiscard]] const StepReport &LastReport() const { return report_; }
    [[nodiscard]] const ExecutionPlan &Plan() const { return plan_; }
    [[nodiscard]] const Flowsheet &Graph() const { return flowsheet_; }
    [[nodiscard]] const SolverConfig &Solver() const { return solver_; }
    [[nodiscard]] std::size_t StepCount() const { return step_count_; }

    [[nodiscard]] Component &GetComponent(NodeIndex node) { return *components_.at(node); }

    void SetStateObserver(StateObserver observer) { observer_ = std::move(observer); }

  private:
    void RunStage(std::size_t index, double dt, double time);
    void RunLinear(std::size_t index, double dt, double time);
    void RunLoop(std::size_t index, double dt, double time);

    /**
     * @brief Evaluate one node and route its outputs
     *
     * Writes to edges in @p deferred go to tear_next_ instead of values_.
     */
    void EvaluateNode(NodeIndex node, double dt, double time,
                      const std::vector<bool> *deferred = nullptr);

    [[nodiscard]] double Residual(const PortValue &old_value, const PortValue &new_value) const;

    [[nodiscard]] PortValue InitialGuess(const Edge &edge) const;

    void Transition(ExecutorState state, std::size_t stage);

    const Flowsheet &flowsheet_;
    ExecutionPlan plan_;
    std::vector<std::unique_ptr<Component>> components_;
    SolverConfig solver_;
    std::string name_;

    std::vector<std::optional<PortValue>> values_;    ///< Committed/current edge values
    std::vector<std::optional<PortValue>> tear_next_; ///< Tear writes of the running iteration
    std::vector<PortMap> node_outputs_;               ///< Last outputs per node
    std::vector<bool> is_tear_;

    ExecutorState state_ = ExecutorState::Idle;
    StepReport report_;
    std::size_t step_count_ = 0;
    StateObserver observer_;
};

} // namespace sluice
