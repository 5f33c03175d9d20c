#pragma once

/**
 * @file Simulator.hpp
 * @brief Top-level flowsheet simulation driver
 *
 * Owns the flowsheet graph, its execution plan, the components and the
 * Executor. Users see one class with a small lifecycle:
 * - FromConfig() - Build from YAML or a FlowsheetConfig
 * - Stage() - Log the plan and open the recorder
 * - Step() / Run() - Advance simulation time
 * - ~Simulator() - Cleanup (RAII)
 */

#include <sluice/core/Component.hpp>
#include <sluice/core/CoreTypes.hpp>
#include <sluice/core/ParameterResolver.hpp>
#include <sluice/graph/Flowsheet.hpp>
#include <sluice/io/ObservationRecorder.hpp>
#include <sluice/sched/StagePlanner.hpp>
#include <sluice/sim/Executor.hpp>
#include <sluice/sim/SimulatorConfig.hpp>

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace sluice {

/**
 * @brief Simulation lifecycle phases
 */
enum class Phase : uint8_t {
    Built,     ///< Graph, plan and components ready
    Staged,    ///< Ready to run
    Running,   ///< During Step loop
    Completed, ///< Run() reached time.end
    Error      ///< Last step failed
};

class Simulator {
  public:
    /// Edge observer: (edge_id, time, value) after each successful step
    using EdgeObserverCallback =
        std::function<void(const std::string &, double, const PortValue &)>;

    // =========================================================================
    // CORE LIFECYCLE
    // =========================================================================

    /**
     * @brief Create simulator from configuration file
     * @throws ConfigError on malformed YAML or an invalid flowsheet
     */
    [[nodiscard]] static std::unique_ptr<Simulator> FromConfig(const std::string &config_path);

    /**
     * @brief Create simulator from configuration struct
     *
     * Parameters are resolved from config.parameter_tables.
     */
    [[nodiscard]] static std::unique_ptr<Simulator> FromConfig(const FlowsheetConfig &config);

    /**
     * @brief Build from a configuration with an explicit parameter resolver
     *
     * Resolves parameters, creates components through the ComponentFactory,
     * fills undeclared ports from the components, builds and validates the
     * graph, and plans execution. Every configuration error surfaces here,
     * before any step.
     */
    Simulator(FlowsheetConfig config, const ParameterResolver &resolver);

    ~Simulator();

    // Non-copyable, non-movable (Executor holds a reference to the graph)
    Simulator(const Simulator &) = delete;
    Simulator &operator=(const Simulator &) = delete;
    Simulator(Simulator &&) = delete;
    Simulator &operator=(Simulator &&) = delete;

    /**
     * @brief Prepare for execution
     *
     * Logs the execution plan and opens the recorder when recording is
     * enabled.
     */
    void Stage();

    /**
     * @brief Advance one step
     *
     * @param dt Step size (uses configured dt if not specified)
     * @throws LifecycleError if Stage() has not been called
     * @throws ComputationError, NonConvergenceError (time and edge values
     *         are left as before the step)
     */
    const StepReport &Step(double dt);
    const StepReport &Step();

    /**
     * @brief Step with the configured dt until time.end
     *
     * Stages first if needed. Closes the recorder when done.
     * @return Number of steps taken
     */
    std::size_t Run();

    /**
     * @brief Restore initial guesses and component state, rewind time
     */
    void Reset();

    // =========================================================================
    // QUERY INTERFACE
    // =========================================================================

    [[nodiscard]] const std::string &Name() const { return config_.name; }
    [[nodiscard]] double Dt() const { return config_.dt; }
    [[nodiscard]] double EndTime() const { return config_.t_end; }
    [[nodiscard]] double Time() const { return time_; }
    [[nodiscard]] Phase GetPhase() const { return phase_; }

    /**
     * @brief Current value on an edge
     * @throws ConfigError if the edge id is unknown
     * @throws LifecycleError if the edge has not carried a value yet
     */
    [[nodiscard]] const PortValue &EdgeValue(const std::string &edge_id) const;

    /// Last outputs of a node, including ports with no outgoing edge
    [[nodiscard]] const PortMap &NodeOutputs(const std::string &node_id) const;

    [[nodiscard]] const ExecutionPlan &Plan() const { return executor_->Plan(); }
    [[nodiscard]] const Flowsheet &Graph() const { return *flowsheet_; }
    [[nodiscard]] const StepReport &LastReport() const { return executor_->LastReport(); }
    [[nodiscard]] const FlowsheetConfig &Config() const { return config_; }
    [[nodiscard]] std::size_t StepCount() const { return executor_->StepCount(); }

    // =========================================================================
    // CONTROL INTERFACE
    // =========================================================================

    /// Observe an edge after every successful step
    void SetEdgeObserver(const std::string &edge_id, EdgeObserverCallback callback);

    void ClearEdgeObserver(const std::string &edge_id);

    /// Seed an edge (typically a tear edge) before the next step
    void SetEdgeValue(const std::string &edge_id, PortValue value);

    // =========================================================================
    // EXPERT INTERFACE
    // =========================================================================

    [[nodiscard]] Executor &GetExecutor() { return *executor_; }
    [[nodiscard]] const Executor &GetExecutor() const { return *executor_; }

    [[nodiscard]] Component &GetComponent(const std::string &node_id);

    /// Recorder, when recording is enabled (null otherwise)
    [[nodiscard]] const ObservationRecorder *GetRecorder() const { return recorder_.get(); }

  private:
    void LogPlan() const;
    void InvokeEdgeObservers();

    FlowsheetConfig config_;

    std::unique_ptr<Flowsheet> flowsheet_;
    std::unique_ptr<Executor> executor_;
    std::unique_ptr<ObservationRecorder> recorder_;

    double time_ = 0.0;
    Phase phase_ = Phase::Built;

    std::unordered_map<std::string, EdgeObserverCallback> edge_observers_;
};

} // namespace sluice
