/**
 * @file Executor.cpp
 * @brief Staged fixed-point execution with rollback
 */

#include <sluice/sim/Executor.hpp>

#include <sluice/core/ErrorLogging.hpp>
#include <sluice/io/LogService.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

namespace sluice {

namespace {

constexpr double kInfinity = std::numeric_limits<double>::infinity();
constexpr double kRelativeFloor = 1e-12;

} // namespace

Executor::Executor(const Flowsheet &flowsheet, ExecutionPlan plan,
                   std::vector<std::unique_ptr<Component>> components, SolverConfig solver,
                   std::string name)
    : flowsheet_(flowsheet), plan_(std::move(plan)), components_(std::move(components)),
      solver_(solver), name_(std::move(name)) {
    if (components_.size() != flowsheet_.NumNodes()) {
        throw ConfigError("executor needs one component per node: got " +
                          std::to_string(components_.size()) + " for " +
                          std::to_string(flowsheet_.NumNodes()) + " nodes");
    }
    for (NodeIndex i = 0; i < components_.size(); ++i) {
        if (!components_[i]) {
            throw ConfigError("no component bound to node '" + flowsheet_.GetNode(i).id() + "'");
        }
    }
    auto errors = solver_.Validate();
    if (!errors.empty()) {
        throw ConfigError(errors.front());
    }

    is_tear_.assign(flowsheet_.NumEdges(), false);
    for (EdgeIndex e : plan_.TearEdges()) {
        is_tear_.at(e) = true;
    }
    node_outputs_.resize(flowsheet_.NumNodes());
    tear_next_.resize(flowsheet_.NumEdges());
    Reset();
}

// =============================================================================
// Step
// =============================================================================

const StepReport &Executor::Step(double dt, double time) {
    if (state_ != ExecutorState::Idle) {
        throw LifecycleError(LifecyclePhase::Step, "executor re-entered while running");
    }

    // Everything a failed step must not leak
    auto saved_values = values_;
    auto saved_outputs = node_outputs_;
    auto rollback = [&]() {
        values_ = std::move(saved_values);
        node_outputs_ = std::move(saved_outputs);
        std::fill(tear_next_.begin(), tear_next_.end(), std::nullopt);
    };

    report_ = StepReport{};
    report_.time = time;
    std::size_t current = 0;

    try {
        for (current = 0; current < plan_.stages.size(); ++current) {
            RunStage(current, dt, time);
        }
    } catch (const NonConvergenceError &) {
        rollback();
        Transition(ExecutorState::Idle, current);
        throw;
    } catch (...) {
        rollback();
        Transition(ExecutorState::Failed, current);
        Transition(ExecutorState::Idle, current);
        throw;
    }

    // Commit time-advancing component state once, in plan order. Components
    // committed before a failing one keep their commit; edge values do not.
    for (current = 0; current < plan_.stages.size(); ++current) {
        for (NodeIndex node : plan_.stages[current].nodes) {
            const std::string &id = flowsheet_.GetNode(node).id();
            try {
                try {
                    components_[node]->PostStep(dt);
                } catch (const Error &e) {
                    LogError(e, time, id);
                    throw;
                } catch (const std::exception &e) {
                    ThrowAndLog(
                        ComputationError(id, time, std::string("commit failed: ") + e.what()),
                        time, id);
                }
            } catch (...) {
                rollback();
                Transition(ExecutorState::Failed, current);
                Transition(ExecutorState::Idle, current);
                throw;
            }
        }
    }

    ++step_count_;
    Transition(ExecutorState::Idle, plan_.stages.size());
    return report_;
}

void Executor::RunStage(std::size_t index, double dt, double time) {
    Transition(ExecutorState::RunningStage, index);
    if (plan_.stages[index].IsLoop()) {
        RunLoop(index, dt, time);
    } else {
        RunLinear(index, dt, time);
    }
}

void Executor::RunLinear(std::size_t index, double dt, double time) {
    for (NodeIndex node : plan_.stages[index].nodes) {
        EvaluateNode(node, dt, time);
    }
    StageReport stage_report;
    stage_report.stage = index;
    stage_report.kind = StageKind::Linear;
    report_.stages.push_back(std::move(stage_report));
    Transition(ExecutorState::Converged, index);
}

// =============================================================================
// Loop stages
// =============================================================================

void Executor::RunLoop(std::size_t index, double dt, double time) {
    const Stage &stage = plan_.stages[index];

    std::vector<bool> deferred(flowsheet_.NumEdges(), false);
    for (EdgeIndex e : stage.tear_edges) {
        deferred[e] = true;
        if (!values_[e]) {
            values_[e] = InitialGuess(flowsheet_.GetEdge(e));
        }
    }

    StageReport stage_report;
    stage_report.stage = index;
    stage_report.kind = StageKind::Loop;
    stage_report.converged = false;
    stage_report.residual = kInfinity;

    const double r = solver_.relaxation;

    for (std::size_t iter = 1; iter <= stage.max_iterations; ++iter) {
        for (EdgeIndex e : stage.tear_edges) {
            tear_next_[e].reset();
        }
        for (NodeIndex node : stage.nodes) {
            EvaluateNode(node, dt, time, &deferred);
        }

        // Residual before relaxation, then move the tears forward
        double residual = 0.0;
        for (EdgeIndex e : stage.tear_edges) {
            PortValue &current = *values_[e];
            PortValue &next = *tear_next_[e];
            residual = std::max(residual, Residual(current, next));
            if (r < 1.0 && current.size() == next.size()) {
                current = (1.0 - r) * current + r * next;
            } else {
                current = std::move(next);
            }
            tear_next_[e].reset();
        }

        stage_report.iterations = iter;
        stage_report.residual = residual;
        stage_report.residual_history.push_back(residual);
        GetLogService().Trace(time, "stage " + std::to_string(index) + " iteration " +
                                        std::to_string(iter) +
                                        " residual=" + std::to_string(residual));

        if (residual < stage.tolerance) {
            stage_report.converged = true;
            break;
        }
    }

    if (stage_report.converged) {
        GetLogService().Debug(time, "stage " + std::to_string(index) + " converged in " +
                                        std::to_string(stage_report.iterations) +
                                        " iterations (residual " +
                                        std::to_string(stage_report.residual) + ")");
        report_.stages.push_back(std::move(stage_report));
        Transition(ExecutorState::Converged, index);
        return;
    }

    Transition(ExecutorState::IterationCapReached, index);

    std::vector<std::string> ids;
    ids.reserve(stage.nodes.size());
    for (NodeIndex node : stage.nodes) {
        ids.push_back(flowsheet_.GetNode(node).id());
    }
    NonConvergenceError error(index, std::move(ids), stage_report.iterations,
                              stage_report.residual, stage.tolerance, time);
    report_.stages.push_back(std::move(stage_report));

    if (solver_.on_non_convergence == NonConvergencePolicy::Error) {
        ThrowAndLog(std::move(error), time);
    }

    GetLogService().Warning(time, std::string(error.what()) + "; keeping unconverged values");
    report_.converged = false;
}

// =============================================================================
// Node evaluation
// =============================================================================

void Executor::EvaluateNode(NodeIndex node, double dt, double time,
                            const std::vector<bool> *deferred) {
    const Node &n = flowsheet_.GetNode(node);

    PortMap inputs;
    for (EdgeIndex e : n.in_edges) {
        const auto &value = values_[e];
        if (value) {
            inputs.emplace(flowsheet_.GetEdge(e).target_port, *value);
        }
    }

    PortMap outputs;
    {
        LogContextManager::ScopedContext context(name_, n.id(), n.type());
        try {
            outputs = components_[node]->Step(inputs, dt);
        } catch (const ComputationError &e) {
            if (!e.node_id().empty()) {
                LogError(e, time, n.id());
                throw;
            }
            ThrowAndLog(ComputationError(n.id(), time, e.reason()), time, n.id());
        } catch (const Error &e) {
            LogError(e, time, n.id());
            throw;
        } catch (const std::exception &e) {
            ThrowAndLog(ComputationError(n.id(), time, e.what()), time, n.id());
        }
    }

    for (EdgeIndex e : n.out_edges) {
        const Edge &edge = flowsheet_.GetEdge(e);
        auto it = outputs.find(edge.source_port);
        if (it == outputs.end()) {
            ThrowAndLog(ComputationError(n.id(), time,
                                         "no value produced on output port '" + edge.source_port +
                                             "' (edge '" + edge.id + "')"),
                        time, n.id());
        }
        if (edge.size && static_cast<std::size_t>(it->second.size()) != *edge.size) {
            ThrowAndLog(ComputationError(n.id(), time,
                                         "port '" + edge.source_port + "' produced " +
                                             std::to_string(it->second.size()) +
                                             " values, edge '" + edge.id + "' expects " +
                                             std::to_string(*edge.size)),
                        time, n.id());
        }
        if (deferred != nullptr && (*deferred)[e]) {
            tear_next_[e] = it->second;
        } else {
            values_[e] = it->second;
        }
    }

    node_outputs_[node] = std::move(outputs);
}

// =============================================================================
// Helpers
// =============================================================================

double Executor::Residual(const PortValue &old_value, const PortValue &new_value) const {
    if (old_value.size() != new_value.size()) {
        return kInfinity;
    }
    double residual = 0.0;
    for (Eigen::Index i = 0; i < new_value.size(); ++i) {
        double diff = std::abs(new_value(i) - old_value(i));
        if (solver_.residual == ResidualMode::Relative) {
            diff /= std::max({std::abs(new_value(i)), std::abs(old_value(i)), kRelativeFloor});
        }
        if (!std::isfinite(diff)) {
            return kInfinity;
        }
        residual = std::max(residual, diff);
    }
    return residual;
}

PortValue Executor::InitialGuess(const Edge &edge) const {
    if (edge.initial_value) {
        return *edge.initial_value;
    }
    return ZeroStream(edge.size.value_or(solver_.stream_size));
}

void Executor::Reset() {
    values_.assign(flowsheet_.NumEdges(), std::nullopt);
    for (const auto &edge : flowsheet_.Edges()) {
        if (is_tear_[edge.index]) {
            values_[edge.index] = InitialGuess(edge);
        } else if (edge.initial_value) {
            values_[edge.index] = *edge.initial_value;
        }
    }
    std::fill(tear_next_.begin(), tear_next_.end(), std::nullopt);
    for (auto &outputs : node_outputs_) {
        outputs.clear();
    }
    for (auto &component : components_) {
        component->Reset();
    }
    report_ = StepReport{};
    step_count_ = 0;
    state_ = ExecutorState::Idle;
}

void Executor::Transition(ExecutorState state, std::size_t stage) {
    state_ = state;
    if (observer_) {
        observer_(state, stage);
    }
}

} // namespace sluice
