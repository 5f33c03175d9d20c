/**
 * @file Simulator.cpp
 * @brief Flowsheet simulation driver
 */

#include <sluice/sim/Simulator.hpp>

#include <sluice/core/ComponentFactory.hpp>
#include <sluice/core/ErrorLogging.hpp>
#include <sluice/io/Console.hpp>
#include <sluice/io/FlowsheetLoader.hpp>
#include <sluice/io/LogService.hpp>
#include <sluice/io/LogSink.hpp>
#include <sluice/io/PlanExport.hpp>

#include <cmath>
#include <sstream>

namespace sluice {

namespace {

/// Console shared by every simulator; the console sink keeps a reference
Console &SharedConsole() {
    static Console console;
    return console;
}

} // namespace

// =============================================================================
// Construction
// =============================================================================

std::unique_ptr<Simulator> Simulator::FromConfig(const std::string &config_path) {
    FlowsheetConfig config = io::FlowsheetLoader::Load(config_path);
    auto sim = FromConfig(config);
    GetLogService().Info(config.t_start, "Loaded flowsheet configuration from " + config_path);
    return sim;
}

std::unique_ptr<Simulator> Simulator::FromConfig(const FlowsheetConfig &config) {
    ConfigureLogging(config.logging, SharedConsole());
    auto resolver = config.MakeResolver();
    return std::make_unique<Simulator>(config, resolver);
}

Simulator::Simulator(FlowsheetConfig config, const ParameterResolver &resolver)
    : config_(std::move(config)), time_(config_.t_start) {
    auto errors = config_.Validate();
    if (!errors.empty()) {
        ThrowAndLog(ConfigError(errors.front()), config_.t_start);
    }

    try {
        // Components first: they fill in ports the descriptors leave out
        auto &factory = ComponentFactory::Instance();
        std::vector<std::unique_ptr<Component>> components;
        components.reserve(config_.nodes.size());
        for (auto &node : config_.nodes) {
            LogContextManager::ScopedContext context(config_.name, node.id, node.type);
            components.push_back(factory.Create(node, resolver));
        }

        flowsheet_ = std::make_unique<Flowsheet>(Flowsheet::Build(config_.nodes, config_.edges));

        PlannerOptions options;
        options.tolerance = config_.solver.tolerance;
        options.max_iterations = config_.solver.max_iterations;
        ExecutionPlan plan = StagePlanner(options).Plan(*flowsheet_);

        executor_ = std::make_unique<Executor>(*flowsheet_, std::move(plan), std::move(components),
                                               config_.solver, config_.name);
    } catch (const ConfigError &e) {
        LogError(e, config_.t_start);
        throw;
    } catch (const PlanningError &e) {
        LogError(e, config_.t_start);
        throw;
    }

    GetLogService().Info(config_.t_start,
                         "Flowsheet '" + config_.name + "': " +
                             std::to_string(flowsheet_->NumNodes()) + " nodes, " +
                             std::to_string(flowsheet_->NumEdges()) + " edges, " +
                             std::to_string(Plan().NumLinear()) + " linear / " +
                             std::to_string(Plan().NumLoop()) + " loop stages");

    if (!config_.plan_export_path.empty()) {
        io::PlanExport::Write(config_.plan_export_path, Plan(), *flowsheet_, config_.name);
        GetLogService().Debug(config_.t_start,
                              "Execution plan written to " + config_.plan_export_path);
    }

    if (config_.recording.enabled) {
        recorder_ = std::make_unique<ObservationRecorder>(*executor_, config_.recording);
    }
}

Simulator::~Simulator() {
    if (recorder_ && recorder_->IsOpen()) {
        try {
            recorder_->Close();
        } catch (const std::exception &e) {
            GetLogService().Error(time_, std::string("Closing recorder failed: ") + e.what());
        }
    }
}

// =============================================================================
// Lifecycle
// =============================================================================

void Simulator::Stage() {
    if (phase_ != Phase::Built) {
        throw LifecycleError(LifecyclePhase::Stage, "can only be called once after build");
    }

    LogPlan();

    if (recorder_) {
        recorder_->Open("");
        GetLogService().Info(time_, "Recording " + std::to_string(recorder_->Columns().size()) +
                                        " columns to " + recorder_->Path());
    }

    phase_ = Phase::Staged;
}

const StepReport &Simulator::Step() { return Step(config_.dt); }

const StepReport &Simulator::Step(double dt) {
    if (phase_ == Phase::Built) {
        throw LifecycleError(LifecyclePhase::Step, "requires prior Stage()");
    }
    if (!(dt > 0.0)) {
        throw LifecycleError(LifecyclePhase::Step, "dt must be positive");
    }

    LogService::BufferedScope buffered(GetLogService());
    phase_ = Phase::Running;

    try {
        executor_->Step(dt, time_);
    } catch (const Error &) {
        // Already logged by the executor; the step was rolled back
        phase_ = Phase::Error;
        throw;
    }

    time_ += dt;
    if (recorder_) {
        recorder_->Record(time_);
    }
    InvokeEdgeObservers();
    return executor_->LastReport();
}

std::size_t Simulator::Run() {
    if (phase_ == Phase::Built) {
        Stage();
    }

    GetLogService().Event(time_, "Run from t=" + std::to_string(time_) +
                                     " to t=" + std::to_string(config_.t_end));

    // Half a step of slack so accumulated rounding does not add a step
    std::size_t steps = 0;
    while (time_ + 0.5 * config_.dt < config_.t_end) {
        Step(config_.dt);
        ++steps;
    }

    if (recorder_) {
        recorder_->Close();
    }
    phase_ = Phase::Completed;

    GetLogService().Event(time_, "Run complete: " + std::to_string(steps) + " steps");
    return steps;
}

void Simulator::Reset() {
    executor_->Reset();
    time_ = config_.t_start;
    if (phase_ != Phase::Built) {
        phase_ = Phase::Staged;
    }
    GetLogService().Info(time_, "Flowsheet '" + config_.name + "' reset");
}

// =============================================================================
// Queries and control
// =============================================================================

const PortValue &Simulator::EdgeValue(const std::string &edge_id) const {
    const auto &value = executor_->EdgeValue(flowsheet_->RequireEdge(edge_id));
    if (!value) {
        throw LifecycleError("edge '" + edge_id + "' has not carried a value yet");
    }
    return *value;
}

const PortMap &Simulator::NodeOutputs(const std::string &node_id) const {
    return executor_->NodeOutputs(flowsheet_->RequireNode(node_id));
}

Component &Simulator::GetComponent(const std::string &node_id) {
    return executor_->GetComponent(flowsheet_->RequireNode(node_id));
}

void Simulator::SetEdgeObserver(const std::string &edge_id, EdgeObserverCallback callback) {
    (void)flowsheet_->RequireEdge(edge_id);
    edge_observers_[edge_id] = std::move(callback);
}

void Simulator::ClearEdgeObserver(const std::string &edge_id) { edge_observers_.erase(edge_id); }

void Simulator::SetEdgeValue(const std::string &edge_id, PortValue value) {
    executor_->SetEdgeValue(flowsheet_->RequireEdge(edge_id), std::move(value));
}

// =============================================================================
// Private helpers
// =============================================================================

void Simulator::LogPlan() const {
    auto &log = GetLogService();
    log.Info(time_, "Execution plan for '" + config_.name + "' (" +
                        std::to_string(Plan().Size()) + " stages, " +
                        std::to_string(Plan().NumLevels()) + " levels)");

    std::istringstream lines(Plan().ToString(*flowsheet_));
    std::string line;
    while (std::getline(lines, line)) {
        if (!line.empty()) {
            log.Debug(time_, line);
        }
    }
}

void Simulator::InvokeEdgeObservers() {
    for (const auto &[edge_id, callback] : edge_observers_) {
        const auto &value = executor_->EdgeValue(flowsheet_->RequireEdge(edge_id));
        if (value && callback) {
            callback(edge_id, time_, *value);
        }
    }
}

} // namespace sluice
