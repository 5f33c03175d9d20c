#pragma once

/**
 * @file ScriptedComponent.hpp
 * @brief Component whose Step is a caller-supplied function, for tests
 *
 * Counts Step and PostStep calls so tests can check how often the Executor
 * evaluated and committed a node.
 */

#include <sluice/core/Component.hpp>
#include <sluice/core/CoreTypes.hpp>
#include <sluice/core/NodeConfig.hpp>

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace sluice {
namespace components {

class ScriptedComponent : public Component {
  public:
    using StepFunction = std::function<PortMap(const PortMap &, double)>;
    using CommitFunction = std::function<void(std::size_t commit, double dt)>;

    ScriptedComponent(std::string id, StepFunction fn) : fn_(std::move(fn)) {
        NodeConfig config;
        config.id = std::move(id);
        config.type = "scripted";
        SetConfig(std::move(config));
    }

    [[nodiscard]] std::string TypeName() const override { return "scripted"; }

    PortMap Step(const PortMap &inputs, double dt) override {
        ++step_calls_;
        last_inputs_ = inputs;
        return fn_(inputs, dt);
    }

    /// Runs before each commit is counted; may throw to fail the commit
    void SetCommitFunction(CommitFunction fn) { commit_fn_ = std::move(fn); }

    void PostStep(double dt) override {
        if (commit_fn_) {
            commit_fn_(commits_ + 1, dt);
        }
        ++commits_;
    }

    void Reset() override {
        ++resets_;
        commits_ = 0;
    }

    // Expose counters for testing
    [[nodiscard]] std::size_t step_calls() const { return step_calls_; }
    [[nodiscard]] std::size_t commits() const { return commits_; }
    [[nodiscard]] std::size_t resets() const { return resets_; }
    [[nodiscard]] const PortMap &last_inputs() const { return last_inputs_; }

  private:
    StepFunction fn_;
    CommitFunction commit_fn_;
    std::size_t step_calls_ = 0;
    std::size_t commits_ = 0;
    std::size_t resets_ = 0;
    PortMap last_inputs_;
};

} // namespace components
} // namespace sluice
