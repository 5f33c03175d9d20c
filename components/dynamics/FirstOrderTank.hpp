#pragma once

/**
 * @file FirstOrderTank.hpp
 * @brief Completely mixed tank with first-order response x' = (in - x) / tau
 *
 * Explicit Euler. The state advances only in PostStep, so recycle loop
 * iterations and rolled-back steps never move it.
 */

#include <sluice/core/Component.hpp>
#include <sluice/core/CoreTypes.hpp>
#include <sluice/core/NodeConfig.hpp>

#include <optional>
#include <string>
#include <vector>

namespace sluice {
namespace components {

/**
 * @brief First-order lag on a whole stream
 *
 * Parameters:
 * - tau (double, required, > 0): time constant, same unit as dt
 * - initial_state (vector, optional): state at t0; without it the first
 *   input seen becomes the state
 *
 * Inputs: in_main
 * Outputs: out_main (state at the end of the step)
 */
class FirstOrderTank : public Component {
  public:
    explicit FirstOrderTank(const NodeConfig &config) : tau_(config.Require<double>("tau")) {
        if (!(tau_ > 0.0)) {
            throw ConfigError("node '" + config.id + "': tau must be positive");
        }
        if (config.Has<PortValue>("initial_state")) {
            initial_ = config.Require<PortValue>("initial_state");
        }
        Reset();
    }

    [[nodiscard]] std::string TypeName() const override { return "integrator"; }

    [[nodiscard]] std::vector<PortDecl> DeclareInputs() const override {
        return {{"in_main", "Inflow stream", true}};
    }

    [[nodiscard]] std::vector<PortDecl> DeclareOutputs() const override {
        return {{"out_main", "Tank contents", false}};
    }

    PortMap Step(const PortMap &inputs, double dt) override {
        const PortValue &in = RequireInput(inputs, "in_main");
        const PortValue &x = state_ ? *state_ : in;
        if (x.size() != in.size()) {
            throw ComputationError("input width " + std::to_string(in.size()) +
                                   " differs from state width " + std::to_string(x.size()));
        }

        PortValue next = x + (dt / tau_) * (in - x);
        pending_ = next;
        return {{"out_main", next}};
    }

    void PostStep(double /*dt*/) override {
        if (pending_) {
            state_ = std::move(pending_);
            pending_.reset();
        }
    }

    void Reset() override {
        state_ = initial_;
        pending_.reset();
    }

    /// Committed state (empty before the first step without initial_state)
    [[nodiscard]] const std::optional<PortValue> &State() const { return state_; }

    [[nodiscard]] double Tau() const { return tau_; }

  private:
    double tau_;
    std::optional<PortValue> initial_;
    std::optional<PortValue> state_;
    std::optional<PortValue> pending_;
};

} // namespace components
} // namespace sluice
