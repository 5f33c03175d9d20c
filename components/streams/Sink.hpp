#pragma once

/**
 * @file Sink.hpp
 * @brief Terminal node that keeps the last stream it received (effluent)
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
 * @brief Passes in_main through to out_final and remembers it
 *
 * Without an input value nothing is emitted.
 *
 * Inputs: in_main
 * Outputs: out_final
 */
class Sink : public Component {
  public:
    explicit Sink(const NodeConfig & /*config*/) {}

    [[nodiscard]] std::string TypeName() const override { return "sink"; }

    [[nodiscard]] std::vector<PortDecl> DeclareInputs() const override {
        return {{"in_main", "Final stream", true}};
    }

    [[nodiscard]] std::vector<PortDecl> DeclareOutputs() const override {
        return {{"out_final", "Copy of the final stream", false}};
    }

    PortMap Step(const PortMap &inputs, double /*dt*/) override {
        auto it = inputs.find("in_main");
        if (it == inputs.end()) {
            pending_.reset();
            return {};
        }
        pending_ = it->second;
        return {{"out_final", it->second}};
    }

    /// Committed once per step so loop iterations and failed steps are not kept
    void PostStep(double /*dt*/) override {
        if (pending_) {
            last_ = pending_;
        }
    }

    void Reset() override {
        last_.reset();
        pending_.reset();
    }

    /// Last stream of a successful step
    [[nodiscard]] const std::optional<PortValue> &Last() const { return last_; }

  private:
    std::optional<PortValue> last_;
    std::optional<PortValue> pending_;
};

} // namespace components
} // namespace sluice
