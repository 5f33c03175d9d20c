#pragma once

/**
 * @file LinearMap.hpp
 * @brief Affine map out = gain * in + offset
 */

#include <sluice/core/Component.hpp>
#include <sluice/core/CoreTypes.hpp>
#include <sluice/core/NodeConfig.hpp>

#include <string>
#include <vector>

namespace sluice {
namespace components {

/**
 * @brief Affine stream map
 *
 * With |gain| < 1 inside a recycle loop this is a contraction, so the fixed
 * point in_main = out_main is reached by plain iteration.
 *
 * Parameters:
 * - gain (double, default 1.0)
 * - offset (vector, default zero)
 *
 * Inputs: in_main
 * Outputs: out_main
 */
class LinearMap : public Component {
  public:
    explicit LinearMap(const NodeConfig &config)
        : gain_(config.Get<double>("gain", 1.0)), offset_(config.Get<PortValue>("offset", {})) {}

    [[nodiscard]] std::string TypeName() const override { return "linear_map"; }

    [[nodiscard]] std::vector<PortDecl> DeclareInputs() const override {
        return {{"in_main", "Input stream", true}};
    }

    [[nodiscard]] std::vector<PortDecl> DeclareOutputs() const override {
        return {{"out_main", "gain * in_main + offset", false}};
    }

    PortMap Step(const PortMap &inputs, double /*dt*/) override {
        const PortValue &in = RequireInput(inputs, "in_main");
        if (offset_.size() == 0) {
            return {{"out_main", gain_ * in}};
        }
        if (offset_.size() != in.size()) {
            throw ComputationError("offset has " + std::to_string(offset_.size()) +
                                   " entries, input has " + std::to_string(in.size()));
        }
        PortValue out = gain_ * in + offset_;
        return {{"out_main", out}};
    }

    [[nodiscard]] double Gain() const { return gain_; }

  private:
    double gain_;
    PortValue offset_;
};

} // namespace components
} // namespace sluice
