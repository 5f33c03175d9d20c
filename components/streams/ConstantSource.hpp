#pragma once

/**
 * @file ConstantSource.hpp
 * @brief Emits a constant stream (static influent)
 */

#include <sluice/core/Component.hpp>
#include <sluice/core/CoreTypes.hpp>
#include <sluice/core/NodeConfig.hpp>

#include <string>
#include <vector>

namespace sluice {
namespace components {

/**
 * @brief Constant stream source
 *
 * Parameters:
 * - y_in_constant (vector, required): the emitted stream
 *
 * Outputs: out_main
 */
class ConstantSource : public Component {
  public:
    explicit ConstantSource(const NodeConfig &config)
        : value_(config.Require<PortValue>("y_in_constant")) {
        if (value_.size() == 0) {
            throw ConfigError("node '" + config.id + "': y_in_constant must not be empty");
        }
    }

    [[nodiscard]] std::string TypeName() const override { return "constant_source"; }

    [[nodiscard]] std::vector<PortDecl> DeclareOutputs() const override {
        return {{"out_main", "Constant stream", false}};
    }

    PortMap Step(const PortMap & /*inputs*/, double /*dt*/) override {
        return {{"out_main", value_}};
    }

    [[nodiscard]] const PortValue &Value() const { return value_; }

  private:
    PortValue value_;
};

} // namespace components
} // namespace sluice
