#pragma once

/**
 * @file Component.hpp
 * @brief Base class for all flowsheet components
 *
 * A component wraps one unit operation behind a fixed contract:
 * Step(inputs, dt) -> outputs. All coupling between components goes
 * through edge values owned by the Executor.
 */

#include <sluice/core/CoreTypes.hpp>
#include <sluice/core/Error.hpp>
#include <sluice/core/NodeConfig.hpp>

#include <string>
#include <vector>

namespace sluice {

/**
 * @brief Port declaration for introspection and default wiring
 */
struct PortDecl {
    std::string name;        ///< Port name
    std::string description; ///< Human-readable description
    bool is_input = false;   ///< True if input, false if output
};

/**
 * @brief Base class for all flowsheet components
 *
 * **Contract:**
 * - Step is deterministic given identical inputs and internal state.
 * - Step may be called many times per simulation step while a recycle loop
 *   iterates. Internal state that advances in time must only be committed
 *   in PostStep, which the Executor calls exactly once per successful step.
 * - Step reports failures by throwing ComputationError.
 * - A component never reads another component's state.
 */
class Component {
  public:
    virtual ~Component() = default;

    // =========================================================================
    // Core Contract (Required)
    // =========================================================================

    /**
     * @brief Evaluate the component
     *
     * @param inputs Values on connected input ports (unconnected ports and
     *               ports without a value yet are absent)
     * @param dt Time step size
     * @return Values for output ports
     */
    virtual PortMap Step(const PortMap &inputs, double dt) = 0;

    // =========================================================================
    // Extended Hooks (Optional)
    // =========================================================================

    /**
     * @brief Commit internal state after the whole step succeeded
     */
    virtual void PostStep(double /*dt*/) {}

    /**
     * @brief Return to initial conditions
     */
    virtual void Reset() {}

    // =========================================================================
    // Identity & Introspection
    // =========================================================================

    /// Node id this component is bound to
    [[nodiscard]] const std::string &Id() const { return config_.id; }

    /// Component type tag (e.g., "splitter")
    [[nodiscard]] virtual std::string TypeName() const = 0;

    /// Declared inputs, used when the node descriptor lists no input ports
    [[nodiscard]] virtual std::vector<PortDecl> DeclareInputs() const { return {}; }

    /// Declared outputs, used when the node descriptor lists no output ports
    [[nodiscard]] virtual std::vector<PortDecl> DeclareOutputs() const { return {}; }

    [[nodiscard]] std::vector<std::string> GetInputNames() const {
        std::vector<std::string> names;
        for (const auto &decl : DeclareInputs()) {
            names.push_back(decl.name);
        }
        return names;
    }

    [[nodiscard]] std::vector<std::string> GetOutputNames() const {
        std::vector<std::string> names;
        for (const auto &decl : DeclareOutputs()) {
            names.push_back(decl.name);
        }
        return names;
    }

    // =========================================================================
    // Configuration
    // =========================================================================

    /**
     * @brief Bind the resolved node descriptor (called by the factory)
     */
    void SetConfig(NodeConfig config) { config_ = std::move(config); }

    [[nodiscard]] const NodeConfig &GetConfig() const { return config_; }

  protected:
    /**
     * @brief Fetch a required input, failing with ComputationError if absent
     */
    [[nodiscard]] const PortValue &RequireInput(const PortMap &inputs,
                                                const std::string &port) const {
        auto it = inputs.find(port);
        if (it == inputs.end()) {
            throw ComputationError("no value on input port '" + port + "'");
        }
        return it->second;
    }

  private:
    NodeConfig config_;
};

} // namespace sluice
