#pragma once

/**
 * @file Combiner.hpp
 * @brief Flow-weighted mixing of process streams
 *
 * Every component except the flow rate is averaged by flow; the flows add.
 */

#include <sluice/core/Component.hpp>
#include <sluice/core/CoreTypes.hpp>
#include <sluice/core/NodeConfig.hpp>

#include <string>
#include <vector>

namespace sluice {
namespace components {

/**
 * @brief Mixes all connected inputs into out_combined
 *
 * Inputs are mixed in declared port order. Streams with zero flow are
 * skipped until the first stream that carries flow, so a leading empty
 * stream does not zero the mix. With no flow at all the result is a zero
 * stream.
 *
 * Parameters:
 * - flow_index (int, default 14): position of the flow rate
 * - stream_size (int, default 21): width of the zero stream emitted when no
 *   input has a value
 *
 * Inputs: in_1, in_2 (default; any number may be declared)
 * Outputs: out_combined
 */
class Combiner : public Component {
  public:
    explicit Combiner(const NodeConfig &config)
        : flow_index_(static_cast<Eigen::Index>(
              config.Get<int>("flow_index", static_cast<int>(kDefaultFlowIndex)))),
          stream_size_(static_cast<std::size_t>(
              config.Get<int>("stream_size", static_cast<int>(kDefaultStreamSize)))) {
        if (flow_index_ < 0) {
            throw ConfigError("node '" + config.id + "': flow_index must not be negative");
        }
    }

    [[nodiscard]] std::string TypeName() const override { return "combiner"; }

    [[nodiscard]] std::vector<PortDecl> DeclareInputs() const override {
        return {{"in_1", "First stream", true}, {"in_2", "Second stream", true}};
    }

    [[nodiscard]] std::vector<PortDecl> DeclareOutputs() const override {
        return {{"out_combined", "Mixed stream", false}};
    }

    PortMap Step(const PortMap &inputs, double /*dt*/) override {
        std::vector<const PortValue *> streams;
        for (const auto &port : GetConfig().inputs) {
            auto it = inputs.find(port);
            if (it != inputs.end()) {
                streams.push_back(&it->second);
            }
        }
        if (streams.empty()) {
            return {{"out_combined", ZeroStream(stream_size_)}};
        }

        const Eigen::Index width = streams.front()->size();
        for (const auto *stream : streams) {
            if (stream->size() != width) {
                throw ComputationError("input streams differ in width");
            }
            if (flow_index_ >= stream->size()) {
                throw ComputationError("flow index " + std::to_string(flow_index_) +
                                       " outside stream of width " +
                                       std::to_string(stream->size()));
            }
            if ((*stream)(flow_index_) < 0.0) {
                throw ComputationError("negative inflow " +
                                       std::to_string((*stream)(flow_index_)));
            }
        }

        return {{"out_combined", Mix(streams)}};
    }

    /**
     * @brief Flow-weighted mix of equally sized streams
     */
    [[nodiscard]] PortValue Mix(const std::vector<const PortValue *> &streams) const {
        PortValue out = PortValue::Zero(streams.front()->size());

        std::size_t start = streams.size();
        for (std::size_t i = 0; i < streams.size(); ++i) {
            if ((*streams[i])(flow_index_) != 0.0) {
                start = i;
                break;
            }
        }

        for (std::size_t i = start; i < streams.size(); ++i) {
            const PortValue &in = *streams[i];
            const double q_out = out(flow_index_);
            const double q_in = in(flow_index_);
            const double q_total = q_out + q_in;
            for (Eigen::Index k = 0; k < out.size(); ++k) {
                if (k != flow_index_) {
                    out(k) = (out(k) * q_out + in(k) * q_in) / q_total;
                }
            }
            out(flow_index_) = q_total;
        }
        return out;
    }

  private:
    Eigen::Index flow_index_;
    std::size_t stream_size_;
};

} // namespace components
} // namespace sluice
