#pragma once

/**
 * @file Splitter.hpp
 * @brief Splits one process stream onto several outputs
 */

#include <sluice/core/Component.hpp>
#include <sluice/core/CoreTypes.hpp>
#include <sluice/core/NodeConfig.hpp>

#include <algorithm>
#include <numeric>
#include <string>
#include <vector>

namespace sluice {
namespace components {

/**
 * @brief Flow splitter
 *
 * Every output carries the inbound composition; only the flow rate is
 * divided. An output whose share of the flow is zero carries a zero stream.
 * With no inbound flow every output is a copy of the input with flow 0.
 *
 * Modes (`mode`, default "ratio"):
 * - ratio: `splitratio` (vector, one entry per output) normalised by its sum
 * - threshold: the first output carries the flow up to `qthreshold`, the
 *   second the rest
 * - fixed_recycle: the last output carries `qintr` (default 55338), the
 *   first the remainder with a floor of 0; flows are normalised so the
 *   split never creates flow
 *
 * Parameters: mode, splitratio, qthreshold, qintr, flow_index (default 14)
 *
 * Inputs: in_main
 * Outputs (defaults): ratio/threshold: out_1, out_2;
 *                     fixed_recycle: out_to_settler, out_recycle_to_combiner
 */
class Splitter : public Component {
  public:
    enum class Mode { Ratio, Threshold, FixedRecycle };

    explicit Splitter(const NodeConfig &config)
        : mode_(ParseMode(config)), flow_index_(static_cast<Eigen::Index>(config.Get<int>(
                                         "flow_index", static_cast<int>(kDefaultFlowIndex)))) {
        switch (mode_) {
        case Mode::Ratio:
            ratios_ = config.Require<std::vector<double>>("splitratio");
            if (ratios_.empty()) {
                throw ConfigError("node '" + config.id + "': splitratio must not be empty");
            }
            for (double r : ratios_) {
                if (r < 0.0) {
                    throw ConfigError("node '" + config.id +
                                      "': splitratio entries must not be negative");
                }
            }
            break;
        case Mode::Threshold:
            qthreshold_ = config.Require<double>("qthreshold");
            break;
        case Mode::FixedRecycle:
            qintr_ = config.Get<double>("qintr", 55338.0);
            break;
        }

        if (!config.outputs.empty() && config.outputs.size() != NumOutputs()) {
            throw ConfigError("node '" + config.id + "': splitter needs " +
                              std::to_string(NumOutputs()) + " outputs, " +
                              std::to_string(config.outputs.size()) + " declared");
        }
    }

    [[nodiscard]] std::string TypeName() const override { return "splitter"; }

    [[nodiscard]] std::vector<PortDecl> DeclareInputs() const override {
        return {{"in_main", "Stream to split", true}};
    }

    [[nodiscard]] std::vector<PortDecl> DeclareOutputs() const override {
        if (mode_ == Mode::FixedRecycle) {
            return {{"out_to_settler", "Forward flow", false},
                    {"out_recycle_to_combiner", "Internal recycle", false}};
        }
        std::vector<PortDecl> decls;
        for (std::size_t i = 0; i < NumOutputs(); ++i) {
            decls.push_back({"out_" + std::to_string(i + 1), "Split stream", false});
        }
        return decls;
    }

    PortMap Step(const PortMap &inputs, double /*dt*/) override {
        const PortValue &in = RequireInput(inputs, "in_main");
        if (flow_index_ >= in.size()) {
            throw ComputationError("flow index " + std::to_string(flow_index_) +
                                   " outside stream of width " + std::to_string(in.size()));
        }

        const auto &ports = GetConfig().outputs;
        auto streams = Split(in);

        PortMap outputs;
        for (std::size_t i = 0; i < streams.size() && i < ports.size(); ++i) {
            outputs.emplace(ports[i], std::move(streams[i]));
        }
        return outputs;
    }

    /**
     * @brief Split a stream according to the configured mode
     */
    [[nodiscard]] std::vector<PortValue> Split(const PortValue &in) const {
        const double q = in(flow_index_);
        std::vector<PortValue> outs;

        if (q == 0.0) {
            for (std::size_t i = 0; i < NumOutputs(); ++i) {
                PortValue out = in;
                out(flow_index_) = 0.0;
                outs.push_back(std::move(out));
            }
            return outs;
        }
        if (q < 0.0) {
            throw ComputationError("negative inflow " + std::to_string(q));
        }

        std::vector<double> shares = Shares(q);
        double total = std::accumulate(shares.begin(), shares.end(), 0.0);
        if (!(total > 0.0)) {
            throw ComputationError("split ratios sum to zero");
        }

        for (double share : shares) {
            const double flow = q * share / total;
            PortValue out = flow > 0.0 ? in : PortValue::Zero(in.size());
            out(flow_index_) = flow > 0.0 ? flow : 0.0;
            outs.push_back(std::move(out));
        }
        return outs;
    }

    [[nodiscard]] Mode GetMode() const { return mode_; }

    [[nodiscard]] std::size_t NumOutputs() const {
        return mode_ == Mode::Ratio ? ratios_.size() : 2;
    }

  private:
    static Mode ParseMode(const NodeConfig &config) {
        std::string mode = config.Get<std::string>("mode", "ratio");
        if (mode == "ratio")
            return Mode::Ratio;
        if (mode == "threshold")
            return Mode::Threshold;
        if (mode == "fixed_recycle")
            return Mode::FixedRecycle;
        throw ConfigError("node '" + config.id + "': unknown splitter mode '" + mode +
                          "' (expected ratio, threshold or fixed_recycle)");
    }

    /// Unnormalised share of each output for inbound flow q
    [[nodiscard]] std::vector<double> Shares(double q) const {
        switch (mode_) {
        case Mode::Ratio:
            return ratios_;
        case Mode::Threshold:
            if (q >= qthreshold_) {
                return {qthreshold_, q - qthreshold_};
            }
            return {q, 0.0};
        case Mode::FixedRecycle:
            return {std::max(q - qintr_, 0.0), qintr_};
        }
        return ratios_;
    }

    Mode mode_;
    Eigen::Index flow_index_;
    std::vector<double> ratios_;
    double qthreshold_ = 0.0;
    double qintr_ = 55338.0;
};

} // namespace components
} // namespace sluice
