#pragma once

/**
 * @file TestFlowsheets.hpp
 * @brief Descriptor builders shared by the graph, scheduler and executor tests
 */

#include <sluice/core/CoreTypes.hpp>
#include <sluice/core/NodeConfig.hpp>
#include <sluice/graph/Flowsheet.hpp>

#include <initializer_list>
#include <string>
#include <vector>

namespace sluice::test {

inline NodeConfig MakeNode(const std::string &id, std::vector<std::string> inputs,
                           std::vector<std::string> outputs,
                           const std::string &type = "scripted") {
    NodeConfig node;
    node.id = id;
    node.type = type;
    node.inputs = std::move(inputs);
    node.outputs = std::move(outputs);
    return node;
}

inline EdgeConfig MakeEdge(const std::string &id, const std::string &source,
                           const std::string &source_port, const std::string &target,
                           const std::string &target_port) {
    EdgeConfig edge;
    edge.id = id;
    edge.source_node = source;
    edge.source_port = source_port;
    edge.target_node = target;
    edge.target_port = target_port;
    return edge;
}

inline PortValue Vec(std::initializer_list<double> values) {
    PortValue v(static_cast<Eigen::Index>(values.size()));
    Eigen::Index i = 0;
    for (double x : values) {
        v(i++) = x;
    }
    return v;
}

/// a -> b -> a, ports "in"/"out" on both nodes
inline Flowsheet TwoNodeLoop() {
    return Flowsheet::Build({MakeNode("a", {"in"}, {"out"}), MakeNode("b", {"in"}, {"out"})},
                            {MakeEdge("ab", "a", "out", "b", "in"),
                             MakeEdge("ba", "b", "out", "a", "in")});
}

/// feed -> mix -> reactor -> split -> product, with split -> mix recycle
inline Flowsheet RecyclePlant() {
    return Flowsheet::Build(
        {MakeNode("feed", {}, {"out"}), MakeNode("mix", {"in_1", "in_2"}, {"out"}),
         MakeNode("reactor", {"in"}, {"out"}), MakeNode("split", {"in"}, {"out_1", "out_2"}),
         MakeNode("product", {"in"}, {})},
        {MakeEdge("feed_mix", "feed", "out", "mix", "in_1"),
         MakeEdge("mix_reactor", "mix", "out", "reactor", "in"),
         MakeEdge("reactor_split", "reactor", "out", "split", "in"),
         MakeEdge("recycle", "split", "out_1", "mix", "in_2"),
         MakeEdge("split_product", "split", "out_2", "product", "in")});
}

/// n independent chains c<i>_0 -> c<i>_1 -> ... of the given length
inline Flowsheet IndependentChains(std::size_t chains, std::size_t length) {
    std::vector<NodeConfig> nodes;
    std::vector<EdgeConfig> edges;
    for (std::size_t c = 0; c < chains; ++c) {
        for (std::size_t k = 0; k < length; ++k) {
            std::string id = "c" + std::to_string(c) + "_" + std::to_string(k);
            nodes.push_back(MakeNode(id, {"in"}, {"out"}));
            if (k > 0) {
                std::string prev = "c" + std::to_string(c) + "_" + std::to_string(k - 1);
                edges.push_back(MakeEdge(prev + "_" + id, prev, "out", id, "in"));
            }
        }
    }
    return Flowsheet::Build(nodes, edges);
}

} // namespace sluice::test
