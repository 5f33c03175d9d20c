/**
 * @file Flowsheet.cpp
 * @brief Flowsheet construction and validation
 */

#include <sluice/graph/Flowsheet.hpp>

#include <algorithm>
#include <unordered_set>

namespace sluice {

Flowsheet Flowsheet::Build(const std::vector<NodeConfig> &nodes,
                           const std::vector<EdgeConfig> &edges) {
    Flowsheet flowsheet;
    for (const auto &node : nodes) {
        flowsheet.AddNode(node);
    }
    for (const auto &edge : edges) {
        flowsheet.AddEdge(edge);
    }
    return flowsheet;
}

NodeIndex Flowsheet::AddNode(NodeConfig config) {
    if (config.id.empty()) {
        throw ConfigError("node with empty id (type '" + config.type + "')");
    }
    if (node_lookup_.count(config.id) > 0) {
        throw DuplicateNodeError(config.id);
    }

    auto check_unique = [&config](const std::vector<std::string> &ports, const char *what) {
        std::unordered_set<std::string> seen;
        for (const auto &port : ports) {
            if (!seen.insert(port).second) {
                throw ConfigError("node '" + config.id + "' declares " + what + " port '" + port +
                                  "' twice");
            }
        }
    };
    check_unique(config.inputs, "input");
    check_unique(config.outputs, "output");

    Node node;
    node.index = nodes_.size();
    node.config = std::move(config);
    node_lookup_.emplace(node.config.id, node.index);
    nodes_.push_back(std::move(node));
    return nodes_.back().index;
}

EdgeIndex Flowsheet::AddEdge(const EdgeConfig &config) {
    if (config.id.empty()) {
        throw ConfigError("edge with empty id (" + config.source_node + " -> " +
                          config.target_node + ")");
    }
    if (edge_lookup_.count(config.id) > 0) {
        throw DuplicateEdgeError(config.id);
    }

    auto source = FindNode(config.source_node);
    if (!source) {
        throw UnknownReferenceError(config.id, "source node '" + config.source_node +
                                                   "' does not exist");
    }
    auto target = FindNode(config.target_node);
    if (!target) {
        throw UnknownReferenceError(config.id, "target node '" + config.target_node +
                                                   "' does not exist");
    }
    if (!nodes_[*source].config.HasOutput(config.source_port)) {
        throw UnknownReferenceError(config.id, "node '" + config.source_node +
                                                   "' has no output port '" +
                                                   config.source_port + "'");
    }
    if (!nodes_[*target].config.HasInput(config.target_port)) {
        throw UnknownReferenceError(config.id, "node '" + config.target_node +
                                                   "' has no input port '" +
                                                   config.target_port + "'");
    }

    auto port_key = std::make_pair(*target, config.target_port);
    if (auto it = port_feed_.find(port_key); it != port_feed_.end()) {
        throw FanInViolationError(config.id, MakePortPath(config.target_node, config.target_port),
                                  edges_[it->second].id);
    }

    Edge edge;
    edge.index = edges_.size();
    edge.id = config.id;
    edge.source = *source;
    edge.source_port = config.source_port;
    edge.target = *target;
    edge.target_port = config.target_port;
    edge.size = config.size;

    if (config.initial_value) {
        const auto &guess = *config.initial_value;
        if (config.size && *config.size != guess.size()) {
            throw ConfigError("edge '" + config.id + "' initial_value has " +
                              std::to_string(guess.size()) + " entries, size is " +
                              std::to_string(*config.size));
        }
        PortValue value(static_cast<Eigen::Index>(guess.size()));
        for (std::size_t i = 0; i < guess.size(); ++i) {
            value(static_cast<Eigen::Index>(i)) = guess[i];
        }
        edge.initial_value = std::move(value);
    }

    edge_lookup_.emplace(edge.id, edge.index);
    port_feed_.emplace(std::move(port_key), edge.index);
    nodes_[edge.source].out_edges.push_back(edge.index);
    nodes_[edge.target].in_edges.push_back(edge.index);
    edges_.push_back(std::move(edge));
    return edges_.back().index;
}

std::optional<NodeIndex> Flowsheet::FindNode(const std::string &id) const {
    auto it = node_lookup_.find(id);
    if (it == node_lookup_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<EdgeIndex> Flowsheet::FindEdge(const std::string &id) const {
    auto it = edge_lookup_.find(id);
    if (it == edge_lookup_.end()) {
        return std::nullopt;
    }
    return it->second;
}

NodeIndex Flowsheet::RequireNode(const std::string &id) const {
    auto index = FindNode(id);
    if (!index) {
        throw ConfigError("no node with id '" + id + "'");
    }
    return *index;
}

EdgeIndex Flowsheet::RequireEdge(const std::string &id) const {
    auto index = FindEdge(id);
    if (!index) {
        throw ConfigError("no edge with id '" + id + "'");
    }
    return *index;
}

std::vector<NodeIndex> Flowsheet::Successors(NodeIndex node) const {
    std::vector<NodeIndex> result;
    for (EdgeIndex e : nodes_.at(node).out_edges) {
        NodeIndex target = edges_[e].target;
        if (std::find(result.begin(), result.end(), target) == result.end()) {
            result.push_back(target);
        }
    }
    return result;
}

std::vector<NodeIndex> Flowsheet::Predecessors(NodeIndex node) const {
    std::vector<NodeIndex> result;
    for (EdgeIndex e : nodes_.at(node).in_edges) {
        NodeIndex source = edges_[e].source;
        if (std::find(result.begin(), result.end(), source) == result.end()) {
            result.push_back(source);
        }
    }
    return result;
}

bool Flowsheet::HasSelfLoop(NodeIndex node) const {
    for (EdgeIndex e : nodes_.at(node).out_edges) {
        if (edges_[e].IsSelfLoop()) {
            return true;
        }
    }
    return false;
}

std::optional<EdgeIndex> Flowsheet::EdgeIntoPort(NodeIndex node, const std::string &port) const {
    auto it = port_feed_.find(std::make_pair(nodes_.at(node).index, port));
    if (it == port_feed_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<EdgeIndex> Flowsheet::EdgesFromPort(NodeIndex node, const std::string &port) const {
    std::vector<EdgeIndex> result;
    for (EdgeIndex e : nodes_.at(node).out_edges) {
        if (edges_[e].source_port == port) {
            result.push_back(e);
        }
    }
    return result;
}

std::vector<NodeIndex> Flowsheet::NodesById() const {
    std::vector<NodeIndex> order(nodes_.size());
    for (NodeIndex i = 0; i < nodes_.size(); ++i) {
        order[i] = i;
    }
    std::sort(order.begin(), order.end(),
              [this](NodeIndex a, NodeIndex b) { return nodes_[a].id() < nodes_[b].id(); });
    return order;
}

} // namespace sluice
