#pragma once

/**
 * @file Flowsheet.hpp
 * @brief Flowsheet graph model: nodes and port-to-port edges
 *
 * Nodes and edges live in index-addressed arenas so recycle loops are
 * plain index cycles with no shared ownership. Edge indices double as
 * insertion order, which the tear heuristic uses for tie-breaking.
 */

#include <sluice/core/CoreTypes.hpp>
#include <sluice/core/Error.hpp>
#include <sluice/core/NodeConfig.hpp>

#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace sluice {

// =============================================================================
// Descriptors
// =============================================================================

/**
 * @brief Declarative description of one edge (`edges:` list entry)
 */
struct EdgeConfig {
    std::string id;
    std::string source_node;
    std::string source_port;
    std::string target_node;
    std::string target_port;

    /// Expected stream width (used for the zero guess when torn)
    std::optional<std::size_t> size;

    /// Caller-supplied guess used if this edge is torn
    std::optional<std::vector<double>> initial_value;
};

// =============================================================================
// Graph Elements
// =============================================================================

/**
 * @brief One component instance in the flowsheet
 *
 * Immutable once the flowsheet is built.
 */
struct Node {
    NodeIndex index = kInvalidIndex;
    NodeConfig config;              ///< Resolved descriptor (ports, parameters)
    std::vector<EdgeIndex> in_edges;  ///< Incoming edges, insertion order
    std::vector<EdgeIndex> out_edges; ///< Outgoing edges, insertion order

    [[nodiscard]] const std::string &id() const { return config.id; }
    [[nodiscard]] const std::string &type() const { return config.type; }
};

/**
 * @brief Directed connection (source node, port) -> (target node, port)
 */
struct Edge {
    EdgeIndex index = kInvalidIndex;
    std::string id;
    NodeIndex source = kInvalidIndex;
    std::string source_port;
    NodeIndex target = kInvalidIndex;
    std::string target_port;

    std::optional<std::size_t> size;
    std::optional<PortValue> initial_value;

    [[nodiscard]] bool IsSelfLoop() const { return source == target; }
};

// =============================================================================
// Flowsheet
// =============================================================================

/**
 * @brief Validated flowsheet graph
 *
 * Build-time checks:
 * - node ids are unique (DuplicateNodeError)
 * - edge ids are unique (DuplicateEdgeError)
 * - every edge names existing nodes and declared ports (UnknownReferenceError)
 * - every target port has at most one incoming edge (FanInViolationError)
 */
class Flowsheet {
  public:
    Flowsheet() = default;

    /**
     * @brief Build and validate a flowsheet from descriptors
     *
     * All nodes are added before any edge, so edge order in the input does
     * not depend on node order.
     */
    static Flowsheet Build(const std::vector<NodeConfig> &nodes,
                           const std::vector<EdgeConfig> &edges);

    /// @throws DuplicateNodeError, ConfigError (duplicate port name)
    NodeIndex AddNode(NodeConfig config);

    /// @throws UnknownReferenceError, FanInViolationError, DuplicateEdgeError
    EdgeIndex AddEdge(const EdgeConfig &config);

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] std::size_t NumNodes() const { return nodes_.size(); }
    [[nodiscard]] std::size_t NumEdges() const { return edges_.size(); }
    [[nodiscard]] bool Empty() const { return nodes_.empty(); }

    [[nodiscard]] const Node &GetNode(NodeIndex index) const { return nodes_.at(index); }
    [[nodiscard]] const Edge &GetEdge(EdgeIndex index) const { return edges_.at(index); }

    [[nodiscard]] const std::vector<Node> &Nodes() const { return nodes_; }

    /// Full edge list in insertion order
    [[nodiscard]] const std::vector<Edge> &Edges() const { return edges_; }

    [[nodiscard]] std::optional<NodeIndex> FindNode(const std::string &id) const;
    [[nodiscard]] std::optional<EdgeIndex> FindEdge(const std::string &id) const;

    /// @throws ConfigError if no such node
    [[nodiscard]] NodeIndex RequireNode(const std::string &id) const;

    /// @throws ConfigError if no such edge
    [[nodiscard]] EdgeIndex RequireEdge(const std::string &id) const;

    /// Distinct successor nodes, in order of first outgoing edge
    [[nodiscard]] std::vector<NodeIndex> Successors(NodeIndex node) const;

    /// Distinct predecessor nodes, in order of first incoming edge
    [[nodiscard]] std::vector<NodeIndex> Predecessors(NodeIndex node) const;

    [[nodiscard]] const std::vector<EdgeIndex> &InEdges(NodeIndex node) const {
        return nodes_.at(node).in_edges;
    }

    [[nodiscard]] const std::vector<EdgeIndex> &OutEdges(NodeIndex node) const {
        return nodes_.at(node).out_edges;
    }

    [[nodiscard]] bool HasSelfLoop(NodeIndex node) const;

    /// The edge feeding a target port, if connected
    [[nodiscard]] std::optional<EdgeIndex> EdgeIntoPort(NodeIndex node,
                                                        const std::string &port) const;

    /// All edges leaving a source port
    [[nodiscard]] std::vector<EdgeIndex> EdgesFromPort(NodeIndex node,
                                                       const std::string &port) const;

    /// Node indices sorted by ascending id
    [[nodiscard]] std::vector<NodeIndex> NodesById() const;

  private:
    std::vector<Node> nodes_;
    std::vector<Edge> edges_;
    std::unordered_map<std::string, NodeIndex> node_lookup_;
    std::unordered_map<std::string, EdgeIndex> edge_lookup_;
    std::map<std::pair<NodeIndex, std::string>, EdgeIndex> port_feed_; ///< (node, port) -> feeding edge
};

} // namespace sluice
