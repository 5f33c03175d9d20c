#pragma once

/**
 * @file CycleAnalyzer.hpp
 * @brief Strongly connected component decomposition of a flowsheet
 *
 * Partitions the graph into SCCs and orders them along the condensation
 * graph so that every producer SCC precedes all of its consumers.
 */

#include <sluice/graph/Flowsheet.hpp>

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace sluice {

/**
 * @brief One strongly connected component
 */
struct StronglyConnectedComponent {
    std::vector<NodeIndex> nodes; ///< Members, ascending node id
    bool cyclic = false;          ///< Size > 1, or a single node with a self-loop
    std::size_t level = 0;        ///< Longest producer chain above this SCC

    [[nodiscard]] std::size_t Size() const { return nodes.size(); }
};

/**
 * @brief Result of cycle analysis
 */
struct CycleAnalysis {
    /// SCCs in dependency order (producers before consumers)
    std::vector<StronglyConnectedComponent> components;

    /// Node index -> position in `components`
    std::vector<std::size_t> component_of;

    /// Condensation edges: component position -> consumer positions
    std::vector<std::set<std::size_t>> successors;

    [[nodiscard]] std::size_t NumCyclic() const {
        std::size_t count = 0;
        for (const auto &scc : components) {
            if (scc.cyclic)
                ++count;
        }
        return count;
    }

    [[nodiscard]] bool HasCycles() const { return NumCyclic() > 0; }

    /**
     * @brief Check that the condensation graph has no cycle
     *
     * Always true for a correct analysis. Exposed so callers and tests can
     * verify the property directly.
     */
    [[nodiscard]] bool IsCondensationAcyclic() const;

    /// Human-readable listing ("[0] L0 linear {a}", "[1] L1 cyclic {b, c}")
    [[nodiscard]] std::string ToString(const Flowsheet &flowsheet) const;
};

/**
 * @brief Cycle analysis over a Flowsheet
 */
class CycleAnalyzer {
  public:
    /**
     * @brief Decompose and order the flowsheet
     *
     * Ties between SCCs that are ready at the same time are broken by the
     * smallest member node id.
     *
     * @throws PlanningError if the condensation graph turns out cyclic
     */
    [[nodiscard]] static CycleAnalysis Analyze(const Flowsheet &flowsheet);

    /**
     * @brief Tarjan's algorithm (iterative), SCCs in reverse topological order
     */
    [[nodiscard]] static std::vector<std::vector<NodeIndex>> FindSCCs(const Flowsheet &flowsheet);

    /**
     * @brief Topological order of a node subset, ignoring some edges
     *
     * Only edges with both ends in @p members and not in @p excluded count.
     * Ready nodes are taken in ascending id order.
     *
     * @return The order, or std::nullopt if the remaining subgraph is cyclic
     */
    [[nodiscard]] static std::optional<std::vector<NodeIndex>>
    TopologicalOrder(const Flowsheet &flowsheet, const std::vector<NodeIndex> &members,
                     const std::set<EdgeIndex> &excluded = {});
};

} // namespace sluice
