#pragma once

/**
 * @file TearSelector.hpp
 * @brief Feedback edge ("tear") selection for cyclic SCCs
 *
 * Greedy cycle cover: enumerate the elementary cycles of the SCC, then keep
 * tearing the edge that lies on the most still-unbroken cycles (ties go to
 * the earliest inserted edge). Redundant tears are dropped afterwards.
 *
 * Cycle enumeration is exponential in the worst case, so both the number of
 * cycles and the number of DFS edge expansions are bounded. If either bound
 * is hit, the selector falls back to tearing the back edges of a
 * deterministic depth-first search, which is always sufficient.
 */

#include <sluice/graph/Flowsheet.hpp>
#include <sluice/sched/CycleAnalyzer.hpp>

#include <optional>
#include <set>
#include <vector>

namespace sluice {

struct TearSelectorOptions {
    std::size_t max_cycles = 10000;        ///< Enumeration bound per SCC
    std::size_t max_expansions = 1000000;  ///< DFS edge expansions per SCC
};

/**
 * @brief Tear edges chosen for one SCC
 */
struct TearSet {
    std::vector<EdgeIndex> edges; ///< Insertion order
    std::size_t cycles_found = 0; ///< Elementary cycles enumerated (0 on fallback)
    bool used_fallback = false;   ///< DFS back edges were used

    [[nodiscard]] std::set<EdgeIndex> AsSet() const { return {edges.begin(), edges.end()}; }
};

class TearSelector {
  public:
    TearSelector() = default;
    explicit TearSelector(TearSelectorOptions options) : options_(options) {}

    /**
     * @brief Select tear edges for a cyclic SCC
     *
     * Non-cyclic SCCs get an empty set.
     *
     * @throws PlanningError if the resulting subgraph still has a cycle
     */
    [[nodiscard]] TearSet Select(const Flowsheet &flowsheet,
                                 const StronglyConnectedComponent &scc) const;

    /**
     * @brief Enumerate elementary cycles inside a node set
     *
     * Each cycle is a list of edge indices. Parallel edges yield distinct
     * cycles. Each cycle is reported once, rooted at its member that comes
     * first in @p members.
     *
     * @return The cycles, or std::nullopt if more than @p limit exist or the
     *         search needs more than @p max_expansions edge expansions
     */
    [[nodiscard]] static std::optional<std::vector<std::vector<EdgeIndex>>>
    EnumerateCycles(const Flowsheet &flowsheet, const std::vector<NodeIndex> &members,
                    std::size_t limit, std::size_t max_expansions = 1000000);

    /**
     * @brief Back edges of a DFS over the node set
     *
     * Roots are visited in @p members order and edges in insertion order.
     */
    [[nodiscard]] static std::vector<EdgeIndex> BackEdges(const Flowsheet &flowsheet,
                                                          const std::vector<NodeIndex> &members);

    [[nodiscard]] const TearSelectorOptions &Options() const { return options_; }

  private:
    TearSelectorOptions options_;
};

} // namespace sluice
