/**
 * @file TearSelector.cpp
 * @brief Greedy cycle-cover tear selection
 */

#include <sluice/sched/TearSelector.hpp>

#include <algorithm>
#include <map>

namespace sluice {

namespace {

/// Local numbering of the SCC members for the enumeration
struct SubGraph {
    std::vector<NodeIndex> members;
    std::vector<std::size_t> local;                    ///< node -> local id (or invalid)
    std::vector<std::vector<EdgeIndex>> out;           ///< local id -> internal out edges

    SubGraph(const Flowsheet &flowsheet, const std::vector<NodeIndex> &nodes)
        : members(nodes), local(flowsheet.NumNodes(), kInvalidIndex), out(nodes.size()) {
        for (std::size_t i = 0; i < nodes.size(); ++i) {
            local[nodes[i]] = i;
        }
        for (std::size_t i = 0; i < nodes.size(); ++i) {
            for (EdgeIndex e : flowsheet.OutEdges(nodes[i])) {
                if (local[flowsheet.GetEdge(e).target] != kInvalidIndex) {
                    out[i].push_back(e);
                }
            }
        }
    }
};

} // namespace

// =============================================================================
// Cycle enumeration
// =============================================================================

std::optional<std::vector<std::vector<EdgeIndex>>>
TearSelector::EnumerateCycles(const Flowsheet &flowsheet, const std::vector<NodeIndex> &members,
                              std::size_t limit, std::size_t max_expansions) {
    SubGraph sub(flowsheet, members);
    std::vector<std::vector<EdgeIndex>> cycles;
    std::size_t expansions = 0;

    // Cycles rooted at `start` may only pass through members with a larger
    // local id, so every elementary cycle is found exactly once.
    struct Frame {
        std::size_t node;
        std::size_t next;
    };

    for (std::size_t start = 0; start < members.size(); ++start) {
        std::vector<bool> on_path(members.size(), false);
        std::vector<EdgeIndex> path;
        std::vector<Frame> frames{{start, 0}};
        on_path[start] = true;

        while (!frames.empty()) {
            Frame &frame = frames.back();
            if (frame.next >= sub.out[frame.node].size()) {
                on_path[frame.node] = false;
                frames.pop_back();
                if (!path.empty()) {
                    path.pop_back();
                }
                continue;
            }

            // Dead-end paths cost work without producing cycles
            if (++expansions > max_expansions) {
                return std::nullopt;
            }
            EdgeIndex e = sub.out[frame.node][frame.next++];
            std::size_t w = sub.local[flowsheet.GetEdge(e).target];
            if (w == start) {
                path.push_back(e);
                cycles.push_back(path);
                path.pop_back();
                if (cycles.size() > limit) {
                    return std::nullopt;
                }
            } else if (w > start && !on_path[w]) {
                on_path[w] = true;
                path.push_back(e);
                frames.push_back({w, 0});
            }
        }
    }
    return cycles;
}

// =============================================================================
// DFS back edges
// =============================================================================

std::vector<EdgeIndex> TearSelector::BackEdges(const Flowsheet &flowsheet,
                                               const std::vector<NodeIndex> &members) {
    SubGraph sub(flowsheet, members);
    enum : std::uint8_t { kWhite, kGray, kBlack };
    std::vector<std::uint8_t> color(members.size(), kWhite);
    std::vector<EdgeIndex> back;

    for (std::size_t root = 0; root < members.size(); ++root) {
        if (color[root] != kWhite) {
            continue;
        }
        std::vector<std::pair<std::size_t, std::size_t>> stack{{root, 0}};
        color[root] = kGray;
        while (!stack.empty()) {
            auto &[v, pos] = stack.back();
            if (pos >= sub.out[v].size()) {
                color[v] = kBlack;
                stack.pop_back();
                continue;
            }
            EdgeIndex e = sub.out[v][pos++];
            std::size_t w = sub.local[flowsheet.GetEdge(e).target];
            if (color[w] == kGray) {
                back.push_back(e);
            } else if (color[w] == kWhite) {
                color[w] = kGray;
                stack.emplace_back(w, 0);
            }
        }
    }
    std::sort(back.begin(), back.end());
    return back;
}

// =============================================================================
// Selection
// =============================================================================

TearSet TearSelector::Select(const Flowsheet &flowsheet,
                             const StronglyConnectedComponent &scc) const {
    TearSet result;
    if (!scc.cyclic) {
        return result;
    }

    auto cycles =
        EnumerateCycles(flowsheet, scc.nodes, options_.max_cycles, options_.max_expansions);
    std::vector<EdgeIndex> selected;

    if (cycles) {
        result.cycles_found = cycles->size();
        std::vector<bool> broken(cycles->size(), false);
        std::size_t remaining = cycles->size();

        while (remaining > 0) {
            // Ordered map: on equal counts the smallest edge index wins
            std::map<EdgeIndex, std::size_t> hits;
            for (std::size_t c = 0; c < cycles->size(); ++c) {
                if (broken[c])
                    continue;
                for (EdgeIndex e : (*cycles)[c]) {
                    ++hits[e];
                }
            }
            EdgeIndex best = hits.begin()->first;
            std::size_t best_hits = 0;
            for (const auto &[e, count] : hits) {
                if (count > best_hits) {
                    best = e;
                    best_hits = count;
                }
            }
            selected.push_back(best);
            for (std::size_t c = 0; c < cycles->size(); ++c) {
                if (!broken[c] && std::find((*cycles)[c].begin(), (*cycles)[c].end(), best) !=
                                      (*cycles)[c].end()) {
                    broken[c] = true;
                    --remaining;
                }
            }
        }

        // Drop tears made redundant by later picks, newest first
        for (std::size_t i = selected.size(); i-- > 0;) {
            std::set<EdgeIndex> without(selected.begin(), selected.end());
            without.erase(selected[i]);
            if (CycleAnalyzer::TopologicalOrder(flowsheet, scc.nodes, without)) {
                selected.erase(selected.begin() + static_cast<std::ptrdiff_t>(i));
            }
        }
    } else {
        result.used_fallback = true;
        selected = BackEdges(flowsheet, scc.nodes);
    }

    std::sort(selected.begin(), selected.end());
    result.edges = std::move(selected);

    if (!CycleAnalyzer::TopologicalOrder(flowsheet, scc.nodes, result.AsSet())) {
        throw PlanningError("tear set for SCC containing '" +
                            flowsheet.GetNode(scc.nodes.front()).id() + "' leaves a cycle");
    }
    return result;
}

} // namespace sluice
