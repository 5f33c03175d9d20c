/**
 * @file CycleAnalyzer.cpp
 * @brief Tarjan SCC decomposition and condensation ordering
 */

#include <sluice/sched/CycleAnalyzer.hpp>

#include <algorithm>
#include <functional>
#include <queue>
#include <sstream>
#include <utility>

namespace sluice {

namespace {

/// Min-heap entry keyed by a node id string
using IdKey = std::pair<std::string, std::size_t>;
using IdHeap = std::priority_queue<IdKey, std::vector<IdKey>, std::greater<>>;

} // namespace

// =============================================================================
// Tarjan
// =============================================================================

std::vector<std::vector<NodeIndex>> CycleAnalyzer::FindSCCs(const Flowsheet &flowsheet) {
    const std::size_t n = flowsheet.NumNodes();
    constexpr std::size_t kUnvisited = kInvalidIndex;

    std::vector<std::size_t> index(n, kUnvisited);
    std::vector<std::size_t> lowlink(n, 0);
    std::vector<bool> on_stack(n, false);
    std::vector<NodeIndex> stack;
    std::vector<std::vector<NodeIndex>> result;
    std::size_t counter = 0;

    // Explicit call stack: (node, next out-edge position)
    std::vector<std::pair<NodeIndex, std::size_t>> call_stack;

    for (NodeIndex root : flowsheet.NodesById()) {
        if (index[root] != kUnvisited) {
            continue;
        }
        call_stack.emplace_back(root, 0);
        index[root] = lowlink[root] = counter++;
        stack.push_back(root);
        on_stack[root] = true;

        while (!call_stack.empty()) {
            auto &[v, pos] = call_stack.back();
            const auto &out = flowsheet.OutEdges(v);

            if (pos < out.size()) {
                NodeIndex w = flowsheet.GetEdge(out[pos]).target;
                ++pos;
                if (index[w] == kUnvisited) {
                    index[w] = lowlink[w] = counter++;
                    stack.push_back(w);
                    on_stack[w] = true;
                    call_stack.emplace_back(w, 0);
                } else if (on_stack[w]) {
                    lowlink[v] = std::min(lowlink[v], index[w]);
                }
                continue;
            }

            // All successors done
            NodeIndex done = v;
            if (lowlink[done] == index[done]) {
                std::vector<NodeIndex> scc;
                NodeIndex w;
                do {
                    w = stack.back();
                    stack.pop_back();
                    on_stack[w] = false;
                    scc.push_back(w);
                } while (w != done);
                result.push_back(std::move(scc));
            }
            call_stack.pop_back();
            if (!call_stack.empty()) {
                NodeIndex parent = call_stack.back().first;
                lowlink[parent] = std::min(lowlink[parent], lowlink[done]);
            }
        }
    }
    return result;
}

// =============================================================================
// Analyze
// =============================================================================

CycleAnalysis CycleAnalyzer::Analyze(const Flowsheet &flowsheet) {
    auto raw = FindSCCs(flowsheet);
    const std::size_t count = raw.size();

    auto by_id = [&flowsheet](NodeIndex a, NodeIndex b) {
        return flowsheet.GetNode(a).id() < flowsheet.GetNode(b).id();
    };
    for (auto &members : raw) {
        std::sort(members.begin(), members.end(), by_id);
    }

    std::vector<std::size_t> raw_of(flowsheet.NumNodes(), 0);
    for (std::size_t c = 0; c < count; ++c) {
        for (NodeIndex v : raw[c]) {
            raw_of[v] = c;
        }
    }

    // Condensation edges over raw component numbers
    std::vector<std::set<std::size_t>> raw_succ(count);
    std::vector<std::size_t> in_degree(count, 0);
    for (const auto &edge : flowsheet.Edges()) {
        std::size_t a = raw_of[edge.source];
        std::size_t b = raw_of[edge.target];
        if (a != b && raw_succ[a].insert(b).second) {
            ++in_degree[b];
        }
    }

    // Kahn over the condensation, smallest member id first
    IdHeap ready;
    for (std::size_t c = 0; c < count; ++c) {
        if (in_degree[c] == 0) {
            ready.emplace(flowsheet.GetNode(raw[c].front()).id(), c);
        }
    }

    std::vector<std::size_t> order;
    std::vector<std::size_t> level(count, 0);
    order.reserve(count);
    while (!ready.empty()) {
        std::size_t c = ready.top().second;
        ready.pop();
        order.push_back(c);
        for (std::size_t d : raw_succ[c]) {
            level[d] = std::max(level[d], level[c] + 1);
            if (--in_degree[d] == 0) {
                ready.emplace(flowsheet.GetNode(raw[d].front()).id(), d);
            }
        }
    }

    if (order.size() != count) {
        throw PlanningError("condensation graph unexpectedly cyclic (" +
                            std::to_string(count - order.size()) + " components unordered)");
    }

    CycleAnalysis analysis;
    analysis.components.reserve(count);
    analysis.component_of.assign(flowsheet.NumNodes(), 0);
    analysis.successors.resize(count);

    std::vector<std::size_t> position(count, 0);
    for (std::size_t p = 0; p < count; ++p) {
        position[order[p]] = p;
    }

    for (std::size_t p = 0; p < count; ++p) {
        std::size_t c = order[p];
        StronglyConnectedComponent scc;
        scc.nodes = std::move(raw[c]);
        scc.cyclic = scc.nodes.size() > 1 || flowsheet.HasSelfLoop(scc.nodes.front());
        scc.level = level[c];
        for (NodeIndex v : scc.nodes) {
            analysis.component_of[v] = p;
        }
        for (std::size_t d : raw_succ[c]) {
            analysis.successors[p].insert(position[d]);
        }
        analysis.components.push_back(std::move(scc));
    }

    if (!analysis.IsCondensationAcyclic()) {
        throw PlanningError("condensation order violates a dependency");
    }
    return analysis;
}

// =============================================================================
// Subgraph topological order
// =============================================================================

std::optional<std::vector<NodeIndex>>
CycleAnalyzer::TopologicalOrder(const Flowsheet &flowsheet, const std::vector<NodeIndex> &members,
                                const std::set<EdgeIndex> &excluded) {
    std::vector<bool> member(flowsheet.NumNodes(), false);
    for (NodeIndex v : members) {
        member[v] = true;
    }

    std::vector<std::size_t> in_degree(flowsheet.NumNodes(), 0);
    for (NodeIndex v : members) {
        for (EdgeIndex e : flowsheet.OutEdges(v)) {
            const auto &edge = flowsheet.GetEdge(e);
            if (member[edge.target] && excluded.count(e) == 0) {
                ++in_degree[edge.target];
            }
        }
    }

    IdHeap ready;
    for (NodeIndex v : members) {
        if (in_degree[v] == 0) {
            ready.emplace(flowsheet.GetNode(v).id(), v);
        }
    }

    std::vector<NodeIndex> order;
    order.reserve(members.size());
    while (!ready.empty()) {
        NodeIndex v = ready.top().second;
        ready.pop();
        order.push_back(v);
        for (EdgeIndex e : flowsheet.OutEdges(v)) {
            const auto &edge = flowsheet.GetEdge(e);
            if (!member[edge.target] || excluded.count(e) > 0) {
                continue;
            }
            if (--in_degree[edge.target] == 0) {
                ready.emplace(flowsheet.GetNode(edge.target).id(), edge.target);
            }
        }
    }

    if (order.size() != members.size()) {
        return std::nullopt;
    }
    return order;
}

// =============================================================================
// CycleAnalysis
// =============================================================================

bool CycleAnalysis::IsCondensationAcyclic() const {
    // Components are stored in dependency order, so every condensation edge
    // must point forward. A backward edge would close a cycle.
    for (std::size_t p = 0; p < successors.size(); ++p) {
        for (std::size_t q : successors[p]) {
            if (q <= p) {
                return false;
            }
        }
    }
    return true;
}

std::string CycleAnalysis::ToString(const Flowsheet &flowsheet) const {
    std::ostringstream oss;
    for (std::size_t p = 0; p < components.size(); ++p) {
        const auto &scc = components[p];
        oss << "[" << p << "] L" << scc.level << " " << (scc.cyclic ? "cyclic" : "linear")
            << " {";
        for (std::size_t i = 0; i < scc.nodes.size(); ++i) {
            oss << (i > 0 ? ", " : "") << flowsheet.GetNode(scc.nodes[i]).id();
        }
        oss << "}\n";
    }
    return oss.str();
}

} // namespace sluice
