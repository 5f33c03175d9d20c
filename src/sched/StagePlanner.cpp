/**
 * @file StagePlanner.cpp
 * @brief Stage sequencing and loop internal ordering
 */

#include <sluice/sched/StagePlanner.hpp>

#include <set>
#include <sstream>

namespace sluice {

// =============================================================================
// ExecutionPlan
// =============================================================================

std::size_t ExecutionPlan::NumLinear() const {
    std::size_t count = 0;
    for (const auto &stage : stages) {
        if (!stage.IsLoop())
            ++count;
    }
    return count;
}

std::size_t ExecutionPlan::NumLoop() const { return stages.size() - NumLinear(); }

std::vector<NodeIndex> ExecutionPlan::NodeOrder() const {
    std::vector<NodeIndex> order;
    for (const auto &stage : stages) {
        order.insert(order.end(), stage.nodes.begin(), stage.nodes.end());
    }
    return order;
}

std::vector<EdgeIndex> ExecutionPlan::TearEdges() const {
    std::vector<EdgeIndex> tears;
    for (const auto &stage : stages) {
        tears.insert(tears.end(), stage.tear_edges.begin(), stage.tear_edges.end());
    }
    return tears;
}

std::size_t ExecutionPlan::NumLevels() const {
    std::set<std::size_t> levels;
    for (const auto &stage : stages) {
        levels.insert(stage.level);
    }
    return levels.size();
}

std::string ExecutionPlan::ToString(const Flowsheet &flowsheet) const {
    std::ostringstream oss;
    for (std::size_t s = 0; s < stages.size(); ++s) {
        const auto &stage = stages[s];
        oss << "  [" << s << "] " << StageKindName(stage.kind) << " L" << stage.level << " {";
        for (std::size_t i = 0; i < stage.nodes.size(); ++i) {
            oss << (i > 0 ? " -> " : "") << flowsheet.GetNode(stage.nodes[i]).id();
        }
        oss << "}";
        if (stage.IsLoop()) {
            oss << " tear {";
            for (std::size_t i = 0; i < stage.tear_edges.size(); ++i) {
                oss << (i > 0 ? ", " : "") << flowsheet.GetEdge(stage.tear_edges[i]).id;
            }
            oss << "} tol=" << stage.tolerance << " max_iter=" << stage.max_iterations;
        }
        oss << "\n";
    }
    return oss.str();
}

// =============================================================================
// StagePlanner
// =============================================================================

ExecutionPlan StagePlanner::Plan(const Flowsheet &flowsheet) const {
    return Plan(flowsheet, CycleAnalyzer::Analyze(flowsheet));
}

ExecutionPlan StagePlanner::Plan(const Flowsheet &flowsheet,
                                 const CycleAnalysis &analysis) const {
    TearSelector selector(options_.tear);
    ExecutionPlan plan;
    plan.stages.reserve(analysis.components.size());

    for (const auto &scc : analysis.components) {
        Stage stage;
        stage.level = scc.level;

        if (!scc.cyclic) {
            stage.kind = StageKind::Linear;
            stage.nodes = scc.nodes;
            plan.stages.push_back(std::move(stage));
            continue;
        }

        TearSet tears = selector.Select(flowsheet, scc);
        auto order = CycleAnalyzer::TopologicalOrder(flowsheet, scc.nodes, tears.AsSet());
        if (!order) {
            throw PlanningError("loop containing '" + flowsheet.GetNode(scc.nodes.front()).id() +
                                "' has no order after tearing");
        }

        stage.kind = StageKind::Loop;
        stage.nodes = std::move(*order);
        stage.tear_edges = std::move(tears.edges);
        stage.tolerance = options_.tolerance;
        stage.max_iterations = options_.max_iterations;
        plan.stages.push_back(std::move(stage));
    }
    return plan;
}

} // namespace sluice
