/**
 * @file test_stage_planner.cpp
 * @brief Tests for execution plan construction
 */

#include <gtest/gtest.h>

#include <sluice/sched/StagePlanner.hpp>

#include "../support/TestFlowsheets.hpp"

#include <algorithm>
#include <set>

namespace sluice {
namespace {

using test::MakeEdge;
using test::MakeNode;
using test::RecyclePlant;

std::size_t PositionOf(const std::vector<NodeIndex> &order, NodeIndex node) {
    return static_cast<std::size_t>(std::find(order.begin(), order.end(), node) - order.begin());
}

/// Every edge that is not torn runs from an earlier to a later evaluation
void ExpectDependencyOrder(const Flowsheet &graph, const ExecutionPlan &plan) {
    auto order = plan.NodeOrder();
    ASSERT_EQ(order.size(), graph.NumNodes());
    auto tears = plan.TearEdges();
    std::set<EdgeIndex> torn(tears.begin(), tears.end());
    for (const auto &edge : graph.Edges()) {
        if (torn.count(edge.index) > 0) {
            continue;
        }
        EXPECT_LT(PositionOf(order, edge.source), PositionOf(order, edge.target))
            << "edge " << edge.id;
    }
}

// =============================================================================
// Plan shape
// =============================================================================

TEST(StagePlannerTest, TwoNodeCycleIsOneLoopWithOneTear) {
    auto graph = test::TwoNodeLoop();
    auto plan = StagePlanner().Plan(graph);

    ASSERT_EQ(plan.Size(), 1u);
    const Stage &stage = plan.stages[0];
    EXPECT_TRUE(stage.IsLoop());
    EXPECT_EQ(stage.nodes.size(), 2u);
    EXPECT_EQ(stage.tear_edges.size(), 1u);
    EXPECT_EQ(plan.NumLoop(), 1u);
    EXPECT_EQ(plan.NumLinear(), 0u);
    ExpectDependencyOrder(graph, plan);
}

TEST(StagePlannerTest, IndependentChainsAreAllLinear) {
    auto graph = test::IndependentChains(3, 3);
    auto plan = StagePlanner().Plan(graph);

    EXPECT_EQ(plan.Size(), 9u);
    EXPECT_EQ(plan.NumLoop(), 0u);
    EXPECT_TRUE(plan.TearEdges().empty());
    for (const auto &stage : plan.stages) {
        EXPECT_EQ(stage.kind, StageKind::Linear);
        EXPECT_EQ(stage.nodes.size(), 1u);
    }
    ExpectDependencyOrder(graph, plan);

    // Chain heads share level 0 and can run in any order relative to each other
    EXPECT_EQ(plan.NumLevels(), 3u);
    for (const auto &stage : plan.stages) {
        const std::string &id = graph.GetNode(stage.nodes[0]).id();
        EXPECT_EQ(stage.level, static_cast<std::size_t>(id.back() - '0')) << id;
    }
}

TEST(StagePlannerTest, RecyclePlantHasLinearLoopLinear) {
    auto graph = RecyclePlant();
    auto plan = StagePlanner().Plan(graph);

    ASSERT_EQ(plan.Size(), 3u);
    EXPECT_EQ(plan.stages[0].kind, StageKind::Linear);
    EXPECT_EQ(plan.stages[1].kind, StageKind::Loop);
    EXPECT_EQ(plan.stages[2].kind, StageKind::Linear);

    EXPECT_EQ(plan.stages[0].nodes, (std::vector<NodeIndex>{graph.RequireNode("feed")}));
    EXPECT_EQ(plan.stages[2].nodes, (std::vector<NodeIndex>{graph.RequireNode("product")}));

    // One simple cycle: the tie goes to the earliest inserted edge on it
    EXPECT_EQ(plan.stages[1].tear_edges,
              (std::vector<EdgeIndex>{graph.RequireEdge("mix_reactor")}));
    EXPECT_EQ(plan.stages[1].nodes,
              (std::vector<NodeIndex>{graph.RequireNode("reactor"), graph.RequireNode("split"),
                                      graph.RequireNode("mix")}));
    ExpectDependencyOrder(graph, plan);
}

TEST(StagePlannerTest, LoopStagesCarryConvergenceSettings) {
    PlannerOptions options;
    options.tolerance = 1e-9;
    options.max_iterations = 7;
    auto plan = StagePlanner(options).Plan(test::TwoNodeLoop());

    EXPECT_DOUBLE_EQ(plan.stages[0].tolerance, 1e-9);
    EXPECT_EQ(plan.stages[0].max_iterations, 7u);
}

TEST(StagePlannerTest, EveryNodeAppearsInExactlyOneStage) {
    auto graph = RecyclePlant();
    auto order = StagePlanner().Plan(graph).NodeOrder();
    std::sort(order.begin(), order.end());
    EXPECT_EQ(order, (std::vector<NodeIndex>{0, 1, 2, 3, 4}));
}

TEST(StagePlannerTest, EmptyGraphGivesEmptyPlan) {
    Flowsheet graph;
    auto plan = StagePlanner().Plan(graph);
    EXPECT_TRUE(plan.Empty());
}

// =============================================================================
// Determinism
// =============================================================================

TEST(StagePlannerTest, PlanningIsIdempotent) {
    auto graph = RecyclePlant();
    StagePlanner planner;
    auto first = planner.Plan(graph);
    auto second = planner.Plan(graph);
    EXPECT_EQ(first, second);
    EXPECT_EQ(first, planner.Plan(graph, CycleAnalyzer::Analyze(graph)));
}

TEST(StagePlannerTest, NodeInsertionOrderDoesNotChangeThePlan) {
    // Same graph, nodes listed in reverse
    auto forward = Flowsheet::Build(
        {MakeNode("a", {"in"}, {"out"}), MakeNode("b", {"in"}, {"out"}),
         MakeNode("c", {"in"}, {})},
        {MakeEdge("ab", "a", "out", "b", "in"), MakeEdge("ba", "b", "out", "a", "in")});
    auto reversed = Flowsheet::Build(
        {MakeNode("c", {"in"}, {}), MakeNode("b", {"in"}, {"out"}),
         MakeNode("a", {"in"}, {"out"})},
        {MakeEdge("ab", "a", "out", "b", "in"), MakeEdge("ba", "b", "out", "a", "in")});

    auto ids = [](const Flowsheet &graph, const ExecutionPlan &plan) {
        std::vector<std::string> result;
        for (NodeIndex n : plan.NodeOrder()) {
            result.push_back(graph.GetNode(n).id());
        }
        return result;
    };
    EXPECT_EQ(ids(forward, StagePlanner().Plan(forward)),
              ids(reversed, StagePlanner().Plan(reversed)));
}

TEST(StagePlannerTest, ToStringDescribesStages) {
    auto graph = RecyclePlant();
    auto text = StagePlanner().Plan(graph).ToString(graph);
    EXPECT_NE(text.find("linear"), std::string::npos);
    EXPECT_NE(text.find("loop"), std::string::npos);
    EXPECT_NE(text.find("tear {mix_reactor}"), std::string::npos);
}

} // namespace
} // namespace sluice
