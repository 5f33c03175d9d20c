/**
 * @file test_simulator.cpp
 * @brief Tests for the Simulator lifecycle, observers and configuration errors
 */

#include <gtest/gtest.h>

#include <sluice/io/FlowsheetLoader.hpp>
#include <sluice/sim/Simulator.hpp>

#include "../support/TestFlowsheets.hpp"

#include <memory>
#include <string>
#include <vector>

#ifndef SLUICE_CONFIG_DIR
#define SLUICE_CONFIG_DIR "config"
#endif

namespace sluice {
namespace {

using test::MakeEdge;

// =============================================================================
// Helpers
// =============================================================================

NodeConfig Node(const std::string &id, const std::string &type) {
    NodeConfig node;
    node.id = id;
    node.type = type;
    return node;
}

/**
 * feed -> mix -> split -> product, split recycles half its flow to mix.
 * Streams are [concentration, flow]; the loop settles at a mixed flow of 200.
 */
FlowsheetConfig HalfRecycle() {
    FlowsheetConfig config;
    config.name = "half_recycle";
    config.t_start = 0.0;
    config.t_end = 1.0;
    config.dt = 0.25;
    config.solver.stream_size = 2;
    config.logging = LogConfig::Quiet();

    auto feed = Node("feed", "constant_source");
    feed.vectors["y_in_constant"] = {1.0, 100.0};

    auto mix = Node("mix", "combiner");
    mix.inputs = {"in_feed", "in_recycle"};
    mix.integers["flow_index"] = 1;
    mix.integers["stream_size"] = 2;

    auto split = Node("split", "splitter");
    split.outputs = {"out_product", "out_recycle"};
    split.vectors["splitratio"] = {1.0, 1.0};
    split.integers["flow_index"] = 1;
    split.integers["stream_size"] = 2;

    config.nodes = {feed, mix, split, Node("product", "sink")};
    config.edges = {MakeEdge("feed_mix", "feed", "out_main", "mix", "in_feed"),
                    MakeEdge("mixed", "mix", "out_combined", "split", "in_main"),
                    MakeEdge("recycle", "split", "out_recycle", "mix", "in_recycle"),
                    MakeEdge("product", "split", "out_product", "product", "in_main")};
    return config;
}

// =============================================================================
// Construction
// =============================================================================

TEST(SimulatorTest, BuildsGraphAndPlan) {
    auto sim = Simulator::FromConfig(HalfRecycle());

    EXPECT_EQ(sim->Name(), "half_recycle");
    EXPECT_EQ(sim->GetPhase(), Phase::Built);
    EXPECT_EQ(sim->Graph().NumNodes(), 4u);
    EXPECT_EQ(sim->Plan().Size(), 3u);
    EXPECT_EQ(sim->Plan().NumLoop(), 1u);
    EXPECT_EQ(sim->Plan().TearEdges(),
              (std::vector<EdgeIndex>{sim->Graph().RequireEdge("mixed")}));
    EXPECT_EQ(sim->GetComponent("split").TypeName(), "splitter");
    EXPECT_EQ(sim->GetRecorder(), nullptr);
}

TEST(SimulatorTest, UnknownPortFailsBeforeAnyStep) {
    auto config = HalfRecycle();
    config.edges.push_back(MakeEdge("bad", "feed", "out_main", "product", "in_9"));

    try {
        (void)Simulator::FromConfig(config);
        FAIL() << "Expected UnknownReferenceError";
    } catch (const UnknownReferenceError &e) {
        EXPECT_EQ(e.subject(), "bad");
        EXPECT_NE(std::string(e.what()).find("in_9"), std::string::npos);
    }
}

TEST(SimulatorTest, UnknownComponentTypeFails) {
    auto config = HalfRecycle();
    config.nodes.push_back(Node("clarifier", "clarifier_9000"));
    EXPECT_THROW((void)Simulator::FromConfig(config), UnknownComponentTypeError);
}

TEST(SimulatorTest, MissingParameterTableFails) {
    auto config = HalfRecycle();
    config.nodes[2].references["qintr"] = "bsm1.QINTR";
    EXPECT_THROW((void)Simulator::FromConfig(config), UnknownParameterError);
}

TEST(SimulatorTest, InvalidSolverSettingsFail) {
    auto config = HalfRecycle();
    config.solver.relaxation = 0.0;
    EXPECT_THROW((void)Simulator::FromConfig(config), ConfigError);
}

// =============================================================================
// Lifecycle
// =============================================================================

TEST(SimulatorTest, StepRequiresStage) {
    auto sim = Simulator::FromConfig(HalfRecycle());
    try {
        sim->Step();
        FAIL() << "Expected LifecycleError";
    } catch (const LifecycleError &e) {
        EXPECT_EQ(e.phase(), LifecyclePhase::Step);
    }

    sim->Stage();
    EXPECT_EQ(sim->GetPhase(), Phase::Staged);
    EXPECT_THROW(sim->Stage(), LifecycleError);
    EXPECT_THROW(sim->Step(0.0), LifecycleError);
}

TEST(SimulatorTest, StepConvergesRecycleLoop) {
    auto sim = Simulator::FromConfig(HalfRecycle());
    sim->Stage();
    const auto &report = sim->Step();

    EXPECT_TRUE(report.converged);
    EXPECT_GT(report.TotalIterations(), 3u);
    EXPECT_DOUBLE_EQ(sim->Time(), 0.25);
    EXPECT_EQ(sim->StepCount(), 1u);
    EXPECT_EQ(sim->GetPhase(), Phase::Running);

    EXPECT_NEAR(sim->EdgeValue("mixed")(1), 200.0, 1e-4);
    EXPECT_NEAR(sim->EdgeValue("product")(1), 100.0, 1e-4);
    EXPECT_NEAR(sim->EdgeValue("product")(0), 1.0, 1e-12);

    // Sink output has no outgoing edge but is retained
    EXPECT_EQ(sim->NodeOutputs("product").count("out_final"), 1u);
}

TEST(SimulatorTest, EdgeValueQueries) {
    auto sim = Simulator::FromConfig(HalfRecycle());
    sim->Stage();
    EXPECT_THROW((void)sim->EdgeValue("product"), LifecycleError);
    EXPECT_THROW((void)sim->EdgeValue("ghost"), ConfigError);

    // Tear edges carry their initial guess before the first step
    EXPECT_EQ(sim->EdgeValue("mixed").size(), 2);
}

TEST(SimulatorTest, RunStepsUntilEndTime) {
    auto sim = Simulator::FromConfig(HalfRecycle());
    EXPECT_EQ(sim->Run(), 4u);
    EXPECT_EQ(sim->GetPhase(), Phase::Completed);
    EXPECT_NEAR(sim->Time(), 1.0, 1e-12);
    EXPECT_EQ(sim->StepCount(), 4u);
}

TEST(SimulatorTest, EdgeObserversSeeEverySuccessfulStep) {
    auto sim = Simulator::FromConfig(HalfRecycle());
    std::vector<double> times;
    double last_flow = 0.0;
    sim->SetEdgeObserver("product", [&](const std::string &edge, double t, const PortValue &v) {
        EXPECT_EQ(edge, "product");
        times.push_back(t);
        last_flow = v(1);
    });

    sim->Stage();
    sim->Step();
    sim->Step();
    EXPECT_EQ(times, (std::vector<double>{0.25, 0.5}));
    EXPECT_NEAR(last_flow, 100.0, 1e-4);

    sim->ClearEdgeObserver("product");
    sim->Step();
    EXPECT_EQ(times.size(), 2u);

    EXPECT_THROW(sim->SetEdgeObserver("ghost", nullptr), ConfigError);
}

TEST(SimulatorTest, SeededTearStartsCloser) {
    auto cold = Simulator::FromConfig(HalfRecycle());
    cold->Stage();
    std::size_t cold_iterations = cold->Step().TotalIterations();

    auto warm = Simulator::FromConfig(HalfRecycle());
    warm->Stage();
    warm->SetEdgeValue("mixed", test::Vec({1.0, 200.0}));
    std::size_t warm_iterations = warm->Step().TotalIterations();

    EXPECT_LT(warm_iterations, cold_iterations);
}

TEST(SimulatorTest, ResetRewindsTimeAndValues) {
    auto sim = Simulator::FromConfig(HalfRecycle());
    sim->Stage();
    sim->Step();
    sim->Step();

    sim->Reset();
    EXPECT_DOUBLE_EQ(sim->Time(), 0.0);
    EXPECT_EQ(sim->GetPhase(), Phase::Staged);
    EXPECT_THROW((void)sim->EdgeValue("product"), LifecycleError);
    EXPECT_DOUBLE_EQ(sim->EdgeValue("mixed")(1), 0.0);

    sim->Step();
    EXPECT_NEAR(sim->EdgeValue("product")(1), 100.0, 1e-4);
}

// =============================================================================
// Non-convergence
// =============================================================================

TEST(SimulatorTest, NonConvergenceLeavesStateUnchanged) {
    auto config = HalfRecycle();
    config.solver.max_iterations = 3;
    auto sim = Simulator::FromConfig(config);
    sim->Stage();

    try {
        sim->Step();
        FAIL() << "Expected NonConvergenceError";
    } catch (const NonConvergenceError &e) {
        EXPECT_EQ(e.iterations(), 3u);
    }
    EXPECT_EQ(sim->GetPhase(), Phase::Error);
    EXPECT_DOUBLE_EQ(sim->Time(), 0.0);
    EXPECT_EQ(sim->StepCount(), 0u);
    EXPECT_THROW((void)sim->EdgeValue("product"), LifecycleError);
    EXPECT_DOUBLE_EQ(sim->EdgeValue("mixed")(1), 0.0);
}

TEST(SimulatorTest, WarnPolicyKeepsUnconvergedStep) {
    auto config = HalfRecycle();
    config.solver.max_iterations = 3;
    config.solver.on_non_convergence = NonConvergencePolicy::Warn;
    auto sim = Simulator::FromConfig(config);
    sim->Stage();

    const auto &report = sim->Step();
    EXPECT_FALSE(report.converged);
    EXPECT_DOUBLE_EQ(sim->Time(), 0.25);
    EXPECT_LT(sim->EdgeValue("mixed")(1), 200.0);
}

// =============================================================================
// BSM1 hydraulics
// =============================================================================

TEST(SimulatorTest, BsmHydraulicsReachesDesignFlows) {
    auto config = io::FlowsheetLoader::Load(std::string(SLUICE_CONFIG_DIR) + "/bsm_hydraulics.yaml");
    config.recording.enabled = false;
    config.plan_export_path.clear();
    config.logging = LogConfig::Quiet();

    auto sim = Simulator::FromConfig(config);
    EXPECT_EQ(sim->Plan().NumLoop(), 1u);
    EXPECT_EQ(sim->Plan().TearEdges(),
              (std::vector<EdgeIndex>{sim->Graph().RequireEdge("e_mixed")}));

    sim->Stage();
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(sim->Step().converged);
    }

    const auto q = static_cast<Eigen::Index>(kDefaultFlowIndex);
    EXPECT_NEAR(sim->EdgeValue("e_recycle")(q), 55338.0, 1e-2);
    EXPECT_NEAR(sim->EdgeValue("e_effluent")(q), 18446.0, 1e-2);
    EXPECT_NEAR(sim->EdgeValue("e_mixed")(q), 92230.0, 1e-2);

    // Mixing streams of one composition keeps that composition
    EXPECT_NEAR(sim->EdgeValue("e_effluent")(0), 30.0, 1e-6);
}

} // namespace
} // namespace sluice
