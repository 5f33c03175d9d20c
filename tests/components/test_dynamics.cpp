/**
 * @file test_dynamics.cpp
 * @brief Unit tests for FirstOrderTank and LinearMap
 */

#include <gtest/gtest.h>

#include <dynamics/FirstOrderTank.hpp>
#include <math/LinearMap.hpp>

#include "../support/TestFlowsheets.hpp"

using namespace sluice;
using namespace sluice::components;
using sluice::test::Vec;

// =============================================================================
// FirstOrderTank
// =============================================================================

namespace {

NodeConfig TankConfig(double tau) {
    NodeConfig config;
    config.id = "reactor";
    config.scalars["tau"] = tau;
    return config;
}

} // namespace

TEST(FirstOrderTank, Identity) {
    FirstOrderTank tank(TankConfig(2.0));
    EXPECT_EQ(tank.TypeName(), "integrator");
    EXPECT_DOUBLE_EQ(tank.Tau(), 2.0);
    EXPECT_EQ(tank.GetInputNames(), (std::vector<std::string>{"in_main"}));
    EXPECT_EQ(tank.GetOutputNames(), (std::vector<std::string>{"out_main"}));
}

TEST(FirstOrderTank, EulerStepTowardsInput) {
    auto config = TankConfig(1.0);
    config.vectors["initial_state"] = {0.0, 10.0};
    FirstOrderTank tank(config);

    auto out = tank.Step({{"in_main", Vec({2.0, 10.0})}}, 0.5);
    EXPECT_DOUBLE_EQ(out.at("out_main")(0), 1.0);
    EXPECT_DOUBLE_EQ(out.at("out_main")(1), 10.0);
}

TEST(FirstOrderTank, RepeatedEvaluationDoesNotAdvanceState) {
    auto config = TankConfig(1.0);
    config.vectors["initial_state"] = {0.0};
    FirstOrderTank tank(config);

    // Loop iterations evaluate the tank several times per step
    for (int i = 0; i < 4; ++i) {
        auto out = tank.Step({{"in_main", Vec({2.0})}}, 0.5);
        EXPECT_DOUBLE_EQ(out.at("out_main")(0), 1.0);
    }
    EXPECT_DOUBLE_EQ((*tank.State())(0), 0.0);

    tank.PostStep(0.5);
    EXPECT_DOUBLE_EQ((*tank.State())(0), 1.0);

    auto out = tank.Step({{"in_main", Vec({2.0})}}, 0.5);
    EXPECT_DOUBLE_EQ(out.at("out_main")(0), 1.5);
}

TEST(FirstOrderTank, FirstInputSeedsStateWithoutInitialCondition) {
    FirstOrderTank tank(TankConfig(3.0));
    EXPECT_FALSE(tank.State().has_value());

    auto out = tank.Step({{"in_main", Vec({4.0, 5.0})}}, 1.0);
    EXPECT_DOUBLE_EQ(out.at("out_main")(0), 4.0);
    EXPECT_DOUBLE_EQ(out.at("out_main")(1), 5.0);
}

TEST(FirstOrderTank, ResetRestoresInitialState) {
    auto config = TankConfig(1.0);
    config.vectors["initial_state"] = {0.0};
    FirstOrderTank tank(config);

    (void)tank.Step({{"in_main", Vec({2.0})}}, 0.5);
    tank.PostStep(0.5);
    tank.Reset();
    EXPECT_DOUBLE_EQ((*tank.State())(0), 0.0);
}

TEST(FirstOrderTank, Errors) {
    EXPECT_THROW(FirstOrderTank{TankConfig(0.0)}, ConfigError);

    NodeConfig no_tau;
    no_tau.id = "reactor";
    EXPECT_THROW(FirstOrderTank{no_tau}, ConfigError);

    auto config = TankConfig(1.0);
    config.vectors["initial_state"] = {0.0, 0.0};
    FirstOrderTank tank(config);
    EXPECT_THROW(tank.Step({{"in_main", Vec({1.0})}}, 0.1), ComputationError);
    EXPECT_THROW(tank.Step({}, 0.1), ComputationError);
}

// =============================================================================
// LinearMap
// =============================================================================

TEST(LinearMap, GainOnly) {
    NodeConfig config;
    config.id = "gain";
    config.scalars["gain"] = 0.9;
    LinearMap map(config);

    EXPECT_EQ(map.TypeName(), "linear_map");
    EXPECT_DOUBLE_EQ(map.Gain(), 0.9);
    auto out = map.Step({{"in_main", Vec({10.0, 20.0})}}, 0.1);
    EXPECT_DOUBLE_EQ(out.at("out_main")(1), 18.0);
}

TEST(LinearMap, GainAndOffset) {
    NodeConfig config;
    config.id = "affine";
    config.scalars["gain"] = 0.5;
    config.vectors["offset"] = {1.0, 1.0};
    LinearMap map(config);

    auto out = map.Step({{"in_main", Vec({2.0, 2.0})}}, 0.1);
    EXPECT_DOUBLE_EQ(out.at("out_main")(0), 2.0);
    EXPECT_DOUBLE_EQ(out.at("out_main")(1), 2.0);
}

TEST(LinearMap, DefaultsToIdentity) {
    NodeConfig config;
    config.id = "copy";
    LinearMap map(config);
    auto out = map.Step({{"in_main", Vec({3.0})}}, 0.1);
    EXPECT_DOUBLE_EQ(out.at("out_main")(0), 3.0);
}

TEST(LinearMap, OffsetWidthMustMatch) {
    NodeConfig config;
    config.id = "affine";
    config.vectors["offset"] = {1.0, 1.0, 1.0};
    LinearMap map(config);
    EXPECT_THROW(map.Step({{"in_main", Vec({2.0, 2.0})}}, 0.1), ComputationError);
}
