/**
 * @file test_component_factory.cpp
 * @brief Tests for ComponentFactory registration and creation
 */

#include <gtest/gtest.h>

#include <sluice/core/ComponentFactory.hpp>

#include <Registration.hpp>

#include <algorithm>
#include <memory>

namespace {

/// Doubles its input; registered through the macro below
class Doubler : public sluice::Component {
  public:
    explicit Doubler(const sluice::NodeConfig &config)
        : factor_(config.Get<double>("factor", 2.0)) {}

    [[nodiscard]] std::string TypeName() const override { return "test_doubler"; }

    [[nodiscard]] std::vector<sluice::PortDecl> DeclareInputs() const override {
        return {{"in_main", "Input", true}};
    }

    [[nodiscard]] std::vector<sluice::PortDecl> DeclareOutputs() const override {
        return {{"out_main", "Scaled input", false}};
    }

    sluice::PortMap Step(const sluice::PortMap &inputs, double /*dt*/) override {
        return {{"out_main", sluice::PortValue(factor_ * RequireInput(inputs, "in_main"))}};
    }

    [[nodiscard]] double Factor() const { return factor_; }

  private:
    double factor_;
};

} // namespace

SLUICE_REGISTER_COMPONENT(Doubler, "test_doubler")

namespace sluice {
namespace {

TEST(ComponentFactoryTest, BuiltinsAreRegistered) {
    auto &factory = ComponentFactory::Instance();
    for (const char *type :
         {"constant_source", "combiner", "splitter", "sink", "linear_map", "integrator"}) {
        EXPECT_TRUE(factory.HasType(type)) << type;
    }

    auto types = factory.GetRegisteredTypes();
    EXPECT_TRUE(std::is_sorted(types.begin(), types.end()));
    EXPECT_GE(factory.NumRegistered(), 7u);
}

TEST(ComponentFactoryTest, RegisteringBuiltinsAgainReplacesCreators) {
    auto &factory = ComponentFactory::Instance();
    std::size_t before = factory.NumRegistered();
    components::RegisterBuiltins(factory);
    EXPECT_EQ(factory.NumRegistered(), before);
}

TEST(ComponentFactoryTest, MacroRegistersComponent) {
    auto &factory = ComponentFactory::Instance();
    ASSERT_TRUE(factory.HasType("test_doubler"));

    NodeConfig config;
    config.id = "d";
    config.type = "test_doubler";
    config.scalars["factor"] = 3.0;

    auto component = factory.Create(config);
    EXPECT_EQ(component->Id(), "d");
    EXPECT_EQ(component->TypeName(), "test_doubler");
    EXPECT_DOUBLE_EQ(dynamic_cast<Doubler &>(*component).Factor(), 3.0);
}

TEST(ComponentFactoryTest, CreateResolvesReferencesAndFillsPorts) {
    TableParameterResolver resolver;
    resolver.SetScalar("plant", "QINTR", 40.0);

    NodeConfig config;
    config.id = "internal_split";
    config.type = "splitter";
    config.strings["mode"] = "fixed_recycle";
    config.references["qintr"] = "plant.QINTR";

    auto component = ComponentFactory::Instance().Create(config, resolver);

    EXPECT_DOUBLE_EQ(config.Require<double>("qintr"), 40.0);
    EXPECT_TRUE(config.references.empty());
    EXPECT_EQ(config.inputs, (std::vector<std::string>{"in_main"}));
    EXPECT_EQ(config.outputs,
              (std::vector<std::string>{"out_to_settler", "out_recycle_to_combiner"}));
    EXPECT_EQ(component->GetConfig().outputs, config.outputs);
}

TEST(ComponentFactoryTest, DeclaredPortsAreKept) {
    TableParameterResolver resolver;
    NodeConfig config;
    config.id = "mix";
    config.type = "combiner";
    config.inputs = {"in_influent", "in_recycle"};

    auto component = ComponentFactory::Instance().Create(config, resolver);
    EXPECT_EQ(component->GetConfig().inputs,
              (std::vector<std::string>{"in_influent", "in_recycle"}));
    EXPECT_EQ(config.outputs, (std::vector<std::string>{"out_combined"}));
}

TEST(ComponentFactoryTest, UnknownTypeListsRegisteredTypes) {
    NodeConfig config;
    config.id = "x";
    config.type = "clarifier_9000";
    try {
        (void)ComponentFactory::Instance().Create(config);
        FAIL() << "Expected UnknownComponentTypeError";
    } catch (const UnknownComponentTypeError &e) {
        EXPECT_EQ(e.subject(), "clarifier_9000");
        EXPECT_NE(std::string(e.what()).find("splitter"), std::string::npos);
    }
}

TEST(ComponentFactoryTest, UnresolvedReferenceFailsBeforeCreation) {
    TableParameterResolver resolver;
    NodeConfig config;
    config.id = "internal_split";
    config.type = "splitter";
    config.references["qintr"] = "plant.QINTR";
    EXPECT_THROW((void)ComponentFactory::Instance().Create(config, resolver), UnknownParameterError);
}

TEST(ComponentFactoryTest, RegisterWithLambda) {
    auto &factory = ComponentFactory::Instance();
    factory.Register("test_lambda", [](const NodeConfig &config) -> std::unique_ptr<Component> {
        return std::make_unique<Doubler>(config);
    });

    NodeConfig config;
    config.id = "l";
    config.type = "test_lambda";
    EXPECT_DOUBLE_EQ(dynamic_cast<Doubler &>(*factory.Create(config)).Factor(), 2.0);
}

} // namespace
} // namespace sluice
