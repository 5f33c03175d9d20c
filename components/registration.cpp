/**
 * @file registration.cpp
 * @brief Component factory registration for built-in components
 *
 * This file registers all built-in components with the ComponentFactory,
 * enabling them to be instantiated from YAML configuration files.
 *
 * Components are registered at static initialization time when this
 * translation unit is linked into an executable.
 */

#include <Registration.hpp>

#include <dynamics/FirstOrderTank.hpp>
#include <math/LinearMap.hpp>
#include <streams/Combiner.hpp>
#include <streams/ConstantSource.hpp>
#include <streams/Sink.hpp>
#include <streams/Splitter.hpp>

namespace sluice {
namespace components {

namespace {

template <typename ComponentType> ComponentFactory::Creator MakeCreator() {
    return [](const NodeConfig &config) -> std::unique_ptr<Component> {
        return std::make_unique<ComponentType>(config);
    };
}

} // namespace

void RegisterBuiltins(ComponentFactory &factory) {
    // Streams
    factory.Register("constant_source", MakeCreator<ConstantSource>());
    factory.Register("combiner", MakeCreator<Combiner>());
    factory.Register("splitter", MakeCreator<Splitter>());
    factory.Register("sink", MakeCreator<Sink>());

    // Math
    factory.Register("linear_map", MakeCreator<LinearMap>());

    // Dynamics
    factory.Register("integrator", MakeCreator<FirstOrderTank>());
}

} // namespace components
} // namespace sluice

namespace {

// Static registration - runs at program startup
const bool registered = []() {
    ::sluice::components::RegisterBuiltins(::sluice::ComponentFactory::Instance());
    return true;
}();

} // anonymous namespace
