#pragma once

/**
 * @file ComponentFactory.hpp
 * @brief Registry of component variants keyed by type tag
 *
 * New unit operations are added by registering a creator; the core never
 * needs to know the concrete classes.
 */

#include <sluice/core/Component.hpp>
#include <sluice/core/Error.hpp>
#include <sluice/core/NodeConfig.hpp>
#include <sluice/core/ParameterResolver.hpp>

#include <algorithm>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace sluice {

/**
 * @brief Factory for creating components from node descriptors
 *
 * @code
 * auto &factory = ComponentFactory::Instance();
 * auto component = factory.Create(node_config, resolver);
 * @endcode
 */
class ComponentFactory {
  public:
    /// Creator function type: takes the resolved NodeConfig, returns component
    using Creator = std::function<std::unique_ptr<Component>(const NodeConfig &)>;

    void Register(const std::string &type_tag, Creator creator) {
        creators_[type_tag] = std::move(creator);
    }

    /**
     * @brief Create a component from an already-resolved descriptor
     * @throws UnknownComponentTypeError if the type is not registered
     */
    [[nodiscard]] std::unique_ptr<Component> Create(const NodeConfig &config) const {
        auto it = creators_.find(config.type);
        if (it == creators_.end()) {
            throw UnknownComponentTypeError(config.type, ListTypesString());
        }
        auto component = it->second(config);
        component->SetConfig(config);
        return component;
    }

    /**
     * @brief Resolve parameter references, then create
     *
     * Port lists left empty in the descriptor are filled from the
     * component's declarations and written back into @p config.
     */
    [[nodiscard]] std::unique_ptr<Component> Create(NodeConfig &config,
                                                    const ParameterResolver &resolver) const {
        ResolveParameters(config, resolver);
        auto component = Create(config);
        if (config.inputs.empty()) {
            config.inputs = component->GetInputNames();
        }
        if (config.outputs.empty()) {
            config.outputs = component->GetOutputNames();
        }
        component->SetConfig(config);
        return component;
    }

    [[nodiscard]] bool HasType(const std::string &type_tag) const {
        return creators_.count(type_tag) > 0;
    }

    /// Registered type tags, sorted
    [[nodiscard]] std::vector<std::string> GetRegisteredTypes() const {
        std::vector<std::string> types;
        types.reserve(creators_.size());
        for (const auto &pair : creators_) {
            types.push_back(pair.first);
        }
        std::sort(types.begin(), types.end());
        return types;
    }

    [[nodiscard]] std::size_t NumRegistered() const { return creators_.size(); }

    static ComponentFactory &Instance() {
        static ComponentFactory instance;
        return instance;
    }

    /// Clear all registrations (for testing)
    void Clear() { creators_.clear(); }

  private:
    ComponentFactory() = default;

    [[nodiscard]] std::string ListTypesString() const {
        std::string result;
        for (const auto &type : GetRegisteredTypes()) {
            if (!result.empty())
                result += ", ";
            result += type;
        }
        return result.empty() ? "(none)" : result;
    }

    std::unordered_map<std::string, Creator> creators_;
};

// =============================================================================
// Registration Macros
// =============================================================================

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

/**
 * @brief Register a component class under a type tag
 *
 * The class must be constructible from a const NodeConfig& and read its
 * parameters there. Usage at namespace scope:
 * @code
 * SLUICE_REGISTER_COMPONENT(Splitter, "splitter")
 * @endcode
 */
#define SLUICE_REGISTER_COMPONENT_IMPL2(ComponentType, TypeTag, Counter)                           \
    namespace {                                                                                    \
    const bool _sluice_reg_##Counter = []() {                                                      \
        ::sluice::ComponentFactory::Instance().Register(                                           \
            TypeTag,                                                                               \
            [](const ::sluice::NodeConfig &config) -> std::unique_ptr<::sluice::Component> {      \
                return std::make_unique<ComponentType>(config);                                    \
            });                                                                                    \
        return true;                                                                               \
    }();                                                                                           \
    }

#define SLUICE_REGISTER_COMPONENT_IMPL(ComponentType, TypeTag, Counter)                            \
    SLUICE_REGISTER_COMPONENT_IMPL2(ComponentType, TypeTag, Counter)

#define SLUICE_REGISTER_COMPONENT(ComponentType, TypeTag)                                          \
    SLUICE_REGISTER_COMPONENT_IMPL(ComponentType, TypeTag, __COUNTER__)

// NOLINTEND(cppcoreguidelines-macro-usage)

} // namespace sluice
