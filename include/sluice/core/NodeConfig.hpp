#pragma once

/**
 * @file NodeConfig.hpp
 * @brief Node descriptor with typed parameter accessors
 *
 * One entry of the `nodes:` list. The loader fills the raw maps; parameter
 * references are replaced by numeric values through the ParameterResolver
 * before the component is created, so components only ever see numbers.
 */

#include <sluice/core/CoreTypes.hpp>
#include <sluice/core/Error.hpp>

#include <string>
#include <unordered_map>
#include <vector>

namespace sluice {

/**
 * @brief Declarative description of one flowsheet node
 *
 * Components read their parameters through the typed accessors:
 * @code
 * qintr_ = cfg.Require<double>("qintr");
 * flow_index_ = cfg.Get<int>("flow_index", 14);
 * @endcode
 */
struct NodeConfig {
    // =========================================================================
    // Identity
    // =========================================================================

    std::string id;    ///< Unique node id
    std::string type;  ///< Component type tag (registry key)
    std::string label; ///< Human-readable label (optional)

    /// Declared ports, in position order. Empty lists are filled from the
    /// component's own declarations.
    std::vector<std::string> inputs;
    std::vector<std::string> outputs;

    // =========================================================================
    // Raw Storage (populated by loader)
    // =========================================================================

    std::unordered_map<std::string, double> scalars;
    std::unordered_map<std::string, std::vector<double>> vectors;
    std::unordered_map<std::string, std::string> strings;
    std::unordered_map<std::string, int64_t> integers;
    std::unordered_map<std::string, bool> booleans;

    /// Parameter name -> reference key for the ParameterResolver ("table.KEY")
    std::unordered_map<std::string, std::string> references;

    // =========================================================================
    // Typed Accessors
    // =========================================================================

    /// @throws ConfigError if the key is missing
    template <typename T> T Require(const std::string &key) const;

    template <typename T> T Get(const std::string &key, const T &default_value) const;

    template <typename T> [[nodiscard]] bool Has(const std::string &key) const;

    [[nodiscard]] std::string DisplayName() const { return label.empty() ? id : label; }

    [[nodiscard]] bool HasInput(const std::string &port) const {
        for (const auto &p : inputs) {
            if (p == port)
                return true;
        }
        return false;
    }

    [[nodiscard]] bool HasOutput(const std::string &port) const {
        for (const auto &p : outputs) {
            if (p == port)
                return true;
        }
        return false;
    }
};

// =============================================================================
// Template Specializations - double
// =============================================================================

template <>
inline double NodeConfig::Get<double>(const std::string &key, const double &def) const {
    auto it = scalars.find(key);
    return (it != scalars.end()) ? it->second : def;
}

template <> inline double NodeConfig::Require<double>(const std::string &key) const {
    auto it = scalars.find(key);
    if (it == scalars.end()) {
        throw ConfigError(id, key);
    }
    return it->second;
}

template <> inline bool NodeConfig::Has<double>(const std::string &key) const {
    return scalars.count(key) > 0;
}

// =============================================================================
// Template Specializations - int
// =============================================================================

// Integer parameters may also be written as plain YAML numbers, which the
// loader stores as scalars.
template <> inline int NodeConfig::Get<int>(const std::string &key, const int &def) const {
    auto it = integers.find(key);
    if (it != integers.end()) {
        return static_cast<int>(it->second);
    }
    auto sit = scalars.find(key);
    return (sit != scalars.end()) ? static_cast<int>(sit->second) : def;
}

template <> inline int NodeConfig::Require<int>(const std::string &key) const {
    auto it = integers.find(key);
    if (it != integers.end()) {
        return static_cast<int>(it->second);
    }
    auto sit = scalars.find(key);
    if (sit == scalars.end()) {
        throw ConfigError(id, key);
    }
    return static_cast<int>(sit->second);
}

template <> inline bool NodeConfig::Has<int>(const std::string &key) const {
    return integers.count(key) > 0 || scalars.count(key) > 0;
}

// =============================================================================
// Template Specializations - bool
// =============================================================================

template <> inline bool NodeConfig::Get<bool>(const std::string &key, const bool &def) const {
    auto it = booleans.find(key);
    return (it != booleans.end()) ? it->second : def;
}

template <> inline bool NodeConfig::Require<bool>(const std::string &key) const {
    auto it = booleans.find(key);
    if (it == booleans.end()) {
        throw ConfigError(id, key);
    }
    return it->second;
}

template <> inline bool NodeConfig::Has<bool>(const std::string &key) const {
    return booleans.count(key) > 0;
}

// =============================================================================
// Template Specializations - std::string
// =============================================================================

template <>
inline std::string NodeConfig::Get<std::string>(const std::string &key,
                                                const std::string &def) const {
    auto it = strings.find(key);
    return (it != strings.end()) ? it->second : def;
}

template <> inline std::string NodeConfig::Require<std::string>(const std::string &key) const {
    auto it = strings.find(key);
    if (it == strings.end()) {
        throw ConfigError(id, key);
    }
    return it->second;
}

template <> inline bool NodeConfig::Has<std::string>(const std::string &key) const {
    return strings.count(key) > 0;
}

// =============================================================================
// Template Specializations - std::vector<double>
// =============================================================================

template <>
inline std::vector<double>
NodeConfig::Get<std::vector<double>>(const std::string &key,
                                     const std::vector<double> &def) const {
    auto it = vectors.find(key);
    return (it != vectors.end()) ? it->second : def;
}

template <>
inline std::vector<double> NodeConfig::Require<std::vector<double>>(const std::string &key) const {
    auto it = vectors.find(key);
    if (it == vectors.end()) {
        throw ConfigError(id, key);
    }
    return it->second;
}

template <> inline bool NodeConfig::Has<std::vector<double>>(const std::string &key) const {
    return vectors.count(key) > 0;
}

// =============================================================================
// Template Specializations - PortValue (Janus vector)
// =============================================================================

template <>
inline PortValue NodeConfig::Get<PortValue>(const std::string &key, const PortValue &def) const {
    auto it = vectors.find(key);
    if (it == vectors.end()) {
        return def;
    }
    PortValue value(static_cast<Eigen::Index>(it->second.size()));
    for (std::size_t i = 0; i < it->second.size(); ++i) {
        value(static_cast<Eigen::Index>(i)) = it->second[i];
    }
    return value;
}

template <> inline PortValue NodeConfig::Require<PortValue>(const std::string &key) const {
    if (vectors.count(key) == 0) {
        throw ConfigError(id, key);
    }
    return Get<PortValue>(key, PortValue{});
}

template <> inline bool NodeConfig::Has<PortValue>(const std::string &key) const {
    return vectors.count(key) > 0;
}

} // namespace sluice
