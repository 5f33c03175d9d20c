#pragma once

/**
 * @file CoreTypes.hpp
 * @brief Core type definitions for Sluice
 *
 * Re-exports the Janus numeric vector used as the payload of every stream
 * and defines the identifiers used to address nodes, ports and edges.
 */

#include <cstddef>
#include <cstdint>
#include <limits>
#include <map>
#include <string>

#include <Eigen/Core>
#include <janus/core/JanusTypes.hpp>

namespace sluice {

// =============================================================================
// Janus Type Re-exports
// =============================================================================

using janus::JanusVector;
using janus::NumericVector;

/**
 * @brief Numeric payload carried by an edge
 *
 * A process stream: concentrations, flow, temperature and auxiliary state.
 * The width is fixed per edge but is not mandated by the core.
 */
using PortValue = JanusVector<double>;

/// Port name -> value mapping passed into and returned from Component::Step
using PortMap = std::map<std::string, PortValue>;

// =============================================================================
// Graph Identifiers
// =============================================================================

/// Index of a node in the flowsheet arena
using NodeIndex = std::size_t;

/// Index of an edge in the flowsheet arena (also its insertion order)
using EdgeIndex = std::size_t;

inline constexpr std::size_t kInvalidIndex = std::numeric_limits<std::size_t>::max();

/// Default ASM1 stream width (15 states + Q + T + 4 dummy states)
inline constexpr std::size_t kDefaultStreamSize = 21;

/// Default position of the volumetric flow rate in an ASM1 stream
inline constexpr std::size_t kDefaultFlowIndex = 14;

/// Create a zero stream of the given width
inline PortValue ZeroStream(std::size_t size) {
    return PortValue::Zero(static_cast<Eigen::Index>(size));
}

// =============================================================================
// Version Information
// =============================================================================

#define SLUICE_VERSION_MAJOR 0
#define SLUICE_VERSION_MINOR 3
#define SLUICE_VERSION_PATCH 0

#define SLUICE_STRINGIFY(x) #x
#define SLUICE_VERSION_STR(major, minor, patch)                                                    \
    SLUICE_STRINGIFY(major) "." SLUICE_STRINGIFY(minor) "." SLUICE_STRINGIFY(patch)

constexpr int VersionMajor() { return SLUICE_VERSION_MAJOR; }
constexpr int VersionMinor() { return SLUICE_VERSION_MINOR; }
constexpr int VersionPatch() { return SLUICE_VERSION_PATCH; }

/// Version string (derived from components)
constexpr const char *Version() {
    return SLUICE_VERSION_STR(SLUICE_VERSION_MAJOR, SLUICE_VERSION_MINOR, SLUICE_VERSION_PATCH);
}

// =============================================================================
// Naming Utilities
// =============================================================================

/**
 * @brief Build a port path from node id and port name
 *
 * Returns "node.port" for error messages and log lines. Not unique when ids
 * contain dots, so never use it as a lookup key.
 */
inline std::string MakePortPath(const std::string &node, const std::string &port) {
    if (port.empty())
        return node;
    return node + "." + port;
}

} // namespace sluice
