#pragma once

/**
 * @file Registration.hpp
 * @brief Registration of the built-in unit operations
 */

#include <sluice/core/ComponentFactory.hpp>

namespace sluice {
namespace components {

/**
 * @brief Register every built-in component type with a factory
 *
 * Runs automatically at static initialization for the global factory when
 * registration.cpp is linked. Call it again after ComponentFactory::Clear().
 */
void RegisterBuiltins(ComponentFactory &factory);

} // namespace components
} // namespace sluice
