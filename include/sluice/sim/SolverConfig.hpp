#pragma once

/**
 * @file SolverConfig.hpp
 * @brief Convergence settings for recycle loops (`solver:` section)
 */

#include <sluice/core/CoreTypes.hpp>
#include <sluice/core/Error.hpp>

#include <string>
#include <vector>

namespace sluice {

/**
 * @brief How the change between iterations is measured
 */
enum class ResidualMode {
    Absolute, ///< max |new - old|
    Relative  ///< max |new - old| / max(|new|, |old|, 1e-12)
};

/**
 * @brief What happens when a loop hits max_iterations
 */
enum class NonConvergencePolicy {
    Error, ///< Roll the step back and throw NonConvergenceError
    Warn   ///< Keep the unconverged values, log a warning, flag the report
};

struct SolverConfig {
    double tolerance = 1e-6;
    std::size_t max_iterations = 50;
    ResidualMode residual = ResidualMode::Absolute;

    /// Under-relaxation factor r in (0, 1]: x <- (1 - r) * x_old + r * x_new
    double relaxation = 1.0;

    NonConvergencePolicy on_non_convergence = NonConvergencePolicy::Error;

    /// Width of the zero guess for tear edges without size or initial value
    std::size_t stream_size = kDefaultStreamSize;

    [[nodiscard]] static SolverConfig Default() { return SolverConfig{}; }

    /**
     * @brief Validate settings
     * @return List of error messages (empty if valid)
     */
    [[nodiscard]] std::vector<std::string> Validate() const {
        std::vector<std::string> errors;
        if (!(tolerance > 0.0)) {
            errors.push_back("solver.tolerance must be positive");
        }
        if (max_iterations == 0) {
            errors.push_back("solver.max_iterations must be at least 1");
        }
        if (!(relaxation > 0.0) || relaxation > 1.0) {
            errors.push_back("solver.relaxation must be in (0, 1]");
        }
        if (stream_size == 0) {
            errors.push_back("solver.stream_size must be at least 1");
        }
        return errors;
    }
};

/// @throws ConfigError on an unknown mode name
inline ResidualMode ParseResidualMode(const std::string &text) {
    if (text == "absolute")
        return ResidualMode::Absolute;
    if (text == "relative")
        return ResidualMode::Relative;
    throw ConfigError("solver.residual must be 'absolute' or 'relative', got '" + text + "'");
}

/// @throws ConfigError on an unknown policy name
inline NonConvergencePolicy ParseNonConvergencePolicy(const std::string &text) {
    if (text == "error")
        return NonConvergencePolicy::Error;
    if (text == "warn")
        return NonConvergencePolicy::Warn;
    throw ConfigError("solver.on_non_convergence must be 'error' or 'warn', got '" + text + "'");
}

} // namespace sluice
