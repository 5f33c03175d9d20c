#pragma once

/**
 * @file Error.hpp
 * @brief Error hierarchy for Sluice
 *
 * Three families matter to callers and are distinguishable by type:
 * - ConfigError: the flowsheet description is invalid (fatal at build time)
 * - ComputationError: a node failed to evaluate (fatal for the current step)
 * - NonConvergenceError: a recycle loop hit its iteration cap
 *
 * Each family carries contextual information (node id, edge id, residual)
 * rather than being split into many unrelated classes.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace sluice {

// =============================================================================
// Error Severity (for SimulationError / logging)
// =============================================================================

enum class Severity : uint8_t {
    INFO,    ///< Informational (logged, no action)
    WARNING, ///< Warning (run may continue)
    ERROR,   ///< Error (current operation aborted)
    FATAL    ///< Fatal (internal defect, run must stop)
};

// =============================================================================
// Simulation Error (structured record for logging)
// =============================================================================

struct SimulationError {
    Severity severity;
    std::string message;
    std::string component;
    double time = 0.0;
};

// =============================================================================
// Base Exception
// =============================================================================

/**
 * @brief Base class for all Sluice exceptions
 *
 * Carries a severity level, a category string used as logging context,
 * and converts to SimulationError for the log service.
 */
class Error : public std::runtime_error {
  public:
    explicit Error(const std::string &msg, Severity severity = Severity::ERROR,
                   std::string category = "general")
        : std::runtime_error("[sluice] " + msg), severity_(severity),
          category_(std::move(category)) {}

    [[nodiscard]] Severity severity() const { return severity_; }
    [[nodiscard]] const std::string &category() const { return category_; }

    [[nodiscard]] SimulationError toSimulationError(double time = 0.0,
                                                    const std::string &component = "") const {
        return SimulationError{.severity = severity_,
                               .message = what(),
                               .component = component.empty() ? category_ : component,
                               .time = time};
    }

  protected:
    Severity severity_;
    std::string category_;
};

// =============================================================================
// Configuration Errors
// =============================================================================

/**
 * @brief Kinds of flowsheet description errors
 */
enum class ConfigErrorKind {
    Invalid,             ///< Generic malformed configuration
    UnknownReference,    ///< Edge names a node or port that does not exist
    FanInViolation,      ///< Target port already has an incoming edge
    DuplicateNode,       ///< Node id used twice
    DuplicateEdge,       ///< Edge id used twice
    UnknownParameter,    ///< Parameter reference could not be resolved
    UnknownComponentType ///< No component registered for a type tag
};

/**
 * @brief Configuration/parsing errors with optional file context
 *
 * Fatal at build time; never recovered automatically.
 */
class ConfigError : public Error {
  public:
    explicit ConfigError(const std::string &msg)
        : Error("Config: " + msg, Severity::ERROR, "config") {}

    ConfigError(const std::string &node, const std::string &key)
        : Error("Config: node '" + node + "' missing required key '" + key + "'",
                Severity::ERROR, "config"),
          subject_(node) {}

    ConfigError(const std::string &message, const std::string &file, int line,
                const std::string &hint = "")
        : Error(FormatMessage(message, file, line, hint), Severity::ERROR, "config"), file_(file),
          line_(line), hint_(hint) {}

    [[nodiscard]] ConfigErrorKind kind() const { return kind_; }

    /// Id of the offending node, edge or parameter reference (may be empty)
    [[nodiscard]] const std::string &subject() const { return subject_; }

    [[nodiscard]] const std::string &file() const { return file_; }
    [[nodiscard]] int line() const { return line_; }
    [[nodiscard]] const std::string &hint() const { return hint_; }

  protected:
    ConfigError(ConfigErrorKind kind, const std::string &subject, const std::string &detail)
        : Error("Config: " + KindPrefix(kind) + " '" + subject + "'" +
                    (detail.empty() ? "" : " (" + detail + ")"),
                Severity::ERROR, "config"),
          kind_(kind), subject_(subject) {}

  private:
    static std::string KindPrefix(ConfigErrorKind kind) {
        switch (kind) {
        case ConfigErrorKind::Invalid:
            return "invalid";
        case ConfigErrorKind::UnknownReference:
            return "unknown reference in edge";
        case ConfigErrorKind::FanInViolation:
            return "fan-in violation at edge";
        case ConfigErrorKind::DuplicateNode:
            return "duplicate node id";
        case ConfigErrorKind::DuplicateEdge:
            return "duplicate edge id";
        case ConfigErrorKind::UnknownParameter:
            return "unknown parameter";
        case ConfigErrorKind::UnknownComponentType:
            return "unknown component type";
        }
        return "invalid";
    }

    static std::string FormatMessage(const std::string &msg, const std::string &file, int line,
                                     const std::string &hint) {
        std::string result = "Config: " + msg;
        if (!file.empty()) {
            result += "\n  at: " + file;
            if (line >= 0) {
                result += ":" + std::to_string(line);
            }
        }
        if (!hint.empty()) {
            result += "\n  hint: " + hint;
        }
        return result;
    }

    ConfigErrorKind kind_ = ConfigErrorKind::Invalid;
    std::string subject_;
    std::string file_;
    int line_ = -1;
    std::string hint_;
};

using ConfigurationError = ConfigError;

/**
 * @brief An edge references a node id or port name that does not exist
 */
class UnknownReferenceError : public ConfigError {
  public:
    UnknownReferenceError(const std::string &edge_id, const std::string &detail)
        : ConfigError(ConfigErrorKind::UnknownReference, edge_id, detail) {}
};

/**
 * @brief A target port received a second incoming edge
 */
class FanInViolationError : public ConfigError {
  public:
    FanInViolationError(const std::string &edge_id, const std::string &target_port,
                        const std::string &existing_edge)
        : ConfigError(ConfigErrorKind::FanInViolation, edge_id,
                      "port '" + target_port + "' is already fed by edge '" + existing_edge +
                          "'") {}
};

class DuplicateNodeError : public ConfigError {
  public:
    explicit DuplicateNodeError(const std::string &node_id)
        : ConfigError(ConfigErrorKind::DuplicateNode, node_id, "") {}
};

class DuplicateEdgeError : public ConfigError {
  public:
    explicit DuplicateEdgeError(const std::string &edge_id)
        : ConfigError(ConfigErrorKind::DuplicateEdge, edge_id, "") {}
};

/**
 * @brief Parameter reference could not be resolved by the ParameterResolver
 */
class UnknownParameterError : public ConfigError {
  public:
    explicit UnknownParameterError(const std::string &reference, const std::string &detail = "")
        : ConfigError(ConfigErrorKind::UnknownParameter, reference, detail) {}
};

class UnknownComponentTypeError : public ConfigError {
  public:
    UnknownComponentTypeError(const std::string &type_tag, const std::string &registered)
        : ConfigError(ConfigErrorKind::UnknownComponentType, type_tag,
                      "registered types: " + registered) {}
};

// =============================================================================
// Computation Errors
// =============================================================================

/**
 * @brief A node's Step failed for the given inputs
 *
 * Fatal for the current simulation step. Components may throw it without a
 * node id; the Executor rethrows with the id and time attached.
 */
class ComputationError : public Error {
  public:
    explicit ComputationError(const std::string &reason)
        : Error("Computation: " + reason, Severity::ERROR, "computation"), reason_(reason) {}

    ComputationError(const std::string &node_id, double time, const std::string &reason)
        : Error("Computation failed in node '" + node_id + "' at t=" + std::to_string(time) +
                    ": " + reason,
                Severity::ERROR, "computation"),
          node_id_(node_id), time_(time), reason_(reason) {}

    [[nodiscard]] const std::string &node_id() const { return node_id_; }
    [[nodiscard]] std::optional<double> time() const { return time_; }
    [[nodiscard]] const std::string &reason() const { return reason_; }

  private:
    std::string node_id_;
    std::optional<double> time_;
    std::string reason_;
};

// =============================================================================
// Convergence Errors
// =============================================================================

/**
 * @brief A loop stage reached its iteration cap without converging
 */
class NonConvergenceError : public Error {
  public:
    NonConvergenceError(std::size_t stage, std::vector<std::string> nodes, std::size_t iterations,
                        double residual, double tolerance, double time = 0.0)
        : Error(FormatMessage(stage, nodes, iterations, residual, tolerance, time),
                Severity::ERROR, "convergence"),
          stage_(stage), nodes_(std::move(nodes)), iterations_(iterations), residual_(residual),
          tolerance_(tolerance), time_(time) {}

    [[nodiscard]] std::size_t stage() const { return stage_; }
    [[nodiscard]] const std::vector<std::string> &nodes() const { return nodes_; }
    [[nodiscard]] std::size_t iterations() const { return iterations_; }
    [[nodiscard]] double residual() const { return residual_; }
    [[nodiscard]] double tolerance() const { return tolerance_; }
    [[nodiscard]] double time() const { return time_; }

  private:
    static std::string FormatMessage(std::size_t stage, const std::vector<std::string> &nodes,
                                     std::size_t iterations, double residual, double tolerance,
                                     double time) {
        std::ostringstream oss;
        oss << "Loop stage " << stage << " {";
        for (std::size_t i = 0; i < nodes.size(); ++i) {
            oss << (i > 0 ? ", " : "") << nodes[i];
        }
        oss << "} did not converge at t=" << time << " after " << iterations
            << " iterations (residual " << residual << ", tolerance " << tolerance << ")";
        return oss.str();
    }

    std::size_t stage_;
    std::vector<std::string> nodes_;
    std::size_t iterations_;
    double residual_;
    double tolerance_;
    double time_;
};

// =============================================================================
// Planning Errors
// =============================================================================

/**
 * @brief Internal planner invariant violated
 *
 * Raised if the condensation graph is cyclic or a tear set leaves a cycle.
 * Either means a defect in the scheduler, never a bad configuration.
 */
class PlanningError : public Error {
  public:
    explicit PlanningError(const std::string &msg)
        : Error("Planning: " + msg, Severity::FATAL, "planning") {}
};

// =============================================================================
// Lifecycle Errors
// =============================================================================

enum class LifecyclePhase { Build, Stage, Step, Reset, Other };

/**
 * @brief API misuse: wrong call order on the Simulator or Executor
 */
class LifecycleError : public Error {
  public:
    explicit LifecycleError(const std::string &msg)
        : Error("Lifecycle: " + msg, Severity::ERROR, "lifecycle"), phase_(LifecyclePhase::Other) {}

    LifecycleError(LifecyclePhase phase, const std::string &msg)
        : Error("Lifecycle [" + PhaseName(phase) + "]: " + msg, Severity::ERROR, "lifecycle"),
          phase_(phase) {}

    [[nodiscard]] LifecyclePhase phase() const { return phase_; }

  private:
    static std::string PhaseName(LifecyclePhase phase) {
        switch (phase) {
        case LifecyclePhase::Build:
            return "Build";
        case LifecyclePhase::Stage:
            return "Stage";
        case LifecyclePhase::Step:
            return "Step";
        case LifecyclePhase::Reset:
            return "Reset";
        case LifecyclePhase::Other:
            return "Other";
        }
        return "Unknown";
    }

    LifecyclePhase phase_;
};

// =============================================================================
// I/O Errors
// =============================================================================

class IOError : public Error {
  public:
    explicit IOError(const std::string &msg) : Error("IO: " + msg, Severity::ERROR, "io") {}

    IOError(const std::string &operation, const std::string &path, const std::string &reason)
        : Error("IO: " + operation + " '" + path + "': " + reason, Severity::ERROR, "io"),
          path_(path) {}

    [[nodiscard]] const std::string &path() const { return path_; }

  private:
    std::string path_;
};

} // namespace sluice

// =============================================================================
// Error Throwing Macros
// =============================================================================

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

/**
 * @brief Throw an error (simple version, no logging)
 */
#define SLUICE_THROW(error) throw(error)

// NOLINTEND(cppcoreguidelines-macro-usage)
