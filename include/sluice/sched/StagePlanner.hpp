#pragma once

/**
 * @file StagePlanner.hpp
 * @brief Execution plan construction
 *
 * Graph -> CycleAnalyzer -> TearSelector -> StagePlanner yields a static
 * ExecutionPlan, built once per configuration and read-only during the run.
 */

#include <sluice/graph/Flowsheet.hpp>
#include <sluice/sched/CycleAnalyzer.hpp>
#include <sluice/sched/TearSelector.hpp>

#include <string>
#include <vector>

namespace sluice {

enum class StageKind { Linear, Loop };

inline const char *StageKindName(StageKind kind) {
    return kind == StageKind::Linear ? "linear" : "loop";
}

/**
 * @brief One stage of the execution plan
 *
 * Linear stages hold a single node evaluated once. Loop stages hold the SCC
 * members in their fixed internal order plus the tear edges that carry the
 * previous iteration's value.
 */
struct Stage {
    StageKind kind = StageKind::Linear;
    std::vector<NodeIndex> nodes;      ///< Execution order
    std::vector<EdgeIndex> tear_edges; ///< Loop stages only, insertion order
    double tolerance = 1e-6;           ///< Loop stages only
    std::size_t max_iterations = 50;   ///< Loop stages only
    std::size_t level = 0;             ///< Condensation depth; equal levels are independent

    [[nodiscard]] bool IsLoop() const { return kind == StageKind::Loop; }

    bool operator==(const Stage &other) const = default;
};

/**
 * @brief Ordered sequence of stages
 */
struct ExecutionPlan {
    std::vector<Stage> stages;

    [[nodiscard]] std::size_t Size() const { return stages.size(); }
    [[nodiscard]] bool Empty() const { return stages.empty(); }

    [[nodiscard]] std::size_t NumLinear() const;
    [[nodiscard]] std::size_t NumLoop() const;

    /// All nodes in the order they are first evaluated
    [[nodiscard]] std::vector<NodeIndex> NodeOrder() const;

    /// All tear edges across loop stages
    [[nodiscard]] std::vector<EdgeIndex> TearEdges() const;

    /// Number of distinct levels (upper bound on parallel waves)
    [[nodiscard]] std::size_t NumLevels() const;

    /// One line per stage, e.g. "  [2] loop L1 {a -> b} tear {r1}"
    [[nodiscard]] std::string ToString(const Flowsheet &flowsheet) const;

    bool operator==(const ExecutionPlan &other) const = default;
};

struct PlannerOptions {
    double tolerance = 1e-6;
    std::size_t max_iterations = 50;
    TearSelectorOptions tear;
};

class StagePlanner {
  public:
    StagePlanner() = default;
    explicit StagePlanner(PlannerOptions options) : options_(options) {}

    /**
     * @brief Build the execution plan
     * @throws PlanningError on an internal invariant violation
     */
    [[nodiscard]] ExecutionPlan Plan(const Flowsheet &flowsheet) const;

    /// Plan from an existing analysis
    [[nodiscard]] ExecutionPlan Plan(const Flowsheet &flowsheet,
                                     const CycleAnalysis &analysis) const;

    [[nodiscard]] const PlannerOptions &Options() const { return options_; }

  private:
    PlannerOptions options_;
};

} // namespace sluice
