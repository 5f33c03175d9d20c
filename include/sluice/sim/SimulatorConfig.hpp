#pragma once

/**
 * @file SimulatorConfig.hpp
 * @brief Complete flowsheet configuration as loaded from YAML
 *
 * These structs are plain data. The Simulator consumes them during
 * construction; components only see their own NodeConfig.
 */

#include <sluice/core/NodeConfig.hpp>
#include <sluice/core/ParameterResolver.hpp>
#include <sluice/graph/Flowsheet.hpp>
#include <sluice/io/LogService.hpp>
#include <sluice/sim/SolverConfig.hpp>

#include <map>
#include <string>
#include <vector>

namespace sluice {

// =============================================================================
// RecordingConfig
// =============================================================================

/**
 * @brief Observation recording (`recording:` section)
 *
 * One row per step, one column per observed stream component. Column names
 * are caller-defined; without them they default to "<edge>[<i>]".
 */
struct RecordingConfig {
    bool enabled = false;
    std::string path = "output/flowsheet.h5";
    int decimation = 1; ///< Record every N-th step

    std::vector<std::string> edges;                             ///< Observed edge ids
    std::map<std::string, std::vector<std::string>> columns;    ///< edge id -> column names
    bool export_csv = false; ///< Write a CSV next to the HDF5 file on close

    [[nodiscard]] std::vector<std::string> Validate() const {
        std::vector<std::string> errors;
        if (enabled && path.empty()) {
            errors.push_back("recording.path is empty");
        }
        if (enabled && edges.empty()) {
            errors.push_back("recording enabled but no edges listed");
        }
        if (decimation < 1) {
            errors.push_back("recording.decimation must be at least 1");
        }
        for (const auto &[edge, names] : columns) {
            bool listed = false;
            for (const auto &e : edges) {
                listed = listed || e == edge;
            }
            if (!listed) {
                errors.push_back("recording.columns names unobserved edge '" + edge + "'");
            }
        }
        return errors;
    }
};

// =============================================================================
// FlowsheetConfig
// =============================================================================

/**
 * @brief Everything needed to build and run a flowsheet
 */
struct FlowsheetConfig {
    // Identity
    std::string name = "flowsheet";
    std::string description;
    std::string source_file; ///< Set by the loader

    // Time (used by Simulator::Run)
    double t_start = 0.0;
    double t_end = 1.0;
    double dt = 0.010416667; ///< 15 minutes in days

    SolverConfig solver;
    LogConfig logging;
    RecordingConfig recording;

    /// Optional path the execution plan is written to as YAML
    std::string plan_export_path;

    /// Named parameter tables referenced as "table.KEY"
    std::map<std::string, TableParameterResolver::Table> parameter_tables;

    std::vector<NodeConfig> nodes;
    std::vector<EdgeConfig> edges;

    /**
     * @brief Load from a YAML file
     *
     * Defined in FlowsheetLoader.hpp.
     */
    static FlowsheetConfig FromFile(const std::string &path);

    /// Resolver populated from parameter_tables
    [[nodiscard]] TableParameterResolver MakeResolver() const {
        TableParameterResolver resolver;
        for (const auto &[table_name, table] : parameter_tables) {
            resolver.AddTable(table_name, table);
        }
        return resolver;
    }

    /**
     * @brief Validate settings that do not need the graph
     * @return List of error messages (empty if valid)
     */
    [[nodiscard]] std::vector<std::string> Validate() const {
        std::vector<std::string> errors;
        if (!(dt > 0.0)) {
            errors.push_back("time.dt must be positive");
        }
        if (t_end < t_start) {
            errors.push_back("time.end must not precede time.start");
        }
        if (nodes.empty()) {
            errors.push_back("flowsheet has no nodes");
        }
        for (auto &e : solver.Validate()) {
            errors.push_back(std::move(e));
        }
        for (auto &e : recording.Validate()) {
            errors.push_back(std::move(e));
        }
        return errors;
    }
};

} // namespace sluice
