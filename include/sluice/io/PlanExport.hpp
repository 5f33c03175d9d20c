#pragma once

/**
 * @file PlanExport.hpp
 * @brief Writes an ExecutionPlan as YAML for inspection
 *
 * The document lists every stage in execution order with node and tear edge
 * ids, so two runs of the same configuration can be diffed.
 */

#include <sluice/core/Error.hpp>
#include <sluice/graph/Flowsheet.hpp>
#include <sluice/sched/StagePlanner.hpp>

#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <fstream>
#include <string>

namespace sluice::io {

class PlanExport {
  public:
    /**
     * @brief Render the plan as a YAML document
     */
    [[nodiscard]] static std::string ToYAML(const ExecutionPlan &plan, const Flowsheet &flowsheet,
                                            const std::string &name = "") {
        YAML::Emitter out;
        out << YAML::BeginMap;

        if (!name.empty()) {
            out << YAML::Key << "flowsheet" << YAML::Value << name;
        }

        // Summary
        out << YAML::Key << "summary" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "nodes" << YAML::Value << flowsheet.NumNodes();
        out << YAML::Key << "edges" << YAML::Value << flowsheet.NumEdges();
        out << YAML::Key << "stages" << YAML::Value << plan.Size();
        out << YAML::Key << "linear_stages" << YAML::Value << plan.NumLinear();
        out << YAML::Key << "loop_stages" << YAML::Value << plan.NumLoop();
        out << YAML::Key << "levels" << YAML::Value << plan.NumLevels();
        out << YAML::EndMap;

        out << YAML::Key << "stages" << YAML::Value << YAML::BeginSeq;
        for (std::size_t i = 0; i < plan.stages.size(); ++i) {
            const Stage &stage = plan.stages[i];
            out << YAML::BeginMap;
            out << YAML::Key << "index" << YAML::Value << i;
            out << YAML::Key << "kind" << YAML::Value << StageKindName(stage.kind);
            out << YAML::Key << "level" << YAML::Value << stage.level;

            out << YAML::Key << "nodes" << YAML::Value << YAML::Flow << YAML::BeginSeq;
            for (NodeIndex node : stage.nodes) {
                out << flowsheet.GetNode(node).id();
            }
            out << YAML::EndSeq;

            if (stage.IsLoop()) {
                out << YAML::Key << "tear_edges" << YAML::Value << YAML::Flow << YAML::BeginSeq;
                for (EdgeIndex edge : stage.tear_edges) {
                    out << flowsheet.GetEdge(edge).id;
                }
                out << YAML::EndSeq;
                out << YAML::Key << "tolerance" << YAML::Value << stage.tolerance;
                out << YAML::Key << "max_iterations" << YAML::Value << stage.max_iterations;
            }
            out << YAML::EndMap;
        }
        out << YAML::EndSeq;

        out << YAML::EndMap;
        return out.c_str();
    }

    /**
     * @brief Write the plan to a YAML file, creating parent directories
     * @throws IOError if the file cannot be written
     */
    static void Write(const std::string &path, const ExecutionPlan &plan,
                      const Flowsheet &flowsheet, const std::string &name = "") {
        std::filesystem::path file_path(path);
        std::error_code ec;
        if (file_path.has_parent_path()) {
            std::filesystem::create_directories(file_path.parent_path(), ec);
            if (ec) {
                throw IOError("create directory", file_path.parent_path().string(), ec.message());
            }
        }

        std::ofstream file(path);
        if (!file.is_open()) {
            throw IOError("write plan", path, "cannot open file");
        }
        file << ToYAML(plan, flowsheet, name) << "\n";
        if (!file) {
            throw IOError("write plan", path, "write failed");
        }
    }
};

} // namespace sluice::io
