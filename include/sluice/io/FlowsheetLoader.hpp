#pragma once

/**
 * @file FlowsheetLoader.hpp
 * @brief Loads a complete flowsheet configuration from YAML
 *
 * Uses Vulcan's YAML infrastructure for:
 * - !include directive resolution (e.g. shared parameter tables)
 * - ${VAR} and ${VAR:default} environment variable expansion
 * - Type-safe value extraction
 *
 * Only the document structure is checked here. Graph validation (unknown
 * references, fan-in, duplicate ids) happens when the Flowsheet is built,
 * which is still before any simulation step.
 */

#include <sluice/core/Error.hpp>
#include <sluice/core/NodeConfig.hpp>
#include <sluice/sim/SimulatorConfig.hpp>

#include <vulcan/io/YamlEnv.hpp>
#include <vulcan/io/YamlNode.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace sluice::io {

/**
 * @brief Loads flowsheet configuration from YAML
 *
 * @code
 * auto config = FlowsheetLoader::Load("bsm_hydraulics.yaml");
 * auto sim = Simulator::FromConfig(config);
 * @endcode
 */
class FlowsheetLoader {
  public:
    /**
     * @brief Load from file
     * @throws ConfigError on parse errors, undefined variables, missing keys
     */
    static FlowsheetConfig Load(const std::string &path) {
        if (!std::filesystem::exists(path)) {
            throw sluice::ConfigError("Config file not found", path, -1);
        }
        try {
            auto root = vulcan::io::YamlEnv::LoadWithIncludesAndEnv(path);
            return ParseRoot(root, path);
        } catch (const vulcan::io::EnvVarError &e) {
            // EnvVarError derives from YamlError, must catch first
            throw sluice::ConfigError("Undefined environment variable: " + e.var_name(), path, -1,
                                      "Set the variable or use ${" + e.var_name() + ":default}");
        } catch (const vulcan::io::YamlError &e) {
            throw sluice::ConfigError(e.what(), path, -1);
        }
    }

    /**
     * @brief Parse from a YAML string (for testing)
     */
    static FlowsheetConfig Parse(const std::string &yaml_content) {
        try {
            auto root = vulcan::io::YamlNode::Parse(yaml_content);
            return ParseRoot(root, "<string>");
        } catch (const vulcan::io::YamlError &e) {
            throw sluice::ConfigError(e.what(), "<string>", -1);
        }
    }

    /**
     * @brief Parse a single node descriptor
     */
    static NodeConfig ParseNode(const vulcan::io::YamlNode &node) {
        NodeConfig cfg;
        cfg.id = node.Require<std::string>("id");
        cfg.type = node.Require<std::string>("type");
        cfg.label = node.Get<std::string>("label", "");

        if (node.Has("inputs")) {
            cfg.inputs = node["inputs"].ToVector<std::string>();
        }
        if (node.Has("outputs")) {
            cfg.outputs = node["outputs"].ToVector<std::string>();
        }

        if (node.Has("scalars")) {
            node["scalars"].ForEachEntry(
                [&](const std::string &key, const vulcan::io::YamlNode &val) {
                    cfg.scalars[key] = val.As<double>();
                });
        }
        if (node.Has("vectors")) {
            node["vectors"].ForEachEntry(
                [&](const std::string &key, const vulcan::io::YamlNode &val) {
                    cfg.vectors[key] = val.ToVector<double>();
                });
        }
        if (node.Has("strings")) {
            node["strings"].ForEachEntry(
                [&](const std::string &key, const vulcan::io::YamlNode &val) {
                    cfg.strings[key] = val.As<std::string>();
                });
        }
        if (node.Has("integers")) {
            node["integers"].ForEachEntry(
                [&](const std::string &key, const vulcan::io::YamlNode &val) {
                    cfg.integers[key] = val.As<int64_t>();
                });
        }
        if (node.Has("booleans")) {
            node["booleans"].ForEachEntry(
                [&](const std::string &key, const vulcan::io::YamlNode &val) {
                    cfg.booleans[key] = val.As<bool>();
                });
        }
        if (node.Has("references")) {
            node["references"].ForEachEntry(
                [&](const std::string &key, const vulcan::io::YamlNode &val) {
                    cfg.references[key] = val.As<std::string>();
                });
        }
        return cfg;
    }

    /**
     * @brief Parse a single edge descriptor
     */
    static EdgeConfig ParseEdge(const vulcan::io::YamlNode &node) {
        EdgeConfig cfg;
        cfg.id = node.Require<std::string>("id");
        cfg.source_node = node.Require<std::string>("source_node");
        cfg.source_port = node.Require<std::string>("source_port");
        cfg.target_node = node.Require<std::string>("target_node");
        cfg.target_port = node.Require<std::string>("target_port");

        if (node.Has("size")) {
            int size = node.Require<int>("size");
            if (size <= 0) {
                throw sluice::ConfigError("edge '" + cfg.id + "' size must be positive");
            }
            cfg.size = static_cast<std::size_t>(size);
        }
        if (node.Has("initial_value")) {
            cfg.initial_value = node["initial_value"].ToVector<double>();
        }
        return cfg;
    }

  private:
    // =========================================================================
    // Root Parsing
    // =========================================================================

    static FlowsheetConfig ParseRoot(const vulcan::io::YamlNode &root,
                                     const std::string &source_path) {
        FlowsheetConfig cfg;
        cfg.source_file = source_path;

        if (root.Has("flowsheet")) {
            ParseFlowsheetSection(cfg, root["flowsheet"]);
        }
        if (root.Has("time")) {
            ParseTimeSection(cfg, root["time"]);
        }
        if (root.Has("solver")) {
            ParseSolver(cfg.solver, root["solver"]);
        }
        if (root.Has("parameter_tables")) {
            ParseParameterTables(cfg, root["parameter_tables"]);
        }

        if (!root.Has("nodes")) {
            throw sluice::ConfigError("Config must have a 'nodes' section", source_path, -1);
        }
        root["nodes"].ForEach(
            [&](const vulcan::io::YamlNode &node) { cfg.nodes.push_back(ParseNode(node)); });

        if (root.Has("edges")) {
            root["edges"].ForEach(
                [&](const vulcan::io::YamlNode &node) { cfg.edges.push_back(ParseEdge(node)); });
        }

        if (root.Has("logging")) {
            ParseLogging(cfg.logging, root["logging"]);
        }
        if (root.Has("recording")) {
            ParseRecording(cfg.recording, root["recording"]);
        }
        if (root.Has("plan_export")) {
            cfg.plan_export_path = root["plan_export"].Get<std::string>("path", "");
        }

        auto errors = cfg.Validate();
        if (!errors.empty()) {
            std::string hint;
            for (std::size_t i = 1; i < errors.size(); ++i) {
                hint += (i > 1 ? "; " : "") + errors[i];
            }
            throw sluice::ConfigError(errors.front(), source_path, -1, hint);
        }
        return cfg;
    }

    // =========================================================================
    // Section Parsers
    // =========================================================================

    static void ParseFlowsheetSection(FlowsheetConfig &cfg, const vulcan::io::YamlNode &node) {
        cfg.name = node.Get<std::string>("name", cfg.name);
        cfg.description = node.Get<std::string>("description", cfg.description);
    }

    static void ParseTimeSection(FlowsheetConfig &cfg, const vulcan::io::YamlNode &node) {
        cfg.t_start = node.Get<double>("start", cfg.t_start);
        cfg.t_end = node.Get<double>("end", cfg.t_end);
        cfg.dt = node.Get<double>("dt", cfg.dt);
    }

    static void ParseSolver(SolverConfig &solver, const vulcan::io::YamlNode &node) {
        solver.tolerance = node.Get<double>("tolerance", solver.tolerance);
        solver.max_iterations = static_cast<std::size_t>(
            node.Get<int>("max_iterations", static_cast<int>(solver.max_iterations)));
        solver.relaxation = node.Get<double>("relaxation", solver.relaxation);
        solver.stream_size = static_cast<std::size_t>(
            node.Get<int>("stream_size", static_cast<int>(solver.stream_size)));
        if (node.Has("residual")) {
            solver.residual = ParseResidualMode(node.Require<std::string>("residual"));
        }
        if (node.Has("on_non_convergence")) {
            solver.on_non_convergence =
                ParseNonConvergencePolicy(node.Require<std::string>("on_non_convergence"));
        }
    }

    static void ParseParameterTables(FlowsheetConfig &cfg, const vulcan::io::YamlNode &node) {
        node.ForEachEntry([&](const std::string &table_name, const vulcan::io::YamlNode &body) {
            TableParameterResolver::Table table;
            if (body.Has("scalars")) {
                body["scalars"].ForEachEntry(
                    [&](const std::string &key, const vulcan::io::YamlNode &val) {
                        table.scalars[key] = val.As<double>();
                    });
            }
            if (body.Has("vectors")) {
                body["vectors"].ForEachEntry(
                    [&](const std::string &key, const vulcan::io::YamlNode &val) {
                        table.vectors[key] = val.ToVector<double>();
                    });
            }
            cfg.parameter_tables[table_name] = std::move(table);
        });
    }

    static void ParseLogging(LogConfig &logging, const vulcan::io::YamlNode &node) {
        if (node.Has("console_level")) {
            logging.console_level = ParseLogLevel(node.Require<std::string>("console_level"));
        }
        logging.file_enabled = node.Get<bool>("file_enabled", logging.file_enabled);
        logging.file_path = node.Get<std::string>("file_path", logging.file_path);
        if (node.Has("file_level")) {
            logging.file_level = ParseLogLevel(node.Require<std::string>("file_level"));
        }
        logging.quiet_mode = node.Get<bool>("quiet", logging.quiet_mode);
    }

    static void ParseRecording(RecordingConfig &recording, const vulcan::io::YamlNode &node) {
        recording.enabled = node.Get<bool>("enabled", recording.enabled);
        recording.path = node.Get<std::string>("path", recording.path);
        recording.decimation = node.Get<int>("decimation", recording.decimation);
        recording.export_csv = node.Get<bool>("export_csv", recording.export_csv);
        if (node.Has("edges")) {
            recording.edges = node["edges"].ToVector<std::string>();
        }
        if (node.Has("columns")) {
            node["columns"].ForEachEntry(
                [&](const std::string &edge, const vulcan::io::YamlNode &names) {
                    recording.columns[edge] = names.ToVector<std::string>();
                });
        }
    }

    static LogLevel ParseLogLevel(const std::string &level_str) {
        if (level_str == "Trace" || level_str == "trace")
            return LogLevel::Trace;
        if (level_str == "Debug" || level_str == "debug")
            return LogLevel::Debug;
        if (level_str == "Info" || level_str == "info")
            return LogLevel::Info;
        if (level_str == "Event" || level_str == "event")
            return LogLevel::Event;
        if (level_str == "Warning" || level_str == "warning")
            return LogLevel::Warning;
        if (level_str == "Error" || level_str == "error")
            return LogLevel::Error;
        if (level_str == "Off" || level_str == "off")
            return LogLevel::Fatal;
        return LogLevel::Info;
    }
};

} // namespace sluice::io

// =============================================================================
// FlowsheetConfig::FromFile() implementation
// =============================================================================

namespace sluice {

inline FlowsheetConfig FlowsheetConfig::FromFile(const std::string &path) {
    return io::FlowsheetLoader::Load(path);
}

} // namespace sluice
