#pragma once

/**
 * @file ObservationRecorder.hpp
 * @brief HDF5 recorder for observed streams, wrapping Vulcan's telemetry system
 *
 * - Builds a TelemetrySchema with one double column per observed stream
 *   component
 * - Captures edge values after each successful step
 * - Delegates to Vulcan's HDF5Writer for file I/O
 */

#include <sluice/core/Error.hpp>
#include <sluice/io/Recorder.hpp>
#include <sluice/io/RecordingReader.hpp>
#include <sluice/sim/Executor.hpp>
#include <sluice/sim/SimulatorConfig.hpp>

#include <vulcan/io/CSVExport.hpp>
#include <vulcan/io/Frame.hpp>
#include <vulcan/io/HDF5Writer.hpp>
#include <vulcan/io/TelemetrySchema.hpp>

#include <cmath>
#include <filesystem>
#include <limits>
#include <memory>
#include <string>
#include <vector>

namespace sluice {

/**
 * @brief Records observed edge values once per step
 *
 * Column names come from RecordingConfig::columns; otherwise stream component
 * @c i of edge @c e is named "e[i]". Edges without a value yet are written as
 * NaN.
 *
 * @code
 * ObservationRecorder recorder(executor, config.recording);
 * recorder.Open("");
 * while (t < t_end) {
 *     executor.Step(dt, t);
 *     recorder.Record(t);
 * }
 * recorder.Close();
 * @endcode
 */
class ObservationRecorder : public Recorder {
  public:
    /**
     * @param executor Source of edge values (must outlive the recorder)
     * @param config Recording configuration
     */
    ObservationRecorder(const Executor &executor, const RecordingConfig &config)
        : executor_(executor), config_(config) {}

    ~ObservationRecorder() override = default;

    ObservationRecorder(const ObservationRecorder &) = delete;
    ObservationRecorder &operator=(const ObservationRecorder &) = delete;

    /**
     * @brief Open recording file and initialize writer
     * @param path Output file path (overrides config.path if non-empty)
     * @throws ConfigError if an observed edge is unknown or a column list has
     *         the wrong length
     */
    void Open(const std::string &path) override {
        if (!path.empty()) {
            config_.path = path;
        }
        BuildSchema();

        std::filesystem::path file_path(config_.path);
        if (file_path.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(file_path.parent_path(), ec);
            if (ec) {
                throw IOError("create directory", file_path.parent_path().string(), ec.message());
            }
        }
        writer_ = std::make_unique<vulcan::io::HDF5Writer>(config_.path, schema_);
        frame_ = std::make_unique<vulcan::io::Frame>(schema_);
        step_counter_ = 0;
    }

    /**
     * @brief Record current edge values as a frame
     *
     * Respects decimation: only every N-th call is written.
     */
    void Record(double time) override {
        if (!writer_) {
            throw IOError("recorder not open");
        }

        ++step_counter_;
        if (config_.decimation > 1 &&
            (step_counter_ % static_cast<std::size_t>(config_.decimation)) != 1) {
            return;
        }

        frame_->set_time(time);
        CaptureValues();
        writer_->write_frame(*frame_);
    }

    /**
     * @brief Close recording file
     *
     * If export_csv is enabled, the HDF5 data is also exported to CSV.
     */
    void Close() override {
        if (writer_) {
            writer_->close();
            writer_.reset();

            if (config_.export_csv) {
                ExportCSV();
            }
        }
    }

    [[nodiscard]] bool IsOpen() const { return writer_ != nullptr; }

    [[nodiscard]] std::size_t FrameCount() const { return writer_ ? writer_->frame_count() : 0; }

    void Flush() {
        if (writer_) {
            writer_->flush();
        }
    }

    [[nodiscard]] const vulcan::io::TelemetrySchema &Schema() const { return schema_; }

    /// Column names in file order
    [[nodiscard]] std::vector<std::string> Columns() const {
        std::vector<std::string> names;
        for (const auto &observed : observed_) {
            names.insert(names.end(), observed.columns.begin(), observed.columns.end());
        }
        return names;
    }

    [[nodiscard]] const std::string &Path() const { return config_.path; }

  private:
    struct ObservedEdge {
        EdgeIndex edge = kInvalidIndex;
        std::vector<std::string> columns;
    };

    const Executor &executor_;
    RecordingConfig config_;
    vulcan::io::TelemetrySchema schema_;
    std::unique_ptr<vulcan::io::HDF5Writer> writer_;
    std::unique_ptr<vulcan::io::Frame> frame_;
    std::vector<ObservedEdge> observed_;
    std::size_t step_counter_ = 0;

    void BuildSchema() {
        schema_ = vulcan::io::TelemetrySchema();
        observed_.clear();

        const Flowsheet &graph = executor_.Graph();
        for (const auto &edge_id : config_.edges) {
            ObservedEdge observed;
            observed.edge = graph.RequireEdge(edge_id);
            std::size_t width = StreamWidth(observed.edge);

            auto it = config_.columns.find(edge_id);
            if (it != config_.columns.end()) {
                if (it->second.size() != width) {
                    throw ConfigError("recording.columns for edge '" + edge_id + "' lists " +
                                      std::to_string(it->second.size()) + " names, stream has " +
                                      std::to_string(width) + " components");
                }
                observed.columns = it->second;
            } else {
                observed.columns = DefaultStreamColumns(edge_id, width);
            }

            for (const auto &column : observed.columns) {
                schema_.add_double(column, vulcan::io::SignalLifecycle::Dynamic, "");
            }
            observed_.push_back(std::move(observed));
        }
    }

    /// Declared edge size, else current value size, else solver stream size
    [[nodiscard]] std::size_t StreamWidth(EdgeIndex edge) const {
        const Edge &e = executor_.Graph().GetEdge(edge);
        if (e.size) {
            return *e.size;
        }
        const auto &value = executor_.EdgeValue(edge);
        if (value) {
            return static_cast<std::size_t>(value->size());
        }
        return executor_.Solver().stream_size;
    }

    void CaptureValues() {
        constexpr double kMissing = std::numeric_limits<double>::quiet_NaN();
        for (const auto &observed : observed_) {
            const auto &value = executor_.EdgeValue(observed.edge);
            for (std::size_t i = 0; i < observed.columns.size(); ++i) {
                auto index = static_cast<Eigen::Index>(i);
                double v = (value && index < value->size()) ? (*value)(index) : kMissing;
                frame_->set(observed.columns[i], v);
            }
        }
    }

    /**
     * @brief Export HDF5 data to CSV next to the HDF5 file
     */
    void ExportCSV() {
        std::string csv_path = config_.path;
        auto dot_pos = csv_path.rfind('.');
        if (dot_pos != std::string::npos) {
            csv_path = csv_path.substr(0, dot_pos) + ".csv";
        } else {
            csv_path += ".csv";
        }

        vulcan::io::CSVExportOptions options;
        options.signals = Columns();
        vulcan::io::export_to_csv(config_.path, csv_path, options);
    }
};

} // namespace sluice
