#pragma once

/**
 * @file RecordingReader.hpp
 * @brief Reads observation recordings back from HDF5
 */

#include <Eigen/Core>
#include <vulcan/io/HDF5Reader.hpp>

#include <string>
#include <vector>

namespace sluice {

/**
 * @brief HDF5 recording reader (re-export of Vulcan's HDF5Reader)
 *
 * @code
 * RecordingReader reader("output/flowsheet.h5");
 * auto times = reader.times();
 * auto flow = reader.read_double("recycle[14]");
 * @endcode
 */
using RecordingReader = vulcan::io::HDF5Reader;

/**
 * @brief Read a recorded stream as a (frames x columns) matrix
 *
 * @param reader Open recording
 * @param columns Column names of the stream, in component order
 */
inline Eigen::MatrixXd ReadStreamHistory(RecordingReader &reader,
                                         const std::vector<std::string> &columns) {
    Eigen::MatrixXd history(static_cast<Eigen::Index>(reader.frame_count()),
                            static_cast<Eigen::Index>(columns.size()));
    for (std::size_t c = 0; c < columns.size(); ++c) {
        auto values = reader.read_double(columns[c]);
        for (std::size_t r = 0; r < values.size() && r < static_cast<std::size_t>(history.rows());
             ++r) {
            history(static_cast<Eigen::Index>(r), static_cast<Eigen::Index>(c)) = values[r];
        }
    }
    return history;
}

/**
 * @brief Default column names the ObservationRecorder uses for an edge
 */
inline std::vector<std::string> DefaultStreamColumns(const std::string &edge_id,
                                                     std::size_t width) {
    std::vector<std::string> names;
    names.reserve(width);
    for (std::size_t i = 0; i < width; ++i) {
        names.push_back(edge_id + "[" + std::to_string(i) + "]");
    }
    return names;
}

} // namespace sluice
