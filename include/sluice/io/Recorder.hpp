#pragma once

#include <string>

namespace sluice {

/**
 * @brief Flowsheet data recorder interface.
 *
 * Records observed stream values to persistent storage (HDF5).
 */
class Recorder {
  public:
    virtual ~Recorder() = default;

    /**
     * @brief Open recording file.
     */
    virtual void Open(const std::string &path) = 0;

    /**
     * @brief Close recording file.
     */
    virtual void Close() = 0;

    /**
     * @brief Record current observed values.
     */
    virtual void Record(double time) = 0;
};

} // namespace sluice
