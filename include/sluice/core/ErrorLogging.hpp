#pragma once

/**
 * @file ErrorLogging.hpp
 * @brief Integration between Error types and LogService
 *
 * Bridges Error.hpp and LogService.hpp so error paths can log before they
 * propagate.
 */

#include <sluice/core/Error.hpp>
#include <sluice/io/LogService.hpp>

namespace sluice {

inline LogLevel SeverityToLogLevel(Severity severity) {
    switch (severity) {
    case Severity::INFO:
        return LogLevel::Info;
    case Severity::WARNING:
        return LogLevel::Warning;
    case Severity::ERROR:
        return LogLevel::Error;
    case Severity::FATAL:
        return LogLevel::Fatal;
    }
    return LogLevel::Error;
}

/**
 * @brief Log an error to the global LogService
 * @param node Node id used as context; empty keeps the thread-local context
 */
inline void LogError(const Error &error, double time = 0.0, const std::string &node = "") {
    auto sim_error = error.toSimulationError(time, node);
    LogLevel level = SeverityToLogLevel(sim_error.severity);

    if (!node.empty()) {
        LogContext ctx = LogContextManager::GetContext();
        ctx.node = node;
        GetLogService().Log(level, time, sim_error.message, ctx);
    } else {
        GetLogService().Log(level, time, sim_error.message);
    }
}

/**
 * @brief Throw an error after logging it
 *
 * @code
 * ThrowAndLog(ComputationError("splitter1", t, "negative flow"), t, "splitter1");
 * @endcode
 */
template <typename E>
[[noreturn]] void ThrowAndLog(E &&error, double time = 0.0, const std::string &node = "") {
    LogError(error, time, node);
    throw std::forward<E>(error);
}

} // namespace sluice

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

/**
 * @brief Throw an error after logging it to the global LogService
 */
#define SLUICE_THROW_LOG(error) ::sluice::ThrowAndLog((error), 0.0, "")

/**
 * @brief Throw an error with time and node context, logging before throw
 */
#define SLUICE_THROW_LOG_CTX(error, time, node) ::sluice::ThrowAndLog((error), (time), (node))

// NOLINTEND(cppcoreguidelines-macro-usage)
