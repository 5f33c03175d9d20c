#pragma once

/**
 * @file LogService.hpp
 * @brief Logging service for Sluice
 *
 * Entries carry the simulation time and the node being evaluated. The
 * Executor sets the node context around every Step call, so component code
 * just logs and the line is attributed automatically.
 *
 * Consolidates: LogConfig, LogContext, LogEntry, LogContextManager, LogService
 */

#include <sluice/core/CoreTypes.hpp>
#include <sluice/io/Console.hpp>

#include <chrono>
#include <functional>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace sluice {

// =============================================================================
// LogConfig
// =============================================================================

/**
 * @brief Logging configuration (`logging:` section of a flowsheet file)
 */
struct LogConfig {
    LogLevel console_level = LogLevel::Info;

    bool file_enabled = false;
    std::string file_path;
    LogLevel file_level = LogLevel::Debug;

    bool quiet_mode = false; ///< Suppress all but errors

    [[nodiscard]] static LogConfig Default() { return LogConfig{}; }

    /// Errors only
    [[nodiscard]] static LogConfig Quiet() {
        LogConfig config;
        config.console_level = LogLevel::Error;
        config.quiet_mode = true;
        return config;
    }
};

// =============================================================================
// LogContext
// =============================================================================

/**
 * @brief Where a log line came from
 */
struct LogContext {
    std::string flowsheet; ///< Flowsheet name (e.g., "bsm1")
    std::string node;      ///< Node id (e.g., "splitter1")
    std::string type;      ///< Component type tag (e.g., "splitter")

    /// "flowsheet.node" or just "node" if no flowsheet
    [[nodiscard]] std::string FullPath() const {
        if (flowsheet.empty())
            return node;
        return flowsheet + "." + node;
    }

    [[nodiscard]] bool IsSet() const { return !node.empty(); }
};

// =============================================================================
// LogEntry
// =============================================================================

struct LogEntry {
    LogLevel level;      ///< Severity level
    double sim_time;     ///< Simulation time when logged
    std::string message; ///< Log message
    LogContext context;  ///< Flowsheet/node context

    std::chrono::steady_clock::time_point wall_time;

    static LogEntry Create(LogLevel level, double sim_time, std::string_view message,
                           const LogContext &ctx) {
        LogEntry entry;
        entry.level = level;
        entry.sim_time = sim_time;
        entry.message = std::string(message);
        entry.context = ctx;
        entry.wall_time = std::chrono::steady_clock::now();
        return entry;
    }

    /// "[sim_time] [LVL] [flowsheet.node] message"
    [[nodiscard]] std::string Format(bool include_context = true) const {
        std::ostringstream oss;
        oss << "[" << std::fixed << std::setprecision(4) << sim_time << "] ";
        oss << "[" << Console::LevelTag(level) << "] ";
        if (include_context && context.IsSet()) {
            oss << "[" << context.FullPath() << "] ";
        }
        oss << message;
        return oss.str();
    }

    [[nodiscard]] std::string FormatColored(const Console &console) const {
        std::ostringstream oss;
        oss << console.Colorize("[", AnsiColor::Dim);
        oss << std::fixed << std::setprecision(4) << sim_time;
        oss << console.Colorize("]", AnsiColor::Dim) << " ";
        oss << console.Colorize("[" + std::string(Console::LevelTag(level)) + "]",
                                Console::LevelColor(level))
            << " ";
        if (context.IsSet()) {
            oss << console.Colorize("[" + context.FullPath() + "]", AnsiColor::Cyan) << " ";
        }
        oss << message;
        return oss.str();
    }
};

// =============================================================================
// LogContextManager
// =============================================================================

/**
 * @brief Thread-local log context
 *
 * The Executor installs a ScopedContext before each node evaluation.
 */
class LogContextManager {
  public:
    static void SetContext(const LogContext &ctx) { current_context_ = ctx; }

    static void ClearContext() { current_context_ = LogContext{}; }

    [[nodiscard]] static const LogContext &GetContext() { return current_context_; }

    /**
     * @brief RAII guard restoring the previous context on exit
     */
    class ScopedContext {
      public:
        ScopedContext(const std::string &flowsheet, const std::string &node,
                      const std::string &type = "")
            : previous_(current_context_) {
            current_context_.flowsheet = flowsheet;
            current_context_.node = node;
            current_context_.type = type;
        }

        ~ScopedContext() { current_context_ = previous_; }

        ScopedContext(const ScopedContext &) = delete;
        ScopedContext &operator=(const ScopedContext &) = delete;
        ScopedContext(ScopedContext &&) = delete;
        ScopedContext &operator=(ScopedContext &&) = delete;

      private:
        LogContext previous_;
    };

  private:
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
    static inline thread_local LogContext current_context_;
};

// =============================================================================
// LogService
// =============================================================================

/**
 * @brief Logging service
 *
 * Two modes:
 * 1. **Immediate** (load, plan, reset): every entry goes to the sinks at once.
 * 2. **Buffered** (Step): entries are collected and flushed at the end of the
 *    step, so a loop stage iterating fifty times does not hit the terminal
 *    fifty times.
 */
class LogService {
  public:
    /// Sink callback type: receives a batch of entries
    using Sink = std::function<void(const std::vector<LogEntry> &)>;

    LogService() = default;

    // === Mode Control ===

    void SetImmediateMode(bool immediate) { immediate_mode_ = immediate; }
    [[nodiscard]] bool IsImmediateMode() const { return immediate_mode_; }

    /**
     * @brief RAII guard for buffered mode
     *
     * Flushes and restores the previous mode on destruction, also when the
     * step unwinds with an exception.
     */
    class BufferedScope {
      public:
        explicit BufferedScope(LogService &service)
            : service_(service), previous_mode_(service.immediate_mode_) {
            service_.SetImmediateMode(false);
        }

        ~BufferedScope() {
            service_.FlushAndClear();
            service_.SetImmediateMode(previous_mode_);
        }

        BufferedScope(const BufferedScope &) = delete;
        BufferedScope &operator=(const BufferedScope &) = delete;
        BufferedScope(BufferedScope &&) = delete;
        BufferedScope &operator=(BufferedScope &&) = delete;

      private:
        LogService &service_;
        bool previous_mode_;
    };

    // === Configuration ===

    /// Entries below this level are dropped
    void SetMinLevel(LogLevel level) { min_level_ = level; }
    [[nodiscard]] LogLevel GetMinLevel() const { return min_level_; }

    void AddSink(Sink sink) { sinks_.emplace_back(std::move(sink), LogLevel::Trace); }

    /// Add a sink that only receives entries at or above a level
    void AddSink(Sink sink, LogLevel min_level) { sinks_.emplace_back(std::move(sink), min_level); }

    void ClearSinks() { sinks_.clear(); }

    // === Logging API ===

    /// Log with the current thread-local context
    void Log(LogLevel level, double sim_time, std::string_view message) {
        Log(level, sim_time, message, LogContextManager::GetContext());
    }

    void Log(LogLevel level, double sim_time, std::string_view message, const LogContext &ctx) {
        if (level < min_level_) {
            return;
        }

        auto entry = LogEntry::Create(level, sim_time, message, ctx);

        std::lock_guard<std::mutex> lock(mutex_);
        if (level == LogLevel::Error) {
            ++error_count_;
        } else if (level == LogLevel::Fatal) {
            ++fatal_count_;
        }

        entries_.push_back(std::move(entry));
        if (immediate_mode_) {
            FlushEntry(entries_.back());
            delivered_ = entries_.size();
        }
    }

    void Trace(double t, std::string_view msg) { Log(LogLevel::Trace, t, msg); }
    void Debug(double t, std::string_view msg) { Log(LogLevel::Debug, t, msg); }
    void Info(double t, std::string_view msg) { Log(LogLevel::Info, t, msg); }
    void Event(double t, std::string_view msg) { Log(LogLevel::Event, t, msg); }
    void Warning(double t, std::string_view msg) { Log(LogLevel::Warning, t, msg); }
    void Error(double t, std::string_view msg) { Log(LogLevel::Error, t, msg); }
    void Fatal(double t, std::string_view msg) { Log(LogLevel::Fatal, t, msg); }

    // === Flush Control ===

    /// Send entries not yet delivered to all sinks
    void Flush() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (delivered_ >= entries_.size()) {
            return;
        }
        for (const auto &[sink, min_level] : sinks_) {
            std::vector<LogEntry> filtered;
            filtered.reserve(entries_.size() - delivered_);
            for (std::size_t i = delivered_; i < entries_.size(); ++i) {
                if (entries_[i].level >= min_level) {
                    filtered.push_back(entries_[i]);
                }
            }
            if (!filtered.empty()) {
                sink(filtered);
            }
        }
        delivered_ = entries_.size();
    }

    void FlushAndClear() {
        Flush();
        Clear();
    }

    /// Discard retained entries without flushing
    void Clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
        delivered_ = 0;
    }

    // === Query API ===

    [[nodiscard]] std::size_t PendingCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    [[nodiscard]] std::vector<LogEntry> GetPending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_;
    }

    [[nodiscard]] bool HasErrors() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return error_count_ > 0;
    }

    [[nodiscard]] std::size_t ErrorCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return error_count_;
    }

    [[nodiscard]] std::size_t FatalCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return fatal_count_;
    }

    void ResetErrorCounts() {
        std::lock_guard<std::mutex> lock(mutex_);
        error_count_ = 0;
        fatal_count_ = 0;
    }

    [[nodiscard]] std::vector<LogEntry> GetEntriesAtLevel(LogLevel level) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<LogEntry> result;
        for (const auto &entry : entries_) {
            if (entry.level == level) {
                result.push_back(entry);
            }
        }
        return result;
    }

    [[nodiscard]] std::vector<LogEntry> GetEntriesForNode(std::string_view node) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<LogEntry> result;
        for (const auto &entry : entries_) {
            if (entry.context.node == node) {
                result.push_back(entry);
            }
        }
        return result;
    }

  private:
    std::vector<LogEntry> entries_;
    std::vector<std::pair<Sink, LogLevel>> sinks_; ///< sink + min level
    LogLevel min_level_ = LogLevel::Info;
    bool immediate_mode_ = true;
    std::size_t delivered_ = 0; ///< entries_[0, delivered_) already reached the sinks

    std::size_t error_count_ = 0;
    std::size_t fatal_count_ = 0;

    mutable std::mutex mutex_;

    void FlushEntry(const LogEntry &entry) {
        for (const auto &[sink, min_level] : sinks_) {
            if (entry.level >= min_level) {
                sink({entry});
            }
        }
    }
};

/**
 * @brief Global log service singleton
 */
inline LogService &GetLogService() {
    static LogService instance;
    return instance;
}

} // namespace sluice

// =============================================================================
// Logging Macros
// =============================================================================

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define SLUICE_LOG_TRACE(sim_time, msg) ::sluice::GetLogService().Trace(sim_time, msg)

#define SLUICE_LOG_DEBUG(sim_time, msg) ::sluice::GetLogService().Debug(sim_time, msg)

#define SLUICE_LOG_INFO(sim_time, msg) ::sluice::GetLogService().Info(sim_time, msg)

#define SLUICE_LOG_EVENT(sim_time, msg) ::sluice::GetLogService().Event(sim_time, msg)

#define SLUICE_LOG_WARN(sim_time, msg) ::sluice::GetLogService().Warning(sim_time, msg)

#define SLUICE_LOG_ERROR(sim_time, msg) ::sluice::GetLogService().Error(sim_time, msg)
// NOLINTEND(cppcoreguidelines-macro-usage)
