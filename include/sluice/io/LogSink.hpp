#pragma once

/**
 * @file LogSink.hpp
 * @brief Pre-built log sinks for common output destinations
 */

#include <sluice/core/Error.hpp>
#include <sluice/io/Console.hpp>
#include <sluice/io/LogService.hpp>

#include <algorithm>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace sluice {

/**
 * @brief Factory for common log sinks
 */
class LogSinks {
  public:
    /// Console sink with colors (respects TTY detection)
    static LogService::Sink Console(const class Console &console) {
        return [&console](const std::vector<LogEntry> &entries) {
            for (const auto &entry : entries) {
                if (console.IsColorEnabled()) {
                    std::cout << entry.FormatColored(console) << "\n";
                } else {
                    std::cout << entry.Format() << "\n";
                }
            }
            std::cout.flush();
        };
    }

    /// Plain text file sink, appending
    static LogService::Sink File(const std::string &path) {
        auto file = std::make_shared<std::ofstream>(path, std::ios::app);
        if (!file->is_open()) {
            throw IOError("open log file", path, "cannot open for writing");
        }
        return [file](const std::vector<LogEntry> &entries) {
            for (const auto &entry : entries) {
                *file << entry.Format() << "\n";
            }
            file->flush();
        };
    }

    /// JSON Lines sink, one object per entry
    static LogService::Sink JsonLines(const std::string &path) {
        auto file = std::make_shared<std::ofstream>(path, std::ios::app);
        if (!file->is_open()) {
            throw IOError("open log file", path, "cannot open for writing");
        }
        return [file](const std::vector<LogEntry> &entries) {
            for (const auto &entry : entries) {
                *file << "{\"time\":" << entry.sim_time << ",\"level\":\""
                      << Console::LevelTag(entry.level) << "\",\"flowsheet\":\""
                      << EscapeJson(entry.context.flowsheet) << "\",\"node\":\""
                      << EscapeJson(entry.context.node) << "\",\"message\":\""
                      << EscapeJson(entry.message) << "\"}\n";
            }
            file->flush();
        };
    }

    static LogService::Sink Null() {
        return [](const std::vector<LogEntry> & /*entries*/) {};
    }

    /// Per-entry callback (tests, GUIs)
    static LogService::Sink Callback(std::function<void(const LogEntry &)> handler) {
        return [handler = std::move(handler)](const std::vector<LogEntry> &entries) {
            for (const auto &entry : entries) {
                handler(entry);
            }
        };
    }

  private:
    [[nodiscard]] static std::string EscapeJson(const std::string &s) {
        std::string result;
        result.reserve(s.size());
        for (char c : s) {
            switch (c) {
            case '"':
                result += "\\\"";
                break;
            case '\\':
                result += "\\\\";
                break;
            case '\n':
                result += "\\n";
                break;
            case '\t':
                result += "\\t";
                break;
            default:
                result += c;
                break;
            }
        }
        return result;
    }
};

/**
 * @brief Install sinks on the global service according to a LogConfig
 *
 * Replaces any sinks already installed. The console object must outlive
 * the service's use of it.
 */
inline void ConfigureLogging(const LogConfig &config, const class Console &console) {
    auto &service = GetLogService();
    service.ClearSinks();

    LogLevel console_level = config.quiet_mode ? LogLevel::Error : config.console_level;
    service.AddSink(LogSinks::Console(console), console_level);

    LogLevel min_level = console_level;
    if (config.file_enabled && !config.file_path.empty()) {
        service.AddSink(LogSinks::File(config.file_path), config.file_level);
        min_level = std::min(min_level, config.file_level);
    }
    service.SetMinLevel(min_level);
}

} // namespace sluice
