/**
 * @file test_logging.cpp
 * @brief Unit tests for the log service, sinks and console helpers
 */

#include <sluice/io/Console.hpp>
#include <sluice/io/LogService.hpp>
#include <sluice/io/LogSink.hpp>

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>
#include <vector>

using namespace sluice;

// =============================================================================
// Console Tests
// =============================================================================

TEST(Console, SetColorEnabled) {
    Console console;
    console.SetColorEnabled(true);
    EXPECT_TRUE(console.IsColorEnabled());

    console.SetColorEnabled(false);
    EXPECT_FALSE(console.IsColorEnabled());
}

TEST(Console, ColorizeStripsWhenDisabled) {
    Console console;
    console.SetColorEnabled(false);
    EXPECT_EQ(console.Colorize("test", AnsiColor::Red), "test");
}

TEST(Console, ColorizeAddsWhenEnabled) {
    Console console;
    console.SetColorEnabled(true);

    auto result = console.Colorize("test", AnsiColor::Red);
    EXPECT_TRUE(result.find("\033[31m") != std::string::npos);
    EXPECT_TRUE(result.find("\033[0m") != std::string::npos);
}

TEST(Console, Padding) {
    EXPECT_EQ(Console::PadRight("ab", 4), "ab  ");
    EXPECT_EQ(Console::PadLeft("ab", 4), "  ab");
    EXPECT_EQ(Console::PadRight("abcdef", 4), "abcdef");
    EXPECT_EQ(Console::HorizontalRule(3, '='), "===");
}

TEST(Console, LevelTags) {
    EXPECT_STREQ(Console::LevelTag(LogLevel::Warning), "WRN");
    EXPECT_STREQ(Console::LevelTag(LogLevel::Error), "ERR");
    EXPECT_STREQ(Console::LevelColor(LogLevel::Error), AnsiColor::Red);
}

// =============================================================================
// LogEntry Tests
// =============================================================================

TEST(LogEntry, FormatIncludesTimeLevelAndContext) {
    LogContext ctx;
    ctx.flowsheet = "bsm1";
    ctx.node = "splitter1";
    auto entry = LogEntry::Create(LogLevel::Warning, 1.5, "loop slow", ctx);

    auto text = entry.Format();
    EXPECT_NE(text.find("[1.5000]"), std::string::npos);
    EXPECT_NE(text.find("[WRN]"), std::string::npos);
    EXPECT_NE(text.find("[bsm1.splitter1]"), std::string::npos);
    EXPECT_NE(text.find("loop slow"), std::string::npos);

    EXPECT_EQ(entry.Format(false).find("splitter1"), std::string::npos);
}

TEST(LogEntry, ContextWithoutFlowsheet) {
    LogContext ctx;
    EXPECT_FALSE(ctx.IsSet());
    ctx.node = "mix";
    EXPECT_EQ(ctx.FullPath(), "mix");
}

// =============================================================================
// LogService Tests
// =============================================================================

TEST(LogService, ImmediateModeDeliversAtOnce) {
    LogService service;
    std::vector<LogEntry> received;
    service.AddSink(LogSinks::Callback([&](const LogEntry &e) { received.push_back(e); }));

    service.Info(0.0, "hello");
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0].message, "hello");

    // Flushing again does not resend
    service.Flush();
    EXPECT_EQ(received.size(), 1u);
}

TEST(LogService, MinLevelDropsEntries) {
    LogService service;
    std::vector<LogEntry> received;
    service.AddSink(LogSinks::Callback([&](const LogEntry &e) { received.push_back(e); }));

    service.Debug(0.0, "dropped");
    EXPECT_TRUE(received.empty());
    EXPECT_EQ(service.PendingCount(), 0u);

    service.SetMinLevel(LogLevel::Trace);
    service.Debug(0.0, "kept");
    EXPECT_EQ(received.size(), 1u);
}

TEST(LogService, SinkLevelFilters) {
    LogService service;
    std::size_t all = 0;
    std::size_t errors = 0;
    service.AddSink(LogSinks::Callback([&](const LogEntry &) { ++all; }));
    service.AddSink(LogSinks::Callback([&](const LogEntry &) { ++errors; }), LogLevel::Error);

    service.Info(0.0, "info");
    service.Warning(0.0, "warn");
    service.Error(0.0, "error");

    EXPECT_EQ(all, 3u);
    EXPECT_EQ(errors, 1u);
    EXPECT_EQ(service.ErrorCount(), 1u);
    EXPECT_TRUE(service.HasErrors());

    service.ResetErrorCounts();
    EXPECT_FALSE(service.HasErrors());
}

TEST(LogService, BufferedScopeFlushesOnExit) {
    LogService service;
    std::vector<std::string> received;
    service.AddSink(
        LogSinks::Callback([&](const LogEntry &e) { received.push_back(e.message); }));

    {
        LogService::BufferedScope scope(service);
        EXPECT_FALSE(service.IsImmediateMode());
        service.Info(1.0, "iteration 1");
        service.Info(1.0, "iteration 2");
        EXPECT_TRUE(received.empty());
        EXPECT_EQ(service.PendingCount(), 2u);
    }

    EXPECT_TRUE(service.IsImmediateMode());
    EXPECT_EQ(received, (std::vector<std::string>{"iteration 1", "iteration 2"}));
    EXPECT_EQ(service.PendingCount(), 0u);
}

TEST(LogService, BufferedScopeFlushesDuringUnwinding) {
    LogService service;
    std::size_t delivered = 0;
    service.AddSink(LogSinks::Callback([&](const LogEntry &) { ++delivered; }));

    try {
        LogService::BufferedScope scope(service);
        service.Warning(2.0, "about to fail");
        throw std::runtime_error("step failed");
    } catch (const std::runtime_error &) {
        // Expected
    }
    EXPECT_EQ(delivered, 1u);
}

TEST(LogService, EntriesCarryThreadLocalContext) {
    LogService service;
    service.SetImmediateMode(false);

    {
        LogContextManager::ScopedContext outer("bsm1", "reactor", "integrator");
        service.Info(0.5, "from reactor");
        {
            LogContextManager::ScopedContext inner("bsm1", "splitter1", "splitter");
            service.Info(0.5, "from splitter");
        }
        EXPECT_EQ(LogContextManager::GetContext().node, "reactor");
    }
    EXPECT_FALSE(LogContextManager::GetContext().IsSet());
    service.Info(0.5, "no context");

    auto splitter = service.GetEntriesForNode("splitter1");
    ASSERT_EQ(splitter.size(), 1u);
    EXPECT_EQ(splitter[0].context.flowsheet, "bsm1");
    EXPECT_EQ(splitter[0].context.type, "splitter");
    EXPECT_EQ(service.GetEntriesForNode("reactor").size(), 1u);
    EXPECT_EQ(service.GetEntriesAtLevel(LogLevel::Info).size(), 3u);
}

// =============================================================================
// Sink and Configuration Tests
// =============================================================================

class LogFileTest : public ::testing::Test {
  protected:
    void SetUp() override { std::filesystem::remove(path_); }

    void TearDown() override {
        auto &service = GetLogService();
        service.ClearSinks();
        service.Clear();
        service.SetMinLevel(LogLevel::Info);
        std::filesystem::remove(path_);
    }

    [[nodiscard]] std::string ReadAll() const {
        std::ifstream file(path_);
        std::stringstream ss;
        ss << file.rdbuf();
        return ss.str();
    }

    std::string path_ = "/tmp/sluice_test_log.txt";
};

TEST_F(LogFileTest, FileSinkAppendsFormattedLines) {
    LogService service;
    service.AddSink(LogSinks::File(path_));
    service.Info(0.25, "first");
    service.Warning(0.5, "second");

    auto text = ReadAll();
    EXPECT_NE(text.find("[INF] first"), std::string::npos);
    EXPECT_NE(text.find("[WRN] second"), std::string::npos);
}

TEST_F(LogFileTest, FileSinkRejectsUnwritablePath) {
    EXPECT_THROW(LogSinks::File("/nonexistent_dir/sluice/log.txt"), IOError);
}

TEST_F(LogFileTest, JsonLinesEscapesMessages) {
    LogService service;
    service.AddSink(LogSinks::JsonLines(path_));
    service.Info(0.0, "say \"hi\"");

    auto text = ReadAll();
    EXPECT_NE(text.find("\"level\":\"INF\""), std::string::npos);
    EXPECT_NE(text.find("say \\\"hi\\\""), std::string::npos);
}

TEST_F(LogFileTest, ConfigureLoggingInstallsFileSink) {
    Console console;
    console.SetColorEnabled(false);

    LogConfig config;
    config.console_level = LogLevel::Error;
    config.file_enabled = true;
    config.file_path = path_;
    config.file_level = LogLevel::Debug;
    ConfigureLogging(config, console);

    auto &service = GetLogService();
    EXPECT_EQ(service.GetMinLevel(), LogLevel::Debug);

    service.Debug(0.0, "debug line");
    EXPECT_NE(ReadAll().find("debug line"), std::string::npos);
}

TEST_F(LogFileTest, QuietModeRaisesConsoleLevel) {
    Console console;
    ConfigureLogging(LogConfig::Quiet(), console);
    EXPECT_EQ(GetLogService().GetMinLevel(), LogLevel::Error);
}
