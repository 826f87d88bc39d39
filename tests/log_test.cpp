//! # Logger Unit Tests
//!
//! Tests for the logging layer: LogFilter parsing, record formatting,
//! capture sinks, level and module filtering through the macros, and
//! command-line option parsing.

#include "log/log.hpp"

#include <cstdlib>
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

using namespace pystruct::log;

// ============================================================================
// LogFilter Parsing
// ============================================================================

class LogFilterTest : public ::testing::Test {
protected:
    LogFilter filter;
};

TEST_F(LogFilterTest, ParseModuleAndDefault) {
    filter.parse("extract=debug,*=warn");

    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "extract"));
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "extract"));

    // Unmatched modules use the default
    EXPECT_TRUE(filter.should_log(LogLevel::Warn, "filter"));
    EXPECT_FALSE(filter.should_log(LogLevel::Info, "filter"));
}

TEST_F(LogFilterTest, ParseBareModuleName) {
    filter.parse("filter");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "filter"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "cli"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "cli"));
}

TEST_F(LogFilterTest, ModuleOff) {
    filter.parse("parallel=off");
    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "parallel"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "extract"));
}

TEST_F(LogFilterTest, MinLevel) {
    filter.parse("extract=trace,*=error");
    EXPECT_EQ(filter.min_level(), LogLevel::Trace);
    EXPECT_EQ(filter.default_level(), LogLevel::Error);

    filter.parse("");
    EXPECT_EQ(filter.min_level(), LogLevel::Error);
}

TEST(LogLevelTest, ParseLevel) {
    EXPECT_EQ(parse_level("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parse_level("warning"), LogLevel::Warn);
    EXPECT_EQ(parse_level("off"), LogLevel::Off);
    EXPECT_EQ(parse_level("loud"), LogLevel::Info);
    EXPECT_STREQ(level_name(LogLevel::Fatal), "FATAL");
}

// ============================================================================
// Formatting
// ============================================================================

TEST(LogFormatTest, JsonRecord) {
    LogRecord record{.level = LogLevel::Warn,
                     .module = "extract",
                     .message = "pkg/bad.py:3:7: \"oops\"",
                     .file = __FILE__,
                     .line = __LINE__,
                     .timestamp_ms = 1234};
    EXPECT_EQ(format_record(record, LogFormat::JSON),
              R"({"ts":1234,"level":"WARN","module":"extract","msg":"pkg/bad.py:3:7: \"oops\""})");
}

TEST(LogFormatTest, TextRecord) {
    LogRecord record{.level = LogLevel::Info,
                     .module = "cli",
                     .message = "done",
                     .file = __FILE__,
                     .line = __LINE__,
                     .timestamp_ms = 0};
    auto text = format_record(record, LogFormat::Text);
    EXPECT_NE(text.find("INFO  [cli] done"), std::string::npos);
}

// ============================================================================
// Logger Dispatch
// ============================================================================

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        LogConfig config;
        config.level = LogLevel::Info;
        config.console = false;
        Logger::init(config);

        auto sink = std::make_unique<CaptureSink>();
        capture_ = sink.get();
        Logger::instance().add_sink(std::move(sink));
    }

    void TearDown() override {
        Logger::instance().clear_sinks();
    }

    CaptureSink* capture_ = nullptr;
};

TEST_F(LoggerTest, LevelGate) {
    PYSTRUCT_LOG_DEBUG("extract", "hidden " << 1);
    PYSTRUCT_LOG_INFO("extract", "extracted " << 2 << " modules");
    PYSTRUCT_LOG_WARN("extract", "skipped pkg/bad.py");

    auto entries = capture_->entries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].message, "extracted 2 modules");
    EXPECT_EQ(entries[0].module, "extract");
    EXPECT_EQ(capture_->count(LogLevel::Warn), 1u);
}

TEST_F(LoggerTest, ModuleFilterLowersTheGate) {
    Logger::instance().set_filter("filter=debug");
    PYSTRUCT_LOG_DEBUG("filter", "EmptyFilter: nothing removed");
    PYSTRUCT_LOG_DEBUG("extract", "hidden");
    PYSTRUCT_LOG_INFO("extract", "shown");

    auto entries = capture_->entries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].module, "filter");
    EXPECT_EQ(entries[1].message, "shown");
}

TEST_F(LoggerTest, SetLevel) {
    Logger::instance().set_level(LogLevel::Error);
    PYSTRUCT_LOG_WARN("cli", "hidden");
    PYSTRUCT_LOG_ERROR("cli", "shown");
    EXPECT_EQ(capture_->entries().size(), 1u);
    EXPECT_EQ(Logger::instance().level(), LogLevel::Error);
}

TEST_F(LoggerTest, NoSinksDropsEverything) {
    Logger::instance().clear_sinks();
    EXPECT_FALSE(Logger::instance().should_log(LogLevel::Fatal, "cli"));
}

TEST_F(LoggerTest, ConcurrentWriters) {
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([t] {
            for (int i = 0; i < 50; ++i) {
                PYSTRUCT_LOG_INFO("parallel", "worker " << t << " file " << i);
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    EXPECT_EQ(capture_->count(LogLevel::Info), 200u);
}

// ============================================================================
// Command-Line Options
// ============================================================================

class LogOptionsTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("PYSTRUCT_LOG");
    }

    void TearDown() override {
        unsetenv("PYSTRUCT_LOG");
    }

    auto parse(std::vector<std::string> args) -> LogConfig {
        args.insert(args.begin(), "pystruct");
        storage_ = std::move(args);
        argv_.clear();
        for (auto& arg : storage_) {
            argv_.push_back(arg.data());
        }
        return parse_log_options(static_cast<int>(argv_.size()), argv_.data());
    }

    std::vector<std::string> storage_;
    std::vector<char*> argv_;
};

TEST_F(LogOptionsTest, DefaultsToWarn) {
    auto config = parse({"extract", "--root", "src"});
    EXPECT_EQ(config.level, LogLevel::Warn);
    EXPECT_EQ(config.format, LogFormat::Text);
    EXPECT_TRUE(config.filter_spec.empty());
    EXPECT_TRUE(config.log_file.empty());
}

TEST_F(LogOptionsTest, ExplicitOptions) {
    auto config = parse({"--log-level=debug", "--log-filter=extract=trace",
                         "--log-file=run.log", "--log-format=json"});
    EXPECT_EQ(config.level, LogLevel::Debug);
    EXPECT_EQ(config.filter_spec, "extract=trace");
    EXPECT_EQ(config.log_file, "run.log");
    EXPECT_EQ(config.format, LogFormat::JSON);
}

TEST_F(LogOptionsTest, Verbosity) {
    EXPECT_EQ(parse({"-v"}).level, LogLevel::Info);
    EXPECT_EQ(parse({"-vv"}).level, LogLevel::Debug);
    EXPECT_EQ(parse({"-vvv"}).level, LogLevel::Trace);
    EXPECT_EQ(parse({"--verbose"}).level, LogLevel::Info);
    EXPECT_EQ(parse({"-q"}).level, LogLevel::Error);
    EXPECT_EQ(parse({"-q", "-vv"}).level, LogLevel::Error);
}

TEST_F(LogOptionsTest, EnvironmentFallback) {
    setenv("PYSTRUCT_LOG", "debug", 1);
    EXPECT_EQ(parse({}).level, LogLevel::Debug);

    setenv("PYSTRUCT_LOG", "extract=trace,*=warn", 1);
    EXPECT_EQ(parse({}).filter_spec, "extract=trace,*=warn");

    // Command-line options win over the environment.
    EXPECT_EQ(parse({"-v"}).level, LogLevel::Info);
    EXPECT_TRUE(parse({"-v"}).filter_spec.empty());
}

TEST_F(LogOptionsTest, IsLogOption) {
    EXPECT_TRUE(is_log_option("--log-level=info"));
    EXPECT_TRUE(is_log_option("--log-file=x.log"));
    EXPECT_TRUE(is_log_option("-vvv"));
    EXPECT_TRUE(is_log_option("--quiet"));
    EXPECT_FALSE(is_log_option("-j"));
    EXPECT_FALSE(is_log_option("--log"));
    EXPECT_FALSE(is_log_option("-"));
    EXPECT_FALSE(is_log_option("--filters"));
}
