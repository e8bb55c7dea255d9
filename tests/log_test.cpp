//! # Logger Unit Tests
//!
//! LogFilter parsing, record formatting, thread context labels, FileSink
//! I/O, command-line log options and thread safety of the Logger singleton.

#include "log/log.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

using namespace semdiff::log;
namespace fs = std::filesystem;

namespace {

auto make_record(LogLevel level, std::string_view module, std::string message,
                 std::string context = {}) -> LogRecord {
    return LogRecord{.level = level,
                     .module = module,
                     .message = std::move(message),
                     .context = std::move(context),
                     .file = __FILE__,
                     .line = __LINE__,
                     .timestamp_ms = 1700000000123};
}

/// Stores records in memory.
class CaptureSink : public LogSink {
public:
    void write(const LogRecord& record) override {
        std::lock_guard<std::mutex> lock(mutex);
        records.push_back(
            {record.level, std::string(record.module), record.message, record.context});
    }
    void flush() override {}

    struct Entry {
        LogLevel level;
        std::string module;
        std::string message;
        std::string context;
    };

    std::mutex mutex;
    std::vector<Entry> records;
};

} // namespace

// ============================================================================
// LogFilter
// ============================================================================

class LogFilterTest : public ::testing::Test {
protected:
    LogFilter filter;
};

TEST_F(LogFilterTest, ModuleLevelAndDefault) {
    filter.parse("extract=debug,*=warn");

    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "extract"));
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "extract"));

    EXPECT_TRUE(filter.should_log(LogLevel::Warn, "vcs"));
    EXPECT_FALSE(filter.should_log(LogLevel::Info, "vcs"));
}

TEST_F(LogFilterTest, BareModuleEnablesTrace) {
    filter.parse("snapshot");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "snapshot"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "diff"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "diff"));
}

TEST_F(LogFilterTest, OffSilencesModule) {
    filter.parse("parser=off");

    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "parser"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "lexer"));
}

TEST_F(LogFilterTest, MinLevelIsLowestConfigured) {
    filter.parse("granular=trace,*=error");
    EXPECT_EQ(filter.min_level(), LogLevel::Trace);

    LogFilter plain;
    plain.set_default_level(LogLevel::Error);
    EXPECT_EQ(plain.min_level(), LogLevel::Error);
}

TEST_F(LogFilterTest, DefaultIsInfo) {
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "anything"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "anything"));
}

TEST_F(LogFilterTest, UnknownLevelEntryIsIgnored) {
    filter.parse("extract=loud,vcs=debug");

    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "extract"));
    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "vcs"));
}

TEST(LogLevelTest, ParseLevelNames) {
    EXPECT_TRUE(parse_level("trace") == LogLevel::Trace);
    EXPECT_TRUE(parse_level("DEBUG") == LogLevel::Debug);
    EXPECT_TRUE(parse_level("Warning") == LogLevel::Warn);
    EXPECT_TRUE(parse_level("off") == LogLevel::Off);
    EXPECT_FALSE(parse_level("nonsense").has_value());
    EXPECT_FALSE(parse_level("").has_value());
}

TEST(LogLevelTest, LevelNames) {
    EXPECT_EQ(level_name(LogLevel::Warn), "WARN");
    EXPECT_EQ(level_name(LogLevel::Fatal), "FATAL");
}

// ============================================================================
// Formatting
// ============================================================================

TEST(LogFormatTest, TextContainsLevelModuleAndMessage) {
    auto line = format_record(make_record(LogLevel::Warn, "extract", "bad file"), LogFormat::Text,
                              false);
    EXPECT_NE(line.find("WARN"), std::string::npos);
    EXPECT_NE(line.find("[extract]"), std::string::npos);
    EXPECT_NE(line.find("bad file"), std::string::npos);
    EXPECT_EQ(line.find("\033["), std::string::npos);
    EXPECT_EQ(line.back(), '\n');
}

TEST(LogFormatTest, JsonLineIsEscaped) {
    auto line = format_record(
        make_record(LogLevel::Error, "report", "line1\nline2\t\"quoted\"\\"), LogFormat::JSON,
        false);
    EXPECT_EQ(line.rfind("{\"ts\":1700000000123,", 0), 0u);
    EXPECT_NE(line.find("\"level\":\"ERROR\""), std::string::npos);
    EXPECT_NE(line.find("\"module\":\"report\""), std::string::npos);
    EXPECT_NE(line.find("line1\\nline2\\t\\\"quoted\\\"\\\\"), std::string::npos);
    EXPECT_EQ(line.find("\"ctx\""), std::string::npos);
}

TEST(LogFormatTest, ContextFollowsModule) {
    auto text = format_record(make_record(LogLevel::Info, "extract", "3 entities", "base"),
                              LogFormat::Text, false);
    EXPECT_NE(text.find("[extract] (base) 3 entities"), std::string::npos);

    auto json = format_record(make_record(LogLevel::Info, "extract", "3 entities", "target"),
                              LogFormat::JSON, false);
    EXPECT_NE(json.find("\"ctx\":\"target\",\"msg\""), std::string::npos);
}

TEST(LogFormatTest, MillisecondsArePadded) {
    auto line = format_record(make_record(LogLevel::Info, "cli", "done"), LogFormat::Text, false);
    EXPECT_EQ(line.substr(8, 4), ".123");
}

// ============================================================================
// FileSink
// ============================================================================

class FileSinkTest : public ::testing::Test {
protected:
    fs::path temp_file;

    void SetUp() override {
        temp_file = fs::temp_directory_path() / "semdiff_log_test.log";
        fs::remove(temp_file);
    }

    void TearDown() override {
        fs::remove(temp_file);
    }

    std::string read_file() {
        std::ifstream f(temp_file);
        return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    }
};

TEST_F(FileSinkTest, WritesTextRecords) {
    {
        FileSink sink(temp_file.string(), false);
        ASSERT_TRUE(sink.is_open());
        sink.write(make_record(LogLevel::Info, "snapshot", "42 entities"));
    }

    std::string content = read_file();
    EXPECT_NE(content.find("INFO"), std::string::npos);
    EXPECT_NE(content.find("[snapshot] 42 entities"), std::string::npos);
}

TEST_F(FileSinkTest, AppendKeepsEarlierRecords) {
    {
        FileSink sink(temp_file.string(), true);
        sink.write(make_record(LogLevel::Info, "vcs", "first"));
    }
    {
        FileSink sink(temp_file.string(), true);
        sink.write(make_record(LogLevel::Warn, "vcs", "second"));
    }

    std::string content = read_file();
    EXPECT_NE(content.find("first"), std::string::npos);
    EXPECT_NE(content.find("second"), std::string::npos);
}

TEST_F(FileSinkTest, JsonFormat) {
    {
        FileSink sink(temp_file.string(), false);
        sink.set_format(LogFormat::JSON);
        sink.write(make_record(LogLevel::Error, "cli", "failed"));
    }

    std::string content = read_file();
    EXPECT_NE(content.find("\"msg\":\"failed\""), std::string::npos);
}

// ============================================================================
// Command-line options
// ============================================================================

TEST(LogOptionsTest, VerbosityFlags) {
    char prog[] = "semdiff";
    char vv[] = "-vv";
    char* argv[] = {prog, vv};
    auto config = parse_log_options(2, argv);
    EXPECT_EQ(config.level, LogLevel::Debug);
}

TEST(LogOptionsTest, ExplicitLevelWinsOverVerbosity) {
    char prog[] = "semdiff";
    char level[] = "--log-level=error";
    char v[] = "-vvv";
    char* argv[] = {prog, level, v};
    auto config = parse_log_options(3, argv);
    EXPECT_EQ(config.level, LogLevel::Error);
}

TEST(LogOptionsTest, FilterFileAndFormat) {
    char prog[] = "semdiff";
    char filter[] = "--log-filter=extract=trace,*=warn";
    char file[] = "--log-file=run.log";
    char format[] = "--log-format=json";
    char* argv[] = {prog, filter, file, format};
    auto config = parse_log_options(4, argv);
    EXPECT_EQ(config.filter_spec, "extract=trace,*=warn");
    EXPECT_EQ(config.log_file, "run.log");
    EXPECT_EQ(config.format, LogFormat::JSON);
}

TEST(LogOptionsTest, RecognizesLogArguments) {
    EXPECT_TRUE(is_log_option("-v"));
    EXPECT_TRUE(is_log_option("-vvv"));
    EXPECT_TRUE(is_log_option("-q"));
    EXPECT_TRUE(is_log_option("--log-level=debug"));
    EXPECT_FALSE(is_log_option("--threads=4"));
    EXPECT_FALSE(is_log_option("-V"));
    EXPECT_FALSE(is_log_option("--base-dir=a"));
}

// ============================================================================
// Logger
// ============================================================================

TEST(LoggerTest, ConcurrentLoggingKeepsEveryRecord) {
    auto& logger = Logger::instance();
    logger.clear_sinks();
    auto capture = std::make_unique<CaptureSink>();
    auto* captured = capture.get();
    logger.add_sink(std::move(capture));
    logger.set_level(LogLevel::Trace);

    constexpr int num_threads = 8;
    constexpr int per_thread = 100;
    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&logger, t] {
            for (int i = 0; i < per_thread; ++i) {
                logger.log(LogLevel::Info, "snapshot",
                           "worker " + std::to_string(t) + " file " + std::to_string(i), __FILE__,
                           __LINE__);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(captured->records.size(), static_cast<size_t>(num_threads * per_thread));

    logger.clear_sinks();
    logger.set_level(LogLevel::Warn);
}

TEST(LoggerTest, ContextIsPerThreadAndNested) {
    auto& logger = Logger::instance();
    logger.clear_sinks();
    auto capture = std::make_unique<CaptureSink>();
    auto* captured = capture.get();
    logger.add_sink(std::move(capture));
    logger.set_level(LogLevel::Info);

    {
        ScopedContext outer("base");
        SEMDIFF_LOG_INFO("snapshot", "outer");
        {
            ScopedContext inner("target");
            SEMDIFF_LOG_INFO("snapshot", "inner");
        }
        std::thread other([] { SEMDIFF_LOG_INFO("snapshot", "other thread"); });
        other.join();
        SEMDIFF_LOG_INFO("snapshot", "restored");
    }
    SEMDIFF_LOG_INFO("snapshot", "none");

    ASSERT_EQ(captured->records.size(), 5u);
    EXPECT_EQ(captured->records[0].context, "base");
    EXPECT_EQ(captured->records[1].context, "target");
    EXPECT_EQ(captured->records[2].context, "");
    EXPECT_EQ(captured->records[3].context, "base");
    EXPECT_EQ(captured->records[4].context, "");
    EXPECT_TRUE(current_context().empty());

    logger.clear_sinks();
    logger.set_level(LogLevel::Warn);
}

TEST(LoggerTest, MacroRespectsModuleFilter) {
    auto& logger = Logger::instance();
    logger.clear_sinks();
    auto capture = std::make_unique<CaptureSink>();
    auto* captured = capture.get();
    logger.add_sink(std::move(capture));
    logger.set_level(LogLevel::Warn);
    logger.set_filter("diff=debug,*=warn");

    SEMDIFF_LOG_DEBUG("diff", "kept " << 1);
    SEMDIFF_LOG_DEBUG("vcs", "dropped " << 2);
    SEMDIFF_LOG_WARN("vcs", "kept " << 3);

    ASSERT_EQ(captured->records.size(), 2u);
    EXPECT_EQ(captured->records[0].module, "diff");
    EXPECT_EQ(captured->records[0].message, "kept 1");
    EXPECT_EQ(captured->records[1].message, "kept 3");

    logger.clear_sinks();
    logger.set_filter("*=warn");
    logger.set_level(LogLevel::Warn);
}
