//! # Logger Unit Tests
//!
//! Tests for the jstub logging system: LogFilter parsing, sink output,
//! level and module filtering, and command-line configuration.

#include "log/log.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace jstub::log;
namespace fs = std::filesystem;

// ============================================================================
// LogFilter Parsing
// ============================================================================

class LogFilterTest : public ::testing::Test {
protected:
    LogFilter filter;
};

TEST_F(LogFilterTest, ParseModuleAndDefault) {
    filter.parse("emitter=debug,*=info");

    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "emitter"));
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "emitter"));
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "emitter"));

    // Unmatched modules use the default
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "walker"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "walker"));
}

TEST_F(LogFilterTest, ParseModuleOff) {
    filter.parse("translator=off");

    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "translator"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "emitter"));
}

TEST_F(LogFilterTest, ParseBareModuleName) {
    filter.parse("scheduler");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "scheduler"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "walker"));
}

TEST_F(LogFilterTest, ParseMultipleModules) {
    filter.parse("emitter=trace,walker=info,reflect=warn,*=error");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "emitter"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "walker"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "walker"));
    EXPECT_TRUE(filter.should_log(LogLevel::Warn, "reflect"));
    EXPECT_FALSE(filter.should_log(LogLevel::Info, "reflect"));
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "other"));
    EXPECT_FALSE(filter.should_log(LogLevel::Warn, "other"));
}

TEST_F(LogFilterTest, MinLevelAcrossModules) {
    filter.parse("emitter=trace,*=warn");
    EXPECT_EQ(filter.min_level(), LogLevel::Trace);
}

TEST_F(LogFilterTest, EmptyFilter) {
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "anything"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "anything"));
}

// ============================================================================
// Helper: Capture sink that stores records in memory
// ============================================================================

class CaptureSink : public LogSink {
public:
    void write(const LogRecord& record) override {
        records.push_back({record.level, std::string(record.module), record.message});
    }
    void flush() override {}

    struct Entry {
        LogLevel level;
        std::string module;
        std::string message;
    };
    std::vector<Entry> records;
};

// ============================================================================
// Record Formatting
// ============================================================================

static auto make_record(LogLevel level, std::string_view module, std::string message)
    -> LogRecord {
    LogRecord record;
    record.level = level;
    record.module = module;
    record.message = std::move(message);
    record.file = __FILE__;
    record.line = __LINE__;
    record.timestamp_ms = 1234567890;
    return record;
}

TEST(FormatRecordTest, TextContainsLevelModuleAndMessage) {
    auto line = format_record(make_record(LogLevel::Warn, "scheduler", "cycle"), LogFormat::Text);
    EXPECT_NE(line.find("WARN"), std::string::npos);
    EXPECT_NE(line.find("[scheduler] cycle"), std::string::npos);
    EXPECT_EQ(line.find('\033'), std::string::npos);
}

TEST(FormatRecordTest, JsonEscapesSpecialCharacters) {
    auto line = format_record(
        make_record(LogLevel::Error, "writer", "line1\nline2\t\"quoted\"\\"), LogFormat::JSON);
    EXPECT_EQ(line,
              "{\"ts\":1234567890,\"level\":\"ERROR\",\"module\":\"writer\","
              "\"msg\":\"line1\\nline2\\t\\\"quoted\\\"\\\\\"}");
}

// ============================================================================
// FileSink
// ============================================================================

class FileSinkTest : public ::testing::Test {
protected:
    fs::path temp_file;

    void SetUp() override {
        temp_file = fs::temp_directory_path() / "jstub_log_test.log";
        if (fs::exists(temp_file)) {
            fs::remove(temp_file);
        }
    }

    void TearDown() override {
        if (fs::exists(temp_file)) {
            fs::remove(temp_file);
        }
    }

    std::string read_file(const fs::path& path) {
        std::ifstream f(path);
        std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        return content;
    }
};

TEST_F(FileSinkTest, CreatesAndWritesFile) {
    {
        FileSink sink(temp_file.string(), false);
        ASSERT_TRUE(sink.is_open());
        sink.write(make_record(LogLevel::Info, "generate", "file sink test"));
        sink.flush();
    }

    std::string content = read_file(temp_file);
    EXPECT_NE(content.find("INFO"), std::string::npos);
    EXPECT_NE(content.find("[generate]"), std::string::npos);
    EXPECT_NE(content.find("file sink test"), std::string::npos);
}

TEST_F(FileSinkTest, AppendsToExistingFile) {
    {
        FileSink sink(temp_file.string(), true);
        sink.write(make_record(LogLevel::Info, "m1", "first"));
    }
    {
        FileSink sink(temp_file.string(), true);
        sink.write(make_record(LogLevel::Warn, "m2", "second"));
    }

    std::string content = read_file(temp_file);
    EXPECT_NE(content.find("first"), std::string::npos);
    EXPECT_NE(content.find("second"), std::string::npos);
}

TEST_F(FileSinkTest, JsonFormatCreatesValidLines) {
    {
        FileSink sink(temp_file.string(), false);
        sink.set_format(LogFormat::JSON);
        sink.write(make_record(LogLevel::Error, "json_test", "error occurred"));
    }

    std::string content = read_file(temp_file);
    EXPECT_NE(content.find("{\"ts\":"), std::string::npos);
    EXPECT_NE(content.find("\"level\":\"ERROR\""), std::string::npos);
    EXPECT_NE(content.find("\"msg\":\"error occurred\""), std::string::npos);
}

// ============================================================================
// Logger
// ============================================================================

TEST(LoggerTest, MacrosRespectModuleFilter) {
    auto& logger = Logger::instance();
    logger.clear_sinks();
    auto capture = std::make_unique<CaptureSink>();
    auto* capture_ptr = capture.get();
    logger.add_sink(std::move(capture));
    logger.set_level(LogLevel::Warn);
    logger.set_filter("emitter=debug,*=warn");

    JSTUB_LOG_DEBUG("emitter", "emitting " << "java.util.List");
    JSTUB_LOG_DEBUG("walker", "hidden");
    JSTUB_LOG_WARN("walker", "skipping " << 3 << " classes");

    ASSERT_EQ(capture_ptr->records.size(), 2u);
    EXPECT_EQ(capture_ptr->records[0].module, "emitter");
    EXPECT_EQ(capture_ptr->records[0].message, "emitting java.util.List");
    EXPECT_EQ(capture_ptr->records[1].level, LogLevel::Warn);
    EXPECT_EQ(capture_ptr->records[1].message, "skipping 3 classes");

    logger.clear_sinks();
    logger.set_filter("*=warn");
    logger.set_level(LogLevel::Warn);
}

// ============================================================================
// Level Helpers
// ============================================================================

TEST(LogLevelHelpersTest, LevelNames) {
    EXPECT_STREQ(level_name(LogLevel::Trace), "TRACE");
    EXPECT_STREQ(level_name(LogLevel::Warn), "WARN");
    EXPECT_STREQ(level_name(LogLevel::Off), "OFF");
}

TEST(LogLevelHelpersTest, ParseLevelCaseInsensitive) {
    EXPECT_EQ(parse_level("trace"), LogLevel::Trace);
    EXPECT_EQ(parse_level("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parse_level("warning"), LogLevel::Warn);
    EXPECT_EQ(parse_level("off"), LogLevel::Off);
}

TEST(LogLevelHelpersTest, ParseUnknownDefaultsToInfo) {
    EXPECT_EQ(parse_level("garbage"), LogLevel::Info);
    EXPECT_EQ(parse_level(""), LogLevel::Info);
}

// ============================================================================
// Command-Line Options
// ============================================================================

TEST(LogOptionsTest, RecognizesLogOptions) {
    EXPECT_TRUE(is_log_option("--log-level=debug"));
    EXPECT_TRUE(is_log_option("--log-filter=emitter=trace"));
    EXPECT_TRUE(is_log_option("-vv"));
    EXPECT_TRUE(is_log_option("-q"));
    EXPECT_FALSE(is_log_option("--output-dir=out"));
    EXPECT_FALSE(is_log_option("-V"));
    EXPECT_FALSE(is_log_option("java"));
}

TEST(LogOptionsTest, VerbosityRaisesLevel) {
    char arg0[] = "jstub";
    char arg1[] = "-vv";
    char arg2[] = "java";
    char* argv[] = {arg0, arg1, arg2};

    auto config = parse_log_options(3, argv);
    EXPECT_EQ(config.level, LogLevel::Trace);
}

TEST(LogOptionsTest, ExplicitOptions) {
    char arg0[] = "jstub";
    char arg1[] = "--log-level=warn";
    char arg2[] = "--log-format=json";
    char arg3[] = "--log-filter=emitter=debug";
    char* argv[] = {arg0, arg1, arg2, arg3};

    auto config = parse_log_options(4, argv);
    EXPECT_EQ(config.level, LogLevel::Warn);
    EXPECT_EQ(config.format, LogFormat::JSON);
    EXPECT_EQ(config.filter_spec, "emitter=debug");
}
