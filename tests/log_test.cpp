//! # Logger Unit Tests
//!
//! LogFilter parsing, record formatting, FileSink I/O, MultiSink fan-out,
//! the logging macros and command-line log options.

#include "log/log.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace elmtest::log;
namespace fs = std::filesystem;

namespace {

LogRecord make_record(LogLevel level, std::string_view module, std::string message) {
    LogRecord record;
    record.level = level;
    record.module = module;
    record.message = std::move(message);
    record.file = __FILE__;
    record.line = __LINE__;
    record.timestamp_ms = 1700000000000;
    return record;
}

/// Builds a mutable argv from string literals.
class Args {
public:
    Args(std::initializer_list<std::string> args) : storage_(args) {
        for (auto& s : storage_) {
            pointers_.push_back(s.data());
        }
    }

    int argc() const {
        return static_cast<int>(pointers_.size());
    }
    char** argv() {
        return pointers_.data();
    }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
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
    filter.parse("check=debug,*=warn");

    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "check"));
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "check"));
    EXPECT_TRUE(filter.should_log(LogLevel::Warn, "config"));
    EXPECT_FALSE(filter.should_log(LogLevel::Info, "config"));
}

TEST_F(LogFilterTest, BareModuleNameEnablesTrace) {
    filter.parse("discovery");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "discovery"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "check"));
}

TEST_F(LogFilterTest, ModuleOff) {
    filter.parse("config=off");

    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "config"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "check"));
}

TEST_F(LogFilterTest, MinLevelIsLowestConfigured) {
    filter.parse("discovery=trace,*=error");
    EXPECT_EQ(filter.min_level(), LogLevel::Trace);

    LogFilter plain;
    plain.set_default_level(LogLevel::Error);
    EXPECT_EQ(plain.min_level(), LogLevel::Error);
}

// ============================================================================
// Level Helpers
// ============================================================================

TEST(LogLevelHelpersTest, Names) {
    EXPECT_STREQ(level_name(LogLevel::Trace), "TRACE");
    EXPECT_STREQ(level_name(LogLevel::Warn), "WARN");
    EXPECT_STREQ(level_name(LogLevel::Off), "OFF");
}

TEST(LogLevelHelpersTest, ParseLevel) {
    EXPECT_EQ(parse_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_level("ERROR"), LogLevel::Error);
    EXPECT_EQ(parse_level("off"), LogLevel::Off);
    EXPECT_EQ(parse_level("Warning"), LogLevel::Warn);
    EXPECT_EQ(parse_level("verbose"), LogLevel::Info);
}

// ============================================================================
// Formatting
// ============================================================================

TEST(LogFormatTest, TextContainsLevelModuleAndMessage) {
    auto line = format_text(make_record(LogLevel::Warn, "config", "unknown key 'colour'"));
    EXPECT_NE(line.find("WARN"), std::string::npos);
    EXPECT_NE(line.find("[config]"), std::string::npos);
    EXPECT_NE(line.find("unknown key 'colour'"), std::string::npos);
}

TEST(LogFormatTest, JsonFields) {
    auto line = format_json(make_record(LogLevel::Error, "check", "cannot open Foo.elm"));
    EXPECT_EQ(line, "{\"ts\":1700000000000,\"level\":\"ERROR\",\"module\":\"check\","
                    "\"msg\":\"cannot open Foo.elm\"}");
}

TEST(LogFormatTest, JsonEscapesSpecialCharacters) {
    auto line = format_json(make_record(LogLevel::Info, "check", "a\"b\\c\nd\te"));
    EXPECT_NE(line.find("a\\\"b\\\\c\\nd\\te"), std::string::npos);
}

// ============================================================================
// FileSink
// ============================================================================

class FileSinkTest : public ::testing::Test {
protected:
    fs::path temp_file;

    void SetUp() override {
        temp_file = fs::temp_directory_path() /
                    (std::string("elmtest_log_test_") +
                     ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".log");
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

TEST_F(FileSinkTest, WritesTextLines) {
    {
        FileSink sink(temp_file.string(), false);
        ASSERT_TRUE(sink.is_open());
        sink.write(make_record(LogLevel::Info, "discovery", "Found 3 Elm files"));
        sink.flush();
    }

    std::string content = read_file(temp_file);
    EXPECT_NE(content.find("INFO"), std::string::npos);
    EXPECT_NE(content.find("[discovery] Found 3 Elm files"), std::string::npos);
}

TEST_F(FileSinkTest, AppendMode) {
    {
        FileSink sink(temp_file.string(), true);
        sink.write(make_record(LogLevel::Info, "check", "first"));
    }
    {
        FileSink sink(temp_file.string(), true);
        sink.set_format(LogFormat::JSON);
        sink.write(make_record(LogLevel::Warn, "check", "second"));
    }

    std::string content = read_file(temp_file);
    EXPECT_NE(content.find("first"), std::string::npos);
    EXPECT_NE(content.find("\"msg\":\"second\""), std::string::npos);
}

// ============================================================================
// MultiSink
// ============================================================================

class CaptureSink : public LogSink {
public:
    struct Entry {
        LogLevel level;
        std::string module;
        std::string message;
    };

    explicit CaptureSink(std::vector<Entry>* out) : out_(out) {}

    void write(const LogRecord& record) override {
        out_->push_back({record.level, std::string(record.module), record.message});
    }
    void flush() override {}

private:
    std::vector<Entry>* out_;
};

TEST(MultiSinkTest, FansOutToAllChildren) {
    std::vector<CaptureSink::Entry> first;
    std::vector<CaptureSink::Entry> second;

    MultiSink multi;
    multi.add(std::make_unique<CaptureSink>(&first));
    multi.add(std::make_unique<CaptureSink>(&second));
    multi.add(std::make_unique<NullSink>());
    EXPECT_EQ(multi.size(), 3u);

    multi.write(make_record(LogLevel::Info, "check", "fan-out"));
    multi.flush();

    ASSERT_EQ(first.size(), 1u);
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(first[0].message, "fan-out");
    EXPECT_EQ(second[0].module, "check");
}

// ============================================================================
// Logger and Macros
// ============================================================================

TEST(LoggerTest, DefaultLevelIsWarn) {
    auto& logger = Logger::instance();
    EXPECT_EQ(logger.level(), LogLevel::Warn);
    EXPECT_FALSE(logger.should_log(LogLevel::Info, "check"));
    EXPECT_TRUE(logger.should_log(LogLevel::Warn, "check"));
}

TEST(LoggerTest, MacrosRespectLevelAndFilter) {
    std::vector<CaptureSink::Entry> captured;

    LogConfig config;
    config.console = false;
    config.level = LogLevel::Warn;
    config.filter_spec = "discovery=debug,*=warn";
    Logger::init(config);
    Logger::instance().add_sink(std::make_unique<CaptureSink>(&captured));

    ELMTEST_LOG_DEBUG("discovery", "candidate " << "suite");
    ELMTEST_LOG_DEBUG("check", "hidden");
    ELMTEST_LOG_INFO("config", "hidden");
    ELMTEST_LOG_WARN("config", "unknown key '" << "colour" << "'");
    Logger::init(LogConfig{});

    ASSERT_EQ(captured.size(), 2u);
    EXPECT_EQ(captured[0].module, "discovery");
    EXPECT_EQ(captured[0].message, "candidate suite");
    EXPECT_EQ(captured[1].level, LogLevel::Warn);
    EXPECT_EQ(captured[1].message, "unknown key 'colour'");
}

// ============================================================================
// Command-Line Options
// ============================================================================

TEST(LogOptionsTest, VerbosityFlags) {
    Args args{"elmtest", "check", "-vv"};
    auto config = parse_log_options(args.argc(), args.argv());
    EXPECT_EQ(config.level, LogLevel::Debug);

    Args trace{"elmtest", "-vvv", "check"};
    EXPECT_EQ(parse_log_options(trace.argc(), trace.argv()).level, LogLevel::Trace);
}

TEST(LogOptionsTest, ExplicitLevelWinsOverVerbosity) {
    Args args{"elmtest", "check", "-v", "--log-level=error"};
    EXPECT_EQ(parse_log_options(args.argc(), args.argv()).level, LogLevel::Error);
}

TEST(LogOptionsTest, QuietAndFileAndFormat) {
    Args args{"elmtest", "check", "-q", "--log-file=check.log", "--log-format=json"};
    auto config = parse_log_options(args.argc(), args.argv());
    EXPECT_EQ(config.level, LogLevel::Error);
    EXPECT_EQ(config.log_file, "check.log");
    EXPECT_EQ(config.format, LogFormat::JSON);
}

TEST(LogOptionsTest, FilterSpec) {
    Args args{"elmtest", "check", "--log-filter=check=debug,*=warn"};
    EXPECT_EQ(parse_log_options(args.argc(), args.argv()).filter_spec, "check=debug,*=warn");
}

TEST(LogOptionsTest, RecognizesLogOptions) {
    EXPECT_TRUE(is_log_option("--log-level=debug"));
    EXPECT_TRUE(is_log_option("-vvv"));
    EXPECT_TRUE(is_log_option("--quiet"));
    EXPECT_FALSE(is_log_option("--strict"));
    EXPECT_FALSE(is_log_option("-j4"));
    EXPECT_FALSE(is_log_option("-"));
}
