//! # Logger Unit Tests
//!
//! LogFilter parsing, FileSink I/O, JSON output, level and module filtering,
//! CLI option parsing and thread safety.

#include "log/log.hpp"
#include "test_helpers.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace relpack::log;
namespace fs = std::filesystem;

// ============================================================================
// LogFilter Parsing
// ============================================================================

class LogFilterTest : public ::testing::Test {
protected:
    LogFilter filter;
};

TEST_F(LogFilterTest, ParseModuleAndDefault) {
    filter.parse("merge=debug,*=info");

    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "merge"));
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "merge"));
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "merge"));

    // Unmatched modules use the default
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "build"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "build"));
}

TEST_F(LogFilterTest, ParseModuleOff) {
    filter.parse("icon=off");

    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "icon"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "assemble"));
}

TEST_F(LogFilterTest, ParseBareModuleName) {
    // Bare module name (no =level) sets module to Trace
    filter.parse("tools");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "tools"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "build"));
}

TEST_F(LogFilterTest, ParseMultipleModules) {
    filter.parse("assemble=trace,build=info,verify=warn,*=error");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "assemble"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "build"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "build"));
    EXPECT_TRUE(filter.should_log(LogLevel::Warn, "verify"));
    EXPECT_FALSE(filter.should_log(LogLevel::Info, "verify"));
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "other"));
    EXPECT_FALSE(filter.should_log(LogLevel::Warn, "other"));
}

TEST_F(LogFilterTest, MinLevelAcrossModules) {
    filter.parse("merge=trace,*=warn");
    EXPECT_EQ(filter.min_level(), LogLevel::Trace);
}

TEST_F(LogFilterTest, EmptyFilter) {
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "anything"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "anything"));
}

// ============================================================================
// Capture sink
// ============================================================================

class CaptureSink : public LogSink {
public:
    void write(const LogRecord& record) override {
        std::lock_guard<std::mutex> lock(mutex);
        records.push_back({record.level, std::string(record.module), record.message});
    }
    void flush() override {}

    struct Entry {
        LogLevel level;
        std::string module;
        std::string message;
    };

    std::mutex mutex;
    std::vector<Entry> records;
};

// ============================================================================
// FileSink
// ============================================================================

class FileSinkTest : public ::testing::Test {
protected:
    relpack::testing::TempDir dir{"relpack_log"};
    fs::path temp_file = dir / "relpack.log";

    std::string read(const fs::path& path) {
        std::ifstream f(path);
        return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    }

    LogRecord make_record(LogLevel level, std::string_view module, std::string message) {
        LogRecord record;
        record.level = level;
        record.module = module;
        record.message = std::move(message);
        record.file = __FILE__;
        record.line = __LINE__;
        record.timestamp_ms = 12345;
        return record;
    }
};

TEST_F(FileSinkTest, CreatesAndWritesFile) {
    {
        FileSink sink(temp_file.string(), false);
        ASSERT_TRUE(sink.is_open());
        sink.write(make_record(LogLevel::Info, "build", "building x86_64"));
        sink.flush();
    }

    std::string content = read(temp_file);
    EXPECT_NE(content.find("INFO"), std::string::npos);
    EXPECT_NE(content.find("[build]"), std::string::npos);
    EXPECT_NE(content.find("building x86_64"), std::string::npos);
}

TEST_F(FileSinkTest, AppendsToExistingFile) {
    {
        FileSink sink(temp_file.string(), true);
        sink.write(make_record(LogLevel::Info, "merge", "first"));
    }
    {
        FileSink sink(temp_file.string(), true);
        sink.write(make_record(LogLevel::Warn, "icon", "second"));
    }

    std::string content = read(temp_file);
    EXPECT_NE(content.find("first"), std::string::npos);
    EXPECT_NE(content.find("second"), std::string::npos);
}

TEST_F(FileSinkTest, JsonEscapesSpecialCharacters) {
    {
        FileSink sink(temp_file.string(), false);
        sink.set_format(LogFormat::JSON);
        sink.write(make_record(LogLevel::Error, "assemble",
                               "line1\nline2\ttab\"quote\\backslash"));
        sink.flush();
    }

    std::string content = read(temp_file);
    EXPECT_NE(content.find("{\"ts\":12345"), std::string::npos);
    EXPECT_NE(content.find("\"level\":\"ERROR\""), std::string::npos);
    EXPECT_NE(content.find("\"module\":\"assemble\""), std::string::npos);
    EXPECT_NE(content.find("\\n"), std::string::npos);
    EXPECT_NE(content.find("\\t"), std::string::npos);
    EXPECT_NE(content.find("\\\""), std::string::npos);
    EXPECT_NE(content.find("\\\\"), std::string::npos);
}

// ============================================================================
// Level helpers
// ============================================================================

TEST(LogLevelHelpersTest, ParseLevel) {
    EXPECT_EQ(parse_level("trace"), LogLevel::Trace);
    EXPECT_EQ(parse_level("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parse_level("warn"), LogLevel::Warn);
    EXPECT_EQ(parse_level("off"), LogLevel::Off);
    EXPECT_EQ(parse_level("garbage"), LogLevel::Info);
}

TEST(TimestampTest, GetTimestampFormat) {
    std::string ts = get_timestamp();
    EXPECT_EQ(ts.size(), 12u);
    EXPECT_EQ(ts[2], ':');
    EXPECT_EQ(ts[5], ':');
    EXPECT_EQ(ts[8], '.');
}

// ============================================================================
// CLI option parsing
// ============================================================================

namespace {

LogConfig parse(std::vector<std::string> args) {
    args.insert(args.begin(), "relpack");
    std::vector<char*> argv;
    for (auto& arg : args)
        argv.push_back(arg.data());
    return parse_log_options(static_cast<int>(argv.size()), argv.data());
}

} // namespace

TEST(LogOptionsTest, DefaultsToInfo) {
    EXPECT_EQ(parse({"build", "--log-level=info"}).level, LogLevel::Info);
}

TEST(LogOptionsTest, VerbosityFlags) {
    EXPECT_EQ(parse({"-v"}).level, LogLevel::Debug);
    EXPECT_EQ(parse({"-vv"}).level, LogLevel::Trace);
    EXPECT_EQ(parse({"--quiet"}).level, LogLevel::Warn);
}

TEST(LogOptionsTest, FilterFileAndFormat) {
    auto config = parse({"--log-filter=merge=debug,*=warn", "--log-file=/tmp/relpack.log",
                         "--log-format=json"});
    EXPECT_EQ(config.filter_spec, "merge=debug,*=warn");
    EXPECT_EQ(config.log_file, "/tmp/relpack.log");
    EXPECT_EQ(config.format, LogFormat::JSON);
}

TEST(LogOptionsTest, RecognizesLogOptions) {
    EXPECT_TRUE(is_log_option("--log-level=debug"));
    EXPECT_TRUE(is_log_option("-vvv"));
    EXPECT_TRUE(is_log_option("-q"));
    EXPECT_FALSE(is_log_option("--arch=arm64"));
    EXPECT_FALSE(is_log_option("-h"));
}

// ============================================================================
// Thread safety
// ============================================================================

TEST(LoggerThreadSafetyTest, ConcurrentLogging) {
    auto& logger = Logger::instance();
    auto capture = std::make_unique<CaptureSink>();
    auto* capture_ptr = capture.get();
    logger.set_sink(std::move(capture));
    logger.set_level(LogLevel::Trace);

    const int num_threads = 8;
    const int messages_per_thread = 100;

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; t++) {
        threads.emplace_back([&logger, t]() {
            for (int i = 0; i < messages_per_thread; i++) {
                std::ostringstream oss;
                oss << "arch-" << t << "-msg-" << i;
                logger.log(LogLevel::Info, "build", oss.str(), __FILE__, __LINE__);
            }
        });
    }
    for (auto& thread : threads)
        thread.join();

    EXPECT_EQ(static_cast<int>(capture_ptr->records.size()), num_threads * messages_per_thread);

    logger.set_sink(std::make_unique<NullSink>());
    logger.set_level(LogLevel::Warn);
}

TEST(LoggerMacroTest, MacroRespectsModuleFilter) {
    auto& logger = Logger::instance();
    auto capture = std::make_unique<CaptureSink>();
    auto* capture_ptr = capture.get();
    logger.set_sink(std::move(capture));
    logger.set_filter("merge=debug,*=warn");

    RELPACK_LOG_DEBUG("merge", "fusing " << 2 << " slices");
    RELPACK_LOG_INFO("build", "hidden");
    RELPACK_LOG_WARN("build", "shown");

    ASSERT_EQ(capture_ptr->records.size(), 2u);
    EXPECT_EQ(capture_ptr->records[0].message, "fusing 2 slices");
    EXPECT_EQ(capture_ptr->records[1].module, "build");

    logger.set_sink(std::make_unique<NullSink>());
    logger.set_filter("*=warn");
}
