//! # Logger Unit Tests
//!
//! LogFilter parsing, sink formatting, command-line configuration, macro
//! dispatch and thread safety of the irkit logging system.

#include "log/log.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace irkit::log;
namespace fs = std::filesystem;

// ============================================================================
// LogFilter Parsing
// ============================================================================

class LogFilterTest : public ::testing::Test {
protected:
    LogFilter filter;
};

TEST_F(LogFilterTest, ParseModuleAndDefault) {
    filter.parse("rewrite=debug,*=info");

    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "rewrite"));
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "rewrite"));
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "rewrite"));

    // Unmatched modules use the default
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "imm"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "imm"));
}

TEST_F(LogFilterTest, ParseModuleOff) {
    filter.parse("match=off");

    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "match"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "rewrite"));
}

TEST_F(LogFilterTest, BareModuleNameEnablesTrace) {
    filter.parse("imm");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "imm"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "ir"));
}

TEST_F(LogFilterTest, ParseMultipleModules) {
    filter.parse("rewrite=trace,imm=info,match=warn,*=error");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "rewrite"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "imm"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "imm"));
    EXPECT_TRUE(filter.should_log(LogLevel::Warn, "match"));
    EXPECT_FALSE(filter.should_log(LogLevel::Info, "match"));
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "registry"));
    EXPECT_FALSE(filter.should_log(LogLevel::Warn, "registry"));
}

TEST_F(LogFilterTest, MinLevelAcrossModules) {
    filter.parse("fold=trace,*=warn");
    EXPECT_EQ(filter.min_level(), LogLevel::Trace);
}

TEST_F(LogFilterTest, EmptyFilter) {
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "anything"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "anything"));
}

TEST(LogLevelTest, ParseLevelNames) {
    EXPECT_EQ(parse_level("trace"), LogLevel::Trace);
    EXPECT_EQ(parse_level("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parse_level("warn"), LogLevel::Warn);
    EXPECT_EQ(parse_level("off"), LogLevel::Off);
    EXPECT_EQ(parse_level("chatty"), LogLevel::Info);
    EXPECT_STREQ(level_name(LogLevel::Error), "ERROR");
}

// ============================================================================
// Capture sink
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
// Formatting
// ============================================================================

TEST(FormatRecordTest, TextContainsLevelModuleAndMessage) {
    LogRecord record{LogLevel::Warn, "rewrite", "pattern failed", __FILE__, __LINE__, epoch_ms()};
    std::string line = format_record(record, LogFormat::Text);

    EXPECT_NE(line.find("WARN"), std::string::npos);
    EXPECT_NE(line.find("[rewrite]"), std::string::npos);
    EXPECT_NE(line.find("pattern failed"), std::string::npos);
}

TEST(FormatRecordTest, JsonEscapesSpecialCharacters) {
    LogRecord record{LogLevel::Info, "imm", "a\"b\\c\nd", __FILE__, __LINE__, 42};
    std::string line = format_record(record, LogFormat::JSON);

    EXPECT_EQ(line, "{\"ts\":42,\"level\":\"INFO\",\"module\":\"imm\",\"msg\":\"a\\\"b\\\\c\\nd\"}");
}

// ============================================================================
// FileSink
// ============================================================================

class FileSinkTest : public ::testing::Test {
protected:
    fs::path temp_file;

    void SetUp() override {
        temp_file = fs::temp_directory_path() / "irkit_log_test.log";
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
        return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    }
};

TEST_F(FileSinkTest, CreatesAndAppends) {
    for (const char* message : {"first", "second"}) {
        FileSink sink(temp_file.string(), true);
        ASSERT_TRUE(sink.is_open());
        sink.write({LogLevel::Info, "registry", message, __FILE__, __LINE__, epoch_ms()});
        sink.flush();
    }

    std::string content = read_file(temp_file);
    EXPECT_NE(content.find("[registry] first"), std::string::npos);
    EXPECT_NE(content.find("[registry] second"), std::string::npos);
}

TEST_F(FileSinkTest, JsonFormat) {
    {
        FileSink sink(temp_file.string(), false);
        sink.set_format(LogFormat::JSON);
        ASSERT_TRUE(sink.is_open());
        sink.write({LogLevel::Error, "fold", "bad predicate", __FILE__, __LINE__, 9999});
    }

    std::string content = read_file(temp_file);
    EXPECT_NE(content.find("\"level\":\"ERROR\""), std::string::npos);
    EXPECT_NE(content.find("\"module\":\"fold\""), std::string::npos);
    EXPECT_NE(content.find("\"msg\":\"bad predicate\""), std::string::npos);
}

TEST_F(FileSinkTest, InitRoutesToConfiguredFile) {
    LogConfig config;
    config.level = LogLevel::Debug;
    config.console = false;
    config.log_file = temp_file.string();
    Logger::init(config);

    IRKIT_LOG_DEBUG("ir", "walked " << 3 << " ops");
    IRKIT_LOG_TRACE("ir", "too chatty");
    Logger::instance().flush();
    Logger::instance().reset();

    std::string content = read_file(temp_file);
    EXPECT_NE(content.find("[ir] walked 3 ops"), std::string::npos);
    EXPECT_EQ(content.find("too chatty"), std::string::npos);
}

TEST(MultiSinkTest, FansOutToEveryChild) {
    MultiSink multi;
    auto first = std::make_unique<CaptureSink>();
    auto second = std::make_unique<CaptureSink>();
    auto* first_ptr = first.get();
    auto* second_ptr = second.get();
    multi.add(std::move(first));
    multi.add(std::move(second));
    multi.add(std::make_unique<NullSink>());

    multi.write({LogLevel::Debug, "ir", "hello", __FILE__, __LINE__, 0});

    EXPECT_EQ(multi.size(), 3u);
    ASSERT_EQ(first_ptr->records.size(), 1u);
    ASSERT_EQ(second_ptr->records.size(), 1u);
    EXPECT_EQ(first_ptr->records[0].message, "hello");
}

// ============================================================================
// Logger and macros
// ============================================================================

class LoggerTest : public ::testing::Test {
protected:
    CaptureSink* capture = nullptr;

    void SetUp() override {
        auto& logger = Logger::instance();
        logger.reset();
        auto sink = std::make_unique<CaptureSink>();
        capture = sink.get();
        logger.add_sink(std::move(sink));
    }

    void TearDown() override {
        Logger::instance().reset();
    }
};

TEST_F(LoggerTest, MacroRespectsLevel) {
    Logger::instance().set_level(LogLevel::Info);

    IRKIT_LOG_DEBUG("rewrite", "hidden " << 1);
    IRKIT_LOG_INFO("rewrite", "shown " << 2);

    ASSERT_EQ(capture->records.size(), 1u);
    EXPECT_EQ(capture->records[0].level, LogLevel::Info);
    EXPECT_EQ(capture->records[0].module, "rewrite");
    EXPECT_EQ(capture->records[0].message, "shown 2");
}

TEST_F(LoggerTest, MacroRespectsModuleFilter) {
    Logger::instance().set_filter("imm=trace,*=error");

    IRKIT_LOG_TRACE("imm", "kept");
    IRKIT_LOG_WARN("match", "dropped");
    IRKIT_LOG_ERROR("match", "kept too");

    ASSERT_EQ(capture->records.size(), 2u);
    EXPECT_EQ(capture->records[0].message, "kept");
    EXPECT_EQ(capture->records[1].message, "kept too");
}

TEST_F(LoggerTest, ConcurrentLogging) {
    auto& logger = Logger::instance();
    logger.set_level(LogLevel::Trace);

    const int num_threads = 8;
    const int messages_per_thread = 100;

    std::vector<std::thread> threads;
    threads.reserve(num_threads);
    for (int t = 0; t < num_threads; t++) {
        threads.emplace_back([&logger, t]() {
            for (int i = 0; i < messages_per_thread; i++) {
                std::ostringstream oss;
                oss << "thread-" << t << "-msg-" << i;
                logger.log(LogLevel::Info, "test", oss.str(), __FILE__, __LINE__);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(static_cast<int>(capture->records.size()), num_threads * messages_per_thread);
}

// ============================================================================
// Command-line options
// ============================================================================

class LogOptionsTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("IRKIT_LOG");
    }

    void TearDown() override {
        unsetenv("IRKIT_LOG");
    }

    LogConfig parse(std::vector<std::string> args) {
        args.insert(args.begin(), "irkit");
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        return parse_log_options(static_cast<int>(argv.size()), argv.data());
    }
};

TEST_F(LogOptionsTest, ExplicitFlags) {
    auto config = parse({"--log-level=debug", "--log-filter=rewrite=trace", "--log-format=json",
                         "--log-file=irkit.log"});

    EXPECT_EQ(config.level, LogLevel::Debug);
    EXPECT_EQ(config.filter_spec, "rewrite=trace");
    EXPECT_EQ(config.format, LogFormat::JSON);
    EXPECT_EQ(config.log_file, "irkit.log");
}

TEST_F(LogOptionsTest, VerbosityFlags) {
    EXPECT_EQ(parse({"-v"}).level, LogLevel::Info);
    EXPECT_EQ(parse({"-vv"}).level, LogLevel::Debug);
    EXPECT_EQ(parse({"-vvv"}).level, LogLevel::Trace);
    EXPECT_EQ(parse({"-q"}).level, LogLevel::Error);
    EXPECT_EQ(parse({"--log-level=warn", "-vvv"}).level, LogLevel::Warn);
}

TEST_F(LogOptionsTest, EnvironmentFallback) {
    setenv("IRKIT_LOG", "debug", 1);
    EXPECT_EQ(parse({}).level, LogLevel::Debug);

    setenv("IRKIT_LOG", "imm=trace,*=warn", 1);
    EXPECT_EQ(parse({}).filter_spec, "imm=trace,*=warn");

    // Command-line level wins over the environment
    EXPECT_EQ(parse({"--log-level=error"}).level, LogLevel::Error);
}
