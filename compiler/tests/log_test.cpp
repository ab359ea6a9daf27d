//! # Logger Unit Tests
//!
//! LogFilter parsing, record formatting, FileSink I/O, command-line and
//! environment configuration, the logging macros and thread safety.

#include "log/log.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

using namespace wolf::log;
namespace fs = std::filesystem;

namespace {

/// Stores records in memory.
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

auto make_record(LogLevel level, std::string_view module, std::string message) -> LogRecord {
    return LogRecord{.level = level,
                     .module = module,
                     .message = std::move(message),
                     .file = __FILE__,
                     .line = __LINE__,
                     .timestamp_ms = 1700000000000};
}

/// Builds an argv array from string literals.
class Args {
public:
    Args(std::initializer_list<const char*> args) {
        storage_.emplace_back("wolf");
        for (const char* a : args) {
            storage_.emplace_back(a);
        }
        for (auto& s : storage_) {
            argv_.push_back(s.data());
        }
        argv_.push_back(nullptr);
    }

    auto argc() const -> int {
        return static_cast<int>(storage_.size());
    }
    auto argv() -> char** {
        return argv_.data();
    }

private:
    std::vector<std::string> storage_;
    std::vector<char*> argv_;
};

} // namespace

// ============================================================================
// LogFilter Parsing
// ============================================================================

class LogFilterTest : public ::testing::Test {
protected:
    LogFilter filter;
};

TEST_F(LogFilterTest, ModuleAndDefault) {
    filter.parse("codegen=debug,*=info");

    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "codegen"));
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "codegen"));
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "codegen"));

    EXPECT_TRUE(filter.should_log(LogLevel::Info, "driver"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "driver"));
}

TEST_F(LogFilterTest, BareModuleNameEnablesTrace) {
    filter.parse("parser");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "parser"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "lexer"));
}

TEST_F(LogFilterTest, ModuleOff) {
    filter.parse("linker=off");

    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "linker"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "codegen"));
}

TEST_F(LogFilterTest, MultipleModules) {
    filter.parse("lexer=trace,ir=info,linker=warn,*=error");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "lexer"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "ir"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "ir"));
    EXPECT_TRUE(filter.should_log(LogLevel::Warn, "linker"));
    EXPECT_FALSE(filter.should_log(LogLevel::Info, "linker"));
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "other"));
    EXPECT_FALSE(filter.should_log(LogLevel::Warn, "other"));
}

TEST_F(LogFilterTest, MinLevel) {
    filter.parse("codegen=trace,*=warn");
    EXPECT_EQ(filter.min_level(), LogLevel::Trace);

    LogFilter plain;
    plain.set_default_level(LogLevel::Error);
    EXPECT_EQ(plain.min_level(), LogLevel::Error);
}

TEST(LogLevelTest, ParseAndName) {
    EXPECT_EQ(parse_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_level("WARN"), LogLevel::Warn);
    EXPECT_EQ(parse_level("off"), LogLevel::Off);
    EXPECT_EQ(parse_level("nonsense"), LogLevel::Info);
    EXPECT_STREQ(level_name(LogLevel::Trace), "TRACE");
    EXPECT_STREQ(level_name(LogLevel::Fatal), "FATAL");
}

// ============================================================================
// Formatting
// ============================================================================

TEST(LogFormatTest, TextLine) {
    auto text = format_text(make_record(LogLevel::Info, "driver", "Compiling prog.wolf"));
    EXPECT_NE(text.find("INFO  [driver] Compiling prog.wolf\n"), std::string::npos) << text;
    EXPECT_EQ(text.find("\033["), std::string::npos);
}

TEST(LogFormatTest, TextLineWithColor) {
    auto text = format_text(make_record(LogLevel::Error, "linker", "failed"), "\033[31m");
    EXPECT_NE(text.find("\033[31mERROR\033[0m"), std::string::npos) << text;
}

TEST(LogFormatTest, JsonEscapes) {
    auto json = format_json(make_record(LogLevel::Warn, "parser", "a\"b\\c\nd\te"));
    EXPECT_EQ(json, "{\"ts\":1700000000000,\"level\":\"WARN\",\"module\":\"parser\","
                    "\"msg\":\"a\\\"b\\\\c\\nd\\te\"}\n");
}

// ============================================================================
// FileSink
// ============================================================================

class FileSinkTest : public ::testing::Test {
protected:
    fs::path temp_file;

    void SetUp() override {
        temp_file = fs::temp_directory_path() /
                    ("wolf_log_test_" +
                     std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()) +
                     ".log");
        std::error_code ec;
        fs::remove(temp_file, ec);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove(temp_file, ec);
    }

    static auto read_file(const fs::path& path) -> std::string {
        std::ifstream f(path);
        return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    }
};

TEST_F(FileSinkTest, CreatesAndWrites) {
    {
        FileSink sink(temp_file.string(), false);
        ASSERT_TRUE(sink.is_open());
        sink.write(make_record(LogLevel::Info, "ir", "Lowered 'main'"));
    }

    auto content = read_file(temp_file);
    EXPECT_NE(content.find("INFO"), std::string::npos);
    EXPECT_NE(content.find("[ir] Lowered 'main'"), std::string::npos);
}

TEST_F(FileSinkTest, Appends) {
    {
        FileSink sink(temp_file.string(), true);
        sink.write(make_record(LogLevel::Info, "a", "first"));
    }
    {
        FileSink sink(temp_file.string(), true);
        sink.write(make_record(LogLevel::Warn, "b", "second"));
    }

    auto content = read_file(temp_file);
    EXPECT_NE(content.find("first"), std::string::npos);
    EXPECT_NE(content.find("second"), std::string::npos);
}

TEST_F(FileSinkTest, JsonLines) {
    {
        FileSink sink(temp_file.string(), false);
        sink.set_format(LogFormat::JSON);
        sink.write(make_record(LogLevel::Error, "codegen", "emission failed"));
    }

    auto content = read_file(temp_file);
    EXPECT_NE(content.find("\"level\":\"ERROR\""), std::string::npos);
    EXPECT_NE(content.find("\"module\":\"codegen\""), std::string::npos);
    EXPECT_NE(content.find("\"msg\":\"emission failed\""), std::string::npos);
}

TEST_F(FileSinkTest, UnopenablePath) {
    FileSink sink((temp_file.parent_path() / "wolf-missing-dir" / "x.log").string(), false);
    EXPECT_FALSE(sink.is_open());
    sink.write(make_record(LogLevel::Error, "x", "dropped"));
}

// ============================================================================
// Command-line Options
// ============================================================================

class LogOptionsTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("WOLF_LOG");
    }
    void TearDown() override {
        unsetenv("WOLF_LOG");
    }
};

TEST_F(LogOptionsTest, DefaultIsWarn) {
    Args args{"compile", "prog.wolf"};
    auto config = parse_log_options(args.argc(), args.argv());
    EXPECT_EQ(config.level, LogLevel::Warn);
    EXPECT_TRUE(config.filter_spec.empty());
    EXPECT_TRUE(config.log_file.empty());
}

TEST_F(LogOptionsTest, VerbosityFlags) {
    Args v{"-v"};
    EXPECT_EQ(parse_log_options(v.argc(), v.argv()).level, LogLevel::Info);
    Args vv{"-vv"};
    EXPECT_EQ(parse_log_options(vv.argc(), vv.argv()).level, LogLevel::Debug);
    Args vvv{"compile", "-vvv", "prog.wolf"};
    EXPECT_EQ(parse_log_options(vvv.argc(), vvv.argv()).level, LogLevel::Trace);
    Args verbose{"--verbose"};
    EXPECT_EQ(parse_log_options(verbose.argc(), verbose.argv()).level, LogLevel::Info);
    Args quiet{"-q"};
    EXPECT_EQ(parse_log_options(quiet.argc(), quiet.argv()).level, LogLevel::Error);
}

TEST_F(LogOptionsTest, ExplicitLevelWinsOverVerbosity) {
    Args args{"-vvv", "--log-level=error"};
    EXPECT_EQ(parse_log_options(args.argc(), args.argv()).level, LogLevel::Error);
}

TEST_F(LogOptionsTest, FilterFileAndFormat) {
    Args args{"--log-filter=codegen=trace", "--log-file=/tmp/wolf.log", "--log-format=json"};
    auto config = parse_log_options(args.argc(), args.argv());
    EXPECT_EQ(config.filter_spec, "codegen=trace");
    EXPECT_EQ(config.log_file, "/tmp/wolf.log");
    EXPECT_EQ(config.format, LogFormat::JSON);
}

TEST_F(LogOptionsTest, EnvironmentLevel) {
    setenv("WOLF_LOG", "debug", 1);
    Args args{"compile", "prog.wolf"};
    EXPECT_EQ(parse_log_options(args.argc(), args.argv()).level, LogLevel::Debug);
}

TEST_F(LogOptionsTest, EnvironmentFilter) {
    setenv("WOLF_LOG", "linker=trace,driver=info", 1);
    Args args{"compile", "prog.wolf"};
    auto config = parse_log_options(args.argc(), args.argv());
    EXPECT_EQ(config.filter_spec, "linker=trace,driver=info");
    EXPECT_EQ(config.level, LogLevel::Warn);
}

TEST_F(LogOptionsTest, CommandLineBeatsEnvironment) {
    setenv("WOLF_LOG", "trace", 1);
    Args args{"-q"};
    EXPECT_EQ(parse_log_options(args.argc(), args.argv()).level, LogLevel::Error);
}

TEST_F(LogOptionsTest, IsLogOption) {
    EXPECT_TRUE(is_log_option("-v"));
    EXPECT_TRUE(is_log_option("-vvv"));
    EXPECT_TRUE(is_log_option("--quiet"));
    EXPECT_TRUE(is_log_option("--log-level=debug"));
    EXPECT_FALSE(is_log_option("-o"));
    EXPECT_FALSE(is_log_option("-V"));
    EXPECT_FALSE(is_log_option("--version"));
    EXPECT_FALSE(is_log_option("prog.wolf"));
}

// ============================================================================
// Logger and Macros
// ============================================================================

class LoggerTest : public ::testing::Test {
protected:
    std::vector<CaptureSink::Entry> records_;

    void SetUp() override {
        LogConfig config;
        config.console = false;
        config.level = LogLevel::Trace;
        Logger::init(config);
        Logger::instance().add_sink(std::make_unique<CaptureSink>(&records_));
    }

    void TearDown() override {
        Logger::init(LogConfig{});
    }
};

TEST_F(LoggerTest, MacrosFormatMessage) {
    int slots = 3;
    WOLF_LOG_DEBUG("ir", "Allocated " << slots << " slots");

    ASSERT_EQ(records_.size(), 1u);
    EXPECT_EQ(records_[0].level, LogLevel::Debug);
    EXPECT_EQ(records_[0].module, "ir");
    EXPECT_EQ(records_[0].message, "Allocated 3 slots");
}

TEST_F(LoggerTest, LevelFiltering) {
    Logger::instance().set_level(LogLevel::Warn);
    WOLF_LOG_INFO("driver", "hidden");
    WOLF_LOG_WARN("driver", "shown");
    WOLF_LOG_ERROR("driver", "shown too");

    ASSERT_EQ(records_.size(), 2u);
    EXPECT_EQ(records_[0].message, "shown");
    EXPECT_EQ(records_[1].level, LogLevel::Error);
}

TEST_F(LoggerTest, ModuleFiltering) {
    Logger::instance().set_filter("linker=trace,*=error");
    WOLF_LOG_TRACE("linker", "argv");
    WOLF_LOG_TRACE("lexer", "token");
    WOLF_LOG_ERROR("lexer", "bad byte");

    ASSERT_EQ(records_.size(), 2u);
    EXPECT_EQ(records_[0].module, "linker");
    EXPECT_EQ(records_[1].message, "bad byte");
}

TEST_F(LoggerTest, MessageNotBuiltWhenFiltered) {
    Logger::instance().set_level(LogLevel::Off);
    int evaluated = 0;
    auto touch = [&evaluated]() {
        ++evaluated;
        return "x";
    };
    WOLF_LOG_FATAL("driver", touch());
    EXPECT_EQ(evaluated, 0);
    EXPECT_TRUE(records_.empty());
}

TEST_F(LoggerTest, ConcurrentLogging) {
    constexpr int num_threads = 8;
    constexpr int messages_per_thread = 100;

    std::vector<std::thread> threads;
    threads.reserve(num_threads);
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([t]() {
            for (int i = 0; i < messages_per_thread; ++i) {
                WOLF_LOG_INFO("test", "thread-" << t << "-msg-" << i);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(static_cast<int>(records_.size()), num_threads * messages_per_thread);
}

TEST_F(LoggerTest, InitWithFilterUsesLowestLevel) {
    LogConfig config;
    config.console = false;
    config.filter_spec = "codegen=debug";
    Logger::init(config);

    EXPECT_EQ(Logger::instance().level(), LogLevel::Debug);
    EXPECT_TRUE(Logger::instance().should_log(LogLevel::Debug, "codegen"));
    EXPECT_FALSE(Logger::instance().should_log(LogLevel::Info, "driver"));
}
