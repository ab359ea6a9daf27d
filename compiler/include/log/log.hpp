//! # wolf Logging
//!
//! A small structured logger shared by every compiler stage:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Module-tagged messages for per-stage filtering
//! - Console, file and null sinks
//! - Compile-time level elision via WOLF_MIN_LOG_LEVEL
//!
//! ## Usage
//!
//! ```cpp
//! WOLF_LOG_INFO("driver", "Compiling " << input << " -> " << output);
//! WOLF_LOG_DEBUG("codegen", "Allocating " << count << " stack slots");
//! ```

#ifndef WOLF_LOG_HPP
#define WOLF_LOG_HPP

#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace wolf::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severity levels in ascending order.
enum class LogLevel : int {
    Trace = 0, ///< Fine-grained internal tracing
    Debug = 1, ///< Debugging information
    Info = 2,  ///< General informational messages
    Warn = 3,  ///< Potential issues
    Error = 4, ///< Recoverable errors
    Fatal = 5, ///< Unrecoverable errors
    Off = 6    ///< Disables all logging
};

/// Returns the upper-case name for a log level (e.g., "TRACE").
auto level_name(LogLevel level) -> const char*;

/// Parses a log level name (lower or upper case).
/// Returns LogLevel::Info if the string is not recognized.
auto parse_level(std::string_view s) -> LogLevel;

// ============================================================================
// Log Record
// ============================================================================

/// A single log message with metadata.
struct LogRecord {
    LogLevel level;          ///< Severity level
    std::string_view module; ///< Module tag (e.g., "codegen", "driver")
    std::string message;     ///< Formatted message text
    const char* file;        ///< Source file (__FILE__)
    int line;                ///< Source line (__LINE__)
    int64_t timestamp_ms;    ///< Milliseconds since epoch
};

/// Output format for log messages.
enum class LogFormat {
    Text, ///< Human-readable text with optional ANSI colors
    JSON  ///< One JSON object per line
};

/// Renders a record as `HH:MM:SS.mmm LEVEL [module] message`.
/// `color` wraps the level name when non-empty.
auto format_text(const LogRecord& record, std::string_view color = {}) -> std::string;

/// Renders a record as a single-line JSON object.
auto format_json(const LogRecord& record) -> std::string;

// ============================================================================
// Log Sinks
// ============================================================================

/// Abstract base class for log output destinations.
class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// Console sink writing to stderr, colored when stderr is a terminal.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);

    void write(const LogRecord& record) override;
    void flush() override;

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    bool colors_enabled_;
    LogFormat format_ = LogFormat::Text;
};

/// File sink. Flushes after every Error and Fatal record.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, bool append = true);
    ~FileSink() override;

    void write(const LogRecord& record) override;
    void flush() override;

    [[nodiscard]] auto is_open() const -> bool {
        return file_.is_open();
    }

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    std::ofstream file_;
    LogFormat format_ = LogFormat::Text;
};

// ============================================================================
// Log Filter
// ============================================================================

/// Module-based log level filter.
///
/// Parses filter strings like "codegen=trace,linker=debug,*=warn". A bare
/// module name enables everything from that module.
class LogFilter {
public:
    LogFilter() = default;

    void parse(std::string_view spec);

    [[nodiscard]] auto should_log(LogLevel level, std::string_view module) const -> bool;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    [[nodiscard]] auto default_level() const -> LogLevel {
        return default_level_;
    }

    /// The lowest level any module (or the default) accepts.
    [[nodiscard]] auto min_level() const -> LogLevel;

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger
// ============================================================================

/// Configuration for logger initialization.
struct LogConfig {
    LogLevel level = LogLevel::Warn;    ///< Global minimum log level
    LogFormat format = LogFormat::Text; ///< Output format
    std::string filter_spec;            ///< Module filter string
    std::string log_file;               ///< Path to log file (empty = no file)
    bool console = true;                ///< Enable console (stderr) output
    bool colors = true;                 ///< Enable ANSI colors on console
};

/// Thread-safe global logger.
///
/// Works before `init()` is called: the default instance writes Warn and
/// above to the console.
class Logger {
public:
    /// Replaces sinks, level and filter of the global logger.
    static void init(const LogConfig& config);

    static auto instance() -> Logger&;

    /// Fast-path check used by the macros before building the message.
    [[nodiscard]] auto should_log(LogLevel level, std::string_view module) const -> bool;

    void log(const LogRecord& record);

    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Removes every sink.
    void clear_sinks();

    void set_level(LogLevel level);

    [[nodiscard]] auto level() const -> LogLevel {
        return level_;
    }

    void set_filter(std::string_view spec);

    void flush();

private:
    Logger();

    LogLevel level_ = LogLevel::Warn;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

/// Returns current local time formatted as "HH:MM:SS.mmm".
auto get_timestamp() -> std::string;

/// Returns milliseconds since epoch.
auto epoch_ms() -> int64_t;

// ============================================================================
// CLI Parsing
// ============================================================================

/// Parse logging-related CLI options from argv.
/// Extracts: --log-level, --log-filter, --log-file, --log-format, -v/-vv/-vvv, -q.
/// Falls back to the WOLF_LOG environment variable when no level or filter
/// was given on the command line.
auto parse_log_options(int argc, char* argv[]) -> LogConfig;

/// Returns true for arguments consumed by `parse_log_options`.
[[nodiscard]] auto is_log_option(std::string_view arg) -> bool;

// ============================================================================
// Logging Macros
// ============================================================================

// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef WOLF_MIN_LOG_LEVEL
#define WOLF_MIN_LOG_LEVEL 0
#endif

#define WOLF_LOG_IMPL(level, module_str, msg)                                                      \
    do {                                                                                           \
        if (static_cast<int>(level) >= WOLF_MIN_LOG_LEVEL) {                                       \
            auto& logger_ = ::wolf::log::Logger::instance();                                       \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

/// Usage: WOLF_LOG_TRACE("module", "message " << value);
#define WOLF_LOG_TRACE(module, msg) WOLF_LOG_IMPL(::wolf::log::LogLevel::Trace, module, msg)
#define WOLF_LOG_DEBUG(module, msg) WOLF_LOG_IMPL(::wolf::log::LogLevel::Debug, module, msg)
#define WOLF_LOG_INFO(module, msg) WOLF_LOG_IMPL(::wolf::log::LogLevel::Info, module, msg)
#define WOLF_LOG_WARN(module, msg) WOLF_LOG_IMPL(::wolf::log::LogLevel::Warn, module, msg)
#define WOLF_LOG_ERROR(module, msg) WOLF_LOG_IMPL(::wolf::log::LogLevel::Error, module, msg)
#define WOLF_LOG_FATAL(module, msg) WOLF_LOG_IMPL(::wolf::log::LogLevel::Fatal, module, msg)

} // namespace wolf::log

#endif // WOLF_LOG_HPP
