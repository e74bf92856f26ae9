//! # irkit Logging
//!
//! Module-tagged structured logging used by every irkit component:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Per-module filtering ("rewrite=trace,*=warn")
//! - Console, file, null and fan-out sinks
//! - Mutex-protected dispatch
//! - Compile-time level elision via IRKIT_MIN_LOG_LEVEL
//!
//! ## Usage
//!
//! ```cpp
//! IRKIT_LOG_DEBUG("rewrite", "applied " << pattern << " to " << describe(op));
//! IRKIT_LOG_WARN("match", "constraint reads unbound variable " << name);
//! ```
//!
//! Module tags used inside the library: `ir`, `imm`, `match`, `rewrite`,
//! `registry`, `fold`.

#ifndef IRKIT_LOG_HPP
#define IRKIT_LOG_HPP

#include <chrono>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace irkit::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severity levels in ascending order.
enum class LogLevel : int {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5,
    Off = 6
};

inline const char* level_name(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Fatal:
        return "FATAL";
    case LogLevel::Off:
        return "OFF";
    }
    return "???";
}

/// Parses a log level name in lower or upper case.
/// Unrecognized names map to LogLevel::Info.
LogLevel parse_level(std::string_view s);

// ============================================================================
// Log Record
// ============================================================================

struct LogRecord {
    LogLevel level;
    std::string_view module; ///< Module tag (e.g., "rewrite", "imm")
    std::string message;
    const char* file; ///< Source file (__FILE__)
    int line;         ///< Source line (__LINE__)
    int64_t timestamp_ms;
};

enum class LogFormat {
    Text, ///< Human-readable text with optional ANSI colors
    JSON  ///< One JSON object per line
};

/// Renders a record in the requested format, without trailing newline.
std::string format_record(const LogRecord& record, LogFormat format);

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

/// Writes to stderr, colored when stderr is a terminal.
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

/// Appends to a file. Flushes on Error and Fatal.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, bool append = true);
    ~FileSink() override;

    void write(const LogRecord& record) override;
    void flush() override;

    bool is_open() const {
        return file_.is_open();
    }

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    std::ofstream file_;
    LogFormat format_ = LogFormat::Text;
};

class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

/// Fans a record out to several child sinks.
class MultiSink : public LogSink {
public:
    void write(const LogRecord& record) override;
    void flush() override;

    void add(std::unique_ptr<LogSink> sink);

    size_t size() const {
        return sinks_.size();
    }

private:
    std::vector<std::unique_ptr<LogSink>> sinks_;
};

// ============================================================================
// Log Filter
// ============================================================================

/// Module-based level filter.
///
/// Parses "module1=level,module2=level,*=default_level". A bare module name
/// enables everything for that module.
class LogFilter {
public:
    LogFilter() = default;

    void parse(std::string_view spec);

    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    LogLevel default_level() const {
        return default_level_;
    }

    /// Lowest level configured for any module, including the default.
    LogLevel min_level() const;

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger Configuration
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Warn;
    LogFormat format = LogFormat::Text;
    std::string filter_spec;
    std::string log_file; ///< Empty = no file sink
    bool console = true;
    bool colors = true;
};

/// Parse logging options from argv.
/// Understands --log-level, --log-filter, --log-file, --log-format,
/// -v/-vv/-vvv and -q. Falls back to the IRKIT_LOG environment variable
/// when neither a level nor a filter was given on the command line.
LogConfig parse_log_options(int argc, char* argv[]);

// ============================================================================
// Logger Singleton
// ============================================================================

class Logger {
public:
    static void init(const LogConfig& config);

    static Logger& instance();

    /// Fast-path check used by the macros before the message is built.
    bool should_log(LogLevel level, std::string_view module) const;

    void log(const LogRecord& record);

    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    void set_level(LogLevel level);

    LogLevel level() const {
        return level_;
    }

    void set_filter(std::string_view spec);

    void flush();

    /// Drops every sink and restores the default level and filter.
    void reset();

private:
    Logger();

    LogLevel level_ = LogLevel::Warn;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

/// Returns milliseconds since epoch.
inline int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ============================================================================
// Logging Macros
// ============================================================================

// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef IRKIT_MIN_LOG_LEVEL
#define IRKIT_MIN_LOG_LEVEL 0
#endif

/// Internal macro, use the level-specific ones below.
#define IRKIT_LOG_IMPL(level, module_str, msg)                                                     \
    do {                                                                                           \
        if (static_cast<int>(level) >= IRKIT_MIN_LOG_LEVEL) {                                      \
            auto& logger_ = ::irkit::log::Logger::instance();                                      \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define IRKIT_LOG_TRACE(module, msg) IRKIT_LOG_IMPL(::irkit::log::LogLevel::Trace, module, msg)
#define IRKIT_LOG_DEBUG(module, msg) IRKIT_LOG_IMPL(::irkit::log::LogLevel::Debug, module, msg)
#define IRKIT_LOG_INFO(module, msg) IRKIT_LOG_IMPL(::irkit::log::LogLevel::Info, module, msg)
#define IRKIT_LOG_WARN(module, msg) IRKIT_LOG_IMPL(::irkit::log::LogLevel::Warn, module, msg)
#define IRKIT_LOG_ERROR(module, msg) IRKIT_LOG_IMPL(::irkit::log::LogLevel::Error, module, msg)
#define IRKIT_LOG_FATAL(module, msg) IRKIT_LOG_IMPL(::irkit::log::LogLevel::Fatal, module, msg)

} // namespace irkit::log

#endif // IRKIT_LOG_HPP
