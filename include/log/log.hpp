//! # elmtest Logging
//!
//! Leveled, module-tagged logging shared by every component:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Module tags for per-component filtering ("discovery", "config", "check")
//! - Console, file and null sinks, fanned out through `MultiSink`
//! - Mutex-protected dispatch so worker threads can log freely
//! - Compile-time level elision via ELMTEST_MIN_LOG_LEVEL
//!
//! ## Usage
//!
//! ```cpp
//! ELMTEST_LOG_INFO("check", "Scanning " << jobs.size() << " modules");
//! ELMTEST_LOG_DEBUG("discovery", "Found candidate " << name << " in " << path);
//! ```

#ifndef ELMTEST_LOG_HPP
#define ELMTEST_LOG_HPP

#include <chrono>
#include <cstdint>
#include <ctime>
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

namespace elmtest::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severity levels in ascending order.
enum class LogLevel : int {
    Trace = 0, ///< Per-line scanner tracing
    Debug = 1, ///< Per-module decisions
    Info = 2,  ///< Progress messages
    Warn = 3,  ///< Unexposed tests, unusable configuration values
    Error = 4, ///< Modules that could not be checked
    Fatal = 5, ///< Run cannot continue
    Off = 6    ///< Disables all logging
};

/// Returns the upper-case name for a log level (e.g., "WARN").
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

/// Parses a level name ("warn", "WARN", also "warning").
/// Unrecognized names map to LogLevel::Info.
inline LogLevel parse_level(std::string_view s) {
    std::string lower(s);
    for (auto& c : lower) {
        if (c >= 'A' && c <= 'Z')
            c = static_cast<char>(c - 'A' + 'a');
    }

    for (int i = static_cast<int>(LogLevel::Trace); i <= static_cast<int>(LogLevel::Off); ++i) {
        std::string name = level_name(static_cast<LogLevel>(i));
        for (auto& c : name) {
            c = static_cast<char>(c - 'A' + 'a');
        }
        if (lower == name)
            return static_cast<LogLevel>(i);
    }
    if (lower == "warning")
        return LogLevel::Warn;
    return LogLevel::Info;
}

// ============================================================================
// Log Record
// ============================================================================

/// A single log message with metadata.
struct LogRecord {
    LogLevel level;          ///< Severity level
    std::string_view module; ///< Module tag
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

// ============================================================================
// Log Sinks
// ============================================================================

/// Abstract destination for log records.
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

    void set_color_enabled(bool enabled) {
        colors_enabled_ = enabled;
    }
    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    bool colors_enabled_;
    LogFormat format_ = LogFormat::Text;

    const char* level_color(LogLevel level) const;
};

/// Appends log records to a file. Flushes after Error and Fatal records.
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

/// Discards everything.
class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

/// Fans out each record to every child sink.
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

/// Renders a record as a single text line (no trailing newline).
std::string format_text(const LogRecord& record);

/// Renders a record as a single JSON object (no trailing newline).
std::string format_json(const LogRecord& record);

// ============================================================================
// Log Filter
// ============================================================================

/// Per-module level filter.
///
/// Parses specs like "check=debug,discovery=trace,*=warn".
class LogFilter {
public:
    LogFilter() = default;

    /// Format: "module1=level,module2=level,*=default_level".
    /// A bare module name enables Trace for that module.
    void parse(std::string_view spec);

    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    LogLevel default_level() const {
        return default_level_;
    }

    /// Lowest level configured for any module, or the default.
    LogLevel min_level() const {
        LogLevel min = default_level_;
        for (const auto& [_, level] : module_levels_) {
            if (level < min)
                min = level;
        }
        return min;
    }

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger Configuration
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Warn;    ///< Global minimum log level
    LogFormat format = LogFormat::Text; ///< Output format
    std::string filter_spec;            ///< Module filter string
    std::string log_file;               ///< Path to log file (empty = no file)
    bool console = true;                ///< Enable stderr output
    bool colors = true;                 ///< Enable ANSI colors on console
};

// ============================================================================
// Logger Singleton
// ============================================================================

/// Thread-safe global logger.
///
/// Usable before `init()`: the default instance logs Warn and above to a
/// console sink.
class Logger {
public:
    /// Replaces sinks, level and filter with the given configuration.
    static void init(const LogConfig& config);

    static Logger& instance();

    /// Fast-path check used by the macros before building the message.
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

private:
    Logger();

    LogLevel level_ = LogLevel::Warn;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Timestamp Helpers
// ============================================================================

/// Returns the local time as "HH:MM:SS.mmm".
inline std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    auto now_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &now_c);
#else
    localtime_r(&now_c, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << now_ms.count();
    return oss.str();
}

/// Milliseconds since epoch.
inline int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ============================================================================
// CLI Parsing
// ============================================================================

/// Extracts --log-level, --log-filter, --log-file, --log-format, -v/-vv/-vvv
/// and -q from argv. Falls back to the ELMTEST_LOG environment variable when
/// neither a level nor a filter was given on the command line.
LogConfig parse_log_options(int argc, char* argv[]);

/// True if `arg` is one of the options consumed by parse_log_options().
bool is_log_option(std::string_view arg);

// ============================================================================
// Logging Macros
// ============================================================================

// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef ELMTEST_MIN_LOG_LEVEL
#define ELMTEST_MIN_LOG_LEVEL 0
#endif

/// Internal macro, use the level-specific ones below.
#define ELMTEST_LOG_IMPL(level, module_str, msg)                                                   \
    do {                                                                                           \
        if (static_cast<int>(level) >= ELMTEST_MIN_LOG_LEVEL) {                                    \
            auto& logger_ = ::elmtest::log::Logger::instance();                                    \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

/// Usage: ELMTEST_LOG_TRACE("module", "message " << value);
#define ELMTEST_LOG_TRACE(module, msg) ELMTEST_LOG_IMPL(::elmtest::log::LogLevel::Trace, module, msg)
#define ELMTEST_LOG_DEBUG(module, msg) ELMTEST_LOG_IMPL(::elmtest::log::LogLevel::Debug, module, msg)
#define ELMTEST_LOG_INFO(module, msg) ELMTEST_LOG_IMPL(::elmtest::log::LogLevel::Info, module, msg)
#define ELMTEST_LOG_WARN(module, msg) ELMTEST_LOG_IMPL(::elmtest::log::LogLevel::Warn, module, msg)
#define ELMTEST_LOG_ERROR(module, msg) ELMTEST_LOG_IMPL(::elmtest::log::LogLevel::Error, module, msg)
#define ELMTEST_LOG_FATAL(module, msg) ELMTEST_LOG_IMPL(::elmtest::log::LogLevel::Fatal, module, msg)

} // namespace elmtest::log

#endif // ELMTEST_LOG_HPP
