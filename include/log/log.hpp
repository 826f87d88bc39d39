//! # pystruct Logging
//!
//! Module-tagged diagnostics for the extractor, the filter pipeline and the
//! command-line driver. Records go to stderr, an optional log file, or both;
//! tests install a `CaptureSink` instead.
//!
//! Module tags in use: `extract`, `parallel`, `filter`, `serialize`, `cli`.
//!
//! ```cpp
//! PYSTRUCT_LOG_WARN("extract", failure.to_string());
//! PYSTRUCT_LOG_DEBUG("filter", step.filter << " removed " << step.removed.functions
//!                                           << " functions");
//! ```
//!
//! Verbosity comes from `--log-level=`, `-v`/`-vv`/`-vvv`, `-q`, or the
//! `PYSTRUCT_LOG` environment variable (a level name or a filter spec such as
//! `extract=debug,*=warn`). Worker threads may log concurrently.

#ifndef PYSTRUCT_LOG_LOG_HPP
#define PYSTRUCT_LOG_LOG_HPP

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace pystruct::log {

// ============================================================================
// Levels
// ============================================================================

enum class LogLevel : int {
    Trace = 0, ///< Per-file entity counts
    Debug = 1, ///< Per-file progress and filter removals
    Info = 2,  ///< Per-run summaries
    Warn = 3,  ///< Skipped files (syntax or I/O failures)
    Error = 4, ///< Failed commands
    Fatal = 5,
    Off = 6
};

/// Upper-case name used in rendered records ("WARN").
const char* level_name(LogLevel level);

/// Case-insensitive; accepts "warning" for Warn. Unknown names give Info.
LogLevel parse_level(std::string_view s);

// ============================================================================
// Records and Formats
// ============================================================================

struct LogRecord {
    LogLevel level;
    std::string_view module;
    std::string message;
    const char* file;
    int line;
    int64_t timestamp_ms; ///< Milliseconds since the Unix epoch
};

enum class LogFormat {
    Text, ///< `HH:MM:SS.mmm LEVEL [module] message`
    JSON  ///< One object per line: `{"ts":..,"level":..,"module":..,"msg":..}`
};

/// Renders one record without the trailing newline.
std::string format_record(const LogRecord& record, LogFormat format);

// ============================================================================
// Sinks
// ============================================================================

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// Writes to stderr. Level names are colored when stderr is a terminal.
class ConsoleSink : public LogSink {
public:
    ConsoleSink(bool use_colors, LogFormat format);

    void write(const LogRecord& record) override;
    void flush() override;

private:
    bool colors_;
    LogFormat format_;
};

/// Appends to a file. Error and Fatal records are flushed immediately.
class FileSink : public LogSink {
public:
    FileSink(const std::filesystem::path& path, LogFormat format);

    void write(const LogRecord& record) override;
    void flush() override;

    [[nodiscard]] bool is_open() const {
        return file_.is_open();
    }

private:
    std::ofstream file_;
    LogFormat format_;
};

/// Keeps every record in memory so tests can assert on what was logged.
class CaptureSink : public LogSink {
public:
    struct Entry {
        LogLevel level;
        std::string module;
        std::string message;
    };

    void write(const LogRecord& record) override;
    void flush() override {}

    std::vector<Entry> entries() const;
    size_t count(LogLevel level) const;

private:
    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
};

// ============================================================================
// Module Filter
// ============================================================================

/// Per-module thresholds parsed from `"extract=debug,filter,*=warn"`.
///
/// A bare module name enables everything for that module; `*` sets the
/// threshold for unlisted modules.
class LogFilter {
public:
    void parse(std::string_view spec);

    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    LogLevel default_level() const {
        return default_level_;
    }

    /// Lowest threshold of any module or the default.
    LogLevel min_level() const;

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Warn;
    LogFormat format = LogFormat::Text;
    std::string filter_spec; ///< Empty: every module uses `level`
    std::string log_file;    ///< Empty: no file sink
    bool console = true;
    bool colors = true;
};

/// Process-wide logger. Has no sinks, and so drops everything, until
/// `init()` or `add_sink()` is called.
class Logger {
public:
    /// Replaces the sinks and thresholds with those described by `config`.
    static void init(const LogConfig& config);

    static Logger& instance();

    /// Cheap check the macros make before formatting a message.
    bool should_log(LogLevel level, std::string_view module) const;

    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);
    void clear_sinks();

    /// Sets the global threshold and the default for unlisted modules.
    void set_level(LogLevel level);
    LogLevel level() const;

    /// Installs a module filter; the global threshold drops to the lowest
    /// module threshold so listed modules can log below it.
    void set_filter(std::string_view spec);

    void flush();

private:
    Logger() = default;

    LogLevel level_ = LogLevel::Info;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Command Line
// ============================================================================

/// Reads `--log-level=`, `--log-filter=`, `--log-file=`, `--log-format=`,
/// `-v`/`-vv`/`-vvv`/`--verbose` and `-q`/`--quiet` from argv, falling back
/// to `PYSTRUCT_LOG` when neither a level nor a filter was given.
LogConfig parse_log_options(int argc, char* argv[]);

/// True for every argument parse_log_options() consumes, so command parsers
/// can skip them.
bool is_log_option(std::string_view arg);

// ============================================================================
// Macros
// ============================================================================

// Records below this level are compiled out (0 = Trace ... 6 = Off).
#ifndef PYSTRUCT_MIN_LOG_LEVEL
#define PYSTRUCT_MIN_LOG_LEVEL 0
#endif

#define PYSTRUCT_LOG_IMPL(level, module_str, msg)                                                  \
    do {                                                                                           \
        if (static_cast<int>(level) >= PYSTRUCT_MIN_LOG_LEVEL) {                                   \
            auto& pystruct_logger_ = ::pystruct::log::Logger::instance();                          \
            if (pystruct_logger_.should_log(level, module_str)) {                                  \
                std::ostringstream pystruct_msg_;                                                  \
                pystruct_msg_ << msg;                                                              \
                pystruct_logger_.log(level, module_str, pystruct_msg_.str(), __FILE__, __LINE__);  \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define PYSTRUCT_LOG_TRACE(module, msg)                                                            \
    PYSTRUCT_LOG_IMPL(::pystruct::log::LogLevel::Trace, module, msg)
#define PYSTRUCT_LOG_DEBUG(module, msg)                                                            \
    PYSTRUCT_LOG_IMPL(::pystruct::log::LogLevel::Debug, module, msg)
#define PYSTRUCT_LOG_INFO(module, msg)                                                             \
    PYSTRUCT_LOG_IMPL(::pystruct::log::LogLevel::Info, module, msg)
#define PYSTRUCT_LOG_WARN(module, msg)                                                             \
    PYSTRUCT_LOG_IMPL(::pystruct::log::LogLevel::Warn, module, msg)
#define PYSTRUCT_LOG_ERROR(module, msg)                                                            \
    PYSTRUCT_LOG_IMPL(::pystruct::log::LogLevel::Error, module, msg)

} // namespace pystruct::log

#endif // PYSTRUCT_LOG_LOG_HPP
