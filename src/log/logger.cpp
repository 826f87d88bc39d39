//! # Logger Implementation
//!
//! Record rendering, the three sinks, module filtering and the Logger
//! singleton.

#include "log/log.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>

#ifdef _WIN32
#include <io.h>
#define PYSTRUCT_ISATTY(fd) _isatty(fd)
#define PYSTRUCT_FILENO(f) _fileno(f)
#else
#include <unistd.h>
#define PYSTRUCT_ISATTY(fd) isatty(fd)
#define PYSTRUCT_FILENO(f) fileno(f)
#endif

namespace pystruct::log {

namespace {

bool stderr_supports_color() {
    if (!PYSTRUCT_ISATTY(PYSTRUCT_FILENO(stderr))) {
        return false;
    }
    const char* term = std::getenv("TERM");
    return term != nullptr && std::string_view(term) != "dumb";
}

auto now_ms() -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

/// Local wall-clock time of a record, "HH:MM:SS.mmm".
auto clock_time(int64_t timestamp_ms) -> std::string {
    auto seconds = static_cast<std::time_t>(timestamp_ms / 1000);
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &seconds);
#else
    localtime_r(&seconds, &local);
#endif
    std::ostringstream out;
    out << std::put_time(&local, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << (timestamp_ms % 1000);
    return out.str();
}

auto color_of(LogLevel level) -> const char* {
    switch (level) {
    case LogLevel::Trace:
        return "\033[90m";
    case LogLevel::Debug:
        return "\033[36m";
    case LogLevel::Info:
        return "\033[32m";
    case LogLevel::Warn:
        return "\033[33m";
    case LogLevel::Error:
        return "\033[31m";
    case LogLevel::Fatal:
        return "\033[1;31m";
    case LogLevel::Off:
        break;
    }
    return "";
}

void append_escaped(std::string& out, std::string_view text) {
    for (char c : text) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            out += c;
        }
    }
}

auto render_text(const LogRecord& record, const char* color) -> std::string {
    std::ostringstream out;
    out << clock_time(record.timestamp_ms) << " " << color << std::left << std::setw(5)
        << level_name(record.level) << (*color != '\0' ? "\033[0m" : "") << " [" << record.module
        << "] " << record.message;
    return out.str();
}

} // namespace

const char* level_name(LogLevel level) {
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
    return "?";
}

LogLevel parse_level(std::string_view s) {
    std::string name(s);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    static const std::unordered_map<std::string, LogLevel> levels = {
        {"trace", LogLevel::Trace}, {"debug", LogLevel::Debug},   {"info", LogLevel::Info},
        {"warn", LogLevel::Warn},   {"warning", LogLevel::Warn},  {"error", LogLevel::Error},
        {"fatal", LogLevel::Fatal}, {"off", LogLevel::Off},
    };
    auto it = levels.find(name);
    return it != levels.end() ? it->second : LogLevel::Info;
}

std::string format_record(const LogRecord& record, LogFormat format) {
    if (format == LogFormat::Text) {
        return render_text(record, "");
    }
    std::string out = "{\"ts\":";
    out += std::to_string(record.timestamp_ms);
    out += ",\"level\":\"";
    out += level_name(record.level);
    out += "\",\"module\":\"";
    append_escaped(out, record.module);
    out += "\",\"msg\":\"";
    append_escaped(out, record.message);
    out += "\"}";
    return out;
}

// ============================================================================
// Sinks
// ============================================================================

ConsoleSink::ConsoleSink(bool use_colors, LogFormat format)
    : colors_(use_colors && format == LogFormat::Text && stderr_supports_color()),
      format_(format) {}

void ConsoleSink::write(const LogRecord& record) {
    auto line = colors_ ? render_text(record, color_of(record.level))
                        : format_record(record, format_);
    std::cerr << line << "\n";
}

void ConsoleSink::flush() {
    std::cerr.flush();
}

FileSink::FileSink(const std::filesystem::path& path, LogFormat format)
    : file_(path, std::ios::out | std::ios::app), format_(format) {}

void FileSink::write(const LogRecord& record) {
    if (!file_.is_open()) {
        return;
    }
    file_ << format_record(record, format_) << "\n";
    if (record.level >= LogLevel::Error) {
        file_.flush();
    }
}

void FileSink::flush() {
    if (file_.is_open()) {
        file_.flush();
    }
}

void CaptureSink::write(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(Entry{.level = record.level,
                             .module = std::string(record.module),
                             .message = record.message});
}

std::vector<CaptureSink::Entry> CaptureSink::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

size_t CaptureSink::count(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
                                             [level](const Entry& e) { return e.level == level; }));
}

// ============================================================================
// LogFilter
// ============================================================================

void LogFilter::parse(std::string_view spec) {
    module_levels_.clear();
    while (!spec.empty()) {
        auto comma = spec.find(',');
        auto rule = spec.substr(0, comma);
        spec = comma == std::string_view::npos ? std::string_view() : spec.substr(comma + 1);
        if (rule.empty()) {
            continue;
        }

        auto eq = rule.find('=');
        if (eq == std::string_view::npos) {
            module_levels_[std::string(rule)] = LogLevel::Trace;
        } else if (rule.substr(0, eq) == "*") {
            default_level_ = parse_level(rule.substr(eq + 1));
        } else {
            module_levels_[std::string(rule.substr(0, eq))] = parse_level(rule.substr(eq + 1));
        }
    }
}

bool LogFilter::should_log(LogLevel level, std::string_view module) const {
    auto it = module_levels_.find(std::string(module));
    auto threshold = it != module_levels_.end() ? it->second : default_level_;
    return level >= threshold;
}

LogLevel LogFilter::min_level() const {
    auto lowest = default_level_;
    for (const auto& [module, level] : module_levels_) {
        lowest = std::min(lowest, level);
    }
    return lowest;
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::init(const LogConfig& config) {
    auto& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);

    logger.sinks_.clear();
    logger.filter_ = LogFilter();
    logger.filter_.set_default_level(config.level);
    logger.level_ = config.level;
    if (!config.filter_spec.empty()) {
        // A spec without "*=level" keeps config.level for unlisted modules.
        auto base = config.level;
        logger.filter_.parse(config.filter_spec);
        logger.filter_.set_default_level(std::min(base, logger.filter_.default_level()));
        logger.level_ = logger.filter_.min_level();
    }

    if (config.console) {
        logger.sinks_.push_back(std::make_unique<ConsoleSink>(config.colors, config.format));
    }
    if (!config.log_file.empty()) {
        auto file = std::make_unique<FileSink>(config.log_file, config.format);
        if (file->is_open()) {
            logger.sinks_.push_back(std::move(file));
        } else {
            std::cerr << "warning: could not open log file: " << config.log_file << "\n";
        }
    }
}

bool Logger::should_log(LogLevel level, std::string_view module) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !sinks_.empty() && level >= level_ && filter_.should_log(level, module);
}

void Logger::log(LogLevel level, std::string_view module, const std::string& message,
                 const char* file, int line) {
    LogRecord record{.level = level,
                     .module = module,
                     .message = message,
                     .file = file,
                     .line = line,
                     .timestamp_ms = now_ms()};
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->write(record);
    }
}

void Logger::add_sink(std::unique_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
    filter_.set_default_level(level);
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

void Logger::set_filter(std::string_view spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    filter_.parse(spec);
    level_ = std::min(level_, filter_.min_level());
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

} // namespace pystruct::log
