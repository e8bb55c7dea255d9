//! # Logger Implementation

#include "log/log.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <unistd.h>

namespace semdiff::log {

namespace {

struct LevelInfo {
    std::string_view name;
    const char* color;
};

constexpr std::array<LevelInfo, 7> kLevels = {{
    {"TRACE", "\033[90m"},
    {"DEBUG", "\033[36m"},
    {"INFO", "\033[32m"},
    {"WARN", "\033[33m"},
    {"ERROR", "\033[31m"},
    {"FATAL", "\033[1;31m"},
    {"OFF", ""},
}};

constexpr const char* kColorReset = "\033[0m";

auto info(LogLevel level) -> const LevelInfo& {
    auto index = static_cast<size_t>(level);
    return kLevels[index < kLevels.size() ? index : kLevels.size() - 1];
}

thread_local std::string tls_context;

/// "HH:MM:SS.mmm" in local time.
auto clock_text(int64_t timestamp_ms) -> std::string {
    auto seconds = static_cast<std::time_t>(timestamp_ms / 1000);
    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << (timestamp_ms % 1000);
    return oss.str();
}

void put_json_string(std::ostringstream& oss, std::string_view text) {
    oss << '"';
    for (char c : text) {
        switch (c) {
        case '"':
            oss << "\\\"";
            break;
        case '\\':
            oss << "\\\\";
            break;
        case '\n':
            oss << "\\n";
            break;
        case '\r':
            oss << "\\r";
            break;
        case '\t':
            oss << "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                    << static_cast<int>(c) << std::dec << std::setfill(' ');
            } else {
                oss << c;
            }
        }
    }
    oss << '"';
}

bool stderr_supports_color() {
    if (!isatty(fileno(stderr))) {
        return false;
    }
    const char* term = std::getenv("TERM");
    return term != nullptr && std::string_view(term) != "dumb";
}

} // namespace

// ============================================================================
// Levels and formatting
// ============================================================================

auto level_name(LogLevel level) -> std::string_view {
    return info(level).name;
}

auto parse_level(std::string_view name) -> std::optional<LogLevel> {
    std::string upper(name);
    for (auto& c : upper) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    if (upper == "WARNING") {
        return LogLevel::Warn;
    }
    for (size_t i = 0; i < kLevels.size(); ++i) {
        if (kLevels[i].name == upper) {
            return static_cast<LogLevel>(i);
        }
    }
    return std::nullopt;
}

auto format_record(const LogRecord& record, LogFormat format, bool colors) -> std::string {
    std::ostringstream oss;

    if (format == LogFormat::JSON) {
        oss << "{\"ts\":" << record.timestamp_ms << ",\"level\":";
        put_json_string(oss, level_name(record.level));
        oss << ",\"module\":";
        put_json_string(oss, record.module);
        if (!record.context.empty()) {
            oss << ",\"ctx\":";
            put_json_string(oss, record.context);
        }
        oss << ",\"msg\":";
        put_json_string(oss, record.message);
        oss << "}\n";
        return oss.str();
    }

    const auto& level = info(record.level);
    oss << clock_text(record.timestamp_ms) << ' ';
    if (colors) {
        oss << level.color;
    }
    oss << std::left << std::setw(5) << level.name;
    if (colors) {
        oss << kColorReset;
    }
    oss << " [" << record.module << "] ";
    if (!record.context.empty()) {
        oss << '(' << record.context << ") ";
    }
    oss << record.message << '\n';
    return oss.str();
}

// ============================================================================
// Thread context
// ============================================================================

ScopedContext::ScopedContext(std::string label) : saved_(std::move(tls_context)) {
    tls_context = std::move(label);
}

ScopedContext::~ScopedContext() {
    tls_context = std::move(saved_);
}

auto current_context() -> const std::string& {
    return tls_context;
}

// ============================================================================
// Sinks
// ============================================================================

ConsoleSink::ConsoleSink(bool use_colors) : colors_(use_colors && stderr_supports_color()) {}

void ConsoleSink::write(const LogRecord& record) {
    std::cerr << format_record(record, format_, colors_);
}

void ConsoleSink::flush() {
    std::cerr.flush();
}

FileSink::FileSink(const std::string& path, bool append)
    : file_(path, append ? std::ios::app : std::ios::trunc) {}

void FileSink::write(const LogRecord& record) {
    if (!file_.is_open()) {
        return;
    }
    file_ << format_record(record, format_, false);
    if (record.level >= LogLevel::Error) {
        file_.flush();
    }
}

void FileSink::flush() {
    if (file_.is_open()) {
        file_.flush();
    }
}

// ============================================================================
// LogFilter
// ============================================================================

void LogFilter::parse(std::string_view spec) {
    modules_.clear();

    while (!spec.empty()) {
        auto comma = spec.find(',');
        auto entry = spec.substr(0, comma);
        spec = comma == std::string_view::npos ? std::string_view{} : spec.substr(comma + 1);

        if (entry.empty()) {
            continue;
        }
        auto eq = entry.find('=');
        if (eq == std::string_view::npos) {
            modules_.insert_or_assign(std::string(entry), LogLevel::Trace);
            continue;
        }
        auto level = parse_level(entry.substr(eq + 1));
        if (!level) {
            continue;
        }
        auto module = entry.substr(0, eq);
        if (module == "*") {
            default_level_ = *level;
        } else {
            modules_.insert_or_assign(std::string(module), *level);
        }
    }
}

bool LogFilter::should_log(LogLevel level, std::string_view module) const {
    auto it = modules_.find(module);
    LogLevel threshold = it != modules_.end() ? it->second : default_level_;
    return level >= threshold;
}

LogLevel LogFilter::min_level() const {
    LogLevel lowest = default_level_;
    for (const auto& entry : modules_) {
        lowest = std::min(lowest, entry.second);
    }
    return lowest;
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger() {
    filter_.set_default_level(threshold_);
    sinks_.push_back(std::make_unique<ConsoleSink>());
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::init(const LogConfig& config) {
    std::vector<std::unique_ptr<LogSink>> sinks;
    if (config.console) {
        auto console = std::make_unique<ConsoleSink>(config.colors);
        console->set_format(config.format);
        sinks.push_back(std::move(console));
    }
    if (!config.log_file.empty()) {
        auto file = std::make_unique<FileSink>(config.log_file);
        if (file->is_open()) {
            file->set_format(config.format);
            sinks.push_back(std::move(file));
        } else {
            std::cerr << "warning: cannot open log file '" << config.log_file << "'\n";
        }
    }

    auto& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);
    logger.sinks_ = std::move(sinks);
    logger.filter_ = LogFilter{};
    logger.filter_.set_default_level(config.level);
    if (!config.filter_spec.empty()) {
        logger.filter_.parse(config.filter_spec);
        // A `*=` entry in the spec only ever makes the default more verbose.
        logger.filter_.set_default_level(std::min(config.level, logger.filter_.default_level()));
    }
    logger.threshold_ = logger.filter_.min_level();
}

bool Logger::should_log(LogLevel level, std::string_view module) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= threshold_ && filter_.should_log(level, module);
}

void Logger::log(LogLevel level, std::string_view module, std::string message, const char* file,
                 int line) {
    LogRecord record{.level = level,
                     .module = module,
                     .message = std::move(message),
                     .context = current_context(),
                     .file = file,
                     .line = line,
                     .timestamp_ms = epoch_ms()};

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
    filter_.set_default_level(level);
    threshold_ = filter_.min_level();
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return threshold_;
}

void Logger::set_filter(std::string_view spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    filter_.parse(spec);
    threshold_ = filter_.min_level();
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

} // namespace semdiff::log
