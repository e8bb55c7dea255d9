//! # semdiff Logging
//!
//! Module-tagged logging for the analysis pipeline. Every message carries a
//! stage tag (`lexer`, `parser`, `extract`, `snapshot`, `diff`, `granular`,
//! `report`, `vcs`, `cli`) that `--log-filter` selects on, and the context
//! label of the thread that emitted it.
//!
//! ## Context labels
//!
//! Base and target snapshots are extracted at the same time, so a bare
//! "parse failed" line would not say which side it belongs to. A
//! `ScopedContext` sets a label ("base", "target") for the current thread;
//! records pick it up automatically.
//!
//! ```cpp
//! log::ScopedContext side("base");
//! SEMDIFF_LOG_WARN("extract", path << ":" << line << ": " << message);
//! // 10:42:07.113 WARN  [extract] (base) src/lib.rs:3: expected `;`
//! ```
//!
//! Levels below `SEMDIFF_MIN_LOG_LEVEL` are removed at compile time.

#ifndef SEMDIFF_LOG_HPP
#define SEMDIFF_LOG_HPP

#include <chrono>
#include <cstdint>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace semdiff::log {

// ============================================================================
// Levels
// ============================================================================

enum class LogLevel : int { Trace = 0, Debug, Info, Warn, Error, Fatal, Off };

/// Upper-case level name, padded by the text formatter.
[[nodiscard]] auto level_name(LogLevel level) -> std::string_view;

/// Case-insensitive; accepts "warning" for Warn. `std::nullopt` for anything else.
[[nodiscard]] auto parse_level(std::string_view name) -> std::optional<LogLevel>;

// ============================================================================
// Records and formatting
// ============================================================================

struct LogRecord {
    LogLevel level = LogLevel::Info;
    std::string_view module;
    std::string message;
    std::string context;        ///< Thread context label, may be empty
    const char* file = nullptr;
    int line = 0;
    int64_t timestamp_ms = 0;   ///< Milliseconds since epoch
};

enum class LogFormat {
    Text, ///< `HH:MM:SS.mmm LEVEL [module] (context) message`
    JSON  ///< One object per line: ts, level, module, ctx (if set), msg
};

/// One formatted line, newline included.
[[nodiscard]] auto format_record(const LogRecord& record, LogFormat format, bool colors)
    -> std::string;

[[nodiscard]] inline auto epoch_ms() -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ============================================================================
// Thread context
// ============================================================================

/// Labels every record logged by this thread until destroyed. Nests: the
/// previous label is restored on destruction.
class ScopedContext {
public:
    explicit ScopedContext(std::string label);
    ~ScopedContext();

    ScopedContext(const ScopedContext&) = delete;
    ScopedContext& operator=(const ScopedContext&) = delete;

private:
    std::string saved_;
};

[[nodiscard]] auto current_context() -> const std::string&;

// ============================================================================
// Sinks
// ============================================================================

class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;

    void set_format(LogFormat format) {
        format_ = format;
    }

protected:
    LogFormat format_ = LogFormat::Text;
};

/// stderr; colours only when stderr is a terminal and TERM is not "dumb".
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);

    void write(const LogRecord& record) override;
    void flush() override;

private:
    bool colors_;
};

/// Plain file, never coloured. Error and Fatal records are flushed at once
/// so a failed run leaves its cause on disk.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, bool append = true);

    void write(const LogRecord& record) override;
    void flush() override;

    [[nodiscard]] bool is_open() const {
        return file_.is_open();
    }

private:
    std::ofstream file_;
};

class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

// ============================================================================
// Filter
// ============================================================================

/// Per-module thresholds from a spec such as `extract=trace,vcs=debug,*=warn`.
/// A bare module name means `module=trace`; `*` sets the default. Entries
/// with an unknown level are ignored.
class LogFilter {
public:
    void parse(std::string_view spec);

    [[nodiscard]] bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }
    [[nodiscard]] LogLevel default_level() const {
        return default_level_;
    }

    /// The most verbose threshold in effect for any module.
    [[nodiscard]] LogLevel min_level() const;

private:
    LogLevel default_level_ = LogLevel::Info;
    std::map<std::string, LogLevel, std::less<>> modules_;
};

// ============================================================================
// Logger
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Warn;
    LogFormat format = LogFormat::Text;
    std::string filter_spec;
    std::string log_file; ///< Empty: console only
    bool console = true;
    bool colors = true;
};

/// Process-wide logger shared by the CLI thread and the extraction workers.
/// Until `init()` runs it writes Warn and above to the console.
class Logger {
public:
    static Logger& instance();

    /// Replaces level, filter and sinks. An unopenable log file is reported
    /// on stderr and skipped.
    static void init(const LogConfig& config);

    /// Checked by the macros before the message is built.
    [[nodiscard]] bool should_log(LogLevel level, std::string_view module) const;

    /// Stamps time and thread context, then hands the record to every sink.
    void log(LogLevel level, std::string_view module, std::string message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);
    void clear_sinks();

    void set_level(LogLevel level);
    [[nodiscard]] LogLevel level() const;

    void set_filter(std::string_view spec);

    void flush();

private:
    Logger();

    LogLevel threshold_ = LogLevel::Warn;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Command line
// ============================================================================

/// Builds a LogConfig from `--log-level=`, `--log-filter=`, `--log-file=`,
/// `--log-format=`, `-v`/`-vv`/`-vvv`, `--verbose` and `-q`/`--quiet`.
/// Without any of them the `SEMDIFF_LOG` environment variable is used: a
/// level name, or a filter spec when it contains `=` or `,`.
[[nodiscard]] LogConfig parse_log_options(int argc, char* argv[]);

/// True for arguments `parse_log_options` consumes.
[[nodiscard]] bool is_log_option(std::string_view arg);

// ============================================================================
// Logging Macros
// ============================================================================

// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef SEMDIFF_MIN_LOG_LEVEL
#define SEMDIFF_MIN_LOG_LEVEL 0
#endif

#define SEMDIFF_LOG_IMPL(level, module_str, msg)                                                   \
    do {                                                                                           \
        if (static_cast<int>(level) >= SEMDIFF_MIN_LOG_LEVEL) {                                    \
            auto& logger_ = ::semdiff::log::Logger::instance();                                    \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define SEMDIFF_LOG_TRACE(module, msg)                                                             \
    SEMDIFF_LOG_IMPL(::semdiff::log::LogLevel::Trace, module, msg)
#define SEMDIFF_LOG_DEBUG(module, msg)                                                             \
    SEMDIFF_LOG_IMPL(::semdiff::log::LogLevel::Debug, module, msg)
#define SEMDIFF_LOG_INFO(module, msg) SEMDIFF_LOG_IMPL(::semdiff::log::LogLevel::Info, module, msg)
#define SEMDIFF_LOG_WARN(module, msg) SEMDIFF_LOG_IMPL(::semdiff::log::LogLevel::Warn, module, msg)
#define SEMDIFF_LOG_ERROR(module, msg)                                                             \
    SEMDIFF_LOG_IMPL(::semdiff::log::LogLevel::Error, module, msg)
#define SEMDIFF_LOG_FATAL(module, msg)                                                             \
    SEMDIFF_LOG_IMPL(::semdiff::log::LogLevel::Fatal, module, msg)

} // namespace semdiff::log

#endif // SEMDIFF_LOG_HPP
