//! # Logging Options
//!
//! Turns the logging flags of the command line, or the SEMDIFF_LOG
//! environment variable, into a LogConfig.

#include "log/log.hpp"

#include <algorithm>
#include <array>
#include <cstdlib>

namespace semdiff::log {

namespace {

constexpr std::array<std::string_view, 4> kValueOptions = {
    "--log-level=", "--log-filter=", "--log-file=", "--log-format="};

/// `-v`, `-vv`, `-vvv`, ...
bool is_verbosity(std::string_view arg) {
    return arg.size() >= 2 && arg[0] == '-' &&
           arg.find_first_not_of('v', 1) == std::string_view::npos;
}

auto verbosity_level(int count) -> LogLevel {
    switch (count) {
    case 1:
        return LogLevel::Info;
    case 2:
        return LogLevel::Debug;
    default:
        return LogLevel::Trace;
    }
}

} // namespace

bool is_log_option(std::string_view arg) {
    for (auto prefix : kValueOptions) {
        if (arg.starts_with(prefix)) {
            return true;
        }
    }
    return arg == "-q" || arg == "--quiet" || arg == "--verbose" || is_verbosity(arg);
}

LogConfig parse_log_options(int argc, char* argv[]) {
    LogConfig config;
    std::optional<LogLevel> explicit_level;
    int verbosity = 0;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        auto value = arg.substr(arg.find('=') + 1);

        if (arg.starts_with("--log-level=")) {
            if (auto level = parse_level(value)) {
                explicit_level = level;
            }
        } else if (arg.starts_with("--log-filter=")) {
            config.filter_spec = std::string(value);
        } else if (arg.starts_with("--log-file=")) {
            config.log_file = std::string(value);
        } else if (arg.starts_with("--log-format=")) {
            config.format = (value == "json" || value == "JSON") ? LogFormat::JSON : LogFormat::Text;
        } else if (arg == "-q" || arg == "--quiet") {
            explicit_level = LogLevel::Error;
        } else if (arg == "--verbose") {
            verbosity = std::max(verbosity, 1);
        } else if (is_verbosity(arg)) {
            verbosity = std::max(verbosity, static_cast<int>(arg.size()) - 1);
        }
    }

    if (explicit_level) {
        config.level = *explicit_level;
        return config;
    }
    if (verbosity > 0) {
        config.level = verbosity_level(verbosity);
        return config;
    }
    if (!config.filter_spec.empty()) {
        return config;
    }

    const char* env = std::getenv("SEMDIFF_LOG");
    std::string_view env_spec = env != nullptr ? env : "";
    if (env_spec.find_first_of("=,") != std::string_view::npos) {
        config.filter_spec = std::string(env_spec);
    } else if (auto level = parse_level(env_spec)) {
        config.level = *level;
    }
    return config;
}

} // namespace semdiff::log
