//! # CLI Dispatcher
//!
//! Entry point of the `semdiff` command line.
//!
//! ```text
//! semdiff_main()
//!   ├─ --help, -h     → print_usage()
//!   ├─ --version, -V  → print_version()
//!   └─ otherwise      → parse_diff_args() → run_diff() → print_summary()
//! ```
//!
//! ## Return Codes
//!
//! | Code | Meaning                                          |
//! |------|--------------------------------------------------|
//! | 0    | Success, all report files written                |
//! | 1    | Fatal analysis error, no report files written    |
//! | 2    | Invalid command line or configuration            |

#include "cmd_diff.hpp"
#include "config.hpp"
#include "driver.hpp"
#include "log/log.hpp"

#include <iostream>
#include <string>
#include <vector>

#ifndef SEMDIFF_VERSION
#define SEMDIFF_VERSION "0.1.0"
#endif

namespace semdiff::cli {

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FATAL = 1;
constexpr int EXIT_USAGE = 2;

void print_usage() {
    std::cout << "semdiff - entity-level diff of Rust source trees\n\n";
    std::cout << "Usage:\n";
    std::cout << "  semdiff <repoUrl> <localRepoPath> <branchName> <currentCommit> [outputPath] "
                 "[options]\n";
    std::cout << "  semdiff --base-dir=<dir> --target-dir=<dir> [outputPath] [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config=<path>       Configuration file (default: semdiff.toml)\n";
    std::cout << "  --threads=<n>         Extraction worker threads (0 = all cores)\n";
    std::cout << "  --changed-only        Analyse only files that differ (default)\n";
    std::cout << "  --all-files           Analyse every Rust file of both trees\n";
    std::cout << "  --exclude=<a,b>       Path prefixes never analysed\n";
    std::cout << "  --output=<dir>        Report directory (default: ./)\n";
    std::cout << "  --log-level=<level>   trace, debug, info, warn, error, off\n";
    std::cout << "  --log-filter=<spec>   Per-module levels, e.g. extract=debug,*=warn\n";
    std::cout << "  --log-file=<path>     Also log to a file\n";
    std::cout << "  --log-format=<fmt>    text or json\n";
    std::cout << "  -v, -vv, -vvv         More output\n";
    std::cout << "  -q, --quiet           Errors only\n";
    std::cout << "  -h, --help            Show this help\n";
    std::cout << "  -V, --version         Show the version\n";
}

void print_version() {
    std::cout << "semdiff " << SEMDIFF_VERSION << "\n";
}

} // namespace

} // namespace semdiff::cli

int semdiff_main(int argc, char* argv[]) {
    using namespace semdiff;
    using namespace semdiff::cli;

    log::Logger::init(log::parse_log_options(argc, argv));

    std::vector<std::string> args;
    std::string config_path;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage();
            return EXIT_OK;
        }
        if (arg == "--version" || arg == "-V") {
            print_version();
            return EXIT_OK;
        }
        if (log::is_log_option(arg)) {
            continue;
        }
        if (arg.starts_with("--config=")) {
            config_path = arg.substr(9);
        }
        args.push_back(std::move(arg));
    }

    if (args.empty()) {
        print_usage();
        return EXIT_USAGE;
    }

    auto config = Config::load_or_default(config_path);
    if (is_err(config)) {
        std::cerr << "error: " << unwrap_err(config).message << "\n";
        return EXIT_USAGE;
    }

    auto command = parse_diff_args(args, unwrap(config));
    if (is_err(command)) {
        std::cerr << "error: " << unwrap_err(command).message << "\n";
        std::cerr << "Run 'semdiff --help' for usage.\n";
        return EXIT_USAGE;
    }

    auto summary = run_diff(unwrap(command));
    if (is_err(summary)) {
        const auto& error = unwrap_err(summary);
        SEMDIFF_LOG_ERROR("cli", diff_error_kind_name(error.kind) << ": " << error.message);
        std::cerr << "error: " << diff_error_kind_name(error.kind) << ": " << error.message
                  << "\n";
        log::Logger::instance().flush();
        return error.kind == DiffErrorKind::Usage ? EXIT_USAGE : EXIT_FATAL;
    }

    print_summary(unwrap(summary), unwrap(command).settings.output_dir);
    log::Logger::instance().flush();
    return EXIT_OK;
}
