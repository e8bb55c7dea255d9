//! # Diff Command
//!
//! The whole analysis run: obtain two tree states, build their snapshots,
//! diff them and write the report files.
//!
//! ```text
//! git / directories ─> files ─> SnapshotBuilder ─┐
//!                                                 ├─> Differ ─> Report ─> ReportWriter
//! git / directories ─> files ─> SnapshotBuilder ─┘
//! ```

#ifndef SEMDIFF_CLI_CMD_DIFF_HPP
#define SEMDIFF_CLI_CMD_DIFF_HPP

#include "common.hpp"
#include "config.hpp"
#include "diff/differ.hpp"

#include <string>
#include <vector>

namespace semdiff::cli {

enum class SourceMode {
    Git,         ///< base = branch tip, target = commit of one repository
    Directories, ///< two checked-out trees
};

struct DiffCommand {
    SourceMode mode = SourceMode::Git;
    std::string repo_url;
    std::string local_path;
    std::string branch;
    std::string commit;
    std::string base_dir;
    std::string target_dir;
    DiffSettings settings;
};

/// Counts printed at the end of a run.
struct DiffSummary {
    size_t base_entities = 0;
    size_t target_entities = 0;
    size_t parse_failures = 0;
    std::vector<std::string> warnings;
    diff::ChangeSet changes;
};

/// Builds a `DiffCommand` from the positional arguments and flags (log
/// options already removed). Flags override `config`. Bad arguments are
/// `Usage` errors.
[[nodiscard]] auto parse_diff_args(const std::vector<std::string>& args, const Config& config)
    -> Result<DiffCommand, DiffError>;

/// Runs the pipeline. Nothing is written unless every step succeeded.
[[nodiscard]] auto run_diff(const DiffCommand& command) -> Result<DiffSummary, DiffError>;

/// Prints the change counts and warnings to stdout.
void print_summary(const DiffSummary& summary, const std::string& output_dir);

} // namespace semdiff::cli

#endif // SEMDIFF_CLI_CMD_DIFF_HPP
