//! # Diff Command
//!
//! Argument handling and the analysis pipeline.

#include "cmd_diff.hpp"

#include "log/log.hpp"
#include "report/report_writer.hpp"
#include "snapshot/snapshot_builder.hpp"
#include "vcs/git.hpp"
#include "vcs/source_tree.hpp"

#include <iostream>
#include <set>
#include <thread>

namespace semdiff::cli {

namespace {

using TreePair = std::pair<std::vector<snapshot::FileContents>, std::vector<snapshot::FileContents>>;

struct Revisions {
    std::string base;
    std::string target;
};

auto usage_error(const std::string& message) -> DiffError {
    return DiffError{DiffErrorKind::Usage, message};
}

auto load_git_trees(const DiffCommand& command, const vcs::SourceFilter& filter, Revisions& revs)
    -> Result<TreePair, DiffError> {
    auto repo_result = vcs::GitRepository::ensure_clone(command.repo_url, command.local_path);
    if (is_err(repo_result)) {
        return unwrap_err(repo_result);
    }
    const auto& repo = unwrap(repo_result);

    auto base = repo.resolve(command.branch);
    if (is_err(base)) {
        return unwrap_err(base);
    }
    auto target = repo.resolve(command.commit);
    if (is_err(target)) {
        return unwrap_err(target);
    }
    revs.base = unwrap(base);
    revs.target = unwrap(target);

    std::set<std::string> changed;
    const std::set<std::string>* only = nullptr;
    if (command.settings.changed_only) {
        auto paths = repo.changed_files(revs.base, revs.target);
        if (is_err(paths)) {
            return unwrap_err(paths);
        }
        changed.insert(unwrap(paths).begin(), unwrap(paths).end());
        only = &changed;
        SEMDIFF_LOG_INFO("cli", changed.size() << " files differ between " << command.branch
                                               << " and " << command.commit);
    }

    auto base_files = repo.load_tree(revs.base, filter, only);
    if (is_err(base_files)) {
        return unwrap_err(base_files);
    }
    auto target_files = repo.load_tree(revs.target, filter, only);
    if (is_err(target_files)) {
        return unwrap_err(target_files);
    }
    return TreePair{std::move(unwrap(base_files)), std::move(unwrap(target_files))};
}

auto load_directory_trees(const DiffCommand& command, const vcs::SourceFilter& filter,
                          Revisions& revs) -> Result<TreePair, DiffError> {
    auto base_files = vcs::load_directory(command.base_dir, filter);
    if (is_err(base_files)) {
        return unwrap_err(base_files);
    }
    auto target_files = vcs::load_directory(command.target_dir, filter);
    if (is_err(target_files)) {
        return unwrap_err(target_files);
    }

    revs.base = command.base_dir;
    revs.target = command.target_dir;
    TreePair trees{std::move(unwrap(base_files)), std::move(unwrap(target_files))};
    if (command.settings.changed_only) {
        vcs::retain_changed(trees.first, trees.second);
    }
    return trees;
}

auto parse_threads(const std::string& text) -> Result<unsigned, DiffError> {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos ||
        text.size() > 6) {
        return usage_error("--threads expects a non-negative integer, got '" + text + "'");
    }
    return static_cast<unsigned>(std::stoul(text));
}

} // namespace

// ============================================================================
// Arguments
// ============================================================================

auto parse_diff_args(const std::vector<std::string>& args, const Config& config)
    -> Result<DiffCommand, DiffError> {
    DiffCommand command;
    command.settings = config.diff;

    std::vector<std::string> positional;
    for (const auto& arg : args) {
        if (arg.starts_with("--base-dir=")) {
            command.base_dir = arg.substr(11);
        } else if (arg.starts_with("--target-dir=")) {
            command.target_dir = arg.substr(13);
        } else if (arg.starts_with("--threads=")) {
            auto threads = parse_threads(arg.substr(10));
            if (is_err(threads)) {
                return unwrap_err(threads);
            }
            command.settings.threads = unwrap(threads);
        } else if (arg == "--all-files") {
            command.settings.changed_only = false;
        } else if (arg == "--changed-only") {
            command.settings.changed_only = true;
        } else if (arg.starts_with("--exclude=")) {
            command.settings.exclude = split_list(arg.substr(10));
        } else if (arg.starts_with("--output=")) {
            command.settings.output_dir = arg.substr(9);
        } else if (arg.starts_with("--config=")) {
            // Consumed by the dispatcher
        } else if (arg.starts_with("-") && arg.size() > 1) {
            return usage_error("unknown option '" + arg + "'");
        } else {
            positional.push_back(arg);
        }
    }

    bool has_dirs = !command.base_dir.empty() || !command.target_dir.empty();
    if (has_dirs) {
        if (command.base_dir.empty() || command.target_dir.empty()) {
            return usage_error("--base-dir and --target-dir must be given together");
        }
        if (positional.size() > 1) {
            return usage_error("unexpected argument '" + positional[1] + "'");
        }
        command.mode = SourceMode::Directories;
        if (positional.size() == 1) {
            command.settings.output_dir = positional[0];
        }
        return command;
    }

    if (positional.size() < 4) {
        return usage_error("expected <repoUrl> <localRepoPath> <branchName> <currentCommit>");
    }
    if (positional.size() > 5) {
        return usage_error("unexpected argument '" + positional[5] + "'");
    }
    command.mode = SourceMode::Git;
    command.repo_url = positional[0];
    command.local_path = positional[1];
    command.branch = positional[2];
    command.commit = positional[3];
    if (positional.size() == 5) {
        command.settings.output_dir = positional[4];
    }
    return command;
}

// ============================================================================
// Pipeline
// ============================================================================

auto run_diff(const DiffCommand& command) -> Result<DiffSummary, DiffError> {
    vcs::SourceFilter filter(command.settings.exclude);
    Revisions revs;

    auto trees = command.mode == SourceMode::Git ? load_git_trees(command, filter, revs)
                                                 : load_directory_trees(command, filter, revs);
    if (is_err(trees)) {
        return unwrap_err(trees);
    }
    auto& base_files = unwrap(trees).first;
    auto& target_files = unwrap(trees).second;
    SEMDIFF_LOG_INFO("cli", "analysing " << base_files.size() << " base and "
                                         << target_files.size() << " target files");

    // Both snapshots at once; each builder runs its own workers
    snapshot::BuildOptions build_options{.threads = command.settings.threads};
    snapshot::SnapshotBuilder base_builder(build_options);
    snapshot::SnapshotBuilder target_builder(build_options);

    Result<snapshot::Snapshot, DiffError> base_snapshot = DiffError{};
    std::thread base_thread([&] {
        log::ScopedContext side("base");
        base_snapshot = base_builder.build(revs.base, std::move(base_files));
    });
    auto target_snapshot = [&] {
        log::ScopedContext side("target");
        return target_builder.build(revs.target, std::move(target_files));
    }();
    base_thread.join();

    if (is_err(base_snapshot)) {
        return unwrap_err(base_snapshot);
    }
    if (is_err(target_snapshot)) {
        return unwrap_err(target_snapshot);
    }
    const auto& base = unwrap(base_snapshot);
    const auto& target = unwrap(target_snapshot);

    diff::Differ differ(diff::DiffOptions{.threads = command.settings.threads});
    auto changes = differ.diff(&base, &target);
    if (is_err(changes)) {
        return unwrap_err(changes);
    }

    DiffSummary summary{
        .base_entities = base.size(),
        .target_entities = target.size(),
        .parse_failures = base.parse_failures().size() + target.parse_failures().size(),
        .warnings = {},
        .changes = std::move(unwrap(changes)),
    };
    summary.warnings = summary.changes.warnings;

    auto report = report::assemble_report(summary.changes);
    report::ReportWriter writer(command.settings.output_dir);
    auto written = writer.write(report);
    if (is_err(written)) {
        return unwrap_err(written);
    }

    for (const auto& warning : summary.warnings) {
        SEMDIFF_LOG_WARN("cli", warning);
    }
    return summary;
}

void print_summary(const DiffSummary& summary, const std::string& output_dir) {
    std::cout << "Entities: " << summary.base_entities << " base, " << summary.target_entities
              << " target\n";
    for (auto kind : extract::ALL_ENTITY_KINDS) {
        std::cout << "  " << extract::entity_kind_name(kind) << ": "
                  << summary.changes.count(kind, diff::ChangeKind::Added) << " added, "
                  << summary.changes.count(kind, diff::ChangeKind::Modified) << " modified, "
                  << summary.changes.count(kind, diff::ChangeKind::Removed) << " removed\n";
    }
    std::cout << "Parse failures: " << summary.parse_failures << "\n";
    std::cout << "Reports written to " << output_dir << "\n";
}

} // namespace semdiff::cli
