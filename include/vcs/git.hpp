//! # Git Repository
//!
//! Obtains tree states by driving the `git` executable. Files are read
//! straight from the object database with `git show <rev>:<path>`, so the
//! working tree is never checked out and both revisions can be loaded
//! side by side.
//!
//! Any failure to obtain a tree state is `SnapshotUnavailable`.

#ifndef SEMDIFF_VCS_GIT_HPP
#define SEMDIFF_VCS_GIT_HPP

#include "common.hpp"
#include "snapshot/snapshot.hpp"
#include "vcs/source_tree.hpp"

#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace semdiff::vcs {

struct CommandOutput {
    std::string output;
    int exit_code = -1;
};

/// Runs a shell command and captures its standard output (and standard
/// error when `merge_stderr` is set).
[[nodiscard]] auto run_command(const std::string& cmd, bool merge_stderr) -> CommandOutput;

/// Single-quotes `arg` for a POSIX shell.
[[nodiscard]] auto shell_quote(std::string_view arg) -> std::string;

class GitRepository {
public:
    explicit GitRepository(std::filesystem::path path) : path_(std::move(path)) {}

    /// Clones `url` into `path`, or refreshes an existing clone (remote URL
    /// and `fetch --all`; failures there are only warnings).
    [[nodiscard]] static auto ensure_clone(const std::string& url,
                                           const std::filesystem::path& path)
        -> Result<GitRepository, DiffError>;

    /// Full commit id of `rev`, falling back to `origin/<rev>` for branches
    /// that only exist on the remote.
    [[nodiscard]] auto resolve(const std::string& rev) const -> Result<std::string, DiffError>;

    /// Every file path of the tree at `rev`.
    [[nodiscard]] auto list_files(const std::string& rev) const
        -> Result<std::vector<std::string>, DiffError>;

    /// Paths that differ between two revisions.
    [[nodiscard]] auto changed_files(const std::string& base, const std::string& target) const
        -> Result<std::vector<std::string>, DiffError>;

    /// Paths that exist in `target` but not in `base`.
    [[nodiscard]] auto added_files(const std::string& base, const std::string& target) const
        -> Result<std::vector<std::string>, DiffError>;

    /// Paths that exist in `base` but not in `target`.
    [[nodiscard]] auto deleted_files(const std::string& base, const std::string& target) const
        -> Result<std::vector<std::string>, DiffError>;

    [[nodiscard]] auto read_file(const std::string& rev, const std::string& path) const
        -> Result<std::string, DiffError>;

    /// Rust sources of `rev` accepted by `filter`, sorted by path. With
    /// `only`, paths outside that set are skipped.
    [[nodiscard]] auto load_tree(const std::string& rev, const SourceFilter& filter,
                                 const std::set<std::string>* only = nullptr) const
        -> Result<std::vector<snapshot::FileContents>, DiffError>;

    [[nodiscard]] auto path() const -> const std::filesystem::path& {
        return path_;
    }

private:
    std::filesystem::path path_;

    [[nodiscard]] auto git(const std::vector<std::string>& args, bool merge_stderr) const
        -> CommandOutput;

    [[nodiscard]] auto name_list(const std::vector<std::string>& args) const
        -> Result<std::vector<std::string>, DiffError>;
};

} // namespace semdiff::vcs

#endif // SEMDIFF_VCS_GIT_HPP
