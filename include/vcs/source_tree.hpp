//! # Source Tree
//!
//! Decides which files are Rust sources and loads them from a checked-out
//! directory.

#ifndef SEMDIFF_VCS_SOURCE_TREE_HPP
#define SEMDIFF_VCS_SOURCE_TREE_HPP

#include "common.hpp"
#include "snapshot/snapshot.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace semdiff::vcs {

/// Filters tree-relative, `/`-separated paths.
class SourceFilter {
public:
    explicit SourceFilter(std::vector<std::string> excluded = {});

    /// `.rs` files outside `target/`, hidden directories and the excluded
    /// prefixes.
    [[nodiscard]] auto is_rust_source(std::string_view path) const -> bool;

    [[nodiscard]] auto excluded() const -> const std::vector<std::string>& {
        return excluded_;
    }

private:
    std::vector<std::string> excluded_;
};

/// Loads every Rust source below `root`, sorted by path. An unreadable
/// directory or file is `SnapshotUnavailable`.
[[nodiscard]] auto load_directory(const std::filesystem::path& root, const SourceFilter& filter)
    -> Result<std::vector<snapshot::FileContents>, DiffError>;

/// Drops the files whose contents are identical on both sides. Both inputs
/// must be sorted by path.
void retain_changed(std::vector<snapshot::FileContents>& base,
                    std::vector<snapshot::FileContents>& target);

} // namespace semdiff::vcs

#endif // SEMDIFF_VCS_SOURCE_TREE_HPP
