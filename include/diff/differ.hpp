//! # Entity Matcher & Differ
//!
//! Compares two snapshots key by key and classifies every entity as
//! Added, Removed, Modified or Unchanged. Unchanged entities produce no
//! record.
//!
//! ## Classification
//!
//! | Present in    | Signatures | Fingerprints | Result                     |
//! |---------------|------------|--------------|----------------------------|
//! | base only     |            |              | Removed                    |
//! | target only   |            |              | Added                      |
//! | both          | differ     | any          | Modified                   |
//! | both          | equal      | differ       | Modified, `body_only`      |
//! | both          | equal      | equal        | Unchanged (no record)      |
//!
//! Modified functions and methods carry a `GranularDiff`.
//!
//! ## Ordering
//!
//! Records are grouped by kind (function, type, trait, method) and ordered
//! by key within a kind, independent of thread scheduling.

#ifndef SEMDIFF_DIFF_DIFFER_HPP
#define SEMDIFF_DIFF_DIFFER_HPP

#include "common.hpp"
#include "diff/granular.hpp"
#include "snapshot/snapshot.hpp"

#include <optional>
#include <string>
#include <vector>

namespace semdiff::diff {

enum class ChangeKind : uint8_t {
    Added,
    Removed,
    Modified,
};

[[nodiscard]] constexpr auto change_kind_name(ChangeKind kind) -> const char* {
    switch (kind) {
    case ChangeKind::Added:
        return "added";
    case ChangeKind::Removed:
        return "removed";
    case ChangeKind::Modified:
        return "modified";
    }
    return "unknown";
}

/// One side of a change: what the entity looked like in one snapshot.
struct EntityVersion {
    std::string signature;
    std::string code;
    extract::EntitySpan span;
};

struct ChangeRecord {
    extract::EntityKey key;
    ChangeKind change = ChangeKind::Added;
    extract::TypeSubKind type_kind = extract::TypeSubKind::None;
    std::optional<EntityVersion> old_version; ///< Removed and Modified
    std::optional<EntityVersion> new_version; ///< Added and Modified
    bool body_only = false;                   ///< Modified with equal signatures
    std::optional<GranularDiff> granular;     ///< Modified functions and methods

    [[nodiscard]] auto old_signature() const -> std::string {
        return old_version ? old_version->signature : std::string{};
    }

    [[nodiscard]] auto new_signature() const -> std::string {
        return new_version ? new_version->signature : std::string{};
    }

    /// File of the newest version.
    [[nodiscard]] auto file() const -> const std::string& {
        return new_version ? new_version->span.file : old_version->span.file;
    }
};

/// The result of a diff run.
struct ChangeSet {
    std::string base_revision;
    std::string target_revision;
    std::vector<ChangeRecord> changes;
    std::vector<std::string> warnings; ///< Parse failures of either side

    [[nodiscard]] auto count(extract::EntityKind kind, ChangeKind change) const -> size_t;
};

struct DiffOptions {
    unsigned threads = 0;       ///< 1 keeps the whole diff on the calling thread
    bool parallel_kinds = true; ///< Compare the four kinds on separate threads
};

class Differ {
public:
    explicit Differ(DiffOptions options = {}) : options_(options) {}

    /// Diffs `base` against `target`. A null snapshot is
    /// `SnapshotUnavailable`.
    [[nodiscard]] auto diff(const snapshot::Snapshot* base,
                            const snapshot::Snapshot* target) const
        -> Result<ChangeSet, DiffError>;

    /// Classifies the entities of one kind.
    [[nodiscard]] static auto diff_kind(extract::EntityKind kind, const snapshot::Snapshot& base,
                                        const snapshot::Snapshot& target)
        -> Result<std::vector<ChangeRecord>, DiffError>;

private:
    DiffOptions options_;
};

} // namespace semdiff::diff

#endif // SEMDIFF_DIFF_DIFFER_HPP
