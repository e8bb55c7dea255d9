//! # Snapshot
//!
//! All entities of one tree state, keyed by `EntityKey`.
//!
//! A `Snapshot` is produced by `SnapshotBuilder` and never changes
//! afterwards; every accessor is `const`, so two snapshots can be compared
//! from several threads without locking.
//!
//! Besides the entity map it records which keys came from which file and
//! the files that failed to parse.

#ifndef SEMDIFF_SNAPSHOT_SNAPSHOT_HPP
#define SEMDIFF_SNAPSHOT_SNAPSHOT_HPP

#include "extract/entity.hpp"
#include "json/json_value.hpp"

#include <map>
#include <string>
#include <vector>

namespace semdiff::snapshot {

/// A file handed to the builder: `/`-separated path relative to the tree
/// root and its contents.
struct FileContents {
    std::string path;
    std::string contents;
};

class Snapshot {
public:
    Snapshot() = default;

    [[nodiscard]] auto revision() const -> const std::string& {
        return revision_;
    }

    /// The record for `key`, or `nullptr`.
    [[nodiscard]] auto find(const extract::EntityKey& key) const -> const extract::EntityRecord*;

    [[nodiscard]] auto contains(const extract::EntityKey& key) const -> bool {
        return entities_.contains(key);
    }

    /// All records in key order (kind, module, owner, name).
    [[nodiscard]] auto entities() const
        -> const std::map<extract::EntityKey, extract::EntityRecord>& {
        return entities_;
    }

    /// Records of one kind in key order.
    [[nodiscard]] auto of_kind(extract::EntityKind kind) const
        -> std::vector<const extract::EntityRecord*>;

    /// Keys per file, for every file that was extracted (failed files
    /// included, with no keys).
    [[nodiscard]] auto files() const -> const std::map<std::string, std::vector<extract::EntityKey>>& {
        return files_;
    }

    [[nodiscard]] auto parse_failures() const -> const std::vector<extract::ParseFailure>& {
        return failures_;
    }

    [[nodiscard]] auto warnings() const -> const std::vector<std::string>& {
        return warnings_;
    }

    [[nodiscard]] auto size() const -> size_t {
        return entities_.size();
    }

    /// Full deterministic dump (entities, files, failures).
    [[nodiscard]] auto to_json() const -> json::JsonValue;

private:
    friend class SnapshotBuilder;

    std::string revision_;
    std::map<extract::EntityKey, extract::EntityRecord> entities_;
    std::map<std::string, std::vector<extract::EntityKey>> files_;
    std::vector<extract::ParseFailure> failures_;
    std::vector<std::string> warnings_;
};

} // namespace semdiff::snapshot

#endif // SEMDIFF_SNAPSHOT_SNAPSHOT_HPP
