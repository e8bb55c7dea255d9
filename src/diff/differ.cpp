#include "diff/differ.hpp"

#include "log/log.hpp"

#include <array>
#include <thread>

namespace semdiff::diff {

namespace {

auto version_of(const extract::EntityRecord& record) -> EntityVersion {
    return EntityVersion{
        .signature = record.signature,
        .code = record.code,
        .span = record.span,
    };
}

auto added(const extract::EntityRecord& record) -> ChangeRecord {
    return ChangeRecord{
        .key = record.key,
        .change = ChangeKind::Added,
        .type_kind = record.type_kind,
        .new_version = version_of(record),
    };
}

auto removed(const extract::EntityRecord& record) -> ChangeRecord {
    return ChangeRecord{
        .key = record.key,
        .change = ChangeKind::Removed,
        .type_kind = record.type_kind,
        .old_version = version_of(record),
    };
}

/// Modified record for two versions of one key, or `std::nullopt` when they
/// are equivalent.
auto compare(const extract::EntityRecord& old_record, const extract::EntityRecord& new_record)
    -> Result<std::optional<ChangeRecord>, DiffError> {
    bool signature_changed = old_record.signature != new_record.signature;
    bool body_changed = old_record.has_body_contents() &&
                        !(old_record.body_fingerprint == new_record.body_fingerprint);
    if (!signature_changed && !body_changed) {
        return std::optional<ChangeRecord>{};
    }

    ChangeRecord record{
        .key = new_record.key,
        .change = ChangeKind::Modified,
        .type_kind = new_record.type_kind,
        .old_version = version_of(old_record),
        .new_version = version_of(new_record),
        .body_only = !signature_changed,
    };

    if (new_record.has_body_contents()) {
        auto granular = granular_diff(old_record, new_record);
        if (is_err(granular)) {
            return unwrap_err(granular);
        }
        record.granular = std::move(unwrap(granular));
    }
    return std::optional<ChangeRecord>{std::move(record)};
}

} // namespace

auto ChangeSet::count(extract::EntityKind kind, ChangeKind change) const -> size_t {
    size_t n = 0;
    for (const auto& record : changes) {
        if (record.key.kind == kind && record.change == change) {
            ++n;
        }
    }
    return n;
}

auto Differ::diff_kind(extract::EntityKind kind, const snapshot::Snapshot& base,
                       const snapshot::Snapshot& target)
    -> Result<std::vector<ChangeRecord>, DiffError> {
    auto old_records = base.of_kind(kind);
    auto new_records = target.of_kind(kind);

    // Both lists are in key order: walk them together
    std::vector<ChangeRecord> changes;
    size_t i = 0;
    size_t j = 0;
    while (i < old_records.size() || j < new_records.size()) {
        if (j == new_records.size() ||
            (i < old_records.size() && old_records[i]->key < new_records[j]->key)) {
            changes.push_back(removed(*old_records[i++]));
        } else if (i == old_records.size() || new_records[j]->key < old_records[i]->key) {
            changes.push_back(added(*new_records[j++]));
        } else {
            auto result = compare(*old_records[i++], *new_records[j++]);
            if (is_err(result)) {
                return unwrap_err(result);
            }
            auto& modified = unwrap(result);
            if (modified) {
                changes.push_back(std::move(*modified));
            }
        }
    }

    SEMDIFF_LOG_DEBUG("diff", extract::entity_kind_name(kind)
                                  << ": " << old_records.size() << " base, " << new_records.size()
                                  << " target, " << changes.size() << " changes");
    return changes;
}

auto Differ::diff(const snapshot::Snapshot* base, const snapshot::Snapshot* target) const
    -> Result<ChangeSet, DiffError> {
    if (base == nullptr || target == nullptr) {
        return DiffError{DiffErrorKind::SnapshotUnavailable,
                         std::string(base == nullptr ? "base" : "target") +
                             " snapshot is not available"};
    }

    std::array<Result<std::vector<ChangeRecord>, DiffError>, extract::ALL_ENTITY_KINDS.size()>
        per_kind;

    if (options_.parallel_kinds && options_.threads != 1) {
        std::vector<std::thread> workers;
        for (size_t k = 0; k < extract::ALL_ENTITY_KINDS.size(); ++k) {
            workers.emplace_back([&per_kind, k, base, target] {
                per_kind[k] = diff_kind(extract::ALL_ENTITY_KINDS[k], *base, *target);
            });
        }
        for (auto& worker : workers) {
            worker.join();
        }
    } else {
        for (size_t k = 0; k < extract::ALL_ENTITY_KINDS.size(); ++k) {
            per_kind[k] = diff_kind(extract::ALL_ENTITY_KINDS[k], *base, *target);
        }
    }

    ChangeSet set;
    set.base_revision = base->revision();
    set.target_revision = target->revision();
    for (auto& result : per_kind) {
        if (is_err(result)) {
            return unwrap_err(result);
        }
        auto& records = unwrap(result);
        set.changes.insert(set.changes.end(), std::make_move_iterator(records.begin()),
                           std::make_move_iterator(records.end()));
    }

    for (const auto* side : {base, target}) {
        for (const auto& failure : side->parse_failures()) {
            set.warnings.push_back(side->revision() + ": " + failure.path + ":" +
                                   std::to_string(failure.line) + ":" +
                                   std::to_string(failure.column) + ": " + failure.message);
        }
        for (const auto& warning : side->warnings()) {
            set.warnings.push_back(side->revision() + ": " + warning);
        }
    }

    SEMDIFF_LOG_INFO("diff", set.base_revision << " -> " << set.target_revision << ": "
                                               << set.changes.size() << " changes, "
                                               << set.warnings.size() << " warnings");
    return set;
}

} // namespace semdiff::diff
