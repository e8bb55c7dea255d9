//! # Report Assembler
//!
//! Regroups a `ChangeSet` into the views the report files are written
//! from. No comparison happens here; every view points into the change set
//! and keeps its order.
//!
//! | View        | Contents                                          |
//! |-------------|---------------------------------------------------|
//! | `all`       | every change record                               |
//! | `functions` | free functions, split into added/modified/deleted |
//! | `types`     | structs, enums and type aliases                   |
//! | `traits`    | traits                                            |
//! | `methods`   | inherent, trait-impl and trait-declared methods   |
//! | `granular`  | body deltas of modified functions and methods     |

#ifndef SEMDIFF_REPORT_REPORT_HPP
#define SEMDIFF_REPORT_REPORT_HPP

#include "diff/differ.hpp"

#include <string>
#include <vector>

namespace semdiff::report {

/// Changes of one entity kind.
struct KindView {
    std::vector<const diff::ChangeRecord*> added;
    std::vector<const diff::ChangeRecord*> modified;
    std::vector<const diff::ChangeRecord*> deleted;

    [[nodiscard]] auto empty() const -> bool {
        return added.empty() && modified.empty() && deleted.empty();
    }

    [[nodiscard]] auto size() const -> size_t {
        return added.size() + modified.size() + deleted.size();
    }
};

/// Body delta of one modified function or method.
struct GranularEntry {
    std::string file;         ///< File of the target version
    std::string display_name; ///< `name` or `Owner.name`
    const diff::ChangeRecord* record = nullptr;
};

/// All report views over one change set. Only valid while the change set
/// is alive.
struct Report {
    std::vector<const diff::ChangeRecord*> all;
    KindView functions;
    KindView types;
    KindView traits;
    KindView methods;
    std::vector<GranularEntry> granular;

    [[nodiscard]] auto view(extract::EntityKind kind) const -> const KindView&;
};

[[nodiscard]] auto assemble_report(const diff::ChangeSet& changes) -> Report;

} // namespace semdiff::report

#endif // SEMDIFF_REPORT_REPORT_HPP
