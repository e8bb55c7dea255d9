//! # Granular Body Differ
//!
//! Net change in call and literal usage between two versions of a function.
//!
//! Calls and literals are compared as multisets: for every distinct item
//! with base count `b` and target count `t`, `max(0, t - b)` copies are
//! added and `max(0, b - t)` copies removed. Moving a call around the body
//! changes neither count, calling it twice as often adds one copy.
//!
//! ```text
//! base:   g(x) + 1             calls {g/1}        literals {1}
//! target: g(x) + g(x) + 2      calls {g/1, g/1}   literals {2}
//! delta:  +g/1                 +2  -1
//! ```

#ifndef SEMDIFF_DIFF_GRANULAR_HPP
#define SEMDIFF_DIFF_GRANULAR_HPP

#include "common.hpp"
#include "extract/entity.hpp"

#include <map>
#include <utility>
#include <vector>

namespace semdiff::diff {

/// Added and removed copies of a multiset comparison, each in ascending
/// item order with one entry per unit of count difference.
template <typename T> struct MultisetDelta {
    std::vector<T> added;
    std::vector<T> removed;
};

/// Multiset difference of `base` and `target` through frequency maps.
template <typename T>
[[nodiscard]] auto multiset_diff(const std::vector<T>& base, const std::vector<T>& target)
    -> MultisetDelta<T> {
    std::map<T, std::pair<size_t, size_t>> counts;
    for (const auto& item : base) {
        ++counts[item].first;
    }
    for (const auto& item : target) {
        ++counts[item].second;
    }

    MultisetDelta<T> delta;
    for (const auto& [item, count] : counts) {
        auto [in_base, in_target] = count;
        if (in_target > in_base) {
            delta.added.insert(delta.added.end(), in_target - in_base, item);
        } else if (in_base > in_target) {
            delta.removed.insert(delta.removed.end(), in_base - in_target, item);
        }
    }
    return delta;
}

/// Call and literal delta of one modified function or method.
struct GranularDiff {
    std::vector<extract::CallSite> added_calls;
    std::vector<extract::CallSite> removed_calls;
    std::vector<extract::LiteralValue> added_literals;
    std::vector<extract::LiteralValue> removed_literals;

    [[nodiscard]] auto empty() const -> bool {
        return added_calls.empty() && removed_calls.empty() && added_literals.empty() &&
               removed_literals.empty();
    }

    /// Distinct callees of `added_calls`, first occurrence order.
    [[nodiscard]] auto added_callees() const -> std::vector<std::string>;

    /// Distinct callees of `removed_calls`, first occurrence order.
    [[nodiscard]] auto removed_callees() const -> std::vector<std::string>;
};

/// Diffs the bodies of two versions of one function or method.
///
/// Returns `InternalInconsistency` when the records are not functions or
/// methods, or do not share a key.
[[nodiscard]] auto granular_diff(const extract::EntityRecord& base,
                                 const extract::EntityRecord& target)
    -> Result<GranularDiff, DiffError>;

} // namespace semdiff::diff

#endif // SEMDIFF_DIFF_GRANULAR_HPP
