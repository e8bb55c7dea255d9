#include "diff/granular.hpp"

#include "log/log.hpp"

#include <algorithm>

namespace semdiff::diff {

namespace {

auto distinct_callees(const std::vector<extract::CallSite>& calls) -> std::vector<std::string> {
    std::vector<std::string> out;
    for (const auto& call : calls) {
        if (std::find(out.begin(), out.end(), call.callee) == out.end()) {
            out.push_back(call.callee);
        }
    }
    return out;
}

} // namespace

auto GranularDiff::added_callees() const -> std::vector<std::string> {
    return distinct_callees(added_calls);
}

auto GranularDiff::removed_callees() const -> std::vector<std::string> {
    return distinct_callees(removed_calls);
}

auto granular_diff(const extract::EntityRecord& base, const extract::EntityRecord& target)
    -> Result<GranularDiff, DiffError> {
    if (!base.has_body_contents() || !target.has_body_contents()) {
        return DiffError{DiffErrorKind::InternalInconsistency,
                         "granular diff requested for " +
                             std::string(extract::entity_kind_name(target.key.kind)) + " '" +
                             target.key.to_string() + "'"};
    }
    if (!(base.key == target.key)) {
        return DiffError{DiffErrorKind::InternalInconsistency,
                         "granular diff of unrelated entities '" + base.key.to_string() +
                             "' and '" + target.key.to_string() + "'"};
    }

    auto calls = multiset_diff(base.calls, target.calls);
    auto literals = multiset_diff(base.literals, target.literals);

    GranularDiff diff{
        .added_calls = std::move(calls.added),
        .removed_calls = std::move(calls.removed),
        .added_literals = std::move(literals.added),
        .removed_literals = std::move(literals.removed),
    };

    SEMDIFF_LOG_DEBUG("granular", target.key.to_string()
                                      << ": +" << diff.added_calls.size() << " calls, -"
                                      << diff.removed_calls.size() << " calls, +"
                                      << diff.added_literals.size() << " literals, -"
                                      << diff.removed_literals.size() << " literals");
    return diff;
}

} // namespace semdiff::diff
