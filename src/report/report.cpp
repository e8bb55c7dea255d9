#include "report/report.hpp"

namespace semdiff::report {

auto Report::view(extract::EntityKind kind) const -> const KindView& {
    switch (kind) {
    case extract::EntityKind::Function:
        return functions;
    case extract::EntityKind::Type:
        return types;
    case extract::EntityKind::Trait:
        return traits;
    case extract::EntityKind::Method:
        return methods;
    }
    return functions;
}

namespace {

auto kind_view(Report& report, extract::EntityKind kind) -> KindView& {
    switch (kind) {
    case extract::EntityKind::Function:
        return report.functions;
    case extract::EntityKind::Type:
        return report.types;
    case extract::EntityKind::Trait:
        return report.traits;
    case extract::EntityKind::Method:
        return report.methods;
    }
    return report.functions;
}

} // namespace

auto assemble_report(const diff::ChangeSet& changes) -> Report {
    Report report;
    for (const auto& record : changes.changes) {
        report.all.push_back(&record);

        auto& view = kind_view(report, record.key.kind);
        switch (record.change) {
        case diff::ChangeKind::Added:
            view.added.push_back(&record);
            break;
        case diff::ChangeKind::Modified:
            view.modified.push_back(&record);
            break;
        case diff::ChangeKind::Removed:
            view.deleted.push_back(&record);
            break;
        }

        if (record.granular) {
            report.granular.push_back(GranularEntry{
                .file = record.file(),
                .display_name = record.key.display_name(),
                .record = &record,
            });
        }
    }
    return report;
}

} // namespace semdiff::report
