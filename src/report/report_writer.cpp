//! # Report Writer
//!
//! JSON shapes of the report files and writing them to disk.

#include "report/report_writer.hpp"

#include "log/log.hpp"

#include <fstream>
#include <map>

namespace semdiff::report {

using namespace json;

namespace {

auto location_to_json(const extract::EntitySpan& span) -> JsonValue {
    auto obj = json_object();
    obj.set("start_line", json_uint(span.start_line));
    obj.set("start_col", json_uint(span.start_col));
    obj.set("end_line", json_uint(span.end_line));
    obj.set("end_col", json_uint(span.end_col));
    obj.set("file_name", json_string(span.file));
    return obj;
}

auto callees_to_json(const std::vector<std::string>& callees) -> JsonValue {
    auto arr = json_array();
    for (const auto& callee : callees) {
        arr.push(json_string(callee));
    }
    return arr;
}

auto calls_to_json(const std::vector<extract::CallSite>& calls) -> JsonValue {
    auto arr = json_array();
    for (const auto& call : calls) {
        auto obj = json_object();
        obj.set("callee", json_string(call.callee));
        obj.set("arg_count", json_uint(call.arg_count));
        arr.push(std::move(obj));
    }
    return arr;
}

auto literals_to_json(const std::vector<extract::LiteralValue>& literals) -> JsonValue {
    auto arr = json_array();
    for (const auto& lit : literals) {
        auto obj = json_object();
        obj.set("type_name", json_string(extract::literal_kind_name(lit.kind)));
        obj.set("value", json_string(lit.value));
        arr.push(std::move(obj));
    }
    return arr;
}

/// Name used in the per-kind files: methods are qualified by their owner.
auto entry_name(const diff::ChangeRecord& record) -> std::string {
    return record.key.display_name();
}

auto kind_entry(const diff::ChangeRecord& record) -> JsonValue {
    auto obj = json_object();
    obj.set("module", json_string(record.key.module));
    obj.set("name", json_string(entry_name(record)));
    obj.set("file", json_string(record.file()));
    if (record.change == diff::ChangeKind::Modified) {
        obj.set("oldCode", json_string(record.old_version->code));
        obj.set("newCode", json_string(record.new_version->code));
    } else if (record.change == diff::ChangeKind::Added) {
        obj.set("code", json_string(record.new_version->code));
    } else {
        obj.set("code", json_string(record.old_version->code));
    }
    return obj;
}

auto change_entry(const diff::ChangeRecord& record) -> JsonValue {
    auto obj = json_object();
    obj.set("kind", json_string(extract::entity_kind_name(record.key.kind)));
    obj.set("change", json_string(diff::change_kind_name(record.change)));
    obj.set("module", json_string(record.key.module));
    obj.set("name", json_string(record.key.name));
    if (!record.key.owner.empty()) {
        obj.set("owner", json_string(record.key.owner));
    }
    if (record.type_kind != extract::TypeSubKind::None) {
        obj.set("type_kind", json_string(extract::type_sub_kind_name(record.type_kind)));
    }
    obj.set("file", json_string(record.file()));

    switch (record.change) {
    case diff::ChangeKind::Added:
        obj.set("code", json_string(record.new_version->code));
        obj.set("signature", json_string(record.new_version->signature));
        break;
    case diff::ChangeKind::Removed:
        obj.set("code", json_string(record.old_version->code));
        obj.set("signature", json_string(record.old_version->signature));
        break;
    case diff::ChangeKind::Modified:
        obj.set("oldCode", json_string(record.old_version->code));
        obj.set("newCode", json_string(record.new_version->code));
        obj.set("oldSignature", json_string(record.old_version->signature));
        obj.set("newSignature", json_string(record.new_version->signature));
        obj.set("body_only", json_bool(record.body_only));
        break;
    }
    return obj;
}

auto granular_entry(const diff::ChangeRecord& record) -> JsonValue {
    const auto& delta = *record.granular;
    auto obj = json_object();
    obj.set("added_functions", callees_to_json(delta.added_callees()));
    obj.set("removed_functions", callees_to_json(delta.removed_callees()));
    obj.set("added_calls", calls_to_json(delta.added_calls));
    obj.set("removed_calls", calls_to_json(delta.removed_calls));
    obj.set("added_literals", literals_to_json(delta.added_literals));
    obj.set("removed_literals", literals_to_json(delta.removed_literals));
    obj.set("old_function_src_loc", location_to_json(record.old_version->span));
    obj.set("new_function_src_loc", location_to_json(record.new_version->span));
    return obj;
}

} // namespace

// ============================================================================
// Rendering
// ============================================================================

auto render_all(const Report& report) -> JsonValue {
    auto arr = json_array();
    for (const auto* record : report.all) {
        arr.push(change_entry(*record));
    }
    return arr;
}

auto render_kind(const KindView& view) -> JsonValue {
    auto list = [](const std::vector<const diff::ChangeRecord*>& records) {
        auto arr = json_array();
        for (const auto* record : records) {
            arr.push(kind_entry(*record));
        }
        return arr;
    };

    auto obj = json_object();
    obj.set("added", list(view.added));
    obj.set("modified", list(view.modified));
    obj.set("deleted", list(view.deleted));
    return obj;
}

auto render_granular(const Report& report) -> JsonValue {
    // Two inline modules of one file may declare the same name; every entry
    // sharing it is then keyed by its full entity key.
    std::map<std::pair<std::string, std::string>, size_t> uses;
    for (const auto& entry : report.granular) {
        ++uses[{entry.file, entry.display_name}];
    }

    auto root = json_object();
    for (const auto& entry : report.granular) {
        bool shared = uses[{entry.file, entry.display_name}] > 1;
        std::string name = shared ? entry.record->key.to_string() : entry.display_name;
        root.object_at(entry.file).set(name, granular_entry(*entry.record));
    }
    return root;
}

auto render_files(const Report& report) -> std::vector<std::pair<std::string, JsonValue>> {
    std::vector<std::pair<std::string, JsonValue>> files;
    files.emplace_back("all_code_changes.json", render_all(report));
    files.emplace_back("function_changes.json", render_kind(report.functions));
    files.emplace_back("type_changes.json", render_kind(report.types));
    files.emplace_back("interface_changes.json", render_kind(report.traits));
    files.emplace_back("method_changes.json", render_kind(report.methods));
    files.emplace_back("function_changes_granular.json", render_granular(report));
    return files;
}

// ============================================================================
// Writing
// ============================================================================

auto ReportWriter::write(const Report& report) const -> Result<Unit, DiffError> {
    namespace fs = std::filesystem;
    auto files = render_files(report);

    std::error_code ec;
    fs::create_directories(output_dir_, ec);
    if (ec) {
        return DiffError{DiffErrorKind::Io, "cannot create output directory '" +
                                                output_dir_.string() + "': " + ec.message()};
    }

    // Stage every file first so a failed run leaves earlier reports untouched
    std::vector<std::pair<fs::path, fs::path>> staged;
    auto discard_staged = [&staged] {
        for (const auto& [temp, _] : staged) {
            std::error_code ignored;
            fs::remove(temp, ignored);
        }
    };

    for (const auto& [name, document] : files) {
        auto path = output_dir_ / name;
        auto temp = output_dir_ / (name + ".tmp");
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            discard_staged();
            return DiffError{DiffErrorKind::Io, "cannot write to " + temp.string()};
        }
        staged.emplace_back(temp, path);
        document.write_pretty(out, 2);
        out << '\n';
        out.close();
        if (!out) {
            discard_staged();
            return DiffError{DiffErrorKind::Io, "failed writing " + temp.string()};
        }
    }

    // Move the previous reports aside, then install the new set. Any failure
    // puts the previous set back.
    std::vector<std::pair<fs::path, fs::path>> backups;
    std::vector<fs::path> installed;
    auto roll_back = [&] {
        std::error_code err;
        for (const auto& path : installed) {
            fs::remove(path, err);
        }
        for (const auto& [path, backup] : backups) {
            fs::rename(backup, path, err);
            if (err) {
                SEMDIFF_LOG_ERROR("report", "cannot restore " << path.string() << " from "
                                                              << backup.string() << ": "
                                                              << err.message());
            }
        }
        discard_staged();
    };

    for (const auto& [temp, path] : staged) {
        if (!fs::is_regular_file(path, ec)) {
            continue;
        }
        auto backup = fs::path(path.string() + ".bak");
        fs::rename(path, backup, ec);
        if (ec) {
            roll_back();
            return DiffError{DiffErrorKind::Io, "cannot move aside " + path.string() + ": " +
                                                    ec.message()};
        }
        backups.emplace_back(path, backup);
    }

    for (const auto& [temp, path] : staged) {
        fs::rename(temp, path, ec);
        if (ec) {
            roll_back();
            return DiffError{DiffErrorKind::Io,
                             "cannot move " + temp.string() + " to " + path.string() + ": " +
                                 ec.message()};
        }
        installed.push_back(path);
        SEMDIFF_LOG_DEBUG("report", "wrote " << path.string());
    }

    for (const auto& [path, backup] : backups) {
        fs::remove(backup, ec);
        if (ec) {
            SEMDIFF_LOG_WARN("report", "cannot remove " << backup.string() << ": " << ec.message());
        }
    }

    SEMDIFF_LOG_INFO("report", "wrote " << files.size() << " report files to "
                                        << output_dir_.string());
    return Unit{};
}

} // namespace semdiff::report
