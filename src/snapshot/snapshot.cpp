//! # Snapshot
//!
//! Lookup and JSON dump of a built snapshot.

#include "snapshot/snapshot.hpp"

namespace semdiff::snapshot {

using namespace json;

auto Snapshot::find(const extract::EntityKey& key) const -> const extract::EntityRecord* {
    auto it = entities_.find(key);
    return it == entities_.end() ? nullptr : &it->second;
}

auto Snapshot::of_kind(extract::EntityKind kind) const
    -> std::vector<const extract::EntityRecord*> {
    std::vector<const extract::EntityRecord*> out;
    for (const auto& [key, record] : entities_) {
        if (key.kind == kind) {
            out.push_back(&record);
        }
    }
    return out;
}

namespace {

auto key_to_json(const extract::EntityKey& key) -> JsonValue {
    auto obj = json_object();
    obj.set("kind", json_string(extract::entity_kind_name(key.kind)));
    obj.set("module", json_string(key.module));
    obj.set("name", json_string(key.name));
    if (!key.owner.empty()) {
        obj.set("owner", json_string(key.owner));
    }
    return obj;
}

auto record_to_json(const extract::EntityRecord& record) -> JsonValue {
    auto obj = key_to_json(record.key);
    if (record.type_kind != extract::TypeSubKind::None) {
        obj.set("type_kind", json_string(extract::type_sub_kind_name(record.type_kind)));
    }
    obj.set("signature", json_string(record.signature));
    obj.set("fingerprint", json_string(record.body_fingerprint.to_hex()));
    obj.set("file", json_string(record.span.file));
    obj.set("start_line", json_uint(record.span.start_line));
    obj.set("end_line", json_uint(record.span.end_line));

    if (record.has_body_contents()) {
        auto calls = json_array();
        for (const auto& call : record.calls) {
            calls.push(json_string(call.callee + "/" + std::to_string(call.arg_count)));
        }
        obj.set("calls", std::move(calls));

        auto literals = json_array();
        for (const auto& lit : record.literals) {
            literals.push(json_string(std::string(extract::literal_kind_name(lit.kind)) + ":" +
                                      lit.value));
        }
        obj.set("literals", std::move(literals));
    }
    return obj;
}

} // namespace

auto Snapshot::to_json() const -> JsonValue {
    auto root = json_object();
    root.set("revision", json_string(revision_));

    auto entities = json_array();
    for (const auto& [key, record] : entities_) {
        entities.push(record_to_json(record));
    }
    root.set("entities", std::move(entities));

    auto files = json_object();
    for (const auto& [path, keys] : files_) {
        auto list = json_array();
        for (const auto& key : keys) {
            list.push(json_string(key.to_string()));
        }
        files.set(path, std::move(list));
    }
    root.set("files", std::move(files));

    auto failures = json_array();
    for (const auto& failure : failures_) {
        auto obj = json_object();
        obj.set("path", json_string(failure.path));
        obj.set("message", json_string(failure.message));
        obj.set("line", json_uint(failure.line));
        obj.set("column", json_uint(failure.column));
        failures.push(std::move(obj));
    }
    root.set("parse_failures", std::move(failures));
    return root;
}

} // namespace semdiff::snapshot
