//! # Entity Extractor

#include "extract/extractor.hpp"

#include "extract/body_walker.hpp"
#include "extract/signature.hpp"
#include "log/log.hpp"
#include "parser/parser.hpp"

#include <algorithm>

namespace semdiff::extract {

auto module_path_for(std::string_view path) -> std::string {
    std::string normalized(path);
    std::replace(normalized.begin(), normalized.end(), '\\', '/');
    while (normalized.starts_with("./")) {
        normalized.erase(0, 2);
    }
    if (normalized.ends_with(".rs")) {
        normalized.resize(normalized.size() - 3);
    }

    std::vector<std::string> components;
    size_t start = 0;
    while (start <= normalized.size()) {
        size_t slash = normalized.find('/', start);
        if (slash == std::string::npos) {
            slash = normalized.size();
        }
        if (slash > start) {
            components.push_back(normalized.substr(start, slash - start));
        }
        start = slash + 1;
    }

    if (components.size() > 1 && components.back() == "mod") {
        components.pop_back();
    }

    std::string module;
    for (size_t i = 0; i < components.size(); ++i) {
        if (i > 0) {
            module += "::";
        }
        module += components[i];
    }
    return module;
}

// ============================================================================
// EntityExtractor
// ============================================================================

EntityExtractor::EntityExtractor(const parser::SourceFile& file, std::string path,
                                 std::string module_path)
    : file_(file), path_(std::move(path)), module_path_(std::move(module_path)) {}

void EntityExtractor::extract() {
    extract_items(file_.items, module_path_);
}

void EntityExtractor::extract_items(const std::vector<parser::ItemPtr>& items,
                                    const std::string& module) {
    for (const auto& item : items) {
        if (item->is<parser::FnDecl>()) {
            add_function(*item, module, EntityKind::Function, "");
        } else if (item->is<parser::TypeDecl>()) {
            add_type(*item, module);
        } else if (item->is<parser::TraitDecl>()) {
            add_trait(*item, module);
        } else if (item->is<parser::ImplDecl>()) {
            add_impl(item->as<parser::ImplDecl>(), module);
        } else if (item->is<parser::ModDecl>()) {
            const auto& mod = item->as<parser::ModDecl>();
            if (mod.is_inline) {
                extract_items(mod.items, module.empty() ? mod.name : module + "::" + mod.name);
            }
        }
    }
}

auto EntityExtractor::make_record(const parser::Item& item, EntityKey key) const
    -> EntityRecord {
    const auto& tokens = file_.tokens;
    const auto& first = tokens[item.range.begin];
    const auto& last = tokens[item.range.end > item.range.begin ? item.range.end - 1
                                                                 : item.range.begin];

    EntityRecord record;
    record.key = std::move(key);
    record.span = EntitySpan{.file = path_,
                             .start_line = first.span.start.line,
                             .start_col = first.span.start.column,
                             .end_line = last.span.end.line,
                             .end_col = last.span.end.column};
    record.code = std::string(file_.source->slice(first.span.start.offset, last.end_offset()));
    return record;
}

void EntityExtractor::add_function(const parser::Item& item, const std::string& module,
                                   EntityKind kind, const std::string& owner) {
    const auto& fn = item.as<parser::FnDecl>();

    EntityRecord record =
        make_record(item, EntityKey{.module = module, .kind = kind, .name = fn.name, .owner = owner});
    record.signature = function_signature(file_, item);

    if (fn.body) {
        BodyWalker walker(file_.tokens);
        walker.walk(*fn.body);
        record.body_fingerprint = walker.fingerprint();
        record.calls = walker.take_calls();
        record.literals = walker.take_literals();
    }

    insert(std::move(record));
}

void EntityExtractor::add_type(const parser::Item& item, const std::string& module) {
    const auto& decl = item.as<parser::TypeDecl>();

    EntityRecord record = make_record(
        item, EntityKey{.module = module, .kind = EntityKind::Type, .name = decl.name});
    switch (decl.kind) {
    case parser::TypeDeclKind::Struct:
        record.type_kind = TypeSubKind::Struct;
        break;
    case parser::TypeDeclKind::Enum:
        record.type_kind = TypeSubKind::Enum;
        break;
    case parser::TypeDeclKind::TypeAlias:
        record.type_kind = TypeSubKind::TypeAlias;
        break;
    }
    record.signature = type_signature(file_, item);
    insert(std::move(record));
}

void EntityExtractor::add_trait(const parser::Item& item, const std::string& module) {
    const auto& trait = item.as<parser::TraitDecl>();

    EntityRecord record = make_record(
        item, EntityKey{.module = module, .kind = EntityKind::Trait, .name = trait.name});
    record.signature = trait_signature(file_, item);
    insert(std::move(record));

    for (const auto& member : trait.items) {
        if (member->is<parser::FnDecl>()) {
            add_function(*member, module, EntityKind::Method, trait.name);
        }
    }
}

void EntityExtractor::add_impl(const parser::ImplDecl& impl, const std::string& module) {
    std::string owner = impl_owner(file_, impl);
    for (const auto& member : impl.items) {
        if (member->is<parser::FnDecl>()) {
            add_function(*member, module, EntityKind::Method, owner);
        }
    }
}

void EntityExtractor::insert(EntityRecord record) {
    auto [it, inserted] = index_.try_emplace(record.key, records_.size());
    if (inserted) {
        records_.push_back(std::move(record));
        return;
    }

    std::string message = path_ + ":" + std::to_string(record.span.start_line) + ": " +
                          entity_kind_name(record.key.kind) + " '" + record.key.to_string() +
                          "' declared again; the later declaration wins";
    SEMDIFF_LOG_DEBUG("extract", message);
    warnings_.push_back(std::move(message));
    records_[it->second] = std::move(record);
}

// ============================================================================
// extract_file
// ============================================================================

auto extract_file(std::string path, std::string contents) -> FileExtraction {
    FileExtraction result{.path = path, .module_path = module_path_for(path)};

    auto parsed = parser::parse_source(path, std::move(contents));
    if (is_err(parsed)) {
        const auto& err = unwrap_err(parsed);
        SEMDIFF_LOG_WARN("extract", path << ":" << err.span.start.line << ":"
                                          << err.span.start.column << ": " << err.message);
        result.failure = ParseFailure{.path = path,
                                      .message = err.message,
                                      .line = err.span.start.line,
                                      .column = err.span.start.column};
        return result;
    }

    EntityExtractor extractor(unwrap(parsed), path, result.module_path);
    extractor.extract();
    result.records = extractor.take_records();
    result.warnings = extractor.warnings();

    SEMDIFF_LOG_DEBUG("extract", path << ": " << result.records.size() << " entities");
    return result;
}

} // namespace semdiff::extract
