//! # Entity Extractor
//!
//! Turns one parsed file into `EntityRecord`s.
//!
//! ## What Is Extracted
//!
//! - free functions, structs, enums, type aliases and traits declared at
//!   file level or inside inline `mod` blocks
//! - methods of `impl` blocks (inherent and trait impls)
//! - methods declared in traits, with or without a default body
//!
//! Items nested in function bodies are not entities. Associated types and
//! consts are part of their trait's signature; in impls they are ignored.
//!
//! ## Module Paths
//!
//! | File                | Module path   |
//! |---------------------|---------------|
//! | `src/lib.rs`        | `src::lib`    |
//! | `src/net/mod.rs`    | `src::net`    |
//! | `src/net/tcp.rs`    | `src::net::tcp` |
//! | `mod tests { }` in `src/lib.rs` | `src::lib::tests` |
//!
//! ## Duplicates
//!
//! When one file declares the same key twice (typically `#[cfg]`
//! alternatives), the later declaration replaces the earlier one and a
//! warning is recorded.

#ifndef SEMDIFF_EXTRACT_EXTRACTOR_HPP
#define SEMDIFF_EXTRACT_EXTRACTOR_HPP

#include "extract/entity.hpp"
#include "parser/ast.hpp"

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace semdiff::extract {

/// Module path of a file from its `/`-separated path.
[[nodiscard]] auto module_path_for(std::string_view path) -> std::string;

class EntityExtractor {
public:
    /// `file` must outlive the extractor.
    EntityExtractor(const parser::SourceFile& file, std::string path, std::string module_path);

    /// Extracts every entity of the file.
    void extract();

    [[nodiscard]] auto take_records() -> std::vector<EntityRecord> {
        return std::move(records_);
    }

    [[nodiscard]] auto warnings() const -> const std::vector<std::string>& {
        return warnings_;
    }

private:
    const parser::SourceFile& file_;
    std::string path_;
    std::string module_path_;
    std::vector<EntityRecord> records_;
    std::map<EntityKey, size_t> index_;
    std::vector<std::string> warnings_;

    void extract_items(const std::vector<parser::ItemPtr>& items, const std::string& module);
    void add_function(const parser::Item& item, const std::string& module, EntityKind kind,
                      const std::string& owner);
    void add_type(const parser::Item& item, const std::string& module);
    void add_trait(const parser::Item& item, const std::string& module);
    void add_impl(const parser::ImplDecl& impl, const std::string& module);
    void insert(EntityRecord record);

    [[nodiscard]] auto make_record(const parser::Item& item, EntityKey key) const
        -> EntityRecord;
};

/// Lexes, parses and extracts one file. A file that does not parse yields
/// no records and a `failure`.
[[nodiscard]] auto extract_file(std::string path, std::string contents) -> FileExtraction;

} // namespace semdiff::extract

#endif // SEMDIFF_EXTRACT_EXTRACTOR_HPP
