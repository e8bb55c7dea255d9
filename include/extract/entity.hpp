//! # Entity Model
//!
//! The normalized view of a Rust file that snapshots are built from and
//! that the differ compares.
//!
//! ## Identity
//!
//! An `EntityKey` is `(module, kind, name, owner)`. Two entities in
//! different snapshots are the same entity exactly when their keys are
//! equal; nothing else about them is consulted for matching. Keys order by
//! kind first, then module, owner and name, which is the order changes are
//! reported in.
//!
//! | Kind     | Name              | Owner                                 |
//! |----------|-------------------|---------------------------------------|
//! | Function | `fn` identifier   | empty                                 |
//! | Type     | struct/enum/alias | empty                                 |
//! | Trait    | trait identifier  | empty                                 |
//! | Method   | `fn` identifier   | `Foo`, `<Foo as Display>` or `Trait`  |

#ifndef SEMDIFF_EXTRACT_ENTITY_HPP
#define SEMDIFF_EXTRACT_ENTITY_HPP

#include "common/fingerprint.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace semdiff::extract {

// ============================================================================
// Kinds
// ============================================================================

enum class EntityKind : uint8_t {
    Function,
    Type,
    Trait,
    Method,
};

inline constexpr std::array<EntityKind, 4> ALL_ENTITY_KINDS = {
    EntityKind::Function, EntityKind::Type, EntityKind::Trait, EntityKind::Method};

[[nodiscard]] constexpr auto entity_kind_name(EntityKind kind) -> const char* {
    switch (kind) {
    case EntityKind::Function:
        return "function";
    case EntityKind::Type:
        return "type";
    case EntityKind::Trait:
        return "trait";
    case EntityKind::Method:
        return "method";
    }
    return "unknown";
}

/// Sub-tag of `EntityKind::Type`.
enum class TypeSubKind : uint8_t {
    None,
    Struct,
    Enum,
    TypeAlias,
};

[[nodiscard]] constexpr auto type_sub_kind_name(TypeSubKind kind) -> const char* {
    switch (kind) {
    case TypeSubKind::None:
        return "";
    case TypeSubKind::Struct:
        return "struct";
    case TypeSubKind::Enum:
        return "enum";
    case TypeSubKind::TypeAlias:
        return "type_alias";
    }
    return "";
}

// ============================================================================
// Identity
// ============================================================================

struct EntityKey {
    std::string module;
    EntityKind kind = EntityKind::Function;
    std::string name;
    std::string owner; ///< Methods only

    [[nodiscard]] auto operator==(const EntityKey& other) const -> bool = default;

    [[nodiscard]] auto operator<(const EntityKey& other) const -> bool {
        return std::tie(kind, module, owner, name) <
               std::tie(other.kind, other.module, other.owner, other.name);
    }

    /// `name`, or `Owner.name` for methods.
    [[nodiscard]] auto display_name() const -> std::string {
        return owner.empty() ? name : owner + "." + name;
    }

    /// `module::name` or `module::Owner::name`, for diagnostics.
    [[nodiscard]] auto to_string() const -> std::string {
        std::string out = module;
        if (!owner.empty()) {
            out += "::" + owner;
        }
        return out + "::" + name;
    }
};

// ============================================================================
// Body Contents
// ============================================================================

/// One call expression: callee text and argument count.
struct CallSite {
    std::string callee;
    uint32_t arg_count = 0;

    [[nodiscard]] auto operator==(const CallSite& other) const -> bool = default;

    [[nodiscard]] auto operator<(const CallSite& other) const -> bool {
        return std::tie(callee, arg_count) < std::tie(other.callee, other.arg_count);
    }
};

enum class LiteralKind : uint8_t {
    Integer,
    Float,
    String,
    Boolean,
    Char,
    Byte,
    ByteString,
    CString,
};

[[nodiscard]] constexpr auto literal_kind_name(LiteralKind kind) -> const char* {
    switch (kind) {
    case LiteralKind::Integer:
        return "integer";
    case LiteralKind::Float:
        return "float";
    case LiteralKind::String:
        return "string";
    case LiteralKind::Boolean:
        return "boolean";
    case LiteralKind::Char:
        return "char";
    case LiteralKind::Byte:
        return "byte";
    case LiteralKind::ByteString:
        return "byte_string";
    case LiteralKind::CString:
        return "c_string";
    }
    return "unknown";
}

/// One literal: kind and normalized value (`0x10_u8` is integer `16`).
struct LiteralValue {
    LiteralKind kind = LiteralKind::Integer;
    std::string value;

    [[nodiscard]] auto operator==(const LiteralValue& other) const -> bool = default;

    [[nodiscard]] auto operator<(const LiteralValue& other) const -> bool {
        return std::tie(kind, value) < std::tie(other.kind, other.value);
    }
};

// ============================================================================
// Records
// ============================================================================

/// Where an entity was declared. Lines and columns are 1-based; the end is
/// the position of the last character.
struct EntitySpan {
    std::string file;
    uint32_t start_line = 0;
    uint32_t start_col = 0;
    uint32_t end_line = 0;
    uint32_t end_col = 0;

    [[nodiscard]] auto operator==(const EntitySpan& other) const -> bool = default;
};

/// One extracted entity. Immutable once its snapshot is built.
struct EntityRecord {
    EntityKey key;
    TypeSubKind type_kind = TypeSubKind::None;
    std::string signature;
    Fingerprint body_fingerprint; ///< Zero for types, traits and body-less methods
    EntitySpan span;
    std::string code; ///< Source text of the whole item
    std::vector<CallSite> calls;       ///< Functions and methods, source order
    std::vector<LiteralValue> literals; ///< Functions and methods, source order

    [[nodiscard]] auto has_body_contents() const -> bool {
        return key.kind == EntityKind::Function || key.kind == EntityKind::Method;
    }
};

/// A file that could not be lexed or parsed.
struct ParseFailure {
    std::string path;
    std::string message;
    uint32_t line = 0;
    uint32_t column = 0;
};

/// Everything extracted from one file.
struct FileExtraction {
    std::string path;
    std::string module_path;
    std::vector<EntityRecord> records;     ///< Unique keys, declaration order
    std::optional<ParseFailure> failure;   ///< Set when nothing could be extracted
    std::vector<std::string> warnings;     ///< Non-fatal notes (replaced duplicates)
};

} // namespace semdiff::extract

#endif // SEMDIFF_EXTRACT_ENTITY_HPP
