//! # Item AST Nodes
//!
//! Top-level and nested Rust items.
//!
//! | Item            | Node        | Notes                                   |
//! |-----------------|-------------|-----------------------------------------|
//! | `fn`            | `FnDecl`    | header range + parsed body              |
//! | `struct`/`enum` | `TypeDecl`  | whole definition kept as a range        |
//! | `type X = ..;`  | `TypeDecl`  | also associated types inside traits     |
//! | `trait`         | `TraitDecl` | header range + member items             |
//! | `impl`          | `ImplDecl`  | self type, optional trait, member items |
//! | `mod x { }`     | `ModDecl`   | inline items; `mod x;` has none         |
//! | everything else | `OtherItem` | `use`, `const`, `static`, macros, ...   |

#ifndef SEMDIFF_PARSER_AST_DECLS_HPP
#define SEMDIFF_PARSER_AST_DECLS_HPP

#include "parser/ast_stmts.hpp"

namespace semdiff::parser {

/// `#[...]` or `#![...]`.
struct Attribute {
    TokenRange range;
    bool inner = false;
    bool is_doc = false; ///< `#[doc = ...]` / `#[doc(...)]`
};

/// `fn name<G>(params) -> R where ... { body }`
///
/// `header` covers the item from its first attribute to the token before
/// the body (or before the closing `;`).
struct FnDecl {
    std::string name;
    TokenRange header;
    ExprPtr body; ///< BlockExpr, null for `fn f();`
};

enum class TypeDeclKind {
    Struct,
    Enum,
    TypeAlias,
};

struct TypeDecl {
    TypeDeclKind kind;
    std::string name;
};

/// `trait Name<G>: Bounds where ... { items }`
///
/// `header` ends before the `{`.
struct TraitDecl {
    std::string name;
    TokenRange header;
    std::vector<ItemPtr> items;
};

/// `impl<G> Trait for SelfTy where ... { items }`
struct ImplDecl {
    TokenRange generics;  ///< `<...>` after `impl`, may be empty
    TokenRange self_type;
    TokenRange trait_ref; ///< Empty for inherent impls; excludes a leading `!`
    bool negative = false;
    std::vector<ItemPtr> items;
};

struct ModDecl {
    std::string name;
    bool is_inline = false;
    std::vector<ItemPtr> items;
};

enum class OtherItemKind {
    Use,
    Const,
    Static,
    ExternCrate,
    ExternBlock,
    Union,
    MacroRules,
    MacroCall,
};

struct OtherItem {
    OtherItemKind kind;
    std::string name; ///< Empty where the item has no name
};

/// An item with its outer attributes and visibility.
struct Item {
    std::vector<Attribute> attrs;
    TokenRange visibility;
    std::variant<FnDecl, TypeDecl, TraitDecl, ImplDecl, ModDecl, OtherItem> kind;
    TokenRange range; ///< First attribute through the last token

    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }

    template <typename T> [[nodiscard]] auto as() const -> const T& {
        return std::get<T>(kind);
    }
};

} // namespace semdiff::parser

#endif // SEMDIFF_PARSER_AST_DECLS_HPP
