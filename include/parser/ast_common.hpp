//! # AST Common Types
//!
//! Forward declarations, owning pointer aliases and token ranges shared by
//! the AST headers.
//!
//! ## Architecture
//!
//! - `ast_common.hpp` - Forward declarations, `TokenRange` (this file)
//! - `ast_exprs.hpp` - Expressions (`Expr`, `CallExpr`, `MatchExpr`, ...)
//! - `ast_stmts.hpp` - Statements inside blocks
//! - `ast_decls.hpp` - Items (`FnDecl`, `ImplDecl`, `TraitDecl`, ...)
//! - `ast.hpp` - Umbrella header and `SourceFile`
//!
//! ## Token Ranges
//!
//! Types, patterns, attributes, macro bodies and item headers are not
//! modelled as trees. They are kept as a `TokenRange` into the file's token
//! vector, which is enough to render them canonically and to scan them for
//! literals. Every AST node also records the range it was parsed from.
//!
//! ## Ownership Model
//!
//! Child nodes are owned through `Box<T>`; the tree is never shared.

#ifndef SEMDIFF_PARSER_AST_COMMON_HPP
#define SEMDIFF_PARSER_AST_COMMON_HPP

#include "common.hpp"
#include "lexer/token.hpp"

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace semdiff::parser {

struct Expr;
struct Stmt;
struct Item;

using ExprPtr = Box<Expr>;
using StmtPtr = Box<Stmt>;
using ItemPtr = Box<Item>;

/// Half-open range `[begin, end)` of token indices.
struct TokenRange {
    size_t begin = 0;
    size_t end = 0;

    [[nodiscard]] auto empty() const -> bool {
        return end <= begin;
    }
    [[nodiscard]] auto size() const -> size_t {
        return empty() ? 0 : end - begin;
    }

    bool operator==(const TokenRange& other) const = default;
};

} // namespace semdiff::parser

#endif // SEMDIFF_PARSER_AST_COMMON_HPP
