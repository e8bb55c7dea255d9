//! # Statement AST Nodes
//!
//! Statements appear only inside block expressions.
//!
//! | Statement | Example                              |
//! |-----------|--------------------------------------|
//! | Let       | `let (a, b): (u8, u8) = pair;`       |
//! | Let-else  | `let Some(x) = opt else { return };` |
//! | Expr      | `call();`, `if c { .. }`             |
//! | Item      | `fn helper() {}` inside a body       |
//! | Empty     | `;`                                  |

#ifndef SEMDIFF_PARSER_AST_STMTS_HPP
#define SEMDIFF_PARSER_AST_STMTS_HPP

#include "parser/ast_exprs.hpp"

namespace semdiff::parser {

struct LetStmt {
    TokenRange pattern;
    TokenRange type; ///< Empty without an annotation
    ExprPtr init;    ///< May be null
    ExprPtr else_block;
};

struct ExprStmt {
    ExprPtr expr;
    bool has_semi = false;
};

/// A nested item. Nested items are not entities of their own.
struct ItemStmt {
    ItemPtr item;
};

struct EmptyStmt {};

struct Stmt {
    std::variant<LetStmt, ExprStmt, ItemStmt, EmptyStmt> kind;
    TokenRange range;

    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }

    template <typename T> [[nodiscard]] auto as() const -> const T& {
        return std::get<T>(kind);
    }
};

} // namespace semdiff::parser

#endif // SEMDIFF_PARSER_AST_STMTS_HPP
