//! # Rust Parser
//!
//! Recursive descent for items and statements, Pratt parsing for
//! expressions. Types, patterns, generics, where clauses and attribute
//! contents are skipped structurally and recorded as token ranges.
//!
//! The parser stops at the first error: a file that does not parse
//! contributes nothing to a snapshot, so there is no recovery.
//!
//! ## Example
//!
//! ```cpp
//! auto result = parse_source("src/lib.rs", contents);
//! if (is_err(result)) {
//!     const ParseError& err = unwrap_err(result);
//!     ...
//! }
//! const SourceFile& file = unwrap(result);
//! ```

#ifndef SEMDIFF_PARSER_PARSER_HPP
#define SEMDIFF_PARSER_PARSER_HPP

#include "common.hpp"
#include "lexer/lexer.hpp"
#include "parser/ast.hpp"

#include <initializer_list>
#include <vector>

namespace semdiff::parser {

// Operator precedence levels (higher = tighter binding)
namespace precedence {
constexpr int NONE = 0;
constexpr int ASSIGN = 1;     // =, +=, ... (right associative)
constexpr int RANGE = 2;      // .., ..=
constexpr int OR = 3;         // ||
constexpr int AND = 4;        // &&
constexpr int COMPARISON = 5; // == != < > <= >=
constexpr int BITOR = 6;      // |
constexpr int BITXOR = 7;     // ^
constexpr int BITAND = 8;     // &
constexpr int SHIFT = 9;      // << >>
constexpr int TERM = 10;      // + -
constexpr int FACTOR = 11;    // * / %
constexpr int CAST = 12;      // as
} // namespace precedence

struct ParseError {
    std::string message;
    SourceSpan span;
};

class Parser {
public:
    explicit Parser(std::vector<lexer::Token> tokens);

    /// Parses a whole file: inner attributes, then items up to `Eof`.
    [[nodiscard]] auto parse_file(std::vector<Attribute>& inner_attrs)
        -> Result<std::vector<ItemPtr>, ParseError>;

    /// Parses a single expression (used by tests).
    [[nodiscard]] auto parse_expr() -> Result<ExprPtr, ParseError>;

    /// Parses a single item (used by tests).
    [[nodiscard]] auto parse_item() -> Result<ItemPtr, ParseError>;

    /// The token vector, including tokens split while closing generics.
    [[nodiscard]] auto tokens() const -> const std::vector<lexer::Token>& {
        return tokens_;
    }

    [[nodiscard]] auto take_tokens() -> std::vector<lexer::Token> {
        return std::move(tokens_);
    }

private:
    std::vector<lexer::Token> tokens_;
    size_t pos_ = 0;

    // ========================================================================
    // Token Access
    // ========================================================================

    [[nodiscard]] auto peek() const -> const lexer::Token&;
    [[nodiscard]] auto peek_at(size_t n) const -> const lexer::Token&;
    [[nodiscard]] auto previous() const -> const lexer::Token&;
    auto advance() -> const lexer::Token&;
    [[nodiscard]] auto is_at_end() const -> bool;
    [[nodiscard]] auto check(lexer::TokenKind kind) const -> bool;
    [[nodiscard]] auto check_at(size_t n, lexer::TokenKind kind) const -> bool;
    /// True if the next token is the identifier `word` (weak keywords).
    [[nodiscard]] auto check_word(std::string_view word) const -> bool;
    auto match(lexer::TokenKind kind) -> bool;
    auto expect(lexer::TokenKind kind, const std::string& message) -> Result<size_t, ParseError>;
    [[nodiscard]] auto error_here(const std::string& message) const -> ParseError;

    // ========================================================================
    // Structural Skipping
    // ========================================================================

    /// At an opening delimiter: skips through its matching closer.
    auto skip_balanced() -> Result<TokenRange, ParseError>;

    /// At `<`: skips a generic argument or parameter list.
    auto skip_angle_brackets() -> Result<TokenRange, ParseError>;

    /// Skips tokens until one of `terminators` at nesting depth zero.
    /// `track_angles` counts `<`/`>` as nesting (types, where clauses).
    auto skip_until(std::initializer_list<lexer::TokenKind> terminators, bool track_angles)
        -> Result<TokenRange, ParseError>;

    /// Skips one type by its grammar (used after `as`).
    auto skip_type() -> Result<TokenRange, ParseError>;

    /// Skips a type path: `a::b<T>::C`, `Fn(A) -> B`, `<T as Tr>::X`.
    auto skip_type_path() -> Result<Unit, ParseError>;

    /// Splits `>>`, `>=` or `>>=` at `index` into `>` and the remainder.
    void split_angle_token(size_t index);

    // ========================================================================
    // Items
    // ========================================================================

    auto parse_items_until(lexer::TokenKind end) -> Result<std::vector<ItemPtr>, ParseError>;
    auto parse_outer_attrs() -> Result<std::vector<Attribute>, ParseError>;
    auto parse_inner_attrs() -> Result<std::vector<Attribute>, ParseError>;
    auto parse_attribute(bool inner) -> Result<Attribute, ParseError>;
    auto parse_visibility() -> Result<TokenRange, ParseError>;
    void skip_item_qualifiers();
    auto parse_fn(size_t start) -> Result<FnDecl, ParseError>;
    auto parse_adt_body() -> Result<Unit, ParseError>;
    auto parse_trait(size_t start) -> Result<TraitDecl, ParseError>;
    auto parse_impl() -> Result<ImplDecl, ParseError>;
    auto parse_mod() -> Result<ModDecl, ParseError>;
    auto parse_macro_item() -> Result<OtherItem, ParseError>;
    [[nodiscard]] auto expect_name() -> Result<std::string, ParseError>;
    [[nodiscard]] auto is_item_start() const -> bool;

    // ========================================================================
    // Statements and Blocks
    // ========================================================================

    /// At `{`: parses a block expression.
    auto parse_block(BlockKind kind, std::string label, size_t start)
        -> Result<ExprPtr, ParseError>;
    auto parse_block() -> Result<ExprPtr, ParseError>;
    auto parse_let_stmt() -> Result<LetStmt, ParseError>;

    struct StatementExpr {
        ExprPtr expr;
        bool block_like = false; ///< Complete without `;`
    };

    /// Parses an expression in statement or match-arm position, where a
    /// leading block-like expression ends the expression.
    auto parse_statement_expr() -> Result<StatementExpr, ParseError>;
    [[nodiscard]] auto starts_block_like() const -> bool;

    // ========================================================================
    // Expressions (Pratt parser)
    // ========================================================================

    auto parse_expr_with_precedence(int min_precedence, bool no_struct)
        -> Result<ExprPtr, ParseError>;
    auto parse_infix_loop(ExprPtr left, int min_precedence, bool no_struct)
        -> Result<ExprPtr, ParseError>;
    auto parse_unary_expr(bool no_struct) -> Result<ExprPtr, ParseError>;
    auto parse_postfix_expr(ExprPtr left) -> Result<ExprPtr, ParseError>;
    auto parse_primary_expr(bool no_struct) -> Result<ExprPtr, ParseError>;
    [[nodiscard]] auto can_begin_expr(bool no_struct) const -> bool;

    auto parse_path_or_struct_or_macro(bool no_struct) -> Result<ExprPtr, ParseError>;
    auto parse_path(PathExpr& path) -> Result<Unit, ParseError>;
    auto parse_struct_literal(ExprPtr path, size_t start) -> Result<ExprPtr, ParseError>;
    auto parse_paren_or_tuple() -> Result<ExprPtr, ParseError>;
    auto parse_array() -> Result<ExprPtr, ParseError>;
    auto parse_if() -> Result<ExprPtr, ParseError>;
    auto parse_let_expr() -> Result<ExprPtr, ParseError>;
    auto parse_match() -> Result<ExprPtr, ParseError>;
    auto parse_labeled(std::string label, size_t start) -> Result<ExprPtr, ParseError>;
    auto parse_closure(bool no_struct) -> Result<ExprPtr, ParseError>;
    auto parse_jump(bool no_struct) -> Result<ExprPtr, ParseError>;
    auto parse_call_args(lexer::TokenKind close) -> Result<std::vector<ExprPtr>, ParseError>;

    auto make_expr(decltype(Expr::kind) kind, size_t start) -> ExprPtr;

    [[nodiscard]] static auto get_precedence(lexer::TokenKind kind) -> int;
    [[nodiscard]] static auto token_to_binary_op(lexer::TokenKind kind) -> std::optional<BinaryOp>;
};

/// Lexes and parses one file. The first lexer error, or the parse error,
/// is returned as a `ParseError`.
[[nodiscard]] auto parse_source(std::string path, std::string contents)
    -> Result<SourceFile, ParseError>;

} // namespace semdiff::parser

#endif // SEMDIFF_PARSER_PARSER_HPP
