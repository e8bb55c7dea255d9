//! # Expression AST Nodes
//!
//! Rust expressions as parsed from function bodies.
//!
//! ## Expression Categories
//!
//! - **Literals and paths**: `42`, `"s"`, `x`, `Vec::<u8>::new`, `<T as Tr>::f`
//! - **Operators**: `-x`, `!x`, `&mut x`, `a + b`, `x = y`, `x += 1`, `a as u64`
//! - **Calls**: `f(a)`, `obj.method(x)`, `vec![1, 2]`
//! - **Access**: `obj.field`, `pair.0`, `arr[i]`
//! - **Composites**: `(a, b)`, `[1, 2]`, `[0; 4]`, `Point { x, ..base }`
//! - **Control flow**: `if`, `if let`, `match`, `loop`, `while`, `for`
//! - **Blocks**: `{ ... }`, `unsafe { ... }`, `async move { ... }`, `'a: { ... }`
//! - **Jumps**: `return`, `break 'a v`, `continue`
//! - **Closures**: `|x| x + 1`, `move || { ... }`
//! - **Postfix**: `expr?`, `expr.await`
//!
//! Macro invocations are kept unexpanded as `MacroExpr` with the token range
//! of their arguments.

#ifndef SEMDIFF_PARSER_AST_EXPRS_HPP
#define SEMDIFF_PARSER_AST_EXPRS_HPP

#include "parser/ast_common.hpp"


namespace semdiff::parser {

// ============================================================================
// Literals and Paths
// ============================================================================

/// Literal expression. `token` indexes the literal token.
struct LiteralExpr {
    size_t token = 0;
};

/// Path expression: `x`, `std::mem::swap`, `Vec::<T>::new`, `<T as Tr>::f`.
///
/// `segments` holds the segment names with generic arguments removed. For a
/// qualified path `<T as Tr>::f` the segments are those of the trait
/// followed by the rest (`Tr`, `f`); for `<T>::f` they are `T`, `f`.
struct PathExpr {
    std::vector<std::string> segments;
    bool global = false;       ///< Leading `::`
    bool has_generics = false; ///< Some segment carried `::<...>`
};

/// `_` used as an expression (destructuring assignment).
struct UnderscoreExpr {};

// ============================================================================
// Operators
// ============================================================================

enum class UnaryOp {
    Neg,    ///< `-x`
    Not,    ///< `!x`
    Deref,  ///< `*x`
    Ref,    ///< `&x`
    RefMut, ///< `&mut x`
    RawRef, ///< `&raw const x` / `&raw mut x`
};

struct UnaryExpr {
    UnaryOp op;
    ExprPtr operand;
};

enum class BinaryOp {
    Add,
    Sub,
    Mul,
    Div,
    Rem,
    And, ///< `&&`
    Or,  ///< `||`
    BitAnd,
    BitOr,
    BitXor,
    Shl,
    Shr,
    Eq,
    Ne,
    Lt,
    Le,
    Gt,
    Ge,
    Assign,
    AddAssign,
    SubAssign,
    MulAssign,
    DivAssign,
    RemAssign,
    BitAndAssign,
    BitOrAssign,
    BitXorAssign,
    ShlAssign,
    ShrAssign,
};

/// Returns the operator spelling ("+", "&&", "<<=", ...).
[[nodiscard]] auto binary_op_to_string(BinaryOp op) -> const char*;

struct BinaryExpr {
    BinaryOp op;
    ExprPtr left;
    ExprPtr right;
};

/// `expr as Type`
struct CastExpr {
    ExprPtr expr;
    TokenRange type;
};

/// `start..end`, `start..=end`, `..end`, `start..`, `..`
struct RangeExpr {
    ExprPtr start; ///< May be null
    ExprPtr end;   ///< May be null
    bool inclusive = false;
};

/// `expr?`
struct TryExpr {
    ExprPtr expr;
};

/// `expr.await`
struct AwaitExpr {
    ExprPtr expr;
};

// ============================================================================
// Calls and Access
// ============================================================================

/// Call expression: `f(a, b)`, `(self.cb)(x)`.
struct CallExpr {
    ExprPtr callee;
    std::vector<ExprPtr> args;
};

/// Method call: `receiver.method::<T>(args)`.
struct MethodCallExpr {
    ExprPtr receiver;
    std::string method;
    TokenRange turbofish; ///< `::<...>` if present
    std::vector<ExprPtr> args;
};

/// Field or tuple index access: `obj.field`, `pair.0`.
struct FieldExpr {
    ExprPtr object;
    std::string field;
};

/// `object[index]`
struct IndexExpr {
    ExprPtr object;
    ExprPtr index;
};

/// Macro invocation `path!(...)`, `path![...]` or `path! {...}`.
///
/// The arguments are not parsed; `body` is the token range between the
/// delimiters.
struct MacroExpr {
    std::vector<std::string> path;
    TokenRange body;
    lexer::TokenKind delimiter = lexer::TokenKind::LParen;
};

// ============================================================================
// Composites
// ============================================================================

struct TupleExpr {
    std::vector<ExprPtr> elements;
};

/// `(expr)`, kept distinct from a one-element tuple `(expr,)`.
struct ParenExpr {
    ExprPtr inner;
};

/// `[a, b]` or `[value; count]` when `repeat_count` is set.
struct ArrayExpr {
    std::vector<ExprPtr> elements;
    ExprPtr repeat_count;
};

struct StructExprField {
    std::string name;
    ExprPtr value; ///< Null for shorthand `Point { x }`
};

/// Struct literal `Path { field: value, ..base }`.
struct StructExpr {
    ExprPtr path; ///< Always a PathExpr
    std::vector<StructExprField> fields;
    ExprPtr base; ///< `..base`, may be null
    bool has_rest = false; ///< `..` with or without a base
};

// ============================================================================
// Control Flow
// ============================================================================

/// `let PAT = expr` inside an `if` or `while` condition.
struct LetExpr {
    TokenRange pattern;
    ExprPtr scrutinee;
};

struct IfExpr {
    ExprPtr condition;
    ExprPtr then_block;
    ExprPtr else_branch; ///< Block or nested IfExpr, may be null
};

struct MatchArm {
    TokenRange pattern;
    ExprPtr guard; ///< `if guard`, may be null
    ExprPtr body;
    TokenRange range;
};

struct MatchExpr {
    ExprPtr scrutinee;
    std::vector<MatchArm> arms;
};

struct LoopExpr {
    std::string label;
    ExprPtr body;
};

struct WhileExpr {
    std::string label;
    ExprPtr condition;
    ExprPtr body;
};

struct ForExpr {
    std::string label;
    TokenRange pattern;
    ExprPtr iter;
    ExprPtr body;
};

enum class BlockKind {
    Plain,
    Unsafe,
    Async,
    AsyncMove,
    Const,
};

/// `{ stmts; tail }`
struct BlockExpr {
    BlockKind kind = BlockKind::Plain;
    std::string label;
    std::vector<StmtPtr> stmts;
    ExprPtr tail; ///< Trailing expression without `;`, may be null
};

struct ReturnExpr {
    ExprPtr value;
};

struct BreakExpr {
    std::string label;
    ExprPtr value;
};

struct ContinueExpr {
    std::string label;
};

struct ClosureParam {
    TokenRange pattern;
    TokenRange type;
};

/// `move |a, b: u32| -> T { ... }`
struct ClosureExpr {
    bool is_move = false;
    bool is_async = false;
    std::vector<ClosureParam> params;
    TokenRange return_type;
    ExprPtr body;
};

// ============================================================================
// Expression Variant
// ============================================================================

struct Expr {
    std::variant<LiteralExpr, PathExpr, UnderscoreExpr, UnaryExpr, BinaryExpr, CastExpr,
                 RangeExpr, TryExpr, AwaitExpr, CallExpr, MethodCallExpr, FieldExpr, IndexExpr,
                 MacroExpr, TupleExpr, ParenExpr, ArrayExpr, StructExpr, LetExpr, IfExpr,
                 MatchExpr, LoopExpr, WhileExpr, ForExpr, BlockExpr, ReturnExpr, BreakExpr,
                 ContinueExpr, ClosureExpr>
        kind;
    TokenRange range;

    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }

    /// Throws `std::bad_variant_access` on the wrong kind.
    template <typename T> [[nodiscard]] auto as() -> T& {
        return std::get<T>(kind);
    }

    template <typename T> [[nodiscard]] auto as() const -> const T& {
        return std::get<T>(kind);
    }
};

/// True for expressions that end in a block and may stand as a statement
/// without a trailing `;` (`if`, `match`, loops, blocks).
[[nodiscard]] auto is_block_like(const Expr& expr) -> bool;

} // namespace semdiff::parser

#endif // SEMDIFF_PARSER_AST_EXPRS_HPP
