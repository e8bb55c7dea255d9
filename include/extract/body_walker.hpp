//! # Body Walker
//!
//! One pass over a function body that produces its call sites, its
//! literals and the canonical structural serialization the body
//! fingerprint is computed from.
//!
//! ## Walk Order
//!
//! Pre-order, source order: a call is recorded before its callee, receiver
//! and arguments are walked, so `f(g(1))` yields calls `f`, `g`.
//!
//! ## Callee Text
//!
//! | Expression           | Callee             |
//! |----------------------|--------------------|
//! | `a::b::<T>::c(x)`    | `a::b::c`          |
//! | `<T as Tr>::f(x)`    | `Tr::f`            |
//! | `(s.f)(x)`           | `s.f`              |
//! | `(get())(x)`         | `complex_call`     |
//! | `v.push(x)`          | `v.push`           |
//! | `self.items.push(x)` | `field.items.push` |
//! | `a.iter().map(f)`    | `chain.iter.map`   |
//! | `(a + b).max(c)`     | `expr.max`         |
//! | `vec![1, 2]`         | `vec!` (2 args)    |
//!
//! Macro arguments are not parsed, so calls and literals inside a macro
//! invocation are not recorded. Nested items are skipped.

#ifndef SEMDIFF_EXTRACT_BODY_WALKER_HPP
#define SEMDIFF_EXTRACT_BODY_WALKER_HPP

#include "extract/entity.hpp"
#include "parser/ast.hpp"

#include <optional>
#include <string>
#include <vector>

namespace semdiff::extract {

class BodyWalker {
public:
    explicit BodyWalker(const std::vector<lexer::Token>& tokens);

    /// Walks a function body. May be called once per walker.
    void walk(const parser::Expr& body);

    [[nodiscard]] auto calls() const -> const std::vector<CallSite>& {
        return calls_;
    }

    [[nodiscard]] auto literals() const -> const std::vector<LiteralValue>& {
        return literals_;
    }

    /// The canonical serialization of everything walked so far.
    [[nodiscard]] auto canonical() const -> const std::string& {
        return out_;
    }

    [[nodiscard]] auto fingerprint() const -> Fingerprint {
        return fingerprint_string(out_);
    }

    [[nodiscard]] auto take_calls() -> std::vector<CallSite> {
        return std::move(calls_);
    }

    [[nodiscard]] auto take_literals() -> std::vector<LiteralValue> {
        return std::move(literals_);
    }

private:
    const std::vector<lexer::Token>& tokens_;
    std::string out_;
    std::vector<CallSite> calls_;
    std::vector<LiteralValue> literals_;

    void walk_expr(const parser::Expr& expr);
    void walk_stmt(const parser::Stmt& stmt);
    void walk_block(const parser::BlockExpr& block);
    void walk_arm_body(const parser::Expr& body);

    void open(std::string_view tag);
    void close();
    void atom(std::string_view text);
    void child(const parser::ExprPtr& expr);
    void opaque(parser::TokenRange range);
    void pattern(parser::TokenRange range);
    void record_literal(const lexer::Token& token);

    [[nodiscard]] static auto callee_text(const parser::Expr& callee) -> std::string;
    [[nodiscard]] static auto method_text(const parser::MethodCallExpr& call) -> std::string;
};

/// Kind and normalized value of a literal token, `std::nullopt` for
/// anything else.
[[nodiscard]] auto literal_from_token(const lexer::Token& token) -> std::optional<LiteralValue>;

/// Number of top-level comma-separated groups in a macro body.
[[nodiscard]] auto macro_argument_count(const std::vector<lexer::Token>& tokens,
                                        parser::TokenRange body) -> uint32_t;

} // namespace semdiff::extract

#endif // SEMDIFF_EXTRACT_BODY_WALKER_HPP
