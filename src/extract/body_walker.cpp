//! # Body Walker
//!
//! The serialization is an s-expression with length-prefixed atoms, so two
//! bodies serialize identically exactly when their trees are equal.
//! Parentheses are transparent (the tree already encodes grouping) and a
//! match arm `=> { expr }` serializes like `=> expr`.

#include "extract/body_walker.hpp"

#include "extract/signature.hpp"

#include <type_traits>

namespace semdiff::extract {

using lexer::TokenKind;
using parser::TokenRange;

namespace {

auto strip_parens(const parser::Expr& expr) -> const parser::Expr& {
    const parser::Expr* current = &expr;
    while (current->is<parser::ParenExpr>()) {
        current = current->as<parser::ParenExpr>().inner.get();
    }
    return *current;
}

auto join_path(const std::vector<std::string>& segments) -> std::string {
    std::string out;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) {
            out += "::";
        }
        out += segments[i];
    }
    return out;
}

auto unary_op_name(parser::UnaryOp op) -> const char* {
    switch (op) {
    case parser::UnaryOp::Neg:
        return "-";
    case parser::UnaryOp::Not:
        return "!";
    case parser::UnaryOp::Deref:
        return "*";
    case parser::UnaryOp::Ref:
        return "&";
    case parser::UnaryOp::RefMut:
        return "&mut";
    case parser::UnaryOp::RawRef:
        return "&raw";
    }
    return "?";
}

auto block_kind_name(parser::BlockKind kind) -> const char* {
    switch (kind) {
    case parser::BlockKind::Plain:
        return "plain";
    case parser::BlockKind::Unsafe:
        return "unsafe";
    case parser::BlockKind::Async:
        return "async";
    case parser::BlockKind::AsyncMove:
        return "async_move";
    case parser::BlockKind::Const:
        return "const";
    }
    return "?";
}

} // namespace

// ============================================================================
// Literals and Macros
// ============================================================================

auto literal_from_token(const lexer::Token& token) -> std::optional<LiteralValue> {
    switch (token.kind) {
    case TokenKind::IntLiteral:
        return LiteralValue{.kind = LiteralKind::Integer, .value = token.int_value().decimal};
    case TokenKind::FloatLiteral:
        return LiteralValue{.kind = LiteralKind::Float, .value = token.float_value().text};
    case TokenKind::StringLiteral:
        return LiteralValue{.kind = LiteralKind::String, .value = token.string_value().value};
    case TokenKind::ByteStringLiteral:
        return LiteralValue{.kind = LiteralKind::ByteString,
                            .value = token.string_value().value};
    case TokenKind::CStringLiteral:
        return LiteralValue{.kind = LiteralKind::CString, .value = token.string_value().value};
    case TokenKind::CharLiteral:
        return LiteralValue{.kind = LiteralKind::Char,
                            .value = lexer::encode_utf8(token.char_value().value)};
    case TokenKind::ByteLiteral:
        return LiteralValue{
            .kind = LiteralKind::Byte,
            .value = std::to_string(static_cast<uint32_t>(token.char_value().value))};
    case TokenKind::BoolLiteral:
        return LiteralValue{.kind = LiteralKind::Boolean,
                            .value = token.bool_value() ? "true" : "false"};
    default:
        return std::nullopt;
    }
}

auto macro_argument_count(const std::vector<lexer::Token>& tokens, TokenRange body)
    -> uint32_t {
    uint32_t groups = 0;
    bool group_open = false;
    int depth = 0;

    for (size_t i = body.begin; i < body.end && i < tokens.size(); ++i) {
        const auto kind = tokens[i].kind;
        if (depth == 0 && kind == TokenKind::Comma) {
            group_open = false;
            continue;
        }
        if (lexer::is_open_delim(kind)) {
            ++depth;
        } else if (lexer::is_close_delim(kind)) {
            --depth;
        }
        if (!group_open) {
            ++groups;
            group_open = true;
        }
    }
    return groups;
}

// ============================================================================
// Serialization Primitives
// ============================================================================

BodyWalker::BodyWalker(const std::vector<lexer::Token>& tokens) : tokens_(tokens) {}

void BodyWalker::open(std::string_view tag) {
    out_ += '(';
    out_ += tag;
}

void BodyWalker::close() {
    out_ += ')';
}

void BodyWalker::atom(std::string_view text) {
    out_ += ' ';
    out_ += std::to_string(text.size());
    out_ += ':';
    out_ += text;
}

void BodyWalker::child(const parser::ExprPtr& expr) {
    out_ += ' ';
    if (expr) {
        walk_expr(*expr);
    } else {
        out_ += '_';
    }
}

void BodyWalker::opaque(TokenRange range) {
    atom(render_canonical(tokens_, range));
}

void BodyWalker::pattern(TokenRange range) {
    opaque(range);
    for (size_t i = range.begin; i < range.end && i < tokens_.size(); ++i) {
        record_literal(tokens_[i]);
    }
}

void BodyWalker::record_literal(const lexer::Token& token) {
    if (auto literal = literal_from_token(token)) {
        literals_.push_back(std::move(*literal));
    }
}

// ============================================================================
// Call Text
// ============================================================================

auto BodyWalker::callee_text(const parser::Expr& callee) -> std::string {
    const auto& expr = strip_parens(callee);
    if (expr.is<parser::PathExpr>()) {
        return join_path(expr.as<parser::PathExpr>().segments);
    }
    if (expr.is<parser::FieldExpr>()) {
        const auto& field = expr.as<parser::FieldExpr>();
        const auto& object = strip_parens(*field.object);
        std::string base = "expr";
        if (object.is<parser::PathExpr>() && !object.as<parser::PathExpr>().segments.empty()) {
            base = object.as<parser::PathExpr>().segments.back();
        }
        return base + "." + field.field;
    }
    return "complex_call";
}

auto BodyWalker::method_text(const parser::MethodCallExpr& call) -> std::string {
    const auto& receiver = strip_parens(*call.receiver);
    std::string base = "expr";
    if (receiver.is<parser::PathExpr>() && !receiver.as<parser::PathExpr>().segments.empty()) {
        base = receiver.as<parser::PathExpr>().segments.back();
    } else if (receiver.is<parser::FieldExpr>()) {
        base = "field." + receiver.as<parser::FieldExpr>().field;
    } else if (receiver.is<parser::MethodCallExpr>()) {
        base = "chain." + receiver.as<parser::MethodCallExpr>().method;
    }
    return base + "." + call.method;
}

// ============================================================================
// Walk
// ============================================================================

void BodyWalker::walk(const parser::Expr& body) {
    walk_expr(body);
}

void BodyWalker::walk_block(const parser::BlockExpr& block) {
    open("block");
    atom(block_kind_name(block.kind));
    atom(block.label);
    for (const auto& stmt : block.stmts) {
        walk_stmt(*stmt);
    }
    child(block.tail);
    close();
}

void BodyWalker::walk_arm_body(const parser::Expr& body) {
    if (body.is<parser::BlockExpr>()) {
        const auto& block = body.as<parser::BlockExpr>();
        if (block.kind == parser::BlockKind::Plain && block.label.empty() &&
            block.stmts.empty() && block.tail) {
            walk_arm_body(*block.tail);
            return;
        }
    }
    walk_expr(body);
}

void BodyWalker::walk_stmt(const parser::Stmt& stmt) {
    std::visit(
        [this](const auto& s) {
            using T = std::decay_t<decltype(s)>;

            if constexpr (std::is_same_v<T, parser::LetStmt>) {
                out_ += ' ';
                open("let");
                pattern(s.pattern);
                opaque(s.type);
                child(s.init);
                child(s.else_block);
                close();
            } else if constexpr (std::is_same_v<T, parser::ExprStmt>) {
                child(s.expr);
                if (s.has_semi) {
                    out_ += ';';
                }
            } else if constexpr (std::is_same_v<T, parser::ItemStmt>) {
                // Nested items are fingerprinted but contribute no calls or literals.
                out_ += ' ';
                open("item");
                opaque(s.item->range);
                close();
            }
        },
        stmt.kind);
}

void BodyWalker::walk_expr(const parser::Expr& expr) {
    std::visit(
        [this, &expr](const auto& e) {
            using T = std::decay_t<decltype(e)>;

            if constexpr (std::is_same_v<T, parser::LiteralExpr>) {
                const auto& token = tokens_[e.token];
                open("lit");
                if (auto literal = literal_from_token(token)) {
                    atom(literal_kind_name(literal->kind));
                    atom(literal->value);
                    literals_.push_back(std::move(*literal));
                }
                close();
            } else if constexpr (std::is_same_v<T, parser::PathExpr>) {
                open("path");
                opaque(expr.range);
                close();
            } else if constexpr (std::is_same_v<T, parser::UnderscoreExpr>) {
                open("_");
                close();
            } else if constexpr (std::is_same_v<T, parser::UnaryExpr>) {
                open("unary");
                atom(unary_op_name(e.op));
                child(e.operand);
                close();
            } else if constexpr (std::is_same_v<T, parser::BinaryExpr>) {
                open("binary");
                atom(parser::binary_op_to_string(e.op));
                child(e.left);
                child(e.right);
                close();
            } else if constexpr (std::is_same_v<T, parser::CastExpr>) {
                open("cast");
                child(e.expr);
                opaque(e.type);
                close();
            } else if constexpr (std::is_same_v<T, parser::RangeExpr>) {
                open(e.inclusive ? "range=" : "range");
                child(e.start);
                child(e.end);
                close();
            } else if constexpr (std::is_same_v<T, parser::TryExpr>) {
                open("try");
                child(e.expr);
                close();
            } else if constexpr (std::is_same_v<T, parser::AwaitExpr>) {
                open("await");
                child(e.expr);
                close();
            } else if constexpr (std::is_same_v<T, parser::CallExpr>) {
                calls_.push_back(CallSite{.callee = callee_text(*e.callee),
                                          .arg_count = static_cast<uint32_t>(e.args.size())});
                open("call");
                child(e.callee);
                for (const auto& arg : e.args) {
                    child(arg);
                }
                close();
            } else if constexpr (std::is_same_v<T, parser::MethodCallExpr>) {
                calls_.push_back(CallSite{.callee = method_text(e),
                                          .arg_count = static_cast<uint32_t>(e.args.size())});
                open("method");
                atom(e.method);
                opaque(e.turbofish);
                child(e.receiver);
                for (const auto& arg : e.args) {
                    child(arg);
                }
                close();
            } else if constexpr (std::is_same_v<T, parser::FieldExpr>) {
                open("field");
                child(e.object);
                atom(e.field);
                close();
            } else if constexpr (std::is_same_v<T, parser::IndexExpr>) {
                open("index");
                child(e.object);
                child(e.index);
                close();
            } else if constexpr (std::is_same_v<T, parser::MacroExpr>) {
                std::string name = e.path.empty() ? std::string("?") : e.path.back();
                calls_.push_back(CallSite{.callee = name + "!",
                                          .arg_count = macro_argument_count(tokens_, e.body)});
                open("macro");
                atom(join_path(e.path));
                opaque(e.body);
                close();
            } else if constexpr (std::is_same_v<T, parser::TupleExpr>) {
                open("tuple");
                for (const auto& element : e.elements) {
                    child(element);
                }
                close();
            } else if constexpr (std::is_same_v<T, parser::ParenExpr>) {
                walk_expr(*e.inner);
            } else if constexpr (std::is_same_v<T, parser::ArrayExpr>) {
                open(e.repeat_count ? "repeat" : "array");
                for (const auto& element : e.elements) {
                    child(element);
                }
                if (e.repeat_count) {
                    child(e.repeat_count);
                }
                close();
            } else if constexpr (std::is_same_v<T, parser::StructExpr>) {
                open("struct");
                child(e.path);
                for (const auto& field : e.fields) {
                    atom(field.name);
                    if (field.value) {
                        child(field.value);
                    } else {
                        // Shorthand `Point { x }` is `Point { x: x }`
                        out_ += ' ';
                        open("path");
                        atom(field.name);
                        close();
                    }
                }
                if (e.has_rest) {
                    out_ += " ..";
                    child(e.base);
                }
                close();
            } else if constexpr (std::is_same_v<T, parser::LetExpr>) {
                open("let");
                pattern(e.pattern);
                child(e.scrutinee);
                close();
            } else if constexpr (std::is_same_v<T, parser::IfExpr>) {
                open("if");
                child(e.condition);
                child(e.then_block);
                child(e.else_branch);
                close();
            } else if constexpr (std::is_same_v<T, parser::MatchExpr>) {
                open("match");
                child(e.scrutinee);
                for (const auto& arm : e.arms) {
                    out_ += ' ';
                    open("arm");
                    pattern(arm.pattern);
                    child(arm.guard);
                    out_ += ' ';
                    walk_arm_body(*arm.body);
                    close();
                }
                close();
            } else if constexpr (std::is_same_v<T, parser::LoopExpr>) {
                open("loop");
                atom(e.label);
                child(e.body);
                close();
            } else if constexpr (std::is_same_v<T, parser::WhileExpr>) {
                open("while");
                atom(e.label);
                child(e.condition);
                child(e.body);
                close();
            } else if constexpr (std::is_same_v<T, parser::ForExpr>) {
                open("for");
                atom(e.label);
                pattern(e.pattern);
                child(e.iter);
                child(e.body);
                close();
            } else if constexpr (std::is_same_v<T, parser::BlockExpr>) {
                walk_block(e);
            } else if constexpr (std::is_same_v<T, parser::ReturnExpr>) {
                open("return");
                child(e.value);
                close();
            } else if constexpr (std::is_same_v<T, parser::BreakExpr>) {
                open("break");
                atom(e.label);
                child(e.value);
                close();
            } else if constexpr (std::is_same_v<T, parser::ContinueExpr>) {
                open("continue");
                atom(e.label);
                close();
            } else if constexpr (std::is_same_v<T, parser::ClosureExpr>) {
                open(e.is_move ? "closure_move" : "closure");
                if (e.is_async) {
                    atom("async");
                }
                for (const auto& param : e.params) {
                    pattern(param.pattern);
                    opaque(param.type);
                }
                opaque(e.return_type);
                child(e.body);
                close();
            }
        },
        expr.kind);
}

} // namespace semdiff::extract
