//! # Parser - Expressions
//!
//! Pratt parser for binary operators, plus unary and postfix operators.
//!
//! ## Precedence (lowest to highest)
//!
//! | Level      | Operators                       | Associativity |
//! |------------|---------------------------------|---------------|
//! | ASSIGN     | `=` `+=` `-=` ... `>>=`         | right         |
//! | RANGE      | `..` `..=`                      | none          |
//! | OR         | `\|\|`                          | left          |
//! | AND        | `&&`                            | left          |
//! | COMPARISON | `==` `!=` `<` `>` `<=` `>=`     | left          |
//! | BITOR      | `\|`                            | left          |
//! | BITXOR     | `^`                             | left          |
//! | BITAND     | `&`                             | left          |
//! | SHIFT      | `<<` `>>`                       | left          |
//! | TERM       | `+` `-`                         | left          |
//! | FACTOR     | `*` `/` `%`                     | left          |
//! | CAST       | `as`                            | left          |
//!
//! Unary operators bind tighter than `as`; postfix `?`, `.await`, calls,
//! method calls, field access and indexing bind tightest.
//!
//! ## Struct Literal Restriction
//!
//! In `if`/`while` conditions, `match` scrutinees and `for` iterators a
//! `{` after a path starts the body, not a struct literal. `no_struct`
//! carries that restriction down the operator chain and is cleared inside
//! any delimiter.

#include "parser/parser.hpp"

namespace semdiff::parser {

using lexer::TokenKind;

auto Parser::parse_expr() -> Result<ExprPtr, ParseError> {
    return parse_expr_with_precedence(precedence::NONE, false);
}

auto Parser::get_precedence(TokenKind kind) -> int {
    switch (kind) {
    case TokenKind::Eq:
    case TokenKind::PlusEq:
    case TokenKind::MinusEq:
    case TokenKind::StarEq:
    case TokenKind::SlashEq:
    case TokenKind::PercentEq:
    case TokenKind::CaretEq:
    case TokenKind::AndEq:
    case TokenKind::OrEq:
    case TokenKind::ShlEq:
    case TokenKind::ShrEq:
        return precedence::ASSIGN;
    case TokenKind::DotDot:
    case TokenKind::DotDotEq:
        return precedence::RANGE;
    case TokenKind::OrOr:
        return precedence::OR;
    case TokenKind::AndAnd:
        return precedence::AND;
    case TokenKind::EqEq:
    case TokenKind::Ne:
    case TokenKind::Lt:
    case TokenKind::Gt:
    case TokenKind::Le:
    case TokenKind::Ge:
        return precedence::COMPARISON;
    case TokenKind::Or:
        return precedence::BITOR;
    case TokenKind::Caret:
        return precedence::BITXOR;
    case TokenKind::And:
        return precedence::BITAND;
    case TokenKind::Shl:
    case TokenKind::Shr:
        return precedence::SHIFT;
    case TokenKind::Plus:
    case TokenKind::Minus:
        return precedence::TERM;
    case TokenKind::Star:
    case TokenKind::Slash:
    case TokenKind::Percent:
        return precedence::FACTOR;
    case TokenKind::KwAs:
        return precedence::CAST;
    default:
        return -1;
    }
}

auto Parser::token_to_binary_op(TokenKind kind) -> std::optional<BinaryOp> {
    switch (kind) {
    case TokenKind::Plus:
        return BinaryOp::Add;
    case TokenKind::Minus:
        return BinaryOp::Sub;
    case TokenKind::Star:
        return BinaryOp::Mul;
    case TokenKind::Slash:
        return BinaryOp::Div;
    case TokenKind::Percent:
        return BinaryOp::Rem;
    case TokenKind::AndAnd:
        return BinaryOp::And;
    case TokenKind::OrOr:
        return BinaryOp::Or;
    case TokenKind::And:
        return BinaryOp::BitAnd;
    case TokenKind::Or:
        return BinaryOp::BitOr;
    case TokenKind::Caret:
        return BinaryOp::BitXor;
    case TokenKind::Shl:
        return BinaryOp::Shl;
    case TokenKind::Shr:
        return BinaryOp::Shr;
    case TokenKind::EqEq:
        return BinaryOp::Eq;
    case TokenKind::Ne:
        return BinaryOp::Ne;
    case TokenKind::Lt:
        return BinaryOp::Lt;
    case TokenKind::Le:
        return BinaryOp::Le;
    case TokenKind::Gt:
        return BinaryOp::Gt;
    case TokenKind::Ge:
        return BinaryOp::Ge;
    case TokenKind::Eq:
        return BinaryOp::Assign;
    case TokenKind::PlusEq:
        return BinaryOp::AddAssign;
    case TokenKind::MinusEq:
        return BinaryOp::SubAssign;
    case TokenKind::StarEq:
        return BinaryOp::MulAssign;
    case TokenKind::SlashEq:
        return BinaryOp::DivAssign;
    case TokenKind::PercentEq:
        return BinaryOp::RemAssign;
    case TokenKind::AndEq:
        return BinaryOp::BitAndAssign;
    case TokenKind::OrEq:
        return BinaryOp::BitOrAssign;
    case TokenKind::CaretEq:
        return BinaryOp::BitXorAssign;
    case TokenKind::ShlEq:
        return BinaryOp::ShlAssign;
    case TokenKind::ShrEq:
        return BinaryOp::ShrAssign;
    default:
        return std::nullopt;
    }
}

auto Parser::can_begin_expr(bool no_struct) const -> bool {
    const auto kind = peek().kind;
    if (lexer::is_literal(kind)) {
        return true;
    }
    switch (kind) {
    case TokenKind::Identifier:
    case TokenKind::KwSelfValue:
    case TokenKind::KwSelfType:
    case TokenKind::KwSuper:
    case TokenKind::KwCrate:
    case TokenKind::PathSep:
    case TokenKind::Lt:
    case TokenKind::LParen:
    case TokenKind::LBracket:
    case TokenKind::Minus:
    case TokenKind::Not:
    case TokenKind::Star:
    case TokenKind::And:
    case TokenKind::AndAnd:
    case TokenKind::Or:
    case TokenKind::OrOr:
    case TokenKind::DotDot:
    case TokenKind::DotDotEq:
    case TokenKind::Underscore:
    case TokenKind::KwIf:
    case TokenKind::KwMatch:
    case TokenKind::KwLoop:
    case TokenKind::KwWhile:
    case TokenKind::KwFor:
    case TokenKind::KwUnsafe:
    case TokenKind::KwAsync:
    case TokenKind::KwMove:
    case TokenKind::KwReturn:
    case TokenKind::KwBreak:
    case TokenKind::KwContinue:
    case TokenKind::KwLet:
    case TokenKind::Lifetime:
    case TokenKind::Pound:
        return true;
    case TokenKind::LBrace:
        return !no_struct;
    default:
        return false;
    }
}

// ============================================================================
// Binary Operators
// ============================================================================

auto Parser::parse_expr_with_precedence(int min_precedence, bool no_struct)
    -> Result<ExprPtr, ParseError> {
    size_t start = pos_;

    if (check(TokenKind::DotDot) || check(TokenKind::DotDotEq)) {
        bool inclusive = advance().is(TokenKind::DotDotEq);
        ExprPtr end;
        if (can_begin_expr(no_struct)) {
            auto rhs = parse_expr_with_precedence(precedence::RANGE, no_struct);
            if (is_err(rhs)) {
                return unwrap_err(rhs);
            }
            end = std::move(unwrap(rhs));
        }
        auto range = make_expr(RangeExpr{.start = nullptr, .end = std::move(end),
                                         .inclusive = inclusive},
                               start);
        return parse_infix_loop(std::move(range), min_precedence, no_struct);
    }

    auto left = parse_unary_expr(no_struct);
    if (is_err(left)) {
        return left;
    }
    return parse_infix_loop(std::move(unwrap(left)), min_precedence, no_struct);
}

auto Parser::parse_infix_loop(ExprPtr left, int min_precedence, bool no_struct)
    -> Result<ExprPtr, ParseError> {
    size_t start = left->range.begin;

    while (true) {
        const auto kind = peek().kind;
        int prec = get_precedence(kind);
        if (prec < 0 || prec <= min_precedence) {
            break;
        }

        if (kind == TokenKind::DotDot || kind == TokenKind::DotDotEq) {
            bool inclusive = advance().is(TokenKind::DotDotEq);
            ExprPtr end;
            if (can_begin_expr(no_struct)) {
                auto rhs = parse_expr_with_precedence(precedence::RANGE, no_struct);
                if (is_err(rhs)) {
                    return unwrap_err(rhs);
                }
                end = std::move(unwrap(rhs));
            }
            left = make_expr(RangeExpr{.start = std::move(left), .end = std::move(end),
                                       .inclusive = inclusive},
                             start);
            continue;
        }

        if (kind == TokenKind::KwAs) {
            advance();
            auto type = skip_type();
            if (is_err(type)) {
                return unwrap_err(type);
            }
            left = make_expr(CastExpr{.expr = std::move(left), .type = unwrap(type)}, start);
            continue;
        }

        auto op = token_to_binary_op(kind);
        if (!op) {
            break;
        }
        advance();

        int next_min = prec == precedence::ASSIGN ? precedence::ASSIGN - 1 : prec;
        auto right = parse_expr_with_precedence(next_min, no_struct);
        if (is_err(right)) {
            return unwrap_err(right);
        }
        left = make_expr(
            BinaryExpr{.op = *op, .left = std::move(left), .right = std::move(unwrap(right))},
            start);
    }

    return left;
}

// ============================================================================
// Unary Operators
// ============================================================================

auto Parser::parse_unary_expr(bool no_struct) -> Result<ExprPtr, ParseError> {
    size_t start = pos_;

    auto unary = [&](UnaryOp op) -> Result<ExprPtr, ParseError> {
        auto operand = parse_unary_expr(no_struct);
        if (is_err(operand)) {
            return operand;
        }
        return make_expr(UnaryExpr{.op = op, .operand = std::move(unwrap(operand))}, start);
    };

    switch (peek().kind) {
    case TokenKind::Minus:
        advance();
        return unary(UnaryOp::Neg);
    case TokenKind::Not:
        advance();
        return unary(UnaryOp::Not);
    case TokenKind::Star:
        advance();
        return unary(UnaryOp::Deref);
    case TokenKind::And:
    case TokenKind::AndAnd: {
        bool double_ref = advance().is(TokenKind::AndAnd);
        UnaryOp op = UnaryOp::Ref;
        if (check_word("raw") &&
            (check_at(1, TokenKind::KwConst) || check_at(1, TokenKind::KwMut))) {
            advance();
            advance();
            op = UnaryOp::RawRef;
        } else if (match(TokenKind::KwMut)) {
            op = UnaryOp::RefMut;
        }
        auto inner = unary(op);
        if (is_err(inner) || !double_ref) {
            return inner;
        }
        // `&&x` is `&(&x)`
        return make_expr(UnaryExpr{.op = UnaryOp::Ref, .operand = std::move(unwrap(inner))},
                         start);
    }
    default:
        break;
    }

    auto primary = parse_primary_expr(no_struct);
    if (is_err(primary)) {
        return primary;
    }
    return parse_postfix_expr(std::move(unwrap(primary)));
}

// ============================================================================
// Postfix Operators
// ============================================================================

auto Parser::parse_postfix_expr(ExprPtr left) -> Result<ExprPtr, ParseError> {
    size_t start = left->range.begin;

    while (true) {
        if (match(TokenKind::Question)) {
            left = make_expr(TryExpr{.expr = std::move(left)}, start);
            continue;
        }

        if (check(TokenKind::LParen)) {
            auto args = parse_call_args(TokenKind::RParen);
            if (is_err(args)) {
                return unwrap_err(args);
            }
            left = make_expr(CallExpr{.callee = std::move(left), .args = std::move(unwrap(args))},
                             start);
            continue;
        }

        if (check(TokenKind::LBracket)) {
            advance();
            auto index = parse_expr_with_precedence(precedence::NONE, false);
            if (is_err(index)) {
                return index;
            }
            auto close = expect(TokenKind::RBracket, "expected ']' after index");
            if (is_err(close)) {
                return unwrap_err(close);
            }
            left = make_expr(
                IndexExpr{.object = std::move(left), .index = std::move(unwrap(index))}, start);
            continue;
        }

        if (!match(TokenKind::Dot)) {
            break;
        }

        if (match(TokenKind::KwAwait)) {
            left = make_expr(AwaitExpr{.expr = std::move(left)}, start);
            continue;
        }

        if (check(TokenKind::IntLiteral)) {
            std::string field(advance().lexeme);
            left = make_expr(FieldExpr{.object = std::move(left), .field = std::move(field)},
                             start);
            continue;
        }

        if (check(TokenKind::FloatLiteral)) {
            // `pair.0.1` lexes the indices as one float literal
            std::string_view text = advance().lexeme;
            auto dot = text.find('.');
            if (dot == std::string_view::npos || dot + 1 >= text.size() ||
                text.find_first_not_of("0123456789.") != std::string_view::npos) {
                return ParseError{.message = "invalid tuple index", .span = previous().span};
            }
            left = make_expr(FieldExpr{.object = std::move(left),
                                       .field = std::string(text.substr(0, dot))},
                             start);
            left = make_expr(FieldExpr{.object = std::move(left),
                                       .field = std::string(text.substr(dot + 1))},
                             start);
            continue;
        }

        if (!check(TokenKind::Identifier)) {
            return error_here("expected field or method name after '.'");
        }
        std::string name(advance().text());

        TokenRange turbofish;
        if (check(TokenKind::PathSep) && check_at(1, TokenKind::Lt)) {
            size_t sep = pos_;
            advance();
            auto generics = skip_angle_brackets();
            if (is_err(generics)) {
                return unwrap_err(generics);
            }
            turbofish = TokenRange{sep, unwrap(generics).end};
        }

        if (check(TokenKind::LParen)) {
            auto args = parse_call_args(TokenKind::RParen);
            if (is_err(args)) {
                return unwrap_err(args);
            }
            left = make_expr(MethodCallExpr{.receiver = std::move(left),
                                            .method = std::move(name),
                                            .turbofish = turbofish,
                                            .args = std::move(unwrap(args))},
                             start);
        } else if (!turbofish.empty()) {
            return error_here("expected '(' after method generics");
        } else {
            left = make_expr(FieldExpr{.object = std::move(left), .field = std::move(name)},
                             start);
        }
    }

    return left;
}

auto Parser::parse_call_args(TokenKind close) -> Result<std::vector<ExprPtr>, ParseError> {
    advance(); // opening delimiter
    std::vector<ExprPtr> args;

    while (!check(close)) {
        auto arg = parse_expr_with_precedence(precedence::NONE, false);
        if (is_err(arg)) {
            return unwrap_err(arg);
        }
        args.push_back(std::move(unwrap(arg)));
        if (!match(TokenKind::Comma)) {
            break;
        }
    }

    auto end = expect(close, "expected ')' after arguments");
    if (is_err(end)) {
        return unwrap_err(end);
    }
    return args;
}

} // namespace semdiff::parser
