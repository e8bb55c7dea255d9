//! # Parser - Primary Expressions
//!
//! Literals, paths, macro invocations, struct literals, tuples, arrays,
//! blocks, control flow, jumps and closures.

#include "parser/parser.hpp"

namespace semdiff::parser {

using lexer::TokenKind;

auto Parser::parse_primary_expr(bool no_struct) -> Result<ExprPtr, ParseError> {
    size_t start = pos_;
    const auto kind = peek().kind;

    if (lexer::is_literal(kind)) {
        advance();
        return make_expr(LiteralExpr{.token = start}, start);
    }

    switch (kind) {
    case TokenKind::Identifier:
    case TokenKind::KwSelfValue:
    case TokenKind::KwSelfType:
    case TokenKind::KwSuper:
    case TokenKind::KwCrate:
    case TokenKind::PathSep:
    case TokenKind::Lt:
        return parse_path_or_struct_or_macro(no_struct);

    case TokenKind::Underscore:
        advance();
        return make_expr(UnderscoreExpr{}, start);

    case TokenKind::LParen:
        return parse_paren_or_tuple();

    case TokenKind::LBracket:
        return parse_array();

    case TokenKind::LBrace:
        return parse_block(BlockKind::Plain, "", start);

    case TokenKind::KwUnsafe:
        advance();
        return parse_block(BlockKind::Unsafe, "", start);

    case TokenKind::KwConst:
        advance();
        return parse_block(BlockKind::Const, "", start);

    case TokenKind::KwAsync:
        if (check_at(1, TokenKind::LBrace)) {
            advance();
            return parse_block(BlockKind::Async, "", start);
        }
        if (check_at(1, TokenKind::KwMove) && check_at(2, TokenKind::LBrace)) {
            advance();
            advance();
            return parse_block(BlockKind::AsyncMove, "", start);
        }
        return parse_closure(no_struct);

    case TokenKind::KwStatic:
        advance();
        return parse_closure(no_struct);

    case TokenKind::KwMove:
    case TokenKind::Or:
    case TokenKind::OrOr:
        return parse_closure(no_struct);

    case TokenKind::KwIf:
        return parse_if();

    case TokenKind::KwMatch:
        return parse_match();

    case TokenKind::KwLoop:
    case TokenKind::KwWhile:
    case TokenKind::KwFor:
        return parse_labeled("", start);

    case TokenKind::Lifetime:
        if (check_at(1, TokenKind::Colon)) {
            std::string label(advance().text());
            advance(); // ':'
            return parse_labeled(std::move(label), start);
        }
        return error_here("expected expression");

    case TokenKind::KwReturn:
    case TokenKind::KwBreak:
    case TokenKind::KwContinue:
        return parse_jump(no_struct);

    case TokenKind::KwLet:
        return parse_let_expr();

    case TokenKind::Pound: {
        // Attributes on an expression do not change it.
        auto attrs = parse_outer_attrs();
        if (is_err(attrs)) {
            return unwrap_err(attrs);
        }
        return parse_primary_expr(no_struct);
    }

    default:
        return error_here("expected expression");
    }
}

// ============================================================================
// Paths, Macros and Struct Literals
// ============================================================================

namespace {

auto is_path_segment(TokenKind kind) -> bool {
    return kind == TokenKind::Identifier || kind == TokenKind::KwSelfValue ||
           kind == TokenKind::KwSelfType || kind == TokenKind::KwSuper ||
           kind == TokenKind::KwCrate;
}

} // namespace

auto Parser::parse_path(PathExpr& path) -> Result<Unit, ParseError> {
    if (match(TokenKind::Lt)) {
        // <T as Trait>::item or <T>::item
        size_t self_start = pos_;
        auto self_type = skip_until({TokenKind::KwAs, TokenKind::Gt}, true);
        if (is_err(self_type)) {
            return unwrap_err(self_type);
        }
        if (match(TokenKind::KwAs)) {
            while (true) {
                if (!is_path_segment(peek().kind)) {
                    return error_here("expected trait path");
                }
                path.segments.emplace_back(advance().text());
                if (check(TokenKind::Lt)) {
                    auto generics = skip_angle_brackets();
                    if (is_err(generics)) {
                        return unwrap_err(generics);
                    }
                }
                if (!match(TokenKind::PathSep)) {
                    break;
                }
            }
        } else {
            std::string self_text;
            for (size_t i = self_start; i < pos_; ++i) {
                self_text += tokens_[i].text();
            }
            path.segments.push_back(std::move(self_text));
        }
        auto close = expect(TokenKind::Gt, "expected '>' after qualified path");
        if (is_err(close)) {
            return unwrap_err(close);
        }
        auto sep = expect(TokenKind::PathSep, "expected '::' after qualified path");
        if (is_err(sep)) {
            return unwrap_err(sep);
        }
    } else if (match(TokenKind::PathSep)) {
        path.global = true;
    }

    while (true) {
        if (!is_path_segment(peek().kind)) {
            return error_here("expected identifier in path");
        }
        path.segments.emplace_back(advance().text());

        if (check(TokenKind::PathSep) && check_at(1, TokenKind::Lt)) {
            advance();
            auto generics = skip_angle_brackets();
            if (is_err(generics)) {
                return unwrap_err(generics);
            }
            path.has_generics = true;
        }

        if (check(TokenKind::PathSep) && is_path_segment(peek_at(1).kind)) {
            advance();
            continue;
        }
        return Unit{};
    }
}

auto Parser::parse_path_or_struct_or_macro(bool no_struct) -> Result<ExprPtr, ParseError> {
    size_t start = pos_;
    PathExpr path;
    auto parsed = parse_path(path);
    if (is_err(parsed)) {
        return unwrap_err(parsed);
    }

    if (check(TokenKind::Not) &&
        (check_at(1, TokenKind::LParen) || check_at(1, TokenKind::LBracket) ||
         check_at(1, TokenKind::LBrace))) {
        advance(); // '!'
        auto delimiter = peek().kind;
        auto body = skip_balanced();
        if (is_err(body)) {
            return unwrap_err(body);
        }
        TokenRange inner{unwrap(body).begin + 1, unwrap(body).end - 1};
        return make_expr(MacroExpr{.path = std::move(path.segments),
                                   .body = inner,
                                   .delimiter = delimiter},
                         start);
    }

    auto expr = make_expr(std::move(path), start);
    if (!no_struct && check(TokenKind::LBrace)) {
        return parse_struct_literal(std::move(expr), start);
    }
    return expr;
}

auto Parser::parse_struct_literal(ExprPtr path, size_t start) -> Result<ExprPtr, ParseError> {
    advance(); // '{'
    StructExpr literal{.path = std::move(path)};

    while (!check(TokenKind::RBrace)) {
        if (is_at_end()) {
            return error_here("expected '}' after struct literal");
        }
        auto attrs = parse_outer_attrs();
        if (is_err(attrs)) {
            return unwrap_err(attrs);
        }

        if (match(TokenKind::DotDot)) {
            literal.has_rest = true;
            if (!check(TokenKind::RBrace)) {
                auto base = parse_expr_with_precedence(precedence::NONE, false);
                if (is_err(base)) {
                    return base;
                }
                literal.base = std::move(unwrap(base));
            }
            break;
        }

        if (!check(TokenKind::Identifier) && !check(TokenKind::IntLiteral)) {
            return error_here("expected field name in struct literal");
        }
        StructExprField field{.name = std::string(advance().text())};
        if (match(TokenKind::Colon)) {
            auto value = parse_expr_with_precedence(precedence::NONE, false);
            if (is_err(value)) {
                return value;
            }
            field.value = std::move(unwrap(value));
        }
        literal.fields.push_back(std::move(field));

        if (!match(TokenKind::Comma)) {
            break;
        }
    }

    auto close = expect(TokenKind::RBrace, "expected '}' after struct literal");
    if (is_err(close)) {
        return unwrap_err(close);
    }
    return make_expr(std::move(literal), start);
}

// ============================================================================
// Tuples and Arrays
// ============================================================================

auto Parser::parse_paren_or_tuple() -> Result<ExprPtr, ParseError> {
    size_t start = pos_;
    advance(); // '('

    if (match(TokenKind::RParen)) {
        return make_expr(TupleExpr{}, start);
    }

    auto first = parse_expr_with_precedence(precedence::NONE, false);
    if (is_err(first)) {
        return first;
    }
    if (match(TokenKind::RParen)) {
        return make_expr(ParenExpr{.inner = std::move(unwrap(first))}, start);
    }

    TupleExpr tuple;
    tuple.elements.push_back(std::move(unwrap(first)));
    while (match(TokenKind::Comma)) {
        if (check(TokenKind::RParen)) {
            break;
        }
        auto element = parse_expr_with_precedence(precedence::NONE, false);
        if (is_err(element)) {
            return element;
        }
        tuple.elements.push_back(std::move(unwrap(element)));
    }

    auto close = expect(TokenKind::RParen, "expected ')' after tuple");
    if (is_err(close)) {
        return unwrap_err(close);
    }
    return make_expr(std::move(tuple), start);
}

auto Parser::parse_array() -> Result<ExprPtr, ParseError> {
    size_t start = pos_;
    advance(); // '['

    if (match(TokenKind::RBracket)) {
        return make_expr(ArrayExpr{}, start);
    }

    ArrayExpr array;
    auto first = parse_expr_with_precedence(precedence::NONE, false);
    if (is_err(first)) {
        return first;
    }
    array.elements.push_back(std::move(unwrap(first)));

    if (match(TokenKind::Semi)) {
        auto count = parse_expr_with_precedence(precedence::NONE, false);
        if (is_err(count)) {
            return count;
        }
        array.repeat_count = std::move(unwrap(count));
    } else {
        while (match(TokenKind::Comma)) {
            if (check(TokenKind::RBracket)) {
                break;
            }
            auto element = parse_expr_with_precedence(precedence::NONE, false);
            if (is_err(element)) {
                return element;
            }
            array.elements.push_back(std::move(unwrap(element)));
        }
    }

    auto close = expect(TokenKind::RBracket, "expected ']' after array");
    if (is_err(close)) {
        return unwrap_err(close);
    }
    return make_expr(std::move(array), start);
}

// ============================================================================
// Control Flow
// ============================================================================

auto Parser::parse_if() -> Result<ExprPtr, ParseError> {
    size_t start = pos_;
    advance(); // 'if'

    auto condition = parse_expr_with_precedence(precedence::NONE, true);
    if (is_err(condition)) {
        return condition;
    }
    auto then_block = parse_block();
    if (is_err(then_block)) {
        return then_block;
    }

    ExprPtr else_branch;
    if (match(TokenKind::KwElse)) {
        auto branch = check(TokenKind::KwIf) ? parse_if() : parse_block();
        if (is_err(branch)) {
            return branch;
        }
        else_branch = std::move(unwrap(branch));
    }

    return make_expr(IfExpr{.condition = std::move(unwrap(condition)),
                            .then_block = std::move(unwrap(then_block)),
                            .else_branch = std::move(else_branch)},
                     start);
}

auto Parser::parse_let_expr() -> Result<ExprPtr, ParseError> {
    size_t start = pos_;
    advance(); // 'let'

    auto pattern = skip_until({TokenKind::Eq}, false);
    if (is_err(pattern)) {
        return unwrap_err(pattern);
    }
    auto eq = expect(TokenKind::Eq, "expected '=' in let condition");
    if (is_err(eq)) {
        return unwrap_err(eq);
    }

    // `let` binds tighter than `&&` so that let chains split at `&&`.
    auto scrutinee = parse_expr_with_precedence(precedence::AND, true);
    if (is_err(scrutinee)) {
        return scrutinee;
    }
    return make_expr(
        LetExpr{.pattern = unwrap(pattern), .scrutinee = std::move(unwrap(scrutinee))}, start);
}

auto Parser::parse_match() -> Result<ExprPtr, ParseError> {
    size_t start = pos_;
    advance(); // 'match'

    auto scrutinee = parse_expr_with_precedence(precedence::NONE, true);
    if (is_err(scrutinee)) {
        return scrutinee;
    }
    auto open = expect(TokenKind::LBrace, "expected '{' after match scrutinee");
    if (is_err(open)) {
        return unwrap_err(open);
    }
    auto inner = parse_inner_attrs();
    if (is_err(inner)) {
        return unwrap_err(inner);
    }

    MatchExpr match_expr{.scrutinee = std::move(unwrap(scrutinee))};

    while (!check(TokenKind::RBrace)) {
        if (is_at_end()) {
            return error_here("expected '}' after match arms");
        }
        size_t arm_start = pos_;
        auto attrs = parse_outer_attrs();
        if (is_err(attrs)) {
            return unwrap_err(attrs);
        }

        MatchArm arm;
        auto pattern = skip_until({TokenKind::FatArrow, TokenKind::KwIf}, false);
        if (is_err(pattern)) {
            return unwrap_err(pattern);
        }
        arm.pattern = unwrap(pattern);
        if (arm.pattern.empty()) {
            return error_here("expected pattern");
        }

        if (match(TokenKind::KwIf)) {
            auto guard = parse_expr_with_precedence(precedence::NONE, false);
            if (is_err(guard)) {
                return guard;
            }
            arm.guard = std::move(unwrap(guard));
        }

        auto arrow = expect(TokenKind::FatArrow, "expected '=>' after match pattern");
        if (is_err(arrow)) {
            return unwrap_err(arrow);
        }

        auto body = parse_statement_expr();
        if (is_err(body)) {
            return unwrap_err(body);
        }
        arm.body = std::move(unwrap(body).expr);

        if (!match(TokenKind::Comma) && !unwrap(body).block_like && !check(TokenKind::RBrace)) {
            return error_here("expected ',' after match arm");
        }
        arm.range = {arm_start, pos_};
        match_expr.arms.push_back(std::move(arm));
    }
    advance(); // '}'

    return make_expr(std::move(match_expr), start);
}

auto Parser::parse_labeled(std::string label, size_t start) -> Result<ExprPtr, ParseError> {
    if (check(TokenKind::LBrace)) {
        return parse_block(BlockKind::Plain, std::move(label), start);
    }

    if (match(TokenKind::KwLoop)) {
        auto body = parse_block();
        if (is_err(body)) {
            return body;
        }
        return make_expr(LoopExpr{.label = std::move(label), .body = std::move(unwrap(body))},
                         start);
    }

    if (match(TokenKind::KwWhile)) {
        auto condition = parse_expr_with_precedence(precedence::NONE, true);
        if (is_err(condition)) {
            return condition;
        }
        auto body = parse_block();
        if (is_err(body)) {
            return body;
        }
        return make_expr(WhileExpr{.label = std::move(label),
                                   .condition = std::move(unwrap(condition)),
                                   .body = std::move(unwrap(body))},
                         start);
    }

    if (match(TokenKind::KwFor)) {
        auto pattern = skip_until({TokenKind::KwIn}, false);
        if (is_err(pattern)) {
            return unwrap_err(pattern);
        }
        auto in = expect(TokenKind::KwIn, "expected 'in' after for pattern");
        if (is_err(in)) {
            return unwrap_err(in);
        }
        auto iter = parse_expr_with_precedence(precedence::NONE, true);
        if (is_err(iter)) {
            return iter;
        }
        auto body = parse_block();
        if (is_err(body)) {
            return body;
        }
        return make_expr(ForExpr{.label = std::move(label),
                                 .pattern = unwrap(pattern),
                                 .iter = std::move(unwrap(iter)),
                                 .body = std::move(unwrap(body))},
                         start);
    }

    return error_here("expected loop or block after label");
}

auto Parser::parse_jump(bool no_struct) -> Result<ExprPtr, ParseError> {
    size_t start = pos_;
    const auto kind = advance().kind;

    std::string label;
    if (kind != TokenKind::KwReturn && check(TokenKind::Lifetime)) {
        label = std::string(advance().text());
    }

    ExprPtr value;
    if (kind != TokenKind::KwContinue && can_begin_expr(no_struct)) {
        auto parsed = parse_expr_with_precedence(precedence::NONE, no_struct);
        if (is_err(parsed)) {
            return parsed;
        }
        value = std::move(unwrap(parsed));
    }

    switch (kind) {
    case TokenKind::KwReturn:
        return make_expr(ReturnExpr{.value = std::move(value)}, start);
    case TokenKind::KwBreak:
        return make_expr(BreakExpr{.label = std::move(label), .value = std::move(value)}, start);
    default:
        return make_expr(ContinueExpr{.label = std::move(label)}, start);
    }
}

// ============================================================================
// Closures
// ============================================================================

auto Parser::parse_closure(bool no_struct) -> Result<ExprPtr, ParseError> {
    size_t start = pos_;
    ClosureExpr closure;
    closure.is_async = match(TokenKind::KwAsync);
    closure.is_move = match(TokenKind::KwMove);

    if (!match(TokenKind::OrOr)) {
        auto open = expect(TokenKind::Or, "expected '|' to start closure parameters");
        if (is_err(open)) {
            return unwrap_err(open);
        }
        while (!check(TokenKind::Or)) {
            if (is_at_end()) {
                return error_here("expected '|' after closure parameters");
            }
            auto attrs = parse_outer_attrs();
            if (is_err(attrs)) {
                return unwrap_err(attrs);
            }
            ClosureParam param;
            auto pattern = skip_until({TokenKind::Comma, TokenKind::Or, TokenKind::Colon}, false);
            if (is_err(pattern)) {
                return unwrap_err(pattern);
            }
            param.pattern = unwrap(pattern);
            if (match(TokenKind::Colon)) {
                auto type = skip_until({TokenKind::Comma, TokenKind::Or}, true);
                if (is_err(type)) {
                    return unwrap_err(type);
                }
                param.type = unwrap(type);
            }
            closure.params.push_back(param);
            if (!match(TokenKind::Comma)) {
                break;
            }
        }
        auto close = expect(TokenKind::Or, "expected '|' after closure parameters");
        if (is_err(close)) {
            return unwrap_err(close);
        }
    }

    if (match(TokenKind::RArrow)) {
        auto ret = skip_type();
        if (is_err(ret)) {
            return unwrap_err(ret);
        }
        closure.return_type = unwrap(ret);
        auto body = parse_block();
        if (is_err(body)) {
            return body;
        }
        closure.body = std::move(unwrap(body));
    } else {
        auto body = parse_expr_with_precedence(precedence::NONE, no_struct);
        if (is_err(body)) {
            return body;
        }
        closure.body = std::move(unwrap(body));
    }

    return make_expr(std::move(closure), start);
}

} // namespace semdiff::parser
