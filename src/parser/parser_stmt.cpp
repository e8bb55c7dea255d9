//! # Parser - Blocks and Statements
//!
//! A block is a sequence of statements with an optional tail expression:
//!
//! ```text
//! block = '{' inner_attr* stmt* expr? '}'
//! stmt  = ';' | item | 'let' pattern (':' type)? ('=' expr ('else' block)?)? ';'
//!       | expr ';' | block_like_expr
//! ```
//!
//! An expression statement that begins with a block-like expression (`if`,
//! `match`, a loop, a block, `name! { }`) ends after it, so
//! `if a { } *p = 1;` is two statements.

#include "parser/parser.hpp"

namespace semdiff::parser {

using lexer::TokenKind;

auto Parser::parse_block() -> Result<ExprPtr, ParseError> {
    return parse_block(BlockKind::Plain, "", pos_);
}

auto Parser::parse_block(BlockKind kind, std::string label, size_t start)
    -> Result<ExprPtr, ParseError> {
    auto open = expect(TokenKind::LBrace, "expected '{'");
    if (is_err(open)) {
        return unwrap_err(open);
    }
    auto inner = parse_inner_attrs();
    if (is_err(inner)) {
        return unwrap_err(inner);
    }

    BlockExpr block{.kind = kind, .label = std::move(label)};

    while (!check(TokenKind::RBrace)) {
        if (is_at_end()) {
            return error_here("expected '}'");
        }
        size_t stmt_start = pos_;
        auto push = [&](decltype(Stmt::kind) stmt) {
            block.stmts.push_back(
                make_box<Stmt>(Stmt{.kind = std::move(stmt), .range = {stmt_start, pos_}}));
        };

        if (match(TokenKind::Semi)) {
            push(EmptyStmt{});
            continue;
        }

        auto attrs = parse_outer_attrs();
        if (is_err(attrs)) {
            return unwrap_err(attrs);
        }

        if (is_item_start()) {
            pos_ = stmt_start; // parse_item reads the attributes again
            auto item = parse_item();
            if (is_err(item)) {
                return unwrap_err(item);
            }
            push(ItemStmt{.item = std::move(unwrap(item))});
            continue;
        }

        if (check(TokenKind::KwLet)) {
            auto let = parse_let_stmt();
            if (is_err(let)) {
                return unwrap_err(let);
            }
            push(std::move(unwrap(let)));
            continue;
        }

        auto stmt = parse_statement_expr();
        if (is_err(stmt)) {
            return unwrap_err(stmt);
        }
        auto& [expr, block_like] = unwrap(stmt);

        if (match(TokenKind::Semi)) {
            push(ExprStmt{.expr = std::move(expr), .has_semi = true});
        } else if (check(TokenKind::RBrace)) {
            block.tail = std::move(expr);
        } else if (block_like) {
            push(ExprStmt{.expr = std::move(expr), .has_semi = false});
        } else {
            return error_here("expected ';' or '}' after expression");
        }
    }
    advance(); // '}'

    return make_expr(std::move(block), start);
}

auto Parser::parse_let_stmt() -> Result<LetStmt, ParseError> {
    advance(); // 'let'
    LetStmt let;

    auto pattern = skip_until({TokenKind::Colon, TokenKind::Eq, TokenKind::Semi}, false);
    if (is_err(pattern)) {
        return unwrap_err(pattern);
    }
    let.pattern = unwrap(pattern);
    if (let.pattern.empty()) {
        return error_here("expected pattern after 'let'");
    }

    if (match(TokenKind::Colon)) {
        auto type = skip_until({TokenKind::Eq, TokenKind::Semi}, true);
        if (is_err(type)) {
            return unwrap_err(type);
        }
        let.type = unwrap(type);
    }

    if (match(TokenKind::Eq)) {
        auto init = parse_expr_with_precedence(precedence::NONE, false);
        if (is_err(init)) {
            return unwrap_err(init);
        }
        let.init = std::move(unwrap(init));

        if (match(TokenKind::KwElse)) {
            auto else_block = parse_block();
            if (is_err(else_block)) {
                return unwrap_err(else_block);
            }
            let.else_block = std::move(unwrap(else_block));
        }
    }

    auto semi = expect(TokenKind::Semi, "expected ';' after let statement");
    if (is_err(semi)) {
        return unwrap_err(semi);
    }
    return let;
}

auto Parser::starts_block_like() const -> bool {
    const auto& next = peek_at(1);
    switch (peek().kind) {
    case TokenKind::LBrace:
    case TokenKind::KwIf:
    case TokenKind::KwMatch:
    case TokenKind::KwLoop:
    case TokenKind::KwWhile:
    case TokenKind::KwFor:
        return true;
    case TokenKind::KwUnsafe:
    case TokenKind::KwConst:
        return next.is(TokenKind::LBrace);
    case TokenKind::KwAsync:
        return next.is(TokenKind::LBrace) ||
               (next.is(TokenKind::KwMove) && check_at(2, TokenKind::LBrace));
    case TokenKind::Lifetime:
        return next.is(TokenKind::Colon);
    case TokenKind::Identifier:
        return next.is(TokenKind::Not) && check_at(2, TokenKind::LBrace);
    default:
        return false;
    }
}

auto Parser::parse_statement_expr() -> Result<StatementExpr, ParseError> {
    if (!starts_block_like()) {
        auto expr = parse_expr_with_precedence(precedence::NONE, false);
        if (is_err(expr)) {
            return unwrap_err(expr);
        }
        return StatementExpr{.expr = std::move(unwrap(expr)), .block_like = false};
    }

    auto expr = parse_primary_expr(false);
    if (is_err(expr)) {
        return unwrap_err(expr);
    }
    if (!check(TokenKind::Dot) && !check(TokenKind::Question)) {
        return StatementExpr{.expr = std::move(unwrap(expr)), .block_like = true};
    }

    // `match x { .. }.len()` continues as an ordinary expression
    auto postfix = parse_postfix_expr(std::move(unwrap(expr)));
    if (is_err(postfix)) {
        return unwrap_err(postfix);
    }
    auto full = parse_infix_loop(std::move(unwrap(postfix)), precedence::NONE, false);
    if (is_err(full)) {
        return unwrap_err(full);
    }
    return StatementExpr{.expr = std::move(unwrap(full)), .block_like = false};
}

} // namespace semdiff::parser
