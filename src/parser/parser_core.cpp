//! # Parser Core
//!
//! Token navigation, structural skipping and the `parse_source` entry point.
//!
//! ## Token Navigation
//!
//! | Method         | Description                           |
//! |----------------|---------------------------------------|
//! | `peek()`       | Look at current token                 |
//! | `peek_at(n)`   | Look `n` tokens ahead                 |
//! | `advance()`    | Consume and return current token      |
//! | `previous()`   | Get last consumed token               |
//! | `match()`      | Consume token if it matches           |
//! | `check()`      | Check current token without consuming |
//! | `expect()`     | Require specific token or error       |
//!
//! ## Skipping
//!
//! Types, patterns, generics and where clauses are never parsed into nodes.
//! The skip routines walk them by delimiter nesting and return the range
//! they covered. `<` and `>` only count as nesting where generics can
//! appear; a `>>`, `>=` or `>>=` that closes a generic list is split in the
//! parser's token vector so that the remainder is seen as its own token.

#include "log/log.hpp"
#include "parser/parser.hpp"

#include <algorithm>

namespace semdiff::parser {

using lexer::TokenKind;

Parser::Parser(std::vector<lexer::Token> tokens) : tokens_(std::move(tokens)) {
    if (tokens_.empty() || !tokens_.back().is_eof()) {
        tokens_.push_back(lexer::Token{});
    }
}

// ============================================================================
// Token Access
// ============================================================================

auto Parser::peek() const -> const lexer::Token& {
    if (pos_ >= tokens_.size()) {
        return tokens_.back();
    }
    return tokens_[pos_];
}

auto Parser::peek_at(size_t n) const -> const lexer::Token& {
    if (pos_ + n >= tokens_.size()) {
        return tokens_.back();
    }
    return tokens_[pos_ + n];
}

auto Parser::previous() const -> const lexer::Token& {
    if (pos_ == 0) {
        return tokens_[0];
    }
    return tokens_[pos_ - 1];
}

auto Parser::advance() -> const lexer::Token& {
    if (!is_at_end()) {
        ++pos_;
    }
    return previous();
}

auto Parser::is_at_end() const -> bool {
    return peek().is_eof();
}

auto Parser::check(TokenKind kind) const -> bool {
    return peek().kind == kind;
}

auto Parser::check_at(size_t n, TokenKind kind) const -> bool {
    return peek_at(n).kind == kind;
}

auto Parser::check_word(std::string_view word) const -> bool {
    return check(TokenKind::Identifier) && peek().lexeme == word;
}

auto Parser::match(TokenKind kind) -> bool {
    if (check(kind)) {
        advance();
        return true;
    }
    return false;
}

auto Parser::expect(TokenKind kind, const std::string& message) -> Result<size_t, ParseError> {
    if (check(kind)) {
        size_t index = pos_;
        advance();
        return index;
    }
    return error_here(message);
}

auto Parser::error_here(const std::string& message) const -> ParseError {
    return ParseError{.message = message + ", found '" +
                                 std::string(lexer::token_kind_to_string(peek().kind)) + "'",
                      .span = peek().span};
}

auto Parser::make_expr(decltype(Expr::kind) kind, size_t start) -> ExprPtr {
    return make_box<Expr>(Expr{.kind = std::move(kind), .range = {start, pos_}});
}

// ============================================================================
// Structural Skipping
// ============================================================================

namespace {

auto closer_for(TokenKind open) -> TokenKind {
    switch (open) {
    case TokenKind::LParen:
        return TokenKind::RParen;
    case TokenKind::LBracket:
        return TokenKind::RBracket;
    case TokenKind::LBrace:
        return TokenKind::RBrace;
    default:
        return TokenKind::Eof;
    }
}

auto is_angle_closer(TokenKind kind) -> bool {
    return kind == TokenKind::Gt || kind == TokenKind::Shr || kind == TokenKind::Ge ||
           kind == TokenKind::ShrEq;
}

} // namespace

auto Parser::skip_balanced() -> Result<TokenRange, ParseError> {
    size_t start = pos_;
    std::vector<TokenKind> stack;
    stack.push_back(closer_for(peek().kind));
    if (stack.back() == TokenKind::Eof) {
        return error_here("expected delimiter");
    }
    advance();

    while (!stack.empty()) {
        const auto& tok = peek();
        if (tok.is_eof()) {
            return ParseError{.message = "unclosed delimiter", .span = tokens_[start].span};
        }
        if (lexer::is_open_delim(tok.kind)) {
            stack.push_back(closer_for(tok.kind));
        } else if (lexer::is_close_delim(tok.kind)) {
            if (tok.kind != stack.back()) {
                return error_here("mismatched closing delimiter");
            }
            stack.pop_back();
        }
        advance();
    }
    return TokenRange{start, pos_};
}

void Parser::split_angle_token(size_t index) {
    lexer::Token& tok = tokens_[index];
    TokenKind rest_kind;
    switch (tok.kind) {
    case TokenKind::Shr:
        rest_kind = TokenKind::Gt;
        break;
    case TokenKind::Ge:
        rest_kind = TokenKind::Eq;
        break;
    case TokenKind::ShrEq:
        rest_kind = TokenKind::Ge;
        break;
    default:
        return;
    }

    lexer::Token rest = tok;
    rest.kind = rest_kind;
    rest.lexeme = tok.lexeme.substr(1);
    rest.span.start.offset += 1;
    rest.span.start.column += 1;
    rest.span.start.length = static_cast<uint32_t>(rest.lexeme.size());

    tok.kind = TokenKind::Gt;
    tok.lexeme = tok.lexeme.substr(0, 1);
    tok.span.end = tok.span.start;
    tok.span.start.length = 1;

    tokens_.insert(tokens_.begin() + static_cast<std::ptrdiff_t>(index) + 1, rest);
}

auto Parser::skip_angle_brackets() -> Result<TokenRange, ParseError> {
    size_t start = pos_;
    if (!check(TokenKind::Lt)) {
        return error_here("expected '<'");
    }
    advance();
    int depth = 1;

    while (depth > 0) {
        const auto kind = peek().kind;
        if (kind == TokenKind::Eof) {
            return ParseError{.message = "unclosed '<'", .span = tokens_[start].span};
        }
        if (lexer::is_open_delim(kind)) {
            auto r = skip_balanced();
            if (is_err(r)) {
                return unwrap_err(r);
            }
            continue;
        }
        if (lexer::is_close_delim(kind) || kind == TokenKind::Semi) {
            return error_here("unexpected token in generic arguments");
        }
        if (kind == TokenKind::Lt) {
            ++depth;
        } else if (kind == TokenKind::Shl) {
            depth += 2;
        } else if (is_angle_closer(kind)) {
            split_angle_token(pos_);
            --depth;
        }
        advance();
    }
    return TokenRange{start, pos_};
}

auto Parser::skip_until(std::initializer_list<TokenKind> terminators, bool track_angles)
    -> Result<TokenRange, ParseError> {
    size_t start = pos_;
    int angle_depth = 0;

    while (true) {
        const auto kind = peek().kind;
        if (kind == TokenKind::Eof) {
            break;
        }
        bool terminator = std::find(terminators.begin(), terminators.end(), kind) !=
                          terminators.end();
        if (terminator && angle_depth == 0) {
            break;
        }
        if (lexer::is_open_delim(kind)) {
            auto r = skip_balanced();
            if (is_err(r)) {
                return unwrap_err(r);
            }
            continue;
        }
        if (lexer::is_close_delim(kind)) {
            // Closer of an enclosing delimiter ends the run.
            break;
        }
        if (track_angles) {
            if (kind == TokenKind::Lt) {
                ++angle_depth;
            } else if (kind == TokenKind::Shl) {
                angle_depth += 2;
            } else if (is_angle_closer(kind) && angle_depth > 0) {
                split_angle_token(pos_);
                --angle_depth;
            }
        }
        advance();
    }
    return TokenRange{start, pos_};
}

auto Parser::skip_type_path() -> Result<Unit, ParseError> {
    if (check(TokenKind::Lt)) {
        auto q = skip_angle_brackets();
        if (is_err(q)) {
            return unwrap_err(q);
        }
        if (!match(TokenKind::PathSep)) {
            return Unit{};
        }
    } else {
        match(TokenKind::PathSep);
    }

    while (true) {
        if (!(check(TokenKind::Identifier) || check(TokenKind::KwSelfValue) ||
              check(TokenKind::KwSelfType) || check(TokenKind::KwSuper) ||
              check(TokenKind::KwCrate))) {
            return error_here("expected type");
        }
        advance();

        if (check(TokenKind::Lt) ||
            (check(TokenKind::PathSep) && check_at(1, TokenKind::Lt))) {
            match(TokenKind::PathSep);
            auto g = skip_angle_brackets();
            if (is_err(g)) {
                return unwrap_err(g);
            }
        } else if (check(TokenKind::LParen)) {
            // Fn(A, B) -> C sugar
            auto p = skip_balanced();
            if (is_err(p)) {
                return unwrap_err(p);
            }
            if (match(TokenKind::RArrow)) {
                auto r = skip_type();
                if (is_err(r)) {
                    return unwrap_err(r);
                }
            }
        }

        if (check(TokenKind::PathSep) && !check_at(1, TokenKind::Lt)) {
            advance();
            continue;
        }
        return Unit{};
    }
}

auto Parser::skip_type() -> Result<TokenRange, ParseError> {
    size_t start = pos_;
    auto done = [&]() -> Result<TokenRange, ParseError> { return TokenRange{start, pos_}; };

    switch (peek().kind) {
    case TokenKind::And:
    case TokenKind::AndAnd: {
        advance();
        match(TokenKind::Lifetime);
        match(TokenKind::KwMut);
        auto inner = skip_type();
        if (is_err(inner)) {
            return unwrap_err(inner);
        }
        return done();
    }
    case TokenKind::Star: {
        advance();
        if (!match(TokenKind::KwConst) && !match(TokenKind::KwMut)) {
            return error_here("expected 'const' or 'mut' in raw pointer type");
        }
        auto inner = skip_type();
        if (is_err(inner)) {
            return unwrap_err(inner);
        }
        return done();
    }
    case TokenKind::LParen:
    case TokenKind::LBracket: {
        auto r = skip_balanced();
        if (is_err(r)) {
            return unwrap_err(r);
        }
        return done();
    }
    case TokenKind::Not:
    case TokenKind::Underscore:
        advance();
        return done();
    case TokenKind::KwUnsafe:
    case TokenKind::KwExtern:
    case TokenKind::KwFn: {
        match(TokenKind::KwUnsafe);
        if (match(TokenKind::KwExtern)) {
            match(TokenKind::StringLiteral);
        }
        if (!match(TokenKind::KwFn)) {
            return error_here("expected 'fn'");
        }
        auto params = skip_balanced();
        if (is_err(params)) {
            return unwrap_err(params);
        }
        if (match(TokenKind::RArrow)) {
            auto ret = skip_type();
            if (is_err(ret)) {
                return unwrap_err(ret);
            }
        }
        return done();
    }
    case TokenKind::KwImpl:
    case TokenKind::KwDyn: {
        advance();
        // Bounds: Trait + 'a + ?Sized
        while (true) {
            match(TokenKind::Question);
            if (check(TokenKind::Lifetime)) {
                advance();
            } else if (check(TokenKind::LParen)) {
                auto r = skip_balanced();
                if (is_err(r)) {
                    return unwrap_err(r);
                }
            } else {
                auto r = skip_type_path();
                if (is_err(r)) {
                    return unwrap_err(r);
                }
            }
            if (!match(TokenKind::Plus)) {
                break;
            }
        }
        return done();
    }
    case TokenKind::KwFor: {
        advance();
        auto g = skip_angle_brackets();
        if (is_err(g)) {
            return unwrap_err(g);
        }
        auto inner = skip_type();
        if (is_err(inner)) {
            return unwrap_err(inner);
        }
        return done();
    }
    default: {
        auto r = skip_type_path();
        if (is_err(r)) {
            return unwrap_err(r);
        }
        return done();
    }
    }
}

// ============================================================================
// Entry Point
// ============================================================================

auto parse_source(std::string path, std::string contents) -> Result<SourceFile, ParseError> {
    SourceFile file;
    file.source = make_box<lexer::Source>(std::move(path), std::move(contents));

    lexer::Lexer lex(*file.source);
    auto tokens = lex.tokenize();
    if (lex.has_errors()) {
        const auto& first = lex.errors().front();
        SEMDIFF_LOG_DEBUG("lexer", file.source->filename() << ": " << lex.errors().size()
                                                       << " lexical error(s)");
        return ParseError{.message = first.message, .span = first.span};
    }

    Parser parser(std::move(tokens));
    auto items = parser.parse_file(file.inner_attrs);
    if (is_err(items)) {
        SEMDIFF_LOG_DEBUG("parser", file.source->filename() << ": " << unwrap_err(items).message);
        return unwrap_err(items);
    }
    file.items = std::move(unwrap(items));
    file.tokens = parser.take_tokens();
    SEMDIFF_LOG_TRACE("parser", file.source->filename() << ": " << file.items.size() << " items, "
                                                        << file.tokens.size() << " tokens");
    return file;
}

} // namespace semdiff::parser
