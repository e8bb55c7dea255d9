//! # Lexer Core
//!
//! - **Keyword table**: strict Rust keywords
//! - **Character access**: `peek()`, `advance()`, `is_at_end()`
//! - **Token creation**: `make_token()`, `make_error_token()`
//! - **Comment handling**: line, doc and nested block comments, shebang line
//! - **Dispatch**: `next_token()` selects the sub-lexer from the first character
//!
//! Weak keywords (`union`, `default`, `auto`, `macro_rules`) stay identifiers;
//! the parser recognizes them by position.

#include "lexer/lexer.hpp"

#include <unordered_map>

namespace semdiff::lexer {

namespace {

const std::unordered_map<std::string_view, TokenKind> KEYWORDS = {
    {"as", TokenKind::KwAs},
    {"async", TokenKind::KwAsync},
    {"await", TokenKind::KwAwait},
    {"break", TokenKind::KwBreak},
    {"const", TokenKind::KwConst},
    {"continue", TokenKind::KwContinue},
    {"crate", TokenKind::KwCrate},
    {"dyn", TokenKind::KwDyn},
    {"else", TokenKind::KwElse},
    {"enum", TokenKind::KwEnum},
    {"extern", TokenKind::KwExtern},
    {"fn", TokenKind::KwFn},
    {"for", TokenKind::KwFor},
    {"if", TokenKind::KwIf},
    {"impl", TokenKind::KwImpl},
    {"in", TokenKind::KwIn},
    {"let", TokenKind::KwLet},
    {"loop", TokenKind::KwLoop},
    {"match", TokenKind::KwMatch},
    {"mod", TokenKind::KwMod},
    {"move", TokenKind::KwMove},
    {"mut", TokenKind::KwMut},
    {"pub", TokenKind::KwPub},
    {"ref", TokenKind::KwRef},
    {"return", TokenKind::KwReturn},
    {"self", TokenKind::KwSelfValue},
    {"Self", TokenKind::KwSelfType},
    {"static", TokenKind::KwStatic},
    {"struct", TokenKind::KwStruct},
    {"super", TokenKind::KwSuper},
    {"trait", TokenKind::KwTrait},
    {"type", TokenKind::KwType},
    {"unsafe", TokenKind::KwUnsafe},
    {"use", TokenKind::KwUse},
    {"where", TokenKind::KwWhere},
    {"while", TokenKind::KwWhile},

    // Literals spelled as words
    {"true", TokenKind::BoolLiteral},
    {"false", TokenKind::BoolLiteral},
};

} // anonymous namespace

auto Lexer::lookup_keyword(std::string_view ident) -> std::optional<TokenKind> {
    auto it = KEYWORDS.find(ident);
    if (it == KEYWORDS.end()) {
        return std::nullopt;
    }
    return it->second;
}

Lexer::Lexer(const Source& source) : source_(source) {
    skip_shebang();
}

auto Lexer::peek() const -> char {
    return source_.at(pos_);
}

auto Lexer::peek_next() const -> char {
    return source_.at(pos_ + 1);
}

auto Lexer::peek_n(size_t n) const -> char {
    return source_.at(pos_ + n);
}

auto Lexer::advance() -> char {
    char c = peek();
    ++pos_;
    return c;
}

auto Lexer::is_at_end() const -> bool {
    return pos_ >= source_.length();
}

auto Lexer::make_token(TokenKind kind) -> Token {
    auto start_loc = source_.location(token_start_);
    auto end_loc = source_.location(pos_ > token_start_ ? pos_ - 1 : token_start_);
    start_loc.length = static_cast<uint32_t>(pos_ - token_start_);
    end_loc.length = start_loc.length;

    return Token{.kind = kind,
                 .span = {start_loc, end_loc},
                 .lexeme = source_.slice(token_start_, pos_),
                 .value = std::monostate{}};
}

auto Lexer::make_error_token(const std::string& message) -> Token {
    report_error(message);
    auto token = make_token(TokenKind::Error);
    token.value = std::monostate{};
    return token;
}

void Lexer::report_error(const std::string& message) {
    errors_.push_back(LexerError{
        .message = message, .span = {source_.location(token_start_), source_.location(pos_)}});
}

// ============================================================================
// Whitespace and Comments
// ============================================================================

void Lexer::skip_shebang() {
    // `#!` starts a shebang unless it is an inner attribute `#![...]`.
    if (peek() != '#' || peek_next() != '!') {
        return;
    }
    size_t ahead = 2;
    while (peek_n(ahead) == ' ' || peek_n(ahead) == '\t') {
        ++ahead;
    }
    if (peek_n(ahead) == '[') {
        return;
    }
    while (!is_at_end() && peek() != '\n') {
        advance();
    }
}

void Lexer::skip_whitespace() {
    while (!is_at_end()) {
        char c = peek();
        switch (c) {
        case ' ':
        case '\t':
        case '\r':
        case '\n':
        case '\v':
        case '\f':
            advance();
            break;
        case '/':
            if (peek_next() == '/') {
                skip_line_comment();
            } else if (peek_next() == '*') {
                skip_block_comment();
            } else {
                return;
            }
            break;
        default:
            return;
        }
    }
}

void Lexer::skip_line_comment() {
    while (!is_at_end() && peek() != '\n') {
        advance();
    }
}

void Lexer::skip_block_comment() {
    token_start_ = pos_;
    advance();
    advance();

    int depth = 1;
    while (!is_at_end() && depth > 0) {
        if (peek() == '/' && peek_next() == '*') {
            advance();
            advance();
            ++depth;
        } else if (peek() == '*' && peek_next() == '/') {
            advance();
            advance();
            --depth;
        } else {
            advance();
        }
    }

    if (depth > 0) {
        report_error("unterminated block comment");
    }
}

// ============================================================================
// Dispatch
// ============================================================================

auto Lexer::next_token() -> Token {
    skip_whitespace();
    token_start_ = pos_;

    if (is_at_end()) {
        return make_token(TokenKind::Eof);
    }

    char c = peek();
    char next = peek_next();

    // Literal prefixes and raw identifiers share their first letter with
    // ordinary identifiers, so they are checked first.
    if (c == 'r' && (next == '"' || (next == '#' && (peek_n(2) == '"' || peek_n(2) == '#')))) {
        return lex_raw_quoted(TokenKind::StringLiteral);
    }
    if (c == 'b') {
        if (next == '\'') {
            advance();
            return lex_byte();
        }
        if (next == '"') {
            advance();
            return lex_quoted(TokenKind::ByteStringLiteral);
        }
        if (next == 'r' && (peek_n(2) == '"' || peek_n(2) == '#')) {
            advance();
            return lex_raw_quoted(TokenKind::ByteStringLiteral);
        }
    }
    if (c == 'c') {
        if (next == '"') {
            advance();
            return lex_quoted(TokenKind::CStringLiteral);
        }
        if (next == 'r' && (peek_n(2) == '"' || peek_n(2) == '#')) {
            advance();
            return lex_raw_quoted(TokenKind::CStringLiteral);
        }
    }

    if (is_identifier_start(c)) {
        return lex_identifier();
    }
    if (c >= '0' && c <= '9') {
        return lex_number();
    }
    if (c == '"') {
        return lex_quoted(TokenKind::StringLiteral);
    }
    if (c == '\'') {
        return lex_lifetime_or_char();
    }
    return lex_operator();
}

auto Lexer::tokenize() -> std::vector<Token> {
    std::vector<Token> tokens;
    tokens.reserve(source_.length() / 4 + 1);
    while (true) {
        tokens.push_back(next_token());
        if (tokens.back().is_eof()) {
            break;
        }
    }
    return tokens;
}

} // namespace semdiff::lexer
