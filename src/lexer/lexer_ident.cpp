//! # Lexer - Identifiers and Lifetimes
//!
//! ## Identifier Rules
//!
//! - Start with an ASCII letter, `_`, or any non-ASCII character
//! - Continue with letters, digits, `_`, or non-ASCII characters
//! - `r#name` is a raw identifier: never a keyword, value `name`
//! - A lone `_` is the `Underscore` token
//!
//! ## Quote Disambiguation
//!
//! `'` starts a char literal when it is followed by an escape, or by one
//! character and a closing `'`. Otherwise it starts a lifetime or label.

#include "lexer/lexer.hpp"

namespace semdiff::lexer {

auto Lexer::is_identifier_start(char c) -> bool {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' ||
           static_cast<unsigned char>(c) >= 0x80;
}

auto Lexer::is_identifier_continue(char c) -> bool {
    return is_identifier_start(c) || (c >= '0' && c <= '9');
}

auto Lexer::utf8_char_length(char c) -> size_t {
    auto byte = static_cast<unsigned char>(c);
    if (byte < 0x80)
        return 1;
    if ((byte & 0xE0) == 0xC0)
        return 2;
    if ((byte & 0xF0) == 0xE0)
        return 3;
    if ((byte & 0xF8) == 0xF0)
        return 4;
    return 1;
}

auto Lexer::decode_utf8() -> char32_t {
    auto lead = static_cast<unsigned char>(advance());
    size_t len = utf8_char_length(static_cast<char>(lead));
    if (len == 1) {
        return lead;
    }
    char32_t cp = lead & (0xFF >> (len + 1));
    for (size_t i = 1; i < len && !is_at_end(); ++i) {
        cp = (cp << 6) | (static_cast<unsigned char>(advance()) & 0x3F);
    }
    return cp;
}

auto Lexer::lex_identifier() -> Token {
    bool raw = peek() == 'r' && peek_next() == '#' && is_identifier_start(peek_n(2));
    if (raw) {
        advance();
        advance();
    }
    size_t name_start = pos_;
    while (!is_at_end() && is_identifier_continue(peek())) {
        advance();
    }

    auto name = source_.slice(name_start, pos_);
    if (raw) {
        auto token = make_token(TokenKind::Identifier);
        token.value = std::string(name);
        return token;
    }
    if (name == "_") {
        return make_token(TokenKind::Underscore);
    }
    if (auto kw = lookup_keyword(name)) {
        auto token = make_token(*kw);
        if (*kw == TokenKind::BoolLiteral) {
            token.value = (name == "true");
        }
        return token;
    }
    return make_token(TokenKind::Identifier);
}

auto Lexer::lex_lifetime_or_char() -> Token {
    advance(); // '

    if (peek() == '\\') {
        advance();
        auto escaped = parse_escape_sequence(false);
        if (is_err(escaped)) {
            return make_error_token(unwrap_err(escaped));
        }
        if (peek() != '\'') {
            return make_error_token("unterminated character literal");
        }
        advance();
        auto token = make_token(TokenKind::CharLiteral);
        token.value = CharValue{unwrap(escaped)};
        return token;
    }

    if (is_at_end() || peek() == '\n') {
        return make_error_token("unterminated character literal");
    }

    size_t len = utf8_char_length(peek());
    if (peek_n(len) == '\'') {
        char32_t value = decode_utf8();
        advance(); // closing '
        auto token = make_token(TokenKind::CharLiteral);
        token.value = CharValue{value};
        return token;
    }

    if (is_identifier_start(peek())) {
        if (peek() == 'r' && peek_next() == '#') {
            advance();
            advance();
        }
        while (!is_at_end() && is_identifier_continue(peek())) {
            advance();
        }
        return make_token(TokenKind::Lifetime);
    }

    return make_error_token("invalid character literal");
}

} // namespace semdiff::lexer
