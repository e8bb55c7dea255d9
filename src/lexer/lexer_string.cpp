//! # Lexer - Strings, Bytes and Escapes
//!
//! | Form        | Kind                | Escapes                      |
//! |-------------|---------------------|------------------------------|
//! | `"..."`     | `StringLiteral`     | full set incl. `\u{...}`     |
//! | `b"..."`    | `ByteStringLiteral` | ASCII set, `\xNN` up to 0xFF |
//! | `c"..."`    | `CStringLiteral`    | full set, `\xNN` up to 0xFF  |
//! | `r#"..."#`  | any of the above    | none                         |
//! | `b'x'`      | `ByteLiteral`       | ASCII set, `\xNN` up to 0xFF |
//!
//! A backslash before a newline continues the string: the newline and the
//! leading whitespace of the next line are dropped.

#include "lexer/lexer.hpp"

namespace semdiff::lexer {

namespace {

auto hex_value(char c) -> int {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

} // namespace

auto Lexer::parse_escape_sequence(bool byte_mode) -> Result<char32_t, std::string> {
    if (is_at_end()) {
        return std::string("unterminated escape sequence");
    }
    char c = advance();
    switch (c) {
    case 'n':
        return U'\n';
    case 'r':
        return U'\r';
    case 't':
        return U'\t';
    case '\\':
        return U'\\';
    case '0':
        return U'\0';
    case '\'':
        return U'\'';
    case '"':
        return U'"';
    case 'x': {
        int hi = hex_value(peek());
        int lo = hex_value(peek_next());
        if (hi < 0 || lo < 0) {
            return std::string("invalid \\x escape");
        }
        advance();
        advance();
        int value = hi * 16 + lo;
        if (!byte_mode && value > 0x7F) {
            return std::string("\\x escape out of range, must be at most \\x7F");
        }
        return static_cast<char32_t>(value);
    }
    case 'u': {
        if (byte_mode) {
            return std::string("unicode escape in a byte literal");
        }
        if (peek() != '{') {
            return std::string("expected '{' after \\u");
        }
        advance();
        char32_t value = 0;
        int digits = 0;
        while (!is_at_end() && peek() != '}') {
            char d = advance();
            if (d == '_') {
                continue;
            }
            int v = hex_value(d);
            if (v < 0 || ++digits > 6) {
                return std::string("invalid unicode escape");
            }
            value = value * 16 + static_cast<char32_t>(v);
        }
        if (peek() != '}' || digits == 0) {
            return std::string("unterminated unicode escape");
        }
        advance();
        if (value > 0x10FFFF || (value >= 0xD800 && value <= 0xDFFF)) {
            return std::string("invalid unicode code point in escape");
        }
        return value;
    }
    default:
        return std::string("unknown character escape: '\\") + c + "'";
    }
}

auto Lexer::lex_quoted(TokenKind kind) -> Token {
    advance(); // opening "
    const bool byte_mode = kind == TokenKind::ByteStringLiteral;
    const bool raw_bytes = kind != TokenKind::StringLiteral;
    std::string value;

    while (!is_at_end() && peek() != '"') {
        if (peek() != '\\') {
            value += advance();
            continue;
        }
        advance();
        if (peek() == '\n' || (peek() == '\r' && peek_next() == '\n')) {
            while (!is_at_end() &&
                   (peek() == ' ' || peek() == '\t' || peek() == '\n' || peek() == '\r')) {
                advance();
            }
            continue;
        }
        const char escape_kind = peek();
        auto escaped = parse_escape_sequence(byte_mode);
        if (is_err(escaped)) {
            return make_error_token(unwrap_err(escaped));
        }
        char32_t cp = unwrap(escaped);
        // \xNN in byte and C strings denotes a raw byte, not a code point.
        if (raw_bytes && escape_kind == 'x') {
            value += static_cast<char>(cp);
        } else {
            value += encode_utf8(cp);
        }
    }

    if (is_at_end()) {
        return make_error_token("unterminated string literal");
    }
    advance(); // closing "

    auto token = make_token(kind);
    token.value = StringValue{.value = std::move(value), .is_raw = false};
    return token;
}

auto Lexer::lex_raw_quoted(TokenKind kind) -> Token {
    advance(); // r
    size_t hashes = 0;
    while (peek() == '#') {
        advance();
        ++hashes;
    }
    if (peek() != '"') {
        return make_error_token("expected '\"' in raw string literal");
    }
    advance();

    size_t content_start = pos_;
    while (!is_at_end()) {
        if (peek() == '"') {
            size_t closing = 0;
            while (closing < hashes && peek_n(1 + closing) == '#') {
                ++closing;
            }
            if (closing == hashes) {
                auto content = source_.slice(content_start, pos_);
                pos_ += 1 + hashes;
                auto token = make_token(kind);
                token.value = StringValue{.value = std::string(content), .is_raw = true};
                return token;
            }
        }
        advance();
    }
    return make_error_token("unterminated raw string literal");
}

auto Lexer::lex_byte() -> Token {
    advance(); // '
    char32_t value = 0;
    if (peek() == '\\') {
        advance();
        auto escaped = parse_escape_sequence(true);
        if (is_err(escaped)) {
            return make_error_token(unwrap_err(escaped));
        }
        value = unwrap(escaped);
    } else {
        if (is_at_end() || static_cast<unsigned char>(peek()) >= 0x80 || peek() == '\'') {
            return make_error_token("invalid byte literal");
        }
        value = static_cast<unsigned char>(advance());
    }
    if (peek() != '\'') {
        return make_error_token("unterminated byte literal");
    }
    advance();

    auto token = make_token(TokenKind::ByteLiteral);
    token.value = CharValue{value};
    return token;
}

} // namespace semdiff::lexer
