//! # Lexer - Numbers
//!
//! | Format      | Prefix | Example        | Base |
//! |-------------|--------|----------------|------|
//! | Decimal     | (none) | `42`, `3.14`   | 10   |
//! | Hexadecimal | `0x`   | `0xFF`         | 16   |
//! | Binary      | `0b`   | `0b1010`       | 2    |
//! | Octal       | `0o`   | `0o755`        | 8    |
//!
//! Integer values are converted to decimal text so that literals written in
//! different bases compare equal (`0x10` and `16` both yield `"16"`). Any
//! identifier directly after the digits is the suffix; an `f32`/`f64`
//! suffix turns an integer-looking literal into a float (`1f32`).
//!
//! `1.` is a float only when the dot is not followed by another `.` (a
//! range) or an identifier (a method call such as `1.max(2)`).

#include "lexer/lexer.hpp"

#include <algorithm>
#include <vector>

namespace semdiff::lexer {

namespace {

auto digit_value(char c) -> int {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return 99;
}

/// Converts digits in `base` to base-10 text without overflow, using a
/// little-endian vector of decimal digits.
auto to_decimal(std::string_view digits, int base) -> std::string {
    std::vector<int> dec{0};
    for (char c : digits) {
        int carry = digit_value(c);
        for (int& d : dec) {
            int v = d * base + carry;
            d = v % 10;
            carry = v / 10;
        }
        while (carry > 0) {
            dec.push_back(carry % 10);
            carry /= 10;
        }
    }
    std::string out;
    for (auto it = dec.rbegin(); it != dec.rend(); ++it) {
        out += static_cast<char>('0' + *it);
    }
    return out;
}

auto strip_underscores(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c != '_')
            out += c;
    }
    return out;
}

} // namespace

auto Lexer::lex_number() -> Token {
    if (peek() == '0') {
        switch (peek_next()) {
        case 'x':
            return lex_radix_number(16);
        case 'o':
            return lex_radix_number(8);
        case 'b':
            return lex_radix_number(2);
        default:
            break;
        }
    }
    return lex_decimal_number();
}

auto Lexer::lex_radix_number(int base) -> Token {
    advance(); // 0
    advance(); // x / o / b

    size_t digit_start = pos_;
    while (!is_at_end()) {
        char c = peek();
        bool hex_letter = base == 16 && digit_value(c) >= 10 && digit_value(c) < 16;
        if ((c >= '0' && c <= '9') || hex_letter || c == '_') {
            advance();
        } else {
            break;
        }
    }

    std::string digits = strip_underscores(source_.slice(digit_start, pos_));
    if (digits.empty()) {
        return make_error_token("missing digits after integer base prefix");
    }
    if (std::any_of(digits.begin(), digits.end(), [base](char c) { return digit_value(c) >= base; })) {
        return make_error_token("invalid digit for a base " + std::to_string(base) + " literal");
    }

    size_t suffix_start = pos_;
    while (!is_at_end() && is_identifier_continue(peek())) {
        advance();
    }

    auto token = make_token(TokenKind::IntLiteral);
    token.value = IntValue{.decimal = to_decimal(digits, base),
                           .base = static_cast<uint8_t>(base),
                           .suffix = std::string(source_.slice(suffix_start, pos_))};
    return token;
}

auto Lexer::lex_decimal_number() -> Token {
    auto consume_digits = [this] {
        while (!is_at_end() && ((peek() >= '0' && peek() <= '9') || peek() == '_')) {
            advance();
        }
    };

    consume_digits();
    bool is_float = false;

    if (peek() == '.' && peek_next() != '.' && !is_identifier_start(peek_next())) {
        advance();
        is_float = true;
        consume_digits();
    }

    char e = peek();
    if (e == 'e' || e == 'E') {
        char sign = peek_next();
        bool has_sign = sign == '+' || sign == '-';
        size_t digit_pos = has_sign ? 2 : 1;
        size_t ahead = digit_pos;
        while (peek_n(ahead) == '_') {
            ++ahead;
        }
        if (peek_n(ahead) >= '0' && peek_n(ahead) <= '9') {
            for (size_t i = 0; i < digit_pos; ++i) {
                advance();
            }
            consume_digits();
            is_float = true;
        }
    }

    std::string text = strip_underscores(source_.slice(token_start_, pos_));

    size_t suffix_start = pos_;
    while (!is_at_end() && is_identifier_continue(peek())) {
        advance();
    }
    std::string suffix(source_.slice(suffix_start, pos_));
    if (suffix == "f32" || suffix == "f64") {
        is_float = true;
    }

    if (is_float) {
        auto token = make_token(TokenKind::FloatLiteral);
        token.value = FloatValue{.text = std::move(text), .suffix = std::move(suffix)};
        return token;
    }

    size_t first_significant = text.find_first_not_of('0');
    auto token = make_token(TokenKind::IntLiteral);
    token.value = IntValue{.decimal = first_significant == std::string::npos
                                          ? std::string("0")
                                          : text.substr(first_significant),
                           .base = 10,
                           .suffix = std::move(suffix)};
    return token;
}

} // namespace semdiff::lexer
