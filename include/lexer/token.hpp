//! # Token Definitions
//!
//! Token types produced by the Rust lexer.
//!
//! ## Overview
//!
//! - **Literals**: integers, floats, strings, byte and C strings, chars, bytes, booleans
//! - **Keywords**: the strict Rust keywords (`fn`, `impl`, `match`, ...)
//! - **Lifetimes**: `'a`, `'static`, loop labels
//! - **Operators and delimiters**: everything Rust punctuation can form
//!
//! Comments never become tokens. Signatures and fingerprints are computed
//! from the token stream, which makes them insensitive to comments and
//! whitespace.

#ifndef SEMDIFF_LEXER_TOKEN_HPP
#define SEMDIFF_LEXER_TOKEN_HPP

#include "common.hpp"

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <variant>

namespace semdiff::lexer {

/// All token kinds.
enum class TokenKind : uint8_t {
    Eof,
    Error,

    // ========================================================================
    // Literals
    // ========================================================================
    IntLiteral,        ///< `42`, `0xFF`, `1_000u64`
    FloatLiteral,      ///< `3.14`, `1e10`, `2.5f32`
    StringLiteral,     ///< `"text"`, `r#"raw"#`
    ByteStringLiteral, ///< `b"bytes"`, `br"raw"`
    CStringLiteral,    ///< `c"text"`, `cr"raw"`
    CharLiteral,       ///< `'a'`, `'\u{1F600}'`
    ByteLiteral,       ///< `b'a'`
    BoolLiteral,       ///< `true`, `false`

    // ========================================================================
    // Names
    // ========================================================================
    Identifier, ///< `foo`, `r#type`
    Lifetime,   ///< `'a`, `'static`, `'outer`

    // ========================================================================
    // Keywords
    // ========================================================================
    KwAs,
    KwAsync,
    KwAwait,
    KwBreak,
    KwConst,
    KwContinue,
    KwCrate,
    KwDyn,
    KwElse,
    KwEnum,
    KwExtern,
    KwFn,
    KwFor,
    KwIf,
    KwImpl,
    KwIn,
    KwLet,
    KwLoop,
    KwMatch,
    KwMod,
    KwMove,
    KwMut,
    KwPub,
    KwRef,
    KwReturn,
    KwSelfValue, ///< `self`
    KwSelfType,  ///< `Self`
    KwStatic,
    KwStruct,
    KwSuper,
    KwTrait,
    KwType,
    KwUnsafe,
    KwUse,
    KwWhere,
    KwWhile,

    // ========================================================================
    // Operators
    // ========================================================================
    Plus,       ///< `+`
    Minus,      ///< `-`
    Star,       ///< `*`
    Slash,      ///< `/`
    Percent,    ///< `%`
    Caret,      ///< `^`
    Not,        ///< `!`
    And,        ///< `&`
    Or,         ///< `|`
    AndAnd,     ///< `&&`
    OrOr,       ///< `||`
    Shl,        ///< `<<`
    Shr,        ///< `>>`
    PlusEq,     ///< `+=`
    MinusEq,    ///< `-=`
    StarEq,     ///< `*=`
    SlashEq,    ///< `/=`
    PercentEq,  ///< `%=`
    CaretEq,    ///< `^=`
    AndEq,      ///< `&=`
    OrEq,       ///< `|=`
    ShlEq,      ///< `<<=`
    ShrEq,      ///< `>>=`
    Eq,         ///< `=`
    EqEq,       ///< `==`
    Ne,         ///< `!=`
    Lt,         ///< `<`
    Gt,         ///< `>`
    Le,         ///< `<=`
    Ge,         ///< `>=`
    At,         ///< `@`
    Underscore, ///< `_`
    Dot,        ///< `.`
    DotDot,     ///< `..`
    DotDotDot,  ///< `...`
    DotDotEq,   ///< `..=`
    Comma,      ///< `,`
    Semi,       ///< `;`
    Colon,      ///< `:`
    PathSep,    ///< `::`
    RArrow,     ///< `->`
    FatArrow,   ///< `=>`
    Pound,      ///< `#`
    Dollar,     ///< `$`
    Question,   ///< `?`
    Tilde,      ///< `~`

    // ========================================================================
    // Delimiters
    // ========================================================================
    LParen,
    RParen,
    LBracket,
    RBracket,
    LBrace,
    RBrace,
};

/// Returns a display name ("identifier", "fn", "::", ...).
[[nodiscard]] auto token_kind_to_string(TokenKind kind) -> std::string_view;

/// True for `fn`, `impl`, ... (not `true`/`false`).
[[nodiscard]] auto is_keyword(TokenKind kind) -> bool;

/// True for the eight literal kinds.
[[nodiscard]] auto is_literal(TokenKind kind) -> bool;

/// True for `(`, `[`, `{`.
[[nodiscard]] auto is_open_delim(TokenKind kind) -> bool;

/// True for `)`, `]`, `}`.
[[nodiscard]] auto is_close_delim(TokenKind kind) -> bool;

// ============================================================================
// Literal Values
// ============================================================================

/// Integer literal. The value is kept as decimal text because Rust allows
/// 128-bit literals.
struct IntValue {
    std::string decimal; ///< Base-10 digits, no separators
    uint8_t base = 10;   ///< 2, 8, 10 or 16 as written
    std::string suffix;  ///< `u8`, `i64`, ... or empty
};

/// Float literal.
struct FloatValue {
    std::string text;   ///< Digits without separators or suffix
    std::string suffix; ///< `f32`, `f64` or empty
};

/// String, byte string or C string literal with escapes processed.
struct StringValue {
    std::string value;
    bool is_raw = false;
};

/// Char or byte literal.
struct CharValue {
    char32_t value = 0;
};

// ============================================================================
// Token
// ============================================================================

/// A lexical token.
///
/// For `let x = 0x10;` the lexer produces `KwLet`, `Identifier("x")`, `Eq`,
/// `IntLiteral` with `IntValue{"16", 16, ""}`, `Semi`, then `Eof`.
struct Token {
    TokenKind kind = TokenKind::Eof;
    SourceSpan span;
    std::string_view lexeme; ///< Raw source text

    /// Decoded value for literal tokens; `std::string` holds the name of an
    /// identifier (`r#` stripped) or lifetime.
    std::variant<std::monostate, IntValue, FloatValue, StringValue, CharValue, bool, std::string>
        value;

    [[nodiscard]] auto is(TokenKind k) const -> bool {
        return kind == k;
    }

    [[nodiscard]] auto is_one_of(std::initializer_list<TokenKind> kinds) const -> bool {
        for (auto k : kinds) {
            if (kind == k)
                return true;
        }
        return false;
    }

    [[nodiscard]] auto is_eof() const -> bool {
        return kind == TokenKind::Eof;
    }

    /// Identifier or lifetime name; the lexeme for any other token.
    [[nodiscard]] auto text() const -> std::string_view;

    [[nodiscard]] auto int_value() const -> const IntValue&;
    [[nodiscard]] auto float_value() const -> const FloatValue&;
    [[nodiscard]] auto string_value() const -> const StringValue&;
    [[nodiscard]] auto char_value() const -> const CharValue&;
    [[nodiscard]] auto bool_value() const -> bool;

    /// Byte offset one past the last character.
    [[nodiscard]] auto end_offset() const -> uint32_t {
        return span.start.offset + static_cast<uint32_t>(lexeme.size());
    }
};

/// Encodes a code point as UTF-8.
[[nodiscard]] auto encode_utf8(char32_t cp) -> std::string;

} // namespace semdiff::lexer

#endif // SEMDIFF_LEXER_TOKEN_HPP
