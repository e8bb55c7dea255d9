//! # Rust Lexer
//!
//! Converts Rust source text into tokens.
//!
//! ## Features
//!
//! - **Number bases**: decimal, hex (`0x`), binary (`0b`), octal (`0o`), `_` separators,
//!   type suffixes
//! - **All string forms**: `"..."`, `r#"..."#`, `b"..."`, `br"..."`, `c"..."`, `cr"..."`
//! - **Chars and lifetimes**: `'a'` versus `'a`, byte literals `b'a'`
//! - **Raw identifiers**: `r#type` lexes as the identifier `type`
//! - **Comments**: line, nested block and doc comments are skipped
//!
//! ## Error Recovery
//!
//! The lexer continues after an error, producing `TokenKind::Error`. All
//! errors are collected and exposed by `errors()`; the extractor treats any
//! lexer error as a parse failure of the file.
//!
//! ## Example
//!
//! ```cpp
//! Source source = Source::from_string("fn f() { g(1) }");
//! Lexer lexer(source);
//! std::vector<Token> tokens = lexer.tokenize();
//! ```

#ifndef SEMDIFF_LEXER_LEXER_HPP
#define SEMDIFF_LEXER_LEXER_HPP

#include "common.hpp"
#include "lexer/source.hpp"
#include "lexer/token.hpp"

#include <optional>
#include <vector>

namespace semdiff::lexer {

/// An error encountered during lexical analysis.
struct LexerError {
    std::string message;
    SourceSpan span;
};

/// Lexical analyzer for Rust source code.
class Lexer {
public:
    /// The source must outlive the lexer and every token it returns.
    explicit Lexer(const Source& source);

    /// Returns the next token, `TokenKind::Eof` at the end of input.
    [[nodiscard]] auto next_token() -> Token;

    /// Tokenizes the whole source. The final token is `Eof`.
    [[nodiscard]] auto tokenize() -> std::vector<Token>;

    [[nodiscard]] auto errors() const -> const std::vector<LexerError>& {
        return errors_;
    }

    [[nodiscard]] auto has_errors() const -> bool {
        return !errors_.empty();
    }

private:
    const Source& source_;
    size_t pos_ = 0;
    size_t token_start_ = 0;
    std::vector<LexerError> errors_;

    // ========================================================================
    // Character Access
    // ========================================================================

    [[nodiscard]] auto peek() const -> char;
    [[nodiscard]] auto peek_next() const -> char;
    [[nodiscard]] auto peek_n(size_t n) const -> char;
    auto advance() -> char;
    [[nodiscard]] auto is_at_end() const -> bool;

    // ========================================================================
    // Token Creation
    // ========================================================================

    [[nodiscard]] auto make_token(TokenKind kind) -> Token;
    [[nodiscard]] auto make_error_token(const std::string& message) -> Token;
    void report_error(const std::string& message);

    // ========================================================================
    // Whitespace and Comments
    // ========================================================================

    void skip_shebang();
    void skip_whitespace();
    void skip_line_comment();
    void skip_block_comment();

    // ========================================================================
    // Token Lexers
    // ========================================================================

    /// Identifiers, keywords, `_`, and raw identifiers.
    [[nodiscard]] auto lex_identifier() -> Token;

    /// A token starting with `'`: lifetime/label or char literal.
    [[nodiscard]] auto lex_lifetime_or_char() -> Token;

    [[nodiscard]] auto lex_number() -> Token;
    [[nodiscard]] auto lex_radix_number(int base) -> Token;
    [[nodiscard]] auto lex_decimal_number() -> Token;

    /// A quoted literal whose prefix has been consumed; `pos_` is at the `"`.
    [[nodiscard]] auto lex_quoted(TokenKind kind) -> Token;

    /// A raw literal whose prefix up to `r` has been consumed; `pos_` is at
    /// the first `#` or the `"`.
    [[nodiscard]] auto lex_raw_quoted(TokenKind kind) -> Token;

    /// `b'x'` with `pos_` at the `'`.
    [[nodiscard]] auto lex_byte() -> Token;

    [[nodiscard]] auto lex_operator() -> Token;

    // ========================================================================
    // Escapes and Unicode
    // ========================================================================

    /// Parses the escape after a backslash (the backslash is consumed).
    /// Byte mode allows `\xNN` up to 0xFF and rejects `\u{...}`.
    [[nodiscard]] auto parse_escape_sequence(bool byte_mode) -> Result<char32_t, std::string>;

    [[nodiscard]] static auto is_identifier_start(char c) -> bool;
    [[nodiscard]] static auto is_identifier_continue(char c) -> bool;

    /// Decodes the UTF-8 character at `pos_` and advances past it.
    [[nodiscard]] auto decode_utf8() -> char32_t;

    [[nodiscard]] static auto utf8_char_length(char c) -> size_t;

    [[nodiscard]] static auto lookup_keyword(std::string_view ident) -> std::optional<TokenKind>;
};

} // namespace semdiff::lexer

#endif // SEMDIFF_LEXER_LEXER_HPP
