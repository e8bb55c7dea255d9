//! # Lexer - Operators
//!
//! Maximal munch over Rust punctuation.
//!
//! | Lead  | Tokens                         |
//! |-------|--------------------------------|
//! | `-`   | `-`, `-=`, `->`                |
//! | `=`   | `=`, `==`, `=>`                |
//! | `<`   | `<`, `<=`, `<<`, `<<=`         |
//! | `>`   | `>`, `>=`, `>>`, `>>=`         |
//! | `.`   | `.`, `..`, `...`, `..=`        |
//! | `:`   | `:`, `::`                      |
//!
//! `>>` is always produced as one token; the parser splits it when it
//! closes two generic argument lists.

#include "lexer/lexer.hpp"

namespace semdiff::lexer {

auto Lexer::lex_operator() -> Token {
    // Consumes `expected` and returns true if it is the next character.
    auto eat = [this](char expected) {
        if (peek() == expected) {
            advance();
            return true;
        }
        return false;
    };

    char c = advance();
    switch (c) {
    case '(':
        return make_token(TokenKind::LParen);
    case ')':
        return make_token(TokenKind::RParen);
    case '[':
        return make_token(TokenKind::LBracket);
    case ']':
        return make_token(TokenKind::RBracket);
    case '{':
        return make_token(TokenKind::LBrace);
    case '}':
        return make_token(TokenKind::RBrace);
    case ',':
        return make_token(TokenKind::Comma);
    case ';':
        return make_token(TokenKind::Semi);
    case '#':
        return make_token(TokenKind::Pound);
    case '$':
        return make_token(TokenKind::Dollar);
    case '?':
        return make_token(TokenKind::Question);
    case '@':
        return make_token(TokenKind::At);
    case '~':
        return make_token(TokenKind::Tilde);

    case '+':
        return make_token(eat('=') ? TokenKind::PlusEq : TokenKind::Plus);
    case '*':
        return make_token(eat('=') ? TokenKind::StarEq : TokenKind::Star);
    case '/':
        return make_token(eat('=') ? TokenKind::SlashEq : TokenKind::Slash);
    case '%':
        return make_token(eat('=') ? TokenKind::PercentEq : TokenKind::Percent);
    case '^':
        return make_token(eat('=') ? TokenKind::CaretEq : TokenKind::Caret);
    case '!':
        return make_token(eat('=') ? TokenKind::Ne : TokenKind::Not);

    case '-':
        if (eat('='))
            return make_token(TokenKind::MinusEq);
        if (eat('>'))
            return make_token(TokenKind::RArrow);
        return make_token(TokenKind::Minus);

    case '=':
        if (eat('='))
            return make_token(TokenKind::EqEq);
        if (eat('>'))
            return make_token(TokenKind::FatArrow);
        return make_token(TokenKind::Eq);

    case '&':
        if (eat('&'))
            return make_token(TokenKind::AndAnd);
        if (eat('='))
            return make_token(TokenKind::AndEq);
        return make_token(TokenKind::And);

    case '|':
        if (eat('|'))
            return make_token(TokenKind::OrOr);
        if (eat('='))
            return make_token(TokenKind::OrEq);
        return make_token(TokenKind::Or);

    case '<':
        if (eat('='))
            return make_token(TokenKind::Le);
        if (eat('<'))
            return make_token(eat('=') ? TokenKind::ShlEq : TokenKind::Shl);
        return make_token(TokenKind::Lt);

    case '>':
        if (eat('='))
            return make_token(TokenKind::Ge);
        if (eat('>'))
            return make_token(eat('=') ? TokenKind::ShrEq : TokenKind::Shr);
        return make_token(TokenKind::Gt);

    case '.':
        if (eat('.')) {
            if (eat('.'))
                return make_token(TokenKind::DotDotDot);
            if (eat('='))
                return make_token(TokenKind::DotDotEq);
            return make_token(TokenKind::DotDot);
        }
        return make_token(TokenKind::Dot);

    case ':':
        return make_token(eat(':') ? TokenKind::PathSep : TokenKind::Colon);

    default:
        return make_error_token("unexpected character '" +
                                std::string(source_.slice(token_start_, pos_)) + "'");
    }
}

} // namespace semdiff::lexer
