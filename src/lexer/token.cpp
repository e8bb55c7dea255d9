//! # Token Utilities
//!
//! Display names, kind predicates and typed value accessors.

#include "lexer/token.hpp"

namespace semdiff::lexer {

auto token_kind_to_string(TokenKind kind) -> std::string_view {
    switch (kind) {
    case TokenKind::Eof:
        return "EOF";
    case TokenKind::Error:
        return "error";

    case TokenKind::IntLiteral:
        return "integer";
    case TokenKind::FloatLiteral:
        return "float";
    case TokenKind::StringLiteral:
        return "string";
    case TokenKind::ByteStringLiteral:
        return "byte string";
    case TokenKind::CStringLiteral:
        return "C string";
    case TokenKind::CharLiteral:
        return "char";
    case TokenKind::ByteLiteral:
        return "byte";
    case TokenKind::BoolLiteral:
        return "bool";

    case TokenKind::Identifier:
        return "identifier";
    case TokenKind::Lifetime:
        return "lifetime";

    case TokenKind::KwAs:
        return "as";
    case TokenKind::KwAsync:
        return "async";
    case TokenKind::KwAwait:
        return "await";
    case TokenKind::KwBreak:
        return "break";
    case TokenKind::KwConst:
        return "const";
    case TokenKind::KwContinue:
        return "continue";
    case TokenKind::KwCrate:
        return "crate";
    case TokenKind::KwDyn:
        return "dyn";
    case TokenKind::KwElse:
        return "else";
    case TokenKind::KwEnum:
        return "enum";
    case TokenKind::KwExtern:
        return "extern";
    case TokenKind::KwFn:
        return "fn";
    case TokenKind::KwFor:
        return "for";
    case TokenKind::KwIf:
        return "if";
    case TokenKind::KwImpl:
        return "impl";
    case TokenKind::KwIn:
        return "in";
    case TokenKind::KwLet:
        return "let";
    case TokenKind::KwLoop:
        return "loop";
    case TokenKind::KwMatch:
        return "match";
    case TokenKind::KwMod:
        return "mod";
    case TokenKind::KwMove:
        return "move";
    case TokenKind::KwMut:
        return "mut";
    case TokenKind::KwPub:
        return "pub";
    case TokenKind::KwRef:
        return "ref";
    case TokenKind::KwReturn:
        return "return";
    case TokenKind::KwSelfValue:
        return "self";
    case TokenKind::KwSelfType:
        return "Self";
    case TokenKind::KwStatic:
        return "static";
    case TokenKind::KwStruct:
        return "struct";
    case TokenKind::KwSuper:
        return "super";
    case TokenKind::KwTrait:
        return "trait";
    case TokenKind::KwType:
        return "type";
    case TokenKind::KwUnsafe:
        return "unsafe";
    case TokenKind::KwUse:
        return "use";
    case TokenKind::KwWhere:
        return "where";
    case TokenKind::KwWhile:
        return "while";

    case TokenKind::Plus:
        return "+";
    case TokenKind::Minus:
        return "-";
    case TokenKind::Star:
        return "*";
    case TokenKind::Slash:
        return "/";
    case TokenKind::Percent:
        return "%";
    case TokenKind::Caret:
        return "^";
    case TokenKind::Not:
        return "!";
    case TokenKind::And:
        return "&";
    case TokenKind::Or:
        return "|";
    case TokenKind::AndAnd:
        return "&&";
    case TokenKind::OrOr:
        return "||";
    case TokenKind::Shl:
        return "<<";
    case TokenKind::Shr:
        return ">>";
    case TokenKind::PlusEq:
        return "+=";
    case TokenKind::MinusEq:
        return "-=";
    case TokenKind::StarEq:
        return "*=";
    case TokenKind::SlashEq:
        return "/=";
    case TokenKind::PercentEq:
        return "%=";
    case TokenKind::CaretEq:
        return "^=";
    case TokenKind::AndEq:
        return "&=";
    case TokenKind::OrEq:
        return "|=";
    case TokenKind::ShlEq:
        return "<<=";
    case TokenKind::ShrEq:
        return ">>=";
    case TokenKind::Eq:
        return "=";
    case TokenKind::EqEq:
        return "==";
    case TokenKind::Ne:
        return "!=";
    case TokenKind::Lt:
        return "<";
    case TokenKind::Gt:
        return ">";
    case TokenKind::Le:
        return "<=";
    case TokenKind::Ge:
        return ">=";
    case TokenKind::At:
        return "@";
    case TokenKind::Underscore:
        return "_";
    case TokenKind::Dot:
        return ".";
    case TokenKind::DotDot:
        return "..";
    case TokenKind::DotDotDot:
        return "...";
    case TokenKind::DotDotEq:
        return "..=";
    case TokenKind::Comma:
        return ",";
    case TokenKind::Semi:
        return ";";
    case TokenKind::Colon:
        return ":";
    case TokenKind::PathSep:
        return "::";
    case TokenKind::RArrow:
        return "->";
    case TokenKind::FatArrow:
        return "=>";
    case TokenKind::Pound:
        return "#";
    case TokenKind::Dollar:
        return "$";
    case TokenKind::Question:
        return "?";
    case TokenKind::Tilde:
        return "~";

    case TokenKind::LParen:
        return "(";
    case TokenKind::RParen:
        return ")";
    case TokenKind::LBracket:
        return "[";
    case TokenKind::RBracket:
        return "]";
    case TokenKind::LBrace:
        return "{";
    case TokenKind::RBrace:
        return "}";
    }
    return "unknown";
}

auto is_keyword(TokenKind kind) -> bool {
    return kind >= TokenKind::KwAs && kind <= TokenKind::KwWhile;
}

auto is_literal(TokenKind kind) -> bool {
    return kind >= TokenKind::IntLiteral && kind <= TokenKind::BoolLiteral;
}

auto is_open_delim(TokenKind kind) -> bool {
    return kind == TokenKind::LParen || kind == TokenKind::LBracket || kind == TokenKind::LBrace;
}

auto is_close_delim(TokenKind kind) -> bool {
    return kind == TokenKind::RParen || kind == TokenKind::RBracket || kind == TokenKind::RBrace;
}

auto Token::text() const -> std::string_view {
    if (const auto* name = std::get_if<std::string>(&value)) {
        return *name;
    }
    return lexeme;
}

auto Token::int_value() const -> const IntValue& {
    return std::get<IntValue>(value);
}

auto Token::float_value() const -> const FloatValue& {
    return std::get<FloatValue>(value);
}

auto Token::string_value() const -> const StringValue& {
    return std::get<StringValue>(value);
}

auto Token::char_value() const -> const CharValue& {
    return std::get<CharValue>(value);
}

auto Token::bool_value() const -> bool {
    return std::get<bool>(value);
}

auto encode_utf8(char32_t cp) -> std::string {
    std::string out;
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    return out;
}

} // namespace semdiff::lexer
