#include "lexer/lexer.hpp"
#include "lexer/source.hpp"

#include <gtest/gtest.h>
#include <memory>

using namespace semdiff;
using namespace semdiff::lexer;

class LexerTest : public ::testing::Test {
protected:
    // Keep source alive so Token.lexeme (string_view) remains valid
    std::unique_ptr<Source> source_;
    std::vector<LexerError> errors_;

    auto lex(const std::string& code) -> std::vector<Token> {
        source_ = std::make_unique<Source>(Source::from_string(code));
        Lexer lexer(*source_);
        auto tokens = lexer.tokenize();
        errors_ = lexer.errors();
        return tokens;
    }

    auto lex_one(const std::string& code) -> Token {
        auto tokens = lex(code);
        EXPECT_GE(tokens.size(), 1u);
        return tokens[0];
    }

    auto kinds(const std::string& code) -> std::vector<TokenKind> {
        std::vector<TokenKind> out;
        for (const auto& token : lex(code)) {
            out.push_back(token.kind);
        }
        return out;
    }
};

// Keywords
TEST_F(LexerTest, StrictKeywords) {
    EXPECT_EQ(lex_one("fn").kind, TokenKind::KwFn);
    EXPECT_EQ(lex_one("impl").kind, TokenKind::KwImpl);
    EXPECT_EQ(lex_one("trait").kind, TokenKind::KwTrait);
    EXPECT_EQ(lex_one("self").kind, TokenKind::KwSelfValue);
    EXPECT_EQ(lex_one("Self").kind, TokenKind::KwSelfType);
    EXPECT_EQ(lex_one("where").kind, TokenKind::KwWhere);
    EXPECT_EQ(lex_one("await").kind, TokenKind::KwAwait);
}

TEST_F(LexerTest, WeakKeywordsStayIdentifiers) {
    EXPECT_EQ(lex_one("union").kind, TokenKind::Identifier);
    EXPECT_EQ(lex_one("default").kind, TokenKind::Identifier);
    EXPECT_EQ(lex_one("macro_rules").kind, TokenKind::Identifier);
}

// Identifiers
TEST_F(LexerTest, Identifiers) {
    auto token = lex_one("parse_file");
    EXPECT_EQ(token.kind, TokenKind::Identifier);
    EXPECT_EQ(token.text(), "parse_file");

    EXPECT_EQ(lex_one("_").kind, TokenKind::Underscore);
    EXPECT_EQ(lex_one("_unused").kind, TokenKind::Identifier);
}

TEST_F(LexerTest, RawIdentifier) {
    auto token = lex_one("r#type");
    EXPECT_EQ(token.kind, TokenKind::Identifier);
    EXPECT_EQ(token.text(), "type");
    EXPECT_EQ(token.lexeme, "r#type");
}

TEST_F(LexerTest, LifetimesAndChars) {
    auto lifetime = lex_one("'a");
    EXPECT_EQ(lifetime.kind, TokenKind::Lifetime);
    EXPECT_EQ(lifetime.text(), "'a");

    EXPECT_EQ(lex_one("'static").kind, TokenKind::Lifetime);

    auto ch = lex_one("'x'");
    EXPECT_EQ(ch.kind, TokenKind::CharLiteral);
    EXPECT_EQ(ch.char_value().value, U'x');

    EXPECT_EQ(lex_one("'\\n'").char_value().value, U'\n');
    EXPECT_EQ(lex_one("'\\''").char_value().value, U'\'');
    EXPECT_EQ(lex_one("'\\u{1F600}'").char_value().value, U'\U0001F600');
    EXPECT_EQ(lex_one("'é'").char_value().value, U'é');
}

// Numbers
TEST_F(LexerTest, IntegerBasesNormalizeToDecimal) {
    EXPECT_EQ(lex_one("42").int_value().decimal, "42");
    EXPECT_EQ(lex_one("0x10").int_value().decimal, "16");
    EXPECT_EQ(lex_one("0o17").int_value().decimal, "15");
    EXPECT_EQ(lex_one("0b1010").int_value().decimal, "10");
    EXPECT_EQ(lex_one("1_000_000").int_value().decimal, "1000000");
    EXPECT_EQ(lex_one("007").int_value().decimal, "7");
}

TEST_F(LexerTest, IntegerSuffix) {
    auto token = lex_one("0xFF_u8");
    EXPECT_EQ(token.kind, TokenKind::IntLiteral);
    EXPECT_EQ(token.int_value().decimal, "255");
    EXPECT_EQ(token.int_value().suffix, "u8");
}

TEST_F(LexerTest, HugeIntegerKeepsPrecision) {
    EXPECT_EQ(lex_one("0xFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFF").int_value().decimal,
              "340282366920938463463374607431768211455");
}

TEST_F(LexerTest, Floats) {
    auto f = lex_one("3.14");
    EXPECT_EQ(f.kind, TokenKind::FloatLiteral);
    EXPECT_EQ(f.float_value().text, "3.14");

    EXPECT_EQ(lex_one("1e10").kind, TokenKind::FloatLiteral);
    EXPECT_EQ(lex_one("2.5E-3").float_value().text, "2.5E-3");
    EXPECT_EQ(lex_one("1_000.5").float_value().text, "1000.5");

    auto suffixed = lex_one("1f32");
    EXPECT_EQ(suffixed.kind, TokenKind::FloatLiteral);
    EXPECT_EQ(suffixed.float_value().suffix, "f32");
}

TEST_F(LexerTest, DotAfterIntegerIsNotAlwaysFloat) {
    EXPECT_EQ(kinds("1..2"), (std::vector<TokenKind>{TokenKind::IntLiteral, TokenKind::DotDot,
                                                     TokenKind::IntLiteral, TokenKind::Eof}));
    EXPECT_EQ(kinds("1.max(2)")[1], TokenKind::Dot);
    EXPECT_EQ(lex_one("1.").kind, TokenKind::FloatLiteral);
}

// Strings
TEST_F(LexerTest, StringEscapes) {
    auto token = lex_one(R"("a\tb\n\"q\"\\ \x41 \u{e9}")");
    EXPECT_EQ(token.kind, TokenKind::StringLiteral);
    EXPECT_EQ(token.string_value().value, "a\tb\n\"q\"\\ A \xC3\xA9");
}

TEST_F(LexerTest, StringLineContinuation) {
    auto token = lex_one("\"one \\\n      two\"");
    EXPECT_EQ(token.string_value().value, "one two");
}

TEST_F(LexerTest, RawStrings) {
    auto plain = lex_one(R"(r"C:\path")");
    EXPECT_EQ(plain.kind, TokenKind::StringLiteral);
    EXPECT_EQ(plain.string_value().value, R"(C:\path)");
    EXPECT_TRUE(plain.string_value().is_raw);

    auto hashed = lex_one(R"--(r#"say "hi""#)--");
    EXPECT_EQ(hashed.string_value().value, R"(say "hi")");
}

TEST_F(LexerTest, ByteAndCStrings) {
    auto bytes = lex_one(R"(b"ab\x00")");
    EXPECT_EQ(bytes.kind, TokenKind::ByteStringLiteral);
    EXPECT_EQ(bytes.string_value().value, std::string("ab\0", 3));

    EXPECT_EQ(lex_one(R"(br"raw\n")").string_value().value, R"(raw\n)");
    EXPECT_EQ(lex_one(R"(c"text")").kind, TokenKind::CStringLiteral);
    EXPECT_EQ(lex_one(R"(cr#"x"#)").kind, TokenKind::CStringLiteral);

    auto byte = lex_one("b'A'");
    EXPECT_EQ(byte.kind, TokenKind::ByteLiteral);
    EXPECT_EQ(byte.char_value().value, 65u);
    EXPECT_EQ(lex_one(R"(b'\xff')").char_value().value, 255u);
}

TEST_F(LexerTest, Booleans) {
    auto t = lex_one("true");
    EXPECT_EQ(t.kind, TokenKind::BoolLiteral);
    EXPECT_TRUE(t.bool_value());
    EXPECT_FALSE(lex_one("false").bool_value());
}

// Operators
TEST_F(LexerTest, MultiCharacterOperators) {
    EXPECT_EQ(kinds(":: -> => ..= ... <<= >>= && || != ==")[0], TokenKind::PathSep);
    EXPECT_EQ(kinds(":: -> => ..= ... <<= >>= && || != =="),
              (std::vector<TokenKind>{TokenKind::PathSep, TokenKind::RArrow, TokenKind::FatArrow,
                                      TokenKind::DotDotEq, TokenKind::DotDotDot, TokenKind::ShlEq,
                                      TokenKind::ShrEq, TokenKind::AndAnd, TokenKind::OrOr,
                                      TokenKind::Ne, TokenKind::EqEq, TokenKind::Eof}));
}

TEST_F(LexerTest, SinglePunctuation) {
    EXPECT_EQ(kinds("# $ ? @ ~"),
              (std::vector<TokenKind>{TokenKind::Pound, TokenKind::Dollar, TokenKind::Question,
                                      TokenKind::At, TokenKind::Tilde, TokenKind::Eof}));
}

// Comments
TEST_F(LexerTest, CommentsAreSkipped) {
    auto tokens = lex("/// doc\nfn /* a /* nested */ b */ f() // tail\n{}");
    ASSERT_EQ(tokens.size(), 7u);
    EXPECT_EQ(tokens[0].kind, TokenKind::KwFn);
    EXPECT_EQ(tokens[1].text(), "f");
    EXPECT_TRUE(errors_.empty());
}

TEST_F(LexerTest, ShebangSkippedButInnerAttributeKept) {
    EXPECT_EQ(lex_one("#!/usr/bin/env run-cargo-script\nfn").kind, TokenKind::KwFn);
    EXPECT_EQ(lex_one("#![allow(dead_code)]").kind, TokenKind::Pound);
}

// Locations
TEST_F(LexerTest, SpansAreOneBased) {
    auto tokens = lex("fn\n  main");
    EXPECT_EQ(tokens[1].span.start.line, 2u);
    EXPECT_EQ(tokens[1].span.start.column, 3u);
    EXPECT_EQ(tokens[1].span.end.column, 6u);
    EXPECT_EQ(tokens[1].end_offset(), 9u);
}

// Errors
TEST_F(LexerTest, UnterminatedStringIsError) {
    auto tokens = lex("\"open");
    EXPECT_EQ(tokens[0].kind, TokenKind::Error);
    ASSERT_EQ(errors_.size(), 1u);
    EXPECT_EQ(errors_[0].message, "unterminated string literal");
}

TEST_F(LexerTest, UnterminatedBlockCommentIsError) {
    lex("fn /* never closed");
    ASSERT_EQ(errors_.size(), 1u);
    EXPECT_EQ(errors_[0].message, "unterminated block comment");
}

TEST_F(LexerTest, InvalidDigitIsError) {
    EXPECT_EQ(lex_one("0b102").kind, TokenKind::Error);
    EXPECT_FALSE(errors_.empty());
}
