// Body walker tests
//
// Call sites, literals and the canonical body serialization.

#include "extract/body_walker.hpp"
#include "parser/parser.hpp"

#include <gtest/gtest.h>

using namespace semdiff;
using namespace semdiff::extract;

class BodyWalkerTest : public ::testing::Test {
protected:
    parser::SourceFile file_;

    /// Walks the body of `fn f() { <body> }`.
    auto walk(const std::string& body) -> BodyWalker {
        auto result = parser::parse_source("test.rs", "fn f() { " + body + " }");
        EXPECT_TRUE(is_ok(result)) << (is_err(result) ? unwrap_err(result).message : "");
        if (is_ok(result)) {
            file_ = std::move(unwrap(result));
        }
        BodyWalker walker(file_.tokens);
        if (!file_.items.empty()) {
            walker.walk(*file_.items[0]->as<parser::FnDecl>().body);
        }
        return walker;
    }

    auto callees(const std::string& body) -> std::vector<std::string> {
        auto walker = walk(body);
        std::vector<std::string> out;
        for (const auto& call : walker.calls()) {
            out.push_back(call.callee);
        }
        return out;
    }

    auto fingerprint(const std::string& body) -> Fingerprint {
        return walk(body).fingerprint();
    }
};

using Strings = std::vector<std::string>;

// ============================================================================
// Call Sites
// ============================================================================

TEST_F(BodyWalkerTest, CallsInPreOrder) {
    auto walker = walk("f(g(1), h());");
    ASSERT_EQ(walker.calls().size(), 3u);
    EXPECT_EQ(walker.calls()[0], (CallSite{"f", 2}));
    EXPECT_EQ(walker.calls()[1], (CallSite{"g", 1}));
    EXPECT_EQ(walker.calls()[2], (CallSite{"h", 0}));
}

TEST_F(BodyWalkerTest, PathCallees) {
    EXPECT_EQ(callees("a::b::<T>::c(x)"), Strings{"a::b::c"});
    EXPECT_EQ(callees("<T as Tr>::f(x)"), Strings{"Tr::f"});
    EXPECT_EQ(callees("Self::new()"), Strings{"Self::new"});
}

TEST_F(BodyWalkerTest, FieldAndComplexCallees) {
    EXPECT_EQ(callees("(s.f)(x)"), Strings{"s.f"});
    EXPECT_EQ(callees("(get())(x)"), (Strings{"complex_call", "get"}));
}

TEST_F(BodyWalkerTest, MethodCallees) {
    EXPECT_EQ(callees("v.push(x)"), Strings{"v.push"});
    EXPECT_EQ(callees("self.items.push(x)"), Strings{"field.items.push"});
    EXPECT_EQ(callees("a.iter().map(f)"), (Strings{"chain.iter.map", "a.iter"}));
    EXPECT_EQ(callees("(a + b).max(c)"), Strings{"expr.max"});
}

TEST_F(BodyWalkerTest, MacrosAreOpaqueCalls) {
    auto walker = walk("println!(\"{} {}\", g(x), y); let v = vec![]; assert!(ok)");
    ASSERT_EQ(walker.calls().size(), 3u);
    EXPECT_EQ(walker.calls()[0], (CallSite{"println!", 3}));
    EXPECT_EQ(walker.calls()[1], (CallSite{"vec!", 0}));
    EXPECT_EQ(walker.calls()[2], (CallSite{"assert!", 1}));
    // Nothing inside the macro arguments is recorded
    EXPECT_TRUE(walker.literals().empty());
}

TEST_F(BodyWalkerTest, MacroArgumentCountIgnoresNestedCommas) {
    auto walker = walk("m!(f(a, b), [1, 2], c,)");
    ASSERT_EQ(walker.calls().size(), 1u);
    EXPECT_EQ(walker.calls()[0].arg_count, 3u);
}

TEST_F(BodyWalkerTest, NestedItemsAreSkipped) {
    auto walker = walk("fn helper() { inner(1); } helper()");
    ASSERT_EQ(walker.calls().size(), 1u);
    EXPECT_EQ(walker.calls()[0].callee, "helper");
    EXPECT_TRUE(walker.literals().empty());
}

TEST_F(BodyWalkerTest, CallsInsideClosuresAndControlFlow) {
    EXPECT_EQ(callees("if ok() { a() } else { b() }"), (Strings{"ok", "a", "b"}));
    EXPECT_EQ(callees("items.iter().for_each(|x| use_it(x))"),
              (Strings{"chain.iter.for_each", "items.iter", "use_it"}));
    EXPECT_EQ(callees("for x in xs() { y(x); }"), (Strings{"xs", "y"}));
}

// ============================================================================
// Literals
// ============================================================================

TEST_F(BodyWalkerTest, LiteralKindsAndValues) {
    auto walker = walk("let a = 0x10_u8; let b = 2.50f32; let c = \"hi\\n\"; "
                       "let d = 'x'; let e = b'a'; let g = true; let h = b\"ab\";");
    const auto& lits = walker.literals();
    ASSERT_EQ(lits.size(), 7u);
    EXPECT_EQ(lits[0], (LiteralValue{LiteralKind::Integer, "16"}));
    EXPECT_EQ(lits[1].kind, LiteralKind::Float);
    EXPECT_EQ(lits[2], (LiteralValue{LiteralKind::String, "hi\n"}));
    EXPECT_EQ(lits[3], (LiteralValue{LiteralKind::Char, "x"}));
    EXPECT_EQ(lits[4], (LiteralValue{LiteralKind::Byte, "97"}));
    EXPECT_EQ(lits[5], (LiteralValue{LiteralKind::Boolean, "true"}));
    EXPECT_EQ(lits[6], (LiteralValue{LiteralKind::ByteString, "ab"}));
}

TEST_F(BodyWalkerTest, PatternLiteralsAreCounted) {
    auto walker = walk("match v { 0 => 1, _ => 2 }");
    ASSERT_EQ(walker.literals().size(), 3u);
    EXPECT_EQ(walker.literals()[0].value, "0");
    EXPECT_EQ(walker.literals()[1].value, "1");
    EXPECT_EQ(walker.literals()[2].value, "2");
}

TEST_F(BodyWalkerTest, NegationIsNotFolded) {
    auto walker = walk("-1");
    ASSERT_EQ(walker.literals().size(), 1u);
    EXPECT_EQ(walker.literals()[0].value, "1");
}

TEST_F(BodyWalkerTest, LiteralFromToken) {
    lexer::Source source("t.rs", "x 42");
    lexer::Lexer lex(source);
    auto lexed = lex.tokenize();
    ASSERT_GE(lexed.size(), 2u);
    EXPECT_FALSE(literal_from_token(lexed[0]).has_value());
    ASSERT_TRUE(literal_from_token(lexed[1]).has_value());
    EXPECT_EQ(literal_from_token(lexed[1])->value, "42");
}

// ============================================================================
// Fingerprints
// ============================================================================

TEST_F(BodyWalkerTest, FormattingDoesNotChangeFingerprint) {
    EXPECT_EQ(fingerprint("let x = g(a,b); x + 1"),
              fingerprint("let   x=g( a , b ) ;\n\n   // note\n   x+1"));
    EXPECT_EQ(fingerprint("a /* block */ + b"), fingerprint("a + b"));
}

TEST_F(BodyWalkerTest, EquivalentSpellingsShareFingerprint) {
    EXPECT_EQ(fingerprint("return (x);"), fingerprint("return x;"));
    EXPECT_EQ(fingerprint("match v { _ => { x } }"), fingerprint("match v { _ => x }"));
    EXPECT_EQ(fingerprint("let n = 0x10;"), fingerprint("let n = 16;"));
    EXPECT_EQ(fingerprint("P { x }"), fingerprint("P { x: x }"));
}

TEST_F(BodyWalkerTest, StructuralChangesChangeFingerprint) {
    EXPECT_NE(fingerprint("g(x) + 1"), fingerprint("g(x) + 2"));
    EXPECT_NE(fingerprint("a + b"), fingerprint("a - b"));
    EXPECT_NE(fingerprint("f(a, b)"), fingerprint("f(b, a)"));
    EXPECT_NE(fingerprint("x;"), fingerprint("x"));
    EXPECT_NE(fingerprint("let x = 1;"), fingerprint("let y = 1;"));
    EXPECT_NE(fingerprint("'a: loop {}"), fingerprint("loop {}"));
}

TEST_F(BodyWalkerTest, MethodTurbofishIsPartOfFingerprint) {
    EXPECT_NE(fingerprint("s.parse::<u32>()"), fingerprint("s.parse::<u64>()"));
    EXPECT_NE(fingerprint("s.parse::<u32>()"), fingerprint("s.parse()"));
}

TEST_F(BodyWalkerTest, OneElementTupleTypeKeepsItsComma) {
    EXPECT_NE(fingerprint("let x: (u8,) = v;"), fingerprint("let x: u8 = v;"));
    EXPECT_NE(fingerprint("let x: (u8,) = v;"), fingerprint("let x: (u8) = v;"));
}

TEST_F(BodyWalkerTest, CanonicalFormIsLengthPrefixed) {
    auto walker = walk("1");
    EXPECT_EQ(walker.canonical(), "(block 5:plain 0: (lit 7:integer 1:1))");
}
