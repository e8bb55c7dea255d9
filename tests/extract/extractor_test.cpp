// Entity extractor tests
//
// Keys, owners, signatures and spans produced from whole files.

#include "extract/extractor.hpp"

#include <gtest/gtest.h>

using namespace semdiff;
using namespace semdiff::extract;

class ExtractorTest : public ::testing::Test {
protected:
    FileExtraction result_;

    void extract(const std::string& code, const std::string& path = "src/lib.rs") {
        result_ = extract_file(path, code);
        ASSERT_FALSE(result_.failure.has_value()) << result_.failure->message;
    }

    auto find(EntityKind kind, const std::string& name, const std::string& owner = "")
        -> const EntityRecord* {
        for (const auto& record : result_.records) {
            if (record.key.kind == kind && record.key.name == name && record.key.owner == owner) {
                return &record;
            }
        }
        return nullptr;
    }

    auto signature_of(const std::string& code) -> std::string {
        extract(code);
        EXPECT_FALSE(result_.records.empty());
        return result_.records.empty() ? "" : result_.records[0].signature;
    }
};

// ============================================================================
// Module Paths
// ============================================================================

TEST(ModulePathTest, FromFilePath) {
    EXPECT_EQ(module_path_for("src/lib.rs"), "src::lib");
    EXPECT_EQ(module_path_for("src/net/mod.rs"), "src::net");
    EXPECT_EQ(module_path_for("src/net/tcp.rs"), "src::net::tcp");
    EXPECT_EQ(module_path_for("./src/main.rs"), "src::main");
    EXPECT_EQ(module_path_for("src\\win\\io.rs"), "src::win::io");
    EXPECT_EQ(module_path_for("mod.rs"), "mod");
}

// ============================================================================
// Entity Kinds
// ============================================================================

TEST_F(ExtractorTest, ExtractsEveryEntityKind) {
    extract(R"(
        use std::fmt;
        const LIMIT: u32 = 3;

        pub fn run() {}
        struct Point { x: i32 }
        enum Shape { Circle, Square }
        type Id = u64;
        trait Area {
            fn area(&self) -> f64;
            fn double(&self) -> f64 { self.area() * 2.0 }
        }
        impl Point { fn new() -> Self { Point { x: 0 } } }
        impl Area for Point { fn area(&self) -> f64 { 0.0 } }
    )");

    EXPECT_EQ(result_.module_path, "src::lib");
    EXPECT_EQ(result_.records.size(), 9u);
    EXPECT_NE(find(EntityKind::Function, "run"), nullptr);
    EXPECT_EQ(find(EntityKind::Type, "Point")->type_kind, TypeSubKind::Struct);
    EXPECT_EQ(find(EntityKind::Type, "Shape")->type_kind, TypeSubKind::Enum);
    EXPECT_EQ(find(EntityKind::Type, "Id")->type_kind, TypeSubKind::TypeAlias);
    EXPECT_NE(find(EntityKind::Trait, "Area"), nullptr);
    EXPECT_NE(find(EntityKind::Method, "area", "Area"), nullptr);
    EXPECT_NE(find(EntityKind::Method, "double", "Area"), nullptr);
    EXPECT_NE(find(EntityKind::Method, "new", "Point"), nullptr);
    EXPECT_NE(find(EntityKind::Method, "area", "<Point as Area>"), nullptr);
}

TEST_F(ExtractorTest, RecordsAreInDeclarationOrder) {
    extract("fn b() {}\nfn a() {}\nstruct C;");
    ASSERT_EQ(result_.records.size(), 3u);
    EXPECT_EQ(result_.records[0].key.name, "b");
    EXPECT_EQ(result_.records[1].key.name, "a");
    EXPECT_EQ(result_.records[2].key.name, "C");
}

TEST_F(ExtractorTest, InlineModulesExtendModulePath) {
    extract("mod tests { fn helper() {} mod deep { struct S; } }\nmod external;",
            "src/net/mod.rs");
    const auto* helper = find(EntityKind::Function, "helper");
    ASSERT_NE(helper, nullptr);
    EXPECT_EQ(helper->key.module, "src::net::tests");
    const auto* deep = find(EntityKind::Type, "S");
    ASSERT_NE(deep, nullptr);
    EXPECT_EQ(deep->key.module, "src::net::tests::deep");
}

TEST_F(ExtractorTest, NestedItemsAreNotEntities) {
    extract("fn outer() { fn inner() {} struct Local; }");
    ASSERT_EQ(result_.records.size(), 1u);
    EXPECT_EQ(result_.records[0].key.name, "outer");
}

TEST_F(ExtractorTest, UnionsAndMacrosAreNotEntities) {
    extract("union U { a: u8 }\nmacro_rules! m { () => {} }\nstatic S: u8 = 0;");
    EXPECT_TRUE(result_.records.empty());
}

// ============================================================================
// Owners
// ============================================================================

TEST_F(ExtractorTest, InherentImplOwnerIsLastPathSegment) {
    extract("impl<T: Clone> crate::store::Cache<T> { fn get(&self) {} }");
    EXPECT_NE(find(EntityKind::Method, "get", "Cache"), nullptr);
}

TEST_F(ExtractorTest, TraitImplOwnerNamesBothSides) {
    extract("impl fmt::Display for Tree<u8> { fn fmt(&self) {} }\n"
            "impl<T> From<Vec<T>> for Tree<T> { fn from(v: Vec<T>) -> Self { todo!() } }");
    EXPECT_NE(find(EntityKind::Method, "fmt", "<Tree<u8> as fmt::Display>"), nullptr);
    EXPECT_NE(find(EntityKind::Method, "from", "<Tree<T> as From<Vec<T>>>"), nullptr);
}

TEST_F(ExtractorTest, SameMethodNameOnDifferentOwners) {
    extract("impl A { fn new() {} }\nimpl B { fn new() {} }");
    EXPECT_EQ(result_.records.size(), 2u);
    EXPECT_TRUE(result_.warnings.empty());
}

// ============================================================================
// Signatures
// ============================================================================

TEST_F(ExtractorTest, FunctionSignatureIsCanonical) {
    EXPECT_EQ(signature_of("pub  fn  new ( cap : usize , )  ->  Self { Self }"),
              "pub fn new(cap: usize) -> Self");
    EXPECT_EQ(signature_of("fn get<'a, T>(x: &'a [T], i: usize) -> Option<&'a T> where T: Copy {}"),
              "fn get<'a, T>(x: &'a [T], i: usize) -> Option<&'a T> where T: Copy");
    EXPECT_EQ(signature_of("pub(crate) async fn run(self: &mut Self) {}"),
              "pub(crate) async fn run(self: &mut Self)");
}

TEST_F(ExtractorTest, OneElementTupleKeepsItsComma) {
    EXPECT_EQ(signature_of("fn f() -> (i32,) { (1,) }"), "fn f() -> (i32,)");
    EXPECT_NE(signature_of("fn f() -> (i32,) {}"), signature_of("fn f() -> (i32) {}"));
    EXPECT_EQ(signature_of("fn f(v: Vec<(u8, )>) {}"), "fn f(v: Vec<(u8,)>)");
    // Only a lone comma marks a tuple
    EXPECT_EQ(signature_of("fn f() -> (i32, u8,) {}"), "fn f() -> (i32, u8)");
    EXPECT_EQ(signature_of("fn f(a: (u8,),) {}"), "fn f(a: (u8,))");
}

TEST_F(ExtractorTest, SignatureIgnoresDocsButNotAttributes) {
    auto documented = signature_of("/// Adds.\n#[doc = \"more\"]\n#[inline]\nfn add() {}");
    auto plain = signature_of("#[inline]\nfn add() {}");
    EXPECT_EQ(documented, plain);
    EXPECT_NE(plain, signature_of("fn add() {}"));
}

TEST_F(ExtractorTest, NestedGenericsRenderTheSame) {
    EXPECT_EQ(signature_of("type M = Vec<Vec<u8>>;"), signature_of("type M = Vec<Vec<u8> >;"));
    EXPECT_EQ(signature_of("type M = Vec<Vec<u8>>;"), "type M = Vec<Vec<u8>>;");
}

TEST_F(ExtractorTest, TypeSignatureIsWholeDefinition) {
    EXPECT_EQ(signature_of("pub struct P {\n    x: i32,\n    y: i32,\n}"),
              "pub struct P { x: i32, y: i32 }");
    EXPECT_EQ(signature_of("enum E { A(u8), B { n: u8 } }"), "enum E { A(u8), B { n: u8 } }");
}

TEST_F(ExtractorTest, TraitSignatureIncludesAssociatedItems) {
    extract("pub trait Store: Send {\n type Key;\n const CAP: usize;\n fn get(&self);\n}");
    const auto* trait = find(EntityKind::Trait, "Store");
    ASSERT_NE(trait, nullptr);
    EXPECT_EQ(trait->signature, "pub trait Store: Send { type Key; const CAP: usize; }");
    EXPECT_TRUE(trait->body_fingerprint.is_zero());
}

// ============================================================================
// Bodies, Spans and Code
// ============================================================================

TEST_F(ExtractorTest, FunctionBodyContents) {
    extract("fn f(x: u8) -> u8 { g(x) + 1 }");
    const auto* f = find(EntityKind::Function, "f");
    ASSERT_NE(f, nullptr);
    EXPECT_FALSE(f->body_fingerprint.is_zero());
    ASSERT_EQ(f->calls.size(), 1u);
    EXPECT_EQ(f->calls[0], (CallSite{"g", 1}));
    ASSERT_EQ(f->literals.size(), 1u);
    EXPECT_EQ(f->literals[0], (LiteralValue{LiteralKind::Integer, "1"}));
}

TEST_F(ExtractorTest, BodylessMethodHasZeroFingerprint) {
    extract("trait T { fn required(&self); }");
    const auto* m = find(EntityKind::Method, "required", "T");
    ASSERT_NE(m, nullptr);
    EXPECT_TRUE(m->body_fingerprint.is_zero());
    EXPECT_TRUE(m->calls.empty());
}

TEST_F(ExtractorTest, SpanAndCodeCoverTheItem) {
    extract("// header\n\n/// doc\n#[inline]\npub fn f() {\n    1\n}\n");
    const auto* f = find(EntityKind::Function, "f");
    ASSERT_NE(f, nullptr);
    EXPECT_EQ(f->span.file, "src/lib.rs");
    EXPECT_EQ(f->span.start_line, 4u);
    EXPECT_EQ(f->span.start_col, 1u);
    EXPECT_EQ(f->span.end_line, 7u);
    EXPECT_EQ(f->code, "#[inline]\npub fn f() {\n    1\n}");
}

// ============================================================================
// Duplicates and Failures
// ============================================================================

TEST_F(ExtractorTest, LaterDuplicateWins) {
    extract("#[cfg(unix)]\nfn f() { 1 }\n#[cfg(not(unix))]\nfn f() { 2 }");
    ASSERT_EQ(result_.records.size(), 1u);
    ASSERT_EQ(result_.records[0].literals.size(), 1u);
    EXPECT_EQ(result_.records[0].literals[0].value, "2");
    ASSERT_EQ(result_.warnings.size(), 1u);
    EXPECT_NE(result_.warnings[0].find("declared again"), std::string::npos);
}

TEST(ExtractFileTest, ParseFailureYieldsNoRecords) {
    auto result = extract_file("src/bad.rs", "fn ok() {}\nfn broken( {");
    ASSERT_TRUE(result.failure.has_value());
    EXPECT_TRUE(result.records.empty());
    EXPECT_EQ(result.failure->path, "src/bad.rs");
    EXPECT_EQ(result.failure->line, 2u);
    EXPECT_FALSE(result.failure->message.empty());
}

TEST(ExtractFileTest, LexFailureYieldsNoRecords) {
    auto result = extract_file("src/bad.rs", "fn f() { \"open }");
    ASSERT_TRUE(result.failure.has_value());
    EXPECT_TRUE(result.records.empty());
}

TEST(ExtractFileTest, EmptyFileHasNoEntities) {
    auto result = extract_file("src/empty.rs", "");
    EXPECT_FALSE(result.failure.has_value());
    EXPECT_TRUE(result.records.empty());
}
