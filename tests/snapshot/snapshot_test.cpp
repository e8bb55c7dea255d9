// Snapshot builder tests

#include "log/log.hpp"
#include "snapshot/snapshot_builder.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <mutex>

using namespace semdiff;
using namespace semdiff::snapshot;
using extract::EntityKey;
using extract::EntityKind;

namespace {

auto sample_files() -> std::vector<FileContents> {
    return {
        {"src/lib.rs", "pub fn run() { helper(1); }\nstruct Config { depth: u8 }"},
        {"src/net/mod.rs", "pub trait Transport { fn send(&self); }"},
        {"src/net/tcp.rs", "impl Transport for Tcp { fn send(&self) { write(); } }\nstruct Tcp;"},
        {"src/util.rs", "fn helper(n: u8) -> u8 { n * 2 }"},
    };
}

auto build(const std::string& revision, std::vector<FileContents> files, unsigned threads = 1)
    -> Snapshot {
    SnapshotBuilder builder(BuildOptions{.threads = threads});
    auto result = builder.build(revision, std::move(files));
    EXPECT_TRUE(is_ok(result)) << (is_err(result) ? unwrap_err(result).message : "");
    return is_ok(result) ? std::move(unwrap(result)) : Snapshot{};
}

/// Keeps the context label of every record.
class ContextSink : public log::LogSink {
public:
    void write(const log::LogRecord& record) override {
        std::lock_guard<std::mutex> lock(mutex);
        contexts.push_back(record.context);
    }
    void flush() override {}

    std::mutex mutex;
    std::vector<std::string> contexts;
};

} // namespace

// ============================================================================
// Contents
// ============================================================================

TEST(SnapshotTest, CollectsEntitiesOfAllFiles) {
    auto snap = build("base", sample_files());
    EXPECT_EQ(snap.revision(), "base");
    EXPECT_EQ(snap.size(), 7u);
    EXPECT_TRUE(snap.contains(EntityKey{"src::lib", EntityKind::Function, "run", ""}));
    EXPECT_TRUE(snap.contains(EntityKey{"src::net", EntityKind::Method, "send", "Transport"}));
    EXPECT_TRUE(
        snap.contains(EntityKey{"src::net::tcp", EntityKind::Method, "send", "<Tcp as Transport>"}));

    const auto* helper = snap.find(EntityKey{"src::util", EntityKind::Function, "helper", ""});
    ASSERT_NE(helper, nullptr);
    EXPECT_EQ(helper->span.file, "src/util.rs");
    EXPECT_EQ(snap.find(EntityKey{"src::util", EntityKind::Function, "missing", ""}), nullptr);
}

TEST(SnapshotTest, OfKindIsInKeyOrder) {
    auto snap = build("base", sample_files());
    auto types = snap.of_kind(EntityKind::Type);
    ASSERT_EQ(types.size(), 2u);
    EXPECT_EQ(types[0]->key.name, "Config");
    EXPECT_EQ(types[1]->key.name, "Tcp");
    EXPECT_EQ(snap.of_kind(EntityKind::Trait).size(), 1u);
    EXPECT_EQ(snap.of_kind(EntityKind::Method).size(), 2u);
}

TEST(SnapshotTest, FilesListTheirKeys) {
    auto snap = build("base", sample_files());
    ASSERT_EQ(snap.files().size(), 4u);
    EXPECT_EQ(snap.files().at("src/lib.rs").size(), 2u);
    EXPECT_EQ(snap.files().at("src/util.rs").size(), 1u);
}

TEST(SnapshotTest, EmptyInputGivesEmptySnapshot) {
    auto snap = build("empty", {});
    EXPECT_EQ(snap.size(), 0u);
    EXPECT_TRUE(snap.files().empty());
    EXPECT_TRUE(snap.parse_failures().empty());
}

// ============================================================================
// Failures and Warnings
// ============================================================================

TEST(SnapshotTest, ParseFailureIsIsolatedToItsFile) {
    auto files = sample_files();
    files.push_back({"src/broken.rs", "fn broken( {"});
    auto snap = build("base", std::move(files));

    EXPECT_EQ(snap.size(), 7u);
    ASSERT_EQ(snap.parse_failures().size(), 1u);
    EXPECT_EQ(snap.parse_failures()[0].path, "src/broken.rs");
    ASSERT_TRUE(snap.files().contains("src/broken.rs"));
    EXPECT_TRUE(snap.files().at("src/broken.rs").empty());
}

TEST(SnapshotTest, InFileDuplicatesBecomeWarnings) {
    auto snap = build("base", {{"src/lib.rs", "fn f() {}\nfn f() { 1 }"}});
    EXPECT_EQ(snap.size(), 1u);
    ASSERT_EQ(snap.warnings().size(), 1u);
    EXPECT_EQ(snap.warnings()[0].rfind("src/lib.rs:", 0), 0u);
}

TEST(SnapshotTest, SameKeyFromTwoFilesIsInconsistent) {
    SnapshotBuilder builder(BuildOptions{.threads = 1});
    // `src/a/mod.rs` and `src/a.rs` both map to module `src::a`
    auto result = builder.build("base", {{"src/a.rs", "fn f() {}"}, {"src/a/mod.rs", "fn f() {}"}});
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, DiffErrorKind::InternalInconsistency);
    EXPECT_NE(unwrap_err(result).message.find("src::a::f"), std::string::npos);
}

TEST(SnapshotTest, DuplicatePathIsInconsistent) {
    SnapshotBuilder builder;
    auto result = builder.build("base", {{"src/a.rs", ""}, {"src/a.rs", ""}});
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, DiffErrorKind::InternalInconsistency);
}

// ============================================================================
// Determinism
// ============================================================================

TEST(SnapshotTest, ParallelBuildMatchesSequential) {
    std::vector<FileContents> many;
    for (int i = 0; i < 40; ++i) {
        many.push_back({"src/m" + std::to_string(i) + ".rs",
                        "fn f" + std::to_string(i) + "(x: u8) { g(x, " + std::to_string(i) +
                            "); }\nstruct S" + std::to_string(i) + ";"});
    }
    auto reversed = many;
    std::reverse(reversed.begin(), reversed.end());

    auto sequential = build("rev", many, 1);
    auto parallel = build("rev", reversed, 8);
    EXPECT_EQ(sequential.size(), 80u);
    EXPECT_EQ(sequential.to_json().to_string(), parallel.to_json().to_string());
}

TEST(SnapshotTest, JsonDumpNamesEverything) {
    auto snap = build("base", {{"src/lib.rs", "fn f() { g(1); }"}, {"src/bad.rs", "fn ("}});
    auto json = snap.to_json();
    ASSERT_TRUE(json.contains("entities"));
    EXPECT_EQ(json.get("revision")->as_string(), "base");
    EXPECT_EQ(json.get("entities")->size(), 1u);
    EXPECT_EQ(json.get("parse_failures")->size(), 1u);
    EXPECT_EQ(json.get("files")->size(), 2u);
}

TEST(SnapshotBuilderTest, ThreadCountIsBoundedByFiles) {
    SnapshotBuilder builder(BuildOptions{.threads = 8});
    EXPECT_EQ(builder.thread_count(3), 3u);
    EXPECT_EQ(builder.thread_count(0), 1u);
    EXPECT_EQ(builder.thread_count(100), 8u);
    SnapshotBuilder automatic;
    EXPECT_GE(automatic.thread_count(100), 1u);
}

TEST(SnapshotBuilderTest, WorkersLogUnderCallerContext) {
    auto& logger = log::Logger::instance();
    logger.clear_sinks();
    auto sink = std::make_unique<ContextSink>();
    auto* captured = sink.get();
    logger.add_sink(std::move(sink));
    logger.set_filter("extract=debug,*=error");

    {
        log::ScopedContext side("target");
        build("target", sample_files(), 4);
    }

    // The sink dies with clear_sinks()
    auto contexts = captured->contexts;
    logger.clear_sinks();
    logger.set_filter("*=warn");
    logger.add_sink(std::make_unique<log::ConsoleSink>());

    ASSERT_EQ(contexts.size(), 4u);
    for (const auto& context : contexts) {
        EXPECT_EQ(context, "target");
    }
}

TEST(ExtractQueueTest, DrainsBeforeStopping) {
    ExtractQueue queue;
    queue.push(1);
    queue.push(2);
    queue.stop();
    EXPECT_FALSE(queue.is_stopped());
    EXPECT_EQ(queue.pop(), std::optional<size_t>{1});
    EXPECT_EQ(queue.pop(), std::optional<size_t>{2});
    EXPECT_TRUE(queue.is_stopped());
    EXPECT_FALSE(queue.pop(1).has_value());
}
