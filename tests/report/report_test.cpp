// Report assembly and writer tests

#include "report/report_writer.hpp"
#include "snapshot/snapshot_builder.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace semdiff;
using namespace semdiff::report;
using extract::EntityKind;

class ReportTest : public ::testing::Test {
protected:
    diff::ChangeSet changes_;

    void SetUp() override {
        auto base = build("base", {{"src/lib.rs", R"(
fn run(x: u8) -> u8 { step(x) + 1 }
fn legacy() {}
struct Config { depth: u8 }
trait Shape { fn area(&self) -> f64; }
impl Shape for Config { fn area(&self) -> f64 { 1.0 } }
)"}});
        auto target = build("target", {{"src/lib.rs", R"(
fn run(x: u8) -> u8 { step(x) + step(x) + 2 }
fn fresh() {}
struct Config { depth: u16 }
trait Shape { fn area(&self) -> f64; fn name(&self) -> String; }
impl Shape for Config { fn area(&self) -> f64 { compute(self.depth, 2.0) } }
)"}});
        auto result = diff::Differ().diff(&base, &target);
        ASSERT_TRUE(is_ok(result));
        changes_ = std::move(unwrap(result));
    }

    static auto build(const std::string& revision, std::vector<snapshot::FileContents> files)
        -> snapshot::Snapshot {
        snapshot::SnapshotBuilder builder(snapshot::BuildOptions{.threads = 1});
        auto result = builder.build(revision, std::move(files));
        EXPECT_TRUE(is_ok(result));
        return is_ok(result) ? std::move(unwrap(result)) : snapshot::Snapshot{};
    }
};

// ============================================================================
// Assembly
// ============================================================================

TEST_F(ReportTest, ViewsPartitionChangesByKind) {
    auto report = assemble_report(changes_);
    EXPECT_EQ(report.all.size(), changes_.changes.size());

    EXPECT_EQ(report.functions.added.size(), 1u);
    EXPECT_EQ(report.functions.modified.size(), 1u);
    EXPECT_EQ(report.functions.deleted.size(), 1u);
    EXPECT_EQ(report.types.modified.size(), 1u);
    EXPECT_TRUE(report.traits.empty());
    EXPECT_EQ(report.methods.added.size(), 1u);
    EXPECT_EQ(report.methods.modified.size(), 1u);

    size_t total = 0;
    for (auto kind : extract::ALL_ENTITY_KINDS) {
        total += report.view(kind).size();
    }
    EXPECT_EQ(total, report.all.size());
}

TEST_F(ReportTest, GranularCoversModifiedFunctionsAndMethods) {
    auto report = assemble_report(changes_);
    ASSERT_EQ(report.granular.size(), 2u);
    EXPECT_EQ(report.granular[0].display_name, "run");
    EXPECT_EQ(report.granular[1].display_name, "<Config as Shape>.area");
    EXPECT_EQ(report.granular[0].file, "src/lib.rs");
}

TEST(ReportAssemblyTest, EmptyChangeSet) {
    auto report = assemble_report(diff::ChangeSet{});
    EXPECT_TRUE(report.all.empty());
    EXPECT_TRUE(report.granular.empty());
    for (auto kind : extract::ALL_ENTITY_KINDS) {
        EXPECT_TRUE(report.view(kind).empty());
    }
}

// ============================================================================
// Rendering
// ============================================================================

TEST_F(ReportTest, KindDocumentShape) {
    auto report = assemble_report(changes_);
    auto doc = render_kind(report.functions);
    ASSERT_EQ(doc.get("added")->size(), 1u);
    ASSERT_EQ(doc.get("modified")->size(), 1u);
    ASSERT_EQ(doc.get("deleted")->size(), 1u);

    const auto& added = (*doc.get("added"))[0];
    EXPECT_EQ(added.get("name")->as_string(), "fresh");
    EXPECT_EQ(added.get("module")->as_string(), "src::lib");
    EXPECT_EQ(added.get("file")->as_string(), "src/lib.rs");
    EXPECT_EQ(added.get("code")->as_string(), "fn fresh() {}");

    const auto& modified = (*doc.get("modified"))[0];
    EXPECT_FALSE(modified.contains("code"));
    EXPECT_EQ(modified.get("oldCode")->as_string(), "fn run(x: u8) -> u8 { step(x) + 1 }");
    EXPECT_EQ(modified.get("newCode")->as_string(),
              "fn run(x: u8) -> u8 { step(x) + step(x) + 2 }");
}

TEST_F(ReportTest, MethodEntriesUseOwnerQualifiedNames) {
    auto report = assemble_report(changes_);
    auto doc = render_kind(report.methods);
    EXPECT_EQ((*doc.get("added"))[0].get("name")->as_string(), "Shape.name");
}

TEST_F(ReportTest, AllChangesEntryShape) {
    auto report = assemble_report(changes_);
    auto doc = render_all(report);
    ASSERT_EQ(doc.size(), report.all.size());

    bool saw_type = false;
    for (size_t i = 0; i < doc.size(); ++i) {
        const auto& entry = doc[i];
        EXPECT_TRUE(entry.contains("kind"));
        EXPECT_TRUE(entry.contains("change"));
        if (entry.get("kind")->as_string() == "type") {
            saw_type = true;
            EXPECT_EQ(entry.get("change")->as_string(), "modified");
            EXPECT_EQ(entry.get("type_kind")->as_string(), "struct");
            EXPECT_EQ(entry.get("oldSignature")->as_string(), "struct Config { depth: u8 }");
            EXPECT_EQ(entry.get("newSignature")->as_string(), "struct Config { depth: u16 }");
            EXPECT_FALSE(entry.get("body_only")->as_bool());
        }
    }
    EXPECT_TRUE(saw_type);
}

TEST_F(ReportTest, GranularDocumentShape) {
    auto report = assemble_report(changes_);
    auto doc = render_granular(report);
    const auto* file = doc.get("src/lib.rs");
    ASSERT_NE(file, nullptr);

    const auto* run = file->get("run");
    ASSERT_NE(run, nullptr);
    EXPECT_EQ(run->get("added_functions")->size(), 1u);
    EXPECT_EQ((*run->get("added_functions"))[0].as_string(), "step");
    EXPECT_EQ(run->get("removed_functions")->size(), 0u);
    const auto& call = (*run->get("added_calls"))[0];
    EXPECT_EQ(call.get("callee")->as_string(), "step");
    EXPECT_EQ(call.get("arg_count")->as_i64(), 1);
    const auto& lit = (*run->get("added_literals"))[0];
    EXPECT_EQ(lit.get("type_name")->as_string(), "integer");
    EXPECT_EQ(lit.get("value")->as_string(), "2");
    EXPECT_EQ(run->get("new_function_src_loc")->get("start_line")->as_i64(), 2);
    EXPECT_EQ(run->get("new_function_src_loc")->get("file_name")->as_string(), "src/lib.rs");

    const auto* area = file->get("<Config as Shape>.area");
    ASSERT_NE(area, nullptr);
    EXPECT_EQ((*area->get("added_functions"))[0].as_string(), "compute");
    EXPECT_EQ((*area->get("removed_literals"))[0].get("type_name")->as_string(), "float");
}

TEST_F(ReportTest, SharedGranularNamesInOneFileUseFullKeys) {
    auto base = build("base", {{"src/lib.rs", R"(
mod a { fn go() { one() } }
mod b { fn go() { two() } }
fn solo() { x() }
)"}});
    auto target = build("target", {{"src/lib.rs", R"(
mod a { fn go() { one(1) } }
mod b { fn go() { two(2) } }
fn solo() { y() }
)"}});
    auto changes = diff::Differ().diff(&base, &target);
    ASSERT_TRUE(is_ok(changes));
    auto doc = render_granular(assemble_report(unwrap(changes)));

    const auto* file = doc.get("src/lib.rs");
    ASSERT_NE(file, nullptr);
    EXPECT_EQ(file->size(), 3u);
    EXPECT_FALSE(file->contains("go"));
    EXPECT_TRUE(file->contains("src::lib::a::go"));
    EXPECT_TRUE(file->contains("src::lib::b::go"));
    EXPECT_TRUE(file->contains("solo"));
}

// ============================================================================
// Writer
// ============================================================================

class ReportWriterTest : public ReportTest {
protected:
    std::filesystem::path dir_;

    void SetUp() override {
        ReportTest::SetUp();
        dir_ = std::filesystem::temp_directory_path() / "semdiff_report_test" / "out";
        std::filesystem::remove_all(dir_.parent_path());
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_.parent_path());
    }

    static auto read(const std::filesystem::path& path) -> std::string {
        std::ifstream in(path);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }
};

TEST_F(ReportWriterTest, WritesSixFiles) {
    auto report = assemble_report(changes_);
    auto result = ReportWriter(dir_).write(report);
    ASSERT_TRUE(is_ok(result));

    for (const auto* name : {"all_code_changes.json", "function_changes.json", "type_changes.json",
                             "interface_changes.json", "method_changes.json",
                             "function_changes_granular.json"}) {
        EXPECT_TRUE(std::filesystem::exists(dir_ / name)) << name;
    }

    auto traits = read(dir_ / "interface_changes.json");
    EXPECT_EQ(traits, "{\n  \"added\": [],\n  \"deleted\": [],\n  \"modified\": []\n}\n");
    EXPECT_NE(read(dir_ / "function_changes.json").find("\"fresh\""), std::string::npos);
}

TEST_F(ReportWriterTest, EmptyReportStillWritesEveryFile) {
    auto report = assemble_report(diff::ChangeSet{});
    ASSERT_TRUE(is_ok(ReportWriter(dir_).write(report)));
    EXPECT_EQ(read(dir_ / "all_code_changes.json"), "[]\n");
    EXPECT_EQ(read(dir_ / "function_changes_granular.json"), "{}\n");
}

TEST_F(ReportWriterTest, UnwritableDirectoryIsIoError) {
    std::filesystem::create_directories(dir_.parent_path());
    auto blocker = dir_.parent_path() / "file";
    std::ofstream(blocker) << "x";

    auto result = ReportWriter(blocker / "out").write(assemble_report(changes_));
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, DiffErrorKind::Io);
}

TEST_F(ReportWriterTest, RewriteLeavesOnlyReportFiles) {
    ASSERT_TRUE(is_ok(ReportWriter(dir_).write(assemble_report(changes_))));
    ASSERT_TRUE(is_ok(ReportWriter(dir_).write(assemble_report(diff::ChangeSet{}))));

    EXPECT_EQ(read(dir_ / "all_code_changes.json"), "[]\n");
    size_t entries = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir_)) {
        EXPECT_NE(entry.path().extension(), ".tmp") << entry.path();
        ++entries;
    }
    EXPECT_EQ(entries, 6u);
}

TEST_F(ReportWriterTest, FailedWriteKeepsEarlierReports) {
    ASSERT_TRUE(is_ok(ReportWriter(dir_).write(assemble_report(changes_))));
    auto before = read(dir_ / "all_code_changes.json");

    // A directory where a staging file should go makes that write fail
    std::filesystem::create_directories(dir_ / "method_changes.json.tmp");
    auto result = ReportWriter(dir_).write(assemble_report(diff::ChangeSet{}));
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, DiffErrorKind::Io);

    EXPECT_EQ(read(dir_ / "all_code_changes.json"), before);
    EXPECT_FALSE(std::filesystem::exists(dir_ / "all_code_changes.json.tmp"));
    EXPECT_FALSE(std::filesystem::exists(dir_ / "function_changes.json.tmp"));
}

TEST_F(ReportWriterTest, FailedInstallRestoresEarlierReports) {
    ASSERT_TRUE(is_ok(ReportWriter(dir_).write(assemble_report(changes_))));
    auto all_before = read(dir_ / "all_code_changes.json");
    auto functions_before = read(dir_ / "function_changes.json");

    // A non-empty directory in place of a later report file fails its rename
    // after the earlier ones were already moved into place
    std::filesystem::remove(dir_ / "method_changes.json");
    std::filesystem::create_directories(dir_ / "method_changes.json" / "blocker");
    auto result = ReportWriter(dir_).write(assemble_report(diff::ChangeSet{}));
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, DiffErrorKind::Io);

    EXPECT_EQ(read(dir_ / "all_code_changes.json"), all_before);
    EXPECT_EQ(read(dir_ / "function_changes.json"), functions_before);
    for (const auto& entry : std::filesystem::directory_iterator(dir_)) {
        EXPECT_NE(entry.path().extension(), ".tmp") << entry.path();
        EXPECT_NE(entry.path().extension(), ".bak") << entry.path();
    }
}
