// Diff command tests
//
// Argument handling, and the whole pipeline run over two directories.

#include "cli/cmd_diff.hpp"
#include "vcs/git.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using namespace semdiff;
using namespace semdiff::cli;

namespace fs = std::filesystem;

// ============================================================================
// Arguments
// ============================================================================

TEST(DiffArgsTest, GitModePositionals) {
    auto result = parse_diff_args({"https://example.org/r.git", "/tmp/r", "main", "abc123"}, {});
    ASSERT_TRUE(is_ok(result));
    const auto& cmd = unwrap(result);
    EXPECT_EQ(cmd.mode, SourceMode::Git);
    EXPECT_EQ(cmd.repo_url, "https://example.org/r.git");
    EXPECT_EQ(cmd.local_path, "/tmp/r");
    EXPECT_EQ(cmd.branch, "main");
    EXPECT_EQ(cmd.commit, "abc123");
    EXPECT_EQ(cmd.settings.output_dir, "./");
}

TEST(DiffArgsTest, OptionalOutputDirectory) {
    auto result = parse_diff_args({"url", "path", "main", "HEAD", "out/"}, {});
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).settings.output_dir, "out/");
}

TEST(DiffArgsTest, FlagsOverrideConfig) {
    Config config;
    config.diff.threads = 2;
    config.diff.exclude = {"vendor/"};
    auto result = parse_diff_args({"url", "path", "main", "HEAD", "--threads=8", "--all-files",
                                   "--exclude=a/,b/", "--output=o", "--config=x.toml"},
                                  config);
    ASSERT_TRUE(is_ok(result));
    const auto& settings = unwrap(result).settings;
    EXPECT_EQ(settings.threads, 8u);
    EXPECT_FALSE(settings.changed_only);
    EXPECT_EQ(settings.exclude, (std::vector<std::string>{"a/", "b/"}));
    EXPECT_EQ(settings.output_dir, "o");
}

TEST(DiffArgsTest, ConfigValuesAreDefaults) {
    Config config;
    config.diff.changed_only = false;
    config.diff.output_dir = "from-config";
    auto result = parse_diff_args({"url", "path", "main", "HEAD"}, config);
    ASSERT_TRUE(is_ok(result));
    EXPECT_FALSE(unwrap(result).settings.changed_only);
    EXPECT_EQ(unwrap(result).settings.output_dir, "from-config");
}

TEST(DiffArgsTest, DirectoryMode) {
    auto result = parse_diff_args({"--base-dir=old", "--target-dir=new", "reports"}, {});
    ASSERT_TRUE(is_ok(result));
    const auto& cmd = unwrap(result);
    EXPECT_EQ(cmd.mode, SourceMode::Directories);
    EXPECT_EQ(cmd.base_dir, "old");
    EXPECT_EQ(cmd.target_dir, "new");
    EXPECT_EQ(cmd.settings.output_dir, "reports");
}

TEST(DiffArgsTest, UsageErrors) {
    auto is_usage = [](const std::vector<std::string>& args) {
        auto result = parse_diff_args(args, {});
        return is_err(result) && unwrap_err(result).kind == DiffErrorKind::Usage;
    };
    EXPECT_TRUE(is_usage({}));
    EXPECT_TRUE(is_usage({"url", "path", "main"}));
    EXPECT_TRUE(is_usage({"url", "path", "main", "HEAD", "out", "extra"}));
    EXPECT_TRUE(is_usage({"url", "path", "main", "HEAD", "--frobnicate"}));
    EXPECT_TRUE(is_usage({"url", "path", "main", "HEAD", "--threads=many"}));
    EXPECT_TRUE(is_usage({"url", "path", "main", "HEAD", "--threads="}));
    EXPECT_TRUE(is_usage({"--base-dir=old"}));
    EXPECT_TRUE(is_usage({"--base-dir=old", "--target-dir=new", "out", "extra"}));
}

// ============================================================================
// Pipeline
// ============================================================================

class RunDiffTest : public ::testing::Test {
protected:
    fs::path root_;

    void SetUp() override {
        root_ = fs::temp_directory_path() / "semdiff_run_diff_test";
        fs::remove_all(root_);
        fs::create_directories(root_);
    }

    void TearDown() override {
        fs::remove_all(root_);
    }

    void write(const fs::path& relative, const std::string& contents) {
        auto path = root_ / relative;
        fs::create_directories(path.parent_path());
        std::ofstream(path) << contents;
    }

    auto command() -> DiffCommand {
        DiffCommand cmd;
        cmd.mode = SourceMode::Directories;
        cmd.base_dir = (root_ / "base").string();
        cmd.target_dir = (root_ / "target").string();
        cmd.settings.output_dir = (root_ / "out").string();
        cmd.settings.threads = 2;
        return cmd;
    }
};

TEST_F(RunDiffTest, DirectoriesEndToEnd) {
    write("base/src/lib.rs", "pub fn run(x: u8) -> u8 { step(x) + 1 }\nfn same() {}");
    write("base/src/gone.rs", "struct Old;");
    write("base/src/stable.rs", "fn untouched() {}");
    write("target/src/lib.rs", "pub fn run(x: u8) -> u8 { step(x) + step(x) + 2 }\nfn same() {}");
    write("target/src/stable.rs", "fn untouched() {}");
    write("target/src/new.rs", "trait Fresh { fn go(&self); }");

    auto result = run_diff(command());
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).message;
    const auto& summary = unwrap(result);

    using extract::EntityKind;
    using diff::ChangeKind;
    EXPECT_EQ(summary.changes.count(EntityKind::Function, ChangeKind::Modified), 1u);
    EXPECT_EQ(summary.changes.count(EntityKind::Type, ChangeKind::Removed), 1u);
    EXPECT_EQ(summary.changes.count(EntityKind::Trait, ChangeKind::Added), 1u);
    EXPECT_EQ(summary.changes.count(EntityKind::Method, ChangeKind::Added), 1u);
    EXPECT_EQ(summary.changes.changes.size(), 4u);
    // Identical files are left out of both snapshots
    EXPECT_EQ(summary.base_entities, 3u);
    EXPECT_EQ(summary.target_entities, 4u);
    EXPECT_EQ(summary.parse_failures, 0u);

    EXPECT_TRUE(fs::exists(root_ / "out" / "all_code_changes.json"));
    EXPECT_TRUE(fs::exists(root_ / "out" / "function_changes_granular.json"));
}

TEST_F(RunDiffTest, AllFilesIncludesUnchangedFiles) {
    write("base/src/stable.rs", "fn untouched() {}");
    write("target/src/stable.rs", "fn untouched() {}");
    auto cmd = command();
    cmd.settings.changed_only = false;

    auto result = run_diff(cmd);
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).base_entities, 1u);
    EXPECT_TRUE(unwrap(result).changes.changes.empty());
}

TEST_F(RunDiffTest, ParseFailuresAreWarningsNotErrors) {
    write("base/src/lib.rs", "fn f() {}");
    write("target/src/lib.rs", "fn f( {");
    auto result = run_diff(command());
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).parse_failures, 1u);
    EXPECT_EQ(unwrap(result).warnings.size(), 1u);
    // The unparseable file contributes nothing, so `f` looks removed
    EXPECT_EQ(unwrap(result).changes.changes.size(), 1u);
}

TEST_F(RunDiffTest, MissingDirectoryIsUnavailable) {
    write("base/src/lib.rs", "fn f() {}");
    auto result = run_diff(command());
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, DiffErrorKind::SnapshotUnavailable);
    EXPECT_FALSE(fs::exists(root_ / "out"));
}

#ifndef _WIN32
TEST_F(RunDiffTest, GitMovedFileCountsAsRemovedAndAdded) {
    if (vcs::run_command("git --version", false).exit_code != 0) {
        GTEST_SKIP() << "git is not installed";
    }
    auto origin = root_ / "origin";
    fs::create_directories(origin);
    auto git = [&](const std::string& args) {
        auto result =
            vcs::run_command("git -C " + vcs::shell_quote(origin.string()) + " " + args, true);
        ASSERT_EQ(result.exit_code, 0) << args << ": " << result.output;
    };
    git("init -q");
    git("symbolic-ref HEAD refs/heads/main");
    git("config user.email test@example.org");
    git("config user.name test");
    write("origin/src/old.rs", "fn a() {}\nfn b() {}");
    git("add -A");
    git("commit -q -m first");
    git("mv src/old.rs src/new.rs");
    git("commit -q -m move");

    DiffCommand cmd;
    cmd.mode = SourceMode::Git;
    cmd.repo_url = origin.string();
    cmd.local_path = (root_ / "clone").string();
    cmd.branch = "main~1";
    cmd.commit = "main";
    cmd.settings.output_dir = (root_ / "out").string();
    cmd.settings.changed_only = true;

    auto result = run_diff(cmd);
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).message;
    using extract::EntityKind;
    using diff::ChangeKind;
    const auto& changes = unwrap(result).changes;
    EXPECT_EQ(changes.count(EntityKind::Function, ChangeKind::Added), 2u);
    EXPECT_EQ(changes.count(EntityKind::Function, ChangeKind::Removed), 2u);
}
#endif
