// Git access tests
//
// The repository tests build a throwaway repository with the `git` binary
// and are skipped where it is not installed.

#include "vcs/git.hpp"

#include <gtest/gtest.h>

#include <fstream>

using namespace semdiff;
using namespace semdiff::vcs;

namespace fs = std::filesystem;

TEST(ShellQuoteTest, QuotesAndEscapes) {
    EXPECT_EQ(shell_quote("plain"), "'plain'");
    EXPECT_EQ(shell_quote("with space"), "'with space'");
    EXPECT_EQ(shell_quote("it's"), "'it'\\''s'");
    EXPECT_EQ(shell_quote(""), "''");
}

#ifndef _WIN32
TEST(RunCommandTest, CapturesOutputAndExitCode) {
    auto ok = run_command("printf 'a\\0b'", false);
    EXPECT_EQ(ok.exit_code, 0);
    EXPECT_EQ(ok.output, std::string("a\0b", 3));

    auto failed = run_command("sh -c 'echo oops >&2; exit 3'", true);
    EXPECT_EQ(failed.exit_code, 3);
    EXPECT_EQ(failed.output, "oops\n");
}

class GitRepositoryTest : public ::testing::Test {
protected:
    fs::path root_;
    fs::path repo_;
    std::string first_;
    std::string second_;

    void SetUp() override {
        if (run_command("git --version", false).exit_code != 0) {
            GTEST_SKIP() << "git is not installed";
        }
        root_ = fs::temp_directory_path() / "semdiff_git_test";
        repo_ = root_ / "origin";
        fs::remove_all(root_);
        fs::create_directories(repo_);

        git("init -q");
        git("symbolic-ref HEAD refs/heads/main");
        git("config user.email test@example.org");
        git("config user.name test");
        write("src/lib.rs", "fn f() {}");
        write("src/keep.rs", "fn k() {}");
        write("notes.txt", "hello");
        git("add -A");
        git("commit -q -m first");
        first_ = head();

        write("src/lib.rs", "fn f() { 1 }");
        write("src/new.rs", "fn n() {}");
        fs::remove(repo_ / "notes.txt");
        git("add -A");
        git("commit -q -m second");
        second_ = head();
    }

    void TearDown() override {
        if (!root_.empty()) {
            fs::remove_all(root_);
        }
    }

    void git(const std::string& args) {
        auto result = run_command("git -C " + shell_quote(repo_.string()) + " " + args, true);
        ASSERT_EQ(result.exit_code, 0) << args << ": " << result.output;
    }

    auto head() -> std::string {
        auto out = run_command("git -C " + shell_quote(repo_.string()) + " rev-parse HEAD", false)
                       .output;
        return out.substr(0, out.find('\n'));
    }

    void write(const std::string& relative, const std::string& contents) {
        auto path = repo_ / relative;
        fs::create_directories(path.parent_path());
        std::ofstream(path) << contents;
    }
};

TEST_F(GitRepositoryTest, ResolvesRevisions) {
    GitRepository repo(repo_);
    auto head = repo.resolve("main");
    ASSERT_TRUE(is_ok(head));
    EXPECT_EQ(unwrap(head), second_);
    auto parent = repo.resolve("main~1");
    ASSERT_TRUE(is_ok(parent));
    EXPECT_EQ(unwrap(parent), first_);

    auto missing = repo.resolve("no-such-branch");
    ASSERT_TRUE(is_err(missing));
    EXPECT_EQ(unwrap_err(missing).kind, DiffErrorKind::SnapshotUnavailable);
}

TEST_F(GitRepositoryTest, ListsAndDiffsFiles) {
    GitRepository repo(repo_);
    auto listed = repo.list_files(first_);
    ASSERT_TRUE(is_ok(listed));
    EXPECT_EQ(unwrap(listed), (std::vector<std::string>{"notes.txt", "src/keep.rs", "src/lib.rs"}));

    auto changed = repo.changed_files(first_, second_);
    ASSERT_TRUE(is_ok(changed));
    EXPECT_EQ(unwrap(changed), (std::vector<std::string>{"notes.txt", "src/lib.rs", "src/new.rs"}));
    EXPECT_EQ(unwrap(repo.added_files(first_, second_)), (std::vector<std::string>{"src/new.rs"}));
    EXPECT_EQ(unwrap(repo.deleted_files(first_, second_)), (std::vector<std::string>{"notes.txt"}));
}

TEST_F(GitRepositoryTest, MovedFileListsBothPaths) {
    git("mv src/keep.rs src/kept.rs");
    git("commit -q -m move");
    auto third = head();

    GitRepository repo(repo_);
    auto changed = repo.changed_files(second_, third);
    ASSERT_TRUE(is_ok(changed));
    EXPECT_EQ(unwrap(changed), (std::vector<std::string>{"src/keep.rs", "src/kept.rs"}));
    EXPECT_EQ(unwrap(repo.added_files(second_, third)), (std::vector<std::string>{"src/kept.rs"}));
    EXPECT_EQ(unwrap(repo.deleted_files(second_, third)),
              (std::vector<std::string>{"src/keep.rs"}));
}

TEST_F(GitRepositoryTest, LoadsRustFilesAtRevision) {
    GitRepository repo(repo_);
    auto tree = repo.load_tree(first_, SourceFilter(), nullptr);
    ASSERT_TRUE(is_ok(tree));
    ASSERT_EQ(unwrap(tree).size(), 2u);
    EXPECT_EQ(unwrap(tree)[1].path, "src/lib.rs");
    EXPECT_EQ(unwrap(tree)[1].contents, "fn f() {}");

    std::set<std::string> only = {"src/lib.rs"};
    auto limited = repo.load_tree(second_, SourceFilter(), &only);
    ASSERT_TRUE(is_ok(limited));
    ASSERT_EQ(unwrap(limited).size(), 1u);
    EXPECT_EQ(unwrap(limited)[0].contents, "fn f() { 1 }");
}

TEST_F(GitRepositoryTest, ReadFileFailsForMissingPath) {
    GitRepository repo(repo_);
    auto result = repo.read_file(first_, "src/absent.rs");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, DiffErrorKind::SnapshotUnavailable);
}

TEST_F(GitRepositoryTest, EnsureCloneClonesOnce) {
    auto clone_path = root_ / "clone";
    auto cloned = GitRepository::ensure_clone(repo_.string(), clone_path);
    ASSERT_TRUE(is_ok(cloned));
    EXPECT_TRUE(fs::exists(clone_path / "src" / "lib.rs"));

    // A second call reuses the checkout and fetches
    auto reused = GitRepository::ensure_clone(repo_.string(), clone_path);
    ASSERT_TRUE(is_ok(reused));
    auto resolved = unwrap(reused).resolve("main");
    ASSERT_TRUE(is_ok(resolved));
    EXPECT_EQ(unwrap(resolved), second_);
}

TEST(GitCloneTest, BadUrlIsUnavailable) {
    if (run_command("git --version", false).exit_code != 0) {
        GTEST_SKIP() << "git is not installed";
    }
    auto path = fs::temp_directory_path() / "semdiff_git_bad_clone";
    fs::remove_all(path);
    auto result = GitRepository::ensure_clone((path / "nowhere").string(), path);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, DiffErrorKind::SnapshotUnavailable);
}
#endif
