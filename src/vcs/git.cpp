#include "vcs/git.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <cstdio>

#ifndef _WIN32
#include <sys/wait.h>
#endif

namespace semdiff::vcs {

namespace {

auto unavailable(const std::string& what, const CommandOutput& result) -> DiffError {
    std::string message = what + " (exit code " + std::to_string(result.exit_code) + ")";
    if (!result.output.empty()) {
        message += ": " + result.output;
        while (!message.empty() && (message.back() == '\n' || message.back() == '\r')) {
            message.pop_back();
        }
    }
    return DiffError{DiffErrorKind::SnapshotUnavailable, std::move(message)};
}

/// Splits `-z` output on NUL bytes.
auto split_nul(const std::string& output) -> std::vector<std::string> {
    std::vector<std::string> out;
    size_t start = 0;
    while (start < output.size()) {
        size_t end = output.find('\0', start);
        if (end == std::string::npos) {
            end = output.size();
        }
        if (end > start) {
            out.emplace_back(output.substr(start, end - start));
        }
        start = end + 1;
    }
    return out;
}

} // namespace

// ============================================================================
// Process Helpers
// ============================================================================

auto run_command(const std::string& cmd, bool merge_stderr) -> CommandOutput {
    CommandOutput result;

#ifdef _WIN32
    std::string full_cmd = cmd + (merge_stderr ? " 2>&1" : " 2>NUL");
    FILE* pipe = _popen(full_cmd.c_str(), "rb");
#else
    std::string full_cmd = cmd + (merge_stderr ? " 2>&1" : " 2>/dev/null");
    FILE* pipe = popen(full_cmd.c_str(), "r");
#endif
    if (!pipe) {
        return result;
    }

    // fread, not fgets: -z listings and file contents may contain NUL bytes
    char buffer[4096];
    size_t n = 0;
    while ((n = fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
        result.output.append(buffer, n);
    }

#ifdef _WIN32
    result.exit_code = _pclose(pipe);
#else
    int status = pclose(pipe);
    result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
#endif
    return result;
}

auto shell_quote(std::string_view arg) -> std::string {
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

// ============================================================================
// GitRepository
// ============================================================================

auto GitRepository::git(const std::vector<std::string>& args, bool merge_stderr) const
    -> CommandOutput {
    std::string cmd = "git -C " + shell_quote(path_.string());
    for (const auto& arg : args) {
        cmd += " " + shell_quote(arg);
    }
    SEMDIFF_LOG_TRACE("vcs", cmd);
    return run_command(cmd, merge_stderr);
}

auto GitRepository::ensure_clone(const std::string& url, const std::filesystem::path& path)
    -> Result<GitRepository, DiffError> {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        SEMDIFF_LOG_INFO("vcs", "cloning " << url << " into " << path.string());
        auto result = run_command("git clone " + shell_quote(url) + " " +
                                      shell_quote(path.string()),
                                  true);
        if (result.exit_code != 0) {
            return unavailable("cannot clone " + url, result);
        }
        return GitRepository(path);
    }

    GitRepository repo(path);
    auto set_url = repo.git({"remote", "set-url", "origin", url}, true);
    if (set_url.exit_code != 0) {
        SEMDIFF_LOG_WARN("vcs", "cannot set origin of " << path.string() << " to " << url << ": "
                                                        << set_url.output);
    }
    auto fetch = repo.git({"fetch", "--all"}, true);
    if (fetch.exit_code != 0) {
        SEMDIFF_LOG_WARN("vcs", "fetch failed in " << path.string() << ": " << fetch.output);
    }
    return repo;
}

auto GitRepository::resolve(const std::string& rev) const -> Result<std::string, DiffError> {
    CommandOutput result;
    for (const auto& candidate : {rev, "origin/" + rev}) {
        result = git({"rev-parse", "--verify", "--quiet", candidate + "^{commit}"}, false);
        if (result.exit_code == 0) {
            std::string id = result.output;
            while (!id.empty() && (id.back() == '\n' || id.back() == '\r')) {
                id.pop_back();
            }
            SEMDIFF_LOG_DEBUG("vcs", rev << " resolves to " << id);
            return id;
        }
    }
    return unavailable("cannot resolve revision '" + rev + "'", result);
}

auto GitRepository::name_list(const std::vector<std::string>& args) const
    -> Result<std::vector<std::string>, DiffError> {
    auto result = git(args, false);
    if (result.exit_code != 0) {
        std::string what = "git";
        for (const auto& arg : args) {
            what += " " + arg;
        }
        return unavailable(what + " failed", result);
    }
    auto names = split_nul(result.output);
    std::sort(names.begin(), names.end());
    return names;
}

auto GitRepository::list_files(const std::string& rev) const
    -> Result<std::vector<std::string>, DiffError> {
    return name_list({"ls-tree", "-r", "--name-only", "-z", rev});
}

auto GitRepository::changed_files(const std::string& base, const std::string& target) const
    -> Result<std::vector<std::string>, DiffError> {
    return name_list({"diff", "--name-only", "--no-renames", "-z", base, target});
}

auto GitRepository::added_files(const std::string& base, const std::string& target) const
    -> Result<std::vector<std::string>, DiffError> {
    return name_list(
        {"diff", "--name-only", "--no-renames", "-z", "--diff-filter=A", base, target});
}

auto GitRepository::deleted_files(const std::string& base, const std::string& target) const
    -> Result<std::vector<std::string>, DiffError> {
    return name_list(
        {"diff", "--name-only", "--no-renames", "-z", "--diff-filter=D", base, target});
}

auto GitRepository::read_file(const std::string& rev, const std::string& path) const
    -> Result<std::string, DiffError> {
    auto result = git({"show", rev + ":" + path}, false);
    if (result.exit_code != 0) {
        return unavailable("cannot read " + path + " at " + rev, result);
    }
    return std::move(result.output);
}

auto GitRepository::load_tree(const std::string& rev, const SourceFilter& filter,
                              const std::set<std::string>* only) const
    -> Result<std::vector<snapshot::FileContents>, DiffError> {
    auto listed = list_files(rev);
    if (is_err(listed)) {
        return unwrap_err(listed);
    }

    std::vector<snapshot::FileContents> files;
    for (const auto& path : unwrap(listed)) {
        if (!filter.is_rust_source(path) || (only != nullptr && !only->contains(path))) {
            continue;
        }
        auto contents = read_file(rev, path);
        if (is_err(contents)) {
            return unwrap_err(contents);
        }
        files.push_back(snapshot::FileContents{.path = path, .contents = std::move(unwrap(contents))});
    }

    SEMDIFF_LOG_INFO("vcs", "loaded " << files.size() << " Rust files at " << rev);
    return files;
}

} // namespace semdiff::vcs
