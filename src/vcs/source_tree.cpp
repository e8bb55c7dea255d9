#include "vcs/source_tree.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <fstream>
#include <set>
#include <sstream>

namespace semdiff::vcs {

namespace fs = std::filesystem;

SourceFilter::SourceFilter(std::vector<std::string> excluded) {
    for (auto& prefix : excluded) {
        // Trim whitespace and a leading "./"
        auto begin = prefix.find_first_not_of(" \t");
        auto end = prefix.find_last_not_of(" \t");
        if (begin == std::string::npos) {
            continue;
        }
        prefix = prefix.substr(begin, end - begin + 1);
        if (prefix.starts_with("./")) {
            prefix.erase(0, 2);
        }
        if (!prefix.empty()) {
            excluded_.push_back(std::move(prefix));
        }
    }
}

auto SourceFilter::is_rust_source(std::string_view path) const -> bool {
    if (!path.ends_with(".rs")) {
        return false;
    }
    if (path.starts_with("target/")) {
        return false;
    }

    size_t start = 0;
    while (start < path.size()) {
        size_t slash = path.find('/', start);
        if (slash == std::string_view::npos) {
            break;
        }
        if (path[start] == '.') {
            return false;
        }
        start = slash + 1;
    }

    for (const auto& prefix : excluded_) {
        if (path.starts_with(prefix)) {
            return false;
        }
    }
    return true;
}

auto load_directory(const fs::path& root, const SourceFilter& filter)
    -> Result<std::vector<snapshot::FileContents>, DiffError> {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return DiffError{DiffErrorKind::SnapshotUnavailable,
                         "'" + root.string() + "' is not a directory"};
    }

    std::vector<snapshot::FileContents> files;
    fs::recursive_directory_iterator it(root, ec);
    if (ec) {
        return DiffError{DiffErrorKind::SnapshotUnavailable,
                         "cannot read '" + root.string() + "': " + ec.message()};
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            return DiffError{DiffErrorKind::SnapshotUnavailable,
                             "cannot read '" + root.string() + "': " + ec.message()};
        }
        if (it->is_directory(ec)) {
            auto name = it->path().filename().string();
            if (name.starts_with(".") || (it.depth() == 0 && name == "target")) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!it->is_regular_file(ec)) {
            continue;
        }

        std::string relative = fs::relative(it->path(), root, ec).generic_string();
        if (ec || !filter.is_rust_source(relative)) {
            continue;
        }

        std::ifstream in(it->path(), std::ios::binary);
        if (!in) {
            return DiffError{DiffErrorKind::SnapshotUnavailable,
                             "cannot open '" + it->path().string() + "'"};
        }
        std::ostringstream contents;
        contents << in.rdbuf();
        files.push_back(snapshot::FileContents{.path = std::move(relative),
                                               .contents = contents.str()});
    }

    std::sort(files.begin(), files.end(),
              [](const auto& a, const auto& b) { return a.path < b.path; });
    SEMDIFF_LOG_DEBUG("vcs", "loaded " << files.size() << " Rust files from " << root.string());
    return files;
}

void retain_changed(std::vector<snapshot::FileContents>& base,
                    std::vector<snapshot::FileContents>& target) {
    std::set<std::string> unchanged;
    size_t i = 0;
    size_t j = 0;
    while (i < base.size() && j < target.size()) {
        if (base[i].path < target[j].path) {
            ++i;
        } else if (target[j].path < base[i].path) {
            ++j;
        } else {
            if (base[i].contents == target[j].contents) {
                unchanged.insert(base[i].path);
            }
            ++i;
            ++j;
        }
    }

    auto is_unchanged = [&unchanged](const snapshot::FileContents& file) {
        return unchanged.contains(file.path);
    };
    std::erase_if(base, is_unchanged);
    std::erase_if(target, is_unchanged);
}

} // namespace semdiff::vcs
