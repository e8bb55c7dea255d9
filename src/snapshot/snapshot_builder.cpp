//! # Snapshot Builder
//!
//! Parallel extraction followed by a sequential, path-ordered merge.

#include "snapshot/snapshot_builder.hpp"

#include "extract/extractor.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

namespace semdiff::snapshot {

// ============================================================================
// ExtractQueue
// ============================================================================

void ExtractQueue::push(size_t index) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        queue.push(index);
    }
    cv.notify_one();
}

std::optional<size_t> ExtractQueue::pop(int timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex);
    if (!cv.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                     [this] { return !queue.empty() || stop_flag; })) {
        return std::nullopt;
    }
    if (queue.empty()) {
        return std::nullopt;
    }
    size_t index = queue.front();
    queue.pop();
    return index;
}

void ExtractQueue::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        stop_flag = true;
    }
    cv.notify_all();
}

bool ExtractQueue::is_stopped() {
    std::lock_guard<std::mutex> lock(mutex);
    return stop_flag && queue.empty();
}

// ============================================================================
// SnapshotBuilder
// ============================================================================

SnapshotBuilder::SnapshotBuilder(BuildOptions options) : options_(options) {}

auto SnapshotBuilder::thread_count(size_t file_count) const -> unsigned {
    unsigned threads = options_.threads;
    if (threads == 0) {
        threads = std::thread::hardware_concurrency();
        if (threads == 0) {
            threads = 1;
        }
    }
    return static_cast<unsigned>(std::min<size_t>(threads, std::max<size_t>(file_count, 1)));
}

void SnapshotBuilder::worker_thread(ExtractQueue& queue, std::vector<FileContents>& files,
                                    std::vector<extract::FileExtraction>& results,
                                    const std::string& context) {
    log::ScopedContext scope(context);
    while (true) {
        auto index = queue.pop();
        if (!index) {
            if (queue.is_stopped()) {
                break;
            }
            continue;
        }
        auto& file = files[*index];
        results[*index] = extract::extract_file(file.path, std::move(file.contents));
    }
}

auto SnapshotBuilder::build(std::string revision, std::vector<FileContents> files)
    -> Result<Snapshot, DiffError> {
    std::sort(files.begin(), files.end(),
              [](const FileContents& a, const FileContents& b) { return a.path < b.path; });
    for (size_t i = 1; i < files.size(); ++i) {
        if (files[i].path == files[i - 1].path) {
            return DiffError{DiffErrorKind::InternalInconsistency,
                             "file '" + files[i].path + "' given twice for " + revision};
        }
    }

    std::vector<extract::FileExtraction> results(files.size());
    unsigned threads = thread_count(files.size());
    SEMDIFF_LOG_DEBUG("snapshot", "extracting " << files.size() << " files of " << revision
                                                << " on " << threads << " threads");

    if (threads <= 1) {
        for (size_t i = 0; i < files.size(); ++i) {
            results[i] = extract::extract_file(files[i].path, std::move(files[i].contents));
        }
    } else {
        ExtractQueue queue;
        for (size_t i = 0; i < files.size(); ++i) {
            queue.push(i);
        }
        queue.stop();

        std::vector<std::thread> workers;
        workers.reserve(threads);
        for (unsigned i = 0; i < threads; ++i) {
            workers.emplace_back(&SnapshotBuilder::worker_thread, this, std::ref(queue),
                                 std::ref(files), std::ref(results),
                                 std::cref(log::current_context()));
        }
        for (auto& worker : workers) {
            worker.join();
        }
    }

    // Merge in path order
    Snapshot snapshot;
    snapshot.revision_ = std::move(revision);
    std::map<extract::EntityKey, std::string> origin;

    for (auto& result : results) {
        auto& keys = snapshot.files_[result.path];
        if (result.failure) {
            snapshot.failures_.push_back(std::move(*result.failure));
        }
        for (auto& warning : result.warnings) {
            snapshot.warnings_.push_back(std::move(warning));
        }
        for (auto& record : result.records) {
            auto [it, inserted] = origin.emplace(record.key, result.path);
            if (!inserted) {
                return DiffError{DiffErrorKind::InternalInconsistency,
                                 "entity '" + record.key.to_string() + "' extracted from both '" +
                                     it->second + "' and '" + result.path + "'"};
            }
            keys.push_back(record.key);
            auto key = record.key;
            snapshot.entities_.emplace(std::move(key), std::move(record));
        }
    }

    SEMDIFF_LOG_INFO("snapshot", snapshot.revision_ << ": " << snapshot.entities_.size()
                                                    << " entities from " << files.size()
                                                    << " files, " << snapshot.failures_.size()
                                                    << " parse failures");
    return snapshot;
}

} // namespace semdiff::snapshot
