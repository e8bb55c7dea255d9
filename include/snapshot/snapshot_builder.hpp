//! # Snapshot Builder
//!
//! Runs the extractor over every file of a tree state and merges the
//! results into one `Snapshot`.
//!
//! ## Parallelism
//!
//! Files are independent: each worker takes a file index from an
//! `ExtractQueue` and writes only to that file's result slot. Once all
//! workers have joined, the slots are merged in path order on the calling
//! thread, so the snapshot does not depend on scheduling.
//!
//! ```text
//! files ──> ExtractQueue ──> worker 1..N ──> results[i] ──> merge (sorted) ──> Snapshot
//! ```

#ifndef SEMDIFF_SNAPSHOT_SNAPSHOT_BUILDER_HPP
#define SEMDIFF_SNAPSHOT_SNAPSHOT_BUILDER_HPP

#include "common.hpp"
#include "snapshot/snapshot.hpp"

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

namespace semdiff::snapshot {

/// Work queue of file indices shared by the extraction workers.
class ExtractQueue {
public:
    ExtractQueue() : stop_flag(false) {}

    void push(size_t index);

    /// Pops an index, waiting up to `timeout_ms`. Returns `std::nullopt` if
    /// the queue is still empty.
    std::optional<size_t> pop(int timeout_ms = 100);

    /// No more indices will be pushed.
    void stop();

    bool is_stopped();

private:
    std::queue<size_t> queue;
    std::mutex mutex;
    std::condition_variable cv;
    bool stop_flag;
};

struct BuildOptions {
    unsigned threads = 0; ///< 0 = hardware concurrency
};

class SnapshotBuilder {
public:
    explicit SnapshotBuilder(BuildOptions options = {});

    /// Builds the snapshot of `revision` from its Rust files.
    ///
    /// Parse failures are recorded in the snapshot. Two files producing the
    /// same key, or the same path given twice, is an `InternalInconsistency`.
    [[nodiscard]] auto build(std::string revision, std::vector<FileContents> files)
        -> Result<Snapshot, DiffError>;

    [[nodiscard]] auto thread_count(size_t file_count) const -> unsigned;

private:
    BuildOptions options_;

    /// Runs under the caller's log context so worker messages name the side.
    void worker_thread(ExtractQueue& queue, std::vector<FileContents>& files,
                       std::vector<extract::FileExtraction>& results, const std::string& context);
};

} // namespace semdiff::snapshot

#endif // SEMDIFF_SNAPSHOT_SNAPSHOT_BUILDER_HPP
