//! # Parallel Extraction
//!
//! This header defines the multi-threaded extraction infrastructure.
//!
//! ## Components
//!
//! | Class                | Description                          |
//! |----------------------|--------------------------------------|
//! | `WorkQueue`          | Thread-safe queue of file indices    |
//! | `ExtractionStats`    | Progress counters                    |
//! | `ParallelExtractor`  | Runs lex → parse → extract per file  |
//!
//! ## Result Slots
//!
//! Every input file owns one pre-allocated result slot; a worker writes only
//! the slot of the file it popped. The coordinator joins all workers before
//! returning the slots, so no partial result is ever observed.

#ifndef PYSTRUCT_EXTRACT_PARALLEL_HPP
#define PYSTRUCT_EXTRACT_PARALLEL_HPP

#include "common.hpp"
#include "extract/cancellation.hpp"
#include "extract/failure.hpp"
#include "extract/loader.hpp"
#include "model/entities.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>
#include <vector>

namespace pystruct::extract {

/// The outcome of one file: its module or why it has none.
using FileOutcome = Result<model::Module, ExtractionFailure>;

/**
 * Thread-safe work queue of input indices
 */
class WorkQueue {
public:
    WorkQueue() : stop_flag(false) {}

    void push(size_t index);
    std::optional<size_t> pop(int timeout_ms = 100);
    void stop();
    bool is_empty();
    bool is_stopped();
    size_t size();

private:
    std::queue<size_t> queue;
    std::mutex mutex;
    std::condition_variable cv;
    bool stop_flag;
};

/**
 * Extraction statistics for reporting
 */
struct ExtractionStats {
    std::atomic<int> total_files{0};
    std::atomic<int> completed{0};
    std::atomic<int> failed{0};
    std::atomic<int> cancelled{0};
    std::chrono::steady_clock::time_point start_time;

    void reset() {
        total_files = 0;
        completed = 0;
        failed = 0;
        cancelled = 0;
        start_time = std::chrono::steady_clock::now();
    }

    int64_t elapsed_ms() const {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<std::chrono::milliseconds>(now - start_time).count();
    }
};

/**
 * Parallel extraction orchestrator
 * Extracts every source unit on a bounded pool of worker threads
 */
class ParallelExtractor {
public:
    /// `num_threads <= 0` uses the hardware concurrency (at least 1).
    explicit ParallelExtractor(int num_threads = 0);

    /// Extracts `units`, returning one outcome per unit in input order.
    ///
    /// Files not started, or finished, after `token` is cancelled yield a
    /// `Cancelled` failure instead of their module.
    std::vector<FileOutcome> run(const std::vector<SourceUnit>& units,
                                 const CancellationToken& token);

    const ExtractionStats& get_stats() const {
        return stats;
    }

    int thread_count() const {
        return num_threads;
    }

private:
    int num_threads;
    WorkQueue queue;
    ExtractionStats stats;

    // Worker thread function
    void worker_thread(const std::vector<SourceUnit>& units, const CancellationToken& token,
                       std::vector<FileOutcome>& slots);

    // Extract a single unit into its slot
    void extract_one(const SourceUnit& unit, const CancellationToken& token, FileOutcome& slot);
};

} // namespace pystruct::extract

#endif // PYSTRUCT_EXTRACT_PARALLEL_HPP
