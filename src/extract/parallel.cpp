//! # Parallel Extraction Implementation
//!
//! ## Extraction Flow
//!
//! ```text
//! run()
//! ├─ queue every input index, then stop() the queue
//! ├─ spawn min(files, threads) workers
//! │  └─ worker_thread()     - pop index until the queue drains
//! │     └─ extract_one()    - check token → lex/parse/extract → check token
//! └─ join all workers (barrier) and return the slots
//! ```
//!
//! ## Thread Safety
//!
//! - `WorkQueue` is guarded by its mutex and condition variable
//! - Each slot is written by exactly one worker
//! - Statistics are atomic counters
//! - Logging goes through the thread-safe global logger

#include "extract/parallel.hpp"

#include "extract/extractor.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <thread>

namespace pystruct::extract {

namespace {

auto cancelled_failure(const SourceUnit& unit) -> ExtractionFailure {
    return ExtractionFailure{.kind = FailureKind::Cancelled,
                             .file = unit.relative_path,
                             .message = "extraction was cancelled",
                             .line = 0,
                             .column = 0};
}

} // namespace

// ============================================================================
// WorkQueue Implementation
// ============================================================================

void WorkQueue::push(size_t index) {
    std::lock_guard<std::mutex> lock(mutex);
    queue.push(index);
    cv.notify_one();
}

/// Pops an index from the queue, waiting up to timeout_ms.
///
/// Returns nullopt if the queue is empty after the timeout.
std::optional<size_t> WorkQueue::pop(int timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex);

    if (queue.empty()) {
        cv.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                    [this] { return !queue.empty() || stop_flag; });
    }

    if (queue.empty()) {
        return std::nullopt;
    }

    auto index = queue.front();
    queue.pop();
    return index;
}

void WorkQueue::stop() {
    std::lock_guard<std::mutex> lock(mutex);
    stop_flag = true;
    cv.notify_all();
}

bool WorkQueue::is_empty() {
    std::lock_guard<std::mutex> lock(mutex);
    return queue.empty();
}

bool WorkQueue::is_stopped() {
    std::lock_guard<std::mutex> lock(mutex);
    return stop_flag;
}

size_t WorkQueue::size() {
    std::lock_guard<std::mutex> lock(mutex);
    return queue.size();
}

// ============================================================================
// ParallelExtractor Implementation
// ============================================================================

ParallelExtractor::ParallelExtractor(int num_threads) : num_threads(num_threads) {
    if (this->num_threads <= 0) {
        this->num_threads = static_cast<int>(std::thread::hardware_concurrency());
        if (this->num_threads <= 0) {
            this->num_threads = 1;
        }
    }
}

std::vector<FileOutcome> ParallelExtractor::run(const std::vector<SourceUnit>& units,
                                                const CancellationToken& token) {
    stats.reset();
    stats.total_files = static_cast<int>(units.size());

    std::vector<FileOutcome> slots(units.size());
    if (units.empty()) {
        return slots;
    }

    for (size_t i = 0; i < units.size(); ++i) {
        queue.push(i);
    }
    queue.stop();

    int actual_threads = std::min(static_cast<int>(units.size()), num_threads);
    PYSTRUCT_LOG_DEBUG("extract", "Extracting " << units.size() << " files with "
                                                << actual_threads << " threads");

    std::vector<std::thread> workers;
    workers.reserve(static_cast<size_t>(actual_threads));
    for (int i = 0; i < actual_threads; ++i) {
        workers.emplace_back(&ParallelExtractor::worker_thread, this, std::cref(units),
                             std::cref(token), std::ref(slots));
    }

    // Wait for all workers to finish
    for (auto& worker : workers) {
        worker.join();
    }

    PYSTRUCT_LOG_DEBUG("extract", "Extracted " << stats.completed << " of " << stats.total_files
                                               << " files in " << stats.elapsed_ms() << " ms ("
                                               << stats.failed << " failed, " << stats.cancelled
                                               << " cancelled)");
    return slots;
}

void ParallelExtractor::worker_thread(const std::vector<SourceUnit>& units,
                                      const CancellationToken& token,
                                      std::vector<FileOutcome>& slots) {
    while (true) {
        auto index = queue.pop(100);
        if (!index) {
            if (queue.is_stopped() && queue.is_empty()) {
                break;
            }
            continue;
        }
        extract_one(units[*index], token, slots[*index]);
    }
}

void ParallelExtractor::extract_one(const SourceUnit& unit, const CancellationToken& token,
                                    FileOutcome& slot) {
    if (token.is_cancelled()) {
        slot = cancelled_failure(unit);
        ++stats.cancelled;
        return;
    }

    PYSTRUCT_LOG_DEBUG("extract", "Extracting " << unit.relative_path);
    auto outcome = extract_module(unit.source, unit.relative_path);

    // A file that finishes after cancellation is discarded.
    if (token.is_cancelled()) {
        slot = cancelled_failure(unit);
        ++stats.cancelled;
        return;
    }

    if (is_err(outcome)) {
        PYSTRUCT_LOG_WARN("extract", unwrap_err(outcome).to_string());
        ++stats.failed;
    } else {
        ++stats.completed;
    }
    slot = std::move(outcome);
}

} // namespace pystruct::extract
