#ifndef PYSTRUCT_EXTRACT_CANCELLATION_HPP
#define PYSTRUCT_EXTRACT_CANCELLATION_HPP

#include <atomic>
#include <chrono>
#include <cstdint>

namespace pystruct::extract {

/**
 * Cooperative cancellation shared by the coordinator and the workers.
 *
 * A run is cancelled once `cancel()` is called or once the deadline set by
 * `set_timeout()` passes. Workers poll `is_cancelled()` before starting and
 * after finishing each file.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() {
        cancelled_.store(true, std::memory_order_release);
    }

    /// Cancels the run `timeout` from now. A non-positive timeout clears the deadline.
    void set_timeout(std::chrono::milliseconds timeout);

    [[nodiscard]] auto is_cancelled() const -> bool;

private:
    using Clock = std::chrono::steady_clock;

    std::atomic<bool> cancelled_{false};
    std::atomic<int64_t> deadline_ns_{0}; // steady-clock ticks, 0 = none
};

} // namespace pystruct::extract

#endif // PYSTRUCT_EXTRACT_CANCELLATION_HPP
