#include "extract/cancellation.hpp"

namespace pystruct::extract {

void CancellationToken::set_timeout(std::chrono::milliseconds timeout) {
    if (timeout.count() <= 0) {
        deadline_ns_.store(0, std::memory_order_release);
        return;
    }
    auto deadline = Clock::now() + timeout;
    auto ticks =
        std::chrono::duration_cast<std::chrono::nanoseconds>(deadline.time_since_epoch()).count();
    deadline_ns_.store(ticks, std::memory_order_release);
}

auto CancellationToken::is_cancelled() const -> bool {
    if (cancelled_.load(std::memory_order_acquire)) {
        return true;
    }
    auto deadline = deadline_ns_.load(std::memory_order_acquire);
    if (deadline == 0) {
        return false;
    }
    auto now = std::chrono::duration_cast<std::chrono::nanoseconds>(
                   Clock::now().time_since_epoch())
                   .count();
    return now >= deadline;
}

} // namespace pystruct::extract
