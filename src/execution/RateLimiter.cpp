#include "execution/RateLimiter.h"
#include "common/Logger.h"
#include <algorithm>

namespace stratlab {
namespace execution {

RateLimiter::RateLimiter(int max_per_second)
    : max_per_second_(std::max(1, max_per_second))
    , current_count_(0)
    , window_start_(std::chrono::steady_clock::now())
    , total_requests_(0)
    , forced_waits_(0)
    , total_wait_time_(std::chrono::milliseconds(0))
{
    LOG_DEBUG("RateLimiter initialized: {} requests/s", max_per_second_);
}

void RateLimiter::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (true) {
        resetWindowIfNeeded();

        if (current_count_ < max_per_second_) {
            current_count_++;
            total_requests_++;
            return;
        }

        // Sleep until the next window opens; a reset by another thread wakes us early.
        const auto wake_time = window_start_ + std::chrono::seconds(1) + std::chrono::milliseconds(1);

        forced_waits_++;
        const auto wait_start = std::chrono::steady_clock::now();

        cv_.wait_until(lock, wake_time);

        total_wait_time_ += std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - wait_start
        );
    }
}

RateLimiter::Stats RateLimiter::getStats() const {
    std::unique_lock<std::mutex> lock(mutex_);

    Stats stats;
    stats.total_requests = total_requests_;
    stats.forced_waits = forced_waits_;
    stats.total_wait_time = total_wait_time_;

    return stats;
}

void RateLimiter::resetWindowIfNeeded() {
    const auto now = std::chrono::steady_clock::now();
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - window_start_);

    if (elapsed.count() >= 1000) {
        current_count_ = 0;
        window_start_ = now;
        cv_.notify_all();
    }
}

} // namespace execution
} // namespace stratlab
