#pragma once

#include <chrono>
#include <mutex>
#include <condition_variable>

namespace stratlab {
namespace execution {

// Fixed-window limiter for calls to an external data source (thread-safe)
class RateLimiter {
public:
    explicit RateLimiter(int max_per_second = 5);

    // Blocks until a slot is available
    void acquire();

    struct Stats {
        int total_requests;
        int forced_waits;
        std::chrono::milliseconds total_wait_time;
    };
    Stats getStats() const;

private:
    void resetWindowIfNeeded();

    int max_per_second_;
    int current_count_;
    std::chrono::steady_clock::time_point window_start_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;

    int total_requests_;
    int forced_waits_;
    std::chrono::milliseconds total_wait_time_;
};

} // namespace execution
} // namespace stratlab
