#pragma once

#include <atomic>

namespace stratlab {

// Cooperative cancellation flag shared between a controller and running simulations
class CancellationToken {
public:
    void cancel() { cancelled_.store(true, std::memory_order_release); }
    bool isCancelled() const { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace stratlab
