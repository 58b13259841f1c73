#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <vector>
#include "common/CancellationToken.h"
#include "common/Types.h"

namespace stratlab {
namespace backtest {

// Fan-out/fan-in of independent backtests over a bounded worker pool
class StrategyComparator {
public:
    using Task = std::function<BacktestResult(const CancellationToken&)>;

    // 0 = std::thread::hardware_concurrency()
    explicit StrategyComparator(size_t worker_threads = 0);

    // Results come back in task order. With a non-zero budget, outstanding tasks are
    // cancelled once it elapses and `timed_out` is set. A task that throws does not
    // stop the others; the first exception is rethrown once every task has finished.
    std::vector<BacktestResult> runAll(const std::vector<Task>& tasks,
                                       std::chrono::milliseconds budget = std::chrono::milliseconds(0),
                                       bool* timed_out = nullptr) const;

    // Completed runs by total return (best first), then every other status in input order
    static void rank(std::vector<BacktestResult>& results);

    // Id of the highest-return completed run, empty when none completed
    static std::string bestStrategy(const std::vector<BacktestResult>& results);

    size_t workerThreads() const { return worker_threads_; }

private:
    size_t worker_threads_;
};

} // namespace backtest
} // namespace stratlab
