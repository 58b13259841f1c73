#include "backtest/StrategyComparator.h"
#include "common/Logger.h"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <thread>

namespace stratlab {
namespace backtest {

StrategyComparator::StrategyComparator(size_t worker_threads)
    : worker_threads_(worker_threads)
{
    if (worker_threads_ == 0) {
        worker_threads_ = std::max(1u, std::thread::hardware_concurrency());
    }
}

std::vector<BacktestResult> StrategyComparator::runAll(const std::vector<Task>& tasks,
                                                       std::chrono::milliseconds budget,
                                                       bool* timed_out) const {
    std::vector<BacktestResult> results(tasks.size());
    if (timed_out != nullptr) *timed_out = false;
    if (tasks.empty()) return results;

    CancellationToken token;
    std::atomic<size_t> next{0};
    std::mutex mutex;
    std::condition_variable done_cv;
    size_t finished = 0;
    std::exception_ptr first_error;

    auto worker = [&]() {
        while (true) {
            const size_t idx = next.fetch_add(1);
            if (idx >= tasks.size()) break;

            try {
                results[idx] = tasks[idx](token);
            } catch (const std::exception& e) {
                std::lock_guard<std::mutex> lock(mutex);
                LOG_ERROR("Backtest task {} failed: {}", idx, e.what());
                if (!first_error) {
                    first_error = std::current_exception();
                }
            }

            std::lock_guard<std::mutex> lock(mutex);
            ++finished;
            done_cv.notify_all();
        }
    };

    const size_t pool_size = std::min(worker_threads_, tasks.size());
    std::vector<std::thread> pool;
    pool.reserve(pool_size);
    for (size_t i = 0; i < pool_size; ++i) {
        pool.emplace_back(worker);
    }

    if (budget.count() > 0) {
        std::unique_lock<std::mutex> lock(mutex);
        const bool all_done = done_cv.wait_for(lock, budget, [&] { return finished == tasks.size(); });
        if (!all_done) {
            LOG_WARN("Comparison budget of {} ms elapsed, cancelling {} outstanding run(s)",
                     budget.count(), tasks.size() - finished);
            token.cancel();
            if (timed_out != nullptr) *timed_out = true;
        }
    }

    for (auto& t : pool) {
        t.join();
    }

    if (first_error) {
        std::rethrow_exception(first_error);
    }
    return results;
}

void StrategyComparator::rank(std::vector<BacktestResult>& results) {
    std::stable_sort(results.begin(), results.end(), [](const BacktestResult& a, const BacktestResult& b) {
        const bool a_done = (a.status == ResultStatus::COMPLETED);
        const bool b_done = (b.status == ResultStatus::COMPLETED);
        if (a_done != b_done) return a_done;
        if (!a_done) return false;
        return a.total_return_pct > b.total_return_pct;
    });
}

std::string StrategyComparator::bestStrategy(const std::vector<BacktestResult>& results) {
    const BacktestResult* best = nullptr;
    for (const auto& r : results) {
        if (r.status != ResultStatus::COMPLETED) continue;
        if (best == nullptr || r.total_return_pct > best->total_return_pct) {
            best = &r;
        }
    }
    return best ? best->strategy_id : std::string();
}

} // namespace backtest
} // namespace stratlab
