#pragma once

#include <optional>
#include <string>
#include <vector>
#include "common/Date.h"

namespace stratlab {
namespace engine {

struct EngineConfig {
    double initial_capital = 10000.0;
    int years = 5;
    bool enforce_buy_first = true;
    bool fractional_quantity = true;

    int worker_threads = 0;             // 0 = hardware concurrency
    long long compare_budget_ms = 0;    // 0 = no wall-clock limit

    std::string data_dir = "data";
    int provider_max_requests_per_second = 0;   // 0 = no rate limiting
    std::optional<Date> as_of;          // end of the backtest window, today when unset

    std::string log_dir = "logs";
    std::string log_level = "info";

    // Empty = every registered strategy
    std::vector<std::string> enabled_strategies;
    std::vector<double> sweep_capitals = {1000.0, 5000.0, 10000.0, 25000.0, 50000.0, 100000.0};
};

} // namespace engine
} // namespace stratlab
