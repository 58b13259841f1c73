#include "common/Config.h"
#include "TestSeries.h"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace stratlab;
using testing::near;

static std::filesystem::path writeConfig(const std::string& name, const std::string& content) {
    const auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << content;
    return path;
}

static void testDefaults() {
    Config& config = Config::getInstance();
    config.load((std::filesystem::temp_directory_path() / "stratlab_missing_config.json").string());

    const auto engine = config.getEngineConfig();
    assert(near(engine.initial_capital, 10000.0));
    assert(engine.years == 5);
    assert(engine.enforce_buy_first);
    assert(engine.worker_threads == 0);
    assert(!engine.as_of);
    assert(engine.sweep_capitals.size() == 6);
    assert(config.getCostProfiles().empty());
    assert(config.getPairs().empty());

    const auto seasonal = config.getStrategyParameters("monthlySeasonal");
    assert(seasonal.risk.worst_month_exit);
    assert(near(seasonal.risk.stop_loss_value, 0.08));
    std::cout << "[TEST] Config defaults PASSED" << std::endl;
}

static void testLoad() {
    const auto path = writeConfig("stratlab_test_config.json", R"({
        "engine": {
            "initial_capital": 25000,
            "years": 3,
            "enforce_buy_first": false,
            "worker_threads": 2,
            "compare_budget_ms": 5000,
            "as_of": "2024-06-30",
            "enabled_strategies": ["buyHold", "SMA_Crossover", "rsi"]
        },
        "risk": { "take_profit_pct": 0.25 },
        "strategies": {
            "rsi": { "period": 10, "oversold": 25, "overbought": 75 },
            "sma_crossover": { "fast_period": 300, "slow_period": 200 },
            "monthly_seasonal": {
                "favorable_months": ["Jan", "feb", 3, "October", 13],
                "unfavorable_months": [4, 6, 12],
                "risk": { "stop_loss_method": "atr", "stop_loss_value": 2.5 }
            },
            "momentum": { "risk": { "stop_loss_method": "sideways" } },
            "pairMeanReversion": { "secondary_symbol": "PEP", "entry_z": 2.5, "exit_z": 0.25 }
        },
        "cost_profiles": {
            "ALL": { "commission": 0, "exchange_fee": 0, "clearing_fee": 0, "overnight_rate": 0 },
            "ES": { "commission": 2.0 }
        },
        "pairs": [
            { "primary": "KO", "secondary": "PEP", "pearson_correlation": 0.91, "cointegration_score": 0.8,
              "is_stationary_pair": true, "half_life": 12.5, "optimal_ratio": 0.74 },
            { "primary": "XOM", "secondary": "CVX" }
        ]
    })");

    Config& config = Config::getInstance();
    config.load(path.string());

    const auto engine = config.getEngineConfig();
    assert(near(engine.initial_capital, 25000.0));
    assert(engine.years == 3);
    assert(!engine.enforce_buy_first);
    assert(engine.worker_threads == 2);
    assert(engine.compare_budget_ms == 5000);
    assert(engine.as_of && *engine.as_of == Date(2024, 6, 30));
    assert(engine.enabled_strategies == std::vector<std::string>({"buy_hold", "sma_crossover", "rsi"}));

    const auto rsi = config.getStrategyParameters("rsi");
    assert(rsi.rsi.period == 10);
    assert(near(rsi.rsi.oversold, 25.0));
    assert(near(rsi.risk.take_profit_pct, 0.25));

    // fast >= slow falls back to 50/200
    const auto sma = config.getStrategyParameters("sma_crossover");
    assert(sma.sma.fast_period == 50 && sma.sma.slow_period == 200);

    const auto seasonal = config.getStrategyParameters("monthly_seasonal");
    assert(seasonal.seasonal.favorable_months == std::vector<int>({1, 2, 3, 10}));
    assert(seasonal.seasonal.unfavorable_months == std::vector<int>({4, 6, 12}));
    assert(seasonal.risk.stop_loss_method == risk::StopLossMethod::ATR);
    assert(near(seasonal.risk.stop_loss_value, 2.5));
    assert(seasonal.risk.worst_month_exit);
    assert(near(seasonal.risk.take_profit_pct, 0.25));

    // Unknown stop method keeps the built-in 8% stop
    const auto momentum = config.getStrategyParameters("momentum");
    assert(momentum.risk.stop_loss_method == risk::StopLossMethod::PERCENTAGE);

    const auto pair = config.getStrategyParameters("pair_mean_reversion");
    assert(pair.pair.secondary_symbol == "PEP");
    assert(near(pair.pair.entry_z, 2.5));

    // Unconfigured strategy still picks up the global risk section
    assert(near(config.getStrategyParameters("macd").risk.take_profit_pct, 0.25));

    const auto costs = config.getCostProfiles();
    assert(costs.size() == 2);
    assert(costs.at("ALL").perUnitFees() == 0.0);
    assert(near(costs.at("ES").commission, 2.0));
    assert(near(costs.at("ES").exchange_fee, 1.50));

    const auto pairs = config.getPairs();
    assert(pairs.size() == 1);
    assert(pairs[0].is_stationary_pair);
    assert(pairs[0].half_life && near(*pairs[0].half_life, 12.5));
    assert(near(pairs[0].optimal_ratio, 0.74));
    const auto symbols = config.getPairSymbols();
    assert(symbols.at("KO") == "PEP");
    assert(symbols.at("XOM") == "CVX");

    std::filesystem::remove(path);
    std::cout << "[TEST] Config load PASSED" << std::endl;
}

static void testReloadResets() {
    const auto path = writeConfig("stratlab_test_config_small.json", R"({"engine": {"years": -2}})");
    Config& config = Config::getInstance();
    config.load(path.string());

    const auto engine = config.getEngineConfig();
    assert(engine.years == 5);
    assert(near(engine.initial_capital, 10000.0));
    assert(engine.enabled_strategies.empty());
    assert(config.getCostProfiles().empty());
    std::filesystem::remove(path);
    std::cout << "[TEST] Config reload PASSED" << std::endl;
}

int main() {
    std::cout << "[TEST] Starting Config Test..." << std::endl;
    testDefaults();
    testLoad();
    testReloadResets();
    std::cout << "[TEST] Config Test PASSED!" << std::endl;
    return 0;
}
