#include "common/Logger.h"
#include "common/Config.h"
#include "common/Errors.h"
#include "backtest/BacktestEngine.h"
#include "backtest/ResultSchema.h"
#include "data/FilePriceSeriesProvider.h"
#include "data/RateLimitedPriceSeriesProvider.h"

#include <nlohmann/json.hpp>

#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace stratlab;

namespace {

struct CliOptions {
    std::string mode;            // backtest | compare | sweep | list
    std::string symbol;
    std::string strategy_id;
    std::vector<double> capitals;
    bool json_mode = false;
    bool include_series = false;
    std::optional<double> initial_capital;
    std::optional<int> years;
    std::optional<bool> enforce_buy_first;
    std::string data_dir;
    std::string config_path = "config/config.json";
};

void printUsage() {
    std::cout
        << "Usage:\n"
        << "  stratlab --backtest SYMBOL --strategy ID [options]\n"
        << "  stratlab --compare SYMBOL [options]\n"
        << "  stratlab --sweep SYMBOL --strategy ID [--capitals 1000,5000,...] [options]\n"
        << "  stratlab --list\n"
        << "Options:\n"
        << "  --initial-capital N   starting capital (default from config)\n"
        << "  --years N             lookback in calendar years\n"
        << "  --no-buy-first        allow short entries from flat\n"
        << "  --data-dir DIR        directory of SYMBOL.csv / SYMBOL.json files\n"
        << "  --config PATH         config file (default config/config.json)\n"
        << "  --json                print results as JSON\n"
        << "  --series              include trade ledger and equity curve in comparison JSON\n";
}

std::vector<double> parseCapitals(const std::string& csv) {
    std::vector<double> out;
    size_t start = 0;
    while (start <= csv.size()) {
        const size_t comma = csv.find(',', start);
        const std::string token = (comma == std::string::npos)
            ? csv.substr(start)
            : csv.substr(start, comma - start);
        if (!token.empty()) {
            out.push_back(std::stod(token));
        }
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return out;
}

// Throws std::invalid_argument on malformed input
CliOptions parseArgs(int argc, char* argv[]) {
    CliOptions opts;
    auto next = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw std::invalid_argument("Missing value for " + flag);
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--backtest" || arg == "--compare" || arg == "--sweep") {
            opts.mode = arg.substr(2);
            opts.symbol = next(i, arg);
        } else if (arg == "--list") {
            opts.mode = "list";
        } else if (arg == "--strategy") {
            opts.strategy_id = next(i, arg);
        } else if (arg == "--capitals") {
            opts.capitals = parseCapitals(next(i, arg));
        } else if (arg == "--initial-capital") {
            opts.initial_capital = std::stod(next(i, arg));
        } else if (arg == "--years") {
            opts.years = std::stoi(next(i, arg));
        } else if (arg == "--no-buy-first") {
            opts.enforce_buy_first = false;
        } else if (arg == "--buy-first") {
            opts.enforce_buy_first = true;
        } else if (arg == "--data-dir") {
            opts.data_dir = next(i, arg);
        } else if (arg == "--config") {
            opts.config_path = next(i, arg);
        } else if (arg == "--json") {
            opts.json_mode = true;
        } else if (arg == "--series") {
            opts.include_series = true;
        } else if (arg == "--help" || arg == "-h") {
            opts.mode.clear();
            return opts;
        } else {
            throw std::invalid_argument("Unknown argument: " + arg);
        }
    }
    if ((opts.mode == "backtest" || opts.mode == "sweep") && opts.strategy_id.empty()) {
        throw std::invalid_argument("--" + opts.mode + " requires --strategy ID");
    }
    return opts;
}

std::string fmtOptional(const std::optional<double>& value, const char* suffix = "") {
    if (!value) return "N/A";
    return fmt::format("{:.2f}{}", *value, suffix);
}

void printResult(const BacktestResult& r) {
    std::cout << "\n" << r.strategy_name << " on " << r.symbol
              << " (" << r.start_date.toString() << " .. " << r.end_date.toString() << ")\n";
    std::cout << "---------------------------------------------\n";
    std::cout << "Status:          " << resultStatusToString(r.status) << "\n";
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Initial capital: " << r.initial_capital << "\n";
    std::cout << "Final value:     " << r.final_value << "\n";
    std::cout << "Total return:    " << r.total_return_pct << "%\n";
    std::cout << "Annual return:   " << fmtOptional(r.annual_return_pct, "%") << "\n";
    std::cout << "Max drawdown:    " << r.max_drawdown_pct << "%\n";
    std::cout << "Trades:          " << r.total_trades << " (" << r.winning_trades << " won, "
              << r.losing_trades << " lost)\n";
    std::cout << "Win rate:        " << fmtOptional(r.win_rate_pct, "%") << "\n";
    std::cout << "Avg win / loss:  " << r.avg_win << " / " << r.avg_loss << "\n";
    std::cout << "Profit factor:   " << fmtOptional(r.profit_factor) << "\n";
    std::cout << "Sharpe / Sortino: " << r.sharpe_ratio << " / " << r.sortino_ratio << "\n";
    std::cout << "Total costs:     " << r.total_costs << "\n";
    if (r.skipped_signals > 0) {
        std::cout << "Skipped signals: " << r.skipped_signals << "\n";
    }
    for (const auto& note : r.notes) {
        std::cout << "  note: " << note << "\n";
    }
    if (!r.trade_ledger.empty()) {
        std::cout << "Trades:\n";
        for (const auto& t : r.trade_ledger) {
            std::cout << "  " << t.date.toString() << "  " << std::left << std::setw(10)
                      << tradeTypeToString(t.type) << std::right
                      << " qty=" << std::setprecision(4) << t.quantity
                      << " @ " << std::setprecision(2) << t.price;
            if (t.pnl) {
                std::cout << "  pnl=" << *t.pnl;
            }
            std::cout << "  (" << t.reason << ")\n";
        }
    }
    std::cout << "---------------------------------------------\n";
}

void printComparison(const ComparisonResult& c) {
    std::cout << "\nStrategy comparison for " << c.symbol << " | capital " << std::fixed << std::setprecision(2)
              << c.capital << " | " << c.years << "y | buy-first " << (c.enforce_buy_first ? "on" : "off") << "\n";
    std::cout << "-------------------------------------------------------------------------------\n";
    std::cout << std::left << std::setw(28) << "Strategy" << std::right
              << std::setw(12) << "Return %" << std::setw(12) << "Win %"
              << std::setw(10) << "MaxDD %" << std::setw(8) << "Trades" << "  Status\n";
    for (const auto& r : c.results) {
        std::cout << std::left << std::setw(28) << r.strategy_name << std::right
                  << std::setw(12) << r.total_return_pct
                  << std::setw(12) << fmtOptional(r.win_rate_pct)
                  << std::setw(10) << r.max_drawdown_pct
                  << std::setw(8) << r.total_trades
                  << "  " << resultStatusToString(r.status) << "\n";
    }
    std::cout << "-------------------------------------------------------------------------------\n";
    std::cout << "Best strategy: " << (c.best_strategy.empty() ? "N/A" : c.best_strategy) << "\n";
    if (c.cancelled) {
        std::cout << "Comparison budget elapsed; some runs were cancelled.\n";
    }
}

void printSweep(const SweepResult& s) {
    std::cout << "\nCapital sweep for " << s.strategy_id << " on " << s.symbol << " (" << s.years << "y)\n";
    std::cout << "-----------------------------------------------------------------\n";
    std::cout << std::right << std::setw(12) << "Capital" << std::setw(14) << "Final"
              << std::setw(14) << "Profit" << std::setw(10) << "Return %"
              << std::setw(8) << "Win %" << std::setw(8) << "Trades" << "\n";
    std::cout << std::fixed << std::setprecision(2);
    for (const auto& row : s.rows) {
        std::cout << std::setw(12) << row.capital << std::setw(14) << row.final_value
                  << std::setw(14) << row.profit << std::setw(10) << row.total_return_pct
                  << std::setw(8) << fmtOptional(row.win_rate_pct)
                  << std::setw(8) << row.total_trades << "\n";
    }
    std::cout << "-----------------------------------------------------------------\n";
}

std::unique_ptr<backtest::BacktestEngine> buildEngine(const Config& config, const engine::EngineConfig& engine_cfg) {
    std::shared_ptr<data::IPriceSeriesProvider> prices =
        std::make_shared<data::FilePriceSeriesProvider>(engine_cfg.data_dir);
    if (engine_cfg.provider_max_requests_per_second > 0) {
        prices = std::make_shared<data::RateLimitedPriceSeriesProvider>(
            prices, engine_cfg.provider_max_requests_per_second);
    }

    auto costs = std::make_shared<execution::MapCostProfileStore>(config.getCostProfiles());

    auto pairs = std::make_shared<data::StaticPairAnalyticsProvider>();
    for (const auto& pair : config.getPairs()) {
        pairs->setPair(pair);
    }

    auto engine = std::make_unique<backtest::BacktestEngine>(prices, costs, engine_cfg, nullptr, pairs);
    for (const auto& id : engine->strategies().getStrategyIds()) {
        engine->setStrategyParameters(id, config.getStrategyParameters(id));
    }
    for (const auto& kv : config.getPairSymbols()) {
        engine->setPairSymbol(kv.first, kv.second);
    }
    return engine;
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions opts;
    try {
        opts = parseArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        printUsage();
        return 2;
    }
    if (opts.mode.empty()) {
        printUsage();
        return argc > 1 ? 0 : 2;
    }

    try {
        auto& config = Config::getInstance();
        config.load(opts.config_path);
        auto engine_cfg = config.getEngineConfig();

        Logger::getInstance().initialize(engine_cfg.log_dir, opts.json_mode ? "warn" : engine_cfg.log_level);
        LOG_INFO("StratLab backtest engine starting ({})", opts.mode);

        if (!opts.data_dir.empty()) engine_cfg.data_dir = opts.data_dir;
        if (opts.initial_capital) engine_cfg.initial_capital = *opts.initial_capital;
        if (opts.years) engine_cfg.years = *opts.years;
        if (opts.enforce_buy_first) engine_cfg.enforce_buy_first = *opts.enforce_buy_first;

        auto engine = buildEngine(config, engine_cfg);

        if (opts.mode == "list") {
            for (const auto& s : engine->strategies().getStrategies()) {
                const auto info = s->getInfo();
                std::cout << std::left << std::setw(22) << info.id << std::setw(30) << info.name
                          << info.category << " / " << info.risk_level << "\n";
            }
            return 0;
        }

        if (opts.mode == "backtest") {
            const auto result = engine->runBacktest(opts.symbol, opts.strategy_id, engine_cfg.initial_capital,
                                                    engine_cfg.years, engine_cfg.enforce_buy_first);
            if (opts.json_mode) {
                std::cout << backtest::toJson(result).dump(2) << "\n";
            } else {
                printResult(result);
            }
            return 0;
        }

        if (opts.mode == "compare") {
            const auto comparison = engine->compareStrategies(opts.symbol, engine_cfg.initial_capital,
                                                              engine_cfg.years, engine_cfg.enforce_buy_first);
            if (opts.json_mode) {
                std::cout << backtest::toJson(comparison, opts.include_series).dump(2) << "\n";
            } else {
                printComparison(comparison);
            }
            return 0;
        }

        const std::vector<double> capitals = opts.capitals.empty() ? engine_cfg.sweep_capitals : opts.capitals;
        const auto sweep = engine->sweepCapital(opts.symbol, opts.strategy_id, capitals, engine_cfg.years);
        if (opts.json_mode) {
            std::cout << backtest::toJson(sweep).dump(2) << "\n";
        } else {
            printSweep(sweep);
        }
        return 0;

    } catch (const BacktestError& e) {
        LOG_ERROR("Backtest failed: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
