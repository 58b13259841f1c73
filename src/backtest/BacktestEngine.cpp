#include "backtest/BacktestEngine.h"
#include "analytics/PairStatistics.h"
#include "analytics/PerformanceAnalytics.h"
#include "analytics/SeasonalAnalyzer.h"
#include "backtest/StrategyComparator.h"
#include "backtest/TradeSimulator.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <stdexcept>

namespace stratlab {
namespace backtest {

BacktestEngine::BacktestEngine(std::shared_ptr<data::IPriceSeriesProvider> prices,
                               std::shared_ptr<execution::ICostProfileStore> costs,
                               engine::EngineConfig config,
                               std::shared_ptr<strategy::StrategyManager> strategies,
                               std::shared_ptr<data::IPairAnalyticsProvider> pairs)
    : prices_(std::move(prices))
    , costs_(std::move(costs))
    , config_(std::move(config))
    , strategies_(std::move(strategies))
    , pairs_(std::move(pairs))
{
    if (!prices_) {
        throw std::invalid_argument("BacktestEngine requires a price series provider");
    }
    if (!costs_) {
        costs_ = std::make_shared<execution::MapCostProfileStore>();
    }
    if (!strategies_) {
        strategies_ = strategy::StrategyManager::createDefault();
    }
}

void BacktestEngine::setStrategyParameters(const std::string& strategy_id,
                                           const strategy::StrategyParameters& params) {
    parameters_[strategy::StrategyManager::normalizeStrategyId(strategy_id)] = params;
}

strategy::StrategyParameters BacktestEngine::getStrategyParameters(const std::string& strategy_id) const {
    const std::string id = strategy::StrategyManager::normalizeStrategyId(strategy_id);
    auto it = parameters_.find(id);
    if (it != parameters_.end()) return it->second;
    return strategy::defaultParametersFor(id);
}

void BacktestEngine::setPairSymbol(const std::string& primary, const std::string& secondary) {
    pair_symbols_[primary] = secondary;
}

std::pair<Date, Date> BacktestEngine::dateRange(int years) const {
    if (years <= 0) {
        throw std::invalid_argument("years must be positive");
    }
    const Date end = config_.as_of ? *config_.as_of : Date::today();
    Date start(end.year - years, end.month, end.day);
    if (!start.isValid()) {
        start.day -= 1;   // Feb 29 into a non-leap year
    }
    return {start, end};
}

std::string BacktestEngine::secondarySymbolFor(const std::string& symbol,
                                               const strategy::StrategyParameters& params) const {
    if (!params.pair.secondary_symbol.empty()) return params.pair.secondary_symbol;
    auto it = pair_symbols_.find(symbol);
    return (it != pair_symbols_.end()) ? it->second : std::string();
}

std::optional<BacktestEngine::PairInputs> BacktestEngine::loadPairInputs(
    const std::string& symbol, const PriceSeries& bars, const std::string& secondary,
    const Date& start, const Date& end) {
    if (secondary.empty()) return std::nullopt;

    PairInputs inputs;
    inputs.secondary = prices_->getPriceSeries(secondary, start, end);
    TradeSimulator::validateSeries(inputs.secondary);
    if (pairs_) {
        inputs.analytics = pairs_->getPairAnalytics(symbol, secondary);
    }
    if (!inputs.analytics) {
        inputs.analytics = analytics::PairStatistics::analyze(symbol, bars, secondary, inputs.secondary);
    }
    return inputs;
}

std::vector<std::shared_ptr<strategy::IStrategy>> BacktestEngine::enabledStrategies() const {
    if (config_.enabled_strategies.empty()) {
        return strategies_->getStrategies();
    }
    std::vector<std::shared_ptr<strategy::IStrategy>> out;
    for (const auto& id : config_.enabled_strategies) {
        out.push_back(strategies_->requireStrategy(id));
    }
    return out;
}

BacktestResult BacktestEngine::statusResult(const std::string& symbol, const strategy::StrategyInfo& info,
                                            ResultStatus status, const std::string& note,
                                            const PriceSeries& bars, double capital, bool enforce_buy_first) {
    BacktestResult result;
    result.symbol = symbol;
    result.strategy_id = info.id;
    result.strategy_name = info.name;
    result.status = status;
    result.notes.push_back(note);
    result.initial_capital = capital;
    result.final_value = capital;
    result.enforce_buy_first = enforce_buy_first;
    if (!bars.empty()) {
        result.start_date = bars.front().date;
        result.end_date = bars.back().date;
        result.equity_curve.reserve(bars.size());
        for (const auto& bar : bars) {
            result.equity_curve.emplace_back(bar.date, capital);
        }
    }
    analytics::PerformanceAnalytics::summarize(result);
    return result;
}

BacktestResult BacktestEngine::runPrepared(const std::string& symbol,
                                           const std::shared_ptr<strategy::IStrategy>& strategy,
                                           const PriceSeries& bars, const PairInputs* pair,
                                           double capital, bool enforce_buy_first,
                                           const CancellationToken* cancel) const {
    const auto info = strategy->getInfo();
    std::vector<std::string> notes;

    SimulationRequest request;
    request.symbol = symbol;
    request.bars = bars;
    request.initial_capital = capital;
    request.enforce_buy_first = enforce_buy_first;
    request.fractional_quantity = config_.fractional_quantity;
    request.params = strategy->calibrate(getStrategyParameters(info.id), bars, notes);
    request.cost_profile = costs_->getCostProfile(symbol);
    request.cancel = cancel;
    if (pair != nullptr) {
        request.secondary = pair->secondary;
        request.pair = pair->analytics;
    }

    BacktestResult result;
    try {
        result = TradeSimulator(strategy).run(request);
    } catch (const InsufficientDataError& e) {
        LOG_WARN("[{}|{}] insufficient data: {}", symbol, info.id, e.what());
        result = statusResult(symbol, info, ResultStatus::INSUFFICIENT_DATA, e.what(),
                              bars, capital, enforce_buy_first);
    } catch (const NonStationaryPairError& e) {
        LOG_WARN("[{}|{}] {}", symbol, info.id, e.what());
        result = statusResult(symbol, info, ResultStatus::NON_STATIONARY_PAIR, e.what(),
                              bars, capital, enforce_buy_first);
    } catch (const BacktestCancelledError& e) {
        LOG_WARN("[{}|{}] cancelled", symbol, info.id);
        result = statusResult(symbol, info, ResultStatus::CANCELLED,
                              "Cancelled before completion (comparison budget elapsed)",
                              bars, capital, enforce_buy_first);
    }

    result.notes.insert(result.notes.begin(), notes.begin(), notes.end());

    if (info.id == "monthly_seasonal") {
        result.favorable_months = request.params.seasonal.favorable_months;
        result.unfavorable_months = request.params.seasonal.unfavorable_months;
        result.monthly_stats = analytics::SeasonalAnalyzer::monthlyStats(bars);
    }
    return result;
}

BacktestResult BacktestEngine::runBacktest(const std::string& symbol, const std::string& strategy_id,
                                           double capital, int years, bool enforce_buy_first) {
    if (capital <= 0.0) {
        throw std::invalid_argument("capital must be positive");
    }
    const auto strategy = strategies_->requireStrategy(strategy_id);
    const auto range = dateRange(years);

    LOG_INFO("runBacktest {} {} capital={:.2f} years={} buy_first={}",
             symbol, strategy->getInfo().id, capital, years, enforce_buy_first);

    const PriceSeries bars = prices_->getPriceSeries(symbol, range.first, range.second);

    std::optional<PairInputs> pair;
    if (strategy->requiresPair()) {
        const auto params = getStrategyParameters(strategy->getInfo().id);
        pair = loadPairInputs(symbol, bars, secondarySymbolFor(symbol, params), range.first, range.second);
    }

    return runPrepared(symbol, strategy, bars, pair ? &*pair : nullptr, capital, enforce_buy_first, nullptr);
}

ComparisonResult BacktestEngine::compareStrategies(const std::string& symbol, double capital, int years,
                                                   bool enforce_buy_first) {
    if (capital <= 0.0) {
        throw std::invalid_argument("capital must be positive");
    }
    const auto range = dateRange(years);

    ComparisonResult comparison;
    comparison.symbol = symbol;
    comparison.capital = capital;
    comparison.years = years;
    comparison.enforce_buy_first = enforce_buy_first;

    // Fetch once, before fan-out. Errors in the primary series fail the whole comparison.
    const PriceSeries bars = prices_->getPriceSeries(symbol, range.first, range.second);
    TradeSimulator::validateSeries(bars);

    std::map<std::string, PairInputs> pair_inputs;
    std::map<std::string, std::string> pair_failures;

    struct Job {
        std::shared_ptr<strategy::IStrategy> strategy;
        const PairInputs* pair = nullptr;
        std::string pair_failure;
    };
    std::vector<Job> jobs;

    for (const auto& strategy : enabledStrategies()) {
        Job job;
        job.strategy = strategy;
        if (strategy->requiresPair()) {
            const std::string secondary = secondarySymbolFor(symbol, getStrategyParameters(strategy->getInfo().id));
            if (secondary.empty()) {
                LOG_INFO("Skipping {} for {}: no paired instrument configured", strategy->getInfo().id, symbol);
                continue;
            }
            auto it = pair_inputs.find(secondary);
            if (it == pair_inputs.end() && pair_failures.find(secondary) == pair_failures.end()) {
                try {
                    auto inputs = loadPairInputs(symbol, bars, secondary, range.first, range.second);
                    it = pair_inputs.emplace(secondary, std::move(*inputs)).first;
                } catch (const BacktestError& e) {
                    LOG_WARN("compareStrategies {}: paired instrument {} unusable: {}", symbol, secondary, e.what());
                    pair_failures[secondary] = "Paired instrument " + secondary + " unavailable: " + e.what();
                }
            }
            if (it != pair_inputs.end()) {
                job.pair = &it->second;
            } else {
                job.pair_failure = pair_failures[secondary];
            }
        }
        jobs.push_back(job);
    }

    std::vector<StrategyComparator::Task> tasks;
    tasks.reserve(jobs.size());
    for (const auto& job : jobs) {
        tasks.push_back([this, &symbol, &bars, job, capital, enforce_buy_first](const CancellationToken& token) {
            if (!job.pair_failure.empty()) {
                return statusResult(symbol, job.strategy->getInfo(), ResultStatus::PAIR_DATA_UNAVAILABLE,
                                    job.pair_failure, bars, capital, enforce_buy_first);
            }
            return runPrepared(symbol, job.strategy, bars, job.pair, capital, enforce_buy_first, &token);
        });
    }

    StrategyComparator comparator(static_cast<size_t>(std::max(config_.worker_threads, 0)));
    LOG_INFO("compareStrategies {}: {} strategies on {} worker(s)", symbol, tasks.size(),
             std::min(comparator.workerThreads(), tasks.size()));

    bool timed_out = false;
    comparison.results = comparator.runAll(tasks, std::chrono::milliseconds(config_.compare_budget_ms), &timed_out);
    comparison.cancelled = timed_out;

    StrategyComparator::rank(comparison.results);
    comparison.best_strategy = StrategyComparator::bestStrategy(comparison.results);

    if (comparison.best_strategy.empty()) {
        LOG_WARN("compareStrategies {}: no strategy completed", symbol);
    } else {
        LOG_INFO("compareStrategies {}: best strategy {} ({:+.2f}%)", symbol, comparison.best_strategy,
                 comparison.results.front().total_return_pct);
    }
    return comparison;
}

SweepResult BacktestEngine::sweepCapital(const std::string& symbol, const std::string& strategy_id,
                                         const std::vector<double>& capitals, int years) {
    const auto strategy = strategies_->requireStrategy(strategy_id);
    for (double c : capitals) {
        if (c <= 0.0) {
            throw std::invalid_argument("capital amounts must be positive");
        }
    }
    const auto range = dateRange(years);

    SweepResult sweep;
    sweep.symbol = symbol;
    sweep.strategy_id = strategy->getInfo().id;
    sweep.years = years;
    if (capitals.empty()) return sweep;

    const PriceSeries bars = prices_->getPriceSeries(symbol, range.first, range.second);
    std::optional<PairInputs> pair;
    if (strategy->requiresPair()) {
        pair = loadPairInputs(symbol, bars, secondarySymbolFor(symbol, getStrategyParameters(sweep.strategy_id)),
                              range.first, range.second);
    }
    const PairInputs* pair_ptr = pair ? &*pair : nullptr;

    std::vector<StrategyComparator::Task> tasks;
    tasks.reserve(capitals.size());
    for (double capital : capitals) {
        tasks.push_back([this, &symbol, &strategy, &bars, pair_ptr, capital](const CancellationToken& token) {
            return runPrepared(symbol, strategy, bars, pair_ptr, capital, config_.enforce_buy_first, &token);
        });
    }

    StrategyComparator comparator(static_cast<size_t>(std::max(config_.worker_threads, 0)));
    const auto results = comparator.runAll(tasks);

    for (const auto& r : results) {
        CalculatorRow row;
        row.capital = r.initial_capital;
        row.final_value = r.final_value;
        row.profit = r.final_value - r.initial_capital;
        row.total_return_pct = r.total_return_pct;
        row.win_rate_pct = r.win_rate_pct;
        row.total_trades = r.total_trades;
        sweep.rows.push_back(row);
    }
    LOG_INFO("sweepCapital {} {}: {} capital levels", symbol, sweep.strategy_id, sweep.rows.size());
    return sweep;
}

} // namespace backtest
} // namespace stratlab
