#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "common/CancellationToken.h"
#include "common/Types.h"
#include "data/IPairAnalyticsProvider.h"
#include "data/IPriceSeriesProvider.h"
#include "engine/EngineConfig.h"
#include "execution/CostModel.h"
#include "strategy/StrategyManager.h"

namespace stratlab {
namespace backtest {

// Entry point for single runs, strategy comparisons and capital sweeps
class BacktestEngine {
public:
    BacktestEngine(std::shared_ptr<data::IPriceSeriesProvider> prices,
                   std::shared_ptr<execution::ICostProfileStore> costs,
                   engine::EngineConfig config = engine::EngineConfig(),
                   std::shared_ptr<strategy::StrategyManager> strategies = nullptr,
                   std::shared_ptr<data::IPairAnalyticsProvider> pairs = nullptr);

    // Provider errors (SymbolNotFoundError, DataUnavailableError), malformed series
    // and unknown strategy ids propagate. Too little data and non-stationary pairs
    // come back as a result with a status and a note.
    BacktestResult runBacktest(const std::string& symbol, const std::string& strategy_id,
                               double capital, int years, bool enforce_buy_first);

    ComparisonResult compareStrategies(const std::string& symbol, double capital, int years,
                                       bool enforce_buy_first);

    SweepResult sweepCapital(const std::string& symbol, const std::string& strategy_id,
                             const std::vector<double>& capitals, int years);

    void setStrategyParameters(const std::string& strategy_id, const strategy::StrategyParameters& params);
    strategy::StrategyParameters getStrategyParameters(const std::string& strategy_id) const;

    // Secondary instrument used by pair strategies when trading `primary`
    void setPairSymbol(const std::string& primary, const std::string& secondary);

    // [start, end] window covering `years` calendar years up to the as-of date
    std::pair<Date, Date> dateRange(int years) const;

    const engine::EngineConfig& config() const { return config_; }
    const strategy::StrategyManager& strategies() const { return *strategies_; }

private:
    struct PairInputs {
        PriceSeries secondary;
        std::optional<PairAnalytics> analytics;
    };

    // Runs a prepared series; converts recoverable errors into status results
    BacktestResult runPrepared(const std::string& symbol,
                               const std::shared_ptr<strategy::IStrategy>& strategy,
                               const PriceSeries& bars, const PairInputs* pair,
                               double capital, bool enforce_buy_first,
                               const CancellationToken* cancel) const;

    std::string secondarySymbolFor(const std::string& symbol, const strategy::StrategyParameters& params) const;
    std::optional<PairInputs> loadPairInputs(const std::string& symbol, const PriceSeries& bars,
                                             const std::string& secondary, const Date& start, const Date& end);

    std::vector<std::shared_ptr<strategy::IStrategy>> enabledStrategies() const;

    static BacktestResult statusResult(const std::string& symbol, const strategy::StrategyInfo& info,
                                       ResultStatus status, const std::string& note,
                                       const PriceSeries& bars, double capital, bool enforce_buy_first);

    std::shared_ptr<data::IPriceSeriesProvider> prices_;
    std::shared_ptr<execution::ICostProfileStore> costs_;
    engine::EngineConfig config_;
    std::shared_ptr<strategy::StrategyManager> strategies_;
    std::shared_ptr<data::IPairAnalyticsProvider> pairs_;

    std::map<std::string, strategy::StrategyParameters> parameters_;
    std::map<std::string, std::string> pair_symbols_;
};

} // namespace backtest
} // namespace stratlab
