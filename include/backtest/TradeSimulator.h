#pragma once

#include <memory>
#include <optional>
#include <string>
#include "common/CancellationToken.h"
#include "common/Types.h"
#include "execution/CostModel.h"
#include "strategy/IStrategy.h"

namespace stratlab {
namespace backtest {

struct SimulationRequest {
    std::string symbol;
    PriceSeries bars;
    double initial_capital = 10000.0;
    bool enforce_buy_first = true;
    bool fractional_quantity = true;
    strategy::StrategyParameters params;
    execution::CostProfile cost_profile = execution::CostProfile::zero();

    // Pair policies only; aligned to `bars` by date inside run()
    PriceSeries secondary;
    std::optional<PairAnalytics> pair;

    const CancellationToken* cancel = nullptr;
};

// Bar-by-bar walk of one policy over one series. All-in sizing, one position
// at a time, fills at the bar close.
class TradeSimulator {
public:
    explicit TradeSimulator(std::shared_ptr<const strategy::IStrategy> strategy);

    // Throws MalformedPriceSeriesError, InsufficientDataError, NonStationaryPairError,
    // DataUnavailableError (pair without a secondary series) and BacktestCancelledError.
    BacktestResult run(const SimulationRequest& request) const;

    // Throws MalformedPriceSeriesError on non-finite or non-positive prices,
    // high < low, or dates that are not strictly increasing
    static void validateSeries(const PriceSeries& bars);

    // Minimum number of bars for a run
    size_t requiredBars(const strategy::StrategyParameters& params) const;

private:
    std::shared_ptr<const strategy::IStrategy> strategy_;
};

} // namespace backtest
} // namespace stratlab
