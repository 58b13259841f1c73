#pragma once

#include "strategy/IStrategy.h"

namespace stratlab {
namespace strategy {

// Calendar rotation: long early in favorable months while above trend, flat otherwise.
// Exit on an unfavorable month is enforced by the risk manager's worst-month rule.
class MonthlySeasonalStrategy : public IStrategy {
public:
    StrategyInfo getInfo() const override;
    size_t warmupBars(const StrategyParameters& params) const override;
    Decision evaluate(const StrategyContext& context) const override;
    std::vector<int> unfavorableMonths(const StrategyParameters& params) const override;

    // Empty month sets are ranked from the series' average daily return per month
    StrategyParameters calibrate(const StrategyParameters& params, const PriceSeries& bars,
                                 std::vector<std::string>& notes) const override;

    // 1-based position of the bar among the trading days of its calendar month
    static int tradingDayOfMonth(const PriceSeries& bars, size_t index);
};

} // namespace strategy
} // namespace stratlab
