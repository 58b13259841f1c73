#pragma once

#include <optional>
#include <vector>
#include "common/Types.h"

namespace stratlab {
namespace analytics {

// Summary statistics of a finished run
class PerformanceAnalytics {
public:
    // Profit factor reported when there are winning trades and no losing ones
    static constexpr double kProfitFactorCap = 999.99;
    static constexpr double kTradingDaysPerYear = 252.0;

    // Fills every derived field of `result` from its ledger, equity curve,
    // initial capital and final value.
    static void summarize(BacktestResult& result);

    static double totalReturnPct(double initial, double final_value);
    static std::optional<double> annualReturnPct(double initial, double final_value,
                                                 const Date& start, const Date& end);
    // Most negative peak-to-trough decline in percent (<= 0)
    static double maxDrawdownPct(const std::vector<EquityPoint>& curve);
    static std::vector<double> dailyReturns(const std::vector<EquityPoint>& curve);
    static double sharpeRatio(const std::vector<double>& daily_returns);
    static double sortinoRatio(const std::vector<double>& daily_returns);
};

} // namespace analytics
} // namespace stratlab
