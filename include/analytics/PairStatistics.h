#pragma once

#include <optional>
#include <utility>
#include <vector>
#include "common/Types.h"

namespace stratlab {
namespace analytics {

// Engle-Granger style statistics for a pair of price series
class PairStatistics {
public:
    // ADF critical value at 5% (constant, no trend)
    static constexpr double kAdfCritical5Pct = -2.86;
    static constexpr double kAdfCritical1Pct = -3.43;

    // Keeps only the dates present in both series, in ascending order
    static std::pair<PriceSeries, PriceSeries> alignByDate(const PriceSeries& primary,
                                                           const PriceSeries& secondary);

    static double pearsonCorrelation(const std::vector<double>& a, const std::vector<double>& b);

    // Slope of the OLS fit a = alpha + beta * b
    static double hedgeRatio(const std::vector<double>& a, const std::vector<double>& b);

    // AR(1) half-life of mean reversion: -ln(2) / beta from ds = alpha + beta * s_lag
    static std::optional<double> halfLife(const std::vector<double>& spread);

    // Dickey-Fuller t statistic of the lag coefficient (no augmentation lags)
    static double adfStatistic(const std::vector<double>& series);

    static std::vector<double> spread(const std::vector<double>& a, const std::vector<double>& b,
                                      double ratio);
    static std::vector<double> ratio(const std::vector<double>& a, const std::vector<double>& b);

    // Full analysis over two (unaligned) series
    static PairAnalytics analyze(const std::string& primary_symbol, const PriceSeries& primary,
                                 const std::string& secondary_symbol, const PriceSeries& secondary);
};

} // namespace analytics
} // namespace stratlab
