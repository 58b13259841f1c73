#pragma once

#include <vector>
#include "common/Types.h"

namespace stratlab {
namespace analytics {

// Indicators over a price window. Every function looks only at the values it is
// given, so callers pass the history up to and including the current bar.
class TechnicalIndicators {
public:
    // RSI with simple rolling averages of gains and losses over the last `period` changes.
    // 50 when there is not enough data, 100 when the window has no losses.
    static double calculateRSI(const std::vector<double>& prices, int period = 14);

    struct MACDResult {
        double macd;
        double signal;
        double histogram;

        MACDResult() : macd(0), signal(0), histogram(0) {}
    };
    static MACDResult calculateMACD(const std::vector<double>& prices,
                                    int fast = 12, int slow = 26, int signal_period = 9);
    // Aligned to the end of `prices`: back() is the latest bar. Empty when
    // prices.size() < slow + signal_period - 1.
    static std::vector<MACDResult> calculateMACDSeries(const std::vector<double>& prices,
                                                       int fast = 12, int slow = 26,
                                                       int signal_period = 9);

    struct BollingerBands {
        double upper;
        double middle;
        double lower;
        double width;
        double percent_b;   // 0 at the lower band, 1 at the upper band

        BollingerBands() : upper(0), middle(0), lower(0), width(0), percent_b(0) {}
    };
    static BollingerBands calculateBollingerBands(const std::vector<double>& prices,
                                                  double current_price,
                                                  int period = 20,
                                                  double std_dev_mult = 2.0);

    // Wilder-smoothed average true range
    static double calculateATR(const std::vector<PriceBar>& bars, int period = 14);

    // SMA-seeded exponential moving average
    static double calculateEMA(const std::vector<double>& prices, int period);
    static std::vector<double> calculateEMAVector(const std::vector<double>& prices, int period);

    // Mean of the last `period` values, 0 when there are fewer
    static double calculateSMA(const std::vector<double>& prices, int period);
    // Mean of prices[end_index - period + 1 .. end_index], 0 when the window does not fit
    static double calculateSMAAt(const std::vector<double>& prices, size_t end_index, int period);

    // Annualized standard deviation of daily returns over the last `lookback` changes, in percent
    static double calculateAnnualizedVolatility(const std::vector<double>& prices, int lookback = 20);

    // Extremes of the last `lookback` values
    static double highest(const std::vector<double>& values, int lookback);
    static double lowest(const std::vector<double>& values, int lookback);

    static std::vector<double> extractClosePrices(const std::vector<PriceBar>& bars);

    // Sample standard deviation (n - 1)
    static double calculateStandardDeviation(const std::vector<double>& values, double mean);
    static double calculateMean(const std::vector<double>& values);
};

} // namespace analytics
} // namespace stratlab
