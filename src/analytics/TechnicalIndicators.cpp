#include "analytics/TechnicalIndicators.h"
#include <cmath>
#include <algorithm>
#include <numeric>

namespace stratlab {
namespace analytics {

double TechnicalIndicators::calculateRSI(const std::vector<double>& prices, int period) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period + 1)) {
        return 50.0;
    }

    double gain_sum = 0.0;
    double loss_sum = 0.0;
    for (size_t i = prices.size() - period; i < prices.size(); ++i) {
        const double change = prices[i] - prices[i - 1];
        if (change > 0) gain_sum += change;
        else loss_sum += -change;
    }

    const double avg_gain = gain_sum / period;
    const double avg_loss = loss_sum / period;

    if (avg_loss < 1e-12) {
        return (avg_gain < 1e-12) ? 50.0 : 100.0;
    }

    const double rs = avg_gain / avg_loss;
    return 100.0 - (100.0 / (1.0 + rs));
}

std::vector<TechnicalIndicators::MACDResult> TechnicalIndicators::calculateMACDSeries(
    const std::vector<double>& prices,
    int fast,
    int slow,
    int signal_period
) {
    std::vector<MACDResult> series;
    if (fast <= 0 || slow <= 0 || signal_period <= 0) return series;

    const auto fast_ema_vec = calculateEMAVector(prices, fast);
    const auto slow_ema_vec = calculateEMAVector(prices, slow);
    if (fast_ema_vec.empty() || slow_ema_vec.empty()) return series;

    // Both vectors end at the latest price; align from the back.
    const size_t min_size = std::min(fast_ema_vec.size(), slow_ema_vec.size());
    const size_t offset_fast = fast_ema_vec.size() - min_size;
    const size_t offset_slow = slow_ema_vec.size() - min_size;

    std::vector<double> macd_line;
    macd_line.reserve(min_size);
    for (size_t i = 0; i < min_size; ++i) {
        macd_line.push_back(fast_ema_vec[offset_fast + i] - slow_ema_vec[offset_slow + i]);
    }

    const auto signal_line = calculateEMAVector(macd_line, signal_period);
    if (signal_line.empty()) return series;

    const size_t offset_macd = macd_line.size() - signal_line.size();
    series.reserve(signal_line.size());
    for (size_t i = 0; i < signal_line.size(); ++i) {
        MACDResult r;
        r.macd = macd_line[offset_macd + i];
        r.signal = signal_line[i];
        r.histogram = r.macd - r.signal;
        series.push_back(r);
    }
    return series;
}

TechnicalIndicators::MACDResult TechnicalIndicators::calculateMACD(
    const std::vector<double>& prices,
    int fast,
    int slow,
    int signal_period
) {
    const auto series = calculateMACDSeries(prices, fast, slow, signal_period);
    if (series.empty()) {
        return MACDResult();
    }
    return series.back();
}

TechnicalIndicators::BollingerBands TechnicalIndicators::calculateBollingerBands(
    const std::vector<double>& prices,
    double current_price,
    int period,
    double std_dev_mult
) {
    BollingerBands result;

    if (period <= 1 || prices.size() < static_cast<size_t>(period)) {
        return result;
    }

    std::vector<double> recent_prices(prices.end() - period, prices.end());

    result.middle = calculateSMA(recent_prices, period);
    const double std_dev = calculateStandardDeviation(recent_prices, result.middle);

    result.upper = result.middle + (std_dev * std_dev_mult);
    result.lower = result.middle - (std_dev * std_dev_mult);
    result.width = result.upper - result.lower;

    if (result.width > 1e-12) {
        result.percent_b = (current_price - result.lower) / result.width;
    } else {
        result.percent_b = 0.5;
    }

    return result;
}

double TechnicalIndicators::calculateATR(const std::vector<PriceBar>& bars, int period) {
    if (period <= 0 || bars.size() < static_cast<size_t>(period + 1)) {
        return 0.0;
    }

    std::vector<double> tr_values;
    tr_values.reserve(bars.size());

    for (size_t i = 1; i < bars.size(); ++i) {
        const auto& current = bars[i];
        const auto& prev = bars[i - 1];

        const double tr1 = current.high - current.low;
        const double tr2 = std::abs(current.high - prev.close);
        const double tr3 = std::abs(current.low - prev.close);

        tr_values.push_back(std::max({tr1, tr2, tr3}));
    }

    double atr = 0.0;
    for (int i = 0; i < period; ++i) atr += tr_values[i];
    atr /= period;

    for (size_t i = period; i < tr_values.size(); ++i) {
        atr = ((atr * (period - 1)) + tr_values[i]) / period;
    }

    return atr;
}

double TechnicalIndicators::calculateEMA(const std::vector<double>& prices, int period) {
    if (prices.empty()) return 0.0;
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) return prices.back();

    const auto values = calculateEMAVector(prices, period);
    return values.back();
}

std::vector<double> TechnicalIndicators::calculateEMAVector(
    const std::vector<double>& prices,
    int period
) {
    std::vector<double> ema_values;
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) return ema_values;

    const double multiplier = 2.0 / (period + 1.0);

    double ema = 0.0;
    for (int i = 0; i < period; ++i) ema += prices[i];
    ema /= period;

    ema_values.reserve(prices.size() - period + 1);
    ema_values.push_back(ema);

    for (size_t i = period; i < prices.size(); ++i) {
        ema = (prices[i] - ema) * multiplier + ema;
        ema_values.push_back(ema);
    }

    return ema_values;
}

double TechnicalIndicators::calculateSMA(const std::vector<double>& prices, int period) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) return 0.0;

    double sum = 0.0;
    for (size_t i = prices.size() - period; i < prices.size(); ++i) {
        sum += prices[i];
    }

    return sum / period;
}

double TechnicalIndicators::calculateSMAAt(const std::vector<double>& prices, size_t end_index, int period) {
    if (period <= 0 || end_index >= prices.size() || end_index + 1 < static_cast<size_t>(period)) {
        return 0.0;
    }

    double sum = 0.0;
    for (size_t i = end_index + 1 - period; i <= end_index; ++i) {
        sum += prices[i];
    }
    return sum / period;
}

double TechnicalIndicators::calculateAnnualizedVolatility(const std::vector<double>& prices, int lookback) {
    if (lookback <= 1 || prices.size() < static_cast<size_t>(lookback + 1)) return 0.0;

    std::vector<double> returns;
    returns.reserve(lookback);
    for (size_t i = prices.size() - lookback; i < prices.size(); ++i) {
        if (prices[i - 1] <= 0.0) continue;
        returns.push_back(prices[i] / prices[i - 1] - 1.0);
    }
    if (returns.size() < 2) return 0.0;

    const double mean = calculateMean(returns);
    return calculateStandardDeviation(returns, mean) * std::sqrt(252.0) * 100.0;
}

double TechnicalIndicators::highest(const std::vector<double>& values, int lookback) {
    if (values.empty() || lookback <= 0) return 0.0;
    const size_t n = std::min(values.size(), static_cast<size_t>(lookback));
    return *std::max_element(values.end() - n, values.end());
}

double TechnicalIndicators::lowest(const std::vector<double>& values, int lookback) {
    if (values.empty() || lookback <= 0) return 0.0;
    const size_t n = std::min(values.size(), static_cast<size_t>(lookback));
    return *std::min_element(values.end() - n, values.end());
}

std::vector<double> TechnicalIndicators::extractClosePrices(const std::vector<PriceBar>& bars) {
    std::vector<double> prices;
    prices.reserve(bars.size());

    for (const auto& bar : bars) {
        prices.push_back(bar.close);
    }

    return prices;
}

double TechnicalIndicators::calculateStandardDeviation(
    const std::vector<double>& values,
    double mean
) {
    if (values.size() < 2) return 0.0;
    double sum_sq_diff = 0.0;
    for (double val : values) {
        sum_sq_diff += (val - mean) * (val - mean);
    }
    return std::sqrt(sum_sq_diff / (values.size() - 1));
}

double TechnicalIndicators::calculateMean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;

    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

} // namespace analytics
} // namespace stratlab
