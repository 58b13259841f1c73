#include "analytics/PairStatistics.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>
#include <map>

namespace stratlab {
namespace analytics {

namespace {
struct OlsFit {
    double alpha = 0.0;
    double beta = 0.0;
    double beta_stderr = 0.0;
    bool valid = false;
};

OlsFit fitOls(const std::vector<double>& y, const std::vector<double>& x) {
    OlsFit fit;
    const size_t n = std::min(x.size(), y.size());
    if (n < 3) return fit;

    double mean_x = 0.0, mean_y = 0.0;
    for (size_t i = 0; i < n; ++i) {
        mean_x += x[i];
        mean_y += y[i];
    }
    mean_x /= n;
    mean_y /= n;

    double sxx = 0.0, sxy = 0.0;
    for (size_t i = 0; i < n; ++i) {
        sxx += (x[i] - mean_x) * (x[i] - mean_x);
        sxy += (x[i] - mean_x) * (y[i] - mean_y);
    }
    if (sxx < 1e-12) return fit;

    fit.beta = sxy / sxx;
    fit.alpha = mean_y - fit.beta * mean_x;

    double sse = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double residual = y[i] - (fit.alpha + fit.beta * x[i]);
        sse += residual * residual;
    }
    const double sigma_sq = sse / static_cast<double>(n - 2);
    fit.beta_stderr = std::sqrt(sigma_sq / sxx);
    fit.valid = true;
    return fit;
}
}

std::pair<PriceSeries, PriceSeries> PairStatistics::alignByDate(const PriceSeries& primary,
                                                                const PriceSeries& secondary) {
    std::map<long long, const PriceBar*> secondary_by_day;
    for (const auto& bar : secondary) {
        secondary_by_day[bar.date.toDays()] = &bar;
    }

    PriceSeries a, b;
    a.reserve(primary.size());
    b.reserve(primary.size());
    for (const auto& bar : primary) {
        auto it = secondary_by_day.find(bar.date.toDays());
        if (it == secondary_by_day.end()) continue;
        a.push_back(bar);
        b.push_back(*it->second);
    }
    return {std::move(a), std::move(b)};
}

double PairStatistics::pearsonCorrelation(const std::vector<double>& a, const std::vector<double>& b) {
    const size_t n = std::min(a.size(), b.size());
    if (n < 2) return 0.0;

    double mean_a = 0.0, mean_b = 0.0;
    for (size_t i = 0; i < n; ++i) {
        mean_a += a[i];
        mean_b += b[i];
    }
    mean_a /= n;
    mean_b /= n;

    double cov = 0.0, var_a = 0.0, var_b = 0.0;
    for (size_t i = 0; i < n; ++i) {
        cov += (a[i] - mean_a) * (b[i] - mean_b);
        var_a += (a[i] - mean_a) * (a[i] - mean_a);
        var_b += (b[i] - mean_b) * (b[i] - mean_b);
    }
    if (var_a < 1e-12 || var_b < 1e-12) return 0.0;
    return cov / std::sqrt(var_a * var_b);
}

double PairStatistics::hedgeRatio(const std::vector<double>& a, const std::vector<double>& b) {
    const auto fit = fitOls(a, b);
    return fit.valid ? fit.beta : 1.0;
}

std::optional<double> PairStatistics::halfLife(const std::vector<double>& spread) {
    if (spread.size() < 3) return std::nullopt;

    std::vector<double> lag(spread.begin(), spread.end() - 1);
    std::vector<double> delta;
    delta.reserve(lag.size());
    for (size_t i = 1; i < spread.size(); ++i) {
        delta.push_back(spread[i] - spread[i - 1]);
    }

    const auto fit = fitOls(delta, lag);
    if (!fit.valid || fit.beta >= 0.0) return std::nullopt;
    return -std::log(2.0) / fit.beta;
}

double PairStatistics::adfStatistic(const std::vector<double>& series) {
    if (series.size() < 20) return 0.0;

    std::vector<double> lag(series.begin(), series.end() - 1);
    std::vector<double> delta;
    delta.reserve(lag.size());
    for (size_t i = 1; i < series.size(); ++i) {
        delta.push_back(series[i] - series[i - 1]);
    }

    const auto fit = fitOls(delta, lag);
    if (!fit.valid || fit.beta_stderr < 1e-12) return 0.0;
    return fit.beta / fit.beta_stderr;
}

std::vector<double> PairStatistics::spread(const std::vector<double>& a, const std::vector<double>& b,
                                           double ratio) {
    const size_t n = std::min(a.size(), b.size());
    std::vector<double> out;
    out.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        out.push_back(a[i] - ratio * b[i]);
    }
    return out;
}

std::vector<double> PairStatistics::ratio(const std::vector<double>& a, const std::vector<double>& b) {
    const size_t n = std::min(a.size(), b.size());
    std::vector<double> out;
    out.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        out.push_back(b[i] != 0.0 ? a[i] / b[i] : 0.0);
    }
    return out;
}

PairAnalytics PairStatistics::analyze(const std::string& primary_symbol, const PriceSeries& primary,
                                      const std::string& secondary_symbol, const PriceSeries& secondary) {
    PairAnalytics result;
    result.primary = primary_symbol;
    result.secondary = secondary_symbol;

    const auto aligned = alignByDate(primary, secondary);
    const auto a = TechnicalIndicators::extractClosePrices(aligned.first);
    const auto b = TechnicalIndicators::extractClosePrices(aligned.second);
    if (a.size() < 20) {
        LOG_WARN("Pair {}/{}: only {} common bars, treating as non-stationary",
                 primary_symbol, secondary_symbol, a.size());
        return result;
    }

    result.pearson_correlation = pearsonCorrelation(a, b);
    result.optimal_ratio = hedgeRatio(a, b);

    const auto residual = spread(a, b, result.optimal_ratio);
    const double adf = adfStatistic(residual);
    result.is_stationary_pair = adf < kAdfCritical5Pct;
    result.cointegration_score = std::max(0.0, std::min(1.0, adf / kAdfCritical1Pct));
    if (result.is_stationary_pair) {
        result.half_life = halfLife(residual);
    }

    LOG_INFO("Pair {}/{}: corr={:.3f} ratio={:.4f} adf={:.3f} stationary={}",
             primary_symbol, secondary_symbol, result.pearson_correlation,
             result.optimal_ratio, adf, result.is_stationary_pair);
    return result;
}

} // namespace analytics
} // namespace stratlab
