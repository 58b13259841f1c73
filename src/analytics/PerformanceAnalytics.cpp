#include "analytics/PerformanceAnalytics.h"
#include "analytics/TechnicalIndicators.h"

#include <algorithm>
#include <cmath>

namespace stratlab {
namespace analytics {

double PerformanceAnalytics::totalReturnPct(double initial, double final_value) {
    if (initial <= 0.0) return 0.0;
    return (final_value / initial - 1.0) * 100.0;
}

std::optional<double> PerformanceAnalytics::annualReturnPct(double initial, double final_value,
                                                            const Date& start, const Date& end) {
    const double years = static_cast<double>(Date::daysBetween(start, end)) / 365.25;
    if (years <= 0.0 || initial <= 0.0) return std::nullopt;
    if (final_value <= 0.0) return -100.0;
    return (std::pow(final_value / initial, 1.0 / years) - 1.0) * 100.0;
}

double PerformanceAnalytics::maxDrawdownPct(const std::vector<EquityPoint>& curve) {
    double peak = 0.0;
    double worst = 0.0;
    for (const auto& point : curve) {
        peak = std::max(peak, point.portfolio_value);
        if (peak <= 0.0) continue;
        const double drawdown = (point.portfolio_value - peak) / peak * 100.0;
        worst = std::min(worst, drawdown);
    }
    return worst;
}

std::vector<double> PerformanceAnalytics::dailyReturns(const std::vector<EquityPoint>& curve) {
    std::vector<double> returns;
    if (curve.size() < 2) return returns;
    returns.reserve(curve.size() - 1);
    for (size_t i = 1; i < curve.size(); ++i) {
        const double prev = curve[i - 1].portfolio_value;
        if (prev <= 0.0) continue;
        returns.push_back(curve[i].portfolio_value / prev - 1.0);
    }
    return returns;
}

double PerformanceAnalytics::sharpeRatio(const std::vector<double>& daily_returns) {
    if (daily_returns.size() < 2) return 0.0;
    const double mean = TechnicalIndicators::calculateMean(daily_returns);
    const double stdev = TechnicalIndicators::calculateStandardDeviation(daily_returns, mean);
    if (stdev < 1e-12) return 0.0;
    return mean / stdev * std::sqrt(kTradingDaysPerYear);
}

double PerformanceAnalytics::sortinoRatio(const std::vector<double>& daily_returns) {
    if (daily_returns.size() < 2) return 0.0;
    const double mean = TechnicalIndicators::calculateMean(daily_returns);

    double downside_sq = 0.0;
    for (double r : daily_returns) {
        const double d = std::min(r, 0.0);
        downside_sq += d * d;
    }
    const double downside_dev = std::sqrt(downside_sq / daily_returns.size());
    if (downside_dev < 1e-12) return 0.0;
    return mean / downside_dev * std::sqrt(kTradingDaysPerYear);
}

void PerformanceAnalytics::summarize(BacktestResult& result) {
    result.total_return_pct = totalReturnPct(result.initial_capital, result.final_value);
    result.annual_return_pct = annualReturnPct(result.initial_capital, result.final_value,
                                               result.start_date, result.end_date);
    result.max_drawdown_pct = maxDrawdownPct(result.equity_curve);

    result.total_trades = static_cast<int>(result.trade_ledger.size());
    result.closed_trades = 0;
    result.winning_trades = 0;
    result.losing_trades = 0;
    result.total_costs = 0.0;

    double gross_profit = 0.0;
    double gross_loss_abs = 0.0;
    for (const auto& trade : result.trade_ledger) {
        result.total_costs += trade.totalCosts();
        if (!trade.isClosing() || !trade.pnl) continue;
        result.closed_trades++;
        const double pnl = *trade.pnl;
        if (pnl > 0.0) {
            result.winning_trades++;
            gross_profit += pnl;
        } else if (pnl < 0.0) {
            result.losing_trades++;
            gross_loss_abs += -pnl;
        }
    }

    result.avg_win = (result.winning_trades > 0) ? gross_profit / result.winning_trades : 0.0;
    result.avg_loss = (result.losing_trades > 0) ? -gross_loss_abs / result.losing_trades : 0.0;

    if (result.closed_trades > 0) {
        result.win_rate_pct = 100.0 * result.winning_trades / result.closed_trades;
        if (gross_loss_abs > 1e-12) {
            result.profit_factor = std::min(gross_profit / gross_loss_abs, kProfitFactorCap);
        } else {
            result.profit_factor = (gross_profit > 0.0) ? kProfitFactorCap : 0.0;
        }
    } else {
        result.win_rate_pct.reset();
        result.profit_factor.reset();
    }

    result.risk_reward_ratio = (result.losing_trades > 0 && std::abs(result.avg_loss) > 1e-12)
        ? result.avg_win / std::abs(result.avg_loss)
        : 0.0;

    const auto returns = dailyReturns(result.equity_curve);
    result.sharpe_ratio = sharpeRatio(returns);
    result.sortino_ratio = sortinoRatio(returns);
}

} // namespace analytics
} // namespace stratlab
