#include "analytics/PerformanceAnalytics.h"
#include "TestSeries.h"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace stratlab;
using analytics::PerformanceAnalytics;
using testing::near;

namespace {
std::vector<EquityPoint> curveOf(const std::vector<double>& values) {
    std::vector<EquityPoint> curve;
    const auto bars = testing::makeBars(values);
    for (const auto& bar : bars) curve.emplace_back(bar.date, bar.close);
    return curve;
}

Trade closing(double pnl) {
    Trade t;
    t.type = TradeType::SELL_CLOSE;
    t.pnl = pnl;
    t.commission = 1.0;
    return t;
}

Trade opening() {
    Trade t;
    t.type = TradeType::BUY_OPEN;
    t.commission = 1.0;
    return t;
}
}

static void testReturns() {
    assert(near(PerformanceAnalytics::totalReturnPct(10000, 12500), 25.0));
    assert(near(PerformanceAnalytics::totalReturnPct(10000, 10000), 0.0));

    // Two calendar years of 365.25 days each, doubling
    const auto annual = PerformanceAnalytics::annualReturnPct(1000, 2000, Date(2020, 1, 1), Date(2020, 1, 1).addDays(731));
    assert(annual && std::abs(*annual - (std::sqrt(2.0) - 1.0) * 100.0) < 0.05);

    assert(!PerformanceAnalytics::annualReturnPct(1000, 2000, Date(2020, 1, 1), Date(2020, 1, 1)));
    assert(near(*PerformanceAnalytics::annualReturnPct(1000, 0, Date(2020, 1, 1), Date(2021, 1, 1)), -100.0));
    std::cout << "[TEST] Returns PASSED" << std::endl;
}

static void testDrawdown() {
    assert(near(PerformanceAnalytics::maxDrawdownPct(curveOf({100, 120, 90, 130, 104})), -25.0));
    assert(PerformanceAnalytics::maxDrawdownPct(curveOf({100, 101, 102})) == 0.0);
    assert(PerformanceAnalytics::maxDrawdownPct({}) == 0.0);
    std::cout << "[TEST] Drawdown PASSED" << std::endl;
}

static void testRatios() {
    const auto flat = PerformanceAnalytics::dailyReturns(curveOf({100, 100, 100, 100}));
    assert(flat.size() == 3);
    assert(PerformanceAnalytics::sharpeRatio(flat) == 0.0);
    assert(PerformanceAnalytics::sortinoRatio(flat) == 0.0);

    const std::vector<double> returns = {0.01, -0.01, 0.02, -0.005};
    const double mean = 0.00375;
    double ss = 0.0;
    for (double r : returns) ss += (r - mean) * (r - mean);
    const double stdev = std::sqrt(ss / 3.0);
    assert(near(PerformanceAnalytics::sharpeRatio(returns), mean / stdev * std::sqrt(252.0)));

    const double downside = std::sqrt((0.0001 + 0.000025) / 4.0);
    assert(near(PerformanceAnalytics::sortinoRatio(returns), mean / downside * std::sqrt(252.0)));

    // Only gains: no downside deviation
    assert(PerformanceAnalytics::sortinoRatio({0.01, 0.02, 0.01}) == 0.0);
    std::cout << "[TEST] Sharpe / Sortino PASSED" << std::endl;
}

static void testSummarize() {
    BacktestResult r;
    r.initial_capital = 1000.0;
    r.final_value = 1150.0;
    r.start_date = Date(2020, 1, 1);
    r.end_date = Date(2021, 1, 1);
    r.equity_curve = curveOf({1000, 1100, 1050, 1150});
    r.trade_ledger = {opening(), closing(200.0), opening(), closing(-50.0), opening(), closing(0.0)};
    analytics::PerformanceAnalytics::summarize(r);

    assert(r.total_trades == 6);
    assert(r.closed_trades == 3);
    assert(r.winning_trades == 1);
    assert(r.losing_trades == 1);
    assert(near(*r.win_rate_pct, 100.0 / 3.0));
    assert(near(r.avg_win, 200.0));
    assert(near(r.avg_loss, -50.0));
    assert(near(*r.profit_factor, 4.0));
    assert(near(r.risk_reward_ratio, 4.0));
    assert(near(r.total_costs, 6.0));
    assert(near(r.total_return_pct, 15.0));
    assert(r.max_drawdown_pct < 0.0);

    BacktestResult empty;
    empty.initial_capital = 1000.0;
    empty.final_value = 1000.0;
    empty.equity_curve = curveOf({1000, 1000});
    analytics::PerformanceAnalytics::summarize(empty);
    assert(!empty.win_rate_pct);
    assert(!empty.profit_factor);
    assert(empty.total_trades == 0);
    assert(empty.risk_reward_ratio == 0.0);
    std::cout << "[TEST] Summarize PASSED" << std::endl;
}

int main() {
    std::cout << "[TEST] Starting PerformanceAnalytics Test..." << std::endl;
    testReturns();
    testDrawdown();
    testRatios();
    testSummarize();
    std::cout << "[TEST] PerformanceAnalytics Test PASSED!" << std::endl;
    return 0;
}
