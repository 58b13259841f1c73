#include "analytics/TechnicalIndicators.h"
#include "common/Errors.h"
#include "strategy/BollingerBandsStrategy.h"
#include "strategy/BuyHoldStrategy.h"
#include "strategy/MacdStrategy.h"
#include "strategy/MomentumStrategy.h"
#include "strategy/MonthlySeasonalStrategy.h"
#include "strategy/PairMeanReversionStrategy.h"
#include "strategy/RsiStrategy.h"
#include "strategy/SmaCrossoverStrategy.h"
#include "strategy/StrategyManager.h"
#include "TestSeries.h"

#include <algorithm>
#include <cassert>
#include <iostream>

using namespace stratlab;
using namespace stratlab::strategy;
using analytics::TechnicalIndicators;

namespace {
PositionState longPosition(const PriceSeries& bars, size_t index) {
    PositionState p;
    p.status = PositionStatus::LONG;
    p.entry_price = bars[index].close;
    p.entry_date = bars[index].date;
    p.entry_index = index;
    p.quantity = 1.0;
    return p;
}

Decision evaluateAt(const IStrategy& s, const PriceSeries& bars, size_t index,
                    const PositionState& position, const StrategyParameters& params) {
    const auto closes = TechnicalIndicators::extractClosePrices(bars);
    StrategyContext context(bars, closes, index, position, params);
    return s.evaluate(context);
}

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}
}

static void testBuyHold() {
    BuyHoldStrategy s;
    const auto bars = testing::makeBars({10, 11, 12, 13});
    const StrategyParameters params;
    PositionState flat;

    auto d = evaluateAt(s, bars, 0, flat, params);
    assert(d.signal == SignalType::ENTER_LONG);
    assert(d.reason == "Buy and Hold");
    assert(evaluateAt(s, bars, 1, flat, params).signal == SignalType::HOLD);

    const auto held = longPosition(bars, 0);
    assert(evaluateAt(s, bars, 2, held, params).signal == SignalType::HOLD);
    d = evaluateAt(s, bars, 3, held, params);
    assert(d.signal == SignalType::EXIT);
    assert(d.reason == "End of period");
    std::cout << "[TEST] BuyHold PASSED" << std::endl;
}

static void testSmaCrossover() {
    SmaCrossoverStrategy s;
    StrategyParameters params;
    params.sma.fast_period = 3;
    params.sma.slow_period = 5;
    assert(s.warmupBars(params) == 5);

    const auto bars = testing::makeBars({10, 9, 8, 7, 6, 5, 6, 8, 10, 12});
    PositionState flat;
    size_t entry = 0;
    for (size_t i = s.warmupBars(params); i < bars.size(); ++i) {
        const auto d = evaluateAt(s, bars, i, flat, params);
        if (d.signal == SignalType::ENTER_LONG) {
            assert(d.reason == "Golden Cross (SMA3 > SMA5)");
            entry = i;
            break;
        }
    }
    assert(entry == 8);

    const auto down = testing::makeBars({5, 6, 7, 8, 9, 10, 9, 7, 5, 3});
    const auto held = longPosition(down, 5);
    bool exited = false;
    for (size_t i = 6; i < down.size() && !exited; ++i) {
        const auto d = evaluateAt(s, down, i, held, params);
        if (d.signal == SignalType::EXIT) {
            assert(startsWith(d.reason, "Death Cross"));
            exited = true;
        }
    }
    assert(exited);
    std::cout << "[TEST] SMA crossover PASSED" << std::endl;
}

static void testRsi() {
    RsiStrategy s;
    const StrategyParameters params;
    assert(s.warmupBars(params) == 14);

    const auto falling = testing::makeBars(testing::linear(100, -1, 20));
    PositionState flat;
    auto d = evaluateAt(s, falling, 19, flat, params);
    assert(d.signal == SignalType::ENTER_LONG);
    assert(startsWith(d.reason, "RSI Oversold (RSI="));

    const auto rising = testing::makeBars(testing::linear(100, 1, 20));
    d = evaluateAt(s, rising, 19, longPosition(rising, 0), params);
    assert(d.signal == SignalType::EXIT);
    assert(startsWith(d.reason, "RSI Overbought"));

    // No signal before a full window
    assert(evaluateAt(s, falling, 10, flat, params).signal == SignalType::HOLD);
    std::cout << "[TEST] RSI PASSED" << std::endl;
}

static void testMacd() {
    MacdStrategy s;
    const StrategyParameters params;
    assert(s.warmupBars(params) == 34);

    auto closes = testing::linear(200, -1, 40);
    const auto up = testing::linear(161, 2, 20);
    closes.insert(closes.end(), up.begin(), up.end());
    const auto bars = testing::makeBars(closes);

    PositionState flat;
    size_t entry = 0;
    for (size_t i = s.warmupBars(params); i < bars.size(); ++i) {
        const auto d = evaluateAt(s, bars, i, flat, params);
        if (d.signal == SignalType::ENTER_LONG) {
            assert(d.reason == "MACD Bullish Crossover");
            entry = i;
            break;
        }
    }
    assert(entry >= 40);
    std::cout << "[TEST] MACD PASSED" << std::endl;
}

static void testBollinger() {
    BollingerBandsStrategy s;
    const StrategyParameters params;

    std::vector<double> closes;
    for (int i = 0; i < 19; ++i) closes.push_back(i % 2 == 0 ? 99.0 : 101.0);
    closes.push_back(90.0);
    const auto bars = testing::makeBars(closes);

    PositionState flat;
    auto d = evaluateAt(s, bars, 19, flat, params);
    assert(d.signal == SignalType::ENTER_LONG);
    assert(d.reason == "Price at Lower Bollinger Band");

    closes.back() = 110.0;
    const auto high = testing::makeBars(closes);
    d = evaluateAt(s, high, 19, longPosition(high, 0), params);
    assert(d.signal == SignalType::EXIT);
    assert(d.reason == "Price at Upper Bollinger Band");

    // Flat-lined window has zero width
    const auto flat_bars = testing::makeBars(std::vector<double>(20, 100.0));
    assert(evaluateAt(s, flat_bars, 19, flat, params).signal == SignalType::HOLD);
    std::cout << "[TEST] Bollinger PASSED" << std::endl;
}

static void testMomentum() {
    MomentumStrategy s;
    StrategyParameters params = defaultParametersFor("momentum");
    params.momentum.lookback = 5;
    assert(params.risk.stop_loss_method == risk::StopLossMethod::PERCENTAGE);
    assert(testing::near(params.risk.stop_loss_value, 0.08));

    const auto breakout = testing::makeBars({10, 10, 10, 10, 10, 11});
    PositionState flat;
    auto d = evaluateAt(s, breakout, 5, flat, params);
    assert(d.signal == SignalType::ENTER_LONG);
    assert(d.reason == "Breakout above 5-day high");

    const auto breakdown = testing::makeBars({10, 10, 10, 10, 10, 9});
    d = evaluateAt(s, breakdown, 5, longPosition(breakdown, 0), params);
    assert(d.signal == SignalType::EXIT);
    assert(d.reason == "Breakdown below 5-day low");
    std::cout << "[TEST] Momentum PASSED" << std::endl;
}

static void testMonthlySeasonal() {
    MonthlySeasonalStrategy s;
    StrategyParameters params = defaultParametersFor("monthly_seasonal");
    params.seasonal.favorable_months = {1, 2, 3, 10};
    params.seasonal.unfavorable_months = {4, 6, 12};
    params.seasonal.trend_ma_period = 3;
    assert(params.risk.worst_month_exit);
    assert(testing::near(params.risk.trailing_activation_pct, 0.10));
    assert(testing::near(params.risk.trailing_distance_pct, 0.05));
    assert(s.unfavorableMonths(params) == std::vector<int>({4, 6, 12}));

    // 2021-03-01 is a Monday; 23 trading days in March 2021
    const auto bars = testing::makeBars(testing::linear(100, 0.5, 30), Date(2021, 3, 1));
    assert(MonthlySeasonalStrategy::tradingDayOfMonth(bars, 0) == 1);
    assert(MonthlySeasonalStrategy::tradingDayOfMonth(bars, 4) == 5);
    assert(bars[23].date.month == 4);
    assert(MonthlySeasonalStrategy::tradingDayOfMonth(bars, 23) == 1);

    PositionState flat;
    auto d = evaluateAt(s, bars, 3, flat, params);
    assert(d.signal == SignalType::ENTER_LONG);
    assert(d.reason == "Favorable Month (March)");
    // Past the entry window
    assert(evaluateAt(s, bars, 6, flat, params).signal == SignalType::HOLD);

    const auto held = longPosition(bars, 3);
    assert(evaluateAt(s, bars, 10, held, params).signal == SignalType::HOLD);
    d = evaluateAt(s, bars, 24, held, params);
    assert(d.signal == SignalType::EXIT);
    assert(d.reason == "End of Favorable Month");

    // Below trend: no entry
    const auto falling = testing::makeBars(testing::linear(100, -0.5, 10), Date(2021, 3, 1));
    assert(evaluateAt(s, falling, 3, flat, params).signal == SignalType::HOLD);
    std::cout << "[TEST] Monthly seasonal PASSED" << std::endl;
}

static void testSeasonalCalibration() {
    MonthlySeasonalStrategy s;
    const auto bars = testing::makeBars(testing::randomWalk(100, 320), Date(2020, 1, 1));

    std::vector<std::string> notes;
    const auto calibrated = s.calibrate(defaultParametersFor("monthly_seasonal"), bars, notes);
    assert(calibrated.seasonal.favorable_months.size() == 4);
    assert(calibrated.seasonal.unfavorable_months.size() == 3);
    for (int m : calibrated.seasonal.unfavorable_months) {
        assert(std::find(calibrated.seasonal.favorable_months.begin(),
                         calibrated.seasonal.favorable_months.end(), m) == calibrated.seasonal.favorable_months.end());
    }
    assert(notes.size() == 1);
    assert(startsWith(notes[0], "Seasonal months ranked from this series"));

    // Configured months are left alone
    StrategyParameters fixed;
    fixed.seasonal.favorable_months = {1};
    fixed.seasonal.unfavorable_months = {6};
    notes.clear();
    const auto same = s.calibrate(fixed, bars, notes);
    assert(same.seasonal.favorable_months == std::vector<int>({1}));
    assert(notes.empty());
    std::cout << "[TEST] Seasonal calibration PASSED" << std::endl;
}

static void testPairMeanReversion() {
    PairMeanReversionStrategy s(PairMode::SPREAD);
    StrategyParameters params;
    assert(s.requiresPair());
    assert(s.getInfo().id == "pair_mean_reversion");
    assert(PairMeanReversionStrategy(PairMode::RATIO).getInfo().id == "ratio_trading");

    PairAnalytics pair;
    pair.primary = "KO";
    pair.secondary = "PEP";
    pair.is_stationary_pair = false;

    const auto secondary = testing::makeBars(std::vector<double>(20, 50.0));
    bool threw = false;
    try {
        s.validate(params, nullptr, &pair);
    } catch (const DataUnavailableError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        s.validate(params, &secondary, &pair);
    } catch (const NonStationaryPairError& e) {
        threw = std::string(e.what()).find("KO/PEP") != std::string::npos;
    }
    assert(threw);

    pair.is_stationary_pair = true;
    s.validate(params, &secondary, &pair);

    assert(s.maxHoldingBars(params, nullptr) == 30);
    pair.half_life = 7.4;
    assert(s.maxHoldingBars(params, &pair) == 15);
    params.pair.max_holding_bars = 10;
    assert(s.maxHoldingBars(params, &pair) == 10);
    params.pair.max_holding_bars = 0;

    std::vector<double> primary_closes;
    for (int i = 0; i < 19; ++i) primary_closes.push_back(i % 2 == 0 ? 100.0 : 101.0);
    primary_closes.push_back(95.0);
    const auto primary = testing::makeBars(primary_closes);
    const auto secondary_closes = TechnicalIndicators::extractClosePrices(secondary);
    const auto closes = TechnicalIndicators::extractClosePrices(primary);

    const auto z = s.zScore(closes, secondary_closes, 19, 20, 1.0);
    assert(z && *z < -2.0);

    PositionState flat;
    StrategyContext context(primary, closes, 19, flat, params);
    context.secondary = &secondary;
    context.secondary_closes = &secondary_closes;
    context.pair = &pair;
    auto d = s.evaluate(context);
    assert(d.signal == SignalType::ENTER_LONG);
    assert(startsWith(d.reason, "Spread below mean"));

    primary_closes.back() = 106.0;
    const auto rich = testing::makeBars(primary_closes);
    const auto rich_closes = TechnicalIndicators::extractClosePrices(rich);
    StrategyContext rich_context(rich, rich_closes, 19, flat, params);
    rich_context.secondary = &secondary;
    rich_context.secondary_closes = &secondary_closes;
    rich_context.pair = &pair;
    d = s.evaluate(rich_context);
    assert(d.signal == SignalType::ENTER_SHORT);
    assert(startsWith(d.reason, "Spread above mean"));

    // Held past 2 x half-life
    PositionState held = longPosition(primary, 2);
    StrategyContext hold_context(primary, closes, 19, held, params);
    hold_context.secondary = &secondary;
    hold_context.secondary_closes = &secondary_closes;
    hold_context.pair = &pair;
    d = s.evaluate(hold_context);
    assert(d.signal == SignalType::EXIT);
    assert(d.reason == "Max holding period reached");

    // Exactly 15 bars held is still within the limit; 16 exceeds it
    PositionState at_limit = longPosition(primary, 4);
    StrategyContext limit_context(primary, closes, 19, at_limit, params);
    limit_context.secondary = &secondary;
    limit_context.secondary_closes = &secondary_closes;
    limit_context.pair = &pair;
    assert(s.evaluate(limit_context).signal == SignalType::HOLD);
    PositionState past_limit = longPosition(primary, 3);
    StrategyContext past_context(primary, closes, 19, past_limit, params);
    past_context.secondary = &secondary;
    past_context.secondary_closes = &secondary_closes;
    past_context.pair = &pair;
    assert(s.evaluate(past_context).reason == "Max holding period reached");
    std::cout << "[TEST] Pair mean reversion PASSED" << std::endl;
}

static void testRegistry() {
    auto manager = StrategyManager::createDefault();
    const auto ids = manager->getStrategyIds();
    assert(ids.size() == 9);
    for (const char* id : {"buy_hold", "sma_crossover", "rsi", "macd", "bollinger_bands", "momentum",
                           "monthly_seasonal", "pair_mean_reversion", "ratio_trading"}) {
        assert(std::find(ids.begin(), ids.end(), id) != ids.end());
    }

    assert(manager->getStrategy("smaCrossover")->getInfo().id == "sma_crossover");
    assert(manager->getStrategy("buyHold")->getInfo().id == "buy_hold");
    assert(manager->getStrategy("monthlySeasonal")->getInfo().id == "monthly_seasonal");
    assert(manager->getStrategy("ratioTrading")->getInfo().id == "ratio_trading");
    assert(manager->getStrategy("Bollinger-Bands")->getInfo().id == "bollinger_bands");
    assert(manager->getStrategy("nope") == nullptr);

    bool threw = false;
    try {
        manager->requireStrategy("nope");
    } catch (const UnknownStrategyError&) {
        threw = true;
    }
    assert(threw);

    // Re-registering replaces by id
    manager->registerStrategy(std::make_shared<BuyHoldStrategy>());
    assert(manager->getStrategyIds().size() == 9);
    std::cout << "[TEST] Strategy registry PASSED" << std::endl;
}

int main() {
    std::cout << "[TEST] Starting Strategies Test..." << std::endl;
    testBuyHold();
    testSmaCrossover();
    testRsi();
    testMacd();
    testBollinger();
    testMomentum();
    testMonthlySeasonal();
    testSeasonalCalibration();
    testPairMeanReversion();
    testRegistry();
    std::cout << "[TEST] Strategies Test PASSED!" << std::endl;
    return 0;
}
