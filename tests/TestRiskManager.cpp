#include "risk/RiskManager.h"
#include "TestSeries.h"

#include <cassert>
#include <iostream>

using namespace stratlab;
using risk::RiskAction;
using risk::RiskConfig;
using risk::RiskManager;
using risk::StopLossMethod;
using strategy::Decision;
using strategy::SignalType;
using testing::near;

static PositionState longAt(double entry, double stop, const Date& date) {
    PositionState p;
    p.status = PositionStatus::LONG;
    p.entry_price = entry;
    p.entry_date = date;
    p.quantity = 10.0;
    p.stop_loss_price = stop;
    p.peak_price_since_entry = entry;
    return p;
}

static void testBuyFirstAndFlatRules() {
    const auto bars = testing::makeBars({100, 101, 102});
    PositionState flat;

    RiskManager strict(RiskConfig(), true);
    auto d = strict.evaluate(Decision(SignalType::ENTER_SHORT, "short"), flat, bars, 1);
    assert(d.action == RiskAction::HOLD);
    assert(strict.skippedSignals() == 1);

    d = strict.evaluate(Decision(SignalType::EXIT, "exit"), flat, bars, 1);
    assert(d.action == RiskAction::HOLD);
    d = strict.evaluate(Decision(SignalType::COVER, "cover"), flat, bars, 2);
    assert(d.action == RiskAction::HOLD);
    assert(strict.skippedSignals() == 3);

    d = strict.evaluate(Decision(SignalType::ENTER_LONG, "long"), flat, bars, 1);
    assert(d.action == RiskAction::OPEN_LONG);
    assert(d.reason == "long");

    RiskManager relaxed(RiskConfig(), false);
    d = relaxed.evaluate(Decision(SignalType::ENTER_SHORT, "short"), flat, bars, 1);
    assert(d.action == RiskAction::OPEN_SHORT);
    assert(relaxed.skippedSignals() == 0);
    std::cout << "[TEST] Buy-first / flat rules PASSED" << std::endl;
}

static void testStopLossPrices() {
    const auto bars = testing::makeBars(std::vector<double>(30, 100.0));

    RiskConfig pct;
    pct.stop_loss_method = StopLossMethod::PERCENTAGE;
    pct.stop_loss_value = 0.08;
    RiskManager rm(pct, true);
    assert(near(rm.calculateStopLoss(PositionStatus::LONG, 100.0, bars, 20), 92.0));
    assert(near(rm.calculateStopLoss(PositionStatus::SHORT, 100.0, bars, 20), 108.0));

    RiskConfig fixed;
    fixed.stop_loss_method = StopLossMethod::FIXED;
    fixed.stop_loss_value = 5.0;
    assert(near(RiskManager(fixed, true).calculateStopLoss(PositionStatus::LONG, 100.0, bars, 20), 95.0));

    RiskConfig atr;
    atr.stop_loss_method = StopLossMethod::ATR;
    atr.stop_loss_value = 2.0;
    assert(near(RiskManager(atr, true).calculateStopLoss(PositionStatus::LONG, 100.0, bars, 20), 96.0));

    assert(RiskManager(RiskConfig(), true).calculateStopLoss(PositionStatus::LONG, 100.0, bars, 20) == 0.0);
    std::cout << "[TEST] Stop-loss prices PASSED" << std::endl;
}

static void testExitPriority() {
    // Stop-loss wins over the policy's own exit
    RiskConfig cfg;
    cfg.stop_loss_method = StopLossMethod::PERCENTAGE;
    cfg.stop_loss_value = 0.08;
    cfg.take_profit_pct = 0.20;
    cfg.worst_month_exit = true;
    RiskManager rm(cfg, true, {4});

    const auto march = testing::makeBars({100, 90}, Date(2021, 3, 1));
    auto pos = longAt(100.0, 92.0, march[0].date);
    auto d = rm.evaluate(Decision(SignalType::EXIT, "policy"), pos, march, 1);
    assert(d.action == RiskAction::CLOSE);
    assert(d.reason == "Stop loss triggered");
    assert(d.forced);

    // Worst month beats take-profit
    const auto april = testing::makeBars({100, 130}, Date(2021, 4, 1));
    pos = longAt(100.0, 92.0, april[0].date);
    d = rm.evaluate(Decision(), pos, april, 1);
    assert(d.action == RiskAction::CLOSE);
    assert(d.reason == "Unfavorable month (April)");

    const auto may = testing::makeBars({100, 125}, Date(2021, 5, 3));
    pos = longAt(100.0, 92.0, may[0].date);
    d = rm.evaluate(Decision(), pos, may, 1);
    assert(d.reason == "Take profit reached");

    pos = longAt(100.0, 92.0, may[0].date);
    d = rm.evaluate(Decision(SignalType::EXIT, "Death Cross"), pos, testing::makeBars({100, 101}, Date(2021, 5, 3)), 1);
    assert(d.action == RiskAction::CLOSE);
    assert(d.reason == "Death Cross");
    assert(!d.forced);

    // A long ignores COVER
    pos = longAt(100.0, 92.0, may[0].date);
    d = rm.evaluate(Decision(SignalType::COVER, "cover"), pos, testing::makeBars({100, 101}, Date(2021, 5, 3)), 1);
    assert(d.action == RiskAction::HOLD);
    std::cout << "[TEST] Exit priority PASSED" << std::endl;
}

static void testTrailingStop() {
    RiskConfig cfg;
    cfg.trailing_activation_pct = 0.10;
    cfg.trailing_distance_pct = 0.05;
    RiskManager rm(cfg, true);

    const auto bars = testing::makeBars({100, 105, 112, 108, 106});
    auto pos = longAt(100.0, 0.0, bars[0].date);

    assert(rm.evaluate(Decision(), pos, bars, 1).action == RiskAction::HOLD);
    assert(!pos.trailing_stop_active);

    assert(rm.evaluate(Decision(), pos, bars, 2).action == RiskAction::HOLD);
    assert(pos.trailing_stop_active);
    assert(near(pos.peak_price_since_entry, 112.0));

    // 3.6% off the peak
    assert(rm.evaluate(Decision(), pos, bars, 3).action == RiskAction::HOLD);

    const auto d = rm.evaluate(Decision(), pos, bars, 4);
    assert(d.action == RiskAction::CLOSE);
    assert(d.reason == "Trailing stop triggered");
    std::cout << "[TEST] Trailing stop PASSED" << std::endl;
}

static void testShortStop() {
    RiskConfig cfg;
    cfg.stop_loss_method = StopLossMethod::PERCENTAGE;
    cfg.stop_loss_value = 0.05;
    RiskManager rm(cfg, false);

    const auto bars = testing::makeBars({100, 103, 106});
    PositionState pos;
    pos.status = PositionStatus::SHORT;
    pos.entry_price = 100.0;
    pos.entry_date = bars[0].date;
    pos.quantity = 1.0;
    pos.stop_loss_price = rm.calculateStopLoss(PositionStatus::SHORT, 100.0, bars, 0);

    assert(rm.evaluate(Decision(), pos, bars, 1).action == RiskAction::HOLD);
    const auto d = rm.evaluate(Decision(), pos, bars, 2);
    assert(d.action == RiskAction::CLOSE);
    assert(d.reason == "Stop loss triggered");
    std::cout << "[TEST] Short stop PASSED" << std::endl;
}

int main() {
    std::cout << "[TEST] Starting RiskManager Test..." << std::endl;
    testBuyFirstAndFlatRules();
    testStopLossPrices();
    testExitPriority();
    testTrailingStop();
    testShortStop();
    std::cout << "[TEST] RiskManager Test PASSED!" << std::endl;
    return 0;
}
