#include "execution/CostModel.h"
#include "TestSeries.h"

#include <cassert>
#include <iostream>

using namespace stratlab;
using execution::CostModel;
using execution::CostProfile;
using execution::MapCostProfileStore;
using testing::near;

static void testEntryAndExitFees() {
    const CostModel model(CostProfile::defaults());

    const auto entry = model.compute(TradeType::BUY_OPEN, 2.0, 200.0, 0);
    assert(near(entry.commission, 5.0));
    assert(near(entry.exchange_fee, 3.0));
    assert(near(entry.clearing_fee, 1.0));
    assert(entry.financing_accrued == 0.0);
    assert(near(entry.total(), 9.0));

    // Financing only on the closing leg: notional x rate x days
    const auto exit = model.compute(TradeType::SELL_CLOSE, 2.0, 1000.0, 10);
    assert(near(exit.financing_accrued, 1000.0 * 0.000137 * 10));
    assert(near(exit.total(), 9.0 + 1.37));

    const auto same_day = model.compute(TradeType::BUY_COVER, 2.0, 1000.0, 0);
    assert(same_day.financing_accrued == 0.0);

    const auto short_open = model.compute(TradeType::SELL_SHORT, 1.0, 500.0, 5);
    assert(short_open.financing_accrued == 0.0);
    std::cout << "[TEST] Entry/exit fees PASSED" << std::endl;
}

static void testZeroProfile() {
    const CostModel model(CostProfile::zero());
    assert(model.compute(TradeType::SELL_CLOSE, 100.0, 1e6, 365).total() == 0.0);
    assert(CostProfile::zero().perUnitFees() == 0.0);
    assert(near(CostProfile::defaults().perUnitFees(), 4.5));
    std::cout << "[TEST] Zero profile PASSED" << std::endl;
}

static void testStoreFallback() {
    CostProfile es;
    es.commission = 1.0;
    CostProfile all;
    all.commission = 0.25;

    MapCostProfileStore store({{"ES", es}});
    assert(near(store.getCostProfile("ES").commission, 1.0));
    // No "ALL" entry: built-in CME defaults
    assert(near(store.getCostProfile("SPY").commission, 2.50));
    assert(near(store.getCostProfile("SPY").overnight_rate, 0.000137));

    store.setProfile("ALL", all);
    assert(near(store.getCostProfile("SPY").commission, 0.25));
    assert(near(store.getCostProfile("ES").commission, 1.0));

    MapCostProfileStore free_store({}, CostProfile::zero());
    assert(free_store.getCostProfile("ANY").perUnitFees() == 0.0);
    std::cout << "[TEST] Cost store fallback PASSED" << std::endl;
}

int main() {
    std::cout << "[TEST] Starting CostModel Test..." << std::endl;
    testEntryAndExitFees();
    testZeroProfile();
    testStoreFallback();
    std::cout << "[TEST] CostModel Test PASSED!" << std::endl;
    return 0;
}
