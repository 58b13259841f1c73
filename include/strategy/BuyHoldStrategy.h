#pragma once

#include "strategy/IStrategy.h"

namespace stratlab {
namespace strategy {

// Baseline: long from the first bar to the last
class BuyHoldStrategy : public IStrategy {
public:
    StrategyInfo getInfo() const override;
    size_t warmupBars(const StrategyParameters& params) const override;
    Decision evaluate(const StrategyContext& context) const override;
};

} // namespace strategy
} // namespace stratlab
