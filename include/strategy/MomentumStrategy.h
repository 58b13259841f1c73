#pragma once

#include "strategy/IStrategy.h"

namespace stratlab {
namespace strategy {

// Donchian-style breakout: buy above the prior N-bar high, sell below the prior N-bar low
class MomentumStrategy : public IStrategy {
public:
    StrategyInfo getInfo() const override;
    size_t warmupBars(const StrategyParameters& params) const override;
    Decision evaluate(const StrategyContext& context) const override;
};

} // namespace strategy
} // namespace stratlab
