#pragma once

#include "strategy/IStrategy.h"

namespace stratlab {
namespace strategy {

// Golden cross entry, death cross exit
class SmaCrossoverStrategy : public IStrategy {
public:
    StrategyInfo getInfo() const override;
    size_t warmupBars(const StrategyParameters& params) const override;
    Decision evaluate(const StrategyContext& context) const override;
};

} // namespace strategy
} // namespace stratlab
