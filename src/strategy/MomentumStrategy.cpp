#include "strategy/MomentumStrategy.h"
#include "common/Logger.h"

#include <algorithm>

namespace stratlab {
namespace strategy {

StrategyInfo MomentumStrategy::getInfo() const {
    StrategyInfo info;
    info.id = "momentum";
    info.name = "Momentum Breakout";
    info.description = "Buy on a breakout above the recent high, sell on a breakdown below the recent low";
    info.category = "Momentum";
    info.risk_level = "High";
    return info;
}

size_t MomentumStrategy::warmupBars(const StrategyParameters& params) const {
    return static_cast<size_t>(std::max(params.momentum.lookback, 1));
}

Decision MomentumStrategy::evaluate(const StrategyContext& context) const {
    const int lookback = context.params.momentum.lookback;
    const size_t i = context.index;
    if (lookback <= 0 || i < static_cast<size_t>(lookback)) return Decision::hold();

    // Prior window excludes the current bar
    const auto first = context.closes.begin() + (i - lookback);
    const auto last = context.closes.begin() + i;
    const double prior_high = *std::max_element(first, last);
    const double prior_low = *std::min_element(first, last);
    const double price = context.price();

    if (context.position.isFlat() && price > prior_high) {
        return Decision(SignalType::ENTER_LONG, fmt::format("Breakout above {}-day high", lookback));
    }
    if (context.position.status == PositionStatus::LONG && price < prior_low) {
        return Decision(SignalType::EXIT, fmt::format("Breakdown below {}-day low", lookback));
    }
    return Decision::hold();
}

} // namespace strategy
} // namespace stratlab
