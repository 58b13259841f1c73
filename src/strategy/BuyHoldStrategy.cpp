#include "strategy/BuyHoldStrategy.h"

namespace stratlab {
namespace strategy {

StrategyInfo BuyHoldStrategy::getInfo() const {
    StrategyInfo info;
    info.id = "buy_hold";
    info.name = "Buy and Hold";
    info.description = "Buy on the first bar and hold until the end of the period";
    info.category = "Passive";
    info.risk_level = "Medium";
    return info;
}

size_t BuyHoldStrategy::warmupBars(const StrategyParameters&) const {
    return 0;
}

Decision BuyHoldStrategy::evaluate(const StrategyContext& context) const {
    if (context.position.isFlat()) {
        if (context.index == 0 && !context.isLastBar()) {
            return Decision(SignalType::ENTER_LONG, "Buy and Hold");
        }
        return Decision::hold();
    }
    if (context.isLastBar()) {
        return Decision(SignalType::EXIT, "End of period");
    }
    return Decision::hold();
}

} // namespace strategy
} // namespace stratlab
