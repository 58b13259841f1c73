#include "strategy/SmaCrossoverStrategy.h"
#include "analytics/TechnicalIndicators.h"

#include <algorithm>
#include "common/Logger.h"

namespace stratlab {
namespace strategy {

StrategyInfo SmaCrossoverStrategy::getInfo() const {
    StrategyInfo info;
    info.id = "sma_crossover";
    info.name = "SMA Crossover";
    info.description = "Buy when the fast SMA crosses above the slow SMA, sell on the reverse cross";
    info.category = "Trend Following";
    info.risk_level = "Medium";
    return info;
}

size_t SmaCrossoverStrategy::warmupBars(const StrategyParameters& params) const {
    return static_cast<size_t>(std::max(params.sma.fast_period, params.sma.slow_period));
}

Decision SmaCrossoverStrategy::evaluate(const StrategyContext& context) const {
    using analytics::TechnicalIndicators;
    const auto& cfg = context.params.sma;
    const size_t i = context.index;
    if (i == 0) return Decision::hold();

    const double fast = TechnicalIndicators::calculateSMAAt(context.closes, i, cfg.fast_period);
    const double slow = TechnicalIndicators::calculateSMAAt(context.closes, i, cfg.slow_period);
    const double prev_fast = TechnicalIndicators::calculateSMAAt(context.closes, i - 1, cfg.fast_period);
    const double prev_slow = TechnicalIndicators::calculateSMAAt(context.closes, i - 1, cfg.slow_period);
    if (slow <= 0.0 || prev_slow <= 0.0) return Decision::hold();

    if (context.position.isFlat()) {
        if (prev_fast <= prev_slow && fast > slow) {
            return Decision(SignalType::ENTER_LONG,
                            fmt::format("Golden Cross (SMA{} > SMA{})", cfg.fast_period, cfg.slow_period));
        }
    } else if (context.position.status == PositionStatus::LONG) {
        if (prev_fast >= prev_slow && fast < slow) {
            return Decision(SignalType::EXIT,
                            fmt::format("Death Cross (SMA{} < SMA{})", cfg.fast_period, cfg.slow_period));
        }
    }
    return Decision::hold();
}

} // namespace strategy
} // namespace stratlab
