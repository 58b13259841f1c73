#include "strategy/MacdStrategy.h"
#include "analytics/TechnicalIndicators.h"

#include <algorithm>

namespace stratlab {
namespace strategy {

StrategyInfo MacdStrategy::getInfo() const {
    StrategyInfo info;
    info.id = "macd";
    info.name = "MACD Crossover";
    info.description = "Buy when MACD crosses above its signal line, sell on the reverse cross";
    info.category = "Momentum";
    info.risk_level = "Medium";
    return info;
}

size_t MacdStrategy::warmupBars(const StrategyParameters& params) const {
    const int slow = std::max(params.macd.fast_period, params.macd.slow_period);
    return static_cast<size_t>(slow + params.macd.signal_period - 1);
}

Decision MacdStrategy::evaluate(const StrategyContext& context) const {
    const auto& cfg = context.params.macd;
    const auto series = analytics::TechnicalIndicators::calculateMACDSeries(
        context.history(), cfg.fast_period, cfg.slow_period, cfg.signal_period);
    if (series.size() < 2) return Decision::hold();

    const auto& prev = series[series.size() - 2];
    const auto& curr = series.back();

    if (context.position.isFlat()) {
        if (prev.macd <= prev.signal && curr.macd > curr.signal) {
            return Decision(SignalType::ENTER_LONG, "MACD Bullish Crossover");
        }
    } else if (context.position.status == PositionStatus::LONG) {
        if (prev.macd >= prev.signal && curr.macd < curr.signal) {
            return Decision(SignalType::EXIT, "MACD Bearish Crossover");
        }
    }
    return Decision::hold();
}

} // namespace strategy
} // namespace stratlab
