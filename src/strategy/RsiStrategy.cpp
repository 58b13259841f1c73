#include "strategy/RsiStrategy.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"

namespace stratlab {
namespace strategy {

StrategyInfo RsiStrategy::getInfo() const {
    StrategyInfo info;
    info.id = "rsi";
    info.name = "RSI Mean Reversion";
    info.description = "Buy when RSI is oversold, sell when it is overbought";
    info.category = "Mean Reversion";
    info.risk_level = "Medium";
    return info;
}

size_t RsiStrategy::warmupBars(const StrategyParameters& params) const {
    return static_cast<size_t>(params.rsi.period);
}

Decision RsiStrategy::evaluate(const StrategyContext& context) const {
    const auto& cfg = context.params.rsi;
    if (context.index < static_cast<size_t>(cfg.period)) return Decision::hold();

    const auto first = context.closes.begin() + (context.index - cfg.period);
    const std::vector<double> window(first, context.closes.begin() + context.index + 1);
    const double rsi = analytics::TechnicalIndicators::calculateRSI(window, cfg.period);

    if (context.position.isFlat() && rsi < cfg.oversold) {
        return Decision(SignalType::ENTER_LONG, fmt::format("RSI Oversold (RSI={:.1f})", rsi));
    }
    if (context.position.status == PositionStatus::LONG && rsi > cfg.overbought) {
        return Decision(SignalType::EXIT, fmt::format("RSI Overbought (RSI={:.1f})", rsi));
    }
    return Decision::hold();
}

} // namespace strategy
} // namespace stratlab
