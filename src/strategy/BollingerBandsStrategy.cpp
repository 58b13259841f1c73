#include "strategy/BollingerBandsStrategy.h"
#include "analytics/TechnicalIndicators.h"

#include <algorithm>

namespace stratlab {
namespace strategy {

StrategyInfo BollingerBandsStrategy::getInfo() const {
    StrategyInfo info;
    info.id = "bollinger_bands";
    info.name = "Bollinger Bands";
    info.description = "Buy at or below the lower band, sell at or above the upper band";
    info.category = "Mean Reversion";
    info.risk_level = "Medium";
    return info;
}

size_t BollingerBandsStrategy::warmupBars(const StrategyParameters& params) const {
    return static_cast<size_t>(std::max(params.bollinger.period - 1, 1));
}

Decision BollingerBandsStrategy::evaluate(const StrategyContext& context) const {
    const auto& cfg = context.params.bollinger;
    if (context.index + 1 < static_cast<size_t>(cfg.period)) return Decision::hold();

    const auto first = context.closes.begin() + (context.index + 1 - cfg.period);
    const std::vector<double> window(first, context.closes.begin() + context.index + 1);
    const double price = context.price();
    const auto bands = analytics::TechnicalIndicators::calculateBollingerBands(
        window, price, cfg.period, cfg.std_dev_mult);
    if (bands.width <= 0.0) return Decision::hold();

    if (context.position.isFlat() && price <= bands.lower) {
        return Decision(SignalType::ENTER_LONG, "Price at Lower Bollinger Band");
    }
    if (context.position.status == PositionStatus::LONG && price >= bands.upper) {
        return Decision(SignalType::EXIT, "Price at Upper Bollinger Band");
    }
    return Decision::hold();
}

} // namespace strategy
} // namespace stratlab
