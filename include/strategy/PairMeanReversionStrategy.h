#pragma once

#include "strategy/IStrategy.h"

namespace stratlab {
namespace strategy {

// Z-score trading of a two-instrument spread (or price ratio). The position is
// carried on the primary instrument; the secondary only shapes the signal.
class PairMeanReversionStrategy : public IStrategy {
public:
    explicit PairMeanReversionStrategy(PairMode mode = PairMode::SPREAD);

    StrategyInfo getInfo() const override;
    size_t warmupBars(const StrategyParameters& params) const override;
    Decision evaluate(const StrategyContext& context) const override;
    bool requiresPair() const override { return true; }
    void validate(const StrategyParameters& params, const PriceSeries* secondary,
                  const PairAnalytics* pair) const override;

    // Z-score of the spread at `index` over the trailing `lookback` bars; nullopt when flat-lined
    std::optional<double> zScore(const std::vector<double>& primary,
                                 const std::vector<double>& secondary,
                                 size_t index, int lookback, double ratio) const;

    int maxHoldingBars(const StrategyParameters& params, const PairAnalytics* pair) const;

private:
    PairMode mode_;
};

} // namespace strategy
} // namespace stratlab
