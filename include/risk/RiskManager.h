#pragma once

#include <string>
#include <vector>
#include "common/Types.h"
#include "risk/RiskConfig.h"
#include "strategy/IStrategy.h"

namespace stratlab {
namespace risk {

enum class RiskAction {
    HOLD,
    OPEN_LONG,
    OPEN_SHORT,
    CLOSE
};

struct RiskDecision {
    RiskAction action;
    std::string reason;
    bool forced;        // overlay rule rather than the policy's own signal

    RiskDecision() : action(RiskAction::HOLD), forced(false) {}
    RiskDecision(RiskAction a, std::string r, bool f = false)
        : action(a), reason(std::move(r)), forced(f) {}
};

// Position state machine for a single run: FLAT -> LONG/SHORT -> FLAT.
// Overlay rules are checked in priority order while a position is open:
// stop-loss, worst month, trailing stop, take-profit, policy exit.
class RiskManager {
public:
    RiskManager(const RiskConfig& config, bool enforce_buy_first,
                std::vector<int> unfavorable_months = {});

    // Resolves the policy decision for the bar at `index`. Updates the excursion
    // tracking of an open position (peak price, trailing activation).
    RiskDecision evaluate(const strategy::Decision& decision, PositionState& position,
                          const PriceSeries& bars, size_t index);

    // Stop price for a new position, 0 when no stop applies
    double calculateStopLoss(PositionStatus side, double entry_price,
                             const PriceSeries& bars, size_t index) const;

    int skippedSignals() const { return skipped_signals_; }
    const RiskConfig& config() const { return config_; }

private:
    RiskDecision evaluateFlat(const strategy::Decision& decision, const PriceBar& bar);
    RiskDecision evaluateOpen(const strategy::Decision& decision, PositionState& position,
                              const PriceBar& bar);
    bool isUnfavorableMonth(int month) const;

    RiskConfig config_;
    bool enforce_buy_first_;
    std::vector<int> unfavorable_months_;
    int skipped_signals_ = 0;
};

} // namespace risk
} // namespace stratlab
