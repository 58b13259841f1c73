#pragma once

#include "common/Types.h"
#include "strategy/StrategyConfig.h"
#include <string>
#include <vector>
#include <memory>

namespace stratlab {
namespace strategy {

enum class SignalType {
    HOLD,
    ENTER_LONG,
    EXIT,         // close a long
    ENTER_SHORT,
    COVER         // close a short
};

inline const char* signalTypeToString(SignalType type) {
    switch (type) {
        case SignalType::HOLD: return "HOLD";
        case SignalType::ENTER_LONG: return "ENTER_LONG";
        case SignalType::EXIT: return "EXIT";
        case SignalType::ENTER_SHORT: return "ENTER_SHORT";
        case SignalType::COVER: return "COVER";
    }
    return "HOLD";
}

struct Decision {
    SignalType signal;
    std::string reason;

    Decision() : signal(SignalType::HOLD) {}
    Decision(SignalType s, std::string r) : signal(s), reason(std::move(r)) {}

    static Decision hold() { return Decision(); }
};

struct StrategyInfo {
    std::string id;             // registry key, e.g. "sma_crossover"
    std::string name;           // display name
    std::string description;
    std::string category;
    std::string risk_level;     // Low / Medium / High
};

// Read-only view handed to a policy for one bar. `closes` mirrors `bars`;
// only indices <= `index` may be read.
struct StrategyContext {
    const PriceSeries& bars;
    const std::vector<double>& closes;
    size_t index;
    const PositionState& position;
    const StrategyParameters& params;
    const PriceSeries* secondary = nullptr;         // aligned to bars by date
    const std::vector<double>* secondary_closes = nullptr;
    const PairAnalytics* pair = nullptr;

    StrategyContext(const PriceSeries& b, const std::vector<double>& c, size_t i,
                    const PositionState& p, const StrategyParameters& prm)
        : bars(b), closes(c), index(i), position(p), params(prm) {}

    const PriceBar& bar() const { return bars[index]; }
    double price() const { return closes[index]; }
    bool isLastBar() const { return index + 1 == bars.size(); }

    // Closes [0, index]
    std::vector<double> history() const {
        return std::vector<double>(closes.begin(), closes.begin() + index + 1);
    }
};

// Pure trading policy. Implementations hold no per-run state, so one instance
// can serve concurrent runs.
class IStrategy {
public:
    virtual ~IStrategy() = default;

    virtual StrategyInfo getInfo() const = 0;

    // First bar index at which the policy can produce a signal
    virtual size_t warmupBars(const StrategyParameters& params) const = 0;

    virtual Decision evaluate(const StrategyContext& context) const = 0;

    // Months in which the risk manager forces an exit when the worst-month rule is on
    virtual std::vector<int> unfavorableMonths(const StrategyParameters& params) const {
        (void)params;
        return {};
    }

    virtual bool requiresPair() const { return false; }

    // Fills parameters the policy derives from the series itself before a run.
    // Appends a human-readable line to `notes` for anything it decided.
    virtual StrategyParameters calibrate(const StrategyParameters& params, const PriceSeries& bars,
                                         std::vector<std::string>& notes) const {
        (void)bars;
        (void)notes;
        return params;
    }

    // Run once before the walk; throws when the inputs cannot support the policy
    virtual void validate(const StrategyParameters& params, const PriceSeries* secondary,
                          const PairAnalytics* pair) const {
        (void)params;
        (void)secondary;
        (void)pair;
    }
};

} // namespace strategy
} // namespace stratlab
