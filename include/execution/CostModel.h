#pragma once

#include <map>
#include <mutex>
#include <string>
#include "common/Types.h"

namespace stratlab {
namespace execution {

// Per-unit fees and a daily financing rate for one instrument
struct CostProfile {
    double commission = 0.0;
    double exchange_fee = 0.0;
    double clearing_fee = 0.0;
    double overnight_rate = 0.0;   // daily, fraction of notional

    double perUnitFees() const { return commission + exchange_fee + clearing_fee; }

    // CME futures defaults
    static CostProfile defaults() {
        CostProfile p;
        p.commission = 2.50;
        p.exchange_fee = 1.50;
        p.clearing_fee = 0.50;
        p.overnight_rate = 0.000137;
        return p;
    }

    static CostProfile zero() { return CostProfile(); }
};

struct CostBreakdown {
    double commission = 0.0;
    double exchange_fee = 0.0;
    double clearing_fee = 0.0;
    double financing_accrued = 0.0;

    double total() const { return commission + exchange_fee + clearing_fee + financing_accrued; }
};

// Pure cost computation over a single profile
class CostModel {
public:
    explicit CostModel(const CostProfile& profile = CostProfile::defaults()) : profile_(profile) {}

    // Financing is charged on closing trades only and is zero for days_held == 0
    CostBreakdown compute(TradeType type, double quantity, double notional, long long days_held) const;

    const CostProfile& profile() const { return profile_; }

private:
    CostProfile profile_;
};

class ICostProfileStore {
public:
    virtual ~ICostProfileStore() = default;
    virtual CostProfile getCostProfile(const std::string& symbol) const = 0;
};

// Lookup order: symbol entry, then "ALL", then the fallback profile
class MapCostProfileStore : public ICostProfileStore {
public:
    explicit MapCostProfileStore(std::map<std::string, CostProfile> profiles = {},
                                 const CostProfile& fallback = CostProfile::defaults());

    CostProfile getCostProfile(const std::string& symbol) const override;
    void setProfile(const std::string& symbol, const CostProfile& profile);

private:
    std::map<std::string, CostProfile> profiles_;
    CostProfile fallback_;
    mutable std::mutex mutex_;
};

} // namespace execution
} // namespace stratlab
