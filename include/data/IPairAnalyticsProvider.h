#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include "common/Types.h"

namespace stratlab {
namespace data {

class IPairAnalyticsProvider {
public:
    virtual ~IPairAnalyticsProvider() = default;

    // nullopt when the pair has not been analyzed
    virtual std::optional<PairAnalytics> getPairAnalytics(const std::string& primary,
                                                          const std::string& secondary) const = 0;
};

// Pre-computed pair statistics, typically loaded from config
class StaticPairAnalyticsProvider : public IPairAnalyticsProvider {
public:
    void setPair(const PairAnalytics& analytics);
    std::optional<PairAnalytics> getPairAnalytics(const std::string& primary,
                                                  const std::string& secondary) const override;

private:
    std::map<std::pair<std::string, std::string>, PairAnalytics> pairs_;
    mutable std::mutex mutex_;
};

} // namespace data
} // namespace stratlab
