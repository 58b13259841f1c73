#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include "data/IPriceSeriesProvider.h"

namespace stratlab {
namespace data {

// Reads <data_dir>/<symbol>.csv or <data_dir>/<symbol>.json, caching each file once loaded
class FilePriceSeriesProvider : public IPriceSeriesProvider {
public:
    explicit FilePriceSeriesProvider(std::filesystem::path data_dir);

    PriceSeries getPriceSeries(const std::string& symbol, const Date& start, const Date& end) override;

    std::filesystem::path findFile(const std::string& symbol) const;

private:
    std::filesystem::path data_dir_;
    std::map<std::string, PriceSeries> cache_;
    std::mutex mutex_;
};

} // namespace data
} // namespace stratlab
