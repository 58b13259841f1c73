#include "data/FilePriceSeriesProvider.h"
#include "backtest/DataHistory.h"
#include "common/Errors.h"
#include "common/Logger.h"

namespace stratlab {
namespace data {

FilePriceSeriesProvider::FilePriceSeriesProvider(std::filesystem::path data_dir)
    : data_dir_(std::move(data_dir))
{}

std::filesystem::path FilePriceSeriesProvider::findFile(const std::string& symbol) const {
    std::error_code ec;
    for (const char* ext : {".csv", ".json"}) {
        const auto candidate = data_dir_ / (symbol + ext);
        if (std::filesystem::exists(candidate, ec)) {
            return candidate;
        }
    }
    return {};
}

PriceSeries FilePriceSeriesProvider::getPriceSeries(const std::string& symbol,
                                                    const Date& start, const Date& end) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = cache_.find(symbol);
    if (it == cache_.end()) {
        const auto path = findFile(symbol);
        if (path.empty()) {
            throw SymbolNotFoundError(symbol);
        }

        PriceSeries bars = (path.extension() == ".json")
            ? backtest::DataHistory::loadJSON(path.string())
            : backtest::DataHistory::loadCSV(path.string());
        if (bars.empty()) {
            throw DataUnavailableError("No readable bars in " + path.string());
        }
        it = cache_.emplace(symbol, std::move(bars)).first;
    }

    auto filtered = backtest::DataHistory::filterByDate(it->second, start, end);
    LOG_DEBUG("{}: {} bars between {} and {}", symbol, filtered.size(), start.toString(), end.toString());
    return filtered;
}

} // namespace data
} // namespace stratlab
