#include "backtest/DataHistory.h"
#include "common/Errors.h"
#include "data/FilePriceSeriesProvider.h"
#include "data/InMemoryPriceSeriesProvider.h"
#include "data/RateLimitedPriceSeriesProvider.h"
#include "TestSeries.h"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace stratlab;
using backtest::DataHistory;
using testing::near;

namespace {
std::filesystem::path makeTempDir() {
    const auto dir = std::filesystem::temp_directory_path() / "stratlab_price_history_test";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

void writeFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path);
    out << content;
}
}

static void testCsv(const std::filesystem::path& dir) {
    const auto path = dir / "SPY.csv";
    writeFile(path,
              "Date,Open,High,Low,Close,Adj Close,Volume\n"
              "2021-01-05,101,103,100,102,101.5,2000\n"
              "2021-01-04,100,102,99,101,100.5,1000\n"
              "\"2021-01-06\",102,104,101,103,102.5,3000\n"
              "2021-01-07,bad,row\n");

    const auto bars = DataHistory::loadCSV(path.string());
    assert(bars.size() == 3);
    assert(bars[0].date == Date(2021, 1, 4));
    assert(bars[2].date == Date(2021, 1, 6));
    assert(near(bars[0].close, 101.0));
    assert(near(bars[1].high, 103.0));
    assert(near(bars[2].volume, 3000.0));

    // Headerless, unix seconds
    const auto epoch = dir / "EPOCH.csv";
    writeFile(epoch, "1609718400,10,11,9,10.5,100\n1609804800,10.5,12,10,11.5,200\n");
    const auto ebars = DataHistory::loadCSV(epoch.string());
    assert(ebars.size() == 2);
    assert(ebars[0].date == Date(2021, 1, 4));
    assert(near(ebars[1].close, 11.5));

    assert(DataHistory::loadCSV((dir / "missing.csv").string()).empty());
    std::cout << "[TEST] CSV loading PASSED" << std::endl;
}

static void testJson(const std::filesystem::path& dir) {
    const auto path = dir / "GLD.json";
    writeFile(path, R"({"bars": [
        {"date": "2021-02-02", "open": 10, "high": 12, "low": 9, "close": 11, "volume": 5},
        {"d": "2021-02-01", "c": 10},
        {"date": "2021-02-03"}
    ]})");

    const auto bars = DataHistory::loadJSON(path.string());
    assert(bars.size() == 2);
    assert(bars[0].date == Date(2021, 2, 1));
    // Close-only bar gets flat OHLC
    assert(near(bars[0].open, 10.0) && near(bars[0].high, 10.0) && near(bars[0].low, 10.0));
    assert(near(bars[1].high, 12.0));

    const auto array_path = dir / "ARR.json";
    writeFile(array_path, R"([{"t": 1612137600000, "o": 1, "h": 2, "l": 0.5, "c": 1.5, "v": 10}])");
    const auto arr = DataHistory::loadJSON(array_path.string());
    assert(arr.size() == 1);
    assert(arr[0].date == Date(2021, 2, 1));

    const auto broken = dir / "BROKEN.json";
    writeFile(broken, "{not json");
    assert(DataHistory::loadJSON(broken.string()).empty());
    std::cout << "[TEST] JSON loading PASSED" << std::endl;
}

static void testFilterAndTimestamps() {
    const auto bars = testing::makeBars(testing::linear(1, 1, 10), Date(2021, 3, 1));
    const auto filtered = DataHistory::filterByDate(bars, Date(2021, 3, 2), Date(2021, 3, 5));
    assert(filtered.size() == 4);
    assert(filtered.front().date == Date(2021, 3, 2));
    assert(filtered.back().date == Date(2021, 3, 5));
    assert(DataHistory::filterByDate(bars, Date(2022, 1, 1), Date(2022, 2, 1)).empty());

    assert(DataHistory::dateFromTimestamp(1577836800LL) == Date(2020, 1, 1));
    assert(DataHistory::dateFromTimestamp(1577836800000LL) == Date(2020, 1, 1));
    assert(DataHistory::dateFromTimestamp(1577836799LL) == Date(2019, 12, 31));
    std::cout << "[TEST] Date filtering PASSED" << std::endl;
}

static void testProviders(const std::filesystem::path& dir) {
    data::FilePriceSeriesProvider files(dir);
    const auto spy = files.getPriceSeries("SPY", Date(2021, 1, 5), Date(2021, 12, 31));
    assert(spy.size() == 2);
    assert(files.findFile("GLD").extension() == ".json");

    bool threw = false;
    try {
        files.getPriceSeries("NOPE", Date(2021, 1, 1), Date(2021, 12, 31));
    } catch (const SymbolNotFoundError& e) {
        threw = (e.symbol() == "NOPE");
    }
    assert(threw);

    writeFile(dir / "EMPTY.csv", "Date,Open,High,Low,Close,Volume\n");
    threw = false;
    try {
        files.getPriceSeries("EMPTY", Date(2021, 1, 1), Date(2021, 12, 31));
    } catch (const DataUnavailableError&) {
        threw = true;
    }
    assert(threw);

    auto memory = std::make_shared<data::InMemoryPriceSeriesProvider>();
    memory->setSeries("X", testing::makeBars(testing::linear(1, 1, 10), Date(2021, 3, 1)));
    assert(memory->getPriceSeries("X", Date(2021, 3, 1), Date(2021, 3, 3)).size() == 3);
    threw = false;
    try {
        memory->getPriceSeries("Y", Date(2021, 3, 1), Date(2021, 3, 3));
    } catch (const SymbolNotFoundError&) {
        threw = true;
    }
    assert(threw);

    // Third call inside the same second has to wait for the next window
    data::RateLimitedPriceSeriesProvider limited(memory, 2);
    for (int i = 0; i < 3; ++i) {
        assert(limited.getPriceSeries("X", Date(2021, 3, 1), Date(2021, 3, 31)).size() == 10);
    }
    const auto stats = limited.getStats();
    assert(stats.total_requests == 3);
    assert(stats.forced_waits >= 1);
    std::cout << "[TEST] Price providers PASSED" << std::endl;
}

int main() {
    std::cout << "[TEST] Starting PriceHistory Test..." << std::endl;
    const auto dir = makeTempDir();
    testCsv(dir);
    testJson(dir);
    testFilterAndTimestamps();
    testProviders(dir);
    std::filesystem::remove_all(dir);
    std::cout << "[TEST] PriceHistory Test PASSED!" << std::endl;
    return 0;
}
