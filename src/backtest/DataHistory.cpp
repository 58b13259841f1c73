#include "backtest/DataHistory.h"
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <map>
#include "common/Logger.h"

namespace stratlab {
namespace backtest {

namespace {
std::string trim(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.erase(s.begin());
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.pop_back();
    }
    return s;
}

std::string normalizeCell(std::string s) {
    s = trim(std::move(s));

    // Strip UTF-8 BOM if present at first cell.
    if (s.size() >= 3 &&
        static_cast<unsigned char>(s[0]) == 0xEF &&
        static_cast<unsigned char>(s[1]) == 0xBB &&
        static_cast<unsigned char>(s[2]) == 0xBF) {
        s = s.substr(3);
    }

    // Accept quoted CSV cells.
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return trim(std::move(s));
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

Date parseDateCell(const std::string& cell) {
    if (cell.find('-') != std::string::npos) {
        return Date::parse(cell);
    }
    return DataHistory::dateFromTimestamp(std::stoll(cell));
}

Date parseDateJson(const nlohmann::json& value) {
    if (value.is_string()) {
        return parseDateCell(value.get<std::string>());
    }
    return DataHistory::dateFromTimestamp(value.get<long long>());
}

template <typename T>
bool readField(const nlohmann::json& item, const char* key, const char* alias, T& out) {
    if (item.contains(key)) {
        out = item[key].get<T>();
        return true;
    }
    if (item.contains(alias)) {
        out = item[alias].get<T>();
        return true;
    }
    return false;
}

void sortByDate(PriceSeries& bars) {
    std::stable_sort(bars.begin(), bars.end(), [](const PriceBar& a, const PriceBar& b) {
        return a.date < b.date;
    });
}
}

Date DataHistory::dateFromTimestamp(long long ts) {
    // Millisecond timestamps
    if (ts > 100000000000LL || ts < -100000000000LL) {
        ts /= 1000;
    }
    long long days = ts / 86400;
    if (ts < 0 && ts % 86400 != 0) --days;
    return Date::fromDays(days);
}

PriceSeries DataHistory::loadCSV(const std::string& file_path) {
    PriceSeries bars;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open CSV file: {}", file_path);
        return bars;
    }

    // date, open, high, low, close, volume
    int columns[6] = {0, 1, 2, 3, 4, 5};
    std::string line;
    size_t line_no = 0;

    while (std::getline(file, line)) {
        ++line_no;
        std::stringstream ss(line);
        std::string cell;
        std::vector<std::string> row;

        while (std::getline(ss, cell, ',')) {
            row.push_back(normalizeCell(cell));
        }

        if (row.empty() || row[0].empty()) continue;
        if (!std::isdigit(static_cast<unsigned char>(row[0][0])) && row[0][0] != '-') {
            // Header row: map columns by name.
            static const char* names[6] = {"date", "open", "high", "low", "close", "volume"};
            for (int k = 0; k < 6; ++k) {
                for (size_t c = 0; c < row.size(); ++c) {
                    const std::string h = toLower(row[c]);
                    if (h == names[k] || (k == 0 && (h == "timestamp" || h == "time"))) {
                        columns[k] = static_cast<int>(c);
                        break;
                    }
                }
            }
            continue;
        }

        const int needed = *std::max_element(columns, columns + 5);
        if (static_cast<int>(row.size()) <= needed) {
            LOG_WARN("Skipping short row {} in {}", line_no, file_path);
            continue;
        }

        try {
            PriceBar bar;
            bar.date = parseDateCell(row[columns[0]]);
            bar.open = std::stod(row[columns[1]]);
            bar.high = std::stod(row[columns[2]]);
            bar.low = std::stod(row[columns[3]]);
            bar.close = std::stod(row[columns[4]]);
            bar.volume = (columns[5] < static_cast<int>(row.size()) && !row[columns[5]].empty())
                ? std::stod(row[columns[5]])
                : 0.0;
            bars.push_back(bar);
        } catch (const std::exception& e) {
            LOG_WARN("Error parsing row: {} - {}", line, e.what());
        }
    }

    sortByDate(bars);
    LOG_INFO("Loaded {} bars from {}", bars.size(), file_path);
    return bars;
}

PriceSeries DataHistory::loadJSON(const std::string& file_path) {
    PriceSeries bars;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open JSON file: {}", file_path);
        return bars;
    }

    try {
        nlohmann::json j;
        file >> j;
        const nlohmann::json& items = (j.is_object() && j.contains("bars")) ? j["bars"] : j;

        for (const auto& item : items) {
            PriceBar bar;
            if (item.contains("date")) bar.date = parseDateJson(item["date"]);
            else if (item.contains("d")) bar.date = parseDateJson(item["d"]);
            else if (item.contains("timestamp")) bar.date = parseDateJson(item["timestamp"]);
            else if (item.contains("t")) bar.date = parseDateJson(item["t"]);
            else {
                LOG_WARN("Skipping bar without a date in {}", file_path);
                continue;
            }

            readField(item, "open", "o", bar.open);
            readField(item, "high", "h", bar.high);
            readField(item, "low", "l", bar.low);
            if (!readField(item, "close", "c", bar.close)) {
                LOG_WARN("Skipping bar without a close in {}", file_path);
                continue;
            }
            readField(item, "volume", "v", bar.volume);

            // Close-only feeds
            if (bar.open == 0.0) bar.open = bar.close;
            if (bar.high == 0.0) bar.high = std::max(bar.open, bar.close);
            if (bar.low == 0.0) bar.low = std::min(bar.open, bar.close);

            bars.push_back(bar);
        }
        sortByDate(bars);

    } catch (const std::exception& e) {
        LOG_ERROR("Error parsing JSON file: {} - {}", file_path, e.what());
        bars.clear();
    }

    LOG_INFO("Loaded {} bars from {}", bars.size(), file_path);
    return bars;
}

PriceSeries DataHistory::filterByDate(const PriceSeries& bars, const Date& start, const Date& end) {
    PriceSeries filtered;
    const long long from = start.toDays();
    const long long to = end.toDays();
    for (const auto& bar : bars) {
        const long long d = bar.date.toDays();
        if (d >= from && d <= to) {
            filtered.push_back(bar);
        }
    }
    return filtered;
}

} // namespace backtest
} // namespace stratlab
