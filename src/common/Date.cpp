#include "common/Date.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace stratlab {

namespace {
const char* kMonthNames[] = {
    "January", "February", "March", "April", "May", "June",
    "July", "August", "September", "October", "November", "December"
};

const char* kMonthShortNames[] = {
    "Jan", "Feb", "Mar", "Apr", "May", "Jun",
    "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"
};

int daysInMonth(int year, int month) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2) {
        const bool leap = (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
        return leap ? 29 : 28;
    }
    return kDays[month - 1];
}
}

// Howard Hinnant's days_from_civil
long long Date::toDays() const {
    const long long y = static_cast<long long>(year) - (month <= 2 ? 1 : 0);
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const long long yoe = y - era * 400;
    const long long mp = (month + 9) % 12;
    const long long doy = (153 * mp + 2) / 5 + day - 1;
    const long long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

Date Date::fromDays(long long days) {
    days += 719468;
    const long long era = (days >= 0 ? days : days - 146096) / 146097;
    const long long doe = days - era * 146097;
    const long long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const long long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const long long mp = (5 * doy + 2) / 153;
    const int d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    const int m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    const long long y = yoe + era * 400 + (m <= 2 ? 1 : 0);
    return Date(static_cast<int>(y), m, d);
}

Date Date::parse(const std::string& text) {
    int y = 0, m = 0, d = 0;
    char tail = '\0';
    // Accept a trailing time component ("2024-01-02T00:00:00") by reading only the date part.
    const int n = std::sscanf(text.c_str(), "%4d-%2d-%2d%c", &y, &m, &d, &tail);
    if (n < 3 || (n == 4 && tail != 'T' && tail != ' ')) {
        throw std::invalid_argument("Invalid date: " + text);
    }
    Date date(y, m, d);
    if (!date.isValid()) {
        throw std::invalid_argument("Invalid date: " + text);
    }
    return date;
}

std::string Date::toString() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    return buf;
}

int Date::dayOfWeek() const {
    const long long z = toDays();
    return static_cast<int>(((z % 7) + 7 + 4) % 7);
}

bool Date::isValid() const {
    if (month < 1 || month > 12 || day < 1) return false;
    return day <= daysInMonth(year, month);
}

Date Date::today() {
    const auto now = std::chrono::system_clock::now();
    const auto secs = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
    return fromDays(secs / 86400);
}

const char* monthName(int month) {
    if (month < 1 || month > 12) return "Unknown";
    return kMonthNames[month - 1];
}

const char* monthShortName(int month) {
    if (month < 1 || month > 12) return "???";
    return kMonthShortNames[month - 1];
}

int parseMonth(const std::string& text) {
    std::string s;
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    if (s.empty()) return 0;
    if (s.size() <= 2 && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); })) {
        const int m = std::stoi(s);
        return (m >= 1 && m <= 12) ? m : 0;
    }
    for (int i = 0; i < 12; ++i) {
        std::string full = kMonthNames[i];
        std::transform(full.begin(), full.end(), full.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (s == full || (s.size() >= 3 && full.compare(0, s.size(), s) == 0)) {
            return i + 1;
        }
    }
    return 0;
}

} // namespace stratlab
