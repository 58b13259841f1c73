#pragma once

#include <string>

namespace stratlab {

// Civil calendar date (proleptic Gregorian). Bars are daily, so no time of day.
struct Date {
    int year;
    int month;   // 1-12
    int day;     // 1-31

    Date() : year(1970), month(1), day(1) {}
    Date(int y, int m, int d) : year(y), month(m), day(d) {}

    // Days since 1970-01-01
    long long toDays() const;
    static Date fromDays(long long days);

    // "YYYY-MM-DD"; throws std::invalid_argument on malformed input
    static Date parse(const std::string& text);
    std::string toString() const;

    Date addDays(long long n) const { return fromDays(toDays() + n); }
    int dayOfWeek() const;  // 0 = Sunday
    bool isValid() const;

    static Date today();
    static long long daysBetween(const Date& from, const Date& to) {
        return to.toDays() - from.toDays();
    }

    bool operator==(const Date& o) const { return year == o.year && month == o.month && day == o.day; }
    bool operator!=(const Date& o) const { return !(*this == o); }
    bool operator<(const Date& o) const { return toDays() < o.toDays(); }
    bool operator<=(const Date& o) const { return toDays() <= o.toDays(); }
    bool operator>(const Date& o) const { return toDays() > o.toDays(); }
    bool operator>=(const Date& o) const { return toDays() >= o.toDays(); }
};

const char* monthName(int month);
const char* monthShortName(int month);

// Accepts "Jan", "january", "1"; returns 0 when unknown
int parseMonth(const std::string& text);

} // namespace stratlab
