#pragma once

#include <chrono>
#include <ctime>
#include <string>

namespace snapkeep {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Calendar date in the local time zone. Arithmetic goes through std::mktime,
// which normalizes out-of-range fields the same way the schedule code does.
struct Date {
    int year = 1;
    int month = 1;   // 1-12
    int day = 1;     // 1-31

    static Date fromTimePoint(TimePoint tp);
    static Date today();
    // 0001-01-01, "before every snapshot"
    static Date minimum() { return Date{1, 1, 1}; }
    static int daysInMonth(int year, int month);

    Date addDays(int days) const;
    Date previousMonth() const;     // day clamped to the length of the target month
    int weekday() const;            // 0 = Monday ... 6 = Sunday
    Date mondayOfWeek() const;
    TimePoint startOfDay() const;   // local midnight
    std::string toString() const;   // YYYY-MM-DD

    bool operator==(const Date& other) const;
    bool operator!=(const Date& other) const { return !(*this == other); }
    bool operator<(const Date& other) const;
    bool operator<=(const Date& other) const { return !(other < *this); }
    bool operator>(const Date& other) const { return other < *this; }
    bool operator>=(const Date& other) const { return !(*this < other); }
};

// Local wall-clock instant, e.g. makeLocalTime(2024, 5, 2, 13, 45).
TimePoint makeLocalTime(int year, int month, int day, int hour = 0, int minute = 0, int second = 0);
std::tm toLocalTm(TimePoint tp);

} // namespace snapkeep
