#include "common/calendar.hpp"
#include <iomanip>
#include <sstream>
#include <tuple>

namespace snapkeep {

namespace {

// Noon keeps DST transitions from moving the result onto another day.
std::tm noonTm(int year, int month, int day) {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = 12;
    tm.tm_isdst = -1;
    return tm;
}

Date fromTm(const std::tm& tm) {
    return Date{tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday};
}

} // namespace

std::tm toLocalTm(TimePoint tp) {
    std::time_t t = Clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    return tm;
}

TimePoint makeLocalTime(int year, int month, int day, int hour, int minute, int second) {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    tm.tm_isdst = -1;
    return Clock::from_time_t(std::mktime(&tm));
}

Date Date::fromTimePoint(TimePoint tp) {
    return fromTm(toLocalTm(tp));
}

Date Date::today() {
    return fromTimePoint(Clock::now());
}

int Date::daysInMonth(int year, int month) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2) {
        bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
        return leap ? 29 : 28;
    }
    return kDays[month - 1];
}

Date Date::addDays(int days) const {
    std::tm tm = noonTm(year, month, day + days);
    std::mktime(&tm);
    return fromTm(tm);
}

Date Date::previousMonth() const {
    int y = year;
    int m = month;
    if (m == 1) {
        m = 12;
        --y;
    } else {
        --m;
    }
    int d = day;
    int last = daysInMonth(y, m);
    if (d > last) {
        d = last;
    }
    return Date{y, m, d};
}

int Date::weekday() const {
    std::tm tm = noonTm(year, month, day);
    std::mktime(&tm);
    // tm_wday counts from Sunday
    return (tm.tm_wday + 6) % 7;
}

Date Date::mondayOfWeek() const {
    return addDays(-weekday());
}

TimePoint Date::startOfDay() const {
    return makeLocalTime(year, month, day);
}

std::string Date::toString() const {
    std::stringstream ss;
    ss << std::setfill('0') << std::setw(4) << year << "-"
       << std::setw(2) << month << "-"
       << std::setw(2) << day;
    return ss.str();
}

bool Date::operator==(const Date& other) const {
    return year == other.year && month == other.month && day == other.day;
}

bool Date::operator<(const Date& other) const {
    return std::tie(year, month, day) < std::tie(other.year, other.month, other.day);
}

} // namespace snapkeep
