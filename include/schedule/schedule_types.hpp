#pragma once

#include <string>

namespace snapkeep {

// Persisted values. The gaps are intentional and the order matters: units are
// bucketed with "<=" against Hour/Day/Week/Month, so a new mode must be
// inserted at the value that keeps it inside the right bucket.
enum class ScheduleMode : int {
    Disabled = 0,
    AtBoot = 1,
    Every5Min = 2,
    Every10Min = 4,
    Every30Min = 7,
    Hourly = 10,
    Every2H = 12,
    Every4H = 14,
    Every6H = 16,
    Every12H = 18,
    CustomHours = 19,
    Daily = 20,
    RepeatedInterval = 25,
    OnDeviceConnect = 27,
    Weekly = 30,
    Monthly = 40,
    Yearly = 80
};

// Shares its granularity constants with ScheduleMode.
enum class TimeUnit : int {
    Hour = 10,
    Day = 20,
    Week = 30,
    Month = 40,
    Year = 80
};

enum class DiskUnit : int {
    MB = 10,
    GB = 20
};

constexpr int toInt(ScheduleMode mode) { return static_cast<int>(mode); }
constexpr int toInt(TimeUnit unit) { return static_cast<int>(unit); }
constexpr int toInt(DiskUnit unit) { return static_cast<int>(unit); }

// Unknown persisted values are kept as-is; the bucketing below still works on them.
constexpr ScheduleMode scheduleModeFromInt(int value) { return static_cast<ScheduleMode>(value); }
constexpr TimeUnit timeUnitFromInt(int value) { return static_cast<TimeUnit>(value); }
constexpr DiskUnit diskUnitFromInt(int value) { return static_cast<DiskUnit>(value); }

constexpr bool isHourScale(TimeUnit unit) { return toInt(unit) <= toInt(TimeUnit::Hour); }
constexpr bool isDayScale(TimeUnit unit) { return !isHourScale(unit) && toInt(unit) <= toInt(TimeUnit::Day); }
constexpr bool isWeekScale(TimeUnit unit) {
    return toInt(unit) > toInt(TimeUnit::Day) && toInt(unit) <= toInt(TimeUnit::Week);
}
// Month and everything coarser
constexpr bool isMonthScale(TimeUnit unit) { return toInt(unit) > toInt(TimeUnit::Week); }

std::string toString(ScheduleMode mode);
std::string toString(TimeUnit unit);

// Abstract schedule of one profile.
struct ScheduleSpec {
    ScheduleMode mode = ScheduleMode::Disabled;
    int time = 0;                       // HHMM, 0-2400
    int day = 1;                        // day of month, 1-28
    int weekday = 7;                    // 1 = Monday ... 7 = Sunday
    std::string customHours = "8,12,18,23";
    int repeatedPeriod = 1;
    TimeUnit repeatedUnit = TimeUnit::Day;

    int hour() const { return time / 100; }
    int minute() const { return time % 100; }
};

} // namespace snapkeep
