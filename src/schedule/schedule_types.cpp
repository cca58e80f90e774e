#include "schedule/schedule_types.hpp"

namespace snapkeep {

std::string toString(ScheduleMode mode) {
    switch (mode) {
        case ScheduleMode::Disabled:         return "disabled";
        case ScheduleMode::AtBoot:           return "at every boot";
        case ScheduleMode::Every5Min:        return "every 5 minutes";
        case ScheduleMode::Every10Min:       return "every 10 minutes";
        case ScheduleMode::Every30Min:       return "every 30 minutes";
        case ScheduleMode::Hourly:           return "every hour";
        case ScheduleMode::Every2H:          return "every 2 hours";
        case ScheduleMode::Every4H:          return "every 4 hours";
        case ScheduleMode::Every6H:          return "every 6 hours";
        case ScheduleMode::Every12H:         return "every 12 hours";
        case ScheduleMode::CustomHours:      return "custom hours";
        case ScheduleMode::Daily:            return "every day";
        case ScheduleMode::RepeatedInterval: return "repeatedly (anacron)";
        case ScheduleMode::OnDeviceConnect:  return "when drive gets connected";
        case ScheduleMode::Weekly:           return "every week";
        case ScheduleMode::Monthly:          return "every month";
        case ScheduleMode::Yearly:           return "every year";
    }
    return "unknown (" + std::to_string(toInt(mode)) + ")";
}

std::string toString(TimeUnit unit) {
    switch (unit) {
        case TimeUnit::Hour:  return "hour";
        case TimeUnit::Day:   return "day";
        case TimeUnit::Week:  return "week";
        case TimeUnit::Month: return "month";
        case TimeUnit::Year:  return "year";
    }
    return "unknown (" + std::to_string(toInt(unit)) + ")";
}

} // namespace snapkeep
