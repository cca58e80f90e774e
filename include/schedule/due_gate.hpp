#pragma once

#include "common/calendar.hpp"
#include "schedule/schedule_types.hpp"
#include <optional>
#include <string>

namespace snapkeep {

class ProfileSettings;

// Decides whether an elapsed-time ("anacron style") or device triggered
// schedule should run now. Every other mode is due whenever its trigger
// fires; the trigger cadence is authoritative for them.
class DueGate {
public:
    static bool consultsTimestamp(ScheduleMode mode);

    // Throws std::invalid_argument if the repeat period is not positive.
    bool isDue(const ScheduleSpec& spec, std::optional<TimePoint> lastRun, TimePoint now) const;

    // True if lastRun lies at least period units before now, with calendar
    // snapping for day, week and month granularity:
    //   hour  : now - lastRun >= period hours
    //   day   : date(lastRun) <= today - period days
    //   week  : date(lastRun) <  Monday of this week - (period - 1) weeks
    //   month : date(lastRun) <  monthReference(today, period)
    // Units coarser than month use the month walk as well.
    static bool olderThan(TimePoint lastRun, int period, TimeUnit unit, TimePoint now);
    static Date weekReference(const Date& today, int period);
    static Date monthReference(const Date& today, int period);

    // Reads the profile's timestamp file; unreadable counts as never run.
    bool isProfileDue(const ProfileSettings& settings, const std::string& profileId, TimePoint now) const;
    // Called once the backup actually completed.
    bool recordRun(const ProfileSettings& settings, const std::string& profileId, TimePoint now) const;
};

} // namespace snapkeep
