#include "schedule/due_gate.hpp"
#include "schedule/timestamp_store.hpp"
#include "config/profile_settings.hpp"
#include "common/logger.hpp"
#include <stdexcept>

namespace snapkeep {

bool DueGate::consultsTimestamp(ScheduleMode mode) {
    return mode == ScheduleMode::RepeatedInterval || mode == ScheduleMode::OnDeviceConnect;
}

bool DueGate::isDue(const ScheduleSpec& spec, std::optional<TimePoint> lastRun, TimePoint now) const {
    if (!consultsTimestamp(spec.mode)) {
        return true;
    }

    if (spec.repeatedPeriod < 1) {
        throw std::invalid_argument("Repeat period must be at least 1, got " +
                                    std::to_string(spec.repeatedPeriod));
    }

    if (!lastRun) {
        return true;
    }

    return olderThan(*lastRun, spec.repeatedPeriod, spec.repeatedUnit, now);
}

Date DueGate::weekReference(const Date& today, int period) {
    return today.mondayOfWeek().addDays(-7 * (period - 1));
}

Date DueGate::monthReference(const Date& today, int period) {
    // Starts one day before the last day of the previous month.
    Date reference = today.addDays(-(today.day + 1));
    for (int i = 0; i < period - 1; ++i) {
        reference = reference.previousMonth();
    }
    return reference;
}

bool DueGate::olderThan(TimePoint lastRun, int period, TimeUnit unit, TimePoint now) {
    if (isHourScale(unit)) {
        return now - lastRun >= std::chrono::hours(period);
    }

    Date lastDate = Date::fromTimePoint(lastRun);
    Date today = Date::fromTimePoint(now);

    if (isDayScale(unit)) {
        return lastDate <= today.addDays(-period);
    }
    if (isWeekScale(unit)) {
        return lastDate < weekReference(today, period);
    }
    return lastDate < monthReference(today, period);
}

bool DueGate::isProfileDue(const ProfileSettings& settings, const std::string& profileId, TimePoint now) const {
    ScheduleSpec spec = settings.scheduleSpec(profileId);
    if (!consultsTimestamp(spec.mode)) {
        return true;
    }

    TimestampStore timestamps(settings.anacronSpoolFile(profileId));
    auto lastRun = timestamps.read();
    bool due = isDue(spec, lastRun, now);

    if (lastRun) {
        Logger::debug("Profile " + profileId + " last ran " + TimestampStore::format(*lastRun) + ", every " +
                      std::to_string(spec.repeatedPeriod) + " " + toString(spec.repeatedUnit) +
                      (due ? ": due" : ": not due"));
    } else {
        Logger::debug("Profile " + profileId + " has no recorded run: due");
    }
    return due;
}

bool DueGate::recordRun(const ProfileSettings& settings, const std::string& profileId, TimePoint now) const {
    TimestampStore timestamps(settings.anacronSpoolFile(profileId));
    return timestamps.write(now);
}

} // namespace snapkeep
