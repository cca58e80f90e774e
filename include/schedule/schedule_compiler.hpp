#pragma once

#include "schedule/schedule_types.hpp"
#include <string>
#include <vector>

namespace snapkeep {

class ProfileSettings;
class DeviceResolver;
class UdevRuleSink;
class ErrorNotifier;
class CronCommandBuilder;
class Crontab;

// Trigger of one profile.
struct CompiledSchedule {
    enum class Kind {
        Empty,
        Cron,
        Device
    };

    Kind kind = Kind::Empty;
    std::string special;    // "@reboot" instead of the five fields
    std::string minute;
    std::string hour;
    std::string dayOfMonth;
    std::string month;
    std::string dayOfWeek;
    std::string uuid;       // Device only

    static CompiledSchedule empty() { return CompiledSchedule(); }
    static CompiledSchedule cron(std::string minute, std::string hour, std::string dayOfMonth,
                                 std::string month, std::string dayOfWeek);
    static CompiledSchedule atReboot();
    static CompiledSchedule device(std::string uuid);

    bool isEmpty() const { return kind == Kind::Empty; }
    bool isCron() const { return kind == Kind::Cron; }
    bool isDevice() const { return kind == Kind::Device; }

    // "M H D M W" or the special form; empty unless kind is Cron.
    std::string timeSpec() const;
    // Cron line running command, with % escaped; empty unless kind is Cron.
    std::string toCronLine(const std::string& command) const;
};

// Turns the schedule settings of every profile into crontab lines and
// udev rules.
class ScheduleCompiler {
public:
    ScheduleCompiler(ProfileSettings& settings,
                     const DeviceResolver& resolver,
                     UdevRuleSink& udev,
                     ErrorNotifier& notifier,
                     const CronCommandBuilder& commands);

    // Timing part of the schedule only. OnDeviceConnect yields a Device
    // schedule without a UUID; unknown modes yield Empty.
    static CompiledSchedule compile(const ScheduleSpec& spec);

    // Full compilation of one profile. Device schedules resolve the UUID of
    // the destination and register a udev rule. Failures are notified and
    // give an Empty schedule.
    CompiledSchedule compileProfile(const std::string& profileId);

    // Cron lines of all profiles. Profiles that are unscheduled, device
    // triggered or failed are left out.
    std::vector<std::string> compileAll();

    // Rebuilds the udev rules and the managed crontab entries.
    bool setupSchedules(const Crontab& crontab);

private:
    CompiledSchedule compileDeviceTrigger(const std::string& profileId);
    void reportError(const std::string& profileId, const std::string& message);

    ProfileSettings& settings_;
    const DeviceResolver& resolver_;
    UdevRuleSink& udev_;
    ErrorNotifier& notifier_;
    const CronCommandBuilder& commands_;
};

} // namespace snapkeep
