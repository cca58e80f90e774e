#include "schedule/schedule_compiler.hpp"
#include "schedule/cron_command.hpp"
#include "schedule/crontab.hpp"
#include "schedule/device_resolver.hpp"
#include "schedule/udev_rules.hpp"
#include "config/profile_settings.hpp"
#include "common/error_notifier.hpp"
#include "common/logger.hpp"

namespace snapkeep {

CompiledSchedule CompiledSchedule::cron(std::string minute, std::string hour, std::string dayOfMonth,
                                        std::string month, std::string dayOfWeek) {
    CompiledSchedule schedule;
    schedule.kind = Kind::Cron;
    schedule.minute = std::move(minute);
    schedule.hour = std::move(hour);
    schedule.dayOfMonth = std::move(dayOfMonth);
    schedule.month = std::move(month);
    schedule.dayOfWeek = std::move(dayOfWeek);
    return schedule;
}

CompiledSchedule CompiledSchedule::atReboot() {
    CompiledSchedule schedule;
    schedule.kind = Kind::Cron;
    schedule.special = "@reboot";
    return schedule;
}

CompiledSchedule CompiledSchedule::device(std::string uuid) {
    CompiledSchedule schedule;
    schedule.kind = Kind::Device;
    schedule.uuid = std::move(uuid);
    return schedule;
}

std::string CompiledSchedule::timeSpec() const {
    if (kind != Kind::Cron) {
        return "";
    }
    if (!special.empty()) {
        return special;
    }
    return minute + " " + hour + " " + dayOfMonth + " " + month + " " + dayOfWeek;
}

std::string CompiledSchedule::toCronLine(const std::string& command) const {
    if (kind != Kind::Cron) {
        return "";
    }
    // cron turns an unescaped % into a newline, even inside quotes.
    std::string escaped;
    for (char c : command) {
        if (c == '%') {
            escaped += '\\';
        }
        escaped += c;
    }
    return timeSpec() + " " + escaped;
}

ScheduleCompiler::ScheduleCompiler(ProfileSettings& settings,
                                   const DeviceResolver& resolver,
                                   UdevRuleSink& udev,
                                   ErrorNotifier& notifier,
                                   const CronCommandBuilder& commands)
    : settings_(settings)
    , resolver_(resolver)
    , udev_(udev)
    , notifier_(notifier)
    , commands_(commands) {
}

CompiledSchedule ScheduleCompiler::compile(const ScheduleSpec& spec) {
    const std::string minute = std::to_string(spec.minute());
    const std::string hour = std::to_string(spec.hour());

    switch (spec.mode) {
        case ScheduleMode::Disabled:
            return CompiledSchedule::empty();
        case ScheduleMode::AtBoot:
            return CompiledSchedule::atReboot();
        case ScheduleMode::Every5Min:
            return CompiledSchedule::cron("*/5", "*", "*", "*", "*");
        case ScheduleMode::Every10Min:
            return CompiledSchedule::cron("*/10", "*", "*", "*", "*");
        case ScheduleMode::Every30Min:
            return CompiledSchedule::cron("*/30", "*", "*", "*", "*");
        case ScheduleMode::Hourly:
            return CompiledSchedule::cron("0", "*", "*", "*", "*");
        case ScheduleMode::Every2H:
            return CompiledSchedule::cron("0", "*/2", "*", "*", "*");
        case ScheduleMode::Every4H:
            return CompiledSchedule::cron("0", "*/4", "*", "*", "*");
        case ScheduleMode::Every6H:
            return CompiledSchedule::cron("0", "*/6", "*", "*", "*");
        case ScheduleMode::Every12H:
            return CompiledSchedule::cron("0", "*/12", "*", "*", "*");
        case ScheduleMode::CustomHours:
            return CompiledSchedule::cron("0", spec.customHours, "*", "*", "*");
        case ScheduleMode::Daily:
            return CompiledSchedule::cron(minute, hour, "*", "*", "*");
        case ScheduleMode::RepeatedInterval:
            // Fire often enough for the due gate to catch the deadline.
            if (toInt(spec.repeatedUnit) <= toInt(TimeUnit::Day)) {
                return CompiledSchedule::cron("*/15", "*", "*", "*", "*");
            }
            return CompiledSchedule::cron("0", "*", "*", "*", "*");
        case ScheduleMode::OnDeviceConnect:
            return CompiledSchedule::device("");
        case ScheduleMode::Weekly:
            return CompiledSchedule::cron(minute, hour, "*", "*", std::to_string(spec.weekday));
        case ScheduleMode::Monthly:
            return CompiledSchedule::cron(minute, hour, std::to_string(spec.day), "*", "*");
        case ScheduleMode::Yearly:
            return CompiledSchedule::cron(minute, hour, "1", "1", "*");
    }

    Logger::warning("Unknown schedule mode " + std::to_string(toInt(spec.mode)));
    return CompiledSchedule::empty();
}

void ScheduleCompiler::reportError(const std::string& profileId, const std::string& message) {
    notifier_.notifyError("Profile: \"" + settings_.profileName(profileId) + "\"\n" + message);
}

CompiledSchedule ScheduleCompiler::compileDeviceTrigger(const std::string& profileId) {
    if (!udev_.isReady()) {
        reportError(profileId, "Could not install udev rule for profile " + profileId +
                               ". The udev rules directory is not writable");
    }

    std::string mode = settings_.snapshotsMode(profileId);
    std::string destination;
    if (mode == "local") {
        destination = settings_.snapshotsFullPath(profileId);
    } else if (mode == "local_encfs") {
        destination = settings_.localEncfsPath(profileId);
    } else {
        reportError(profileId, "Schedule udev doesn't work with mode " + mode);
        return CompiledSchedule::empty();
    }

    std::string uuid;
    if (auto resolved = resolver_.uuidFromPath(destination)) {
        uuid = *resolved;
        settings_.setCachedDeviceUuid(uuid, profileId);
    } else {
        // Drive may simply not be connected right now.
        uuid = settings_.cachedDeviceUuid(profileId);
        if (uuid.empty()) {
            reportError(profileId, "Couldn't find UUID for \"" + destination + "\"");
            return CompiledSchedule::empty();
        }
        Logger::debug("Using cached UUID " + uuid + " for profile " + profileId);
    }

    try {
        udev_.addRule(commands_.compileAsShellString(profileId), uuid);
    } catch (const InvalidUdevCommand& e) {
        reportError(profileId, e.what());
        return CompiledSchedule::empty();
    }
    return CompiledSchedule::device(uuid);
}

CompiledSchedule ScheduleCompiler::compileProfile(const std::string& profileId) {
    ScheduleSpec spec = settings_.scheduleSpec(profileId);
    Logger::debug("Profile: " + settings_.profileName(profileId) + " | Automatic backup: " +
                  toString(spec.mode));

    if (spec.mode == ScheduleMode::OnDeviceConnect) {
        return compileDeviceTrigger(profileId);
    }
    return compile(spec);
}

std::vector<std::string> ScheduleCompiler::compileAll() {
    std::vector<std::string> lines;
    for (const auto& profileId : settings_.profiles()) {
        try {
            CompiledSchedule schedule = compileProfile(profileId);
            if (schedule.isCron()) {
                lines.push_back(schedule.toCronLine(commands_.compileAsShellString(profileId)));
            }
        } catch (const std::exception& e) {
            reportError(profileId, std::string("Failed to compile schedule: ") + e.what());
        }
    }
    return lines;
}

bool ScheduleCompiler::setupSchedules(const Crontab& crontab) {
    udev_.clean();
    std::vector<std::string> lines = compileAll();

    bool ok = true;
    if (!udev_.save()) {
        notifier_.notifyError("Failed to save udev rules");
        ok = false;
    }
    switch (crontab.install(lines)) {
        case Crontab::InstallResult::Failed:
            notifier_.notifyError("Failed to write new crontab");
            ok = false;
            break;
        case Crontab::InstallResult::Written:
            if (!crontab.isDaemonRunning()) {
                Logger::error("Cron is not running, scheduled snapshots will not run");
                notifier_.notifyError("Cron is not running despite the crontab command being available. "
                                      "Scheduled snapshots will not run. Cron might be installed but not "
                                      "enabled, try \"systemctl enable cron\".");
            }
            break;
        case Crontab::InstallResult::Unchanged:
            break;
    }
    return ok;
}

} // namespace snapkeep
