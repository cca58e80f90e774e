#include "config/profile_settings.hpp"
#include "common/error_notifier.hpp"
#include "common/logger.hpp"
#include "common/shell_words.hpp"
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <pwd.h>
#include <unistd.h>

namespace snapkeep {

using json = nlohmann::json;

namespace {

const char* kDefaultSshPrefix = "PATH=/opt/bin:/opt/sbin:\\$PATH";
const int kMinSshMaxArgLength = 700;

std::string homeDirectory() {
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return home;
    }
    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_dir) {
        return pw->pw_dir;
    }
    return "/tmp";
}

std::string hostName() {
    char buffer[256] = {0};
    if (gethostname(buffer, sizeof(buffer) - 1) != 0) {
        return "localhost";
    }
    return buffer;
}

std::string userName() {
    const char* user = std::getenv("USER");
    if (user && *user) {
        return user;
    }
    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_name) {
        return pw->pw_name;
    }
    return "unknown";
}

std::string profileNotice(const std::string& name, const std::string& message) {
    return "Profile: \"" + name + "\"\n" + message;
}

} // namespace

ConfigPaths ConfigPaths::defaults(const std::string& configPath) {
    std::filesystem::path home = homeDirectory();
    ConfigPaths paths;
    paths.defaultConfigPath = (home / ".config" / "snapkeep" / "config.json").string();
    paths.dataDir = (home / ".local" / "share" / "snapkeep").string();
    if (configPath.empty()) {
        paths.configPath = paths.defaultConfigPath;
    } else {
        paths.configPath = std::filesystem::absolute(configPath).lexically_normal().string();
    }
    return paths;
}

ProfileSettings::ProfileSettings(ConfigStore& store, ConfigPaths paths)
    : store_(store)
    , paths_(std::move(paths)) {
}

bool ProfileSettings::usesDefaultConfigPath() const {
    return paths_.configPath == paths_.defaultConfigPath;
}

ScheduleMode ProfileSettings::scheduleMode(const std::string& profileId) const {
    return scheduleModeFromInt(store_.profileIntValue("schedule.mode", toInt(ScheduleMode::Disabled), profileId));
}

int ProfileSettings::scheduleTime(const std::string& profileId) const {
    return store_.profileIntValue("schedule.time", 0, profileId);
}

int ProfileSettings::scheduleDay(const std::string& profileId) const {
    return store_.profileIntValue("schedule.day", 1, profileId);
}

int ProfileSettings::scheduleWeekday(const std::string& profileId) const {
    return store_.profileIntValue("schedule.weekday", 7, profileId);
}

std::string ProfileSettings::customBackupTime(const std::string& profileId) const {
    return store_.profileStrValue("schedule.custom_time", "8,12,18,23", profileId);
}

int ProfileSettings::scheduleRepeatedPeriod(const std::string& profileId) const {
    return store_.profileIntValue("schedule.repeatedly.period", 1, profileId);
}

TimeUnit ProfileSettings::scheduleRepeatedUnit(const std::string& profileId) const {
    return timeUnitFromInt(store_.profileIntValue("schedule.repeatedly.unit", toInt(TimeUnit::Day), profileId));
}

bool ProfileSettings::scheduleDebug(const std::string& profileId) const {
    return store_.profileBoolValue("schedule.debug", false, profileId);
}

ScheduleSpec ProfileSettings::scheduleSpec(const std::string& profileId) const {
    ScheduleSpec spec;
    spec.mode = scheduleMode(profileId);
    spec.time = scheduleTime(profileId);
    spec.day = scheduleDay(profileId);
    spec.weekday = scheduleWeekday(profileId);
    spec.customHours = customBackupTime(profileId);
    spec.repeatedPeriod = scheduleRepeatedPeriod(profileId);
    spec.repeatedUnit = scheduleRepeatedUnit(profileId);
    return spec;
}

void ProfileSettings::setScheduleSpec(const ScheduleSpec& spec, const std::string& profileId) {
    store_.setProfileIntValue("schedule.mode", toInt(spec.mode), profileId);
    store_.setProfileIntValue("schedule.time", spec.time, profileId);
    store_.setProfileIntValue("schedule.day", spec.day, profileId);
    store_.setProfileIntValue("schedule.weekday", spec.weekday, profileId);
    store_.setProfileStrValue("schedule.custom_time", spec.customHours, profileId);
    store_.setProfileIntValue("schedule.repeatedly.period", spec.repeatedPeriod, profileId);
    store_.setProfileIntValue("schedule.repeatedly.unit", toInt(spec.repeatedUnit), profileId);
}

AgeRetention ProfileSettings::removeOldSnapshots(const std::string& profileId) const {
    AgeRetention age;
    age.enabled = store_.profileBoolValue("snapshots.remove_old_snapshots.enabled", true, profileId);
    age.value = store_.profileIntValue("snapshots.remove_old_snapshots.value", 10, profileId);
    age.unit = timeUnitFromInt(
        store_.profileIntValue("snapshots.remove_old_snapshots.unit", toInt(TimeUnit::Year), profileId));
    return age;
}

SpaceRetention ProfileSettings::minFreeSpace(const std::string& profileId) const {
    SpaceRetention space;
    space.enabled = store_.profileBoolValue("snapshots.min_free_space.enabled", true, profileId);
    space.value = store_.profileIntValue("snapshots.min_free_space.value", 1, profileId);
    space.unit = diskUnitFromInt(
        store_.profileIntValue("snapshots.min_free_space.unit", toInt(DiskUnit::GB), profileId));
    return space;
}

InodeRetention ProfileSettings::minFreeInodes(const std::string& profileId) const {
    InodeRetention inodes;
    inodes.enabled = store_.profileBoolValue("snapshots.min_free_inodes.enabled", true, profileId);
    inodes.percent = store_.profileIntValue("snapshots.min_free_inodes.value", 2, profileId);
    return inodes;
}

SmartRetention ProfileSettings::smartRemove(const std::string& profileId) const {
    SmartRetention smart;
    smart.enabled = store_.profileBoolValue("snapshots.smart_remove", false, profileId);
    smart.keepAllDays = store_.profileIntValue("snapshots.smart_remove.keep_all", 2, profileId);
    smart.keepOnePerDayDays = store_.profileIntValue("snapshots.smart_remove.keep_one_per_day", 7, profileId);
    smart.keepOnePerWeekWeeks = store_.profileIntValue("snapshots.smart_remove.keep_one_per_week", 4, profileId);
    smart.keepOnePerMonthMonths =
        store_.profileIntValue("snapshots.smart_remove.keep_one_per_month", 24, profileId);
    smart.keepNamedSnapshots = store_.profileBoolValue("snapshots.dont_remove_named_snapshots", true, profileId);
    return smart;
}

RetentionSpec ProfileSettings::retention(const std::string& profileId) const {
    RetentionSpec spec;
    spec.age = removeOldSnapshots(profileId);
    spec.space = minFreeSpace(profileId);
    spec.inodes = minFreeInodes(profileId);
    spec.smart = smartRemove(profileId);
    return spec;
}

void ProfileSettings::setRemoveOldSnapshots(const AgeRetention& age, const std::string& profileId) {
    store_.setProfileBoolValue("snapshots.remove_old_snapshots.enabled", age.enabled, profileId);
    store_.setProfileIntValue("snapshots.remove_old_snapshots.value", age.value, profileId);
    store_.setProfileIntValue("snapshots.remove_old_snapshots.unit", toInt(age.unit), profileId);
}

void ProfileSettings::setMinFreeSpace(const SpaceRetention& space, const std::string& profileId) {
    store_.setProfileBoolValue("snapshots.min_free_space.enabled", space.enabled, profileId);
    store_.setProfileIntValue("snapshots.min_free_space.value", space.value, profileId);
    store_.setProfileIntValue("snapshots.min_free_space.unit", toInt(space.unit), profileId);
}

void ProfileSettings::setMinFreeInodes(const InodeRetention& inodes, const std::string& profileId) {
    store_.setProfileBoolValue("snapshots.min_free_inodes.enabled", inodes.enabled, profileId);
    store_.setProfileIntValue("snapshots.min_free_inodes.value", inodes.percent, profileId);
}

void ProfileSettings::setSmartRemove(const SmartRetention& smart, const std::string& profileId) {
    store_.setProfileBoolValue("snapshots.smart_remove", smart.enabled, profileId);
    store_.setProfileIntValue("snapshots.smart_remove.keep_all", smart.keepAllDays, profileId);
    store_.setProfileIntValue("snapshots.smart_remove.keep_one_per_day", smart.keepOnePerDayDays, profileId);
    store_.setProfileIntValue("snapshots.smart_remove.keep_one_per_week", smart.keepOnePerWeekWeeks, profileId);
    store_.setProfileIntValue("snapshots.smart_remove.keep_one_per_month", smart.keepOnePerMonthMonths, profileId);
    store_.setProfileBoolValue("snapshots.dont_remove_named_snapshots", smart.keepNamedSnapshots, profileId);
}

std::string ProfileSettings::snapshotsMode(const std::string& profileId) const {
    return store_.profileStrValue("snapshots.mode", "local", profileId);
}

std::string ProfileSettings::snapshotsPath(const std::string& profileId) const {
    return store_.profileStrValue("snapshots.path", "", profileId);
}

std::string ProfileSettings::snapshotsFullPath(const std::string& profileId) const {
    std::string host = store_.profileStrValue("snapshots.path.host", hostName(), profileId);
    std::string user = store_.profileStrValue("snapshots.path.user", userName(), profileId);
    std::string profile = store_.profileStrValue("snapshots.path.profile", profileId, profileId);
    return (std::filesystem::path(snapshotsPath(profileId)) / "snapkeep" / host / user / profile).string();
}

std::string ProfileSettings::localEncfsPath(const std::string& profileId) const {
    return store_.profileStrValue("snapshots.local_encfs.path", "", profileId);
}

std::string ProfileSettings::cachedDeviceUuid(const std::string& profileId) const {
    return store_.profileStrValue("snapshots.path.uuid", "", profileId);
}

void ProfileSettings::setCachedDeviceUuid(const std::string& uuid, const std::string& profileId) {
    store_.setProfileStrValue("snapshots.path.uuid", uuid, profileId);
}

std::vector<IncludeEntry> ProfileSettings::include(const std::string& profileId) const {
    std::vector<IncludeEntry> result;
    for (const auto& item : store_.profileListValue("snapshots.include", profileId)) {
        if (!item.is_object() || !item.contains("value") || !item["value"].is_string()) {
            Logger::warning("Skipping malformed include entry of profile " + profileId + ": " + item.dump());
            continue;
        }
        IncludeEntry entry;
        entry.path = item["value"].get<std::string>();
        entry.type = item.value("type", 0);
        result.push_back(entry);
    }
    return result;
}

void ProfileSettings::setInclude(const std::vector<IncludeEntry>& values, const std::string& profileId) {
    json list = json::array();
    for (const auto& entry : values) {
        list.push_back({{"value", entry.path}, {"type", entry.type}});
    }
    store_.setProfileListValue("snapshots.include", list, profileId);
}

std::vector<std::string> ProfileSettings::exclude(const std::string& profileId) const {
    if (!store_.hasProfileKey("snapshots.exclude", profileId)) {
        return defaultExclude();
    }
    std::vector<std::string> result;
    for (const auto& item : store_.profileListValue("snapshots.exclude", profileId)) {
        if (item.is_string()) {
            result.push_back(item.get<std::string>());
        }
    }
    return result;
}

void ProfileSettings::setExclude(const std::vector<std::string>& values, const std::string& profileId) {
    store_.setProfileListValue("snapshots.exclude", json(values), profileId);
}

bool ProfileSettings::niceOnCron(const std::string& profileId) const {
    return store_.profileBoolValue("snapshots.cron.nice", true, profileId);
}

bool ProfileSettings::ioniceOnCron(const std::string& profileId) const {
    return store_.profileBoolValue("snapshots.cron.ionice", true, profileId);
}

bool ProfileSettings::redirectStdoutInCron(const std::string& profileId) const {
    return store_.profileBoolValue("snapshots.cron.redirect_stdout", true, profileId);
}

bool ProfileSettings::redirectStderrInCron(const std::string& profileId) const {
    return store_.profileBoolValue("snapshots.cron.redirect_stderr", isConfigured(profileId), profileId);
}

int ProfileSettings::sshMaxArgLength(const std::string& profileId) const {
    int value = store_.profileIntValue("snapshots.ssh.max_arg_length", 0, profileId);
    if (value != 0 && value < kMinSshMaxArgLength) {
        throw std::invalid_argument("SSH max arg length " + std::to_string(value) +
                                    " is too low to run commands");
    }
    return value;
}

bool ProfileSettings::sshPrefixEnabled(const std::string& profileId) const {
    return store_.profileBoolValue("snapshots.ssh.prefix.enabled", false, profileId);
}

std::string ProfileSettings::sshPrefix(const std::string& profileId) const {
    return store_.profileStrValue("snapshots.ssh.prefix.value", kDefaultSshPrefix, profileId);
}

std::vector<std::string> ProfileSettings::sshPrefixTokens(const std::string& profileId) const {
    if (!sshPrefixEnabled(profileId)) {
        return {};
    }
    return shell::split(sshPrefix(profileId));
}

std::string ProfileSettings::sshPrefixShellString(const std::string& profileId) const {
    if (!sshPrefixEnabled(profileId)) {
        return "";
    }
    std::string prefix = sshPrefix(profileId);
    size_t first = prefix.find_first_not_of(" \t\n");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = prefix.find_last_not_of(" \t\n");
    return prefix.substr(first, last - first + 1) + " ";
}

std::string ProfileSettings::snapshotCommand() const {
    return store_.strValue("global.snapshot_command", "");
}

std::string ProfileSettings::fileId(const std::string& profileId) const {
    return profileId == "1" ? "" : profileId;
}

std::string ProfileSettings::anacronSpool() const {
    return (std::filesystem::path(paths_.dataDir) / "anacron").string();
}

std::string ProfileSettings::anacronJobIdentify(const std::string& profileId) const {
    std::string name = profileName(profileId);
    for (auto& c : name) {
        if (c == ' ') {
            c = '_';
        }
    }
    return profileId + "_" + name;
}

std::string ProfileSettings::anacronSpoolFile(const std::string& profileId) const {
    return (std::filesystem::path(anacronSpool()) / anacronJobIdentify(profileId)).string();
}

std::string ProfileSettings::takeSnapshotInstanceFile(const std::string& profileId) const {
    return (std::filesystem::path(paths_.dataDir) / ("worker" + fileId(profileId) + ".lock")).string();
}

std::string ProfileSettings::logFile() const {
    return (std::filesystem::path(paths_.dataDir) / "snapkeep.log").string();
}

bool ProfileSettings::isConfigured(const std::string& profileId) const {
    std::string path = snapshotsPath(profileId);
    bool hasIncludes = !store_.profileListValue("snapshots.include", profileId).empty();
    if (path.empty() || !hasIncludes) {
        Logger::debug("Profile " + profileId + " is not configured: snapshot path is " +
                      (path.empty() ? "empty" : "set") + ", includes are " + (hasIncludes ? "set" : "empty"));
        return false;
    }
    return true;
}

bool ProfileSettings::checkConfig(ErrorNotifier& notifier) const {
    for (const auto& profileId : profiles()) {
        std::string name = profileName(profileId);
        std::string path = snapshotsPath(profileId);
        Logger::debug("Check profile " + name);

        if (path.empty()) {
            notifier.notifyError(profileNotice(name, "Snapshots folder is not valid!"));
            return false;
        }

        auto includes = include(profileId);
        if (includes.empty()) {
            notifier.notifyError(profileNotice(name, "You must select at least one folder to back up!"));
            return false;
        }

        std::string pathWithSlash = path + "/";
        for (const auto& entry : includes) {
            if (entry.type != 0) {
                continue;
            }
            if (entry.path == path) {
                notifier.notifyError(profileNotice(name, "Backup folder cannot be included."));
                return false;
            }
            if (entry.path.compare(0, pathWithSlash.size(), pathWithSlash) == 0) {
                notifier.notifyError(profileNotice(name, "Backup sub-folder cannot be included."));
                return false;
            }
        }
    }
    return true;
}

const std::vector<std::string>& ProfileSettings::defaultExclude() {
    static const std::vector<std::string> kDefaultExclude = {
        ".gvfs",
        ".cache/*",
        ".thumbnails*",
        ".local/share/[Tt]rash*",
        "*.backup*",
        "*~",
        ".dropbox*",
        "/proc/*",
        "/sys/*",
        "/dev/*",
        "/run/*",
        "/etc/mtab",
        "/var/cache/apt/archives/*.deb",
        "lost+found/*",
        "/tmp/*",
        "/var/tmp/*",
        "/var/backups/*",
        ".Private",
        "/swapfile",
        "SingletonLock",
        "SingletonCookie",
        "lock"
    };
    return kDefaultExclude;
}

} // namespace snapkeep
