#pragma once

#include "config/config_store.hpp"
#include "retention/retention_types.hpp"
#include "schedule/schedule_types.hpp"
#include <string>
#include <vector>

namespace snapkeep {

class ErrorNotifier;

// Where things live on disk for one invocation.
struct ConfigPaths {
    std::string configPath;         // file actually in use
    std::string defaultConfigPath;  // ~/.config/snapkeep/config.json
    std::string dataDir;            // ~/.local/share/snapkeep

    // Defaults derived from $HOME; configPath overrides the config file.
    static ConfigPaths defaults(const std::string& configPath = "");
};

struct IncludeEntry {
    std::string path;
    int type = 0;   // 0 = folder, 1 = file

    bool operator==(const IncludeEntry& other) const {
        return path == other.path && type == other.type;
    }
};

// Typed, defaulted view on the settings of the profiles in a ConfigStore.
class ProfileSettings {
public:
    ProfileSettings(ConfigStore& store, ConfigPaths paths);

    ConfigStore& store() { return store_; }
    const ConfigStore& store() const { return store_; }
    const ConfigPaths& paths() const { return paths_; }
    bool usesDefaultConfigPath() const;

    std::vector<std::string> profiles() const { return store_.profiles(); }
    std::string profileName(const std::string& profileId) const { return store_.profileName(profileId); }

    // Schedule
    ScheduleMode scheduleMode(const std::string& profileId) const;
    int scheduleTime(const std::string& profileId) const;
    int scheduleDay(const std::string& profileId) const;
    int scheduleWeekday(const std::string& profileId) const;
    std::string customBackupTime(const std::string& profileId) const;
    int scheduleRepeatedPeriod(const std::string& profileId) const;
    TimeUnit scheduleRepeatedUnit(const std::string& profileId) const;
    bool scheduleDebug(const std::string& profileId) const;
    ScheduleSpec scheduleSpec(const std::string& profileId) const;
    void setScheduleSpec(const ScheduleSpec& spec, const std::string& profileId);

    // Retention
    AgeRetention removeOldSnapshots(const std::string& profileId) const;
    SpaceRetention minFreeSpace(const std::string& profileId) const;
    InodeRetention minFreeInodes(const std::string& profileId) const;
    SmartRetention smartRemove(const std::string& profileId) const;
    RetentionSpec retention(const std::string& profileId) const;
    void setRemoveOldSnapshots(const AgeRetention& age, const std::string& profileId);
    void setMinFreeSpace(const SpaceRetention& space, const std::string& profileId);
    void setMinFreeInodes(const InodeRetention& inodes, const std::string& profileId);
    void setSmartRemove(const SmartRetention& smart, const std::string& profileId);

    // Snapshot destination
    std::string snapshotsMode(const std::string& profileId) const;
    std::string snapshotsPath(const std::string& profileId) const;
    std::string snapshotsFullPath(const std::string& profileId) const;
    std::string localEncfsPath(const std::string& profileId) const;
    std::string cachedDeviceUuid(const std::string& profileId) const;
    void setCachedDeviceUuid(const std::string& uuid, const std::string& profileId);

    // Sources
    std::vector<IncludeEntry> include(const std::string& profileId) const;
    void setInclude(const std::vector<IncludeEntry>& values, const std::string& profileId);
    std::vector<std::string> exclude(const std::string& profileId) const;
    void setExclude(const std::vector<std::string>& values, const std::string& profileId);

    // Cron command
    bool niceOnCron(const std::string& profileId) const;
    bool ioniceOnCron(const std::string& profileId) const;
    bool redirectStdoutInCron(const std::string& profileId) const;
    bool redirectStderrInCron(const std::string& profileId) const;

    // SSH
    int sshMaxArgLength(const std::string& profileId) const;
    bool sshPrefixEnabled(const std::string& profileId) const;
    std::string sshPrefix(const std::string& profileId) const;
    std::vector<std::string> sshPrefixTokens(const std::string& profileId) const;
    std::string sshPrefixShellString(const std::string& profileId) const;

    // External snapshot engine run by "backup-job"
    std::string snapshotCommand() const;

    // Files
    std::string fileId(const std::string& profileId) const;
    std::string anacronSpool() const;
    std::string anacronJobIdentify(const std::string& profileId) const;
    std::string anacronSpoolFile(const std::string& profileId) const;
    std::string takeSnapshotInstanceFile(const std::string& profileId) const;
    std::string logFile() const;

    bool isConfigured(const std::string& profileId) const;
    // Validates every profile; the first problem is notified and stops the check.
    bool checkConfig(ErrorNotifier& notifier) const;

    static const std::vector<std::string>& defaultExclude();

private:
    ConfigStore& store_;
    ConfigPaths paths_;
};

} // namespace snapkeep
