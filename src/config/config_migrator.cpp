#include "config/config_migrator.hpp"
#include "config/profile_settings.hpp"
#include "common/logger.hpp"
#include <cstdlib>
#include <filesystem>
#include <utility>
#include <vector>

namespace snapkeep {

namespace {

const char* kLegacyExcludeDefault = ".gvfs:.cache*:[Cc]ache*:.thumbnails*:[Tt]rash*:*.backup*:*~";

std::vector<std::string> splitOn(const std::string& text, char separator) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t end = text.find(separator, start);
        parts.push_back(text.substr(start, end == std::string::npos ? std::string::npos : end - start));
        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }
    return parts;
}

std::string expandAndAbsolute(const std::string& path) {
    std::string expanded = path;
    if (!expanded.empty() && expanded[0] == '~' && (expanded.size() == 1 || expanded[1] == '/')) {
        const char* home = std::getenv("HOME");
        if (home) {
            expanded = std::string(home) + expanded.substr(1);
        }
    }

    std::filesystem::path p = std::filesystem::absolute(expanded).lexically_normal();
    std::string result = p.string();
    if (result.size() > 1 && result.back() == '/') {
        result.pop_back();
    }
    return result;
}

// Version 4 kept folders as "path1|flags:path2|flags".
std::vector<std::string> legacyIncludeFolders(const ConfigStore& store, const std::string& profileId) {
    std::string value = store.profileStrValue("snapshots.include_folders", "", profileId);
    std::vector<std::string> paths;
    if (value.empty()) {
        return paths;
    }
    for (const auto& item : splitOn(value, ':')) {
        std::string path = splitOn(item, '|').front();
        if (path.empty()) {
            continue;
        }
        paths.push_back(expandAndAbsolute(path));
    }
    return paths;
}

std::vector<std::string> legacyExcludePatterns(const ConfigStore& store, const std::string& profileId) {
    std::string value = store.profileStrValue("snapshots.exclude_patterns", kLegacyExcludeDefault, profileId);
    if (value.empty()) {
        return {};
    }
    return splitOn(value, ':');
}

} // namespace

UnsupportedConfigVersion::UnsupportedConfigVersion(int version)
    : std::runtime_error("config.version is " + std::to_string(version) +
                         ". Configurations older than version " +
                         std::to_string(ConfigMigrator::MINIMUM_SUPPORTED_VERSION) +
                         " can no longer be upgraded.")
    , version_(version) {
}

int ConfigMigrator::storedVersion(const ConfigStore& store) {
    return store.intValue(VERSION_KEY, CURRENT_VERSION);
}

bool ConfigMigrator::migrate(ConfigStore& store, int fromVersion) const {
    if (fromVersion >= CURRENT_VERSION) {
        return false;
    }

    if (fromVersion < MINIMUM_SUPPORTED_VERSION) {
        Logger::fatal("Config version " + std::to_string(fromVersion) + " is below the supported minimum " +
                      std::to_string(MINIMUM_SUPPORTED_VERSION));
        throw UnsupportedConfigVersion(fromVersion);
    }

    if (fromVersion < 5) {
        Logger::info("Update to config version 5: other snapshot locations");
        migrateTo5(store);
    }

    if (fromVersion < 6) {
        Logger::info("Update to config version 6: schedule settings");
        migrateTo6(store);
    }

    store.setIntValue(VERSION_KEY, CURRENT_VERSION);
    return true;
}

bool ConfigMigrator::migrateAndSave(ConfigStore& store, const std::string& path) const {
    int fromVersion = storedVersion(store);
    if (!migrate(store, fromVersion)) {
        return true;
    }

    if (!store.save(path)) {
        Logger::error("Failed to save migrated config to " + path);
        return false;
    }
    Logger::info("Config migrated from version " + std::to_string(fromVersion) + " to " +
                 std::to_string(CURRENT_VERSION));
    return true;
}

void ConfigMigrator::migrateTo5(ConfigStore& store) const {
    ProfileSettings settings(store, ConfigPaths{});

    for (const auto& profileId : store.profiles()) {
        if (store.hasProfileKey("snapshots.include_folders", profileId)) {
            std::vector<IncludeEntry> include;
            for (const auto& path : legacyIncludeFolders(store, profileId)) {
                include.push_back(IncludeEntry{path, 0});
            }
            settings.setInclude(include, profileId);
        }

        if (!store.hasProfileKey("snapshots.exclude", profileId)) {
            settings.setExclude(legacyExcludePatterns(store, profileId), profileId);
        }

        store.removeProfileKey("snapshots.include_folders", profileId);
        store.removeProfileKey("snapshots.exclude_patterns", profileId);
    }
}

void ConfigMigrator::migrateTo6(ConfigStore& store) const {
    static const std::vector<std::pair<std::string, std::string>> kScheduleKeys = {
        {"snapshots.automatic_backup_anacron_period", "schedule.repeatedly.period"},
        {"snapshots.automatic_backup_anacron_unit", "schedule.repeatedly.unit"},
        {"snapshots.automatic_backup_day", "schedule.day"},
        {"snapshots.automatic_backup_mode", "schedule.mode"},
        {"snapshots.automatic_backup_time", "schedule.time"},
        {"snapshots.automatic_backup_weekday", "schedule.weekday"},
        {"snapshots.custom_backup_time", "schedule.custom_time"},
        // full rsync mode is gone
        {"snapshots.full_rsync.take_snapshot_regardless_of_changes",
         "snapshots.take_snapshot_regardless_of_changes"}
    };

    for (const auto& profileId : store.profiles()) {
        for (const auto& keys : kScheduleKeys) {
            store.remapProfileKey(keys.first, keys.second, profileId);
        }
    }

    store.remapKeyRegex("qt4", "qt");
    store.removeKeysStartingWith("gnome");
    store.removeKeysStartingWith("kde");
}

} // namespace snapkeep
