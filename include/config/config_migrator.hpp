#pragma once

#include "config/config_store.hpp"
#include <stdexcept>
#include <string>

namespace snapkeep {

// Raised for configurations older than the oldest layout that can still be
// upgraded. Nothing has been modified when it is thrown; the process is
// expected to stop with exitCode().
class UnsupportedConfigVersion : public std::runtime_error {
public:
    explicit UnsupportedConfigVersion(int version);

    int version() const { return version_; }
    static constexpr int exitCode() { return 2; }

private:
    int version_;
};

class ConfigMigrator {
public:
    static constexpr int CURRENT_VERSION = 6;
    static constexpr int MINIMUM_SUPPORTED_VERSION = 4;
    static constexpr const char* VERSION_KEY = "config.version";

    // Version recorded in the store; a missing field means CURRENT_VERSION.
    static int storedVersion(const ConfigStore& store);

    // Runs every step from fromVersion up to CURRENT_VERSION and stamps the
    // version field. Returns true if anything had to be migrated.
    bool migrate(ConfigStore& store, int fromVersion) const;

    // Reads the stored version, migrates and saves immediately when a
    // migration ran. Returns false only if saving failed.
    bool migrateAndSave(ConfigStore& store, const std::string& path) const;

private:
    void migrateTo5(ConfigStore& store) const;
    void migrateTo6(ConfigStore& store) const;
};

} // namespace snapkeep
