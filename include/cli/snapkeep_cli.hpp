#pragma once

#include "config/config_store.hpp"
#include "config/profile_settings.hpp"
#include "common/error_notifier.hpp"
#include <memory>
#include <string>
#include <vector>

namespace snapkeep {

struct GlobalOptions {
    std::string configPath;     // empty = default location
    std::string profileId = "1";
    bool debug = false;
};

// Command line front end. Every handler returns the process exit code.
class SnapkeepCLI {
public:
    static constexpr int EXIT_OK = 0;
    static constexpr int EXIT_ERROR = 1;
    static constexpr int EXIT_NOT_DUE = 3;

    SnapkeepCLI();
    ~SnapkeepCLI();

    int run(int argc, char* argv[]);
    void printUsage() const;

    const GlobalOptions& options() const { return options_; }

private:
    bool parseGlobalOptions(std::vector<std::string>& args);
    // Loads and migrates the config. Throws UnsupportedConfigVersion.
    bool loadConfig();
    bool checkProfile() const;

    int handleCheckConfig(const std::vector<std::string>& args);
    int handleCronLines();
    int handleIsDue();
    int handleBackupJob();
    int handleRecordRun();
    int handleRetention();
    int handleMigrate();

    bool runSnapshotCommand(const std::string& command) const;
    std::string currentUser() const;

    GlobalOptions options_;
    ConfigStore store_;
    std::unique_ptr<ProfileSettings> settings_;
    LoggingNotifier notifier_;
};

} // namespace snapkeep
