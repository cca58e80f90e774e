#include "cli/snapkeep_cli.hpp"
#include "config/config_migrator.hpp"
#include "schedule/cron_command.hpp"
#include "schedule/crontab.hpp"
#include "schedule/device_resolver.hpp"
#include "schedule/due_gate.hpp"
#include "schedule/schedule_compiler.hpp"
#include "schedule/udev_rules.hpp"
#include "retention/filesystem_stats.hpp"
#include "retention/retention_policy.hpp"
#include "common/logger.hpp"
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <nlohmann/json.hpp>
#include <fcntl.h>
#include <pwd.h>
#include <sys/file.h>
#include <unistd.h>

namespace snapkeep {

using json = nlohmann::json;

namespace {

const char* kVersion = "1.0.0";

// Advisory per-profile lock, held for the lifetime of the object.
class ProfileLock {
public:
    explicit ProfileLock(const std::string& path) {
        std::error_code ec;
        std::filesystem::create_directories(std::filesystem::path(path).parent_path(), ec);
        fd_ = open(path.c_str(), O_RDWR | O_CREAT, 0644);
        if (fd_ < 0) {
            Logger::error("Failed to open lock file " + path + ": " + std::strerror(errno));
            return;
        }
        if (flock(fd_, LOCK_EX | LOCK_NB) != 0) {
            close(fd_);
            fd_ = -1;
            return;
        }
        locked_ = true;
    }

    ~ProfileLock() {
        if (fd_ >= 0) {
            flock(fd_, LOCK_UN);
            close(fd_);
        }
    }

    ProfileLock(const ProfileLock&) = delete;
    ProfileLock& operator=(const ProfileLock&) = delete;

    bool locked() const { return locked_; }

private:
    int fd_{-1};
    bool locked_{false};
};

json windowsToJson(const std::vector<DateWindow>& windows) {
    json result = json::array();
    for (const auto& window : windows) {
        result.push_back({{"start", window.start.toString()}, {"end", window.end.toString()}});
    }
    return result;
}

} // namespace

SnapkeepCLI::SnapkeepCLI() = default;

SnapkeepCLI::~SnapkeepCLI() = default;

void SnapkeepCLI::printUsage() const {
    std::cout << "Usage: snapkeep [options] <command> [command options]\n"
              << "Options:\n"
              << "  --config PATH       Use PATH instead of ~/.config/snapkeep/config.json\n"
              << "  --profile-id ID     Select profile by id (default: 1)\n"
              << "  --debug             Verbose logging\n"
              << "  -h, --help          Show this help message\n"
              << "  -v, --version       Show version information\n"
              << "\n"
              << "Commands:\n"
              << "  check-config [--print]  Validate profiles and install schedules,\n"
              << "                          --print only prints the crontab lines\n"
              << "  cron-lines              Print the generated crontab lines\n"
              << "  is-due                  Exit 0 if the profile is due, 3 if not\n"
              << "  backup-job              Run the snapshot command if the profile is due\n"
              << "  record-run              Record now as the last run of the profile\n"
              << "  retention               Print the retention rules of the profile as JSON\n"
              << "  migrate                 Upgrade the config file to the current version\n";
}

bool SnapkeepCLI::parseGlobalOptions(std::vector<std::string>& args) {
    std::vector<std::string> rest;
    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];
        if (arg == "--config") {
            if (i + 1 >= args.size()) {
                std::cerr << "Error: --config requires a path" << std::endl;
                return false;
            }
            options_.configPath = args[++i];
        } else if (arg == "--profile-id") {
            if (i + 1 >= args.size()) {
                std::cerr << "Error: --profile-id requires an id" << std::endl;
                return false;
            }
            options_.profileId = args[++i];
        } else if (arg == "--debug") {
            options_.debug = true;
        } else {
            rest.push_back(arg);
        }
    }
    args = rest;
    return true;
}

int SnapkeepCLI::run(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    if (!args.empty() && (args[0] == "--help" || args[0] == "-h")) {
        printUsage();
        return EXIT_OK;
    }
    if (!args.empty() && (args[0] == "--version" || args[0] == "-v")) {
        std::cout << "snapkeep version " << kVersion << "\n";
        return EXIT_OK;
    }

    if (!parseGlobalOptions(args)) {
        printUsage();
        return EXIT_ERROR;
    }
    if (args.empty()) {
        std::cerr << "Error: No command specified" << std::endl;
        printUsage();
        return EXIT_ERROR;
    }

    std::string command = args[0];
    args.erase(args.begin());

    settings_ = std::make_unique<ProfileSettings>(store_, ConfigPaths::defaults(options_.configPath));
    if (!Logger::initialize(settings_->logFile(), options_.debug ? LogLevel::DEBUG : LogLevel::INFO)) {
        std::cerr << "Failed to initialize logger" << std::endl;
    }
    Logger::debug("Command: " + command + ", profile " + options_.profileId + ", config " +
                  settings_->paths().configPath);

    try {
        if (!loadConfig()) {
            return EXIT_ERROR;
        }

        if (command == "check-config") {
            return handleCheckConfig(args);
        } else if (command == "cron-lines") {
            return handleCronLines();
        } else if (command == "is-due") {
            return handleIsDue();
        } else if (command == "backup-job") {
            return handleBackupJob();
        } else if (command == "record-run") {
            return handleRecordRun();
        } else if (command == "retention") {
            return handleRetention();
        } else if (command == "migrate") {
            return handleMigrate();
        }

        std::cerr << "Error: Unknown command: " << command << std::endl;
        Logger::error("Unknown command: " + command);
        printUsage();
        return EXIT_ERROR;
    } catch (const UnsupportedConfigVersion& e) {
        Logger::fatal(e.what());
        return UnsupportedConfigVersion::exitCode();
    } catch (const std::exception& e) {
        Logger::error("Error: " + std::string(e.what()));
        return EXIT_ERROR;
    }
}

bool SnapkeepCLI::loadConfig() {
    const std::string& path = settings_->paths().configPath;
    if (!store_.load(path)) {
        if (!settings_->usesDefaultConfigPath()) {
            Logger::error("Config file " + path + " does not exist");
            return false;
        }
        Logger::info("No config file at " + path + ", using defaults");
        return true;
    }

    ConfigMigrator migrator;
    return migrator.migrateAndSave(store_, path);
}

bool SnapkeepCLI::checkProfile() const {
    for (const auto& id : settings_->profiles()) {
        if (id == options_.profileId) {
            return true;
        }
    }
    Logger::error("Profile " + options_.profileId + " does not exist");
    return false;
}

std::string SnapkeepCLI::currentUser() const {
    const char* user = std::getenv("USER");
    if (user && *user) {
        return user;
    }
    struct passwd* pw = getpwuid(getuid());
    return (pw && pw->pw_name) ? pw->pw_name : "root";
}

int SnapkeepCLI::handleCheckConfig(const std::vector<std::string>& args) {
    bool printOnly = false;
    for (const auto& arg : args) {
        if (arg == "--print") {
            printOnly = true;
        } else {
            std::cerr << "Error: Unknown option for check-config: " << arg << std::endl;
            return EXIT_ERROR;
        }
    }

    if (!settings_->checkConfig(notifier_)) {
        std::cout << "Config " << settings_->paths().configPath << " has errors" << std::endl;
        return EXIT_ERROR;
    }

    CronCommandBuilder commands(*settings_);
    FilesystemDeviceResolver resolver;
    std::string user = currentUser();
    UdevRuleFile udev(UdevRuleFile::defaultRulesPath(user), commands.executable(), user);
    ScheduleCompiler compiler(*settings_, resolver, udev, notifier_, commands);

    if (printOnly) {
        for (const auto& line : compiler.compileAll()) {
            std::cout << line << "\n";
        }
    } else {
        Crontab crontab;
        compiler.setupSchedules(crontab);
        if (!store_.save(settings_->paths().configPath)) {
            Logger::warning("Failed to save cached device UUIDs");
        }
    }

    if (notifier_.hasErrors()) {
        std::cout << "Config " << settings_->paths().configPath << " has errors" << std::endl;
        return EXIT_ERROR;
    }
    std::cout << "Config " << settings_->paths().configPath << " is fine" << std::endl;
    return EXIT_OK;
}

int SnapkeepCLI::handleCronLines() {
    CronCommandBuilder commands(*settings_);
    FilesystemDeviceResolver resolver;
    std::string user = currentUser();
    UdevRuleFile udev(UdevRuleFile::defaultRulesPath(user), commands.executable(), user);
    ScheduleCompiler compiler(*settings_, resolver, udev, notifier_, commands);

    for (const auto& line : compiler.compileAll()) {
        std::cout << line << "\n";
    }
    return notifier_.hasErrors() ? EXIT_ERROR : EXIT_OK;
}

int SnapkeepCLI::handleIsDue() {
    if (!checkProfile()) {
        return EXIT_ERROR;
    }
    DueGate gate;
    bool due = gate.isProfileDue(*settings_, options_.profileId, Clock::now());
    std::cout << (due ? "due" : "not due") << std::endl;
    return due ? EXIT_OK : EXIT_NOT_DUE;
}

bool SnapkeepCLI::runSnapshotCommand(const std::string& command) const {
    setenv("SNAPKEEP_PROFILE_ID", options_.profileId.c_str(), 1);
    setenv("SNAPKEEP_PROFILE_NAME", settings_->profileName(options_.profileId).c_str(), 1);
    setenv("SNAPKEEP_SNAPSHOTS_PATH", settings_->snapshotsFullPath(options_.profileId).c_str(), 1);

    Logger::info("Running snapshot command: " + command);
    std::string fullCmd = command + " 2>&1";
    FILE* pipe = popen(fullCmd.c_str(), "r");
    if (!pipe) {
        Logger::error("Failed to run snapshot command: " + std::string(std::strerror(errno)));
        return false;
    }

    char buffer[512];
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
        std::string line(buffer);
        if (!line.empty() && line.back() == '\n') {
            line.pop_back();
        }
        Logger::info("[snapshot] " + line);
    }

    int status = pclose(pipe);
    if (status != 0) {
        Logger::error("Snapshot command failed with status " + std::to_string(status));
        return false;
    }
    return true;
}

int SnapkeepCLI::handleBackupJob() {
    if (!checkProfile()) {
        return EXIT_ERROR;
    }

    ProfileLock lock(settings_->takeSnapshotInstanceFile(options_.profileId));
    if (!lock.locked()) {
        Logger::warning("A backup job for profile " + options_.profileId + " is already running");
        return EXIT_ERROR;
    }

    DueGate gate;
    TimePoint now = Clock::now();
    if (!gate.isProfileDue(*settings_, options_.profileId, now)) {
        Logger::info("Profile " + options_.profileId + " is not due yet");
        return EXIT_OK;
    }

    std::string command = settings_->snapshotCommand();
    if (command.empty()) {
        Logger::warning("global.snapshot_command is not set, only recording the run");
    } else if (!runSnapshotCommand(command)) {
        return EXIT_ERROR;
    }

    if (!gate.recordRun(*settings_, options_.profileId, now)) {
        return EXIT_ERROR;
    }
    Logger::info("Backup job for profile " + options_.profileId + " finished");
    return EXIT_OK;
}

int SnapkeepCLI::handleRecordRun() {
    if (!checkProfile()) {
        return EXIT_ERROR;
    }
    DueGate gate;
    return gate.recordRun(*settings_, options_.profileId, Clock::now()) ? EXIT_OK : EXIT_ERROR;
}

int SnapkeepCLI::handleRetention() {
    if (!checkProfile()) {
        return EXIT_ERROR;
    }

    const std::string& id = options_.profileId;
    RetentionSpec spec = settings_->retention(id);
    Date today = Date::today();

    json buckets = json::array();
    for (const auto& bucket : RetentionPolicy::tieredBuckets(spec.smart, today)) {
        buckets.push_back({{"kind", toString(bucket.kind)},
                           {"count", bucket.count},
                           {"windows", windowsToJson(bucket.windows)}});
    }

    json result = {
        {"profile", id},
        {"today", today.toString()},
        {"cutoff_date", RetentionPolicy::cutoffDate(spec.age, today).toString()},
        {"min_free_space_mib", RetentionPolicy::minFreeSpaceMib(spec.space)},
        {"min_free_inodes_percent", RetentionPolicy::minFreeInodesPercent(spec.inodes)},
        {"smart_remove", {{"enabled", spec.smart.enabled},
                          {"keep_named_snapshots", spec.smart.keepNamedSnapshots},
                          {"buckets", buckets}}}
    };

    std::string path = settings_->snapshotsPath(id);
    if (!path.empty()) {
        if (auto stats = FilesystemStats::probe(path)) {
            result["filesystem"] = {
                {"free_mib", stats->freeMib()},
                {"free_inodes_percent", stats->freeInodesPercent()},
                {"space_below_minimum", RetentionPolicy::freeSpaceBelowMinimum(*stats, spec.space)},
                {"inodes_below_minimum", RetentionPolicy::freeInodesBelowMinimum(*stats, spec.inodes)}
            };
        }
    }

    std::cout << result.dump(4) << std::endl;
    return EXIT_OK;
}

int SnapkeepCLI::handleMigrate() {
    // loadConfig() already migrated and saved.
    std::cout << "Config version " << ConfigMigrator::storedVersion(store_) << std::endl;
    return EXIT_OK;
}

} // namespace snapkeep
