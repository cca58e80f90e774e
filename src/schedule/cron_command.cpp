#include "schedule/cron_command.hpp"
#include "config/profile_settings.hpp"
#include "common/shell_words.hpp"
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <unistd.h>

namespace snapkeep {

namespace fs = std::filesystem;

std::optional<std::string> which(const std::string& executable) {
    if (executable.find('/') != std::string::npos) {
        if (access(executable.c_str(), X_OK) == 0) {
            return executable;
        }
        return std::nullopt;
    }

    const char* pathEnv = std::getenv("PATH");
    std::string searchPath = pathEnv ? pathEnv : "/usr/local/bin:/usr/bin:/bin";

    std::istringstream dirs(searchPath);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) {
            continue;
        }
        fs::path candidate = fs::path(dir) / executable;
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec) && access(candidate.c_str(), X_OK) == 0) {
            return candidate.string();
        }
    }
    return std::nullopt;
}

CronCommandBuilder::CronCommandBuilder(const ProfileSettings& settings, ExecutableLocator locator)
    : settings_(settings)
    , locator_(std::move(locator)) {
}

std::string CronCommandBuilder::executable() const {
    auto found = locator_("snapkeep");
    return found ? *found : FALLBACK_EXECUTABLE;
}

std::vector<std::string> CronCommandBuilder::compileAsTokens(const std::string& profileId) const {
    std::vector<std::string> tokens;

    if (settings_.niceOnCron(profileId)) {
        if (auto nice = locator_("nice")) {
            tokens.insert(tokens.end(), {*nice, "-n19"});
        }
    }
    if (settings_.ioniceOnCron(profileId)) {
        if (auto ionice = locator_("ionice")) {
            tokens.insert(tokens.end(), {*ionice, "-c2", "-n7"});
        }
    }

    tokens.push_back(executable());
    if (profileId != "1") {
        tokens.insert(tokens.end(), {"--profile-id", profileId});
    }
    if (!settings_.usesDefaultConfigPath()) {
        tokens.insert(tokens.end(), {"--config", settings_.paths().configPath});
    }
    if (settings_.scheduleDebug(profileId)) {
        tokens.push_back("--debug");
    }
    tokens.push_back(JOB_COMMAND);
    return tokens;
}

std::string CronCommandBuilder::compileAsShellString(const std::string& profileId) const {
    std::string command = shell::join(compileAsTokens(profileId));

    bool redirectStdout = settings_.redirectStdoutInCron(profileId);
    if (redirectStdout) {
        command += " >/dev/null";
    }
    if (settings_.redirectStderrInCron(profileId)) {
        command += redirectStdout ? " 2>&1" : " 2>/dev/null";
    }
    return command;
}

} // namespace snapkeep
