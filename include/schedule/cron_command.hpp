#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace snapkeep {

class ProfileSettings;

// Returns the absolute path of an executable, or nothing if it is not installed.
using ExecutableLocator = std::function<std::optional<std::string>(const std::string&)>;

// Searches $PATH like the shell does.
std::optional<std::string> which(const std::string& executable);

// Builds the command line a scheduled trigger runs for a profile:
//   [nice -n19] [ionice -c2 -n7] snapkeep [--profile-id ID] [--config PATH] [--debug] backup-job
class CronCommandBuilder {
public:
    static constexpr const char* FALLBACK_EXECUTABLE = "/usr/bin/snapkeep";
    static constexpr const char* JOB_COMMAND = "backup-job";

    explicit CronCommandBuilder(const ProfileSettings& settings, ExecutableLocator locator = which);

    // Path of the snapkeep executable the trigger starts.
    std::string executable() const;

    // Argument vector without output redirection.
    std::vector<std::string> compileAsTokens(const std::string& profileId) const;
    // Quoted command line including the configured output redirection.
    std::string compileAsShellString(const std::string& profileId) const;

private:
    const ProfileSettings& settings_;
    ExecutableLocator locator_;
};

} // namespace snapkeep
