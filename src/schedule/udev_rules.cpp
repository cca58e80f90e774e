#include "schedule/udev_rules.hpp"
#include "common/logger.hpp"
#include "common/shell_words.hpp"
#include <cctype>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace snapkeep {

namespace fs = std::filesystem;

namespace {

bool isAllowedCommandChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) ||
           std::string("_/.:=~ >&-").find(c) != std::string::npos;
}

bool isPriorityWrapper(const std::string& token) {
    std::string name = fs::path(token).filename().string();
    return name == "nice" || name == "ionice";
}

} // namespace

UdevRuleFile::UdevRuleFile(std::string rulesPath, std::string executable, std::string user)
    : rulesPath_(std::move(rulesPath))
    , executable_(std::move(executable))
    , user_(std::move(user)) {
}

std::string UdevRuleFile::defaultRulesPath(const std::string& user) {
    return "/etc/udev/rules.d/99-snapkeep-" + user + ".rules";
}

std::string UdevRuleFile::renderRule(const std::string& command, const std::string& uuid, const std::string& user) {
    return "ACTION==\"add|change\", ENV{ID_FS_UUID}==\"" + uuid +
           "\", RUN+=\"/bin/su - " + user + " -c '" + command + "'\"";
}

bool UdevRuleFile::isReady() const {
    fs::path dir = fs::path(rulesPath_).parent_path();
    std::error_code ec;
    if (fs::exists(rulesPath_, ec)) {
        return access(rulesPath_.c_str(), W_OK) == 0;
    }
    return fs::is_directory(dir, ec) && access(dir.c_str(), W_OK) == 0;
}

void UdevRuleFile::clean() {
    rules_.clear();
    cleaned_ = true;
}

void UdevRuleFile::validate(const std::string& command, const std::string& uuid) const {
    if (rules_.size() >= MAX_RULES) {
        throw InvalidUdevCommand(InvalidUdevCommand::Reason::LimitExceeded,
                                 "Maximum number of udev rules (" + std::to_string(MAX_RULES) + ") exceeded");
    }
    if (command.size() > MAX_COMMAND_LENGTH) {
        throw InvalidUdevCommand(InvalidUdevCommand::Reason::LimitExceeded,
                                 "Udev command is longer than " + std::to_string(MAX_COMMAND_LENGTH) +
                                 " characters");
    }

    for (char c : command) {
        if (!isAllowedCommandChar(c)) {
            throw InvalidUdevCommand(InvalidUdevCommand::Reason::InvalidChar,
                                     std::string("Udev command contains invalid character '") + c + "'");
        }
    }
    for (char c : uuid) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') {
            throw InvalidUdevCommand(InvalidUdevCommand::Reason::InvalidChar,
                                     std::string("Device UUID contains invalid character '") + c + "'");
        }
    }

    // Skip "nice -n19" / "ionice -c2 -n7" in front of the real command.
    auto tokens = shell::split(command);
    size_t i = 0;
    while (i < tokens.size() && isPriorityWrapper(tokens[i])) {
        ++i;
        while (i < tokens.size() && !tokens[i].empty() && tokens[i][0] == '-') {
            ++i;
        }
    }
    if (i >= tokens.size() || tokens[i] != executable_) {
        throw InvalidUdevCommand(InvalidUdevCommand::Reason::InvalidCmd,
                                 "Udev command must start with " + executable_ + ": " + command);
    }
}

void UdevRuleFile::addRule(const std::string& command, const std::string& uuid) {
    validate(command, uuid);
    rules_.push_back(renderRule(command, uuid, user_));
    Logger::debug("Added udev rule for device " + uuid);
}

bool UdevRuleFile::save() {
    std::error_code ec;
    if (rules_.empty()) {
        if (cleaned_ && fs::exists(rulesPath_, ec)) {
            if (!fs::remove(rulesPath_, ec)) {
                Logger::error("Failed to remove udev rules " + rulesPath_ + ": " + ec.message());
                return false;
            }
            Logger::info("Removed udev rules " + rulesPath_);
        }
        return true;
    }

    std::ofstream out(rulesPath_, std::ios::trunc);
    if (!out.is_open()) {
        Logger::error("Failed to write udev rules " + rulesPath_);
        return false;
    }
    for (const auto& rule : rules_) {
        out << rule << "\n";
    }
    if (!out) {
        Logger::error("Failed to write udev rules " + rulesPath_);
        return false;
    }
    Logger::info("Saved " + std::to_string(rules_.size()) + " udev rule(s) to " + rulesPath_);
    return true;
}

} // namespace snapkeep
