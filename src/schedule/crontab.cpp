#include "schedule/crontab.hpp"
#include "common/logger.hpp"
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <fstream>

namespace snapkeep {

std::optional<std::vector<std::string>> Crontab::read() const {
    FILE* pipe = popen("crontab -l 2>/dev/null", "r");
    if (!pipe) {
        Logger::error("Failed to run crontab -l");
        return std::nullopt;
    }

    std::string output;
    char buffer[256];
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
        output += buffer;
    }
    int status = pclose(pipe);

    if (status != 0 && output.empty()) {
        // "no crontab for <user>"
        Logger::debug("No crontab installed for current user");
        return std::vector<std::string>{};
    }
    if (status != 0) {
        Logger::error("crontab -l failed with status " + std::to_string(status));
        return std::nullopt;
    }

    std::vector<std::string> lines;
    size_t start = 0;
    while (start < output.size()) {
        size_t end = output.find('\n', start);
        if (end == std::string::npos) {
            end = output.size();
        }
        lines.push_back(output.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

bool Crontab::write(const std::vector<std::string>& lines) const {
    FILE* pipe = popen("crontab -", "w");
    if (!pipe) {
        Logger::error("Failed to run crontab -");
        return false;
    }

    bool ok = true;
    for (const auto& line : lines) {
        if (fputs(line.c_str(), pipe) < 0 || fputc('\n', pipe) == EOF) {
            ok = false;
            break;
        }
    }
    int status = pclose(pipe);
    if (!ok || status != 0) {
        Logger::error("Failed to write crontab (status " + std::to_string(status) + ")");
        return false;
    }
    return true;
}

bool Crontab::isDaemonRunning() const {
    return findCronDaemon("/proc");
}

bool Crontab::findCronDaemon(const std::string& procRoot) {
    static const std::vector<std::string> daemons = {"cron", "crond", "fcron", "dcron", "bcron-sched"};

    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(procRoot, ec)) {
        std::string pid = entry.path().filename().string();
        if (pid.empty() || !std::isdigit(static_cast<unsigned char>(pid[0]))) {
            continue;
        }

        std::ifstream comm(entry.path() / "comm");
        std::string name;
        if (!comm.is_open() || !std::getline(comm, name)) {
            continue;
        }
        for (const auto& daemon : daemons) {
            if (name == daemon) {
                Logger::debug("Found " + name + " with pid " + pid);
                return true;
            }
        }
    }
    if (ec) {
        Logger::warning("Failed to scan " + procRoot + ": " + ec.message());
    }
    return false;
}

std::vector<std::string> Crontab::removeManaged(const std::vector<std::string>& lines) {
    std::vector<std::string> result;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (lines[i] == MARKER) {
            ++i;
            continue;
        }
        result.push_back(lines[i]);
    }
    return result;
}

std::vector<std::string> Crontab::appendManaged(const std::vector<std::string>& lines,
                                                const std::vector<std::string>& entries) {
    std::vector<std::string> result = lines;
    for (const auto& entry : entries) {
        result.push_back(MARKER);
        result.push_back(entry);
    }
    return result;
}

Crontab::InstallResult Crontab::install(const std::vector<std::string>& entries) const {
    auto current = read();
    if (!current) {
        return InstallResult::Failed;
    }

    auto updated = appendManaged(removeManaged(*current), entries);
    if (updated == *current) {
        Logger::debug("Crontab is up to date");
        return InstallResult::Unchanged;
    }

    if (!write(updated)) {
        return InstallResult::Failed;
    }
    Logger::info("Installed " + std::to_string(entries.size()) + " crontab entr" +
                 (entries.size() == 1 ? "y" : "ies"));
    return InstallResult::Written;
}

} // namespace snapkeep
