#pragma once

#include <optional>
#include <string>
#include <vector>

namespace snapkeep {

// The user's crontab. Entries owned by snapkeep are the lines directly below
// a MARKER comment; everything else belongs to the user and is left alone.
class Crontab {
public:
    static constexpr const char* MARKER = "#snapkeep system entry, this will be edited by snapkeep:";

    enum class InstallResult {
        Unchanged,
        Written,
        Failed
    };

    virtual ~Crontab() = default;

    // "crontab -l"; a user without a crontab yields an empty list.
    virtual std::optional<std::vector<std::string>> read() const;
    // "crontab -"
    virtual bool write(const std::vector<std::string>& lines) const;
    // True if a cron daemon shows up in the process table.
    virtual bool isDaemonRunning() const;

    // Scans <procRoot>/<pid>/comm for a known cron daemon name.
    static bool findCronDaemon(const std::string& procRoot);

    static std::vector<std::string> removeManaged(const std::vector<std::string>& lines);
    static std::vector<std::string> appendManaged(const std::vector<std::string>& lines,
                                                  const std::vector<std::string>& entries);

    // Replaces all managed entries with the given ones. Skips the write if
    // nothing changed.
    InstallResult install(const std::vector<std::string>& entries) const;
};

} // namespace snapkeep
