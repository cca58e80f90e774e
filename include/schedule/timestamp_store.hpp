#pragma once

#include "common/calendar.hpp"
#include <optional>
#include <string>

namespace snapkeep {

// Last successful scheduled run of one profile, kept in a one-line file
// ("YYYYMMDD HHMM", local time). A missing or unreadable file reads as
// "never run" so a broken record can never block backups.
class TimestampStore {
public:
    explicit TimestampStore(std::string path);

    const std::string& path() const { return path_; }

    std::optional<TimePoint> read() const;
    // Creates the parent directory if needed. Failures are logged, not thrown.
    bool write(TimePoint when) const;
    bool remove() const;

    static std::string format(TimePoint when);
    static std::optional<TimePoint> parse(const std::string& text);

private:
    std::string path_;
};

} // namespace snapkeep
