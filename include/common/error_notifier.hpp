#pragma once

#include <string>
#include <vector>
#include <mutex>

namespace snapkeep {

// Channel for failures the user has to see (profile-scoped schedule errors,
// crontab write failures). Implementations must not throw.
class ErrorNotifier {
public:
    virtual ~ErrorNotifier() = default;
    virtual void notifyError(const std::string& message) = 0;
};

// Default channel: every message goes to the log at ERROR level and is kept
// so the command line front end can print a summary.
class LoggingNotifier : public ErrorNotifier {
public:
    void notifyError(const std::string& message) override;

    std::vector<std::string> getMessages() const;
    bool hasErrors() const;
    void clear();

private:
    std::vector<std::string> messages_;
    mutable std::mutex mutex_;
};

} // namespace snapkeep
