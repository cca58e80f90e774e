#include "common/error_notifier.hpp"
#include "common/logger.hpp"

namespace snapkeep {

void LoggingNotifier::notifyError(const std::string& message) {
    Logger::error(message);
    std::lock_guard<std::mutex> lock(mutex_);
    messages_.push_back(message);
}

std::vector<std::string> LoggingNotifier::getMessages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_;
}

bool LoggingNotifier::hasErrors() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !messages_.empty();
}

void LoggingNotifier::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    messages_.clear();
}

} // namespace snapkeep
