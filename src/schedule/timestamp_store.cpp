#include "schedule/timestamp_store.hpp"
#include "common/logger.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace snapkeep {

namespace {
const char* kTimestampFormat = "%Y%m%d %H%M";
}

TimestampStore::TimestampStore(std::string path)
    : path_(std::move(path)) {
}

std::string TimestampStore::format(TimePoint when) {
    std::tm tm = toLocalTm(when);
    std::stringstream ss;
    ss << std::put_time(&tm, kTimestampFormat);
    return ss.str();
}

std::optional<TimePoint> TimestampStore::parse(const std::string& text) {
    std::tm tm{};
    std::istringstream ss(text);
    ss >> std::get_time(&tm, kTimestampFormat);
    if (ss.fail()) {
        return std::nullopt;
    }
    return makeLocalTime(tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min);
}

std::optional<TimePoint> TimestampStore::read() const {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return std::nullopt;
    }

    std::ifstream in(path_);
    if (!in.is_open()) {
        Logger::warning("Failed to read timestamp file " + path_ + ", treating profile as never run");
        return std::nullopt;
    }

    std::string line;
    std::getline(in, line);
    auto result = parse(line);
    if (!result) {
        Logger::warning("Invalid timestamp '" + line + "' in " + path_ + ", treating profile as never run");
    }
    return result;
}

bool TimestampStore::write(TimePoint when) const {
    try {
        std::filesystem::path dir = std::filesystem::path(path_).parent_path();
        if (!dir.empty()) {
            std::filesystem::create_directories(dir);
        }

        std::ofstream out(path_, std::ios::trunc);
        if (!out.is_open()) {
            Logger::error("Failed to write timestamp file " + path_);
            return false;
        }
        out << format(when) << "\n";
        if (!out) {
            Logger::error("Failed to write timestamp file " + path_);
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        Logger::error("Failed to write timestamp file " + path_ + ": " + e.what());
        return false;
    }
}

bool TimestampStore::remove() const {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        Logger::warning("Failed to remove timestamp file " + path_ + ": " + ec.message());
        return false;
    }
    return true;
}

} // namespace snapkeep
