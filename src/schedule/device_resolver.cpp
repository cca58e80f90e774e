#include "schedule/device_resolver.hpp"
#include "common/logger.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace snapkeep {

namespace fs = std::filesystem;

FilesystemDeviceResolver::FilesystemDeviceResolver(std::string mountTable, std::string uuidDirectory)
    : mountTable_(std::move(mountTable))
    , uuidDirectory_(std::move(uuidDirectory)) {
}

// Mount tables escape blanks and backslashes as three digit octal sequences.
std::string FilesystemDeviceResolver::unescapeMountField(const std::string& field) {
    std::string result;
    for (size_t i = 0; i < field.size(); ++i) {
        if (field[i] == '\\' && i + 3 < field.size()) {
            std::string octal = field.substr(i + 1, 3);
            if (octal.find_first_not_of("01234567") == std::string::npos) {
                result += static_cast<char>(std::stoi(octal, nullptr, 8));
                i += 3;
                continue;
            }
        }
        result += field[i];
    }
    return result;
}

std::optional<std::string> FilesystemDeviceResolver::deviceForPath(const std::string& path) const {
    std::error_code ec;
    fs::path target = fs::weakly_canonical(path, ec);
    if (ec) {
        target = fs::path(path).lexically_normal();
    }
    std::string targetStr = target.string();

    std::ifstream mounts(mountTable_);
    if (!mounts.is_open()) {
        Logger::warning("Failed to read mount table " + mountTable_);
        return std::nullopt;
    }

    std::string bestDevice;
    size_t bestLength = 0;
    bool found = false;
    std::string line;
    while (std::getline(mounts, line)) {
        std::istringstream fields(line);
        std::string device, mountPoint;
        if (!(fields >> device >> mountPoint)) {
            continue;
        }
        mountPoint = unescapeMountField(mountPoint);

        bool contains = targetStr == mountPoint ||
                        mountPoint == "/" ||
                        targetStr.compare(0, mountPoint.size() + 1, mountPoint + "/") == 0;
        if (contains && (!found || mountPoint.size() >= bestLength)) {
            bestDevice = unescapeMountField(device);
            bestLength = mountPoint.size();
            found = true;
        }
    }

    if (!found) {
        return std::nullopt;
    }
    return bestDevice;
}

std::optional<std::string> FilesystemDeviceResolver::uuidFromPath(const std::string& path) const {
    auto device = deviceForPath(path);
    if (!device || device->compare(0, 5, "/dev/") != 0) {
        Logger::debug("No block device found for " + path);
        return std::nullopt;
    }

    std::error_code ec;
    fs::path deviceCanonical = fs::weakly_canonical(*device, ec);
    if (ec) {
        deviceCanonical = *device;
    }

    if (!fs::is_directory(uuidDirectory_, ec)) {
        Logger::debug("UUID directory " + uuidDirectory_ + " is not available");
        return std::nullopt;
    }

    for (const auto& entry : fs::directory_iterator(uuidDirectory_, ec)) {
        std::error_code linkEc;
        fs::path resolved = fs::weakly_canonical(entry.path(), linkEc);
        if (linkEc) {
            continue;
        }
        if (resolved == deviceCanonical) {
            return entry.path().filename().string();
        }
    }

    Logger::debug("No UUID found for device " + deviceCanonical.string());
    return std::nullopt;
}

} // namespace snapkeep
