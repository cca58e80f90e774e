#pragma once

#include <optional>
#include <string>

namespace snapkeep {

// Maps a backup destination to a stable identifier of the device it lives on.
class DeviceResolver {
public:
    virtual ~DeviceResolver() = default;
    virtual std::optional<std::string> uuidFromPath(const std::string& path) const = 0;
};

// Looks up the mount containing the path in the mount table, then the
// filesystem UUID whose /dev/disk/by-uuid link points at that device.
class FilesystemDeviceResolver : public DeviceResolver {
public:
    explicit FilesystemDeviceResolver(std::string mountTable = "/proc/mounts",
                                      std::string uuidDirectory = "/dev/disk/by-uuid");

    std::optional<std::string> uuidFromPath(const std::string& path) const override;

    // Device of the longest mount point that contains path.
    std::optional<std::string> deviceForPath(const std::string& path) const;

private:
    static std::string unescapeMountField(const std::string& field);

    std::string mountTable_;
    std::string uuidDirectory_;
};

} // namespace snapkeep
