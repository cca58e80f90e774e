#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace snapkeep {

// Capacity figures of the filesystem holding the snapshots.
struct FilesystemStats {
    uint64_t fragmentSize = 0;
    uint64_t totalBlocks = 0;
    uint64_t availableBlocks = 0;   // usable by unprivileged users
    uint64_t totalInodes = 0;
    uint64_t availableInodes = 0;

    uint64_t freeMib() const;
    // 100.0 when the filesystem does not report inodes.
    double freeInodesPercent() const;

    // statvfs() of path; nothing if the call fails.
    static std::optional<FilesystemStats> probe(const std::string& path);
};

} // namespace snapkeep
