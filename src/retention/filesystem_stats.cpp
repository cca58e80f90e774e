#include "retention/filesystem_stats.hpp"
#include "common/logger.hpp"
#include <cerrno>
#include <cstring>
#include <sys/statvfs.h>

namespace snapkeep {

uint64_t FilesystemStats::freeMib() const {
    return availableBlocks * fragmentSize / (1024 * 1024);
}

double FilesystemStats::freeInodesPercent() const {
    if (totalInodes == 0) {
        return 100.0;
    }
    return static_cast<double>(availableInodes) * 100.0 / static_cast<double>(totalInodes);
}

std::optional<FilesystemStats> FilesystemStats::probe(const std::string& path) {
    struct statvfs info;
    if (statvfs(path.c_str(), &info) != 0) {
        Logger::error("Failed to stat filesystem of " + path + ": " + std::strerror(errno));
        return std::nullopt;
    }

    FilesystemStats stats;
    stats.fragmentSize = info.f_frsize ? info.f_frsize : info.f_bsize;
    stats.totalBlocks = info.f_blocks;
    stats.availableBlocks = info.f_bavail;
    stats.totalInodes = info.f_files;
    stats.availableInodes = info.f_favail;
    return stats;
}

} // namespace snapkeep
