#pragma once

#include "common/calendar.hpp"
#include "retention/filesystem_stats.hpp"
#include "retention/retention_types.hpp"
#include <string>
#include <vector>

namespace snapkeep {

// A snapshot as seen by the retention rules.
struct SnapshotInfo {
    std::string id;
    Date date;
    bool named = false;
};

// Dates in [start, end)
struct DateWindow {
    Date start;
    Date end;

    bool contains(const Date& date) const { return start <= date && date < end; }
};

enum class BucketKind {
    KeepAll,
    OnePerDay,
    OnePerWeek,
    OnePerMonth
};

std::string toString(BucketKind kind);

struct RetentionBucket {
    BucketKind kind;
    int count;                      // days, days, weeks or months
    std::vector<DateWindow> windows;
};

// Advisory retention rules: each answers "deletable if" questions, the
// caller does the deleting and re-measures after every removal.
class RetentionPolicy {
public:
    // Snapshots older than the returned date are deletable by age.
    // Disabled or unsupported units give Date::minimum(). Throws
    // std::invalid_argument for an enabled age below 1.
    static Date cutoffDate(const AgeRetention& age, const Date& today);
    static bool isDeletableByAge(const Date& snapshotDate, const AgeRetention& age, const Date& today);

    static int minFreeSpaceMib(const SpaceRetention& space);
    static int minFreeInodesPercent(const InodeRetention& inodes);
    static bool freeSpaceBelowMinimum(const FilesystemStats& stats, const SpaceRetention& space);
    static bool freeInodesBelowMinimum(const FilesystemStats& stats, const InodeRetention& inodes);

    // KeepAll, OnePerDay, OnePerWeek, OnePerMonth, newest window first.
    static std::vector<RetentionBucket> tieredBuckets(const SmartRetention& smart, const Date& today);

    // Ids of the snapshots that survive a smart removal, newest first. A
    // snapshot survives if any tier keeps it; the newest snapshot always
    // survives. With smart removal disabled everything survives.
    static std::vector<std::string> smartRemoveSurvivors(const std::vector<SnapshotInfo>& snapshots,
                                                         const SmartRetention& smart,
                                                         const Date& today);
};

} // namespace snapkeep
