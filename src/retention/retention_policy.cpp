#include "retention/retention_policy.hpp"
#include <algorithm>
#include <set>
#include <stdexcept>

namespace snapkeep {

std::string toString(BucketKind kind) {
    switch (kind) {
        case BucketKind::KeepAll:
            return "keep_all";
        case BucketKind::OnePerDay:
            return "keep_one_per_day";
        case BucketKind::OnePerWeek:
            return "keep_one_per_week";
        case BucketKind::OnePerMonth:
            return "keep_one_per_month";
    }
    return "unknown";
}

Date RetentionPolicy::cutoffDate(const AgeRetention& age, const Date& today) {
    if (!age.enabled) {
        return Date::minimum();
    }
    if (age.value < 1) {
        throw std::invalid_argument("Retention age must be at least 1, got " + std::to_string(age.value));
    }

    switch (age.unit) {
        case TimeUnit::Day:
            return today.addDays(-age.value);
        case TimeUnit::Week:
            return today.mondayOfWeek().addDays(-7 * (age.value - 1));
        case TimeUnit::Year:
            return Date{today.year - age.value, today.month, 1};
        default:
            return Date::minimum();
    }
}

bool RetentionPolicy::isDeletableByAge(const Date& snapshotDate, const AgeRetention& age, const Date& today) {
    return snapshotDate < cutoffDate(age, today);
}

int RetentionPolicy::minFreeSpaceMib(const SpaceRetention& space) {
    if (!space.enabled) {
        return 0;
    }
    if (space.unit == DiskUnit::MB) {
        return space.value;
    }
    if (space.unit == DiskUnit::GB) {
        return space.value * 1024;
    }
    return 0;
}

int RetentionPolicy::minFreeInodesPercent(const InodeRetention& inodes) {
    return inodes.enabled ? inodes.percent : 0;
}

bool RetentionPolicy::freeSpaceBelowMinimum(const FilesystemStats& stats, const SpaceRetention& space) {
    int minimum = minFreeSpaceMib(space);
    return minimum > 0 && stats.freeMib() < static_cast<uint64_t>(minimum);
}

bool RetentionPolicy::freeInodesBelowMinimum(const FilesystemStats& stats, const InodeRetention& inodes) {
    int minimum = minFreeInodesPercent(inodes);
    return minimum > 0 && stats.freeInodesPercent() < minimum;
}

std::vector<RetentionBucket> RetentionPolicy::tieredBuckets(const SmartRetention& smart, const Date& today) {
    std::vector<RetentionBucket> buckets;
    Date tomorrow = today.addDays(1);

    RetentionBucket keepAll{BucketKind::KeepAll, smart.keepAllDays, {}};
    if (smart.keepAllDays > 0) {
        keepAll.windows.push_back({today.addDays(-(smart.keepAllDays - 1)), tomorrow});
    }
    buckets.push_back(keepAll);

    RetentionBucket perDay{BucketKind::OnePerDay, smart.keepOnePerDayDays, {}};
    for (int i = 0; i < smart.keepOnePerDayDays; ++i) {
        perDay.windows.push_back({today.addDays(-i), today.addDays(-i + 1)});
    }
    buckets.push_back(perDay);

    RetentionBucket perWeek{BucketKind::OnePerWeek, smart.keepOnePerWeekWeeks, {}};
    Date monday = today.mondayOfWeek();
    for (int i = 0; i < smart.keepOnePerWeekWeeks; ++i) {
        Date start = monday.addDays(-7 * i);
        perWeek.windows.push_back({start, start.addDays(7)});
    }
    buckets.push_back(perWeek);

    RetentionBucket perMonth{BucketKind::OnePerMonth, smart.keepOnePerMonthMonths, {}};
    Date first{today.year, today.month, 1};
    for (int i = 0; i < smart.keepOnePerMonthMonths; ++i) {
        perMonth.windows.push_back({first, first.addDays(Date::daysInMonth(first.year, first.month))});
        first = first.previousMonth();
    }
    buckets.push_back(perMonth);

    return buckets;
}

std::vector<std::string> RetentionPolicy::smartRemoveSurvivors(const std::vector<SnapshotInfo>& snapshots,
                                                               const SmartRetention& smart,
                                                               const Date& today) {
    std::vector<SnapshotInfo> sorted = snapshots;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const SnapshotInfo& a, const SnapshotInfo& b) { return b.date < a.date; });

    std::vector<std::string> survivors;
    if (!smart.enabled) {
        for (const auto& snapshot : sorted) {
            survivors.push_back(snapshot.id);
        }
        return survivors;
    }

    std::set<std::string> keep;
    if (!sorted.empty()) {
        keep.insert(sorted.front().id);
    }

    for (const auto& bucket : tieredBuckets(smart, today)) {
        for (const auto& window : bucket.windows) {
            for (const auto& snapshot : sorted) {
                if (!window.contains(snapshot.date)) {
                    continue;
                }
                keep.insert(snapshot.id);
                if (bucket.kind != BucketKind::KeepAll) {
                    break;  // newest in the window
                }
            }
        }
    }

    for (const auto& snapshot : sorted) {
        if (keep.count(snapshot.id) || (smart.keepNamedSnapshots && snapshot.named)) {
            survivors.push_back(snapshot.id);
        }
    }
    return survivors;
}

} // namespace snapkeep
