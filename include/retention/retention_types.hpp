#pragma once

#include "schedule/schedule_types.hpp"

namespace snapkeep {

// Remove snapshots older than value * unit (unit is Day, Week or Year).
struct AgeRetention {
    bool enabled = true;
    int value = 10;
    TimeUnit unit = TimeUnit::Year;
};

// Remove snapshots until this much space is free.
struct SpaceRetention {
    bool enabled = true;
    int value = 1;
    DiskUnit unit = DiskUnit::GB;
};

// Remove snapshots until this percentage of inodes is free (1-15).
struct InodeRetention {
    bool enabled = true;
    int percent = 2;
};

// Decreasing density of snapshots as they age.
struct SmartRetention {
    bool enabled = false;
    int keepAllDays = 2;
    int keepOnePerDayDays = 7;
    int keepOnePerWeekWeeks = 4;
    int keepOnePerMonthMonths = 24;
    bool keepNamedSnapshots = true;
};

struct RetentionSpec {
    AgeRetention age;
    SpaceRetention space;
    InodeRetention inodes;
    SmartRetention smart;
};

} // namespace snapkeep
