#pragma once

#include "core/Random.hpp"
#include "host/HostInterfaces.hpp"

#include <string>

namespace deaddrop {

class Config;

constexpr int DEFAULT_DAYS_PER_WEEK = 7;

/// How many item stacks go into one drop.
///
/// Two named policies exist and are deliberately kept apart:
///   tiered - automatic and manual drops, uniform in [min, max]
///   daily  - daily refresh drops, clamp(week + 1, min, max)
struct FillPolicy {
    std::string name;
    int minCount = 2;
    int maxCount = 5;
    bool scaleWithWeek = false;

    static FillPolicy tiered() { return {"tiered", 2, 5, false}; }
    static FillPolicy daily()  { return {"daily", 2, 5, true}; }

    /// Item count for a drop spawned during `week`
    int countFor(int week, IRandom& rng) const;
};

/// Scheduler tuning read from the "schedule" and "fill" config sections
struct ScheduleSettings {
    int daysPerWeek = DEFAULT_DAYS_PER_WEEK;
    bool dailyRefresh = false;
    int autoTierMin = 1;
    int autoTierMax = 3;
    FillPolicy tieredFill = FillPolicy::tiered();
    FillPolicy dailyFill = FillPolicy::daily();

    /// `highestTier` is the top of the automatic tier range when
    /// schedule.auto_tier_max is not set.
    static ScheduleSettings fromConfig(const Config& config, int highestTier = 3);
};

inline int clampInt(int value, int lo, int hi) {
    if (value < lo) return lo;
    if (value > hi) return hi;
    return value;
}

/// Uniform day-of-week in [0, daysPerWeek - 1]
int rollDayOfWeek(IRandom& rng, int daysPerWeek = DEFAULT_DAYS_PER_WEEK);

/// Stack size for one item: uniform in [1, stackLimit], or 1 when the item
/// has no meaningful stack limit.
int rollQuantity(const ItemDefinition& definition, IRandom& rng);

} // namespace deaddrop
