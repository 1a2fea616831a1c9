#include "drop/SchedulePolicy.hpp"
#include "core/Config.hpp"
#include "core/Log.hpp"

namespace deaddrop {

namespace {

FillPolicy readFillPolicy(const Config& config, const std::string& prefix, FillPolicy policy) {
    FillPolicy result = policy;
    result.minCount = config.getInt(prefix + ".min", policy.minCount);
    result.maxCount = config.getInt(prefix + ".max", policy.maxCount);
    result.scaleWithWeek = config.getBool(prefix + ".scale_with_week", policy.scaleWithWeek);

    if (result.minCount < 0 || result.minCount > result.maxCount) {
        LOG_WARN("Config: {} fill range [{}, {}] is invalid, using [{}, {}]",
                 policy.name, result.minCount, result.maxCount, policy.minCount, policy.maxCount);
        result.minCount = policy.minCount;
        result.maxCount = policy.maxCount;
    }
    return result;
}

} // anonymous namespace

int FillPolicy::countFor(int week, IRandom& rng) const {
    if (scaleWithWeek) {
        return clampInt(week + 1, minCount, maxCount);
    }
    return rng.range(minCount, maxCount);
}

ScheduleSettings ScheduleSettings::fromConfig(const Config& config, int highestTier) {
    ScheduleSettings settings;

    settings.daysPerWeek = config.getInt("schedule.days_per_week", DEFAULT_DAYS_PER_WEEK);
    if (settings.daysPerWeek < 1) {
        LOG_WARN("Config: schedule.days_per_week {} is invalid, using {}",
                 settings.daysPerWeek, DEFAULT_DAYS_PER_WEEK);
        settings.daysPerWeek = DEFAULT_DAYS_PER_WEEK;
    }

    settings.dailyRefresh = config.getBool("schedule.daily_refresh", false);

    if (highestTier < 1) highestTier = 1;
    settings.autoTierMin = config.getInt("schedule.auto_tier_min", 1);
    settings.autoTierMax = config.getInt("schedule.auto_tier_max", highestTier);
    if (settings.autoTierMin > settings.autoTierMax) {
        LOG_WARN("Config: automatic tier range [{}, {}] is inverted, using [1, {}]",
                 settings.autoTierMin, settings.autoTierMax, highestTier);
        settings.autoTierMin = 1;
        settings.autoTierMax = highestTier;
    }

    settings.tieredFill = readFillPolicy(config, "fill.tiered", FillPolicy::tiered());
    settings.dailyFill = readFillPolicy(config, "fill.daily", FillPolicy::daily());
    return settings;
}

int rollDayOfWeek(IRandom& rng, int daysPerWeek) {
    return rng.range(0, daysPerWeek - 1);
}

int rollQuantity(const ItemDefinition& definition, IRandom& rng) {
    if (definition.stackLimit <= 1) {
        return 1;
    }
    return rng.range(1, definition.stackLimit);
}

} // namespace deaddrop
