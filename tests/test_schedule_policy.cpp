#include <gtest/gtest.h>
#include "drop/SchedulePolicy.hpp"
#include "core/Config.hpp"
#include "TestDoubles.hpp"

#include <set>

using namespace deaddrop;

// =============================================================================
// Fill policies
// =============================================================================

TEST(FillPolicyTest, TieredCountStaysInRange) {
    FillPolicy policy = FillPolicy::tiered();
    MersenneRandom rng(2024);
    std::set<int> seen;

    for (int week = 0; week < 10; ++week) {
        for (int i = 0; i < 200; ++i) {
            int count = policy.countFor(week, rng);
            ASSERT_GE(count, 2);
            ASSERT_LE(count, 5);
            seen.insert(count);
        }
    }
    EXPECT_EQ(seen, (std::set<int>{2, 3, 4, 5}));
}

TEST(FillPolicyTest, DailyCountIsWeekPlusOneClamped) {
    FillPolicy policy = FillPolicy::daily();
    test::ScriptedRandom rng;

    EXPECT_EQ(policy.countFor(0, rng), 2);
    EXPECT_EQ(policy.countFor(1, rng), 2);
    EXPECT_EQ(policy.countFor(2, rng), 3);
    EXPECT_EQ(policy.countFor(3, rng), 4);
    EXPECT_EQ(policy.countFor(4, rng), 5);
    EXPECT_EQ(policy.countFor(50, rng), 5);

    // Deterministic: no random draws
    EXPECT_TRUE(rng.calls.empty());
}

TEST(FillPolicyTest, PoliciesStayDistinct) {
    FillPolicy tiered = FillPolicy::tiered();
    FillPolicy daily = FillPolicy::daily();

    EXPECT_EQ(tiered.name, "tiered");
    EXPECT_EQ(daily.name, "daily");
    EXPECT_FALSE(tiered.scaleWithWeek);
    EXPECT_TRUE(daily.scaleWithWeek);
    EXPECT_EQ(tiered.minCount, 2);
    EXPECT_EQ(tiered.maxCount, 5);
    EXPECT_EQ(daily.minCount, 2);
    EXPECT_EQ(daily.maxCount, 5);
}

TEST(FillPolicyTest, TieredDrawsFromConfiguredWindow) {
    FillPolicy policy{"custom", 1, 8, false};
    test::ScriptedRandom rng{6};

    EXPECT_EQ(policy.countFor(0, rng), 6);
    ASSERT_EQ(rng.calls.size(), 1u);
    EXPECT_EQ(rng.calls[0], std::make_pair(1, 8));
}

// =============================================================================
// Helpers
// =============================================================================

TEST(SchedulePolicyTest, ClampInt) {
    EXPECT_EQ(clampInt(1, 2, 5), 2);
    EXPECT_EQ(clampInt(2, 2, 5), 2);
    EXPECT_EQ(clampInt(4, 2, 5), 4);
    EXPECT_EQ(clampInt(9, 2, 5), 5);
}

TEST(SchedulePolicyTest, RollDayOfWeekCoversWeek) {
    MersenneRandom rng(77);
    std::set<int> seen;
    for (int i = 0; i < 1000; ++i) {
        int day = rollDayOfWeek(rng);
        ASSERT_GE(day, 0);
        ASSERT_LE(day, 6);
        seen.insert(day);
    }
    EXPECT_EQ(seen.size(), 7u);
}

TEST(SchedulePolicyTest, RollDayOfWeekShortWeek) {
    test::ScriptedRandom rng{9};
    EXPECT_EQ(rollDayOfWeek(rng, 3), 2);
    EXPECT_EQ(rng.calls[0], std::make_pair(0, 2));
}

TEST(SchedulePolicyTest, QuantityForNonStackingItemIsOne) {
    test::ScriptedRandom rng{50, 50, 50};
    EXPECT_EQ(rollQuantity(ItemDefinition{"m1911", "M1911", 1}, rng), 1);
    EXPECT_EQ(rollQuantity(ItemDefinition{"goldwatch", "Gold Watch", 0}, rng), 1);
    EXPECT_EQ(rollQuantity(ItemDefinition{"odd", "Odd", -4}, rng), 1);
    EXPECT_TRUE(rng.calls.empty());
}

TEST(SchedulePolicyTest, QuantityWithinStackLimit) {
    MersenneRandom rng(3);
    ItemDefinition soda{"soda", "Soda", 10};
    std::set<int> seen;
    for (int i = 0; i < 2000; ++i) {
        int qty = rollQuantity(soda, rng);
        ASSERT_GE(qty, 1);
        ASSERT_LE(qty, 10);
        seen.insert(qty);
    }
    EXPECT_EQ(seen.size(), 10u);
}

// =============================================================================
// Settings from config
// =============================================================================

TEST(ScheduleSettingsTest, Defaults) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({})"));

    ScheduleSettings settings = ScheduleSettings::fromConfig(cfg);
    EXPECT_EQ(settings.daysPerWeek, 7);
    EXPECT_FALSE(settings.dailyRefresh);
    EXPECT_EQ(settings.autoTierMin, 1);
    EXPECT_EQ(settings.autoTierMax, 3);
    EXPECT_EQ(settings.tieredFill.minCount, 2);
    EXPECT_EQ(settings.tieredFill.maxCount, 5);
    EXPECT_FALSE(settings.tieredFill.scaleWithWeek);
    EXPECT_TRUE(settings.dailyFill.scaleWithWeek);
}

TEST(ScheduleSettingsTest, CustomValues) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({
        "schedule": {"days_per_week": 5, "daily_refresh": true, "auto_tier_min": 2, "auto_tier_max": 2},
        "fill": {"tiered": {"min": 1, "max": 3}, "daily": {"min": 3, "max": 6}}
    })"));

    ScheduleSettings settings = ScheduleSettings::fromConfig(cfg);
    EXPECT_EQ(settings.daysPerWeek, 5);
    EXPECT_TRUE(settings.dailyRefresh);
    EXPECT_EQ(settings.autoTierMin, 2);
    EXPECT_EQ(settings.autoTierMax, 2);
    EXPECT_EQ(settings.tieredFill.minCount, 1);
    EXPECT_EQ(settings.tieredFill.maxCount, 3);
    EXPECT_EQ(settings.dailyFill.minCount, 3);
    EXPECT_EQ(settings.dailyFill.maxCount, 6);
    EXPECT_EQ(settings.dailyFill.name, "daily");
}

TEST(ScheduleSettingsTest, InvalidValuesFallBack) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({
        "schedule": {"days_per_week": 0, "auto_tier_min": 3, "auto_tier_max": 1},
        "fill": {"tiered": {"min": 6, "max": 2}}
    })"));

    test::LogCapture capture;
    ScheduleSettings settings = ScheduleSettings::fromConfig(cfg);

    EXPECT_EQ(settings.daysPerWeek, 7);
    EXPECT_EQ(settings.autoTierMin, 1);
    EXPECT_EQ(settings.autoTierMax, 3);
    EXPECT_EQ(settings.tieredFill.minCount, 2);
    EXPECT_EQ(settings.tieredFill.maxCount, 5);
    EXPECT_EQ(capture.warningCount(), 3u);
}

TEST(ScheduleSettingsTest, AutomaticTierRangeDefaultsToHighestTier) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({})"));

    EXPECT_EQ(ScheduleSettings::fromConfig(cfg, 5).autoTierMax, 5);
    EXPECT_EQ(ScheduleSettings::fromConfig(cfg, 2).autoTierMax, 2);
    EXPECT_EQ(ScheduleSettings::fromConfig(cfg, 0).autoTierMax, 1);

    ASSERT_TRUE(cfg.loadFromString(R"({"schedule": {"auto_tier_max": 4}})"));
    EXPECT_EQ(ScheduleSettings::fromConfig(cfg, 2).autoTierMax, 4);

    ASSERT_TRUE(cfg.loadFromString(R"({"schedule": {"auto_tier_min": 4, "auto_tier_max": 2}})"));
    ScheduleSettings inverted = ScheduleSettings::fromConfig(cfg, 6);
    EXPECT_EQ(inverted.autoTierMin, 1);
    EXPECT_EQ(inverted.autoTierMax, 6);
}
