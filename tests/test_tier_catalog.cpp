#include <gtest/gtest.h>
#include "loot/TierCatalog.hpp"
#include "core/Config.hpp"
#include "TestDoubles.hpp"

using namespace deaddrop;

// =============================================================================
// Reference catalog
// =============================================================================

TEST(TierCatalogTest, ReferenceUnlockThresholds) {
    TierCatalog catalog = TierCatalog::reference();

    EXPECT_EQ(catalog.unlockedTierFor(0), 1);
    EXPECT_EQ(catalog.unlockedTierFor(1), 1);
    EXPECT_EQ(catalog.unlockedTierFor(2), 2);
    EXPECT_EQ(catalog.unlockedTierFor(3), 2);
    EXPECT_EQ(catalog.unlockedTierFor(4), 3);
    EXPECT_EQ(catalog.unlockedTierFor(100), 3);
}

TEST(TierCatalogTest, NegativeWeekTreatedAsZero) {
    TierCatalog catalog = TierCatalog::reference();
    EXPECT_EQ(catalog.unlockedTierFor(-5), 1);
}

TEST(TierCatalogTest, UnlockIsMonotonicAndBounded) {
    TierCatalog catalog = TierCatalog::reference();
    int previous = catalog.unlockedTierFor(0);
    for (int week = 0; week <= 520; ++week) {
        int tier = catalog.unlockedTierFor(week);
        ASSERT_GE(tier, previous) << "week " << week;
        ASSERT_GE(tier, 1);
        ASSERT_LE(tier, 3);
        previous = tier;
    }
}

TEST(TierCatalogTest, ValidTiers) {
    TierCatalog catalog = TierCatalog::reference();
    EXPECT_TRUE(catalog.isValidTier(1));
    EXPECT_TRUE(catalog.isValidTier(2));
    EXPECT_TRUE(catalog.isValidTier(3));
    EXPECT_FALSE(catalog.isValidTier(0));
    EXPECT_FALSE(catalog.isValidTier(4));
    EXPECT_FALSE(catalog.isValidTier(5));
    EXPECT_FALSE(catalog.isValidTier(-1));
}

TEST(TierCatalogTest, TiersSorted) {
    TierCatalog catalog = TierCatalog::reference();
    EXPECT_EQ(catalog.tiers(), (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(catalog.highestTier(), 3);
    EXPECT_EQ(catalog.finalTier(), 3);
}

TEST(TierCatalogTest, LootForKnownTierKeepsOrder) {
    TierCatalog catalog = TierCatalog::reference();
    EXPECT_EQ(catalog.lootFor(1), (std::vector<ItemRef>{"cash", "soda", "energy_drink"}));
    EXPECT_EQ(catalog.lootFor(2), (std::vector<ItemRef>{"weed_bag", "fertilizer", "clippers"}));
    EXPECT_EQ(catalog.lootFor(3), (std::vector<ItemRef>{"goldwatch", "m1911", "goldbar"}));
}

TEST(TierCatalogTest, LootForUnknownTierIsEmptyWithWarning) {
    TierCatalog catalog = TierCatalog::reference();
    test::LogCapture capture;

    EXPECT_TRUE(catalog.lootFor(5).empty());
    EXPECT_TRUE(capture.hasWarning("unknown tier 5"));
    EXPECT_FALSE(catalog.isValidTier(5));
}

TEST(TierCatalogTest, ValidateAcceptsReference) {
    TierCatalog catalog = TierCatalog::reference();
    std::map<int, std::vector<ItemRef>> loot{{1, {"a"}}, {2, {"b"}}, {3, {"c"}}};
    EXPECT_EQ(TierCatalog::validate(loot, catalog.unlockSteps(), 3), "");
}

TEST(TierCatalogTest, ValidateRejectsBadTables) {
    std::map<int, std::vector<ItemRef>> loot{{1, {"a"}}, {2, {"b"}}};

    EXPECT_NE(TierCatalog::validate({}, {}, 1), "");
    EXPECT_NE(TierCatalog::validate(loot, {}, 3), "");                    // final tier unknown
    EXPECT_NE(TierCatalog::validate(loot, {{1, 4}}, 2), "");              // step tier unknown
    EXPECT_NE(TierCatalog::validate(loot, {{3, 1}, {2, 2}}, 2), "");      // weeks not increasing
    EXPECT_NE(TierCatalog::validate(loot, {{1, 2}, {3, 1}}, 2), "");      // tiers decreasing
    EXPECT_NE(TierCatalog::validate(loot, {{1, 2}}, 1), "");              // final below last step
    EXPECT_NE(TierCatalog::validate({{0, {"a"}}, {1, {"b"}}}, {}, 1), ""); // non-positive tier
}

// =============================================================================
// Loading from config
// =============================================================================

TEST(TierCatalogConfigTest, MissingSectionUsesReference) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({})"));

    TierCatalog catalog = TierCatalog::fromConfig(cfg);
    EXPECT_EQ(catalog.tiers(), (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(catalog.lootFor(3), TierCatalog::reference().lootFor(3));
    EXPECT_EQ(catalog.unlockedTierFor(4), 3);
}

TEST(TierCatalogConfigTest, CustomTable) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({
        "loot": {
            "tiers": {"1": ["soda"], "2": ["goldbar", "m1911"]},
            "unlock": [{"max_week": 0, "tier": 1}],
            "final_tier": 2
        }
    })"));

    TierCatalog catalog = TierCatalog::fromConfig(cfg);
    EXPECT_EQ(catalog.tiers(), (std::vector<int>{1, 2}));
    EXPECT_EQ(catalog.lootFor(2), (std::vector<ItemRef>{"goldbar", "m1911"}));
    EXPECT_EQ(catalog.unlockedTierFor(0), 1);
    EXPECT_EQ(catalog.unlockedTierFor(1), 2);
    EXPECT_FALSE(catalog.isValidTier(3));
}

TEST(TierCatalogConfigTest, NonMonotonicUnlockFallsBack) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({
        "loot": {
            "unlock": [{"max_week": 1, "tier": 3}, {"max_week": 3, "tier": 1}]
        }
    })"));

    test::LogCapture capture;
    TierCatalog catalog = TierCatalog::fromConfig(cfg);

    EXPECT_TRUE(capture.hasWarning("using reference catalog"));
    EXPECT_EQ(catalog.unlockedTierFor(0), 1);
    EXPECT_EQ(catalog.unlockedTierFor(2), 2);
}

TEST(TierCatalogConfigTest, NonIntegerTierKeyFallsBack) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"loot": {"tiers": {"one": ["cash"]}}})"));

    test::LogCapture capture;
    TierCatalog catalog = TierCatalog::fromConfig(cfg);

    EXPECT_TRUE(capture.hasWarning("not an integer"));
    EXPECT_EQ(catalog.tiers(), (std::vector<int>{1, 2, 3}));
}

TEST(TierCatalogConfigTest, NonStringItemFallsBack) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"loot": {"tiers": {"1": ["cash", 4]}}})"));

    test::LogCapture capture;
    TierCatalog catalog = TierCatalog::fromConfig(cfg);

    EXPECT_TRUE(capture.hasWarning("must be strings"));
    EXPECT_EQ(catalog.lootFor(1), TierCatalog::reference().lootFor(1));
}

TEST(TierCatalogConfigTest, TiersWithoutFinalTierFallBack) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"loot": {"tiers": {"1": ["cash"], "2": ["soda"]}}})"));

    // Reference final tier 3 is not in this table
    test::LogCapture capture;
    TierCatalog catalog = TierCatalog::fromConfig(cfg);

    EXPECT_GE(capture.warningCount(), 1u);
    EXPECT_EQ(catalog.tiers(), (std::vector<int>{1, 2, 3}));
}
