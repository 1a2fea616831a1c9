#pragma once

#include "host/HostInterfaces.hpp"

#include <map>
#include <string>
#include <vector>

namespace deaddrop {

class Config;

/// One row of the unlock table: weeks up to and including `maxWeek`
/// unlock at most `tier`.
struct UnlockStep {
    int maxWeek = 0;
    int tier = 1;
};

/// Read-only tier -> loot table plus the week -> highest-tier policy.
///
/// The tier set is fixed at construction.  Unknown tiers are rejected by
/// every query; nothing ever adds a tier later.
class TierCatalog {
public:
    /// Build from explicit tables.  Callers are expected to validate first
    /// (see validate()); fromConfig() does this for you.
    TierCatalog(std::map<int, std::vector<ItemRef>> loot,
                std::vector<UnlockStep> unlockSteps, int finalTier);

    /// The hand-curated reference catalog:
    ///   tier 1: cash, soda, energy_drink
    ///   tier 2: weed_bag, fertilizer, clippers
    ///   tier 3: goldwatch, m1911, goldbar
    /// unlocking tier 1 up to week 1, tier 2 up to week 3, tier 3 after.
    static TierCatalog reference();

    /// Build from the "loot" config section.  Any part that is missing
    /// falls back to the reference table; an invalid table is logged and
    /// the whole reference catalog is used instead.
    static TierCatalog fromConfig(const Config& config);

    /// Item ids for a tier, in catalog order.  Unknown tiers give an empty
    /// list and a warning.
    std::vector<ItemRef> lootFor(int tier) const;

    /// Highest tier reachable at the given week.  Monotonic in `week`;
    /// negative weeks are treated as week 0.
    int unlockedTierFor(int week) const;

    bool isValidTier(int tier) const;

    /// Known tiers in ascending order
    std::vector<int> tiers() const;
    int highestTier() const;

    const std::vector<UnlockStep>& unlockSteps() const { return m_unlockSteps; }
    int finalTier() const { return m_finalTier; }

    /// Check a table for consistency.  Returns an empty string when valid,
    /// otherwise a description of the first problem found.
    static std::string validate(const std::map<int, std::vector<ItemRef>>& loot,
                                const std::vector<UnlockStep>& unlockSteps, int finalTier);

private:
    std::map<int, std::vector<ItemRef>> m_loot;
    std::vector<UnlockStep> m_unlockSteps;
    int m_finalTier = 1;
};

} // namespace deaddrop
