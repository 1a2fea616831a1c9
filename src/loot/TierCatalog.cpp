#include "loot/TierCatalog.hpp"
#include "core/Config.hpp"
#include "core/Log.hpp"

#include <exception>
#include <string>
#include <utility>

namespace deaddrop {

namespace {

std::map<int, std::vector<ItemRef>> referenceLoot() {
    return {
        {1, {"cash", "soda", "energy_drink"}},
        {2, {"weed_bag", "fertilizer", "clippers"}},
        {3, {"goldwatch", "m1911", "goldbar"}},
    };
}

std::vector<UnlockStep> referenceUnlockSteps() {
    return {{1, 1}, {3, 2}};
}

constexpr int REFERENCE_FINAL_TIER = 3;

// Parse {"1": ["cash", ...], ...}.  Returns false on any malformed entry.
bool parseLoot(const nlohmann::json& node, std::map<int, std::vector<ItemRef>>& out,
               std::string& error) {
    if (!node.is_object()) {
        error = "loot.tiers must be an object";
        return false;
    }
    for (auto it = node.begin(); it != node.end(); ++it) {
        int tier = 0;
        try {
            size_t consumed = 0;
            tier = std::stoi(it.key(), &consumed);
            if (consumed != it.key().size()) {
                error = "tier key '" + it.key() + "' is not an integer";
                return false;
            }
        } catch (const std::exception&) {
            error = "tier key '" + it.key() + "' is not an integer";
            return false;
        }

        if (!it->is_array()) {
            error = "items of tier " + it.key() + " must be an array";
            return false;
        }
        std::vector<ItemRef> items;
        for (const auto& id : *it) {
            if (!id.is_string()) {
                error = "item ids of tier " + it.key() + " must be strings";
                return false;
            }
            items.push_back(id.get<std::string>());
        }
        out[tier] = std::move(items);
    }
    return true;
}

bool parseUnlockSteps(const nlohmann::json& node, std::vector<UnlockStep>& out,
                      std::string& error) {
    if (!node.is_array()) {
        error = "loot.unlock must be an array";
        return false;
    }
    for (const auto& entry : node) {
        if (!entry.is_object() || !entry.contains("max_week") || !entry.contains("tier") ||
            !entry["max_week"].is_number_integer() || !entry["tier"].is_number_integer()) {
            error = "loot.unlock entries need integer max_week and tier";
            return false;
        }
        out.push_back({entry["max_week"].get<int>(), entry["tier"].get<int>()});
    }
    return true;
}

} // anonymous namespace

TierCatalog::TierCatalog(std::map<int, std::vector<ItemRef>> loot,
                         std::vector<UnlockStep> unlockSteps, int finalTier)
    : m_loot(std::move(loot))
    , m_unlockSteps(std::move(unlockSteps))
    , m_finalTier(finalTier) {}

TierCatalog TierCatalog::reference() {
    return TierCatalog(referenceLoot(), referenceUnlockSteps(), REFERENCE_FINAL_TIER);
}

TierCatalog TierCatalog::fromConfig(const Config& config) {
    auto loot = referenceLoot();
    auto steps = referenceUnlockSteps();
    int finalTier = config.getInt("loot.final_tier", REFERENCE_FINAL_TIER);
    std::string error;

    if (const auto* node = config.find("loot.tiers")) {
        loot.clear();
        if (!parseLoot(*node, loot, error)) {
            LOG_WARN("TierCatalog: {}; using reference catalog", error);
            return reference();
        }
    }
    if (const auto* node = config.find("loot.unlock")) {
        steps.clear();
        if (!parseUnlockSteps(*node, steps, error)) {
            LOG_WARN("TierCatalog: {}; using reference catalog", error);
            return reference();
        }
    }

    error = validate(loot, steps, finalTier);
    if (!error.empty()) {
        LOG_WARN("TierCatalog: {}; using reference catalog", error);
        return reference();
    }

    LOG_INFO("TierCatalog: {} tiers loaded, final tier {}", loot.size(), finalTier);
    return TierCatalog(std::move(loot), std::move(steps), finalTier);
}

std::string TierCatalog::validate(const std::map<int, std::vector<ItemRef>>& loot,
                                  const std::vector<UnlockStep>& unlockSteps, int finalTier) {
    if (loot.empty()) {
        return "catalog has no tiers";
    }
    for (const auto& [tier, items] : loot) {
        if (tier < 1) {
            return "tier " + std::to_string(tier) + " is not positive";
        }
    }
    if (loot.count(finalTier) == 0) {
        return "final tier " + std::to_string(finalTier) + " is not in the catalog";
    }

    int prevWeek = -1;
    int prevTier = 0;
    for (const auto& step : unlockSteps) {
        if (loot.count(step.tier) == 0) {
            return "unlock tier " + std::to_string(step.tier) + " is not in the catalog";
        }
        if (step.maxWeek <= prevWeek) {
            return "unlock weeks must be strictly increasing";
        }
        if (step.tier < prevTier) {
            return "unlock tiers must not decrease";
        }
        prevWeek = step.maxWeek;
        prevTier = step.tier;
    }
    if (finalTier < prevTier) {
        return "final tier is lower than the last unlock step";
    }
    return {};
}

std::vector<ItemRef> TierCatalog::lootFor(int tier) const {
    auto it = m_loot.find(tier);
    if (it == m_loot.end()) {
        LOG_WARN("TierCatalog: unknown tier {}", tier);
        return {};
    }
    return it->second;
}

int TierCatalog::unlockedTierFor(int week) const {
    if (week < 0) week = 0;
    for (const auto& step : m_unlockSteps) {
        if (week <= step.maxWeek) {
            return step.tier;
        }
    }
    return m_finalTier;
}

bool TierCatalog::isValidTier(int tier) const {
    return m_loot.count(tier) > 0;
}

std::vector<int> TierCatalog::tiers() const {
    std::vector<int> result;
    result.reserve(m_loot.size());
    for (const auto& entry : m_loot) {
        result.push_back(entry.first);
    }
    return result;
}

int TierCatalog::highestTier() const {
    return m_loot.empty() ? 0 : m_loot.rbegin()->first;
}

} // namespace deaddrop
