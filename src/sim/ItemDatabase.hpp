#pragma once

#include "host/HostInterfaces.hpp"

#include <unordered_map>

namespace deaddrop {

class Config;

/// Simulated item registry backing IItemCatalog
class ItemDatabase : public IItemCatalog {
public:
    ItemDatabase() = default;

    /// Read "sim.items": [{"id", "name", "stack_limit"}].
    /// Returns the number of items registered.
    int loadFromConfig(const Config& config);

    /// Register or replace an item definition
    void registerItem(const ItemDefinition& definition);

    std::optional<ItemDefinition> resolve(const ItemRef& id) const override;

    /// Fails for unknown items and for quantities outside [1, stack limit]
    std::optional<ItemInstance> createInstance(const ItemDefinition& definition, int quantity) const override;

    bool hasItem(const ItemRef& id) const { return m_items.count(id) > 0; }
    size_t itemCount() const { return m_items.size(); }

private:
    std::unordered_map<ItemRef, ItemDefinition> m_items;
};

} // namespace deaddrop
