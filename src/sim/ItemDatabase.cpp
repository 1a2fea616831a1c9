#include "sim/ItemDatabase.hpp"
#include "core/Config.hpp"
#include "core/Log.hpp"

namespace deaddrop {

int ItemDatabase::loadFromConfig(const Config& config) {
    const auto* node = config.find("sim.items");
    if (!node) return 0;
    if (!node->is_array()) {
        HOST_LOG_WARN("Items: sim.items must be an array");
        return 0;
    }

    int loaded = 0;
    for (const auto& entry : *node) {
        if (!entry.is_object() || !entry.contains("id") || !entry["id"].is_string()) {
            HOST_LOG_WARN("Items: skipping entry without an id");
            continue;
        }

        ItemDefinition def;
        def.id = entry["id"].get<std::string>();
        def.name = def.id;
        if (entry.contains("name") && entry["name"].is_string()) {
            def.name = entry["name"].get<std::string>();
        }
        if (entry.contains("stack_limit") && entry["stack_limit"].is_number_integer()) {
            def.stackLimit = entry["stack_limit"].get<int>();
        }

        registerItem(def);
        ++loaded;
    }
    HOST_LOG_INFO("Items: {} definitions loaded", loaded);
    return loaded;
}

void ItemDatabase::registerItem(const ItemDefinition& definition) {
    m_items[definition.id] = definition;
}

std::optional<ItemDefinition> ItemDatabase::resolve(const ItemRef& id) const {
    auto it = m_items.find(id);
    if (it == m_items.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<ItemInstance> ItemDatabase::createInstance(const ItemDefinition& definition,
                                                         int quantity) const {
    auto it = m_items.find(definition.id);
    if (it == m_items.end()) {
        return std::nullopt;
    }

    const int limit = it->second.stackLimit > 1 ? it->second.stackLimit : 1;
    if (quantity < 1 || quantity > limit) {
        HOST_LOG_DEBUG("Items: quantity {} out of range for '{}'", quantity, definition.id);
        return std::nullopt;
    }
    return ItemInstance{definition.id, quantity};
}

} // namespace deaddrop
