#include "sim/SimWorld.hpp"
#include "core/Config.hpp"
#include "core/Log.hpp"

#include <utility>

namespace deaddrop {

// ---------------------------------------------------------------------------
// StorageContainer
// ---------------------------------------------------------------------------

bool StorageContainer::addItem(const ItemInstance& instance) {
    if (instance.quantity <= 0 || isFull()) {
        return false;
    }
    m_contents.push_back(instance);
    return true;
}

int StorageContainer::countOf(const ItemRef& itemId) const {
    int total = 0;
    for (const auto& stack : m_contents) {
        if (stack.itemId == itemId) total += stack.quantity;
    }
    return total;
}

// ---------------------------------------------------------------------------
// SimWorld
// ---------------------------------------------------------------------------

void SimWorld::loadFromConfig(const Config& config) {
    const auto* node = config.find("sim.locations");
    if (!node) return;
    if (!node->is_array()) {
        HOST_LOG_WARN("World: sim.locations must be an array");
        return;
    }

    for (const auto& entry : *node) {
        if (!entry.is_object() || !entry.contains("id") || !entry["id"].is_string()) {
            HOST_LOG_WARN("World: skipping location without an id");
            continue;
        }
        std::string id = entry["id"].get<std::string>();

        Vec3 position;
        if (entry.contains("position")) {
            const auto& pos = entry["position"];
            if (!pos.is_array() || pos.size() != 3 || !pos[0].is_number() ||
                !pos[1].is_number() || !pos[2].is_number()) {
                HOST_LOG_WARN("World: location '{}' has a malformed position, skipped", id);
                continue;
            }
            position = Vec3(pos[0].get<float>(), pos[1].get<float>(), pos[2].get<float>());
        }

        int slots = 8;
        if (entry.contains("slots") && entry["slots"].is_number_integer()) {
            slots = entry["slots"].get<int>();
        }
        if (!addSite(id, position, slots)) {
            HOST_LOG_WARN("World: duplicate location '{}' skipped", id);
        }
    }
    HOST_LOG_INFO("World: {} drop sites loaded", m_sites.size());
}

bool SimWorld::addSite(const std::string& id, const Vec3& position, int slots) {
    if (site(id)) return false;

    DropSite dropSite;
    dropSite.id = id;
    dropSite.position = position;
    dropSite.storage = std::make_unique<StorageContainer>(slots);
    m_sites.push_back(std::move(dropSite));
    return true;
}

bool SimWorld::setSiteEnabled(const std::string& id, bool enabled) {
    for (auto& dropSite : m_sites) {
        if (dropSite.id == id) {
            dropSite.enabled = enabled;
            return true;
        }
    }
    return false;
}

std::vector<Location> SimWorld::availableLocations() const {
    std::vector<Location> locations;
    for (const auto& dropSite : m_sites) {
        if (!dropSite.enabled) continue;
        locations.push_back({dropSite.id, dropSite.position, dropSite.storage.get()});
    }
    return locations;
}

const Location* SimWorld::chooseLocation(const std::vector<Location>& locations, IRandom& rng) const {
    const Location* chosen = pickOne(locations, rng);
    if (!chosen) return nullptr;

    for (const auto& dropSite : m_sites) {
        if (dropSite.id != chosen->id) continue;
        if (!dropSite.storage->contents().empty()) {
            HOST_LOG_DEBUG("World: clearing {} stale stacks from '{}'",
                           dropSite.storage->contents().size(), dropSite.id);
            dropSite.storage->clear();
        }
        break;
    }
    return chosen;
}

StorageContainer* SimWorld::storage(const std::string& id) {
    for (auto& dropSite : m_sites) {
        if (dropSite.id == id) return dropSite.storage.get();
    }
    return nullptr;
}

const DropSite* SimWorld::site(const std::string& id) const {
    for (const auto& dropSite : m_sites) {
        if (dropSite.id == id) return &dropSite;
    }
    return nullptr;
}

} // namespace deaddrop
