#pragma once

#include "host/HostInterfaces.hpp"

#include <memory>
#include <string>
#include <vector>

namespace deaddrop {

class Config;

/// Fixed-size stash.  Each added stack takes one slot.
class StorageContainer : public IStorage {
public:
    explicit StorageContainer(int slots = 8) : m_slots(slots) {}

    bool addItem(const ItemInstance& instance) override;

    const std::vector<ItemInstance>& contents() const { return m_contents; }
    int slots() const { return m_slots; }
    bool isFull() const { return static_cast<int>(m_contents.size()) >= m_slots; }

    /// Total quantity of one item across all stacks
    int countOf(const ItemRef& itemId) const;

    void clear() { m_contents.clear(); }

private:
    int m_slots;
    std::vector<ItemInstance> m_contents;
};

/// A dead-drop spot placed in the world
struct DropSite {
    std::string id;
    Vec3 position;
    bool enabled = true;
    std::unique_ptr<StorageContainer> storage;
};

/// Simulated world: the set of drop sites the mod may use
class SimWorld : public ILocationProvider {
public:
    SimWorld() = default;

    /// Read "sim.locations": [{"id", "position": [x, y, z], "slots"}].
    /// Malformed entries are skipped with a warning.
    void loadFromConfig(const Config& config);

    /// Add a site.  Returns false if the id is already taken.
    bool addSite(const std::string& id, const Vec3& position, int slots = 8);

    /// Enable or disable a site.  Returns false for an unknown id.
    bool setSiteEnabled(const std::string& id, bool enabled);

    std::vector<Location> availableLocations() const override;

    /// Uniform pick.  The chosen site is emptied first, so a new drop never
    /// lands on top of an old one.
    const Location* chooseLocation(const std::vector<Location>& locations, IRandom& rng) const override;

    StorageContainer* storage(const std::string& id);
    const DropSite* site(const std::string& id) const;

    size_t siteCount() const { return m_sites.size(); }
    const std::vector<DropSite>& sites() const { return m_sites; }

private:
    std::vector<DropSite> m_sites;
};

} // namespace deaddrop
