#pragma once

#include "core/Random.hpp"

#include <optional>
#include <string>
#include <vector>

namespace deaddrop {

/// Opaque item identifier, resolved by the host's item catalog
using ItemRef = std::string;

struct Vec3 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;

    constexpr Vec3() = default;
    constexpr Vec3(float x, float y, float z) : x(x), y(y), z(z) {}
};

/// Host-side item definition
struct ItemDefinition {
    ItemRef id;
    std::string name;
    int stackLimit = 1;     // <= 0 means the item does not stack
};

/// A concrete stack of an item, ready to be placed in storage
struct ItemInstance {
    ItemRef itemId;
    int quantity = 1;
};

// ============================================================================
// Consumed capabilities
// ============================================================================

class ITimeSource {
public:
    virtual ~ITimeSource() = default;
    virtual int elapsedDays() const = 0;
};

/// Hosts report failures through return values.  Anything an adapter does
/// throw must derive from std::exception; such errors are caught per item.
class IStorage {
public:
    virtual ~IStorage() = default;

    /// Add an item stack.  Returns false if the storage refused it.
    virtual bool addItem(const ItemInstance& instance) = 0;
};

/// A place in the world where a drop can be stashed.  The storage is owned
/// by the host and outlives the location value.
struct Location {
    std::string id;
    Vec3 position;
    IStorage* storage = nullptr;
};

class ILocationProvider {
public:
    virtual ~ILocationProvider() = default;

    virtual std::vector<Location> availableLocations() const = 0;

    /// Choose the location for the next drop.  Default: uniform pick.
    /// Returns nullptr only for an empty list.
    virtual const Location* chooseLocation(const std::vector<Location>& locations, IRandom& rng) const {
        return pickOne(locations, rng);
    }
};

/// createInstance() follows the same rule as IStorage::addItem(): empty
/// result on failure, std::exception-derived errors only.
class IItemCatalog {
public:
    virtual ~IItemCatalog() = default;

    virtual std::optional<ItemDefinition> resolve(const ItemRef& id) const = 0;
    virtual std::optional<ItemInstance> createInstance(const ItemDefinition& definition, int quantity) const = 0;
};

/// Delivers a player-visible message from a contact
class INotifier {
public:
    virtual ~INotifier() = default;
    virtual void sendMessage(const std::string& text) = 0;
};

struct ContactInfo {
    std::string id;
    std::string firstName;
    std::string lastName;
};

/// Looks up a messaging contact by id, creating it if the host has none
class IContactDirectory {
public:
    virtual ~IContactDirectory() = default;
    virtual INotifier& contact(const ContactInfo& info) = 0;
};

} // namespace deaddrop
