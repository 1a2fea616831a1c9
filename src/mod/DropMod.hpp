#pragma once

#include "contact/ContactBroker.hpp"
#include "drop/DropScheduler.hpp"
#include "host/HostInterfaces.hpp"
#include "host/TimeSignals.hpp"
#include "loot/TierCatalog.hpp"

#include <memory>
#include <string>
#include <vector>

namespace deaddrop {

class Config;

/// Everything the mod needs from the game.  All references must outlive
/// the DropMod.
struct HostServices {
    ITimeSource& time;
    TimeSignalBus& signals;
    ILocationProvider& locations;
    IItemCatalog& items;
    IContactDirectory& contacts;
    IRandom& rng;
};

/// Mod entry point.
///
/// Nothing happens until the gameplay scene loads.  The first time it does,
/// the mod builds its catalog, contact and scheduler and hooks the
/// scheduler to the host's time signals.  Later scene loads are ignored.
class DropMod {
public:
    DropMod(const Config& config, HostServices services);
    ~DropMod();

    DropMod(const DropMod&) = delete;
    DropMod& operator=(const DropMod&) = delete;

    /// Host callback for every scene load.  Returns true if this call
    /// started the mod.
    bool onSceneLoaded(const std::string& sceneName);

    /// Unhook from the time signals.  Safe to call more than once.
    void shutdown();

    bool isStarted() const { return m_started; }
    const std::string& sceneName() const { return m_sceneName; }

    /// Null until the mod has started
    DropScheduler* scheduler() { return m_scheduler.get(); }
    ContactBroker* contact() { return m_contact.get(); }
    const TierCatalog* catalog() const { return m_catalog.get(); }

private:
    void start();
    void handleDayPass();

    const Config& m_config;
    HostServices m_services;

    std::string m_sceneName;
    bool m_announceDailyTier = false;
    bool m_started = false;

    std::unique_ptr<TierCatalog> m_catalog;
    std::unique_ptr<DropScheduler> m_scheduler;
    std::unique_ptr<ContactBroker> m_contact;
    std::vector<SignalHandlerId> m_handlers;
};

} // namespace deaddrop
