#pragma once

#include "drop/DropTypes.hpp"
#include "drop/SchedulePolicy.hpp"
#include "host/HostInterfaces.hpp"
#include "loot/TierCatalog.hpp"

#include <optional>
#include <vector>

namespace deaddrop {

/// Decides when loot drops appear and fills them.
///
/// Driven by three host time signals and one player request:
///   onWeekPass()          - re-roll this week's automatic drop day
///   onDayPass()           - spawn the automatic drop on the scheduled day,
///                           at most once per week
///   onSleepStart()        - forget the active drop (Active -> Idle)
///   requestManualDrop(t)  - spawn a tier t drop if t is unlocked
///
/// All calls must come from the host's single update thread.  Every failure
/// is resolved here and reported as a DropRequest outcome plus a log line;
/// nothing throws out of the public handlers.
///
/// The scheduler keeps non-owning references to its collaborators, which
/// must outlive it.
class DropScheduler {
public:
    DropScheduler(const TierCatalog& catalog,
                  ScheduleSettings settings,
                  const ITimeSource& time,
                  const ILocationProvider& locations,
                  const IItemCatalog& items,
                  INotifier& notifier,
                  IRandom& rng);

    /// One-time setup.  Calling it again has no effect.
    void initialize();
    bool isInitialized() const { return m_initialized; }

    // --- Time signal handlers ---

    void onDayPass();
    void onWeekPass();
    void onSleepStart();

    // --- Requests ---

    /// Player-triggered drop.  Returns true if a drop was spawned.
    bool requestManualDrop(int tier);

    /// Same as requestManualDrop(), with the failure reason.
    DropRequest tryManualDrop(int tier);

    /// Spawn a drop of the currently unlocked tier using the daily fill
    /// policy.  Does not count as the week's automatic drop.
    DropRequest refreshDailyDrop();

    /// Loot ids of the tier unlocked at the current week
    std::vector<ItemRef> lootForCurrentWeek() const;

    // --- State ---

    int currentWeek() const;
    int today() const;

    const SchedulerState& state() const { return m_state; }
    DropPhase phase() const { return m_state.activeDropPresent ? DropPhase::Active : DropPhase::Idle; }
    const std::optional<ActiveDrop>& activeDrop() const { return m_activeDrop; }

    const TierCatalog& catalog() const { return m_catalog; }
    const ScheduleSettings& settings() const { return m_settings; }

private:
    /// Validate the tier, pick a location, fill it and notify the player
    DropRequest spawnDrop(int tier, DropKind kind, const FillPolicy& fill);

    /// Fill storage with loot for `tier`.  Returns the number of stacks
    /// that actually made it into the storage.
    int fillStorage(IStorage& storage, int tier, const FillPolicy& fill);

    /// Create one item stack and add it to storage.  Failures, including
    /// std::exception thrown by the host, are logged and reported as false.
    bool tryPlaceItem(IStorage& storage, const ItemDefinition& definition);

    /// Catalog ids for a tier mapped to host definitions, skipping unknown ids
    std::vector<ItemDefinition> resolveLoot(int tier) const;

    const TierCatalog& m_catalog;
    ScheduleSettings m_settings;
    const ITimeSource& m_time;
    const ILocationProvider& m_locations;
    const IItemCatalog& m_items;
    INotifier& m_notifier;
    IRandom& m_rng;

    bool m_initialized = false;
    SchedulerState m_state;
    std::optional<ActiveDrop> m_activeDrop;
};

} // namespace deaddrop
