#include "drop/DropScheduler.hpp"
#include "contact/Messages.hpp"
#include "core/Log.hpp"

#include <exception>
#include <utility>

namespace deaddrop {

DropScheduler::DropScheduler(const TierCatalog& catalog,
                             ScheduleSettings settings,
                             const ITimeSource& time,
                             const ILocationProvider& locations,
                             const IItemCatalog& items,
                             INotifier& notifier,
                             IRandom& rng)
    : m_catalog(catalog)
    , m_settings(std::move(settings))
    , m_time(time)
    , m_locations(locations)
    , m_items(items)
    , m_notifier(notifier)
    , m_rng(rng) {}

void DropScheduler::initialize() {
    if (m_initialized) {
        LOG_DEBUG("DropScheduler: already initialized");
        return;
    }
    m_initialized = true;
    m_state = SchedulerState{};
    m_activeDrop.reset();
    LOG_INFO("DropScheduler: initialized ({} tiers, {} days per week)",
             m_catalog.tiers().size(), m_settings.daysPerWeek);
}

int DropScheduler::currentWeek() const {
    return m_time.elapsedDays() / m_settings.daysPerWeek;
}

int DropScheduler::today() const {
    return m_time.elapsedDays() % m_settings.daysPerWeek;
}

// ---------------------------------------------------------------------------
// Time signals
// ---------------------------------------------------------------------------

void DropScheduler::onWeekPass() {
    if (!m_initialized) {
        LOG_WARN("DropScheduler: week signal before initialize, ignored");
        return;
    }
    m_state.scheduledDayOfWeek = rollDayOfWeek(m_rng, m_settings.daysPerWeek);
    LOG_INFO("Week {} began (elapsed days {}), automatic drop scheduled for day {}",
             currentWeek(), m_time.elapsedDays(), m_state.scheduledDayOfWeek);
}

void DropScheduler::onDayPass() {
    if (!m_initialized) {
        LOG_WARN("DropScheduler: day signal before initialize, ignored");
        return;
    }

    const int week = currentWeek();
    const int day = today();
    LOG_DEBUG("New day: week {} day {}", week, day);

    if (m_settings.dailyRefresh) {
        refreshDailyDrop();
    }

    if (m_state.lastAutoDropWeek == week) {
        return;
    }
    if (day != m_state.scheduledDayOfWeek) {
        LOG_DEBUG("Automatic drop pending for week {}, scheduled for day {}",
                  week, m_state.scheduledDayOfWeek);
        return;
    }

    const int tier = m_rng.range(m_settings.autoTierMin, m_settings.autoTierMax);
    LOG_INFO("Automatic drop day {} reached, rolled tier {}", day, tier);

    DropRequest request = spawnDrop(tier, DropKind::Automatic, m_settings.tieredFill);
    if (request.spawned()) {
        m_state.lastAutoDropWeek = week;
    } else {
        LOG_WARN("Automatic drop for week {} failed: {}", week, dropOutcomeToString(request.outcome));
    }
}

void DropScheduler::onSleepStart() {
    if (m_activeDrop) {
        LOG_INFO("Clearing active drop at '{}'", m_activeDrop->locationId);
    }
    m_activeDrop.reset();
    m_state.activeDropPresent = false;
}

// ---------------------------------------------------------------------------
// Requests
// ---------------------------------------------------------------------------

bool DropScheduler::requestManualDrop(int tier) {
    return tryManualDrop(tier).spawned();
}

DropRequest DropScheduler::tryManualDrop(int tier) {
    DropRequest request;
    request.tier = tier;
    request.kind = DropKind::Manual;

    if (!m_initialized) {
        LOG_WARN("Manual drop for tier {} rejected: scheduler not initialized", tier);
        request.outcome = DropOutcome::NotInitialized;
        return request;
    }
    if (!m_catalog.isValidTier(tier)) {
        LOG_WARN("Manual drop rejected: unknown tier {}", tier);
        request.outcome = DropOutcome::UnknownTier;
        return request;
    }

    const int week = currentWeek();
    const int unlocked = m_catalog.unlockedTierFor(week);
    if (tier > unlocked) {
        LOG_INFO("Manual drop for tier {} blocked at week {} (unlocked tier {})", tier, week, unlocked);
        request.outcome = DropOutcome::NotUnlocked;
        return request;
    }

    return spawnDrop(tier, DropKind::Manual, m_settings.tieredFill);
}

DropRequest DropScheduler::refreshDailyDrop() {
    if (!m_initialized) {
        DropRequest request;
        request.kind = DropKind::DailyRefresh;
        request.outcome = DropOutcome::NotInitialized;
        return request;
    }
    const int tier = m_catalog.unlockedTierFor(currentWeek());
    return spawnDrop(tier, DropKind::DailyRefresh, m_settings.dailyFill);
}

std::vector<ItemRef> DropScheduler::lootForCurrentWeek() const {
    return m_catalog.lootFor(m_catalog.unlockedTierFor(currentWeek()));
}

// ---------------------------------------------------------------------------
// Spawning
// ---------------------------------------------------------------------------

DropRequest DropScheduler::spawnDrop(int tier, DropKind kind, const FillPolicy& fill) {
    DropRequest request;
    request.tier = tier;
    request.kind = kind;

    if (!m_catalog.isValidTier(tier)) {
        LOG_WARN("Spawn of {} drop rejected: unknown tier {}", dropKindToString(kind), tier);
        request.outcome = DropOutcome::UnknownTier;
        return request;
    }

    std::vector<Location> available = m_locations.availableLocations();
    const Location* chosen = m_locations.chooseLocation(available, m_rng);
    if (!chosen || !chosen->storage) {
        LOG_WARN("No drop locations available, {} tier {} drop aborted", dropKindToString(kind), tier);
        request.outcome = DropOutcome::NoLocations;
        return request;
    }

    LOG_INFO("Spawning {} tier {} drop at '{}' {}", dropKindToString(kind), tier,
             chosen->id, messages::formatPosition(chosen->position));

    request.itemsPlaced = fillStorage(*chosen->storage, tier, fill);
    request.outcome = DropOutcome::Spawned;

    ActiveDrop drop;
    drop.locationId = chosen->id;
    drop.position = chosen->position;
    drop.tier = tier;
    drop.kind = kind;
    drop.itemsPlaced = request.itemsPlaced;
    m_activeDrop = drop;
    m_state.activeDropPresent = true;

    m_notifier.sendMessage(messages::dropLive(tier, drop.position));
    return request;
}

int DropScheduler::fillStorage(IStorage& storage, int tier, const FillPolicy& fill) {
    std::vector<ItemDefinition> loot = resolveLoot(tier);
    if (loot.empty()) {
        LOG_WARN("No items resolved for tier {}, drop will be empty", tier);
        return 0;
    }

    const int count = fill.countFor(currentWeek(), m_rng);
    std::vector<ItemDefinition> selected = pickMany(loot, count, m_rng);

    int placed = 0;
    for (const auto& definition : selected) {
        if (tryPlaceItem(storage, definition)) {
            ++placed;
        }
    }

    LOG_INFO("Fill complete ({} policy): {} of {} stacks placed", fill.name, placed, count);
    return placed;
}

bool DropScheduler::tryPlaceItem(IStorage& storage, const ItemDefinition& definition) {
    const int quantity = rollQuantity(definition, m_rng);
    try {
        std::optional<ItemInstance> instance = m_items.createInstance(definition, quantity);
        if (!instance) {
            LOG_WARN("Failed to create instance of '{}' x{}", definition.id, quantity);
            return false;
        }
        if (!storage.addItem(*instance)) {
            LOG_WARN("Storage refused '{}' x{}", definition.id, quantity);
            return false;
        }
    } catch (const std::exception& e) {
        LOG_WARN("Error adding item '{}': {}", definition.id, e.what());
        return false;
    }

    LOG_DEBUG("Added '{}' x{}", definition.id, quantity);
    return true;
}

std::vector<ItemDefinition> DropScheduler::resolveLoot(int tier) const {
    std::vector<ItemDefinition> definitions;
    for (const auto& id : m_catalog.lootFor(tier)) {
        if (auto definition = m_items.resolve(id)) {
            definitions.push_back(std::move(*definition));
        } else {
            LOG_WARN("Item not found for id '{}'", id);
        }
    }
    return definitions;
}

} // namespace deaddrop
