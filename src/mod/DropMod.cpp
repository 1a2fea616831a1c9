#include "mod/DropMod.hpp"
#include "core/Config.hpp"
#include "core/Log.hpp"

namespace deaddrop {

DropMod::DropMod(const Config& config, HostServices services)
    : m_config(config)
    , m_services(services)
    , m_sceneName(config.getString("mod.scene", "Main"))
    , m_announceDailyTier(config.getBool("mod.announce_daily_tier", false)) {
    HOST_LOG_INFO("Dead drop mod loaded, waiting for scene '{}'", m_sceneName);
}

DropMod::~DropMod() {
    shutdown();
}

bool DropMod::onSceneLoaded(const std::string& sceneName) {
    if (m_started || sceneName != m_sceneName) {
        return false;
    }

    HOST_LOG_INFO("Scene '{}' loaded, starting dead drops", sceneName);
    start();
    return true;
}

void DropMod::start() {
    m_catalog = std::make_unique<TierCatalog>(TierCatalog::fromConfig(m_config));

    ContactInfo info;
    info.id = m_config.getString("mod.contact.id", "MrStacks");
    info.firstName = m_config.getString("mod.contact.first", "Mr.");
    info.lastName = m_config.getString("mod.contact.last", "Stacks");
    INotifier& contact = m_services.contacts.contact(info);

    m_scheduler = std::make_unique<DropScheduler>(
        *m_catalog, ScheduleSettings::fromConfig(m_config, m_catalog->highestTier()),
        m_services.time, m_services.locations, m_services.items,
        contact, m_services.rng);
    m_scheduler->initialize();

    m_contact = std::make_unique<ContactBroker>(*m_scheduler, contact);

    auto& bus = m_services.signals;
    m_handlers.push_back(bus.on(TimeSignal::DayPassed, [this]() { handleDayPass(); }));
    m_handlers.push_back(bus.on(TimeSignal::WeekPassed, [this]() { m_scheduler->onWeekPass(); }));
    m_handlers.push_back(bus.on(TimeSignal::SleepStart, [this]() { m_scheduler->onSleepStart(); }));

    m_started = true;
}

void DropMod::handleDayPass() {
    if (m_announceDailyTier) {
        m_contact->announceDailyTier(m_scheduler->currentWeek());
    }
    m_scheduler->onDayPass();
}

void DropMod::shutdown() {
    if (m_handlers.empty()) return;

    for (SignalHandlerId id : m_handlers) {
        m_services.signals.off(id);
    }
    m_handlers.clear();
    HOST_LOG_INFO("Dead drop mod unhooked from time signals");
}

} // namespace deaddrop
