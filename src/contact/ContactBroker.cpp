#include "contact/ContactBroker.hpp"
#include "contact/Messages.hpp"
#include "drop/DropScheduler.hpp"
#include "core/Log.hpp"

namespace deaddrop {

ContactBroker::ContactBroker(DropScheduler& scheduler, INotifier& contact)
    : m_scheduler(scheduler)
    , m_contact(contact) {}

bool ContactBroker::requestCustomDrop(int tier) {
    DropRequest request = m_scheduler.tryManualDrop(tier);

    switch (request.outcome) {
        case DropOutcome::Spawned:
            m_contact.sendMessage(messages::requestAccepted(tier));
            return true;
        case DropOutcome::UnknownTier:
            m_contact.sendMessage(messages::unknownTier());
            break;
        case DropOutcome::NotUnlocked:
            m_contact.sendMessage(messages::notUnlocked(tier));
            break;
        case DropOutcome::NoLocations:
        case DropOutcome::NotInitialized:
            m_contact.sendMessage(messages::noLocations());
            break;
    }

    HOST_LOG_INFO("Contact: tier {} request denied ({})", tier, dropOutcomeToString(request.outcome));
    return false;
}

void ContactBroker::announceDailyTier(int week) {
    m_contact.sendMessage(messages::dailyTier(m_scheduler.catalog().unlockedTierFor(week)));
}

} // namespace deaddrop
