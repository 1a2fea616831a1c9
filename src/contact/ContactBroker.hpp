#pragma once

#include "host/HostInterfaces.hpp"

namespace deaddrop {

class DropScheduler;

/// The NPC contact the player talks to.
///
/// Turns player requests into scheduler calls and answers every request
/// with a message, whether or not a drop was spawned.
class ContactBroker {
public:
    ContactBroker(DropScheduler& scheduler, INotifier& contact);

    /// Ask for a drop of a given tier.  Returns true if one was spawned.
    bool requestCustomDrop(int tier);

    /// Tell the player which tier the given week unlocks
    void announceDailyTier(int week);

    INotifier& contact() { return m_contact; }

private:
    DropScheduler& m_scheduler;
    INotifier& m_contact;
};

} // namespace deaddrop
