#include "sim/ContactBook.hpp"
#include "core/Log.hpp"

namespace deaddrop {

void ContactLog::sendMessage(const std::string& text) {
    HOST_LOG_INFO("[{}] {}", displayName(), text);
    m_messages.push_back(text);
}

std::string ContactLog::displayName() const {
    if (m_info.lastName.empty()) return m_info.firstName;
    if (m_info.firstName.empty()) return m_info.lastName;
    return m_info.firstName + " " + m_info.lastName;
}

INotifier& ContactBook::contact(const ContactInfo& info) {
    auto it = m_contacts.find(info.id);
    if (it != m_contacts.end()) {
        HOST_LOG_DEBUG("Contacts: reusing '{}'", info.id);
        return *it->second;
    }

    HOST_LOG_INFO("Contacts: created '{}'", info.id);
    auto& slot = m_contacts[info.id];
    slot = std::make_unique<ContactLog>(info);
    return *slot;
}

ContactLog* ContactBook::find(const std::string& id) {
    auto it = m_contacts.find(id);
    return it != m_contacts.end() ? it->second.get() : nullptr;
}

} // namespace deaddrop
