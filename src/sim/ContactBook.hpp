#pragma once

#include "host/HostInterfaces.hpp"

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace deaddrop {

/// A phone contact that records every message it sends to the player
class ContactLog : public INotifier {
public:
    explicit ContactLog(ContactInfo info) : m_info(std::move(info)) {}

    void sendMessage(const std::string& text) override;

    const ContactInfo& info() const { return m_info; }
    std::string displayName() const;

    const std::vector<std::string>& messages() const { return m_messages; }
    void clearMessages() { m_messages.clear(); }

private:
    ContactInfo m_info;
    std::vector<std::string> m_messages;
};

/// The player's phone contacts, keyed by id
class ContactBook : public IContactDirectory {
public:
    /// Existing contact with the same id, or a new one
    INotifier& contact(const ContactInfo& info) override;

    ContactLog* find(const std::string& id);
    size_t contactCount() const { return m_contacts.size(); }

private:
    std::map<std::string, std::unique_ptr<ContactLog>> m_contacts;
};

} // namespace deaddrop
