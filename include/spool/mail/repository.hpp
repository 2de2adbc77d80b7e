#pragma once

#include "spool/mail/message_entry.hpp"

#include <functional>
#include <vector>

namespace spool::mail
{

/**
 * @brief Source of stored message entries.
 *
 * Event handlers may be invoked from any thread. Consumers are expected to
 * re-post the notification onto their own queue before touching shared state.
 */
class Repository
{
public:
    using NewMessageHandler = std::function<void(const MessageEntry &entry)>;
    using RefreshNeededHandler = std::function<void()>;

    virtual ~Repository() = default;

    virtual std::vector<MessageEntry> loadAll() = 0;

    // Throws NotFoundError when the entry was already removed.
    virtual void deleteMessage(const MessageEntry &entry) = 0;

    virtual void setNewMessageHandler(NewMessageHandler handler) = 0;
    virtual void setRefreshNeededHandler(RefreshNeededHandler handler) = 0;
};

} // namespace spool::mail
