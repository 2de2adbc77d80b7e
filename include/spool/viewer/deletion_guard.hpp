#pragma once

#include "spool/mail/message_entry.hpp"

#include <mutex>
#include <vector>

namespace spool::log {
class Logger;
}

namespace spool::mail {
class Repository;
}

namespace spool::viewer
{

class ListSynchronizer;

struct DeletionResult
{
    std::vector<mail::MessageEntry> deleted;
    // Entries the repository no longer had; removed from the list as well.
    std::vector<mail::MessageEntry> missing;
    // Entries the repository failed to delete; left in place.
    std::vector<mail::MessageEntry> failed;
    bool resynced = false;

    bool empty() const noexcept { return deleted.empty() && missing.empty() && failed.empty(); }
};

// Runs "delete the selected messages" as one critical section so a second
// request (key repeat, click racing a key press) waits for the first to finish
// and then sees the selection the first one left behind.
class DeletionGuard
{
public:
    DeletionGuard(mail::Repository &repository, ListSynchronizer &list, const log::Logger &logger);

    DeletionResult deleteSelected();

private:
    mail::Repository &repository_;
    ListSynchronizer &list_;
    const log::Logger &logger_;
    std::mutex mutex_;
};

} // namespace spool::viewer
