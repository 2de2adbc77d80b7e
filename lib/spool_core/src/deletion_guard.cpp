#include "spool/viewer/deletion_guard.hpp"
#include "spool/viewer/list_synchronizer.hpp"
#include "spool/mail/errors.hpp"
#include "spool/mail/repository.hpp"
#include "spool/log.hpp"

namespace spool::viewer
{

DeletionGuard::DeletionGuard(mail::Repository &repository, ListSynchronizer &list, const log::Logger &logger)
    : repository_(repository), list_(list), logger_(logger)
{
}

DeletionResult DeletionGuard::deleteSelected()
{
    std::lock_guard<std::mutex> lock(mutex_);

    DeletionResult result;
    const std::vector<mail::MessageEntry> captured = list_.selectedEntries();
    const std::optional<std::size_t> priorIndex = list_.selectedIndex();
    if (captured.empty())
        return result;

    for (const auto &entry : captured)
    {
        try
        {
            repository_.deleteMessage(entry);
            result.deleted.push_back(entry);
        }
        catch (const mail::NotFoundError &ex)
        {
            logger_.warning("Message " + entry.token() + " was already gone: " + ex.what());
            result.missing.push_back(entry);
        }
        catch (const mail::MailError &ex)
        {
            logger_.error("Failed to delete message " + entry.token() + ": " + ex.what());
            result.failed.push_back(entry);
        }
    }

    std::vector<mail::MessageEntry> removed = result.deleted;
    removed.insert(removed.end(), result.missing.begin(), result.missing.end());
    list_.remove(removed, priorIndex);

    if (!result.missing.empty())
    {
        try
        {
            list_.reset(repository_.loadAll());
            result.resynced = true;
        }
        catch (const mail::MailError &ex)
        {
            logger_.error(std::string("Unable to resync message list after delete: ") + ex.what());
        }
    }

    if (!result.deleted.empty())
        list_.clearMarks();
    return result;
}

} // namespace spool::viewer
