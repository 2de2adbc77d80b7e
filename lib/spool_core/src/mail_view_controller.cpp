#include "spool/viewer/mail_view_controller.hpp"
#include "spool/viewer/ui_queue.hpp"
#include "spool/mail/errors.hpp"
#include "spool/mail/repository.hpp"
#include "spool/log.hpp"

namespace spool::viewer
{

using mail::LoadOutcome;
using mail::MessageEntry;

std::string truncate(const std::string &text, std::size_t limit)
{
    // Counts UTF-8 code points; continuation bytes belong to the preceding character.
    std::size_t characters = 0;
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        if ((static_cast<unsigned char>(text[i]) & 0xC0) == 0x80)
            continue;
        if (characters == limit)
            return text.substr(0, i);
        ++characters;
    }
    return text;
}

Notification makeNewMessageNotification(const mail::FullMessage &message)
{
    Notification notification;
    notification.title = "New Message Received";
    notification.body = "From: " + truncate(message.from, kNotificationFieldLimit) +
                        "\nSubject: " + truncate(message.subject, kNotificationFieldLimit);
    return notification;
}

MailViewController::MailViewController(mail::Repository &repository, mail::ContentLoader &loader, UiQueue &queue,
                                       const RenderMaterializer *materializer, const log::Logger &logger)
    : repository_(repository), loader_(loader), queue_(queue), logger_(logger),
      coordinator_(loader, queue, materializer, logger), deletion_(repository, list_, logger),
      exportAdapter_([this](Point origin) { return entryAt(origin); },
                     [this](const ExportRequest &request) {
                         if (exportSink_)
                             exportSink_(request);
                     })
{
    list_.setSelectionChangedCallback(
        [this](const std::optional<MessageEntry> &selected) { coordinator_.select(selected); });
}

MailViewController::~MailViewController()
{
    stop();
}

void MailViewController::start()
{
    if (started_)
        return;
    started_ = true;

    std::weak_ptr<bool> alive = alive_;
    UiQueue *queue = &queue_;
    repository_.setNewMessageHandler([this, alive, queue](const MessageEntry &entry) {
        queue->post([this, alive, entry]() {
            if (!alive.expired())
                onNewMessage(entry);
        });
    });
    repository_.setRefreshNeededHandler([this, alive, queue]() {
        queue->post([this, alive]() {
            if (!alive.expired())
                refresh();
        });
    });

    refresh();
}

void MailViewController::stop()
{
    if (!started_)
        return;
    started_ = false;

    repository_.setNewMessageHandler(nullptr);
    repository_.setRefreshNeededHandler(nullptr);
    for (auto &[id, handle] : notificationLoads_)
        handle.cancel();
    notificationLoads_.clear();
}

void MailViewController::refresh()
{
    try
    {
        list_.reset(repository_.loadAll());
    }
    catch (const mail::MailError &ex)
    {
        logger_.error(std::string("Unable to load messages: ") + ex.what());
        notifyStatus(std::string("Unable to load messages: ") + ex.what());
        return;
    }
    notifyListChanged();
    notifyStatus(std::to_string(list_.size()) + (list_.size() == 1 ? " message" : " messages"));
}

void MailViewController::select(std::optional<std::size_t> index)
{
    list_.select(index);
    notifyListChanged();
}

void MailViewController::selectMostRecent()
{
    list_.selectLast();
    notifyListChanged();
}

void MailViewController::reloadSelected()
{
    auto entry = list_.selectedEntry();
    if (!entry)
        return;
    coordinator_.reload();
    notifyStatus("Reloading " + entry->token());
}

bool MailViewController::toggleMark(std::size_t index)
{
    bool marked = list_.toggleMark(index);
    notifyListChanged();
    return marked;
}

DeletionResult MailViewController::deleteSelected()
{
    if (!coordinator_.display().deleteEnabled)
    {
        logger_.debug("Delete ignored while " + std::string(viewStateName(coordinator_.state())));
        return DeletionResult{};
    }

    DeletionResult result = deletion_.deleteSelected();
    if (result.empty())
        return result;

    notifyListChanged();
    const std::size_t removed = result.deleted.size() + result.missing.size();
    if (!result.failed.empty())
        notifyStatus("Failed to delete " + std::to_string(result.failed.size()) + " of " +
                     std::to_string(removed + result.failed.size()) + " messages");
    else
        notifyStatus("Deleted " + std::to_string(removed) + (removed == 1 ? " message" : " messages"));
    return result;
}

void MailViewController::onNewMessage(const MessageEntry &entry)
{
    if (!list_.insert(entry))
        return;
    logger_.info("New message " + entry.token());
    notifyListChanged();

    if (!notificationsEnabled_ || !notify_)
        return;

    const std::uint64_t id = nextNotificationId_++;
    std::weak_ptr<bool> alive = alive_;
    UiQueue *queue = &queue_;
    try
    {
        mail::LoadHandle handle = loader_.get(entry, [this, alive, queue, id](LoadOutcome outcome) {
            if (alive.expired())
                return;
            queue->post([this, alive, id, outcome = std::move(outcome)]() {
                if (!alive.expired())
                    onNotificationLoaded(id, outcome);
            });
        });
        notificationLoads_.emplace(id, std::move(handle));
    }
    catch (const mail::MailError &ex)
    {
        logger_.warning("Unable to load new message " + entry.token() + " for notification: " + ex.what());
    }
}

void MailViewController::onNotificationLoaded(std::uint64_t id, const LoadOutcome &outcome)
{
    auto it = notificationLoads_.find(id);
    if (it == notificationLoads_.end())
        return;
    notificationLoads_.erase(it);

    if (!outcome.succeeded())
    {
        logger_.warning("New message could not be read for notification: " + outcome.errorMessage);
        return;
    }
    if (notificationsEnabled_ && notify_)
        notify_(makeNewMessageNotification(*outcome.message));
}

void MailViewController::notifyStatus(const std::string &message)
{
    if (status_)
        status_(message);
}

void MailViewController::notifyListChanged()
{
    if (listChanged_)
        listChanged_();
}

std::optional<MessageEntry> MailViewController::entryAt(Point origin) const
{
    if (!rowAtPoint_)
        return std::nullopt;
    std::optional<std::size_t> row = rowAtPoint_(origin);
    if (!row || *row >= list_.size())
        return std::nullopt;
    return list_.entries()[*row];
}

} // namespace spool::viewer
