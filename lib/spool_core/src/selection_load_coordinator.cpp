#include "spool/viewer/selection_load_coordinator.hpp"
#include "spool/viewer/render_materializer.hpp"
#include "spool/viewer/ui_queue.hpp"
#include "spool/mail/errors.hpp"
#include "spool/log.hpp"

namespace spool::viewer
{

using mail::FullMessage;
using mail::LoadOutcome;
using mail::MessageEntry;

const char *viewStateName(ViewState state) noexcept
{
    switch (state)
    {
    case ViewState::Idle:
        return "idle";
    case ViewState::Loading:
        return "loading";
    case ViewState::Rendered:
        return "rendered";
    case ViewState::Failed:
        return "failed";
    }
    return "unknown";
}

SelectionLoadCoordinator::SelectionLoadCoordinator(mail::ContentLoader &loader, UiQueue &queue,
                                                   const RenderMaterializer *materializer,
                                                   const log::Logger &logger)
    : loader_(loader), queue_(queue), materializer_(materializer), logger_(logger)
{
}

SelectionLoadCoordinator::~SelectionLoadCoordinator()
{
    cancelActive();
}

const LoadSession *SelectionLoadCoordinator::activeSession() const noexcept
{
    if (session_ && session_->active())
        return session_.get();
    return nullptr;
}

void SelectionLoadCoordinator::select(const std::optional<MessageEntry> &entry)
{
    if (!entry)
    {
        cancelActive();
        session_.reset();
        clearFields();
        notifyDisplayChanged();
        return;
    }
    startLoad(*entry);
}

void SelectionLoadCoordinator::reload()
{
    if (!session_)
        return;
    MessageEntry entry = session_->entry;
    startLoad(entry);
}

void SelectionLoadCoordinator::cancelActive()
{
    if (!session_ || !session_->active())
        return;
    session_->handle.cancel();
    session_->state = SessionState::Cancelled;
}

void SelectionLoadCoordinator::startLoad(const MessageEntry &entry)
{
    cancelActive();

    auto session = std::make_unique<LoadSession>();
    session->id = nextSessionId_++;
    session->entry = entry;
    session_ = std::move(session);

    clearFields();
    display_.state = ViewState::Loading;
    display_.title = kLoadingTitle;
    display_.loading = true;
    notifyDisplayChanged();

    const std::uint64_t id = session_->id;
    std::weak_ptr<bool> alive = alive_;
    UiQueue *queue = &queue_;
    try
    {
        session_->handle = loader_.get(entry, [this, alive, queue, id](LoadOutcome outcome) {
            if (alive.expired())
                return;
            queue->post([this, alive, id, outcome = std::move(outcome)]() mutable {
                if (alive.expired())
                    return;
                onCompleted(id, std::move(outcome));
            });
        });
    }
    catch (const mail::MailError &ex)
    {
        session_->state = SessionState::Failed;
        logger_.error("Unable to start loading message " + entry.token() + ": " + ex.what());
        showFailure(entry, LoadOutcome::failure(mail::LoadError::Io, ex.what()));
    }
}

void SelectionLoadCoordinator::onCompleted(std::uint64_t sessionId, LoadOutcome outcome)
{
    if (!session_ || session_->id != sessionId || session_->state != SessionState::Pending)
    {
        ++discarded_;
        logger_.debug("Dropped stale load result for session " + std::to_string(sessionId));
        return;
    }

    if (outcome.succeeded())
    {
        session_->state = SessionState::Delivered;
        showMessage(session_->entry, *outcome.message);
        return;
    }

    session_->state = SessionState::Failed;
    logger_.warning("Failed to load message " + session_->entry.token() + " (" +
                  mail::loadErrorName(outcome.error) + "): " + outcome.errorMessage);
    showFailure(session_->entry, outcome);
}

void SelectionLoadCoordinator::showMessage(const MessageEntry &entry, const FullMessage &message)
{
    clearFields();
    display_.state = ViewState::Rendered;
    display_.title = message.subject.empty() ? std::string(kNeutralTitle) : message.subject;

    display_.headers = message.headerText();
    display_.from = message.from;
    display_.to = message.to;
    display_.cc = message.cc;
    display_.bcc = message.bcc;
    display_.date = message.date;
    display_.subject = message.subject;

    display_.body = message.body.text;
    display_.bodyIsHtml = message.body.isHtml();
    if (display_.bodyIsHtml && materializer_)
    {
        try
        {
            display_.htmlFile = materializer_->materialize(message);
        }
        catch (const mail::MailError &ex)
        {
            logger_.error("Unable to write render files for " + entry.token() + ": " + ex.what());
        }
    }

    if (message.plainText)
        display_.plainText = message.plainText->text;
    display_.bodyTabVisible = true;
    display_.textTabVisible = display_.bodyIsHtml && message.plainText.has_value();

    display_.contentEnabled = true;
    display_.loading = false;
    display_.deleteEnabled = true;
    display_.forwardEnabled = true;
    notifyDisplayChanged();
}

void SelectionLoadCoordinator::showFailure(const MessageEntry &entry, const LoadOutcome &outcome)
{
    clearFields();
    display_.state = ViewState::Failed;
    display_.title = kNeutralTitle;
    display_.bodyTabVisible = false;
    display_.textTabVisible = false;
    display_.contentEnabled = false;
    display_.loading = false;
    // The entry is still selected and can be deleted even though it did not load.
    display_.deleteEnabled = true;
    display_.forwardEnabled = false;
    display_.failureReason = entry.token() + ": " + mail::loadErrorName(outcome.error);
    if (!outcome.errorMessage.empty())
        display_.failureReason += " - " + outcome.errorMessage;
    notifyDisplayChanged();
}

void SelectionLoadCoordinator::clearFields()
{
    display_ = DisplayState{};
}

void SelectionLoadCoordinator::notifyDisplayChanged()
{
    if (displayChanged_)
        displayChanged_(display_);
}

} // namespace spool::viewer
