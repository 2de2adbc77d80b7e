#pragma once

#include "spool/mail/content_loader.hpp"
#include "spool/mail/message_entry.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace spool::log {
class Logger;
}

namespace spool::viewer
{

class RenderMaterializer;
class UiQueue;

enum class ViewState
{
    Idle,
    Loading,
    Rendered,
    Failed,
};

const char *viewStateName(ViewState state) noexcept;

inline constexpr char kNeutralTitle[] = "Spool";
inline constexpr char kLoadingTitle[] = "Loading...";

// Everything the content pane shows. The window redraws from this snapshot.
struct DisplayState
{
    ViewState state = ViewState::Idle;
    std::string title = kNeutralTitle;

    std::string headers;
    std::string from;
    std::string to;
    std::string cc;
    std::string bcc;
    std::string date;
    std::string subject;

    std::string body;
    bool bodyIsHtml = false;
    std::filesystem::path htmlFile;
    std::string plainText;

    bool bodyTabVisible = true;
    bool textTabVisible = false;
    bool contentEnabled = false;
    bool loading = false;
    bool deleteEnabled = false;
    bool forwardEnabled = false;

    std::string failureReason;
};

enum class SessionState
{
    Pending,
    Delivered,
    Cancelled,
    Failed,
};

struct LoadSession
{
    std::uint64_t id = 0;
    mail::MessageEntry entry;
    mail::LoadHandle handle;
    SessionState state = SessionState::Pending;

    bool active() const noexcept
    {
        return state == SessionState::Pending || state == SessionState::Delivered;
    }
};

/**
 * @brief Decides what the content pane shows for the current selection.
 *
 * Every selection change supersedes the previous load: its handle is
 * cancelled and its session id retired, so a late completion is recognised by
 * tag and dropped no matter the order in which completions arrive. Completions
 * are re-posted onto the UI queue before they touch any state.
 */
class SelectionLoadCoordinator
{
public:
    using DisplayChangedCallback = std::function<void(const DisplayState &state)>;

    SelectionLoadCoordinator(mail::ContentLoader &loader, UiQueue &queue,
                             const RenderMaterializer *materializer,
                             const log::Logger &logger);
    ~SelectionLoadCoordinator();

    SelectionLoadCoordinator(const SelectionLoadCoordinator &) = delete;
    SelectionLoadCoordinator &operator=(const SelectionLoadCoordinator &) = delete;

    void setDisplayChangedCallback(DisplayChangedCallback callback)
    {
        displayChanged_ = std::move(callback);
    }

    void select(const std::optional<mail::MessageEntry> &entry);
    void reload();

    ViewState state() const noexcept { return display_.state; }
    const DisplayState &display() const noexcept { return display_; }
    const LoadSession *activeSession() const noexcept;
    const LoadSession *currentSession() const noexcept { return session_.get(); }
    std::uint64_t discardedDeliveries() const noexcept { return discarded_; }

private:
    void cancelActive();
    void startLoad(const mail::MessageEntry &entry);
    void onCompleted(std::uint64_t sessionId, mail::LoadOutcome outcome);
    void showMessage(const mail::MessageEntry &entry, const mail::FullMessage &message);
    void showFailure(const mail::MessageEntry &entry, const mail::LoadOutcome &outcome);
    void clearFields();
    void notifyDisplayChanged();

    mail::ContentLoader &loader_;
    UiQueue &queue_;
    const RenderMaterializer *materializer_;
    const log::Logger &logger_;

    std::unique_ptr<LoadSession> session_;
    std::uint64_t nextSessionId_ = 1;
    std::uint64_t discarded_ = 0;
    DisplayState display_;
    DisplayChangedCallback displayChanged_;
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

} // namespace spool::viewer
