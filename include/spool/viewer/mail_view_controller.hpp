#pragma once

#include "spool/viewer/deletion_guard.hpp"
#include "spool/viewer/export_adapter.hpp"
#include "spool/viewer/list_synchronizer.hpp"
#include "spool/viewer/selection_load_coordinator.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace spool::mail {
class ContentLoader;
class Repository;
}

namespace spool::viewer
{

struct Notification
{
    std::string title;
    std::string body;
    int durationMs = 5000;
};

inline constexpr std::size_t kNotificationFieldLimit = 50;

std::string truncate(const std::string &text, std::size_t limit);
Notification makeNewMessageNotification(const mail::FullMessage &message);

/**
 * @brief Wires the message repository, the list and the content pane together.
 *
 * Repository events arrive on arbitrary threads and are re-posted to the UI
 * queue before they reach the list. The controller owns the list, the load
 * coordinator, the deletion guard and the export adapter; the window only
 * forwards user input and renders the state the controller publishes.
 */
class MailViewController
{
public:
    using NotificationCallback = std::function<void(const Notification &notification)>;
    using StatusCallback = std::function<void(const std::string &message)>;
    using ListChangedCallback = std::function<void()>;
    using RowAtPoint = std::function<std::optional<std::size_t>(Point point)>;

    MailViewController(mail::Repository &repository, mail::ContentLoader &loader, UiQueue &queue,
                       const RenderMaterializer *materializer, const log::Logger &logger);
    ~MailViewController();

    MailViewController(const MailViewController &) = delete;
    MailViewController &operator=(const MailViewController &) = delete;

    // Subscribes to repository events and loads the initial list.
    void start();
    void stop();

    void setNotificationCallback(NotificationCallback callback) { notify_ = std::move(callback); }
    void setStatusCallback(StatusCallback callback) { status_ = std::move(callback); }
    void setListChangedCallback(ListChangedCallback callback) { listChanged_ = std::move(callback); }
    void setExportSink(ExportAdapter::ExportSink sink) { exportSink_ = std::move(sink); }
    void setRowAtPoint(RowAtPoint rowAtPoint) { rowAtPoint_ = std::move(rowAtPoint); }
    void setNotificationsEnabled(bool enabled) noexcept { notificationsEnabled_ = enabled; }
    bool notificationsEnabled() const noexcept { return notificationsEnabled_; }

    void refresh();
    void select(std::optional<std::size_t> index);
    void selectMostRecent();
    // Loads the selected message again, e.g. after a failed read.
    void reloadSelected();
    bool toggleMark(std::size_t index);
    DeletionResult deleteSelected();

    ListSynchronizer &list() noexcept { return list_; }
    const ListSynchronizer &list() const noexcept { return list_; }
    SelectionLoadCoordinator &coordinator() noexcept { return coordinator_; }
    ExportAdapter &exportAdapter() noexcept { return exportAdapter_; }

    std::size_t pendingNotifications() const noexcept { return notificationLoads_.size(); }

private:
    void onNewMessage(const mail::MessageEntry &entry);
    void onNotificationLoaded(std::uint64_t id, const mail::LoadOutcome &outcome);
    void notifyStatus(const std::string &message);
    void notifyListChanged();
    std::optional<mail::MessageEntry> entryAt(Point origin) const;

    mail::Repository &repository_;
    mail::ContentLoader &loader_;
    UiQueue &queue_;
    const log::Logger &logger_;

    ListSynchronizer list_;
    SelectionLoadCoordinator coordinator_;
    DeletionGuard deletion_;
    ExportAdapter exportAdapter_;

    NotificationCallback notify_;
    StatusCallback status_;
    ListChangedCallback listChanged_;
    ExportAdapter::ExportSink exportSink_;
    RowAtPoint rowAtPoint_;
    bool notificationsEnabled_ = true;
    bool started_ = false;

    std::map<std::uint64_t, mail::LoadHandle> notificationLoads_;
    std::uint64_t nextNotificationId_ = 1;
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

} // namespace spool::viewer
