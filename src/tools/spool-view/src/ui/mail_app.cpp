#include "mail_app.hpp"
#include "../clipboard.hpp"
#include "../commands.hpp"
#include "../external_open.hpp"
#include "mail_window.hpp"
#include "message_list_view.hpp"
#include "notification_window.hpp"

#include "spool/mail/errors.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>

#ifndef SPOOL_VIEW_VERSION
#define SPOOL_VIEW_VERSION "dev"
#endif

namespace
{
std::filesystem::path resolveBinaryDir(int argc, char **argv)
{
    std::filesystem::path dir;
    if (argv && argc > 0 && argv[0])
    {
        std::error_code ec;
        dir = std::filesystem::absolute(std::filesystem::path(argv[0]), ec).parent_path();
        if (ec)
            dir.clear();
    }
    if (dir.empty())
    {
        std::error_code ec;
        dir = std::filesystem::current_path(ec);
    }
    return dir;
}
} // namespace

MailApp::MailApp(int argc, char **argv, const spool::view::CliOptions &cli)
    : TProgInit(&MailApp::initStatusLine, &MailApp::initMenuBar, &TApplication::initDeskTop),
      binaryDir_(resolveBinaryDir(argc, argv))
{
    optionRegistry_ = std::make_shared<spool::config::OptionRegistry>("spool-view");
    spool::view::registerViewerOptions(*optionRegistry_);
    std::string optionsError;
    const bool optionsLoaded = optionRegistry_->loadDefaults(&optionsError);
    spool::view::applyCommandLine(cli, *optionRegistry_);
    settings_ = spool::view::resolveViewerSettings(*optionRegistry_, binaryDir_);

    std::ofstream(settings_.logFile, std::ios::trunc).close();
    logger_.setSink(spool::log::fileSink(settings_.logFile));
    if (!optionsLoaded && !optionsError.empty())
        logger_.warning("Ignoring saved options: " + optionsError);
    logger_.info("Watching " + settings_.messageDirectory.string());

    repository_ = std::make_unique<spool::mail::DirectoryMessageRepository>(settings_.messageDirectory, &logger_);
    loader_ = std::make_unique<spool::mail::EmlContentLoader>(&logger_);
    materializer_ = std::make_unique<spool::viewer::RenderMaterializer>(settings_.scratchDirectory);
    controller_ = std::make_unique<spool::viewer::MailViewController>(*repository_, *loader_, queue_,
                                                                      materializer_.get(), logger_);
    controller_->setNotificationsEnabled(settings_.showNotifications);

    openMailWindow();

    controller_->setListChangedCallback([this]() {
        if (window_)
            window_->syncList();
    });
    controller_->coordinator().setDisplayChangedCallback([this](const spool::viewer::DisplayState &display) {
        if (window_)
            window_->applyDisplay(display);
    });
    controller_->setStatusCallback([this](const std::string &text) { setStatus(text); });
    controller_->setNotificationCallback(
        [this](const spool::viewer::Notification &notification) { showNotification(notification); });
    controller_->setRowAtPoint([this](spool::viewer::Point point) -> std::optional<std::size_t> {
        if (!window_)
            return std::nullopt;
        return window_->listView()->rowAt(point);
    });
    controller_->setExportSink([this](const spool::viewer::ExportRequest &request) {
        if (request.files.empty())
            return;
        const std::string path = request.files.front().string();
        clipboard::copyToClipboard(path);
        setStatus(clipboard::statusMessage(path));
    });

    if (window_)
        window_->applyDisplay(controller_->coordinator().display());
    controller_->start();
    repository_->startWatching(settings_.pollInterval);
}

void MailApp::openMailWindow()
{
    if (!deskTop)
        return;

    TRect bounds = deskTop->getExtent();
    window_ = new MailWindow(bounds, *controller_);
    deskTop->insert(window_);
    window_->select();
}

void MailApp::handleEvent(TEvent &event)
{
    TApplication::handleEvent(event);
    if (event.what != evCommand)
        return;

    switch (event.message.command)
    {
    case cmRefresh:
        controller_->refresh();
        clearEvent(event);
        break;
    case cmShowMostRecent:
        controller_->selectMostRecent();
        clearEvent(event);
        break;
    case cmReloadMessage:
        controller_->reloadSelected();
        clearEvent(event);
        break;
    case cmDeleteSelected:
    {
        auto result = controller_->deleteSelected();
        if (!result.failed.empty())
            messageBox("Some messages could not be deleted. See the log for details.", mfError | mfOKButton);
        clearEvent(event);
        break;
    }
    case cmToggleMark:
        if (auto index = controller_->list().selectedIndex())
            controller_->toggleMark(*index);
        clearEvent(event);
        break;
    case cmOpenHtml:
        openHtml();
        clearEvent(event);
        break;
    case cmCopyPath:
        copyPath();
        clearEvent(event);
        break;
    case cmToggleNotifications:
        toggleNotifications();
        clearEvent(event);
        break;
    case cmAbout:
        showAboutDialog();
        clearEvent(event);
        break;
    default:
        break;
    }
}

void MailApp::idle()
{
    TApplication::idle();

    try
    {
        queue_.drain();
    }
    catch (const std::exception &ex)
    {
        appendLog(std::string("UI task failed: ") + ex.what());
    }
    expireNotifications();
}

void MailApp::shutDown()
{
    if (controller_)
    {
        controller_->stop();
        controller_->setListChangedCallback(nullptr);
        controller_->setStatusCallback(nullptr);
        controller_->setNotificationCallback(nullptr);
        controller_->coordinator().setDisplayChangedCallback(nullptr);
    }
    if (repository_)
        repository_->stopWatching();
    window_ = nullptr;
    toasts_.clear();
    TApplication::shutDown();
}

TMenuBar *MailApp::initMenuBar(TRect r)
{
    r.b.y = r.a.y + 1;

    TSubMenu &fileMenu = *new TSubMenu("~F~ile", hcNoContext) +
                         *new TMenuItem("~R~efresh", cmRefresh, kbF5, hcNoContext, "F5") +
                         *new TMenuItem("~D~elete", cmDeleteSelected, kbDel, hcNoContext, "Del") +
                         *new TMenuItem("~O~pen HTML", cmOpenHtml, kbF3, hcNoContext, "F3") +
                         *new TMenuItem("~C~opy Path", cmCopyPath, kbF4, hcNoContext, "F4") + newLine() +
                         *new TMenuItem("E~x~it", cmQuit, kbAltX, hcNoContext, "Alt-X");

    TSubMenu &viewMenu = *new TSubMenu("~V~iew", hcNoContext) +
                         *new TMenuItem("~L~atest Message", cmShowMostRecent, kbF6, hcNoContext, "F6") +
                         *new TMenuItem("~R~eload Message", cmReloadMessage, kbF7, hcNoContext, "F7") +
                         *new TMenuItem("Mar~k~ Message", cmToggleMark, kbNoKey, hcNoContext) + newLine() +
                         *new TMenuItem("~M~essage Tab", cmShowMessageTab, kbNoKey, hcNoContext) +
                         *new TMenuItem("~H~eaders Tab", cmShowHeadersTab, kbNoKey, hcNoContext) +
                         *new TMenuItem("~B~ody Tab", cmShowBodyTab, kbNoKey, hcNoContext) +
                         *new TMenuItem("~T~ext Tab", cmShowTextTab, kbNoKey, hcNoContext) + newLine() +
                         *new TMenuItem("Toggle ~N~otifications", cmToggleNotifications, kbNoKey, hcNoContext);

    TSubMenu &helpMenu = *new TSubMenu("~H~elp", hcNoContext) +
                         *new TMenuItem("~A~bout", cmAbout, kbNoKey, hcNoContext);

    return new TMenuBar(r, fileMenu + viewMenu + helpMenu);
}

TStatusLine *MailApp::initStatusLine(TRect r)
{
    r.a.y = r.b.y - 1;
    return new TStatusLine(r, *new TStatusDef(0, 0xFFFF) +
                                  *new TStatusItem("~F5~ Refresh", kbF5, cmRefresh) +
                                  *new TStatusItem("~Del~ Delete", kbDel, cmDeleteSelected) +
                                  *new TStatusItem("~F3~ Open HTML", kbF3, cmOpenHtml) +
                                  *new TStatusItem("~F4~ Copy Path", kbF4, cmCopyPath) +
                                  *new TStatusItem("~F6~ Latest", kbF6, cmShowMostRecent) +
                                  *new TStatusItem("~F7~ Reload", kbF7, cmReloadMessage) +
                                  *new TStatusItem("~Alt-X~ Quit", kbAltX, cmQuit));
}

void MailApp::appendLog(const std::string &text)
{
    logger_.error(text);
}

void MailApp::showNotification(const spool::viewer::Notification &notification)
{
    if (!deskTop)
        return;

    const TRect desk = deskTop->getExtent();
    const int width = std::min(NotificationWindow::kWidth, static_cast<int>(desk.b.x - desk.a.x));
    const int top = desk.a.y + static_cast<int>(toasts_.size()) * NotificationWindow::kHeight;
    if (top + NotificationWindow::kHeight > desk.b.y)
        return;

    TRect bounds(desk.b.x - width, top, desk.b.x, top + NotificationWindow::kHeight);
    auto *toast = new NotificationWindow(bounds, notification.title, notification.body,
                                         std::chrono::milliseconds(notification.durationMs));
    toast->setOnClosed([this](NotificationWindow *closed) {
        toasts_.erase(std::remove(toasts_.begin(), toasts_.end(), closed), toasts_.end());
    });
    toasts_.push_back(toast);

    // Shown without taking focus from the message list.
    TView *focused = deskTop->current;
    deskTop->insert(toast);
    if (focused)
        focused->select();
}

void MailApp::expireNotifications()
{
    const auto now = NotificationWindow::Clock::now();
    std::vector<NotificationWindow *> expired;
    for (auto *toast : toasts_)
    {
        if (toast->expired(now))
            expired.push_back(toast);
    }
    for (auto *toast : expired)
        TObject::destroy(toast);
}

void MailApp::openHtml()
{
    const auto &display = controller_->coordinator().display();
    if (display.htmlFile.empty())
        return;

    std::string error;
    if (spool::view::openExternally(display.htmlFile, error))
    {
        setStatus("Opened " + display.htmlFile.string());
        return;
    }
    logger_.warning("Open HTML failed: " + error);
    setStatus(error);
}

void MailApp::copyPath()
{
    auto entry = controller_->list().selectedEntry();
    if (!entry || !entry->hasFile())
        return;
    const std::string path = entry->file().string();
    clipboard::copyToClipboard(path);
    setStatus(clipboard::statusMessage(path));
}

void MailApp::toggleNotifications()
{
    const bool enabled = !controller_->notificationsEnabled();
    controller_->setNotificationsEnabled(enabled);
    optionRegistry_->set(spool::view::kOptionShowNotifications, spool::config::OptionValue(enabled));

    // Saved through a fresh registry so command-line overrides are not persisted.
    spool::config::OptionRegistry stored(optionRegistry_->appId());
    spool::view::registerViewerOptions(stored);
    std::string error;
    if (!stored.loadDefaults(&error) && !error.empty())
        logger_.warning("Rewriting unreadable options: " + error);
    stored.set(spool::view::kOptionShowNotifications, spool::config::OptionValue(enabled));
    if (!stored.saveDefaults())
        logger_.warning("Unable to save options to " + stored.defaultOptionsPath().string());
    setStatus(enabled ? "Notifications on" : "Notifications off");
}

void MailApp::showAboutDialog()
{
    messageBox("\003spool-view " SPOOL_VIEW_VERSION "\n\n\003Browse captured mail", mfInformation | mfOKButton);
}

void MailApp::setStatus(const std::string &text)
{
    if (window_)
        window_->setStatus(text);
}
