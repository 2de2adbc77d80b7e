#pragma once

#include "../tvision_include.hpp"
#include "viewer_options.hpp"

#include "spool/log.hpp"
#include "spool/mail/directory_repository.hpp"
#include "spool/mail/eml_loader.hpp"
#include "spool/viewer/mail_view_controller.hpp"
#include "spool/viewer/render_materializer.hpp"
#include "spool/viewer/ui_queue.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

class MailWindow;
class NotificationWindow;

class MailApp : public TApplication
{
public:
    MailApp(int argc, char **argv, const spool::view::CliOptions &cli);

    void handleEvent(TEvent &event) override;
    void idle() override;
    void shutDown() override;

    static TMenuBar *initMenuBar(TRect r);
    static TStatusLine *initStatusLine(TRect r);

    void appendLog(const std::string &text);

private:
    void openMailWindow();
    void showNotification(const spool::viewer::Notification &notification);
    void expireNotifications();
    void openHtml();
    void copyPath();
    void toggleNotifications();
    void showAboutDialog();
    void setStatus(const std::string &text);

    std::filesystem::path binaryDir_;
    std::shared_ptr<spool::config::OptionRegistry> optionRegistry_;
    spool::view::ViewerSettings settings_;
    spool::log::Logger logger_;
    spool::viewer::UiQueue queue_;
    std::unique_ptr<spool::mail::DirectoryMessageRepository> repository_;
    std::unique_ptr<spool::mail::EmlContentLoader> loader_;
    std::unique_ptr<spool::viewer::RenderMaterializer> materializer_;
    std::unique_ptr<spool::viewer::MailViewController> controller_;
    MailWindow *window_ = nullptr;
    std::vector<NotificationWindow *> toasts_;
};
