#include "notification_window.hpp"

NotificationWindow::NotificationWindow(const TRect &bounds, const std::string &title,
                                       const std::string &body, std::chrono::milliseconds duration)
    : TWindowInit(&TWindow::initFrame),
      TWindow(bounds, title.c_str(), wnNoNumber),
      expiresAt_(Clock::now() + duration)
{
    flags &= ~(wfMove | wfGrow | wfZoom);
    palette = wpCyanWindow;

    TRect inner = getExtent();
    inner.grow(-2, -1);
    insert(new TStaticText(inner, body.c_str()));
}

void NotificationWindow::shutDown()
{
    if (onClosed_)
    {
        auto callback = std::move(onClosed_);
        onClosed_ = nullptr;
        callback(this);
    }
    TWindow::shutDown();
}
