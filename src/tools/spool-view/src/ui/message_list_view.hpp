#pragma once

#include "../tvision_include.hpp"

#include <optional>

namespace spool::viewer {
class MailViewController;
struct Point;
}

// Message list bound to the controller's ListSynchronizer. Focus changes are
// forwarded as selections; a press-and-drag is fed to the export adapter.
class MessageListView : public TListViewer
{
public:
    MessageListView(const TRect &bounds, TScrollBar *vScroll, spool::viewer::MailViewController &controller);

    void getText(char *dest, short item, short maxLen) override;
    void handleEvent(TEvent &event) override;
    void focusItem(short item) override;

    // Pulls size and selection from the controller without echoing a selection back.
    void syncFromController();
    std::optional<std::size_t> rowAt(const spool::viewer::Point &point) const;

private:
    void trackMouse(TEvent &event);

    spool::viewer::MailViewController &controller_;
    bool syncing_ = false;
};
