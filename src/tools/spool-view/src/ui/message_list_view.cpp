#include "message_list_view.hpp"

#include "../commands.hpp"

#include "spool/viewer/mail_view_controller.hpp"

#include <cstdio>
#include <string>

MessageListView::MessageListView(const TRect &bounds, TScrollBar *vScroll,
                                 spool::viewer::MailViewController &controller)
    : TListViewer(bounds, 1, nullptr, vScroll), controller_(controller)
{
    growMode = gfGrowHiY;
    syncFromController();
}

void MessageListView::getText(char *dest, short item, short maxLen)
{
    const auto &list = controller_.list();
    if (item < 0 || static_cast<std::size_t>(item) >= list.size())
    {
        *dest = '\0';
        return;
    }

    const std::size_t index = static_cast<std::size_t>(item);
    std::string text = list.isMarked(index) ? "* " : "  ";
    text += list.entries()[index].displayText();
    if (text.size() >= static_cast<std::size_t>(maxLen))
        text.resize(maxLen - 1);
    std::snprintf(dest, maxLen, "%s", text.c_str());
}

void MessageListView::handleEvent(TEvent &event)
{
    if (event.what == evKeyDown)
    {
        switch (event.keyDown.keyCode)
        {
        case kbDel:
            message(owner, evCommand, cmDeleteSelected, this);
            clearEvent(event);
            return;
        case kbIns:
            if (focused >= 0 && focused < range)
            {
                controller_.toggleMark(static_cast<std::size_t>(focused));
                if (focused + 1 < range)
                    focusItemNum(focused + 1);
            }
            clearEvent(event);
            return;
        case kbEnter:
            message(owner, evCommand, cmOpenHtml, this);
            clearEvent(event);
            return;
        default:
            if (event.keyDown.charScan.charCode == ' ')
            {
                if (focused >= 0 && focused < range)
                    controller_.toggleMark(static_cast<std::size_t>(focused));
                clearEvent(event);
                return;
            }
            break;
        }
    }
    else if (event.what == evMouseDown && (event.mouse.buttons & mbLeftButton) &&
             !(event.mouse.eventFlags & meDoubleClick))
    {
        trackMouse(event);
        return;
    }
    else if (event.what == evMouseDown && (event.mouse.eventFlags & meDoubleClick))
    {
        message(owner, evCommand, cmOpenHtml, this);
        clearEvent(event);
        return;
    }

    TListViewer::handleEvent(event);
}

void MessageListView::trackMouse(TEvent &event)
{
    select();
    TPoint local = makeLocal(event.mouse.where);
    const short item = static_cast<short>(topItem + local.y);
    if (item >= 0 && item < range)
        focusItemNum(item);

    auto &adapter = controller_.exportAdapter();
    adapter.pointerDown(spool::viewer::Point{local.x, local.y});
    while (mouseEvent(event, evMouseMove | evMouseAuto))
    {
        TPoint current = makeLocal(event.mouse.where);
        if (adapter.pointerMove(spool::viewer::Point{current.x, current.y}))
            break;
    }
    adapter.pointerUp();
    clearEvent(event);
}

void MessageListView::focusItem(short item)
{
    TListViewer::focusItem(item);
    if (syncing_)
        return;
    if (item >= 0 && static_cast<std::size_t>(item) < controller_.list().size())
        controller_.select(static_cast<std::size_t>(item));
}

void MessageListView::syncFromController()
{
    syncing_ = true;
    const auto &list = controller_.list();
    setRange(static_cast<short>(list.size()));
    if (auto selected = controller_.list().selectedIndex())
        focusItemNum(static_cast<short>(*selected));
    drawView();
    syncing_ = false;
}

std::optional<std::size_t> MessageListView::rowAt(const spool::viewer::Point &point) const
{
    if (point.x < 0 || point.x >= size.x || point.y < 0 || point.y >= size.y)
        return std::nullopt;
    const int row = topItem + point.y;
    if (row < 0 || row >= range)
        return std::nullopt;
    return static_cast<std::size_t>(row);
}
