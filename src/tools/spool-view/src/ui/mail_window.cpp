#include "mail_window.hpp"

#include "../commands.hpp"
#include "html_text.hpp"
#include "message_list_view.hpp"
#include "text_pane.hpp"

#include "spool/ui/tab_control.hpp"
#include "spool/viewer/mail_view_controller.hpp"

#include <algorithm>

namespace
{
constexpr int kSummaryRows = 4;
constexpr int kButtonRows = 2;

void drawLabelled(TView &view, TDrawBuffer &buffer, int row, const char *label, const std::string &value)
{
    const TColorAttr color = view.getColor(1);
    buffer.moveChar(0, ' ', color, view.size.x);
    buffer.moveStr(0, label, color);
    buffer.moveStr(9, TStringView(value), color, static_cast<ushort>(std::max(0, view.size.x - 9)));
    view.writeLine(0, static_cast<short>(row), view.size.x, 1, buffer);
}
} // namespace

SummaryView::SummaryView(const TRect &bounds)
    : TView(bounds)
{
    growMode = gfGrowHiX;
}

void SummaryView::setFields(const spool::viewer::DisplayState &display)
{
    from_ = display.from;
    to_ = display.to;
    if (!display.cc.empty())
        to_ += "  Cc: " + display.cc;
    date_ = display.date;
    subject_ = display.subject;
    drawView();
}

void SummaryView::draw()
{
    TDrawBuffer buffer;
    drawLabelled(*this, buffer, 0, "From:", from_);
    drawLabelled(*this, buffer, 1, "To:", to_);
    drawLabelled(*this, buffer, 2, "Date:", date_);
    drawLabelled(*this, buffer, 3, "Subject:", subject_);
}

StatusTextView::StatusTextView(const TRect &bounds)
    : TView(bounds)
{
    growMode = gfGrowLoY | gfGrowHiX | gfGrowHiY;
}

void StatusTextView::setText(const std::string &text)
{
    text_ = text;
    drawView();
}

void StatusTextView::draw()
{
    TDrawBuffer buffer;
    const TColorAttr color = getColor(1);
    buffer.moveChar(0, ' ', color, size.x);
    buffer.moveStr(1, TStringView(text_), color, static_cast<ushort>(std::max(0, size.x - 1)));
    writeLine(0, 0, size.x, 1, buffer);
}

MailWindow::MailWindow(const TRect &bounds, spool::viewer::MailViewController &controller)
    : TWindowInit(&TWindow::initFrame),
      TWindow(bounds, spool::viewer::kNeutralTitle, wnNoNumber),
      controller_(controller)
{
    flags &= ~wfClose;
    options |= ofTileable;

    const int listWidth = std::max(30, size.x * 2 / 5);
    const int bottom = size.y - 2;

    auto *listScroll = new TScrollBar(TRect(listWidth, 1, listWidth + 1, bottom));
    listScroll->growMode = gfGrowHiY;
    insert(listScroll);
    listView_ = new MessageListView(TRect(1, 1, listWidth, bottom), listScroll, controller_);
    insert(listView_);

    const int right = size.x - 1;
    const int left = listWidth + 2;
    summary_ = new SummaryView(TRect(left, 1, right, 1 + kSummaryRows));
    insert(summary_);

    const int buttonTop = 1 + kSummaryRows;
    auto *deleteButton = new TButton(TRect(left, buttonTop, left + 12, buttonTop + kButtonRows), "~D~elete",
                                     cmDeleteSelected, bfNormal);
    insert(deleteButton);
    auto *openButton = new TButton(TRect(left + 13, buttonTop, left + 28, buttonTop + kButtonRows),
                                   "~O~pen HTML", cmOpenHtml, bfNormal);
    insert(openButton);

    tabs_ = new spool::ui::TabControl(TRect(left, buttonTop + kButtonRows, right, bottom));
    insert(tabs_);
    messageTab_ = tabs_->addTab("Message", makeTextPage(messagePane_), cmShowMessageTab);
    headersTab_ = tabs_->addTab("Headers", makeTextPage(headersPane_), cmShowHeadersTab);
    bodyTab_ = tabs_->addTab("Body", makeTextPage(bodyPane_), cmShowBodyTab);
    textTab_ = tabs_->addTab("Text", makeTextPage(textPane_), cmShowTextTab);
    tabs_->setTabVisible(textTab_, false);

    status_ = new StatusTextView(TRect(1, bottom, right, bottom + 1));
    insert(status_);

    listView_->select();
}

TGroup *MailWindow::makeTextPage(TextPane *&pane)
{
    TRect area = tabs_->pageBounds();
    auto *page = new TGroup(area);
    page->growMode = gfGrowHiX | gfGrowHiY;

    const TRect extent = page->getExtent();
    auto *vScroll = new TScrollBar(TRect(extent.b.x - 1, extent.a.y, extent.b.x, extent.b.y));
    vScroll->growMode = gfGrowLoX | gfGrowHiX | gfGrowHiY;
    page->insert(vScroll);
    pane = new TextPane(TRect(extent.a.x, extent.a.y, extent.b.x - 1, extent.b.y), nullptr, vScroll);
    page->insert(pane);
    return page;
}

void MailWindow::handleEvent(TEvent &event)
{
    if (event.what == evCommand)
    {
        switch (event.message.command)
        {
        case cmShowMessageTab:
        case cmShowHeadersTab:
        case cmShowBodyTab:
        case cmShowTextTab:
            tabs_->selectByCommand(event.message.command);
            clearEvent(event);
            return;
        default:
            break;
        }
    }
    TWindow::handleEvent(event);
}

void MailWindow::sizeLimits(TPoint &min, TPoint &max)
{
    TWindow::sizeLimits(min, max);
    min.x = 80;
    min.y = 16;
}

void MailWindow::applyDisplay(const spool::viewer::DisplayState &display)
{
    using spool::viewer::ViewState;

    setWindowTitle(display.title);
    summary_->setFields(display);

    if (display.state == ViewState::Loading)
        messagePane_->setText(spool::viewer::kLoadingTitle);
    else if (display.bodyIsHtml)
        messagePane_->setText(spool::view::htmlToText(display.body));
    else
        messagePane_->setText(display.body);
    headersPane_->setText(display.headers);
    bodyPane_->setText(display.body);
    textPane_->setText(display.plainText);

    tabs_->setTabVisible(messageTab_, display.bodyTabVisible);
    tabs_->setTabVisible(bodyTab_, display.bodyTabVisible);
    tabs_->setTabVisible(headersTab_, display.state != ViewState::Failed);
    tabs_->setTabVisible(textTab_, display.textTabVisible);
    if (display.state == ViewState::Rendered && !tabs_->currentIndex())
        tabs_->selectTab(messageTab_);

    if (display.deleteEnabled)
        enableCommand(cmDeleteSelected);
    else
        disableCommand(cmDeleteSelected);
    if (!display.htmlFile.empty())
        enableCommand(cmOpenHtml);
    else
        disableCommand(cmOpenHtml);
    if (display.contentEnabled)
        enableCommand(cmCopyPath);
    else
        disableCommand(cmCopyPath);

    if (display.state == ViewState::Failed)
        setStatus("Unable to display " + display.failureReason);
}

void MailWindow::syncList()
{
    listView_->syncFromController();
}

void MailWindow::setStatus(const std::string &text)
{
    status_->setText(text);
}

void MailWindow::setWindowTitle(const std::string &text)
{
    delete[] const_cast<char *>(title);
    title = newStr(text.c_str());
    if (frame)
        frame->drawView();
}
