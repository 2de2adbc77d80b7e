#pragma once

#include "../tvision_include.hpp"

#include <cstddef>
#include <string>

namespace spool::ui {
class TabControl;
}

namespace spool::viewer {
class MailViewController;
struct DisplayState;
}

class MessageListView;
class TextPane;

// One-line views used by the window.
class SummaryView : public TView
{
public:
    explicit SummaryView(const TRect &bounds);

    void setFields(const spool::viewer::DisplayState &display);
    void draw() override;

private:
    std::string from_;
    std::string to_;
    std::string date_;
    std::string subject_;
};

class StatusTextView : public TView
{
public:
    explicit StatusTextView(const TRect &bounds);

    void setText(const std::string &text);
    void draw() override;

private:
    std::string text_;
};

class MailWindow : public TWindow
{
public:
    MailWindow(const TRect &bounds, spool::viewer::MailViewController &controller);

    void handleEvent(TEvent &event) override;
    void sizeLimits(TPoint &min, TPoint &max) override;

    void applyDisplay(const spool::viewer::DisplayState &display);
    void syncList();
    void setStatus(const std::string &text);

    MessageListView *listView() const noexcept { return listView_; }

private:
    TGroup *makeTextPage(TextPane *&pane);
    void setWindowTitle(const std::string &text);

    spool::viewer::MailViewController &controller_;
    MessageListView *listView_ = nullptr;
    SummaryView *summary_ = nullptr;
    StatusTextView *status_ = nullptr;
    spool::ui::TabControl *tabs_ = nullptr;
    TextPane *messagePane_ = nullptr;
    TextPane *headersPane_ = nullptr;
    TextPane *bodyPane_ = nullptr;
    TextPane *textPane_ = nullptr;
    std::size_t messageTab_ = 0;
    std::size_t headersTab_ = 0;
    std::size_t bodyTab_ = 0;
    std::size_t textTab_ = 0;
};
