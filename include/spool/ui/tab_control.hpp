#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#define Uses_TGroup
#define Uses_TPoint
#define Uses_TDrawBuffer
#define Uses_TEvent
#define Uses_TRect
#define Uses_TKeys
#include <tvision/tv.h>

namespace spool::ui
{

// Tab strip over a stack of pages. Hidden tabs keep their page but are skipped
// by selection and not drawn in the strip.
class TabControl : public TGroup
{
public:
    struct Tab
    {
        std::string title;
        TView *page = nullptr;
        unsigned short command = 0;
        bool visible = true;
    };

    explicit TabControl(const TRect &bounds) noexcept;

    std::size_t addTab(const std::string &title, TView *page, unsigned short command = 0);
    TRect pageBounds() const;

    void setTabVisible(std::size_t index, bool visible);
    bool isTabVisible(std::size_t index) const noexcept;

    bool selectTab(std::size_t index);
    bool selectByCommand(unsigned short command);
    void nextTab();
    void previousTab();

    std::optional<std::size_t> currentIndex() const noexcept { return m_current; }
    std::size_t tabCount() const noexcept { return m_tabs.size(); }

    void handleEvent(TEvent &event) override;
    void draw() override;
    void changeBounds(const TRect &bounds) override;
    void shutDown() override;

private:
    void showPage(std::size_t index);
    void hidePage(std::size_t index);
    void step(int direction);
    std::optional<std::size_t> firstVisible() const noexcept;

    std::vector<Tab> m_tabs;
    std::optional<std::size_t> m_current;
};

} // namespace spool::ui
