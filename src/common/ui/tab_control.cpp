#include "spool/ui/tab_control.hpp"

#include "spool/commands/spool_view.hpp"

#include <algorithm>

namespace spool::ui
{

namespace commands = spool::commands::view;

TabControl::TabControl(const TRect &bounds) noexcept
    : TGroup(bounds)
{
    growMode = gfGrowHiX | gfGrowHiY;
    options |= ofSelectable;
}

TRect TabControl::pageBounds() const
{
    TRect area = getExtent();
    area.a.y += 1;
    return area;
}

std::size_t TabControl::addTab(const std::string &title, TView *page, unsigned short command)
{
    TRect area = pageBounds();
    page->locate(area);
    page->growMode = gfGrowHiX | gfGrowHiY;
    insert(page);
    page->hide();

    m_tabs.push_back(Tab{title, page, command, true});
    const std::size_t index = m_tabs.size() - 1;
    if (!m_current)
        selectTab(index);
    return index;
}

void TabControl::setTabVisible(std::size_t index, bool visible)
{
    if (index >= m_tabs.size() || m_tabs[index].visible == visible)
        return;

    m_tabs[index].visible = visible;
    if (!visible && m_current == index)
    {
        hidePage(index);
        m_current.reset();
        if (auto fallback = firstVisible())
            showPage(*fallback);
    }
    else if (visible && !m_current)
    {
        showPage(index);
    }
    drawView();
}

bool TabControl::isTabVisible(std::size_t index) const noexcept
{
    return index < m_tabs.size() && m_tabs[index].visible;
}

bool TabControl::selectTab(std::size_t index)
{
    if (!isTabVisible(index))
        return false;
    if (m_current == index)
        return true;

    if (m_current)
        hidePage(*m_current);
    showPage(index);
    drawView();
    return true;
}

bool TabControl::selectByCommand(unsigned short command)
{
    if (!command)
        return false;
    for (std::size_t i = 0; i < m_tabs.size(); ++i)
    {
        if (m_tabs[i].command == command)
            return selectTab(i);
    }
    return false;
}

void TabControl::nextTab()
{
    step(1);
}

void TabControl::previousTab()
{
    step(-1);
}

void TabControl::handleEvent(TEvent &event)
{
    if (event.what == evCommand)
    {
        if (event.message.command == commands::TabNext)
        {
            nextTab();
            clearEvent(event);
            return;
        }
        if (event.message.command == commands::TabPrevious)
        {
            previousTab();
            clearEvent(event);
            return;
        }
        if (selectByCommand(event.message.command))
        {
            clearEvent(event);
            return;
        }
    }
    else if (event.what == evKeyDown)
    {
        if (event.keyDown.keyCode == kbCtrlTab)
        {
            nextTab();
            clearEvent(event);
            return;
        }
        if (event.keyDown.keyCode == (kbCtrlShift | kbTab))
        {
            previousTab();
            clearEvent(event);
            return;
        }
    }
    else if (event.what == evMouseDown)
    {
        TPoint local = makeLocal(event.mouse.where);
        if (local.y == 0)
        {
            int x = 1;
            for (std::size_t i = 0; i < m_tabs.size(); ++i)
            {
                if (!m_tabs[i].visible)
                    continue;
                const int labelWidth = static_cast<int>(m_tabs[i].title.size()) + 3;
                if (local.x >= x && local.x < x + labelWidth)
                {
                    selectTab(i);
                    break;
                }
                x += labelWidth;
            }
            clearEvent(event);
            return;
        }
    }

    TGroup::handleEvent(event);
}

void TabControl::draw()
{
    const int width = size.x;
    TDrawBuffer buffer;
    const ushort baseColor = getColor(1);
    const ushort highlightColor = getColor(2);

    buffer.moveChar(0, ' ', baseColor, width);
    int x = 1;
    for (std::size_t i = 0; i < m_tabs.size(); ++i)
    {
        if (!m_tabs[i].visible)
            continue;
        const bool active = m_current == i;
        std::string label = active ? "[" + m_tabs[i].title + "]" : " " + m_tabs[i].title + " ";
        label.push_back(' ');

        const int room = width - x - 1;
        if (room <= 0)
            break;
        buffer.moveStr(x, label.c_str(), active ? highlightColor : baseColor, room);
        x += std::min<int>(static_cast<int>(label.size()), room);
    }
    writeLine(0, 0, width, 1, buffer);

    if (!m_current)
    {
        // Every tab hidden: blank the page area.
        buffer.moveChar(0, ' ', baseColor, width);
        writeLine(0, 1, width, size.y - 1, buffer);
    }

    TGroup::draw();
}

void TabControl::changeBounds(const TRect &bounds)
{
    TGroup::changeBounds(bounds);
    TRect area = pageBounds();
    for (auto &tab : m_tabs)
    {
        if (tab.page)
            tab.page->locate(area);
    }
}

void TabControl::shutDown()
{
    m_tabs.clear();
    m_current.reset();
    TGroup::shutDown();
}

void TabControl::showPage(std::size_t index)
{
    m_current = index;
    TView *page = m_tabs[index].page;
    if (!page)
        return;
    TRect area = pageBounds();
    page->locate(area);
    page->show();
    setCurrent(page, enterSelect);
}

void TabControl::hidePage(std::size_t index)
{
    if (TView *page = m_tabs[index].page)
        page->hide();
}

void TabControl::step(int direction)
{
    if (m_tabs.empty())
        return;
    const std::size_t count = m_tabs.size();
    std::size_t index = m_current.value_or(0);
    for (std::size_t attempt = 0; attempt < count; ++attempt)
    {
        index = direction > 0 ? (index + 1) % count : (index == 0 ? count - 1 : index - 1);
        if (m_tabs[index].visible)
        {
            selectTab(index);
            return;
        }
    }
}

std::optional<std::size_t> TabControl::firstVisible() const noexcept
{
    for (std::size_t i = 0; i < m_tabs.size(); ++i)
    {
        if (m_tabs[i].visible)
            return i;
    }
    return std::nullopt;
}

} // namespace spool::ui
