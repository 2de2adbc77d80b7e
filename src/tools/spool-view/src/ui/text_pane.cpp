#include "text_pane.hpp"

#include <algorithm>

namespace
{
constexpr int kTabWidth = 4;

std::string expandTabs(const std::string &line)
{
    std::string result;
    result.reserve(line.size());
    for (char ch : line)
    {
        if (ch == '\t')
        {
            int spaces = kTabWidth - static_cast<int>(result.size() % kTabWidth);
            result.append(static_cast<std::size_t>(spaces), ' ');
        }
        else if (ch != '\r')
        {
            result.push_back(ch);
        }
    }
    return result;
}
} // namespace

TextPane::TextPane(const TRect &bounds, TScrollBar *hScroll, TScrollBar *vScroll)
    : TScroller(bounds, hScroll, vScroll)
{
    growMode = gfGrowHiX | gfGrowHiY;
}

void TextPane::setText(const std::string &text)
{
    lines_.clear();
    std::size_t start = 0;
    while (start <= text.size())
    {
        std::size_t end = text.find('\n', start);
        if (end == std::string::npos)
        {
            lines_.push_back(expandTabs(text.substr(start)));
            break;
        }
        lines_.push_back(expandTabs(text.substr(start, end - start)));
        start = end + 1;
    }

    int width = 0;
    for (const auto &line : lines_)
        width = std::max(width, strwidth(TStringView(line)));
    scrollTo(0, 0);
    setLimit(width, static_cast<int>(lines_.size()));
    drawView();
}

void TextPane::clear()
{
    setText(std::string());
}

void TextPane::draw()
{
    const TColorAttr color = getColor(1);
    TDrawBuffer buffer;
    for (int y = 0; y < size.y; ++y)
    {
        buffer.moveChar(0, ' ', color, size.x);
        const int row = delta.y + y;
        if (row >= 0 && row < static_cast<int>(lines_.size()))
        {
            const std::string &line = lines_[static_cast<std::size_t>(row)];
            buffer.moveStr(0, TStringView(line), color, static_cast<ushort>(size.x), static_cast<ushort>(delta.x));
        }
        writeLine(0, y, size.x, 1, buffer);
    }
}
