#pragma once

#include "../tvision_include.hpp"

#include <string>
#include <vector>

// Read-only scrolling view over a block of text.
class TextPane : public TScroller
{
public:
    TextPane(const TRect &bounds, TScrollBar *hScroll, TScrollBar *vScroll);

    void setText(const std::string &text);
    void clear();
    const std::vector<std::string> &lines() const noexcept { return lines_; }

    void draw() override;

private:
    std::vector<std::string> lines_;
};
