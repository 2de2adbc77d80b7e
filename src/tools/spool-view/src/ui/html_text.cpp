#include "html_text.hpp"

#include <cctype>
#include <cstdint>

namespace spool::view
{

namespace
{
std::string lowerTagName(std::string_view tag)
{
    std::size_t pos = 0;
    if (pos < tag.size() && tag[pos] == '/')
        ++pos;
    std::string name;
    while (pos < tag.size() && std::isalnum(static_cast<unsigned char>(tag[pos])))
        name.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(tag[pos++]))));
    return name;
}

bool isBlockTag(const std::string &name)
{
    return name == "br" || name == "p" || name == "div" || name == "tr" || name == "li" || name == "h1" ||
           name == "h2" || name == "h3" || name == "h4" || name == "table" || name == "blockquote" ||
           name == "hr";
}

void appendUtf8(std::string &out, std::uint32_t codePoint)
{
    if (codePoint < 0x80)
    {
        out.push_back(static_cast<char>(codePoint));
    }
    else if (codePoint < 0x800)
    {
        out.push_back(static_cast<char>(0xC0 | (codePoint >> 6)));
        out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
    }
    else if (codePoint < 0x10000)
    {
        out.push_back(static_cast<char>(0xE0 | (codePoint >> 12)));
        out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
    }
    else if (codePoint < 0x110000)
    {
        out.push_back(static_cast<char>(0xF0 | (codePoint >> 18)));
        out.push_back(static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
    }
}

// Returns the number of characters consumed, or 0 when no entity is recognised.
std::size_t decodeEntity(std::string_view text, std::string &out)
{
    std::size_t end = text.find(';');
    if (end == std::string_view::npos || end > 10)
        return 0;
    std::string_view name = text.substr(1, end - 1);
    if (name == "amp")
        out.push_back('&');
    else if (name == "lt")
        out.push_back('<');
    else if (name == "gt")
        out.push_back('>');
    else if (name == "quot")
        out.push_back('"');
    else if (name == "apos")
        out.push_back('\'');
    else if (name == "nbsp")
        out.push_back(' ');
    else if (name.size() > 1 && name.front() == '#')
    {
        std::uint32_t codePoint = 0;
        bool hex = name[1] == 'x' || name[1] == 'X';
        std::size_t start = hex ? 2 : 1;
        if (start >= name.size())
            return 0;
        for (std::size_t i = start; i < name.size(); ++i)
        {
            unsigned char ch = static_cast<unsigned char>(name[i]);
            if (hex && std::isxdigit(ch))
                codePoint = codePoint * 16 + static_cast<std::uint32_t>(std::isdigit(ch) ? ch - '0' : (std::tolower(ch) - 'a' + 10));
            else if (!hex && std::isdigit(ch))
                codePoint = codePoint * 10 + static_cast<std::uint32_t>(ch - '0');
            else
                return 0;
            if (codePoint > 0x10FFFF)
                return 0;
        }
        appendUtf8(out, codePoint);
    }
    else
        return 0;
    return end + 1;
}
} // namespace

std::string htmlToText(std::string_view html)
{
    std::string out;
    out.reserve(html.size());
    bool pendingSpace = false;
    std::string skipUntil;

    for (std::size_t i = 0; i < html.size();)
    {
        char ch = html[i];
        if (ch == '<')
        {
            std::size_t close = html.find('>', i);
            if (close == std::string_view::npos)
                break;
            std::string_view tag = html.substr(i + 1, close - i - 1);
            i = close + 1;

            const bool closing = !tag.empty() && tag.front() == '/';
            const std::string name = lowerTagName(tag);
            if (!skipUntil.empty())
            {
                if (closing && name == skipUntil)
                    skipUntil.clear();
                continue;
            }
            if (!closing && (name == "style" || name == "script" || name == "head"))
            {
                skipUntil = name;
                continue;
            }
            if (isBlockTag(name) && !out.empty())
            {
                if (out.back() != '\n')
                    out.push_back('\n');
                else if ((name == "br" || name == "p") && (out.size() < 2 || out[out.size() - 2] != '\n'))
                    out.push_back('\n');
                pendingSpace = false;
            }
            continue;
        }

        if (!skipUntil.empty())
        {
            ++i;
            continue;
        }

        if (std::isspace(static_cast<unsigned char>(ch)))
        {
            pendingSpace = !out.empty() && out.back() != '\n';
            ++i;
            continue;
        }

        if (pendingSpace)
        {
            out.push_back(' ');
            pendingSpace = false;
        }

        if (ch == '&')
        {
            std::size_t used = decodeEntity(html.substr(i), out);
            if (used > 0)
            {
                i += used;
                continue;
            }
        }
        out.push_back(ch);
        ++i;
    }

    while (!out.empty() && (out.back() == '\n' || out.back() == ' '))
        out.pop_back();
    return out;
}

} // namespace spool::view
