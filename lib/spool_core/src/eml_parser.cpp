#include "spool/mail/eml_parser.hpp"
#include "spool/mail/errors.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <optional>
#include <vector>

namespace spool::mail
{

namespace
{
constexpr int kMaxMultipartDepth = 16;

struct RawPart
{
    std::vector<MessageHeader> headers;
    std::string body;
};

struct HeaderParams
{
    std::string value;
    std::map<std::string, std::string> params;
};

struct Leaf
{
    std::string mediaType;
    std::string contentId;
    bool attachment = false;
    std::string data;
};

std::string toLower(std::string_view text)
{
    std::string lower;
    lower.reserve(text.size());
    for (char ch : text)
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    return lower;
}

std::string trim(std::string_view text)
{
    auto notSpace = [](char ch) { return !std::isspace(static_cast<unsigned char>(ch)); };
    auto begin = std::find_if(text.begin(), text.end(), notSpace);
    auto end = std::find_if(text.rbegin(), text.rend(), notSpace).base();
    if (begin >= end)
        return std::string();
    return std::string(begin, end);
}

std::string normalizeLineEndings(std::string_view raw)
{
    std::string text;
    text.reserve(raw.size());
    for (std::size_t i = 0; i < raw.size(); ++i)
    {
        char ch = raw[i];
        if (ch == '\r')
        {
            text.push_back('\n');
            if (i + 1 < raw.size() && raw[i + 1] == '\n')
                ++i;
            continue;
        }
        text.push_back(ch);
    }
    return text;
}

RawPart splitPart(std::string_view text, bool requireHeaders)
{
    RawPart part;
    std::size_t pos = 0;
    bool sawSeparator = false;
    while (pos < text.size())
    {
        std::size_t end = text.find('\n', pos);
        std::string_view line = end == std::string_view::npos ? text.substr(pos) : text.substr(pos, end - pos);
        std::size_t next = end == std::string_view::npos ? text.size() : end + 1;

        if (line.empty())
        {
            pos = next;
            sawSeparator = true;
            break;
        }

        if (line.front() == ' ' || line.front() == '\t')
        {
            if (part.headers.empty())
                throw ParseError("continuation line before first header");
            part.headers.back().value += ' ';
            part.headers.back().value += trim(line);
        }
        else
        {
            std::size_t colon = line.find(':');
            if (colon == std::string_view::npos || colon == 0)
                throw ParseError("malformed header line: " + std::string(line.substr(0, 60)));
            part.headers.push_back(MessageHeader{trim(line.substr(0, colon)), trim(line.substr(colon + 1))});
        }
        pos = next;
    }

    if (requireHeaders && part.headers.empty())
        throw ParseError("message has no headers");

    if (sawSeparator)
        part.body = std::string(text.substr(pos));
    return part;
}

std::string headerValue(const std::vector<MessageHeader> &headers, std::string_view name)
{
    const std::string wanted = toLower(name);
    for (const auto &header : headers)
    {
        if (toLower(header.name) == wanted)
            return header.value;
    }
    return std::string();
}

HeaderParams parseParameterized(std::string_view value)
{
    std::vector<std::string> pieces;
    std::string current;
    bool quoted = false;
    for (char ch : value)
    {
        if (ch == '"')
        {
            quoted = !quoted;
            current.push_back(ch);
            continue;
        }
        if (ch == ';' && !quoted)
        {
            pieces.push_back(current);
            current.clear();
            continue;
        }
        current.push_back(ch);
    }
    pieces.push_back(current);

    HeaderParams result;
    result.value = toLower(trim(pieces.front()));
    for (std::size_t i = 1; i < pieces.size(); ++i)
    {
        std::size_t eq = pieces[i].find('=');
        if (eq == std::string::npos)
            continue;
        std::string key = toLower(trim(std::string_view(pieces[i]).substr(0, eq)));
        std::string param = trim(std::string_view(pieces[i]).substr(eq + 1));
        if (param.size() >= 2 && param.front() == '"' && param.back() == '"')
            param = param.substr(1, param.size() - 2);
        if (!key.empty())
            result.params[key] = param;
    }
    return result;
}

std::string rtrimLine(std::string_view line)
{
    while (!line.empty() && std::isspace(static_cast<unsigned char>(line.back())))
        line.remove_suffix(1);
    return std::string(line);
}

std::vector<std::string_view> splitMultipart(std::string_view body, const std::string &boundary)
{
    const std::string delimiter = "--" + boundary;
    std::vector<std::string_view> parts;
    std::optional<std::size_t> partStart;
    bool closed = false;

    std::size_t pos = 0;
    while (pos < body.size())
    {
        std::size_t end = body.find('\n', pos);
        std::string_view line = end == std::string_view::npos ? body.substr(pos) : body.substr(pos, end - pos);
        std::size_t next = end == std::string_view::npos ? body.size() : end + 1;

        std::string candidate = rtrimLine(line);
        if (candidate.rfind(delimiter, 0) == 0)
        {
            std::string rest = candidate.substr(delimiter.size());
            if (rest.empty() || rest == "--")
            {
                if (partStart)
                {
                    std::size_t stop = pos > *partStart ? pos - 1 : *partStart;
                    parts.push_back(body.substr(*partStart, stop - *partStart));
                }
                if (rest == "--")
                {
                    closed = true;
                    break;
                }
                partStart = next;
            }
        }
        pos = next;
    }

    if (!closed && partStart && *partStart < body.size())
        parts.push_back(body.substr(*partStart));

    if (parts.empty())
        throw ParseError("multipart body has no parts for boundary '" + boundary + "'");
    return parts;
}

std::string stripAngles(std::string id)
{
    if (id.size() >= 2 && id.front() == '<' && id.back() == '>')
        return id.substr(1, id.size() - 2);
    return id;
}

void collectLeaves(const RawPart &part, std::vector<Leaf> &leaves, int depth)
{
    if (depth > kMaxMultipartDepth)
        throw ParseError("multipart nesting too deep");

    HeaderParams type = parseParameterized(headerValue(part.headers, "Content-Type"));
    if (type.value.empty() || type.value.find('/') == std::string::npos)
        type.value = "text/plain";

    if (type.value.rfind("multipart/", 0) == 0)
    {
        auto boundary = type.params.find("boundary");
        if (boundary == type.params.end() || boundary->second.empty())
            throw ParseError("multipart part without boundary");
        for (std::string_view section : splitMultipart(part.body, boundary->second))
            collectLeaves(splitPart(section, false), leaves, depth + 1);
        return;
    }

    Leaf leaf;
    leaf.mediaType = type.value;
    std::string encoding = toLower(trim(headerValue(part.headers, "Content-Transfer-Encoding")));
    if (encoding == "base64")
        leaf.data = decodeBase64(part.body);
    else if (encoding == "quoted-printable")
        leaf.data = decodeQuotedPrintable(part.body);
    else
        leaf.data = part.body;

    leaf.contentId = stripAngles(trim(headerValue(part.headers, "Content-ID")));
    leaf.attachment = parseParameterized(headerValue(part.headers, "Content-Disposition")).value == "attachment";
    leaves.push_back(std::move(leaf));
}

bool isText(const Leaf &leaf)
{
    return leaf.mediaType.rfind("text/", 0) == 0;
}

std::optional<std::size_t> findBody(const std::vector<Leaf> &leaves)
{
    auto findType = [&](auto predicate) -> std::optional<std::size_t> {
        for (std::size_t i = 0; i < leaves.size(); ++i)
        {
            if (!leaves[i].attachment && predicate(leaves[i]))
                return i;
        }
        return std::nullopt;
    };

    if (auto html = findType([](const Leaf &leaf) { return leaf.mediaType == "text/html"; }))
        return html;
    if (auto plain = findType([](const Leaf &leaf) { return leaf.mediaType == "text/plain"; }))
        return plain;
    return findType(isText);
}

int hexValue(char ch)
{
    if (ch >= '0' && ch <= '9')
        return ch - '0';
    if (ch >= 'a' && ch <= 'f')
        return ch - 'a' + 10;
    if (ch >= 'A' && ch <= 'F')
        return ch - 'A' + 10;
    return -1;
}

std::string latin1ToUtf8(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    for (char ch : text)
    {
        auto byte = static_cast<unsigned char>(ch);
        if (byte < 0x80)
        {
            out.push_back(ch);
            continue;
        }
        out.push_back(static_cast<char>(0xC0 | (byte >> 6)));
        out.push_back(static_cast<char>(0x80 | (byte & 0x3F)));
    }
    return out;
}

bool isBlank(std::string_view text)
{
    return std::all_of(text.begin(), text.end(), [](char ch) { return ch == ' ' || ch == '\t'; });
}

std::optional<std::string> decodeWord(std::string_view charset, char encoding, std::string_view payload)
{
    std::string decoded;
    if (encoding == 'B' || encoding == 'b')
    {
        decoded = decodeBase64(payload);
    }
    else if (encoding == 'Q' || encoding == 'q')
    {
        std::string text(payload);
        std::replace(text.begin(), text.end(), '_', ' ');
        decoded = decodeQuotedPrintable(text);
    }
    else
    {
        return std::nullopt;
    }

    std::string name = toLower(charset.substr(0, charset.find('*')));
    if (name == "iso-8859-1" || name == "latin1" || name == "windows-1252")
        return latin1ToUtf8(decoded);
    return decoded;
}

} // namespace

std::string decodeBase64(std::string_view encoded)
{
    std::string decoded;
    decoded.reserve(encoded.size() * 3 / 4);
    int val = 0;
    int bits = -8;
    for (char ch : encoded)
    {
        int digit;
        if (ch >= 'A' && ch <= 'Z')
            digit = ch - 'A';
        else if (ch >= 'a' && ch <= 'z')
            digit = ch - 'a' + 26;
        else if (ch >= '0' && ch <= '9')
            digit = ch - '0' + 52;
        else if (ch == '+')
            digit = 62;
        else if (ch == '/')
            digit = 63;
        else if (ch == '=')
            break;
        else
            continue;

        val = (val << 6) | digit;
        bits += 6;
        if (bits >= 0)
        {
            decoded.push_back(static_cast<char>((val >> bits) & 0xFF));
            bits -= 8;
        }
    }
    return decoded;
}

std::string decodeQuotedPrintable(std::string_view encoded)
{
    std::string decoded;
    decoded.reserve(encoded.size());
    for (std::size_t i = 0; i < encoded.size(); ++i)
    {
        char ch = encoded[i];
        if (ch != '=')
        {
            decoded.push_back(ch);
            continue;
        }
        if (i + 1 < encoded.size() && encoded[i + 1] == '\n')
        {
            ++i;
            continue;
        }
        if (i + 2 < encoded.size())
        {
            int hi = hexValue(encoded[i + 1]);
            int lo = hexValue(encoded[i + 2]);
            if (hi >= 0 && lo >= 0)
            {
                decoded.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        decoded.push_back(ch);
    }
    return decoded;
}

std::string decodeEncodedWords(std::string_view value)
{
    std::string out;
    out.reserve(value.size());
    std::size_t pos = 0;
    bool afterEncodedWord = false;
    while (pos < value.size())
    {
        std::size_t start = value.find("=?", pos);
        if (start == std::string_view::npos)
            break;

        std::size_t charsetEnd = value.find('?', start + 2);
        std::size_t payloadEnd = std::string_view::npos;
        if (charsetEnd != std::string_view::npos && charsetEnd + 2 < value.size() && value[charsetEnd + 2] == '?')
            payloadEnd = value.find("?=", charsetEnd + 3);

        std::optional<std::string> decoded;
        if (payloadEnd != std::string_view::npos)
            decoded = decodeWord(value.substr(start + 2, charsetEnd - start - 2), value[charsetEnd + 1],
                                 value.substr(charsetEnd + 3, payloadEnd - charsetEnd - 3));
        if (!decoded)
        {
            out.append(value.substr(pos, start + 2 - pos));
            pos = start + 2;
            afterEncodedWord = false;
            continue;
        }

        // Whitespace separating two encoded words is not part of the text.
        std::string_view gap = value.substr(pos, start - pos);
        if (!(afterEncodedWord && isBlank(gap)))
            out.append(gap);
        out += *decoded;
        pos = payloadEnd + 2;
        afterEncodedWord = true;
    }
    if (pos < value.size())
        out.append(value.substr(pos));
    return out;
}

FullMessage parseMessage(std::string_view raw)
{
    const std::string text = normalizeLineEndings(raw);
    RawPart root = splitPart(text, true);

    FullMessage message;
    message.headers = root.headers;
    message.from = decodeEncodedWords(headerValue(root.headers, "From"));
    message.to = decodeEncodedWords(headerValue(root.headers, "To"));
    message.cc = decodeEncodedWords(headerValue(root.headers, "Cc"));
    message.bcc = decodeEncodedWords(headerValue(root.headers, "Bcc"));
    message.date = headerValue(root.headers, "Date");
    message.subject = decodeEncodedWords(headerValue(root.headers, "Subject"));

    std::vector<Leaf> leaves;
    collectLeaves(root, leaves, 0);

    std::optional<std::size_t> body = findBody(leaves);
    if (body)
        message.body = TextPart{leaves[*body].mediaType, leaves[*body].data};
    else
        message.body = TextPart{"text/plain", std::string()};

    for (std::size_t i = 0; i < leaves.size(); ++i)
    {
        const Leaf &leaf = leaves[i];
        if (body && i == *body)
            continue;
        if (!leaf.attachment && leaf.mediaType == "text/plain")
        {
            message.plainText = TextPart{leaf.mediaType, leaf.data};
            break;
        }
    }

    for (const auto &leaf : leaves)
    {
        if (isText(leaf) || leaf.contentId.empty())
            continue;
        message.resources.push_back(InlineResource{leaf.contentId, leaf.mediaType, leaf.data});
    }

    return message;
}

} // namespace spool::mail
