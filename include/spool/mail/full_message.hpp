#pragma once

#include <optional>
#include <string>
#include <vector>

namespace spool::mail
{

struct MessageHeader
{
    std::string name;
    std::string value;
};

struct TextPart
{
    std::string mediaType = "text/plain";
    std::string text;

    bool isHtml() const noexcept { return mediaType == "text/html"; }
};

struct InlineResource
{
    std::string contentId;
    std::string mediaType;
    std::string data;
};

struct FullMessage
{
    std::vector<MessageHeader> headers;
    std::string from;
    std::string to;
    std::string cc;
    std::string bcc;
    std::string date;
    std::string subject;

    TextPart body;
    // Set only when the message carries a plain-text part distinct from body.
    std::optional<TextPart> plainText;
    std::vector<InlineResource> resources;

    std::string headerText() const;
};

} // namespace spool::mail
