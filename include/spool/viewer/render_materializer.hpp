#pragma once

#include "spool/mail/full_message.hpp"

#include <filesystem>
#include <string>

namespace spool::viewer
{

// Writes the rich body of a message and its inline resources into a scratch
// directory so an external browser can display it. Files are overwritten on
// every render.
class RenderMaterializer
{
public:
    explicit RenderMaterializer(std::filesystem::path scratchDirectory);

    const std::filesystem::path &scratchDirectory() const noexcept { return scratchDirectory_; }

    std::filesystem::path materialize(const mail::FullMessage &message) const;

    static constexpr const char *kHtmlFileName = "spool-message.htm";

    static std::string resourceFileName(const std::string &contentId);
    static std::string rewriteContentReferences(std::string html, const std::string &contentId,
                                                const std::string &target);

private:
    std::filesystem::path scratchDirectory_;
};

} // namespace spool::viewer
