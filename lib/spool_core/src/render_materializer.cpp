#include "spool/viewer/render_materializer.hpp"
#include "spool/mail/errors.hpp"

#include <cctype>
#include <fstream>
#include <set>
#include <system_error>

namespace fs = std::filesystem;

namespace spool::viewer
{

namespace
{
bool isIdChar(char ch)
{
    unsigned char uch = static_cast<unsigned char>(ch);
    return std::isalnum(uch) || ch == '.' || ch == '@' || ch == '-' || ch == '_' || ch == '$' || ch == '%';
}

void replaceAll(std::string &text, const std::string &needle, const std::string &replacement, bool checkBoundary)
{
    if (needle.empty())
        return;
    std::size_t pos = 0;
    while ((pos = text.find(needle, pos)) != std::string::npos)
    {
        std::size_t after = pos + needle.size();
        if (checkBoundary && after < text.size() && isIdChar(text[after]))
        {
            pos = after;
            continue;
        }
        text.replace(pos, needle.size(), replacement);
        pos += replacement.size();
    }
}

void writeFile(const fs::path &path, const std::string &data)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open())
        throw mail::IoError("unable to create " + path.string());
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!out)
        throw mail::IoError("unable to write " + path.string());
}
} // namespace

RenderMaterializer::RenderMaterializer(fs::path scratchDirectory)
    : scratchDirectory_(std::move(scratchDirectory))
{
}

std::string RenderMaterializer::resourceFileName(const std::string &contentId)
{
    std::string name;
    name.reserve(contentId.size());
    for (char ch : contentId)
    {
        unsigned char uch = static_cast<unsigned char>(ch);
        name.push_back(std::isalnum(uch) || ch == '.' || ch == '-' || ch == '_' ? ch : '_');
    }
    if (name.empty() || name.find_first_not_of('.') == std::string::npos)
        name = "resource" + name;
    return name;
}

std::string RenderMaterializer::rewriteContentReferences(std::string html, const std::string &contentId,
                                                         const std::string &target)
{
    replaceAll(html, "cid:'" + contentId + "'", "'" + target + "'", false);
    replaceAll(html, "cid:\"" + contentId + "\"", "\"" + target + "\"", false);
    replaceAll(html, "cid:" + contentId, target, true);
    return html;
}

fs::path RenderMaterializer::materialize(const mail::FullMessage &message) const
{
    std::error_code ec;
    fs::create_directories(scratchDirectory_, ec);
    if (ec)
        throw mail::IoError("unable to create " + scratchDirectory_.string() + ": " + ec.message());

    std::string html = message.body.text;
    std::set<std::string> usedNames;
    for (const auto &resource : message.resources)
    {
        // Distinct ids can sanitize to the same name; later ones get a numeric suffix.
        const std::string baseName = resourceFileName(resource.contentId);
        std::string fileName = baseName;
        for (int index = 2; !usedNames.insert(fileName).second; ++index)
            fileName = baseName + "-" + std::to_string(index);
        writeFile(scratchDirectory_ / fileName, resource.data);
        html = rewriteContentReferences(std::move(html), resource.contentId, fileName);
    }

    fs::path htmlFile = scratchDirectory_ / kHtmlFileName;
    writeFile(htmlFile, html);
    return htmlFile;
}

} // namespace spool::viewer
