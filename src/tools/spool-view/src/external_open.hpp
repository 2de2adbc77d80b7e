#pragma once

#include <filesystem>
#include <string>

namespace spool::view
{

// Hands a file to the desktop's default handler (xdg-open). Returns false and
// fills error when the handler could not be started or reported failure.
bool openExternally(const std::filesystem::path &file, std::string &error);

} // namespace spool::view
