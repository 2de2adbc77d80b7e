#pragma once

#include <string>

namespace clipboard
{
// Status line text describing whether the copy of `what` is likely to reach the system clipboard.
std::string statusMessage(const std::string &what);
void copyToClipboard(const std::string &text);
} // namespace clipboard
