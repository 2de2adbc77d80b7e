#pragma once

#include <string>
#include <string_view>

namespace spool::view
{

// Reduces an HTML body to readable terminal text: tags dropped, block
// elements turned into line breaks, common entities decoded.
std::string htmlToText(std::string_view html);

} // namespace spool::view
