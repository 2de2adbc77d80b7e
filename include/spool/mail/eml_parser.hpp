#pragma once

#include "spool/mail/full_message.hpp"

#include <string>
#include <string_view>

namespace spool::mail
{

// Minimal RFC 5322 / MIME reader: folded headers, nested multiparts, base64 and
// quoted-printable bodies. Throws ParseError on malformed input.
FullMessage parseMessage(std::string_view raw);

std::string decodeBase64(std::string_view encoded);
std::string decodeQuotedPrintable(std::string_view encoded);

// Decodes RFC 2047 encoded words (=?charset?B?...?= and =?charset?Q?...?=) in a
// header value. ISO-8859-1 text is converted to UTF-8; other charsets pass
// through unchanged. Malformed words are left as written.
std::string decodeEncodedWords(std::string_view value);

} // namespace spool::mail
