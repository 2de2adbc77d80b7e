#pragma once

#include <stdexcept>
#include <string>

namespace spool::mail
{

class MailError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Raised by Repository::deleteMessage when the entry is already gone.
class NotFoundError : public MailError
{
public:
    using MailError::MailError;
};

class IoError : public MailError
{
public:
    using MailError::MailError;
};

class ParseError : public MailError
{
public:
    using MailError::MailError;
};

} // namespace spool::mail
