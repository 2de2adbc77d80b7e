#include "spool/mail/content_loader.hpp"

namespace spool::mail
{

const char *loadErrorName(LoadError error) noexcept
{
    switch (error)
    {
    case LoadError::None:
        return "none";
    case LoadError::Io:
        return "I/O error";
    case LoadError::Parse:
        return "parse error";
    }
    return "unknown";
}

LoadOutcome LoadOutcome::success(std::shared_ptr<const FullMessage> message)
{
    LoadOutcome outcome;
    outcome.message = std::move(message);
    return outcome;
}

LoadOutcome LoadOutcome::failure(LoadError error, std::string errorMessage)
{
    LoadOutcome outcome;
    outcome.error = error;
    outcome.errorMessage = std::move(errorMessage);
    return outcome;
}

LoadHandle::LoadHandle(std::shared_ptr<LoadToken> token)
    : token_(std::move(token))
{
}

void LoadHandle::cancel() noexcept
{
    if (token_)
        token_->cancelled.store(true, std::memory_order_release);
}

bool LoadHandle::cancelled() const noexcept
{
    return token_ && token_->cancelled.load(std::memory_order_acquire);
}

bool LoadHandle::completed() const noexcept
{
    return token_ && token_->completed.load(std::memory_order_acquire);
}

} // namespace spool::mail
