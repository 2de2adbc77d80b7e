#pragma once

#include "spool/mail/full_message.hpp"
#include "spool/mail/message_entry.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <string>

namespace spool::mail
{

enum class LoadError
{
    None,
    Io,
    Parse,
};

const char *loadErrorName(LoadError error) noexcept;

struct LoadOutcome
{
    std::shared_ptr<const FullMessage> message;
    LoadError error = LoadError::None;
    std::string errorMessage;

    bool succeeded() const noexcept { return message && error == LoadError::None; }

    static LoadOutcome success(std::shared_ptr<const FullMessage> message);
    static LoadOutcome failure(LoadError error, std::string errorMessage);
};

// Shared between a loader job and the handle given to the caller.
struct LoadToken
{
    std::atomic<bool> cancelled{false};
    std::atomic<bool> completed{false};
};

class LoadHandle
{
public:
    LoadHandle() = default;
    explicit LoadHandle(std::shared_ptr<LoadToken> token);

    // Safe to call repeatedly, on an empty handle, or after completion.
    void cancel() noexcept;

    bool valid() const noexcept { return static_cast<bool>(token_); }
    bool cancelled() const noexcept;
    bool completed() const noexcept;

private:
    std::shared_ptr<LoadToken> token_;
};

/**
 * @brief Fetches the full content of a message entry off the calling thread.
 *
 * The callback runs on a loader-owned thread at most once and is skipped when
 * the handle was cancelled before the result was ready.
 */
class ContentLoader
{
public:
    using Callback = std::function<void(LoadOutcome outcome)>;

    virtual ~ContentLoader() = default;

    virtual LoadHandle get(const MessageEntry &entry, Callback onComplete) = 0;
};

} // namespace spool::mail
