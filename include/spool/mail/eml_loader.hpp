#pragma once

#include "spool/mail/content_loader.hpp"

#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>

namespace spool::log {
class Logger;
}

namespace spool::mail
{

// Loads .eml files on a single background worker, one request at a time.
class EmlContentLoader : public ContentLoader
{
public:
    explicit EmlContentLoader(const log::Logger *logger = nullptr);
    ~EmlContentLoader() override;

    EmlContentLoader(const EmlContentLoader &) = delete;
    EmlContentLoader &operator=(const EmlContentLoader &) = delete;

    LoadHandle get(const MessageEntry &entry, Callback onComplete) override;

    static LoadOutcome loadFile(const MessageEntry &entry);

private:
    struct Job
    {
        MessageEntry entry;
        std::shared_ptr<LoadToken> token;
        Callback callback;
    };

    void run();

    const log::Logger *logger_ = nullptr;
    mutable std::mutex mutex_;
    std::condition_variable wake_;
    std::deque<Job> jobs_;
    bool stopping_ = false;
    std::thread worker_;
};

} // namespace spool::mail
