#include "spool/mail/eml_loader.hpp"
#include "spool/mail/eml_parser.hpp"
#include "spool/mail/errors.hpp"
#include "spool/log.hpp"

#include <fstream>
#include <sstream>

namespace spool::mail
{

EmlContentLoader::EmlContentLoader(const log::Logger *logger)
    : logger_(logger)
{
    worker_ = std::thread([this]() { run(); });
}

EmlContentLoader::~EmlContentLoader()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        for (auto &job : jobs_)
            job.token->cancelled.store(true, std::memory_order_release);
    }
    wake_.notify_all();
    if (worker_.joinable())
        worker_.join();
}

LoadHandle EmlContentLoader::get(const MessageEntry &entry, Callback onComplete)
{
    auto token = std::make_shared<LoadToken>();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_)
        {
            token->cancelled.store(true, std::memory_order_release);
            return LoadHandle(token);
        }
        jobs_.push_back(Job{entry, token, std::move(onComplete)});
    }
    wake_.notify_one();
    return LoadHandle(token);
}

LoadOutcome EmlContentLoader::loadFile(const MessageEntry &entry)
{
    try
    {
        if (!entry.hasFile())
            throw IoError("message " + entry.token() + " has no backing file");

        std::ifstream in(entry.file(), std::ios::binary);
        if (!in.is_open())
            throw IoError("unable to open " + entry.file().string());
        std::ostringstream buffer;
        buffer << in.rdbuf();
        if (in.bad())
            throw IoError("unable to read " + entry.file().string());

        auto message = std::make_shared<FullMessage>(parseMessage(buffer.str()));
        return LoadOutcome::success(std::move(message));
    }
    catch (const IoError &ex)
    {
        return LoadOutcome::failure(LoadError::Io, ex.what());
    }
    catch (const ParseError &ex)
    {
        return LoadOutcome::failure(LoadError::Parse, ex.what());
    }
}

void EmlContentLoader::run()
{
    while (true)
    {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            wake_.wait(lock, [this]() { return stopping_ || !jobs_.empty(); });
            if (stopping_)
                return;
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }

        if (job.token->cancelled.load(std::memory_order_acquire))
        {
            job.token->completed.store(true, std::memory_order_release);
            continue;
        }

        LoadOutcome outcome = loadFile(job.entry);
        if (logger_ && !outcome.succeeded())
            logger_->warning("Failed to load " + job.entry.token() + ": " + outcome.errorMessage);

        if (!job.token->cancelled.load(std::memory_order_acquire) && job.callback)
            job.callback(std::move(outcome));
        job.token->completed.store(true, std::memory_order_release);
    }
}

} // namespace spool::mail
