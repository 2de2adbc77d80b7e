#pragma once

#include "spool/mail/content_loader.hpp"
#include "spool/mail/errors.hpp"
#include "spool/mail/repository.hpp"

#include <algorithm>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace spool::testing
{

inline mail::MessageEntry makeEntry(const std::string &token, int seconds, const std::string &file = std::string())
{
    return mail::MessageEntry(token, std::chrono::system_clock::time_point(std::chrono::seconds(seconds)), 128,
                              file.empty() ? std::filesystem::path() : std::filesystem::path(file));
}

inline std::shared_ptr<const mail::FullMessage> makeMessage(const std::string &subject, const std::string &body,
                                                            const std::string &mediaType = "text/plain")
{
    auto message = std::make_shared<mail::FullMessage>();
    message->headers = {{"From", "sender@example.com"}, {"Subject", subject}};
    message->from = "sender@example.com";
    message->to = "rcpt@example.com";
    message->subject = subject;
    message->body = mail::TextPart{mediaType, body};
    return message;
}

// Loader whose completions are fired by the test, in whatever order it likes.
class ManualContentLoader : public mail::ContentLoader
{
public:
    struct Request
    {
        mail::MessageEntry entry;
        std::shared_ptr<mail::LoadToken> token;
        Callback callback;
    };

    mail::LoadHandle get(const mail::MessageEntry &entry, Callback onComplete) override
    {
        if (throwOnGet)
            throw mail::IoError("loader unavailable");
        auto token = std::make_shared<mail::LoadToken>();
        requests.push_back(Request{entry, token, std::move(onComplete)});
        return mail::LoadHandle(token);
    }

    // Returns false when the request had been cancelled and the callback was skipped.
    bool complete(std::size_t index, mail::LoadOutcome outcome)
    {
        Request &request = requests.at(index);
        request.token->completed.store(true);
        if (request.token->cancelled.load())
            return false;
        request.callback(std::move(outcome));
        return true;
    }

    // Delivers regardless of cancellation, like a fetch that finished just as it was cancelled.
    void forceComplete(std::size_t index, mail::LoadOutcome outcome)
    {
        Request &request = requests.at(index);
        request.token->completed.store(true);
        request.callback(std::move(outcome));
    }

    bool cancelled(std::size_t index) const { return requests.at(index).token->cancelled.load(); }

    std::vector<Request> requests;
    bool throwOnGet = false;
};

class FakeRepository : public mail::Repository
{
public:
    std::vector<mail::MessageEntry> loadAll() override
    {
        std::lock_guard<std::mutex> lock(mutex);
        ++loadAllCalls;
        if (failLoadAll)
            throw mail::IoError("spool unavailable");
        return entries;
    }

    void deleteMessage(const mail::MessageEntry &entry) override
    {
        std::lock_guard<std::mutex> lock(mutex);
        ++deleteCalls[entry.token()];
        if (failing.count(entry.token()) != 0)
            throw mail::IoError("permission denied");
        auto it = std::find(entries.begin(), entries.end(), entry);
        if (it == entries.end())
            throw mail::NotFoundError("no such message: " + entry.token());
        entries.erase(it);
    }

    void setNewMessageHandler(NewMessageHandler handler) override { newMessage = std::move(handler); }
    void setRefreshNeededHandler(RefreshNeededHandler handler) override { refreshNeeded = std::move(handler); }

    int deletesOf(const std::string &token)
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = deleteCalls.find(token);
        return it == deleteCalls.end() ? 0 : it->second;
    }

    std::mutex mutex;
    std::vector<mail::MessageEntry> entries;
    std::set<std::string> failing;
    std::map<std::string, int> deleteCalls;
    int loadAllCalls = 0;
    bool failLoadAll = false;
    NewMessageHandler newMessage;
    RefreshNeededHandler refreshNeeded;
};

} // namespace spool::testing
