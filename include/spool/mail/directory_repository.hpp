#pragma once

#include "spool/mail/repository.hpp"

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

namespace spool::log {
class Logger;
}

namespace spool::mail
{

/**
 * @brief Repository over a spool directory of .eml files.
 *
 * The capture service drops files into the directory; a watcher thread polls
 * it and reports files that appeared (new message) or vanished without going
 * through deleteMessage (refresh needed).
 */
class DirectoryMessageRepository : public Repository
{
public:
    explicit DirectoryMessageRepository(std::filesystem::path directory,
                                        const log::Logger *logger = nullptr);
    ~DirectoryMessageRepository() override;

    DirectoryMessageRepository(const DirectoryMessageRepository &) = delete;
    DirectoryMessageRepository &operator=(const DirectoryMessageRepository &) = delete;

    std::vector<MessageEntry> loadAll() override;
    void deleteMessage(const MessageEntry &entry) override;
    void setNewMessageHandler(NewMessageHandler handler) override;
    void setRefreshNeededHandler(RefreshNeededHandler handler) override;

    MessageEntry saveMessage(std::string_view raw);

    void startWatching(std::chrono::milliseconds interval);
    void stopWatching();
    bool watching() const noexcept { return watcher_.joinable(); }
    void pollOnce();

    const std::filesystem::path &directory() const noexcept { return directory_; }

    static MessageEntry entryFromFile(const std::filesystem::path &file);
    static std::string newFileName(std::chrono::system_clock::time_point now);

private:
    std::map<std::string, MessageEntry> scan() const;
    void announceNewMessage(const MessageEntry &entry);
    void announceRefreshNeeded();
    void watchLoop(std::chrono::milliseconds interval);

    std::filesystem::path directory_;
    const log::Logger *logger_ = nullptr;

    std::mutex knownMutex_;
    std::map<std::string, MessageEntry> known_;

    std::mutex handlerMutex_;
    NewMessageHandler newMessageHandler_;
    RefreshNeededHandler refreshNeededHandler_;

    std::mutex watchMutex_;
    std::condition_variable watchWake_;
    bool stopWatch_ = false;
    std::thread watcher_;
};

} // namespace spool::mail
