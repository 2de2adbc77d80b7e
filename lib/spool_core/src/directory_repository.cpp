#include "spool/mail/directory_repository.hpp"
#include "spool/mail/errors.hpp"
#include "spool/log.hpp"

#include <algorithm>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>
#include <system_error>
#include <vector>

#include <sys/stat.h>

namespace fs = std::filesystem;

namespace spool::mail
{

namespace
{
constexpr const char *kMessageExtension = ".eml";

bool isMessageFile(const fs::directory_entry &entry)
{
    std::error_code ec;
    return entry.is_regular_file(ec) && entry.path().extension() == kMessageExtension;
}

bool olderFirst(const MessageEntry &lhs, const MessageEntry &rhs)
{
    if (lhs.modified() != rhs.modified())
        return lhs.modified() < rhs.modified();
    return lhs.token() < rhs.token();
}

std::string randomSuffix()
{
    static thread_local std::mt19937 engine{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, 0xFFFF);
    std::ostringstream out;
    out << std::hex << std::setw(4) << std::setfill('0') << dist(engine);
    return out.str();
}
} // namespace

DirectoryMessageRepository::DirectoryMessageRepository(fs::path directory, const log::Logger *logger)
    : directory_(std::move(directory)), logger_(logger)
{
}

DirectoryMessageRepository::~DirectoryMessageRepository()
{
    stopWatching();
}

MessageEntry DirectoryMessageRepository::entryFromFile(const fs::path &file)
{
    struct stat sb
    {
    };
    if (::stat(file.c_str(), &sb) != 0)
        throw NotFoundError("message file not found: " + file.string());

    auto modified = std::chrono::system_clock::from_time_t(sb.st_mtime) +
                    std::chrono::duration_cast<std::chrono::system_clock::duration>(
                        std::chrono::nanoseconds(sb.st_mtim.tv_nsec));
    return MessageEntry(file.filename().string(), modified, static_cast<std::uintmax_t>(sb.st_size), file);
}

std::string DirectoryMessageRepository::newFileName(std::chrono::system_clock::time_point now)
{
    std::time_t tt = std::chrono::system_clock::to_time_t(now);
    auto hundredths =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000 / 10;
    std::tm tm{};
    localtime_r(&tt, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y%m%d%H%M%S") << std::setw(2) << std::setfill('0') << hundredths << '-'
        << randomSuffix() << kMessageExtension;
    return out.str();
}

std::map<std::string, MessageEntry> DirectoryMessageRepository::scan() const
{
    std::map<std::string, MessageEntry> found;
    std::error_code ec;
    if (!fs::exists(directory_, ec))
        return found;

    fs::directory_iterator it(directory_, fs::directory_options::skip_permission_denied, ec);
    if (ec)
        throw IoError("unable to list " + directory_.string() + ": " + ec.message());

    try
    {
        for (const auto &dirEntry : it)
        {
            if (!isMessageFile(dirEntry))
                continue;
            try
            {
                MessageEntry entry = entryFromFile(dirEntry.path());
                found.emplace(entry.token(), std::move(entry));
            }
            catch (const NotFoundError &)
            {
                // Removed between listing and stat.
            }
        }
    }
    catch (const fs::filesystem_error &ex)
    {
        throw IoError("unable to list " + directory_.string() + ": " + ex.what());
    }
    return found;
}

std::vector<MessageEntry> DirectoryMessageRepository::loadAll()
{
    std::vector<MessageEntry> entries;
    {
        std::lock_guard<std::mutex> lock(knownMutex_);
        known_ = scan();
        entries.reserve(known_.size());
        for (const auto &[token, entry] : known_)
            entries.push_back(entry);
    }
    std::sort(entries.begin(), entries.end(), olderFirst);
    if (logger_)
        logger_->debug("Loaded " + std::to_string(entries.size()) + " messages from " + directory_.string());
    return entries;
}

void DirectoryMessageRepository::deleteMessage(const MessageEntry &entry)
{
    fs::path file = entry.hasFile() ? entry.file() : directory_ / entry.token();

    std::error_code ec;
    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(knownMutex_);
        removed = fs::remove(file, ec);
        if (removed || !ec)
            known_.erase(entry.token());
    }

    if (ec)
        throw IoError("unable to delete " + file.string() + ": " + ec.message());
    if (!removed)
        throw NotFoundError("message already deleted: " + entry.token());

    if (logger_)
        logger_->info("Deleted message " + entry.token());
}

void DirectoryMessageRepository::setNewMessageHandler(NewMessageHandler handler)
{
    std::lock_guard<std::mutex> lock(handlerMutex_);
    newMessageHandler_ = std::move(handler);
}

void DirectoryMessageRepository::setRefreshNeededHandler(RefreshNeededHandler handler)
{
    std::lock_guard<std::mutex> lock(handlerMutex_);
    refreshNeededHandler_ = std::move(handler);
}

MessageEntry DirectoryMessageRepository::saveMessage(std::string_view raw)
{
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec)
        throw IoError("unable to create " + directory_.string() + ": " + ec.message());

    MessageEntry entry;
    {
        // Held across the write so a concurrent poll never reports our own file.
        std::lock_guard<std::mutex> lock(knownMutex_);
        fs::path file;
        do
        {
            file = directory_ / newFileName(std::chrono::system_clock::now());
        } while (fs::exists(file, ec));

        {
            std::ofstream out(file, std::ios::binary | std::ios::trunc);
            if (!out.is_open())
                throw IoError("unable to create " + file.string());
            out.write(raw.data(), static_cast<std::streamsize>(raw.size()));
            if (!out)
                throw IoError("unable to write " + file.string());
        }

        entry = entryFromFile(file);
        known_.insert_or_assign(entry.token(), entry);
    }
    if (logger_)
        logger_->info("Saved message " + entry.token());
    announceNewMessage(entry);
    return entry;
}

void DirectoryMessageRepository::pollOnce()
{
    std::vector<MessageEntry> added;
    bool vanished = false;
    {
        std::lock_guard<std::mutex> lock(knownMutex_);
        std::map<std::string, MessageEntry> current = scan();
        for (const auto &[token, entry] : current)
        {
            if (known_.find(token) == known_.end())
                added.push_back(entry);
        }
        for (const auto &[token, entry] : known_)
        {
            if (current.find(token) == current.end())
            {
                vanished = true;
                break;
            }
        }
        known_ = std::move(current);
    }

    std::sort(added.begin(), added.end(), olderFirst);
    for (const auto &entry : added)
        announceNewMessage(entry);
    if (vanished)
        announceRefreshNeeded();
}

void DirectoryMessageRepository::startWatching(std::chrono::milliseconds interval)
{
    if (watcher_.joinable())
        return;

    {
        std::lock_guard<std::mutex> lock(knownMutex_);
        if (known_.empty())
            known_ = scan();
    }
    {
        std::lock_guard<std::mutex> lock(watchMutex_);
        stopWatch_ = false;
    }
    watcher_ = std::thread([this, interval]() { watchLoop(interval); });
}

void DirectoryMessageRepository::stopWatching()
{
    {
        std::lock_guard<std::mutex> lock(watchMutex_);
        stopWatch_ = true;
    }
    watchWake_.notify_all();
    if (watcher_.joinable())
        watcher_.join();
}

void DirectoryMessageRepository::announceNewMessage(const MessageEntry &entry)
{
    std::lock_guard<std::mutex> lock(handlerMutex_);
    if (newMessageHandler_)
        newMessageHandler_(entry);
}

void DirectoryMessageRepository::announceRefreshNeeded()
{
    std::lock_guard<std::mutex> lock(handlerMutex_);
    if (refreshNeededHandler_)
        refreshNeededHandler_();
}

void DirectoryMessageRepository::watchLoop(std::chrono::milliseconds interval)
{
    std::unique_lock<std::mutex> lock(watchMutex_);
    while (!stopWatch_)
    {
        if (watchWake_.wait_for(lock, interval, [this]() { return stopWatch_; }))
            break;
        lock.unlock();
        try
        {
            pollOnce();
        }
        catch (const MailError &ex)
        {
            if (logger_)
                logger_->error(std::string("Spool directory poll failed: ") + ex.what());
        }
        lock.lock();
    }
}

} // namespace spool::mail
