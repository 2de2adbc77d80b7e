#include <gtest/gtest.h>

#include "spool/mail/directory_repository.hpp"
#include "spool/mail/errors.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <regex>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using spool::mail::DirectoryMessageRepository;
using spool::mail::MessageEntry;

namespace
{

class TempSpool
{
public:
    TempSpool()
        : path_(fs::temp_directory_path() /
                ("spool-repo-" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count())))
    {
        fs::create_directories(path_);
    }

    ~TempSpool()
    {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    const fs::path &path() const { return path_; }

    fs::path write(const std::string &name, const std::string &content, std::time_t mtime = 0)
    {
        const fs::path file = path_ / name;
        {
            std::ofstream out(file, std::ios::binary);
            out << content;
        }
        if (mtime != 0)
        {
            auto tp = fs::file_time_type::clock::now() -
                      std::chrono::seconds(std::time(nullptr) - mtime);
            fs::last_write_time(file, tp);
        }
        return file;
    }

private:
    fs::path path_;
};

} // namespace

TEST(DirectoryMessageRepository, LoadsOnlyEmlFilesOldestFirst)
{
    TempSpool spool;
    const std::time_t now = std::time(nullptr);
    spool.write("newer.eml", "Subject: b\n\n", now - 10);
    spool.write("older.eml", "Subject: a\n\n", now - 100);
    spool.write("notes.txt", "ignored");
    fs::create_directories(spool.path() / "sub.eml");

    DirectoryMessageRepository repository(spool.path());
    auto entries = repository.loadAll();

    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].token(), "older.eml");
    EXPECT_EQ(entries[1].token(), "newer.eml");
    EXPECT_EQ(entries[0].file(), spool.path() / "older.eml");
    EXPECT_EQ(entries[0].size(), 12u);
}

TEST(DirectoryMessageRepository, MissingDirectoryIsEmpty)
{
    DirectoryMessageRepository repository(fs::temp_directory_path() / "spool-no-such-directory-xyz");
    EXPECT_TRUE(repository.loadAll().empty());
}

TEST(DirectoryMessageRepository, DeleteRemovesFileAndReportsMissing)
{
    TempSpool spool;
    spool.write("a.eml", "Subject: a\n\n");
    DirectoryMessageRepository repository(spool.path());
    auto entries = repository.loadAll();
    ASSERT_EQ(entries.size(), 1u);

    repository.deleteMessage(entries[0]);
    EXPECT_FALSE(fs::exists(spool.path() / "a.eml"));
    EXPECT_THROW(repository.deleteMessage(entries[0]), spool::mail::NotFoundError);
}

TEST(DirectoryMessageRepository, SaveWritesNamedFileAndAnnounces)
{
    TempSpool spool;
    DirectoryMessageRepository repository(spool.path() / "incoming");

    std::vector<std::string> announced;
    repository.setNewMessageHandler([&announced](const MessageEntry &entry) { announced.push_back(entry.token()); });

    auto entry = repository.saveMessage("Subject: saved\n\nbody\n");
    EXPECT_TRUE(fs::exists(entry.file()));
    EXPECT_TRUE(std::regex_match(entry.token(), std::regex("[0-9]{16}-[0-9a-f]{4}\\.eml")));
    ASSERT_EQ(announced.size(), 1u);
    EXPECT_EQ(announced.front(), entry.token());

    // The saved file is already known, so polling does not report it again.
    repository.pollOnce();
    EXPECT_EQ(announced.size(), 1u);
}

TEST(DirectoryMessageRepository, PollReportsNewAndVanishedFiles)
{
    TempSpool spool;
    spool.write("a.eml", "Subject: a\n\n");
    DirectoryMessageRepository repository(spool.path());
    repository.loadAll();

    std::vector<std::string> added;
    int refreshes = 0;
    repository.setNewMessageHandler([&added](const MessageEntry &entry) { added.push_back(entry.token()); });
    repository.setRefreshNeededHandler([&refreshes]() { ++refreshes; });

    spool.write("b.eml", "Subject: b\n\n");
    repository.pollOnce();
    EXPECT_EQ(added, (std::vector<std::string>{"b.eml"}));
    EXPECT_EQ(refreshes, 0);

    fs::remove(spool.path() / "a.eml");
    repository.pollOnce();
    EXPECT_EQ(refreshes, 1);
    EXPECT_EQ(added.size(), 1u);

    repository.pollOnce();
    EXPECT_EQ(refreshes, 1);
}

TEST(DirectoryMessageRepository, DeleteThroughRepositoryDoesNotRequestRefresh)
{
    TempSpool spool;
    spool.write("a.eml", "Subject: a\n\n");
    DirectoryMessageRepository repository(spool.path());
    auto entries = repository.loadAll();

    int refreshes = 0;
    repository.setRefreshNeededHandler([&refreshes]() { ++refreshes; });
    repository.deleteMessage(entries[0]);
    repository.pollOnce();
    EXPECT_EQ(refreshes, 0);
}

TEST(DirectoryMessageRepository, WatcherThreadAnnouncesDroppedFiles)
{
    TempSpool spool;
    DirectoryMessageRepository repository(spool.path());
    repository.loadAll();

    std::mutex mutex;
    std::vector<std::string> added;
    repository.setNewMessageHandler([&](const MessageEntry &entry) {
        std::lock_guard<std::mutex> lock(mutex);
        added.push_back(entry.token());
    });
    repository.startWatching(std::chrono::milliseconds(20));
    EXPECT_TRUE(repository.watching());

    spool.write("dropped.eml", "Subject: d\n\n");
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (std::chrono::steady_clock::now() < deadline)
    {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!added.empty())
                break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    repository.stopWatching();
    EXPECT_FALSE(repository.watching());

    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(added, (std::vector<std::string>{"dropped.eml"}));
}

TEST(DirectoryMessageRepository, EntryFromMissingFileThrows)
{
    EXPECT_THROW(DirectoryMessageRepository::entryFromFile(fs::temp_directory_path() / "spool-missing.eml"),
                 spool::mail::NotFoundError);
}

TEST(DirectoryMessageRepository, FileNamesSortByCreationTime)
{
    auto first = DirectoryMessageRepository::newFileName(std::chrono::system_clock::time_point(std::chrono::hours(1000)));
    auto second = DirectoryMessageRepository::newFileName(
        std::chrono::system_clock::time_point(std::chrono::hours(1000) + std::chrono::milliseconds(20)));
    EXPECT_LT(first.substr(0, 16), second.substr(0, 16));
}
