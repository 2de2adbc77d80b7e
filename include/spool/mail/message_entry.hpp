#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace spool::mail
{

// Handle to one stored message. Entries never change after construction; two
// entries are the same message when their tokens match.
class MessageEntry
{
public:
    using TimePoint = std::chrono::system_clock::time_point;

    MessageEntry() = default;
    MessageEntry(std::string token, TimePoint modified, std::uintmax_t size = 0,
                 std::filesystem::path file = {});

    const std::string &token() const noexcept { return token_; }
    TimePoint modified() const noexcept { return modified_; }
    std::uintmax_t size() const noexcept { return size_; }
    const std::filesystem::path &file() const noexcept { return file_; }
    bool hasFile() const noexcept { return !file_.empty(); }

    std::string displayText() const;

    bool operator==(const MessageEntry &other) const noexcept { return token_ == other.token_; }

private:
    std::string token_;
    TimePoint modified_{};
    std::uintmax_t size_ = 0;
    std::filesystem::path file_;
};

std::string formatTimestamp(const MessageEntry::TimePoint &tp);
std::string formatSize(std::uintmax_t bytes);

} // namespace spool::mail
