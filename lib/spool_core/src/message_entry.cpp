#include "spool/mail/message_entry.hpp"
#include "spool/mail/full_message.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace spool::mail
{

MessageEntry::MessageEntry(std::string token, TimePoint modified, std::uintmax_t size,
                           std::filesystem::path file)
    : token_(std::move(token)), modified_(modified), size_(size), file_(std::move(file))
{
}

std::string MessageEntry::displayText() const
{
    std::ostringstream out;
    out << formatTimestamp(modified_) << "  " << formatSize(size_) << "  " << token_;
    return out.str();
}

std::string formatTimestamp(const MessageEntry::TimePoint &tp)
{
    if (tp.time_since_epoch().count() == 0)
        return "-";

    std::time_t tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    if (!localtime_r(&tt, &tm))
        return "-";
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return out.str();
}

std::string formatSize(std::uintmax_t bytes)
{
    std::ostringstream out;
    if (bytes < 1024)
        out << bytes << " B";
    else if (bytes < 1024 * 1024)
        out << std::fixed << std::setprecision(1) << (bytes / 1024.0) << " KB";
    else
        out << std::fixed << std::setprecision(1) << (bytes / (1024.0 * 1024.0)) << " MB";
    return out.str();
}

std::string FullMessage::headerText() const
{
    std::string text;
    for (const auto &header : headers)
    {
        if (!text.empty())
            text += '\n';
        text += header.name;
        text += ": ";
        text += header.value;
    }
    return text;
}

} // namespace spool::mail
