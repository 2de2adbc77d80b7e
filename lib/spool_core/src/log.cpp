#include "spool/log.hpp"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>

namespace spool::log
{

namespace
{
std::string timestampNow()
{
    auto now = std::chrono::system_clock::now();
    std::time_t tt = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::tm tm{};
    localtime_r(&tt, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
        << millis.count();
    return out.str();
}
} // namespace

const char *levelName(Level level) noexcept
{
    switch (level)
    {
    case Level::Debug:
        return "DEBUG";
    case Level::Info:
        return "INFO";
    case Level::Warning:
        return "WARN";
    case Level::Error:
        return "ERROR";
    }
    return "?";
}

Sink fileSink(std::filesystem::path path)
{
    auto fileMutex = std::make_shared<std::mutex>();
    return [path = std::move(path), fileMutex](Level level, const std::string &line) {
        std::lock_guard<std::mutex> lock(*fileMutex);
        std::ofstream file(path, std::ios::app);
        if (!file.is_open())
            return;
        file << timestampNow() << ' ' << levelName(level) << ' ' << line;
        if (line.empty() || line.back() != '\n')
            file << '\n';
    };
}

Logger::Logger(Sink sink, Level minimum)
    : sink_(std::move(sink)), minimum_(minimum)
{
}

void Logger::setSink(Sink sink)
{
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

void Logger::setMinimumLevel(Level level)
{
    std::lock_guard<std::mutex> lock(mutex_);
    minimum_ = level;
}

Level Logger::minimumLevel() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return minimum_;
}

void Logger::write(Level level, const std::string &message) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!sink_ || level < minimum_)
        return;
    sink_(level, message);
}

} // namespace spool::log
