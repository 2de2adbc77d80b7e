#pragma once

#include <filesystem>
#include <functional>
#include <mutex>
#include <string>

namespace spool::log
{

enum class Level
{
    Debug,
    Info,
    Warning,
    Error,
};

const char *levelName(Level level) noexcept;

using Sink = std::function<void(Level level, const std::string &line)>;

// Appends "<timestamp> <LEVEL> <message>" lines to the given file.
Sink fileSink(std::filesystem::path path);

class Logger
{
public:
    Logger() = default;
    explicit Logger(Sink sink, Level minimum = Level::Info);

    void setSink(Sink sink);
    void setMinimumLevel(Level level);
    Level minimumLevel() const;

    void write(Level level, const std::string &message) const;
    void debug(const std::string &message) const { write(Level::Debug, message); }
    void info(const std::string &message) const { write(Level::Info, message); }
    void warning(const std::string &message) const { write(Level::Warning, message); }
    void error(const std::string &message) const { write(Level::Error, message); }

private:
    mutable std::mutex mutex_;
    Sink sink_;
    Level minimum_ = Level::Info;
};

} // namespace spool::log
