#pragma once

#include "spool/options.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace spool::view
{

inline constexpr char kOptionMessageDirectory[] = "messageDirectory";
inline constexpr char kOptionScratchDirectory[] = "scratchDirectory";
inline constexpr char kOptionShowNotifications[] = "showNotifications";
inline constexpr char kOptionPollIntervalMs[] = "pollIntervalMs";
inline constexpr char kOptionLogFile[] = "logFile";

void registerViewerOptions(config::OptionRegistry &registry);

struct ViewerSettings
{
    std::filesystem::path messageDirectory;
    std::filesystem::path scratchDirectory;
    std::filesystem::path logFile;
    bool showNotifications = true;
    std::chrono::milliseconds pollInterval{1000};
};

// Empty path options fall back to locations derived from the environment.
ViewerSettings resolveViewerSettings(const config::OptionRegistry &registry,
                                     const std::filesystem::path &binaryDir);

struct CliOptions
{
    bool showHelp = false;
    std::optional<std::string> messageDirectory;
    std::optional<std::string> scratchDirectory;
    std::string error;
};

CliOptions parseCommandLine(int argc, char **argv);
void applyCommandLine(const CliOptions &options, config::OptionRegistry &registry);
std::string usageText(const std::string &executable);

} // namespace spool::view
