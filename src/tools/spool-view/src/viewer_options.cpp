#include "viewer_options.hpp"

#include <cstdlib>
#include <sstream>
#include <string_view>

namespace spool::view
{

namespace
{
std::filesystem::path dataHome()
{
    if (const char *xdg = std::getenv("XDG_DATA_HOME"))
    {
        if (*xdg)
            return std::filesystem::path(xdg);
    }
    if (const char *home = std::getenv("HOME"))
    {
        if (*home)
            return std::filesystem::path(home) / ".local" / "share";
    }
    return std::filesystem::path(".local") / "share";
}

bool takeValue(int argc, char **argv, int &i, std::string_view flag, std::optional<std::string> &target,
               std::string &error)
{
    std::string_view arg(argv[i]);
    if (arg == flag)
    {
        if (i + 1 >= argc)
        {
            error = std::string(flag) + " requires a directory";
            return true;
        }
        target = std::string(argv[++i]);
        return true;
    }
    const std::string prefix = std::string(flag) + "=";
    if (arg.rfind(prefix, 0) == 0)
    {
        target = std::string(arg.substr(prefix.size()));
        return true;
    }
    return false;
}
} // namespace

void registerViewerOptions(config::OptionRegistry &registry)
{
    registry.registerOption({kOptionMessageDirectory, config::OptionKind::Path,
                             config::OptionValue(std::string()), "Message Directory",
                             "Directory holding captured .eml files."});
    registry.registerOption({kOptionScratchDirectory, config::OptionKind::Path,
                             config::OptionValue(std::string()), "Scratch Directory",
                             "Where rendered HTML and inline resources are written."});
    registry.registerOption({kOptionShowNotifications, config::OptionKind::Boolean,
                             config::OptionValue(true), "Show Notifications",
                             "Pop up a notice when a new message arrives."});
    registry.registerOption({kOptionPollIntervalMs, config::OptionKind::Integer,
                             config::OptionValue(std::int64_t{1000}), "Poll Interval (ms)",
                             "How often the message directory is checked for changes.",
                             std::int64_t{100}, std::int64_t{60000}});
    registry.registerOption({kOptionLogFile, config::OptionKind::Path,
                             config::OptionValue(std::string()), "Log File",
                             "Log file path; defaults to spool-view.log beside the executable."});
}

ViewerSettings resolveViewerSettings(const config::OptionRegistry &registry,
                                     const std::filesystem::path &binaryDir)
{
    ViewerSettings settings;
    settings.messageDirectory = registry.getPath(kOptionMessageDirectory);
    if (settings.messageDirectory.empty())
        settings.messageDirectory = dataHome() / "spool" / "incoming";

    settings.scratchDirectory = registry.getPath(kOptionScratchDirectory);
    if (settings.scratchDirectory.empty())
    {
        std::error_code ec;
        std::filesystem::path temp = std::filesystem::temp_directory_path(ec);
        settings.scratchDirectory = (ec ? std::filesystem::path("/tmp") : temp) / "spool-view";
    }

    settings.logFile = registry.getPath(kOptionLogFile);
    if (settings.logFile.empty())
        settings.logFile = binaryDir / "spool-view.log";

    settings.showNotifications = registry.getBool(kOptionShowNotifications, true);
    settings.pollInterval = std::chrono::milliseconds(registry.getInteger(kOptionPollIntervalMs, 1000));
    return settings;
}

CliOptions parseCommandLine(int argc, char **argv)
{
    CliOptions options;
    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg(argv[i]);
        if (arg == "--help" || arg == "-h")
        {
            options.showHelp = true;
            continue;
        }
        if (takeValue(argc, argv, i, "--messages", options.messageDirectory, options.error))
            continue;
        if (takeValue(argc, argv, i, "--scratch", options.scratchDirectory, options.error))
            continue;
        if (options.error.empty())
            options.error = "unknown argument: " + std::string(arg);
    }
    return options;
}

void applyCommandLine(const CliOptions &options, config::OptionRegistry &registry)
{
    if (options.messageDirectory)
        registry.set(kOptionMessageDirectory, config::OptionValue(*options.messageDirectory));
    if (options.scratchDirectory)
        registry.set(kOptionScratchDirectory, config::OptionValue(*options.scratchDirectory));
}

std::string usageText(const std::string &executable)
{
    std::ostringstream out;
    out << "Usage: " << executable << " [--messages DIR] [--scratch DIR]\n";
    out << "Browse the messages captured in DIR as they arrive.\n";
    out << "  --messages DIR  directory holding .eml files\n";
    out << "  --scratch DIR   directory for rendered HTML and inline resources\n";
    out << "  -h, --help      show this help\n";
    out << "Defaults are read from " << config::OptionRegistry::configRoot().string()
        << "/spool-view/defaults.json" << '\n';
    return out.str();
}

} // namespace spool::view
