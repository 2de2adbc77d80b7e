#include "external_open.hpp"

#include <cerrno>
#include <cstring>
#include <vector>

#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace spool::view
{

namespace
{
constexpr const char *kOpener = "xdg-open";
}

bool openExternally(const std::filesystem::path &file, std::string &error)
{
    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    // Keep the opener from scribbling over the terminal UI.
    posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
    posix_spawn_file_actions_addopen(&actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);

    std::string opener = kOpener;
    std::string target = file.string();
    std::vector<char *> argv{opener.data(), target.data(), nullptr};

    pid_t childPid = -1;
    int spawnStatus = posix_spawnp(&childPid, opener.c_str(), &actions, nullptr, argv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);
    if (spawnStatus != 0)
    {
        error = std::string("unable to start ") + kOpener + ": " + std::strerror(spawnStatus);
        return false;
    }

    int status = 0;
    while (waitpid(childPid, &status, 0) < 0)
    {
        if (errno != EINTR)
        {
            error = std::string("waitpid failed: ") + std::strerror(errno);
            return false;
        }
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0)
    {
        error = std::string(kOpener) + " could not open " + target;
        return false;
    }
    return true;
}

} // namespace spool::view
