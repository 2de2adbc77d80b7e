#include "ui/mail_app.hpp"
#include "viewer_options.hpp"

#include <iostream>
#include <string>

int main(int argc, char **argv)
{
    const std::string executable = argc > 0 && argv[0] ? argv[0] : "spool-view";
    spool::view::CliOptions cli = spool::view::parseCommandLine(argc, argv);
    if (!cli.error.empty())
    {
        std::cerr << executable << ": " << cli.error << "\n\n" << spool::view::usageText(executable);
        return 2;
    }
    if (cli.showHelp)
    {
        std::cout << spool::view::usageText(executable);
        return 0;
    }

    MailApp app(argc, argv, cli);
    app.run();
    app.shutDown();
    return 0;
}
