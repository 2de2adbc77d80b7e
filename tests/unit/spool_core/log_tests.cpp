#include <gtest/gtest.h>

#include "spool/log.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using spool::log::Level;
using spool::log::Logger;

TEST(Logger, DropsMessagesBelowMinimumLevel)
{
    std::vector<std::string> lines;
    Logger logger([&lines](Level level, const std::string &line) {
        lines.push_back(std::string(spool::log::levelName(level)) + " " + line);
    });

    logger.debug("hidden");
    logger.info("shown");
    logger.setMinimumLevel(Level::Error);
    logger.warning("hidden too");
    logger.error("bad");

    EXPECT_EQ(lines, (std::vector<std::string>{"INFO shown", "ERROR bad"}));
    EXPECT_EQ(logger.minimumLevel(), Level::Error);
}

TEST(Logger, WithoutSinkIsSilent)
{
    Logger logger;
    EXPECT_NO_THROW(logger.error("nowhere"));
}

TEST(Logger, FileSinkAppendsTimestampedLines)
{
    namespace fs = std::filesystem;
    const fs::path file = fs::temp_directory_path() /
                          ("spool-log-" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) +
                           ".log");

    Logger logger(spool::log::fileSink(file), Level::Debug);
    logger.info("first");
    logger.warning("second\n");

    std::ifstream in(file);
    std::string line;
    std::vector<std::string> lines;
    while (std::getline(in, line))
        lines.push_back(line);

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_NE(lines[0].find(" INFO first"), std::string::npos);
    EXPECT_NE(lines[1].find(" WARN second"), std::string::npos);
    EXPECT_EQ(lines[0][4], '-');

    std::error_code ec;
    fs::remove(file, ec);
}
