#include "core/logger.hpp"

#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <sstream>

using namespace blueadv::core;

TEST(LogContextTest, FormatsSortedKeyValuePairs)
{
    LogContext context;
    context.add("zeta", 3).add("alpha", "x").add_hex("payload", {0x01, 0xAB});

    EXPECT_EQ(context.size(), 3u);
    EXPECT_EQ(context.format(), "alpha=x payload=01ab zeta=3");
}

TEST(LogContextTest, EmptyContext)
{
    LogContext context;
    EXPECT_TRUE(context.empty());
    EXPECT_EQ(context.format(), "");
}

TEST(LoggerTest, FormatsLine)
{
    Logger logger("Unit", LogLevel::DEBUG);
    std::string line = logger.format_message(LogLevel::WARNING, "hello", LogContext().add("k", "v"));

    EXPECT_NE(line.find(" [WARN] Unit: hello k=v"), std::string::npos);
    // YYYY-MM-DD HH:MM:SS.mmm
    EXPECT_EQ(line[4], '-');
    EXPECT_EQ(line[10], ' ');
    EXPECT_EQ(line[19], '.');
}

TEST(LoggerTest, LevelFiltering)
{
    Logger logger("Filter", LogLevel::WARNING);
    EXPECT_FALSE(logger.is_enabled(LogLevel::DEBUG));
    EXPECT_FALSE(logger.is_enabled(LogLevel::INFO));
    EXPECT_TRUE(logger.is_enabled(LogLevel::WARNING));
    EXPECT_TRUE(logger.is_enabled(LogLevel::CRITICAL));
}

TEST(LoggerTest, WritesToFile)
{
    std::string path = ::testing::TempDir() + "blueadv_logger_test.log";
    std::remove(path.c_str());

    {
        Logger logger("File", LogLevel::INFO);
        logger.set_console_output(false);
        logger.set_output_file(path);
        logger.debug("hidden");
        logger.info("visible", LogContext().add("n", 1));
    }

    std::ifstream in(path);
    std::stringstream content;
    content << in.rdbuf();

    EXPECT_EQ(content.str().find("hidden"), std::string::npos);
    EXPECT_NE(content.str().find("[INFO] File: visible n=1"), std::string::npos);
    std::remove(path.c_str());
}

TEST(LoggerManagerTest, LevelNames)
{
    EXPECT_EQ(LoggerManager::string_to_level("debug"), LogLevel::DEBUG);
    EXPECT_EQ(LoggerManager::string_to_level("WARNING"), LogLevel::WARNING);
    EXPECT_EQ(LoggerManager::string_to_level("warn"), LogLevel::WARNING);
    EXPECT_EQ(LoggerManager::string_to_level("crit"), LogLevel::CRITICAL);
    EXPECT_EQ(LoggerManager::level_to_string(LogLevel::ERROR), "ERROR");
}

TEST(LoggerManagerTest, SetupReachesExistingLoggers)
{
    auto logger = get_logger("ManagerTest");
    setup_logging(LogLevel::ERROR, "", false);
    EXPECT_EQ(logger->level(), LogLevel::ERROR);
    EXPECT_EQ(get_logger("ManagerTest"), logger);

    auto later = get_logger("ManagerTestLater");
    EXPECT_EQ(later->level(), LogLevel::ERROR);

    setup_logging(LogLevel::WARNING, "", true);
    EXPECT_EQ(logger->level(), LogLevel::WARNING);
}
