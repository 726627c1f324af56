#include "logger/Logger.h"
#include <cstdio>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <unistd.h>

namespace
{
std::string readFile(const char* fileName)
{
    std::ifstream file(fileName);
    std::stringstream content;
    content << file.rdbuf();
    return content.str();
}
} // namespace

TEST(LoggerTest, parseLevel)
{
    EXPECT_EQ(logger::Level::DBG, logger::parseLevel("debug", logger::Level::INFO));
    EXPECT_EQ(logger::Level::DBG, logger::parseLevel("DBG", logger::Level::INFO));
    EXPECT_EQ(logger::Level::WARN, logger::parseLevel("Warn", logger::Level::INFO));
    EXPECT_EQ(logger::Level::ERROR, logger::parseLevel("ERROR", logger::Level::INFO));
    EXPECT_EQ(logger::Level::INFO, logger::parseLevel("verbose", logger::Level::INFO));
    EXPECT_EQ(logger::Level::WARN, logger::parseLevel(nullptr, logger::Level::WARN));
}

TEST(LoggerTest, loggableIdsAreNumberedPerInstance)
{
    logger::LoggableId first("ConnectionOrchestrator");
    logger::LoggableId second("ConnectionOrchestrator");

    EXPECT_EQ(first.getInstanceId() + 1, second.getInstanceId());
    EXPECT_EQ("ConnectionOrchestrator-" + std::to_string(second.getInstanceId()), std::string(second.c_str()));
}

TEST(LoggerTest, writesToFileUntilStopped)
{
    char logFileName[11] = "log-XXXXXX";
    const auto handle = mkstemp(logFileName);
    ASSERT_GT(handle, 0);
    close(handle);

    EXPECT_FALSE(logger::isActive());
    logger::info("not running", "LoggerTest");

    logger::setup(logFileName, false, false, logger::Level::INFO);
    EXPECT_TRUE(logger::isActive());
    logger::info("state %s -> %s", "ConnectionOrchestrator-1", "IDLE", "GATHERING");
    logger::debug("selected %zu candidates", "ConnectionOrchestrator-1", size_t(3));
    logger::error("ICE connection %s", "ConnectionOrchestrator-1", "failed");
    logger::stop();
    EXPECT_FALSE(logger::isActive());

    const auto content = readFile(logFileName);
    EXPECT_NE(std::string::npos, content.find("INFO"));
    EXPECT_NE(std::string::npos, content.find("[ConnectionOrchestrator-1] state IDLE -> GATHERING"));
    EXPECT_NE(std::string::npos, content.find("ERROR"));
    EXPECT_NE(std::string::npos, content.find("ICE connection failed"));
    EXPECT_EQ(std::string::npos, content.find("selected 3 candidates"));
    EXPECT_EQ(std::string::npos, content.find("not running"));

    logger::_logLevel = logger::Level::INFO;
    remove(logFileName);
}
