#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <sstream>
#include "logger.hpp"

TEST(LoggerTest, LevelNamesRoundTrip)
{
    for (const char *name : {"trace", "debug", "info", "warn", "error", "critical", "off"})
    {
        TankLevelLogger::LogLevel level = TankLevelLogger::LogLevel::INFO;
        ASSERT_TRUE(TankLevelLogger::levelFromString(name, level)) << name;
        EXPECT_EQ(TankLevelLogger::levelToString(level), name);
    }

    TankLevelLogger::LogLevel level = TankLevelLogger::LogLevel::WARN;
    EXPECT_FALSE(TankLevelLogger::levelFromString("verbose", level));
    EXPECT_EQ(level, TankLevelLogger::LogLevel::WARN);
}

TEST(LoggerTest, FileOnlyWritesFormattedMessagesAboveLevel)
{
    std::string log_file = ::testing::TempDir() + "tank_level_logger_test.log";
    std::remove(log_file.c_str());

    TankLevelLogger::init(log_file, TankLevelLogger::LogLevel::INFO, 1048576, 1, false, true);
    TankLevelLogger::debug("不应写入 {}", 1);
    TankLevelLogger::info("液位: {:.2f} cm", 33.333);
    TankLevelLogger::warn("没有参数的消息");
    TankLevelLogger::flush();

    std::ifstream ifs(log_file);
    std::stringstream ss;
    ss << ifs.rdbuf();
    const std::string content = ss.str();

    EXPECT_NE(content.find("液位: 33.33 cm"), std::string::npos);
    EXPECT_NE(content.find("[warn] 没有参数的消息"), std::string::npos);
    EXPECT_EQ(content.find("不应写入"), std::string::npos);

    // 恢复默认控制台日志，避免影响其他测试
    spdlog::set_default_logger(spdlog::stdout_color_mt("tank_level_test_console"));
    std::remove(log_file.c_str());
}
