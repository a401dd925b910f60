#include <gtest/gtest.h>
#include "utils/Logger.h"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setConsoleEnabled(false);
        Logger::getInstance().setCallback([this](LogLevel level, const std::string& message) {
            records.emplace_back(level, message);
        });
    }

    void TearDown() override {
        Logger& logger = Logger::getInstance();
        logger.setCallback(nullptr);
        logger.setLevel(LogLevel::INFO);
        logger.setLogFile("");
        logger.setConsoleEnabled(true);
    }

    std::vector<std::pair<LogLevel, std::string>> records;
};

TEST_F(LoggerTest, DropsRecordsBelowLevel) {
    Logger& logger = Logger::getInstance();
    logger.setLevel(LogLevel::WARNING);

    logger.debug("quiet");
    logger.info("still quiet");
    logger.warn("careful");
    logger.error("broken");

    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].first, LogLevel::WARNING);
    EXPECT_EQ(records[0].second, "careful");
    EXPECT_EQ(records[1].first, LogLevel::ERROR);
}

TEST_F(LoggerTest, ParsesLevelNames) {
    EXPECT_EQ(Logger::parseLevel("debug"), LogLevel::DEBUG);
    EXPECT_EQ(Logger::parseLevel("WARN"), LogLevel::WARNING);
    EXPECT_EQ(Logger::parseLevel("Warning"), LogLevel::WARNING);
    EXPECT_EQ(Logger::parseLevel("ERROR"), LogLevel::ERROR);
    EXPECT_EQ(Logger::parseLevel("verbose", LogLevel::ERROR), LogLevel::ERROR);
    EXPECT_EQ(Logger::levelName(LogLevel::WARNING), "WARN");
}

TEST_F(LoggerTest, AppendsTimestampedRecordsToFile) {
    auto path = fs::temp_directory_path() / "tandem_logger_test.log";
    fs::remove(path);

    Logger& logger = Logger::getInstance();
    logger.setLogFile(path.string());
    logger.warn("disk check");
    logger.setLogFile("");

    std::ifstream f(path);
    std::stringstream ss;
    ss << f.rdbuf();
    std::string content = ss.str();
    EXPECT_NE(content.find("[WARN] disk check"), std::string::npos);
    EXPECT_EQ(content.front(), '[');
    fs::remove(path);
}
