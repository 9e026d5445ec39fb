#include <gtest/gtest.h>
#include "logger.hpp"
#include "test_support.hpp"
#include <sstream>

TEST(LoggerTest, ParseLogLevel) {
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parseLogLevel("Warning"), LogLevel::WARN);
    EXPECT_EQ(parseLogLevel("WARN"), LogLevel::WARN);
    EXPECT_EQ(parseLogLevel("error"), LogLevel::ERROR);
    EXPECT_EQ(parseLogLevel("none"), LogLevel::NONE);
    EXPECT_EQ(parseLogLevel("verbose"), LogLevel::INFO);
}

TEST(LoggerTest, FiltersBelowLevel) {
    std::ostringstream out;
    Logger logger(LogLevel::WARN, out);
    logger.setColor(false);

    logger.debug("hidden debug");
    logger.info("hidden info");
    logger.warn("shown warning");
    logger.error("shown error");

    std::string text = out.str();
    EXPECT_EQ(text.find("hidden"), std::string::npos);
    EXPECT_NE(text.find("[WARN] shown warning"), std::string::npos);
    EXPECT_NE(text.find("[ERROR] shown error"), std::string::npos);
}

TEST(LoggerTest, NoneSilencesEverything) {
    std::ostringstream out;
    Logger logger(LogLevel::NONE, out);
    logger.error("nothing");
    EXPECT_TRUE(out.str().empty());
}

TEST(LoggerTest, WritesDailyLogFile) {
    TempDir dir;
    std::ostringstream out;
    Logger logger(LogLevel::INFO, out);

    ASSERT_TRUE(logger.openLogFile(dir.path("log")));
    logger.info("persisted line");

    fs::path file = logger.logFilePath();
    ASSERT_TRUE(fs::exists(file));
    EXPECT_EQ(file.extension(), ".log");

    std::vector<uint8_t> bytes = readAll(file);
    std::string content(bytes.begin(), bytes.end());
    EXPECT_NE(content.find("| INFO     | persisted line"), std::string::npos);
}

TEST(LoggerTest, CleanupRemovesOnlyOldDatedLogs) {
    TempDir dir;
    writeText(dir.path("2000-01-01.log"), "old");
    writeText(dir.path("notes.log"), "keep");
    writeText(dir.path("2000-01-01.txt"), "keep");

    Logger logger(LogLevel::NONE);
    ASSERT_TRUE(logger.openLogFile(dir.root));

    EXPECT_EQ(Logger::cleanupOldLogs(dir.root, 30), 1);
    EXPECT_FALSE(fs::exists(dir.path("2000-01-01.log")));
    EXPECT_TRUE(fs::exists(dir.path("notes.log")));
    EXPECT_TRUE(fs::exists(dir.path("2000-01-01.txt")));
    EXPECT_TRUE(fs::exists(logger.logFilePath()));
}

TEST(LoggerTest, CleanupOnMissingDirectory) {
    EXPECT_EQ(Logger::cleanupOldLogs(fs::temp_directory_path() / "hexguard_no_such_dir"), 0);
}
