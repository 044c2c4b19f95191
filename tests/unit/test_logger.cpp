#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "common/logging.h"

using namespace Common;

class LoggerTestBase : public ::testing::Test {
protected:
    void SetUp() override {
        const auto stamp = std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        test_dir_ = std::filesystem::temp_directory_path() / ("archgate_logger_" + std::to_string(stamp));
        test_log_file_ = (test_dir_ / "nested" / "gate.log").string();
        shutdownLogging();
    }

    void TearDown() override {
        shutdownLogging();
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto readLines(const std::string& filename) -> std::vector<std::string> {
        std::ifstream file(filename);
        std::vector<std::string> lines;
        std::string line;
        while (std::getline(file, line)) {
            lines.push_back(line);
        }
        return lines;
    }

    // Expected format: [YYYY-MM-DD HH:MM:SS.micros][LEVEL] message
    auto verifyLogEntryFormat(const std::string& line, const std::string& level, const std::string& message)
        -> bool {
        if (line.size() < 29 || line[0] != '[' || line[27] != ']' || line[28] != '[') {
            return false;
        }
        size_t level_end = line.find("] ", 29);
        if (level_end == std::string::npos) {
            return false;
        }
        std::string actual_level = line.substr(29, level_end - 29);
        actual_level.erase(std::remove(actual_level.begin(), actual_level.end(), ' '), actual_level.end());
        return actual_level == level && line.substr(level_end + 2) == message;
    }

    std::filesystem::path test_dir_;
    std::string test_log_file_;
};

TEST_F(LoggerTestBase, DisabledLoggingIsNoOp) {
    ASSERT_TRUE(initLogging(""));
    EXPECT_EQ(g_logger, nullptr);
    LOG_INFO("dropped %d", 1);
    LOG_ERROR("dropped too");
    EXPECT_FALSE(std::filesystem::exists(test_dir_));
}

TEST_F(LoggerTestBase, WritesFormattedLines) {
    ASSERT_TRUE(initLogging(test_log_file_, Logger::DEBUG));
    ASSERT_NE(g_logger, nullptr);

    LOG_DEBUG("Stage %s", "workspace");
    LOG_INFO("Classified %zu files", static_cast<size_t>(4));
    LOG_WARN("Listing of %s stopped early", "engine/src");
    LOG_ERROR("Stage %s failed: %s", "core-bans", "optional wrapper");
    EXPECT_EQ(g_logger->getStats().messages_written, 4u);
    shutdownLogging();

    auto lines = readLines(test_log_file_);
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_TRUE(verifyLogEntryFormat(lines[0], "DEBUG", "Stage workspace")) << lines[0];
    EXPECT_TRUE(verifyLogEntryFormat(lines[1], "INFO", "Classified 4 files")) << lines[1];
    EXPECT_TRUE(verifyLogEntryFormat(lines[2], "WARN", "Listing of engine/src stopped early")) << lines[2];
    EXPECT_TRUE(verifyLogEntryFormat(lines[3], "ERROR", "Stage core-bans failed: optional wrapper")) << lines[3];
}

TEST_F(LoggerTestBase, LevelFiltering) {
    ASSERT_TRUE(initLogging(test_log_file_, Logger::WARN));
    EXPECT_EQ(g_logger->minLevel(), Logger::WARN);

    LOG_DEBUG("hidden");
    LOG_INFO("hidden");
    LOG_WARN("shown");
    EXPECT_EQ(g_logger->getStats().messages_written, 1u);
    shutdownLogging();

    auto lines = readLines(test_log_file_);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_TRUE(verifyLogEntryFormat(lines[0], "WARN", "shown"));
}

TEST_F(LoggerTestBase, LongMessagesTruncated) {
    ASSERT_TRUE(initLogging(test_log_file_));
    const std::string big(Logger::MAX_MSG_SIZE * 2, 'x');
    LOG_INFO("%s", big.c_str());
    shutdownLogging();

    auto lines = readLines(test_log_file_);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].size() - lines[0].find("] ") - 2, Logger::MAX_MSG_SIZE - 1);
}

TEST_F(LoggerTestBase, ReinitializeAppends) {
    ASSERT_TRUE(initLogging(test_log_file_));
    LOG_INFO("first run");
    ASSERT_TRUE(initLogging(test_log_file_));
    LOG_INFO("second run");
    shutdownLogging();

    EXPECT_EQ(readLines(test_log_file_).size(), 2u);
}

TEST_F(LoggerTestBase, UnopenableFileFails) {
    std::filesystem::create_directories(test_dir_);
    const std::string blocker = (test_dir_ / "blocker").string();
    std::ofstream(blocker) << "file, not a directory";

    EXPECT_FALSE(initLogging(blocker + "/gate.log"));
    EXPECT_EQ(g_logger, nullptr);
}

TEST_F(LoggerTestBase, ParseLevel) {
    Logger::Level level = Logger::INFO;
    EXPECT_TRUE(Logger::parseLevel("debug", &level));
    EXPECT_EQ(level, Logger::DEBUG);
    EXPECT_TRUE(Logger::parseLevel("Warn", &level));
    EXPECT_EQ(level, Logger::WARN);
    EXPECT_TRUE(Logger::parseLevel("ERROR", &level));
    EXPECT_EQ(level, Logger::ERROR);
    EXPECT_FALSE(Logger::parseLevel("verbose", &level));
    EXPECT_FALSE(Logger::parseLevel("", &level));
    EXPECT_EQ(level, Logger::ERROR);
}
