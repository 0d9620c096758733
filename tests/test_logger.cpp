#include <gtest/gtest.h>
#include "../src/logger.h"
#include "../src/fs.h"
#include <string>
#include <unistd.h>

using namespace meshshare;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_file_ = "/tmp/meshshare_logger_test_" + std::to_string(getpid()) + ".log";
        if (file_exists(log_file_)) delete_file(log_file_);
        previous_level_ = Logger::getInstance().get_log_level();
    }

    void TearDown() override {
        Logger& logger = Logger::getInstance();
        logger.set_file_logging_enabled(false);
        logger.set_log_level(previous_level_);
        if (file_exists(log_file_)) delete_file(log_file_);
    }

    std::string log_file_;
    LogLevel previous_level_;
};

TEST_F(LoggerTest, FileLoggingNeedsPath) {
    Logger& logger = Logger::getInstance();
    logger.set_log_file_path("");
    EXPECT_FALSE(logger.set_file_logging_enabled(true));
    EXPECT_FALSE(logger.is_file_logging_enabled());
}

TEST_F(LoggerTest, FileLoggingWritesModuleAndLevel) {
    Logger& logger = Logger::getInstance();
    logger.set_log_level(LogLevel::INFO);
    logger.set_log_file_path(log_file_);
    ASSERT_TRUE(logger.set_file_logging_enabled(true));
    EXPECT_EQ(logger.get_log_file_path(), log_file_);

    LOG_INFO("events", "transfer " << 42 << " accepted");
    LOG_DEBUG("events", "below the level");
    LOG_ERROR("storage", "disk full");
    ASSERT_TRUE(logger.set_file_logging_enabled(false));

    std::string contents = read_file_text_cpp(log_file_);
    EXPECT_NE(contents.find("[INFO ] [events] transfer 42 accepted"), std::string::npos);
    EXPECT_NE(contents.find("[ERROR] [storage] disk full"), std::string::npos);
    EXPECT_EQ(contents.find("below the level"), std::string::npos);
    EXPECT_EQ(contents.find("\033["), std::string::npos);
}
