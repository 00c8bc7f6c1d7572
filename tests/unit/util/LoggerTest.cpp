/**
 * @file LoggerTest.cpp
 * @brief Unit tests for util::Logger
 */

#include "util/Logger.hpp"

#include "fixtures/TestFixtures.hpp"

#include <gtest/gtest.h>

#include <format>
#include <fstream>
#include <sstream>

class LoggerTest : public ::testing::Test {
protected:
    std::unique_ptr<FakeSystemRoot> scratch;
    fs::path log_dir;

    void SetUp() override {
        scratch = std::make_unique<FakeSystemRoot>();
        log_dir = scratch->root() / "logs";
    }

    void TearDown() override {
        util::Logger::instance().shutdown();
        util::Logger::instance().set_min_level(util::LogLevel::INFO);
        scratch.reset();
    }

    static auto ReadFile(const fs::path& path) -> std::string {
        std::ifstream in{path};
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }
};

TEST_F(LoggerTest, Initialize_CreatesLogFile) {
    auto& logger = util::Logger::instance();
    ASSERT_TRUE(logger.initialize(log_dir, "diskinfo-test"));
    EXPECT_TRUE(logger.is_initialized());
    EXPECT_EQ(logger.get_log_file_path().string(), (log_dir / "diskinfo-test.log").string());
    EXPECT_TRUE(fs::exists(log_dir / "diskinfo-test.log"));
}

TEST_F(LoggerTest, Log_WritesComponentAndLevel) {
    auto& logger = util::Logger::instance();
    ASSERT_TRUE(logger.initialize(log_dir, "diskinfo-test"));

    LOG_WARNING("DiskBuilder", "sda: udev record unreadable");

    const auto content = ReadFile(log_dir / "diskinfo-test.log");
    EXPECT_NE(content.find("[WARN ] [DiskBuilder] sda: udev record unreadable"), std::string::npos);
}

TEST_F(LoggerTest, Log_BelowMinLevel_IsDropped) {
    auto& logger = util::Logger::instance();
    ASSERT_TRUE(logger.initialize(log_dir, "diskinfo-test", util::LogLevel::WARNING));

    LOG_DEBUG("Test", "hidden debug");
    LOG_INFO("Test", "hidden info");
    LOG_ERROR("Test", "visible error");

    const auto content = ReadFile(log_dir / "diskinfo-test.log");
    EXPECT_EQ(content.find("hidden"), std::string::npos);
    EXPECT_NE(content.find("visible error"), std::string::npos);
}

TEST_F(LoggerTest, Log_ExceedingSize_RotatesFiles) {
    auto& logger = util::Logger::instance();
    ASSERT_TRUE(logger.initialize(log_dir, "diskinfo-test", util::LogLevel::DEBUG,
                                  util::LogRotationPolicy{.max_file_size_bytes = 200,
                                                          .max_files = 2}));

    for (int i = 0; i < 20; ++i) {
        LOG_INFO("Rotation", std::format("record number {}", i));
    }

    EXPECT_TRUE(fs::exists(log_dir / "diskinfo-test.log"));
    EXPECT_TRUE(fs::exists(log_dir / "diskinfo-test.1.log"));
    EXPECT_TRUE(fs::exists(log_dir / "diskinfo-test.2.log"));
    EXPECT_FALSE(fs::exists(log_dir / "diskinfo-test.3.log"));
    EXPECT_LE(fs::file_size(log_dir / "diskinfo-test.log"), 200u);
}

TEST_F(LoggerTest, Shutdown_StopsWriting) {
    auto& logger = util::Logger::instance();
    ASSERT_TRUE(logger.initialize(log_dir, "diskinfo-test"));
    logger.shutdown();

    EXPECT_FALSE(logger.is_initialized());
    EXPECT_TRUE(logger.get_log_file_path().empty());
    LOG_ERROR("Test", "after shutdown");
    EXPECT_EQ(ReadFile(log_dir / "diskinfo-test.log").find("after shutdown"), std::string::npos);
}

TEST(LogLevelTest, ParseLogLevel_AcceptsNamesCaseInsensitive) {
    EXPECT_EQ(util::parse_log_level("DEBUG"), util::LogLevel::DEBUG);
    EXPECT_EQ(util::parse_log_level("info"), util::LogLevel::INFO);
    EXPECT_EQ(util::parse_log_level("Warn"), util::LogLevel::WARNING);
    EXPECT_EQ(util::parse_log_level("warning"), util::LogLevel::WARNING);
    EXPECT_EQ(util::parse_log_level("error"), util::LogLevel::ERROR);
    EXPECT_EQ(util::parse_log_level("verbose"), std::nullopt);
}
