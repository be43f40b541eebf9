#include <gtest/gtest.h>
#include "../src/core/Logging.h"
#include <thread>
#include <vector>

namespace netscene {

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().set_level(LogLevel::Info);
    }
    void TearDown() override {
        Logger::instance().set_level(LogLevel::Info);
    }
};

TEST_F(LoggingTest, SingletonInstance) {
    EXPECT_EQ(&Logger::instance(), &Logger::instance());
}

TEST_F(LoggingTest, LevelHierarchy) {
    Logger& logger = Logger::instance();
    EXPECT_TRUE(logger.enabled(LogLevel::Error));
    EXPECT_TRUE(logger.enabled(LogLevel::Info));
    EXPECT_FALSE(logger.enabled(LogLevel::Debug));

    logger.set_level(LogLevel::Trace);
    EXPECT_TRUE(logger.enabled(LogLevel::Trace));

    logger.set_level(LogLevel::Error);
    EXPECT_FALSE(logger.enabled(LogLevel::Warn));
}

TEST_F(LoggingTest, CapturesToStderr) {
    Logger& logger = Logger::instance();
    ::testing::internal::CaptureStderr();
    logger.info("fetching stats");
    logger.debug("hidden");
    std::string out = ::testing::internal::GetCapturedStderr();
    EXPECT_EQ(out, "[INFO] fetching stats\n");
}

TEST_F(LoggingTest, ParseLogLevel) {
    LogLevel lvl = LogLevel::Info;
    EXPECT_TRUE(parse_log_level("debug", lvl));
    EXPECT_EQ(lvl, LogLevel::Debug);
    EXPECT_TRUE(parse_log_level("WARNING", lvl));
    EXPECT_EQ(lvl, LogLevel::Warn);
    EXPECT_TRUE(parse_log_level("Trace", lvl));
    EXPECT_EQ(lvl, LogLevel::Trace);
    EXPECT_FALSE(parse_log_level("verbose", lvl));
    EXPECT_EQ(lvl, LogLevel::Trace);
}

TEST_F(LoggingTest, ConcurrentLogging) {
    Logger& logger = Logger::instance();
    logger.set_level(LogLevel::Error);
    std::vector<std::thread> threads;
    for(int i = 0; i < 4; ++i){
        threads.emplace_back([&logger, i]{
            for(int j = 0; j < 50; ++j) logger.debug("thread " + std::to_string(i));
        });
    }
    for(auto& t : threads) t.join();
    SUCCEED();
}

}
