#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

#include "tuiobridge/Logging.h"

using namespace tuiobridge;

class LoggingTest : public ::testing::Test {
   protected:
    void TearDown() override {
        Logging::setCallback(nullptr);
        Logging::setDebug(false);
    }

    std::vector<std::pair<LogLevel, std::string>> logged;
};

TEST_F(LoggingTest, DebugToggleSetsLevel) {
    EXPECT_EQ(Logging::getLevel(), LogLevel::Info);

    EXPECT_FALSE(Logging::setDebug(true));
    EXPECT_EQ(Logging::getLevel(), LogLevel::Debug);
    EXPECT_TRUE(Logging::isEnabled(LogLevel::Debug));

    EXPECT_TRUE(Logging::setDebug(false));
    EXPECT_EQ(Logging::getLevel(), LogLevel::Info);
    EXPECT_FALSE(Logging::isEnabled(LogLevel::Debug));
}

TEST_F(LoggingTest, LevelFiltersCallback) {
    Logging::setCallback([this](LogLevel level, const std::string& message) {
        logged.emplace_back(level, message);
    });
    Logging::setLevel(LogLevel::Warning);

    logInfo("hidden");
    logDebug("hidden");
    logWarning("shown");
    logError("also shown");

    ASSERT_EQ(logged.size(), 2u);
    EXPECT_EQ(logged[0].first, LogLevel::Warning);
    EXPECT_EQ(logged[0].second, "shown");
    EXPECT_EQ(logged[1].first, LogLevel::Error);
}

TEST_F(LoggingTest, CallbackMayLog) {
    bool nested = false;
    Logging::setCallback([this, &nested](LogLevel level, const std::string& message) {
        logged.emplace_back(level, message);
        if (!nested) {
            nested = true;
            logInfo("from callback");
        }
    });

    logInfo("outer");

    ASSERT_EQ(logged.size(), 2u);
    EXPECT_EQ(logged[0].second, "outer");
    EXPECT_EQ(logged[1].second, "from callback");
}

TEST(Logging, LevelNames) {
    EXPECT_STREQ(Logging::levelName(LogLevel::Error), "ERROR");
    EXPECT_STREQ(Logging::levelName(LogLevel::Debug), "DEBUG");
}
