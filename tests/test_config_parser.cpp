#include "config/ConfigHelper.hpp"
#include "config/ConfigParser.hpp"
#include "config/JsonSessionStore.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>

namespace fs = std::filesystem;

class ConfigParserTest : public ::testing::Test {
protected:
    ConfigHelper& config = ConfigHelper::getInstance();

    void SetUp() override { config.resetToDefaults(); }
    void TearDown() override { config.resetToDefaults(); }
};

TEST_F(ConfigParserTest, DefaultsAreValid) {
    EXPECT_TRUE(config.validateAll());
    EXPECT_EQ(config.scanConfig.scanTimeoutMs, 10000);
    EXPECT_EQ(config.apiConfig.requestTimeoutMs, 10000);
    EXPECT_TRUE(config.sessionConfig.sessionFile.empty());
    EXPECT_EQ(config.loggerConfig.logLevel, Logger::Level::INFO);
    EXPECT_TRUE(config.loggerConfig.enableConsole);
    EXPECT_FALSE(config.loggerConfig.enableFileLogging);
}

TEST_F(ConfigParserTest, LoadsAllSections) {
    ASSERT_TRUE(ConfigParser::loadFromString(R"({
        "scan":    {"scanTimeoutMs": 4000},
        "api":     {"requestTimeoutMs": 2500},
        "session": {"sessionFile": "/tmp/leaflink_session.json"},
        "logger":  {"logLevel": "DEBUG", "enableConsole": false, "enableFileLogging": true, "logDirectory": "/tmp/logs/"}
    })"));

    EXPECT_EQ(config.scanConfig.scanTimeoutMs, 4000);
    EXPECT_EQ(config.apiConfig.requestTimeoutMs, 2500);
    EXPECT_EQ(config.resolveSessionFile(), "/tmp/leaflink_session.json");
    EXPECT_EQ(config.loggerConfig.logLevel, Logger::Level::DEBUG);
    EXPECT_FALSE(config.loggerConfig.enableConsole);
    EXPECT_TRUE(config.loggerConfig.enableFileLogging);
    EXPECT_EQ(config.loggerConfig.logDirectory, "/tmp/logs/");
}

TEST_F(ConfigParserTest, MistypedAndUnknownKeysKeepDefaults) {
    ASSERT_TRUE(ConfigParser::loadFromString(R"({
        "scan":   {"scanTimeoutMs": "fast", "workers": 200},
        "logger": {"logLevel": 42},
        "extra":  true
    })"));

    EXPECT_EQ(config.scanConfig.scanTimeoutMs, 10000);
    EXPECT_EQ(config.loggerConfig.logLevel, Logger::Level::INFO);
}

TEST_F(ConfigParserTest, NumericLogLevel) {
    ASSERT_TRUE(ConfigParser::loadFromString(R"({"logger": {"logLevel": 2}})"));
    EXPECT_EQ(config.loggerConfig.logLevel, Logger::Level::WARN);
}

TEST_F(ConfigParserTest, RejectsMalformedJson) {
    EXPECT_FALSE(ConfigParser::loadFromString("{ scan: "));
    EXPECT_FALSE(ConfigParser::loadFromString("[1, 2]"));
    EXPECT_FALSE(ConfigParser::loadFromFile("/nonexistent/leaflink.json"));
}

TEST_F(ConfigParserTest, SaveAndReloadFile) {
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path file = fs::temp_directory_path() / ("leaflink_config_test_" + std::to_string(stamp) + ".json");

    config.scanConfig.scanTimeoutMs = 1234;
    config.loggerConfig.logLevel = Logger::Level::ERROR;
    ASSERT_TRUE(ConfigParser::saveToFile(file.string()));

    config.resetToDefaults();
    ASSERT_TRUE(ConfigParser::loadFromFile(file.string()));
    EXPECT_EQ(config.scanConfig.scanTimeoutMs, 1234);
    EXPECT_EQ(config.loggerConfig.logLevel, Logger::Level::ERROR);

    std::error_code ec;
    fs::remove(file, ec);
}

TEST_F(ConfigParserTest, ValidationRejectsNonPositiveTimeouts) {
    config.scanConfig.scanTimeoutMs = 0;
    EXPECT_FALSE(config.validateAll());

    config.resetToDefaults();
    config.apiConfig.requestTimeoutMs = -5;
    EXPECT_FALSE(config.validateAll());

    config.resetToDefaults();
    config.loggerConfig.enableFileLogging = true;
    config.loggerConfig.logDirectory = "";
    EXPECT_FALSE(config.validateAll());
}

TEST_F(ConfigParserTest, EmptySessionFileResolvesToDefault) {
    EXPECT_EQ(config.resolveSessionFile(), JsonSessionStore::defaultPath());
}

TEST(LoggerLevelTest, ParseAndName) {
    EXPECT_EQ(Logger::parseLevel("warn"), Logger::Level::WARN);
    EXPECT_EQ(Logger::parseLevel("Error"), Logger::Level::ERROR);
    EXPECT_EQ(Logger::parseLevel("verbose", Logger::Level::OFF), Logger::Level::OFF);
    EXPECT_EQ(Logger::levelName(Logger::Level::DEBUG), "DEBUG");
}

TEST(LoggerLevelTest, InitializeIsIdempotent) {
    Logger& logger = Logger::getInstance();
    EXPECT_TRUE(logger.initialize(Logger::Level::WARN, false, ""));
    EXPECT_TRUE(logger.isInitialized());
    EXPECT_TRUE(logger.initialize(Logger::Level::DEBUG, false, ""));
    EXPECT_TRUE(logger.isInitialized());
}
