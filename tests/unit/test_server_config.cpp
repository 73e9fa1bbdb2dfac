#include "server_config.hpp"
#include <gtest/gtest.h>

using namespace weblib;

class ServerConfigTest : public ::testing::Test {
protected:
  void SetUp() override {
    Logger::getInstance().setLogLevel(LogLevel::FATAL);
    ConfigManager::getInstance().clear();
  }

  void TearDown() override {
    ConfigManager::getInstance().clear();
    Logger::getInstance().setLogLevel(LogLevel::INFO);
  }
};

TEST_F(ServerConfigTest, DefaultsAreValid) {
  ServerConfig config;
  auto result = config.validate();
  EXPECT_TRUE(result.isValid);
  EXPECT_TRUE(result.warnings.empty());
  EXPECT_EQ(config.port, 8080);
}

TEST_F(ServerConfigTest, ValidationReportsEachProblem) {
  ServerConfig config;
  config.host = "";
  config.threads = 0;
  config.requestTimeout = std::chrono::seconds{0};
  config.maxRequestBodySize = 0;

  auto result = config.validate();
  EXPECT_FALSE(result.isValid);
  EXPECT_EQ(result.errors.size(), 4u);

  config.applyDefaults();
  EXPECT_EQ(config, ServerConfig{});
}

TEST_F(ServerConfigTest, LargeSettingsOnlyWarn) {
  ServerConfig config;
  config.threads = 512;
  config.maxRequestBodySize = 512u * 1024 * 1024;

  auto result = config.validate();
  EXPECT_TRUE(result.isValid);
  EXPECT_EQ(result.warnings.size(), 2u);
}

TEST_F(ServerConfigTest, ReadsWebKeys) {
  ASSERT_TRUE(ConfigManager::getInstance().loadFromString(R"({"web": {
    "host": "127.0.0.1",
    "serverPort": 9090,
    "threads": 2,
    "requestTimeoutSeconds": 5,
    "maxRequestBodySize": 1024
  }})"));

  auto config = ServerConfig::fromConfig(ConfigManager::getInstance());
  EXPECT_EQ(config.host, "127.0.0.1");
  EXPECT_EQ(config.port, 9090);
  EXPECT_EQ(config.threads, 2u);
  EXPECT_EQ(config.requestTimeout, std::chrono::seconds{5});
  EXPECT_EQ(config.maxRequestBodySize, 1024u);
}

TEST_F(ServerConfigTest, OutOfRangeValuesFallBackToDefaults) {
  ASSERT_TRUE(ConfigManager::getInstance().loadFromString(R"({"web": {
    "serverPort": 70000,
    "threads": -1,
    "requestTimeoutSeconds": 0
  }})"));

  auto config = ServerConfig::fromConfig(ConfigManager::getInstance());
  EXPECT_EQ(config.port, ServerConfig::DEFAULT_PORT);
  EXPECT_EQ(config.threads, 4u);
  EXPECT_EQ(config.requestTimeout, std::chrono::seconds{30});
}
