#include "config_manager.hpp"
#include "error_reporter.hpp"
#include "logger.hpp"
#include "trace.hpp"
#include "web_exceptions.hpp"
#include <gtest/gtest.h>
#include <thread>

using namespace weblib;

namespace {

class ThrowingReporter : public ErrorReporter {
public:
  void report(const std::exception &) override {
    throw std::runtime_error("reporter down");
  }
};

class ContextCapturingReporter : public ErrorReporter {
public:
  void setContext(const RequestInfo &info) override { seen = info; }
  void report(const std::exception &) override {}

  RequestInfo seen;
};

} // namespace

class ErrorReporterTest : public ::testing::Test {
protected:
  void SetUp() override {
    Logger::getInstance().setLogLevel(LogLevel::FATAL);
    Logger::getInstance().enableConsoleOutput(false);
    ErrorReporting::clearContext();
    Trace::clear();
  }

  void TearDown() override {
    ErrorReporting::setReporter(nullptr);
    ErrorReporting::clearContext();
    ConfigManager::getInstance().clear();
    Trace::clear();
    Logger::getInstance().setLogLevel(LogLevel::INFO);
  }
};

TEST_F(ErrorReporterTest, NullReporterFallsBackToLogging) {
  ErrorReporting::setReporter(nullptr);
  EXPECT_NE(std::dynamic_pointer_cast<LoggingErrorReporter>(
                ErrorReporting::reporter()),
            nullptr);
}

TEST_F(ErrorReporterTest, RequestContextIsPerThreadAndForwarded) {
  auto capturing = std::make_shared<ContextCapturingReporter>();
  ErrorReporting::setReporter(capturing);

  ErrorReporting::setContext({"GET", "/notes?limit=2", "curl/8", "10.0.0.1"});
  EXPECT_EQ(ErrorReporting::context().method, "GET");
  EXPECT_EQ(capturing->seen.url, "/notes?limit=2");

  std::string otherThreadMethod = "unset";
  std::thread([&] { otherThreadMethod = ErrorReporting::context().method; })
      .join();
  EXPECT_TRUE(otherThreadMethod.empty());

  ErrorReporting::clearContext();
  EXPECT_TRUE(ErrorReporting::context().url.empty());
}

TEST_F(ErrorReporterTest, FailingReporterDoesNotPropagate) {
  ErrorReporting::setReporter(std::make_shared<ThrowingReporter>());
  EXPECT_NO_THROW(ErrorReporting::report(std::runtime_error("boom")));
}

TEST_F(ErrorReporterTest, WebhookRequiresUrl) {
  EXPECT_THROW(WebhookErrorReporter(""), SystemException);
}

TEST_F(ErrorReporterTest, WebhookPayloadDescribesErrorAndRequest) {
  ASSERT_TRUE(ConfigManager::getInstance().loadFromString(
      R"({"application": {"name": "notes", "version": "1.2.3"}})"));
  ErrorReporting::setContext({"POST", "/notes", "curl/8", "10.0.0.1"});
  auto session = newUuid4();
  Trace::sessionId(session);

  WebhookErrorReporter reporter("http://127.0.0.1:9/hook");
  auto payload =
      reporter.buildPayload(NotFoundException("Note not found", "note"));

  EXPECT_EQ(payload["message"], "Note not found");
  EXPECT_EQ(payload["type"], "weblib::NotFoundException");
  EXPECT_EQ(payload["application"], "notes");
  EXPECT_EQ(payload["version"], "1.2.3");
  EXPECT_EQ(payload["request"]["method"], "POST");
  EXPECT_EQ(payload["request"]["remoteAddress"], "10.0.0.1");
  EXPECT_EQ(payload["sessionId"], toString(session));
  EXPECT_TRUE(payload.contains("correlationId"));
}

TEST_F(ErrorReporterTest, PayloadOmitsRequestOutsideOfRequests) {
  WebhookErrorReporter reporter("http://127.0.0.1:9/hook");
  auto payload = reporter.buildPayload(std::runtime_error("offline"));
  EXPECT_FALSE(payload.contains("request"));
  EXPECT_FALSE(payload.contains("sessionId"));
  EXPECT_EQ(payload["type"], "std::runtime_error");
}

TEST_F(ErrorReporterTest, ReporterSelectedFromConfig) {
  auto &config = ConfigManager::getInstance();
  EXPECT_NE(std::dynamic_pointer_cast<LoggingErrorReporter>(
                ErrorReporting::fromConfig(config)),
            nullptr);

  ASSERT_TRUE(config.loadFromString(R"({"errorReporter": {
    "type": "webhook", "webhookUrl": "http://127.0.0.1:9/hook"
  }})"));
  auto webhook = std::dynamic_pointer_cast<WebhookErrorReporter>(
      ErrorReporting::fromConfig(config));
  ASSERT_NE(webhook, nullptr);
  EXPECT_EQ(webhook->url(), "http://127.0.0.1:9/hook");

  config.setValue("errorReporter.type", "pager");
  EXPECT_NE(std::dynamic_pointer_cast<LoggingErrorReporter>(
                ErrorReporting::fromConfig(config)),
            nullptr);
}
