#include "error_reporter.hpp"
#include "exception_mapper.hpp"
#include "logger.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <vector>

using namespace weblib;

namespace {

class RecordingReporter : public ErrorReporter {
public:
  void report(const std::exception &error) override {
    messages.emplace_back(error.what());
  }
  std::vector<std::string> messages;
};

class QuotaExceeded : public ValidationException {
public:
  QuotaExceeded() : ValidationException("quota", "exceeded") {}
};

} // namespace

class ExceptionMapperTest : public ::testing::Test {
protected:
  void SetUp() override {
    LogConfig config;
    config.level = LogLevel::FATAL;
    config.consoleOutput = false;
    Logger::getInstance().configure(config);

    reporter_ = std::make_shared<RecordingReporter>();
    ErrorReporting::setReporter(reporter_);
    request_ = HttpRequest{http::verb::get, "/notes", 11};
  }

  void TearDown() override { ErrorReporting::setReporter(nullptr); }

  int statusFor(const ExceptionMapper &mapper, std::exception_ptr error) {
    Context ctx(request_, jsonMapper_);
    EXPECT_TRUE(mapper.handle(error, ctx));
    return ctx.status();
  }

  std::shared_ptr<RecordingReporter> reporter_;
  HttpRequest request_;
  JsonMapper jsonMapper_;
};

TEST_F(ExceptionMapperTest, StatusTraitsMatchDefaults) {
  EXPECT_EQ(ExceptionHttpStatus<ValidationException>::value,
            http::status::bad_request);
  EXPECT_EQ(ExceptionHttpStatus<UnauthorizedException>::value,
            http::status::forbidden);
  EXPECT_EQ(ExceptionHttpStatus<NotFoundException>::value,
            http::status::not_found);
  EXPECT_EQ(ExceptionHttpStatus<std::exception>::value,
            http::status::internal_server_error);
  static_assert(is_default_exception<NotFoundException>);
  static_assert(!is_default_exception<std::runtime_error>);
}

TEST_F(ExceptionMapperTest, DefaultHandlersMapKnownExceptions) {
  ExceptionMapper mapper;
  registerDefaultHandlers(mapper);
  EXPECT_EQ(mapper.size(), 4u);

  EXPECT_EQ(statusFor(mapper, std::make_exception_ptr(
                                  ValidationException("text", "is required"))),
            400);
  EXPECT_EQ(statusFor(mapper, std::make_exception_ptr(UnauthorizedException())),
            403);
  EXPECT_EQ(statusFor(mapper, std::make_exception_ptr(NotFoundException())),
            404);
  EXPECT_TRUE(reporter_->messages.empty());

  EXPECT_EQ(statusFor(mapper, std::make_exception_ptr(
                                  std::runtime_error("database down"))),
            500);
  ASSERT_EQ(reporter_->messages.size(), 1u);
  EXPECT_EQ(reporter_->messages.front(), "database down");
}

TEST_F(ExceptionMapperTest, ValidationBodyListsErrors) {
  ExceptionMapper mapper;
  registerDefaultHandlers(mapper);

  Context ctx(request_, jsonMapper_);
  ctx.result("partial output");
  mapper.handle(std::make_exception_ptr(
                    ValidationException("text", "is required")),
                ctx);

  auto body = nlohmann::json::parse(ctx.resultString());
  ASSERT_TRUE(body.is_array());
  ASSERT_EQ(body.size(), 1u);
  EXPECT_EQ(body[0]["field"], "text");
  EXPECT_EQ(body[0]["message"], "is required");
}

TEST_F(ExceptionMapperTest, MappedStatusClearsEarlierBody) {
  ExceptionMapper mapper;
  registerDefaultHandlers(mapper);

  Context ctx(request_, jsonMapper_);
  ctx.result("half written");
  mapper.handle(std::make_exception_ptr(NotFoundException()), ctx);
  EXPECT_EQ(ctx.resultString(), "");
}

TEST_F(ExceptionMapperTest, NonStandardExceptionsAreGenericFailures) {
  ExceptionMapper mapper;
  registerDefaultHandlers(mapper);

  EXPECT_EQ(statusFor(mapper, std::make_exception_ptr(42)), 500);
  ASSERT_EQ(reporter_->messages.size(), 1u);
  EXPECT_EQ(reporter_->messages.front(), "Unknown non-standard exception");
}

TEST_F(ExceptionMapperTest, MostDerivedHandlerWinsRegardlessOfOrder) {
  ExceptionMapper mapper;
  std::vector<std::string> calls;
  mapper.registerHandler<std::exception>(
      [&calls](const std::exception &, Context &ctx) {
        calls.push_back("exception");
        ctx.status(500);
      });
  mapper.registerHandler<ValidationException>(
      [&calls](const ValidationException &, Context &ctx) {
        calls.push_back("validation");
        ctx.status(400);
      });
  mapper.registerHandler<QuotaExceeded>(
      [&calls](const QuotaExceeded &, Context &ctx) {
        calls.push_back("quota");
        ctx.status(429);
      });

  EXPECT_EQ(statusFor(mapper, std::make_exception_ptr(QuotaExceeded())), 429);
  EXPECT_EQ(statusFor(mapper, std::make_exception_ptr(
                                  ValidationException("a", "b"))),
            400);
  EXPECT_EQ(statusFor(mapper, std::make_exception_ptr(std::logic_error("x"))),
            500);
  EXPECT_EQ(calls,
            (std::vector<std::string>{"quota", "validation", "exception"}));

  auto order = mapper.dispatchOrder();
  ASSERT_EQ(order.size(), 3u);
  EXPECT_EQ(order[0], std::type_index(typeid(QuotaExceeded)));
  EXPECT_EQ(order[2], std::type_index(typeid(std::exception)));
}

TEST_F(ExceptionMapperTest, CustomHandlerSuppressesDefault) {
  ExceptionMapper mapper;
  mapper.registerHandler<NotFoundException>(
      [](const NotFoundException &e, Context &ctx) {
        ctx.status(410).result(e.what());
      });
  registerDefaultHandlers(mapper);

  EXPECT_EQ(mapper.size(), 4u);
  EXPECT_EQ(statusFor(mapper, std::make_exception_ptr(
                                  NotFoundException("gone"))),
            410);
}

TEST_F(ExceptionMapperTest, ReRegisteringReplacesHandler) {
  ExceptionMapper mapper;
  mapper.registerHandler<std::runtime_error>(
      [](const std::runtime_error &, Context &ctx) { ctx.status(501); });
  mapper.registerHandler<std::runtime_error>(
      [](const std::runtime_error &, Context &ctx) { ctx.status(502); });

  EXPECT_EQ(mapper.size(), 1u);
  EXPECT_EQ(statusFor(mapper, std::make_exception_ptr(
                                  std::runtime_error("x"))),
            502);
}

TEST_F(ExceptionMapperTest, UnhandledTypeReportsNoMatch) {
  ExceptionMapper mapper;
  mapper.registerHandler<NotFoundException>(
      [](const NotFoundException &, Context &ctx) { ctx.status(404); });

  Context ctx(request_, jsonMapper_);
  EXPECT_FALSE(mapper.handle(
      std::make_exception_ptr(std::runtime_error("other")), ctx));
  EXPECT_FALSE(mapper.handle(std::exception_ptr(), ctx));
}
