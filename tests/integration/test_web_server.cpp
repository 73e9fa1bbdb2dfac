#include "config_manager.hpp"
#include "error_reporter.hpp"
#include "logger.hpp"
#include "web_server.hpp"
#include <cstdlib>
#include <type_traits>
#include <gtest/gtest.h>

namespace itest {

class SecondRouter : public weblib::Router {
public:
  void route(weblib::RouteBuilder &routes) override {
    routes.get("/2", [](weblib::Context &ctx) { ctx.result("From2"); });
  }
};

class NestedRouter : public weblib::Router {
public:
  void route(weblib::RouteBuilder &routes) override {
    routes.path("/admin", [&] {
      routes.del(
          "/notes/{id}",
          [](weblib::Context &ctx) {
            ctx.result("deleted " + ctx.pathParam("id"));
          },
          {}, {"admin"});
    });
  }
};

class OutsideRouter : public weblib::Router {
public:
  void route(weblib::RouteBuilder &routes) override {
    routes.get("/outside", [](weblib::Context &ctx) { ctx.result("no"); });
  }
};

} // namespace itest

WEBLIB_REGISTER_ROUTER(itest::SecondRouter, "itest.web")
WEBLIB_REGISTER_ROUTER(itest::NestedRouter, "itest.web.admin")
WEBLIB_REGISTER_ROUTER(itest::OutsideRouter, "itest.other")

using namespace weblib;

class WebServerTest : public ::testing::Test {
protected:
  void SetUp() override {
    Logger::getInstance().setLogLevel(LogLevel::FATAL);
    ::unsetenv("APP_ENV");
    ASSERT_TRUE(ConfigManager::getInstance().loadFromString(R"({
      "environment": "test",
      "application": {"name": "itest", "version": "9.9.9"},
      "web": {
        "corsOrigins": "https://app.example.com",
        "accessManager": "bearer",
        "bearerTokens": {"secret": "admin"}
      }
    })"));
  }

  void TearDown() override {
    ErrorReporting::setReporter(nullptr);
    ConfigManager::getInstance().clear();
    Logger::getInstance().setLogLevel(LogLevel::INFO);
  }
};

namespace {

void addRoutes(WebConfig &config, WebServer &server) {
  config.routes([&server](RouteBuilder &routes) {
    routes.get("/1", [](Context &ctx) { ctx.result("From1"); });
    routes.get("/fail",
               [](Context &) { throw std::runtime_error("handler failed"); });
    routes.get("/missing",
               [](Context &) { throw NotFoundException("Note not found"); });
    routes.post("/echo", [](Context &ctx) {
      ctx.json(ctx.bodyFromJson<nlohmann::json>());
    });
    for (const auto &router : server.routers()) {
      router->route(routes);
    }
  });
}

} // namespace

TEST_F(WebServerTest, ReadsWebConfiguration) {
  WebServer server(nullptr, "itest.web");

  const auto &options = server.options();
  EXPECT_TRUE(options.openApi);
  EXPECT_EQ(options.openApiInfo.title, "itest");
  EXPECT_EQ(options.openApiInfo.version, "9.9.9");
  ASSERT_TRUE(options.cors.has_value());
  EXPECT_TRUE(options.cors->isAllowed("https://app.example.com"));
  EXPECT_NE(options.accessManager, nullptr);
  EXPECT_EQ(options.serverConfig.port, 8080);
  EXPECT_EQ(server.port(), 8080);
}

TEST_F(WebServerTest, ConfigurationComesFromProcessSettings) {
  static_assert(std::is_constructible_v<WebServer, WebSetup, std::string>);
  static_assert(!std::is_constructible_v<WebServer, WebSetup, std::string,
                                         const ConfigManager &>);

  ConfigManager::getInstance().setValue("application.name", "renamed");
  EXPECT_EQ(WebServer(nullptr, "itest.web").options().openApiInfo.title,
            "renamed");
}

TEST_F(WebServerTest, OpenApiIsOffInProductionUnlessAllowed) {
  auto &config = ConfigManager::getInstance();
  config.setValue("environment", "prod");
  EXPECT_FALSE(WebServer(nullptr, "itest.web").options().openApi);

  config.setValue("web.allowOpenApiInProd", "true");
  EXPECT_TRUE(WebServer(nullptr, "itest.web").options().openApi);

  config.setValue("web.openApi", "false");
  EXPECT_FALSE(WebServer(nullptr, "itest.web").options().openApi);
}

TEST_F(WebServerTest, DiscoversRoutersOnceBelowPackage) {
  WebServer server(nullptr, "itest.web");
  const auto &first = server.routers();
  const auto &second = server.routers();
  EXPECT_EQ(&first, &second);
  EXPECT_EQ(first.size(), 2u);
}

TEST_F(WebServerTest, ServesSetupAndDiscoveredRoutes) {
  WebServer server([&server](WebConfig &config) { addRoutes(config, server); },
                   "itest.web");

  server.test([](WebApp &app, HttpTestClient &client) {
    EXPECT_TRUE(app.isRunning());
    EXPECT_NE(client.port(), 0);

    auto first = client.get("/1");
    EXPECT_EQ(first.status, 200);
    EXPECT_EQ(first.body, "From1");

    auto second = client.get("/2");
    EXPECT_EQ(second.status, 200);
    EXPECT_EQ(second.body, "From2");

    auto outside = client.get("/outside");
    EXPECT_EQ(outside.status, 404);
    EXPECT_EQ(outside.body, "Endpoint GET /outside not found");
  });
}

TEST_F(WebServerTest, IssuesSessionCookieOverHttp) {
  WebServer server([&server](WebConfig &config) { addRoutes(config, server); },
                   "itest.web");

  server.test([](WebApp &, HttpTestClient &client) {
    auto response = client.get("/1");
    ASSERT_EQ(response.setCookieHeaders.size(), 1u);
    auto session = response.cookies.find("ktlibSessionId");
    ASSERT_NE(session, response.cookies.end());
    EXPECT_TRUE(parseUuid(session->second).has_value());
    EXPECT_NE(response.setCookieHeaders[0].find("HttpOnly"),
              std::string::npos);
    EXPECT_NE(response.setCookieHeaders[0].find("Secure"), std::string::npos);

    auto again = client.get(
        "/1", {{"Cookie", "ktlibSessionId=" + session->second}});
    EXPECT_TRUE(again.setCookieHeaders.empty());
  });
}

TEST_F(WebServerTest, MapsExceptionsOverHttp) {
  WebServer server([&server](WebConfig &config) { addRoutes(config, server); },
                   "itest.web");

  server.test([](WebApp &, HttpTestClient &client) {
    EXPECT_EQ(client.get("/fail").status, 500);
    EXPECT_EQ(client.get("/missing").status, 404);

    auto malformed = client.post("/echo", "{");
    EXPECT_EQ(malformed.status, 400);
    EXPECT_EQ(malformed.json()[0]["field"], "body");

    auto echoed = client.post("/echo", R"({"note_title":"x"})");
    EXPECT_EQ(echoed.status, 200);
    EXPECT_EQ(echoed.json()["noteTitle"], "x");
  });
}

TEST_F(WebServerTest, EnforcesRolesFromConfiguredAccessManager) {
  WebServer server([&server](WebConfig &config) { addRoutes(config, server); },
                   "itest.web");

  server.test([](WebApp &, HttpTestClient &client) {
    EXPECT_EQ(client.del("/admin/notes/5").status, 403);

    auto allowed =
        client.del("/admin/notes/5", {{"Authorization", "Bearer secret"}});
    EXPECT_EQ(allowed.status, 200);
    EXPECT_EQ(allowed.body, "deleted 5");
  });
}

TEST_F(WebServerTest, AnswersCorsPreflight) {
  WebServer server([&server](WebConfig &config) { addRoutes(config, server); },
                   "itest.web");

  server.test([](WebApp &, HttpTestClient &client) {
    auto preflight =
        client.options("/1", {{"Origin", "https://app.example.com"},
                              {"Access-Control-Request-Method", "GET"}});
    EXPECT_EQ(preflight.status, 200);
    EXPECT_EQ(preflight.header("Access-Control-Allow-Origin").value_or(""),
              "https://app.example.com");

    auto simple = client.get("/1", {{"Origin", "https://app.example.com"}});
    EXPECT_EQ(simple.header("Access-Control-Allow-Origin").value_or(""),
              "https://app.example.com");
  });
}

TEST_F(WebServerTest, PublishesOpenApiDocument) {
  WebServer server([&server](WebConfig &config) { addRoutes(config, server); },
                   "itest.web");

  server.test([](WebApp &, HttpTestClient &client) {
    auto document = client.get("/openapi");
    EXPECT_EQ(document.status, 200);
    auto json = document.json();
    EXPECT_EQ(json["info"]["title"], "itest");
    EXPECT_TRUE(json["paths"].contains("/admin/notes/{id}"));
    EXPECT_TRUE(json["paths"]["/admin/notes/{id}"]["delete"].contains(
        "security"));

    auto ui = client.get("/");
    EXPECT_EQ(ui.status, 200);
    EXPECT_NE(ui.header("Content-Type").value_or("").find("text/html"),
              std::string::npos);
  });
}

TEST_F(WebServerTest, StopsApplicationWhenTestCaseThrows) {
  WebServer server(nullptr, "itest.web");
  WebApp *served = nullptr;

  EXPECT_THROW(server.test([&served](WebApp &app, HttpTestClient &) {
    served = &app;
    throw std::runtime_error("test failed");
  }),
               std::runtime_error);
  EXPECT_NE(served, nullptr);
  EXPECT_FALSE(server.isRunning());
}

TEST_F(WebServerTest, StartsOnConfiguredPort) {
  ConfigManager::getInstance().setValue("web.serverPort", "0");
  WebServer server([&server](WebConfig &config) { addRoutes(config, server); },
                   "itest.web");

  server.start();
  ASSERT_TRUE(server.isRunning());
  EXPECT_NE(server.port(), 0);

  HttpTestClient client("127.0.0.1", server.port());
  EXPECT_EQ(client.get("/2").body, "From2");

  server.stop();
  EXPECT_FALSE(server.isRunning());
}

TEST_F(WebServerTest, RejectsBodiesOverConfiguredLimit) {
  ConfigManager::getInstance().setValue("web.maxRequestBodySize", "16");
  WebServer server([&server](WebConfig &config) { addRoutes(config, server); },
                   "itest.web");
  EXPECT_EQ(server.options().serverConfig.maxRequestBodySize, 16u);

  server.test([](WebApp &, HttpTestClient &client) {
    auto small = client.post("/echo", R"({"a":1})");
    EXPECT_EQ(small.status, 200);

    auto large = client.post("/echo", R"({"note_title":"far too long"})");
    EXPECT_EQ(large.status, 413);
    EXPECT_EQ(large.body, "Request body too large");
    EXPECT_EQ(large.header("Connection").value_or(""), "close");
  });
}
