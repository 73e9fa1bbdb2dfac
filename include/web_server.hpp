#pragma once

#include "router.hpp"
#include "test_client.hpp"
#include "web_app.hpp"
#include "web_config.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace weblib {

class ConfigManager;

/**
 * Configuration-driven entry point. Reads the web.* keys from ConfigManager
 * when constructed and builds the WebApp on first use of app(). Declare one
 * per process:
 *
 *   weblib::WebServer server([&server](weblib::WebConfig &config) {
 *     config.routes([&server](weblib::RouteBuilder &routes) {
 *       routes.get("/1", [](weblib::Context &ctx) { ctx.result("From1"); });
 *       for (auto &router : server.routers()) {
 *         router->route(routes);
 *       }
 *     });
 *   }, "app.web");
 *   server.start();
 */
class WebServer {
public:
  using TestCase = std::function<void(WebApp &, HttpTestClient &)>;

  explicit WebServer(WebSetup setup = nullptr, std::string package = "");
  ~WebServer();

  WebServer(const WebServer &) = delete;
  WebServer &operator=(const WebServer &) = delete;

  WebApp &app();

  // Serves app() on web.serverPort; returns once the server is listening
  void start();
  void stop();
  bool isRunning() const;
  unsigned short port() const;

  // Routers registered under the server's package or below it, discovered
  // once and owned by the server so their routes may refer to them
  const std::vector<std::unique_ptr<Router>> &routers();

  /**
   * Runs testCase against a freshly created application served on an
   * ephemeral port. The application is stopped even when testCase throws.
   */
  void test(const TestCase &testCase);

  const std::string &package() const { return package_; }
  const WebAppOptions &options() const { return options_; }

private:
  WebSetup setup_;
  std::string package_;
  WebAppOptions options_;
  std::optional<std::vector<std::unique_ptr<Router>>> routers_;
  std::unique_ptr<WebApp> currentApp_;

  std::unique_ptr<WebApp> create() const;
  static WebAppOptions readOptions(const ConfigManager &config);
};

} // namespace weblib
