#pragma once

#include "access_manager.hpp"
#include "cors.hpp"
#include "exception_mapper.hpp"
#include "http_server.hpp"
#include "json_mapper.hpp"
#include "openapi.hpp"
#include "route_table.hpp"
#include "server_config.hpp"
#include "web_config.hpp"
#include "web_trace_extra_builder.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace weblib {

// Everything a WebApp is built from besides the setup callback
struct WebAppOptions {
  std::optional<CorsConfig> cors;
  bool openApi = true;
  OpenApiInfo openApiInfo;
  OpenApiOptions openApiOptions;
  std::shared_ptr<WebTraceExtraBuilder> traceExtraBuilder;
  std::shared_ptr<AccessManager> accessManager;
  ServerConfig serverConfig;
};

/**
 * One configured application: routes, hooks and exception handlers plus the
 * HTTP server it is served by. Requests pass through CORS, before hooks,
 * the access manager, the route handler, exception mapping and after hooks
 * in that order. After hooks run even when an earlier stage threw.
 */
class WebApp {
public:
  static constexpr const char *SESSION_COOKIE = "ktlibSessionId";

  WebApp(WebAppOptions options, const WebSetup &setup);
  ~WebApp();

  WebApp(const WebApp &) = delete;
  WebApp &operator=(const WebApp &) = delete;

  // Runs the whole pipeline for one request without any network involved
  HttpResponse handle(const HttpRequest &request,
                      const std::string &remoteAddress = "");

  // port overrides the configured port when given; 0 binds an ephemeral one
  void start(std::optional<unsigned short> port = std::nullopt);
  void stop();
  bool isRunning() const;
  unsigned short port() const;

  const RouteTable &routes() const { return routes_; }
  const ExceptionMapper &exceptionMapper() const { return exceptions_; }
  const JsonMapper &jsonMapper() const { return jsonMapper_; }
  const ServerConfig &serverConfig() const { return serverConfig_; }
  const std::optional<CorsConfig> &cors() const { return cors_; }
  bool openApiEnabled() const { return openApiEnabled_; }

private:
  JsonMapper jsonMapper_;
  RouteTable routes_;
  ExceptionMapper exceptions_;
  std::optional<CorsConfig> cors_;
  std::shared_ptr<AccessManager> accessManager_;
  std::shared_ptr<WebTraceExtraBuilder> traceExtraBuilder_;
  ServerConfig serverConfig_;
  std::vector<Hook> beforeHooks_;
  std::vector<Hook> afterHooks_;
  bool openApiEnabled_ = false;
  std::unique_ptr<HttpServer> server_;

  void openSession(Context &ctx);
  void closeTrace(Context &ctx);
  void route(Context &ctx);
  void mapException(std::exception_ptr error, Context &ctx);
};

} // namespace weblib
