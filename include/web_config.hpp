#pragma once

#include "access_manager.hpp"
#include "context.hpp"
#include "cors.hpp"
#include "exception_mapper.hpp"
#include "json_mapper.hpp"
#include "route_builder.hpp"
#include "route_table.hpp"
#include "server_config.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace weblib {

using Hook = std::function<void(Context &)>;

/**
 * Handed to the setup callback while a WebApp is being created. Everything
 * registered here applies to that application only.
 */
class WebConfig {
public:
  WebConfig(RouteTable &routes, ExceptionMapper &exceptions,
            JsonMapper &jsonMapper, ServerConfig &serverConfig,
            std::optional<CorsConfig> &cors,
            std::shared_ptr<AccessManager> &accessManager,
            std::vector<Hook> &beforeHooks, std::vector<Hook> &afterHooks)
      : routes_(routes), exceptions_(exceptions), jsonMapper_(jsonMapper),
        serverConfig_(serverConfig), cors_(cors),
        accessManager_(accessManager), beforeHooks_(beforeHooks),
        afterHooks_(afterHooks) {}

  WebConfig &routes(const std::function<void(RouteBuilder &)> &fn) {
    RouteBuilder builder(routes_);
    fn(builder);
    return *this;
  }

  // Replaces the default handler when ExceptionType is one of the mapped
  // defaults
  template <typename ExceptionType, typename Handler>
  WebConfig &exception(Handler &&handler) {
    exceptions_.registerHandler<ExceptionType>(std::forward<Handler>(handler));
    return *this;
  }

  WebConfig &before(Hook hook) {
    beforeHooks_.push_back(std::move(hook));
    return *this;
  }

  WebConfig &after(Hook hook) {
    afterHooks_.push_back(std::move(hook));
    return *this;
  }

  WebConfig &accessManager(std::shared_ptr<AccessManager> manager) {
    accessManager_ = std::move(manager);
    return *this;
  }

  JsonMapper &jsonMapper() { return jsonMapper_; }
  ServerConfig &serverConfig() { return serverConfig_; }
  WebConfig &enableCors(CorsConfig cors) {
    cors_ = std::move(cors);
    return *this;
  }

  const std::optional<CorsConfig> &cors() const { return cors_; }
  RouteTable &routeTable() { return routes_; }

private:
  RouteTable &routes_;
  ExceptionMapper &exceptions_;
  JsonMapper &jsonMapper_;
  ServerConfig &serverConfig_;
  std::optional<CorsConfig> &cors_;
  std::shared_ptr<AccessManager> &accessManager_;
  std::vector<Hook> &beforeHooks_;
  std::vector<Hook> &afterHooks_;
};

using WebSetup = std::function<void(WebConfig &)>;

} // namespace weblib
