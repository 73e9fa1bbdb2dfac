#pragma once

#include "route_builder.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace weblib {

// A unit of route registration, discovered through RouterRegistry
class Router {
public:
  virtual ~Router() = default;
  virtual void route(RouteBuilder &routes) = 0;
};

using RouterFactory = std::function<std::unique_ptr<Router>()>;

/**
 * Static-initialization registry of Router types keyed by a dotted package
 * name. discover("app.web") returns a fresh instance of every router
 * registered under "app.web" or any package nested below it
 * ("app.web.users"), ordered by package then registration order.
 */
class RouterRegistry {
public:
  static RouterRegistry &getInstance();

  RouterRegistry(const RouterRegistry &) = delete;
  RouterRegistry &operator=(const RouterRegistry &) = delete;

  bool registerRouter(const std::string &package, const std::string &name,
                      RouterFactory factory);

  std::vector<std::unique_ptr<Router>>
  discover(const std::string &package) const;

  std::vector<std::string> registeredNames(const std::string &package) const;

  static bool inPackage(const std::string &candidate,
                        const std::string &package);

private:
  RouterRegistry() = default;

  struct Entry {
    std::string package;
    std::string name;
    RouterFactory factory;
  };

  std::vector<const Entry *> matching(const std::string &package) const;

  std::vector<Entry> entries_;
  mutable std::mutex mutex_;
};

} // namespace weblib

#define WEBLIB_ROUTER_CONCAT_IMPL(a, b) a##b
#define WEBLIB_ROUTER_CONCAT(a, b) WEBLIB_ROUTER_CONCAT_IMPL(a, b)

// Register RouterType under package at static-initialization time
#define WEBLIB_REGISTER_ROUTER(RouterType, package)                            \
  namespace {                                                                  \
  const bool WEBLIB_ROUTER_CONCAT(weblibRouterRegistered_, __LINE__) =         \
      weblib::RouterRegistry::getInstance().registerRouter(                    \
          package, #RouterType,                                                \
          []() -> std::unique_ptr<weblib::Router> {                            \
            return std::make_unique<RouterType>();                             \
          });                                                                  \
  }
