#pragma once

#include "route_table.hpp"
#include <functional>
#include <string>
#include <vector>

namespace weblib {

/**
 * Registers routes into a RouteTable relative to the current path prefix.
 *
 *   routes.path("/users", [&] {
 *     routes.get("/{id}", showUser);
 *     routes.post("", createUser, {}, {"admin"});
 *   });
 */
class RouteBuilder {
public:
  explicit RouteBuilder(RouteTable &table) : table_(table) {}

  RouteBuilder &get(const std::string &path, Handler handler,
                    RouteDoc doc = {}, RoleSet roles = {});
  RouteBuilder &post(const std::string &path, Handler handler,
                     RouteDoc doc = {}, RoleSet roles = {});
  RouteBuilder &put(const std::string &path, Handler handler,
                    RouteDoc doc = {}, RoleSet roles = {});
  RouteBuilder &patch(const std::string &path, Handler handler,
                      RouteDoc doc = {}, RoleSet roles = {});
  RouteBuilder &del(const std::string &path, Handler handler,
                    RouteDoc doc = {}, RoleSet roles = {});
  RouteBuilder &head(const std::string &path, Handler handler,
                     RouteDoc doc = {}, RoleSet roles = {});
  RouteBuilder &options(const std::string &path, Handler handler,
                        RouteDoc doc = {}, RoleSet roles = {});

  RouteBuilder &add(http::verb method, const std::string &path,
                    Handler handler, RouteDoc doc = {}, RoleSet roles = {});

  // Routes added inside group are prefixed with prefix
  RouteBuilder &path(const std::string &prefix,
                     const std::function<void()> &group);

  std::string currentPrefix() const;
  RouteTable &table() { return table_; }

private:
  RouteTable &table_;
  std::vector<std::string> prefixes_;
};

} // namespace weblib
