#pragma once

#include "context.hpp"
#include "transparent_string_hash.hpp"
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace weblib {

using Handler = std::function<void(Context &)>;
using RoleSet = std::set<std::string>;

// Documentation attached to a route and published in the OpenAPI document
struct RouteDoc {
  std::string summary;
  std::string description;
  std::string operationId;
  std::vector<std::string> tags;
  bool deprecated = false;
  bool ignore = false; // excluded from the OpenAPI document

  bool empty() const {
    return summary.empty() && description.empty() && operationId.empty() &&
           tags.empty() && !deprecated;
  }
};

struct RouteSegment {
  enum class Kind { LITERAL, PARAMETER, GREEDY_PARAMETER, WILDCARD };

  Kind kind;
  std::string text; // literal text or parameter name
};

struct Route {
  http::verb method;
  std::string pattern;
  std::vector<RouteSegment> segments;
  Handler handler;
  RouteDoc doc;
  RoleSet roles;
};

struct RouteMatch {
  const Route *route = nullptr;
  StringMap pathParams;
};

/**
 * Linear table of routes. Patterns are '/'-separated; a segment is a literal,
 * "{name}" (one segment), "<name>" (one segment, or the rest of the path when
 * it is the last segment) or a trailing "*". When several routes match, the
 * one with literal segments earliest wins; ties go to registration order.
 * Trailing slashes are ignored. HEAD requests fall back to GET routes.
 *
 * match() takes the raw, still percent-encoded request path. Segments are
 * split first and decoded afterwards, so "%2F" stays inside one parameter.
 */
class RouteTable {
public:
  void add(http::verb method, const std::string &pattern, Handler handler,
           RouteDoc doc = {}, RoleSet roles = {});

  std::optional<RouteMatch> match(http::verb method,
                                  std::string_view path) const;

  const std::vector<Route> &routes() const { return routes_; }
  size_t size() const { return routes_.size(); }
  bool empty() const { return routes_.empty(); }

  static std::string normalizePath(std::string_view path);
  static std::vector<RouteSegment> parsePattern(std::string_view pattern);

private:
  std::vector<Route> routes_;

  std::optional<RouteMatch> matchMethod(http::verb method,
                                        std::string_view path) const;
  static bool matchSegments(const Route &route,
                            const std::vector<std::string_view> &parts,
                            StringMap &params);
};

} // namespace weblib
