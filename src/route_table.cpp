#include "route_table.hpp"
#include "string_utils.hpp"
#include <algorithm>
#include <stdexcept>

namespace weblib {

namespace {

int segmentRank(RouteSegment::Kind kind) {
  switch (kind) {
  case RouteSegment::Kind::LITERAL:
    return 3;
  case RouteSegment::Kind::PARAMETER:
    return 2;
  case RouteSegment::Kind::GREEDY_PARAMETER:
    return 1;
  case RouteSegment::Kind::WILDCARD:
    return 0;
  }
  return 0;
}

// True when a is strictly more specific than b
bool moreSpecific(const Route &a, const Route &b) {
  size_t common = std::min(a.segments.size(), b.segments.size());
  for (size_t i = 0; i < common; ++i) {
    int rankA = segmentRank(a.segments[i].kind);
    int rankB = segmentRank(b.segments[i].kind);
    if (rankA != rankB) {
      return rankA > rankB;
    }
  }
  return a.segments.size() > b.segments.size();
}

std::vector<std::string_view> pathParts(std::string_view normalized) {
  if (normalized == "/") {
    return {};
  }
  return string_utils::split_view(normalized.substr(1), '/');
}

} // namespace

std::string RouteTable::normalizePath(std::string_view path) {
  std::string normalized;
  normalized.reserve(path.size() + 1);
  normalized.push_back('/');

  for (char c : path) {
    if (c == '/' && normalized.back() == '/') {
      continue;
    }
    normalized.push_back(c);
  }

  if (normalized.size() > 1 && normalized.back() == '/') {
    normalized.pop_back();
  }
  return normalized;
}

std::vector<RouteSegment> RouteTable::parsePattern(std::string_view pattern) {
  auto normalized = normalizePath(pattern);
  auto parts = pathParts(normalized);

  std::vector<RouteSegment> segments;
  segments.reserve(parts.size());

  for (size_t i = 0; i < parts.size(); ++i) {
    auto part = parts[i];
    bool last = i + 1 == parts.size();

    if (part == "*") {
      if (!last) {
        throw std::invalid_argument("Wildcard must be the last segment: " +
                                    std::string(pattern));
      }
      segments.push_back({RouteSegment::Kind::WILDCARD, "*"});
    } else if (part.size() >= 2 &&
               ((part.front() == '{' && part.back() == '}') ||
                (part.front() == '<' && part.back() == '>'))) {
      auto name = part.substr(1, part.size() - 2);
      if (name.empty()) {
        throw std::invalid_argument("Empty path parameter name in: " +
                                    std::string(pattern));
      }
      auto kind = part.front() == '<' && last
                      ? RouteSegment::Kind::GREEDY_PARAMETER
                      : RouteSegment::Kind::PARAMETER;
      segments.push_back({kind, std::string(name)});
    } else {
      segments.push_back({RouteSegment::Kind::LITERAL, std::string(part)});
    }
  }

  return segments;
}

void RouteTable::add(http::verb method, const std::string &pattern,
                     Handler handler, RouteDoc doc, RoleSet roles) {
  if (!handler) {
    throw std::invalid_argument("Route handler must not be empty: " + pattern);
  }

  Route route;
  route.method = method;
  route.pattern = normalizePath(pattern);
  route.segments = parsePattern(pattern);
  route.handler = std::move(handler);
  route.doc = std::move(doc);
  route.roles = std::move(roles);
  routes_.push_back(std::move(route));
}

bool RouteTable::matchSegments(const Route &route,
                               const std::vector<std::string_view> &parts,
                               StringMap &params) {
  size_t i = 0;
  for (const auto &segment : route.segments) {
    switch (segment.kind) {
    case RouteSegment::Kind::LITERAL:
      if (i >= parts.size() ||
          string_utils::url_decode(parts[i], false) != segment.text) {
        return false;
      }
      ++i;
      break;
    case RouteSegment::Kind::PARAMETER:
      if (i >= parts.size() || parts[i].empty()) {
        return false;
      }
      params[segment.text] = string_utils::url_decode(parts[i], false);
      ++i;
      break;
    case RouteSegment::Kind::GREEDY_PARAMETER: {
      if (i >= parts.size()) {
        return false;
      }
      std::vector<std::string> rest;
      for (; i < parts.size(); ++i) {
        rest.push_back(string_utils::url_decode(parts[i], false));
      }
      params[segment.text] = string_utils::join(rest, "/");
      return true;
    }
    case RouteSegment::Kind::WILDCARD:
      return true;
    }
  }
  return i == parts.size();
}

std::optional<RouteMatch> RouteTable::matchMethod(http::verb method,
                                                  std::string_view path) const {
  auto normalized = normalizePath(path);
  auto parts = pathParts(normalized);

  std::optional<RouteMatch> best;
  for (const auto &route : routes_) {
    if (route.method != method) {
      continue;
    }
    StringMap params;
    if (!matchSegments(route, parts, params)) {
      continue;
    }
    if (!best || moreSpecific(route, *best->route)) {
      best = RouteMatch{&route, std::move(params)};
    }
  }
  return best;
}

std::optional<RouteMatch> RouteTable::match(http::verb method,
                                            std::string_view path) const {
  auto found = matchMethod(method, path);
  if (!found && method == http::verb::head) {
    found = matchMethod(http::verb::get, path);
  }
  return found;
}

} // namespace weblib
