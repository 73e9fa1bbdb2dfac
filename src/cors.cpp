#include "cors.hpp"
#include "string_utils.hpp"

namespace weblib {

namespace {

std::string_view stripScheme(std::string_view origin) {
  auto pos = origin.find("://");
  return pos == std::string_view::npos ? origin : origin.substr(pos + 3);
}

} // namespace

CorsConfig CorsConfig::fromOrigins(std::string_view origins) {
  if (string_utils::trim(origins) == "*") {
    return anyHost();
  }
  return allowHosts(string_utils::split_trimmed(origins, ','));
}

CorsConfig CorsConfig::anyHost() {
  CorsConfig config;
  config.anyHost_ = true;
  return config;
}

CorsConfig CorsConfig::allowHosts(std::vector<std::string> origins) {
  CorsConfig config;
  for (auto &origin : origins) {
    while (!origin.empty() && origin.back() == '/') {
      origin.pop_back();
    }
    if (origin == "*") {
      config.anyHost_ = true;
    } else if (!origin.empty()) {
      config.origins_.push_back(std::move(origin));
    }
  }
  return config;
}

bool CorsConfig::isAllowed(std::string_view origin) const {
  if (origin.empty()) {
    return false;
  }
  if (anyHost_) {
    return true;
  }

  for (const auto &allowed : origins_) {
    if (string_utils::iequals(allowed, origin)) {
      return true;
    }
    if (allowed.find("://") == std::string::npos &&
        string_utils::iequals(allowed, stripScheme(origin))) {
      return true;
    }
  }
  return false;
}

void CorsConfig::setAllowOrigin(Context &ctx, const std::string &origin) const {
  if (anyHost_) {
    ctx.header("Access-Control-Allow-Origin", "*");
  } else {
    ctx.header("Access-Control-Allow-Origin", origin);
    ctx.header("Vary", "Origin");
  }
}

bool CorsConfig::handlePreflight(Context &ctx) const {
  if (ctx.verb() != http::verb::options) {
    return false;
  }
  auto origin = ctx.header("Origin");
  auto requestedMethod = ctx.header("Access-Control-Request-Method");
  if (!origin || !requestedMethod || !isAllowed(*origin)) {
    return false;
  }

  setAllowOrigin(ctx, *origin);
  ctx.header("Access-Control-Allow-Methods", *requestedMethod);
  if (auto requestedHeaders = ctx.header("Access-Control-Request-Headers")) {
    ctx.header("Access-Control-Allow-Headers", *requestedHeaders);
  }
  ctx.status(200);
  return true;
}

void CorsConfig::applyHeaders(Context &ctx) const {
  auto origin = ctx.header("Origin");
  if (!origin || !isAllowed(*origin)) {
    return;
  }
  setAllowOrigin(ctx, *origin);
}

} // namespace weblib
