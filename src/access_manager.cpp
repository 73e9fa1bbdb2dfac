#include "access_manager.hpp"
#include "config_manager.hpp"
#include "logger.hpp"
#include "string_utils.hpp"
#include "web_exceptions.hpp"

namespace weblib {

BearerTokenAccessManager::BearerTokenAccessManager(
    const StringMap &tokenRoles) {
  for (const auto &[token, roles] : tokenRoles) {
    auto names = string_utils::split_trimmed(roles, ',');
    addToken(token, RoleSet(names.begin(), names.end()));
  }
}

void BearerTokenAccessManager::addToken(const std::string &token,
                                        const RoleSet &roles) {
  if (token.empty()) {
    return;
  }
  tokens_[token] = roles;
}

RoleSet BearerTokenAccessManager::rolesOf(std::string_view token) const {
  auto it = tokens_.find(token);
  return it == tokens_.end() ? RoleSet{} : it->second;
}

std::optional<std::string>
BearerTokenAccessManager::bearerToken(const Context &ctx) {
  auto header = ctx.header("Authorization");
  if (!header) {
    return std::nullopt;
  }
  std::string_view value = string_utils::trim(*header);
  constexpr std::string_view scheme = "Bearer ";
  if (value.size() <= scheme.size() ||
      !string_utils::iequals(value.substr(0, scheme.size()), scheme)) {
    return std::nullopt;
  }
  return std::string(string_utils::trim(value.substr(scheme.size())));
}

void BearerTokenAccessManager::manage(Context &ctx,
                                      const RoleSet &routeRoles) {
  if (routeRoles.empty()) {
    return;
  }

  auto token = bearerToken(ctx);
  if (!token) {
    throw UnauthorizedException("Missing bearer token");
  }

  auto granted = rolesOf(*token);
  for (const auto &role : routeRoles) {
    if (granted.count(role) > 0) {
      ctx.attribute("roles", granted);
      return;
    }
  }
  throw UnauthorizedException("Insufficient role for " + ctx.method() + " " +
                              ctx.path());
}

std::shared_ptr<BearerTokenAccessManager>
BearerTokenAccessManager::fromConfig(const ConfigManager &config) {
  auto tokens = config.getSection("web.bearerTokens");
  if (tokens.empty()) {
    WEB_LOG_WARN("Bearer access manager configured without web.bearerTokens, "
                 "every role-guarded route will answer 403");
  }
  return std::make_shared<BearerTokenAccessManager>(tokens);
}

std::shared_ptr<AccessManager>
createAccessManager(const ConfigManager &config) {
  auto type = string_utils::to_lower(config.getString("web.accessManager"));
  if (type.empty() || type == "none") {
    return nullptr;
  }
  if (type == "bearer") {
    return BearerTokenAccessManager::fromConfig(config);
  }
  throw SystemException(ErrorCode::CONFIGURATION_ERROR,
                        "Unknown web.accessManager '" + type + "'",
                        "WebServer");
}

} // namespace weblib
