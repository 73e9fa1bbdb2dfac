#pragma once

#include "context.hpp"
#include "route_table.hpp"
#include "transparent_string_hash.hpp"
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace weblib {

class ConfigManager;

/**
 * Guards routes declaring roles. manage() runs after the before hooks and
 * before the route handler; throwing UnauthorizedException answers 403.
 */
class AccessManager {
public:
  virtual ~AccessManager() = default;
  virtual void manage(Context &ctx, const RoleSet &routeRoles) = 0;
};

/**
 * Maps "Authorization: Bearer <token>" to roles. Tokens come from
 * web.bearerTokens, each mapped to a comma separated role list. A request
 * passes when its token holds at least one of the route's roles.
 */
class BearerTokenAccessManager : public AccessManager {
public:
  BearerTokenAccessManager() = default;
  explicit BearerTokenAccessManager(const StringMap &tokenRoles);

  void addToken(const std::string &token, const RoleSet &roles);
  void manage(Context &ctx, const RoleSet &routeRoles) override;

  RoleSet rolesOf(std::string_view token) const;

  static std::optional<std::string> bearerToken(const Context &ctx);

  static std::shared_ptr<BearerTokenAccessManager>
  fromConfig(const ConfigManager &config);

private:
  std::unordered_map<std::string, RoleSet, TransparentStringHash,
                     std::equal_to<>>
      tokens_;
};

// web.accessManager: "none" (default) or "bearer"
std::shared_ptr<AccessManager> createAccessManager(const ConfigManager &config);

} // namespace weblib
