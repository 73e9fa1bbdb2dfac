#include "environment.hpp"
#include "config_manager.hpp"
#include "string_utils.hpp"
#include <cstdlib>

namespace weblib {

std::string Environment::name() {
  if (const char *env = std::getenv("APP_ENV"); env && *env) {
    return string_utils::to_lower(string_utils::trim(env));
  }
  auto configured = ConfigManager::getInstance().getString("environment");
  if (!configured.empty()) {
    return string_utils::to_lower(string_utils::trim(configured));
  }
  return "local";
}

std::string Environment::version() {
  return ConfigManager::getInstance().getString("application.version",
                                                "0.0.1");
}

bool Environment::isLocal() { return name() == "local"; }

bool Environment::isProd() {
  auto env = name();
  return env == "prod" || env == "production";
}

bool Environment::isTest() { return name() == "test"; }

std::string Application::name() {
  return ConfigManager::getInstance().getString("application.name", "weblib");
}

} // namespace weblib
