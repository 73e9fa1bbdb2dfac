#pragma once

#include <string>

namespace weblib {

/**
 * Deployment environment of the running process. The name comes from the
 * APP_ENV environment variable, then the "environment" config key, and is
 * "local" when neither is set.
 */
class Environment {
public:
  static std::string name();
  static std::string version();

  static bool isLocal();
  static bool isNotLocal() { return !isLocal(); }
  static bool isProd();
  static bool isNotProd() { return !isProd(); }
  static bool isTest();
};

class Application {
public:
  static std::string name();
};

} // namespace weblib
