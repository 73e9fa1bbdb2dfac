#pragma once

#include "config_manager.hpp"
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace weblib {

// Transport settings for the HTTP server, read from the web.* keys
struct ServerConfig {
  static constexpr unsigned short DEFAULT_PORT = 8080;
  static constexpr size_t DEFAULT_MAX_BODY_SIZE = 10 * 1024 * 1024;

  std::string host = "0.0.0.0";
  unsigned short port = DEFAULT_PORT; // 0 binds an ephemeral port
  size_t threads = 4;
  std::chrono::seconds requestTimeout{30};
  size_t maxRequestBodySize = DEFAULT_MAX_BODY_SIZE;

  using ValidationResult = ConfigValidationResult;

  ValidationResult validate() const;

  // Replaces unset or invalid values with the defaults
  void applyDefaults();

  /**
   * web.host, web.serverPort, web.threads, web.requestTimeoutSeconds and
   * web.maxRequestBodySize, defaults applied.
   */
  static ServerConfig fromConfig(const ConfigManager &config);

  bool operator==(const ServerConfig &other) const {
    return host == other.host && port == other.port &&
           threads == other.threads &&
           requestTimeout == other.requestTimeout &&
           maxRequestBodySize == other.maxRequestBodySize;
  }

  bool operator!=(const ServerConfig &other) const {
    return !(*this == other);
  }
};

} // namespace weblib
