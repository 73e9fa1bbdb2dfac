#include "server_config.hpp"
#include <limits>

namespace weblib {

ServerConfig::ValidationResult ServerConfig::validate() const {
  ValidationResult result;

  if (host.empty()) {
    result.addError("host must not be empty");
  }

  if (threads == 0) {
    result.addError("threads must be greater than 0");
  }

  if (threads > 256) {
    result.addWarning("threads is very high (" + std::to_string(threads) +
                      "), consider system resource limits");
  }

  if (requestTimeout.count() <= 0) {
    result.addError("requestTimeout must be positive");
  }

  if (maxRequestBodySize == 0) {
    result.addError("maxRequestBodySize must be greater than 0");
  }

  if (maxRequestBodySize > 100 * 1024 * 1024) {
    result.addWarning("maxRequestBodySize is very large (" +
                      std::to_string(maxRequestBodySize / (1024 * 1024)) +
                      "MB), consider memory usage implications");
  }

  return result;
}

void ServerConfig::applyDefaults() {
  if (host.empty()) {
    host = "0.0.0.0";
  }
  if (threads == 0) {
    threads = 4;
  }
  if (requestTimeout.count() <= 0) {
    requestTimeout = std::chrono::seconds{30};
  }
  if (maxRequestBodySize == 0) {
    maxRequestBodySize = DEFAULT_MAX_BODY_SIZE;
  }
}

ServerConfig ServerConfig::fromConfig(const ConfigManager &config) {
  ServerConfig server;
  server.host = config.getString("web.host", server.host);

  int port = config.getInt("web.serverPort", DEFAULT_PORT);
  if (port < 0 || port > std::numeric_limits<unsigned short>::max()) {
    CONFIG_LOG_WARN("web.serverPort {} out of range, using {}", port,
                    DEFAULT_PORT);
    port = DEFAULT_PORT;
  }
  server.port = static_cast<unsigned short>(port);

  int threads = config.getInt("web.threads", 4);
  server.threads = threads > 0 ? static_cast<size_t>(threads) : 0;
  server.requestTimeout =
      std::chrono::seconds{config.getInt("web.requestTimeoutSeconds", 30)};

  double bodySize = config.getDouble(
      "web.maxRequestBodySize", static_cast<double>(DEFAULT_MAX_BODY_SIZE));
  server.maxRequestBodySize =
      bodySize > 0 ? static_cast<size_t>(bodySize) : 0;

  server.applyDefaults();
  return server;
}

} // namespace weblib
