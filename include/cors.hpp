#pragma once

#include "context.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace weblib {

/**
 * Allowed origins for cross-origin requests. An origin configured without a
 * scheme ("example.com") matches both http and https.
 */
class CorsConfig {
public:
  // "*" allows any host; otherwise a comma separated origin list
  static CorsConfig fromOrigins(std::string_view origins);

  static CorsConfig anyHost();
  static CorsConfig allowHosts(std::vector<std::string> origins);

  bool isAnyHost() const { return anyHost_; }
  const std::vector<std::string> &origins() const { return origins_; }
  bool empty() const { return !anyHost_ && origins_.empty(); }

  bool isAllowed(std::string_view origin) const;

  /**
   * Answers a preflight request. Returns true when the request was a
   * preflight (OPTIONS with Origin and Access-Control-Request-Method) from an
   * allowed origin and the response is complete.
   */
  bool handlePreflight(Context &ctx) const;

  // Adds the allow-origin headers to an actual request's response
  void applyHeaders(Context &ctx) const;

private:
  bool anyHost_ = false;
  std::vector<std::string> origins_;

  void setAllowOrigin(Context &ctx, const std::string &origin) const;
};

} // namespace weblib
