#pragma once

#include "transparent_string_hash.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace weblib {

struct Cookie {
  std::string name;
  std::string value;
  std::string path = "/";
  std::string domain;
  std::optional<int> maxAge;
  bool httpOnly = false;
  bool secure = false;
  std::string sameSite; // "Strict", "Lax", "None" or empty

  Cookie() = default;
  Cookie(std::string cookieName, std::string cookieValue)
      : name(std::move(cookieName)), value(std::move(cookieValue)) {}

  // Set-Cookie header value
  std::string toHeaderValue() const;
};

/**
 * Parse a request Cookie header ("a=1; b=2") into name/value pairs. Empty
 * parts and parts without a name are skipped; the first occurrence of a name
 * wins.
 */
StringMap parseCookieHeader(std::string_view header);

} // namespace weblib
