#include "cookie.hpp"
#include "string_utils.hpp"
#include <sstream>

namespace weblib {

std::string Cookie::toHeaderValue() const {
  std::ostringstream oss;
  oss << name << "=" << value;
  if (!path.empty()) {
    oss << "; Path=" << path;
  }
  if (!domain.empty()) {
    oss << "; Domain=" << domain;
  }
  if (maxAge) {
    oss << "; Max-Age=" << *maxAge;
  }
  if (secure) {
    oss << "; Secure";
  }
  if (httpOnly) {
    oss << "; HttpOnly";
  }
  if (!sameSite.empty()) {
    oss << "; SameSite=" << sameSite;
  }
  return oss.str();
}

StringMap parseCookieHeader(std::string_view header) {
  StringMap cookies;
  for (auto part : string_utils::split_view(header, ';')) {
    part = string_utils::trim(part);
    if (part.empty()) {
      continue;
    }

    auto eq = part.find('=');
    auto name = string_utils::trim(part.substr(0, eq));
    if (name.empty()) {
      continue;
    }

    std::string_view value;
    if (eq != std::string_view::npos) {
      value = string_utils::trim(part.substr(eq + 1));
      if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        value = value.substr(1, value.size() - 2);
      }
    }
    cookies.try_emplace(std::string(name), value);
  }
  return cookies;
}

} // namespace weblib
