#include "uuid_utils.hpp"
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cctype>
#include <cstdint>

namespace weblib {

Uuid newUuid4() {
  thread_local boost::uuids::random_generator generator;
  return generator();
}

std::optional<Uuid> parseUuid(std::string_view text) {
  // boost::uuids::string_generator also accepts braces and missing dashes
  if (text.size() != 36) {
    return std::nullopt;
  }

  Uuid uuid{};
  size_t byte = 0;
  for (size_t i = 0; i < text.size();) {
    if (i == 8 || i == 13 || i == 18 || i == 23) {
      if (text[i] != '-') {
        return std::nullopt;
      }
      ++i;
      continue;
    }
    auto hi = static_cast<unsigned char>(text[i]);
    auto lo = static_cast<unsigned char>(text[i + 1]);
    if (!std::isxdigit(hi) || !std::isxdigit(lo)) {
      return std::nullopt;
    }
    auto nibble = [](unsigned char c) -> uint8_t {
      if (c >= '0' && c <= '9')
        return static_cast<uint8_t>(c - '0');
      return static_cast<uint8_t>(std::tolower(c) - 'a' + 10);
    };
    uuid.data[byte++] = static_cast<uint8_t>((nibble(hi) << 4) | nibble(lo));
    i += 2;
  }
  return uuid;
}

std::string toString(const Uuid &uuid) { return boost::uuids::to_string(uuid); }

} // namespace weblib
