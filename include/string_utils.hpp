#pragma once

#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace weblib {
namespace string_utils {

// ============================================================================
// String View Utilities
// ============================================================================

/**
 * Trimming without allocation; the returned view aliases the input.
 */
std::string_view trim(std::string_view str) noexcept;

/**
 * Case-insensitive comparison, used for header and cookie names
 */
bool iequals(std::string_view lhs, std::string_view rhs) noexcept;

bool starts_with(std::string_view str, std::string_view prefix) noexcept;
bool ends_with(std::string_view str, std::string_view suffix) noexcept;

// ============================================================================
// Splitting and Joining
// ============================================================================

std::vector<std::string_view> split_view(std::string_view str, char delimiter);

/**
 * Split, trim every part and drop the empty ones. "a, b,,c " -> {a, b, c}
 */
std::vector<std::string> split_trimmed(std::string_view str, char delimiter);

template <typename Container>
std::string join(const Container &container, std::string_view separator) {
  std::ostringstream oss;
  bool first = true;
  for (const auto &item : container) {
    if (!first) {
      oss << separator;
    }
    oss << item;
    first = false;
  }
  return oss.str();
}

// ============================================================================
// Case Conversion
// ============================================================================

std::string to_lower(std::string_view str);

/**
 * snake_case -> camelCase. Leading underscores are kept, "user_id" -> "userId".
 */
std::string snake_to_camel(std::string_view str);

/**
 * camelCase -> snake_case. A run of capitals is one word, "userURL" -> "user_url".
 */
std::string camel_to_snake(std::string_view str);

// ============================================================================
// URL and Path Utilities
// ============================================================================

/**
 * Percent-decoding. Query strings decode '+' as a space, paths do not.
 */
std::string url_decode(std::string_view str, bool plusAsSpace = true);

std::string join_paths(std::string_view path1, std::string_view path2);

/**
 * True when the relative path climbs out of its root ("..", absolute paths).
 */
bool escapes_root(std::string_view relativePath);

} // namespace string_utils
} // namespace weblib
