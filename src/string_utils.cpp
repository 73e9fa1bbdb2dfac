#include "string_utils.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace weblib {
namespace string_utils {

// ============================================================================
// String View Utilities Implementation
// ============================================================================

std::string_view trim(std::string_view str) noexcept {
  constexpr std::string_view whitespace = " \t\n\r\f\v";
  auto start = str.find_first_not_of(whitespace);
  if (start == std::string_view::npos) {
    return {};
  }
  auto end = str.find_last_not_of(whitespace);
  return str.substr(start, end - start + 1);
}

bool iequals(std::string_view lhs, std::string_view rhs) noexcept {
  if (lhs.size() != rhs.size()) {
    return false;
  }

  return std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
    return std::tolower(static_cast<unsigned char>(a)) ==
           std::tolower(static_cast<unsigned char>(b));
  });
}

bool starts_with(std::string_view str, std::string_view prefix) noexcept {
  return str.size() >= prefix.size() && str.substr(0, prefix.size()) == prefix;
}

bool ends_with(std::string_view str, std::string_view suffix) noexcept {
  return str.size() >= suffix.size() &&
         str.substr(str.size() - suffix.size()) == suffix;
}

// ============================================================================
// Splitting Implementation
// ============================================================================

std::vector<std::string_view> split_view(std::string_view str, char delimiter) {
  std::vector<std::string_view> result;

  if (str.empty()) {
    return result;
  }

  std::size_t start = 0;
  std::size_t pos = 0;

  while ((pos = str.find(delimiter, start)) != std::string_view::npos) {
    result.emplace_back(str.substr(start, pos - start));
    start = pos + 1;
  }

  result.emplace_back(str.substr(start));

  return result;
}

std::vector<std::string> split_trimmed(std::string_view str, char delimiter) {
  std::vector<std::string> result;
  for (const auto &view : split_view(str, delimiter)) {
    auto trimmed = trim(view);
    if (!trimmed.empty()) {
      result.emplace_back(trimmed);
    }
  }
  return result;
}

// ============================================================================
// Case Conversion Implementation
// ============================================================================

std::string to_lower(std::string_view str) {
  std::string result(str);
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return result;
}

std::string snake_to_camel(std::string_view str) {
  std::string result;
  result.reserve(str.size());

  std::size_t i = 0;
  while (i < str.size() && str[i] == '_') {
    result.push_back('_');
    ++i;
  }

  bool upperNext = false;
  for (; i < str.size(); ++i) {
    char c = str[i];
    if (c == '_') {
      upperNext = true;
      continue;
    }
    if (upperNext) {
      result.push_back(
          static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
      upperNext = false;
    } else {
      result.push_back(c);
    }
  }

  // Trailing underscores carry no following letter
  if (upperNext) {
    result.push_back('_');
  }

  return result;
}

std::string camel_to_snake(std::string_view str) {
  std::string result;
  result.reserve(str.size() + 4);

  bool previousUpper = false;
  for (char c : str) {
    auto uc = static_cast<unsigned char>(c);
    if (std::isupper(uc)) {
      if (!result.empty() && !previousUpper && result.back() != '_') {
        result.push_back('_');
      }
      result.push_back(static_cast<char>(std::tolower(uc)));
      previousUpper = true;
    } else {
      result.push_back(c);
      previousUpper = false;
    }
  }

  return result;
}

// ============================================================================
// URL and Path Utilities Implementation
// ============================================================================

std::string url_decode(std::string_view str, bool plusAsSpace) {
  std::string decoded;
  decoded.reserve(str.size());

  for (std::size_t i = 0; i < str.size(); ++i) {
    if (str[i] == '%' && i + 2 < str.size() &&
        std::isxdigit(static_cast<unsigned char>(str[i + 1])) &&
        std::isxdigit(static_cast<unsigned char>(str[i + 2]))) {
      char hex_str[3] = {str[i + 1], str[i + 2], '\0'};
      decoded.push_back(static_cast<char>(std::strtol(hex_str, nullptr, 16)));
      i += 2;
    } else if (str[i] == '+' && plusAsSpace) {
      decoded.push_back(' ');
    } else {
      decoded.push_back(str[i]);
    }
  }

  return decoded;
}

std::string join_paths(std::string_view path1, std::string_view path2) {
  if (path1.empty()) {
    return std::string(path2);
  }
  if (path2.empty()) {
    return std::string(path1);
  }

  bool path1_ends_with_slash = path1.back() == '/';
  bool path2_starts_with_slash = path2.front() == '/';

  if (path1_ends_with_slash && path2_starts_with_slash) {
    return std::string(path1.substr(0, path1.size() - 1)) + std::string(path2);
  } else if (!path1_ends_with_slash && !path2_starts_with_slash) {
    return std::string(path1) + "/" + std::string(path2);
  }
  return std::string(path1) + std::string(path2);
}

bool escapes_root(std::string_view relativePath) {
  if (!relativePath.empty() &&
      (relativePath.front() == '/' || relativePath.front() == '\\')) {
    return true;
  }

  int depth = 0;
  for (const auto &part : split_view(relativePath, '/')) {
    if (part == "..") {
      if (--depth < 0) {
        return true;
      }
    } else if (!part.empty() && part != ".") {
      ++depth;
    }
  }
  return false;
}

} // namespace string_utils
} // namespace weblib
