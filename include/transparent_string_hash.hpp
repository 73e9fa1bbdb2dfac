#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

namespace weblib {

// Transparent hasher so string-keyed maps can be probed with string_view
struct TransparentStringHash {
  using is_transparent = void;

  template <typename StringType>
  std::size_t operator()(const StringType &str) const {
    return std::hash<std::string_view>{}(str);
  }
};

using StringMap = std::unordered_map<std::string, std::string,
                                     TransparentStringHash, std::equal_to<>>;

using StringSet =
    std::unordered_set<std::string, TransparentStringHash, std::equal_to<>>;

} // namespace weblib
