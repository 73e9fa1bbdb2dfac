#pragma once

#include "transparent_string_hash.hpp"
#include "web_exceptions.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace weblib {

/**
 * JSON codec used for request and response bodies. Parse failures are client
 * errors and surface as ValidationException on the "body" field.
 *
 * With camel-casing on, object keys are property names: write() turns
 * snake_case keys into camelCase and read() turns camelCase keys back into
 * snake_case, at every nesting level. An object stored under a property
 * registered with keepKeysOf() is a map whose keys are data; those keys pass
 * through unchanged in both directions while its values are still converted.
 */
class JsonMapper {
public:
  explicit JsonMapper(bool camelCase = true) : camelCase_(camelCase) {}

  std::string write(const nlohmann::json &value) const;
  nlohmann::json read(std::string_view text) const;

  template <typename T> T read(std::string_view text) const {
    auto json = read(text);
    try {
      return json.get<T>();
    } catch (const nlohmann::json::exception &e) {
      throw ValidationException("body", e.what(), ErrorCode::INVALID_FORMAT);
    }
  }

  bool camelCase() const { return camelCase_; }
  void setCamelCase(bool enabled) { camelCase_ = enabled; }

  // snake_case property name whose object value is a map
  void keepKeysOf(std::string property);
  bool keepsKeysOf(std::string_view property) const;

  nlohmann::json toCamelCase(const nlohmann::json &value) const;
  nlohmann::json toSnakeCase(const nlohmann::json &value) const;

private:
  nlohmann::json convertKeys(const nlohmann::json &value, bool toCamel) const;

  bool camelCase_;
  StringSet mapProperties_;
};

} // namespace weblib
