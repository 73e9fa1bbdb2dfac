#pragma once

#include "logger.hpp"
#include "transparent_string_hash.hpp"
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace weblib {

// Configuration validation result
struct ConfigValidationResult {
  bool isValid = true;
  std::vector<std::string> errors;
  std::vector<std::string> warnings;

  void addError(const std::string &error) {
    isValid = false;
    errors.push_back(error);
  }

  void addWarning(const std::string &warning) { warnings.push_back(warning); }
};

using StringSet =
    std::unordered_set<std::string, TransparentStringHash, std::equal_to<>>;

/**
 * Process-wide configuration. JSON documents are flattened into dotted keys
 * ({"web": {"serverPort": 8080}} becomes "web.serverPort"). A key is
 * overridden by the environment variable WEBLIB_<KEY> where dots become
 * underscores and letters are upper-cased ("web.serverPort" ->
 * WEBLIB_WEB_SERVERPORT).
 */
class ConfigManager {
public:
  static ConfigManager &getInstance();

  ConfigManager(const ConfigManager &) = delete;
  ConfigManager &operator=(const ConfigManager &) = delete;

  bool loadConfig(const std::string &configPath);
  bool loadFromString(const std::string &jsonText);
  bool reloadConfiguration();

  std::string getString(const std::string &key,
                        const std::string &defaultValue = "") const;
  std::optional<std::string> getOptionalString(const std::string &key) const;
  int getInt(const std::string &key, int defaultValue = 0) const;
  bool getBool(const std::string &key, bool defaultValue = false) const;
  double getDouble(const std::string &key, double defaultValue = 0.0) const;
  StringSet getStringSet(const std::string &key) const;

  /**
   * Entries below a prefix with the prefix stripped. For
   * {"web": {"bearerTokens": {"abc": "admin"}}},
   * getSection("web.bearerTokens") returns {"abc": "admin"}.
   */
  StringMap getSection(const std::string &prefix) const;

  bool hasKey(const std::string &key) const;
  void setValue(const std::string &key, const std::string &value);
  void clear();

  // Logging configuration helpers
  LogConfig getLoggingConfig() const;

  // Configuration access with validation
  template <typename T>
  T getValidatedValue(
      const std::string &key, const T &defaultValue,
      const std::function<bool(const T &)> &validator = nullptr) const;

  static std::string environmentKey(std::string_view key);

private:
  ConfigManager() = default;

  std::optional<std::string> lookup(std::string_view key) const;
  bool applyJson(const nlohmann::json &jsonConfig);
  void flattenJson(const nlohmann::json &json, const std::string &prefix,
                   int currentDepth, int maxDepth, StringMap &out) const;

  StringMap configData;
  std::string configFilePath;
  mutable std::shared_mutex configMutex_;
};

template <typename T>
T ConfigManager::getValidatedValue(
    const std::string &key, const T &defaultValue,
    const std::function<bool(const T &)> &validator) const {
  T value;

  if constexpr (std::is_same_v<T, std::string>) {
    value = getString(key, defaultValue);
  } else if constexpr (std::is_same_v<T, int>) {
    value = getInt(key, defaultValue);
  } else if constexpr (std::is_same_v<T, bool>) {
    value = getBool(key, defaultValue);
  } else if constexpr (std::is_same_v<T, double>) {
    value = getDouble(key, defaultValue);
  } else {
    static_assert(std::is_same_v<T, std::string> || std::is_same_v<T, int> ||
                      std::is_same_v<T, bool> || std::is_same_v<T, double>,
                  "Unsupported type for getValidatedValue");
    return defaultValue;
  }

  if (validator && !validator(value)) {
    return defaultValue;
  }

  return value;
}

} // namespace weblib
