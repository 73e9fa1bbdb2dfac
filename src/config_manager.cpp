#include "config_manager.hpp"
#include "string_utils.hpp"
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <mutex>
#include <stdexcept>

namespace weblib {

namespace {
constexpr int kMaxFlattenDepth = 100;
}

ConfigManager &ConfigManager::getInstance() {
  static ConfigManager instance;
  return instance;
}

bool ConfigManager::loadConfig(const std::string &configPath) {
  CONFIG_LOG_INFO("Loading configuration from: {}", configPath);

  std::ifstream file(configPath);
  if (!file.is_open()) {
    CONFIG_LOG_ERROR("Cannot open config file: {}", configPath);
    return false;
  }

  nlohmann::json jsonConfig;
  try {
    file >> jsonConfig;
  } catch (const nlohmann::json::parse_error &e) {
    CONFIG_LOG_ERROR("Failed to parse JSON config file {}: {}", configPath,
                     e.what());
    return false;
  }

  if (!applyJson(jsonConfig)) {
    CONFIG_LOG_ERROR("Configuration root must be a JSON object: {}",
                     configPath);
    return false;
  }

  size_t parameterCount = 0;
  {
    std::unique_lock lock(configMutex_);
    configFilePath = configPath;
    parameterCount = configData.size();
  }
  CONFIG_LOG_INFO("Configuration loaded successfully with {} parameters",
                  parameterCount);
  return true;
}

bool ConfigManager::loadFromString(const std::string &jsonText) {
  auto jsonConfig = nlohmann::json::parse(jsonText, nullptr, false);
  if (jsonConfig.is_discarded()) {
    CONFIG_LOG_ERROR("Failed to parse JSON configuration text");
    return false;
  }
  return applyJson(jsonConfig);
}

bool ConfigManager::reloadConfiguration() {
  std::string path;
  {
    std::shared_lock lock(configMutex_);
    path = configFilePath;
  }
  if (path.empty()) {
    CONFIG_LOG_ERROR("No configuration file path available for reload");
    return false;
  }
  return loadConfig(path);
}

bool ConfigManager::applyJson(const nlohmann::json &jsonConfig) {
  if (!jsonConfig.is_object()) {
    return false;
  }

  StringMap flattened;
  flattenJson(jsonConfig, "", 0, kMaxFlattenDepth, flattened);

  std::unique_lock lock(configMutex_);
  configData = std::move(flattened);
  return true;
}

void ConfigManager::flattenJson(const nlohmann::json &json,
                                const std::string &prefix, int currentDepth,
                                int maxDepth, StringMap &out) const {
  if (currentDepth >= maxDepth) {
    out[prefix] = json.dump();
    return;
  }

  for (auto it = json.begin(); it != json.end(); ++it) {
    std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();

    if (it->is_object()) {
      flattenJson(*it, key, currentDepth + 1, maxDepth, out);
    } else if (it->is_array()) {
      // Arrays stay JSON text; getStringSet understands them
      out[key] = it->dump();
    } else if (it->is_string()) {
      out[key] = it->get<std::string>();
    } else if (it->is_number_integer()) {
      out[key] = std::to_string(it->get<long long>());
    } else if (it->is_boolean()) {
      out[key] = it->get<bool>() ? "true" : "false";
    } else if (it->is_null()) {
      // null means "not configured"
      continue;
    } else {
      out[key] = it->dump();
    }
  }
}

std::string ConfigManager::environmentKey(std::string_view key) {
  std::string envKey = "WEBLIB_";
  envKey.reserve(envKey.size() + key.size());
  for (char c : key) {
    if (c == '.' || c == '-') {
      envKey.push_back('_');
    } else {
      envKey.push_back(
          static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
  }
  return envKey;
}

std::optional<std::string> ConfigManager::lookup(std::string_view key) const {
  if (const char *envValue = std::getenv(environmentKey(key).c_str())) {
    return std::string(envValue);
  }

  std::shared_lock lock(configMutex_);
  if (auto it = configData.find(key); it != configData.end()) {
    return it->second;
  }
  return std::nullopt;
}

std::string ConfigManager::getString(const std::string &key,
                                     const std::string &defaultValue) const {
  return lookup(key).value_or(defaultValue);
}

std::optional<std::string>
ConfigManager::getOptionalString(const std::string &key) const {
  return lookup(key);
}

int ConfigManager::getInt(const std::string &key, int defaultValue) const {
  if (auto value = lookup(key)) {
    try {
      return std::stoi(*value);
    } catch (const std::invalid_argument &) {
      CONFIG_LOG_WARN("Config key {} is not an integer: {}", key, *value);
      return defaultValue;
    } catch (const std::out_of_range &) {
      CONFIG_LOG_WARN("Config key {} is out of range: {}", key, *value);
      return defaultValue;
    }
  }
  return defaultValue;
}

bool ConfigManager::getBool(const std::string &key, bool defaultValue) const {
  if (auto value = lookup(key)) {
    auto lowered = string_utils::to_lower(string_utils::trim(*value));
    if (lowered == "true" || lowered == "1" || lowered == "yes" ||
        lowered == "on") {
      return true;
    }
    if (lowered == "false" || lowered == "0" || lowered == "no" ||
        lowered == "off") {
      return false;
    }
    CONFIG_LOG_WARN("Config key {} is not a boolean: {}", key, *value);
  }
  return defaultValue;
}

double ConfigManager::getDouble(const std::string &key,
                                double defaultValue) const {
  if (auto value = lookup(key)) {
    try {
      return std::stod(*value);
    } catch (const std::invalid_argument &) {
      return defaultValue;
    } catch (const std::out_of_range &) {
      return defaultValue;
    }
  }
  return defaultValue;
}

StringSet ConfigManager::getStringSet(const std::string &key) const {
  StringSet result;
  auto raw = lookup(key);
  if (!raw) {
    return result;
  }

  if (!raw->empty() && raw->front() == '[') {
    auto arr = nlohmann::json::parse(*raw, nullptr, false);
    if (!arr.is_discarded() && arr.is_array()) {
      for (const auto &v : arr) {
        if (v.is_string()) {
          result.insert(v.get<std::string>());
        }
      }
      return result;
    }
  }

  for (auto &item : string_utils::split_trimmed(*raw, ',')) {
    result.insert(std::move(item));
  }
  return result;
}

StringMap ConfigManager::getSection(const std::string &prefix) const {
  StringMap section;
  std::string dotted = prefix + ".";

  std::shared_lock lock(configMutex_);
  for (const auto &[key, value] : configData) {
    if (string_utils::starts_with(key, dotted)) {
      section.emplace(key.substr(dotted.size()), value);
    }
  }
  return section;
}

bool ConfigManager::hasKey(const std::string &key) const {
  return lookup(key).has_value();
}

void ConfigManager::setValue(const std::string &key, const std::string &value) {
  std::unique_lock lock(configMutex_);
  configData[key] = value;
}

void ConfigManager::clear() {
  std::unique_lock lock(configMutex_);
  configData.clear();
  configFilePath.clear();
}

LogConfig ConfigManager::getLoggingConfig() const {
  LogConfig config;

  config.level = Logger::parseLevel(getString("logging.level", "INFO"));
  config.format = Logger::parseFormat(getString("logging.format", "TEXT"));
  config.consoleOutput = getBool("logging.console_output", true);
  config.fileOutput = getBool("logging.file_output", false);
  config.logFile = getString("logging.log_file", "logs/weblib.log");
  config.maxFileSize =
      static_cast<size_t>(getInt("logging.max_file_size", 10485760));
  config.maxBackupFiles = getInt("logging.max_backup_files", 5);
  config.enableRotation = getBool("logging.enable_rotation", true);
  for (const auto &component : getStringSet("logging.component_filter")) {
    config.componentFilter.insert(component);
  }

  return config;
}

} // namespace weblib
