#pragma once

#include "logger.hpp"
#include "transparent_string_hash.hpp"
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

namespace weblib {

template <typename Component> struct ComponentTrait;

template <> struct ComponentTrait<class WebServer> {
  static constexpr const char *name = "WebServer";
};

template <> struct ComponentTrait<class WebApp> {
  static constexpr const char *name = "WebApp";
};

template <> struct ComponentTrait<class HttpServer> {
  static constexpr const char *name = "HttpServer";
};

template <> struct ComponentTrait<class ConfigManager> {
  static constexpr const char *name = "ConfigManager";
};

template <> struct ComponentTrait<class RouterRegistry> {
  static constexpr const char *name = "RouterRegistry";
};

template <> struct ComponentTrait<class Trace> {
  static constexpr const char *name = "Trace";
};

template <> struct ComponentTrait<class ErrorReporting> {
  static constexpr const char *name = "ErrorReporting";
};

/**
 * ComponentLogger - binds a component name at compile time so call sites only
 * pass the message. "{}" placeholders in the message are filled from the
 * trailing arguments in order.
 */
template <typename Component> class ComponentLogger {
private:
  static_assert(std::is_class_v<Component>, "Component must be a class type");

  static constexpr const char *component_name = ComponentTrait<Component>::name;

  static Logger &getLogger() { return Logger::getInstance(); }

public:
  template <typename... Args>
  static void debug(const std::string &message, Args &&...args) {
    if (!getLogger().isEnabled(LogLevel::DEBUG, component_name)) {
      return;
    }
    getLogger().debug(component_name,
                      format_message(message, std::forward<Args>(args)...));
  }

  template <typename... Args>
  static void info(const std::string &message, Args &&...args) {
    getLogger().info(component_name,
                     format_message(message, std::forward<Args>(args)...));
  }

  template <typename... Args>
  static void warn(const std::string &message, Args &&...args) {
    getLogger().warn(component_name,
                     format_message(message, std::forward<Args>(args)...));
  }

  template <typename... Args>
  static void error(const std::string &message, Args &&...args) {
    getLogger().error(component_name,
                      format_message(message, std::forward<Args>(args)...));
  }

  template <typename... Args>
  static void fatal(const std::string &message, Args &&...args) {
    getLogger().fatal(component_name,
                      format_message(message, std::forward<Args>(args)...));
  }

  // Context-aware logging with metadata

  static void infoWithContext(const std::string &message,
                              const StringMap &context = {}) {
    getLogger().info(component_name, message, context);
  }

  static void warnWithContext(const std::string &message,
                              const StringMap &context = {}) {
    getLogger().warn(component_name, message, context);
  }

  static void errorWithContext(const std::string &message,
                               const StringMap &context = {}) {
    getLogger().error(component_name, message, context);
  }

  static constexpr const char *getComponentName() { return component_name; }

private:
  template <typename T> static void stream_value(std::ostringstream &ss, T &&value) {
    if constexpr (std::is_same_v<std::decay_t<T>, bool>) {
      ss << (value ? "true" : "false");
    } else if constexpr (std::is_arithmetic_v<std::decay_t<T>> ||
                         std::is_convertible_v<T, std::string_view>) {
      ss << std::forward<T>(value);
    } else {
      ss << "[object]";
    }
  }

  template <typename... Args>
  static std::string format_message(const std::string &format, Args &&...args) {
    if constexpr (sizeof...(args) == 0) {
      return format;
    } else {
      std::ostringstream ss;
      format_impl(ss, format, std::forward<Args>(args)...);
      return ss.str();
    }
  }

  template <typename T, typename... Args>
  static void format_impl(std::ostringstream &ss, std::string_view format,
                          T &&arg, Args &&...args) {
    size_t pos = format.find("{}");
    if (pos == std::string_view::npos) {
      ss << format;
      return;
    }
    ss << format.substr(0, pos);
    stream_value(ss, std::forward<T>(arg));
    if constexpr (sizeof...(args) > 0) {
      format_impl(ss, format.substr(pos + 2), std::forward<Args>(args)...);
    } else {
      ss << format.substr(pos + 2);
    }
  }
};

using WebServerLogger = ComponentLogger<class WebServer>;
using WebAppLogger = ComponentLogger<class WebApp>;
using HttpLogger = ComponentLogger<class HttpServer>;
using ConfigLogger = ComponentLogger<class ConfigManager>;
using RouterLogger = ComponentLogger<class RouterRegistry>;
using TraceLogger = ComponentLogger<class Trace>;
using ErrorReportingLogger = ComponentLogger<class ErrorReporting>;

} // namespace weblib

#define COMPONENT_LOG_DEBUG(ComponentClass, message, ...)                      \
  weblib::ComponentLogger<ComponentClass>::debug(message, ##__VA_ARGS__)
#define COMPONENT_LOG_INFO(ComponentClass, message, ...)                       \
  weblib::ComponentLogger<ComponentClass>::info(message, ##__VA_ARGS__)
#define COMPONENT_LOG_WARN(ComponentClass, message, ...)                       \
  weblib::ComponentLogger<ComponentClass>::warn(message, ##__VA_ARGS__)
#define COMPONENT_LOG_ERROR(ComponentClass, message, ...)                      \
  weblib::ComponentLogger<ComponentClass>::error(message, ##__VA_ARGS__)
