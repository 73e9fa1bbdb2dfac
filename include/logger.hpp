#pragma once

#include "transparent_string_hash.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>
#include <unordered_set>

namespace weblib {

enum class LogLevel { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3, FATAL = 4 };

enum class LogFormat { TEXT = 0, JSON = 1 };

struct LogConfig {
  LogLevel level = LogLevel::INFO;
  LogFormat format = LogFormat::TEXT;
  bool consoleOutput = true;
  bool fileOutput = false;
  std::string logFile = "logs/weblib.log";
  size_t maxFileSize = 10 * 1024 * 1024; // 10MB
  int maxBackupFiles = 5;
  bool enableRotation = true;
  std::unordered_set<std::string, TransparentStringHash, std::equal_to<>>
      componentFilter; // Empty = all components
};

struct LogMetrics {
  std::atomic<uint64_t> totalMessages{0};
  std::atomic<uint64_t> errorCount{0};
  std::atomic<uint64_t> warningCount{0};
  std::chrono::steady_clock::time_point startTime;

  LogMetrics() : startTime(std::chrono::steady_clock::now()) {}

  // Atomics are not copyable, copy their values
  LogMetrics(const LogMetrics &other)
      : totalMessages(other.totalMessages.load()),
        errorCount(other.errorCount.load()),
        warningCount(other.warningCount.load()), startTime(other.startTime) {}

  LogMetrics &operator=(const LogMetrics &other) {
    if (this != &other) {
      totalMessages.store(other.totalMessages.load());
      errorCount.store(other.errorCount.load());
      warningCount.store(other.warningCount.load());
      startTime = other.startTime;
    }
    return *this;
  }
};

class Logger {
public:
  static Logger &getInstance();

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  // Configuration methods
  void configure(const LogConfig &config);
  LogConfig getConfig() const;
  void setLogLevel(LogLevel level);
  void setLogFormat(LogFormat format);
  void setLogFile(const std::string &filename);
  void enableConsoleOutput(bool enable);

  // Logging methods
  void log(LogLevel level, const std::string &component,
           const std::string &message, const StringMap &context = {});
  void debug(const std::string &component, const std::string &message,
             const StringMap &context = {});
  void info(const std::string &component, const std::string &message,
            const StringMap &context = {});
  void warn(const std::string &component, const std::string &message,
            const StringMap &context = {});
  void error(const std::string &component, const std::string &message,
             const StringMap &context = {});
  void fatal(const std::string &component, const std::string &message,
             const StringMap &context = {});

  bool isEnabled(LogLevel level, std::string_view component) const;

  LogMetrics getMetrics() const;
  void resetMetrics();

  void flush();
  void shutdown();

  static std::string levelToString(LogLevel level);
  static LogLevel parseLevel(const std::string &levelStr);
  static LogFormat parseFormat(const std::string &formatStr);

private:
  Logger() = default;
  ~Logger();

  LogConfig config_;
  mutable std::mutex configMutex_;

  std::ofstream fileStream_;
  std::string currentLogFile_;
  size_t currentFileSize_ = 0;
  mutable std::mutex fileMutex_;

  LogMetrics metrics_;

  std::string formatTimestamp() const;
  std::string formatTextMessage(LogLevel level, const std::string &component,
                                const std::string &message,
                                const StringMap &context) const;
  std::string formatJsonMessage(LogLevel level, const std::string &component,
                                const std::string &message,
                                const StringMap &context) const;
  void openLogFile(const std::string &filename);
  void writeLog(const LogConfig &config, const std::string &formattedMessage);
  void rotateLogFile(const LogConfig &config);
};

} // namespace weblib

// Standard logging macros
#define LOG_DEBUG(component, message, ...)                                     \
  weblib::Logger::getInstance().debug(component, message, ##__VA_ARGS__)
#define LOG_INFO(component, message, ...)                                      \
  weblib::Logger::getInstance().info(component, message, ##__VA_ARGS__)
#define LOG_WARN(component, message, ...)                                      \
  weblib::Logger::getInstance().warn(component, message, ##__VA_ARGS__)
#define LOG_ERROR(component, message, ...)                                     \
  weblib::Logger::getInstance().error(component, message, ##__VA_ARGS__)
#define LOG_FATAL(component, message, ...)                                     \
  weblib::Logger::getInstance().fatal(component, message, ##__VA_ARGS__)

#include "component_logger.hpp"

#define WEB_LOG_DEBUG(message, ...)                                            \
  weblib::WebServerLogger::debug(message, ##__VA_ARGS__)
#define WEB_LOG_INFO(message, ...)                                             \
  weblib::WebServerLogger::info(message, ##__VA_ARGS__)
#define WEB_LOG_WARN(message, ...)                                             \
  weblib::WebServerLogger::warn(message, ##__VA_ARGS__)
#define WEB_LOG_ERROR(message, ...)                                            \
  weblib::WebServerLogger::error(message, ##__VA_ARGS__)

#define HTTP_LOG_DEBUG(message, ...)                                           \
  weblib::HttpLogger::debug(message, ##__VA_ARGS__)
#define HTTP_LOG_INFO(message, ...)                                            \
  weblib::HttpLogger::info(message, ##__VA_ARGS__)
#define HTTP_LOG_WARN(message, ...)                                            \
  weblib::HttpLogger::warn(message, ##__VA_ARGS__)
#define HTTP_LOG_ERROR(message, ...)                                           \
  weblib::HttpLogger::error(message, ##__VA_ARGS__)

#define CONFIG_LOG_DEBUG(message, ...)                                         \
  weblib::ConfigLogger::debug(message, ##__VA_ARGS__)
#define CONFIG_LOG_INFO(message, ...)                                          \
  weblib::ConfigLogger::info(message, ##__VA_ARGS__)
#define CONFIG_LOG_WARN(message, ...)                                          \
  weblib::ConfigLogger::warn(message, ##__VA_ARGS__)
#define CONFIG_LOG_ERROR(message, ...)                                         \
  weblib::ConfigLogger::error(message, ##__VA_ARGS__)

#define ROUTER_LOG_DEBUG(message, ...)                                         \
  weblib::RouterLogger::debug(message, ##__VA_ARGS__)
#define ROUTER_LOG_INFO(message, ...)                                          \
  weblib::RouterLogger::info(message, ##__VA_ARGS__)
#define ROUTER_LOG_WARN(message, ...)                                          \
  weblib::RouterLogger::warn(message, ##__VA_ARGS__)

#define TRACE_LOG_DEBUG(message, ...)                                          \
  weblib::TraceLogger::debug(message, ##__VA_ARGS__)
#define TRACE_LOG_INFO(message, ...)                                           \
  weblib::TraceLogger::info(message, ##__VA_ARGS__)
#define TRACE_LOG_WARN(message, ...)                                           \
  weblib::TraceLogger::warn(message, ##__VA_ARGS__)

#define ERROR_LOG_WARN(message, ...)                                           \
  weblib::ErrorReportingLogger::warn(message, ##__VA_ARGS__)
#define ERROR_LOG_ERROR(message, ...)                                          \
  weblib::ErrorReportingLogger::error(message, ##__VA_ARGS__)

// Component aliases used by the macros above
#include "component_logger.hpp"
