#include "logger.hpp"
#include "string_utils.hpp"
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace weblib {

Logger &Logger::getInstance() {
  static Logger instance;
  return instance;
}

Logger::~Logger() { shutdown(); }

void Logger::configure(const LogConfig &config) {
  std::lock_guard<std::mutex> lock(configMutex_);
  config_ = config;

  std::lock_guard<std::mutex> fileLock(fileMutex_);
  if (fileStream_.is_open()) {
    fileStream_.close();
  }
  if (config_.fileOutput) {
    openLogFile(config_.logFile);
    if (!fileStream_.is_open()) {
      config_.fileOutput = false;
    }
  }
}

LogConfig Logger::getConfig() const {
  std::lock_guard<std::mutex> lock(configMutex_);
  return config_;
}

void Logger::setLogLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(configMutex_);
  config_.level = level;
}

void Logger::setLogFormat(LogFormat format) {
  std::lock_guard<std::mutex> lock(configMutex_);
  config_.format = format;
}

void Logger::setLogFile(const std::string &filename) {
  std::lock_guard<std::mutex> lock(configMutex_);
  std::lock_guard<std::mutex> fileLock(fileMutex_);

  if (fileStream_.is_open()) {
    fileStream_.close();
  }
  config_.logFile = filename;
  openLogFile(filename);
  config_.fileOutput = fileStream_.is_open();
}

void Logger::enableConsoleOutput(bool enable) {
  std::lock_guard<std::mutex> lock(configMutex_);
  config_.consoleOutput = enable;
}

// Caller holds fileMutex_
void Logger::openLogFile(const std::string &filename) {
  currentLogFile_ = filename;

  std::error_code ec;
  std::filesystem::path logPath(filename);
  if (logPath.has_parent_path()) {
    std::filesystem::create_directories(logPath.parent_path(), ec);
  }

  fileStream_.open(currentLogFile_, std::ios::app);
  if (!fileStream_.is_open()) {
    std::cerr << "Failed to open log file: " << filename << std::endl;
    return;
  }

  auto size = std::filesystem::file_size(currentLogFile_, ec);
  currentFileSize_ = ec ? 0 : static_cast<size_t>(size);
}

void Logger::log(LogLevel level, const std::string &component,
                 const std::string &message, const StringMap &context) {
  LogConfig config;
  {
    std::lock_guard<std::mutex> lock(configMutex_);
    if (level < config_.level ||
        (!config_.componentFilter.empty() &&
         config_.componentFilter.find(component) ==
             config_.componentFilter.end())) {
      return;
    }
    config = config_;
  }

  metrics_.totalMessages++;
  if (level == LogLevel::ERROR || level == LogLevel::FATAL) {
    metrics_.errorCount++;
  } else if (level == LogLevel::WARN) {
    metrics_.warningCount++;
  }

  std::string formatted =
      config.format == LogFormat::JSON
          ? formatJsonMessage(level, component, message, context)
          : formatTextMessage(level, component, message, context);
  writeLog(config, formatted);
}

void Logger::debug(const std::string &component, const std::string &message,
                   const StringMap &context) {
  log(LogLevel::DEBUG, component, message, context);
}

void Logger::info(const std::string &component, const std::string &message,
                  const StringMap &context) {
  log(LogLevel::INFO, component, message, context);
}

void Logger::warn(const std::string &component, const std::string &message,
                  const StringMap &context) {
  log(LogLevel::WARN, component, message, context);
}

void Logger::error(const std::string &component, const std::string &message,
                   const StringMap &context) {
  log(LogLevel::ERROR, component, message, context);
}

void Logger::fatal(const std::string &component, const std::string &message,
                   const StringMap &context) {
  log(LogLevel::FATAL, component, message, context);
}

bool Logger::isEnabled(LogLevel level, std::string_view component) const {
  std::lock_guard<std::mutex> lock(configMutex_);
  if (level < config_.level) {
    return false;
  }
  return config_.componentFilter.empty() ||
         config_.componentFilter.find(component) !=
             config_.componentFilter.end();
}

LogMetrics Logger::getMetrics() const { return metrics_; }

void Logger::resetMetrics() { metrics_ = LogMetrics{}; }

void Logger::flush() {
  std::cout.flush();
  std::lock_guard<std::mutex> lock(fileMutex_);
  if (fileStream_.is_open()) {
    fileStream_.flush();
  }
}

void Logger::shutdown() {
  std::lock_guard<std::mutex> lock(fileMutex_);
  if (fileStream_.is_open()) {
    fileStream_.flush();
    fileStream_.close();
  }
}

std::string Logger::formatTimestamp() const {
  auto now = std::chrono::system_clock::now();
  auto time = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;

  std::tm tm{};
  localtime_r(&time, &tm);

  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  oss << "." << std::setfill('0') << std::setw(3) << ms.count();
  return oss.str();
}

std::string Logger::levelToString(LogLevel level) {
  switch (level) {
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO ";
  case LogLevel::WARN:
    return "WARN ";
  case LogLevel::ERROR:
    return "ERROR";
  case LogLevel::FATAL:
    return "FATAL";
  }
  return "UNKNOWN";
}

LogLevel Logger::parseLevel(const std::string &levelStr) {
  auto level = string_utils::to_lower(string_utils::trim(levelStr));
  if (level == "debug" || level == "trace") {
    return LogLevel::DEBUG;
  }
  if (level == "warn" || level == "warning") {
    return LogLevel::WARN;
  }
  if (level == "error") {
    return LogLevel::ERROR;
  }
  if (level == "fatal") {
    return LogLevel::FATAL;
  }
  return LogLevel::INFO;
}

LogFormat Logger::parseFormat(const std::string &formatStr) {
  return string_utils::iequals(string_utils::trim(formatStr), "json")
             ? LogFormat::JSON
             : LogFormat::TEXT;
}

std::string Logger::formatTextMessage(LogLevel level,
                                      const std::string &component,
                                      const std::string &message,
                                      const StringMap &context) const {
  std::ostringstream oss;
  oss << "[" << formatTimestamp() << "] "
      << "[" << levelToString(level) << "] "
      << "[" << component << "] " << message;

  if (!context.empty()) {
    oss << " |";
    for (const auto &[key, value] : context) {
      oss << " " << key << "=" << value;
    }
  }

  return oss.str();
}

std::string Logger::formatJsonMessage(LogLevel level,
                                      const std::string &component,
                                      const std::string &message,
                                      const StringMap &context) const {
  nlohmann::json line = {{"timestamp", formatTimestamp()},
                         {"level", std::string(string_utils::trim(
                                       levelToString(level)))},
                         {"component", component},
                         {"message", message}};

  if (!context.empty()) {
    auto &ctx = line["context"] = nlohmann::json::object();
    for (const auto &[key, value] : context) {
      ctx[key] = value;
    }
  }

  return line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void Logger::writeLog(const LogConfig &config,
                      const std::string &formattedMessage) {
  if (config.consoleOutput) {
    std::lock_guard<std::mutex> lock(fileMutex_);
    std::cout << formattedMessage << '\n';
  }

  if (config.fileOutput) {
    std::lock_guard<std::mutex> lock(fileMutex_);
    if (!fileStream_.is_open()) {
      return;
    }
    if (config.enableRotation &&
        currentFileSize_ + formattedMessage.length() > config.maxFileSize) {
      rotateLogFile(config);
      if (!fileStream_.is_open()) {
        return;
      }
    }

    fileStream_ << formattedMessage << '\n';
    fileStream_.flush();
    currentFileSize_ += formattedMessage.length() + 1;
  }
}

// Caller holds fileMutex_
void Logger::rotateLogFile(const LogConfig &config) {
  fileStream_.close();

  std::error_code ec;
  for (int i = config.maxBackupFiles - 1; i > 0; i--) {
    std::string oldFile = currentLogFile_ + "." + std::to_string(i);
    std::string newFile = currentLogFile_ + "." + std::to_string(i + 1);

    if (std::filesystem::exists(oldFile, ec)) {
      if (i == config.maxBackupFiles - 1) {
        std::filesystem::remove(newFile, ec);
      }
      std::filesystem::rename(oldFile, newFile, ec);
    }
  }

  if (config.maxBackupFiles > 0 &&
      std::filesystem::exists(currentLogFile_, ec)) {
    std::filesystem::rename(currentLogFile_, currentLogFile_ + ".1", ec);
  }

  fileStream_.open(currentLogFile_, std::ios::out | std::ios::trunc);
  currentFileSize_ = 0;

  if (!fileStream_.is_open()) {
    std::cerr << "Failed to create new log file after rotation: "
              << currentLogFile_ << std::endl;
  }
}

} // namespace weblib
