#pragma once

#include "transparent_string_hash.hpp"
#include <chrono>
#include <exception>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

namespace weblib {

class ConfigManager;

// The request being served when an error is reported
struct RequestInfo {
  std::string method;
  std::string url;
  std::string userAgent;
  std::string remoteAddress;
};

/**
 * External error-reporting collaborator. setContext() is called at the start
 * of every request on the serving thread; report() for every unexpected
 * exception. report() must not throw.
 */
class ErrorReporter {
public:
  virtual ~ErrorReporter() = default;
  virtual void setContext(const RequestInfo &) {}
  virtual void report(const std::exception &error) = 0;
};

class LoggingErrorReporter : public ErrorReporter {
public:
  void report(const std::exception &error) override;
};

/**
 * POSTs a JSON report for every error to a webhook with libcurl. Delivery
 * failures are logged and dropped.
 */
class WebhookErrorReporter : public ErrorReporter {
public:
  explicit WebhookErrorReporter(
      std::string url,
      std::chrono::seconds timeout = std::chrono::seconds(10));

  void report(const std::exception &error) override;

  // Report body, exposed for inspection
  nlohmann::json buildPayload(const std::exception &error) const;

  const std::string &url() const { return url_; }

private:
  std::string url_;
  std::chrono::seconds timeout_;

  bool post(const std::string &body) const;
};

/**
 * Process-wide access point to the active ErrorReporter plus the
 * thread-local request context it reports with.
 */
class ErrorReporting {
public:
  static void setReporter(std::shared_ptr<ErrorReporter> reporter);
  static std::shared_ptr<ErrorReporter> reporter();

  static void setContext(const RequestInfo &info);
  static const RequestInfo &context();
  static void clearContext();

  static void report(const std::exception &error);

  // errorReporter.type: "log" (default) or "webhook" with
  // errorReporter.webhookUrl
  static std::shared_ptr<ErrorReporter> fromConfig(const ConfigManager &config);

  static std::string typeName(const std::exception &error);

private:
  static RequestInfo &threadContext();

  static std::mutex mutex_;
  static std::shared_ptr<ErrorReporter> reporter_;
};

} // namespace weblib
