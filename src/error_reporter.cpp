#include "error_reporter.hpp"
#include "config_manager.hpp"
#include "environment.hpp"
#include "logger.hpp"
#include "trace.hpp"
#include "web_exceptions.hpp"
#include <boost/core/demangle.hpp>
#include <curl/curl.h>
#include <stdexcept>
#include <typeinfo>

namespace weblib {

namespace {

class CurlHandle {
public:
  CurlHandle() : handle_(curl_easy_init()) {
    if (!handle_) {
      throw std::runtime_error("Failed to initialize CURL handle");
    }
  }

  CurlHandle(const CurlHandle &) = delete;
  CurlHandle &operator=(const CurlHandle &) = delete;

  ~CurlHandle() { curl_easy_cleanup(handle_); }

  CURL *get() const { return handle_; }

private:
  CURL *handle_;
};

void ensureCurlGlobalInit() {
  static std::once_flag once;
  std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

size_t discardResponse(char *, size_t size, size_t nmemb, void *) {
  return size * nmemb;
}

} // namespace

// ===== LoggingErrorReporter =====

void LoggingErrorReporter::report(const std::exception &error) {
  const auto &request = ErrorReporting::context();

  StringMap context{{"type", ErrorReporting::typeName(error)}};
  if (!request.method.empty()) {
    context["method"] = request.method;
    context["url"] = request.url;
  }
  if (auto session = Trace::currentSessionId()) {
    context["session_id"] = toString(*session);
  }
  if (const auto *webError = dynamic_cast<const WebException *>(&error)) {
    context["correlation_id"] = webError->getCorrelationId();
  }

  ErrorReportingLogger::errorWithContext(
      std::string("Unhandled exception: ") + error.what(), context);
}

// ===== WebhookErrorReporter =====

WebhookErrorReporter::WebhookErrorReporter(std::string url,
                                           std::chrono::seconds timeout)
    : url_(std::move(url)), timeout_(timeout) {
  if (url_.empty()) {
    throw SystemException(ErrorCode::CONFIGURATION_ERROR,
                          "Webhook error reporter requires a URL",
                          "ErrorReporting");
  }
  ensureCurlGlobalInit();
}

nlohmann::json
WebhookErrorReporter::buildPayload(const std::exception &error) const {
  const auto &request = ErrorReporting::context();

  nlohmann::json payload = {
      {"message", error.what()},
      {"type", ErrorReporting::typeName(error)},
      {"application", Application::name()},
      {"environment", Environment::name()},
      {"version", Environment::version()},
      {"timestamp", std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::system_clock::now().time_since_epoch())
                        .count()}};

  if (!request.method.empty()) {
    payload["request"] = {{"method", request.method},
                          {"url", request.url},
                          {"userAgent", request.userAgent},
                          {"remoteAddress", request.remoteAddress}};
  }
  if (auto session = Trace::currentSessionId()) {
    payload["sessionId"] = toString(*session);
  }
  if (const auto *webError = dynamic_cast<const WebException *>(&error)) {
    payload["correlationId"] = webError->getCorrelationId();
    payload["errorCode"] = static_cast<int>(webError->getCode());
  }
  return payload;
}

void WebhookErrorReporter::report(const std::exception &error) {
  auto body = buildPayload(error).dump(
      -1, ' ', false, nlohmann::json::error_handler_t::replace);
  if (!post(body)) {
    ERROR_LOG_WARN("Error report could not be delivered to {}", url_);
    LoggingErrorReporter().report(error);
  }
}

bool WebhookErrorReporter::post(const std::string &body) const {
  std::unique_ptr<CurlHandle> curl;
  try {
    curl = std::make_unique<CurlHandle>();
  } catch (const std::runtime_error &e) {
    ERROR_LOG_ERROR("{}", e.what());
    return false;
  }

  struct curl_slist *headerList = nullptr;
  headerList = curl_slist_append(headerList, "Content-Type: application/json");
  std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headerGuard(
      headerList, curl_slist_free_all);

  curl_easy_setopt(curl->get(), CURLOPT_URL, url_.c_str());
  curl_easy_setopt(curl->get(), CURLOPT_POST, 1L);
  curl_easy_setopt(curl->get(), CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl->get(), CURLOPT_POSTFIELDSIZE,
                   static_cast<long>(body.size()));
  curl_easy_setopt(curl->get(), CURLOPT_HTTPHEADER, headerList);
  curl_easy_setopt(curl->get(), CURLOPT_WRITEFUNCTION, discardResponse);
  curl_easy_setopt(curl->get(), CURLOPT_TIMEOUT,
                   static_cast<long>(timeout_.count()));
  curl_easy_setopt(curl->get(), CURLOPT_CONNECTTIMEOUT, 5L);
  curl_easy_setopt(curl->get(), CURLOPT_NOSIGNAL, 1L);

  CURLcode res = curl_easy_perform(curl->get());
  if (res != CURLE_OK) {
    ERROR_LOG_WARN("Webhook POST failed: {}", curl_easy_strerror(res));
    return false;
  }

  long status = 0;
  curl_easy_getinfo(curl->get(), CURLINFO_RESPONSE_CODE, &status);
  if (status < 200 || status >= 300) {
    ERROR_LOG_WARN("Webhook answered with HTTP {}", status);
    return false;
  }
  return true;
}

// ===== ErrorReporting =====

std::mutex ErrorReporting::mutex_;
std::shared_ptr<ErrorReporter> ErrorReporting::reporter_ =
    std::make_shared<LoggingErrorReporter>();

void ErrorReporting::setReporter(std::shared_ptr<ErrorReporter> reporter) {
  std::lock_guard<std::mutex> lock(mutex_);
  reporter_ =
      reporter ? std::move(reporter) : std::make_shared<LoggingErrorReporter>();
}

std::shared_ptr<ErrorReporter> ErrorReporting::reporter() {
  std::lock_guard<std::mutex> lock(mutex_);
  return reporter_;
}

RequestInfo &ErrorReporting::threadContext() {
  thread_local RequestInfo info;
  return info;
}

void ErrorReporting::setContext(const RequestInfo &info) {
  threadContext() = info;
  reporter()->setContext(info);
}

const RequestInfo &ErrorReporting::context() { return threadContext(); }

void ErrorReporting::clearContext() { threadContext() = RequestInfo{}; }

void ErrorReporting::report(const std::exception &error) {
  try {
    reporter()->report(error);
  } catch (const std::exception &e) {
    ERROR_LOG_ERROR("Error reporter failed: {} (while reporting: {})",
                    e.what(), error.what());
  }
}

std::shared_ptr<ErrorReporter>
ErrorReporting::fromConfig(const ConfigManager &config) {
  auto type = config.getString("errorReporter.type", "log");
  if (type == "webhook") {
    auto url = config.getString("errorReporter.webhookUrl");
    auto timeout = config.getInt("errorReporter.timeoutSeconds", 10);
    return std::make_shared<WebhookErrorReporter>(url,
                                                  std::chrono::seconds(timeout));
  }
  if (type != "log") {
    ERROR_LOG_WARN("Unknown errorReporter.type '{}', logging errors instead",
                   type);
  }
  return std::make_shared<LoggingErrorReporter>();
}

std::string ErrorReporting::typeName(const std::exception &error) {
  return boost::core::demangle(typeid(error).name());
}

} // namespace weblib
