#pragma once

#include "cookie.hpp"
#include "json_mapper.hpp"
#include "transparent_string_hash.hpp"
#include "uuid_utils.hpp"
#include "web_exceptions.hpp"
#include <any>
#include <boost/beast/http.hpp>
#include <boost/date_time/gregorian/gregorian_types.hpp>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace weblib {

namespace http = boost::beast::http;

using HttpRequest = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;

/**
 * Per-request view over a Beast request plus the response being built for
 * it. Handlers, hooks and exception handlers all receive the same Context.
 * Not thread-safe; a Context lives on the thread serving its request.
 */
class Context {
public:
  Context(const HttpRequest &request, const JsonMapper &jsonMapper);

  Context(const Context &) = delete;
  Context &operator=(const Context &) = delete;

  // ===== Request side =====

  std::string method() const;
  http::verb verb() const { return request_.method(); }
  // Percent-decoded path; rawPath() is the target's path as received
  const std::string &path() const { return path_; }
  const std::string &rawPath() const { return rawPath_; }
  const std::string &rawQuery() const { return rawQuery_; }

  // Route pattern that matched this request, empty when no route matched
  const std::string &matchedPath() const { return matchedPath_; }
  const std::string &endpointHandlerPath() const { return matchedPath_; }

  // Throws std::invalid_argument when the route declares no such parameter
  const std::string &pathParam(std::string_view name) const;
  const StringMap &pathParams() const { return pathParams_; }

  std::optional<std::string> queryParam(std::string_view name) const;
  std::vector<std::string> queryParams(std::string_view name) const;
  std::optional<std::string> header(std::string_view name) const;
  std::optional<std::string> cookie(std::string_view name) const;
  const StringMap &cookies() const { return requestCookies_; }

  const std::string &body() const { return request_.body(); }
  std::vector<uint8_t> bodyAsBytes() const;

  const HttpRequest &request() const { return request_; }

  // ===== Typed request helpers =====

  Uuid idPathParam(std::string_view name = "id") const;
  std::optional<int> intQueryParam(std::string_view name) const;
  std::optional<long long> longQueryParam(std::string_view name) const;
  // ISO calendar date, YYYY-MM-DD
  std::optional<boost::gregorian::date>
  dateQueryParam(std::string_view name) const;

  template <typename T> T bodyFromJson() const {
    return jsonMapper_.read<T>(body());
  }

  // ===== Response side =====

  Context &status(int code);
  int status() const { return status_; }

  Context &result(std::string text);
  Context &json(const nlohmann::json &value);
  Context &html(std::string text);
  Context &contentType(std::string type);
  const std::string &resultString() const { return responseBody_; }
  // Drops the body and content type set so far, headers and cookies stay
  Context &resetResult();

  // Replaces any previous value of the header
  Context &header(std::string name, std::string value);
  std::optional<std::string> responseHeader(std::string_view name) const;
  Context &removeHeader(std::string_view name);

  Context &cookie(const Cookie &cookie);
  const std::vector<Cookie> &responseCookies() const {
    return responseCookies_;
  }

  template <typename T> Context &jsonOr404(const std::optional<T> &value) {
    if (!value) {
      return status(404);
    }
    return json(nlohmann::json(*value));
  }

  Context &jsonOr404(const nlohmann::json &value) {
    return value.is_null() ? status(404) : json(value);
  }

  // ===== Request-scoped attributes =====

  void attribute(const std::string &key, std::any value);
  const std::any *attribute(const std::string &key) const;

  template <typename T>
  std::optional<T> attributeAs(const std::string &key) const {
    if (const auto *value = attribute(key)) {
      if (const auto *typed = std::any_cast<T>(value)) {
        return *typed;
      }
    }
    return std::nullopt;
  }

  const JsonMapper &jsonMapper() const { return jsonMapper_; }

  // ===== Pipeline support =====

  void setMatchedRoute(std::string pattern, StringMap params);
  HttpResponse toResponse() const;

private:
  const HttpRequest &request_;
  const JsonMapper &jsonMapper_;

  std::string path_;
  std::string rawPath_;
  std::string rawQuery_;
  std::vector<std::pair<std::string, std::string>> queryParams_;
  StringMap requestCookies_;
  std::string matchedPath_;
  StringMap pathParams_;

  int status_ = 200;
  std::string responseBody_;
  std::string contentType_;
  std::vector<std::pair<std::string, std::string>> responseHeaders_;
  std::vector<Cookie> responseCookies_;
  std::unordered_map<std::string, std::any> attributes_;

  void parseTarget();
};

} // namespace weblib
