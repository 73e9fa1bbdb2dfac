#include "context.hpp"
#include "string_utils.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <stdexcept>

namespace weblib {

namespace {

template <typename Integer>
std::optional<Integer> parseInteger(std::string_view name,
                                    const std::optional<std::string> &raw) {
  if (!raw) {
    return std::nullopt;
  }
  Integer value{};
  const char *first = raw->data();
  const char *last = raw->data() + raw->size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last) {
    throw ValidationException(std::string(name), "must be an integer",
                              ErrorCode::INVALID_FORMAT);
  }
  return value;
}

bool allDigits(std::string_view text) {
  return !text.empty() &&
         std::all_of(text.begin(), text.end(), [](unsigned char c) {
           return std::isdigit(c) != 0;
         });
}

} // namespace

Context::Context(const HttpRequest &request, const JsonMapper &jsonMapper)
    : request_(request), jsonMapper_(jsonMapper) {
  parseTarget();

  auto cookieHeader = request_.find(http::field::cookie);
  if (cookieHeader != request_.end()) {
    requestCookies_ = parseCookieHeader(
        std::string_view(cookieHeader->value().data(),
                         cookieHeader->value().size()));
  }
}

void Context::parseTarget() {
  std::string_view target(request_.target().data(), request_.target().size());

  auto queryPos = target.find('?');
  rawPath_ = std::string(target.substr(0, queryPos));
  if (rawPath_.empty()) {
    rawPath_ = "/";
  }
  path_ = string_utils::url_decode(rawPath_, false);

  if (queryPos == std::string_view::npos) {
    return;
  }

  rawQuery_ = std::string(target.substr(queryPos + 1));
  for (auto pair : string_utils::split_view(rawQuery_, '&')) {
    if (pair.empty()) {
      continue;
    }
    auto eq = pair.find('=');
    auto key = string_utils::url_decode(pair.substr(0, eq));
    auto value = eq == std::string_view::npos
                     ? std::string()
                     : string_utils::url_decode(pair.substr(eq + 1));
    queryParams_.emplace_back(std::move(key), std::move(value));
  }
}

std::string Context::method() const {
  return std::string(request_.method_string());
}

const std::string &Context::pathParam(std::string_view name) const {
  auto it = pathParams_.find(name);
  if (it == pathParams_.end()) {
    throw std::invalid_argument("'" + std::string(name) +
                                "' is not a path parameter of " +
                                (matchedPath_.empty() ? path_ : matchedPath_));
  }
  return it->second;
}

std::optional<std::string> Context::queryParam(std::string_view name) const {
  for (const auto &[key, value] : queryParams_) {
    if (key == name) {
      return value;
    }
  }
  return std::nullopt;
}

std::vector<std::string> Context::queryParams(std::string_view name) const {
  std::vector<std::string> values;
  for (const auto &[key, value] : queryParams_) {
    if (key == name) {
      values.push_back(value);
    }
  }
  return values;
}

std::optional<std::string> Context::header(std::string_view name) const {
  auto it = request_.find(boost::beast::string_view(name.data(), name.size()));
  if (it == request_.end()) {
    return std::nullopt;
  }
  return std::string(it->value());
}

std::optional<std::string> Context::cookie(std::string_view name) const {
  auto it = requestCookies_.find(name);
  if (it == requestCookies_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<uint8_t> Context::bodyAsBytes() const {
  const auto &text = request_.body();
  return std::vector<uint8_t>(text.begin(), text.end());
}

Uuid Context::idPathParam(std::string_view name) const {
  const auto &raw = pathParam(name);
  auto uuid = parseUuid(raw);
  if (!uuid) {
    throw ValidationException(std::string(name), "must be a UUID",
                              ErrorCode::INVALID_FORMAT);
  }
  return *uuid;
}

std::optional<int> Context::intQueryParam(std::string_view name) const {
  return parseInteger<int>(name, queryParam(name));
}

std::optional<long long> Context::longQueryParam(std::string_view name) const {
  return parseInteger<long long>(name, queryParam(name));
}

std::optional<boost::gregorian::date>
Context::dateQueryParam(std::string_view name) const {
  auto raw = queryParam(name);
  if (!raw) {
    return std::nullopt;
  }

  std::string_view text(*raw);
  if (text.size() != 10 || text[4] != '-' || text[7] != '-' ||
      !allDigits(text.substr(0, 4)) || !allDigits(text.substr(5, 2)) ||
      !allDigits(text.substr(8, 2))) {
    throw ValidationException(std::string(name), "must be a date (YYYY-MM-DD)",
                              ErrorCode::INVALID_FORMAT);
  }

  try {
    return boost::gregorian::date(
        static_cast<unsigned short>(std::stoi(std::string(text.substr(0, 4)))),
        static_cast<unsigned short>(std::stoi(std::string(text.substr(5, 2)))),
        static_cast<unsigned short>(std::stoi(std::string(text.substr(8, 2)))));
  } catch (const std::out_of_range &) {
    // bad_year, bad_month and bad_day_of_month all derive from out_of_range
    throw ValidationException(std::string(name), "is not a valid date",
                              ErrorCode::INVALID_RANGE);
  }
}

Context &Context::status(int code) {
  status_ = code;
  return *this;
}

Context &Context::result(std::string text) {
  responseBody_ = std::move(text);
  if (contentType_.empty()) {
    contentType_ = "text/plain";
  }
  return *this;
}

Context &Context::json(const nlohmann::json &value) {
  responseBody_ = jsonMapper_.write(value);
  contentType_ = "application/json";
  return *this;
}

Context &Context::html(std::string text) {
  responseBody_ = std::move(text);
  contentType_ = "text/html; charset=utf-8";
  return *this;
}

Context &Context::resetResult() {
  responseBody_.clear();
  contentType_.clear();
  return *this;
}

Context &Context::contentType(std::string type) {
  contentType_ = std::move(type);
  return *this;
}

Context &Context::header(std::string name, std::string value) {
  removeHeader(name);
  responseHeaders_.emplace_back(std::move(name), std::move(value));
  return *this;
}

std::optional<std::string>
Context::responseHeader(std::string_view name) const {
  if (string_utils::iequals(name, "Content-Type") && !contentType_.empty()) {
    return contentType_;
  }
  for (const auto &[key, value] : responseHeaders_) {
    if (string_utils::iequals(key, name)) {
      return value;
    }
  }
  return std::nullopt;
}

Context &Context::removeHeader(std::string_view name) {
  responseHeaders_.erase(
      std::remove_if(responseHeaders_.begin(), responseHeaders_.end(),
                     [name](const auto &entry) {
                       return string_utils::iequals(entry.first, name);
                     }),
      responseHeaders_.end());
  return *this;
}

Context &Context::cookie(const Cookie &cookie) {
  // A later cookie with the same name replaces the earlier one
  responseCookies_.erase(std::remove_if(responseCookies_.begin(),
                                        responseCookies_.end(),
                                        [&cookie](const Cookie &existing) {
                                          return existing.name == cookie.name;
                                        }),
                         responseCookies_.end());
  responseCookies_.push_back(cookie);
  return *this;
}

void Context::attribute(const std::string &key, std::any value) {
  attributes_[key] = std::move(value);
}

const std::any *Context::attribute(const std::string &key) const {
  auto it = attributes_.find(key);
  return it == attributes_.end() ? nullptr : &it->second;
}

void Context::setMatchedRoute(std::string pattern, StringMap params) {
  matchedPath_ = std::move(pattern);
  pathParams_ = std::move(params);
}

HttpResponse Context::toResponse() const {
  HttpResponse response{static_cast<http::status>(status_), request_.version()};
  response.set(http::field::server, "weblib");
  if (!contentType_.empty()) {
    response.set(http::field::content_type, contentType_);
  }
  for (const auto &[name, value] : responseHeaders_) {
    response.set(name, value);
  }
  for (const auto &cookie : responseCookies_) {
    response.insert(http::field::set_cookie, cookie.toHeaderValue());
  }
  response.keep_alive(request_.keep_alive());
  response.body() = responseBody_;
  response.prepare_payload();
  if (request_.method() == http::verb::head) {
    // Same headers as GET, no body on the wire
    response.body().clear();
  }
  return response;
}

} // namespace weblib
