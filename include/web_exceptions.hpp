#pragma once

#include <chrono>
#include <exception>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace weblib {

// Error codes organized by category
enum class ErrorCode {
  // Validation errors (1000-1999)
  INVALID_INPUT = 1000,
  MISSING_FIELD = 1001,
  INVALID_FORMAT = 1002,
  INVALID_RANGE = 1003,

  // Authorization errors (2000-2999)
  UNAUTHORIZED = 2000,
  FORBIDDEN = 2001,
  INVALID_CREDENTIALS = 2002,

  // Lookup errors (3000-3999)
  NOT_FOUND = 3000,
  ENDPOINT_NOT_FOUND = 3001,

  // System errors (4000-4999)
  INTERNAL_ERROR = 4000,
  CONFIGURATION_ERROR = 4001,
  NETWORK_ERROR = 4002,
  FILE_ERROR = 4003
};

using ErrorContext = std::unordered_map<std::string, std::string>;

const char *getErrorCodeDescription(ErrorCode code);

// Base exception with error context and correlation ID support
class WebException : public std::exception {
public:
  WebException(ErrorCode code, std::string message, ErrorContext context = {});

  ErrorCode getCode() const { return errorCode_; }
  const std::string &getMessage() const { return message_; }
  const ErrorContext &getContext() const { return context_; }
  const std::string &getCorrelationId() const { return correlationId_; }
  std::chrono::system_clock::time_point getTimestamp() const {
    return timestamp_;
  }

  const char *what() const noexcept override { return message_.c_str(); }

  virtual std::string toLogString() const;
  std::string toJsonString() const;

  void addContext(const std::string &key, const std::string &value);
  void setCorrelationId(const std::string &correlationId);

protected:
  ErrorCode errorCode_;
  std::string message_;
  ErrorContext context_;
  std::string correlationId_;
  std::chrono::system_clock::time_point timestamp_;

  static std::string generateCorrelationId();
};

struct ValidationError {
  std::string field;
  std::string message;

  bool operator==(const ValidationError &other) const {
    return field == other.field && message == other.message;
  }
};

void to_json(nlohmann::json &j, const ValidationError &error);
void from_json(const nlohmann::json &j, ValidationError &error);

/**
 * One or more invalid inputs. Mapped to 400 with the JSON array of
 * validation errors as the response body.
 */
class ValidationException : public WebException {
public:
  explicit ValidationException(std::vector<ValidationError> errors,
                               ErrorCode code = ErrorCode::INVALID_INPUT);
  ValidationException(const std::string &field, const std::string &message,
                      ErrorCode code = ErrorCode::INVALID_INPUT);

  const std::vector<ValidationError> &getValidationErrors() const {
    return validationErrors_;
  }
  nlohmann::json errorsAsJson() const;

  std::string toLogString() const override;

private:
  std::vector<ValidationError> validationErrors_;

  static std::string summarize(const std::vector<ValidationError> &errors);
};

// Mapped to 403
class UnauthorizedException : public WebException {
public:
  explicit UnauthorizedException(std::string message = "Unauthorized",
                                 ErrorContext context = {});

  std::string toLogString() const override;
};

// Mapped to 404
class NotFoundException : public WebException {
public:
  explicit NotFoundException(std::string message = "Not found",
                             std::string resource = "",
                             ErrorContext context = {});

  const std::string &getResource() const { return resource_; }

  std::string toLogString() const override;

private:
  std::string resource_;
};

// Configuration and startup failures inside weblib
class SystemException : public WebException {
public:
  SystemException(ErrorCode code, std::string message,
                  std::string component = "", ErrorContext context = {});

  const std::string &getComponent() const { return component_; }

  std::string toLogString() const override;

private:
  std::string component_;
};

} // namespace weblib
