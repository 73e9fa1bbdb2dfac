#include "web_exceptions.hpp"
#include <random>
#include <sstream>

namespace weblib {

const char *getErrorCodeDescription(ErrorCode code) {
  switch (code) {
  case ErrorCode::INVALID_INPUT:
    return "Invalid input provided";
  case ErrorCode::MISSING_FIELD:
    return "Required field is missing";
  case ErrorCode::INVALID_FORMAT:
    return "Invalid data format";
  case ErrorCode::INVALID_RANGE:
    return "Value is out of valid range";
  case ErrorCode::UNAUTHORIZED:
    return "Unauthorized access";
  case ErrorCode::FORBIDDEN:
    return "Access forbidden";
  case ErrorCode::INVALID_CREDENTIALS:
    return "Invalid credentials provided";
  case ErrorCode::NOT_FOUND:
    return "Resource not found";
  case ErrorCode::ENDPOINT_NOT_FOUND:
    return "Endpoint not found";
  case ErrorCode::INTERNAL_ERROR:
    return "Internal server error";
  case ErrorCode::CONFIGURATION_ERROR:
    return "Configuration error";
  case ErrorCode::NETWORK_ERROR:
    return "Network communication error";
  case ErrorCode::FILE_ERROR:
    return "File operation error";
  }
  return "Unknown error";
}

std::string WebException::generateCorrelationId() {
  thread_local std::mt19937 gen(std::random_device{}());
  std::uniform_int_distribution<> dis(0, 15);

  std::ostringstream ss;
  for (int i = 0; i < 8; ++i) {
    ss << std::hex << dis(gen);
  }
  return ss.str();
}

WebException::WebException(ErrorCode code, std::string message,
                           ErrorContext context)
    : errorCode_(code), message_(std::move(message)),
      context_(std::move(context)), correlationId_(generateCorrelationId()),
      timestamp_(std::chrono::system_clock::now()) {}

std::string WebException::toLogString() const {
  std::ostringstream ss;
  ss << "[" << correlationId_ << "] "
     << "ErrorCode=" << static_cast<int>(errorCode_) << " "
     << "Message=\"" << message_ << "\"";

  if (!context_.empty()) {
    ss << " Context={";
    bool first = true;
    for (const auto &[key, value] : context_) {
      if (!first)
        ss << ", ";
      ss << key << "=\"" << value << "\"";
      first = false;
    }
    ss << "}";
  }

  return ss.str();
}

std::string WebException::toJsonString() const {
  nlohmann::json json = {
      {"correlationId", correlationId_},
      {"errorCode", static_cast<int>(errorCode_)},
      {"message", message_},
      {"timestamp", std::chrono::duration_cast<std::chrono::milliseconds>(
                        timestamp_.time_since_epoch())
                        .count()}};
  if (!context_.empty()) {
    json["context"] = context_;
  }
  return json.dump();
}

void WebException::addContext(const std::string &key,
                              const std::string &value) {
  context_[key] = value;
}

void WebException::setCorrelationId(const std::string &correlationId) {
  correlationId_ = correlationId;
}

// ValidationError JSON binding

void to_json(nlohmann::json &j, const ValidationError &error) {
  j = nlohmann::json{{"field", error.field}, {"message", error.message}};
}

void from_json(const nlohmann::json &j, ValidationError &error) {
  j.at("field").get_to(error.field);
  j.at("message").get_to(error.message);
}

// ValidationException implementation

std::string
ValidationException::summarize(const std::vector<ValidationError> &errors) {
  if (errors.empty()) {
    return "Validation failed";
  }
  std::ostringstream ss;
  ss << "Validation failed: ";
  for (size_t i = 0; i < errors.size(); ++i) {
    if (i > 0)
      ss << "; ";
    ss << errors[i].field << " " << errors[i].message;
  }
  return ss.str();
}

ValidationException::ValidationException(std::vector<ValidationError> errors,
                                         ErrorCode code)
    : WebException(code, summarize(errors)),
      validationErrors_(std::move(errors)) {
  if (validationErrors_.size() == 1) {
    addContext("field", validationErrors_.front().field);
  }
}

ValidationException::ValidationException(const std::string &field,
                                         const std::string &message,
                                         ErrorCode code)
    : ValidationException(std::vector<ValidationError>{{field, message}},
                          code) {}

nlohmann::json ValidationException::errorsAsJson() const {
  return nlohmann::json(validationErrors_);
}

std::string ValidationException::toLogString() const {
  return "[VALIDATION] " + WebException::toLogString();
}

// UnauthorizedException implementation

UnauthorizedException::UnauthorizedException(std::string message,
                                             ErrorContext context)
    : WebException(ErrorCode::UNAUTHORIZED, std::move(message),
                   std::move(context)) {}

std::string UnauthorizedException::toLogString() const {
  return "[UNAUTHORIZED] " + WebException::toLogString();
}

// NotFoundException implementation

NotFoundException::NotFoundException(std::string message, std::string resource,
                                     ErrorContext context)
    : WebException(ErrorCode::NOT_FOUND, std::move(message),
                   std::move(context)),
      resource_(std::move(resource)) {
  if (!resource_.empty()) {
    addContext("resource", resource_);
  }
}

std::string NotFoundException::toLogString() const {
  std::ostringstream ss;
  ss << "[NOT_FOUND] " << WebException::toLogString();
  if (!resource_.empty()) {
    ss << " Resource=\"" << resource_ << "\"";
  }
  return ss.str();
}

// SystemException implementation

SystemException::SystemException(ErrorCode code, std::string message,
                                 std::string component, ErrorContext context)
    : WebException(code, std::move(message), std::move(context)),
      component_(std::move(component)) {
  if (!component_.empty()) {
    addContext("component", component_);
  }
}

std::string SystemException::toLogString() const {
  std::ostringstream ss;
  ss << "[SYSTEM] " << WebException::toLogString();
  if (!component_.empty()) {
    ss << " Component=\"" << component_ << "\"";
  }
  return ss.str();
}

} // namespace weblib
