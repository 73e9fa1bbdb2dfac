#pragma once

#include "context.hpp"
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>

namespace weblib {

// Adds request-specific data to the trace recorded for each request
class WebTraceExtraBuilder {
public:
  virtual ~WebTraceExtraBuilder() = default;
  virtual std::optional<nlohmann::json> build(Context &ctx) = 0;
};

class EmptyWebTraceExtraBuilder : public WebTraceExtraBuilder {
public:
  std::optional<nlohmann::json> build(Context &) override {
    return std::nullopt;
  }
};

/**
 * Named builders selectable through the web.traceExtraBuilder config key.
 * "empty" is always registered.
 */
class TraceExtraBuilderRegistry {
public:
  static TraceExtraBuilderRegistry &getInstance();

  TraceExtraBuilderRegistry(const TraceExtraBuilderRegistry &) = delete;
  TraceExtraBuilderRegistry &
  operator=(const TraceExtraBuilderRegistry &) = delete;

  void registerBuilder(const std::string &name,
                       std::shared_ptr<WebTraceExtraBuilder> builder);

  // Unknown or empty names resolve to the empty builder
  std::shared_ptr<WebTraceExtraBuilder> resolve(const std::string &name) const;

  bool contains(const std::string &name) const;

private:
  TraceExtraBuilderRegistry();

  std::unordered_map<std::string, std::shared_ptr<WebTraceExtraBuilder>>
      builders_;
  std::shared_ptr<WebTraceExtraBuilder> empty_;
  mutable std::mutex mutex_;
};

} // namespace weblib
