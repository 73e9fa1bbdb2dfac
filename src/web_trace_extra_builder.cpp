#include "web_trace_extra_builder.hpp"
#include "logger.hpp"

namespace weblib {

TraceExtraBuilderRegistry &TraceExtraBuilderRegistry::getInstance() {
  static TraceExtraBuilderRegistry instance;
  return instance;
}

TraceExtraBuilderRegistry::TraceExtraBuilderRegistry()
    : empty_(std::make_shared<EmptyWebTraceExtraBuilder>()) {
  builders_["empty"] = empty_;
}

void TraceExtraBuilderRegistry::registerBuilder(
    const std::string &name, std::shared_ptr<WebTraceExtraBuilder> builder) {
  if (!builder) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  builders_[name] = std::move(builder);
}

std::shared_ptr<WebTraceExtraBuilder>
TraceExtraBuilderRegistry::resolve(const std::string &name) const {
  if (name.empty()) {
    return empty_;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = builders_.find(name);
  if (it == builders_.end()) {
    TRACE_LOG_WARN("Unknown trace extra builder '{}', using the empty builder",
                   name);
    return empty_;
  }
  return it->second;
}

bool TraceExtraBuilderRegistry::contains(const std::string &name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return builders_.count(name) > 0;
}

} // namespace weblib
