#include "trace.hpp"
#include "logger.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace weblib {

std::mutex Trace::sinksMutex_;
std::vector<std::shared_ptr<TraceSink>> Trace::sinks_{
    std::make_shared<LoggingTraceSink>()};

nlohmann::json TraceRecord::toJson() const {
  nlohmann::json json = {
      {"type", type},
      {"startName", startName},
      {"name", name},
      {"startedAt", std::chrono::duration_cast<std::chrono::milliseconds>(
                        startedAt.time_since_epoch())
                        .count()},
      {"durationMs", durationMs}};
  if (sessionId) {
    json["sessionId"] = toString(*sessionId);
  }
  if (!startExtra.is_null() && !startExtra.empty()) {
    json["startExtra"] = startExtra;
  }
  if (!finishExtra.is_null() && !finishExtra.empty()) {
    json["finishExtra"] = finishExtra;
  }
  return json;
}

void LoggingTraceSink::onTrace(const TraceRecord &record) {
  std::ostringstream duration;
  duration << std::fixed << std::setprecision(2) << record.durationMs;

  StringMap context{{"type", record.type},
                    {"start", record.startName},
                    {"duration_ms", duration.str()}};
  if (record.sessionId) {
    context["session_id"] = toString(*record.sessionId);
  }
  if (!record.finishExtra.is_null() && !record.finishExtra.empty()) {
    context["extra"] = record.finishExtra.dump();
  }
  TraceLogger::infoWithContext(record.type + " " + record.name, context);
}

Trace::State &Trace::state() {
  thread_local State current;
  return current;
}

void Trace::clear() { state() = State{}; }

void Trace::sessionId(const Uuid &id) { state().sessionId = id; }

std::optional<Uuid> Trace::currentSessionId() { return state().sessionId; }

const Trace::State &Trace::current() { return state(); }

void Trace::start(const std::string &type, const std::string &name,
                  nlohmann::json extra) {
  auto &current = state();
  current.started = true;
  current.type = type;
  current.startName = name;
  current.startExtra = std::move(extra);
  current.startedAt = std::chrono::system_clock::now();
  current.startedSteady = std::chrono::steady_clock::now();
}

std::optional<TraceRecord> Trace::finish(const std::string &name,
                                         std::optional<nlohmann::json> extra) {
  auto &current = state();
  if (!current.started) {
    TRACE_LOG_DEBUG("Trace finish '{}' without start ignored", name);
    return std::nullopt;
  }

  TraceRecord record;
  record.type = current.type;
  record.startName = current.startName;
  record.name = name.empty() ? current.startName : name;
  record.sessionId = current.sessionId;
  record.startedAt = current.startedAt;
  record.durationMs = std::chrono::duration<double, std::milli>(
                          std::chrono::steady_clock::now() -
                          current.startedSteady)
                          .count();
  record.startExtra = current.startExtra;
  if (extra) {
    record.finishExtra = std::move(*extra);
  }
  current.started = false;

  for (const auto &sink : sinksSnapshot()) {
    try {
      sink->onTrace(record);
    } catch (const std::exception &e) {
      TRACE_LOG_WARN("Trace sink failed: {}", e.what());
    }
  }
  return record;
}

void Trace::addSink(std::shared_ptr<TraceSink> sink) {
  if (!sink) {
    return;
  }
  std::lock_guard<std::mutex> lock(sinksMutex_);
  sinks_.push_back(std::move(sink));
}

void Trace::removeSink(const std::shared_ptr<TraceSink> &sink) {
  std::lock_guard<std::mutex> lock(sinksMutex_);
  sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void Trace::resetSinks() {
  std::lock_guard<std::mutex> lock(sinksMutex_);
  sinks_.clear();
  sinks_.push_back(std::make_shared<LoggingTraceSink>());
}

std::vector<std::shared_ptr<TraceSink>> Trace::sinksSnapshot() {
  std::lock_guard<std::mutex> lock(sinksMutex_);
  return sinks_;
}

} // namespace weblib
