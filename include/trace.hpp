#pragma once

#include "uuid_utils.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace weblib {

// One finished unit of work, usually one HTTP request
struct TraceRecord {
  std::string type;
  std::string startName;
  std::string name;
  std::optional<Uuid> sessionId;
  std::chrono::system_clock::time_point startedAt;
  double durationMs = 0.0;
  nlohmann::json startExtra;
  nlohmann::json finishExtra;

  nlohmann::json toJson() const;
};

class TraceSink {
public:
  virtual ~TraceSink() = default;
  virtual void onTrace(const TraceRecord &record) = 0;
};

// Writes one log line per finished trace
class LoggingTraceSink : public TraceSink {
public:
  void onTrace(const TraceRecord &record) override;
};

/**
 * Thread-local trace of the work in progress on the calling thread. start()
 * opens a trace, finish() closes it and hands the record to every registered
 * sink. finish() without a matching start() does nothing.
 */
class Trace {
public:
  struct State {
    std::optional<Uuid> sessionId;
    bool started = false;
    std::string type;
    std::string startName;
    nlohmann::json startExtra;
    std::chrono::system_clock::time_point startedAt;
    std::chrono::steady_clock::time_point startedSteady;
  };

  static void clear();
  static void sessionId(const Uuid &id);
  static std::optional<Uuid> currentSessionId();
  static void start(const std::string &type, const std::string &name,
                    nlohmann::json extra = nlohmann::json::object());
  static std::optional<TraceRecord>
  finish(const std::string &name,
         std::optional<nlohmann::json> extra = std::nullopt);
  static const State &current();

  // Sinks are process-wide; a LoggingTraceSink is installed by default
  static void addSink(std::shared_ptr<TraceSink> sink);
  static void removeSink(const std::shared_ptr<TraceSink> &sink);
  static void resetSinks();

private:
  static State &state();
  static std::vector<std::shared_ptr<TraceSink>> sinksSnapshot();

  static std::mutex sinksMutex_;
  static std::vector<std::shared_ptr<TraceSink>> sinks_;
};

} // namespace weblib
