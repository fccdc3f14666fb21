#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace playwarden::observability {

struct ToolCallEvent {
  std::string tool;
  std::chrono::milliseconds duration{0};
  /// One of `success`, `warning`, `error`.
  std::string outcome;
};

struct EngineRunEvent {
  std::string binary;
  int exit_code = 0;
  bool timed_out = false;
  bool cancelled = false;
  std::chrono::milliseconds duration{0};
};

struct BackupEvent {
  std::string original;
  std::string backup;
};

struct FileChangeEvent {
  std::string path;
  std::string action;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<ToolCallEvent, EngineRunEvent, BackupEvent, FileChangeEvent, ErrorEvent>;

struct ToolLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct InFlightMetric {
  std::uint64_t count = 0;
};

using ObserverMetric = std::variant<ToolLatencyMetric, InFlightMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace playwarden::observability
