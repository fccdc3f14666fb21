#include "playwarden/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace playwarden::observability {

namespace {

void log_line(const std::string &level, const std::string &message) {
  std::cerr << "[" << level << "] " << message << "\n";
}

} // namespace

void LogObserver::record_event(const ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::visit(
      [](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, ToolCallEvent>) {
          log_line(evt.outcome == "error" ? "WARN" : "INFO",
                   "tool.call name=" + evt.tool + " outcome=" + evt.outcome +
                       " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, EngineRunEvent>) {
          log_line("INFO", "engine.run binary=" + evt.binary +
                               " exit_code=" + std::to_string(evt.exit_code) +
                               " timed_out=" + (evt.timed_out ? "true" : "false") +
                               " cancelled=" + (evt.cancelled ? "true" : "false") +
                               " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, BackupEvent>) {
          log_line("INFO", "backup.created original=" + evt.original + " backup=" + evt.backup);
        } else if constexpr (std::is_same_v<T, FileChangeEvent>) {
          log_line("INFO", "file." + evt.action + " path=" + evt.path);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::visit(
      [](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ToolLatencyMetric>) {
          log_line("DEBUG", "metric.tool_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, InFlightMetric>) {
          log_line("DEBUG", "metric.in_flight=" + std::to_string(m.count));
        }
      },
      metric);
}

} // namespace playwarden::observability
