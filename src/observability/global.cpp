#include "playwarden/observability/global.hpp"

#include <mutex>

namespace playwarden::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_tool_call(const std::string &tool, std::chrono::milliseconds duration,
                      const std::string &outcome) {
  record_event(ToolCallEvent{.tool = tool, .duration = duration, .outcome = outcome});
}

void record_engine_run(const std::string &binary, const int exit_code, const bool timed_out,
                       const bool cancelled, std::chrono::milliseconds duration) {
  record_event(EngineRunEvent{.binary = binary,
                              .exit_code = exit_code,
                              .timed_out = timed_out,
                              .cancelled = cancelled,
                              .duration = duration});
}

void record_backup(const std::string &original, const std::string &backup) {
  record_event(BackupEvent{.original = original, .backup = backup});
}

void record_file_change(const std::string &path, const std::string &action) {
  record_event(FileChangeEvent{.path = path, .action = action});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace playwarden::observability
