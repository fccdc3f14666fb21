#pragma once

#include "playwarden/observability/observer.hpp"

#include <memory>

namespace playwarden::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_tool_call(const std::string &tool, std::chrono::milliseconds duration,
                      const std::string &outcome);
void record_engine_run(const std::string &binary, int exit_code, bool timed_out, bool cancelled,
                       std::chrono::milliseconds duration);
void record_backup(const std::string &original, const std::string &backup);
void record_file_change(const std::string &path, const std::string &action);
void record_error(const std::string &component, const std::string &message);

} // namespace playwarden::observability
