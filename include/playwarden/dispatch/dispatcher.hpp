#pragma once

#include "playwarden/audit/audit_log.hpp"
#include "playwarden/security/sanitizer.hpp"
#include "playwarden/tools/tool_registry.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace playwarden::dispatch {

struct CallRequest {
  std::string id;
  std::string tool;
  tools::ToolArgs arguments;
};

struct CallResult {
  std::string id;
  std::string tool;
  tools::Severity severity = tools::Severity::Error;
  /// `SUCCESS: ...`, `WARNING: ...` or `ERROR: ...`, already masked.
  std::string text;
};

enum class DispatchState { Idle, InFlight };

/// Runs one tool call at a time against a fixed registry. Every failure is
/// turned into an `ERROR:` string; nothing escapes.
class Dispatcher {
public:
  Dispatcher(tools::ToolRegistry registry, security::InputSanitizer sanitizer,
             std::shared_ptr<audit::AuditLog> audit = nullptr);

  [[nodiscard]] CallResult execute(const CallRequest &call);
  [[nodiscard]] std::string dispatch(const std::string &tool, const tools::ToolArgs &arguments);

  [[nodiscard]] std::vector<tools::ToolSpec> specs() const { return registry_.all_specs(); }
  [[nodiscard]] DispatchState state() const { return state_.load(); }

private:
  [[nodiscard]] common::Result<tools::ToolOutcome> invoke(const tools::ToolEntry &entry,
                                                          const tools::ToolArgs &arguments) const;
  void journal(const std::string &tool, const CallResult &result, common::ErrorKind kind,
               std::chrono::milliseconds duration, const std::string &digest);

  tools::ToolRegistry registry_;
  security::InputSanitizer sanitizer_;
  std::shared_ptr<audit::AuditLog> audit_;
  std::mutex call_mutex_;
  std::atomic<DispatchState> state_{DispatchState::Idle};
};

} // namespace playwarden::dispatch
