#include "playwarden/dispatch/dispatcher.hpp"

#include "playwarden/common/fs.hpp"
#include "playwarden/observability/global.hpp"

#include <chrono>
#include <exception>

namespace playwarden::dispatch {

namespace {

constexpr const char *kConfirmArg = "confirm";

/// Echo a caller-supplied name only when it is a plain identifier.
std::string printable_name(const std::string &name) {
  if (!name.empty() && security::is_allowed(name, security::ArgumentClass::Identifier)) {
    return "'" + name + "'";
  }
  return "(invalid name)";
}

std::string fill_prompt(const tools::ToolSpec &spec, const tools::ToolArgs &arguments) {
  const std::string subject =
      spec.params.empty() ? std::string() : tools::arg(arguments, spec.params.front().name);
  std::string prompt = spec.confirm_prompt.empty()
                           ? "'" + spec.name + "' makes a destructive change."
                           : spec.confirm_prompt;
  if (const auto pos = prompt.find("{}"); pos != std::string::npos) {
    prompt.replace(pos, 2, subject);
  }
  return prompt + " Set confirm=yes to proceed.";
}

} // namespace

Dispatcher::Dispatcher(tools::ToolRegistry registry, security::InputSanitizer sanitizer,
                       std::shared_ptr<audit::AuditLog> audit)
    : registry_(std::move(registry)), sanitizer_(std::move(sanitizer)), audit_(std::move(audit)) {}

std::string Dispatcher::dispatch(const std::string &tool, const tools::ToolArgs &arguments) {
  return execute(CallRequest{.id = "", .tool = tool, .arguments = arguments}).text;
}

CallResult Dispatcher::execute(const CallRequest &call) {
  std::lock_guard<std::mutex> lock(call_mutex_);
  state_.store(DispatchState::InFlight);
  observability::record_metric(observability::InFlightMetric{.count = 1});
  const auto started = std::chrono::steady_clock::now();

  CallResult out;
  out.id = call.id;
  out.tool = call.tool;

  common::ErrorKind kind = common::ErrorKind::None;
  std::string digest;
  const tools::ToolEntry *entry = registry_.get_tool(call.tool);
  if (entry == nullptr) {
    kind = common::ErrorKind::NotFound;
    out.severity = tools::Severity::Error;
    out.text = "ERROR: Unknown tool " + printable_name(call.tool);
  } else {
    const auto outcome = invoke(*entry, call.arguments);
    if (outcome.ok()) {
      out.severity = outcome.value().severity;
      digest = outcome.value().backup_digest;
      out.text = std::string(tools::severity_prefix(out.severity)) + ": " +
                 sanitizer_.mask(outcome.value().text);
    } else {
      kind = outcome.kind();
      out.severity = tools::Severity::Error;
      out.text = "ERROR: " + sanitizer_.mask(outcome.error());
      observability::record_error(call.tool, std::string(common::error_kind_name(kind)));
    }
  }

  const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  journal(call.tool, out, kind, duration, digest);
  observability::record_metric(observability::ToolLatencyMetric{.latency = duration});
  observability::record_metric(observability::InFlightMetric{.count = 0});
  state_.store(DispatchState::Idle);
  return out;
}

common::Result<tools::ToolOutcome> Dispatcher::invoke(const tools::ToolEntry &entry,
                                                      const tools::ToolArgs &arguments) const {
  for (const auto &[name, value] : arguments) {
    (void)value;
    bool declared = false;
    for (const auto &param : entry.spec.params) {
      declared = declared || param.name == name;
    }
    if (!declared) {
      return common::Result<tools::ToolOutcome>::failure(
          common::ErrorKind::InvalidArgument, "Unknown argument " + printable_name(name) +
                                                  " for " + entry.spec.name);
    }
  }

  tools::ToolArgs marshalled;
  for (const auto &param : entry.spec.params) {
    const auto it = arguments.find(param.name);
    std::string value = it == arguments.end() ? std::string() : it->second;
    if (common::trim(value).empty()) {
      if (param.required) {
        return common::Result<tools::ToolOutcome>::failure(
            common::ErrorKind::InvalidArgument, "Missing argument: " + param.name);
      }
      value = param.default_value;
    }
    const auto allowed = sanitizer_.check(value, param.cls, param.name);
    if (!allowed.ok()) {
      return common::Result<tools::ToolOutcome>::failure(allowed);
    }
    marshalled[param.name] = std::move(value);
  }

  if (entry.spec.destructive && !common::is_truthy(tools::arg(marshalled, kConfirmArg))) {
    return common::Result<tools::ToolOutcome>::success(
        tools::ToolOutcome::warning(fill_prompt(entry.spec, marshalled)));
  }

  try {
    return entry.handler(marshalled);
  } catch (const std::exception &ex) {
    observability::record_error(entry.spec.name, ex.what());
    return common::Result<tools::ToolOutcome>::failure(common::ErrorKind::Internal,
                                                       "Internal error in " + entry.spec.name);
  }
}

void Dispatcher::journal(const std::string &tool, const CallResult &result,
                         const common::ErrorKind kind, const std::chrono::milliseconds duration,
                         const std::string &digest) {
  const std::string outcome =
      common::to_lower(std::string(tools::severity_prefix(result.severity)));
  observability::record_tool_call(tool, duration, outcome);
  if (!audit_) {
    return;
  }
  audit::AuditEntry entry;
  entry.tool = tool;
  entry.outcome = outcome;
  if (kind != common::ErrorKind::None) {
    entry.error_kind = std::string(common::error_kind_name(kind));
  }
  entry.duration_ms = duration.count();
  entry.backup_digest = digest;
  const auto recorded = audit_->record(entry);
  if (!recorded.ok()) {
    observability::record_error("audit", recorded.error());
  }
}

} // namespace playwarden::dispatch
