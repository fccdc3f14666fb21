#include "playwarden/devices/device_ops.hpp"

#include "playwarden/common/fs.hpp"
#include "playwarden/common/json_util.hpp"

namespace playwarden::devices {

namespace {

std::size_t count_occurrences(const std::string &text, const std::string &needle) {
  std::size_t count = 0;
  for (auto pos = text.find(needle); pos != std::string::npos;
       pos = text.find(needle, pos + needle.size())) {
    ++count;
  }
  return count;
}

std::string target_or_all(const std::string &target) {
  const std::string trimmed = common::trim(target);
  return trimmed.empty() ? "all" : trimmed;
}

constexpr const char *kShellModules[] = {"shell", "command", "raw", "script", "expect"};

bool matches_pattern(const std::string &module, const std::string &pattern) {
  if (!pattern.empty() && pattern.back() == '*') {
    return common::starts_with(module, pattern.substr(0, pattern.size() - 1));
  }
  return module == pattern;
}

bool is_loopback_host(std::string host) {
  while (!host.empty() && (host.front() == '&' || host.front() == '!')) {
    host.erase(0, 1);
  }
  host = common::to_lower(common::trim(host));
  return host == "localhost" || common::starts_with(host, "localhost.") || host == "::1" ||
         host == "[::1]" || common::starts_with(host, "127.") || host == "0.0.0.0";
}

/// Any element of a `,` or `:` separated pattern naming the control node.
bool targets_loopback(const std::string &target) {
  for (const auto &piece : common::split(target, ',')) {
    if (is_loopback_host(piece)) {
      return true;
    }
    for (const auto &part : common::split(piece, ':')) {
      if (is_loopback_host(part)) {
        return true;
      }
    }
  }
  return false;
}

} // namespace

bool is_shell_module(const std::string &module) {
  std::string name = common::to_lower(common::trim(module));
  for (const char *prefix : {"ansible.builtin.", "ansible.legacy."}) {
    if (common::starts_with(name, prefix)) {
      name = name.substr(std::string(prefix).size());
      break;
    }
  }
  for (const char *shell : kShellModules) {
    if (name == shell) {
      return true;
    }
  }
  return false;
}

bool DeviceOps::adhoc_allowed(const std::string &module) const {
  if (is_shell_module(module)) {
    return false;
  }
  if (module == modules_.facts_module || module == modules_.config_module ||
      module == modules_.command_module) {
    return true;
  }
  for (const auto &pattern : modules_.adhoc_modules) {
    if (matches_pattern(module, pattern)) {
      return true;
    }
  }
  return false;
}

std::string json_string_list(const std::vector<std::string> &values) {
  std::string out = "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += "\"" + common::json_escape(values[i]) + "\"";
  }
  out += "]";
  return out;
}

DeviceOps::DeviceOps(config::DevicesConfig modules,
                     std::shared_ptr<const engine::AnsibleEngine> engine)
    : modules_(std::move(modules)), engine_(std::move(engine)) {}

common::Result<engine::ExecutionResult>
DeviceOps::invoke(const engine::AdhocInvocation &invocation) const {
  return engine_->run(engine_->adhoc_argv(invocation),
                      std::chrono::seconds(engine_->settings().device_timeout_seconds));
}

common::Result<PingReport> DeviceOps::ping(const std::string &target) const {
  engine::AdhocInvocation invocation;
  invocation.target = target_or_all(target);
  invocation.module = "ping";
  auto result = invoke(invocation);
  if (!result.ok()) {
    return common::Result<PingReport>::failure(result);
  }

  PingReport report;
  report.execution = std::move(result.value());
  const std::string &output = report.execution.stdout_text;
  report.reachable = count_occurrences(output, "SUCCESS");
  report.failed = count_occurrences(output, "UNREACHABLE") + count_occurrences(output, "FAILED");
  return common::Result<PingReport>::success(std::move(report));
}

common::Result<engine::ExecutionResult> DeviceOps::facts(const std::string &target,
                                                         const std::string &subset) const {
  engine::AdhocInvocation invocation;
  invocation.target = target_or_all(target);
  invocation.module = modules_.facts_module;
  if (!common::trim(subset).empty()) {
    invocation.module_args = "gather_subset=" + common::trim(subset);
  }
  return invoke(invocation);
}

common::Result<engine::ExecutionResult> DeviceOps::running_config(const std::string &target,
                                                                  const std::string &format) const {
  const std::string display = common::trim(format).empty() ? "text" : common::trim(format);
  if (display != "text" && display != "set" && display != "json" && display != "xml") {
    return common::Result<engine::ExecutionResult>::failure(
        common::ErrorKind::InvalidArgument, "Invalid format. Use: text, set, json, xml");
  }
  engine::AdhocInvocation invocation;
  invocation.target = target_or_all(target);
  invocation.module = modules_.config_module;
  invocation.module_args = "display=" + display;
  return invoke(invocation);
}

common::Result<engine::ExecutionResult> DeviceOps::run_commands(const std::string &target,
                                                                const std::string &commands) const {
  std::vector<std::string> list;
  for (const auto &command : common::split(commands, ',')) {
    const std::string trimmed = common::trim(command);
    if (!trimmed.empty()) {
      list.push_back(trimmed);
    }
  }
  if (list.empty()) {
    return common::Result<engine::ExecutionResult>::failure(common::ErrorKind::InvalidArgument,
                                                            "No commands specified");
  }
  engine::AdhocInvocation invocation;
  invocation.target = target_or_all(target);
  invocation.module = modules_.command_module;
  invocation.module_args = "commands=" + json_string_list(list);
  return invoke(invocation);
}

common::Result<engine::ExecutionResult>
DeviceOps::push_config(const PushConfigRequest &request) const {
  if (common::trim(request.target).empty()) {
    return common::Result<engine::ExecutionResult>::failure(common::ErrorKind::InvalidArgument,
                                                            "No target hosts specified");
  }
  const std::string format = common::trim(request.format).empty() ? "set" : request.format;
  if (format != "set" && format != "text" && format != "json") {
    return common::Result<engine::ExecutionResult>::failure(
        common::ErrorKind::InvalidArgument, "Invalid format. Use: set, text, json");
  }

  std::vector<std::string> lines;
  for (const auto &line : common::split(request.lines, '\n')) {
    const std::string trimmed = common::trim(line);
    if (!trimmed.empty()) {
      lines.push_back(trimmed);
    }
  }
  if (lines.empty()) {
    return common::Result<engine::ExecutionResult>::failure(common::ErrorKind::InvalidArgument,
                                                            "No configuration provided");
  }

  engine::AdhocInvocation invocation;
  invocation.target = common::trim(request.target);
  invocation.module = modules_.config_module;
  invocation.module_args = "lines=" + json_string_list(lines) + " src_format=" + format +
                           " update=merge commit=" + (request.commit ? "yes" : "no");
  invocation.check = request.check;
  return invoke(invocation);
}

common::Result<engine::ExecutionResult> DeviceOps::adhoc(const AdhocRequest &request) const {
  if (common::trim(request.module).empty()) {
    return common::Result<engine::ExecutionResult>::failure(common::ErrorKind::InvalidArgument,
                                                            "No module specified");
  }
  const std::string module = common::trim(request.module);
  if (!adhoc_allowed(module)) {
    return common::Result<engine::ExecutionResult>::failure(
        common::ErrorKind::SanitizationRejected,
        "Module '" + module + "' is not allowed for ad-hoc runs");
  }
  const std::string target = target_or_all(request.target);
  if (targets_loopback(target)) {
    return common::Result<engine::ExecutionResult>::failure(
        common::ErrorKind::SanitizationRejected,
        "Ad-hoc runs against the control node are not allowed");
  }
  engine::AdhocInvocation invocation;
  invocation.target = target;
  invocation.module = module;
  invocation.module_args = request.module_args;
  return invoke(invocation);
}

} // namespace playwarden::devices
