#pragma once

#include "playwarden/common/result.hpp"
#include "playwarden/config/schema.hpp"
#include "playwarden/engine/ansible.hpp"

#include <memory>
#include <string>
#include <vector>

namespace playwarden::devices {

struct PingReport {
  engine::ExecutionResult execution;
  std::size_t reachable = 0;
  std::size_t failed = 0;
};

struct PushConfigRequest {
  std::string target;
  /// One configuration statement per line; blank lines are ignored.
  std::string lines;
  std::string format = "set";
  bool commit = true;
  bool check = false;
};

struct AdhocRequest {
  std::string target = "all";
  std::string module;
  std::string module_args;
};

/// Single-module engine runs against inventory targets.
class DeviceOps {
public:
  DeviceOps(config::DevicesConfig modules, std::shared_ptr<const engine::AnsibleEngine> engine);

  [[nodiscard]] common::Result<PingReport> ping(const std::string &target) const;
  [[nodiscard]] common::Result<engine::ExecutionResult> facts(const std::string &target,
                                                              const std::string &subset) const;
  /// `format` is one of `text`, `set`, `json`, `xml`.
  [[nodiscard]] common::Result<engine::ExecutionResult>
  running_config(const std::string &target, const std::string &format) const;
  /// Comma separated operational commands.
  [[nodiscard]] common::Result<engine::ExecutionResult>
  run_commands(const std::string &target, const std::string &commands) const;
  [[nodiscard]] common::Result<engine::ExecutionResult>
  push_config(const PushConfigRequest &request) const;
  /// Only modules on the configured allow-list, never against localhost.
  [[nodiscard]] common::Result<engine::ExecutionResult> adhoc(const AdhocRequest &request) const;
  [[nodiscard]] bool adhoc_allowed(const std::string &module) const;

private:
  [[nodiscard]] common::Result<engine::ExecutionResult>
  invoke(const engine::AdhocInvocation &invocation) const;

  config::DevicesConfig modules_;
  std::shared_ptr<const engine::AnsibleEngine> engine_;
};

/// `shell`, `command`, `raw`, `script` or `expect`, bare or under
/// `ansible.builtin.`/`ansible.legacy.`.
[[nodiscard]] bool is_shell_module(const std::string &module);

/// `["a","b"]` with JSON string escaping.
[[nodiscard]] std::string json_string_list(const std::vector<std::string> &values);

} // namespace playwarden::devices
