#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace playwarden::config {

struct WorkspaceConfig {
  std::filesystem::path root;
  std::string inventory = "inventory/hosts.ini";
};

struct EngineConfig {
  std::string playbook_binary = "ansible-playbook";
  std::string adhoc_binary = "ansible";
  bool host_key_checking = false;
  std::uint32_t default_timeout_seconds = 300;
  std::uint32_t syntax_timeout_seconds = 60;
  std::uint32_t device_timeout_seconds = 180;
};

struct DevicesConfig {
  std::string facts_module = "junipernetworks.junos.junos_facts";
  std::string config_module = "junipernetworks.junos.junos_config";
  std::string command_module = "junipernetworks.junos.junos_command";
  /// Modules `ansible_adhoc_command` may run besides the three above. A
  /// trailing `*` matches any suffix. Shell-style modules are refused even
  /// when listed.
  std::vector<std::string> adhoc_modules = {"ping",    "ansible.builtin.ping",
                                            "setup",   "ansible.builtin.setup",
                                            "junos_*", "junipernetworks.junos.*"};
};

struct MaskingConfig {
  std::vector<std::string> keywords = {"password", "passwd", "secret", "token",
                                       "key",      "credential", "private"};
  std::vector<std::string> exempt_keys = {"host_key_checking"};
};

struct AuditConfig {
  bool enabled = true;
  std::string path;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  WorkspaceConfig workspace;
  EngineConfig engine;
  DevicesConfig devices;
  MaskingConfig masking;
  AuditConfig audit;
  ObservabilityConfig observability;
};

} // namespace playwarden::config
