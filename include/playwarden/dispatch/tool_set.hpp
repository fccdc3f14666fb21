#pragma once

#include "playwarden/audit/audit_log.hpp"
#include "playwarden/devices/device_ops.hpp"
#include "playwarden/inventory/inventory.hpp"
#include "playwarden/playbooks/playbook_store.hpp"
#include "playwarden/security/sanitizer.hpp"
#include "playwarden/tools/tool_registry.hpp"
#include "playwarden/vars/variable_store.hpp"
#include "playwarden/workspace/template_store.hpp"
#include "playwarden/workspace/workspace_files.hpp"

#include <memory>

namespace playwarden::dispatch {

/// Components the tool handlers operate on. `audit` may be null.
struct Services {
  std::shared_ptr<const workspace::WorkspaceFiles> files;
  std::shared_ptr<const inventory::InventoryStore> inventory;
  std::shared_ptr<const vars::VariableStore> variables;
  std::shared_ptr<const playbooks::PlaybookStore> playbooks;
  std::shared_ptr<const devices::DeviceOps> devices;
  std::shared_ptr<const workspace::TemplateStore> templates;
  std::shared_ptr<audit::AuditLog> audit;
  /// Structured renderers hide secret values before the text-level mask runs.
  std::shared_ptr<const security::InputSanitizer> sanitizer;
};

void register_workspace_tools(tools::ToolRegistry &registry, const Services &services);
void register_inventory_tools(tools::ToolRegistry &registry, const Services &services);
void register_variable_tools(tools::ToolRegistry &registry, const Services &services);
void register_playbook_tools(tools::ToolRegistry &registry, const Services &services);
void register_device_tools(tools::ToolRegistry &registry, const Services &services);
void register_template_tools(tools::ToolRegistry &registry, const Services &services);
void register_audit_tools(tools::ToolRegistry &registry, const Services &services);

/// Every tool, in the order `tools` lists them.
[[nodiscard]] tools::ToolRegistry build_tool_registry(const Services &services);

} // namespace playwarden::dispatch
