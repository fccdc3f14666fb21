#include "playwarden/dispatch/tool_set.hpp"

namespace playwarden::dispatch {

tools::ToolRegistry build_tool_registry(const Services &services) {
  tools::ToolRegistry registry;
  register_workspace_tools(registry, services);
  register_inventory_tools(registry, services);
  register_variable_tools(registry, services);
  register_playbook_tools(registry, services);
  register_device_tools(registry, services);
  register_template_tools(registry, services);
  register_audit_tools(registry, services);
  return registry;
}

} // namespace playwarden::dispatch
