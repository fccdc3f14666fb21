#include "playwarden/tools/tool_registry.hpp"

#include "playwarden/common/fs.hpp"

namespace playwarden::tools {

void ToolRegistry::register_tool(ToolSpec spec, ToolHandler handler) {
  const std::string key = common::to_lower(spec.name);
  auto entry = std::make_unique<ToolEntry>(ToolEntry{std::move(spec), std::move(handler)});
  if (const auto it = by_name_.find(key); it != by_name_.end()) {
    *it->second = std::move(*entry);
    return;
  }
  by_name_[key] = entry.get();
  tools_.push_back(std::move(entry));
}

const ToolEntry *ToolRegistry::get_tool(const std::string_view name) const {
  const auto it = by_name_.find(common::to_lower(std::string(name)));
  if (it == by_name_.end()) {
    return nullptr;
  }
  return it->second;
}

std::vector<ToolSpec> ToolRegistry::all_specs() const {
  std::vector<ToolSpec> specs;
  specs.reserve(tools_.size());
  for (const auto &tool : tools_) {
    specs.push_back(tool->spec);
  }
  return specs;
}

} // namespace playwarden::tools
