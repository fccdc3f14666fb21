#pragma once

#include "playwarden/tools/tool.hpp"

#include <memory>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace playwarden::tools {

struct ToolEntry {
  ToolSpec spec;
  ToolHandler handler;
};

class ToolRegistry {
public:
  ToolRegistry() = default;

  /// A later registration under the same name replaces the earlier one.
  void register_tool(ToolSpec spec, ToolHandler handler);
  [[nodiscard]] const ToolEntry *get_tool(std::string_view name) const;
  [[nodiscard]] std::vector<ToolSpec> all_specs() const;
  [[nodiscard]] std::size_t size() const { return tools_.size(); }

private:
  std::vector<std::unique_ptr<ToolEntry>> tools_;
  std::unordered_map<std::string, ToolEntry *> by_name_;
};

} // namespace playwarden::tools
