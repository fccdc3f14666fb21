#include "playwarden/dispatch/tool_set.hpp"

#include "tool_support.hpp"

#include <sstream>

namespace playwarden::dispatch {

using detail::ArgumentClass;
using detail::optional_param;
using detail::required_param;
using Outcome = common::Result<tools::ToolOutcome>;

namespace {

struct ScopeText {
  vars::VariableScope scope;
  const char *title;
  const char *argument;
  const char *noun;
};

constexpr ScopeText kGroupScope{vars::VariableScope::Group, "GROUP VARS", "group_name", "group"};
constexpr ScopeText kHostScope{vars::VariableScope::Host, "HOST VARS", "hostname", "host"};

std::string render_scope(const std::vector<vars::VariableFileInfo> &files, const ScopeText &text) {
  std::ostringstream out;
  out << text.title << " (" << vars::scope_directory(text.scope) << "/):";
  std::size_t shown = 0;
  for (const auto &file : files) {
    if (file.scope == text.scope) {
      out << "\n  " << file.name << " -> " << file.relative_path;
      ++shown;
    }
  }
  if (shown == 0) {
    out << "\n  (no files)";
  }
  return out.str();
}

void register_scope_tools(tools::ToolRegistry &registry,
                          const std::shared_ptr<const vars::VariableStore> &variables,
                          const ScopeText &text, const std::string &read_name,
                          const std::string &write_name) {
  registry.register_tool(
      tools::ToolSpec{.name = read_name,
                      .description = "Read a " + std::string(vars::scope_directory(text.scope)) +
                                     " file; without a name, list the available ones",
                      .params = {optional_param(text.argument, std::string("Inventory ") + text.noun,
                                                ArgumentClass::Identifier)},
                      .group = "variables"},
      [variables, text](const tools::ToolArgs &args) -> Outcome {
        const std::string name = tools::arg(args, text.argument);
        if (name.empty()) {
          const auto files = variables->list();
          if (!files.ok()) {
            return Outcome::failure(files);
          }
          return Outcome::success(tools::ToolOutcome::success(render_scope(files.value(), text)));
        }
        const auto content = variables->read(text.scope, name);
        if (!content.ok()) {
          return Outcome::failure(content);
        }
        return Outcome::success(tools::ToolOutcome::success(
            "=== " + std::string(text.title) + ": " + name + " ===\n\n" + content.value()));
      });

  registry.register_tool(
      tools::ToolSpec{.name = write_name,
                      .description = "Replace a " + std::string(vars::scope_directory(text.scope)) +
                                     " file; content must be a YAML mapping",
                      .params = {required_param(text.argument, std::string("Inventory ") + text.noun,
                                                ArgumentClass::Identifier),
                                 required_param("content", "YAML variables",
                                                ArgumentClass::ContentBody)},
                      .group = "variables"},
      [variables, text](const tools::ToolArgs &args) -> Outcome {
        const std::string name = tools::arg(args, text.argument);
        const auto written = variables->write(text.scope, name, tools::arg(args, "content"));
        if (!written.ok()) {
          return Outcome::failure(written);
        }
        return Outcome::success(tools::ToolOutcome::success(
            variables->relative_path(text.scope, name) + " updated." +
                detail::backup_note(written.value()),
            detail::backup_digest(written.value())));
      });
}

} // namespace

void register_variable_tools(tools::ToolRegistry &registry, const Services &services) {
  const auto variables = services.variables;

  registry.register_tool(
      tools::ToolSpec{.name = "ansible_list_vars",
                      .description = "List all group_vars and host_vars files",
                      .params = {},
                      .group = "variables"},
      [variables](const tools::ToolArgs &) -> Outcome {
        const auto files = variables->list();
        if (!files.ok()) {
          return Outcome::failure(files);
        }
        return Outcome::success(tools::ToolOutcome::success(
            "=== VARIABLES ===\n\n" + render_scope(files.value(), kGroupScope) + "\n\n" +
            render_scope(files.value(), kHostScope)));
      });

  register_scope_tools(registry, variables, kGroupScope, "ansible_read_group_vars",
                       "ansible_write_group_vars");
  register_scope_tools(registry, variables, kHostScope, "ansible_read_host_vars",
                       "ansible_write_host_vars");
}

} // namespace playwarden::dispatch
