#include "playwarden/dispatch/tool_set.hpp"

#include "tool_support.hpp"

namespace playwarden::dispatch {

using detail::ArgumentClass;
using detail::required_param;
using Outcome = common::Result<tools::ToolOutcome>;

void register_template_tools(tools::ToolRegistry &registry, const Services &services) {
  const auto templates = services.templates;

  registry.register_tool(
      tools::ToolSpec{.name = "ansible_list_templates",
                      .description = "List the Jinja2 templates in templates/",
                      .params = {},
                      .group = "templates"},
      [templates](const tools::ToolArgs &) -> Outcome {
        const auto names = templates->list();
        if (!names.ok()) {
          return Outcome::failure(names);
        }
        if (names.value().empty()) {
          return Outcome::success(tools::ToolOutcome::success(
              "No templates found.\n\nUse ansible_create_template to create one."));
        }
        std::string text = "=== TEMPLATES ===\n";
        for (const auto &name : names.value()) {
          text += "\n- " + name;
        }
        return Outcome::success(tools::ToolOutcome::success(std::move(text)));
      });

  registry.register_tool(
      tools::ToolSpec{.name = "ansible_read_template",
                      .description = "Read a Jinja2 template",
                      .params = {required_param("template_name", "Template name",
                                                ArgumentClass::Identifier)},
                      .group = "templates"},
      [templates](const tools::ToolArgs &args) -> Outcome {
        const std::string name = workspace::TemplateStore::normalize_name(
            tools::arg(args, "template_name"));
        const auto content = templates->read(name);
        if (!content.ok()) {
          return Outcome::failure(content);
        }
        return Outcome::success(
            tools::ToolOutcome::success("=== TEMPLATE: " + name + " ===\n\n" + content.value()));
      });

  registry.register_tool(
      tools::ToolSpec{.name = "ansible_create_template",
                      .description = "Create a new Jinja2 template",
                      .params = {required_param("template_name", "Template name",
                                                ArgumentClass::Identifier),
                                 required_param("content", "Template body",
                                                ArgumentClass::ContentBody)},
                      .group = "templates"},
      [templates](const tools::ToolArgs &args) -> Outcome {
        const auto created =
            templates->create(tools::arg(args, "template_name"), tools::arg(args, "content"));
        if (!created.ok()) {
          return Outcome::failure(created);
        }
        return Outcome::success(
            tools::ToolOutcome::success("Template '" + created.value() + "' created."));
      });
}

} // namespace playwarden::dispatch
