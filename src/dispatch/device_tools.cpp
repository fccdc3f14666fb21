#include "playwarden/dispatch/tool_set.hpp"

#include "playwarden/common/fs.hpp"
#include "tool_support.hpp"

namespace playwarden::dispatch {

using detail::ArgumentClass;
using detail::optional_param;
using detail::required_param;
using Outcome = common::Result<tools::ToolOutcome>;

namespace {

tools::ToolParam target_param(std::string fallback = "all") {
  return optional_param("target_hosts", "Inventory host pattern", ArgumentClass::ProcessArgument,
                        std::move(fallback));
}

Outcome from_run(const common::Result<engine::ExecutionResult> &result,
                 const std::string &header = "") {
  if (!result.ok()) {
    return Outcome::failure(result);
  }
  return detail::outcome_from_run(result.value(), header);
}

} // namespace

void register_device_tools(tools::ToolRegistry &registry, const Services &services) {
  const auto devices = services.devices;

  registry.register_tool(
      tools::ToolSpec{
          .name = "ansible_adhoc_command",
          .description = "Run an allow-listed ad-hoc module, e.g. "
                         "junipernetworks.junos.junos_command or ping. Shell modules and "
                         "localhost are refused",
          .params = {required_param("module_name", "Module to run", ArgumentClass::Identifier),
                     optional_param("module_args", "Passed to -a", ArgumentClass::ContentBody),
                     target_param()},
          .group = "devices"},
      [devices](const tools::ToolArgs &args) -> Outcome {
        devices::AdhocRequest request;
        request.module = tools::arg(args, "module_name");
        request.module_args = tools::arg(args, "module_args");
        request.target = tools::arg(args, "target_hosts");
        return from_run(devices->adhoc(request));
      });

  registry.register_tool(
      tools::ToolSpec{.name = "ansible_ping_devices",
                      .description = "Test connectivity to devices with the ping module",
                      .params = {target_param()},
                      .group = "devices"},
      [devices](const tools::ToolArgs &args) -> Outcome {
        const auto report = devices->ping(tools::arg(args, "target_hosts"));
        if (!report.ok()) {
          return Outcome::failure(report);
        }
        const std::string header = "=== CONNECTIVITY ===\nReachable: " +
                                   std::to_string(report.value().reachable) +
                                   "\nFailed: " + std::to_string(report.value().failed) + "\n";
        return detail::outcome_from_run(report.value().execution, header);
      });

  registry.register_tool(
      tools::ToolSpec{.name = "ansible_get_facts",
                      .description = "Gather device facts, optionally limited to a subset",
                      .params = {target_param(),
                                 optional_param("gather_subset",
                                                "e.g. hardware, config, interfaces",
                                                ArgumentClass::ProcessArgument)},
                      .group = "devices"},
      [devices](const tools::ToolArgs &args) -> Outcome {
        return from_run(
            devices->facts(tools::arg(args, "target_hosts"), tools::arg(args, "gather_subset")));
      });

  registry.register_tool(
      tools::ToolSpec{.name = "ansible_get_config",
                      .description = "Retrieve the running configuration (text, set, json, xml)",
                      .params = {target_param(),
                                 optional_param("config_format", "text, set, json or xml",
                                                ArgumentClass::Identifier, "text")},
                      .group = "devices"},
      [devices](const tools::ToolArgs &args) -> Outcome {
        return from_run(devices->running_config(tools::arg(args, "target_hosts"),
                                                tools::arg(args, "config_format")));
      });

  registry.register_tool(
      tools::ToolSpec{.name = "ansible_run_command",
                      .description = "Run operational commands; separate several with commas",
                      .params = {target_param(),
                                 required_param("commands", "e.g. show version,show interfaces",
                                                ArgumentClass::ContentBody)},
                      .group = "devices"},
      [devices](const tools::ToolArgs &args) -> Outcome {
        return from_run(
            devices->run_commands(tools::arg(args, "target_hosts"), tools::arg(args, "commands")));
      });

  registry.register_tool(
      tools::ToolSpec{
          .name = "ansible_push_config",
          .description = "Push configuration lines to devices; commit=no leaves a candidate",
          .params = {required_param("target_hosts", "Inventory host pattern",
                                    ArgumentClass::ProcessArgument),
                     required_param("config_lines", "One statement per line",
                                    ArgumentClass::ContentBody),
                     optional_param("config_format", "set, text or json", ArgumentClass::Identifier,
                                    "set"),
                     optional_param("commit", "yes or no", ArgumentClass::Identifier, "yes"),
                     optional_param("check_mode", "yes for a dry run", ArgumentClass::Identifier,
                                    "no")},
          .group = "devices"},
      [devices](const tools::ToolArgs &args) -> Outcome {
        devices::PushConfigRequest request;
        request.target = tools::arg(args, "target_hosts");
        request.lines = tools::arg(args, "config_lines");
        request.format = tools::arg(args, "config_format");
        request.commit = common::is_truthy(tools::arg(args, "commit"));
        request.check = common::is_truthy(tools::arg(args, "check_mode"));
        return from_run(devices->push_config(request), request.check ? "=== DRY RUN ===" : "");
      });
}

} // namespace playwarden::dispatch
