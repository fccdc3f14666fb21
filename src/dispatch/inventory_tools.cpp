#include "playwarden/dispatch/tool_set.hpp"

#include "playwarden/common/fs.hpp"
#include "playwarden/common/json_util.hpp"
#include "tool_support.hpp"

#include <algorithm>
#include <sstream>

namespace playwarden::dispatch {

using detail::ArgumentClass;
using detail::optional_param;
using detail::required_param;
using Outcome = common::Result<tools::ToolOutcome>;

namespace {

/// Secret values are hidden outright. Values that would split or span lines
/// are quoted so the line-level mask always sees the whole value.
std::string render_value(const security::InputSanitizer &sanitizer, const std::string &key,
                         const std::string &value) {
  if (sanitizer.is_secret_key(key)) {
    return security::MASK_MARKER;
  }
  if (value.find_first_of(" \t\r\n\"") == std::string::npos) {
    return value;
  }
  return "\"" + common::json_escape(value) + "\"";
}

std::string render_vars(const security::InputSanitizer &sanitizer,
                        const inventory::VariableList &vars) {
  std::string out;
  for (const auto &[key, value] : vars) {
    out += " " + key + "=" + render_value(sanitizer, key, value);
  }
  return out;
}

std::string render_listing(const security::InputSanitizer &sanitizer,
                           const inventory::InventoryListing &listing, const bool show_vars) {
  std::vector<std::string> hosts;
  for (const auto &group : listing.groups) {
    for (const auto &host : group.hosts) {
      if (std::find(hosts.begin(), hosts.end(), host.name) == hosts.end()) {
        hosts.push_back(host.name);
      }
    }
  }

  std::ostringstream out;
  out << "=== INVENTORY ===\n\nTotal Hosts: " << listing.total_hosts;
  if (!hosts.empty()) {
    out << "\nHosts: " << common::join(hosts, ", ");
  }

  std::size_t shown = 0;
  std::ostringstream groups;
  for (const auto &group : listing.groups) {
    if (group.name == "all" && group.hosts.empty() && (!show_vars || group.vars.empty())) {
      continue;
    }
    ++shown;
    std::vector<std::string> members;
    for (const auto &host : group.hosts) {
      members.push_back(host.name);
    }
    groups << "\n  [" << group.name << "]: " << common::join(members, ", ");
    if (!group.children.empty()) {
      groups << "\n    children: " << common::join(group.children, ", ");
    }
    if (show_vars) {
      if (!group.vars.empty()) {
        groups << "\n    vars:" << render_vars(sanitizer, group.vars);
      }
      for (const auto &host : group.hosts) {
        if (!host.vars.empty()) {
          groups << "\n    " << host.name << ":" << render_vars(sanitizer, host.vars);
        }
      }
    }
  }
  if (shown > 0) {
    out << "\n\nGroups (" << shown << "):" << groups.str();
  }
  return out.str();
}

} // namespace

void register_inventory_tools(tools::ToolRegistry &registry, const Services &services) {
  const auto inventory = services.inventory;
  const auto variables = services.variables;
  const auto sanitizer = services.sanitizer;

  registry.register_tool(
      tools::ToolSpec{.name = "ansible_read_inventory",
                      .description = "Read the inventory file",
                      .params = {},
                      .group = "inventory"},
      [inventory](const tools::ToolArgs &) -> Outcome {
        const auto content = inventory->read();
        if (!content.ok()) {
          if (content.kind() == common::ErrorKind::NotFound) {
            return Outcome::failure(common::ErrorKind::NotFound,
                                    "Inventory file not found at " + inventory->relative_path() +
                                        "\n\nUse ansible_write_inventory to create one.");
          }
          return Outcome::failure(content);
        }
        return Outcome::success(tools::ToolOutcome::success(
            "=== INVENTORY: " + inventory->relative_path() + " ===\n\n" + content.value()));
      });

  registry.register_tool(
      tools::ToolSpec{.name = "ansible_write_inventory",
                      .description = "Replace the inventory file; content must be valid INI "
                                     "inventory",
                      .params = {required_param("content", "Full inventory content",
                                                ArgumentClass::ContentBody)},
                      .group = "inventory"},
      [inventory](const tools::ToolArgs &args) -> Outcome {
        const auto written = inventory->write(tools::arg(args, "content"));
        if (!written.ok()) {
          return Outcome::failure(written);
        }
        return Outcome::success(tools::ToolOutcome::success(
            "Inventory updated." + detail::backup_note(written.value()),
            detail::backup_digest(written.value())));
      });

  registry.register_tool(
      tools::ToolSpec{
          .name = "ansible_add_host",
          .description = "Add a host to a group in the inventory",
          .params = {required_param("hostname", "Inventory host name", ArgumentClass::Identifier),
                     required_param("ansible_host", "Management address",
                                    ArgumentClass::PathFragment),
                     optional_param("group", "Group to add the host to", ArgumentClass::Identifier,
                                    "all"),
                     optional_param("extra_vars", "Space separated key=value pairs",
                                    ArgumentClass::ProcessArgument)},
          .group = "inventory"},
      [inventory](const tools::ToolArgs &args) -> Outcome {
        inventory::AddHostRequest request;
        request.host = tools::arg(args, "hostname");
        request.address = tools::arg(args, "ansible_host");
        request.group = tools::arg(args, "group");
        request.extra_vars = tools::arg(args, "extra_vars");
        const auto written = inventory->add_host(request);
        if (!written.ok()) {
          return Outcome::failure(written);
        }
        return Outcome::success(tools::ToolOutcome::success(
            "Added host '" + request.host + "' (" + request.address + ") to group '" +
                request.group + "'" + detail::backup_note(written.value()),
            detail::backup_digest(written.value())));
      });

  registry.register_tool(
      tools::ToolSpec{.name = "ansible_remove_host",
                      .description = "Remove a host from the inventory",
                      .params = {required_param("hostname", "Inventory host name",
                                                ArgumentClass::Identifier),
                                 detail::confirm_param()},
                      .destructive = true,
                      .confirm_prompt = "This will remove '{}' from inventory.",
                      .group = "inventory"},
      [inventory](const tools::ToolArgs &args) -> Outcome {
        const std::string host = tools::arg(args, "hostname");
        const auto removed = inventory->remove_host(host);
        if (!removed.ok()) {
          return Outcome::failure(removed);
        }
        return Outcome::success(
            tools::ToolOutcome::success("Removed host '" + host + "' from inventory.\nBackup: " +
                                            removed.value().backup_path,
                                        removed.value().digest));
      });

  registry.register_tool(
      tools::ToolSpec{.name = "ansible_list_inventory",
                      .description = "List all hosts and groups in the inventory",
                      .params = {optional_param("show_vars", "yes to include inline variables",
                                                ArgumentClass::Identifier, "no")},
                      .group = "inventory"},
      [inventory, sanitizer](const tools::ToolArgs &args) -> Outcome {
        const auto listing = inventory->list();
        if (!listing.ok()) {
          return Outcome::failure(listing);
        }
        const bool show_vars = common::is_truthy(tools::arg(args, "show_vars"));
        return Outcome::success(
            tools::ToolOutcome::success(render_listing(*sanitizer, listing.value(), show_vars)));
      });

  registry.register_tool(
      tools::ToolSpec{.name = "ansible_show_host_vars",
                      .description = "Show the effective variables of a host with their sources",
                      .params = {required_param("hostname", "Inventory host name",
                                                ArgumentClass::Identifier)},
                      .group = "inventory"},
      [variables, sanitizer](const tools::ToolArgs &args) -> Outcome {
        const auto effective = variables->effective(tools::arg(args, "hostname"));
        if (!effective.ok()) {
          return Outcome::failure(effective);
        }
        std::ostringstream out;
        out << "=== EFFECTIVE VARIABLES: " << effective.value().host << " ===\n";
        if (effective.value().values.empty()) {
          out << "\n(no variables)";
        }
        for (const auto &value : effective.value().values) {
          out << "\n"
              << value.key << ": " << render_value(*sanitizer, value.key, value.value)
              << "    # " << value.source;
        }
        return Outcome::success(tools::ToolOutcome::success(out.str()));
      });
}

} // namespace playwarden::dispatch
