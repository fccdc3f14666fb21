#include "playwarden/dispatch/tool_set.hpp"

#include "playwarden/common/fs.hpp"
#include "tool_support.hpp"

#include <sstream>

namespace playwarden::dispatch {

using detail::ArgumentClass;
using detail::optional_param;
using detail::required_param;
using Outcome = common::Result<tools::ToolOutcome>;
using Store = std::shared_ptr<const playbooks::PlaybookStore>;

namespace {

tools::ToolParam playbook_param() {
  return optional_param("playbook_name", "Playbook name, e.g. backup_config.yml",
                        ArgumentClass::Identifier);
}

std::string available_playbooks(const Store &store) {
  const auto listed = store->list();
  if (!listed.ok() || listed.value().empty()) {
    return "";
  }
  std::string out = " Available:";
  for (const auto &playbook : listed.value()) {
    out += "\n- " + playbook.name;
  }
  return out;
}

/// Missing or unknown names get the list of playbooks that do exist.
template <typename T> Outcome with_available(const common::Result<T> &failed, const Store &store) {
  if (failed.kind() == common::ErrorKind::NotFound) {
    return Outcome::failure(failed.kind(), failed.error() + "." + available_playbooks(store));
  }
  return Outcome::failure(failed);
}

common::Result<std::string> require_name(const tools::ToolArgs &args, const Store &store) {
  const std::string name = tools::arg(args, "playbook_name");
  if (name.empty()) {
    return common::Result<std::string>::failure(common::ErrorKind::InvalidArgument,
                                                "No playbook specified." +
                                                    available_playbooks(store));
  }
  return common::Result<std::string>::success(name);
}

Outcome run_outcome(const playbooks::PlaybookRunReport &report) {
  std::string header;
  if (report.check_mode) {
    header = "=== DRY RUN (CHECK MODE) ===";
  }
  if (!report.summary.empty()) {
    if (!header.empty()) {
      header += "\n";
    }
    header += "=== SUMMARY ===\n" + report.summary + "\n\n=== FULL OUTPUT ===";
  }
  return detail::outcome_from_run(report.execution, header);
}

Outcome write_outcome(const playbooks::PlaybookWriteReport &report, const std::string &message) {
  const std::string digest = detail::backup_digest(report.backup);
  if (!report.validation.passed) {
    return Outcome::success(tools::ToolOutcome::warning(
        message + " but has syntax errors:\n" + report.validation.diagnostics +
            detail::backup_note(report.backup),
        digest));
  }
  return Outcome::success(tools::ToolOutcome::success(
      message + " and validated.\nPath: " + report.relative_path +
          detail::backup_note(report.backup),
      digest));
}

std::string render_list(const std::vector<playbooks::PlaybookInfo> &listed) {
  if (listed.empty()) {
    return "No playbooks found in playbooks/\n\nUse ansible_create_playbook to create one.";
  }
  std::ostringstream out;
  out << "=== PLAYBOOKS ===\n";
  for (const auto &playbook : listed) {
    out << "\n- " << playbook.name;
    if (playbook.legacy_root) {
      out << " (root)";
    }
    if (!playbook.description.empty()) {
      out << ": " << playbook.description;
    }
  }
  out << "\n\nTotal: " << listed.size() << " playbook(s)";
  return out.str();
}

} // namespace

void register_playbook_tools(tools::ToolRegistry &registry, const Services &services) {
  const Store store = services.playbooks;

  registry.register_tool(
      tools::ToolSpec{.name = "ansible_list_playbooks",
                      .description = "List all available playbooks with descriptions",
                      .params = {},
                      .group = "playbooks"},
      [store](const tools::ToolArgs &) -> Outcome {
        const auto listed = store->list();
        if (!listed.ok()) {
          return Outcome::failure(listed);
        }
        return Outcome::success(tools::ToolOutcome::success(render_list(listed.value())));
      });

  registry.register_tool(
      tools::ToolSpec{.name = "ansible_read_playbook",
                      .description = "Read the content of a playbook",
                      .params = {playbook_param()},
                      .group = "playbooks"},
      [store](const tools::ToolArgs &args) -> Outcome {
        const auto name = require_name(args, store);
        if (!name.ok()) {
          return Outcome::failure(name);
        }
        const auto content = store->read(name.value());
        if (!content.ok()) {
          return with_available(content, store);
        }
        return Outcome::success(tools::ToolOutcome::success(
            "=== PLAYBOOK: " + playbooks::normalize_playbook_name(name.value()) + " ===\n\n" +
            content.value()));
      });

  registry.register_tool(
      tools::ToolSpec{
          .name = "ansible_create_playbook",
          .description = "Create a new playbook and syntax-check it",
          .params = {required_param("playbook_name", "Name of the new playbook",
                                    ArgumentClass::Identifier),
                     required_param("content", "Playbook YAML", ArgumentClass::ContentBody),
                     optional_param("description", "One line description stored as a comment",
                                    ArgumentClass::ContentBody)},
          .group = "playbooks"},
      [store](const tools::ToolArgs &args) -> Outcome {
        const std::string name = tools::arg(args, "playbook_name");
        const std::string description = tools::arg(args, "description");
        const auto created = store->create(name, tools::arg(args, "content"),
                                           description.substr(0, description.find('\n')));
        if (!created.ok()) {
          return Outcome::failure(created);
        }
        return write_outcome(created.value(), "Playbook '" +
                                                  playbooks::normalize_playbook_name(name) +
                                                  "' created");
      });

  registry.register_tool(
      tools::ToolSpec{.name = "ansible_edit_playbook",
                      .description = "Replace the content of an existing playbook",
                      .params = {playbook_param(),
                                 optional_param("content", "New playbook YAML",
                                                ArgumentClass::ContentBody)},
                      .group = "playbooks"},
      [store](const tools::ToolArgs &args) -> Outcome {
        const auto name = require_name(args, store);
        if (!name.ok()) {
          return Outcome::failure(name);
        }
        const std::string content = tools::arg(args, "content");
        if (common::trim(content).empty()) {
          return Outcome::failure(common::ErrorKind::InvalidArgument, "No new content provided.");
        }
        const auto updated = store->update(name.value(), content);
        if (!updated.ok()) {
          return with_available(updated, store);
        }
        return write_outcome(updated.value(), "Playbook updated");
      });

  registry.register_tool(
      tools::ToolSpec{.name = "ansible_delete_playbook",
                      .description = "Delete a playbook (a backup is kept)",
                      .params = {playbook_param(), detail::confirm_param()},
                      .destructive = true,
                      .confirm_prompt = "This will delete '{}'.",
                      .group = "playbooks"},
      [store](const tools::ToolArgs &args) -> Outcome {
        const auto name = require_name(args, store);
        if (!name.ok()) {
          return Outcome::failure(name);
        }
        const auto removed = store->remove(name.value());
        if (!removed.ok()) {
          if (removed.kind() == common::ErrorKind::NotFound) {
            return Outcome::failure(common::ErrorKind::NotFound,
                                    "Playbook not found: " +
                                        playbooks::normalize_playbook_name(name.value()));
          }
          return Outcome::failure(removed);
        }
        return Outcome::success(tools::ToolOutcome::success(
            "Playbook '" + playbooks::normalize_playbook_name(name.value()) +
                "' deleted (backup created).\nBackup: " + removed.value().backup_path,
            removed.value().digest));
      });

  registry.register_tool(
      tools::ToolSpec{.name = "ansible_validate_playbook",
                      .description = "Run a syntax check on a playbook",
                      .params = {playbook_param()},
                      .group = "playbooks"},
      [store](const tools::ToolArgs &args) -> Outcome {
        const auto name = require_name(args, store);
        if (!name.ok()) {
          return Outcome::failure(name);
        }
        const auto report = store->validate(name.value());
        if (!report.ok()) {
          return with_available(report, store);
        }
        const std::string file = playbooks::normalize_playbook_name(name.value());
        if (!report.value().passed) {
          return Outcome::failure(common::ErrorKind::ParseError,
                                  "Syntax errors in '" + file + "':\n" +
                                      report.value().diagnostics);
        }
        return Outcome::success(
            tools::ToolOutcome::success("Playbook '" + file + "' syntax is valid."));
      });

  registry.register_tool(
      tools::ToolSpec{
          .name = "ansible_run_playbook",
          .description = "Run a playbook against the inventory",
          .params = {playbook_param(),
                     optional_param("limit_hosts", "Host pattern passed to --limit",
                                    ArgumentClass::ProcessArgument),
                     optional_param("extra_vars", "Passed to --extra-vars",
                                    ArgumentClass::ContentBody),
                     optional_param("tags", "Comma separated tags", ArgumentClass::ProcessArgument),
                     optional_param("verbose", "yes for -vvv output", ArgumentClass::Identifier,
                                    "no")},
          .group = "playbooks"},
      [store](const tools::ToolArgs &args) -> Outcome {
        const auto name = require_name(args, store);
        if (!name.ok()) {
          return Outcome::failure(name);
        }
        playbooks::RunRequest request;
        request.limit = tools::arg(args, "limit_hosts");
        request.extra_vars = tools::arg(args, "extra_vars");
        request.tags = tools::arg(args, "tags");
        request.verbose = common::is_truthy(tools::arg(args, "verbose"));
        const auto report = store->run(name.value(), request);
        if (!report.ok()) {
          return with_available(report, store);
        }
        return run_outcome(report.value());
      });

  registry.register_tool(
      tools::ToolSpec{.name = "ansible_check_playbook",
                      .description = "Dry run a playbook in check mode with diff",
                      .params = {playbook_param(),
                                 optional_param("limit_hosts", "Host pattern passed to --limit",
                                                ArgumentClass::ProcessArgument)},
                      .group = "playbooks"},
      [store](const tools::ToolArgs &args) -> Outcome {
        const auto name = require_name(args, store);
        if (!name.ok()) {
          return Outcome::failure(name);
        }
        const auto report = store->check(name.value(), tools::arg(args, "limit_hosts"));
        if (!report.ok()) {
          return with_available(report, store);
        }
        return run_outcome(report.value());
      });
}

} // namespace playwarden::dispatch
