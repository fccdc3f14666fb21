#include "playwarden/dispatch/tool_set.hpp"

#include "playwarden/common/fs.hpp"
#include "tool_support.hpp"

#include <sstream>

namespace playwarden::dispatch {

using detail::ArgumentClass;
using detail::optional_param;
using detail::required_param;
using Outcome = common::Result<tools::ToolOutcome>;

namespace {

std::string render_tree(const std::filesystem::path &root,
                        const std::vector<workspace::TreeEntry> &entries) {
  std::ostringstream out;
  out << "=== WORKSPACE STRUCTURE ===\nBase: " << root.string() << "\n";
  if (entries.empty()) {
    out << "\n(empty)";
  }
  for (const auto &entry : entries) {
    out << "\n" << std::string(entry.depth * 2, ' ') << entry.name;
    if (entry.is_directory) {
      out << "/";
    } else {
      out << " (" << entry.size << " bytes)";
    }
  }
  return out.str();
}

std::string render_backups(const std::string &path, const std::vector<workspace::Backup> &backups) {
  if (backups.empty()) {
    return "No backups found for " + path;
  }
  std::ostringstream out;
  out << "=== BACKUPS: " << path << " ===\n";
  for (const auto &backup : backups) {
    out << "\n" << backup.backup_path << "  " << common::iso8601_utc(backup.timestamp) << "  sha256:"
        << backup.digest.substr(0, 12);
  }
  out << "\n\nTotal: " << backups.size() << " backup(s)";
  return out.str();
}

} // namespace

void register_workspace_tools(tools::ToolRegistry &registry, const Services &services) {
  const auto files = services.files;

  registry.register_tool(
      tools::ToolSpec{.name = "ansible_show_structure",
                      .description = "Show the workspace directory structure and all files",
                      .params = {},
                      .group = "workspace"},
      [files](const tools::ToolArgs &) -> Outcome {
        const auto entries = files->structure();
        if (!entries.ok()) {
          return Outcome::failure(entries);
        }
        return Outcome::success(tools::ToolOutcome::success(
            render_tree(files->backups().guard().root(), entries.value())));
      });

  registry.register_tool(
      tools::ToolSpec{.name = "ansible_read_file",
                      .description = "Read any file in the workspace, or list a directory",
                      .params = {required_param("file_path",
                                                "Path relative to the workspace, e.g. "
                                                "inventory/hosts.ini",
                                                ArgumentClass::PathFragment)},
                      .group = "workspace"},
      [files](const tools::ToolArgs &args) -> Outcome {
        const auto view = files->read_file(tools::arg(args, "file_path"));
        if (!view.ok()) {
          return Outcome::failure(view);
        }
        const auto &file = view.value();
        if (file.is_directory) {
          std::string text = "'" + file.relative_path + "' is a directory containing:";
          for (const auto &entry : file.entries) {
            text += "\n  - " + entry;
          }
          return Outcome::success(tools::ToolOutcome::success(std::move(text)));
        }
        std::string text = "=== FILE: " + file.relative_path + " ===\n\n" + file.content;
        if (file.truncated) {
          return Outcome::success(tools::ToolOutcome::warning(text + engine::TRUNCATION_MARKER));
        }
        return Outcome::success(tools::ToolOutcome::success(std::move(text)));
      });

  registry.register_tool(
      tools::ToolSpec{.name = "ansible_write_file",
                      .description = "Write a file in the workspace; the old content is backed up",
                      .params = {required_param("file_path", "Path relative to the workspace",
                                                ArgumentClass::PathFragment),
                                 required_param("content", "New file content",
                                                ArgumentClass::ContentBody)},
                      .group = "workspace"},
      [files](const tools::ToolArgs &args) -> Outcome {
        const std::string path = tools::arg(args, "file_path");
        const auto written = files->write_file(path, tools::arg(args, "content"));
        if (!written.ok()) {
          return Outcome::failure(written);
        }
        return Outcome::success(tools::ToolOutcome::success(
            "File written: " + path + detail::backup_note(written.value()),
            detail::backup_digest(written.value())));
      });

  registry.register_tool(
      tools::ToolSpec{.name = "ansible_read_config",
                      .description = "Read ansible.cfg",
                      .params = {},
                      .group = "workspace"},
      [files](const tools::ToolArgs &) -> Outcome {
        const auto content = files->read_engine_config();
        if (!content.ok()) {
          if (content.kind() == common::ErrorKind::NotFound) {
            return Outcome::failure(common::ErrorKind::NotFound,
                                    "ansible.cfg not found. Use ansible_write_config to create one.");
          }
          return Outcome::failure(content);
        }
        return Outcome::success(
            tools::ToolOutcome::success("=== ANSIBLE.CFG ===\n\n" + content.value()));
      });

  registry.register_tool(
      tools::ToolSpec{.name = "ansible_write_config",
                      .description = "Replace ansible.cfg; content must be valid INI",
                      .params = {required_param("content", "INI formatted ansible.cfg",
                                                ArgumentClass::ContentBody)},
                      .group = "workspace"},
      [files](const tools::ToolArgs &args) -> Outcome {
        const auto written = files->write_engine_config(tools::arg(args, "content"));
        if (!written.ok()) {
          return Outcome::failure(written);
        }
        return Outcome::success(tools::ToolOutcome::success(
            "ansible.cfg updated." + detail::backup_note(written.value()),
            detail::backup_digest(written.value())));
      });

  registry.register_tool(
      tools::ToolSpec{.name = "ansible_list_backups",
                      .description = "List the backups kept for a workspace file",
                      .params = {required_param("file_path", "Path relative to the workspace",
                                                ArgumentClass::PathFragment)},
                      .group = "workspace"},
      [files](const tools::ToolArgs &args) -> Outcome {
        const std::string path = tools::arg(args, "file_path");
        const auto backups = files->list_backups(path);
        if (!backups.ok()) {
          return Outcome::failure(backups);
        }
        return Outcome::success(tools::ToolOutcome::success(render_backups(path, backups.value())));
      });

  registry.register_tool(
      tools::ToolSpec{.name = "ansible_restore_backup",
                      .description = "Restore a file from one of its backups",
                      .params = {required_param("backup_path",
                                                "Backup path as shown by ansible_list_backups",
                                                ArgumentClass::PathFragment),
                                 detail::confirm_param()},
                      .destructive = true,
                      .confirm_prompt = "This will overwrite the live file with '{}'.",
                      .group = "workspace"},
      [files](const tools::ToolArgs &args) -> Outcome {
        const std::string path = tools::arg(args, "backup_path");
        const auto restored = files->restore_backup(path);
        if (!restored.ok()) {
          return Outcome::failure(restored);
        }
        return Outcome::success(tools::ToolOutcome::success(
            "Restored from " + path + detail::backup_note(restored.value()),
            detail::backup_digest(restored.value())));
      });
}

} // namespace playwarden::dispatch
