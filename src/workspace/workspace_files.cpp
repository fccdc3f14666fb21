#include "playwarden/workspace/workspace_files.hpp"

#include "playwarden/common/fs.hpp"
#include "playwarden/common/keyvalue.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>

namespace playwarden::workspace {

namespace {

bool hidden_or_backup(const std::string &name) {
  return name.empty() || name.front() == '.' || common::ends_with(name, ".bak");
}

common::Status walk(const std::filesystem::path &directory, const std::size_t depth,
                    std::vector<TreeEntry> &out) {
  std::error_code ec;
  std::vector<std::filesystem::directory_entry> entries;
  for (std::filesystem::directory_iterator it(directory, ec), end; !ec && it != end;
       it.increment(ec)) {
    const auto &entry = *it;
    if (!hidden_or_backup(entry.path().filename().string())) {
      entries.push_back(entry);
    }
  }
  if (ec) {
    return common::Status::error(common::ErrorKind::Io, "Unable to list directory");
  }
  std::sort(entries.begin(), entries.end(),
            [](const auto &a, const auto &b) { return a.path().filename() < b.path().filename(); });

  for (const auto &entry : entries) {
    const bool is_directory = entry.is_directory(ec) && !entry.is_symlink(ec);
    TreeEntry item{.depth = depth,
                   .name = entry.path().filename().string(),
                   .is_directory = is_directory,
                   .size = 0};
    if (!is_directory) {
      const auto size = entry.file_size(ec);
      item.size = ec ? 0 : size;
      ec.clear();
    }
    out.push_back(item);
    if (is_directory) {
      const auto status = walk(entry.path(), depth + 1, out);
      if (!status.ok()) {
        return status;
      }
    }
  }
  return common::Status::success();
}

} // namespace

WorkspaceFiles::WorkspaceFiles(BackupManager backups, const std::size_t max_read_bytes)
    : backups_(std::move(backups)), max_read_bytes_(max_read_bytes) {}

common::Result<std::vector<TreeEntry>> WorkspaceFiles::structure() const {
  std::vector<TreeEntry> entries;
  const auto status = walk(backups_.guard().root(), 0, entries);
  if (!status.ok()) {
    return common::Result<std::vector<TreeEntry>>::failure(status);
  }
  return common::Result<std::vector<TreeEntry>>::success(std::move(entries));
}

common::Result<FileView> WorkspaceFiles::read_file(const std::string &relative_path) const {
  const auto resolved = backups_.guard().resolve_existing(relative_path);
  if (!resolved.ok()) {
    return common::Result<FileView>::failure(resolved);
  }

  FileView view;
  view.relative_path = backups_.guard().relative(resolved.value());
  std::error_code ec;
  if (std::filesystem::is_directory(resolved.value(), ec)) {
    view.is_directory = true;
    for (std::filesystem::directory_iterator it(resolved.value(), ec), end; !ec && it != end;
         it.increment(ec)) {
      const auto &entry = *it;
      view.entries.push_back(entry.path().filename().string());
    }
    if (ec) {
      return common::Result<FileView>::failure(common::ErrorKind::Io, "Unable to list directory");
    }
    std::sort(view.entries.begin(), view.entries.end());
    return common::Result<FileView>::success(std::move(view));
  }

  std::ifstream file(resolved.value(), std::ios::binary);
  if (!file) {
    return common::Result<FileView>::failure(common::ErrorKind::Io, "Failed to read file");
  }
  view.content.resize(max_read_bytes_ + 1);
  file.read(view.content.data(), static_cast<std::streamsize>(view.content.size()));
  view.content.resize(static_cast<std::size_t>(file.gcount()));
  if (file.bad()) {
    return common::Result<FileView>::failure(common::ErrorKind::Io, "Failed to read file");
  }
  if (view.content.size() > max_read_bytes_) {
    view.content.resize(max_read_bytes_);
    view.truncated = true;
  }
  return common::Result<FileView>::success(std::move(view));
}

common::Result<MaybeBackup> WorkspaceFiles::write_file(const std::string &relative_path,
                                                       const std::string &content) const {
  const auto resolved = backups_.guard().resolve(relative_path);
  if (!resolved.ok()) {
    return common::Result<MaybeBackup>::failure(resolved);
  }
  if (resolved.value() == backups_.guard().root()) {
    return common::Result<MaybeBackup>::failure(common::ErrorKind::InvalidArgument,
                                                "Target is a directory");
  }
  return backups_.write_with_backup(relative_path, content);
}

common::Result<std::string> WorkspaceFiles::read_engine_config() const {
  const auto resolved = backups_.guard().resolve_existing(ENGINE_CONFIG_FILE);
  if (!resolved.ok()) {
    return common::Result<std::string>::failure(resolved.kind(),
                                                std::string(ENGINE_CONFIG_FILE) + " not found");
  }
  return common::read_text_file(resolved.value());
}

common::Result<MaybeBackup> WorkspaceFiles::write_engine_config(const std::string &content) const {
  const auto parsed = common::parse_key_values(content, common::KeyValueDialect::Ini);
  if (!parsed.ok()) {
    return common::Result<MaybeBackup>::failure(parsed.kind(),
                                                std::string(ENGINE_CONFIG_FILE) + ": " +
                                                    parsed.error());
  }
  return backups_.write_with_backup(ENGINE_CONFIG_FILE, content);
}

common::Result<std::vector<Backup>>
WorkspaceFiles::list_backups(const std::string &relative_path) const {
  return backups_.list(relative_path);
}

common::Result<MaybeBackup> WorkspaceFiles::restore_backup(const std::string &backup_path) const {
  const auto backup = backups_.load(backup_path);
  if (!backup.ok()) {
    return common::Result<MaybeBackup>::failure(backup);
  }
  return backups_.restore(backup.value());
}

} // namespace playwarden::workspace
