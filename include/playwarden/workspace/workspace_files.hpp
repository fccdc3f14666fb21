#pragma once

#include "playwarden/common/result.hpp"
#include "playwarden/workspace/backup.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace playwarden::workspace {

inline constexpr const char *ENGINE_CONFIG_FILE = "ansible.cfg";

struct TreeEntry {
  std::size_t depth = 0;
  std::string name;
  bool is_directory = false;
  std::uintmax_t size = 0;
};

struct FileView {
  std::string relative_path;
  bool is_directory = false;
  std::vector<std::string> entries;
  std::string content;
  bool truncated = false;
};

/// Generic access to any file under the workspace root.
class WorkspaceFiles {
public:
  explicit WorkspaceFiles(BackupManager backups, std::size_t max_read_bytes = 1024 * 1024);

  /// Depth-first listing; hidden entries and backups are skipped and
  /// symlinked directories are not followed.
  [[nodiscard]] common::Result<std::vector<TreeEntry>> structure() const;

  [[nodiscard]] common::Result<FileView> read_file(const std::string &relative_path) const;
  [[nodiscard]] common::Result<MaybeBackup> write_file(const std::string &relative_path,
                                                       const std::string &content) const;

  [[nodiscard]] common::Result<std::string> read_engine_config() const;
  /// Content must parse as INI.
  [[nodiscard]] common::Result<MaybeBackup> write_engine_config(const std::string &content) const;

  [[nodiscard]] common::Result<std::vector<Backup>>
  list_backups(const std::string &relative_path) const;
  /// Returns the backup taken of the live file before it was replaced.
  [[nodiscard]] common::Result<MaybeBackup> restore_backup(const std::string &backup_path) const;

  [[nodiscard]] const BackupManager &backups() const { return backups_; }

private:
  BackupManager backups_;
  std::size_t max_read_bytes_;
};

} // namespace playwarden::workspace
