#pragma once

#include "playwarden/common/result.hpp"
#include "playwarden/security/path_guard.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace playwarden::workspace {

/// Snapshot of a managed file taken right before it was changed.
struct Backup {
  std::string original_path;
  std::string backup_path;
  std::chrono::system_clock::time_point timestamp;
  std::string content;
  std::string digest;
};

/// Outcome of a mutation: the snapshot taken first, if the file existed.
using MaybeBackup = std::optional<Backup>;

/// Owns every write to the workspace. Nothing is written unless the prior
/// content has first been stored durably as `<file>.<YYYYMMDD_HHMMSS_micro>.bak`
/// beside the original.
class BackupManager {
public:
  explicit BackupManager(security::PathGuard guard);

  /// Empty when the file does not exist yet.
  [[nodiscard]] common::Result<MaybeBackup> snapshot(const std::string &relative_path) const;

  /// Backs up the live file, then writes the snapshot content back.
  [[nodiscard]] common::Result<MaybeBackup> restore(const Backup &backup) const;

  /// Backups of one file, oldest first.
  [[nodiscard]] common::Result<std::vector<Backup>> list(const std::string &relative_path) const;

  [[nodiscard]] common::Result<Backup> load(const std::string &backup_relative_path) const;

  [[nodiscard]] common::Result<MaybeBackup> write_with_backup(const std::string &relative_path,
                                                              const std::string &content) const;
  [[nodiscard]] common::Result<Backup> remove_with_backup(const std::string &relative_path) const;

  [[nodiscard]] const security::PathGuard &guard() const { return guard_; }

private:
  security::PathGuard guard_;
};

[[nodiscard]] bool is_backup_name(const std::string &filename);

} // namespace playwarden::workspace
