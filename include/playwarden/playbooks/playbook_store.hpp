#pragma once

#include "playwarden/common/result.hpp"
#include "playwarden/engine/ansible.hpp"
#include "playwarden/workspace/backup.hpp"

#include <memory>
#include <string>
#include <vector>

namespace playwarden::playbooks {

struct PlaybookInfo {
  std::string name;
  std::string relative_path;
  std::string description;
  bool legacy_root = false;
};

struct ValidationReport {
  bool passed = false;
  std::string diagnostics;
};

struct RunRequest {
  std::string limit;
  std::string extra_vars;
  std::string tags;
  bool verbose = false;
};

struct PlaybookRunReport {
  engine::ExecutionResult execution;
  engine::RunOutcome outcome = engine::RunOutcome::Failure;
  std::string summary;
  bool check_mode = false;
};

struct PlaybookWriteReport {
  std::string relative_path;
  workspace::MaybeBackup backup;
  ValidationReport validation;
};

/// Appends `.yml` unless the name already ends in `.yml`/`.yaml`.
[[nodiscard]] std::string normalize_playbook_name(const std::string &name);

/// Text of a leading `#` comment line, or empty.
[[nodiscard]] std::string playbook_description(const std::string &content);

/// Playbooks live in `playbooks/`; a legacy `playbook.yml` at the root is
/// still found by name.
class PlaybookStore {
public:
  PlaybookStore(workspace::BackupManager backups, std::shared_ptr<const engine::AnsibleEngine> engine);

  [[nodiscard]] common::Result<std::vector<PlaybookInfo>> list() const;
  [[nodiscard]] common::Result<std::string> read(const std::string &name) const;

  /// Fails with `AlreadyExists`; a failing syntax check still creates the file.
  [[nodiscard]] common::Result<PlaybookWriteReport>
  create(const std::string &name, const std::string &content, const std::string &description) const;
  [[nodiscard]] common::Result<PlaybookWriteReport> update(const std::string &name,
                                                           const std::string &content) const;
  [[nodiscard]] common::Result<workspace::Backup> remove(const std::string &name) const;

  [[nodiscard]] common::Result<ValidationReport> validate(const std::string &name) const;
  [[nodiscard]] common::Result<PlaybookRunReport> run(const std::string &name,
                                                      const RunRequest &request) const;
  /// Dry run with `--check --diff`.
  [[nodiscard]] common::Result<PlaybookRunReport> check(const std::string &name,
                                                        const std::string &limit) const;

  /// Root-relative path of an existing playbook.
  [[nodiscard]] common::Result<std::string> locate(const std::string &name) const;

private:
  [[nodiscard]] ValidationReport syntax_check_after_write(const std::string &relative_path) const;
  [[nodiscard]] common::Result<ValidationReport> syntax_check(const std::string &relative_path) const;
  [[nodiscard]] common::Result<PlaybookRunReport>
  execute(const std::string &relative_path, engine::PlaybookInvocation invocation) const;

  workspace::BackupManager backups_;
  std::shared_ptr<const engine::AnsibleEngine> engine_;
};

} // namespace playwarden::playbooks
