#pragma once

#include "playwarden/common/result.hpp"
#include "playwarden/workspace/backup.hpp"

#include <string>
#include <vector>

namespace playwarden::workspace {

/// Jinja2 templates under `templates/`.
class TemplateStore {
public:
  explicit TemplateStore(BackupManager backups);

  [[nodiscard]] common::Result<std::vector<std::string>> list() const;
  [[nodiscard]] common::Result<std::string> read(const std::string &name) const;
  /// Fails with `AlreadyExists` rather than overwriting.
  [[nodiscard]] common::Result<std::string> create(const std::string &name,
                                                   const std::string &content) const;

  /// Appends `.j2` unless the name already ends in `.j2`/`.jinja2`.
  [[nodiscard]] static std::string normalize_name(const std::string &name);

private:
  BackupManager backups_;
};

} // namespace playwarden::workspace
