#pragma once

#include "playwarden/common/result.hpp"
#include "playwarden/inventory/inventory.hpp"
#include "playwarden/workspace/backup.hpp"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace playwarden::vars {

enum class VariableScope { Group, Host };

[[nodiscard]] std::string_view scope_directory(VariableScope scope);

struct VariableFileInfo {
  VariableScope scope = VariableScope::Group;
  std::string name;
  std::string relative_path;
};

struct EffectiveValue {
  std::string key;
  std::string value;
  std::string source;
};

/// Merged variables for one host; keys keep the order they were first seen.
struct EffectiveVariables {
  std::string host;
  std::vector<EffectiveValue> values;

  [[nodiscard]] const EffectiveValue *find(const std::string &key) const;
};

/// Top-level mapping of a YAML variables document, values rendered as text.
/// An empty document yields an empty list.
[[nodiscard]] common::Result<std::vector<std::pair<std::string, std::string>>>
parse_variables_yaml(const std::string &content);

class VariableStore {
public:
  VariableStore(workspace::BackupManager backups, inventory::InventoryStore inventory);

  [[nodiscard]] common::Result<std::string> read(VariableScope scope, const std::string &name) const;
  [[nodiscard]] common::Result<workspace::MaybeBackup>
  write(VariableScope scope, const std::string &name, const std::string &content) const;
  [[nodiscard]] common::Result<std::vector<VariableFileInfo>> list() const;

  /// Inline inventory vars, then group_vars files, then the host_vars file;
  /// later sources win.
  [[nodiscard]] common::Result<EffectiveVariables> effective(const std::string &host) const;

  /// Existing file for the scope/name (`.yml` preferred), else the `.yml` path.
  [[nodiscard]] std::string relative_path(VariableScope scope, const std::string &name) const;

private:
  [[nodiscard]] common::Result<bool> merge_file(VariableScope scope, const std::string &name,
                                                EffectiveVariables &into) const;

  workspace::BackupManager backups_;
  inventory::InventoryStore inventory_;
};

} // namespace playwarden::vars
