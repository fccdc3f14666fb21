#pragma once

#include "playwarden/common/result.hpp"
#include "playwarden/workspace/backup.hpp"

#include <string>
#include <utility>
#include <vector>

namespace playwarden::inventory {

using VariableList = std::vector<std::pair<std::string, std::string>>;

struct InventoryHost {
  std::string name;
  VariableList vars;
};

struct InventoryGroup {
  std::string name;
  std::vector<InventoryHost> hosts;
  std::vector<std::string> children;
  VariableList vars;
};

/// Structured view of an INI inventory. Groups are kept in the order their
/// first section appears; hosts listed before any section land in `ungrouped`.
struct InventoryDocument {
  std::vector<InventoryGroup> groups;

  [[nodiscard]] const InventoryGroup *find_group(const std::string &name) const;
  [[nodiscard]] bool has_host(const std::string &host) const;
  /// Unique host names in order of first appearance.
  [[nodiscard]] std::vector<std::string> host_names() const;
  /// Groups containing the host directly or through `:children`, in
  /// declaration order. `all` is never included.
  [[nodiscard]] std::vector<std::string> groups_of(const std::string &host) const;
  /// Inline variables from every host line of `host`, merged in file order.
  [[nodiscard]] VariableList host_vars(const std::string &host) const;
};

[[nodiscard]] common::Result<InventoryDocument> parse_inventory(const std::string &content);

/// Splits a host line on whitespace, keeping quoted values together.
[[nodiscard]] std::vector<std::string> split_host_line(const std::string &line);

struct AddHostRequest {
  std::string group = "all";
  std::string host;
  std::string address;
  /// Space separated `key=value` pairs appended to the host line.
  std::string extra_vars;
};

struct InventoryListing {
  std::vector<InventoryGroup> groups;
  std::size_t total_hosts = 0;
};

class InventoryStore {
public:
  InventoryStore(workspace::BackupManager backups, std::string relative_path);

  [[nodiscard]] const std::string &relative_path() const { return relative_path_; }

  [[nodiscard]] common::Result<std::string> read() const;
  /// Rejects content that does not parse, then replaces the file.
  [[nodiscard]] common::Result<workspace::MaybeBackup> write(const std::string &content) const;

  [[nodiscard]] common::Result<workspace::MaybeBackup> add_host(const AddHostRequest &request) const;
  [[nodiscard]] common::Result<workspace::Backup> remove_host(const std::string &host) const;

  [[nodiscard]] common::Result<InventoryListing> list() const;
  /// Missing inventory parses as an empty document.
  [[nodiscard]] common::Result<InventoryDocument> parse() const;

private:
  [[nodiscard]] common::Result<std::string> read_or_empty() const;

  workspace::BackupManager backups_;
  std::string relative_path_;
};

} // namespace playwarden::inventory
