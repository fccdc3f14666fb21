#pragma once

#include "playwarden/common/result.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <sqlite3.h>
#include <string>
#include <vector>

namespace playwarden::audit {

struct AuditEntry {
  std::string timestamp;
  std::string tool;
  std::string outcome;
  std::string error_kind;
  std::int64_t duration_ms = 0;
  std::string backup_digest;
};

/// Append-only record of tool calls, kept in SQLite outside the workspace.
class AuditLog {
public:
  /// Opens (creating when needed) the database at `db_path`.
  [[nodiscard]] static common::Result<std::shared_ptr<AuditLog>>
  open(const std::filesystem::path &db_path);

  ~AuditLog();
  AuditLog(const AuditLog &) = delete;
  AuditLog &operator=(const AuditLog &) = delete;

  [[nodiscard]] common::Status record(const AuditEntry &entry);
  /// Newest first.
  [[nodiscard]] common::Result<std::vector<AuditEntry>> recent(std::size_t limit);
  [[nodiscard]] common::Result<std::size_t> count();

  [[nodiscard]] const std::filesystem::path &path() const { return db_path_; }

private:
  AuditLog(std::filesystem::path db_path, sqlite3 *db);
  [[nodiscard]] common::Status init_schema();

  std::filesystem::path db_path_;
  sqlite3 *db_ = nullptr;
  std::mutex mutex_;
};

} // namespace playwarden::audit
