#include "playwarden/audit/audit_log.hpp"

#include "playwarden/common/fs.hpp"

#include <chrono>

namespace playwarden::audit {

namespace {

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string msg = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(common::ErrorKind::Io, msg);
  }
  return common::Status::success();
}

std::string column_text(sqlite3_stmt *stmt, const int column) {
  const unsigned char *text = sqlite3_column_text(stmt, column);
  return text == nullptr ? std::string() : reinterpret_cast<const char *>(text);
}

} // namespace

common::Result<std::shared_ptr<AuditLog>> AuditLog::open(const std::filesystem::path &db_path) {
  std::error_code ec;
  if (db_path.has_parent_path()) {
    std::filesystem::create_directories(db_path.parent_path(), ec);
    if (ec) {
      return common::Result<std::shared_ptr<AuditLog>>::failure(
          common::ErrorKind::Io, "Unable to create audit directory: " + ec.message());
    }
  }

  sqlite3 *db = nullptr;
  if (sqlite3_open(db_path.string().c_str(), &db) != SQLITE_OK) {
    const std::string msg = db == nullptr ? "out of memory" : sqlite3_errmsg(db);
    if (db != nullptr) {
      sqlite3_close(db);
    }
    return common::Result<std::shared_ptr<AuditLog>>::failure(
        common::ErrorKind::Io, "Unable to open audit log " + db_path.string() + ": " + msg);
  }

  std::shared_ptr<AuditLog> log(new AuditLog(db_path, db));
  const auto schema = log->init_schema();
  if (!schema.ok()) {
    return common::Result<std::shared_ptr<AuditLog>>::failure(schema);
  }
  return common::Result<std::shared_ptr<AuditLog>>::success(std::move(log));
}

AuditLog::AuditLog(std::filesystem::path db_path, sqlite3 *db)
    : db_path_(std::move(db_path)), db_(db) {}

AuditLog::~AuditLog() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status AuditLog::init_schema() {
  auto status = exec_sql(db_, "PRAGMA journal_mode=WAL;");
  if (!status.ok()) {
    return status;
  }
  return exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS tool_calls (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  timestamp TEXT NOT NULL,
  tool TEXT NOT NULL,
  outcome TEXT NOT NULL,
  error_kind TEXT NOT NULL DEFAULT '',
  duration_ms INTEGER NOT NULL DEFAULT 0,
  backup_digest TEXT NOT NULL DEFAULT ''
);
)");
}

common::Status AuditLog::record(const AuditEntry &entry) {
  std::lock_guard<std::mutex> lock(mutex_);

  const char *sql = "INSERT INTO tool_calls(timestamp, tool, outcome, error_kind, duration_ms, "
                    "backup_digest) VALUES (?1, ?2, ?3, ?4, ?5, ?6)";
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(common::ErrorKind::Io, sqlite3_errmsg(db_));
  }

  const std::string timestamp = entry.timestamp.empty()
                                    ? common::iso8601_utc(std::chrono::system_clock::now())
                                    : entry.timestamp;
  sqlite3_bind_text(stmt, 1, timestamp.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, entry.tool.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 3, entry.outcome.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 4, entry.error_kind.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt, 5, entry.duration_ms);
  sqlite3_bind_text(stmt, 6, entry.backup_digest.c_str(), -1, SQLITE_TRANSIENT);

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(common::ErrorKind::Io, sqlite3_errmsg(db_));
  }
  return common::Status::success();
}

common::Result<std::vector<AuditEntry>> AuditLog::recent(const std::size_t limit) {
  std::lock_guard<std::mutex> lock(mutex_);

  const char *sql = "SELECT timestamp, tool, outcome, error_kind, duration_ms, backup_digest "
                    "FROM tool_calls ORDER BY id DESC LIMIT ?1";
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<std::vector<AuditEntry>>::failure(common::ErrorKind::Io,
                                                            sqlite3_errmsg(db_));
  }
  sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(limit));

  std::vector<AuditEntry> entries;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    AuditEntry entry;
    entry.timestamp = column_text(stmt, 0);
    entry.tool = column_text(stmt, 1);
    entry.outcome = column_text(stmt, 2);
    entry.error_kind = column_text(stmt, 3);
    entry.duration_ms = sqlite3_column_int64(stmt, 4);
    entry.backup_digest = column_text(stmt, 5);
    entries.push_back(std::move(entry));
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Result<std::vector<AuditEntry>>::failure(common::ErrorKind::Io,
                                                            sqlite3_errmsg(db_));
  }
  return common::Result<std::vector<AuditEntry>>::success(std::move(entries));
}

common::Result<std::size_t> AuditLog::count() {
  std::lock_guard<std::mutex> lock(mutex_);

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM tool_calls", -1, &stmt, nullptr) !=
      SQLITE_OK) {
    return common::Result<std::size_t>::failure(common::ErrorKind::Io, sqlite3_errmsg(db_));
  }
  std::size_t total = 0;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    total = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
  }
  sqlite3_finalize(stmt);
  return common::Result<std::size_t>::success(total);
}

} // namespace playwarden::audit
