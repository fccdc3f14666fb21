#include "playwarden/workspace/backup.hpp"

#include "playwarden/common/fs.hpp"
#include "playwarden/observability/global.hpp"

#include <algorithm>
#include <ctime>
#include <filesystem>
#include <regex>

namespace playwarden::workspace {

namespace {

constexpr const char *kBackupSuffix = ".bak";
constexpr int kMaxNameAttempts = 1000;

// `<original>.<YYYYMMDD>_<HHMMSS>_<micro>[_<n>].bak`
const std::regex kBackupName(R"(^(.+)\.(\d{8})_(\d{6})_(\d{6})(?:_\d+)?\.bak$)");

common::Result<std::chrono::system_clock::time_point>
parse_timestamp(const std::string &date, const std::string &time, const std::string &micros) {
  std::tm utc{};
  utc.tm_year = std::stoi(date.substr(0, 4)) - 1900;
  utc.tm_mon = std::stoi(date.substr(4, 2)) - 1;
  utc.tm_mday = std::stoi(date.substr(6, 2));
  utc.tm_hour = std::stoi(time.substr(0, 2));
  utc.tm_min = std::stoi(time.substr(2, 2));
  utc.tm_sec = std::stoi(time.substr(4, 2));
  const std::time_t seconds = ::timegm(&utc);
  if (seconds == static_cast<std::time_t>(-1)) {
    return common::Result<std::chrono::system_clock::time_point>::failure(
        common::ErrorKind::ParseError, "invalid backup timestamp");
  }
  return common::Result<std::chrono::system_clock::time_point>::success(
      std::chrono::system_clock::from_time_t(seconds) +
      std::chrono::microseconds(std::stoll(micros)));
}

common::Result<std::filesystem::path> unique_backup_path(const std::filesystem::path &original,
                                                         const std::string &stamp) {
  const std::string base = original.string() + "." + stamp;
  std::error_code ec;
  std::filesystem::path candidate = base + kBackupSuffix;
  for (int attempt = 1; std::filesystem::exists(candidate, ec); ++attempt) {
    if (attempt > kMaxNameAttempts) {
      return common::Result<std::filesystem::path>::failure(common::ErrorKind::BackupFailure,
                                                            "Unable to pick a backup file name");
    }
    candidate = base + "_" + std::to_string(attempt) + kBackupSuffix;
  }
  return common::Result<std::filesystem::path>::success(candidate);
}

common::Status reject_backup_target(const std::filesystem::path &target) {
  if (is_backup_name(target.filename().string())) {
    return common::Status::error(common::ErrorKind::InvalidArgument,
                                 "Backup files are read-only; use restore_backup instead");
  }
  return common::Status::success();
}

} // namespace

bool is_backup_name(const std::string &filename) {
  return std::regex_match(filename, kBackupName);
}

BackupManager::BackupManager(security::PathGuard guard) : guard_(std::move(guard)) {}

common::Result<MaybeBackup> BackupManager::snapshot(const std::string &relative_path) const {
  const auto resolved = guard_.resolve(relative_path);
  if (!resolved.ok()) {
    return common::Result<MaybeBackup>::failure(resolved);
  }
  const auto &target = resolved.value();

  std::error_code ec;
  if (!std::filesystem::exists(target, ec)) {
    return common::Result<MaybeBackup>::success(std::nullopt);
  }
  if (!std::filesystem::is_regular_file(target, ec)) {
    return common::Result<MaybeBackup>::failure(common::ErrorKind::BackupFailure,
                                                "Only regular files can be backed up");
  }

  const auto content = common::read_text_file(target);
  if (!content.ok()) {
    return common::Result<MaybeBackup>::failure(common::ErrorKind::BackupFailure,
                                                "Backup failed: " + content.error());
  }

  const auto now = std::chrono::system_clock::now();
  const auto backup_path = unique_backup_path(target, common::sortable_timestamp(now));
  if (!backup_path.ok()) {
    return common::Result<MaybeBackup>::failure(backup_path);
  }

  const auto written = common::write_text_file_atomic(backup_path.value(), content.value());
  if (!written.ok()) {
    observability::record_error("backup", written.error());
    return common::Result<MaybeBackup>::failure(common::ErrorKind::BackupFailure,
                                                "Backup failed: " + written.error());
  }

  Backup backup{.original_path = guard_.relative(target),
                .backup_path = guard_.relative(backup_path.value()),
                .timestamp = now,
                .content = content.value(),
                .digest = common::sha256_hex(content.value())};
  observability::record_backup(backup.original_path, backup.backup_path);
  return common::Result<MaybeBackup>::success(std::move(backup));
}

common::Result<MaybeBackup> BackupManager::restore(const Backup &backup) const {
  const auto target = guard_.resolve(backup.original_path);
  if (!target.ok()) {
    return common::Result<MaybeBackup>::failure(target);
  }

  auto live = snapshot(backup.original_path);
  if (!live.ok()) {
    return live;
  }

  const auto written = common::write_text_file_atomic(target.value(), backup.content);
  if (!written.ok()) {
    return common::Result<MaybeBackup>::failure(written);
  }
  observability::record_file_change(backup.original_path, "restore");
  return live;
}

common::Result<std::vector<Backup>>
BackupManager::list(const std::string &relative_path) const {
  const auto resolved = guard_.resolve(relative_path);
  if (!resolved.ok()) {
    return common::Result<std::vector<Backup>>::failure(resolved);
  }

  const auto directory = resolved.value().parent_path();
  const std::string prefix = resolved.value().filename().string() + ".";
  std::vector<std::string> names;
  std::error_code ec;
  if (std::filesystem::is_directory(directory, ec)) {
    for (std::filesystem::directory_iterator it(directory, ec), end; !ec && it != end;
         it.increment(ec)) {
      const std::string name = it->path().filename().string();
      std::smatch match;
      if (!common::starts_with(name, prefix) || !std::regex_match(name, match, kBackupName)) {
        continue;
      }
      if (match[1].str() + "." != prefix) {
        continue;
      }
      names.push_back(name);
    }
  }
  if (ec) {
    return common::Result<std::vector<Backup>>::failure(common::ErrorKind::Io,
                                                        "Unable to list backups: " + ec.message());
  }
  std::sort(names.begin(), names.end());

  std::vector<Backup> backups;
  backups.reserve(names.size());
  for (const auto &name : names) {
    auto loaded = load(guard_.relative(directory / name));
    if (!loaded.ok()) {
      return common::Result<std::vector<Backup>>::failure(loaded);
    }
    backups.push_back(std::move(loaded.value()));
  }
  return common::Result<std::vector<Backup>>::success(std::move(backups));
}

common::Result<Backup> BackupManager::load(const std::string &backup_relative_path) const {
  const auto resolved = guard_.resolve_existing(backup_relative_path);
  if (!resolved.ok()) {
    return common::Result<Backup>::failure(resolved);
  }

  const std::string name = resolved.value().filename().string();
  std::smatch match;
  if (!std::regex_match(name, match, kBackupName)) {
    return common::Result<Backup>::failure(common::ErrorKind::InvalidArgument,
                                           "Not a backup file");
  }

  const auto timestamp = parse_timestamp(match[2].str(), match[3].str(), match[4].str());
  if (!timestamp.ok()) {
    return common::Result<Backup>::failure(timestamp);
  }

  const auto content = common::read_text_file(resolved.value());
  if (!content.ok()) {
    return common::Result<Backup>::failure(content);
  }

  Backup backup{.original_path = guard_.relative(resolved.value().parent_path() / match[1].str()),
                .backup_path = guard_.relative(resolved.value()),
                .timestamp = timestamp.value(),
                .content = content.value(),
                .digest = common::sha256_hex(content.value())};
  return common::Result<Backup>::success(std::move(backup));
}

common::Result<MaybeBackup> BackupManager::write_with_backup(const std::string &relative_path,
                                                             const std::string &content) const {
  const auto target = guard_.resolve(relative_path);
  if (!target.ok()) {
    return common::Result<MaybeBackup>::failure(target);
  }
  std::error_code ec;
  if (std::filesystem::is_directory(target.value(), ec)) {
    return common::Result<MaybeBackup>::failure(common::ErrorKind::InvalidArgument,
                                                "Target is a directory");
  }
  if (const auto writable = reject_backup_target(target.value()); !writable.ok()) {
    return common::Result<MaybeBackup>::failure(writable);
  }

  auto backup = snapshot(relative_path);
  if (!backup.ok()) {
    return backup;
  }

  const auto written = common::write_text_file_atomic(target.value(), content);
  if (!written.ok()) {
    return common::Result<MaybeBackup>::failure(written);
  }
  observability::record_file_change(guard_.relative(target.value()),
                                    backup.value().has_value() ? "update" : "create");
  return backup;
}

common::Result<Backup> BackupManager::remove_with_backup(const std::string &relative_path) const {
  const auto target = guard_.resolve_existing(relative_path);
  if (!target.ok()) {
    return common::Result<Backup>::failure(target);
  }
  if (const auto removable = reject_backup_target(target.value()); !removable.ok()) {
    return common::Result<Backup>::failure(removable);
  }

  auto backup = snapshot(relative_path);
  if (!backup.ok()) {
    return common::Result<Backup>::failure(backup);
  }
  if (!backup.value().has_value()) {
    return common::Result<Backup>::failure(common::ErrorKind::NotFound, "File not found");
  }

  std::error_code ec;
  std::filesystem::remove(target.value(), ec);
  if (ec) {
    return common::Result<Backup>::failure(common::ErrorKind::Io,
                                           "Failed to delete file: " + ec.message());
  }
  observability::record_file_change(guard_.relative(target.value()), "delete");
  return common::Result<Backup>::success(std::move(*backup.value()));
}

} // namespace playwarden::workspace
