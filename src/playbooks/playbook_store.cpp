#include "playwarden/playbooks/playbook_store.hpp"

#include "playwarden/common/fs.hpp"

#include <algorithm>
#include <filesystem>

namespace playwarden::playbooks {

namespace {

constexpr const char *kPlaybookDir = "playbooks";
constexpr const char *kLegacyPlaybook = "playbook.yml";

bool has_playbook_extension(const std::string &name) {
  return common::ends_with(name, ".yml") || common::ends_with(name, ".yaml");
}

} // namespace

std::string normalize_playbook_name(const std::string &name) {
  return has_playbook_extension(name) ? name : name + ".yml";
}

std::string playbook_description(const std::string &content) {
  const auto end = content.find('\n');
  const std::string first = common::trim(content.substr(0, end));
  if (first.empty() || first.front() != '#') {
    return "";
  }
  return common::trim(first.substr(1));
}

PlaybookStore::PlaybookStore(workspace::BackupManager backups,
                             std::shared_ptr<const engine::AnsibleEngine> engine)
    : backups_(std::move(backups)), engine_(std::move(engine)) {}

common::Result<std::vector<PlaybookInfo>> PlaybookStore::list() const {
  std::vector<PlaybookInfo> playbooks;
  const auto &guard = backups_.guard();

  const auto directory = guard.resolve(kPlaybookDir);
  if (!directory.ok()) {
    return common::Result<std::vector<PlaybookInfo>>::failure(directory);
  }
  std::error_code ec;
  if (std::filesystem::is_directory(directory.value(), ec)) {
    for (std::filesystem::directory_iterator it(directory.value(), ec), end; !ec && it != end;
         it.increment(ec)) {
      const auto &entry = *it;
      std::error_code entry_ec;
      const std::string name = entry.path().filename().string();
      if (!entry.is_regular_file(entry_ec) || !has_playbook_extension(name)) {
        continue;
      }
      const auto content = common::read_text_file(entry.path());
      playbooks.push_back(PlaybookInfo{
          .name = name,
          .relative_path = std::string(kPlaybookDir) + "/" + name,
          .description = content.ok() ? playbook_description(content.value()) : std::string(),
          .legacy_root = false});
    }
    if (ec) {
      return common::Result<std::vector<PlaybookInfo>>::failure(
          common::ErrorKind::Io, "Unable to list playbooks: " + ec.message());
    }
  }
  std::sort(playbooks.begin(), playbooks.end(),
            [](const PlaybookInfo &a, const PlaybookInfo &b) { return a.name < b.name; });

  const auto legacy = guard.resolve(kLegacyPlaybook);
  if (legacy.ok() && std::filesystem::is_regular_file(legacy.value(), ec)) {
    playbooks.push_back(PlaybookInfo{.name = kLegacyPlaybook,
                                     .relative_path = kLegacyPlaybook,
                                     .description = "Legacy root playbook",
                                     .legacy_root = true});
  }
  return common::Result<std::vector<PlaybookInfo>>::success(std::move(playbooks));
}

common::Result<std::string> PlaybookStore::locate(const std::string &name) const {
  const std::string file = normalize_playbook_name(name);
  const auto &guard = backups_.guard();
  for (const std::string candidate : {std::string(kPlaybookDir) + "/" + file, file}) {
    const auto resolved = guard.resolve(candidate);
    if (!resolved.ok()) {
      return common::Result<std::string>::failure(resolved);
    }
    std::error_code ec;
    if (std::filesystem::is_regular_file(resolved.value(), ec)) {
      return common::Result<std::string>::success(guard.relative(resolved.value()));
    }
  }
  return common::Result<std::string>::failure(common::ErrorKind::NotFound,
                                              "Playbook not found: " + file);
}

common::Result<std::string> PlaybookStore::read(const std::string &name) const {
  const auto path = locate(name);
  if (!path.ok()) {
    return path;
  }
  const auto resolved = backups_.guard().resolve_existing(path.value());
  if (!resolved.ok()) {
    return common::Result<std::string>::failure(resolved);
  }
  return common::read_text_file(resolved.value());
}

common::Result<PlaybookWriteReport> PlaybookStore::create(const std::string &name,
                                                          const std::string &content,
                                                          const std::string &description) const {
  const std::string relative = std::string(kPlaybookDir) + "/" + normalize_playbook_name(name);
  const auto target = backups_.guard().resolve(relative);
  if (!target.ok()) {
    return common::Result<PlaybookWriteReport>::failure(target);
  }
  std::error_code ec;
  if (std::filesystem::exists(target.value(), ec)) {
    return common::Result<PlaybookWriteReport>::failure(
        common::ErrorKind::AlreadyExists,
        "Playbook '" + normalize_playbook_name(name) + "' already exists");
  }

  std::string body;
  const std::string summary = common::trim(description);
  if (!summary.empty()) {
    body = "# " + summary + "\n";
  }
  body += content;

  auto written = backups_.write_with_backup(relative, body);
  if (!written.ok()) {
    return common::Result<PlaybookWriteReport>::failure(written);
  }
  PlaybookWriteReport report{.relative_path = relative,
                             .backup = std::move(written.value()),
                             .validation = syntax_check_after_write(relative)};
  return common::Result<PlaybookWriteReport>::success(std::move(report));
}

common::Result<PlaybookWriteReport> PlaybookStore::update(const std::string &name,
                                                          const std::string &content) const {
  const auto path = locate(name);
  if (!path.ok()) {
    return common::Result<PlaybookWriteReport>::failure(path);
  }
  auto written = backups_.write_with_backup(path.value(), content);
  if (!written.ok()) {
    return common::Result<PlaybookWriteReport>::failure(written);
  }
  PlaybookWriteReport report{.relative_path = path.value(),
                             .backup = std::move(written.value()),
                             .validation = syntax_check_after_write(path.value())};
  return common::Result<PlaybookWriteReport>::success(std::move(report));
}

common::Result<workspace::Backup> PlaybookStore::remove(const std::string &name) const {
  const std::string relative = std::string(kPlaybookDir) + "/" + normalize_playbook_name(name);
  return backups_.remove_with_backup(relative);
}

ValidationReport PlaybookStore::syntax_check_after_write(const std::string &relative_path) const {
  auto report = syntax_check(relative_path);
  if (report.ok()) {
    return report.value();
  }
  return ValidationReport{.passed = false,
                          .diagnostics = "Syntax check could not run: " + report.error()};
}

common::Result<ValidationReport> PlaybookStore::syntax_check(const std::string &relative_path) const {
  const auto resolved = backups_.guard().resolve_existing(relative_path);
  if (!resolved.ok()) {
    return common::Result<ValidationReport>::failure(resolved);
  }
  engine::PlaybookInvocation invocation;
  invocation.playbook = resolved.value();
  invocation.syntax_check = true;

  const auto result =
      engine_->run(engine_->playbook_argv(invocation),
                   std::chrono::seconds(engine_->settings().syntax_timeout_seconds));
  if (!result.ok()) {
    return common::Result<ValidationReport>::failure(result);
  }
  const auto &execution = result.value();
  return common::Result<ValidationReport>::success(
      ValidationReport{.passed = !execution.timed_out && execution.exit_code == 0,
                       .diagnostics = execution.masked_output});
}

common::Result<ValidationReport> PlaybookStore::validate(const std::string &name) const {
  const auto path = locate(name);
  if (!path.ok()) {
    return common::Result<ValidationReport>::failure(path);
  }
  return syntax_check(path.value());
}

common::Result<PlaybookRunReport>
PlaybookStore::execute(const std::string &relative_path,
                       engine::PlaybookInvocation invocation) const {
  const auto resolved = backups_.guard().resolve_existing(relative_path);
  if (!resolved.ok()) {
    return common::Result<PlaybookRunReport>::failure(resolved);
  }
  invocation.playbook = resolved.value();

  auto result = engine_->run(engine_->playbook_argv(invocation),
                             std::chrono::seconds(engine_->settings().default_timeout_seconds));
  if (!result.ok()) {
    return common::Result<PlaybookRunReport>::failure(result);
  }

  PlaybookRunReport report;
  report.execution = std::move(result.value());
  report.outcome = engine::classify_exit(report.execution);
  report.summary = engine::summarize_output(report.execution.masked_output);
  report.check_mode = invocation.check;
  return common::Result<PlaybookRunReport>::success(std::move(report));
}

common::Result<PlaybookRunReport> PlaybookStore::run(const std::string &name,
                                                     const RunRequest &request) const {
  const auto path = locate(name);
  if (!path.ok()) {
    return common::Result<PlaybookRunReport>::failure(path);
  }
  engine::PlaybookInvocation invocation;
  invocation.limit = request.limit;
  invocation.extra_vars = request.extra_vars;
  // `@file` makes the engine read a file, so it must resolve inside the workspace.
  if (const std::string trimmed = common::trim(request.extra_vars);
      common::starts_with(trimmed, "@")) {
    const auto file = backups_.guard().resolve_existing(trimmed.substr(1));
    if (!file.ok()) {
      return common::Result<PlaybookRunReport>::failure(file);
    }
    invocation.extra_vars = "@" + file.value().string();
  }
  invocation.tags = request.tags;
  invocation.verbose = request.verbose;
  return execute(path.value(), std::move(invocation));
}

common::Result<PlaybookRunReport> PlaybookStore::check(const std::string &name,
                                                       const std::string &limit) const {
  const auto path = locate(name);
  if (!path.ok()) {
    return common::Result<PlaybookRunReport>::failure(path);
  }
  engine::PlaybookInvocation invocation;
  invocation.limit = limit;
  invocation.check = true;
  return execute(path.value(), std::move(invocation));
}

} // namespace playwarden::playbooks
