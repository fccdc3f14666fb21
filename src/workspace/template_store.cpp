#include "playwarden/workspace/template_store.hpp"

#include "playwarden/common/fs.hpp"

#include <algorithm>
#include <filesystem>

namespace playwarden::workspace {

namespace {

constexpr const char *kTemplateDir = "templates";

bool has_template_extension(const std::string &name) {
  return common::ends_with(name, ".j2") || common::ends_with(name, ".jinja2");
}

} // namespace

TemplateStore::TemplateStore(BackupManager backups) : backups_(std::move(backups)) {}

std::string TemplateStore::normalize_name(const std::string &name) {
  return has_template_extension(name) ? name : name + ".j2";
}

common::Result<std::vector<std::string>> TemplateStore::list() const {
  const auto directory = backups_.guard().resolve(kTemplateDir);
  if (!directory.ok()) {
    return common::Result<std::vector<std::string>>::failure(directory);
  }
  std::vector<std::string> names;
  std::error_code ec;
  if (!std::filesystem::is_directory(directory.value(), ec)) {
    return common::Result<std::vector<std::string>>::success(std::move(names));
  }
  for (std::filesystem::directory_iterator it(directory.value(), ec), end; !ec && it != end;
       it.increment(ec)) {
    const auto &entry = *it;
    std::error_code entry_ec;
    const std::string name = entry.path().filename().string();
    if (entry.is_regular_file(entry_ec) && has_template_extension(name)) {
      names.push_back(name);
    }
  }
  if (ec) {
    return common::Result<std::vector<std::string>>::failure(
        common::ErrorKind::Io, "Unable to list templates: " + ec.message());
  }
  std::sort(names.begin(), names.end());
  return common::Result<std::vector<std::string>>::success(std::move(names));
}

common::Result<std::string> TemplateStore::read(const std::string &name) const {
  const std::string file = normalize_name(name);
  const auto resolved = backups_.guard().resolve_existing(std::string(kTemplateDir) + "/" + file);
  if (!resolved.ok()) {
    if (resolved.kind() == common::ErrorKind::NotFound) {
      return common::Result<std::string>::failure(common::ErrorKind::NotFound,
                                                  "Template not found: " + file);
    }
    return common::Result<std::string>::failure(resolved);
  }
  return common::read_text_file(resolved.value());
}

common::Result<std::string> TemplateStore::create(const std::string &name,
                                                  const std::string &content) const {
  const std::string file = normalize_name(name);
  const std::string relative = std::string(kTemplateDir) + "/" + file;
  const auto resolved = backups_.guard().resolve(relative);
  if (!resolved.ok()) {
    return common::Result<std::string>::failure(resolved);
  }
  std::error_code ec;
  if (std::filesystem::exists(resolved.value(), ec)) {
    return common::Result<std::string>::failure(common::ErrorKind::AlreadyExists,
                                                "Template '" + file + "' already exists");
  }
  const auto written = backups_.write_with_backup(relative, content);
  if (!written.ok()) {
    return common::Result<std::string>::failure(written);
  }
  return common::Result<std::string>::success(file);
}

} // namespace playwarden::workspace
