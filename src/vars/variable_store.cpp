#include "playwarden/vars/variable_store.hpp"

#include "playwarden/common/fs.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <array>
#include <filesystem>

namespace playwarden::vars {

namespace {

constexpr std::array<const char *, 2> kExtensions = {".yml", ".yaml"};

std::string render_node(const YAML::Node &node) {
  if (node.IsScalar()) {
    return node.Scalar();
  }
  if (node.IsNull()) {
    return "";
  }
  YAML::Emitter emitter;
  emitter << YAML::Flow << node;
  return std::string(emitter.c_str());
}

void assign(EffectiveVariables &into, const std::string &key, const std::string &value,
            const std::string &source) {
  for (auto &entry : into.values) {
    if (entry.key == key) {
      entry.value = value;
      entry.source = source;
      return;
    }
  }
  into.values.push_back(EffectiveValue{.key = key, .value = value, .source = source});
}

} // namespace

std::string_view scope_directory(const VariableScope scope) {
  return scope == VariableScope::Group ? "group_vars" : "host_vars";
}

const EffectiveValue *EffectiveVariables::find(const std::string &key) const {
  for (const auto &entry : values) {
    if (entry.key == key) {
      return &entry;
    }
  }
  return nullptr;
}

common::Result<std::vector<std::pair<std::string, std::string>>>
parse_variables_yaml(const std::string &content) {
  using Pairs = std::vector<std::pair<std::string, std::string>>;
  YAML::Node document;
  try {
    document = YAML::Load(content);
  } catch (const YAML::Exception &e) {
    return common::Result<Pairs>::failure(common::ErrorKind::ParseError,
                                          std::string("YAML parse failed: ") + e.what());
  }

  Pairs pairs;
  if (!document || document.IsNull()) {
    return common::Result<Pairs>::success(std::move(pairs));
  }
  if (!document.IsMap()) {
    return common::Result<Pairs>::failure(common::ErrorKind::ParseError,
                                          "Variables file must be a YAML mapping");
  }
  try {
    for (const auto &item : document) {
      pairs.emplace_back(item.first.as<std::string>(), render_node(item.second));
    }
  } catch (const YAML::Exception &e) {
    return common::Result<Pairs>::failure(common::ErrorKind::ParseError,
                                          std::string("Unsupported variable key: ") + e.what());
  }
  return common::Result<Pairs>::success(std::move(pairs));
}

VariableStore::VariableStore(workspace::BackupManager backups, inventory::InventoryStore inventory)
    : backups_(std::move(backups)), inventory_(std::move(inventory)) {}

std::string VariableStore::relative_path(const VariableScope scope, const std::string &name) const {
  const std::string base = std::string(scope_directory(scope)) + "/" + name;
  for (const char *extension : kExtensions) {
    const auto candidate = backups_.guard().resolve(base + extension);
    std::error_code ec;
    if (candidate.ok() && std::filesystem::is_regular_file(candidate.value(), ec)) {
      return base + extension;
    }
  }
  return base + kExtensions.front();
}

common::Result<std::string> VariableStore::read(const VariableScope scope,
                                                const std::string &name) const {
  const std::string path = relative_path(scope, name);
  const auto resolved = backups_.guard().resolve_existing(path);
  if (!resolved.ok()) {
    if (resolved.kind() == common::ErrorKind::NotFound) {
      return common::Result<std::string>::failure(
          common::ErrorKind::NotFound,
          std::string(scope_directory(scope)) + " file not found for '" + name + "'");
    }
    return common::Result<std::string>::failure(resolved);
  }
  return common::read_text_file(resolved.value());
}

common::Result<workspace::MaybeBackup> VariableStore::write(const VariableScope scope,
                                                            const std::string &name,
                                                            const std::string &content) const {
  const auto parsed = parse_variables_yaml(content);
  if (!parsed.ok()) {
    return common::Result<workspace::MaybeBackup>::failure(parsed);
  }
  return backups_.write_with_backup(relative_path(scope, name), content);
}

common::Result<std::vector<VariableFileInfo>> VariableStore::list() const {
  std::vector<VariableFileInfo> files;
  for (const auto scope : {VariableScope::Group, VariableScope::Host}) {
    const auto directory = backups_.guard().resolve(std::string(scope_directory(scope)));
    if (!directory.ok()) {
      return common::Result<std::vector<VariableFileInfo>>::failure(directory);
    }
    std::error_code ec;
    if (!std::filesystem::is_directory(directory.value(), ec)) {
      continue;
    }
    std::vector<VariableFileInfo> scoped;
    for (std::filesystem::directory_iterator it(directory.value(), ec), end; !ec && it != end;
         it.increment(ec)) {
      const auto &entry = *it;
      std::error_code entry_ec;
      const auto extension = entry.path().extension().string();
      if (!entry.is_regular_file(entry_ec) || (extension != ".yml" && extension != ".yaml")) {
        continue;
      }
      scoped.push_back(VariableFileInfo{
          .scope = scope,
          .name = entry.path().stem().string(),
          .relative_path = std::string(scope_directory(scope)) + "/" +
                           entry.path().filename().string()});
    }
    if (ec) {
      return common::Result<std::vector<VariableFileInfo>>::failure(
          common::ErrorKind::Io, "Unable to list variable files: " + ec.message());
    }
    std::sort(scoped.begin(), scoped.end(),
              [](const VariableFileInfo &a, const VariableFileInfo &b) {
                return a.relative_path < b.relative_path;
              });
    files.insert(files.end(), scoped.begin(), scoped.end());
  }
  return common::Result<std::vector<VariableFileInfo>>::success(std::move(files));
}

common::Result<bool> VariableStore::merge_file(const VariableScope scope, const std::string &name,
                                               EffectiveVariables &into) const {
  const std::string path = relative_path(scope, name);
  const auto content = read(scope, name);
  if (!content.ok()) {
    if (content.kind() == common::ErrorKind::NotFound) {
      return common::Result<bool>::success(false);
    }
    return common::Result<bool>::failure(content);
  }
  const auto pairs = parse_variables_yaml(content.value());
  if (!pairs.ok()) {
    return common::Result<bool>::failure(pairs.kind(), path + ": " + pairs.error());
  }
  for (const auto &[key, value] : pairs.value()) {
    assign(into, key, value, path);
  }
  return common::Result<bool>::success(true);
}

common::Result<EffectiveVariables> VariableStore::effective(const std::string &host) const {
  const auto document = inventory_.parse();
  if (!document.ok()) {
    return common::Result<EffectiveVariables>::failure(document);
  }
  const auto &inventory = document.value();

  EffectiveVariables result;
  result.host = host;

  const bool in_inventory = inventory.has_host(host);
  const auto groups = inventory.groups_of(host);

  if (in_inventory) {
    if (const auto *all = inventory.find_group("all"); all != nullptr) {
      for (const auto &[key, value] : all->vars) {
        assign(result, key, value, "inventory [all:vars]");
      }
    }
    for (const auto &group_name : groups) {
      const auto *group = inventory.find_group(group_name);
      for (const auto &[key, value] : group->vars) {
        assign(result, key, value, "inventory [" + group_name + ":vars]");
      }
    }
    for (const auto &[key, value] : inventory.host_vars(host)) {
      assign(result, key, value, "inventory host line");
    }
  }

  const auto all_merged = merge_file(VariableScope::Group, "all", result);
  if (!all_merged.ok()) {
    return common::Result<EffectiveVariables>::failure(all_merged);
  }
  for (const auto &group_name : groups) {
    const auto merged = merge_file(VariableScope::Group, group_name, result);
    if (!merged.ok()) {
      return common::Result<EffectiveVariables>::failure(merged);
    }
  }

  const auto host_merged = merge_file(VariableScope::Host, host, result);
  if (!host_merged.ok()) {
    return common::Result<EffectiveVariables>::failure(host_merged);
  }

  if (!in_inventory && !host_merged.value()) {
    return common::Result<EffectiveVariables>::failure(
        common::ErrorKind::HostNotFound, "Host '" + host + "' not found in inventory or host_vars");
  }
  return common::Result<EffectiveVariables>::success(std::move(result));
}

} // namespace playwarden::vars
