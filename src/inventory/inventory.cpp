#include "playwarden/inventory/inventory.hpp"

#include "playwarden/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <set>

namespace playwarden::inventory {

namespace {

constexpr const char *kUngrouped = "ungrouped";

enum class SectionKind { Hosts, Children, Vars };

struct SectionHeader {
  std::string group;
  SectionKind kind = SectionKind::Hosts;
};

bool is_comment(const std::string &trimmed) {
  return !trimmed.empty() && (trimmed.front() == '#' || trimmed.front() == ';');
}

bool is_header(const std::string &trimmed) {
  return !trimmed.empty() && trimmed.front() == '[' && trimmed.back() == ']';
}

bool valid_group_name(const std::string &name) {
  if (name.empty()) {
    return false;
  }
  return std::all_of(name.begin(), name.end(), [](const char ch) {
    return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_' || ch == '-' ||
           ch == '.';
  });
}

std::optional<SectionHeader> parse_header(const std::string &trimmed) {
  const std::string body = common::trim(trimmed.substr(1, trimmed.size() - 2));
  SectionHeader header;
  const auto colon = body.find(':');
  header.group = body.substr(0, colon);
  if (colon != std::string::npos) {
    const std::string suffix = body.substr(colon + 1);
    if (suffix == "children") {
      header.kind = SectionKind::Children;
    } else if (suffix == "vars") {
      header.kind = SectionKind::Vars;
    } else {
      return std::nullopt;
    }
  }
  if (!valid_group_name(header.group)) {
    return std::nullopt;
  }
  return header;
}

std::string unquote(const std::string &value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
      value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

InventoryGroup &find_or_add(std::vector<InventoryGroup> &groups, const std::string &name) {
  for (auto &group : groups) {
    if (group.name == name) {
      return group;
    }
  }
  groups.push_back(InventoryGroup{.name = name, .hosts = {}, .children = {}, .vars = {}});
  return groups.back();
}

common::Result<InventoryDocument> parse_failure(const std::size_t line_number,
                                                const std::string &what) {
  return common::Result<InventoryDocument>::failure(
      common::ErrorKind::ParseError,
      "Inventory parse error at line " + std::to_string(line_number) + ": " + what);
}

/// First token of a host line inside a hosts section, or empty.
std::string host_of_line(const std::string &line) {
  const std::string trimmed = common::trim(line);
  if (trimmed.empty() || is_comment(trimmed) || is_header(trimmed)) {
    return "";
  }
  const auto tokens = split_host_line(trimmed);
  return tokens.empty() ? "" : tokens.front();
}

struct LineSection {
  bool is_hosts = true;
  bool has_header = false;
};

/// Section membership of every line; a header line belongs to its own section.
std::vector<LineSection> classify(const std::vector<std::string> &lines) {
  std::vector<LineSection> out;
  out.reserve(lines.size());
  LineSection current;
  for (const auto &line : lines) {
    const std::string trimmed = common::trim(line);
    if (is_header(trimmed)) {
      const auto header = parse_header(trimmed);
      current.is_hosts = header.has_value() && header->kind == SectionKind::Hosts;
      current.has_header = true;
    }
    out.push_back(current);
  }
  return out;
}

} // namespace

std::vector<std::string> split_host_line(const std::string &line) {
  std::vector<std::string> tokens;
  std::string current;
  char quote = '\0';
  for (const char ch : line) {
    if (quote != '\0') {
      current.push_back(ch);
      if (ch == quote) {
        quote = '\0';
      }
      continue;
    }
    if (ch == '"' || ch == '\'') {
      quote = ch;
      current.push_back(ch);
      continue;
    }
    if (ch == ' ' || ch == '\t') {
      if (!current.empty()) {
        tokens.push_back(current);
        current.clear();
      }
      continue;
    }
    current.push_back(ch);
  }
  if (!current.empty()) {
    tokens.push_back(current);
  }
  return tokens;
}

const InventoryGroup *InventoryDocument::find_group(const std::string &name) const {
  for (const auto &group : groups) {
    if (group.name == name) {
      return &group;
    }
  }
  return nullptr;
}

bool InventoryDocument::has_host(const std::string &host) const {
  return std::any_of(groups.begin(), groups.end(), [&](const InventoryGroup &group) {
    return std::any_of(group.hosts.begin(), group.hosts.end(),
                       [&](const InventoryHost &entry) { return entry.name == host; });
  });
}

std::vector<std::string> InventoryDocument::host_names() const {
  std::vector<std::string> names;
  for (const auto &group : groups) {
    for (const auto &entry : group.hosts) {
      if (std::find(names.begin(), names.end(), entry.name) == names.end()) {
        names.push_back(entry.name);
      }
    }
  }
  return names;
}

std::vector<std::string> InventoryDocument::groups_of(const std::string &host) const {
  std::set<std::string> members;
  for (const auto &group : groups) {
    for (const auto &entry : group.hosts) {
      if (entry.name == host) {
        members.insert(group.name);
      }
    }
  }

  bool grew = !members.empty();
  while (grew) {
    grew = false;
    for (const auto &group : groups) {
      if (members.contains(group.name)) {
        continue;
      }
      const bool parent = std::any_of(group.children.begin(), group.children.end(),
                                      [&](const std::string &child) {
                                        return members.contains(child);
                                      });
      if (parent) {
        members.insert(group.name);
        grew = true;
      }
    }
  }

  std::vector<std::string> ordered;
  for (const auto &group : groups) {
    if (group.name != "all" && members.contains(group.name)) {
      ordered.push_back(group.name);
    }
  }
  return ordered;
}

VariableList InventoryDocument::host_vars(const std::string &host) const {
  VariableList merged;
  for (const auto &group : groups) {
    for (const auto &entry : group.hosts) {
      if (entry.name != host) {
        continue;
      }
      for (const auto &[key, value] : entry.vars) {
        auto existing = std::find_if(merged.begin(), merged.end(),
                                     [&](const auto &pair) { return pair.first == key; });
        if (existing != merged.end()) {
          existing->second = value;
        } else {
          merged.emplace_back(key, value);
        }
      }
    }
  }
  return merged;
}

common::Result<InventoryDocument> parse_inventory(const std::string &content) {
  InventoryDocument document;
  SectionHeader current{.group = kUngrouped, .kind = SectionKind::Hosts};
  const auto lines = common::split(content, '\n');

  for (std::size_t index = 0; index < lines.size(); ++index) {
    const std::size_t line_number = index + 1;
    const std::string trimmed = common::trim(lines[index]);
    if (trimmed.empty() || is_comment(trimmed)) {
      continue;
    }

    if (trimmed.front() == '[') {
      if (!is_header(trimmed)) {
        return parse_failure(line_number, "unterminated section header");
      }
      const auto header = parse_header(trimmed);
      if (!header.has_value()) {
        return parse_failure(line_number, "invalid section header");
      }
      current = *header;
      (void)find_or_add(document.groups, current.group);
      continue;
    }

    auto &group = find_or_add(document.groups, current.group);
    switch (current.kind) {
    case SectionKind::Hosts: {
      const auto tokens = split_host_line(trimmed);
      InventoryHost host{.name = tokens.front(), .vars = {}};
      for (std::size_t t = 1; t < tokens.size(); ++t) {
        if (is_comment(tokens[t])) {
          break;
        }
        const auto equals = tokens[t].find('=');
        if (equals == std::string::npos || equals == 0) {
          return parse_failure(line_number, "expected key=value after host name");
        }
        host.vars.emplace_back(tokens[t].substr(0, equals), unquote(tokens[t].substr(equals + 1)));
      }
      group.hosts.push_back(std::move(host));
      break;
    }
    case SectionKind::Children: {
      if (!valid_group_name(trimmed)) {
        return parse_failure(line_number, "invalid child group name");
      }
      group.children.push_back(trimmed);
      (void)find_or_add(document.groups, trimmed);
      break;
    }
    case SectionKind::Vars: {
      const auto equals = trimmed.find('=');
      if (equals == std::string::npos) {
        return parse_failure(line_number, "expected key=value in vars section");
      }
      const std::string key = common::trim(trimmed.substr(0, equals));
      if (key.empty()) {
        return parse_failure(line_number, "missing variable name");
      }
      group.vars.emplace_back(key, unquote(common::trim(trimmed.substr(equals + 1))));
      break;
    }
    }
  }

  return common::Result<InventoryDocument>::success(std::move(document));
}

InventoryStore::InventoryStore(workspace::BackupManager backups, std::string relative_path)
    : backups_(std::move(backups)), relative_path_(std::move(relative_path)) {}

common::Result<std::string> InventoryStore::read() const {
  const auto path = backups_.guard().resolve_existing(relative_path_);
  if (!path.ok()) {
    return common::Result<std::string>::failure(path.kind(),
                                                path.kind() == common::ErrorKind::NotFound
                                                    ? "Inventory file not found: " + relative_path_
                                                    : path.error());
  }
  return common::read_text_file(path.value());
}

common::Result<std::string> InventoryStore::read_or_empty() const {
  auto content = read();
  if (!content.ok() && content.kind() == common::ErrorKind::NotFound) {
    return common::Result<std::string>::success("");
  }
  return content;
}

common::Result<workspace::MaybeBackup> InventoryStore::write(const std::string &content) const {
  const auto parsed = parse_inventory(content);
  if (!parsed.ok()) {
    return common::Result<workspace::MaybeBackup>::failure(parsed);
  }
  return backups_.write_with_backup(relative_path_, content);
}

common::Result<workspace::MaybeBackup>
InventoryStore::add_host(const AddHostRequest &request) const {
  const std::string group = request.group.empty() ? "all" : request.group;
  if (!valid_group_name(group)) {
    return common::Result<workspace::MaybeBackup>::failure(common::ErrorKind::InvalidArgument,
                                                           "Invalid group name");
  }
  if (request.host.empty() || request.address.empty()) {
    return common::Result<workspace::MaybeBackup>::failure(common::ErrorKind::InvalidArgument,
                                                           "Host name and address are required");
  }

  const auto content = read_or_empty();
  if (!content.ok()) {
    return common::Result<workspace::MaybeBackup>::failure(content);
  }
  const auto document = parse_inventory(content.value());
  if (!document.ok()) {
    return common::Result<workspace::MaybeBackup>::failure(document);
  }
  if (document.value().has_host(request.host)) {
    return common::Result<workspace::MaybeBackup>::failure(
        common::ErrorKind::DuplicateHost, "Host '" + request.host + "' already exists in inventory");
  }

  std::string host_line = request.host + " ansible_host=" + request.address;
  for (const auto &token : split_host_line(request.extra_vars)) {
    const auto equals = token.find('=');
    if (equals == std::string::npos || equals == 0) {
      return common::Result<workspace::MaybeBackup>::failure(
          common::ErrorKind::InvalidArgument, "extra_vars must be key=value pairs");
    }
    host_line += " " + token;
  }

  const std::string &text = content.value();
  const std::string header = "[" + group + "]";
  auto lines = common::split(text, '\n');
  const bool terminated = text.empty() || text.back() == '\n';
  if (!text.empty() && terminated) {
    // split() drops the empty field after the final newline
    lines.emplace_back();
  }

  std::string updated;
  const auto header_it = std::find_if(lines.begin(), lines.end(), [&](const std::string &line) {
    return common::trim(line) == header;
  });
  if (header_it != lines.end()) {
    lines.insert(header_it + 1, host_line);
    updated = common::join(lines, "\n");
  } else {
    updated = text;
    if (!updated.empty()) {
      if (!terminated) {
        updated += "\n";
      }
      updated += "\n";
    }
    updated += header + "\n" + host_line + "\n";
  }

  return backups_.write_with_backup(relative_path_, updated);
}

common::Result<workspace::Backup> InventoryStore::remove_host(const std::string &host) const {
  const auto content = read();
  if (!content.ok()) {
    return common::Result<workspace::Backup>::failure(content);
  }

  const std::string &text = content.value();
  auto lines = common::split(text, '\n');
  if (!text.empty() && text.back() == '\n') {
    lines.emplace_back();
  }
  const auto sections = classify(lines);

  std::vector<bool> drop(lines.size(), false);
  bool removed = false;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (sections[i].is_hosts && host_of_line(lines[i]) == host) {
      drop[i] = true;
      removed = true;
    }
  }
  if (!removed) {
    return common::Result<workspace::Backup>::failure(
        common::ErrorKind::HostNotFound, "Host '" + host + "' not found in inventory");
  }

  // Drop hosts sections left without content, with the blank line separating them.
  for (std::size_t i = 0; i < lines.size(); ++i) {
    const std::string trimmed = common::trim(lines[i]);
    if (!is_header(trimmed) || !sections[i].is_hosts) {
      continue;
    }
    bool had_removed = false;
    bool has_content = false;
    for (std::size_t j = i + 1; j < lines.size() && !is_header(common::trim(lines[j])); ++j) {
      if (drop[j]) {
        had_removed = true;
      } else if (!common::trim(lines[j]).empty()) {
        has_content = true;
      }
    }
    if (had_removed && !has_content) {
      drop[i] = true;
      if (i > 0 && !drop[i - 1] && common::trim(lines[i - 1]).empty()) {
        drop[i - 1] = true;
      }
    }
  }

  std::vector<std::string> kept;
  kept.reserve(lines.size());
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (!drop[i]) {
      kept.push_back(lines[i]);
    }
  }

  auto written = backups_.write_with_backup(relative_path_, common::join(kept, "\n"));
  if (!written.ok()) {
    return common::Result<workspace::Backup>::failure(written);
  }
  if (!written.value().has_value()) {
    return common::Result<workspace::Backup>::failure(common::ErrorKind::BackupFailure,
                                                      "Inventory backup missing");
  }
  return common::Result<workspace::Backup>::success(std::move(*written.value()));
}

common::Result<InventoryDocument> InventoryStore::parse() const {
  const auto content = read_or_empty();
  if (!content.ok()) {
    return common::Result<InventoryDocument>::failure(content);
  }
  return parse_inventory(content.value());
}

common::Result<InventoryListing> InventoryStore::list() const {
  const auto document = parse();
  if (!document.ok()) {
    return common::Result<InventoryListing>::failure(document);
  }
  InventoryListing listing;
  listing.groups = document.value().groups;
  listing.total_hosts = document.value().host_names().size();
  return common::Result<InventoryListing>::success(std::move(listing));
}

} // namespace playwarden::inventory
