#include "playwarden/config/config.hpp"

#include "playwarden/common/fs.hpp"
#include "playwarden/common/keyvalue.hpp"

#include <cstdlib>
#include <filesystem>
#include <sstream>

namespace playwarden::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".playwarden";
constexpr const char *CONFIG_FILENAME = "config.toml";
constexpr const char *AUDIT_FILENAME = "audit.db";
constexpr const char *DEFAULT_WORKSPACE = "~/ansible";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("PLAYWARDEN_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string bool_to_toml(bool value) { return value ? "true" : "false"; }

std::string string_array_to_toml(const std::vector<std::string> &values) {
  std::ostringstream stream;
  stream << '[';
  for (std::size_t index = 0; index < values.size(); ++index) {
    if (index > 0) {
      stream << ", ";
    }
    stream << common::quote_toml_string(values[index]);
  }
  stream << ']';
  return stream.str();
}

bool is_module_name(const std::string &value) {
  if (value.empty()) {
    return false;
  }
  for (const char ch : value) {
    const bool allowed = (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') ||
                         (ch >= '0' && ch <= '9') || ch == '_' || ch == '.';
    if (!allowed) {
      return false;
    }
  }
  return true;
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    std::filesystem::path candidate = *override_path;
    if (std::filesystem::is_directory(candidate, ec) || candidate.filename().empty()) {
      return common::ensure_dir(candidate);
    }

    auto parent = candidate.parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(common::ErrorKind::Io,
                                                              "unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home);
  }

  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir);
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

void apply_env_overrides(Config &config) {
  if (const char *root = std::getenv(WORKSPACE_ENV); root != nullptr && *root != '\0') {
    config.workspace.root = common::expand_path(root);
  }
  if (config.workspace.root.empty()) {
    config.workspace.root = common::expand_path(DEFAULT_WORKSPACE);
  }

  if (config.audit.path.empty()) {
    const auto dir = config_dir();
    if (dir.ok()) {
      config.audit.path = (dir.value() / AUDIT_FILENAME).string();
    }
  } else {
    config.audit.path = common::expand_path(config.audit.path);
  }
}

common::Result<Config> parse_config(const std::string &content) {
  const auto parsed = common::parse_key_values(content, common::KeyValueDialect::Toml);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed);
  }
  const auto &doc = parsed.value();

  Config config;

  if (doc.has("workspace.root")) {
    config.workspace.root = common::expand_path(doc.get_string("workspace.root"));
  }
  config.workspace.inventory = doc.get_string("workspace.inventory", config.workspace.inventory);

  config.engine.playbook_binary =
      doc.get_string("engine.playbook_binary", config.engine.playbook_binary);
  config.engine.adhoc_binary = doc.get_string("engine.adhoc_binary", config.engine.adhoc_binary);
  config.engine.host_key_checking =
      doc.get_bool("engine.host_key_checking", config.engine.host_key_checking);
  config.engine.default_timeout_seconds = static_cast<std::uint32_t>(
      doc.get_u64("engine.default_timeout_seconds", config.engine.default_timeout_seconds));
  config.engine.syntax_timeout_seconds = static_cast<std::uint32_t>(
      doc.get_u64("engine.syntax_timeout_seconds", config.engine.syntax_timeout_seconds));
  config.engine.device_timeout_seconds = static_cast<std::uint32_t>(
      doc.get_u64("engine.device_timeout_seconds", config.engine.device_timeout_seconds));

  config.devices.facts_module = doc.get_string("devices.facts_module", config.devices.facts_module);
  config.devices.config_module =
      doc.get_string("devices.config_module", config.devices.config_module);
  config.devices.command_module =
      doc.get_string("devices.command_module", config.devices.command_module);
  config.devices.adhoc_modules =
      doc.get_string_array("devices.adhoc_modules", config.devices.adhoc_modules);

  config.masking.keywords = doc.get_string_array("masking.keywords", config.masking.keywords);
  config.masking.exempt_keys =
      doc.get_string_array("masking.exempt_keys", config.masking.exempt_keys);

  config.audit.enabled = doc.get_bool("audit.enabled", config.audit.enabled);
  config.audit.path = doc.get_string("audit.path", config.audit.path);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result);
  }

  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto content = common::read_text_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure(common::ErrorKind::Io,
                                           "Unable to open config file: " + path.string());
  }

  auto parsed = parse_config(content.value());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.kind(), path.string() + ": " + parsed.error());
  }

  Config config = std::move(parsed.value());
  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

std::string render_config(const Config &config) {
  std::ostringstream file;

  file << "[workspace]\n";
  if (!config.workspace.root.empty()) {
    file << "root = " << common::quote_toml_string(config.workspace.root.string()) << "\n";
  }
  file << "inventory = " << common::quote_toml_string(config.workspace.inventory) << "\n";

  file << "\n[engine]\n";
  file << "playbook_binary = " << common::quote_toml_string(config.engine.playbook_binary)
       << "\n";
  file << "adhoc_binary = " << common::quote_toml_string(config.engine.adhoc_binary) << "\n";
  file << "host_key_checking = " << bool_to_toml(config.engine.host_key_checking) << "\n";
  file << "default_timeout_seconds = " << config.engine.default_timeout_seconds << "\n";
  file << "syntax_timeout_seconds = " << config.engine.syntax_timeout_seconds << "\n";
  file << "device_timeout_seconds = " << config.engine.device_timeout_seconds << "\n";

  file << "\n[devices]\n";
  file << "facts_module = " << common::quote_toml_string(config.devices.facts_module) << "\n";
  file << "config_module = " << common::quote_toml_string(config.devices.config_module) << "\n";
  file << "command_module = " << common::quote_toml_string(config.devices.command_module) << "\n";
  file << "adhoc_modules = " << string_array_to_toml(config.devices.adhoc_modules) << "\n";

  file << "\n[masking]\n";
  file << "keywords = " << string_array_to_toml(config.masking.keywords) << "\n";
  file << "exempt_keys = " << string_array_to_toml(config.masking.exempt_keys) << "\n";

  file << "\n[audit]\n";
  file << "enabled = " << bool_to_toml(config.audit.enabled) << "\n";
  if (!config.audit.path.empty()) {
    file << "path = " << common::quote_toml_string(config.audit.path) << "\n";
  }

  file << "\n[observability]\n";
  file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";

  return file.str();
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return cfg_path_result.status();
  }
  return common::write_text_file_atomic(cfg_path_result.value(), render_config(config));
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  if (config.workspace.root.empty()) {
    return common::Result<std::vector<std::string>>::failure(common::ErrorKind::InvalidArgument,
                                                              "workspace.root is not set");
  }

  const std::filesystem::path inventory(config.workspace.inventory);
  if (config.workspace.inventory.empty() || inventory.is_absolute()) {
    return common::Result<std::vector<std::string>>::failure(
        common::ErrorKind::InvalidArgument,
        "workspace.inventory must be a path relative to the workspace root");
  }
  for (const auto &part : inventory) {
    if (part == "..") {
      return common::Result<std::vector<std::string>>::failure(
          common::ErrorKind::InvalidArgument, "workspace.inventory must not contain '..'");
    }
  }

  if (common::trim(config.engine.playbook_binary).empty() ||
      common::trim(config.engine.adhoc_binary).empty()) {
    return common::Result<std::vector<std::string>>::failure(
        common::ErrorKind::InvalidArgument, "engine binaries must not be empty");
  }

  if (config.engine.default_timeout_seconds == 0 || config.engine.syntax_timeout_seconds == 0 ||
      config.engine.device_timeout_seconds == 0) {
    return common::Result<std::vector<std::string>>::failure(
        common::ErrorKind::InvalidArgument, "engine timeouts must be at least 1 second");
  }

  for (const auto *module : {&config.devices.facts_module, &config.devices.config_module,
                             &config.devices.command_module}) {
    if (!is_module_name(*module)) {
      return common::Result<std::vector<std::string>>::failure(
          common::ErrorKind::InvalidArgument, "Invalid device module name: " + *module);
    }
  }
  for (const auto &pattern : config.devices.adhoc_modules) {
    const bool wildcard = !pattern.empty() && pattern.back() == '*';
    if (!is_module_name(wildcard ? pattern.substr(0, pattern.size() - 1) : pattern)) {
      return common::Result<std::vector<std::string>>::failure(
          common::ErrorKind::InvalidArgument, "Invalid devices.adhoc_modules entry: " + pattern);
    }
  }

  if (config.masking.keywords.empty()) {
    warnings.push_back("masking.keywords is empty; command output will not be masked");
  }

  const std::string backend = common::to_lower(config.observability.backend);
  if (backend != "log" && backend != "none" && backend != "noop") {
    return common::Result<std::vector<std::string>>::failure(
        common::ErrorKind::InvalidArgument,
        "Invalid observability.backend: " + config.observability.backend);
  }

  if (config.engine.host_key_checking) {
    warnings.push_back("engine.host_key_checking is enabled; unknown devices will be refused");
  }

  std::error_code ec;
  if (!std::filesystem::is_directory(config.workspace.root, ec)) {
    warnings.push_back("workspace root does not exist yet: " + config.workspace.root.string());
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

} // namespace playwarden::config
