#pragma once

#include "playwarden/common/result.hpp"
#include "playwarden/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace playwarden::config {

/// Environment variable that selects the workspace root.
inline constexpr const char *WORKSPACE_ENV = "ANSIBLE_DIR";

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

[[nodiscard]] common::Result<Config> parse_config(const std::string &content);
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Status save_config(const Config &config);
[[nodiscard]] std::string render_config(const Config &config);

[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

/// Applies `ANSIBLE_DIR` and fills in defaults for unset paths.
void apply_env_overrides(Config &config);

} // namespace playwarden::config
