#pragma once

#include "playwarden/common/result.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace playwarden::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] bool ends_with(const std::string &value, const std::string &suffix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::vector<std::string> split(const std::string &value, char delimiter);
[[nodiscard]] std::string join(const std::vector<std::string> &parts, const std::string &glue);
[[nodiscard]] bool is_truthy(const std::string &value);

[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);
[[nodiscard]] bool is_subpath(const std::filesystem::path &candidate,
                             const std::filesystem::path &parent);

[[nodiscard]] Result<std::string> read_text_file(const std::filesystem::path &path);
/// Writes through a sibling temp file and renames it over the target.
[[nodiscard]] Status write_text_file_atomic(const std::filesystem::path &path,
                                            const std::string &content);

/// Sortable UTC timestamp, `YYYYMMDD_HHMMSS_micro`.
[[nodiscard]] std::string sortable_timestamp(std::chrono::system_clock::time_point when);
[[nodiscard]] std::string iso8601_utc(std::chrono::system_clock::time_point when);
[[nodiscard]] std::string sha256_hex(const std::string &text);

} // namespace playwarden::common
