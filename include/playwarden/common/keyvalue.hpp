#pragma once

#include "playwarden/common/result.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace playwarden::common {

/// Flavour of `[section]` + `key = value` text.
/// Toml: `#` comments, double-quoted strings, `[a, b]` arrays.
/// Ini: `#`/`;` comments, `=` or `:` separators, indented continuation lines.
enum class KeyValueDialect { Toml, Ini };

struct KeyValueDocument {
  std::vector<std::string> sections;
  std::unordered_map<std::string, std::string> values;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] bool has_section(const std::string &section) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback) const;
  [[nodiscard]] std::uint64_t get_u64(const std::string &key, std::uint64_t fallback) const;
  [[nodiscard]] std::vector<std::string>
  get_string_array(const std::string &key, const std::vector<std::string> &fallback = {}) const;
};

[[nodiscard]] Result<KeyValueDocument> parse_key_values(const std::string &content,
                                                        KeyValueDialect dialect);
[[nodiscard]] std::string quote_toml_string(const std::string &value);

} // namespace playwarden::common
