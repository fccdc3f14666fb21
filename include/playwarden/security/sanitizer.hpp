#pragma once

#include "playwarden/common/result.hpp"
#include "playwarden/config/schema.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace playwarden::security {

inline constexpr const char *MASK_MARKER = "********";

/// Allow-list applied to an inbound argument.
enum class ArgumentClass {
  /// Host, group, playbook, template and variable-file names.
  Identifier,
  /// Workspace-relative file paths.
  PathFragment,
  /// Values that end up as engine argv entries (limits, tags, module args).
  ProcessArgument,
  /// File bodies.
  ContentBody,
};

[[nodiscard]] std::string_view argument_class_name(ArgumentClass cls);
[[nodiscard]] bool is_allowed(const std::string &value, ArgumentClass cls);

class InputSanitizer {
public:
  explicit InputSanitizer(config::MaskingConfig masking);

  /// Rejects (never strips) values outside the class allow-list. The error
  /// names the field only.
  [[nodiscard]] common::Status check(const std::string &value, ArgumentClass cls,
                                     std::string_view field) const;

  /// Replaces the value of every secret-looking key with `MASK_MARKER`.
  /// Line oriented; running it twice yields the same text. Lines indented
  /// under a secret key with an empty or block (`|`, `>`) value are hidden
  /// as well.
  [[nodiscard]] std::string mask(const std::string &text) const;

  [[nodiscard]] bool is_secret_key(const std::string &key) const;

private:
  [[nodiscard]] std::string mask_line(const std::string &line) const;
  [[nodiscard]] std::string mask_quoted_pairs(const std::string &line) const;
  [[nodiscard]] std::string mask_inline_tokens(const std::string &line) const;
  [[nodiscard]] bool opens_secret_block(const std::string &line) const;

  std::vector<std::string> keywords_;
  std::vector<std::string> exempt_keys_;
};

} // namespace playwarden::security
