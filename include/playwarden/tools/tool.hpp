#pragma once

#include "playwarden/common/result.hpp"
#include "playwarden/security/sanitizer.hpp"

#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace playwarden::tools {

using ToolArgs = std::unordered_map<std::string, std::string>;

enum class Severity { Success, Warning, Error };

/// `SUCCESS`, `WARNING` or `ERROR`.
[[nodiscard]] std::string_view severity_prefix(Severity severity);

struct ToolOutcome {
  Severity severity = Severity::Success;
  std::string text;
  /// Digest of the snapshot taken by a mutating call, if any.
  std::string backup_digest;

  static ToolOutcome success(std::string text, std::string digest = "") {
    return ToolOutcome{Severity::Success, std::move(text), std::move(digest)};
  }
  static ToolOutcome warning(std::string text, std::string digest = "") {
    return ToolOutcome{Severity::Warning, std::move(text), std::move(digest)};
  }
};

struct ToolParam {
  std::string name;
  std::string description;
  security::ArgumentClass cls = security::ArgumentClass::Identifier;
  bool required = false;
  std::string default_value;
};

struct ToolSpec {
  std::string name;
  std::string description;
  std::vector<ToolParam> params;
  /// Needs `confirm=yes` before it changes anything.
  bool destructive = false;
  /// Shown instead of running when unconfirmed; `{}` takes the first argument.
  std::string confirm_prompt;
  std::string group;

  [[nodiscard]] std::string parameters_json() const;
};

/// Receives every declared parameter, defaults filled in and already checked
/// against its argument class.
using ToolHandler = std::function<common::Result<ToolOutcome>(const ToolArgs &)>;

/// Value of `name`, or empty when absent.
[[nodiscard]] std::string arg(const ToolArgs &args, const std::string &name);

} // namespace playwarden::tools
