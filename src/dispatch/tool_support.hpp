#pragma once

#include "playwarden/engine/ansible.hpp"
#include "playwarden/tools/tool.hpp"
#include "playwarden/workspace/backup.hpp"

#include <string>

namespace playwarden::dispatch::detail {

using security::ArgumentClass;

inline tools::ToolParam required_param(std::string name, std::string description,
                                       const ArgumentClass cls) {
  return tools::ToolParam{.name = std::move(name),
                          .description = std::move(description),
                          .cls = cls,
                          .required = true,
                          .default_value = ""};
}

inline tools::ToolParam optional_param(std::string name, std::string description,
                                       const ArgumentClass cls, std::string fallback = "") {
  return tools::ToolParam{.name = std::move(name),
                          .description = std::move(description),
                          .cls = cls,
                          .required = false,
                          .default_value = std::move(fallback)};
}

inline tools::ToolParam confirm_param() {
  return optional_param("confirm", "Set to yes to proceed", ArgumentClass::Identifier, "no");
}

inline std::string backup_note(const workspace::MaybeBackup &backup) {
  return backup.has_value() ? "\nBackup: " + backup->backup_path : std::string();
}

inline std::string backup_digest(const workspace::MaybeBackup &backup) {
  return backup.has_value() ? backup->digest : std::string();
}

/// Maps a finished engine run onto a tool outcome: warnings for partial
/// failures, an error for timeouts and hard failures.
inline common::Result<tools::ToolOutcome> outcome_from_run(const engine::ExecutionResult &result,
                                                           const std::string &header) {
  const std::string text = header.empty() ? result.masked_output
                                          : header + "\n" + result.masked_output;
  if (result.timed_out) {
    return common::Result<tools::ToolOutcome>::failure(
        common::ErrorKind::SubprocessTimeout,
        (result.cancelled ? "Command cancelled.\n" : "Command timed out.\n") + text);
  }
  switch (engine::classify_exit(result)) {
  case engine::RunOutcome::Success:
    return common::Result<tools::ToolOutcome>::success(tools::ToolOutcome::success(text));
  case engine::RunOutcome::Warning:
    return common::Result<tools::ToolOutcome>::success(tools::ToolOutcome::warning(text));
  case engine::RunOutcome::Failure:
    break;
  }
  return common::Result<tools::ToolOutcome>::failure(common::ErrorKind::SubprocessNonZeroExit,
                                                     text);
}

} // namespace playwarden::dispatch::detail
