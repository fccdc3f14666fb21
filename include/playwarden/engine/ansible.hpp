#pragma once

#include "playwarden/common/result.hpp"
#include "playwarden/config/schema.hpp"
#include "playwarden/engine/command_runner.hpp"
#include "playwarden/security/sanitizer.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace playwarden::engine {

enum class RunOutcome { Success, Warning, Failure };

[[nodiscard]] std::string_view run_outcome_name(RunOutcome outcome);

/// Exit 0 is success, 2 (host failures) and 4 (unreachable) are warnings,
/// anything else or a timeout is a failure.
[[nodiscard]] RunOutcome classify_exit(const ExecutionResult &result);

/// `PLAY RECAP` block plus `fatal:`/`failed:`/`changed:` lines, or empty.
[[nodiscard]] std::string summarize_output(const std::string &output);

/// Human readable dump of both streams and a non-zero return code.
[[nodiscard]] std::string format_output(const ExecutionResult &result);

struct PlaybookInvocation {
  std::filesystem::path playbook;
  std::string limit;
  std::string extra_vars;
  std::string tags;
  bool verbose = false;
  bool check = false;
  bool syntax_check = false;
};

struct AdhocInvocation {
  std::string target = "all";
  std::string module;
  std::string module_args;
  bool check = false;
};

/// Builds engine argv vectors and runs them in the workspace with the fixed
/// engine environment. Every result leaves with `masked_output` filled in.
class AnsibleEngine {
public:
  AnsibleEngine(const config::Config &config, std::filesystem::path root,
                std::shared_ptr<ICommandRunner> runner, security::InputSanitizer sanitizer);

  [[nodiscard]] std::vector<std::string> playbook_argv(const PlaybookInvocation &invocation) const;
  [[nodiscard]] std::vector<std::string> adhoc_argv(const AdhocInvocation &invocation) const;

  [[nodiscard]] common::Result<ExecutionResult>
  run(const std::vector<std::string> &argv, std::chrono::seconds timeout,
      CaptureMode capture = CaptureMode::Separate) const;

  [[nodiscard]] const std::filesystem::path &inventory_path() const { return inventory_; }
  [[nodiscard]] const config::EngineConfig &settings() const { return settings_; }

private:
  config::EngineConfig settings_;
  std::filesystem::path root_;
  std::filesystem::path inventory_;
  std::shared_ptr<ICommandRunner> runner_;
  security::InputSanitizer sanitizer_;
};

} // namespace playwarden::engine
