#include "playwarden/engine/ansible.hpp"

#include "playwarden/common/fs.hpp"
#include "playwarden/observability/global.hpp"

#include <sstream>

namespace playwarden::engine {

std::string_view run_outcome_name(const RunOutcome outcome) {
  switch (outcome) {
  case RunOutcome::Success:
    return "success";
  case RunOutcome::Warning:
    return "warning";
  case RunOutcome::Failure:
    return "failure";
  }
  return "failure";
}

RunOutcome classify_exit(const ExecutionResult &result) {
  if (result.timed_out) {
    return RunOutcome::Failure;
  }
  switch (result.exit_code) {
  case 0:
    return RunOutcome::Success;
  case 2:
  case 4:
    return RunOutcome::Warning;
  default:
    return RunOutcome::Failure;
  }
}

std::string summarize_output(const std::string &output) {
  std::vector<std::string> lines;
  bool in_recap = false;
  std::istringstream stream(output);
  std::string line;
  while (std::getline(stream, line)) {
    if (line.find("PLAY RECAP") != std::string::npos) {
      in_recap = true;
    }
    const std::string lowered = common::to_lower(line);
    if (in_recap) {
      lines.push_back(line);
    } else if (lowered.find("fatal:") != std::string::npos ||
               lowered.find("failed:") != std::string::npos) {
      lines.push_back(line);
    } else if (lowered.find("changed:") != std::string::npos &&
               lowered.find("ok=") == std::string::npos) {
      lines.push_back(line);
    }
  }
  while (!lines.empty() && common::trim(lines.back()).empty()) {
    lines.pop_back();
  }
  return common::join(lines, "\n");
}

std::string format_output(const ExecutionResult &result) {
  std::vector<std::string> parts;
  if (!result.stdout_text.empty()) {
    parts.push_back("=== OUTPUT ===\n" + result.stdout_text);
  }
  if (!result.stderr_text.empty()) {
    parts.push_back("=== STDERR ===\n" + result.stderr_text);
  }
  if (result.timed_out) {
    parts.push_back(result.cancelled ? "=== CANCELLED ===" : "=== TIMED OUT ===");
  } else if (result.exit_code != 0) {
    parts.push_back("=== RETURN CODE: " + std::to_string(result.exit_code) + " ===");
  }
  if (parts.empty()) {
    return "Command completed with no output.";
  }
  return common::join(parts, "\n");
}

AnsibleEngine::AnsibleEngine(const config::Config &config, std::filesystem::path root,
                             std::shared_ptr<ICommandRunner> runner,
                             security::InputSanitizer sanitizer)
    : settings_(config.engine), root_(std::move(root)),
      inventory_(root_ / config.workspace.inventory), runner_(std::move(runner)),
      sanitizer_(std::move(sanitizer)) {}

std::vector<std::string> AnsibleEngine::playbook_argv(const PlaybookInvocation &invocation) const {
  std::vector<std::string> argv = {settings_.playbook_binary, "-i", inventory_.string(),
                                   invocation.playbook.string()};
  if (invocation.syntax_check) {
    argv.emplace_back("--syntax-check");
    return argv;
  }
  if (invocation.check) {
    argv.emplace_back("--check");
    argv.emplace_back("--diff");
  }
  if (!invocation.limit.empty()) {
    argv.emplace_back("--limit");
    argv.push_back(invocation.limit);
  }
  if (!invocation.extra_vars.empty()) {
    argv.emplace_back("--extra-vars");
    argv.push_back(invocation.extra_vars);
  }
  if (!invocation.tags.empty()) {
    argv.emplace_back("--tags");
    argv.push_back(invocation.tags);
  }
  if (invocation.verbose) {
    argv.emplace_back("-vvv");
  }
  return argv;
}

std::vector<std::string> AnsibleEngine::adhoc_argv(const AdhocInvocation &invocation) const {
  std::vector<std::string> argv = {settings_.adhoc_binary, "-i", inventory_.string(),
                                   invocation.target.empty() ? "all" : invocation.target, "-m",
                                   invocation.module};
  if (!invocation.module_args.empty()) {
    argv.emplace_back("-a");
    argv.push_back(invocation.module_args);
  }
  if (invocation.check) {
    argv.emplace_back("--check");
  }
  return argv;
}

common::Result<ExecutionResult> AnsibleEngine::run(const std::vector<std::string> &argv,
                                                   const std::chrono::seconds timeout,
                                                   const CaptureMode capture) const {
  RunOptions options;
  options.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(timeout);
  options.capture = capture;
  options.cwd = root_;
  options.env = {
      {"ANSIBLE_HOST_KEY_CHECKING", settings_.host_key_checking ? "True" : "False"},
      {"ANSIBLE_FORCE_COLOR", "false"},
  };
  options.cancel = &interrupt_flag();

  auto result = runner_->run(argv, options);
  if (!result.ok()) {
    observability::record_error("engine", result.error());
    return result;
  }

  auto &execution = result.value();
  execution.masked_output = sanitizer_.mask(format_output(execution));
  observability::record_engine_run(argv.front(), execution.exit_code, execution.timed_out,
                                   execution.cancelled, execution.duration);
  return result;
}

} // namespace playwarden::engine
