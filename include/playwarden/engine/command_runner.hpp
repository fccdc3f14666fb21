#pragma once

#include "playwarden/common/result.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace playwarden::engine {

enum class CaptureMode { Separate, Merged };

struct RunOptions {
  std::chrono::milliseconds timeout{300'000};
  CaptureMode capture = CaptureMode::Separate;
  std::filesystem::path cwd;
  std::vector<std::pair<std::string, std::string>> env;
  /// Polled while the child runs; setting it kills the child.
  const std::atomic<bool> *cancel = nullptr;
  std::size_t max_output_bytes = 1024 * 1024;
};

struct ExecutionResult {
  int exit_code = 0;
  std::string stdout_text;
  std::string stderr_text;
  /// Captured streams after the masking pass; filled in by the caller that owns masking.
  std::string masked_output;
  bool timed_out = false;
  bool cancelled = false;
  std::chrono::milliseconds duration{0};
};

/// Runs an explicit argv without a shell. A non-zero exit is reported in
/// `exit_code`; only a failure to start the child is an error.
class ICommandRunner {
public:
  virtual ~ICommandRunner() = default;

  [[nodiscard]] virtual common::Result<ExecutionResult>
  run(const std::vector<std::string> &argv, const RunOptions &options) = 0;
};

class ProcessCommandRunner final : public ICommandRunner {
public:
  [[nodiscard]] common::Result<ExecutionResult> run(const std::vector<std::string> &argv,
                                                    const RunOptions &options) override;
};

/// Set by the SIGINT/SIGTERM handlers. Engine runs poll it as their cancel
/// flag, so an interrupted CLI kills the child group instead of orphaning it.
[[nodiscard]] std::atomic<bool> &interrupt_flag();
void install_interrupt_handlers();

inline constexpr const char *TRUNCATION_MARKER = "\n[output truncated]\n";

} // namespace playwarden::engine
