#include "playwarden/engine/command_runner.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace playwarden::engine {

namespace {

std::atomic<bool> g_interrupted{false};

void on_interrupt(int) { g_interrupted.store(true); }

struct OutputSink {
  std::string text;
  std::size_t limit = 0;
  bool truncated = false;

  void append(const char *data, const std::size_t size) {
    if (text.size() >= limit) {
      truncated = truncated || size > 0;
      return;
    }
    const std::size_t room = limit - text.size();
    if (size > room) {
      text.append(data, room);
      truncated = true;
      return;
    }
    text.append(data, size);
  }

  void finish() {
    if (truncated) {
      text += TRUNCATION_MARKER;
    }
  }
};

void set_non_blocking(const int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

void close_fd(int &fd) {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

/// Returns false once the write end is closed.
bool drain(const int fd, OutputSink &sink) {
  if (fd < 0) {
    return false;
  }
  std::array<char, 4096> chunk{};
  while (true) {
    const ssize_t bytes = read(fd, chunk.data(), chunk.size());
    if (bytes > 0) {
      sink.append(chunk.data(), static_cast<std::size_t>(bytes));
      continue;
    }
    if (bytes == 0) {
      return false;
    }
    if (errno == EINTR) {
      continue;
    }
    return errno == EAGAIN || errno == EWOULDBLOCK;
  }
}

std::vector<std::string> build_environment(
    const std::vector<std::pair<std::string, std::string>> &overrides) {
  std::vector<std::string> entries;
  for (char **cursor = environ; cursor != nullptr && *cursor != nullptr; ++cursor) {
    const std::string entry(*cursor);
    const auto equals = entry.find('=');
    const std::string name = entry.substr(0, equals);
    bool overridden = false;
    for (const auto &[key, value] : overrides) {
      if (key == name) {
        overridden = true;
        break;
      }
    }
    if (!overridden) {
      entries.push_back(entry);
    }
  }
  for (const auto &[key, value] : overrides) {
    entries.push_back(key + "=" + value);
  }
  return entries;
}

int decode_status(const int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

} // namespace

std::atomic<bool> &interrupt_flag() { return g_interrupted; }

void install_interrupt_handlers() {
  struct sigaction action {};
  action.sa_handler = on_interrupt;
  sigemptyset(&action.sa_mask);
  // No SA_RESTART: a blocked stdin read returns so `serve` can stop.
  action.sa_flags = 0;
  (void)sigaction(SIGINT, &action, nullptr);
  (void)sigaction(SIGTERM, &action, nullptr);
}

common::Result<ExecutionResult> ProcessCommandRunner::run(const std::vector<std::string> &argv,
                                                          const RunOptions &options) {
  if (argv.empty() || argv.front().empty()) {
    return common::Result<ExecutionResult>::failure(common::ErrorKind::InvalidArgument,
                                                    "command is empty");
  }

  // Everything the child needs is allocated before fork.
  std::vector<char *> child_argv;
  child_argv.reserve(argv.size() + 1);
  for (const auto &arg : argv) {
    child_argv.push_back(const_cast<char *>(arg.c_str()));
  }
  child_argv.push_back(nullptr);

  const std::vector<std::string> env_entries = build_environment(options.env);
  std::vector<char *> child_env;
  child_env.reserve(env_entries.size() + 1);
  for (const auto &entry : env_entries) {
    child_env.push_back(const_cast<char *>(entry.c_str()));
  }
  child_env.push_back(nullptr);
  const std::string cwd = options.cwd.string();

  const bool merged = options.capture == CaptureMode::Merged;
  int stdout_pipe[2] = {-1, -1};
  int stderr_pipe[2] = {-1, -1};
  int status_pipe[2] = {-1, -1};
  const auto close_all = [&]() {
    for (int *fd : {&stdout_pipe[0], &stdout_pipe[1], &stderr_pipe[0], &stderr_pipe[1],
                    &status_pipe[0], &status_pipe[1]}) {
      close_fd(*fd);
    }
  };

  if (pipe(stdout_pipe) != 0 || (!merged && pipe(stderr_pipe) != 0) ||
      pipe2(status_pipe, O_CLOEXEC) != 0) {
    close_all();
    return common::Result<ExecutionResult>::failure(common::ErrorKind::Io,
                                                    "failed to create pipes for " + argv.front());
  }

  const auto started = std::chrono::steady_clock::now();
  const pid_t pid = fork();
  if (pid < 0) {
    close_all();
    return common::Result<ExecutionResult>::failure(common::ErrorKind::Io,
                                                    "failed to fork " + argv.front());
  }

  if (pid == 0) {
    (void)setpgid(0, 0);
    (void)dup2(stdout_pipe[1], STDOUT_FILENO);
    (void)dup2(merged ? stdout_pipe[1] : stderr_pipe[1], STDERR_FILENO);
    const int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      (void)dup2(devnull, STDIN_FILENO);
      close(devnull);
    }
    close(stdout_pipe[0]);
    close(stdout_pipe[1]);
    if (!merged) {
      close(stderr_pipe[0]);
      close(stderr_pipe[1]);
    }
    close(status_pipe[0]);

    if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
      const int error = errno;
      (void)write(status_pipe[1], &error, sizeof(error));
      _exit(127);
    }
    environ = child_env.data();
    execvp(child_argv[0], child_argv.data());
    const int error = errno;
    (void)write(status_pipe[1], &error, sizeof(error));
    _exit(127);
  }

  (void)setpgid(pid, pid);
  close_fd(stdout_pipe[1]);
  close_fd(stderr_pipe[1]);
  close_fd(status_pipe[1]);

  int exec_error = 0;
  ssize_t status_bytes = 0;
  do {
    status_bytes = read(status_pipe[0], &exec_error, sizeof(exec_error));
  } while (status_bytes < 0 && errno == EINTR);
  close_fd(status_pipe[0]);

  if (status_bytes == static_cast<ssize_t>(sizeof(exec_error))) {
    int ignored = 0;
    (void)waitpid(pid, &ignored, 0);
    close_all();
    return common::Result<ExecutionResult>::failure(
        common::ErrorKind::Io, "failed to start " + argv.front() + ": " + std::strerror(exec_error));
  }

  set_non_blocking(stdout_pipe[0]);
  if (!merged) {
    set_non_blocking(stderr_pipe[0]);
  }

  OutputSink out{.text = {}, .limit = options.max_output_bytes, .truncated = false};
  OutputSink err{.text = {}, .limit = options.max_output_bytes, .truncated = false};
  int status = 0;
  bool timed_out = false;
  bool cancelled = false;
  const auto deadline = started + options.timeout;

  while (true) {
    if (!drain(stdout_pipe[0], out)) {
      close_fd(stdout_pipe[0]);
    }
    if (!drain(stderr_pipe[0], err)) {
      close_fd(stderr_pipe[0]);
    }

    const pid_t waited = waitpid(pid, &status, WNOHANG);
    if (waited == pid) {
      break;
    }

    if (options.cancel != nullptr && options.cancel->load()) {
      cancelled = true;
    }
    if (cancelled || std::chrono::steady_clock::now() >= deadline) {
      timed_out = true;
      (void)kill(-pid, SIGKILL);
      (void)kill(pid, SIGKILL);
      while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
      }
      break;
    }

    struct pollfd poll_fds[2] = {
        {.fd = stdout_pipe[0], .events = POLLIN, .revents = 0},
        {.fd = stderr_pipe[0], .events = POLLIN, .revents = 0},
    };
    (void)poll(poll_fds, 2, 50);
  }

  (void)drain(stdout_pipe[0], out);
  (void)drain(stderr_pipe[0], err);
  close_all();
  out.finish();
  err.finish();

  ExecutionResult result;
  result.stdout_text = std::move(out.text);
  result.stderr_text = std::move(err.text);
  result.exit_code = timed_out ? -1 : decode_status(status);
  result.timed_out = timed_out;
  result.cancelled = cancelled;
  result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  return common::Result<ExecutionResult>::success(std::move(result));
}

} // namespace playwarden::engine
