#include "test_framework.hpp"

#include "playwarden/engine/ansible.hpp"
#include "playwarden/engine/command_runner.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <chrono>
#include <csignal>
#include <memory>

namespace {

playwarden::engine::AnsibleEngine
make_engine(const playwarden::config::Config &config,
            std::shared_ptr<playwarden::engine::ICommandRunner> runner) {
  return playwarden::engine::AnsibleEngine(config, config.workspace.root, std::move(runner),
                                           playwarden::security::InputSanitizer(config.masking));
}

} // namespace

void register_engine_tests(std::vector<playwarden::tests::TestCase> &tests) {
  using playwarden::tests::require;
  namespace engine = playwarden::engine;
  namespace common = playwarden::common;
  using playwarden::testing::FakeCommandRunner;
  using playwarden::testing::TempWorkspace;

  tests.push_back({"runner_captures_stdout_and_exit_code", [] {
                     engine::ProcessCommandRunner runner;
                     engine::RunOptions options;
                     options.timeout = std::chrono::seconds(10);
                     const auto result =
                         runner.run({"/bin/sh", "-c", "echo out; echo err 1>&2; exit 3"}, options);
                     require(result.ok(), result.error());
                     require(result.value().exit_code == 3, "exit code mismatch");
                     require(result.value().stdout_text == "out\n", "stdout mismatch");
                     require(result.value().stderr_text == "err\n", "stderr mismatch");
                     require(!result.value().timed_out, "should not time out");
                   }});

  tests.push_back({"runner_merged_capture", [] {
                     engine::ProcessCommandRunner runner;
                     engine::RunOptions options;
                     options.timeout = std::chrono::seconds(10);
                     options.capture = engine::CaptureMode::Merged;
                     const auto result = runner.run({"/bin/sh", "-c", "echo a; echo b 1>&2"}, options);
                     require(result.ok(), result.error());
                     require(result.value().stdout_text.find('a') != std::string::npos &&
                                 result.value().stdout_text.find('b') != std::string::npos,
                             "merged output missing a stream");
                     require(result.value().stderr_text.empty(), "stderr should be merged");
                   }});

  tests.push_back({"runner_does_not_use_a_shell", [] {
                     engine::ProcessCommandRunner runner;
                     engine::RunOptions options;
                     options.timeout = std::chrono::seconds(10);
                     const auto result = runner.run({"echo", "$(id); rm -rf /"}, options);
                     require(result.ok(), result.error());
                     require(result.value().stdout_text == "$(id); rm -rf /\n",
                             "argument should reach the child verbatim");
                   }});

  tests.push_back({"runner_sets_cwd_and_env", [] {
                     TempWorkspace ws;
                     engine::ProcessCommandRunner runner;
                     engine::RunOptions options;
                     options.timeout = std::chrono::seconds(10);
                     options.cwd = ws.path();
                     options.env = {{"PLAYWARDEN_PROBE", "42"}};
                     const auto result =
                         runner.run({"/bin/sh", "-c", "pwd; echo $PLAYWARDEN_PROBE"}, options);
                     require(result.ok(), result.error());
                     require(result.value().stdout_text == ws.path().string() + "\n42\n",
                             "cwd/env mismatch: " + result.value().stdout_text);
                   }});

  tests.push_back({"runner_timeout_kills_child", [] {
                     engine::ProcessCommandRunner runner;
                     engine::RunOptions options;
                     options.timeout = std::chrono::seconds(1);
                     const auto started = std::chrono::steady_clock::now();
                     const auto result = runner.run({"/bin/sh", "-c", "sleep 10"}, options);
                     const auto elapsed = std::chrono::steady_clock::now() - started;
                     require(result.ok(), result.error());
                     require(result.value().timed_out, "timeout flag missing");
                     require(!result.value().cancelled, "timeout is not a cancel");
                     require(elapsed < std::chrono::seconds(5), "child was not killed in time");
                   }});

  tests.push_back({"runner_cancel_flag_stops_child", [] {
                     engine::ProcessCommandRunner runner;
                     std::atomic<bool> cancel{true};
                     engine::RunOptions options;
                     options.timeout = std::chrono::seconds(30);
                     options.cancel = &cancel;
                     const auto result = runner.run({"/bin/sh", "-c", "sleep 10"}, options);
                     require(result.ok(), result.error());
                     require(result.value().timed_out && result.value().cancelled,
                             "cancel flags missing");
                   }});

  tests.push_back({"runner_missing_binary_is_an_error", [] {
                     engine::ProcessCommandRunner runner;
                     const auto result =
                         runner.run({"/nonexistent/ansible-playbook-xyz"}, engine::RunOptions{});
                     require(!result.ok(), "missing binary should fail");
                     require(result.kind() == common::ErrorKind::Io, "kind mismatch");

                     const auto empty = runner.run({}, engine::RunOptions{});
                     require(empty.kind() == common::ErrorKind::InvalidArgument,
                             "empty argv kind mismatch");
                   }});

  tests.push_back({"runner_caps_output", [] {
                     engine::ProcessCommandRunner runner;
                     engine::RunOptions options;
                     options.timeout = std::chrono::seconds(10);
                     options.max_output_bytes = 32;
                     const auto result = runner.run(
                         {"/bin/sh", "-c", "i=0; while [ $i -lt 100 ]; do echo line$i; "
                                           "i=$((i+1)); done"},
                         options);
                     require(result.ok(), result.error());
                     require(result.value().stdout_text.find(engine::TRUNCATION_MARKER) !=
                                 std::string::npos,
                             "truncation marker missing");
                     require(result.value().exit_code == 0, "capped run should still finish");
                   }});

  tests.push_back({"classify_exit_codes", [] {
                     engine::ExecutionResult result;
                     result.exit_code = 0;
                     require(engine::classify_exit(result) == engine::RunOutcome::Success, "0");
                     result.exit_code = 2;
                     require(engine::classify_exit(result) == engine::RunOutcome::Warning, "2");
                     result.exit_code = 4;
                     require(engine::classify_exit(result) == engine::RunOutcome::Warning, "4");
                     result.exit_code = 1;
                     require(engine::classify_exit(result) == engine::RunOutcome::Failure, "1");
                     result.exit_code = 0;
                     result.timed_out = true;
                     require(engine::classify_exit(result) == engine::RunOutcome::Failure,
                             "timeout");
                   }});

  tests.push_back({"summarize_output_keeps_recap_and_failures", [] {
                     const std::string output = "PLAY [all] ***\n"
                                                "TASK [ping] ***\n"
                                                "ok: [r1]\n"
                                                "fatal: [r2]: UNREACHABLE!\n"
                                                "changed: [r3]\n"
                                                "PLAY RECAP ***\n"
                                                "r1 : ok=1 changed=0 failed=0\n";
                     const std::string summary = engine::summarize_output(output);
                     require(summary.find("fatal: [r2]") != std::string::npos, "fatal line lost");
                     require(summary.find("changed: [r3]") != std::string::npos, "changed lost");
                     require(summary.find("PLAY RECAP") != std::string::npos, "recap lost");
                     require(summary.find("ok: [r1]") == std::string::npos, "ok line kept");
                     require(engine::summarize_output("nothing here\n").empty(),
                             "expected empty summary");
                   }});

  tests.push_back({"format_output_sections", [] {
                     engine::ExecutionResult result;
                     require(engine::format_output(result) == "Command completed with no output.",
                             "empty output text mismatch");
                     result.stdout_text = "hello\n";
                     result.exit_code = 2;
                     const std::string text = engine::format_output(result);
                     require(text.find("=== OUTPUT ===") != std::string::npos, "output header");
                     require(text.find("=== RETURN CODE: 2 ===") != std::string::npos,
                             "return code missing");
                   }});

  tests.push_back({"engine_playbook_argv", [] {
                     TempWorkspace ws;
                     auto config = playwarden::testing::temp_config(ws);
                     auto runner = std::make_shared<FakeCommandRunner>();
                     const auto ansible = make_engine(config, runner);

                     engine::PlaybookInvocation invocation;
                     invocation.playbook = ws.path() / "playbooks" / "site.yml";
                     invocation.limit = "core";
                     invocation.extra_vars = "{\"a\": 1}";
                     invocation.tags = "ntp,snmp";
                     invocation.verbose = true;
                     invocation.check = true;
                     const auto argv = ansible.playbook_argv(invocation);
                     const std::vector<std::string> expected = {
                         "ansible-playbook",
                         "-i",
                         (ws.path() / "inventory" / "hosts.ini").string(),
                         (ws.path() / "playbooks" / "site.yml").string(),
                         "--check",
                         "--diff",
                         "--limit",
                         "core",
                         "--extra-vars",
                         "{\"a\": 1}",
                         "--tags",
                         "ntp,snmp",
                         "-vvv"};
                     require(argv == expected, "playbook argv mismatch");

                     engine::PlaybookInvocation syntax;
                     syntax.playbook = invocation.playbook;
                     syntax.syntax_check = true;
                     syntax.limit = "ignored";
                     const auto syntax_argv = ansible.playbook_argv(syntax);
                     require(syntax_argv.back() == "--syntax-check" && syntax_argv.size() == 5,
                             "syntax argv mismatch");
                   }});

  tests.push_back({"engine_adhoc_argv", [] {
                     TempWorkspace ws;
                     auto config = playwarden::testing::temp_config(ws);
                     const auto ansible = make_engine(config, std::make_shared<FakeCommandRunner>());
                     engine::AdhocInvocation invocation;
                     invocation.target = "";
                     invocation.module = "ping";
                     auto argv = ansible.adhoc_argv(invocation);
                     require(argv.size() == 6 && argv[3] == "all" && argv[5] == "ping",
                             "adhoc argv mismatch");
                     invocation.module_args = "display=set";
                     invocation.check = true;
                     argv = ansible.adhoc_argv(invocation);
                     require(argv.size() == 9 && argv[6] == "-a" && argv[8] == "--check",
                             "adhoc args mismatch");
                   }});

  tests.push_back({"engine_run_sets_environment_and_masks", [] {
                     TempWorkspace ws;
                     auto config = playwarden::testing::temp_config(ws);
                     auto runner = std::make_shared<FakeCommandRunner>();
                     engine::ExecutionResult canned;
                     canned.stdout_text = "ansible_password: hunter2\n";
                     runner->set_result(canned);
                     const auto ansible = make_engine(config, runner);

                     const auto result =
                         ansible.run({"ansible", "all", "-m", "ping"}, std::chrono::seconds(7));
                     require(result.ok(), result.error());
                     require(result.value().masked_output.find("hunter2") == std::string::npos,
                             "masked output leaked a secret");
                     require(runner->options.size() == 1, "runner not called");
                     const auto &options = runner->options.front();
                     require(options.timeout == std::chrono::seconds(7), "timeout not passed");
                     require(options.cwd == ws.path(), "cwd should be the workspace root");
                     bool host_key_off = false;
                     for (const auto &[key, value] : options.env) {
                       host_key_off = host_key_off ||
                                      (key == "ANSIBLE_HOST_KEY_CHECKING" && value == "False");
                     }
                     require(host_key_off, "host key checking env missing");
                     require(options.cancel == &engine::interrupt_flag(),
                             "interrupt flag not wired as the cancel flag");
                   }});

  tests.push_back({"engine_run_stops_on_interrupt_signal", [] {
                     TempWorkspace ws;
                     auto config = playwarden::testing::temp_config(ws);
                     const auto ansible =
                         make_engine(config, std::make_shared<engine::ProcessCommandRunner>());
                     engine::install_interrupt_handlers();
                     require(std::raise(SIGTERM) == 0, "raise failed");
                     const bool interrupted = engine::interrupt_flag().load();

                     const auto started = std::chrono::steady_clock::now();
                     const auto result =
                         ansible.run({"/bin/sh", "-c", "sleep 10"}, std::chrono::seconds(30));
                     const auto elapsed = std::chrono::steady_clock::now() - started;
                     engine::interrupt_flag().store(false);
                     std::signal(SIGINT, SIG_DFL);
                     std::signal(SIGTERM, SIG_DFL);

                     require(interrupted, "handler did not set the interrupt flag");
                     require(result.ok(), result.error());
                     require(result.value().cancelled, "run was not cancelled");
                     require(elapsed < std::chrono::seconds(5), "child outlived the interrupt");
                   }});

  tests.push_back({"engine_run_propagates_start_failure", [] {
                     TempWorkspace ws;
                     auto config = playwarden::testing::temp_config(ws);
                     auto runner = std::make_shared<FakeCommandRunner>();
                     runner->set_failure("failed to start ansible: No such file or directory");
                     const auto ansible = make_engine(config, runner);
                     const auto result = ansible.run({"ansible"}, std::chrono::seconds(1));
                     require(!result.ok(), "start failure should propagate");
                     require(result.kind() == common::ErrorKind::Io, "kind mismatch");
                   }});
}
