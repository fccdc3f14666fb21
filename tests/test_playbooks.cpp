#include "test_framework.hpp"

#include "playwarden/devices/device_ops.hpp"
#include "playwarden/playbooks/playbook_store.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <filesystem>
#include <memory>

namespace {

struct PlaybookFixture {
  playwarden::testing::TempWorkspace ws;
  playwarden::testing::TempWorkspace bin;
  playwarden::config::Config config;
  std::shared_ptr<playwarden::testing::FakeCommandRunner> fake;
  std::shared_ptr<const playwarden::engine::AnsibleEngine> ansible;

  /// Real child processes against the fake engine scripts, or the recording
  /// runner when `recording` is set.
  explicit PlaybookFixture(bool recording = false) {
    config = playwarden::testing::temp_config(ws);
    playwarden::testing::install_fake_engine(config, bin.path());
    std::shared_ptr<playwarden::engine::ICommandRunner> runner;
    if (recording) {
      fake = std::make_shared<playwarden::testing::FakeCommandRunner>();
      runner = fake;
    } else {
      runner = std::make_shared<playwarden::engine::ProcessCommandRunner>();
    }
    ansible = std::make_shared<const playwarden::engine::AnsibleEngine>(
        config, ws.path(), runner, playwarden::security::InputSanitizer(config.masking));
  }

  [[nodiscard]] playwarden::playbooks::PlaybookStore playbooks() const {
    auto guard = playwarden::security::PathGuard::create(ws.path());
    if (!guard.ok()) {
      throw std::runtime_error(guard.error());
    }
    return playwarden::playbooks::PlaybookStore(playwarden::workspace::BackupManager(guard.value()),
                                                ansible);
  }

  [[nodiscard]] playwarden::devices::DeviceOps devices() const {
    return playwarden::devices::DeviceOps(config.devices, ansible);
  }
};

} // namespace

void register_playbook_tests(std::vector<playwarden::tests::TestCase> &tests) {
  using playwarden::tests::require;
  namespace playbooks = playwarden::playbooks;
  namespace devices = playwarden::devices;
  namespace engine = playwarden::engine;
  namespace common = playwarden::common;
  using playwarden::testing::contains;

  tests.push_back({"playbook_name_helpers", [] {
                     require(playbooks::normalize_playbook_name("site") == "site.yml", "yml");
                     require(playbooks::normalize_playbook_name("site.yaml") == "site.yaml", "yaml");
                     require(playbooks::playbook_description("# Backup configs\n- hosts: all\n") ==
                                 "Backup configs",
                             "description mismatch");
                     require(playbooks::playbook_description("- hosts: all\n").empty(),
                             "no description expected");
                   }});

  tests.push_back({"playbook_create_validates_with_engine", [] {
                     PlaybookFixture fx;
                     const auto store = fx.playbooks();
                     const auto created =
                         store.create("p1", "- hosts: all\n  tasks: []\n", "Smoke test");
                     require(created.ok(), created.error());
                     require(created.value().relative_path == "playbooks/p1.yml", "path mismatch");
                     require(created.value().validation.passed,
                             "syntax check should pass: " + created.value().validation.diagnostics);
                     require(fx.ws.read_file("playbooks/p1.yml") ==
                                 "# Smoke test\n- hosts: all\n  tasks: []\n",
                             "description header missing");

                     const auto again = store.create("p1.yml", "- hosts: all\n", "");
                     require(again.kind() == common::ErrorKind::AlreadyExists,
                             "duplicate playbook accepted");
                   }});

  tests.push_back({"playbook_validate_and_check_run_real_processes", [] {
                     PlaybookFixture fx;
                     fx.ws.create_file("playbooks/p1.yml", "- hosts: all\n  tasks: []\n");
                     const auto store = fx.playbooks();

                     const auto validated = store.validate("p1");
                     require(validated.ok(), validated.error());
                     require(validated.value().passed, "validate should pass");

                     const auto checked = store.check("p1", "");
                     require(checked.ok(), checked.error());
                     require(checked.value().execution.exit_code == 0, "check exit code");
                     require(!checked.value().execution.timed_out, "check timed out");
                     require(checked.value().check_mode, "check mode flag missing");
                     require(checked.value().outcome == engine::RunOutcome::Success, "outcome");
                     require(checked.value().summary.find("PLAY RECAP") != std::string::npos,
                             "recap missing from summary");
                   }});

  tests.push_back({"playbook_create_keeps_file_on_syntax_failure", [] {
                     PlaybookFixture fx;
                     playwarden::testing::write_script(
                         fx.bin.path() / "fake-ansible-playbook",
                         "echo 'ERROR! A malformed block was encountered.' 1>&2\nexit 4\n");
                     const auto store = fx.playbooks();
                     const auto created = store.create("broken", "- hosts: all\n  tasks: {\n", "");
                     require(created.ok(), created.error());
                     require(!created.value().validation.passed, "syntax failure not reported");
                     require(created.value().validation.diagnostics.find("malformed") !=
                                 std::string::npos,
                             "diagnostics missing");
                     require(std::filesystem::exists(fx.ws.path() / "playbooks" / "broken.yml"),
                             "file should still be created");
                   }});

  tests.push_back({"playbook_list_update_remove", [] {
                     PlaybookFixture fx;
                     fx.ws.create_file("playbooks/b.yml", "# Second\n- hosts: all\n");
                     fx.ws.create_file("playbooks/a.yaml", "- hosts: all\n");
                     fx.ws.create_file("playbooks/notes.txt", "ignore me");
                     fx.ws.create_file("playbook.yml", "- hosts: all\n");
                     const auto store = fx.playbooks();

                     const auto listed = store.list();
                     require(listed.ok(), listed.error());
                     require(listed.value().size() == 3, "playbook count mismatch");
                     require(listed.value()[0].name == "a.yaml", "sort order mismatch");
                     require(listed.value()[1].description == "Second", "description mismatch");
                     require(listed.value()[2].legacy_root, "legacy playbook missing");
                     require(store.locate("playbook").value() == "playbook.yml",
                             "legacy playbook should be found by name");

                     const auto updated = store.update("b", "- hosts: core\n");
                     require(updated.ok(), updated.error());
                     require(updated.value().backup.has_value() &&
                                 updated.value().backup->content == "# Second\n- hosts: all\n",
                             "update backup mismatch");

                     const auto removed = store.remove("b");
                     require(removed.ok(), removed.error());
                     require(store.read("b").kind() == common::ErrorKind::NotFound,
                             "removed playbook still readable");
                     require(store.update("zzz", "x").kind() == common::ErrorKind::NotFound,
                             "update of missing playbook accepted");
                   }});

  tests.push_back({"playbook_run_extra_vars_file_stays_in_workspace", [] {
                     PlaybookFixture fx(true);
                     fx.ws.create_file("playbooks/site.yml", "- hosts: all\n");
                     fx.ws.create_file("vars/run.yml", "vlan: 10\n");
                     const auto store = fx.playbooks();

                     playbooks::RunRequest request;
                     for (const char *escape : {"@/etc/shadow", " @../../etc/passwd", "@",
                                                "@vars/missing.yml"}) {
                       request.extra_vars = escape;
                       require(!store.run("site", request).ok(),
                               std::string("extra vars file accepted: ") + escape);
                     }
                     require(fx.fake->commands.empty(), "a rejected run reached the engine");

                     request.extra_vars = "@vars/run.yml";
                     const auto report = store.run("site", request);
                     require(report.ok(), report.error());
                     const std::string expected =
                         "@" + std::filesystem::canonical(fx.ws.path() / "vars/run.yml").string();
                     require(contains(fx.fake->commands.back(), expected),
                             "extra vars file not passed as a workspace path");
                   }});

  tests.push_back({"playbook_run_builds_argv", [] {
                     PlaybookFixture fx(true);
                     fx.ws.create_file("playbooks/site.yml", "- hosts: all\n");
                     engine::ExecutionResult canned;
                     canned.exit_code = 2;
                     canned.stdout_text = "fatal: [r2]: FAILED!\nPLAY RECAP\nr2 : failed=1\n";
                     fx.fake->set_result(canned);
                     const auto store = fx.playbooks();

                     playbooks::RunRequest request;
                     request.limit = "core";
                     request.tags = "ntp";
                     request.extra_vars = "{\"vlan\": 10}";
                     const auto report = store.run("site", request);
                     require(report.ok(), report.error());
                     require(report.value().outcome == engine::RunOutcome::Warning,
                             "exit 2 should be a warning");
                     require(report.value().summary.find("fatal: [r2]") != std::string::npos,
                             "summary missing failure");

                     const auto &argv = fx.fake->commands.back();
                     require(contains(argv, "--limit") && contains(argv, "core"), "limit missing");
                     require(contains(argv, "--tags") && contains(argv, "ntp"), "tags missing");
                     require(contains(argv, "{\"vlan\": 10}"), "extra vars not a single argv entry");
                     require(!contains(argv, "--check"), "run should not be a dry run");
                     require(fx.fake->options.back().timeout == std::chrono::seconds(30),
                             "default timeout not applied");
                   }});

  tests.push_back({"playbook_run_missing_playbook", [] {
                     PlaybookFixture fx(true);
                     const auto store = fx.playbooks();
                     require(store.run("nope", {}).kind() == common::ErrorKind::NotFound,
                             "missing playbook kind");
                     require(fx.fake->commands.empty(), "engine should not be called");
                     require(store.read("../../etc/passwd").kind() ==
                                 common::ErrorKind::PathViolation,
                             "traversal through playbook name");
                   }});

  tests.push_back({"device_ping_counts_hosts", [] {
                     PlaybookFixture fx(true);
                     engine::ExecutionResult canned;
                     canned.exit_code = 4;
                     canned.stdout_text = "r1 | SUCCESS => {}\nr2 | SUCCESS => {}\n"
                                          "r3 | UNREACHABLE! => {}\n";
                     fx.fake->set_result(canned);
                     const auto report = fx.devices().ping("");
                     require(report.ok(), report.error());
                     require(report.value().reachable == 2, "reachable count");
                     require(report.value().failed == 1, "failed count");
                     const auto &argv = fx.fake->commands.back();
                     require(argv[3] == "all" && argv[5] == "ping", "ping argv mismatch");
                   }});

  tests.push_back({"device_module_arguments", [] {
                     PlaybookFixture fx(true);
                     const auto ops = fx.devices();

                     require(ops.facts("core", "hardware").ok(), "facts failed");
                     auto argv = fx.fake->commands.back();
                     require(argv[5] == fx.config.devices.facts_module, "facts module");
                     require(argv[7] == "gather_subset=hardware", "facts args");

                     require(ops.running_config("r1", "set").ok(), "config failed");
                     argv = fx.fake->commands.back();
                     require(argv[7] == "display=set", "display arg");
                     require(ops.running_config("r1", "yaml").kind() ==
                                 common::ErrorKind::InvalidArgument,
                             "bad format accepted");

                     require(ops.run_commands("r1", "show version, show route summary").ok(),
                             "commands failed");
                     argv = fx.fake->commands.back();
                     require(argv[7] == "commands=[\"show version\", \"show route summary\"]",
                             "commands arg: " + argv[7]);
                     require(ops.run_commands("r1", " , ").kind() ==
                                 common::ErrorKind::InvalidArgument,
                             "empty command list accepted");
                   }});

  tests.push_back({"device_push_config_arguments", [] {
                     PlaybookFixture fx(true);
                     const auto ops = fx.devices();
                     devices::PushConfigRequest request;
                     request.target = "r1";
                     request.lines = "set system host-name r1\n\nset system ntp server 10.0.0.1\n";
                     request.commit = false;
                     request.check = true;
                     require(ops.push_config(request).ok(), "push failed");
                     const auto &argv = fx.fake->commands.back();
                     require(argv[3] == "r1", "target mismatch");
                     require(argv[7].find("lines=[\"set system host-name r1\", ") == 0,
                             "lines arg: " + argv[7]);
                     require(argv[7].find("commit=no") != std::string::npos, "commit flag");
                     require(argv.back() == "--check", "check flag");

                     request.target = "";
                     require(ops.push_config(request).kind() == common::ErrorKind::InvalidArgument,
                             "missing target accepted");
                     request.target = "r1";
                     request.lines = "\n\n";
                     require(ops.push_config(request).kind() == common::ErrorKind::InvalidArgument,
                             "empty config accepted");
                   }});

  tests.push_back({"device_adhoc_requires_module", [] {
                     PlaybookFixture fx(true);
                     const auto ops = fx.devices();
                     devices::AdhocRequest request;
                     require(ops.adhoc(request).kind() == common::ErrorKind::InvalidArgument,
                             "missing module accepted");
                     request.module = "junipernetworks.junos.junos_command";
                     request.module_args = "commands='show version'";
                     request.target = "edge";
                     require(ops.adhoc(request).ok(), "adhoc failed");
                     const auto &argv = fx.fake->commands.back();
                     require(argv[3] == "edge" && argv[5] == request.module &&
                                 argv[7] == "commands='show version'",
                             "adhoc argv mismatch");
                     require(fx.fake->options.back().timeout == std::chrono::seconds(30),
                             "device timeout not applied");
                   }});

  tests.push_back({"device_adhoc_refuses_shell_modules", [] {
                     PlaybookFixture fx(true);
                     const auto ops = fx.devices();
                     devices::AdhocRequest request;
                     request.target = "edge";
                     request.module_args = "cat /etc/shadow";
                     for (const char *module :
                          {"shell", "command", "raw", "script", "expect", "ansible.builtin.shell",
                           "ansible.builtin.command", "ansible.legacy.raw", "Ansible.Builtin.Raw",
                           "ansible.builtin.copy", "file"}) {
                       request.module = module;
                       require(ops.adhoc(request).kind() ==
                                   common::ErrorKind::SanitizationRejected,
                               std::string("module accepted: ") + module);
                     }
                     require(fx.fake->commands.empty(), "a refused module reached the engine");

                     request.module_args.clear();
                     for (const char *module : {"ping", "ansible.builtin.setup", "junos_facts",
                                                "junipernetworks.junos.junos_interfaces"}) {
                       request.module = module;
                       require(ops.adhoc(request).ok(), std::string("module refused: ") + module);
                     }
                   }});

  tests.push_back({"device_adhoc_allow_list_is_configurable", [] {
                     PlaybookFixture fx(true);
                     fx.config.devices.adhoc_modules = {"cisco.ios.*"};
                     fx.config.devices.adhoc_modules.push_back("ansible.builtin.shell");
                     const auto ops = fx.devices();
                     devices::AdhocRequest request;
                     request.module = "cisco.ios.ios_facts";
                     require(ops.adhoc(request).ok(), "configured pattern refused");
                     request.module = "ping";
                     require(!ops.adhoc(request).ok(), "unlisted module accepted");
                     request.module = fx.config.devices.facts_module;
                     require(ops.adhoc(request).ok(), "device module refused");
                     request.module = "ansible.builtin.shell";
                     require(!ops.adhoc(request).ok(), "listed shell module accepted");
                   }});

  tests.push_back({"device_adhoc_refuses_control_node", [] {
                     PlaybookFixture fx(true);
                     const auto ops = fx.devices();
                     devices::AdhocRequest request;
                     request.module = "ping";
                     for (const char *target : {"localhost", "LOCALHOST", "127.0.0.1", "::1",
                                                "core,localhost", "core:!127.0.0.2",
                                                "edge:&localhost"}) {
                       request.target = target;
                       require(ops.adhoc(request).kind() ==
                                   common::ErrorKind::SanitizationRejected,
                               std::string("target accepted: ") + target);
                     }
                     require(fx.fake->commands.empty(), "a refused target reached the engine");
                     request.target = "core:edge";
                     require(ops.adhoc(request).ok(), "inventory pattern refused");
                   }});

  tests.push_back({"device_ping_with_fake_engine_process", [] {
                     PlaybookFixture fx;
                     const auto report = fx.devices().ping("all");
                     require(report.ok(), report.error());
                     require(report.value().reachable == 1, "fake engine should report one host");
                     require(report.value().execution.exit_code == 0, "exit code");
                   }});
}
