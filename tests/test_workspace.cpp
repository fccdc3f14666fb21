#include "test_framework.hpp"

#include "playwarden/common/fs.hpp"
#include "playwarden/workspace/backup.hpp"
#include "playwarden/workspace/template_store.hpp"
#include "playwarden/workspace/workspace_files.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <filesystem>

namespace {

playwarden::workspace::BackupManager make_backups(const playwarden::testing::TempWorkspace &ws) {
  auto guard = playwarden::security::PathGuard::create(ws.path());
  if (!guard.ok()) {
    throw std::runtime_error(guard.error());
  }
  return playwarden::workspace::BackupManager(guard.value());
}

std::size_t count_backups(const std::filesystem::path &dir) {
  std::size_t count = 0;
  for (const auto &entry : std::filesystem::directory_iterator(dir)) {
    if (playwarden::workspace::is_backup_name(entry.path().filename().string())) {
      ++count;
    }
  }
  return count;
}

} // namespace

void register_workspace_tests(std::vector<playwarden::tests::TestCase> &tests) {
  using playwarden::tests::require;
  namespace workspace = playwarden::workspace;
  namespace common = playwarden::common;
  using playwarden::testing::TempWorkspace;

  tests.push_back({"backup_name_pattern", [] {
                     require(workspace::is_backup_name("hosts.ini.20240102_030405_123456.bak"),
                             "plain backup name rejected");
                     require(workspace::is_backup_name("site.yml.20240102_030405_123456_2.bak"),
                             "collision suffix rejected");
                     require(!workspace::is_backup_name("hosts.ini.bak"), "bare .bak accepted");
                     require(!workspace::is_backup_name("hosts.ini"), "live file accepted");
                   }});

  tests.push_back({"backup_write_new_file_has_no_snapshot", [] {
                     TempWorkspace ws;
                     const auto backups = make_backups(ws);
                     const auto written = backups.write_with_backup("files/motd.txt", "hello\n");
                     require(written.ok(), written.error());
                     require(!written.value().has_value(), "new file should not be backed up");
                     require(ws.read_file("files/motd.txt") == "hello\n", "content mismatch");
                   }});

  tests.push_back({"backup_write_snapshots_prior_content", [] {
                     TempWorkspace ws;
                     ws.create_file("inventory/hosts.ini", "[all]\nr1\n");
                     const auto backups = make_backups(ws);
                     const auto written =
                         backups.write_with_backup("inventory/hosts.ini", "[all]\nr1\nr2\n");
                     require(written.ok(), written.error());
                     require(written.value().has_value(), "snapshot missing");
                     const auto &backup = *written.value();
                     require(backup.original_path == "inventory/hosts.ini", "original mismatch");
                     require(backup.content == "[all]\nr1\n", "snapshot content mismatch");
                     require(ws.read_file(backup.backup_path) == "[all]\nr1\n",
                             "backup file should hold the prior content");
                     require(backup.digest == common::sha256_hex("[all]\nr1\n"), "digest mismatch");
                     require(ws.read_file("inventory/hosts.ini") == "[all]\nr1\nr2\n",
                             "live file not updated");
                   }});

  tests.push_back({"backup_back_to_back_writes_keep_every_version", [] {
                     TempWorkspace ws;
                     ws.create_file("site.yml", "v1");
                     const auto backups = make_backups(ws);
                     require(backups.write_with_backup("site.yml", "v2").ok(), "write v2 failed");
                     require(backups.write_with_backup("site.yml", "v3").ok(), "write v3 failed");
                     require(count_backups(ws.path()) == 2, "expected two distinct backups");

                     const auto listed = backups.list("site.yml");
                     require(listed.ok(), listed.error());
                     require(listed.value().size() == 2, "list size mismatch");
                     require(listed.value().front().content == "v1", "oldest should be first");
                     require(listed.value().back().content == "v2", "newest should be last");
                   }});

  tests.push_back({"backup_list_ignores_other_files", [] {
                     TempWorkspace ws;
                     ws.create_file("a.yml", "a");
                     ws.create_file("a.yml.extra", "x");
                     ws.create_file("ab.yml.20240102_030405_123456.bak", "other");
                     const auto backups = make_backups(ws);
                     require(backups.write_with_backup("a.yml", "a2").ok(), "write failed");
                     const auto listed = backups.list("a.yml");
                     require(listed.ok(), listed.error());
                     require(listed.value().size() == 1, "foreign backups were listed");
                   }});

  tests.push_back({"backup_remove_keeps_snapshot", [] {
                     TempWorkspace ws;
                     ws.create_file("playbooks/old.yml", "- hosts: all\n");
                     const auto backups = make_backups(ws);
                     const auto removed = backups.remove_with_backup("playbooks/old.yml");
                     require(removed.ok(), removed.error());
                     require(!std::filesystem::exists(ws.path() / "playbooks" / "old.yml"),
                             "file should be gone");
                     require(ws.read_file(removed.value().backup_path) == "- hosts: all\n",
                             "snapshot lost");

                     const auto again = backups.remove_with_backup("playbooks/old.yml");
                     require(again.kind() == common::ErrorKind::NotFound, "second remove kind");
                   }});

  tests.push_back({"backup_restore_round_trip", [] {
                     TempWorkspace ws;
                     ws.create_file("ansible.cfg", "[defaults]\nforks = 5\n");
                     const auto backups = make_backups(ws);
                     const auto first = backups.write_with_backup("ansible.cfg", "broken");
                     require(first.ok() && first.value().has_value(), "write failed");

                     const auto loaded = backups.load(first.value()->backup_path);
                     require(loaded.ok(), loaded.error());
                     const auto restored = backups.restore(loaded.value());
                     require(restored.ok(), restored.error());
                     require(ws.read_file("ansible.cfg") == "[defaults]\nforks = 5\n",
                             "restore did not bring back the snapshot");
                     require(restored.value().has_value() &&
                                 restored.value()->content == "broken",
                             "restore should back up the live file first");
                   }});

  tests.push_back({"backup_rejects_escaping_target", [] {
                     TempWorkspace ws;
                     const auto backups = make_backups(ws);
                     const auto written = backups.write_with_backup("../escape.txt", "x");
                     require(written.kind() == common::ErrorKind::PathViolation,
                             "escape should be a path violation");
                     const auto loaded = backups.load("inventory");
                     require(!loaded.ok(), "non-backup load accepted");
                   }});

  tests.push_back({"backup_refuses_backup_named_targets", [] {
                     TempWorkspace ws;
                     ws.create_file("ansible.cfg", "[defaults]\nforks = 5\n");
                     const auto backups = make_backups(ws);
                     const auto first = backups.write_with_backup("ansible.cfg", "[defaults]\n");
                     require(first.ok() && first.value().has_value(), "write failed");
                     const std::string snapshot = first.value()->backup_path;

                     const auto overwrite = backups.write_with_backup(snapshot, "tampered");
                     require(overwrite.kind() == common::ErrorKind::InvalidArgument,
                             "backup file was writable");
                     require(ws.read_file(snapshot) == "[defaults]\nforks = 5\n",
                             "backup content changed");
                     const auto removed = backups.remove_with_backup(snapshot);
                     require(removed.kind() == common::ErrorKind::InvalidArgument,
                             "backup file was removable");
                     require(std::filesystem::exists(ws.path() / snapshot), "backup file deleted");

                     const auto fresh =
                         backups.write_with_backup("files/x.20240102_030405_123456.bak", "x");
                     require(fresh.kind() == common::ErrorKind::InvalidArgument,
                             "new backup-named file accepted");
                   }});

  tests.push_back({"atomic_write_keeps_neighbouring_temp_file", [] {
                     TempWorkspace ws;
                     ws.create_file("notes", "old\n");
                     ws.create_file("notes.tmp", "user data\n");
                     const auto backups = make_backups(ws);
                     const auto written = backups.write_with_backup("notes", "new\n");
                     require(written.ok(), written.error());
                     require(ws.read_file("notes") == "new\n", "target not written");
                     require(ws.read_file("notes.tmp") == "user data\n", "user file clobbered");
                     for (const auto &entry : std::filesystem::directory_iterator(ws.path())) {
                       const std::string name = entry.path().filename().string();
                       require(!common::ends_with(name, ".tmp") || name == "notes.tmp",
                               "temp file left behind: " + name);
                     }
                   }});

  tests.push_back({"atomic_write_does_not_follow_temp_symlink", [] {
                     TempWorkspace ws;
                     TempWorkspace outside;
                     outside.create_file("victim.txt", "untouched\n");
                     std::filesystem::create_symlink(outside.path() / "victim.txt",
                                                     ws.path() / "cfg.tmp");
                     const auto status =
                         common::write_text_file_atomic(ws.path() / "cfg", "[defaults]\n");
                     require(status.ok(), status.error());
                     require(outside.read_file("victim.txt") == "untouched\n",
                             "write went through the symlink");
                     require(!std::filesystem::is_symlink(ws.path() / "cfg"),
                             "target became a symlink");
                     require(ws.read_file("cfg") == "[defaults]\n", "target content mismatch");
                   }});

  tests.push_back({"backup_timestamps_are_utc", [] {
                     const playwarden::testing::EnvGuard tz("TZ", std::string("PWT-9"));
                     tzset();
                     const auto epoch = std::chrono::system_clock::from_time_t(0);
                     require(common::sortable_timestamp(epoch) == "19700101_000000_000000",
                             "timestamp not in UTC: " + common::sortable_timestamp(epoch));

                     TempWorkspace ws;
                     ws.create_file("site.yml", "- hosts: all\n");
                     const auto backups = make_backups(ws);
                     const auto before = std::chrono::system_clock::now();
                     const auto written = backups.write_with_backup("site.yml", "- hosts: core\n");
                     require(written.ok() && written.value().has_value(), "write failed");
                     const auto loaded = backups.load(written.value()->backup_path);
                     require(loaded.ok(), loaded.error());
                     const auto skew = loaded.value().timestamp - before;
                     require(skew > -std::chrono::seconds(2) && skew < std::chrono::seconds(60),
                             "loaded timestamp drifted from the write time");
                   }});

  tests.push_back({"workspace_structure_skips_hidden_and_backups", [] {
                     TempWorkspace ws;
                     ws.create_file("inventory/hosts.ini", "[all]\n");
                     ws.create_file("inventory/hosts.ini.20240102_030405_123456.bak", "old");
                     ws.create_file(".git/config", "x");
                     ws.create_file("playbooks/site.yml", "- hosts: all\n");
                     const workspace::WorkspaceFiles files(make_backups(ws));
                     const auto tree = files.structure();
                     require(tree.ok(), tree.error());
                     std::vector<std::string> names;
                     for (const auto &entry : tree.value()) {
                       names.push_back(entry.name);
                     }
                     require(playwarden::testing::contains(names, "hosts.ini"), "file missing");
                     require(playwarden::testing::contains(names, "playbooks"), "dir missing");
                     require(!playwarden::testing::contains(names, ".git"), "hidden dir listed");
                     require(std::none_of(names.begin(), names.end(),
                                          [](const std::string &name) {
                                            return common::ends_with(name, ".bak");
                                          }),
                             "backup listed");
                     require(tree.value().front().name == "inventory" &&
                                 tree.value().front().is_directory,
                             "entries should be sorted");
                     require(tree.value()[1].depth == 1, "child depth mismatch");
                   }});

  tests.push_back({"workspace_read_file_and_directory", [] {
                     TempWorkspace ws;
                     ws.create_file("files/banner.txt", "Authorized access only\n");
                     const workspace::WorkspaceFiles files(make_backups(ws));
                     const auto file = files.read_file("files/banner.txt");
                     require(file.ok(), file.error());
                     require(file.value().content == "Authorized access only\n", "content mismatch");
                     require(!file.value().truncated, "small file truncated");

                     const auto dir = files.read_file("files");
                     require(dir.ok(), dir.error());
                     require(dir.value().is_directory, "directory flag missing");
                     require(dir.value().entries == std::vector<std::string>{"banner.txt"},
                             "directory listing mismatch");

                     require(files.read_file("files/none.txt").kind() ==
                                 common::ErrorKind::NotFound,
                             "missing file kind");
                   }});

  tests.push_back({"workspace_read_file_truncates", [] {
                     TempWorkspace ws;
                     ws.create_file("big.txt", std::string(64, 'x'));
                     const workspace::WorkspaceFiles files(make_backups(ws), 16);
                     const auto file = files.read_file("big.txt");
                     require(file.ok(), file.error());
                     require(file.value().truncated, "truncation flag missing");
                     require(file.value().content.size() == 16, "truncated size mismatch");
                   }});

  tests.push_back({"workspace_write_file_refuses_root", [] {
                     TempWorkspace ws;
                     const workspace::WorkspaceFiles files(make_backups(ws));
                     require(files.write_file("/", "x").kind() ==
                                 common::ErrorKind::InvalidArgument,
                             "writing the root should fail");
                   }});

  tests.push_back({"workspace_engine_config_requires_ini", [] {
                     TempWorkspace ws;
                     const workspace::WorkspaceFiles files(make_backups(ws));
                     require(files.read_engine_config().kind() == common::ErrorKind::NotFound,
                             "missing ansible.cfg kind");
                     const auto bad = files.write_engine_config("[defaults]\nnot a setting\n");
                     require(bad.kind() == common::ErrorKind::ParseError, "bad INI accepted");
                     require(!std::filesystem::exists(ws.path() / "ansible.cfg"),
                             "bad INI should not be written");

                     const std::string good = "[defaults]\ninventory = inventory/hosts.ini\n"
                                              "host_key_checking = False\n";
                     const auto written = files.write_engine_config(good);
                     require(written.ok(), written.error());
                     const auto read = files.read_engine_config();
                     require(read.ok() && read.value() == good, "ansible.cfg mismatch");
                   }});

  tests.push_back({"workspace_restore_backup_by_path", [] {
                     TempWorkspace ws;
                     ws.create_file("group_vars/all.yml", "ntp: 10.0.0.1\n");
                     const workspace::WorkspaceFiles files(make_backups(ws));
                     const auto written = files.write_file("group_vars/all.yml", "ntp: 10.0.0.2\n");
                     require(written.ok() && written.value().has_value(), "write failed");

                     const auto listed = files.list_backups("group_vars/all.yml");
                     require(listed.ok() && listed.value().size() == 1, "backup list mismatch");
                     const auto restored = files.restore_backup(listed.value().front().backup_path);
                     require(restored.ok(), restored.error());
                     require(ws.read_file("group_vars/all.yml") == "ntp: 10.0.0.1\n",
                             "restore mismatch");
                   }});

  tests.push_back({"template_store_create_list_read", [] {
                     TempWorkspace ws;
                     const workspace::TemplateStore templates(make_backups(ws));
                     const auto empty = templates.list();
                     require(empty.ok() && empty.value().empty(), "missing dir should list empty");

                     const auto created = templates.create("ntp", "ntp server {{ ntp }}\n");
                     require(created.ok(), created.error());
                     require(created.value() == "ntp.j2", "normalized name mismatch");
                     ws.create_file("templates/readme.md", "not a template");

                     const auto listed = templates.list();
                     require(listed.ok(), listed.error());
                     require(listed.value() == std::vector<std::string>{"ntp.j2"},
                             "template listing mismatch");

                     const auto read = templates.read("ntp.j2");
                     require(read.ok() && read.value() == "ntp server {{ ntp }}\n",
                             "template content mismatch");
                     require(templates.create("ntp.j2", "x").kind() ==
                                 common::ErrorKind::AlreadyExists,
                             "duplicate template accepted");
                     require(templates.read("missing").kind() == common::ErrorKind::NotFound,
                             "missing template kind");
                   }});
}
