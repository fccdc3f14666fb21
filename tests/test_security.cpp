#include "test_framework.hpp"

#include "playwarden/security/path_guard.hpp"
#include "playwarden/security/sanitizer.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <filesystem>

namespace {

playwarden::security::PathGuard make_guard(const playwarden::testing::TempWorkspace &ws) {
  auto guard = playwarden::security::PathGuard::create(ws.path());
  if (!guard.ok()) {
    throw std::runtime_error(guard.error());
  }
  return guard.value();
}

playwarden::security::InputSanitizer default_sanitizer() {
  return playwarden::security::InputSanitizer(playwarden::config::MaskingConfig{});
}

} // namespace

void register_security_tests(std::vector<playwarden::tests::TestCase> &tests) {
  using playwarden::tests::require;
  namespace security = playwarden::security;
  namespace common = playwarden::common;
  using playwarden::testing::TempWorkspace;

  tests.push_back({"path_guard_resolves_inside_root", [] {
                     TempWorkspace ws;
                     const auto guard = make_guard(ws);
                     const auto resolved = guard.resolve("playbooks/site.yml");
                     require(resolved.ok(), resolved.error());
                     require(resolved.value() == ws.path() / "playbooks" / "site.yml",
                             "resolved path mismatch");
                     require(guard.relative(resolved.value()) == "playbooks/site.yml",
                             "relative form mismatch");
                   }});

  tests.push_back({"path_guard_strips_leading_slash", [] {
                     TempWorkspace ws;
                     const auto guard = make_guard(ws);
                     const auto resolved = guard.resolve("/etc/passwd");
                     require(resolved.ok(), resolved.error());
                     require(resolved.value() == ws.path() / "etc" / "passwd",
                             "absolute input should be re-rooted");
                   }});

  tests.push_back({"path_guard_rejects_parent_traversal", [] {
                     TempWorkspace ws;
                     const auto guard = make_guard(ws);
                     for (const std::string candidate :
                          {"../outside", "playbooks/../../etc/passwd", "a/b/../../..", ".."}) {
                       const auto resolved = guard.resolve(candidate);
                       require(!resolved.ok(), "traversal accepted: " + candidate);
                       require(resolved.kind() == common::ErrorKind::PathViolation,
                               "kind mismatch for " + candidate);
                       require(resolved.error().find(candidate) == std::string::npos,
                               "error should not echo the input");
                     }
                   }});

  tests.push_back({"path_guard_rejects_nul_and_empty", [] {
                     TempWorkspace ws;
                     const auto guard = make_guard(ws);
                     require(!guard.resolve(std::string("a\0b", 3)).ok(), "NUL accepted");
                     require(guard.resolve("").kind() == common::ErrorKind::PathViolation,
                             "empty path accepted");
                   }});

  tests.push_back({"path_guard_rejects_symlink_escape", [] {
                     TempWorkspace ws;
                     TempWorkspace outside;
                     outside.create_file("secret.txt", "top secret");
                     std::filesystem::create_directory_symlink(outside.path(), ws.path() / "link");
                     const auto guard = make_guard(ws);
                     const auto resolved = guard.resolve("link/secret.txt");
                     require(!resolved.ok(), "symlink escape accepted");
                     require(resolved.kind() == common::ErrorKind::PathViolation, "kind mismatch");
                   }});

  tests.push_back({"path_guard_allows_symlink_inside_root", [] {
                     TempWorkspace ws;
                     ws.create_file("real/hosts.ini", "[all]\n");
                     std::filesystem::create_directory_symlink(ws.path() / "real",
                                                               ws.path() / "alias");
                     const auto guard = make_guard(ws);
                     const auto resolved = guard.resolve_existing("alias/hosts.ini");
                     require(resolved.ok(), resolved.error());
                   }});

  tests.push_back({"path_guard_resolve_existing_reports_missing", [] {
                     TempWorkspace ws;
                     const auto guard = make_guard(ws);
                     const auto resolved = guard.resolve_existing("nope.yml");
                     require(!resolved.ok(), "missing file accepted");
                     require(resolved.kind() == common::ErrorKind::NotFound, "kind mismatch");
                   }});

  tests.push_back({"argument_classes_allow_expected_values", [] {
                     require(security::is_allowed("router-1.lab", security::ArgumentClass::Identifier),
                             "identifier rejected");
                     require(!security::is_allowed("r1;rm", security::ArgumentClass::Identifier),
                             "semicolon identifier accepted");
                     require(!security::is_allowed(".hidden", security::ArgumentClass::Identifier),
                             "leading dot identifier accepted");
                     require(security::is_allowed("group_vars/core.yml",
                                                  security::ArgumentClass::PathFragment),
                             "path rejected");
                     require(security::is_allowed("fe80::1", security::ArgumentClass::PathFragment),
                             "ipv6 address rejected");
                     require(!security::is_allowed("a b", security::ArgumentClass::PathFragment),
                             "space in path accepted");
                     require(security::is_allowed("core:&edge:!r3",
                                                  security::ArgumentClass::ProcessArgument),
                             "host pattern rejected");
                     require(!security::is_allowed("--become",
                                                   security::ArgumentClass::ProcessArgument),
                             "option-like argument accepted");
                     require(!security::is_allowed("all;reboot",
                                                   security::ArgumentClass::ProcessArgument),
                             "semicolon argument accepted");
                     require(!security::is_allowed("$(id)", security::ArgumentClass::ProcessArgument),
                             "substitution accepted");
                     require(security::is_allowed("- hosts: all\n\ttasks: []\r\n",
                                                  security::ArgumentClass::ContentBody),
                             "content rejected");
                     require(!security::is_allowed(std::string("a\0b", 3),
                                                   security::ArgumentClass::ContentBody),
                             "NUL content accepted");
                   }});

  tests.push_back({"sanitizer_check_names_field_only", [] {
                     const auto sanitizer = default_sanitizer();
                     const auto status = sanitizer.check("evil`cmd`", security::ArgumentClass::Identifier,
                                                         "hostname");
                     require(!status.ok(), "backticks accepted");
                     require(status.kind() == common::ErrorKind::SanitizationRejected,
                             "kind mismatch");
                     require(status.error().find("hostname") != std::string::npos,
                             "field name missing");
                     require(status.error().find("evil") == std::string::npos,
                             "value should not be echoed");
                   }});

  tests.push_back({"sanitizer_masks_yaml_secret", [] {
                     const auto sanitizer = default_sanitizer();
                     const std::string masked = sanitizer.mask("user: admin\npassword: foo123\n");
                     require(masked.find("foo123") == std::string::npos, "secret leaked");
                     require(masked.find("password: ********") != std::string::npos,
                             "mask marker missing");
                     require(masked.find("user: admin") != std::string::npos,
                             "plain key should survive");
                   }});

  tests.push_back({"sanitizer_masks_json_and_inline_pairs", [] {
                     const auto sanitizer = default_sanitizer();
                     const std::string json =
                         sanitizer.mask(R"({"api_token": "abc123", "name": "r1"})");
                     require(json.find("abc123") == std::string::npos, "json secret leaked");
                     require(json.find("\"name\": \"r1\"") != std::string::npos,
                             "json plain value lost");

                     const std::string inline_text = sanitizer.mask(
                         "r1 ansible_host=10.0.0.1 ansible_password=hunter2 ansible_user=netops");
                     require(inline_text.find("hunter2") == std::string::npos,
                             "inline secret leaked");
                     require(inline_text.find("ansible_host=10.0.0.1") != std::string::npos,
                             "address should survive");
                     require(inline_text.find("ansible_user=netops") != std::string::npos,
                             "user should survive");
                   }});

  tests.push_back({"sanitizer_keeps_exempt_keys", [] {
                     const auto sanitizer = default_sanitizer();
                     const std::string text = "host_key_checking = False\n";
                     require(sanitizer.mask(text) == text, "exempt key was masked");
                     require(!sanitizer.is_secret_key("ANSIBLE_HOST_KEY_CHECKING"),
                             "suffix exemption missing");
                     require(sanitizer.is_secret_key("ssh_private_key_file"),
                             "private key path should be secret");
                   }});

  tests.push_back({"sanitizer_mask_is_idempotent", [] {
                     const auto sanitizer = default_sanitizer();
                     const std::string text = "- secret: \"s3cr3t\"\nvault_password=x\r\nplain: 1";
                     const std::string once = sanitizer.mask(text);
                     require(sanitizer.mask(once) == once, "second pass changed the text");
                     require(once.find("s3cr3t") == std::string::npos, "quoted secret leaked");
                     require(once.find("\"********\"") != std::string::npos,
                             "quotes should be kept");
                     require(once.find("\r\n") != std::string::npos, "line ending lost");
                   }});

  tests.push_back({"sanitizer_masks_block_scalar_secrets", [] {
                     const auto sanitizer = default_sanitizer();
                     const std::string text = "ansible_password: |\n  foo123\n  bar456\n"
                                              "ssh_private_key: >-\n    -----BEGIN-----\n\n"
                                              "    AAAAkey\nntp_server: 10.0.0.1\n";
                     const std::string once = sanitizer.mask(text);
                     for (const char *secret : {"foo123", "bar456", "BEGIN", "AAAAkey"}) {
                       require(once.find(secret) == std::string::npos,
                               std::string("block line leaked: ") + secret);
                     }
                     require(once.find("ansible_password: |\n  ********\n") != std::string::npos,
                             "indicator or indent lost: " + once);
                     require(once.find("ntp_server: 10.0.0.1\n") != std::string::npos,
                             "block did not end at the next key");
                     require(sanitizer.mask(once) == once, "second pass changed the text");
                   }});

  tests.push_back({"sanitizer_block_ends_at_sibling_key", [] {
                     const auto sanitizer = default_sanitizer();
                     const std::string text =
                         "creds:\n  token:\n    - abc\n  user: admin\nbanner: |\n  hi\n";
                     const std::string masked = sanitizer.mask(text);
                     require(masked.find("abc") == std::string::npos, "nested value leaked");
                     require(masked.find("  user: admin\n") != std::string::npos,
                             "sibling key was masked: " + masked);
                     require(masked.find("banner: |\n  hi\n") != std::string::npos,
                             "plain block was masked");
                   }});

  tests.push_back({"sanitizer_handles_very_long_lines", [] {
                     const auto sanitizer = default_sanitizer();
                     const std::string blob(200000, 'a');
                     const std::string plain = "data: " + blob;
                     require(sanitizer.mask(plain) == plain, "plain long line changed");

                     const std::string secret = "{\"api_token\": \"" + blob + "\", \"name\": \"r1\"}";
                     const std::string masked = sanitizer.mask(secret);
                     require(masked.find(blob) == std::string::npos, "long secret leaked");
                     require(masked.find("\"name\": \"r1\"") != std::string::npos,
                             "plain pair after long secret lost");

                     const std::string quotes = "password " + std::string(200000, '"');
                     require(sanitizer.mask(quotes) == quotes, "quote run changed");
                   }});

  tests.push_back({"sanitizer_without_keywords_is_identity", [] {
                     playwarden::config::MaskingConfig masking;
                     masking.keywords.clear();
                     const security::InputSanitizer sanitizer(masking);
                     require(sanitizer.mask("password: x") == "password: x",
                             "empty keyword list should not mask");
                   }});
}
