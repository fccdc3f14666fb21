#include "playwarden/cli/commands.hpp"

#include "playwarden/common/fs.hpp"
#include "playwarden/common/json_util.hpp"
#include "playwarden/config/config.hpp"
#include "playwarden/engine/command_runner.hpp"
#include "playwarden/runtime/app.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace playwarden::cli {

namespace {

std::string version_string() {
#ifdef PLAYWARDEN_VERSION
  return std::string("playwarden ") + PLAYWARDEN_VERSION;
#else
  return "playwarden 0.1.0";
#endif
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string read_stdin_all() {
  std::ostringstream out;
  out << std::cin.rdbuf();
  return out.str();
}

common::Result<std::shared_ptr<dispatch::Dispatcher>> open_dispatcher() {
  auto context = runtime::RuntimeContext::from_disk();
  if (!context.ok()) {
    return common::Result<std::shared_ptr<dispatch::Dispatcher>>::failure(context);
  }
  return context.value().create_dispatcher();
}

int run_tools(std::vector<std::string> args) {
  const bool as_json = take_flag(args, "--json");
  auto dispatcher = open_dispatcher();
  if (!dispatcher.ok()) {
    std::cerr << dispatcher.error() << "\n";
    return 1;
  }

  const auto specs = dispatcher.value()->specs();
  if (as_json) {
    std::cout << "[";
    for (std::size_t i = 0; i < specs.size(); ++i) {
      if (i > 0) {
        std::cout << ",";
      }
      std::cout << "{\"name\":\"" << common::json_escape(specs[i].name) << "\",\"description\":\""
                << common::json_escape(specs[i].description)
                << "\",\"parameters\":" << specs[i].parameters_json() << "}";
    }
    std::cout << "]\n";
    return 0;
  }

  std::string group;
  for (const auto &spec : specs) {
    if (spec.group != group) {
      group = spec.group;
      std::cout << "\n[" << group << "]\n";
    }
    std::cout << "  " << spec.name;
    if (spec.name.size() < 28) {
      std::cout << std::string(28 - spec.name.size(), ' ');
    } else {
      std::cout << "  ";
    }
    std::cout << spec.description << "\n";
  }
  return 0;
}

/// `playwarden call <tool> [key=value ...] [--stdin key]`
int run_call(std::vector<std::string> args) {
  std::string stdin_key;
  const bool from_stdin = take_option(args, "--stdin", stdin_key);
  if (args.empty()) {
    std::cerr << "usage: playwarden call <tool> [key=value ...] [--stdin key]\n";
    return 1;
  }

  const std::string tool = args[0];
  tools::ToolArgs arguments;
  for (std::size_t i = 1; i < args.size(); ++i) {
    const auto equals = args[i].find('=');
    if (equals == std::string::npos || equals == 0) {
      std::cerr << "expected key=value, got: " << args[i] << "\n";
      return 1;
    }
    arguments[args[i].substr(0, equals)] = args[i].substr(equals + 1);
  }
  if (from_stdin) {
    arguments[stdin_key] = read_stdin_all();
  }

  auto dispatcher = open_dispatcher();
  if (!dispatcher.ok()) {
    std::cerr << dispatcher.error() << "\n";
    return 1;
  }
  engine::install_interrupt_handlers();
  const auto result = dispatcher.value()->execute(
      dispatch::CallRequest{.id = "", .tool = tool, .arguments = std::move(arguments)});
  std::cout << result.text << "\n";
  return result.severity == tools::Severity::Error ? 1 : 0;
}

dispatch::CallRequest parse_request_line(const std::string &line) {
  const auto object = common::json_parse_flat(line);
  dispatch::CallRequest request;
  if (const auto it = object.find("id"); it != object.end()) {
    request.id = it->second;
  }
  if (const auto it = object.find("tool"); it != object.end()) {
    request.tool = it->second;
  }
  if (const auto it = object.find("arguments"); it != object.end()) {
    for (auto &[key, value] : common::json_parse_flat(it->second)) {
      request.arguments[key] = value;
    }
  }
  return request;
}

/// One JSON request per stdin line, one JSON response per stdout line.
int run_serve() {
  auto dispatcher = open_dispatcher();
  if (!dispatcher.ok()) {
    std::cerr << dispatcher.error() << "\n";
    return 1;
  }
  std::cerr << "[INFO] " << version_string() << " serving "
            << dispatcher.value()->specs().size() << " tools on stdin\n";
  engine::install_interrupt_handlers();

  std::string line;
  while (!engine::interrupt_flag().load() && std::getline(std::cin, line)) {
    if (common::trim(line).empty()) {
      continue;
    }
    const auto request = parse_request_line(line);
    std::string text;
    if (request.tool.empty()) {
      text = "ERROR: request must carry a \"tool\" field";
    } else {
      text = dispatcher.value()->execute(request).text;
    }
    std::cout << common::json_string_object({{"id", request.id}, {"result", text}}) << "\n"
              << std::flush;
  }
  if (engine::interrupt_flag().load()) {
    std::cerr << "[INFO] interrupted, stopping\n";
    return 130;
  }
  return 0;
}

int run_config(std::vector<std::string> args) {
  const std::string action = args.empty() ? "show" : args[0];

  if (action == "path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }

  if (action == "init") {
    const bool force = take_flag(args, "--force");
    if (config::config_exists() && !force) {
      std::cerr << "config already exists (use --force to overwrite)\n";
      return 1;
    }
    auto saved = config::save_config(config::Config{});
    if (!saved.ok()) {
      std::cerr << saved.error() << "\n";
      return 1;
    }
    const auto path = config::config_path();
    std::cout << "Wrote " << (path.ok() ? path.value().string() : std::string("config")) << "\n";
    return 0;
  }

  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }

  if (action == "show") {
    std::cout << config::render_config(cfg.value());
    return 0;
  }

  if (action == "validate") {
    const auto checked = config::validate_config(cfg.value());
    if (!checked.ok()) {
      std::cerr << "invalid: " << checked.error() << "\n";
      return 1;
    }
    for (const auto &warning : checked.value()) {
      std::cout << "warning: " << warning << "\n";
    }
    std::cout << "config OK\n";
    return 0;
  }

  std::cerr << "unknown config command: " << action << "\n";
  return 1;
}

} // namespace

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "USAGE\n";
  std::cout << "  playwarden [--config PATH] <command> [options]\n\n";
  std::cout << "COMMANDS\n";
  std::cout << "  tools [--json]                     List the available tools\n";
  std::cout << "  call <tool> [k=v ...] [--stdin k]  Run one tool and print its result\n";
  std::cout << "  serve                              Answer JSON tool requests on stdin\n";
  std::cout << "  config show|path|validate|init     Inspect or create the configuration\n";
  std::cout << "  version                            Show version\n\n";
  std::cout << "ENVIRONMENT\n";
  std::cout << "  " << config::WORKSPACE_ENV << "                        Workspace root (default ~/ansible)\n";
  std::cout << "  PLAYWARDEN_CONFIG_PATH             Config file location\n";
}

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "tools") {
    return run_tools(std::move(args));
  }
  if (subcommand == "call") {
    return run_call(std::move(args));
  }
  if (subcommand == "serve") {
    return run_serve();
  }
  if (subcommand == "config") {
    return run_config(std::move(args));
  }

  std::cerr << "unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace playwarden::cli
