// workroot - Project root and session routing command line interface
//
// Usage:
//   workroot root <path> [-m marker]...
//   workroot git-root <path>
//   workroot plan [--config workroot.yaml] <file>...
//   workroot install-info [--config workroot.yaml] <server> [--script]
//   workroot settings [--config workroot.yaml] <server> [section]
//   workroot init [dir]
//
#include <fmt/core.h>
#include <fmt/ostream.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "workroot/basic/path.hpp"
#include "workroot/install/install_layout.hpp"
#include "workroot/project/workspace_config.hpp"
#include "workroot/root/root_resolver.hpp"
#include "workroot/router/router.hpp"
#include "workroot/session/dry_run_transport.hpp"
#include "workroot/settings/settings.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  fmt::print(
    std::cerr,
    "workroot v0.1.0\n\n"
    "Usage: {} <command> [options]\n\n"
    "Commands:\n"
    "  root <path>               Print the project root of a path\n"
    "  git-root <path>           Print the nearest ancestor holding .git\n"
    "  plan <file>...            Show which session each file is routed to\n"
    "  install-info <server>     Show a server's install layout\n"
    "  settings <server> [sec]   Print a server's merged settings (or one section)\n"
    "  init [dir]                Write a starter workroot.yaml\n\n"
    "Options:\n"
    "  -m, --marker <name>       Root marker (repeatable, default: .git)\n"
    "  -c, --config <path>       Workspace configuration file\n"
    "  --check-bins              plan: fail sessions whose command is not on PATH\n"
    "  --script                  install-info: print the install script\n"
    "  -v, --verbose             Verbose output\n"
    "  -h, --help                Show this help message\n",
    program_name);
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::vector<std::string> inputs;
  std::vector<std::string> markers;
  std::string config_path;
  bool check_bins = false;
  bool show_script = false;
  bool verbose = false;
  bool show_help = false;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "-m" || arg == "--marker") {
      if (i + 1 < argc) {
        args.markers.emplace_back(argv[++i]);
      }
    } else if (arg == "-c" || arg == "--config") {
      if (i + 1 < argc) {
        args.config_path = argv[++i];
      }
    } else if (arg == "--check-bins") {
      args.check_bins = true;
    } else if (arg == "--script") {
      args.show_script = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (!arg.empty() && arg[0] != '-') {
      args.inputs.push_back(arg);
    }
  }

  return args;
}

/// Explicit --config, else the nearest workroot.yaml above `search_from`.
std::optional<workroot::WorkspaceConfig> load_config(
  const CommandArgs & args, const fs::path & search_from)
{
  fs::path config_path;
  if (!args.config_path.empty()) {
    config_path = args.config_path;
  } else {
    auto found = workroot::find_workspace_config(search_from);
    if (!found) {
      fmt::print(
        std::cerr, "error: no {} found in {} or parents\n",
        workroot::k_workspace_config_file_name, search_from.string());
      return std::nullopt;
    }
    config_path = *found;
  }

  if (args.verbose) {
    fmt::print(std::cerr, "Using configuration: {}\n", config_path.string());
  }

  auto result = workroot::load_workspace_config(config_path);
  if (!result.success) {
    fmt::print(std::cerr, "error: {}: {}\n", config_path.string(), result.error);
    return std::nullopt;
  }
  return std::move(result.config);
}

// ============================================================================
// Commands
// ============================================================================

int cmd_root(const CommandArgs & args)
{
  if (args.inputs.empty()) {
    fmt::print(std::cerr, "error: missing path\nusage: workroot root <path> [-m marker]...\n");
    return 1;
  }

  const std::vector<std::string> markers =
    args.markers.empty() ? std::vector<std::string>{".git"} : args.markers;
  const workroot::RootResolver resolver = workroot::root_pattern(markers);

  int rc = 0;
  for (const auto & input : args.inputs) {
    if (args.verbose) {
      fmt::print(std::cerr, "Searching {} for:", input);
      for (const auto & m : markers) {
        fmt::print(std::cerr, " {}", m);
      }
      fmt::print(std::cerr, "\n");
    }

    const auto root = resolver(input);
    if (!root) {
      fmt::print(std::cerr, "{}: no project root found\n", input);
      rc = 1;
      continue;
    }
    fmt::print("{}\n", *root);
  }
  return rc;
}

int cmd_git_root(const CommandArgs & args)
{
  if (args.inputs.empty()) {
    fmt::print(std::cerr, "error: missing path\nusage: workroot git-root <path>\n");
    return 1;
  }

  const auto root = workroot::find_git_ancestor(args.inputs.front());
  if (!root) {
    fmt::print(std::cerr, "{}: not inside a git repository\n", args.inputs.front());
    return 1;
  }
  fmt::print("{}\n", *root);
  return 0;
}

int cmd_plan(const CommandArgs & args)
{
  if (args.inputs.empty()) {
    fmt::print(std::cerr, "error: missing input files\nusage: workroot plan <file>...\n");
    return 1;
  }

  const fs::path search_from =
    args.config_path.empty() ? fs::path(args.inputs.front()) : fs::current_path();
  const auto config = load_config(args, search_from);
  if (!config) {
    return 1;
  }

  workroot::DryRunOptions options;
  options.check_executables = args.check_bins;
  workroot::DryRunTransport transport(options);
  workroot::Router router(transport);
  router.register_workspace(*config);

  int rc = 0;
  for (const auto & file : args.inputs) {
    const auto routes = router.route(file);
    if (routes.empty()) {
      fmt::print("{}: no session\n", file);
      continue;
    }
    for (const auto & r : routes) {
      const bool live = transport.get_session(r.session_id) != nullptr;
      fmt::print(
        "{} -> {} @ {} (session {}{})\n", file, r.server, r.root_dir, r.session_id,
        live ? "" : ", failed to start");
      if (!live) {
        rc = 1;
      }
    }
  }

  if (args.verbose) {
    fmt::print(
      std::cerr, "{} session(s) started, {} live\n", transport.start_count(),
      router.clients().size());
  }
  return rc;
}

int cmd_install_info(const CommandArgs & args)
{
  if (args.inputs.empty()) {
    fmt::print(std::cerr, "error: server name required\nusage: workroot install-info <server>\n");
    return 1;
  }

  const auto config = load_config(args, fs::current_path());
  if (!config) {
    return 1;
  }

  const std::string & name = args.inputs.front();
  const workroot::ServerConfig * server = config->find_server(name);
  if (server == nullptr) {
    fmt::print(std::cerr, "error: unknown server '{}'\n", name);
    return 1;
  }
  if (!server->install) {
    fmt::print(std::cerr, "error: server '{}' has no install section\n", name);
    return 1;
  }

  const auto base = config->install_dir ? config->install_dir : workroot::default_base_install_dir();
  if (!base) {
    fmt::print(std::cerr, "error: cannot determine install directory (set HOME or install_dir)\n");
    return 1;
  }

  try {
    const workroot::InstallLayout layout(*base, *server->install);
    if (args.show_script) {
      fmt::print("{}", layout.install_script());
      return 0;
    }

    const workroot::InstallInfo info = layout.info();
    fmt::print("install_dir: {}\n", info.install_dir);
    fmt::print("bin_dir: {}\n", info.bin_dir);
    for (const auto & [bin, bin_path] : info.binaries) {
      fmt::print("binary: {} -> {}\n", bin, bin_path);
    }
    fmt::print("installed: {}\n", info.is_installed ? "yes" : "no");
    return 0;
  } catch (const std::exception & e) {
    fmt::print(std::cerr, "error: {}\n", e.what());
    return 1;
  }
}

int cmd_settings(const CommandArgs & args)
{
  if (args.inputs.empty()) {
    fmt::print(
      std::cerr, "error: server name required\nusage: workroot settings <server> [section]\n");
    return 1;
  }

  const auto config = load_config(args, fs::current_path());
  if (!config) {
    return 1;
  }

  const std::string & name = args.inputs.front();
  const workroot::ServerConfig * server = config->find_server(name);
  if (server == nullptr) {
    fmt::print(std::cerr, "error: unknown server '{}'\n", name);
    return 1;
  }

  const nlohmann::json merged = workroot::effective_settings(*config, *server);
  if (args.inputs.size() < 2) {
    fmt::print("{}\n", merged.dump(2));
    return 0;
  }

  const std::string & section = args.inputs[1];
  const auto value = workroot::settings::lookup_section(merged, section);
  if (!value) {
    fmt::print(std::cerr, "{}: no settings section '{}'\n", name, section);
    return 1;
  }
  fmt::print("{}\n", value->dump(2));
  return 0;
}

int cmd_init(const CommandArgs & args)
{
  const fs::path dir = args.inputs.empty() ? fs::current_path() : fs::path(args.inputs.front());
  const fs::path config_path = dir / workroot::k_workspace_config_file_name;

  if (fs::exists(config_path)) {
    fmt::print(std::cerr, "error: file already exists: {}\n", config_path.string());
    return 1;
  }

  try {
    fs::create_directories(dir);
    std::ofstream out(config_path);
    if (!out.is_open()) {
      fmt::print(std::cerr, "error: failed to open output file: {}\n", config_path.string());
      return 1;
    }
    out << "servers:\n"
        << "  - name: clangd\n"
        << "    cmd: [clangd, --background-index]\n"
        << "    root_markers: [compile_commands.json, .git]\n"
        << "    filetypes: [c, cc, cpp, h, hpp]\n";
    out.close();

    fmt::print("Wrote {}\n", config_path.string());
    return 0;
  } catch (const std::exception & e) {
    fmt::print(std::cerr, "error: {}\n", e.what());
    return 1;
  }
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  try {
    if (args.command == "root") {
      return cmd_root(args);
    }
    if (args.command == "git-root") {
      return cmd_git_root(args);
    }
    if (args.command == "plan") {
      return cmd_plan(args);
    }
    if (args.command == "install-info") {
      return cmd_install_info(args);
    }
    if (args.command == "settings") {
      return cmd_settings(args);
    }
    if (args.command == "init") {
      return cmd_init(args);
    }
  } catch (const std::exception & e) {
    fmt::print(std::cerr, "error: {}\n", e.what());
    return 1;
  }

  fmt::print(std::cerr, "error: unknown command '{}'\n", args.command);
  print_usage(argv[0]);
  return 1;
}
