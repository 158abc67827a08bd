// workroot/project/workspace_config.hpp - Workspace configuration (workroot.yaml)
//
// Declares the servers a workspace uses, how each one finds its project root,
// and what it is started with.
//
#pragma once

#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "workroot/install/install_layout.hpp"
#include "workroot/session/session_config.hpp"

namespace workroot
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * One server entry under `servers:`.
 */
struct ServerConfig
{
  std::string name;

  /// Command line; cmd[0] is the executable
  std::vector<std::string> cmd;

  /// Working directory; relative paths are taken from the project root
  std::optional<std::string> cmd_cwd;

  /// Marker names identifying a project root, checked in order
  std::vector<std::string> root_markers = {".git"};

  /// File extensions (without dot) this server handles; empty = all files
  std::vector<std::string> filetypes;

  std::map<std::string, std::string> cmd_env;

  nlohmann::json settings = nlohmann::json::object();
  nlohmann::json init_options = nlohmann::json::object();

  /// How to install the server's binaries, if managed by workroot
  std::optional<InstallSpec> install;
};

/**
 * Complete workspace configuration (workroot.yaml).
 */
struct WorkspaceConfig
{
  /// Base install directory override
  std::optional<std::string> install_dir;

  /// Workspace-wide settings; each server's own settings are merged over them
  nlohmann::json settings = nlohmann::json::object();

  std::vector<ServerConfig> servers;

  /// Directory containing workroot.yaml
  std::filesystem::path config_dir;

  [[nodiscard]] const ServerConfig * find_server(const std::string & name) const;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  WorkspaceConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(WorkspaceConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a workspace configuration file.
 *
 * @param config_path Path to workroot.yaml
 */
[[nodiscard]] ConfigLoadResult load_workspace_config(const std::filesystem::path & config_path);

/**
 * Parse workspace configuration text.
 *
 * @param yaml_text  YAML document
 * @param config_dir Directory relative paths are resolved against
 */
[[nodiscard]] ConfigLoadResult parse_workspace_config(
  const std::string & yaml_text, const std::filesystem::path & config_dir);

/**
 * Find workroot.yaml in `start` or the nearest ancestor directory holding one.
 */
[[nodiscard]] std::optional<std::filesystem::path> find_workspace_config(
  const std::filesystem::path & start);

/**
 * Session configuration for a server rooted at `root_dir`.
 *
 * Settings are `default_settings` with the server's settings deep-merged over
 * them. The working directory defaults to `root_dir`.
 */
[[nodiscard]] SessionConfig make_session_config(
  const ServerConfig & server, const std::string & root_dir,
  const nlohmann::json & default_settings = nlohmann::json::object());

/// Settings a server's sessions start with: workspace settings, then the server's own.
[[nodiscard]] nlohmann::json effective_settings(
  const WorkspaceConfig & config, const ServerConfig & server);

inline constexpr const char * k_workspace_config_file_name = "workroot.yaml";

}  // namespace workroot
