// workroot/project/workspace_config.cpp - Workspace configuration implementation
//
#include "workroot/project/workspace_config.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <set>

#include "workroot/basic/path.hpp"
#include "workroot/root/root_resolver.hpp"
#include "workroot/settings/settings.hpp"

namespace workroot
{

namespace
{

/// Convert a YAML node to JSON. Quoted scalars stay strings.
nlohmann::json yaml_to_json(const YAML::Node & node)
{
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      return nullptr;

    case YAML::NodeType::Scalar: {
      if (node.Tag() == "!") {
        return node.Scalar();
      }
      bool b = false;
      if (YAML::convert<bool>::decode(node, b)) {
        return b;
      }
      int64_t i = 0;
      if (YAML::convert<int64_t>::decode(node, i)) {
        return i;
      }
      double d = 0.0;
      if (YAML::convert<double>::decode(node, d)) {
        return d;
      }
      return node.Scalar();
    }

    case YAML::NodeType::Sequence: {
      nlohmann::json arr = nlohmann::json::array();
      for (const auto & item : node) {
        arr.push_back(yaml_to_json(item));
      }
      return arr;
    }

    case YAML::NodeType::Map: {
      nlohmann::json obj = nlohmann::json::object();
      for (const auto & kv : node) {
        obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
      }
      return obj;
    }
  }
  return nullptr;
}

/// Parse a list of strings; `what` names the field for error messages.
bool parse_string_list(
  const YAML::Node & node, const std::string & what, std::vector<std::string> & out,
  std::string & error)
{
  if (!node.IsSequence()) {
    error = what + " must be a list";
    return false;
  }
  out.clear();
  for (const auto & item : node) {
    if (!item.IsScalar()) {
      error = what + " must contain only strings";
      return false;
    }
    out.push_back(item.as<std::string>());
  }
  return true;
}

bool parse_json_map(
  const YAML::Node & node, const std::string & what, nlohmann::json & out, std::string & error)
{
  if (node.IsNull()) {
    out = nlohmann::json::object();
    return true;
  }
  if (!node.IsMap()) {
    error = what + " must be a map";
    return false;
  }
  out = yaml_to_json(node);
  return true;
}

std::optional<InstallSpec> parse_install(
  const YAML::Node & node, const std::string & server_name, std::string & error)
{
  if (!node.IsMap()) {
    error = "install must be a map";
    return std::nullopt;
  }

  InstallSpec spec;
  spec.server_name = server_name;

  if (!node["packages"] || !node["binaries"]) {
    error = "install needs 'packages' and 'binaries'";
    return std::nullopt;
  }
  if (!parse_string_list(node["packages"], "install.packages", spec.packages, error) ||
      !parse_string_list(node["binaries"], "install.binaries", spec.binaries, error)) {
    return std::nullopt;
  }
  if (spec.packages.empty() || spec.binaries.empty()) {
    error = "install.packages and install.binaries must not be empty";
    return std::nullopt;
  }
  if (node["post_install_script"]) {
    spec.post_install_script = node["post_install_script"].as<std::string>();
  }
  return spec;
}

/// Parse a single server entry
std::optional<ServerConfig> parse_server(const YAML::Node & node, std::string & error)
{
  if (!node.IsMap()) {
    error = "server entry must be a map";
    return std::nullopt;
  }

  ServerConfig server;

  if (!node["name"] || node["name"].as<std::string>().empty()) {
    error = "server must have a 'name'";
    return std::nullopt;
  }
  server.name = node["name"].as<std::string>();

  const std::string prefix = "server '" + server.name + "': ";

  if (!node["cmd"]) {
    error = prefix + "'cmd' is required";
    return std::nullopt;
  }
  if (!parse_string_list(node["cmd"], "cmd", server.cmd, error)) {
    error = prefix + error;
    return std::nullopt;
  }
  if (server.cmd.empty() || server.cmd.front().empty()) {
    error = prefix + "'cmd' must not be empty";
    return std::nullopt;
  }

  if (node["cmd_cwd"]) {
    server.cmd_cwd = node["cmd_cwd"].as<std::string>();
    if (server.cmd_cwd->empty()) {
      error = prefix + "'cmd_cwd' must not be empty";
      return std::nullopt;
    }
  }

  if (node["root_markers"]) {
    if (!parse_string_list(node["root_markers"], "root_markers", server.root_markers, error)) {
      error = prefix + error;
      return std::nullopt;
    }
    if (server.root_markers.empty()) {
      error = prefix + "'root_markers' must not be empty";
      return std::nullopt;
    }
  }

  if (node["filetypes"]) {
    if (!parse_string_list(node["filetypes"], "filetypes", server.filetypes, error)) {
      error = prefix + error;
      return std::nullopt;
    }
  }

  if (node["cmd_env"]) {
    if (!node["cmd_env"].IsMap()) {
      error = prefix + "cmd_env must be a map";
      return std::nullopt;
    }
    for (const auto & kv : node["cmd_env"]) {
      server.cmd_env[kv.first.as<std::string>()] = kv.second.as<std::string>();
    }
  }

  if (node["settings"] && !parse_json_map(node["settings"], "settings", server.settings, error)) {
    error = prefix + error;
    return std::nullopt;
  }
  if (node["init_options"] &&
      !parse_json_map(node["init_options"], "init_options", server.init_options, error)) {
    error = prefix + error;
    return std::nullopt;
  }

  if (node["install"]) {
    server.install = parse_install(node["install"], server.name, error);
    if (!server.install) {
      error = prefix + error;
      return std::nullopt;
    }
  }

  return server;
}

ConfigLoadResult parse_root(const YAML::Node & root, const std::filesystem::path & config_dir)
{
  WorkspaceConfig config;
  std::string error;
  config.config_dir = config_dir;

  if (root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("top level must be a map");
  }

  if (root["install_dir"]) {
    std::filesystem::path dir = root["install_dir"].as<std::string>();
    if (dir.is_relative()) {
      dir = config_dir / dir;
    }
    config.install_dir = dir.lexically_normal().string();
  }

  if (root["settings"] && !parse_json_map(root["settings"], "settings", config.settings, error)) {
    return ConfigLoadResult::fail(error);
  }

  if (root["servers"]) {
    if (!root["servers"].IsSequence()) {
      return ConfigLoadResult::fail("servers must be a list");
    }
    std::set<std::string> seen;
    for (const auto & server_node : root["servers"]) {
      std::string server_error;
      auto server = parse_server(server_node, server_error);
      if (!server) {
        return ConfigLoadResult::fail("invalid server: " + server_error);
      }
      if (!seen.insert(server->name).second) {
        return ConfigLoadResult::fail("duplicate server name: '" + server->name + "'");
      }
      config.servers.push_back(std::move(*server));
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

const ServerConfig * WorkspaceConfig::find_server(const std::string & name) const
{
  for (const auto & server : servers) {
    if (server.name == name) {
      return &server;
    }
  }
  return nullptr;
}

ConfigLoadResult parse_workspace_config(
  const std::string & yaml_text, const std::filesystem::path & config_dir)
{
  try {
    return parse_root(YAML::Load(yaml_text), config_dir);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

ConfigLoadResult load_workspace_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  const fs::path config_dir = fs::absolute(config_path).parent_path();

  try {
    return parse_root(YAML::LoadFile(config_path.string()), config_dir);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

std::optional<std::filesystem::path> find_workspace_config(const std::filesystem::path & start)
{
  const auto dir = search_ancestors(start.string(), [](const std::string & candidate) {
    std::error_code ec;
    return path::exists(path::join(candidate, k_workspace_config_file_name), ec) ==
           path::FileKind::File;
  });
  if (!dir) {
    return std::nullopt;
  }
  return std::filesystem::path(*dir) / k_workspace_config_file_name;
}

SessionConfig make_session_config(
  const ServerConfig & server, const std::string & root_dir,
  const nlohmann::json & default_settings)
{
  SessionConfig config;
  config.name = server.name;
  config.cmd = server.cmd;
  config.cmd_env = server.cmd_env;
  config.root_dir = root_dir;

  if (!server.cmd_cwd) {
    config.cmd_cwd = root_dir;
  } else if (std::filesystem::path(*server.cmd_cwd).is_relative()) {
    const std::filesystem::path cwd = std::filesystem::path(root_dir) / *server.cmd_cwd;
    config.cmd_cwd = cwd.lexically_normal().string();
  } else {
    config.cmd_cwd = server.cmd_cwd;
  }

  config.settings = default_settings.is_object() ? default_settings : nlohmann::json::object();
  settings::deep_extend(config.settings, server.settings);
  config.init_options = server.init_options;
  return config;
}

nlohmann::json effective_settings(const WorkspaceConfig & config, const ServerConfig & server)
{
  nlohmann::json merged = config.settings;
  return settings::deep_extend(merged, server.settings);
}

}  // namespace workroot
