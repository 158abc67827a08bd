// workroot/router/router.cpp - Route files to the sessions serving them
//
#include "workroot/router/router.hpp"

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <utility>

namespace workroot
{

void Router::register_server(
  const std::string & name, RootResolver resolver, SessionFactory factory,
  std::vector<std::string> filetypes)
{
  if (name.empty()) {
    throw std::invalid_argument("router: server name is empty");
  }
  if (servers_.count(name) > 0) {
    throw std::invalid_argument("router: server already registered: " + name);
  }

  Entry entry;
  entry.resolver = std::move(resolver);
  entry.filetypes = std::move(filetypes);
  entry.manager = std::make_unique<SessionManager>(std::move(factory), transport_);
  servers_.emplace(name, std::move(entry));
}

void Router::register_workspace(const WorkspaceConfig & config)
{
  for (const auto & server : config.servers) {
    register_server(
      server.name, root_pattern(server.root_markers),
      [server, defaults = config.settings](const std::string & root_dir) {
        return make_session_config(server, root_dir, defaults);
      },
      server.filetypes);
  }
}

bool Router::accepts(const Entry & entry, const std::string & file_path)
{
  if (entry.filetypes.empty()) {
    return true;
  }
  std::string ext = std::filesystem::path(file_path).extension().string();
  if (!ext.empty() && ext.front() == '.') {
    ext.erase(0, 1);
  }
  return std::find(entry.filetypes.begin(), entry.filetypes.end(), ext) != entry.filetypes.end();
}

std::vector<Route> Router::route(const std::string & file_path)
{
  std::vector<Route> routes;
  for (auto & [name, entry] : servers_) {
    if (!accepts(entry, file_path)) {
      continue;
    }
    const auto root = entry.resolver(file_path);
    if (!root) {
      continue;
    }
    if (const auto id = entry.manager->add(root)) {
      routes.push_back(Route{name, *root, *id});
    }
  }
  return routes;
}

std::vector<std::shared_ptr<Session>> Router::clients() const
{
  std::vector<std::shared_ptr<Session>> all;
  for (const auto & entry : servers_) {
    auto sessions = entry.second.manager->clients();
    all.insert(all.end(), sessions.begin(), sessions.end());
  }
  return all;
}

SessionManager * Router::manager(const std::string & name)
{
  auto it = servers_.find(name);
  if (it == servers_.end()) {
    return nullptr;
  }
  return it->second.manager.get();
}

}  // namespace workroot
