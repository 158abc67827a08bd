// workroot/router/router.hpp - Route files to the sessions serving them
//
// Each registered server pairs a root resolver with its own SessionManager.
// Routing a file resolves its root per server and adds (or reuses) the
// session for that root.
//
#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "workroot/project/workspace_config.hpp"
#include "workroot/root/root_resolver.hpp"
#include "workroot/session/session_manager.hpp"

namespace workroot
{

struct Route
{
  std::string server;
  std::string root_dir;
  SessionId session_id = 0;
};

class Router
{
public:
  explicit Router(SessionTransport & transport) : transport_(transport) {}

  Router(const Router &) = delete;
  Router & operator=(const Router &) = delete;

  /**
   * Register a server.
   *
   * @param filetypes File extensions (without dot) to accept; empty accepts all
   * @throws std::invalid_argument on an empty or duplicate name
   */
  void register_server(
    const std::string & name, RootResolver resolver, SessionFactory factory,
    std::vector<std::string> filetypes = {});

  /// Register every server of a workspace configuration, with its workspace settings.
  void register_workspace(const WorkspaceConfig & config);

  /**
   * Route a file to every matching server that finds a root for it.
   *
   * Servers are visited in name order. Files without a root for a server are
   * simply not routed to it.
   */
  std::vector<Route> route(const std::string & file_path);

  /// Live sessions across all servers.
  [[nodiscard]] std::vector<std::shared_ptr<Session>> clients() const;

  /// Manager of a registered server, or nullptr.
  [[nodiscard]] SessionManager * manager(const std::string & name);

  [[nodiscard]] size_t server_count() const noexcept { return servers_.size(); }

private:
  struct Entry
  {
    RootResolver resolver;
    std::vector<std::string> filetypes;
    std::unique_ptr<SessionManager> manager;
  };

  [[nodiscard]] static bool accepts(const Entry & entry, const std::string & file_path);

  SessionTransport & transport_;
  std::map<std::string, Entry> servers_;
};

}  // namespace workroot
