// workroot/session/session_manager.hpp - One session per project root
//
#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "workroot/session/session_config.hpp"
#include "workroot/session/session_transport.hpp"

namespace workroot
{

/// Builds the configuration of a new session for a root directory.
using SessionFactory = std::function<SessionConfig(const std::string & root_dir)>;

/**
 * Registry of root directory -> session id.
 *
 * add() starts at most one session per root directory and reuses it until the
 * transport reports that the session exited, at which point the entry is
 * dropped and the next add() for that root starts a fresh session.
 *
 * All registry updates are serialized on one recursive mutex, so exit
 * notifications may arrive from other threads or from inside start_session()
 * itself. clients() releases the mutex before querying the transport.
 * Exit notifications arriving after the manager is destroyed are ignored.
 */
class SessionManager
{
public:
  SessionManager(SessionFactory factory, SessionTransport & transport);
  ~SessionManager();

  SessionManager(const SessionManager &) = delete;
  SessionManager & operator=(const SessionManager &) = delete;

  /**
   * Return the session serving `root_dir`, starting one if needed.
   *
   * nullopt or an empty string is a no-op returning nullopt. If the factory,
   * validation or the transport throws, the registry is left unchanged and
   * the exception propagates.
   *
   * @throws ConfigurationError if the factory's configuration is incomplete
   */
  std::optional<SessionId> add(const std::optional<std::string> & root_dir);

  /// Live sessions; ids the transport no longer knows are skipped.
  [[nodiscard]] std::vector<std::shared_ptr<Session>> clients() const;

  /// Registered session id for `root_dir`, without starting anything.
  [[nodiscard]] std::optional<SessionId> client_for(const std::string & root_dir) const;

  [[nodiscard]] size_t size() const;

private:
  struct State
  {
    std::recursive_mutex mutex;
    std::map<std::string, SessionId> clients;
  };

  SessionFactory factory_;
  SessionTransport & transport_;
  std::shared_ptr<State> state_;
};

}  // namespace workroot
