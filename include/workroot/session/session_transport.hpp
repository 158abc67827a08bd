// workroot/session/session_transport.hpp - Session transport interface
//
// Starting, looking up and tearing down the backend processes is left to an
// implementation of this interface (stdio JSON-RPC, sockets, an in-process
// fake...).
//
#pragma once

#include <memory>
#include <string>

#include "workroot/session/session_config.hpp"

namespace workroot
{

/// Live session as seen by the transport.
struct Session
{
  SessionId id = 0;
  std::string name;
  std::string root_dir;
};

class SessionTransport
{
public:
  virtual ~SessionTransport() = default;

  /**
   * Start a session. May return before the process is initialized.
   *
   * Implementations must call `config.on_exit.notify()` exactly once when the
   * session ends for any reason, including a start failure detected after an
   * id was returned. Throwing instead of returning an id means no session was
   * created and no exit notification follows.
   *
   * notify() must not be called while holding a lock that start_session()
   * takes: SessionManager holds its registry lock across start_session(), and
   * its exit cleanup takes that same lock. Holding a lock that only
   * get_session() takes is allowed.
   */
  virtual SessionId start_session(SessionConfig config) = 0;

  /// Look up a live session; nullptr once it has exited or if unknown.
  [[nodiscard]] virtual std::shared_ptr<Session> get_session(SessionId id) const = 0;
};

}  // namespace workroot
