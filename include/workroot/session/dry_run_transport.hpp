// workroot/session/dry_run_transport.hpp - In-process session transport
//
// Hands out ids without spawning anything. Exits are simulated with
// terminate(). Used by `workroot plan` and by tests.
//
#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "workroot/session/session_transport.hpp"

namespace workroot
{

struct DryRunOptions
{
  /// Fail the start of sessions whose cmd[0] is not an executable on PATH, or
  /// whose working directory is not a directory
  bool check_executables = false;
};

class DryRunTransport : public SessionTransport
{
public:
  DryRunTransport() = default;
  explicit DryRunTransport(DryRunOptions options) : options_(options) {}

  /**
   * Register a session and return its id.
   *
   * A failed start still returns an id; the session's exit listeners run
   * before this call returns and the id is never live.
   */
  SessionId start_session(SessionConfig config) override;

  [[nodiscard]] std::shared_ptr<Session> get_session(SessionId id) const override;

  /// Simulate the session ending. Returns false for unknown ids.
  bool terminate(SessionId id, const ExitEvent & event = {});

  /// End every live session.
  void terminate_all();

  /// Number of start_session() calls so far.
  [[nodiscard]] size_t start_count() const;

  [[nodiscard]] std::vector<SessionId> live_ids() const;

  /// Configuration a live session was started with.
  [[nodiscard]] std::optional<SessionConfig> config_of(SessionId id) const;

private:
  struct Entry
  {
    std::shared_ptr<Session> session;
    SessionConfig config;
  };

  DryRunOptions options_;
  mutable std::mutex mutex_;
  std::map<SessionId, Entry> live_;
  SessionId next_id_ = 1;
  size_t start_count_ = 0;
};

}  // namespace workroot
