// workroot/session/session_manager.cpp - One session per project root
//
#include "workroot/session/session_manager.hpp"

#include <utility>

namespace workroot
{

namespace
{

/// Shared between add() and the exit listener it installs.
struct StartTicket
{
  std::optional<SessionId> id;
  bool exited = false;
};

}  // namespace

SessionManager::SessionManager(SessionFactory factory, SessionTransport & transport)
: factory_(std::move(factory)), transport_(transport), state_(std::make_shared<State>())
{
}

SessionManager::~SessionManager() = default;

std::optional<SessionId> SessionManager::add(const std::optional<std::string> & root_dir)
{
  if (!root_dir || root_dir->empty()) {
    return std::nullopt;
  }

  std::lock_guard<std::recursive_mutex> lock(state_->mutex);

  if (auto it = state_->clients.find(*root_dir); it != state_->clients.end()) {
    return it->second;
  }

  SessionConfig config = factory_(*root_dir);
  config.root_dir = *root_dir;
  if (!config.cmd_cwd) {
    config.cmd_cwd = *root_dir;
  }

  // Registry cleanup runs before any listener the factory registered.
  auto ticket = std::make_shared<StartTicket>();
  std::weak_ptr<State> weak_state = state_;
  config.on_exit.prepend([weak_state, root = *root_dir, ticket](const ExitEvent &) {
    const auto state = weak_state.lock();
    if (!state) {
      return;
    }
    std::lock_guard<std::recursive_mutex> exit_lock(state->mutex);
    ticket->exited = true;
    if (!ticket->id) {
      return;
    }
    auto it = state->clients.find(root);
    if (it != state->clients.end() && it->second == *ticket->id) {
      state->clients.erase(it);
    }
  });

  validate_session_config(config);

  const SessionId id = transport_.start_session(std::move(config));
  ticket->id = id;

  // The transport may already have reported the exit (synchronous start failure).
  if (!ticket->exited) {
    state_->clients.emplace(*root_dir, id);
  }
  return id;
}

std::vector<std::shared_ptr<Session>> SessionManager::clients() const
{
  std::vector<SessionId> ids;
  {
    std::lock_guard<std::recursive_mutex> lock(state_->mutex);
    ids.reserve(state_->clients.size());
    for (const auto & entry : state_->clients) {
      ids.push_back(entry.second);
    }
  }

  // Resolved without the registry lock: the transport may hold its own lock
  // while delivering an exit, and the exit cleanup takes the registry lock.
  std::vector<std::shared_ptr<Session>> result;
  result.reserve(ids.size());
  for (const SessionId id : ids) {
    if (auto session = transport_.get_session(id)) {
      result.push_back(std::move(session));
    }
  }
  return result;
}

std::optional<SessionId> SessionManager::client_for(const std::string & root_dir) const
{
  std::lock_guard<std::recursive_mutex> lock(state_->mutex);
  auto it = state_->clients.find(root_dir);
  if (it == state_->clients.end()) {
    return std::nullopt;
  }
  return it->second;
}

size_t SessionManager::size() const
{
  std::lock_guard<std::recursive_mutex> lock(state_->mutex);
  return state_->clients.size();
}

}  // namespace workroot
