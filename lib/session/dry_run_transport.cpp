// workroot/session/dry_run_transport.cpp - In-process session transport
//
#include "workroot/session/dry_run_transport.hpp"

#include <utility>

#include "workroot/basic/executable.hpp"
#include "workroot/basic/path.hpp"

namespace workroot
{

namespace
{

bool can_start(const SessionConfig & config)
{
  if (config.cmd.empty() || !find_executable(config.cmd.front())) {
    return false;
  }
  if (config.cmd_cwd) {
    std::error_code ec;
    return path::exists(*config.cmd_cwd, ec) == path::FileKind::Directory;
  }
  return true;
}

}  // namespace

SessionId DryRunTransport::start_session(SessionConfig config)
{
  const bool start_failed = options_.check_executables && !can_start(config);

  SessionId id = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    id = next_id_++;
    ++start_count_;
    if (!start_failed) {
      auto session = std::make_shared<Session>();
      session->id = id;
      session->name = config.name;
      session->root_dir = config.root_dir;
      live_.emplace(id, Entry{std::move(session), std::move(config)});
      return id;
    }
  }

  // 127 mirrors the shell's "command not found" (or an unusable directory).
  config.on_exit.notify(ExitEvent{127, 0});
  return id;
}

std::shared_ptr<Session> DryRunTransport::get_session(SessionId id) const
{
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = live_.find(id);
  if (it == live_.end()) {
    return nullptr;
  }
  return it->second.session;
}

bool DryRunTransport::terminate(SessionId id, const ExitEvent & event)
{
  Entry entry;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = live_.find(id);
    if (it == live_.end()) {
      return false;
    }
    entry = std::move(it->second);
    live_.erase(it);
  }

  // Listeners run without the lock held; they may call back into the transport.
  entry.config.on_exit.notify(event);
  return true;
}

void DryRunTransport::terminate_all()
{
  for (const SessionId id : live_ids()) {
    terminate(id);
  }
}

size_t DryRunTransport::start_count() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return start_count_;
}

std::vector<SessionId> DryRunTransport::live_ids() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<SessionId> ids;
  ids.reserve(live_.size());
  for (const auto & entry : live_) {
    ids.push_back(entry.first);
  }
  return ids;
}

std::optional<SessionConfig> DryRunTransport::config_of(SessionId id) const
{
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = live_.find(id);
  if (it == live_.end()) {
    return std::nullopt;
  }
  return it->second.config;
}

}  // namespace workroot
