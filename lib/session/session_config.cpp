// workroot/session/session_config.cpp - Session configuration bag
//
#include "workroot/session/session_config.hpp"

#include <fmt/core.h>

#include <utility>

namespace workroot
{

void ExitListeners::append(ExitListener listener)
{
  if (listener) {
    listeners_.push_back(std::move(listener));
  }
}

void ExitListeners::prepend(ExitListener listener)
{
  if (listener) {
    listeners_.insert(listeners_.begin(), std::move(listener));
  }
}

void ExitListeners::notify(const ExitEvent & event) const
{
  for (const auto & listener : listeners_) {
    listener(event);
  }
}

void validate_session_config(const SessionConfig & config)
{
  const std::string who = config.name.empty() ? std::string("<unnamed>") : config.name;

  if (config.cmd.empty() || config.cmd.front().empty()) {
    throw ConfigurationError(fmt::format("session '{}': 'cmd' must name an executable", who));
  }
  if (config.root_dir.empty()) {
    throw ConfigurationError(fmt::format("session '{}': 'root_dir' is required", who));
  }
  if (config.cmd_cwd && config.cmd_cwd->empty()) {
    throw ConfigurationError(fmt::format("session '{}': 'cmd_cwd' must not be empty", who));
  }
  if (!config.settings.is_null() && !config.settings.is_object()) {
    throw ConfigurationError(fmt::format("session '{}': 'settings' must be an object", who));
  }
  if (!config.init_options.is_null() && !config.init_options.is_object()) {
    throw ConfigurationError(
      fmt::format("session '{}': 'init_options' must be an object", who));
  }
}

}  // namespace workroot
