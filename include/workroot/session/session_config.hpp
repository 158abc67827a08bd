// workroot/session/session_config.hpp - Session configuration bag
//
// The factory handed to a SessionManager produces one of these per root
// directory. Apart from `root_dir` and `on_exit`, the fields are passed through
// to the transport untouched.
//
#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace workroot
{

/// Transport-assigned session identifier (positive once started).
using SessionId = int32_t;

// ============================================================================
// Exit Notification
// ============================================================================

struct ExitEvent
{
  int exit_code = 0;
  int signal = 0;
};

using ExitListener = std::function<void(const ExitEvent &)>;

/**
 * Ordered list of exit listeners, invoked in list order.
 */
class ExitListeners
{
public:
  void append(ExitListener listener);
  void prepend(ExitListener listener);

  /// Run every listener in order.
  void notify(const ExitEvent & event = {}) const;

  [[nodiscard]] bool empty() const noexcept { return listeners_.empty(); }
  [[nodiscard]] size_t size() const noexcept { return listeners_.size(); }

private:
  std::vector<ExitListener> listeners_;
};

// ============================================================================
// Session Configuration
// ============================================================================

struct SessionConfig
{
  /// Server name (used for display and routing)
  std::string name;

  /// Command line; cmd[0] is the executable
  std::vector<std::string> cmd;

  /// Working directory for the process; SessionManager fills in root_dir if unset
  std::optional<std::string> cmd_cwd;

  /// Extra environment variables
  std::map<std::string, std::string> cmd_env;

  /// Project root this session serves; set by the SessionManager
  std::string root_dir;

  /// Server settings (JSON object)
  nlohmann::json settings = nlohmann::json::object();

  /// Initialization options (JSON object)
  nlohmann::json init_options = nlohmann::json::object();

  /// Invoked once the session has terminated
  ExitListeners on_exit;
};

/**
 * Raised when a session configuration is missing required fields.
 */
class ConfigurationError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

/**
 * Check the fields a transport needs before starting a session.
 *
 * @throws ConfigurationError naming the first missing or malformed field
 */
void validate_session_config(const SessionConfig & config);

}  // namespace workroot
