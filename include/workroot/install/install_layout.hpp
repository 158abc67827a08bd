// workroot/install/install_layout.hpp - Where server binaries are installed
//
// Describes the on-disk layout an npm-based installer would produce for a
// server. The base directory is an explicit value; nothing here reads or
// writes process-wide state, and nothing here runs the installer.
//
#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace workroot
{

/**
 * Default base install directory: `$XDG_CACHE_HOME/workroot`, falling back to
 * `$HOME/.cache/workroot`.
 *
 * @return nullopt when neither variable is set
 */
[[nodiscard]] std::optional<std::string> default_base_install_dir();

/**
 * What to install for one server.
 */
struct InstallSpec
{
  std::string server_name;
  std::vector<std::string> packages;
  std::vector<std::string> binaries;
  std::string post_install_script;
};

/**
 * Snapshot of a server's install state.
 */
struct InstallInfo
{
  std::string bin_dir;
  std::string install_dir;
  std::map<std::string, std::string> binaries;  ///< binary name -> installed path
  bool is_installed = false;
};

class InstallLayout
{
public:
  /**
   * @throws std::invalid_argument if the base directory, server name,
   *         packages or binaries are empty
   */
  InstallLayout(std::string base_install_dir, InstallSpec spec);

  [[nodiscard]] const std::string & install_dir() const noexcept { return install_dir_; }
  [[nodiscard]] const std::string & bin_dir() const noexcept { return bin_dir_; }
  [[nodiscard]] const InstallSpec & spec() const noexcept { return spec_; }

  /// Installed path of a binary (whether or not it exists yet).
  [[nodiscard]] std::string bin_path(const std::string & name) const;

  /// Current install state; is_installed requires every binary to be executable.
  [[nodiscard]] InstallInfo info() const;

  /// Shell script an installer would run to populate install_dir().
  [[nodiscard]] std::string install_script() const;

private:
  InstallSpec spec_;
  std::string install_dir_;
  std::string bin_dir_;
};

/**
 * Marketplace download URL of a VS Code extension ("publisher.package").
 *
 * @return nullopt unless the name is exactly two non-empty dot-separated parts
 */
[[nodiscard]] std::optional<std::string> vspackage_url(const std::string & extension_name);

}  // namespace workroot
