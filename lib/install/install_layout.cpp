// workroot/install/install_layout.cpp - Where server binaries are installed
//
#include "workroot/install/install_layout.hpp"

#include <fmt/core.h>

#include <cstdlib>
#include <stdexcept>
#include <utility>

#include "workroot/basic/executable.hpp"
#include "workroot/basic/path.hpp"

namespace workroot
{

namespace
{

std::string join_words(const std::vector<std::string> & words)
{
  std::string out;
  for (const auto & w : words) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out += w;
  }
  return out;
}

}  // namespace

std::optional<std::string> default_base_install_dir()
{
  if (const char * cache = std::getenv("XDG_CACHE_HOME"); cache && *cache) {
    return path::join(cache, "workroot");
  }
  if (const char * home = std::getenv("HOME"); home && *home) {
    return path::join(home, ".cache", "workroot");
  }
  return std::nullopt;
}

InstallLayout::InstallLayout(std::string base_install_dir, InstallSpec spec)
: spec_(std::move(spec))
{
  if (base_install_dir.empty()) {
    throw std::invalid_argument("install: base install directory is empty");
  }
  if (spec_.server_name.empty()) {
    throw std::invalid_argument("install: server_name is required");
  }
  if (spec_.packages.empty()) {
    throw std::invalid_argument(
      fmt::format("install '{}': at least one package is required", spec_.server_name));
  }
  if (spec_.binaries.empty()) {
    throw std::invalid_argument(
      fmt::format("install '{}': at least one binary is required", spec_.server_name));
  }

  install_dir_ = path::join(base_install_dir, spec_.server_name);
  bin_dir_ = path::join(install_dir_, "node_modules", ".bin");
}

std::string InstallLayout::bin_path(const std::string & name) const
{
  return path::join(bin_dir_, name);
}

InstallInfo InstallLayout::info() const
{
  InstallInfo info;
  info.bin_dir = bin_dir_;
  info.install_dir = install_dir_;

  std::vector<std::string> paths;
  for (const auto & name : spec_.binaries) {
    const std::string p = bin_path(name);
    info.binaries.emplace(name, p);
    paths.push_back(p);
  }
  info.is_installed = has_bins(paths);
  return info;
}

std::string InstallLayout::install_script() const
{
  return fmt::format(
    "set -e\n"
    "mkdir -p \"{0}\"\n"
    "cd \"{0}\"\n"
    "npm install {1}\n"
    "{2}\n",
    install_dir_, join_words(spec_.packages), spec_.post_install_script);
}

std::optional<std::string> vspackage_url(const std::string & extension_name)
{
  const auto dot = extension_name.find('.');
  if (dot == std::string::npos || dot == 0 || dot + 1 == extension_name.size() ||
      extension_name.find('.', dot + 1) != std::string::npos) {
    return std::nullopt;
  }

  const std::string org = extension_name.substr(0, dot);
  const std::string package = extension_name.substr(dot + 1);
  return fmt::format(
    "https://marketplace.visualstudio.com/_apis/public/gallery/publishers/{}/vsextensions/{}/"
    "latest/vspackage",
    org, package);
}

}  // namespace workroot
