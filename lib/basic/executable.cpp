// workroot/basic/executable.cpp - Executable lookup on PATH
//
#include "workroot/basic/executable.hpp"

#include <cstdlib>

#ifdef _WIN32
#include <io.h>
#define access _access
#define X_OK 0
#else
#include <unistd.h>
#endif

#include "workroot/basic/path.hpp"

namespace workroot
{

namespace
{

#ifdef _WIN32
constexpr char k_path_list_separator = ';';
#else
constexpr char k_path_list_separator = ':';
#endif

bool is_executable_file(const std::string & candidate)
{
  std::error_code ec;
  if (path::exists(candidate, ec) != path::FileKind::File) {
    return false;
  }
  return access(candidate.c_str(), X_OK) == 0;
}

}  // namespace

std::optional<std::string> find_executable(
  const std::string & name, const std::optional<std::string> & search_path)
{
  if (name.empty()) {
    return std::nullopt;
  }

  if (name.find(path::k_separator) != std::string::npos) {
    if (is_executable_file(name)) {
      return name;
    }
    return std::nullopt;
  }

  std::string dirs;
  if (search_path) {
    dirs = *search_path;
  } else if (const char * env = std::getenv("PATH")) {
    dirs = env;
  }
  if (dirs.empty()) {
    return std::nullopt;
  }

  size_t start = 0;
  while (start <= dirs.size()) {
    size_t end = dirs.find(k_path_list_separator, start);
    if (end == std::string::npos) {
      end = dirs.size();
    }
    // An empty PATH entry means the current directory.
    std::string dir = dirs.substr(start, end - start);
    if (dir.empty()) {
      dir = ".";
    }
    const std::string candidate = path::join(dir, name);
    if (is_executable_file(candidate)) {
      return candidate;
    }
    start = end + 1;
  }
  return std::nullopt;
}

bool has_bins(const std::vector<std::string> & names, const std::optional<std::string> & search_path)
{
  for (const auto & name : names) {
    if (!find_executable(name, search_path)) {
      return false;
    }
  }
  return true;
}

}  // namespace workroot
