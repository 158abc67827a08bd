// workroot/root/root_resolver.cpp - Project root discovery
//
#include "workroot/root/root_resolver.hpp"

#include <utility>

namespace workroot
{

namespace
{

RootPredicate kind_predicate(std::string marker, path::FileKind kind)
{
  return [marker = std::move(marker), kind](const std::string & dir) {
    std::error_code ec;
    return path::exists(path::join(dir, marker), ec) == kind;
  };
}

}  // namespace

std::optional<std::string> search_ancestors(
  const std::string & start_path, const RootPredicate & predicate)
{
  const auto resolved = path::real_path(start_path);
  if (!resolved) {
    return std::nullopt;
  }

  // The starting point is its own first candidate.
  if (predicate(*resolved)) {
    return resolved;
  }

  for (const auto & dir : path::iterate_parents(*resolved)) {
    if (predicate(dir)) {
      return dir;
    }
  }
  return std::nullopt;
}

RootPredicate marker_predicate(std::vector<std::string> markers)
{
  return [markers = std::move(markers)](const std::string & dir) {
    for (const auto & marker : markers) {
      std::error_code ec;
      if (path::exists(path::join(dir, marker), ec) != path::FileKind::None) {
        return true;
      }
    }
    return false;
  };
}

RootResolver root_pattern_list(std::vector<std::string> markers)
{
  RootPredicate matcher = marker_predicate(std::move(markers));
  return [matcher = std::move(matcher)](const std::string & start_path) {
    return search_ancestors(start_path, matcher);
  };
}

std::optional<std::string> find_git_ancestor(const std::string & start_path)
{
  return search_ancestors(start_path, kind_predicate(".git", path::FileKind::Directory));
}

std::optional<std::string> find_node_modules_ancestor(const std::string & start_path)
{
  return search_ancestors(start_path, kind_predicate("node_modules", path::FileKind::Directory));
}

std::optional<std::string> find_package_json_ancestor(const std::string & start_path)
{
  return search_ancestors(start_path, kind_predicate("package.json", path::FileKind::File));
}

}  // namespace workroot
