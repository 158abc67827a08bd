// workroot/root/root_resolver.hpp - Project root discovery
//
// Walks ancestors of a starting path until a predicate accepts one. The
// predicates used here are built from marker names (".git", "package.json"...)
// that identify a project root.
//
#pragma once

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "workroot/basic/path.hpp"

namespace workroot
{

/// Accepts or rejects a candidate directory. Must not throw.
using RootPredicate = std::function<bool(const std::string &)>;

/// Maps a starting path to its project root, if any.
using RootResolver = std::function<std::optional<std::string>(const std::string &)>;

/**
 * Find the nearest directory accepted by `predicate`.
 *
 * The real path of `start_path` is tested first, then each ancestor from
 * path::iterate_parents() in order of increasing distance.
 *
 * @return The accepted directory, or nullopt (also when `start_path` does not exist)
 */
[[nodiscard]] std::optional<std::string> search_ancestors(
  const std::string & start_path, const RootPredicate & predicate);

/**
 * Predicate accepting a directory that contains any of `markers`.
 *
 * Markers are checked in order with the non-throwing path::exists(), so
 * unreadable directories are rejected rather than raising.
 */
[[nodiscard]] RootPredicate marker_predicate(std::vector<std::string> markers);

/// Build a resolver from marker names (strings or vectors of strings).
[[nodiscard]] RootResolver root_pattern_list(std::vector<std::string> markers);

template <typename... Markers>
[[nodiscard]] RootResolver root_pattern(const Markers &... markers)
{
  std::vector<std::string> flat;
  (path::detail::flatten_into(flat, markers), ...);
  return root_pattern_list(std::move(flat));
}

/// Nearest ancestor holding a `.git` directory.
[[nodiscard]] std::optional<std::string> find_git_ancestor(const std::string & start_path);

/// Nearest ancestor holding a `node_modules` directory.
[[nodiscard]] std::optional<std::string> find_node_modules_ancestor(
  const std::string & start_path);

/// Nearest ancestor holding a `package.json` file.
[[nodiscard]] std::optional<std::string> find_package_json_ancestor(
  const std::string & start_path);

}  // namespace workroot
