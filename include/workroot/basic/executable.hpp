// workroot/basic/executable.hpp - Executable lookup on PATH
//
#pragma once

#include <optional>
#include <string>
#include <vector>

namespace workroot
{

/**
 * Locate an executable.
 *
 * Names containing a separator are checked as given; bare names are searched
 * in each entry of `search_path` (defaults to the PATH environment variable).
 *
 * @return Path of the first executable regular file, or nullopt
 */
[[nodiscard]] std::optional<std::string> find_executable(
  const std::string & name, const std::optional<std::string> & search_path = std::nullopt);

/// True when every name resolves through find_executable().
[[nodiscard]] bool has_bins(
  const std::vector<std::string> & names,
  const std::optional<std::string> & search_path = std::nullopt);

}  // namespace workroot
