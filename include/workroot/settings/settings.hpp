// workroot/settings/settings.hpp - Nested server settings helpers
//
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string_view>

namespace workroot::settings
{

/**
 * Merge `src` into `dst`.
 *
 * Objects merge key by key, recursively; any other value (arrays included)
 * replaces what `dst` held. A non-object `dst` is replaced by an empty object
 * first.
 *
 * @throws std::invalid_argument if `src` is not an object
 */
nlohmann::json & deep_extend(nlohmann::json & dst, const nlohmann::json & src);

/// Apply several sources left to right.
template <typename... Sources>
nlohmann::json & deep_extend(nlohmann::json & dst, const nlohmann::json & first,
                             const Sources &... rest)
{
  deep_extend(dst, first);
  (deep_extend(dst, rest), ...);
  return dst;
}

/**
 * Look up a dotted section ("python.analysis.typeCheckingMode").
 *
 * Only missing keys and JSON null count as absent; a `false` value is
 * returned as `false`.
 *
 * @return The value, or nullopt when any part is missing or not an object
 */
[[nodiscard]] std::optional<nlohmann::json> lookup_section(
  const nlohmann::json & settings, std::string_view section);

}  // namespace workroot::settings
