// workroot/settings/settings.cpp - Nested server settings helpers
//
#include "workroot/settings/settings.hpp"

#include <stdexcept>
#include <string>

namespace workroot::settings
{

nlohmann::json & deep_extend(nlohmann::json & dst, const nlohmann::json & src)
{
  if (!src.is_object()) {
    throw std::invalid_argument("deep_extend: source must be an object, got " +
                                std::string(src.type_name()));
  }
  if (!dst.is_object()) {
    dst = nlohmann::json::object();
  }

  for (auto it = src.begin(); it != src.end(); ++it) {
    if (it.value().is_object()) {
      deep_extend(dst[it.key()], it.value());
    } else {
      dst[it.key()] = it.value();
    }
  }
  return dst;
}

std::optional<nlohmann::json> lookup_section(
  const nlohmann::json & settings, std::string_view section)
{
  const nlohmann::json * node = &settings;
  size_t start = 0;
  while (start <= section.size()) {
    size_t dot = section.find('.', start);
    if (dot == std::string_view::npos) {
      dot = section.size();
    }
    const std::string part(section.substr(start, dot - start));

    if (!node->is_object()) {
      return std::nullopt;
    }
    auto it = node->find(part);
    if (it == node->end() || it->is_null()) {
      return std::nullopt;
    }
    node = &*it;
    start = dot + 1;
  }
  return *node;
}

}  // namespace workroot::settings
