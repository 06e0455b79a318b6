#pragma once

#include <lina/value.hpp>

#include <nlohmann/json.hpp>

#include <string_view>

namespace lina {

  // null, booleans, numbers and strings map to the matching scalar; arrays
  // to lists; objects to maps.
  value
  from_json(const nlohmann::json& j);

  // Parse a JSON document whose root is an object into a root context.
  // Throws std::runtime_error on malformed input or a non-object root.
  value_map
  parse_json_context(std::string_view text);

} // namespace lina
