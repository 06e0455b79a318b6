#include <lina/json_context.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>

namespace lina {

  value
  from_json(const nlohmann::json& j) {
    switch (j.type()) {
      case nlohmann::json::value_t::null:
      case nlohmann::json::value_t::discarded:
        return {};
      case nlohmann::json::value_t::boolean:
        return j.get<bool>();
      case nlohmann::json::value_t::number_integer:
        return j.get<std::int64_t>();
      case nlohmann::json::value_t::number_unsigned:
        return value(j.get<std::uint64_t>());
      case nlohmann::json::value_t::number_float:
        return j.get<double>();
      case nlohmann::json::value_t::string:
        return j.get<std::string>();
      case nlohmann::json::value_t::array: {
        value_list items;
        items.reserve(j.size());
        for (const auto& item : j)
          items.push_back(from_json(item));
        return items;
      }
      case nlohmann::json::value_t::object: {
        value_map entries;
        for (const auto& item : j.items())
          entries.emplace(item.key(), from_json(item.value()));
        return entries;
      }
      case nlohmann::json::value_t::binary:
        throw std::runtime_error("json_context: binary values are not supported");
    }
    return {};
  }

  value_map
  parse_json_context(std::string_view text) {
    nlohmann::json document;
    try {
      document = nlohmann::json::parse(text.begin(), text.end());
    } catch (const nlohmann::json::parse_error& e) {
      throw std::runtime_error(std::string("json_context: ") + e.what());
    }

    if (!document.is_object())
      throw std::runtime_error("json_context: document root must be an object");

    return from_json(document).as_map();
  }

} // namespace lina
