#include <lina/context.hpp>

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <stdexcept>
#include <utility>

namespace lina {

  namespace {

    // Markers only need to exist; blocks probing them see an empty map.
    const value&
    marker_value() {
      static const value marker{value_map{}};
      return marker;
    }

    std::optional<std::int64_t>
    parse_index(std::string_view component) {
      if (component.size() < 2 || component.front() != '[' ||
          component.back() != ']')
        return std::nullopt;

      std::string_view digits = component.substr(1, component.size() - 2);
      std::int64_t index = 0;
      auto [ptr, ec] =
          std::from_chars(digits.data(), digits.data() + digits.size(), index);
      if (ec != std::errc() || ptr != digits.data() + digits.size() ||
          digits.empty())
        return std::nullopt;
      return index;
    }

    bool
    is_index(std::string_view component) {
      return component.size() >= 2 && component.front() == '[' &&
             component.back() == ']';
    }

  } // namespace

  // -------------------------------------------------------------------------
  // frame
  // -------------------------------------------------------------------------

  frame::frame(const value_map& entries) : entries_(&entries) {}

  frame
  frame::for_instance(value instance) {
    frame f;
    f.self_ = std::move(instance);
    if (f.self_->kind() == value_kind::map) f.entries_ = &f.self_->as_map();
    return f;
  }

  void
  frame::add_marker(std::string name) {
    markers_.push_back(std::move(name));
  }

  const value*
  frame::find(std::string_view name) const {
    if (std::find(markers_.begin(), markers_.end(), name) != markers_.end())
      return &marker_value();

    if (self_ && name == ".") return &*self_;

    if (entries_ != nullptr) {
      auto it = entries_->find(name);
      if (it != entries_->end()) return &it->second;
    }
    return nullptr;
  }

  // -------------------------------------------------------------------------
  // context_stack
  // -------------------------------------------------------------------------

  context_stack::context_stack(const value_map& root) {
    frames_.emplace_back(root);
  }

  void
  context_stack::push(frame f) {
    frames_.push_back(std::move(f));
  }

  void
  context_stack::pop() {
    if (frames_.empty())
      throw std::logic_error("context_stack: pop on empty stack");
    frames_.pop_back();
  }

  const value*
  context_stack::find(std::string_view name) const {
    for (auto it = frames_.rbegin(); it != frames_.rend(); ++it) {
      if (const value* v = it->find(name)) return v;
    }
    return nullptr;
  }

  // -------------------------------------------------------------------------
  // Path resolution
  // -------------------------------------------------------------------------

  lookup_result
  lookup_component(const value& v, std::string_view component) {
    if (is_index(component)) {
      auto index = parse_index(component);
      if (!index || v.kind() != value_kind::list)
        return {lookup_status::type_error, {}};

      const auto& items = v.as_list();
      auto size = static_cast<std::int64_t>(items.size());
      std::int64_t i = *index < 0 ? *index + size : *index;
      if (i < 0 || i >= size) return {lookup_status::not_found, {}};
      return {lookup_status::found, items[static_cast<std::size_t>(i)]};
    }

    if (v.kind() == value_kind::object) {
      if (auto attribute = v.as_object().attribute(component))
        return {lookup_status::found, std::move(*attribute)};
      return {lookup_status::not_found, {}};
    }

    if (v.kind() == value_kind::map) {
      const auto& map = v.as_map();
      auto it = map.find(component);
      if (it == map.end()) return {lookup_status::not_found, {}};
      return {lookup_status::found, it->second};
    }

    return {lookup_status::type_error, {}};
  }

  std::optional<value>
  resolve(const context_stack& stack, std::string_view name,
          const source_position& position) {
    // Markers of dotted blocks ("a.b#First") are bound under the full name.
    if (name.find('.') != std::string_view::npos && name.front() != '.')
      if (const value* exact = stack.find(name)) return *exact;

    std::string_view root = name;
    std::optional<std::string_view> path;

    if (!name.empty() && name.front() == '.') {
      root = ".";
      if (name.size() > 1) path = name.substr(1);
    } else if (auto dot = name.find('.'); dot != std::string_view::npos) {
      root = name.substr(0, dot);
      path = name.substr(dot + 1);
    }

    const value* bound = stack.find(root);
    if (bound == nullptr) return std::nullopt;

    value current = *bound;
    if (!path) return current;

    std::string_view rest = *path;
    while (true) {
      auto dot = rest.find('.');
      std::string_view component = rest.substr(0, dot);

      auto result = lookup_component(current, component);
      if (result.status != lookup_status::found)
        throw path_error("Cannot expand token, component '" +
                             std::string(component) + "' is missing or invalid",
                         position);
      current = std::move(result.result);

      if (dot == std::string_view::npos) break;
      rest.remove_prefix(dot + 1);
    }
    return current;
  }

  value_list
  block_instances(const value& v) {
    switch (v.kind()) {
      case value_kind::null:
        return {value(value_map{})};
      case value_kind::list:
        return v.as_list();
      case value_kind::set:
        return v.set_items();
      default:
        return {v};
    }
  }

} // namespace lina
