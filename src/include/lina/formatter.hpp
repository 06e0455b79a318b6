#pragma once

#include <lina/value.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace lina {

  enum class formatter_kind { value, block };

  // A named transform attached to a token with the ":name[=argument]"
  // syntax. Value formatters rewrite the value of a value token; block
  // formatters add text around each block instance and may rewrite the
  // rendered text of an instance.
  class formatter {
  public:
    virtual ~formatter() = default;

    virtual formatter_kind
    kind() const = 0;

    bool
    is_value_formatter() const {
      return kind() == formatter_kind::value;
    }

    bool
    is_block_formatter() const {
      return kind() == formatter_kind::block;
    }

    // Value formatters only. May throw std::invalid_argument for inputs
    // the formatter cannot handle.
    virtual value
    format(const value& input) const;

    // Block formatters: rendered text of one instance.
    virtual std::string
    format_block(std::string text) const;

    // Text written before an instance is rendered.
    virtual std::string
    on_block_begin(bool is_first) const;

    // Text written after an instance is rendered.
    virtual std::string
    on_block_end(bool is_last) const;
  };

  // Creates a formatter from its optional argument. Throws
  // std::invalid_argument when the argument is missing, unexpected or
  // malformed.
  using formatter_factory = std::function<std::unique_ptr<formatter>(
      const std::optional<std::string>& argument)>;

  class formatter_registry {
    std::unordered_map<std::string, formatter_factory> factories_;

  public:
    formatter_registry() = default;

    // The built-in formatters, shared by every template that does not
    // configure its own registry.
    static const formatter_registry&
    builtin();

    // A copy of the built-in formatters, for extension.
    static formatter_registry
    defaults();

    void
    set(std::string name, formatter_factory factory);

    const formatter_factory*
    find(std::string_view name) const;

    bool
    contains(std::string_view name) const;

    std::size_t
    size() const;
  };

} // namespace lina
