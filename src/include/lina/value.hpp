#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace lina {

  class value;
  class object;
  struct value_set;

  using value_map = std::map<std::string, value, std::less<>>;
  using value_list = std::vector<value>;

  enum class value_kind {
    null,
    boolean,
    integer,
    floating,
    string,
    map,
    list,
    set,
    object,
  };

  // Context data. Containers are shared and immutable, so copying a value
  // is cheap and rendering never modifies data owned by the caller.
  class value {
  public:
    using variant_type =
        std::variant<std::monostate, bool, std::int64_t, double, std::string,
                     std::shared_ptr<const value_map>,
                     std::shared_ptr<const value_list>,
                     std::shared_ptr<const value_set>,
                     std::shared_ptr<const object>>;

    value() = default;
    value(std::nullptr_t) {}
    value(bool b) : data_(b) {}
    value(int i) : data_(std::int64_t{i}) {}
    value(long i) : data_(std::int64_t{i}) {}
    value(long long i) : data_(static_cast<std::int64_t>(i)) {}
    value(unsigned i) : data_(std::int64_t{i}) {}
    value(unsigned long i) : value(static_cast<unsigned long long>(i)) {}
    // Values above the int64 range are kept as doubles.
    value(unsigned long long i);
    value(double d) : data_(d) {}
    value(const char* s) : data_(std::string(s)) {}
    value(std::string s) : data_(std::move(s)) {}
    value(std::string_view s) : data_(std::string(s)) {}
    value(value_map m);
    value(value_list l);
    value(value_set s);
    value(std::shared_ptr<const object> o);

    // A set keeps the first occurrence of each element, in insertion order.
    static value
    set(value_list items);

    value_kind
    kind() const;

    bool
    is_null() const {
      return std::holds_alternative<std::monostate>(data_);
    }

    bool
    is_string() const {
      return std::holds_alternative<std::string>(data_);
    }

    // Strings, numbers and booleans.
    bool
    is_scalar() const;

    bool
    as_bool() const;

    std::int64_t
    as_integer() const;

    double
    as_floating() const;

    const std::string&
    as_string() const;

    const value_map&
    as_map() const;

    const value_list&
    as_list() const;

    const value_list&
    set_items() const;

    const object&
    as_object() const;

    const variant_type&
    data() const {
      return data_;
    }

    bool
    operator==(const value& other) const;

  private:
    variant_type data_;
  };

  // Host object exposing named attributes to dotted paths.
  class object {
  public:
    virtual ~object() = default;

    // nullopt when the object has no attribute of that name.
    virtual std::optional<value>
    attribute(std::string_view name) const = 0;

    virtual std::string
    to_string() const = 0;
  };

  struct value_set {
    value_list items;
  };

  // Text written to the output for a value. Null is empty; booleans are
  // "True"/"False" (see the cbool formatter); containers use a bracketed
  // literal form.
  std::string
  to_string(const value& v);

  std::ostream&
  operator<<(std::ostream& os, const value& v);

} // namespace lina
