#include <lina/value.hpp>

#include <charconv>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace lina {

  namespace {

    template <class... Ts>
    struct overloaded : Ts... {
      using Ts::operator()...;
    };
    template <class... Ts>
    overloaded(Ts...) -> overloaded<Ts...>;

    std::string
    format_floating(double d) {
      char buf[64];
      auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), d);
      if (ec != std::errc()) return std::to_string(d);

      std::string result(buf, end);
      if (result.find_first_of(".en") == std::string::npos) result += ".0";
      return result;
    }

    void
    write_literal(std::string& out, const value& v);

    void
    write_items(std::string& out, const value_list& items, char open,
                char close) {
      out += open;
      bool first = true;
      for (const auto& item : items) {
        if (!first) out += ", ";
        first = false;
        write_literal(out, item);
      }
      out += close;
    }

    void
    write_map(std::string& out, const value_map& map) {
      out += '{';
      bool first = true;
      for (const auto& [key, item] : map) {
        if (!first) out += ", ";
        first = false;
        out += '\'';
        out += key;
        out += "': ";
        write_literal(out, item);
      }
      out += '}';
    }

    // Element form inside a container: strings are quoted, null is spelled.
    void
    write_literal(std::string& out, const value& v) {
      switch (v.kind()) {
        case value_kind::null:
          out += "None";
          break;
        case value_kind::string:
          out += '\'';
          out += v.as_string();
          out += '\'';
          break;
        default:
          out += to_string(v);
          break;
      }
    }

  } // namespace

  value::value(unsigned long long i) {
    if (i > static_cast<unsigned long long>(
                std::numeric_limits<std::int64_t>::max()))
      data_ = static_cast<double>(i);
    else
      data_ = static_cast<std::int64_t>(i);
  }

  value::value(value_map m)
      : data_(std::make_shared<const value_map>(std::move(m))) {}

  value::value(value_list l)
      : data_(std::make_shared<const value_list>(std::move(l))) {}

  value::value(value_set s)
      : data_(std::make_shared<const value_set>(std::move(s))) {}

  value::value(std::shared_ptr<const object> o) : data_(std::move(o)) {
    if (!std::get<std::shared_ptr<const object>>(data_))
      data_ = std::monostate{};
  }

  value
  value::set(value_list items) {
    value_set s;
    for (auto& item : items) {
      bool seen = false;
      for (const auto& existing : s.items) {
        if (existing == item) {
          seen = true;
          break;
        }
      }
      if (!seen) s.items.push_back(std::move(item));
    }
    return value(std::move(s));
  }

  value_kind
  value::kind() const {
    return std::visit(
        overloaded{
            [](std::monostate) { return value_kind::null; },
            [](bool) { return value_kind::boolean; },
            [](std::int64_t) { return value_kind::integer; },
            [](double) { return value_kind::floating; },
            [](const std::string&) { return value_kind::string; },
            [](const std::shared_ptr<const value_map>&) {
              return value_kind::map;
            },
            [](const std::shared_ptr<const value_list>&) {
              return value_kind::list;
            },
            [](const std::shared_ptr<const value_set>&) {
              return value_kind::set;
            },
            [](const std::shared_ptr<const object>&) {
              return value_kind::object;
            },
        },
        data_);
  }

  bool
  value::is_scalar() const {
    switch (kind()) {
      case value_kind::boolean:
      case value_kind::integer:
      case value_kind::floating:
      case value_kind::string:
        return true;
      default:
        return false;
    }
  }

  bool
  value::as_bool() const {
    return std::get<bool>(data_);
  }

  std::int64_t
  value::as_integer() const {
    return std::get<std::int64_t>(data_);
  }

  double
  value::as_floating() const {
    return std::get<double>(data_);
  }

  const std::string&
  value::as_string() const {
    return std::get<std::string>(data_);
  }

  const value_map&
  value::as_map() const {
    return *std::get<std::shared_ptr<const value_map>>(data_);
  }

  const value_list&
  value::as_list() const {
    return *std::get<std::shared_ptr<const value_list>>(data_);
  }

  const value_list&
  value::set_items() const {
    return std::get<std::shared_ptr<const value_set>>(data_)->items;
  }

  const object&
  value::as_object() const {
    return *std::get<std::shared_ptr<const object>>(data_);
  }

  bool
  value::operator==(const value& other) const {
    if (data_.index() != other.data_.index()) return false;

    switch (kind()) {
      case value_kind::null:
        return true;
      case value_kind::boolean:
        return as_bool() == other.as_bool();
      case value_kind::integer:
        return as_integer() == other.as_integer();
      case value_kind::floating:
        return as_floating() == other.as_floating();
      case value_kind::string:
        return as_string() == other.as_string();
      case value_kind::map:
        return as_map() == other.as_map();
      case value_kind::list:
        return as_list() == other.as_list();
      case value_kind::set:
        return set_items() == other.set_items();
      case value_kind::object:
        return &as_object() == &other.as_object();
    }
    return false;
  }

  std::string
  to_string(const value& v) {
    std::string out;
    switch (v.kind()) {
      case value_kind::null:
        break;
      case value_kind::boolean:
        out = v.as_bool() ? "True" : "False";
        break;
      case value_kind::integer:
        out = std::to_string(v.as_integer());
        break;
      case value_kind::floating:
        out = format_floating(v.as_floating());
        break;
      case value_kind::string:
        out = v.as_string();
        break;
      case value_kind::map:
        write_map(out, v.as_map());
        break;
      case value_kind::list:
        write_items(out, v.as_list(), '[', ']');
        break;
      case value_kind::set:
        write_items(out, v.set_items(), '{', '}');
        break;
      case value_kind::object:
        out = v.as_object().to_string();
        break;
    }
    return out;
  }

  std::ostream&
  operator<<(std::ostream& os, const value& v) {
    return os << to_string(v);
  }

} // namespace lina
