#include <lina/formatter.hpp>

#include <charconv>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace lina {

  value
  formatter::format(const value& input) const {
    return input;
  }

  std::string
  formatter::format_block(std::string text) const {
    return text;
  }

  std::string
  formatter::on_block_begin(bool) const {
    return {};
  }

  std::string
  formatter::on_block_end(bool) const {
    return {};
  }

  namespace {

    // -----------------------------------------------------------------------
    // Argument helpers
    // -----------------------------------------------------------------------

    const std::string&
    require_argument(std::string_view name,
                     const std::optional<std::string>& argument) {
      if (!argument)
        throw std::invalid_argument(std::string(name) +
                                    ": missing argument");
      return *argument;
    }

    void
    reject_argument(std::string_view name,
                    const std::optional<std::string>& argument) {
      if (argument)
        throw std::invalid_argument(std::string(name) +
                                    ": takes no argument, got '" + *argument +
                                    "'");
    }

    std::optional<std::int64_t>
    parse_integer(std::string_view text) {
      std::int64_t result = 0;
      const char* first = text.data();
      const char* last = text.data() + text.size();
      if (first != last && *first == '+') ++first;
      auto [ptr, ec] = std::from_chars(first, last, result);
      if (ec != std::errc() || ptr != last || first == last) return std::nullopt;
      return result;
    }

    // Bound on width and indent arguments.
    constexpr std::int64_t max_integer_argument = 65535;

    int
    integer_argument(std::string_view name,
                     const std::optional<std::string>& argument) {
      const auto& text = require_argument(name, argument);
      auto parsed = parse_integer(text);
      if (!parsed)
        throw std::invalid_argument(std::string(name) +
                                    ": expected an integer, got '" + text +
                                    "'");
      if (*parsed < -max_integer_argument || *parsed > max_integer_argument)
        throw std::invalid_argument(
            std::string(name) + ": argument out of range, got '" + text +
            "'");
      return static_cast<int>(*parsed);
    }

    void
    replace_all(std::string& text, std::string_view from,
                std::string_view to) {
      std::size_t pos = 0;
      while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
      }
    }

    // UTF-8 aware: continuation bytes do not count.
    std::size_t
    display_length(std::string_view text) {
      std::size_t n = 0;
      for (char c : text)
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) ++n;
      return n;
    }

    // -----------------------------------------------------------------------
    // Value formatters
    // -----------------------------------------------------------------------

    class value_formatter : public formatter {
    public:
      formatter_kind
      kind() const override {
        return formatter_kind::value;
      }
    };

    // Negative widths pad on the left ("  42"), positive on the right
    // ("42  ").
    class width_formatter : public value_formatter {
      int width_;

    public:
      explicit width_formatter(int width) : width_(width) {}

      value
      format(const value& input) const override {
        std::string text = to_string(input);
        std::size_t target = width_ < 0 ? static_cast<std::size_t>(-width_)
                                        : static_cast<std::size_t>(width_);
        std::size_t length = display_length(text);
        if (length >= target) return text;

        std::string padding(target - length, ' ');
        if (width_ < 0) return padding + text;
        return text + padding;
      }
    };

    class prefix_formatter : public value_formatter {
      std::string prefix_;

    public:
      explicit prefix_formatter(std::string prefix)
          : prefix_(std::move(prefix)) {}

      value
      format(const value& input) const override {
        return prefix_ + to_string(input);
      }
    };

    class suffix_formatter : public value_formatter {
      std::string suffix_;

    public:
      explicit suffix_formatter(std::string suffix)
          : suffix_(std::move(suffix)) {}

      value
      format(const value& input) const override {
        return to_string(input) + suffix_;
      }
    };

    class default_formatter : public value_formatter {
      std::string default_;

    public:
      explicit default_formatter(std::string fallback)
          : default_(std::move(fallback)) {}

      value
      format(const value& input) const override {
        if (input.is_null()) return default_;
        return input;
      }
    };

    class upper_case_formatter : public value_formatter {
    public:
      value
      format(const value& input) const override {
        std::string text = to_string(input);
        for (auto& c : text)
          if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
        return text;
      }
    };

    class escape_newlines_formatter : public value_formatter {
    public:
      value
      format(const value& input) const override {
        std::string text = to_string(input);
        replace_all(text, "\n", "\\n");
        return text;
      }
    };

    class escape_string_formatter : public value_formatter {
    public:
      value
      format(const value& input) const override {
        std::string result;
        for (char c : to_string(input)) {
          switch (c) {
            case '\n':
              result += "\\n";
              break;
            case '\t':
              result += "\\t";
              break;
            case '"':
              result += "\\\"";
              break;
            default:
              result += c;
              break;
          }
        }
        return result;
      }
    };

    // Only strings are quoted; numbers and booleans pass through.
    class wrap_string_formatter : public value_formatter {
    public:
      value
      format(const value& input) const override {
        if (!input.is_string()) return input;
        return '"' + input.as_string() + '"';
      }
    };

    class cbool_formatter : public value_formatter {
    public:
      value
      format(const value& input) const override {
        if (input.kind() != value_kind::boolean) return input;
        return input.as_bool() ? "true" : "false";
      }
    };

    class hex_formatter : public value_formatter {
    public:
      value
      format(const value& input) const override {
        std::optional<std::int64_t> number;
        if (input.kind() == value_kind::integer)
          number = input.as_integer();
        else if (input.is_string())
          number = parse_integer(input.as_string());

        if (!number)
          throw std::invalid_argument("hex: value '" + to_string(input) +
                                      "' is not an integer");

        std::uint64_t magnitude =
            *number < 0 ? 0 - static_cast<std::uint64_t>(*number)
                        : static_cast<std::uint64_t>(*number);
        char buf[32];
        auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), magnitude, 16);
        std::string digits(buf, end);
        for (auto& c : digits)
          if (c >= 'a' && c <= 'f') c = static_cast<char>(c - 'a' + 'A');

        return std::string(*number < 0 ? "-0x" : "0x") + digits;
      }
    };

    // -----------------------------------------------------------------------
    // Block formatters
    // -----------------------------------------------------------------------

    class block_formatter : public formatter {
    public:
      formatter_kind
      kind() const override {
        return formatter_kind::block;
      }
    };

    class indent_formatter : public block_formatter {
      std::string tabs_;

    public:
      explicit indent_formatter(int depth)
          : tabs_(depth > 0 ? static_cast<std::size_t>(depth) : 0, '\t') {}

      std::string
      on_block_begin(bool) const override {
        return tabs_;
      }

      std::string
      format_block(std::string text) const override {
        if (!tabs_.empty()) replace_all(text, "\n", "\n" + tabs_);
        return text;
      }
    };

    class list_separator_formatter : public block_formatter {
      std::string separator_;

    public:
      explicit list_separator_formatter(std::string separator)
          : separator_(std::move(separator)) {
        replace_all(separator_, "NEWLINE", "\n");
        replace_all(separator_, "SPACE", " ");
      }

      std::string
      on_block_end(bool is_last) const override {
        if (is_last) return {};
        return separator_;
      }
    };

    template <typename T>
    formatter_factory
    no_argument(std::string name) {
      return [name = std::move(name)](const std::optional<std::string>& arg)
                 -> std::unique_ptr<formatter> {
        reject_argument(name, arg);
        return std::make_unique<T>();
      };
    }

    template <typename T>
    formatter_factory
    string_argument(std::string name) {
      return [name = std::move(name)](const std::optional<std::string>& arg)
                 -> std::unique_ptr<formatter> {
        return std::make_unique<T>(require_argument(name, arg));
      };
    }

    template <typename T>
    formatter_factory
    int_argument(std::string name) {
      return [name = std::move(name)](const std::optional<std::string>& arg)
                 -> std::unique_ptr<formatter> {
        return std::make_unique<T>(integer_argument(name, arg));
      };
    }

  } // namespace

  const formatter_registry&
  formatter_registry::builtin() {
    static const formatter_registry registry = [] {
      formatter_registry r;

      for (const char* name : {"width", "w"})
        r.set(name, int_argument<width_formatter>(name));
      r.set("prefix", string_argument<prefix_formatter>("prefix"));
      r.set("suffix", string_argument<suffix_formatter>("suffix"));
      r.set("default", string_argument<default_formatter>("default"));
      for (const char* name : {"upper-case", "uc"})
        r.set(name, no_argument<upper_case_formatter>(name));
      r.set("escape-newlines",
            no_argument<escape_newlines_formatter>("escape-newlines"));
      r.set("escape-string",
            no_argument<escape_string_formatter>("escape-string"));
      r.set("wrap-string", no_argument<wrap_string_formatter>("wrap-string"));
      r.set("cbool", no_argument<cbool_formatter>("cbool"));
      r.set("hex", no_argument<hex_formatter>("hex"));

      r.set("indent", int_argument<indent_formatter>("indent"));
      for (const char* name : {"list-separator", "separator", "l-s"})
        r.set(name, string_argument<list_separator_formatter>(name));

      return r;
    }();
    return registry;
  }

  formatter_registry
  formatter_registry::defaults() {
    return builtin();
  }

  void
  formatter_registry::set(std::string name, formatter_factory factory) {
    factories_[std::move(name)] = std::move(factory);
  }

  const formatter_factory*
  formatter_registry::find(std::string_view name) const {
    auto it = factories_.find(std::string(name));
    if (it == factories_.end()) return nullptr;
    return &it->second;
  }

  bool
  formatter_registry::contains(std::string_view name) const {
    return find(name) != nullptr;
  }

  std::size_t
  formatter_registry::size() const {
    return factories_.size();
  }

} // namespace lina
