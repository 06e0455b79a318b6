#include <lina/token.hpp>

#include <optional>
#include <stdexcept>
#include <utility>

namespace lina {

  namespace {

    struct named_character_entry {
      std::string_view name;
      char character;
    };

    constexpr named_character_entry named_characters[] = {
        {"NEWLINE", '\n'},
        {"SPACE", ' '},
        {"LEFT_BRACE", '{'},
        {"RIGHT_BRACE", '}'},
    };

    bool
    accepts(token_kind kind, const formatter& f) {
      if (f.is_block_formatter()) return kind == token_kind::block_open;
      return kind == token_kind::value || kind == token_kind::self_reference;
    }

  } // namespace

  token::token(std::string_view payload, std::size_t start, std::size_t end,
               source_position position, const formatter_registry& formatters)
      : start_(start), end_(end), position_(std::move(position)) {
    std::string_view rest = payload;
    std::optional<token_kind> prefixed;
    if (!rest.empty()) {
      switch (rest.front()) {
        case '#':
          prefixed = token_kind::block_open;
          break;
        case '/':
          prefixed = token_kind::block_close;
          break;
        case '!':
          prefixed = token_kind::negated_block_open;
          break;
        case '_':
          prefixed = token_kind::named_character;
          break;
        case '>':
          prefixed = token_kind::include;
          break;
        default:
          break;
      }
    }
    if (prefixed) rest.remove_prefix(1);

    auto separator = rest.find(':');
    name_ = std::string(rest.substr(0, separator));
    if (name_.empty())
      throw invalid_token("Token '" + std::string(payload) + "' has no name",
                          position_);

    if (prefixed)
      kind_ = *prefixed;
    else if (name_.front() == '.')
      kind_ = token_kind::self_reference;
    else
      kind_ = token_kind::value;

    if (separator == std::string_view::npos) return;

    std::string_view flags = rest.substr(separator + 1);
    while (true) {
      auto next = flags.find(':');
      std::string_view flag = flags.substr(0, next);

      std::string key;
      std::optional<std::string> argument;
      if (auto eq = flag.find('='); eq != std::string_view::npos) {
        key = std::string(flag.substr(0, eq));
        if (eq + 1 < flag.size()) argument = std::string(flag.substr(eq + 1));
      } else {
        key = std::string(flag);
      }

      const auto* factory = formatters.find(key);
      if (factory == nullptr)
        throw invalid_formatter("Invalid formatter '" + key + "'", position_);

      std::unique_ptr<formatter> f;
      try {
        f = (*factory)(argument);
      } catch (const std::invalid_argument& e) {
        throw invalid_formatter(e.what(), position_);
      }

      if (!accepts(kind_, *f)) {
        if (f->is_block_formatter())
          throw invalid_formatter("Requested block formatter '" + key +
                                      "' on non-block. Only block formatters "
                                      "can be used on blocks.",
                                  position_);
        throw invalid_formatter("Requested value formatter '" + key +
                                    "' for non-value. Only value formatters "
                                    "can be used with values.",
                                position_);
      }

      formatters_.push_back(std::move(f));

      if (next == std::string_view::npos) break;
      flags.remove_prefix(next + 1);
    }
  }

  char
  token::named_character() const {
    for (const auto& entry : named_characters)
      if (entry.name == name_) return entry.character;
    throw invalid_named_character(
        "Unrecognized named character token '" + name_ + "'", position_);
  }

  token
  read_token(text_stream& in, const formatter_registry& formatters) {
    std::size_t start = in.offset();
    source_position start_position = in.position();
    in.skip(2);

    std::string payload;
    while (true) {
      auto c = in.get();
      if (!c)
        throw invalid_token("End-of-file reached while reading token",
                            start_position);

      if (*c != '}') {
        payload += *c;
        continue;
      }

      if (in.peek() != '}')
        throw invalid_token("Token '" + payload + "' incorrectly delimited",
                            in.position());

      in.get();
      return token(payload, start, in.offset(), std::move(start_position),
                   formatters);
    }
  }

} // namespace lina
