#pragma once

#include <lina/error.hpp>
#include <lina/formatter.hpp>
#include <lina/text_stream.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace lina {

  enum class token_kind {
    value,              // {{name}}
    self_reference,     // {{.}} or {{.field}}
    block_open,         // {{#name}}
    negated_block_open, // {{!name}}
    block_close,        // {{/name}}
    named_character,    // {{_NAME}}
    include,            // {{>name}}
  };

  // One {{...}} token. The grammar of the payload is
  //
  //   [prefix]? name (':' flag ('=' argument)?)*
  //
  // where prefix is one of # / ! _ > and each flag names a formatter.
  class token {
  public:
    // Throws invalid_token for an empty name and invalid_formatter for
    // unknown formatters, bad arguments, or a formatter that does not fit
    // the token kind.
    token(std::string_view payload, std::size_t start, std::size_t end,
          source_position position,
          const formatter_registry& formatters = formatter_registry::builtin());

    token_kind
    kind() const {
      return kind_;
    }

    const std::string&
    name() const {
      return name_;
    }

    const std::vector<std::unique_ptr<formatter>>&
    formatters() const {
      return formatters_;
    }

    // Offset of the opening "{{".
    std::size_t
    start() const {
      return start_;
    }

    // Offset just past the closing "}}".
    std::size_t
    end() const {
      return end_;
    }

    const source_position&
    position() const {
      return position_;
    }

    bool
    is_block_open() const {
      return kind_ == token_kind::block_open ||
             kind_ == token_kind::negated_block_open;
    }

    // The character a named-character token stands for. Throws
    // invalid_named_character for names outside the vocabulary.
    char
    named_character() const;

  private:
    token_kind kind_ = token_kind::value;
    std::string name_;
    std::vector<std::unique_ptr<formatter>> formatters_;
    std::size_t start_ = 0;
    std::size_t end_ = 0;
    source_position position_;
  };

  // Read a token from a stream positioned on "{{". On return the stream is
  // positioned just past "}}".
  token
  read_token(text_stream& in,
             const formatter_registry& formatters = formatter_registry::builtin());

} // namespace lina
