#pragma once

#include <cstddef>
#include <ostream>
#include <stdexcept>
#include <string>

namespace lina {

  struct source_position {
    std::size_t line = 1;
    std::size_t column = 1;
    std::string filename;

    bool
    operator==(const source_position&) const = default;

    friend std::ostream&
    operator<<(std::ostream& os, const source_position& p) {
      if (!p.filename.empty()) os << p.filename << ':';
      return os << p.line << ':' << p.column;
    }
  };

  std::string
  to_string(const source_position& position);

  // Base class of every error raised while parsing or rendering a template.
  // what() is "file:line:column:message", the file part omitted when unknown.
  class template_error : public std::runtime_error {
  public:
    template_error(const std::string& message, source_position position);

    const std::string&
    message() const {
      return message_;
    }

    const source_position&
    position() const {
      return position_;
    }

  private:
    std::string message_;
    source_position position_;
  };

  // Unknown formatter, bad formatter argument, or a formatter attached to a
  // token of the wrong kind.
  class invalid_formatter : public template_error {
  public:
    using template_error::template_error;
  };

  // Unterminated or incorrectly delimited token.
  class invalid_token : public template_error {
  public:
    using template_error::template_error;
  };

  class invalid_named_character : public template_error {
  public:
    using template_error::template_error;
  };

  // Unbalanced block nesting or a block that is never closed.
  class invalid_block : public template_error {
  public:
    using template_error::template_error;
  };

  // A component of a dotted path could not be resolved against a value that
  // was found on the context stack.
  class path_error : public template_error {
  public:
    using template_error::template_error;
  };

} // namespace lina
