#pragma once

#include <lina/error.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace lina {

  // Read-only cursor over template text that tracks line and column.
  //
  // A stream may cover only part of a larger text (a block body). Offsets are
  // always relative to the full text, so offsets recorded by one stream can be
  // used to open another over the same text.
  class text_stream {
  public:
    explicit text_stream(std::string_view text, std::string filename = {});

    text_stream(std::string_view text, std::size_t begin, std::size_t end,
                source_position start);

    // Next character, or nullopt at the end of the stream.
    std::optional<char>
    get();

    std::optional<char>
    peek() const;

    // Step back over the character returned by the last get().
    void
    unget();

    void
    skip(std::size_t length);

    std::string_view
    substring(std::size_t start, std::size_t end) const;

    std::size_t
    offset() const {
      return offset_;
    }

    source_position
    position() const;

    bool
    at_end() const {
      return offset_ >= end_;
    }

    void
    reset();

    std::string_view
    text() const {
      return text_;
    }

  private:
    std::string_view text_;
    std::size_t begin_;
    std::size_t end_;
    source_position start_;

    std::size_t offset_;
    std::size_t line_;
    std::size_t column_;
  };

} // namespace lina
