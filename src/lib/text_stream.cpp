#include <lina/text_stream.hpp>

#include <stdexcept>
#include <utility>

namespace lina {

  text_stream::text_stream(std::string_view text, std::string filename)
      : text_stream(text, 0, text.size(),
                    source_position{1, 1, std::move(filename)}) {}

  text_stream::text_stream(std::string_view text, std::size_t begin,
                           std::size_t end, source_position start)
      : text_(text), begin_(begin), end_(end), start_(std::move(start)) {
    if (begin_ > end_ || end_ > text_.size())
      throw std::out_of_range("text_stream: range outside of text");
    reset();
  }

  std::optional<char>
  text_stream::get() {
    if (offset_ >= end_) return std::nullopt;

    char c = text_[offset_++];
    if (c == '\n') {
      ++line_;
      column_ = 1;
    } else {
      ++column_;
    }
    return c;
  }

  std::optional<char>
  text_stream::peek() const {
    if (offset_ >= end_) return std::nullopt;
    return text_[offset_];
  }

  void
  text_stream::unget() {
    if (offset_ <= begin_)
      throw std::out_of_range("text_stream: read pointer is at the beginning");

    --offset_;
    if (text_[offset_] != '\n') {
      --column_;
      return;
    }

    // Stepped back onto the previous line: recover its column.
    --line_;
    std::size_t line_start = offset_;
    while (line_start > begin_ && text_[line_start - 1] != '\n')
      --line_start;

    if (line_start == begin_)
      column_ = start_.column + (offset_ - begin_);
    else
      column_ = 1 + (offset_ - line_start);
  }

  void
  text_stream::skip(std::size_t length) {
    if (length > end_ - offset_)
      throw std::out_of_range("text_stream: skip beyond end of stream");
    for (std::size_t i = 0; i < length; ++i)
      get();
  }

  std::string_view
  text_stream::substring(std::size_t start, std::size_t end) const {
    if (start > end || end > text_.size())
      throw std::out_of_range("text_stream: substring outside of text");
    return text_.substr(start, end - start);
  }

  source_position
  text_stream::position() const {
    return source_position{line_, column_, start_.filename};
  }

  void
  text_stream::reset() {
    offset_ = begin_;
    line_ = start_.line;
    column_ = start_.column;
  }

} // namespace lina
