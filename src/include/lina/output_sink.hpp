#pragma once

#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace lina {

  class output_sink {
  public:
    virtual ~output_sink() = default;

    virtual void
    write(std::string_view text) = 0;

    virtual void
    put(char c) = 0;
  };

  // Collects output in memory.
  class string_sink : public output_sink {
    std::string buffer_;

  public:
    void
    write(std::string_view text) override {
      buffer_.append(text);
    }

    void
    put(char c) override {
      buffer_ += c;
    }

    const std::string&
    str() const {
      return buffer_;
    }

    std::string
    take() {
      return std::move(buffer_);
    }
  };

  class ostream_sink : public output_sink {
    std::ostream& os_;

  public:
    explicit ostream_sink(std::ostream& os) : os_(os) {}

    void
    write(std::string_view text) override {
      os_ << text;
    }

    void
    put(char c) override {
      os_.put(c);
    }
  };

} // namespace lina
