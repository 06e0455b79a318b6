#include <lina/error.hpp>

#include <sstream>
#include <utility>

namespace lina {

  namespace {

    std::string
    format_error(const std::string& message, const source_position& position) {
      std::ostringstream ss;
      ss << position << ':' << message;
      return ss.str();
    }

  } // namespace

  std::string
  to_string(const source_position& position) {
    std::ostringstream ss;
    ss << position;
    return ss.str();
  }

  template_error::template_error(const std::string& message,
                                 source_position position)
      : std::runtime_error(format_error(message, position)), message_(message),
        position_(std::move(position)) {}

} // namespace lina
