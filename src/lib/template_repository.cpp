#include <lina/template_repository.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace lina {

  std::string
  read_local_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in)
      throw std::runtime_error("template_repository: cannot open file: " +
                               path);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
  }

  template_repository::template_repository(std::string location,
                                           std::string suffix,
                                           transport_fn transport)
      : location_(std::move(location)), suffix_(std::move(suffix)),
        transport_(std::move(transport)) {
    if (!transport_) transport_ = read_local_file;
  }

  std::string
  template_repository::location_of(const std::string& name) const {
    if (location_.empty()) return name + suffix_;
    if (location_.back() == '/') return location_ + name + suffix_;
    return location_ + '/' + name + suffix_;
  }

  text_template
  template_repository::get(const std::string& name) {
    template_options options;
    options.filename = name;
    options.includes = this;
    options.formatters = formatters_;
    options.on_warning = on_warning_;
    return text_template(transport_(location_of(name)), std::move(options));
  }

} // namespace lina
