#pragma once

#include <lina/formatter.hpp>
#include <lina/text_template.hpp>

#include <functional>
#include <string>
#include <utility>

namespace lina {

  // Loads the text at a location (a file path or a URL).
  using transport_fn = std::function<std::string(const std::string& location)>;

  // Reads a local file. Throws std::runtime_error when it cannot be opened.
  std::string
  read_local_file(const std::string& path);

  // Include resolver serving templates from a directory (or any base
  // location the transport understands). "{{>name}}" loads
  // "<location>/<name><suffix>"; the loaded template resolves its own
  // includes through the same repository.
  class template_repository : public include_resolver {
  public:
    explicit template_repository(std::string location, std::string suffix = {},
                                 transport_fn transport = {});

    text_template
    get(const std::string& name) override;

    // Location a template name maps to.
    std::string
    location_of(const std::string& name) const;

    // Applied to every template loaded from the repository. Loaded
    // templates do not inherit the including template's registry, so a
    // custom registry has to be set here as well.
    void
    set_formatters(const formatter_registry* formatters) {
      formatters_ = formatters;
    }

    void
    set_warning_handler(warning_fn on_warning) {
      on_warning_ = std::move(on_warning);
    }

  private:
    std::string location_;
    std::string suffix_;
    transport_fn transport_;
    const formatter_registry* formatters_ = nullptr;
    warning_fn on_warning_;
  };

} // namespace lina
