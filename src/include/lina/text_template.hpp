#pragma once

#include <lina/context.hpp>
#include <lina/error.hpp>
#include <lina/formatter.hpp>
#include <lina/output_sink.hpp>
#include <lina/value.hpp>

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <string>

namespace lina {

  class text_template;

  // Resolves the target of an include token ({{>name}}).
  class include_resolver {
  public:
    virtual ~include_resolver() = default;

    virtual text_template
    get(const std::string& name) = 0;
  };

  using warning_fn = std::function<void(const std::string& message,
                                        const source_position& position)>;

  struct template_options {
    // Reported in error positions.
    std::string filename;

    // Required only by templates that contain include tokens. Not owned.
    include_resolver* includes = nullptr;

    // Built-in formatters when null. Not owned.
    const formatter_registry* formatters = nullptr;

    // Receives non-fatal diagnostics; they are dropped when unset.
    warning_fn on_warning;
  };

  class text_template {
  public:
    static constexpr std::size_t max_include_depth = 64;

    explicit text_template(std::string source, template_options options = {});

    text_template(std::string source, include_resolver* includes,
                  std::string filename = {});

    std::string
    render(const value_map& context) const;

    // Builds the root context from the given entries.
    std::string
    render_simple(std::initializer_list<value_map::value_type> items = {}) const;

    // Render into a sink using an existing context stack. Included templates
    // are rendered this way so that they see the includer's variables.
    void
    render_to(output_sink& out, context_stack& stack) const;

    const std::string&
    source() const {
      return source_;
    }

    const template_options&
    options() const {
      return options_;
    }

  private:
    struct renderer;

    void
    render_to(output_sink& out, context_stack& stack,
              std::size_t include_depth) const;

    const formatter_registry&
    formatters() const;

    std::string source_;
    template_options options_;
  };

} // namespace lina
