#include <lina/block_matcher.hpp>
#include <lina/text_stream.hpp>
#include <lina/text_template.hpp>
#include <lina/token.hpp>

#include <stdexcept>
#include <utility>

namespace lina {

  // Recursive expansion of one template against a context stack.
  struct text_template::renderer {
    const text_template& tmpl;
    const formatter_registry& formatters;
    context_stack& stack;
    std::size_t include_depth;

    void
    render(text_stream& in, output_sink& out) {
      while (!in.at_end()) {
        char c = *in.get();
        if (c != '{' || in.peek() != '{') {
          out.put(c);
          continue;
        }

        in.unget();
        token t = read_token(in, formatters);

        switch (t.kind()) {
          case token_kind::value:
          case token_kind::self_reference:
            expand_variable(t, out);
            break;
          case token_kind::block_open:
          case token_kind::negated_block_open:
            expand_block(in, t, out);
            break;
          case token_kind::named_character:
            out.put(t.named_character());
            break;
          case token_kind::include:
            expand_include(t, out);
            break;
          case token_kind::block_close:
            throw invalid_block("Block close '" + t.name() +
                                    "' without a matching block open",
                                t.position());
        }
      }
    }

    void
    expand_variable(const token& t, output_sink& out) {
      auto resolved = resolve(stack, t.name(), t.position());
      if (!resolved) return;

      value v = std::move(*resolved);
      for (const auto& f : t.formatters()) {
        try {
          v = f->format(v);
        } catch (const std::invalid_argument& e) {
          throw invalid_formatter(e.what(), t.position());
        }
      }

      if (v.is_null()) {
        warn("None/Null value found for variable '" + t.name() +
                 "' after all formatters have run",
             t.position());
        return;
      }

      out.write(to_string(v));
    }

    // Missing and null blocks:
    //
    //   not bound     {{#b}} skipped     {{!b}} rendered once
    //   bound, null   {{#b}} rendered once  {{!b}} rendered once
    //   bound         {{#b}} each instance  {{!b}} skipped
    void
    expand_block(text_stream& in, const token& open, output_sink& out) {
      std::size_t body_begin = in.offset();
      source_position body_position = in.position();
      token close = find_block_end(in, open, formatters);
      std::size_t body_end = close.start();

      bool negated = open.kind() == token_kind::negated_block_open;
      auto resolved = resolve(stack, open.name(), open.position());

      // A null value (items stays null) renders one empty-frame pass.
      value items;
      if (!resolved) {
        if (!negated) return;
      } else if (!resolved->is_null()) {
        if (negated) return;
        items = std::move(*resolved);
      }

      value_list instances = block_instances(items);
      const auto& block_formatters = open.formatters();

      for (std::size_t i = 0; i < instances.size(); ++i) {
        bool is_first = i == 0;
        bool is_last = i + 1 == instances.size();

        for (const auto& f : block_formatters)
          out.write(f->on_block_begin(is_first));

        frame instance = frame::for_instance(instances[i]);
        if (is_first) instance.add_marker(open.name() + "#First");
        if (!is_last) instance.add_marker(open.name() + "#Separator");
        if (is_last) instance.add_marker(open.name() + "#Last");

        {
          scoped_frame scope(stack, std::move(instance));
          text_stream body(in.text(), body_begin, body_end, body_position);

          if (block_formatters.empty()) {
            render(body, out);
          } else {
            string_sink buffer;
            render(body, buffer);
            std::string text = buffer.take();
            for (const auto& f : block_formatters)
              text = f->format_block(std::move(text));
            out.write(text);
          }
        }

        for (const auto& f : block_formatters)
          out.write(f->on_block_end(is_last));
      }
    }

    void
    expand_include(const token& t, output_sink& out) {
      if (tmpl.options_.includes == nullptr)
        throw template_error("Cannot resolve include '" + t.name() +
                                 "' without an include handler",
                             t.position());
      if (include_depth >= max_include_depth)
        throw template_error("Include depth limit exceeded while including '" +
                                 t.name() + "'",
                             t.position());

      text_template included = tmpl.options_.includes->get(t.name());
      included.render_to(out, stack, include_depth + 1);
    }

    void
    warn(const std::string& message, const source_position& position) {
      if (tmpl.options_.on_warning) tmpl.options_.on_warning(message, position);
    }
  };

  text_template::text_template(std::string source, template_options options)
      : source_(std::move(source)), options_(std::move(options)) {}

  text_template::text_template(std::string source, include_resolver* includes,
                               std::string filename)
      : source_(std::move(source)) {
    options_.filename = std::move(filename);
    options_.includes = includes;
  }

  std::string
  text_template::render(const value_map& context) const {
    context_stack stack(context);
    string_sink out;
    render_to(out, stack, 0);
    return out.take();
  }

  std::string
  text_template::render_simple(
      std::initializer_list<value_map::value_type> items) const {
    return render(value_map(items));
  }

  void
  text_template::render_to(output_sink& out, context_stack& stack) const {
    render_to(out, stack, 0);
  }

  void
  text_template::render_to(output_sink& out, context_stack& stack,
                           std::size_t include_depth) const {
    text_stream in(source_, options_.filename);
    renderer r{*this, formatters(), stack, include_depth};
    r.render(in, out);
  }

  const formatter_registry&
  text_template::formatters() const {
    if (options_.formatters != nullptr) return *options_.formatters;
    return formatter_registry::builtin();
  }

} // namespace lina
