#pragma once

#include <lina/error.hpp>
#include <lina/value.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lina {

  // One scope of the context stack: the root context, or one instance of a
  // block. Synthetic entries ("." and the #First/#Separator/#Last markers)
  // are kept beside the data, which is never modified.
  class frame {
  public:
    // A frame over caller-owned entries. The map must outlive the frame.
    explicit frame(const value_map& entries);

    // A frame for one block instance. Map instances expose their entries;
    // every instance is bound to ".".
    static frame
    for_instance(value instance);

    void
    add_marker(std::string name);

    // nullptr when the frame does not bind the name.
    const value*
    find(std::string_view name) const;

  private:
    frame() = default;

    const value_map* entries_ = nullptr;
    std::optional<value> self_;
    std::vector<std::string> markers_;
  };

  class context_stack {
    std::vector<frame> frames_;

  public:
    context_stack() = default;
    explicit context_stack(const value_map& root);

    void
    push(frame f);

    void
    pop();

    std::size_t
    size() const {
      return frames_.size();
    }

    bool
    empty() const {
      return frames_.empty();
    }

    // Innermost binding of a name, nullptr when no frame binds it.
    const value*
    find(std::string_view name) const;
  };

  // Pushes a frame for the lifetime of the guard.
  class scoped_frame {
    context_stack& stack_;

  public:
    scoped_frame(context_stack& stack, frame f) : stack_(stack) {
      stack_.push(std::move(f));
    }

    ~scoped_frame() {
      stack_.pop();
    }

    scoped_frame(const scoped_frame&) = delete;
    scoped_frame&
    operator=(const scoped_frame&) = delete;
  };

  enum class lookup_status { found, not_found, type_error };

  struct lookup_result {
    lookup_status status = lookup_status::not_found;
    value result;
  };

  // Resolve one component of a dotted path against a value. Strategies are
  // tried in this order:
  //
  //   1. "[n]" indexes a list (negative n counts from the end);
  //   2. an attribute of a host object;
  //   3. a key of a map.
  //
  // type_error when the value supports none of them.
  lookup_result
  lookup_component(const value& v, std::string_view component);

  // Resolve a possibly dotted name ("a.b.[0]", ".", ".field") against the
  // stack. nullopt when the root name is not bound anywhere; path_error,
  // reported at `position`, when a later component cannot be resolved.
  std::optional<value>
  resolve(const context_stack& stack, std::string_view name,
          const source_position& position);

  // The instances a block iterates over: a map or a scalar is one instance,
  // a set yields its elements, a list is used as is.
  value_list
  block_instances(const value& v);

} // namespace lina
