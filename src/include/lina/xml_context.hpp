#pragma once

#include <lina/value.hpp>

#include <string_view>

namespace lina {

  // Parse an XML document into a root context. The document element itself
  // is unnamed; its content becomes the root map:
  //
  //   - attributes become string entries;
  //   - a child element becomes an entry named after it, and children that
  //     share a name become a list in document order;
  //   - an element without attributes or child elements is its text, or null
  //     when the text is empty or whitespace;
  //   - text beside child elements or attributes is kept under "#text".
  //
  // Throws std::runtime_error on malformed XML or when the document element
  // has neither attributes nor child elements.
  value_map
  parse_xml_context(std::string_view xml);

} // namespace lina
