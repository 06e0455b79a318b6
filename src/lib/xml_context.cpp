#include <lina/xml_context.hpp>

#include <expat.h>

#include <algorithm>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace lina {

  namespace {

    bool
    is_whitespace_only(std::string_view sv) {
      return std::all_of(sv.begin(), sv.end(), [](char c) {
        return c == ' ' || c == '\n' || c == '\r' || c == '\t';
      });
    }

    struct element {
      std::string name;
      value_map attributes;
      std::string text;
      // Children grouped by name, groups in order of first appearance.
      std::vector<std::pair<std::string, value_list>> children;

      void
      add_child(std::string child_name, value child) {
        for (auto& [existing, items] : children) {
          if (existing == child_name) {
            items.push_back(std::move(child));
            return;
          }
        }
        children.push_back({std::move(child_name), value_list{std::move(child)}});
      }

      value
      to_value() && {
        if (attributes.empty() && children.empty()) {
          if (is_whitespace_only(text)) return {};
          return std::move(text);
        }

        value_map entries = std::move(attributes);
        for (auto& [child_name, items] : children) {
          if (items.size() == 1)
            entries.insert_or_assign(child_name, std::move(items.front()));
          else
            entries.insert_or_assign(child_name, value(std::move(items)));
        }
        if (!is_whitespace_only(text))
          entries.insert_or_assign("#text", std::move(text));
        return entries;
      }
    };

    struct builder {
      std::vector<element> open;
      std::optional<value> root;

      static void XMLCALL
      on_start_element(void* user_data, const char* name, const char** atts) {
        auto* self = static_cast<builder*>(user_data);

        element e;
        e.name = name;
        for (const char** p = atts; *p != nullptr; p += 2)
          e.attributes.insert_or_assign(p[0], value(std::string(p[1])));

        self->open.push_back(std::move(e));
      }

      static void XMLCALL
      on_end_element(void* user_data, const char*) {
        auto* self = static_cast<builder*>(user_data);

        element e = std::move(self->open.back());
        self->open.pop_back();

        std::string name = std::move(e.name);
        value v = std::move(e).to_value();
        if (self->open.empty())
          self->root = std::move(v);
        else
          self->open.back().add_child(std::move(name), std::move(v));
      }

      static void XMLCALL
      on_character_data(void* user_data, const char* s, int len) {
        auto* self = static_cast<builder*>(user_data);
        if (self->open.empty()) return;
        self->open.back().text.append(s, static_cast<std::size_t>(len));
      }
    };

  } // namespace

  value_map
  parse_xml_context(std::string_view xml) {
    std::unique_ptr<XML_ParserStruct, decltype(&XML_ParserFree)> parser(
        XML_ParserCreate(nullptr), &XML_ParserFree);
    if (!parser) throw std::runtime_error("xml_context: failed to create expat parser");

    builder b;
    XML_SetUserData(parser.get(), &b);
    XML_SetElementHandler(parser.get(), builder::on_start_element,
                          builder::on_end_element);
    XML_SetCharacterDataHandler(parser.get(), builder::on_character_data);

    XML_Status status = XML_Parse(parser.get(), xml.data(),
                                  static_cast<int>(xml.size()), XML_TRUE);

    if (status == XML_STATUS_ERROR) {
      std::string msg = "xml_context: XML parse error at line ";
      msg += std::to_string(XML_GetCurrentLineNumber(parser.get()));
      msg += ": ";
      msg += XML_ErrorString(XML_GetErrorCode(parser.get()));
      throw std::runtime_error(msg);
    }

    if (!b.root || b.root->kind() != value_kind::map)
      throw std::runtime_error(
          "xml_context: document element has no attributes or child "
          "elements");

    return b.root->as_map();
  }

} // namespace lina
