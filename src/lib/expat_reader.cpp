#include <bpg/xml_reader.hpp>

#include <expat.h>

#include <cstring>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace bpg {

  namespace {

    struct attribute_entry {
      qname name;
      std::string value;
    };

    // One reader event. Attributes live in a pool shared by all events;
    // first_attribute/attribute_count select this event's slice.
    struct event {
      xml_node_type type;
      qname name;
      std::string text;
      std::size_t first_attribute = 0;
      std::size_t attribute_count = 0;
      std::size_t depth = 0;
      std::size_t line = 0;
    };

    struct document {
      std::vector<event> events;
      std::vector<attribute_entry> attributes;
      std::vector<namespace_binding> bindings;
    };

    // expat reports namespaced names as "uri\nlocal".
    constexpr char name_separator = '\n';

    qname
    split_name(const char* expat_name) {
      const char* sep = std::strchr(expat_name, name_separator);
      if (sep == nullptr) { return qname{"", expat_name}; }
      return qname{std::string(expat_name, sep), std::string(sep + 1)};
    }

    // Collects the callbacks of one XML_Parse call into a document.
    class collector {
      XML_Parser parser_;
      document& doc_;
      std::size_t depth_ = 0;

      std::size_t
      current_line() const {
        return static_cast<std::size_t>(XML_GetCurrentLineNumber(parser_));
      }

      static collector&
      self(void* user_data) {
        return *static_cast<collector*>(user_data);
      }

    public:
      collector(XML_Parser parser, document& doc) : parser_(parser), doc_(doc) {
        XML_SetUserData(parser_, this);
        XML_SetElementHandler(parser_, on_start, on_end);
        XML_SetCharacterDataHandler(parser_, on_text);
        XML_SetStartNamespaceDeclHandler(parser_, on_namespace);
      }

      static void XMLCALL
      on_start(void* user_data, const char* name, const char** atts) {
        auto& c = self(user_data);
        event ev{xml_node_type::start_element, split_name(name)};
        ev.depth = ++c.depth_;
        ev.line = c.current_line();
        ev.first_attribute = c.doc_.attributes.size();
        for (const char** p = atts; *p != nullptr; p += 2) {
          c.doc_.attributes.push_back({split_name(p[0]), p[1]});
        }
        ev.attribute_count = c.doc_.attributes.size() - ev.first_attribute;
        c.doc_.events.push_back(std::move(ev));
      }

      static void XMLCALL
      on_end(void* user_data, const char* name) {
        auto& c = self(user_data);
        event ev{xml_node_type::end_element, split_name(name)};
        ev.depth = c.depth_--;
        ev.line = c.current_line();
        c.doc_.events.push_back(std::move(ev));
      }

      static void XMLCALL
      on_text(void* user_data, const char* s, int len) {
        auto& c = self(user_data);
        auto& events = c.doc_.events;
        // expat splits text at entity references and buffer boundaries.
        if (events.empty() || events.back().type != xml_node_type::characters) {
          event ev{xml_node_type::characters};
          ev.depth = c.depth_;
          ev.line = c.current_line();
          events.push_back(std::move(ev));
        }
        events.back().text.append(s, static_cast<std::size_t>(len));
      }

      static void XMLCALL
      on_namespace(void* user_data, const char* prefix, const char* uri) {
        self(user_data).doc_.bindings.push_back(
            {prefix != nullptr ? prefix : "", uri != nullptr ? uri : ""});
      }
    };

    class expat_reader final : public xml_reader {
      document doc_;
      std::size_t cursor_ = 0;

      const event&
      current() const {
        return doc_.events[cursor_ - 1];
      }

      const attribute_entry&
      attribute_at(std::size_t index) const {
        return doc_.attributes[current().first_attribute + index];
      }

    public:
      explicit expat_reader(document doc) : doc_(std::move(doc)) {}

      bool
      read() override {
        if (cursor_ >= doc_.events.size()) { return false; }
        ++cursor_;
        return true;
      }

      xml_node_type
      node_type() const override {
        return current().type;
      }

      const qname&
      name() const override {
        return current().name;
      }

      std::size_t
      attribute_count() const override {
        return current().attribute_count;
      }

      const qname&
      attribute_name(std::size_t index) const override {
        return attribute_at(index).name;
      }

      std::string_view
      attribute_value(std::size_t index) const override {
        return attribute_at(index).value;
      }

      std::string_view
      attribute_value(const qname& name) const override {
        for (std::size_t i = 0; i < current().attribute_count; ++i) {
          const auto& a = attribute_at(i);
          if (a.name == name) { return a.value; }
        }
        return {};
      }

      std::string_view
      text() const override {
        return current().text;
      }

      std::size_t
      depth() const override {
        return current().depth;
      }

      std::size_t
      line() const override {
        return current().line;
      }

      const std::vector<namespace_binding>&
      namespace_bindings() const override {
        return doc_.bindings;
      }
    };

  } // namespace

  std::unique_ptr<xml_reader>
  parse_xml(std::string_view text) {
    if (text.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
      throw std::length_error("bpg: XML input too large");
    }

    std::unique_ptr<XML_ParserStruct, decltype(&XML_ParserFree)> parser(
        XML_ParserCreateNS(nullptr, name_separator), &XML_ParserFree);
    if (!parser) { throw std::runtime_error("bpg: failed to create expat parser"); }

    document doc;
    collector events(parser.get(), doc);
    if (XML_Parse(parser.get(), text.data(), static_cast<int>(text.size()),
                  XML_TRUE) == XML_STATUS_ERROR) {
      throw xml_parse_error(
          static_cast<std::size_t>(XML_GetCurrentLineNumber(parser.get())),
          static_cast<std::size_t>(XML_GetCurrentColumnNumber(parser.get())) + 1,
          XML_ErrorString(XML_GetErrorCode(parser.get())));
    }
    if (doc.events.empty()) { throw xml_parse_error(1, 1, "no element found"); }

    return std::make_unique<expat_reader>(std::move(doc));
  }

} // namespace bpg
