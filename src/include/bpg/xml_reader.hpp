#pragma once

#include <bpg/qname.hpp>

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace bpg {

  enum class xml_node_type {
    start_element,
    end_element,
    characters,
  };

  // The text is not well-formed XML. Positions are 1-based.
  class xml_parse_error : public std::runtime_error {
    std::size_t line_;
    std::size_t column_;
    std::string reason_;

  public:
    xml_parse_error(std::size_t line, std::size_t column, std::string reason)
        : std::runtime_error("XML parse error at line " + std::to_string(line) +
                             ", column " + std::to_string(column) + ": " +
                             reason),
          line_(line), column_(column), reason_(std::move(reason)) {}

    std::size_t
    line() const {
      return line_;
    }

    std::size_t
    column() const {
      return column_;
    }

    const std::string&
    reason() const {
      return reason_;
    }
  };

  // Pull interface over a parsed document. read() advances to the next event
  // and returns false past the last one; the accessors describe the current
  // event. Adjacent character data arrives as one characters event.
  class xml_reader {
  public:
    virtual ~xml_reader() = default;

    virtual bool
    read() = 0;

    virtual xml_node_type
    node_type() const = 0;

    // Element name of a start_element or end_element event.
    virtual const qname&
    name() const = 0;

    virtual std::size_t
    attribute_count() const = 0;

    virtual const qname&
    attribute_name(std::size_t index) const = 0;

    virtual std::string_view
    attribute_value(std::size_t index) const = 0;

    // Empty when the current element has no such attribute.
    virtual std::string_view
    attribute_value(const qname& name) const = 0;

    virtual std::string_view
    text() const = 0;

    // 1 for the root element; the depth of the enclosing element for text.
    virtual std::size_t
    depth() const = 0;

    // Source line the current event starts on; 0 when unknown.
    virtual std::size_t
    line() const = 0;

    // Every xmlns declaration in the document, in document order.
    virtual const std::vector<namespace_binding>&
    namespace_bindings() const = 0;
  };

  // Parses the whole text with expat before returning, so the reader never
  // fails halfway through a document.
  //
  // Throws xml_parse_error when the text is not well-formed or empty.
  std::unique_ptr<xml_reader>
  parse_xml(std::string_view text);

} // namespace bpg
