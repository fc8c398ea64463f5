#pragma once

#include <bpg/qname.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace bpg {

  class xml_reader;
  class xml_writer;

  struct any_attribute {
    qname name;
    std::string value;

    bool
    operator==(const any_attribute&) const = default;
  };

  // An element subtree kept verbatim: name, attributes in document order and
  // mixed children. The decoder walks the whole document in this form, and the
  // preservation layer stores unmodeled content as such trees.
  class any_element {
  public:
    using child = std::variant<std::string, any_element>;

  private:
    qname name_;
    std::vector<any_attribute> attributes_;
    std::vector<child> children_;
    // Source line of the start tag; 0 for synthesized elements. Not compared.
    std::size_t line_ = 0;

  public:
    any_element() = default;

    explicit any_element(qname name) : name_(std::move(name)) {}

    any_element(qname name, std::vector<any_attribute> attributes,
                std::vector<child> children)
        : name_(std::move(name)), attributes_(std::move(attributes)),
          children_(std::move(children)) {}

    // Consumes the subtree the reader is positioned on (a start_element),
    // through its matching end_element.
    //
    // Throws std::runtime_error when the events end before the element does.
    explicit any_element(xml_reader& reader);

    // Names in namespaces the writer has no binding for get one declared on
    // the spot by the writer.
    void
    write(xml_writer& writer) const;

    const qname&
    name() const {
      return name_;
    }

    std::size_t
    line() const {
      return line_;
    }

    const std::vector<any_attribute>&
    attributes() const {
      return attributes_;
    }

    const std::vector<child>&
    children() const {
      return children_;
    }

    std::vector<child>&
    children() {
      return children_;
    }

    std::optional<std::string_view>
    attribute(const qname& name) const;

    std::string
    attribute_or_empty(const qname& name) const;

    // Replaces the value in place, or appends the attribute.
    void
    set_attribute(const qname& name, std::string value);

    // Character data of this element and all descendants, in order.
    std::string
    text() const;

    std::vector<const any_element*>
    children_named(const qname& name) const;

    const any_element*
    first_child(const qname& name) const;

    // Drops whitespace-only text from every element that has element
    // children, i.e. the indentation between tags. Text-only elements keep
    // their content untouched.
    void
    strip_insignificant_whitespace();

    bool
    operator==(const any_element& other) const;
  };

  // Out of line: the variant's equality needs the complete type.
  inline bool
  any_element::operator==(const any_element& other) const {
    return name_ == other.name_ && attributes_ == other.attributes_ &&
           children_ == other.children_;
  }

} // namespace bpg
