#pragma once

#include <bpg/qname.hpp>

#include <string_view>

namespace bpg {

  // Push interface for serializing XML. Attributes and namespace declarations
  // belong to the most recent start_element and must come before any of its
  // content.
  class xml_writer {
  public:
    virtual ~xml_writer() = default;

    virtual void
    start_element(const qname& name) = 0;

    virtual void
    end_element() = 0;

    virtual void
    attribute(const qname& name, std::string_view value) = 0;

    virtual void
    characters(std::string_view text) = 0;

    virtual void
    namespace_declaration(std::string_view prefix, std::string_view uri) = 0;

    // True when a prefix (possibly empty) is bound to uri at the current
    // position, including bindings declared on the pending start tag.
    virtual bool
    namespace_in_scope(std::string_view uri) const = 0;

    // <name>text</name>
    void
    text_element(const qname& name, std::string_view text) {
      start_element(name);
      characters(text);
      end_element();
    }
  };

} // namespace bpg
