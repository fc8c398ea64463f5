#pragma once

#include <bpg/any_element.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace bpg {

  class xml_writer;

  // Everything about a decoded element that the typed model does not
  // understand. Never interpreted, only replayed.
  struct preserved_content {
    // Local name the element had in the source document.
    std::string element_name;
    // Unmodeled attributes in document order.
    std::vector<any_attribute> attributes;
    // Every documentation child, attributes included, in document order.
    std::vector<any_element> documentation;
    // Unknown children that preceded the structural children...
    std::vector<any_element> leading;
    // ...and those that followed them.
    std::vector<any_element> trailing;

    bool
    empty() const {
      return element_name.empty() && attributes.empty() &&
             documentation.empty() && leading.empty() && trailing.empty();
    }

    bool
    has_attribute(const qname& name) const;

    bool
    operator==(const preserved_content&) const = default;
  };

  struct capture_rules {
    // Attribute local names (no namespace) carried by typed fields.
    std::vector<std::string_view> modeled_attributes;
    // BPMN child elements (model namespace) decoded elsewhere. documentation
    // is always structural and need not be listed.
    std::vector<std::string_view> structural_children;
    // Structural children outside the model namespace (BPMNDiagram).
    std::vector<qname> structural_qualified;
  };

  // Unknown children before the first structural child are leading, the rest
  // trailing. Without any structural child, extension-style children
  // (extensionElements, auditing, monitoring, categoryValueRef) lead and
  // everything else trails.
  preserved_content
  capture(const any_element& element, const capture_rules& rules);

  // Attribute namespaces without a binding are declared by the writer.
  void
  write_attributes(xml_writer& writer,
                   const std::vector<any_attribute>& attributes);

  inline void
  write_preserved_attributes(xml_writer& writer,
                             const preserved_content& content) {
    write_attributes(writer, content.attributes);
  }

  // Text of the first documentation entry, the one an editor changes.
  std::string
  first_documentation(const preserved_content& content);

  // Writes the current documentation text followed by every preserved
  // documentation entry after the first (the first is what current edits).
  // The first entry keeps its attributes, and is replayed verbatim while
  // its text is unchanged.
  void
  write_documentation(xml_writer& writer, const std::string& current,
                      const preserved_content& content);

  void
  write_fragments(xml_writer& writer, const std::vector<any_element>& fragments);

} // namespace bpg
