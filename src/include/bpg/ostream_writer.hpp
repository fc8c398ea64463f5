#pragma once

#include <bpg/xml_writer.hpp>

#include <memory>
#include <ostream>
#include <vector>

namespace bpg {

  struct writer_options {
    // Spaces per nesting level; 0 writes everything on one line. Elements
    // holding text are never indented inside.
    int indent = 0;
    bool xml_declaration = false;
    // Prefixes to use when the writer has to declare a namespace itself. A
    // hint is skipped while its prefix is bound to something else.
    std::vector<namespace_binding> prefix_hints;
  };

  // Writes to a stream, closing start tags lazily so attributes and
  // declarations can follow start_element().
  //
  // Element and attribute names whose namespace has no usable binding at the
  // point the start tag is written get a declaration added to that tag: the
  // hinted prefix if there is one, otherwise ns0, ns1, ... An element in no
  // namespace under a default namespace gets xmlns="".
  class ostream_writer : public xml_writer {
  public:
    explicit ostream_writer(std::ostream& os, writer_options options = {});
    ~ostream_writer() override;

    ostream_writer(const ostream_writer&) = delete;
    ostream_writer&
    operator=(const ostream_writer&) = delete;
    ostream_writer(ostream_writer&&) noexcept;
    ostream_writer&
    operator=(ostream_writer&&) noexcept;

    void
    start_element(const qname& name) override;

    void
    end_element() override;

    void
    attribute(const qname& name, std::string_view value) override;

    void
    characters(std::string_view text) override;

    void
    namespace_declaration(std::string_view prefix,
                          std::string_view uri) override;

    bool
    namespace_in_scope(std::string_view uri) const override;

  private:
    struct impl;
    std::unique_ptr<impl> impl_;
  };

} // namespace bpg
