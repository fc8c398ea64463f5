#pragma once

#include <bpg/diagnostics.hpp>
#include <bpg/id_allocator.hpp>
#include <bpg/model.hpp>

#include <string>

namespace bpg {

  struct encode_options {
    // Spaces per nesting level; 0 writes the document on one line.
    int indent = 2;
    bool xml_declaration = true;
  };

  struct encode_result {
    std::string document;
    diagnostics warnings;
  };

  // Writes the graph as a BPMN 2.0 document with a complete diagram section.
  // Preserved content is replayed verbatim; missing structure (processes,
  // collaboration, shapes, waypoints, labels) is synthesized, drawing any new
  // ids from ids. Edges with a missing endpoint are skipped with a warning.
  encode_result
  encode(const graph& g, id_allocator& ids, encode_options options = {});

} // namespace bpg
