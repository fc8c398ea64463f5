#pragma once

#include <bpg/diagnostics.hpp>
#include <bpg/id_allocator.hpp>
#include <bpg/model.hpp>

#include <string_view>

namespace bpg {

  enum class decode_policy {
    // Skip anomalous elements and report them as warnings.
    lenient,
    // Throw document_anomaly_error on the first anomaly.
    strict,
  };

  struct decode_options {
    decode_policy policy = decode_policy::lenient;
  };

  struct decode_result {
    bpg::graph graph;
    diagnostics warnings;
  };

  // Builds a graph from a BPMN 2.0 document. Every id in the document is
  // reported to ids, and ids are synthesized from it for elements that lack
  // one.
  //
  // Throws malformed_document_error when the text is not well-formed XML or
  // its root is not a BPMN definitions element; no partial graph is produced.
  decode_result
  decode(std::string_view text, id_allocator& ids, decode_options options = {});

} // namespace bpg
