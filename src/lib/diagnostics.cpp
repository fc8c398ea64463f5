#include <bpg/diagnostics.hpp>

namespace bpg {

  std::string_view
  to_string(diagnostic_kind kind) {
    switch (kind) {
      case diagnostic_kind::unresolved_reference:
        return "unresolved reference";
      case diagnostic_kind::duplicate_identifier:
        return "duplicate identifier";
      case diagnostic_kind::cross_boundary_flow:
        return "cross-boundary flow";
    }
    return "unknown";
  }

  malformed_document_error::malformed_document_error(std::size_t line,
                                                     std::size_t column,
                                                     std::string reason)
      : std::runtime_error("malformed BPMN document at line " +
                           std::to_string(line) + ", column " +
                           std::to_string(column) + ": " + reason),
        line_(line), column_(column), reason_(std::move(reason)) {}

  malformed_document_error::malformed_document_error(std::string reason)
      : std::runtime_error("malformed BPMN document: " + reason), line_(0),
        column_(0), reason_(std::move(reason)) {}

  document_anomaly_error::document_anomaly_error(diagnostic d)
      : std::runtime_error(std::string(to_string(d.kind)) + ": " + d.message),
        diagnostic_(std::move(d)) {}

} // namespace bpg
