#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace bpg {

  enum class diagnostic_kind {
    // A flow names a source or target that does not exist.
    unresolved_reference,
    // An id, shape or edge shape appears more than once; the first wins.
    duplicate_identifier,
    // A flow's classification contradicts participant ownership.
    cross_boundary_flow,
  };

  std::string_view
  to_string(diagnostic_kind kind);

  struct diagnostic {
    diagnostic_kind kind;
    std::string element_id;
    std::string message;
    // Source line of the offending element; 0 when unknown.
    std::size_t line = 0;

    bool
    operator==(const diagnostic&) const = default;
  };

  using diagnostics = std::vector<diagnostic>;

  // The input is not well-formed XML or is not a BPMN definitions document.
  class malformed_document_error : public std::runtime_error {
    std::size_t line_;
    std::size_t column_;
    std::string reason_;

  public:
    malformed_document_error(std::size_t line, std::size_t column,
                             std::string reason);

    explicit malformed_document_error(std::string reason);

    // Zero when the error is not tied to a source position.
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

  // Thrown by a strict decode for the first anomaly a lenient decode would
  // have skipped with a warning.
  class document_anomaly_error : public std::runtime_error {
    diagnostic diagnostic_;

  public:
    explicit document_anomaly_error(diagnostic d);

    const bpg::diagnostic&
    get_diagnostic() const {
      return diagnostic_;
    }
  };

} // namespace bpg
