#pragma once

#include <ostream>
#include <string>

namespace bpg {

  // Namespace-qualified XML name. Prefixes are not part of a name; a document's
  // prefix choices travel separately as namespace_binding values.
  struct qname {
    std::string namespace_uri;
    std::string local_name;

    bool
    operator==(const qname&) const = default;
  };

  // Clark notation, "{uri}local", for messages and test output.
  inline std::ostream&
  operator<<(std::ostream& os, const qname& q) {
    if (!q.namespace_uri.empty()) { os << '{' << q.namespace_uri << '}'; }
    return os << q.local_name;
  }

  // One xmlns declaration. An empty prefix is the default namespace.
  struct namespace_binding {
    std::string prefix;
    std::string uri;

    bool
    operator==(const namespace_binding&) const = default;
  };

} // namespace bpg
