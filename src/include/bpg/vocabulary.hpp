#pragma once

#include <bpg/model.hpp>
#include <bpg/qname.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bpg {

  namespace ns {

    inline const std::string model =
        "http://www.omg.org/spec/BPMN/20100524/MODEL";
    inline const std::string bpmndi = "http://www.omg.org/spec/BPMN/20100524/DI";
    inline const std::string dc = "http://www.omg.org/spec/DD/20100524/DC";
    inline const std::string di = "http://www.omg.org/spec/DD/20100524/DI";
    inline const std::string xsi = "http://www.w3.org/2001/XMLSchema-instance";
    inline const std::string bioc = "http://bpmn.io/schema/bpmn/biocolor/1.0";
    inline const std::string color =
        "http://www.omg.org/spec/BPMN/non-normative/color/1.0";

  } // namespace ns

  // BPMN semantic elements are accepted with or without the model namespace.
  bool
  is_model_element(const qname& name, std::string_view local_name);

  // Diagram elements are matched by local name within their namespace, or
  // without one.
  bool
  is_element_in(const qname& name, const std::string& namespace_uri,
                std::string_view local_name);

  inline qname
  model_name(std::string local_name) {
    return qname{ns::model, std::move(local_name)};
  }

  // Local name of the BPMN element a node kind encodes to.
  std::string_view
  element_name(const node_kind& kind);

  // Node kind decoded from a process child element; nullopt for elements that
  // are not nodes.
  std::optional<node_kind>
  kind_for_element(std::string_view local_name);

  // Local names of every process child that decodes to a node.
  const std::vector<std::string_view>&
  process_node_names();

  // True when both kinds are the same alternative (task vs. task, gateway vs.
  // gateway) regardless of sub-kind.
  bool
  same_family(const node_kind& a, const node_kind& b);

  // Events, activities and gateways: the kinds that carry incoming/outgoing.
  bool
  is_flow_node(const node_kind& kind);

  // Label an editor shows for an unnamed node.
  std::string_view
  default_label(const node_kind& kind);

} // namespace bpg
