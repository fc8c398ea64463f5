#pragma once

#include <bpg/any_element.hpp>
#include <bpg/geometry.hpp>
#include <bpg/preservation.hpp>
#include <bpg/xml_reader.hpp>

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace bpg {

  template <typename>
  inline constexpr bool always_false_v = false;

  enum class task_kind {
    plain,
    service,
    user,
    script,
    business_rule,
    send,
    receive,
    manual,
  };

  enum class gateway_kind { exclusive, inclusive, parallel, event_based, complex };

  enum class event_direction { catching, throwing };

  // ---------------------------------------------------------------------------
  // Node kinds
  // ---------------------------------------------------------------------------

  struct start_event {
    bool
    operator==(const start_event&) const = default;
  };

  struct end_event {
    bool
    operator==(const end_event&) const = default;
  };

  struct intermediate_event {
    event_direction direction = event_direction::catching;

    bool
    operator==(const intermediate_event&) const = default;
  };

  struct boundary_event {
    bool
    operator==(const boundary_event&) const = default;
  };

  struct task {
    task_kind kind = task_kind::plain;

    bool
    operator==(const task&) const = default;
  };

  struct gateway {
    gateway_kind kind = gateway_kind::exclusive;

    bool
    operator==(const gateway&) const = default;
  };

  struct sub_process {
    bool
    operator==(const sub_process&) const = default;
  };

  struct call_activity {
    bool
    operator==(const call_activity&) const = default;
  };

  // reference: dataObjectReference rather than dataObject.
  struct data_object {
    bool reference = true;

    bool
    operator==(const data_object&) const = default;
  };

  // reference: dataStoreReference rather than dataStore.
  struct data_store {
    bool reference = true;

    bool
    operator==(const data_store&) const = default;
  };

  struct group {
    bool
    operator==(const group&) const = default;
  };

  struct text_annotation {
    bool
    operator==(const text_annotation&) const = default;
  };

  struct participant {
    std::string process_ref;

    bool
    operator==(const participant&) const = default;
  };

  struct lane {
    bool
    operator==(const lane&) const = default;
  };

  // Closed set of node kinds. Every std::visit over it ends in a
  // static_assert, so adding an alternative breaks the build until the
  // decoder, encoder and layout tables handle it.
  using node_kind =
      std::variant<start_event, end_event, intermediate_event, boundary_event,
                   task, gateway, sub_process, call_activity, data_object,
                   data_store, group, text_annotation, participant, lane>;

  // ---------------------------------------------------------------------------
  // Styling and layout records
  // ---------------------------------------------------------------------------

  enum class color_scheme {
    // BPMNExtensionElements with fillColor/strokeColor red/green/blue.
    structured,
    // bioc:fill / bioc:stroke attributes.
    bioc,
    // color:background-color / color:border-color attributes.
    omg_color,
  };

  struct node_style {
    std::string fill;
    std::string stroke;
    color_scheme scheme = color_scheme::structured;

    bool
    empty() const {
      return fill.empty() && stroke.empty();
    }

    bool
    operator==(const node_style&) const = default;
  };

  struct shape_layout {
    std::string shape_id;
    // Absolute bounds as they appeared in the document.
    bounds absolute_bounds;
    std::optional<bounds> label_bounds;
    // Unmodeled BPMNShape attributes (isExpanded, isHorizontal, ...).
    std::vector<any_attribute> attributes;
    // The structured color block, kept whole so unknown entries survive.
    std::optional<any_element> extension;
    // Other unknown BPMNShape children.
    std::vector<any_element> fragments;

    bool
    operator==(const shape_layout&) const = default;
  };

  struct edge_layout {
    std::string shape_id;
    std::vector<point> waypoints;
    std::optional<bounds> label_bounds;
    std::vector<any_attribute> attributes;
    std::vector<any_element> fragments;

    bool
    operator==(const edge_layout&) const = default;
  };

  // The process element a participant references, or the implicit process
  // when the document has no participants.
  struct process_info {
    std::string id;
    std::string name;
    std::string lane_set_id;
    preserved_content preserved;

    bool
    operator==(const process_info&) const = default;
  };

  // ---------------------------------------------------------------------------
  // Graph
  // ---------------------------------------------------------------------------

  struct node {
    std::string id;
    std::string name;
    node_kind kind;
    // Relative to the owning participant's origin when participant_id is set,
    // document-absolute otherwise. Participants are always absolute.
    point position;
    std::optional<dimensions> size;
    // Owning participant; empty for participants and top-level nodes.
    std::string participant_id;
    std::string lane_id;
    node_style style;
    // Editable documentation; mirrors the first preserved entry after decode.
    std::string documentation;
    preserved_content preserved;
    // Set on participants and on the node carrying the implicit process.
    std::optional<process_info> process;
    std::optional<shape_layout> layout;

    template <typename T>
    bool
    holds() const {
      return std::holds_alternative<T>(kind);
    }

    bool
    operator==(const node&) const = default;
  };

  struct edge {
    std::string id;
    std::string source;
    std::string target;
    std::string name;
    // Decided when the edge is created; the encoder trusts it.
    bool is_message_flow = false;
    std::string documentation;
    preserved_content preserved;
    std::optional<edge_layout> layout;

    bool
    operator==(const edge&) const = default;
  };

  // Document-level content outside any node or edge.
  struct definitions_info {
    std::string id;
    std::vector<namespace_binding> namespaces;
    preserved_content preserved;
    std::string collaboration_id;
    preserved_content collaboration;
    std::string diagram_id;
    std::string plane_id;
    // Unknown BPMNDiagram children (label styles, ...).
    std::vector<any_element> diagram_fragments;
    // Unknown BPMNPlane children other than shapes and edges.
    std::vector<any_element> plane_fragments;

    bool
    operator==(const definitions_info&) const = default;
  };

  struct graph {
    definitions_info definitions;
    std::vector<node> nodes;
    std::vector<edge> edges;
  };

} // namespace bpg
