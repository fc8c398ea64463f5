#pragma once

#include <bpg/id_allocator.hpp>
#include <bpg/model.hpp>

#include <string>
#include <string_view>

namespace bpg {

  node*
  find_node(graph& g, std::string_view id);

  const node*
  find_node(const graph& g, std::string_view id);

  edge*
  find_edge(graph& g, std::string_view id);

  const edge*
  find_edge(const graph& g, std::string_view id);

  // The participant a node belongs to. A participant owns itself; top-level
  // nodes have none (empty string).
  std::string
  owning_participant(const node& n);

  // True when a connection between the two nodes crosses a participant
  // boundary and must therefore be a message flow.
  bool
  is_message_connection(const graph& g, std::string_view source,
                        std::string_view target);

  // Adds a node with minimal fields and returns its id. position is relative
  // to the participant when participant_id is non-empty. A participant gets
  // a fresh process; a lane requires a participant.
  //
  // Throws std::invalid_argument when participant_id names no participant.
  std::string
  add_node(graph& g, node_kind kind, std::string name, point position,
           std::string participant_id, id_allocator& ids);

  // Connects two existing nodes and returns the new edge id. The edge is a
  // message flow exactly when the endpoints belong to different participants.
  //
  // Throws std::invalid_argument for unknown endpoints or lane endpoints.
  std::string
  connect(graph& g, std::string_view source, std::string_view target,
          id_allocator& ids);

  // Removes the node and every edge touching it. A participant takes its
  // lanes and contained nodes with it; a removed lane leaves its members
  // without a lane. Returns false when no such node exists.
  bool
  remove_node(graph& g, std::string_view id);

  bool
  remove_edge(graph& g, std::string_view id);

  // Moves a node into a lane of its own participant, or out of any lane when
  // lane_id is empty.
  //
  // Throws std::invalid_argument when either id is unknown or the lane
  // belongs to another participant.
  void
  assign_lane(graph& g, std::string_view node_id, std::string_view lane_id);

  // Changes a flow node's kind. The source element name is forgotten so the
  // encoder names the element after the new kind.
  //
  // Throws std::invalid_argument for unknown ids and for conversions to or
  // from participants and lanes.
  void
  change_kind(graph& g, std::string_view id, node_kind kind);

  // The node's name, or the editor's default label for its kind.
  std::string
  display_name(const node& n);

} // namespace bpg
