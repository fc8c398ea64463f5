#include <bpg/graph.hpp>
#include <bpg/vocabulary.hpp>

#include <algorithm>
#include <stdexcept>
#include <unordered_set>

namespace bpg {

  namespace {

    template <typename Range>
    auto
    find_by_id(Range& items, std::string_view id) -> decltype(&*items.begin()) {
      auto it = std::find_if(items.begin(), items.end(),
                             [id](const auto& item) { return item.id == id; });
      return it != items.end() ? &*it : nullptr;
    }

    bool
    is_structural_kind(const node_kind& kind) {
      return std::holds_alternative<participant>(kind) ||
             std::holds_alternative<lane>(kind);
    }

  } // namespace

  node*
  find_node(graph& g, std::string_view id) {
    return find_by_id(g.nodes, id);
  }

  const node*
  find_node(const graph& g, std::string_view id) {
    return find_by_id(g.nodes, id);
  }

  edge*
  find_edge(graph& g, std::string_view id) {
    return find_by_id(g.edges, id);
  }

  const edge*
  find_edge(const graph& g, std::string_view id) {
    return find_by_id(g.edges, id);
  }

  std::string
  owning_participant(const node& n) {
    return n.holds<participant>() ? n.id : n.participant_id;
  }

  bool
  is_message_connection(const graph& g, std::string_view source,
                        std::string_view target) {
    const auto* s = find_node(g, source);
    const auto* t = find_node(g, target);
    if (s == nullptr || t == nullptr) { return false; }
    return owning_participant(*s) != owning_participant(*t);
  }

  std::string
  add_node(graph& g, node_kind kind, std::string name, point position,
           std::string participant_id, id_allocator& ids) {
    node n;
    n.name = std::move(name);
    n.position = position;

    if (std::holds_alternative<participant>(kind)) {
      // Pools are top-level and absolute.
      participant_id.clear();
      process_info process;
      process.id = ids.generate_id("process");
      std::get<participant>(kind).process_ref = process.id;
      n.process = std::move(process);
    } else if (!participant_id.empty()) {
      const auto* owner = find_node(g, participant_id);
      if (owner == nullptr || !owner->holds<participant>()) {
        throw std::invalid_argument("bpg: unknown participant '" +
                                    participant_id + "'");
      }
    } else if (std::holds_alternative<lane>(kind)) {
      throw std::invalid_argument("bpg: a lane requires a participant");
    }

    n.participant_id = std::move(participant_id);
    n.id = ids.generate_id(kind);
    n.kind = std::move(kind);
    g.nodes.push_back(std::move(n));
    return g.nodes.back().id;
  }

  std::string
  connect(graph& g, std::string_view source, std::string_view target,
          id_allocator& ids) {
    for (auto id : {source, target}) {
      const auto* n = find_node(g, id);
      if (n == nullptr) {
        throw std::invalid_argument("bpg: unknown node '" + std::string(id) +
                                    "'");
      }
      if (n->holds<lane>()) {
        throw std::invalid_argument("bpg: lane '" + std::string(id) +
                                    "' cannot be connected");
      }
    }

    edge e;
    e.is_message_flow = is_message_connection(g, source, target);
    e.id = ids.generate_id(e.is_message_flow ? "messageFlow" : "sequenceFlow");
    e.source = std::string(source);
    e.target = std::string(target);
    g.edges.push_back(std::move(e));
    return g.edges.back().id;
  }

  bool
  remove_node(graph& g, std::string_view id) {
    const auto* target = find_node(g, id);
    if (target == nullptr) { return false; }

    std::unordered_set<std::string> removed{target->id};
    if (target->holds<participant>()) {
      for (const auto& n : g.nodes) {
        if (n.participant_id == target->id) { removed.insert(n.id); }
      }
    } else if (target->holds<lane>()) {
      for (auto& n : g.nodes) {
        if (n.lane_id == id) { n.lane_id.clear(); }
      }
    }

    std::erase_if(g.nodes,
                  [&](const node& n) { return removed.count(n.id) != 0; });
    std::erase_if(g.edges, [&](const edge& e) {
      return removed.count(e.source) != 0 || removed.count(e.target) != 0;
    });
    return true;
  }

  bool
  remove_edge(graph& g, std::string_view id) {
    return std::erase_if(g.edges,
                         [id](const edge& e) { return e.id == id; }) != 0;
  }

  void
  assign_lane(graph& g, std::string_view node_id, std::string_view lane_id) {
    auto* n = find_node(g, node_id);
    if (n == nullptr || is_structural_kind(n->kind)) {
      throw std::invalid_argument("bpg: unknown flow node '" +
                                  std::string(node_id) + "'");
    }
    if (lane_id.empty()) {
      n->lane_id.clear();
      return;
    }
    const auto* l = find_node(g, lane_id);
    if (l == nullptr || !l->holds<lane>()) {
      throw std::invalid_argument("bpg: unknown lane '" + std::string(lane_id) +
                                  "'");
    }
    if (l->participant_id != n->participant_id) {
      throw std::invalid_argument("bpg: lane '" + l->id +
                                  "' belongs to another participant");
    }
    n->lane_id = l->id;
  }

  void
  change_kind(graph& g, std::string_view id, node_kind kind) {
    auto* n = find_node(g, id);
    if (n == nullptr) {
      throw std::invalid_argument("bpg: unknown node '" + std::string(id) +
                                  "'");
    }
    if (is_structural_kind(n->kind) || is_structural_kind(kind)) {
      throw std::invalid_argument(
          "bpg: participants and lanes cannot change kind");
    }
    n->kind = std::move(kind);
    n->preserved.element_name.clear();
  }

  std::string
  display_name(const node& n) {
    return n.name.empty() ? std::string(default_label(n.kind)) : n.name;
  }

} // namespace bpg
