#include <bpg/color.hpp>
#include <bpg/encoder.hpp>
#include <bpg/graph.hpp>
#include <bpg/layout.hpp>
#include <bpg/ostream_writer.hpp>
#include <bpg/vocabulary.hpp>

#include <sstream>
#include <unordered_map>
#include <unordered_set>

namespace bpg {

  namespace {

    const qname id_attr{"", "id"};
    const qname name_attr{"", "name"};
    const std::string default_target_namespace = "http://bpmn.io/schema/bpmn";

    qname
    di_name(const char* local_name) {
      return qname{ns::bpmndi, local_name};
    }

    void
    write_bounds(xml_writer& w, const bounds& b) {
      w.start_element(qname{ns::dc, "Bounds"});
      w.attribute({"", "x"}, format_coordinate(b.x));
      w.attribute({"", "y"}, format_coordinate(b.y));
      w.attribute({"", "width"}, format_coordinate(b.width));
      w.attribute({"", "height"}, format_coordinate(b.height));
      w.end_element();
    }

    void
    write_label(xml_writer& w, const bounds& b) {
      w.start_element(di_name("BPMNLabel"));
      write_bounds(w, b);
      w.end_element();
    }

    bool
    has_plain_attribute(const std::vector<any_attribute>& attributes,
                        std::string_view local_name) {
      for (const auto& a : attributes) {
        if (a.name.namespace_uri.empty() && a.name.local_name == local_name) {
          return true;
        }
      }
      return false;
    }

    // Sets one fillColor/strokeColor entry of a structured color block.
    void
    set_structured_channel(any_element& extension, const char* local_name,
                           const std::string& value) {
      auto color = parse_color(value);
      if (!color) { return; }
      any_element* target = nullptr;
      for (auto& child : extension.children()) {
        auto* e = std::get_if<any_element>(&child);
        if (e != nullptr && is_element_in(e->name(), ns::bpmndi, local_name)) {
          target = e;
          break;
        }
      }
      if (target == nullptr) {
        extension.children().emplace_back(any_element(di_name(local_name)));
        target = &std::get<any_element>(extension.children().back());
      }
      target->set_attribute({"", "red"}, std::to_string(color->red));
      target->set_attribute({"", "green"}, std::to_string(color->green));
      target->set_attribute({"", "blue"}, std::to_string(color->blue));
    }

    // A group of nodes encoded into one process element.
    struct process_group {
      // Empty for the process holding nodes outside any participant.
      std::string participant_id;
      std::string process_id;
      const process_info* info = nullptr;
      std::vector<const node*> lanes;
      std::vector<const node*> flow_nodes;
      std::vector<const edge*> flows;
    };

    class encoder {
      const graph& g_;
      id_allocator& ids_;
      encode_options options_;
      diagnostics warnings_;

      std::unordered_map<std::string, const node*> by_id_;
      std::vector<const node*> participants_;
      std::vector<const edge*> sequence_flows_;
      std::vector<const edge*> message_flows_;
      std::vector<process_group> groups_;
      // participant id -> index into groups_
      std::unordered_map<std::string, std::size_t> group_of_;
      std::string collaboration_id_;

    public:
      encoder(const graph& g, id_allocator& ids, encode_options options)
          : g_(g), ids_(ids), options_(options) {}

      encode_result
      run() {
        index();

        std::ostringstream os;
        {
          ostream_writer w(os, {options_.indent, options_.xml_declaration,
                                g_.definitions.namespaces});
          write_definitions(w);
        }
        return {os.str(), std::move(warnings_)};
      }

    private:
      // -----------------------------------------------------------------------
      // Partitioning
      // -----------------------------------------------------------------------

      // The participant whose process holds the node; empty for top level.
      std::string
      group_key(const node& n) const {
        auto owner = owning_participant(n);
        if (owner.empty()) { return owner; }
        auto it = by_id_.find(owner);
        if (it == by_id_.end() || !it->second->holds<participant>()) {
          return {};
        }
        return owner;
      }

      std::optional<point>
      participant_origin(const node& n) const {
        if (n.holds<participant>() || n.participant_id.empty()) {
          return std::nullopt;
        }
        auto it = by_id_.find(n.participant_id);
        if (it == by_id_.end() || !it->second->holds<participant>()) {
          return std::nullopt;
        }
        return it->second->position;
      }

      process_group&
      group_for(const std::string& key) {
        if (auto it = group_of_.find(key); it != group_of_.end()) {
          return groups_[it->second];
        }
        group_of_.emplace(key, groups_.size());
        groups_.push_back({key, {}, nullptr, {}, {}, {}});
        return groups_.back();
      }

      void
      index() {
        for (const auto& n : g_.nodes) {
          by_id_.emplace(n.id, &n);
        }

        for (const auto& n : g_.nodes) {
          if (!n.holds<participant>()) { continue; }
          participants_.push_back(&n);
          // Black-box pools without process content stay without a process.
          if (n.process) { group_for(n.id); }
        }

        for (const auto& n : g_.nodes) {
          if (n.holds<participant>()) { continue; }
          auto& group = group_for(group_key(n));
          if (n.holds<lane>()) {
            group.lanes.push_back(&n);
          } else {
            group.flow_nodes.push_back(&n);
          }
        }

        for (const auto& e : g_.edges) {
          auto source = by_id_.find(e.source);
          auto target = by_id_.find(e.target);
          if (source == by_id_.end() || target == by_id_.end()) {
            const auto& missing =
                source == by_id_.end() ? e.source : e.target;
            warnings_.push_back({diagnostic_kind::unresolved_reference, e.id,
                                 "flow '" + e.id + "' references unknown node '" +
                                     missing + "'; not encoded"});
            continue;
          }
          if (e.is_message_flow) {
            message_flows_.push_back(&e);
          } else {
            sequence_flows_.push_back(&e);
            group_for(group_key(*source->second)).flows.push_back(&e);
          }
        }

        // An empty diagram still gets a process to hold its plane.
        if (participants_.empty() && groups_.empty()) { group_for(""); }

        for (auto& group : groups_) {
          if (!group.participant_id.empty()) {
            const auto& owner = *by_id_.at(group.participant_id);
            group.info = owner.process ? &*owner.process : nullptr;
            const auto& ref = std::get<participant>(owner.kind).process_ref;
            if (group.info != nullptr && !group.info->id.empty()) {
              group.process_id = group.info->id;
            } else if (!ref.empty()) {
              group.process_id = ref;
            }
          } else {
            for (const auto* n : group.flow_nodes) {
              if (n->process) {
                group.info = &*n->process;
                break;
              }
            }
            if (group.info != nullptr) { group.process_id = group.info->id; }
          }
          if (group.process_id.empty()) {
            group.process_id = ids_.generate_id("process");
          }
        }

        if (!participants_.empty()) {
          collaboration_id_ = g_.definitions.collaboration_id.empty()
                                  ? ids_.generate_id("collaboration")
                                  : g_.definitions.collaboration_id;
        }
      }

      // -----------------------------------------------------------------------
      // Semantic section
      // -----------------------------------------------------------------------

      bool
      uses_scheme(color_scheme scheme) const {
        for (const auto& n : g_.nodes) {
          if (!n.style.empty() && n.style.scheme == scheme) { return true; }
        }
        return false;
      }

      void
      declare_namespaces(xml_writer& w) {
        std::unordered_set<std::string> prefixes;
        for (const auto& b : g_.definitions.namespaces) {
          if (b.prefix == "xml") { continue; }
          w.namespace_declaration(b.prefix, b.uri);
          prefixes.insert(b.prefix);
        }

        std::vector<std::pair<std::string, std::string>> required = {
            {"", ns::model}, {"bpmndi", ns::bpmndi}, {"dc", ns::dc},
            {"di", ns::di}};
        if (g_.definitions.namespaces.empty()) {
          required.emplace_back("xsi", ns::xsi);
          required.emplace_back("bioc", ns::bioc);
          required.emplace_back("color", ns::color);
        } else {
          if (uses_scheme(color_scheme::bioc)) {
            required.emplace_back("bioc", ns::bioc);
          }
          if (uses_scheme(color_scheme::omg_color)) {
            required.emplace_back("color", ns::color);
          }
        }

        for (auto& [prefix, uri] : required) {
          if (w.namespace_in_scope(uri)) { continue; }
          if (prefix.empty() && prefixes.count(prefix)) { prefix = "bpmn"; }
          while (prefixes.count(prefix)) {
            prefix += '_';
          }
          w.namespace_declaration(prefix, uri);
          prefixes.insert(prefix);
        }
      }

      void
      write_definitions(xml_writer& w) {
        const auto& defs = g_.definitions;
        w.start_element(model_name("definitions"));
        declare_namespaces(w);
        w.attribute(id_attr, defs.id.empty() ? "Definitions_1" : defs.id);
        write_preserved_attributes(w, defs.preserved);
        if (!defs.preserved.has_attribute({"", "targetNamespace"})) {
          w.attribute({"", "targetNamespace"}, default_target_namespace);
        }

        write_documentation(w, first_documentation(defs.preserved),
                            defs.preserved);
        write_fragments(w, defs.preserved.leading);
        if (!participants_.empty()) { write_collaboration(w); }
        for (const auto& group : groups_) {
          write_process(w, group);
        }
        write_fragments(w, defs.preserved.trailing);
        write_diagram(w);
        w.end_element();
      }

      void
      write_collaboration(xml_writer& w) {
        const auto& preserved = g_.definitions.collaboration;
        w.start_element(model_name("collaboration"));
        w.attribute(id_attr, collaboration_id_);
        write_preserved_attributes(w, preserved);
        write_documentation(w, first_documentation(preserved),
                            preserved);
        write_fragments(w, preserved.leading);

        for (const auto* p : participants_) {
          write_participant(w, *p);
        }
        for (const auto* e : message_flows_) {
          write_flow(w, *e, "messageFlow");
        }

        write_fragments(w, preserved.trailing);
        w.end_element();
      }

      void
      write_participant(xml_writer& w, const node& p) {
        w.start_element(model_name("participant"));
        w.attribute(id_attr, p.id);
        if (!p.name.empty()) { w.attribute(name_attr, p.name); }
        std::string process_ref = std::get<participant>(p.kind).process_ref;
        if (auto it = group_of_.find(p.id); it != group_of_.end()) {
          process_ref = groups_[it->second].process_id;
        }
        if (!process_ref.empty()) {
          w.attribute({"", "processRef"}, process_ref);
        }
        write_preserved_attributes(w, p.preserved);
        write_documentation(w, p.documentation, p.preserved);
        write_fragments(w, p.preserved.leading);
        write_fragments(w, p.preserved.trailing);
        w.end_element();
      }

      void
      write_flow(xml_writer& w, const edge& e, const char* element) {
        w.start_element(model_name(element));
        w.attribute(id_attr, e.id);
        if (!e.name.empty()) { w.attribute(name_attr, e.name); }
        w.attribute({"", "sourceRef"}, e.source);
        w.attribute({"", "targetRef"}, e.target);
        write_preserved_attributes(w, e.preserved);
        write_documentation(w, e.documentation, e.preserved);
        write_fragments(w, e.preserved.leading);
        write_fragments(w, e.preserved.trailing);
        w.end_element();
      }

      void
      write_process(xml_writer& w, const process_group& group) {
        static const preserved_content none;
        const auto& preserved = group.info ? group.info->preserved : none;

        w.start_element(model_name("process"));
        w.attribute(id_attr, group.process_id);
        if (group.info != nullptr && !group.info->name.empty()) {
          w.attribute(name_attr, group.info->name);
        }
        write_preserved_attributes(w, preserved);
        if (group.info == nullptr) {
          w.attribute({"", "isExecutable"}, "false");
        }
        write_documentation(w, first_documentation(preserved),
                            preserved);
        write_fragments(w, preserved.leading);

        if (!group.lanes.empty()) {
          w.start_element(model_name("laneSet"));
          w.attribute(id_attr, group.info != nullptr &&
                                       !group.info->lane_set_id.empty()
                                   ? group.info->lane_set_id
                                   : ids_.generate_id("laneSet"));
          for (const auto* l : group.lanes) {
            write_lane(w, *l, group);
          }
          w.end_element();
        }

        for (const auto* n : group.flow_nodes) {
          write_flow_node(w, *n);
        }
        for (const auto* e : group.flows) {
          write_flow(w, *e, "sequenceFlow");
        }

        write_fragments(w, preserved.trailing);
        w.end_element();
      }

      void
      write_lane(xml_writer& w, const node& l, const process_group& group) {
        w.start_element(model_name("lane"));
        w.attribute(id_attr, l.id);
        if (!l.name.empty()) { w.attribute(name_attr, l.name); }
        write_preserved_attributes(w, l.preserved);
        write_documentation(w, l.documentation, l.preserved);
        write_fragments(w, l.preserved.leading);
        for (const auto* n : group.flow_nodes) {
          if (n->lane_id != l.id) { continue; }
          w.text_element(model_name("flowNodeRef"), n->id);
        }
        write_fragments(w, l.preserved.trailing);
        w.end_element();
      }

      std::string
      flow_node_element(const node& n) const {
        const auto& original = n.preserved.element_name;
        if (!original.empty()) {
          auto kind = kind_for_element(original);
          if (kind && same_family(*kind, n.kind)) { return original; }
        }
        return std::string(element_name(n.kind));
      }

      void
      write_flow_node(xml_writer& w, const node& n) {
        std::string synthesized_object;
        const auto element = flow_node_element(n);

        w.start_element(model_name(element));
        w.attribute(id_attr, n.id);
        if (!n.name.empty() && !n.holds<text_annotation>()) {
          w.attribute(name_attr, n.name);
        }
        if (element == "dataObjectReference" &&
            !n.preserved.has_attribute({"", "dataObjectRef"})) {
          synthesized_object = "DataObject_" + n.id;
          if (by_id_.count(synthesized_object) ||
              ids_.is_taken(synthesized_object)) {
            synthesized_object = ids_.generate_id("dataObject");
          }
          ids_.observe(synthesized_object);
          w.attribute({"", "dataObjectRef"}, synthesized_object);
        }
        write_preserved_attributes(w, n.preserved);
        write_documentation(w, n.documentation, n.preserved);
        write_fragments(w, n.preserved.leading);

        if (n.holds<text_annotation>()) {
          w.text_element(model_name("text"), n.name);
        }

        if (is_flow_node(n.kind)) {
          for (const auto* e : sequence_flows_) {
            if (e->target != n.id) { continue; }
            w.text_element(model_name("incoming"), e->id);
          }
          for (const auto* e : sequence_flows_) {
            if (e->source != n.id) { continue; }
            w.text_element(model_name("outgoing"), e->id);
          }
        }

        write_fragments(w, n.preserved.trailing);
        w.end_element();

        if (!synthesized_object.empty()) {
          w.start_element(model_name("dataObject"));
          w.attribute(id_attr, synthesized_object);
          w.end_element();
        }
      }

      // -----------------------------------------------------------------------
      // Diagram section
      // -----------------------------------------------------------------------

      void
      write_diagram(xml_writer& w) {
        const auto& defs = g_.definitions;
        w.start_element(di_name("BPMNDiagram"));
        w.attribute(id_attr,
                    defs.diagram_id.empty() ? "BPMNDiagram_1" : defs.diagram_id);
        w.start_element(di_name("BPMNPlane"));
        w.attribute(id_attr,
                    defs.plane_id.empty() ? "BPMNPlane_1" : defs.plane_id);
        w.attribute({"", "bpmnElement"}, participants_.empty() && !groups_.empty()
                                             ? groups_.front().process_id
                                             : collaboration_id_);

        // Pools first, then lanes, so contained shapes draw on top.
        for (const auto* p : participants_) {
          write_shape(w, *p);
        }
        for (const auto& n : g_.nodes) {
          if (n.holds<lane>()) { write_shape(w, n); }
        }
        for (const auto& n : g_.nodes) {
          if (n.holds<participant>() || n.holds<lane>()) { continue; }
          // Plain data objects have no diagram presence of their own.
          const auto* object = std::get_if<data_object>(&n.kind);
          if (object != nullptr && !object->reference && !n.layout) { continue; }
          write_shape(w, n);
        }
        for (const auto& e : g_.edges) {
          if (by_id_.count(e.source) && by_id_.count(e.target)) {
            write_edge(w, e);
          }
        }

        write_fragments(w, defs.plane_fragments);
        w.end_element();
        write_fragments(w, defs.diagram_fragments);
        w.end_element();
      }

      bounds
      bounds_of(const node& n) const {
        return shape_bounds(n, participant_origin(n));
      }

      void
      write_shape(xml_writer& w, const node& n) {
        const auto* layout = n.layout ? &*n.layout : nullptr;
        auto shape = bounds_of(n);

        w.start_element(di_name("BPMNShape"));
        w.attribute(id_attr, layout != nullptr && !layout->shape_id.empty()
                                 ? layout->shape_id
                                 : n.id + "_di");
        w.attribute({"", "bpmnElement"}, n.id);
        if (layout != nullptr) { write_attributes(w, layout->attributes); }
        if ((n.holds<participant>() || n.holds<lane>()) &&
            (layout == nullptr ||
             !has_plain_attribute(layout->attributes, "isHorizontal"))) {
          w.attribute({"", "isHorizontal"}, "true");
        }
        write_color_attributes(w, n.style);

        write_bounds(w, shape);
        write_color_extension(w, n.style,
                              layout != nullptr ? layout->extension
                                                : std::optional<any_element>());
        if (layout != nullptr && layout->label_bounds) {
          write_label(w, *layout->label_bounds);
        } else if (has_external_label(n.kind) && !n.name.empty()) {
          write_label(w, label_below(shape));
        }
        if (layout != nullptr) { write_fragments(w, layout->fragments); }
        w.end_element();
      }

      static void
      write_color_attributes(xml_writer& w, const node_style& style) {
        if (style.scheme == color_scheme::bioc) {
          if (!style.fill.empty()) { w.attribute({ns::bioc, "fill"}, style.fill); }
          if (!style.stroke.empty()) {
            w.attribute({ns::bioc, "stroke"}, style.stroke);
          }
        } else if (style.scheme == color_scheme::omg_color) {
          if (!style.fill.empty()) {
            w.attribute({ns::color, "background-color"}, style.fill);
          }
          if (!style.stroke.empty()) {
            w.attribute({ns::color, "border-color"}, style.stroke);
          }
        }
      }

      static void
      write_color_extension(xml_writer& w, const node_style& style,
                            std::optional<any_element> extension) {
        if (style.scheme == color_scheme::structured && !style.empty()) {
          if (!extension) {
            extension.emplace(di_name("BPMNExtensionElements"));
          }
          if (!style.fill.empty()) {
            set_structured_channel(*extension, "fillColor", style.fill);
          }
          if (!style.stroke.empty()) {
            set_structured_channel(*extension, "strokeColor", style.stroke);
          }
        }
        if (extension) { extension->write(w); }
      }

      void
      write_edge(xml_writer& w, const edge& e) {
        const auto* layout = e.layout ? &*e.layout : nullptr;

        std::vector<point> waypoints;
        if (layout != nullptr && layout->waypoints.size() >= 2) {
          waypoints = layout->waypoints;
        } else {
          waypoints = connection_waypoints(bounds_of(*by_id_.at(e.source)),
                                           bounds_of(*by_id_.at(e.target)));
        }

        w.start_element(di_name("BPMNEdge"));
        w.attribute(id_attr, layout != nullptr && !layout->shape_id.empty()
                                 ? layout->shape_id
                                 : e.id + "_di");
        w.attribute({"", "bpmnElement"}, e.id);
        if (layout != nullptr) { write_attributes(w, layout->attributes); }
        for (const auto& p : waypoints) {
          w.start_element(qname{ns::di, "waypoint"});
          w.attribute({"", "x"}, format_coordinate(p.x));
          w.attribute({"", "y"}, format_coordinate(p.y));
          w.end_element();
        }
        if (layout != nullptr && layout->label_bounds) {
          write_label(w, *layout->label_bounds);
        } else if (!e.name.empty()) {
          write_label(w, centered_label(path_midpoint(waypoints)));
        }
        if (layout != nullptr) { write_fragments(w, layout->fragments); }
        w.end_element();
      }
    };

  } // namespace

  encode_result
  encode(const graph& g, id_allocator& ids, encode_options options) {
    return encoder(g, ids, options).run();
  }

} // namespace bpg
