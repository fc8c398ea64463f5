#include <bpg/color.hpp>
#include <bpg/coordinates.hpp>
#include <bpg/decoder.hpp>
#include <bpg/graph.hpp>
#include <bpg/layout.hpp>
#include <bpg/vocabulary.hpp>
#include <bpg/xml_reader.hpp>

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace bpg {

  namespace {

    const qname id_attr{"", "id"};
    const qname name_attr{"", "name"};

    std::vector<const any_element*>
    model_children(const any_element& parent, std::string_view local_name) {
      std::vector<const any_element*> result;
      for (const auto& child : parent.children()) {
        const auto* e = std::get_if<any_element>(&child);
        if (e != nullptr && is_model_element(e->name(), local_name)) {
          result.push_back(e);
        }
      }
      return result;
    }

    std::vector<const any_element*>
    children_in(const any_element& parent, const std::string& namespace_uri,
                std::string_view local_name) {
      std::vector<const any_element*> result;
      for (const auto& child : parent.children()) {
        const auto* e = std::get_if<any_element>(&child);
        if (e != nullptr && is_element_in(e->name(), namespace_uri, local_name)) {
          result.push_back(e);
        }
      }
      return result;
    }

    const any_element*
    first_in(const any_element& parent, const std::string& namespace_uri,
             std::string_view local_name) {
      auto all = children_in(parent, namespace_uri, local_name);
      return all.empty() ? nullptr : all.front();
    }

    bounds
    read_bounds(const any_element& e) {
      return {parse_coordinate(e.attribute_or_empty({"", "x"})),
              parse_coordinate(e.attribute_or_empty({"", "y"})),
              parse_coordinate(e.attribute_or_empty({"", "width"})),
              parse_coordinate(e.attribute_or_empty({"", "height"}))};
    }

    std::optional<bounds>
    read_label_bounds(const any_element& di_element) {
      const auto* label = first_in(di_element, ns::bpmndi, "BPMNLabel");
      if (label == nullptr) { return std::nullopt; }
      const auto* b = first_in(*label, ns::dc, "Bounds");
      if (b == nullptr) { return std::nullopt; }
      return read_bounds(*b);
    }

    bool
    is_color_attribute(const qname& name) {
      return name == qname{ns::bioc, "fill"} ||
             name == qname{ns::bioc, "stroke"} ||
             name == qname{ns::color, "background-color"} ||
             name == qname{ns::color, "border-color"};
    }

    std::string
    structured_channel(const any_element& extension,
                       std::string_view local_name) {
      const auto* c = first_in(extension, ns::bpmndi, local_name);
      if (c == nullptr) { return {}; }
      auto channel = [c](const char* attr) {
        auto v = c->attribute({"", attr});
        return v && !v->empty() ? std::string(*v) : std::string("0");
      };
      return "rgb(" + channel("red") + ", " + channel("green") + ", " +
             channel("blue") + ")";
    }

    std::string
    trimmed(const std::string& text) {
      auto first = text.find_first_not_of(" \t\r\n");
      if (first == std::string::npos) { return {}; }
      auto last = text.find_last_not_of(" \t\r\n");
      return text.substr(first, last - first + 1);
    }

    void
    collect_ids(const any_element& e, id_allocator& ids,
                std::uint64_t& max_suffix) {
      if (auto id = e.attribute(id_attr)) {
        ids.observe(std::string(*id));
        if (auto n = numeric_suffix(*id)) {
          max_suffix = std::max(max_suffix, *n);
        }
      }
      for (const auto& child : e.children()) {
        if (const auto* c = std::get_if<any_element>(&child)) {
          collect_ids(*c, ids, max_suffix);
        }
      }
    }

    class decoder {
      id_allocator& ids_;
      decode_options options_;
      decode_result result_;
      std::unordered_set<std::string> decoded_ids_;
      std::unordered_map<std::string, const any_element*> shapes_;
      std::unordered_map<std::string, const any_element*> edge_shapes_;
      const any_element* plane_ = nullptr;
      // flowNodeRef -> lane, first membership wins.
      std::unordered_map<std::string, std::string> lane_of_;
      std::size_t flow_node_count_ = 0;

    public:
      decoder(id_allocator& ids, decode_options options)
          : ids_(ids), options_(options) {}

      decode_result
      run(const any_element& root,
          const std::vector<namespace_binding>& bindings) {
        std::uint64_t max_suffix = 0;
        collect_ids(root, ids_, max_suffix);
        ids_.reseed(max_suffix);

        decode_definitions(root, bindings);
        for (const auto* diagram : children_in(root, ns::bpmndi, "BPMNDiagram")) {
          index_diagram(*diagram);
        }

        auto collaborations = model_children(root, "collaboration");
        const any_element* collaboration =
            collaborations.empty() ? nullptr : collaborations.front();
        if (collaboration != nullptr) { decode_participants(*collaboration); }

        auto processes = model_children(root, "process");
        for (const auto* process : processes) {
          decode_process_nodes(*process);
        }
        for (const auto* process : processes) {
          for (const auto* flow : model_children(*process, "sequenceFlow")) {
            decode_sequence_flow(*flow);
          }
        }
        if (collaboration != nullptr) {
          for (const auto* flow : model_children(*collaboration, "messageFlow")) {
            decode_message_flow(*flow);
          }
        }
        collect_plane_fragments();
        return std::move(result_);
      }

    private:
      graph&
      g() {
        return result_.graph;
      }

      void
      report(diagnostic_kind kind, const std::string& id, std::string message,
             std::size_t line) {
        diagnostic d{kind, id, std::move(message), line};
        if (options_.policy == decode_policy::strict) {
          throw document_anomaly_error(std::move(d));
        }
        result_.warnings.push_back(std::move(d));
      }

      std::string
      element_id(const any_element& e) {
        auto id = e.attribute(id_attr);
        if (id && !id->empty()) { return std::string(*id); }
        return ids_.legacy_id(e.name().local_name);
      }

      // False when the id was already decoded in this pass.
      bool
      claim(const std::string& id, const any_element& e) {
        if (decoded_ids_.insert(id).second) { return true; }
        report(diagnostic_kind::duplicate_identifier, id,
               "duplicate id '" + id + "' on " + e.name().local_name +
                   "; element skipped",
               e.line());
        return false;
      }

      void
      decode_definitions(const any_element& root,
                         const std::vector<namespace_binding>& bindings) {
        auto& defs = g().definitions;
        defs.id = root.attribute_or_empty(id_attr);

        std::unordered_set<std::string> uris;
        std::unordered_set<std::string> prefixes;
        for (const auto& b : bindings) {
          if (uris.count(b.uri) || prefixes.count(b.prefix)) { continue; }
          uris.insert(b.uri);
          prefixes.insert(b.prefix);
          defs.namespaces.push_back(b);
        }

        defs.preserved = capture(
            root, {{"id"},
                   {"collaboration", "process"},
                   {qname{ns::bpmndi, "BPMNDiagram"}}});

        auto collaborations = model_children(root, "collaboration");
        if (!collaborations.empty()) {
          const auto& c = *collaborations.front();
          defs.collaboration_id = c.attribute_or_empty(id_attr);
          defs.collaboration =
              capture(c, {{"id"}, {"participant", "messageFlow"}, {}});
        }

        const auto* diagram = first_in(root, ns::bpmndi, "BPMNDiagram");
        if (diagram == nullptr) { return; }
        defs.diagram_id = diagram->attribute_or_empty(id_attr);
        for (const auto& child : diagram->children()) {
          const auto* e = std::get_if<any_element>(&child);
          if (e == nullptr) { continue; }
          if (is_element_in(e->name(), ns::bpmndi, "BPMNPlane") &&
              defs.plane_id.empty()) {
            defs.plane_id = e->attribute_or_empty(id_attr);
            plane_ = e;
          } else {
            defs.diagram_fragments.push_back(*e);
          }
        }
      }

      // Plane children the graph does not model, in document order. Shapes
      // and edges of decoded elements are rebuilt from the layout instead,
      // and those of elements dropped during decoding stay dropped.
      void
      collect_plane_fragments() {
        if (plane_ == nullptr) { return; }
        auto& fragments = g().definitions.plane_fragments;
        for (const auto& child : plane_->children()) {
          const auto* e = std::get_if<any_element>(&child);
          if (e == nullptr) { continue; }
          if (is_element_in(e->name(), ns::bpmndi, "BPMNShape") ||
              is_element_in(e->name(), ns::bpmndi, "BPMNEdge")) {
            auto target = e->attribute_or_empty({"", "bpmnElement"});
            if (decoded_ids_.count(target)) { continue; }
          }
          fragments.push_back(*e);
        }
      }

      void
      index_diagram(const any_element& diagram) {
        for (const auto* plane : children_in(diagram, ns::bpmndi, "BPMNPlane")) {
          for (const auto& child : plane->children()) {
            const auto* e = std::get_if<any_element>(&child);
            if (e == nullptr) { continue; }
            bool is_shape = is_element_in(e->name(), ns::bpmndi, "BPMNShape");
            bool is_edge = is_element_in(e->name(), ns::bpmndi, "BPMNEdge");
            if (!is_shape && !is_edge) { continue; }
            auto target = e->attribute_or_empty({"", "bpmnElement"});
            if (target.empty()) { continue; }
            auto& index = is_shape ? shapes_ : edge_shapes_;
            if (!index.emplace(target, e).second) {
              report(diagnostic_kind::duplicate_identifier, target,
                     std::string(is_shape ? "shape" : "edge") + " for '" +
                         target + "' appears more than once; first kept",
                     e->line());
            }
          }
        }
      }

      // Layout record and style of a node's BPMNShape.
      void
      apply_shape(node& n, const any_element& shape) {
        shape_layout layout;
        layout.shape_id = shape.attribute_or_empty(id_attr);
        if (const auto* b = first_in(shape, ns::dc, "Bounds")) {
          layout.absolute_bounds = read_bounds(*b);
        } else {
          auto size = default_size(n.kind);
          layout.absolute_bounds = {0, 0, size.width, size.height};
        }
        layout.label_bounds = read_label_bounds(shape);

        for (const auto& attr : shape.attributes()) {
          const auto& name = attr.name;
          if (name.namespace_uri.empty() &&
              (name.local_name == "id" || name.local_name == "bpmnElement")) {
            continue;
          }
          if (is_color_attribute(name)) { continue; }
          layout.attributes.push_back(attr);
        }

        for (const auto& child : shape.children()) {
          const auto* e = std::get_if<any_element>(&child);
          if (e == nullptr ||
              is_element_in(e->name(), ns::dc, "Bounds") ||
              is_element_in(e->name(), ns::bpmndi, "BPMNLabel")) {
            continue;
          }
          if (is_element_in(e->name(), ns::bpmndi, "BPMNExtensionElements") &&
              !layout.extension) {
            layout.extension = *e;
          } else {
            layout.fragments.push_back(*e);
          }
        }

        auto& style = n.style;
        auto bioc_fill = shape.attribute_or_empty({ns::bioc, "fill"});
        auto bioc_stroke = shape.attribute_or_empty({ns::bioc, "stroke"});
        auto omg_fill = shape.attribute_or_empty({ns::color, "background-color"});
        auto omg_stroke = shape.attribute_or_empty({ns::color, "border-color"});
        if (!bioc_fill.empty() || !bioc_stroke.empty()) {
          style.scheme = color_scheme::bioc;
        } else if (!omg_fill.empty() || !omg_stroke.empty()) {
          style.scheme = color_scheme::omg_color;
        }
        style.fill = !bioc_fill.empty() ? bioc_fill : omg_fill;
        style.stroke = !bioc_stroke.empty() ? bioc_stroke : omg_stroke;
        if (layout.extension) {
          if (style.fill.empty()) {
            style.fill = structured_channel(*layout.extension, "fillColor");
          }
          if (style.stroke.empty()) {
            style.stroke = structured_channel(*layout.extension, "strokeColor");
          }
        }

        n.size = layout.absolute_bounds.size();
        n.layout = std::move(layout);
      }

      const any_element*
      shape_for(const std::string& id) const {
        auto it = shapes_.find(id);
        return it != shapes_.end() ? it->second : nullptr;
      }

      void
      decode_participants(const any_element& collaboration) {
        std::size_t index = 0;
        for (const auto* p : model_children(collaboration, "participant")) {
          auto i = index++;
          auto id = element_id(*p);
          if (!claim(id, *p)) { continue; }

          node n;
          n.id = id;
          n.name = p->attribute_or_empty(name_attr);
          n.kind = participant{p->attribute_or_empty({"", "processRef"})};
          n.preserved = capture(*p, {{"id", "name", "processRef"}, {}, {}});
          n.documentation = first_documentation(n.preserved);

          if (const auto* shape = shape_for(id)) {
            apply_shape(n, *shape);
            n.position = n.layout->absolute_bounds.origin();
          } else {
            n.position = {participant_default_x,
                          participant_default_y +
                              static_cast<double>(i) * participant_stride};
            n.size = participant_default_size;
          }
          g().nodes.push_back(std::move(n));
        }
      }

      const node*
      participant_for_process(const std::string& process_id) const {
        if (process_id.empty()) { return nullptr; }
        for (const auto& n : result_.graph.nodes) {
          const auto* p = std::get_if<participant>(&n.kind);
          if (p != nullptr && p->process_ref == process_id) { return &n; }
        }
        return nullptr;
      }

      void
      decode_process_nodes(const any_element& process) {
        auto process_id = process.attribute_or_empty(id_attr);

        std::vector<std::string_view> structural = process_node_names();
        structural.push_back("sequenceFlow");
        structural.push_back("laneSet");

        process_info info;
        info.id = process_id;
        info.name = process.attribute_or_empty(name_attr);
        info.preserved = capture(process, {{"id", "name"}, structural, {}});

        std::string owner_id;
        std::optional<point> origin;
        double owner_width = participant_default_size.width;
        if (const auto* owner = participant_for_process(process_id)) {
          owner_id = owner->id;
          origin = owner->position;
          if (owner->size) { owner_width = owner->size->width; }
        }

        auto lane_sets = model_children(process, "laneSet");
        if (!lane_sets.empty()) {
          info.lane_set_id = lane_sets.front()->attribute_or_empty(id_attr);
          decode_lanes(*lane_sets.front(), owner_id, origin, owner_width);
        }

        // A dataObject that some dataObjectReference points at is the
        // reference's backing object, not a node of its own.
        std::unordered_set<std::string> backing_objects;
        for (const auto* ref : model_children(process, "dataObjectReference")) {
          auto target = ref->attribute_or_empty({"", "dataObjectRef"});
          if (!target.empty()) { backing_objects.insert(target); }
        }
        for (const auto* object : model_children(process, "dataObject")) {
          if (backing_objects.count(object->attribute_or_empty(id_attr))) {
            info.preserved.trailing.push_back(*object);
          }
        }

        std::optional<process_info> pending_info = std::move(info);
        if (!owner_id.empty()) {
          find_node(g(), owner_id)->process = std::move(pending_info);
          pending_info.reset();
        }

        for (const auto& child : process.children()) {
          const auto* e = std::get_if<any_element>(&child);
          if (e == nullptr) { continue; }
          const auto& name = e->name();
          if (name.namespace_uri != ns::model && !name.namespace_uri.empty()) {
            continue;
          }
          auto kind = kind_for_element(name.local_name);
          if (!kind) { continue; }
          if (name.local_name == "dataObject" &&
              backing_objects.count(e->attribute_or_empty(id_attr))) {
            continue;
          }
          if (decode_flow_node(*e, std::move(*kind), owner_id, origin) &&
              pending_info) {
            g().nodes.back().process = std::move(pending_info);
            pending_info.reset();
          }
        }
      }

      void
      decode_lanes(const any_element& lane_set, const std::string& owner_id,
                   std::optional<point> origin, double owner_width) {
        std::size_t index = 0;
        for (const auto* l : model_children(lane_set, "lane")) {
          auto i = index++;
          auto id = element_id(*l);
          if (!claim(id, *l)) { continue; }

          node n;
          n.id = id;
          n.name = l->attribute_or_empty(name_attr);
          n.kind = lane{};
          n.participant_id = owner_id;
          n.preserved = capture(*l, {{"id", "name"}, {"flowNodeRef"}, {}});
          n.documentation = first_documentation(n.preserved);

          for (const auto* ref : model_children(*l, "flowNodeRef")) {
            lane_of_.emplace(trimmed(ref->text()), id);
          }

          if (const auto* shape = shape_for(id)) {
            apply_shape(n, *shape);
            auto absolute = n.layout->absolute_bounds.origin();
            n.position = origin ? to_relative(absolute, *origin) : absolute;
          } else {
            n.position = {lane_default_x,
                          lane_default_y +
                              static_cast<double>(i) * lane_default_height};
            n.size = dimensions{owner_width - lane_width_inset,
                                lane_default_height};
          }
          g().nodes.push_back(std::move(n));
        }
      }

      // True when a node was appended.
      bool
      decode_flow_node(const any_element& e, node_kind kind,
                       const std::string& owner_id,
                       std::optional<point> origin) {
        auto id = element_id(e);
        if (!claim(id, e)) { return false; }
        ++flow_node_count_;

        node n;
        n.id = id;
        n.kind = std::move(kind);
        n.participant_id = owner_id;

        if (n.holds<text_annotation>()) {
          auto texts = model_children(e, "text");
          if (!texts.empty()) { n.name = texts.front()->text(); }
          n.preserved =
              capture(e, {{"id"}, {"incoming", "outgoing", "text"}, {}});
        } else {
          n.name = e.attribute_or_empty(name_attr);
          n.preserved = capture(e, {{"id", "name"}, {"incoming", "outgoing"}, {}});
        }
        n.documentation = first_documentation(n.preserved);

        if (auto it = lane_of_.find(id); it != lane_of_.end()) {
          n.lane_id = it->second;
        }

        point absolute;
        if (const auto* shape = shape_for(id)) {
          apply_shape(n, *shape);
          absolute = n.layout->absolute_bounds.origin();
        } else {
          absolute = {100 + 50 * static_cast<double>(flow_node_count_), 100};
        }
        n.position = origin ? to_relative_padded(absolute, *origin) : absolute;

        g().nodes.push_back(std::move(n));
        return true;
      }

      std::optional<edge>
      decode_edge(const any_element& e) {
        auto id = element_id(e);
        if (!claim(id, e)) { return std::nullopt; }

        edge result;
        result.id = id;
        result.source = e.attribute_or_empty({"", "sourceRef"});
        result.target = e.attribute_or_empty({"", "targetRef"});
        result.name = e.attribute_or_empty(name_attr);
        result.preserved =
            capture(e, {{"id", "name", "sourceRef", "targetRef"}, {}, {}});
        result.documentation = first_documentation(result.preserved);

        for (const auto* endpoint : {&result.source, &result.target}) {
          if (find_node(g(), *endpoint) == nullptr) {
            report(diagnostic_kind::unresolved_reference, id,
                   e.name().local_name + " '" + id +
                       "' references unknown element '" + *endpoint +
                       "'; flow dropped",
                   e.line());
            return std::nullopt;
          }
        }

        if (auto it = edge_shapes_.find(id); it != edge_shapes_.end()) {
          result.layout = read_edge_layout(*it->second);
        }
        return result;
      }

      static edge_layout
      read_edge_layout(const any_element& shape) {
        edge_layout layout;
        layout.shape_id = shape.attribute_or_empty(id_attr);
        layout.label_bounds = read_label_bounds(shape);
        for (const auto& attr : shape.attributes()) {
          const auto& name = attr.name;
          if (name.namespace_uri.empty() &&
              (name.local_name == "id" || name.local_name == "bpmnElement")) {
            continue;
          }
          layout.attributes.push_back(attr);
        }
        for (const auto& child : shape.children()) {
          const auto* c = std::get_if<any_element>(&child);
          if (c == nullptr || is_element_in(c->name(), ns::bpmndi, "BPMNLabel")) {
            continue;
          }
          if (is_element_in(c->name(), ns::di, "waypoint")) {
            layout.waypoints.push_back(
                {parse_coordinate(c->attribute_or_empty({"", "x"})),
                 parse_coordinate(c->attribute_or_empty({"", "y"}))});
          } else {
            layout.fragments.push_back(*c);
          }
        }
        return layout;
      }

      void
      decode_sequence_flow(const any_element& e) {
        auto flow = decode_edge(e);
        if (!flow) { return; }
        if (is_message_connection(g(), flow->source, flow->target)) {
          report(diagnostic_kind::cross_boundary_flow, flow->id,
                 "sequence flow '" + flow->id +
                     "' crosses a participant boundary; flow dropped",
                 e.line());
          return;
        }
        g().edges.push_back(std::move(*flow));
      }

      void
      decode_message_flow(const any_element& e) {
        auto flow = decode_edge(e);
        if (!flow) { return; }
        if (!is_message_connection(g(), flow->source, flow->target)) {
          report(diagnostic_kind::cross_boundary_flow, flow->id,
                 "message flow '" + flow->id +
                     "' stays within one participant; flow dropped",
                 e.line());
          return;
        }
        flow->is_message_flow = true;
        g().edges.push_back(std::move(*flow));
      }
    };

    any_element
    parse_document(std::string_view text,
                   std::vector<namespace_binding>& bindings) {
      try {
        auto reader = parse_xml(text);
        while (reader->read()) {
          if (reader->node_type() == xml_node_type::start_element) {
            any_element root(*reader);
            bindings = reader->namespace_bindings();
            return root;
          }
        }
      } catch (const xml_parse_error& e) {
        throw malformed_document_error(e.line(), e.column(), e.reason());
      }
      throw malformed_document_error("no root element");
    }

  } // namespace

  decode_result
  decode(std::string_view text, id_allocator& ids, decode_options options) {
    std::vector<namespace_binding> bindings;
    auto root = parse_document(text, bindings);
    if (!is_model_element(root.name(), "definitions")) {
      throw malformed_document_error("root element '" +
                                     root.name().local_name +
                                     "' is not a BPMN definitions element");
    }
    root.strip_insignificant_whitespace();
    return decoder(ids, options).run(root, bindings);
  }

} // namespace bpg
