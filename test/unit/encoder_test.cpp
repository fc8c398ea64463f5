#include <bpg/decoder.hpp>
#include <bpg/encoder.hpp>
#include <bpg/graph.hpp>
#include <bpg/vocabulary.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace bpg;

namespace {

  const encode_options compact{0, false};

  bool
  contains(const std::string& text, const std::string& part) {
    return text.find(part) != std::string::npos;
  }

} // namespace

TEST_CASE("encode an empty graph", "[encoder]") {
  graph g;
  id_allocator ids(1);
  auto result = encode(g, ids);
  const auto& doc = result.document;

  CHECK(result.warnings.empty());
  CHECK(doc.rfind(R"(<?xml version="1.0" encoding="UTF-8"?>)", 0) == 0);
  CHECK(contains(doc, R"(<definitions xmlns=")" + ns::model + "\""));
  CHECK(contains(doc, R"(xmlns:bpmndi=")" + ns::bpmndi + "\""));
  CHECK(contains(doc, R"(xmlns:bioc=")" + ns::bioc + "\""));
  CHECK(contains(doc, R"(id="Definitions_1")"));
  CHECK(contains(doc, R"(targetNamespace="http://bpmn.io/schema/bpmn")"));
  CHECK(contains(doc, R"(isExecutable="false")"));
  CHECK(contains(doc, R"(<bpmndi:BPMNDiagram id="BPMNDiagram_1">)"));
  CHECK(contains(doc, R"(<bpmndi:BPMNPlane id="BPMNPlane_1" bpmnElement="Process_)"));
}

TEST_CASE("encode a synthesized process with shapes and flows", "[encoder]") {
  graph g;
  id_allocator ids(1);
  auto start = add_node(g, start_event{}, "Begin", {100, 100}, "", ids);
  auto work = add_node(g, task{}, "Work & rest", {200, 78}, "", ids);
  auto flow = connect(g, start, work, ids);
  find_edge(g, flow)->name = "go";

  auto doc = encode(g, ids, compact).document;

  CHECK(contains(doc, "<startEvent id=\"" + start + "\" name=\"Begin\">"
                      "<outgoing>" + flow + "</outgoing></startEvent>"));
  CHECK(contains(doc, "<task id=\"" + work + "\" name=\"Work &amp; rest\">"
                      "<incoming>" + flow + "</incoming></task>"));
  CHECK(contains(doc, "<sequenceFlow id=\"" + flow + "\" name=\"go\" sourceRef=\"" +
                          start + "\" targetRef=\"" + work + "\"/>"));

  CHECK(contains(doc, "<bpmndi:BPMNShape id=\"" + start + "_di\" bpmnElement=\"" +
                          start + "\"><dc:Bounds x=\"100\" y=\"100\" "
                                  "width=\"36\" height=\"36\"/>"
                                  "<bpmndi:BPMNLabel><dc:Bounds x=\"100\" "
                                  "y=\"141\" width=\"36\" height=\"40\"/>"));
  CHECK(contains(doc, R"(<dc:Bounds x="200" y="78" width="100" height="80"/>)"));
  CHECK(contains(doc, R"(<di:waypoint x="136" y="118"/><di:waypoint x="200" y="118"/>)"));
  CHECK(contains(doc, R"(<dc:Bounds x="118" y="98" width="100" height="40"/>)"));
}

TEST_CASE("encode skips the label of unnamed shapes", "[encoder]") {
  graph g;
  id_allocator ids(1);
  auto gw = add_node(g, gateway{}, "", {10, 10}, "", ids);
  auto doc = encode(g, ids, compact).document;

  CHECK(contains(doc, "<exclusiveGateway id=\"" + gw + "\"/>"));
  CHECK_FALSE(contains(doc, "BPMNLabel"));
}

TEST_CASE("encode participants, lanes and message flows", "[encoder]") {
  graph g;
  id_allocator ids(1);
  auto pa = add_node(g, participant{}, "Customer", {50, 50}, "", ids);
  auto pb = add_node(g, participant{}, "Shop", {50, 330}, "", ids);
  auto lane_id = add_node(g, lane{}, "Front", {30, 0}, pa, ids);
  auto ta = add_node(g, task{}, "Order", {100, 40}, pa, ids);
  auto tb = add_node(g, task{}, "Ship", {100, 40}, pb, ids);
  assign_lane(g, ta, lane_id);
  auto message = connect(g, ta, tb, ids);

  auto result = encode(g, ids, compact);
  const auto& doc = result.document;
  const auto& process_a = find_node(g, pa)->process->id;

  CHECK(result.warnings.empty());
  CHECK(contains(doc, "<participant id=\"" + pa +
                          "\" name=\"Customer\" processRef=\"" + process_a +
                          "\"/>"));
  CHECK(contains(doc, "<messageFlow id=\"" + message + "\" sourceRef=\"" + ta +
                          "\" targetRef=\"" + tb + "\"/></collaboration>"));
  CHECK(contains(doc, "<process id=\"" + process_a + "\"><laneSet id=\""));
  CHECK(contains(doc, "<lane id=\"" + lane_id + "\" name=\"Front\"><flowNodeRef>" +
                          ta + "</flowNodeRef></lane>"));
  CHECK(contains(doc, R"(<bpmndi:BPMNPlane id="BPMNPlane_1" bpmnElement="Collaboration_)"));
  CHECK(contains(doc, "bpmnElement=\"" + pa + "\" isHorizontal=\"true\">"
                      "<dc:Bounds x=\"50\" y=\"50\" width=\"910\" height=\"250\"/>"));
  // Contained nodes are written at absolute coordinates.
  CHECK(contains(doc, R"(<dc:Bounds x="150" y="90" width="100" height="80"/>)"));
  CHECK(contains(doc, R"(<dc:Bounds x="80" y="50" width="830" height="120"/>)"));
}

TEST_CASE("encode skips flows with a missing endpoint", "[encoder]") {
  graph g;
  id_allocator ids(1);
  auto t = add_node(g, task{}, "t", {0, 0}, "", ids);
  edge dangling;
  dangling.id = "Flow_dangling";
  dangling.source = t;
  dangling.target = "ghost";
  g.edges.push_back(dangling);

  auto result = encode(g, ids, compact);

  REQUIRE(result.warnings.size() == 1);
  CHECK(result.warnings[0].kind == diagnostic_kind::unresolved_reference);
  CHECK(result.warnings[0].element_id == "Flow_dangling");
  CHECK_FALSE(contains(result.document, "Flow_dangling"));
}

TEST_CASE("encode synthesizes the data object behind a reference",
          "[encoder]") {
  graph g;
  id_allocator ids(1);
  auto d = add_node(g, data_object{}, "Invoice", {0, 0}, "", ids);
  auto doc = encode(g, ids, compact).document;

  CHECK(contains(doc, "<dataObjectReference id=\"" + d +
                          "\" name=\"Invoice\" dataObjectRef=\"DataObject_" + d +
                          "\"/><dataObject id=\"DataObject_" + d + "\"/>"));
  CHECK(ids.is_taken("DataObject_" + d));
}

TEST_CASE("encode text annotations with a text child", "[encoder]") {
  graph g;
  id_allocator ids(1);
  auto n = add_node(g, text_annotation{}, "a < b", {0, 0}, "", ids);
  auto doc = encode(g, ids, compact).document;

  CHECK(contains(doc, "<textAnnotation id=\"" + n +
                          "\"><text>a &lt; b</text></textAnnotation>"));
  CHECK_FALSE(contains(doc, "BPMNLabel"));
}

TEST_CASE("encode colors in the node's scheme", "[encoder]") {
  graph g;
  id_allocator ids(1);
  auto a = add_node(g, task{}, "", {0, 0}, "", ids);
  auto b = add_node(g, task{}, "", {0, 0}, "", ids);
  auto c = add_node(g, task{}, "", {0, 0}, "", ids);
  find_node(g, a)->style = {"#ff0000", "#000", color_scheme::bioc};
  find_node(g, b)->style = {"#00ff00", "", color_scheme::omg_color};
  find_node(g, c)->style = {"rgb(1, 2, 3)", "not a color", color_scheme::structured};

  auto doc = encode(g, ids, compact).document;

  CHECK(contains(doc, "bpmnElement=\"" + a +
                          "\" bioc:fill=\"#ff0000\" bioc:stroke=\"#000\">"));
  CHECK(contains(doc, "bpmnElement=\"" + b +
                          "\" color:background-color=\"#00ff00\">"));
  CHECK(contains(doc, R"(<bpmndi:BPMNExtensionElements>)"
                      R"(<bpmndi:fillColor red="1" green="2" blue="3"/>)"
                      R"(</bpmndi:BPMNExtensionElements>)"));
  CHECK_FALSE(contains(doc, "strokeColor"));
}

TEST_CASE("encode honors the layout options", "[encoder]") {
  graph g;
  id_allocator ids(1);
  add_node(g, task{}, "t", {0, 0}, "", ids);

  auto pretty = encode(g, ids).document;
  CHECK(contains(pretty, "\n  <process"));

  auto flat = encode(g, ids, compact).document;
  CHECK(flat.find('\n') == std::string::npos);
  CHECK(flat.rfind("<definitions", 0) == 0);
}

TEST_CASE("encode keeps the original element name within its family",
          "[encoder]") {
  id_allocator ids(1);
  auto decoded = decode(
      R"(<definitions xmlns="http://www.omg.org/spec/BPMN/20100524/MODEL">)"
      R"(<process id="P"><userTask id="U"/><parallelGateway id="G"/></process>)"
      R"(</definitions>)",
      ids);
  auto& g = decoded.graph;
  change_kind(g, "G", gateway{gateway_kind::inclusive});

  auto doc = encode(g, ids, compact).document;
  CHECK(contains(doc, R"(<userTask id="U"/>)"));
  CHECK(contains(doc, R"(<inclusiveGateway id="G"/>)"));
  CHECK(contains(doc, R"(<process id="P">)"));
}
