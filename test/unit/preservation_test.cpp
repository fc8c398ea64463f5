#include <bpg/xml_reader.hpp>
#include <bpg/ostream_writer.hpp>
#include <bpg/preservation.hpp>
#include <bpg/vocabulary.hpp>

#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <string>

using namespace bpg;

namespace {

  any_element
  parse(const std::string& xml) {
    auto reader = parse_xml(xml);
    REQUIRE(reader->read());
    any_element root(*reader);
    root.strip_insignificant_whitespace();
    return root;
  }

  const std::string bpmn_ns =
      R"( xmlns="http://www.omg.org/spec/BPMN/20100524/MODEL")"
      R"( xmlns:camunda="http://camunda.org/schema/1.0/bpmn")";

  const capture_rules flow_node_rules{{"id", "name"}, {"incoming", "outgoing"}, {}};

} // namespace

TEST_CASE("capture keeps unmodeled attributes in order", "[preservation]") {
  auto e = parse("<serviceTask" + bpmn_ns +
                 R"( id="T" camunda:type="external" name="Call" )"
                 R"(camunda:topic="billing"/>)");
  auto content = capture(e, flow_node_rules);

  CHECK(content.element_name == "serviceTask");
  REQUIRE(content.attributes.size() == 2);
  CHECK(content.attributes[0].name.local_name == "type");
  CHECK(content.attributes[1].value == "billing");
  CHECK(content.has_attribute(
      qname{"http://camunda.org/schema/1.0/bpmn", "topic"}));
  CHECK_FALSE(content.has_attribute(qname{"", "id"}));
}

TEST_CASE("capture collects every documentation text", "[preservation]") {
  auto e = parse("<task" + bpmn_ns +
                 "><documentation>first</documentation>"
                 "<documentation>  second\n</documentation></task>");
  auto content = capture(e, flow_node_rules);

  REQUIRE(content.documentation.size() == 2);
  CHECK(content.documentation[0].text() == "first");
  CHECK(content.documentation[1].text() == "  second\n");
  CHECK(first_documentation(content) == "first");
  CHECK(content.leading.empty());
  CHECK(content.trailing.empty());
}

TEST_CASE("capture splits fragments around the structural block",
          "[preservation]") {
  auto e = parse("<scriptTask" + bpmn_ns +
                 "><extensionElements><camunda:x/></extensionElements>"
                 "<incoming>F1</incoming><outgoing>F2</outgoing>"
                 "<script>return 1;</script></scriptTask>");
  auto content = capture(e, flow_node_rules);

  REQUIRE(content.leading.size() == 1);
  CHECK(content.leading[0].name().local_name == "extensionElements");
  REQUIRE(content.trailing.size() == 1);
  CHECK(content.trailing[0].name().local_name == "script");
  CHECK(content.trailing[0].text() == "return 1;");
}

TEST_CASE("capture without structural children puts extensions first",
          "[preservation]") {
  auto e = parse("<sequenceFlow" + bpmn_ns +
                 "><conditionExpression>x &gt; 1</conditionExpression>"
                 "<extensionElements/></sequenceFlow>");
  auto content = capture(e, {{"id", "sourceRef", "targetRef"}, {}, {}});

  REQUIRE(content.leading.size() == 1);
  CHECK(content.leading[0].name().local_name == "extensionElements");
  REQUIRE(content.trailing.size() == 1);
  CHECK(content.trailing[0].name().local_name == "conditionExpression");
}

TEST_CASE("write_documentation replays current then the extra entries",
          "[preservation]") {
  preserved_content content;
  content.documentation = {
      any_element(model_name("documentation"), {}, {std::string("old")}),
      any_element(model_name("documentation"), {}, {std::string("second")})};

  std::ostringstream os;
  ostream_writer writer(os);
  writer.start_element(model_name("task"));
  writer.namespace_declaration("", ns::model);
  write_documentation(writer, "edited", content);
  writer.end_element();

  CHECK(os.str() == "<task xmlns=\"" + ns::model +
                        "\"><documentation>edited</documentation>"
                        "<documentation>second</documentation></task>");
}

TEST_CASE("write_preserved_attributes leaves namespace declarations to the writer",
          "[preservation]") {
  preserved_content content;
  content.attributes.push_back({{"urn:vendor", "flag"}, "a&b"});
  content.attributes.push_back({{"", "isInterrupting"}, "false"});

  std::ostringstream os;
  ostream_writer writer(os);
  writer.start_element({"", "boundaryEvent"});
  write_preserved_attributes(writer, content);
  writer.end_element();

  CHECK(os.str() == R"(<boundaryEvent xmlns:ns0="urn:vendor" ns0:flag="a&amp;b" )"
                    R"(isInterrupting="false"/>)");
}

TEST_CASE("write_fragments writes markup, not escaped text", "[preservation]") {
  auto fragment = parse(R"(<script xmlns="urn:s">if (a &lt; b) {}</script>)");

  std::ostringstream os;
  ostream_writer writer(os);
  writer.start_element({"urn:s", "scriptTask"});
  writer.namespace_declaration("", "urn:s");
  write_fragments(writer, {fragment});
  writer.end_element();

  CHECK(os.str() == R"(<scriptTask xmlns="urn:s"><script>if (a &lt; b) {})"
                    R"(</script></scriptTask>)");
}

TEST_CASE("documentation attributes survive capture and replay",
          "[preservation]") {
  auto e = parse("<task" + bpmn_ns +
                 R"(><documentation id="D1" textFormat="text/html">)"
                 R"(<![CDATA[<b>x</b>]]></documentation>)"
                 R"(<documentation textFormat="text/plain">y</documentation>)"
                 "</task>");
  auto content = capture(e, flow_node_rules);
  REQUIRE(content.documentation.size() == 2);
  CHECK(content.documentation[0].attribute_or_empty({"", "textFormat"}) ==
        "text/html");

  auto replay = [&content](const std::string& current) {
    std::ostringstream os;
    ostream_writer writer(os);
    writer.start_element(model_name("task"));
    writer.namespace_declaration("", ns::model);
    write_documentation(writer, current, content);
    writer.end_element();
    return os.str();
  };

  CHECK(replay("<b>x</b>") ==
        "<task xmlns=\"" + ns::model +
            "\"><documentation id=\"D1\" textFormat=\"text/html\">"
            "&lt;b&gt;x&lt;/b&gt;</documentation>"
            "<documentation textFormat=\"text/plain\">y</documentation></task>");
  CHECK(replay("edited") ==
        "<task xmlns=\"" + ns::model +
            "\"><documentation id=\"D1\" textFormat=\"text/html\">"
            "edited</documentation>"
            "<documentation textFormat=\"text/plain\">y</documentation></task>");
}
