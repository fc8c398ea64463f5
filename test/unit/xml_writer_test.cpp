#include <bpg/ostream_writer.hpp>
#include <bpg/vocabulary.hpp>
#include <bpg/xml_writer.hpp>

#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <string>

using namespace bpg;

TEST_CASE("writer: empty element (self-closing)", "[xml_writer]") {
  std::ostringstream os;
  ostream_writer writer(os);

  writer.start_element({"", "incoming"});
  writer.end_element();

  CHECK(os.str() == "<incoming/>");
}

TEST_CASE("writer: element with text content", "[xml_writer]") {
  std::ostringstream os;
  ostream_writer writer(os);

  writer.start_element({"", "outgoing"});
  writer.characters("Flow_1");
  writer.end_element();

  CHECK(os.str() == "<outgoing>Flow_1</outgoing>");
}

TEST_CASE("writer: attributes in call order", "[xml_writer]") {
  std::ostringstream os;
  ostream_writer writer(os);

  writer.start_element({"", "Bounds"});
  writer.attribute({"", "x"}, "1");
  writer.attribute({"", "y"}, "2");
  writer.end_element();

  CHECK(os.str() == R"(<Bounds x="1" y="2"/>)");
}

TEST_CASE("writer: escapes all five special characters", "[xml_writer]") {
  std::ostringstream os;
  ostream_writer writer(os);

  writer.start_element({"", "task"});
  writer.attribute({"", "name"}, R"(Check "A" & 'B' < C > D)");
  writer.characters(R"(x<y & "q" 'r' >)");
  writer.end_element();

  CHECK(os.str() ==
        "<task name=\"Check &quot;A&quot; &amp; &apos;B&apos; &lt; C &gt; D\">"
        "x&lt;y &amp; &quot;q&quot; &apos;r&apos; &gt;</task>");
}

TEST_CASE("writer: line breaks in attributes become character references",
          "[xml_writer]") {
  std::ostringstream os;
  ostream_writer writer(os);

  writer.start_element({"", "task"});
  writer.attribute({"", "name"}, "Review\norder\tnow");
  writer.characters("line one\nline two");
  writer.end_element();

  CHECK(os.str() == "<task name=\"Review&#10;order&#9;now\">"
                    "line one\nline two</task>");
}

TEST_CASE("writer: text_element writes a text-only child", "[xml_writer]") {
  std::ostringstream os;
  ostream_writer writer(os, {2, false});

  writer.start_element({"", "lane"});
  writer.text_element({"", "flowNodeRef"}, "Task_1");
  writer.end_element();

  CHECK(os.str() == "<lane>\n  <flowNodeRef>Task_1</flowNodeRef>\n</lane>\n");
}

TEST_CASE("writer: default and prefixed namespace declarations",
          "[xml_writer]") {
  std::ostringstream os;
  ostream_writer writer(os);

  writer.start_element({ns::model, "definitions"});
  writer.namespace_declaration("", ns::model);
  writer.namespace_declaration("bpmndi", ns::bpmndi);
  writer.start_element({ns::bpmndi, "BPMNDiagram"});
  writer.end_element();
  writer.end_element();

  CHECK(os.str() == "<definitions xmlns=\"" + ns::model +
                        "\" xmlns:bpmndi=\"" + ns::bpmndi +
                        "\"><bpmndi:BPMNDiagram/></definitions>");
}

TEST_CASE("writer: namespace bindings are scoped to their element",
          "[xml_writer]") {
  std::ostringstream os;
  ostream_writer writer(os);

  writer.start_element({"", "root"});
  CHECK_FALSE(writer.namespace_in_scope("urn:x"));
  writer.start_element({"urn:x", "a"});
  writer.namespace_declaration("x", "urn:x");
  CHECK(writer.namespace_in_scope("urn:x"));
  writer.end_element();
  CHECK_FALSE(writer.namespace_in_scope("urn:x"));
  writer.end_element();

  CHECK(os.str() == R"(<root><x:a xmlns:x="urn:x"/></root>)");
}

TEST_CASE("writer: xml prefix is always bound", "[xml_writer]") {
  std::ostringstream os;
  ostream_writer writer(os);

  writer.start_element({"", "documentation"});
  CHECK(writer.namespace_in_scope("http://www.w3.org/XML/1998/namespace"));
  writer.attribute({"http://www.w3.org/XML/1998/namespace", "lang"}, "en");
  writer.end_element();

  CHECK(os.str() == R"(<documentation xml:lang="en"/>)");
}

TEST_CASE("writer: indentation and declaration", "[xml_writer]") {
  std::ostringstream os;
  ostream_writer writer(os, {2, true});

  writer.start_element({"", "process"});
  writer.start_element({"", "task"});
  writer.start_element({"", "incoming"});
  writer.characters("F");
  writer.end_element();
  writer.end_element();
  writer.start_element({"", "endEvent"});
  writer.end_element();
  writer.end_element();

  CHECK(os.str() == "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
                    "<process>\n"
                    "  <task>\n"
                    "    <incoming>F</incoming>\n"
                    "  </task>\n"
                    "  <endEvent/>\n"
                    "</process>\n");
}

TEST_CASE("writer: no indentation inside mixed content", "[xml_writer]") {
  std::ostringstream os;
  ostream_writer writer(os, {2, false});

  writer.start_element({"", "documentation"});
  writer.characters("See ");
  writer.start_element({"", "b"});
  writer.characters("this");
  writer.end_element();
  writer.end_element();

  CHECK(os.str() == "<documentation>See <b>this</b></documentation>\n");
}

TEST_CASE("writer: declares unbound namespaces with hinted prefixes",
          "[xml_writer]") {
  std::ostringstream os;
  ostream_writer writer(
      os, {0, false, {{"camunda", "urn:camunda"}, {"", "urn:default"}}});

  writer.start_element({"urn:default", "task"});
  writer.attribute({"urn:camunda", "asyncBefore"}, "true");
  writer.start_element({"urn:camunda", "properties"});
  writer.end_element();
  writer.end_element();

  CHECK(os.str() == R"(<ns0:task xmlns:ns0="urn:default" )"
                    R"(xmlns:camunda="urn:camunda" camunda:asyncBefore="true">)"
                    R"(<camunda:properties/></ns0:task>)");
}

TEST_CASE("writer: attributes never take the default namespace",
          "[xml_writer]") {
  std::ostringstream os;
  ostream_writer writer(os);

  writer.start_element({"urn:m", "definitions"});
  writer.namespace_declaration("", "urn:m");
  writer.attribute({"urn:m", "flag"}, "1");
  writer.end_element();

  CHECK(os.str() == R"(<definitions xmlns="urn:m" xmlns:ns0="urn:m" )"
                    R"(ns0:flag="1"/>)");
}

TEST_CASE("writer: a rebound prefix hides the outer binding", "[xml_writer]") {
  std::ostringstream os;
  ostream_writer writer(os);

  writer.start_element({"urn:a", "root"});
  writer.namespace_declaration("p", "urn:a");
  writer.start_element({"urn:b", "inner"});
  writer.namespace_declaration("p", "urn:b");
  CHECK_FALSE(writer.namespace_in_scope("urn:a"));
  writer.start_element({"urn:a", "leaf"});
  writer.end_element();
  writer.end_element();
  writer.end_element();

  CHECK(os.str() == R"(<p:root xmlns:p="urn:a"><p:inner xmlns:p="urn:b">)"
                    R"(<ns0:leaf xmlns:ns0="urn:a"/></p:inner></p:root>)");
}

TEST_CASE("writer: unqualified element under a default namespace",
          "[xml_writer]") {
  std::ostringstream os;
  ostream_writer writer(os);

  writer.start_element({"urn:m", "definitions"});
  writer.namespace_declaration("", "urn:m");
  writer.start_element({"", "plain"});
  writer.end_element();
  writer.end_element();

  CHECK(os.str() == R"(<definitions xmlns="urn:m"><plain xmlns=""/>)"
                    R"(</definitions>)");
}
