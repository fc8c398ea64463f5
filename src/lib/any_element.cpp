#include <bpg/any_element.hpp>
#include <bpg/xml_reader.hpp>
#include <bpg/xml_writer.hpp>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <variant>

namespace bpg {

  namespace {

    bool
    is_indentation(const any_element::child& c) {
      const auto* s = std::get_if<std::string>(&c);
      return s != nullptr &&
             s->find_first_not_of(" \t\r\n") == std::string::npos;
    }

  } // namespace

  any_element::any_element(xml_reader& reader)
      : name_(reader.name()), line_(reader.line()) {
    attributes_.reserve(reader.attribute_count());
    for (std::size_t i = 0; i < reader.attribute_count(); ++i) {
      attributes_.push_back(
          {reader.attribute_name(i), std::string(reader.attribute_value(i))});
    }

    const auto depth = reader.depth();
    while (reader.read()) {
      switch (reader.node_type()) {
        case xml_node_type::start_element:
          children_.emplace_back(any_element(reader));
          break;
        case xml_node_type::characters:
          children_.emplace_back(std::string(reader.text()));
          break;
        case xml_node_type::end_element:
          if (reader.depth() == depth) { return; }
          break;
      }
    }
    throw std::runtime_error("bpg: input ended inside element '" +
                             name_.local_name + "'");
  }

  void
  any_element::write(xml_writer& writer) const {
    writer.start_element(name_);
    for (const auto& a : attributes_) {
      writer.attribute(a.name, a.value);
    }
    for (const auto& c : children_) {
      if (const auto* text = std::get_if<std::string>(&c)) {
        writer.characters(*text);
      } else {
        std::get<any_element>(c).write(writer);
      }
    }
    writer.end_element();
  }

  std::optional<std::string_view>
  any_element::attribute(const qname& name) const {
    auto it = std::find_if(attributes_.begin(), attributes_.end(),
                           [&name](const any_attribute& a) { return a.name == name; });
    if (it == attributes_.end()) { return std::nullopt; }
    return std::string_view(it->value);
  }

  std::string
  any_element::attribute_or_empty(const qname& name) const {
    return std::string(attribute(name).value_or(std::string_view()));
  }

  void
  any_element::set_attribute(const qname& name, std::string value) {
    for (auto& a : attributes_) {
      if (a.name == name) {
        a.value = std::move(value);
        return;
      }
    }
    attributes_.push_back({name, std::move(value)});
  }

  std::string
  any_element::text() const {
    std::string result;
    for (const auto& c : children_) {
      if (const auto* text = std::get_if<std::string>(&c)) {
        result += *text;
      } else {
        result += std::get<any_element>(c).text();
      }
    }
    return result;
  }

  std::vector<const any_element*>
  any_element::children_named(const qname& name) const {
    std::vector<const any_element*> result;
    for (const auto& c : children_) {
      const auto* e = std::get_if<any_element>(&c);
      if (e != nullptr && e->name_ == name) { result.push_back(e); }
    }
    return result;
  }

  const any_element*
  any_element::first_child(const qname& name) const {
    for (const auto& c : children_) {
      const auto* e = std::get_if<any_element>(&c);
      if (e != nullptr && e->name_ == name) { return e; }
    }
    return nullptr;
  }

  void
  any_element::strip_insignificant_whitespace() {
    auto has_elements =
        std::any_of(children_.begin(), children_.end(), [](const child& c) {
          return std::holds_alternative<any_element>(c);
        });
    if (has_elements) {
      children_.erase(
          std::remove_if(children_.begin(), children_.end(), is_indentation),
          children_.end());
    }
    for (auto& c : children_) {
      if (auto* e = std::get_if<any_element>(&c)) {
        e->strip_insignificant_whitespace();
      }
    }
  }

} // namespace bpg
