#include <bpg/preservation.hpp>
#include <bpg/vocabulary.hpp>
#include <bpg/xml_writer.hpp>

#include <algorithm>
#include <string>
#include <variant>

namespace bpg {

  namespace {

    bool
    contains(const std::vector<std::string_view>& names,
             std::string_view name) {
      return std::find(names.begin(), names.end(), name) != names.end();
    }

    bool
    is_structural(const any_element& child, const capture_rules& rules) {
      const auto& name = child.name();
      if (contains(rules.structural_children, name.local_name) &&
          (name.namespace_uri == ns::model || name.namespace_uri.empty())) {
        return true;
      }
      return std::find(rules.structural_qualified.begin(),
                       rules.structural_qualified.end(),
                       name) != rules.structural_qualified.end();
    }

    // Children that conventionally open an element's content.
    bool
    is_extension_style(const any_element& child) {
      static const std::vector<std::string_view> names = {
          "extensionElements", "auditing", "monitoring", "categoryValueRef"};
      return (child.name().namespace_uri == ns::model ||
              child.name().namespace_uri.empty()) &&
             contains(names, child.name().local_name);
    }

  } // namespace

  bool
  preserved_content::has_attribute(const qname& name) const {
    return std::any_of(attributes.begin(), attributes.end(),
                       [&name](const any_attribute& a) {
                         return a.name == name;
                       });
  }

  preserved_content
  capture(const any_element& element, const capture_rules& rules) {
    preserved_content content;
    content.element_name = element.name().local_name;

    for (const auto& attr : element.attributes()) {
      if (attr.name.namespace_uri.empty() &&
          contains(rules.modeled_attributes, attr.name.local_name)) {
        continue;
      }
      content.attributes.push_back(attr);
    }

    struct pending {
      const any_element* element;
      bool before_structure;
    };
    std::vector<pending> unknown;
    bool seen_structural = false;

    for (const auto& child : element.children()) {
      const auto* e = std::get_if<any_element>(&child);
      if (e == nullptr) { continue; }
      if (is_model_element(e->name(), "documentation")) {
        auto entry = *e;
        entry.strip_insignificant_whitespace();
        content.documentation.push_back(std::move(entry));
      } else if (is_structural(*e, rules)) {
        seen_structural = true;
      } else {
        unknown.push_back({e, !seen_structural});
      }
    }

    for (const auto& u : unknown) {
      bool leading =
          seen_structural ? u.before_structure : is_extension_style(*u.element);
      auto fragment = *u.element;
      fragment.strip_insignificant_whitespace();
      (leading ? content.leading : content.trailing)
          .push_back(std::move(fragment));
    }
    return content;
  }

  void
  write_attributes(xml_writer& writer,
                   const std::vector<any_attribute>& attributes) {
    for (const auto& attr : attributes) {
      writer.attribute(attr.name, attr.value);
    }
  }

  std::string
  first_documentation(const preserved_content& content) {
    return content.documentation.empty() ? std::string()
                                         : content.documentation.front().text();
  }

  void
  write_documentation(xml_writer& writer, const std::string& current,
                      const preserved_content& content) {
    const auto& entries = content.documentation;
    if (!current.empty()) {
      if (!entries.empty() && entries.front().text() == current) {
        entries.front().write(writer);
      } else {
        writer.start_element(model_name("documentation"));
        if (!entries.empty()) {
          write_attributes(writer, entries.front().attributes());
        }
        writer.characters(current);
        writer.end_element();
      }
    }
    for (std::size_t i = 1; i < entries.size(); ++i) {
      entries[i].write(writer);
    }
  }

  void
  write_fragments(xml_writer& writer,
                  const std::vector<any_element>& fragments) {
    for (const auto& fragment : fragments) {
      fragment.write(writer);
    }
  }

} // namespace bpg
