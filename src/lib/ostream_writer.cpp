#include <bpg/ostream_writer.hpp>

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace bpg {

  namespace {

    const std::string xml_namespace = "http://www.w3.org/XML/1998/namespace";

    // The five metacharacters, plus CR which the next parser would
    // otherwise normalize away.
    bool
    escape_markup(std::ostream& os, char c) {
      switch (c) {
        case '<': os << "&lt;"; return true;
        case '>': os << "&gt;"; return true;
        case '&': os << "&amp;"; return true;
        case '"': os << "&quot;"; return true;
        case '\'': os << "&apos;"; return true;
        case '\r': os << "&#13;"; return true;
        default: return false;
      }
    }

    void
    escape_text(std::ostream& os, std::string_view text) {
      for (char c : text) {
        if (!escape_markup(os, c)) { os << c; }
      }
    }

    // LF and TAB are also written as character references in attributes,
    // otherwise attribute value normalization turns them into spaces on the
    // way back in.
    void
    escape_attribute(std::ostream& os, std::string_view value) {
      for (char c : value) {
        if (escape_markup(os, c)) { continue; }
        switch (c) {
          case '\n': os << "&#10;"; break;
          case '\t': os << "&#9;"; break;
          default: os << c; break;
        }
      }
    }

    struct pending_attribute {
      qname name;
      std::string value;
    };

  } // namespace

  struct ostream_writer::impl {
    std::ostream& os;
    writer_options options;

    struct frame {
      qname name;
      // Declarations written on this element's start tag.
      std::vector<namespace_binding> bindings;
      bool has_child_elements = false;
      bool has_text = false;
    };

    std::vector<frame> stack;

    // The innermost start tag has not been written yet.
    bool tag_pending = false;
    std::vector<pending_attribute> pending_attributes;

    // Next suffix for ns<N>; never reused within one document.
    int generated = 0;

    impl(std::ostream& os, writer_options options)
        : os(os), options(std::move(options)) {}

    bool
    pretty() const {
      return options.indent > 0;
    }

    void
    newline_and_indent(std::size_t level) {
      os << '\n'
         << std::string(level * static_cast<std::size_t>(options.indent), ' ');
    }

    // Prefix bound to uri here, honoring inner declarations that rebind a
    // prefix. Attributes cannot use the default namespace.
    std::optional<std::string>
    prefix_for(std::string_view uri, bool for_attribute) const {
      if (uri == xml_namespace) { return std::string("xml"); }
      std::vector<std::string_view> shadowed;
      for (auto f = stack.rbegin(); f != stack.rend(); ++f) {
        for (const auto& b : f->bindings) {
          if (std::find(shadowed.begin(), shadowed.end(), b.prefix) !=
              shadowed.end()) {
            continue;
          }
          if (b.uri == uri && !(for_attribute && b.prefix.empty())) {
            return b.prefix;
          }
        }
        for (const auto& b : f->bindings) { shadowed.push_back(b.prefix); }
      }
      return std::nullopt;
    }

    // URI of the innermost declaration of prefix; empty when unbound.
    std::string_view
    uri_of(std::string_view prefix) const {
      for (auto f = stack.rbegin(); f != stack.rend(); ++f) {
        for (const auto& b : f->bindings) {
          if (b.prefix == prefix) { return b.uri; }
        }
      }
      return {};
    }

    bool
    prefix_bound(std::string_view prefix) const {
      return prefix == "xml" || prefix == "xmlns" || !uri_of(prefix).empty();
    }

    std::string
    fresh_prefix(std::string_view uri) {
      for (const auto& hint : options.prefix_hints) {
        if (hint.uri == uri && !hint.prefix.empty() &&
            !prefix_bound(hint.prefix)) {
          return hint.prefix;
        }
      }
      std::string prefix;
      do {
        prefix = "ns" + std::to_string(generated++);
      } while (prefix_bound(prefix));
      return prefix;
    }

    void
    declare_missing(const qname& name, bool for_attribute) {
      if (name.namespace_uri.empty()) {
        if (!for_attribute && !uri_of("").empty()) {
          stack.back().bindings.push_back({"", ""});
        }
        return;
      }
      if (!prefix_for(name.namespace_uri, for_attribute)) {
        stack.back().bindings.push_back(
            {fresh_prefix(name.namespace_uri), name.namespace_uri});
      }
    }

    void
    write_name(const qname& name, bool for_attribute) {
      if (!name.namespace_uri.empty()) {
        auto prefix = prefix_for(name.namespace_uri, for_attribute);
        if (prefix && !prefix->empty()) { os << *prefix << ':'; }
      }
      os << name.local_name;
    }

    void
    flush_pending_tag() {
      if (!tag_pending) { return; }
      tag_pending = false;

      auto& top = stack.back();
      declare_missing(top.name, false);
      for (const auto& a : pending_attributes) { declare_missing(a.name, true); }

      os << '<';
      write_name(top.name, false);
      for (const auto& b : top.bindings) {
        os << (b.prefix.empty() ? " xmlns" : " xmlns:" + b.prefix) << "=\"";
        escape_attribute(os, b.uri);
        os << '"';
      }
      for (const auto& a : pending_attributes) {
        os << ' ';
        write_name(a.name, true);
        os << "=\"";
        escape_attribute(os, a.value);
        os << '"';
      }
      pending_attributes.clear();
    }

    void
    flush_and_close_tag() {
      if (tag_pending) {
        flush_pending_tag();
        os << '>';
      }
    }
  };

  ostream_writer::ostream_writer(std::ostream& os, writer_options options)
      : impl_(std::make_unique<impl>(os, std::move(options))) {
    if (impl_->options.xml_declaration) {
      os << R"(<?xml version="1.0" encoding="UTF-8"?>)";
      if (impl_->pretty()) { os << '\n'; }
    }
  }

  ostream_writer::~ostream_writer() = default;
  ostream_writer::ostream_writer(ostream_writer&&) noexcept = default;
  ostream_writer&
  ostream_writer::operator=(ostream_writer&&) noexcept = default;

  void
  ostream_writer::start_element(const qname& name) {
    impl_->flush_and_close_tag();

    if (!impl_->stack.empty()) {
      auto& parent = impl_->stack.back();
      parent.has_child_elements = true;
      if (impl_->pretty() && !parent.has_text) {
        impl_->newline_and_indent(impl_->stack.size());
      }
    }

    impl_->stack.push_back({name, {}, false, false});
    impl_->tag_pending = true;
  }

  void
  ostream_writer::end_element() {
    if (impl_->stack.empty()) {
      throw std::logic_error("bpg: end_element without an open element");
    }

    if (impl_->tag_pending) {
      impl_->flush_pending_tag();
      impl_->os << "/>";
    } else {
      const auto& top = impl_->stack.back();
      if (impl_->pretty() && top.has_child_elements && !top.has_text) {
        impl_->newline_and_indent(impl_->stack.size() - 1);
      }
      impl_->os << "</";
      impl_->write_name(top.name, false);
      impl_->os << '>';
    }
    impl_->stack.pop_back();

    if (impl_->stack.empty() && impl_->pretty()) { impl_->os << '\n'; }
  }

  void
  ostream_writer::attribute(const qname& name, std::string_view value) {
    if (!impl_->tag_pending) {
      throw std::logic_error("bpg: attribute '" + name.local_name +
                             "' after element content");
    }
    impl_->pending_attributes.push_back({name, std::string(value)});
  }

  void
  ostream_writer::characters(std::string_view text) {
    impl_->flush_and_close_tag();
    if (!impl_->stack.empty()) { impl_->stack.back().has_text = true; }
    escape_text(impl_->os, text);
  }

  void
  ostream_writer::namespace_declaration(std::string_view prefix,
                                        std::string_view uri) {
    if (!impl_->tag_pending) {
      throw std::logic_error("bpg: namespace declaration after element content");
    }
    impl_->stack.back().bindings.push_back(
        {std::string(prefix), std::string(uri)});
  }

  bool
  ostream_writer::namespace_in_scope(std::string_view uri) const {
    return impl_->prefix_for(uri, false).has_value();
  }

} // namespace bpg
