#include <bpg/color.hpp>

#include <cctype>
#include <charconv>

namespace bpg {

  namespace {

    std::optional<int>
    hex_channel(std::string_view digits) {
      int value = 0;
      auto [ptr, ec] = std::from_chars(digits.data(),
                                       digits.data() + digits.size(), value, 16);
      if (ec != std::errc() || ptr != digits.data() + digits.size()) {
        return std::nullopt;
      }
      if (digits.size() == 1) { value = value * 16 + value; }
      return value;
    }

    void
    skip_spaces(std::string_view& s) {
      while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
      }
    }

    std::optional<int>
    decimal_channel(std::string_view& s) {
      skip_spaces(s);
      int value = 0;
      auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
      if (ec != std::errc() || value < 0 || value > 255) { return std::nullopt; }
      s.remove_prefix(static_cast<std::size_t>(ptr - s.data()));
      skip_spaces(s);
      return value;
    }

    std::optional<rgb>
    parse_hex(std::string_view hex) {
      std::size_t width = 0;
      if (hex.size() == 6) {
        width = 2;
      } else if (hex.size() == 3) {
        width = 1;
      } else {
        return std::nullopt;
      }
      auto r = hex_channel(hex.substr(0, width));
      auto g = hex_channel(hex.substr(width, width));
      auto b = hex_channel(hex.substr(2 * width, width));
      if (!r || !g || !b) { return std::nullopt; }
      return rgb{*r, *g, *b};
    }

    std::optional<rgb>
    parse_function(std::string_view body) {
      int channels[3] = {};
      for (int i = 0; i < 3; ++i) {
        auto value = decimal_channel(body);
        if (!value) { return std::nullopt; }
        channels[i] = *value;
        if (i < 2) {
          if (body.empty() || body.front() != ',') { return std::nullopt; }
          body.remove_prefix(1);
        }
      }
      if (body != ")") { return std::nullopt; }
      return rgb{channels[0], channels[1], channels[2]};
    }

  } // namespace

  std::optional<rgb>
  parse_color(std::string_view text) {
    skip_spaces(text);
    while (!text.empty() &&
           std::isspace(static_cast<unsigned char>(text.back()))) {
      text.remove_suffix(1);
    }
    if (text.starts_with('#')) { return parse_hex(text.substr(1)); }
    if (text.starts_with("rgb(")) { return parse_function(text.substr(4)); }
    return std::nullopt;
  }

  std::string
  format_rgb(const rgb& color) {
    return "rgb(" + std::to_string(color.red) + ", " +
           std::to_string(color.green) + ", " + std::to_string(color.blue) +
           ")";
  }

} // namespace bpg
