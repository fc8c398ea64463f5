#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace bpg {

  struct rgb {
    int red = 0;
    int green = 0;
    int blue = 0;

    bool
    operator==(const rgb&) const = default;
  };

  // Accepts "#rrggbb", "#rgb" and "rgb(r, g, b)"; nullopt for anything else.
  std::optional<rgb>
  parse_color(std::string_view text);

  // "rgb(r, g, b)", the form structured colors decode to.
  std::string
  format_rgb(const rgb& color);

} // namespace bpg
