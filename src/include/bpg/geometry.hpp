#pragma once

#include <string>

namespace bpg {

  struct point {
    double x = 0;
    double y = 0;

    bool
    operator==(const point&) const = default;
  };

  struct dimensions {
    double width = 0;
    double height = 0;

    bool
    operator==(const dimensions&) const = default;
  };

  struct bounds {
    double x = 0;
    double y = 0;
    double width = 0;
    double height = 0;

    point
    origin() const {
      return {x, y};
    }

    dimensions
    size() const {
      return {width, height};
    }

    bool
    operator==(const bounds&) const = default;
  };

  // Integral values print without a fractional part ("100", not "100.0").
  std::string
  format_coordinate(double value);

  // Lenient number parsing for DI attributes; returns fallback when the text
  // is empty or not a number.
  double
  parse_coordinate(const std::string& text, double fallback = 0);

} // namespace bpg
