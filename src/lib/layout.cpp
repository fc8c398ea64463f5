#include <bpg/coordinates.hpp>
#include <bpg/layout.hpp>

#include <type_traits>

namespace bpg {

  dimensions
  default_size(const node_kind& kind) {
    return std::visit(
        [](const auto& k) -> dimensions {
          using T = std::decay_t<decltype(k)>;
          if constexpr (std::is_same_v<T, start_event> ||
                        std::is_same_v<T, end_event> ||
                        std::is_same_v<T, intermediate_event> ||
                        std::is_same_v<T, boundary_event>) {
            return {36, 36};
          } else if constexpr (std::is_same_v<T, gateway> ||
                               std::is_same_v<T, data_store>) {
            return {50, 50};
          } else if constexpr (std::is_same_v<T, task> ||
                               std::is_same_v<T, sub_process> ||
                               std::is_same_v<T, call_activity>) {
            return {100, 80};
          } else if constexpr (std::is_same_v<T, data_object>) {
            return {36, 50};
          } else if constexpr (std::is_same_v<T, group>) {
            return {300, 300};
          } else if constexpr (std::is_same_v<T, text_annotation>) {
            return {100, 30};
          } else if constexpr (std::is_same_v<T, participant>) {
            return participant_default_size;
          } else if constexpr (std::is_same_v<T, lane>) {
            return {participant_default_size.width - lane_width_inset,
                    lane_default_height};
          } else {
            static_assert(always_false_v<T>, "unhandled node kind");
          }
        },
        kind);
  }

  dimensions
  shape_size(const node& n) {
    return n.size ? *n.size : default_size(n.kind);
  }

  bounds
  shape_bounds(const node& n, std::optional<point> participant_origin) {
    point p = participant_origin ? to_absolute(n.position, *participant_origin)
                                 : n.position;
    auto size = shape_size(n);
    return {p.x, p.y, size.width, size.height};
  }

  bounds
  label_below(const bounds& shape) {
    return {shape.x, shape.y + shape.height + label_gap, shape.width,
            label_height};
  }

  bool
  has_external_label(const node_kind& kind) {
    return !std::holds_alternative<participant>(kind) &&
           !std::holds_alternative<lane>(kind) &&
           !std::holds_alternative<text_annotation>(kind);
  }

  std::vector<point>
  connection_waypoints(const bounds& source, const bounds& target) {
    return {{source.x + source.width, source.y + source.height / 2},
            {target.x, target.y + target.height / 2}};
  }

  point
  path_midpoint(const std::vector<point>& waypoints) {
    if (waypoints.empty()) { return {}; }
    auto n = waypoints.size();
    if (n % 2 == 1) { return waypoints[n / 2]; }
    const auto& a = waypoints[n / 2 - 1];
    const auto& b = waypoints[n / 2];
    return {(a.x + b.x) / 2, (a.y + b.y) / 2};
  }

  bounds
  centered_label(point center) {
    return {center.x - edge_label_size.width / 2,
            center.y - edge_label_size.height / 2, edge_label_size.width,
            edge_label_size.height};
  }

} // namespace bpg
