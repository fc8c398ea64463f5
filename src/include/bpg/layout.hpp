#pragma once

#include <bpg/geometry.hpp>
#include <bpg/model.hpp>

#include <optional>
#include <vector>

namespace bpg {

  // Default pool geometry for documents that carry no participant shape.
  inline constexpr double participant_default_x = 50;
  inline constexpr double participant_default_y = 50;
  inline constexpr double participant_stride = 280;
  inline constexpr dimensions participant_default_size{910, 250};

  inline constexpr double lane_default_x = 60;
  inline constexpr double lane_default_y = 30;
  inline constexpr double lane_default_height = 120;
  // Lanes are this much narrower than their participant.
  inline constexpr double lane_width_inset = 80;

  inline constexpr double label_gap = 5;
  inline constexpr double label_height = 40;
  inline constexpr dimensions edge_label_size{100, 40};

  // Size an editor gives a freshly created node of this kind.
  dimensions
  default_size(const node_kind& kind);

  dimensions
  shape_size(const node& n);

  // Document-absolute bounds; participant_origin is the owning participant's
  // position for contained nodes and nullopt otherwise.
  bounds
  shape_bounds(const node& n, std::optional<point> participant_origin);

  // Label box under a shape: same x and width, 5 units below, 40 high.
  bounds
  label_below(const bounds& shape);

  // Whether an editor draws an external label for the node kind.
  bool
  has_external_label(const node_kind& kind);

  // Right-middle of source to left-middle of target.
  std::vector<point>
  connection_waypoints(const bounds& source, const bounds& target);

  // Middle vertex for an odd count, midpoint of the two middle vertices for
  // an even count.
  point
  path_midpoint(const std::vector<point>& waypoints);

  bounds
  centered_label(point center);

} // namespace bpg
