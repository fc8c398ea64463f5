#pragma once

#include <bpg/geometry.hpp>

namespace bpg {

  // Nodes inside a participant keep their position relative to the
  // participant's origin; the document stores absolute coordinates.

  // Minimum relative offset that keeps a node clear of the participant
  // header band and lane labels.
  inline constexpr double min_relative_x = 80;
  inline constexpr double min_relative_y = 30;

  point
  to_relative(point absolute, point participant_origin);

  point
  to_absolute(point relative, point participant_origin);

  // to_relative followed by the padding floor. Not invertible for points
  // inside the padding band.
  point
  to_relative_padded(point absolute, point participant_origin);

} // namespace bpg
