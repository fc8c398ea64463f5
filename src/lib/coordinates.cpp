#include <bpg/coordinates.hpp>

#include <algorithm>

namespace bpg {

  point
  to_relative(point absolute, point participant_origin) {
    return {absolute.x - participant_origin.x,
            absolute.y - participant_origin.y};
  }

  point
  to_absolute(point relative, point participant_origin) {
    return {relative.x + participant_origin.x,
            relative.y + participant_origin.y};
  }

  point
  to_relative_padded(point absolute, point participant_origin) {
    point p = to_relative(absolute, participant_origin);
    p.x = std::max(p.x, min_relative_x);
    p.y = std::max(p.y, min_relative_y);
    return p;
  }

} // namespace bpg
