#include <bpg/layout.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace bpg;

TEST_CASE("default sizes per node kind", "[layout]") {
  CHECK(default_size(start_event{}) == dimensions{36, 36});
  CHECK(default_size(intermediate_event{event_direction::throwing}) ==
        dimensions{36, 36});
  CHECK(default_size(gateway{gateway_kind::parallel}) == dimensions{50, 50});
  CHECK(default_size(task{task_kind::user}) == dimensions{100, 80});
  CHECK(default_size(data_object{}) == dimensions{36, 50});
  CHECK(default_size(participant{}) == participant_default_size);
}

TEST_CASE("shape_bounds adds the participant origin", "[layout]") {
  node n;
  n.kind = task{};
  n.position = {100, 40};

  CHECK(shape_bounds(n, point{50, 60}) == bounds{150, 100, 100, 80});
  CHECK(shape_bounds(n, std::nullopt) == bounds{100, 40, 100, 80});

  n.size = dimensions{120, 90};
  CHECK(shape_bounds(n, std::nullopt) == bounds{100, 40, 120, 90});
}

TEST_CASE("label_below sits five units under the shape", "[layout]") {
  CHECK(label_below({100, 100, 36, 36}) == bounds{100, 141, 36, 40});
}

TEST_CASE("connection_waypoints join right-middle to left-middle",
          "[layout]") {
  auto points = connection_waypoints({100, 100, 36, 36}, {200, 90, 100, 80});
  REQUIRE(points.size() == 2);
  CHECK(points[0] == point{136, 118});
  CHECK(points[1] == point{200, 130});
}

TEST_CASE("path_midpoint and centered_label", "[layout]") {
  CHECK(path_midpoint({{0, 0}, {100, 50}}) == point{50, 25});
  CHECK(path_midpoint({{0, 0}, {10, 10}, {20, 0}}) == point{10, 10});
  CHECK(centered_label({50, 25}) == bounds{0, 5, 100, 40});
}

TEST_CASE("pools, lanes and annotations have no external label",
          "[layout]") {
  CHECK_FALSE(has_external_label(participant{}));
  CHECK_FALSE(has_external_label(lane{}));
  CHECK_FALSE(has_external_label(text_annotation{}));
  CHECK(has_external_label(start_event{}));
}
