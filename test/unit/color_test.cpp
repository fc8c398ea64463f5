#include <bpg/color.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace bpg;

TEST_CASE("parse_color reads six-digit hex", "[color]") {
  CHECK(parse_color("#ff8000") == rgb{255, 128, 0});
  CHECK(parse_color("#FFFFFF") == rgb{255, 255, 255});
}

TEST_CASE("parse_color reads three-digit hex", "[color]") {
  CHECK(parse_color("#f80") == rgb{255, 136, 0});
}

TEST_CASE("parse_color reads the rgb() form", "[color]") {
  CHECK(parse_color("rgb(12, 34, 56)") == rgb{12, 34, 56});
  CHECK(parse_color("rgb(1,2,3)") == rgb{1, 2, 3});
  CHECK(parse_color("  rgb( 0 , 0 , 0 )  ") == rgb{0, 0, 0});
}

TEST_CASE("parse_color rejects other text", "[color]") {
  CHECK_FALSE(parse_color("").has_value());
  CHECK_FALSE(parse_color("red").has_value());
  CHECK_FALSE(parse_color("#12345").has_value());
  CHECK_FALSE(parse_color("#gg0000").has_value());
  CHECK_FALSE(parse_color("rgb(256, 0, 0)").has_value());
  CHECK_FALSE(parse_color("rgb(1, 2)").has_value());
  CHECK_FALSE(parse_color("rgba(1, 2, 3, 0.5)").has_value());
}

TEST_CASE("format_rgb matches the structured decode form", "[color]") {
  CHECK(format_rgb({255, 0, 10}) == "rgb(255, 0, 10)");
  CHECK(parse_color(format_rgb({7, 8, 9})) == rgb{7, 8, 9});
}
