#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include "../track_geometry.hpp"

using namespace tracks;

namespace {
  double d(fp x) {
    return static_cast<double>(x);
  }

  // leaving the element through this connector heads west, so the element runs east
  const connector eastward {{fp{}, fp{}}, fp::pi()};
}

TEST_CASE("normalize_angle usage", "[geometry]") {
  REQUIRE(d(normalize_angle(fp{})) == Catch::Approx(0).margin(1e-4));
  REQUIRE(d(normalize_angle(fp::pi())) == Catch::Approx(d(fp::pi())).margin(1e-4));
  REQUIRE(d(normalize_angle(-fp::pi())) == Catch::Approx(d(fp::pi())).margin(1e-4));
  REQUIRE(d(normalize_angle(fp::pi() + fp::half_pi())) == Catch::Approx(-d(fp::half_pi())).margin(1e-4));
  REQUIRE(d(normalize_angle(fp{-7})) == Catch::Approx(-7 + 2 * 3.14159265).margin(1e-3));
}

TEST_CASE("compute_connectors usage", "[geometry]") {
  SECTION("straight") {
    auto cs = compute_connectors(eastward, element_type::straight(fp{10}));
    REQUIRE(cs.size() == 2);
    REQUIRE(d(cs[1].position.x) == Catch::Approx(10).margin(0.01));
    REQUIRE(d(cs[1].position.y) == Catch::Approx(0).margin(0.01));
    REQUIRE(d(cs[1].orientation) == Catch::Approx(0).margin(1e-3));
  }

  SECTION("curve to the left") {
    auto cs = compute_connectors(eastward, element_type::curve(fp{10}, fp::half_pi()));
    REQUIRE(cs.size() == 2);
    REQUIRE(d(cs[1].position.x) == Catch::Approx(10).margin(0.01));
    REQUIRE(d(cs[1].position.y) == Catch::Approx(10).margin(0.01));
    REQUIRE(d(cs[1].orientation) == Catch::Approx(d(fp::half_pi())).margin(1e-3));
  }

  SECTION("curve to the right") {
    auto cs = compute_connectors(eastward, element_type::curve(fp{10}, -fp::half_pi()));
    REQUIRE(d(cs[1].position.x) == Catch::Approx(10).margin(0.01));
    REQUIRE(d(cs[1].position.y) == Catch::Approx(-10).margin(0.01));
    REQUIRE(d(cs[1].orientation) == Catch::Approx(-d(fp::half_pi())).margin(1e-3));
  }

  SECTION("turnout") {
    auto right = compute_connectors(eastward, element_type::turnout(fp{30}, fp{10}, fp::half_pi(), hand_t::RIGHT));
    REQUIRE(right.size() == 3);
    REQUIRE(d(right[1].position.x) == Catch::Approx(30).margin(0.01));
    REQUIRE(d(right[2].position.y) == Catch::Approx(10).margin(0.01));

    auto left = compute_connectors(eastward, element_type::turnout(fp{30}, fp{10}, fp::half_pi(), hand_t::LEFT));
    REQUIRE(d(left[2].position.x) == Catch::Approx(10).margin(0.01));
    REQUIRE(d(left[2].position.y) == Catch::Approx(-10).margin(0.01));
    REQUIRE(d(left[2].orientation) == Catch::Approx(-d(fp::half_pi())).margin(1e-3));
  }

  SECTION("end") {
    auto cs = compute_connectors(eastward, element_type::end());
    REQUIRE(cs.size() == 1);
    REQUIRE(cs[0].position.x == fp{});
  }

  SECTION("orientations stay normalized") {
    connector c0 {{fp{}, fp{}}, fp{}};
    auto cs = compute_connectors(c0, element_type::curve(fp{10}, fp{-3}));
    REQUIRE(cs[1].orientation > -fp::pi());
    REQUIRE(cs[1].orientation <= fp::pi());
  }
}

TEST_CASE("are_joined usage", "[geometry]") {
  connector a {{fp{5}, fp{5}}, fp{}};
  REQUIRE(are_joined(a, {{fp{5.005}, fp{5}}, fp::pi()}));
  REQUIRE(are_joined(a, {{fp{5}, fp{5}}, -fp::pi()}));
  REQUIRE_FALSE(are_joined(a, {{fp{5.05}, fp{5}}, fp::pi()}));
  REQUIRE_FALSE(are_joined(a, {{fp{5}, fp{5}}, fp::half_pi()}));
  REQUIRE_FALSE(are_joined(a, {{fp{5}, fp{5}}, fp{}}));

  SECTION("far apart across the layout") {
    connector east {{fp{250}, fp{}}, fp{}};
    REQUIRE_FALSE(are_joined(east, {{fp{-250}, fp{}}, fp::pi()}));
    REQUIRE_FALSE(are_joined(east, {{fp{-6}, fp{}}, fp::pi()}));
    REQUIRE_FALSE(are_joined(east, {{fp{250}, fp{256}}, fp::pi()}));
  }
}

TEST_CASE("length_of usage", "[geometry]") {
  REQUIRE(length_of({fp{}, fp{}}) == fp{});
  REQUIRE(d(length_of({fp{3}, fp{-4}})) == Catch::Approx(5).margin(1e-3));
  REQUIRE(d(length_of({fp{-500}, fp{}})) == Catch::Approx(500).margin(1e-2));
  REQUIRE(d(length_of({fp{300}, fp{400}})) == Catch::Approx(500).margin(0.05));
  REQUIRE(d(length_of({fp{0.006}, fp{0.008}})) == Catch::Approx(0.01).margin(1e-3));
}

TEST_CASE("element traversals", "[geometry]") {
  REQUIRE(connector_count(element_kind::STRAIGHT) == 2);
  REQUIRE(connector_count(element_kind::TURNOUT) == 3);
  REQUIRE(connector_count(element_kind::END) == 1);

  REQUIRE(is_traversal(element_kind::CURVE, 1, 0));
  REQUIRE(is_traversal(element_kind::TURNOUT, 0, 2));
  REQUIRE_FALSE(is_traversal(element_kind::TURNOUT, 1, 2));
  REQUIRE_FALSE(is_traversal(element_kind::END, 0, 0));

  auto t = element_type::turnout(fp{30}, fp{190}, fp{0.2}, hand_t::LEFT);
  REQUIRE(diverging_sweep(t) == fp{-0.2});
}
