#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <fpm/math.hpp>
#include "../track_consts.hpp"
#include "../track_graph.hpp"

using namespace tracks;

namespace {
  double d(fp x) {
    return static_cast<double>(x);
  }

  const switch_status_t no_switches {};

  switch_status_t main_switch(switch_position position) {
    switch_status_t switches;
    switches[sawmill::main_switch] = position;
    return switches;
  }

  /**
   * buffer stop, n straights of 10 m heading east, buffer stop.
   */
  layout straight_line(int n) {
    layout track;
    auto prev = track.place_element(element_type::end(), {{fp{}, fp{}}, fp::pi()});
    for (int i = 0; i < n; ++i) {
      prev = track.place_element_at(element_type::straight(fp{10}), {*prev, i == 0 ? size_t{0} : size_t{1}});
    }
    track.place_element_at(element_type::end(), {*prev, 1});
    return track;
  }
}

TEST_CASE("exit_connector usage", "[route]") {
  auto &track = sawmill_layout();
  auto &turnout = *track.find_element(sawmill::main_turnout);
  auto &straight = *track.find_element(sawmill::mainline);

  REQUIRE(*exit_connector(straight, 0, no_switches) == 1);
  REQUIRE(*exit_connector(straight, 1, no_switches) == 0);
  REQUIRE(*exit_connector(turnout, 0, no_switches) == 1);
  REQUIRE(*exit_connector(turnout, 0, main_switch(switch_position::REVERSE)) == 2);

  SECTION("trailing moves ignore the switch") {
    REQUIRE(*exit_connector(turnout, 1, main_switch(switch_position::REVERSE)) == 0);
    REQUIRE(*exit_connector(turnout, 2, main_switch(switch_position::NORMAL)) == 0);
  }

  REQUIRE_FALSE(exit_connector(*track.find_element(sawmill::buffer_stop), 0, no_switches));
  REQUIRE_FALSE(exit_connector(straight, 2, no_switches));
}

TEST_CASE("build_route on the sawmill", "[route]") {
  auto &track = sawmill_layout();

  SECTION("westbound through the mainline") {
    auto [r, status] = build_route(sawmill::east_portal, 0, main_switch(switch_position::NORMAL), track);
    REQUIRE(status == route_status::OK);
    REQUIRE(r.segments.size() == 3);
    REQUIRE(r.segments[0].element == sawmill::east_approach);
    REQUIRE(r.segments[1].element == sawmill::main_turnout);
    REQUIRE(r.segments[2].element == sawmill::mainline);
    REQUIRE(r.total_length == fp{500});
    REQUIRE(stringify_route<30>(r) == "(1,2,3;500.00)");
  }

  SECTION("westbound into the siding") {
    auto [r, status] = build_route(sawmill::east_portal, 0, main_switch(switch_position::REVERSE), track);
    REQUIRE(status == route_status::OK);
    REQUIRE(r.segments.size() == 5);
    REQUIRE(r.segments[1].geometry.shape == segment_shape::ARC);
    REQUIRE(d(r.segments[1].length) == Catch::Approx(38).margin(0.1));
    REQUIRE(d(r.segments[2].length) == Catch::Approx(38).margin(0.1));
    REQUIRE(r.segments[4].element == sawmill::team_track);
    REQUIRE(d(r.total_length) == Catch::Approx(356).margin(0.2));
  }

  SECTION("eastbound trails through the turnout") {
    for (auto position : {switch_position::NORMAL, switch_position::REVERSE}) {
      auto [r, status] = build_route(sawmill::west_portal, 0, main_switch(position), track);
      REQUIRE(status == route_status::OK);
      REQUIRE(r.segments.size() == 3);
      REQUIRE(r.segments[0].element == sawmill::mainline);
      REQUIRE(r.segments[0].entry == 1);
      REQUIRE(r.segments[2].element == sawmill::east_approach);
      REQUIRE(r.total_length == fp{500});
    }
  }

  SECTION("segments are contiguous") {
    auto [r, status] = build_route(sawmill::east_portal, 0, main_switch(switch_position::REVERSE), track);
    REQUIRE(status == route_status::OK);
    fp expected {};
    for (auto &seg : r.segments) {
      REQUIRE(seg.start_distance == expected);
      expected += seg.length;
    }
    REQUIRE(expected == r.total_length);
  }

  SECTION("bad start") {
    auto [r, status] = build_route(42, 0, no_switches, track);
    REQUIRE(status == route_status::BAD_START);
    REQUIRE(r.segments.empty());
    REQUIRE(std::get<1>(build_route(sawmill::east_portal, 1, no_switches, track)) == route_status::BAD_START);
  }
}

TEST_CASE("build_route on long and looping layouts", "[route]") {
  SECTION("more than 20 elements in a line") {
    auto track = straight_line(30);
    auto [r, status] = build_route(0, 0, no_switches, track);
    REQUIRE(status == route_status::OK);
    REQUIRE(r.segments.size() == 30);
    REQUIRE(r.total_length == fp{300});
  }

  SECTION("a closed loop is reported, not followed forever") {
    layout track;
    auto first = track.place_element(element_type::curve(fp{10}, fp::half_pi()), {{fp{}, fp{}}, fp::pi()});
    auto prev = first;
    for (int i = 0; i < 3; ++i) {
      prev = track.place_element_at(element_type::curve(fp{10}, fp::half_pi()), {*prev, 1});
    }
    REQUIRE(track.connect({*prev, 1}, {*first, 0}));

    auto [r, status] = build_route(*prev, 1, no_switches, track);
    REQUIRE(status == route_status::CYCLE_DETECTED);
    REQUIRE(r.segments.size() == 4);
    REQUIRE(d(r.total_length) == Catch::Approx(4 * 10 * 1.5708).margin(0.05));
  }

  SECTION("a loose connector ends the route") {
    layout track;
    auto a = track.place_element(element_type::straight(fp{10}), {{fp{}, fp{}}, fp::pi()});
    auto b = track.place_element_at(element_type::straight(fp{10}), {*a, 1});
    auto [r, status] = build_route(*a, 0, no_switches, track);
    REQUIRE(status == route_status::OK);
    REQUIRE(r.segments.empty());
    std::tie(r, status) = build_route(*b, 0, no_switches, track);
    REQUIRE(status == route_status::OK);
    REQUIRE(r.segments.size() == 1);
    REQUIRE(r.segments[0].element == *a);
  }
}

TEST_CASE("position_on_route usage", "[route]") {
  auto &track = sawmill_layout();
  auto [r, status] = build_route(sawmill::east_portal, 0, main_switch(switch_position::REVERSE), track);
  REQUIRE(status == route_status::OK);

  SECTION("outside the route") {
    REQUIRE_FALSE(position_on_route(fp{-1}, r));
    REQUIRE_FALSE(position_on_route(r.total_length + fp{1}, r));
    REQUIRE_FALSE(position_on_route(fp{}, route {}));
  }

  SECTION("straight") {
    auto p = position_on_route(fp{50}, r);
    REQUIRE(p);
    REQUIRE(d(p->position.x) == Catch::Approx(200).margin(0.05));
    REQUIRE(d(p->position.y) == Catch::Approx(0).margin(0.05));
    REQUIRE(d(fpm::abs(p->orientation)) == Catch::Approx(3.14159).margin(0.01));
  }

  SECTION("segment ends meet the element connectors") {
    auto &turnout = *track.find_element(sawmill::main_turnout);
    auto &arc = r.segments[1];
    auto p = position_on_route(arc.start_distance + arc.length, r);
    REQUIRE(p);
    REQUIRE(d(p->position.x) == Catch::Approx(d(turnout.connectors[2].position.x)).margin(0.1));
    REQUIRE(d(p->position.y) == Catch::Approx(d(turnout.connectors[2].position.y)).margin(0.1));
    REQUIRE(d(normalize_angle(p->orientation - turnout.connectors[2].orientation)) == Catch::Approx(0).margin(0.01));

    auto &team = *track.find_element(sawmill::team_track);
    auto end = position_on_route(r.total_length, r);
    REQUIRE(end);
    REQUIRE(d(end->position.x) == Catch::Approx(d(team.connectors[1].position.x)).margin(0.05));
    REQUIRE(d(end->position.y) == Catch::Approx(d(team.connectors[1].position.y)).margin(0.05));
  }

  SECTION("arc midpoint") {
    auto &arc = r.segments[1];
    auto p = position_on_route(arc.start_distance + arc.length / 2, r);
    REQUIRE(p);
    REQUIRE(d(p->position.x) == Catch::Approx(131.03).margin(0.1));
    REQUIRE(d(p->position.y) == Catch::Approx(-0.95).margin(0.1));
    REQUIRE(d(normalize_angle(p->orientation - fp::pi() - fp{0.1})) == Catch::Approx(0).margin(0.01));
  }
}

TEST_CASE("route status names", "[route]") {
  REQUIRE(etl::string<20>(stringify_route_status(route_status::CYCLE_DETECTED)) == "cycle detected");
  REQUIRE(stringify_route<30>(route {}) == "(;0.00)");
}
