#include <algorithm>
#include <utility>
#include <fpm/math.hpp>
#include "track_geometry.hpp"

namespace {
  using tracks::fp;
  using tracks::vec2;
  using tracks::connector;

  const fp join_distance_tolerance {0.01};
  // fp::two_pi() is rounded on its own and is not exactly pi + pi
  const fp full_turn = fp::pi() + fp::pi();
  // one degree
  const fp join_angle_tolerance {0.0174533};

  connector extend_straight(const connector &from, fp length) {
    auto travel = tracks::normalize_angle(from.orientation + fp::pi());
    return {from.position + tracks::heading(travel) * length, travel};
  }

  connector extend_curve(const connector &from, fp radius, fp sweep) {
    auto travel = tracks::normalize_angle(from.orientation + fp::pi());
    // center is on the side the track bends to
    auto side = sweep > fp{} ? fp::half_pi() : -fp::half_pi();
    auto center = from.position + tracks::heading(travel + side) * radius;
    auto exit = center + tracks::rotate(from.position - center, sweep);
    return {exit, tracks::normalize_angle(travel + sweep)};
  }
}  // namespace

namespace tracks {
  fp length_of(vec2 v) {
    // scale by the larger component so the squares stay inside the fixed point range
    auto m = std::max(fpm::abs(v.x), fpm::abs(v.y));
    if (m == fp{}) {
      return m;
    }
    auto x = v.x / m, y = v.y / m;
    return m * fpm::sqrt(x * x + y * y);
  }

  vec2 heading(fp a) {
    return {fpm::cos(a), fpm::sin(a)};
  }

  vec2 rotate(vec2 v, fp a) {
    auto c = fpm::cos(a), s = fpm::sin(a);
    return {v.x * c - v.y * s, v.x * s + v.y * c};
  }

  fp normalize_angle(fp a) {
    while (a > fp::pi()) {
      a -= full_turn;
    }
    while (a <= -fp::pi()) {
      a += full_turn;
    }
    return a;
  }

  bool are_joined(const connector &a, const connector &b) {
    auto d = a.position - b.position;
    if (fpm::abs(d.x) > join_distance_tolerance || fpm::abs(d.y) > join_distance_tolerance) {
      return false;
    }
    if (length_of(d) > join_distance_tolerance) {
      return false;
    }
    auto facing = normalize_angle(a.orientation - b.orientation - fp::pi());
    return fpm::abs(facing) <= join_angle_tolerance;
  }

  size_t connector_count(element_kind kind) {
    switch (kind) {
      case element_kind::STRAIGHT:
      case element_kind::CURVE:
        return 2;
      case element_kind::TURNOUT:
        return 3;
      case element_kind::END:
        return 1;
    }
    return 0;
  }

  fp diverging_sweep(const element_type &type) {
    return type.hand == hand_t::LEFT ? -type.sweep : type.sweep;
  }

  bool is_traversal(element_kind kind, size_t a, size_t b) {
    if (a > b) {
      std::swap(a, b);
    }
    switch (kind) {
      case element_kind::STRAIGHT:
      case element_kind::CURVE:
        return a == 0 && b == 1;
      case element_kind::TURNOUT:
        return a == 0 && (b == 1 || b == 2);
      case element_kind::END:
        return false;
    }
    return false;
  }

  connector_set_t compute_connectors(const connector &c0, const element_type &type) {
    connector_set_t result;
    result.push_back(c0);
    switch (type.kind) {
      case element_kind::STRAIGHT:
        result.push_back(extend_straight(c0, type.length));
        break;
      case element_kind::CURVE:
        result.push_back(extend_curve(c0, type.radius, type.sweep));
        break;
      case element_kind::TURNOUT:
        result.push_back(extend_straight(c0, type.length));
        result.push_back(extend_curve(c0, type.radius, diverging_sweep(type)));
        break;
      case element_kind::END:
        break;
    }
    return result;
  }
}
