#pragma once

#include <cstddef>
#include <etl/vector.h>
#include <fpm/fixed.hpp>

namespace tracks {
  /**
   * scalar used for every metric quantity: meters, seconds, radians.
   */
  using fp = fpm::fixed_16_16;

  /**
   * a point or a displacement on the layout plane, in meters.
   */
  struct vec2 {
    fp x {}, y {};
  };

  inline vec2 operator+(vec2 a, vec2 b) {
    return {a.x + b.x, a.y + b.y};
  }

  inline vec2 operator-(vec2 a, vec2 b) {
    return {a.x - b.x, a.y - b.y};
  }

  inline vec2 operator*(vec2 a, fp k) {
    return {a.x * k, a.y * k};
  }

  fp length_of(vec2 v);

  /**
   * unit vector pointing along angle a.
   */
  vec2 heading(fp a);

  /**
   * rotates v counterclockwise by a around the origin.
   */
  vec2 rotate(vec2 v, fp a);

  /**
   * brings an angle into (-pi, pi].
   */
  fp normalize_angle(fp a);

  /**
   * attachment point of an element. orientation points outward: it is the heading of
   * a train leaving the element through this connector.
   */
  struct connector {
    vec2 position {};
    fp orientation {};
  };

  /**
   * two connectors are joined if they touch (1 cm) and face each other (1 degree).
   */
  bool are_joined(const connector &a, const connector &b);

  enum class element_kind {
    STRAIGHT,
    CURVE,
    TURNOUT,
    END,
  };

  enum class hand_t {
    LEFT,
    RIGHT,
  };

  /**
   * shape of one piece of track.
   *
   * STRAIGHT uses length. CURVE uses radius and a signed sweep. TURNOUT uses length as
   * the through leg and radius, sweep, hand for the diverging leg. END (buffer stop or
   * tunnel portal) uses nothing.
   */
  struct element_type {
    element_kind kind {element_kind::END};
    fp length {};
    fp radius {};
    fp sweep {};
    hand_t hand {hand_t::RIGHT};

    static element_type straight(fp length) {
      return {element_kind::STRAIGHT, length, {}, {}, hand_t::RIGHT};
    }

    static element_type curve(fp radius, fp sweep) {
      return {element_kind::CURVE, {}, radius, sweep, hand_t::RIGHT};
    }

    static element_type turnout(fp through_length, fp radius, fp sweep, hand_t hand) {
      return {element_kind::TURNOUT, through_length, radius, sweep, hand};
    }

    static element_type end() {
      return {};
    }
  };

  constexpr size_t max_connectors = 3;

  using connector_set_t = etl::vector<connector, max_connectors>;

  /**
   * 2 for straights and curves, 3 for turnouts, 1 for ends.
   */
  size_t connector_count(element_kind kind);

  /**
   * signed sweep of the diverging leg of a turnout. left hand turnouts bend the other way.
   */
  fp diverging_sweep(const element_type &type);

  /**
   * whether a train may pass through the element between connectors a and b.
   */
  bool is_traversal(element_kind kind, size_t a, size_t b);

  /**
   * derives every connector of an element from its connector 0.
   */
  connector_set_t compute_connectors(const connector &c0, const element_type &type);
}
