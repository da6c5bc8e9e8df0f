#pragma once

#include <tuple>
#include <etl/optional.h>
#include <etl/string.h>
#include "generic/containers.hpp"
#include "track_layout.hpp"

namespace tracks {
  enum class switch_position {
    NORMAL,
    REVERSE,
  };

  constexpr size_t max_switches = 8;

  /**
   * snapshot of every switch keyed by name. switches missing from it read as NORMAL.
   */
  using switch_status_t = yard::string_map<switch_position, max_switch_name_len, max_switches>;

  switch_position switch_state(const switch_status_t &switches, const switch_name_t &name);

  /**
   * "Normal" or "Diverging".
   */
  const char *stringify_switch_position(switch_position position);

  enum class segment_shape {
    STRAIGHT,
    ARC,
  };

  /**
   * the path of one traversal through an element, in travel direction.
   *
   * STRAIGHT uses start, end, orientation. ARC uses center, radius, start_angle (polar angle
   * of the entry point around center) and signed_sweep.
   */
  struct segment_geometry {
    segment_shape shape {segment_shape::STRAIGHT};
    vec2 start {}, end {};
    fp orientation {};
    vec2 center {};
    fp radius {}, start_angle {}, signed_sweep {};
  };

  struct route_segment {
    element_id element {};
    // connector the train enters the element through
    size_t entry {};
    fp length {};
    fp start_distance {};
    segment_geometry geometry {};
  };

  constexpr size_t max_route_segments = 64;

  /**
   * contiguous traversals: each segment starts where the previous one ends, and the last one
   * ends at total_length.
   */
  struct route {
    etl::vector<route_segment, max_route_segments> segments {};
    fp total_length {};
  };

  enum class route_status {
    OK,
    // start element or connector does not exist
    BAD_START,
    // an element was entered twice through the same connector
    CYCLE_DETECTED,
    // ran out of segment slots
    ROUTE_TOO_LONG,
  };

  /**
   * which connector a train leaves through after entering the element at `entry`.
   * facing turnouts follow their switch, trailing turnouts always lead to the toe.
   */
  etl::optional<size_t> exit_connector(const placed_element &element, size_t entry, const switch_status_t &switches);

  /**
   * walks the layout from the element joined to (start_element, start_connector) and follows
   * the switches until an end element or a loose connector.
   *
   * when the walk fails part way, the segments built so far are still returned.
   */
  std::tuple<route, route_status> build_route(
    element_id start_element,
    size_t start_connector,
    const switch_status_t &switches,
    const layout &track
  );

  struct pose {
    vec2 position {};
    fp orientation {};
  };

  /**
   * position and heading at a distance along the route. empty outside [0, total_length].
   */
  etl::optional<pose> position_on_route(fp distance, const route &r);

  size_t stringify_route(char *buf, size_t buflen, const route &r);

  template<size_t N>
  etl::string<N> stringify_route(const route &r) {
    etl::string<N> res;
    auto len = stringify_route(res.data(), N + 1, r);
    res.uninitialized_resize(len);
    return res;
  }

  const char *stringify_route_status(route_status status);
}
