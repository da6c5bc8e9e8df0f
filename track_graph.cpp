#include <etl/unordered_set.h>
#include <fpm/math.hpp>
#include "track_graph.hpp"
#include "generic/format.hpp"

namespace {
  using namespace tracks;

  int visit_key(element_id element, size_t entry) {
    return element * static_cast<int>(max_connectors) + static_cast<int>(entry);
  }

  fp polar_angle(vec2 point, vec2 center) {
    auto d = point - center;
    return fpm::atan2(d.y, d.x);
  }

  segment_geometry straight_geometry(const connector &from, const connector &to) {
    segment_geometry g {};
    g.shape = segment_shape::STRAIGHT;
    g.start = from.position;
    g.end = to.position;
    g.orientation = normalize_angle(from.orientation + fp::pi());
    return g;
  }

  /**
   * the center is recomputed from the entry connector so it agrees with compute_connectors,
   * then the sweep is read back from the two end points and forced to the expected turn sign.
   */
  segment_geometry arc_geometry(const connector &from, const connector &to, fp radius, fp expected_sweep) {
    auto travel = normalize_angle(from.orientation + fp::pi());
    auto side = expected_sweep > fp{} ? fp::half_pi() : -fp::half_pi();
    auto center = from.position + heading(travel + side) * radius;

    auto start_angle = polar_angle(from.position, center);
    auto sweep = normalize_angle(polar_angle(to.position, center) - start_angle);
    if (expected_sweep > fp{} && sweep < fp{}) {
      sweep += fp::pi() + fp::pi();
    } else if (expected_sweep < fp{} && sweep > fp{}) {
      sweep -= fp::pi() + fp::pi();
    }

    segment_geometry g {};
    g.shape = segment_shape::ARC;
    g.center = center;
    g.radius = radius;
    g.start_angle = start_angle;
    g.signed_sweep = sweep;
    return g;
  }

  route_segment make_segment(const placed_element &element, size_t entry, size_t exit, fp start_distance) {
    auto &from = element.connectors[entry];
    auto &to = element.connectors[exit];
    route_segment seg {element.id, entry, {}, start_distance, {}};

    auto bends = element.type.kind == element_kind::CURVE
      || (element.type.kind == element_kind::TURNOUT && (entry == 2 || exit == 2));
    if (!bends) {
      seg.geometry = straight_geometry(from, to);
      seg.length = element.type.length;
      return seg;
    }

    auto sweep = element.type.kind == element_kind::CURVE ? element.type.sweep : diverging_sweep(element.type);
    // walking the element backwards turns the other way
    if (entry != 0) {
      sweep = -sweep;
    }
    seg.geometry = arc_geometry(from, to, element.type.radius, sweep);
    seg.length = element.type.radius * fpm::abs(seg.geometry.signed_sweep);
    return seg;
  }
}  // namespace

namespace tracks {
  switch_position switch_state(const switch_status_t &switches, const switch_name_t &name) {
    auto it = switches.find(name);
    return it == switches.end() ? switch_position::NORMAL : it->second;
  }

  const char *stringify_switch_position(switch_position position) {
    return position == switch_position::NORMAL ? "Normal" : "Diverging";
  }

  etl::optional<size_t> exit_connector(const placed_element &element, size_t entry, const switch_status_t &switches) {
    if (entry >= element.connectors.size()) {
      return {};
    }
    switch (element.type.kind) {
      case element_kind::STRAIGHT:
      case element_kind::CURVE:
        return entry == 0 ? size_t{1} : size_t{0};
      case element_kind::TURNOUT:
        if (entry != 0) {
          // trailing move, allowed whatever the switch says
          return size_t{0};
        }
        return switch_state(switches, element.switch_name) == switch_position::NORMAL ? size_t{1} : size_t{2};
      case element_kind::END:
        return {};
    }
    return {};
  }

  std::tuple<route, route_status> build_route(
    element_id start_element,
    size_t start_connector,
    const switch_status_t &switches,
    const layout &track
  ) {
    route result {};
    if (!track.get_connector({start_element, start_connector})) {
      return {result, route_status::BAD_START};
    }
    auto next = track.find_connected({start_element, start_connector});
    etl::unordered_set<int, max_route_segments> visited;

    while (next) {
      auto *element = track.find_element(next->element);
      if (!element || element->type.kind == element_kind::END) {
        break;
      }
      if (result.segments.full()) {
        return {result, route_status::ROUTE_TOO_LONG};
      }
      auto key = visit_key(next->element, next->index);
      if (visited.find(key) != visited.end()) {
        return {result, route_status::CYCLE_DETECTED};
      }
      visited.insert(key);

      auto exit = exit_connector(*element, next->index, switches);
      if (!exit) {
        break;
      }
      result.segments.push_back(make_segment(*element, next->index, *exit, result.total_length));
      result.total_length += result.segments.back().length;
      next = track.find_connected({element->id, *exit});
    }
    return {result, route_status::OK};
  }

  etl::optional<pose> position_on_route(fp distance, const route &r) {
    if (distance < fp{} || distance > r.total_length || r.segments.empty()) {
      return {};
    }
    auto *seg = &r.segments.back();
    for (auto &candidate : r.segments) {
      if (distance <= candidate.start_distance + candidate.length) {
        seg = &candidate;
        break;
      }
    }

    auto t = seg->length == fp{} ? fp{} : (distance - seg->start_distance) / seg->length;
    auto &g = seg->geometry;
    if (g.shape == segment_shape::STRAIGHT) {
      return pose {g.start + (g.end - g.start) * t, g.orientation};
    }
    auto angle = g.start_angle + t * g.signed_sweep;
    auto tangent = g.signed_sweep > fp{} ? fp::half_pi() : -fp::half_pi();
    return pose {g.center + heading(angle) * g.radius, normalize_angle(angle + tangent)};
  }

  size_t stringify_route(char *buf, size_t buflen, const route &r) {
    auto len = yard::snformat(buf, buflen, "(");
    for (auto &seg : r.segments) {
      len += yard::snformat(buf + len, buflen - len, "{},", seg.element);
    }
    if (!r.segments.empty()) {
      // drop the trailing comma
      --len;
    }
    len += yard::snformat(buf + len, buflen - len, ";{})", r.total_length);
    return len;
  }

  const char *stringify_route_status(route_status status) {
    switch (status) {
      case route_status::OK:
        return "ok";
      case route_status::BAD_START:
        return "bad start";
      case route_status::CYCLE_DETECTED:
        return "cycle detected";
      case route_status::ROUTE_TOO_LONG:
        return "route too long";
    }
    return "?";
  }
}
