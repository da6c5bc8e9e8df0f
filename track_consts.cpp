#include <etl/array.h>
#include "track_consts.hpp"

namespace tracks {
  fp car_length(stock_kind kind) {
    switch (kind) {
      case stock_kind::LOCOMOTIVE:
        return fp{20};
      case stock_kind::PASSENGER:
        return fp{25};
      case stock_kind::FLATBED:
      case stock_kind::BOXCAR:
        return fp{15};
    }
    return fp{};
  }

  const char *stock_name(stock_kind kind) {
    switch (kind) {
      case stock_kind::LOCOMOTIVE:
        return "Locomotive";
      case stock_kind::PASSENGER:
        return "Passenger";
      case stock_kind::FLATBED:
        return "Flatbed";
      case stock_kind::BOXCAR:
        return "Boxcar";
    }
    return "?";
  }

  const char *spawn_name(spawn_point point) {
    return point == spawn_point::EAST ? "East Station" : "West Station";
  }

  namespace sawmill {
    connector_ref spawn_connector(spawn_point point) {
      return point == spawn_point::EAST ? connector_ref {east_portal, 0} : connector_ref {west_portal, 0};
    }

    const spot_location &spot_location_of(spot_id spot) {
      static etl::array<spot_location, num_spots> spots = {{
        {platform_track, fp{40}, fp{80}, false},
        // closer to the platform end, so a parked consist stays clear of the buffer stop
        {team_track, fp{30}, fp{100}, false},
        {east_approach, fp{}, fp{100}, true},
        {mainline, fp{}, fp{370}, true},
      }};
      return spots[static_cast<size_t>(spot)];
    }
  }

  const layout &sawmill_layout() {
    static bool initialized = false;
    static layout sawmill;

    if (!initialized) {
      using namespace sawmill;
      // a train leaving the east portal heads west
      sawmill.place_element(element_type::end(), {{fp{250}, fp{}}, fp::pi()});
      sawmill.place_element_at(element_type::straight(fp{100}), {east_portal, 0});
      sawmill.place_element_at(element_type::turnout(fp{30}, fp{190}, fp{0.2}, hand_t::RIGHT), {east_approach, 1});
      sawmill.place_element_at(element_type::straight(fp{370}), {main_turnout, 1});
      sawmill.place_element_at(element_type::end(), {mainline, 1});
      // reverse curve brings the siding back parallel to the mainline
      sawmill.place_element_at(element_type::curve(fp{190}, fp{-0.2}), {main_turnout, 2});
      sawmill.place_element_at(element_type::straight(fp{80}), {siding_curve, 1});
      sawmill.place_element_at(element_type::straight(fp{100}), {platform_track, 1});
      sawmill.place_element_at(element_type::end(), {team_track, 1});
      sawmill.name_switch(main_turnout, main_switch);
      initialized = true;
    }

    return sawmill;
  }
}
