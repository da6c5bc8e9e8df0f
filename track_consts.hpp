#pragma once

#include "track_layout.hpp"
#include "track_spots.hpp"

namespace tracks {
  /**
   * motion limits shared by every train. accelerations are magnitudes in m/s^2,
   * speeds in m/s, distances in m.
   */
  struct physics_profile {
    fp acceleration;
    fp braking;
    fp emergency_braking;
    fp max_speed;
    fp arrival_threshold;
  };

  /**
   * 40 km/h top speed, gentle service braking, and a harder emergency brake used only
   * near buffer stops.
   */
  constexpr physics_profile default_physics() {
    return {fp{2.0}, fp{3.0}, fp{5.0}, fp{11.11}, fp{0.5}};
  }

  enum class stock_kind {
    LOCOMOTIVE,
    PASSENGER,
    FLATBED,
    BOXCAR,
  };

  /**
   * coupled length of one car, in meters.
   */
  fp car_length(stock_kind kind);

  const char *stock_name(stock_kind kind);

  enum class spawn_point {
    // trains enter through the east portal and head west
    EAST,
    // trains enter through the west portal and head east
    WEST,
  };

  const char *spawn_name(spawn_point point);

  /**
   * the sawmill, the single layout trains run on.
   *
   *   west portal ==== mainline (370) ========= main ==== approach (100) ==== east portal
   *                                            /
   *   buffer stop ==== team track ==== platform
   *
   * element ids follow the order elements are placed in.
   */
  namespace sawmill {
    constexpr element_id east_portal = 0;
    constexpr element_id east_approach = 1;
    constexpr element_id main_turnout = 2;
    constexpr element_id mainline = 3;
    constexpr element_id west_portal = 4;
    constexpr element_id siding_curve = 5;
    constexpr element_id platform_track = 6;
    constexpr element_id team_track = 7;
    constexpr element_id buffer_stop = 8;

    constexpr const char *main_switch = "main";

    /**
     * the portal connector a train spawned at `point` leaves from.
     */
    connector_ref spawn_connector(spawn_point point);

    const spot_location &spot_location_of(spot_id spot);
  }

  /**
   * a static sawmill layout, built on first use.
   */
  const layout &sawmill_layout();
}
