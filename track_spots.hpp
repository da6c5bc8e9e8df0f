#pragma once

#include <etl/optional.h>
#include <etl/string_view.h>
#include "track_graph.hpp"

namespace tracks {
  enum class spot_id {
    PLATFORM,
    TEAM_TRACK,
    EAST_TUNNEL,
    WEST_TUNNEL,
  };

  constexpr size_t num_spots = 4;

  /**
   * where a spot sits on its element, measured from connector 0.
   *
   * portal spots are not measured: they mean the start or the end of whichever route
   * begins or ends on their element.
   */
  struct spot_location {
    element_id element {};
    fp local_distance {};
    fp element_length {};
    bool portal {};
  };

  const char *spot_name(spot_id spot);

  /**
   * accepts display names ("Team Track") and compact names ("TeamTrack"), any case.
   */
  etl::optional<spot_id> parse_spot(etl::string_view text);

  /**
   * distance of the spot along the route, or empty if the route never passes its element.
   */
  etl::optional<fp> spot_position(const spot_location &spot, const route &r);

  etl::optional<fp> spot_position(spot_id spot, const route &r);
}
