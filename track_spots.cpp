#include "track_spots.hpp"
#include "track_consts.hpp"

namespace {
  using namespace tracks;

  char lower(char c) {
    return ('A' <= c && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
  }

  /**
   * compares ignoring case and spaces, so "team track" matches "TeamTrack".
   */
  bool loosely_equal(etl::string_view a, const char *b) {
    size_t i = 0;
    for (auto c : a) {
      if (c == ' ') {
        continue;
      }
      while (b[i] == ' ') {
        ++i;
      }
      if (b[i] == '\0' || lower(c) != lower(b[i])) {
        return false;
      }
      ++i;
    }
    while (b[i] == ' ') {
      ++i;
    }
    return b[i] == '\0';
  }
}  // namespace

namespace tracks {
  const char *spot_name(spot_id spot) {
    switch (spot) {
      case spot_id::PLATFORM:
        return "Platform";
      case spot_id::TEAM_TRACK:
        return "Team Track";
      case spot_id::EAST_TUNNEL:
        return "East Tunnel";
      case spot_id::WEST_TUNNEL:
        return "West Tunnel";
    }
    return "?";
  }

  etl::optional<spot_id> parse_spot(etl::string_view text) {
    for (auto spot : {spot_id::PLATFORM, spot_id::TEAM_TRACK, spot_id::EAST_TUNNEL, spot_id::WEST_TUNNEL}) {
      if (!text.empty() && loosely_equal(text, spot_name(spot))) {
        return spot;
      }
    }
    return {};
  }

  etl::optional<fp> spot_position(const spot_location &spot, const route &r) {
    if (r.segments.empty()) {
      return {};
    }
    if (spot.portal) {
      if (r.segments.front().element == spot.element) {
        return fp{};
      }
      if (r.segments.back().element == spot.element) {
        return r.total_length;
      }
      return {};
    }
    for (auto &seg : r.segments) {
      if (seg.element != spot.element) {
        continue;
      }
      // entering through connector 0 means the element is walked in its native direction
      auto local = seg.entry == 0 ? spot.local_distance : spot.element_length - spot.local_distance;
      return seg.start_distance + local;
    }
    return {};
  }

  etl::optional<fp> spot_position(spot_id spot, const route &r) {
    return spot_position(sawmill::spot_location_of(spot), r);
  }
}
