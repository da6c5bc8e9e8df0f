#pragma once

#include <etl/optional.h>
#include <etl/string.h>
#include <etl/string_view.h>
#include <etl/vector.h>
#include "track_consts.hpp"
#include "track_graph.hpp"

namespace traffic {
  using tracks::fp;

  static constexpr size_t max_orders = 32;
  static constexpr size_t max_cars = 16;
  static constexpr size_t max_effects = 4;
  static constexpr size_t max_reason_len = 48;
  // longest WAIT_SECONDS order, one hour
  static constexpr int max_wait_seconds = 3600;

  enum class reverser_t {
    FORWARD,
    REVERSE,
  };

  enum class order_kind {
    MOVE_TO,
    SET_REVERSER,
    SET_SWITCH,
    WAIT_SECONDS,
    COUPLE,
    UNCOUPLE,
  };

  /**
   * one instruction of a train's program. which fields are meaningful depends on kind.
   */
  struct order {
    order_kind kind {order_kind::COUPLE};
    // MOVE_TO
    tracks::spot_id spot {};
    // SET_REVERSER
    reverser_t reverser {};
    // SET_SWITCH
    tracks::switch_name_t switch_name {};
    tracks::switch_position position {};
    // WAIT_SECONDS
    fp seconds {};
    // UNCOUPLE
    int cars {};

    static order move_to(tracks::spot_id spot) {
      order o {};
      o.kind = order_kind::MOVE_TO;
      o.spot = spot;
      return o;
    }

    static order set_reverser(reverser_t reverser) {
      order o {};
      o.kind = order_kind::SET_REVERSER;
      o.reverser = reverser;
      return o;
    }

    static order set_switch(etl::string_view name, tracks::switch_position position) {
      order o {};
      o.kind = order_kind::SET_SWITCH;
      o.switch_name.assign(name.begin(), name.end());
      o.position = position;
      return o;
    }

    static order wait_seconds(fp seconds) {
      order o {};
      o.kind = order_kind::WAIT_SECONDS;
      o.seconds = seconds;
      return o;
    }

    static order couple() {
      return {};
    }

    static order uncouple(int cars) {
      order o {};
      o.kind = order_kind::UNCOUPLE;
      o.cars = cars;
      return o;
    }
  };

  using program_t = etl::vector<order, max_orders>;

  /**
   * cars in order from the lead car backwards.
   */
  using consist_t = etl::vector<tracks::stock_kind, max_cars>;

  enum class train_state {
    EXECUTING,
    WAITING_FOR_ORDERS,
    // terminal, the reason is kept beside the state
    STOPPED,
  };

  using reason_t = etl::string<max_reason_len>;

  enum class effect_kind {
    SET_SWITCH,
  };

  /**
   * a change to shared world state requested by a train. the caller applies it.
   */
  struct effect {
    effect_kind kind {effect_kind::SET_SWITCH};
    tracks::switch_name_t switch_name {};
    tracks::switch_position position {};

    static effect set_switch(const tracks::switch_name_t &name, tracks::switch_position position) {
      return {effect_kind::SET_SWITCH, name, position};
    }
  };

  using effects_t = etl::vector<effect, max_effects>;

  /**
   * a train on the layout.
   *
   * position is the distance of the lead car's front along the route, in meters.
   * speed is never negative: the direction of travel comes from the reverser.
   */
  struct active_train {
    int id {};
    consist_t consist {};
    fp position {};
    fp speed {};
    tracks::route route {};
    program_t program {};
    size_t program_counter {};
    train_state state {train_state::EXECUTING};
    // set when state is STOPPED
    reason_t stop_reason {};
    reverser_t reverser {reverser_t::FORWARD};
    // seconds left on the current WAIT_SECONDS order, 0 until the order is entered
    fp wait_timer {};
    // a train with no program that holds line speed until it leaves through the far portal
    bool through {};
  };

  /**
   * a train waiting to enter the layout.
   */
  struct scheduled_train {
    int id {};
    tracks::spawn_point spawn {tracks::spawn_point::EAST};
    // seconds after the start of the session
    int departure {};
    consist_t consist {};
    program_t program {};
  };

  namespace reasons {
    static const char * const COUPLE_NO_CARS = "Couple: no adjacent cars found";
    static const char * const UNCOUPLE_UNSUPPORTED = "Uncouple: not yet supported";
    // not produced yet, kept for when uncoupling is implemented
    static const char * const UNCOUPLE_MOVING = "Uncouple: train is moving";
    static const char * const UNCOUPLE_NOTHING = "Uncouple: nothing to uncouple";
    static const char * const UNCOUPLE_LOCOMOTIVE = "Uncouple: cannot detach locomotive";
  }

  /**
   * sum of car lengths.
   */
  fp consist_length(const consist_t &consist);

  using order_text_t = etl::string<40>;

  /**
   * human readable order, e.g. "Move To Platform" or "Set main Diverging".
   */
  order_text_t describe_order(const order &o);

  /**
   * reads one order in command syntax:
   *
   * mv <spot>, rv F|R, sw <switch> N|R, wt <seconds>, cp, uc <cars>
   */
  etl::optional<order> parse_order(etl::string_view text);

  const char *stringify_train_state(train_state state);

  const char *stringify_reverser(reverser_t reverser);
}
