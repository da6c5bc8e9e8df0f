#pragma once

#include <tuple>
#include <etl/string.h>
#include <etl/vector.h>
#include "track_consts.hpp"
#include "track_graph.hpp"
#include "traffic.hpp"

namespace traffic {

  static constexpr size_t max_active_trains = 8;
  static constexpr size_t max_scheduled_trains = 16;

  struct controller_config {
    // length of one tick
    int tick_ms {100};
    // simulated clock at the start of the session, seconds since midnight
    int clock_start {6 * 3600};
    // print notices to stdout as they are posted
    bool echo {};
  };

  /**
   * the routes a train gets when spawned at each portal, built with the same switch states.
   */
  struct portal_routes {
    tracks::route westbound {};
    tracks::route eastbound {};
    tracks::route_status westbound_status {};
    tracks::route_status eastbound_status {};
  };

  portal_routes build_portal_routes(const tracks::switch_status_t &switches);

  /**
   * drives every train on the sawmill.
   *
   * owns the live switch states, spawns scheduled trains when their departure comes, steps
   * all active trains once per tick, applies the effects they return and removes trains that
   * have left the layout. routes are built at spawn, through the switches the program sets
   * before its first move or wait, and never rebuilt, so a switch thrown afterwards only
   * affects trains spawned later.
   *
   * a train scheduled without a program runs through at line speed when its route leaves
   * through the far portal, and is removed once its last car has passed the end.
   */
  class traffic_controller {
  public:
    explicit traffic_controller(controller_config config = {});

    /**
     * queues a train. false if the schedule is full or the id is taken.
     */
    bool schedule(const scheduled_train &train);

    void set_switch(const tracks::switch_name_t &name, tracks::switch_position position);

    /**
     * advances simulated time by one tick.
     */
    void tick();

    const tracks::switch_status_t &switches() const {
      return switches_;
    }

    const etl::vector<active_train, max_active_trains> &active_trains() const {
      return active_;
    }

    const active_train *find_train(int id) const;

    /**
     * nothing left to spawn and no train that can still make progress.
     */
    bool idle() const;

    fp dt() const;

    /**
     * simulated time in seconds since midnight.
     */
    int clock() const;

    etl::string<8> stringify_clock() const;

    bool despawned(int id) const;

  private:
    void spawn_due();
    /**
     * builds the train's route and puts it on the layout. a train whose route cannot be
     * built is dropped with a notice.
     */
    void spawn(const scheduled_train &train);
    void apply(const effects_t &effects);
    void report(const active_train &before, const active_train &after);
    void despawn_departed();

    controller_config config_;
    tracks::switch_status_t switches_ {};
    etl::vector<scheduled_train, max_scheduled_trains> scheduled_ {};
    etl::vector<active_train, max_active_trains> active_ {};
    etl::vector<int, max_scheduled_trains> departed_ {};
    long long elapsed_ms_ {};
  };

}
