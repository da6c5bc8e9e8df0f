#pragma once

#include <tuple>
#include "track_consts.hpp"
#include "traffic.hpp"

namespace traffic {

  /**
   * simulates the driver of one train for one tick.
   *
   * the driver works on its own copy of the train and collects the effects the train wants
   * applied to the world. it never touches anything else.
   */
  struct mini_driver {
    active_train train;
    effects_t effects {};
    const tracks::physics_profile *physics;  // observer

    /**
     * runs the current order of the program for dt seconds.
     */
    void drive(fp dt);

  private:
    void move_to(fp dt, tracks::spot_id spot);
    void wait(fp dt, fp seconds);
    /**
     * through trains: line speed, no buffer stop protection since the route ends at a portal.
     */
    void run_through(fp dt);
    /**
     * WAITING_FOR_ORDERS: slow down under normal braking until stationary.
     */
    void coast(fp dt);
    /**
     * overrides the planned motion with emergency braking when the train could not
     * otherwise stop before the end of its route.
     */
    void safety_brake(fp dt, fp old_position, fp old_speed);
    void arrive(fp target);
    void advance();
    void stop(const char *reason);
    fp direction() const;
  };

  /**
   * prepares the order under the program counter: arms the wait timer of a WAIT_SECONDS
   * order, or moves to WAITING_FOR_ORDERS past the end of the program.
   *
   * call it once when a program starts. the driver calls it on every advance.
   */
  void enter_order(active_train &train);

  /**
   * advances one train by dt seconds. the input is not modified. a WAIT_SECONDS order whose
   * timer was never armed by enter_order is armed on its first tick.
   *
   * RESULT is the next state of the train and the effects it produced, which the caller
   * must fold into the world (switch positions).
   */
  std::tuple<active_train, effects_t> step(
    fp dt,
    const active_train &train,
    const tracks::physics_profile &physics = tracks::default_physics()
  );

}
