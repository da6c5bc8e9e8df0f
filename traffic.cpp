#include "traffic_controller.hpp"
#include "traffic_mini_driver.hpp"
#include "ui.hpp"

using namespace tracks;

namespace {
  using namespace traffic;

  /**
   * the live switch states with the program's leading SetSwitch orders already applied.
   * those orders run before the train moves, so its route is built through them.
   */
  switch_status_t planned_switches(const switch_status_t &live, const program_t &program) {
    auto planned = live;
    for (auto &o : program) {
      if (o.kind == order_kind::SET_REVERSER) {
        continue;
      }
      if (o.kind != order_kind::SET_SWITCH) {
        break;
      }
      auto it = planned.find(o.switch_name);
      if (it != planned.end()) {
        it->second = o.position;
      } else if (!planned.full()) {
        planned.insert({o.switch_name, o.position});
      }
    }
    return planned;
  }

  /**
   * true when the route runs out through the portal opposite to where the train entered.
   */
  bool leaves_layout(spawn_point spawn, const route &r) {
    auto exit = spot_position(spawn == spawn_point::EAST ? spot_id::WEST_TUNNEL : spot_id::EAST_TUNNEL, r);
    return exit && *exit == r.total_length;
  }
}  // namespace

namespace traffic {

  portal_routes build_portal_routes(const switch_status_t &switches) {
    auto &track = sawmill_layout();
    auto west = sawmill::spawn_connector(spawn_point::EAST);
    auto east = sawmill::spawn_connector(spawn_point::WEST);
    portal_routes routes {};
    std::tie(routes.westbound, routes.westbound_status) = build_route(west.element, west.index, switches, track);
    std::tie(routes.eastbound, routes.eastbound_status) = build_route(east.element, east.index, switches, track);
    return routes;
  }

  traffic_controller::traffic_controller(controller_config config) : config_ {config} {
    ui::out().set_echo(config.echo);
  }

  bool traffic_controller::schedule(const scheduled_train &train) {
    if (scheduled_.full() || find_train(train.id) || despawned(train.id)) {
      return false;
    }
    for (auto &other : scheduled_) {
      if (other.id == train.id) {
        return false;
      }
    }
    scheduled_.push_back(train);
    return true;
  }

  void traffic_controller::set_switch(const switch_name_t &name, switch_position position) {
    auto it = switches_.find(name);
    if (it != switches_.end()) {
      it->second = position;
    } else if (!switches_.full()) {
      switches_.insert({name, position});
    } else {
      ui::out().send_notice(yard::sformat<ui::notice_len>("{} no room for switch {}", stringify_clock(), name));
    }
  }

  void traffic_controller::tick() {
    spawn_due();
    for (auto &train : active_) {
      auto [next, effects] = step(dt(), train);
      report(train, next);
      train = next;
      apply(effects);
    }
    despawn_departed();
    elapsed_ms_ += config_.tick_ms;
  }

  const active_train *traffic_controller::find_train(int id) const {
    for (auto &train : active_) {
      if (train.id == id) {
        return &train;
      }
    }
    return nullptr;
  }

  bool traffic_controller::idle() const {
    if (!scheduled_.empty()) {
      return false;
    }
    for (auto &train : active_) {
      if (train.state == train_state::EXECUTING || train.speed != fp{}) {
        return false;
      }
    }
    return true;
  }

  fp traffic_controller::dt() const {
    return fp{config_.tick_ms} / fp{1000};
  }

  int traffic_controller::clock() const {
    return config_.clock_start + static_cast<int>(elapsed_ms_ / 1000);
  }

  etl::string<8> traffic_controller::stringify_clock() const {
    return ui::stringify_clock(clock());
  }

  bool traffic_controller::despawned(int id) const {
    for (auto departed : departed_) {
      if (departed == id) {
        return true;
      }
    }
    return false;
  }

  void traffic_controller::spawn_due() {
    for (auto it = scheduled_.begin(); it != scheduled_.end();) {
      if (static_cast<long long>(it->departure) * 1000 > elapsed_ms_) {
        ++it;
        continue;
      }
      if (active_.full()) {
        // try again next tick
        return;
      }
      spawn(*it);
      it = scheduled_.erase(it);
    }
  }

  void traffic_controller::spawn(const scheduled_train &scheduled) {
    auto routes = build_portal_routes(planned_switches(switches_, scheduled.program));
    auto east = scheduled.spawn == spawn_point::EAST;
    auto &route = east ? routes.westbound : routes.eastbound;
    auto status = east ? routes.westbound_status : routes.eastbound_status;
    if (status != route_status::OK || route.segments.empty()) {
      ui::out().send_notice(yard::sformat<ui::notice_len>(
        "{} train {} cannot spawn at {}: {}",
        stringify_clock(), scheduled.id, spawn_name(scheduled.spawn), stringify_route_status(status)
      ));
      return;
    }

    active_train train {};
    train.id = scheduled.id;
    train.consist = scheduled.consist;
    train.route = route;
    train.program = scheduled.program;
    enter_order(train);
    if (train.program.empty() && leaves_layout(scheduled.spawn, route)) {
      // enters from inside the tunnel already at line speed
      train.through = true;
      train.state = train_state::EXECUTING;
      train.position = -consist_length(train.consist);
      train.speed = default_physics().max_speed;
    }
    active_.push_back(train);

    ui::out().send_notice(yard::sformat<ui::notice_len>(
      "{} train {} spawned at {} route {}",
      stringify_clock(), train.id, spawn_name(scheduled.spawn), stringify_route<48>(route)
    ));
    if (train.state == train_state::EXECUTING && !train.program.empty()) {
      ui::out().send_notice(yard::sformat<ui::notice_len>(
        "{} train {}: {}", stringify_clock(), train.id, describe_order(train.program.front())
      ));
    }
  }

  void traffic_controller::apply(const effects_t &effects) {
    for (auto &e : effects) {
      switch (e.kind) {
        case effect_kind::SET_SWITCH:
          set_switch(e.switch_name, e.position);
          ui::out().send_notice(yard::sformat<ui::notice_len>(
            "{} switch {} set {}", stringify_clock(), e.switch_name, stringify_switch_position(e.position)
          ));
          break;
      }
    }
  }

  void traffic_controller::report(const active_train &before, const active_train &after) {
    if (before.state != train_state::EXECUTING) {
      return;
    }
    if (before.program_counter >= before.program.size()) {
      return;
    }
    auto &done = before.program[before.program_counter];
    if (after.program_counter != before.program_counter && done.kind == order_kind::MOVE_TO) {
      ui::out().send_notice(yard::sformat<ui::notice_len>(
        "{} train {} arrived at {} ({} m)", stringify_clock(), after.id, spot_name(done.spot), after.position
      ));
    }

    switch (after.state) {
      case train_state::EXECUTING:
        if (after.program_counter != before.program_counter) {
          ui::out().send_notice(yard::sformat<ui::notice_len>(
            "{} train {}: {}", stringify_clock(), after.id, describe_order(after.program[after.program_counter])
          ));
        }
        break;
      case train_state::WAITING_FOR_ORDERS:
        ui::out().send_notice(yard::sformat<ui::notice_len>(
          "{} train {} waiting for orders at {} m", stringify_clock(), after.id, after.position
        ));
        break;
      case train_state::STOPPED:
        ui::out().send_notice(yard::sformat<ui::notice_len>(
          "{} train {} stopped: {}", stringify_clock(), after.id, after.stop_reason
        ));
        break;
    }
  }

  void traffic_controller::despawn_departed() {
    for (auto it = active_.begin(); it != active_.end();) {
      if (it->position - consist_length(it->consist) <= it->route.total_length) {
        ++it;
        continue;
      }
      ui::out().send_notice(yard::sformat<ui::notice_len>("{} train {} left the layout", stringify_clock(), it->id));
      if (!departed_.full()) {
        departed_.push_back(it->id);
      }
      it = active_.erase(it);
    }
  }

}
