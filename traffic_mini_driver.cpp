#include <algorithm>
#include <fpm/math.hpp>
#include "generic/format.hpp"
#include "traffic_mini_driver.hpp"

using namespace tracks;
using namespace traffic;

namespace {
  fp trapezoid(fp old_speed, fp new_speed, fp dt) {
    return (old_speed + new_speed) / fp{2} * dt;
  }
}  // namespace

namespace traffic {
  void enter_order(active_train &train) {
    if (train.program_counter >= train.program.size()) {
      train.program_counter = train.program.size();
      train.state = train_state::WAITING_FOR_ORDERS;
      return;
    }
    auto &o = train.program[train.program_counter];
    if (o.kind == order_kind::WAIT_SECONDS) {
      train.wait_timer = o.seconds;
    }
  }

  void mini_driver::drive(fp dt) {
    if (train.through && train.state == train_state::EXECUTING) {
      run_through(dt);
      return;
    }
    switch (train.state) {
      case train_state::STOPPED:
        train.speed = fp{};
        return;
      case train_state::WAITING_FOR_ORDERS:
        coast(dt);
        return;
      case train_state::EXECUTING:
        break;
    }
    if (train.program_counter >= train.program.size()) {
      enter_order(train);
      coast(dt);
      return;
    }

    auto o = train.program[train.program_counter];
    switch (o.kind) {
      case order_kind::MOVE_TO:
        move_to(dt, o.spot);
        break;
      case order_kind::SET_REVERSER:
        train.reverser = o.reverser;
        advance();
        break;
      case order_kind::SET_SWITCH:
        effects.push_back(effect::set_switch(o.switch_name, o.position));
        advance();
        break;
      case order_kind::WAIT_SECONDS:
        wait(dt, o.seconds);
        break;
      case order_kind::COUPLE:
        stop(reasons::COUPLE_NO_CARS);
        break;
      case order_kind::UNCOUPLE:
        stop(reasons::UNCOUPLE_UNSUPPORTED);
        break;
    }
  }

  void mini_driver::move_to(fp dt, spot_id spot) {
    auto target = spot_position(spot, train.route);
    if (!target) {
      stop(yard::sformat<max_reason_len>("Cannot reach {}", spot_name(spot)).c_str());
      return;
    }

    auto sign = direction();
    auto threshold = physics->arrival_threshold;
    auto old_position = train.position, old_speed = train.speed;
    auto remaining = (*target - train.position) * sign;
    if (fpm::abs(remaining) < threshold) {
      arrive(*target);
      return;
    }

    if (remaining > fp{}) {
      auto braking_distance = old_speed * old_speed / (fp{2} * physics->braking);
      if (braking_distance >= remaining) {
        train.speed = std::max(fp{}, old_speed - physics->braking * dt);
      } else {
        train.speed = std::min(physics->max_speed, old_speed + physics->acceleration * dt);
      }
      train.position = old_position + trapezoid(old_speed, train.speed, dt) * sign;
    } else {
      // overshot: hold here, the check below may still accept the position
      train.speed = fp{};
    }
    safety_brake(dt, old_position, old_speed);

    remaining = fpm::abs((*target - train.position) * sign);
    if (remaining < threshold || (train.speed == fp{} && remaining < threshold * fp{2})) {
      arrive(*target);
    }
  }

  void mini_driver::wait(fp dt, fp seconds) {
    train.speed = fp{};
    if (train.wait_timer == fp{}) {
      // a timer that reached zero has already advanced the program, so this one is unarmed
      train.wait_timer = seconds;
    }
    train.wait_timer -= dt;
    if (train.wait_timer <= fp{}) {
      train.wait_timer = fp{};
      advance();
    }
  }

  void mini_driver::coast(fp dt) {
    if (train.speed == fp{}) {
      return;
    }
    auto old_position = train.position, old_speed = train.speed;
    train.speed = std::max(fp{}, old_speed - physics->braking * dt);
    train.position = old_position + trapezoid(old_speed, train.speed, dt) * direction();
    safety_brake(dt, old_position, old_speed);
  }

  void mini_driver::run_through(fp dt) {
    train.speed = physics->max_speed;
    train.position += train.speed * dt * direction();
  }

  void mini_driver::safety_brake(fp dt, fp old_position, fp old_speed) {
    if (train.reverser != reverser_t::FORWARD) {
      return;
    }
    auto total = train.route.total_length;
    if (train.speed == fp{} && train.position <= total) {
      return;
    }
    auto margin = total - train.position;
    auto stopping = train.speed * train.speed / (fp{2} * physics->emergency_braking) + consist_length(train.consist);
    if (margin >= stopping) {
      return;
    }
    train.speed = std::max(fp{}, old_speed - physics->emergency_braking * dt);
    train.position = std::min(total, old_position + trapezoid(old_speed, train.speed, dt));
  }

  void mini_driver::arrive(fp target) {
    train.position = target;
    train.speed = fp{};
    advance();
  }

  void mini_driver::advance() {
    ++train.program_counter;
    enter_order(train);
  }

  void mini_driver::stop(const char *reason) {
    train.state = train_state::STOPPED;
    train.stop_reason = reason;
    train.speed = fp{};
  }

  fp mini_driver::direction() const {
    return train.reverser == reverser_t::FORWARD ? fp{1} : fp{-1};
  }

  std::tuple<active_train, effects_t> step(fp dt, const active_train &train, const physics_profile &physics) {
    mini_driver driver {train, {}, &physics};
    driver.drive(dt);
    return {driver.train, driver.effects};
  }
}
