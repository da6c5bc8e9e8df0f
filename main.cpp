#include <cstdio>
#include <cstring>
#include "format_scan.hpp"
#include "traffic_controller.hpp"
#include "ui.hpp"

using namespace tracks;
using namespace traffic;

namespace {
  bool is(const char *arg, const char *flag) {
    return std::strcmp(arg, flag) == 0;
  }

  int usage(const char *problem, const char *arg) {
    std::fprintf(stderr, "%s: %s\n\n", problem, arg);
    ui::print_manual();
    return 1;
  }

  constexpr int ticks_per_second = 10;
}  // namespace

int main(int argc, char **argv) {
  auto from = spawn_point::EAST;
  auto main_position = switch_position::NORMAL;
  int seconds = 600;
  program_t program;

  for (int i = 1; i < argc; ++i) {
    auto *arg = argv[i];
    if (is(arg, "-h") || is(arg, "--help")) {
      ui::print_manual();
      return 0;
    } else if (is(arg, "--from") && i + 1 < argc) {
      auto *value = argv[++i];
      if (is(value, "east")) {
        from = spawn_point::EAST;
      } else if (is(value, "west")) {
        from = spawn_point::WEST;
      } else {
        return usage("unknown portal", value);
      }
    } else if (is(arg, "--seconds") && i + 1 < argc) {
      auto *value = argv[++i];
      if (!yard::sscan(value, std::strlen(value), "{}", seconds) || seconds <= 0) {
        return usage("invalid time limit", value);
      }
    } else if (is(arg, "--switch") && i + 1 < argc) {
      auto *value = argv[++i];
      if (is(value, "N") || is(value, "n")) {
        main_position = switch_position::NORMAL;
      } else if (is(value, "R") || is(value, "r")) {
        main_position = switch_position::REVERSE;
      } else {
        return usage("invalid switch position", value);
      }
    } else {
      auto order = parse_order(etl::string_view(arg, std::strlen(arg)));
      if (!order) {
        return usage("invalid order", arg);
      }
      if (program.full()) {
        return usage("too many orders", arg);
      }
      program.push_back(*order);
    }
  }

  traffic_controller controller {{1000 / ticks_per_second, 6 * 3600, true}};
  controller.set_switch(switch_name_t(sawmill::main_switch), main_position);

  scheduled_train train {};
  train.id = 1;
  train.spawn = from;
  train.consist.push_back(stock_kind::LOCOMOTIVE);
  train.consist.push_back(stock_kind::PASSENGER);
  train.consist.push_back(stock_kind::FLATBED);
  train.program = program;
  if (!controller.schedule(train)) {
    std::fprintf(stderr, "could not schedule train %d\n", train.id);
    return 1;
  }

  for (int t = 0; t < seconds * ticks_per_second; ++t) {
    controller.tick();
    if (controller.idle()) {
      break;
    }
  }

  auto *active = controller.find_train(train.id);
  if (!active) {
    auto status = controller.despawned(train.id) ? "left the layout" : "never spawned";
    std::printf("%s train %d %s\n", controller.stringify_clock().c_str(), train.id, status);
    return 0;
  }
  auto line = yard::sformat<ui::notice_len>(
    "{} train {} {} at {} m, speed {} m/s, order {}/{}",
    controller.stringify_clock(),
    active->id,
    stringify_train_state(active->state),
    active->position,
    active->speed,
    static_cast<int>(active->program_counter),
    static_cast<int>(active->program.size())
  );
  std::printf("%s\n", line.c_str());
  return active->state == train_state::STOPPED ? 2 : 0;
}
